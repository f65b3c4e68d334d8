#include "ffi/type/type.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "ffi/common/internal_error.hpp"
#include "ffi/common/overloaded.hpp"
#include "ffi/type/kind_error.hpp"

namespace ffi {

Type::Type(TypeArena* arena, ffi::Kind kind, size_t size, TypePayload payload)
    : arena_(arena), kind_(kind), size_(size), payload_(std::move(payload)) {
}

auto Type::Elem() const -> const Type& {
  if (const auto* ptr = std::get_if<PointerInfo>(&payload_)) {
    return *ptr->elem;
  }
  if (const auto* arr = std::get_if<ArrayInfo>(&payload_)) {
    return *arr->elem;
  }
  throw KindError("ffi::Type::Elem", kind_, KindErrorSubject::kType);
}

auto Type::Len() const -> size_t {
  const auto* arr = std::get_if<ArrayInfo>(&payload_);
  if (arr == nullptr) {
    throw KindError("ffi::Type::Len", kind_, KindErrorSubject::kType);
  }
  return arr->length;
}

auto Type::NumField() const -> size_t {
  return StructFields("ffi::Type::NumField").size();
}

auto Type::Field(size_t i) const -> const StructField& {
  const auto& fields = StructFields("ffi::Type::Field");
  if (i >= fields.size()) {
    throw InternalError(
        "ffi::Type::Field",
        fmt::format(
            "field index {} out of range for {} ({} fields)", i, ToString(),
            fields.size()));
  }
  return fields[i];
}

auto Type::Fields() const -> const std::vector<StructField>& {
  return StructFields("ffi::Type::Fields");
}

auto Type::FieldByName(std::string_view name) const -> const StructField* {
  for (const auto& field : StructFields("ffi::Type::FieldByName")) {
    if (field.name == name) {
      return &field;
    }
  }
  return nullptr;
}

auto Type::StructFields(const char* method) const
    -> const std::vector<StructField>& {
  const auto* info = std::get_if<StructInfo>(&payload_);
  if (info == nullptr) {
    throw KindError(method, kind_, KindErrorSubject::kType);
  }
  return info->fields;
}

auto Type::Name() const -> std::string_view {
  if (const auto* info = std::get_if<StructInfo>(&payload_)) {
    return info->name;
  }
  return {};
}

auto Type::ToString() const -> std::string {
  return std::visit(
      Overloaded{
          [this](std::monostate) -> std::string {
            return std::string(ffi::ToString(kind_));
          },
          [](const PointerInfo& ptr) -> std::string {
            return fmt::format("*{}", ptr.elem->ToString());
          },
          [](const ArrayInfo& arr) -> std::string {
            return fmt::format("[{}]{}", arr.length, arr.elem->ToString());
          },
          [](const StructInfo& info) -> std::string {
            std::string out = "struct";
            if (!info.name.empty()) {
              out += " " + info.name;
            }
            out += " {";
            for (const auto& field : info.fields) {
              out += fmt::format(
                  " {} {} @{};", field.name, field.type->ToString(),
                  field.offset);
            }
            out += " }";
            return out;
          },
      },
      payload_);
}

}  // namespace ffi
