#include "ffi/type/type_arena.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "ffi/common/internal_error.hpp"
#include "ffi/common/log.hpp"

namespace ffi {

TypeArena::TypeArena() {
  for (int i = 0; i < kNumKinds; ++i) {
    auto kind = static_cast<Kind>(i);
    if (IsScalar(kind)) {
      scalars_[i] = Create(kind, *IntrinsicSize(kind), std::monostate{});
    }
  }
  function_ = Create(
      Kind::kFunction, *IntrinsicSize(Kind::kFunction), std::monostate{});
}

auto TypeArena::Scalar(Kind kind) const -> const Type* {
  if (!IsScalar(kind)) {
    throw InternalError(
        "ffi::TypeArena::Scalar",
        fmt::format("{} is not a scalar kind", kind));
  }
  return scalars_[static_cast<size_t>(kind)];
}

auto TypeArena::PointerTo(const Type* elem)
    -> std::expected<const Type*, std::string> {
  if (elem == nullptr) {
    return std::unexpected("ffi: pointer to nil type");
  }

  std::lock_guard lock(mutex_);
  auto it = pointers_.find(elem);
  if (it != pointers_.end()) {
    return it->second;
  }

  const auto* ptr = CreateLocked(
      Kind::kPointer, *IntrinsicSize(Kind::kPointer), PointerInfo{.elem = elem});
  pointers_.emplace(elem, ptr);
  Logger().trace("interned pointer type {}", *ptr);
  return ptr;
}

auto TypeArena::ArrayOf(const Type* elem, size_t length) -> const Type* {
  if (elem == nullptr) {
    throw InternalError("ffi::TypeArena::ArrayOf", "nil element type");
  }
  // Value reports lengths as int64_t.
  if (length > static_cast<size_t>(std::numeric_limits<int64_t>::max())) {
    throw InternalError(
        "ffi::TypeArena::ArrayOf",
        fmt::format("array length {} of {} exceeds int64 range", length, *elem));
  }
  size_t size = 0;
  if (__builtin_mul_overflow(length, elem->Size(), &size)) {
    throw InternalError(
        "ffi::TypeArena::ArrayOf",
        fmt::format("size of [{}]{} overflows size_t", length, *elem));
  }

  std::lock_guard lock(mutex_);
  auto key = std::make_pair(elem, length);
  auto it = arrays_.find(key);
  if (it != arrays_.end()) {
    return it->second;
  }

  const auto* arr = CreateLocked(
      Kind::kArray, size, ArrayInfo{.elem = elem, .length = length});
  arrays_.emplace(key, arr);
  Logger().trace("interned array type {}", *arr);
  return arr;
}

auto TypeArena::StructOf(
    std::string name, std::vector<StructField> fields,
    std::optional<size_t> size) -> const Type* {
  size_t extent = 0;
  for (const auto& field : fields) {
    if (field.type == nullptr) {
      throw InternalError(
          "ffi::TypeArena::StructOf",
          fmt::format("field '{}' of struct '{}' has nil type", field.name, name));
    }
    size_t end = 0;
    if (__builtin_add_overflow(field.offset, field.type->Size(), &end)) {
      throw InternalError(
          "ffi::TypeArena::StructOf",
          fmt::format(
              "field '{}' of struct '{}' ends past size_t range", field.name,
              name));
    }
    extent = std::max(extent, end);
  }

  std::lock_guard lock(mutex_);
  return CreateLocked(
      Kind::kStruct, size.value_or(extent),
      StructInfo{.name = std::move(name), .fields = std::move(fields)});
}

auto TypeArena::Size() const -> size_t {
  std::lock_guard lock(mutex_);
  return types_.size();
}

auto TypeArena::Create(Kind kind, size_t size, TypePayload payload)
    -> const Type* {
  std::lock_guard lock(mutex_);
  return CreateLocked(kind, size, std::move(payload));
}

auto TypeArena::CreateLocked(Kind kind, size_t size, TypePayload payload)
    -> const Type* {
  // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
  types_.push_back(std::unique_ptr<Type>(
      new Type(this, kind, size, std::move(payload))));
  return types_.back().get();
}

auto PointerTo(const Type* typ) -> std::expected<const Type*, std::string> {
  if (typ == nullptr) {
    return std::unexpected("ffi: pointer to nil type");
  }
  return typ->Arena().PointerTo(typ);
}

}  // namespace ffi
