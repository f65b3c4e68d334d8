#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "ffi/type/kind.hpp"

namespace ffi {

class Type;
class TypeArena;

// One named member of a struct. offset is the byte distance from the start
// of the struct, as supplied by whoever built the type.
struct StructField {
  std::string name;
  const Type* type = nullptr;
  size_t offset = 0;
};

struct PointerInfo {
  const Type* elem;
};

struct ArrayInfo {
  const Type* elem;
  size_t length;
};

struct StructInfo {
  std::string name;
  std::vector<StructField> fields;
};

using TypePayload =
    std::variant<std::monostate, PointerInfo, ArrayInfo, StructInfo>;

// Immutable description of a foreign type. Instances are owned by the
// TypeArena that created them and are shared as `const Type*`.
class Type final {
 public:
  Type(const Type&) = delete;
  auto operator=(const Type&) -> Type& = delete;
  Type(Type&&) = delete;
  auto operator=(Type&&) -> Type& = delete;
  ~Type() = default;

  [[nodiscard]] auto Kind() const -> ffi::Kind {
    return kind_;
  }

  [[nodiscard]] auto Size() const -> size_t {
    return size_;
  }

  // Pointee type for kPointer, element type for kArray.
  [[nodiscard]] auto Elem() const -> const Type&;

  // Element count. kArray only.
  [[nodiscard]] auto Len() const -> size_t;

  // kStruct only.
  [[nodiscard]] auto NumField() const -> size_t;
  [[nodiscard]] auto Field(size_t i) const -> const StructField&;
  [[nodiscard]] auto Fields() const -> const std::vector<StructField>&;

  // First field with the given name in declaration order, or nullptr.
  [[nodiscard]] auto FieldByName(std::string_view name) const
      -> const StructField*;

  // Struct tag; empty for anonymous structs and for every other kind.
  [[nodiscard]] auto Name() const -> std::string_view;

  [[nodiscard]] auto Arena() const -> TypeArena& {
    return *arena_;
  }

  [[nodiscard]] auto Payload() const -> const TypePayload& {
    return payload_;
  }

  [[nodiscard]] auto ToString() const -> std::string;

 private:
  friend class TypeArena;

  Type(TypeArena* arena, ffi::Kind kind, size_t size, TypePayload payload);

  // Struct fields, or KindError naming method for any other kind.
  [[nodiscard]] auto StructFields(const char* method) const
      -> const std::vector<StructField>&;

  TypeArena* arena_;
  ffi::Kind kind_;
  size_t size_;
  TypePayload payload_;
};

inline auto operator<<(std::ostream& os, const Type& type) -> std::ostream& {
  return os << type.ToString();
}

}  // namespace ffi

template <>
struct fmt::formatter<ffi::Type> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const ffi::Type& type, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(type.ToString(), ctx);
  }
};
