#pragma once

#include <array>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "ffi/type/kind.hpp"
#include "ffi/type/type.hpp"

namespace ffi {

// Owns and interns Type instances. Scalar types exist once per arena;
// pointer and array types are interned by their structure so repeated
// requests return the same `const Type*`; struct types are nominal and
// every StructOf call creates a new one.
//
// All members are safe to call concurrently. Types outlive every request
// and die with the arena, which must therefore outlive every Value that
// refers to them.
class TypeArena final {
 public:
  TypeArena();
  ~TypeArena() = default;

  // Types keep a back-pointer to their arena.
  TypeArena(const TypeArena&) = delete;
  auto operator=(const TypeArena&) -> TypeArena& = delete;
  TypeArena(TypeArena&&) = delete;
  auto operator=(TypeArena&&) -> TypeArena& = delete;

  // Throws InternalError unless IsScalar(kind).
  [[nodiscard]] auto Scalar(Kind kind) const -> const Type*;

  [[nodiscard]] auto Int8() const -> const Type* {
    return Scalar(Kind::kInt8);
  }
  [[nodiscard]] auto Int16() const -> const Type* {
    return Scalar(Kind::kInt16);
  }
  [[nodiscard]] auto Int32() const -> const Type* {
    return Scalar(Kind::kInt32);
  }
  [[nodiscard]] auto Int64() const -> const Type* {
    return Scalar(Kind::kInt64);
  }
  [[nodiscard]] auto Uint8() const -> const Type* {
    return Scalar(Kind::kUint8);
  }
  [[nodiscard]] auto Uint16() const -> const Type* {
    return Scalar(Kind::kUint16);
  }
  [[nodiscard]] auto Uint32() const -> const Type* {
    return Scalar(Kind::kUint32);
  }
  [[nodiscard]] auto Uint64() const -> const Type* {
    return Scalar(Kind::kUint64);
  }
  [[nodiscard]] auto Float() const -> const Type* {
    return Scalar(Kind::kFloat);
  }
  [[nodiscard]] auto Double() const -> const Type* {
    return Scalar(Kind::kDouble);
  }

  // The reserved function-kind type.
  [[nodiscard]] auto Function() const -> const Type* {
    return function_;
  }

  // Pointer to elem. Idempotent. Fails only when elem is null.
  [[nodiscard]] auto PointerTo(const Type* elem)
      -> std::expected<const Type*, std::string>;

  // Fixed-length array of elem. Throws InternalError for a null elem, and
  // when length or the total byte size would overflow.
  auto ArrayOf(const Type* elem, size_t length) -> const Type*;

  // Struct with caller-supplied offsets. When size is absent the struct
  // ends at the furthest field end. Throws InternalError if any field has
  // a null type or ends past the size_t range.
  auto StructOf(
      std::string name, std::vector<StructField> fields,
      std::optional<size_t> size = std::nullopt) -> const Type*;

  // Number of types owned by the arena.
  [[nodiscard]] auto Size() const -> size_t;

 private:
  auto Create(Kind kind, size_t size, TypePayload payload) -> const Type*;
  // Caller holds mutex_.
  auto CreateLocked(Kind kind, size_t size, TypePayload payload)
      -> const Type*;

  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<Type>> types_;
  std::array<const Type*, kNumKinds> scalars_{};
  const Type* function_ = nullptr;
  absl::flat_hash_map<const Type*, const Type*> pointers_;
  absl::flat_hash_map<std::pair<const Type*, size_t>, const Type*> arrays_;
};

// Pointer to typ, interned in typ's own arena. Returns an error for null.
[[nodiscard]] auto PointerTo(const Type* typ)
    -> std::expected<const Type*, std::string>;

}  // namespace ffi
