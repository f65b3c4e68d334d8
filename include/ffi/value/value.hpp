#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "ffi/type/kind.hpp"
#include "ffi/type/type.hpp"
#include "ffi/value/storage.hpp"

namespace ffi {

class Value;

// Value addressing a new zero-filled buffer of typ->Size() bytes, aligned to
// the configured allocator alignment. Throws InternalError if typ is null.
[[nodiscard]] auto Allocate(const Type* typ) -> Value;

// Pointer-to-typ Value whose storage location is address: address must hold
// a pointer-sized slot, and Elem() follows the pointer stored there. Returns
// the invalid Value if typ is null or its pointer type cannot be built.
[[nodiscard]] auto WrapAddress(const Type* typ, void* address) -> Value;

// Access to one instance of a Type living at some address.
//
// A Value never owns the bytes it addresses exclusively. Values created by
// Allocate, and every Value navigated from them, share ownership of the
// backing Storage, so the bytes stay alive while any of them exists. Values
// created by WrapAddress address caller memory and carry no Storage: the
// caller keeps that memory alive.
//
// The address always points at the data (the representation is always
// indirect), so a Value is cheap to copy and copies alias the same bytes.
// Concurrent writes through aliasing Values need external synchronization.
//
// The default-constructed Value is the invalid Value: IsValid() is false and
// every other member throws KindError.
class Value {
 public:
  Value() = default;

  [[nodiscard]] auto IsValid() const -> bool {
    return type_ != nullptr;
  }

  [[nodiscard]] auto Kind() const -> ffi::Kind;
  [[nodiscard]] auto Type() const -> const ffi::Type&;

  // Signed integer kinds only. Reads the stored width and sign-extends.
  [[nodiscard]] auto Int() const -> int64_t;
  // Unsigned integer kinds only. Reads the stored width and zero-extends.
  [[nodiscard]] auto Uint() const -> uint64_t;
  // kFloat and kDouble only.
  [[nodiscard]] auto Float() const -> double;

  // Narrowing stores keep the low-order bits (or round to float) silently.
  void SetInt(int64_t x) const;
  void SetUint(uint64_t x) const;
  void SetFloat(double x) const;

  // Value the pointer points to. kPointer only. A null pointer yields a
  // valid Value whose address is null; check IsNil() first.
  [[nodiscard]] auto Elem() const -> Value;
  // Whether the stored pointer is null. kPointer only.
  [[nodiscard]] auto IsNil() const -> bool;

  // kStruct only. Out-of-range i throws InternalError.
  [[nodiscard]] auto Field(int i) const -> Value;
  [[nodiscard]] auto NumField() const -> int;
  // Nested field; pointers to structs met after the first hop are
  // dereferenced before the next index is applied.
  [[nodiscard]] auto FieldByIndex(std::span<const int> index) const -> Value;
  // The invalid Value when no field has that name.
  [[nodiscard]] auto FieldByName(std::string_view name) const -> Value;

  // kArray only. Accepts 0 <= i <= Len(): the element one past the end can
  // be addressed, and touching its bytes is rejected only when the value
  // has backing Storage that does not cover them.
  [[nodiscard]] auto Index(int64_t i) const -> Value;
  [[nodiscard]] auto Len() const -> int64_t;
  [[nodiscard]] auto Cap() const -> int64_t;

  // Pointer-kind Value whose pointee is this Value's bytes.
  [[nodiscard]] auto Addr() const -> Value;

  // The Type().Size() bytes of the value, aliased.
  [[nodiscard]] auto Buffer() const -> std::span<std::byte>;

  [[nodiscard]] auto UnsafeAddr() const -> uintptr_t;

  // The backing Storage, or null for caller-managed memory.
  [[nodiscard]] auto GetStorage() const -> const std::shared_ptr<Storage>& {
    return storage_;
  }

  [[nodiscard]] auto ToString() const -> std::string;

 private:
  friend auto Allocate(const ffi::Type* typ) -> Value;
  friend auto WrapAddress(const ffi::Type* typ, void* address) -> Value;

  Value(
      const ffi::Type* type, std::byte* ptr,
      std::shared_ptr<Storage> storage);

  // Throws KindError naming method unless Kind() == expected.
  void MustBe(ffi::Kind expected, const char* method) const;

  // The single access primitive: returns the address of the value's first
  // byte after checking that size bytes from there stay inside the backing
  // Storage, when there is one.
  [[nodiscard]] auto Bytes(const char* method, size_t size) const
      -> std::byte*;

  // Child Value at byte offset from this one, sharing this Storage.
  [[nodiscard]] auto Derive(
      const char* method, const ffi::Type& type, size_t offset) const -> Value;

  const ffi::Type* type_ = nullptr;
  std::byte* ptr_ = nullptr;
  std::shared_ptr<Storage> storage_;
};

// v.Elem() for pointers, v itself otherwise.
[[nodiscard]] auto Indirect(const Value& v) -> Value;

}  // namespace ffi

template <>
struct fmt::formatter<ffi::Value> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const ffi::Value& value, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(value.ToString(), ctx);
  }
};
