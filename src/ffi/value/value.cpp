#include "ffi/value/value.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "ffi/common/internal_error.hpp"
#include "ffi/common/log.hpp"
#include "ffi/config/runtime_config.hpp"
#include "ffi/type/kind_error.hpp"
#include "ffi/type/type_arena.hpp"

namespace ffi {

Value::Value(
    const ffi::Type* type, std::byte* ptr, std::shared_ptr<Storage> storage)
    : type_(type), ptr_(ptr), storage_(std::move(storage)) {
}

auto Allocate(const Type* typ) -> Value {
  if (typ == nullptr) {
    throw InternalError("ffi::Allocate", "nil type");
  }
  auto storage =
      Storage::Create(typ->Size(), config::CurrentConfig().alignment);
  auto* data = storage->Data();
  return Value(typ, data, std::move(storage));
}

auto WrapAddress(const Type* typ, void* address) -> Value {
  if (typ == nullptr) {
    Logger().warn("WrapAddress: nil type, returning invalid Value");
    return Value{};
  }
  auto ptr_type = PointerTo(typ);
  if (!ptr_type) {
    Logger().warn("WrapAddress: {}", ptr_type.error());
    return Value{};
  }
  Logger().trace("wrapped {} slot at {}", **ptr_type, address);
  return Value(*ptr_type, static_cast<std::byte*>(address), nullptr);
}

auto Indirect(const Value& v) -> Value {
  if (v.Kind() != ffi::Kind::kPointer) {
    return v;
  }
  return v.Elem();
}

auto Value::Kind() const -> ffi::Kind {
  if (type_ == nullptr) {
    throw KindError("ffi::Value::Kind", ffi::Kind::kInvalid);
  }
  return type_->Kind();
}

auto Value::Type() const -> const ffi::Type& {
  if (type_ == nullptr) {
    throw KindError("ffi::Value::Type", ffi::Kind::kInvalid);
  }
  return *type_;
}

void Value::MustBe(ffi::Kind expected, const char* method) const {
  if (type_ == nullptr) {
    throw KindError(method, ffi::Kind::kInvalid);
  }
  if (type_->Kind() != expected) {
    throw KindError(method, type_->Kind());
  }
}

auto Value::Bytes(const char* method, size_t size) const -> std::byte* {
  if (type_ == nullptr) {
    throw KindError(method, ffi::Kind::kInvalid);
  }
  if (ptr_ == nullptr && size > 0) {
    throw InternalError(
        method, fmt::format("access of {} through nil address", *type_));
  }
  if (storage_ != nullptr && !storage_->Contains(ptr_, size)) {
    throw InternalError(
        method,
        fmt::format(
            "access of {} bytes at {} outside backing storage {} (+{})",
            size, static_cast<const void*>(ptr_),
            static_cast<const void*>(storage_->Data()), storage_->Size()));
  }
  return ptr_;
}

auto Value::Derive(const char* method, const ffi::Type& type, size_t offset)
    const -> Value {
  if (ptr_ == nullptr) {
    throw InternalError(
        method, fmt::format("navigation through nil {}", *type_));
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return Value(&type, ptr_ + offset, storage_);
}

auto Value::Addr() const -> Value {
  if (type_ == nullptr) {
    throw KindError("ffi::Value::Addr", ffi::Kind::kInvalid);
  }
  auto ptr_type = PointerTo(type_);
  if (!ptr_type) {
    Logger().warn("Addr: {}", ptr_type.error());
    return Value{};
  }

  // A C++ object has no stable address to hand out, so the pointer lives in
  // a cell of its own that keeps the pointee's storage alive.
  auto cell = Storage::Create(sizeof(void*), alignof(void*));
  void* target = ptr_;
  std::memcpy(cell->Data(), &target, sizeof(target));
  cell->Retain(storage_);
  auto* slot = cell->Data();
  return Value(*ptr_type, slot, std::move(cell));
}

auto Value::Buffer() const -> std::span<std::byte> {
  size_t size = Type().Size();
  return {Bytes("ffi::Value::Buffer", size), size};
}

auto Value::UnsafeAddr() const -> uintptr_t {
  if (type_ == nullptr) {
    throw KindError("ffi::Value::UnsafeAddr", ffi::Kind::kInvalid);
  }
  return reinterpret_cast<uintptr_t>(ptr_);
}

auto Value::ToString() const -> std::string {
  if (type_ == nullptr) {
    return "<invalid Value>";
  }
  auto kind = type_->Kind();
  bool readable = ptr_ != nullptr &&
                  (storage_ == nullptr ||
                   storage_->Contains(ptr_, type_->Size()));
  if (!readable) {
    return fmt::format("<{} at {}>", *type_, static_cast<const void*>(ptr_));
  }
  if (IsSignedInt(kind)) {
    return fmt::format("{}({})", *type_, Int());
  }
  if (IsUnsignedInt(kind)) {
    return fmt::format("{}({})", *type_, Uint());
  }
  if (IsFloat(kind)) {
    return fmt::format("{}({})", *type_, Float());
  }
  if (kind == ffi::Kind::kPointer) {
    return fmt::format(
        "{}({})", *type_, reinterpret_cast<const void*>(Elem().UnsafeAddr()));
  }
  return fmt::format("<{} at {}>", *type_, static_cast<const void*>(ptr_));
}

}  // namespace ffi
