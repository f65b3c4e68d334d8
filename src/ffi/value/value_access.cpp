#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "ffi/common/internal_error.hpp"
#include "ffi/common/log.hpp"
#include "ffi/type/kind_error.hpp"
#include "ffi/value/value.hpp"

namespace ffi {

namespace {

template <typename T>
auto Load(const std::byte* p) -> T {
  T out{};
  std::memcpy(&out, p, sizeof(T));
  return out;
}

template <typename T>
void Store(std::byte* p, T x) {
  std::memcpy(p, &x, sizeof(T));
}

}  // namespace

// Scalar accessors. Each switch lists every Kind; unsupported ones fall
// through to KindError.

auto Value::Int() const -> int64_t {
  constexpr const char* kMethod = "ffi::Value::Int";
  if (type_ == nullptr) {
    throw KindError(kMethod, ffi::Kind::kInvalid);
  }
  auto k = type_->Kind();
  switch (k) {
    case ffi::Kind::kInt8:
      return Load<int8_t>(Bytes(kMethod, sizeof(int8_t)));
    case ffi::Kind::kInt16:
      return Load<int16_t>(Bytes(kMethod, sizeof(int16_t)));
    case ffi::Kind::kInt32:
      return Load<int32_t>(Bytes(kMethod, sizeof(int32_t)));
    case ffi::Kind::kInt64:
      return Load<int64_t>(Bytes(kMethod, sizeof(int64_t)));
    case ffi::Kind::kInvalid:
    case ffi::Kind::kUint8:
    case ffi::Kind::kUint16:
    case ffi::Kind::kUint32:
    case ffi::Kind::kUint64:
    case ffi::Kind::kFloat:
    case ffi::Kind::kDouble:
    case ffi::Kind::kPointer:
    case ffi::Kind::kArray:
    case ffi::Kind::kStruct:
    case ffi::Kind::kFunction:
      break;
  }
  throw KindError(kMethod, k);
}

auto Value::Uint() const -> uint64_t {
  constexpr const char* kMethod = "ffi::Value::Uint";
  if (type_ == nullptr) {
    throw KindError(kMethod, ffi::Kind::kInvalid);
  }
  auto k = type_->Kind();
  switch (k) {
    case ffi::Kind::kUint8:
      return Load<uint8_t>(Bytes(kMethod, sizeof(uint8_t)));
    case ffi::Kind::kUint16:
      return Load<uint16_t>(Bytes(kMethod, sizeof(uint16_t)));
    case ffi::Kind::kUint32:
      return Load<uint32_t>(Bytes(kMethod, sizeof(uint32_t)));
    case ffi::Kind::kUint64:
      return Load<uint64_t>(Bytes(kMethod, sizeof(uint64_t)));
    case ffi::Kind::kInvalid:
    case ffi::Kind::kInt8:
    case ffi::Kind::kInt16:
    case ffi::Kind::kInt32:
    case ffi::Kind::kInt64:
    case ffi::Kind::kFloat:
    case ffi::Kind::kDouble:
    case ffi::Kind::kPointer:
    case ffi::Kind::kArray:
    case ffi::Kind::kStruct:
    case ffi::Kind::kFunction:
      break;
  }
  throw KindError(kMethod, k);
}

auto Value::Float() const -> double {
  constexpr const char* kMethod = "ffi::Value::Float";
  if (type_ == nullptr) {
    throw KindError(kMethod, ffi::Kind::kInvalid);
  }
  auto k = type_->Kind();
  switch (k) {
    case ffi::Kind::kFloat:
      return static_cast<double>(Load<float>(Bytes(kMethod, sizeof(float))));
    case ffi::Kind::kDouble:
      return Load<double>(Bytes(kMethod, sizeof(double)));
    case ffi::Kind::kInvalid:
    case ffi::Kind::kInt8:
    case ffi::Kind::kInt16:
    case ffi::Kind::kInt32:
    case ffi::Kind::kInt64:
    case ffi::Kind::kUint8:
    case ffi::Kind::kUint16:
    case ffi::Kind::kUint32:
    case ffi::Kind::kUint64:
    case ffi::Kind::kPointer:
    case ffi::Kind::kArray:
    case ffi::Kind::kStruct:
    case ffi::Kind::kFunction:
      break;
  }
  throw KindError(kMethod, k);
}

void Value::SetInt(int64_t x) const {
  constexpr const char* kMethod = "ffi::Value::SetInt";
  if (type_ == nullptr) {
    throw KindError(kMethod, ffi::Kind::kInvalid);
  }
  auto k = type_->Kind();
  switch (k) {
    case ffi::Kind::kInt8:
      Store(Bytes(kMethod, sizeof(int8_t)), static_cast<int8_t>(x));
      return;
    case ffi::Kind::kInt16:
      Store(Bytes(kMethod, sizeof(int16_t)), static_cast<int16_t>(x));
      return;
    case ffi::Kind::kInt32:
      Store(Bytes(kMethod, sizeof(int32_t)), static_cast<int32_t>(x));
      return;
    case ffi::Kind::kInt64:
      Store(Bytes(kMethod, sizeof(int64_t)), x);
      return;
    case ffi::Kind::kInvalid:
    case ffi::Kind::kUint8:
    case ffi::Kind::kUint16:
    case ffi::Kind::kUint32:
    case ffi::Kind::kUint64:
    case ffi::Kind::kFloat:
    case ffi::Kind::kDouble:
    case ffi::Kind::kPointer:
    case ffi::Kind::kArray:
    case ffi::Kind::kStruct:
    case ffi::Kind::kFunction:
      break;
  }
  throw KindError(kMethod, k);
}

void Value::SetUint(uint64_t x) const {
  constexpr const char* kMethod = "ffi::Value::SetUint";
  if (type_ == nullptr) {
    throw KindError(kMethod, ffi::Kind::kInvalid);
  }
  auto k = type_->Kind();
  switch (k) {
    case ffi::Kind::kUint8:
      Store(Bytes(kMethod, sizeof(uint8_t)), static_cast<uint8_t>(x));
      return;
    case ffi::Kind::kUint16:
      Store(Bytes(kMethod, sizeof(uint16_t)), static_cast<uint16_t>(x));
      return;
    case ffi::Kind::kUint32:
      Store(Bytes(kMethod, sizeof(uint32_t)), static_cast<uint32_t>(x));
      return;
    case ffi::Kind::kUint64:
      Store(Bytes(kMethod, sizeof(uint64_t)), x);
      return;
    case ffi::Kind::kInvalid:
    case ffi::Kind::kInt8:
    case ffi::Kind::kInt16:
    case ffi::Kind::kInt32:
    case ffi::Kind::kInt64:
    case ffi::Kind::kFloat:
    case ffi::Kind::kDouble:
    case ffi::Kind::kPointer:
    case ffi::Kind::kArray:
    case ffi::Kind::kStruct:
    case ffi::Kind::kFunction:
      break;
  }
  throw KindError(kMethod, k);
}

void Value::SetFloat(double x) const {
  constexpr const char* kMethod = "ffi::Value::SetFloat";
  if (type_ == nullptr) {
    throw KindError(kMethod, ffi::Kind::kInvalid);
  }
  auto k = type_->Kind();
  switch (k) {
    case ffi::Kind::kFloat:
      Store(Bytes(kMethod, sizeof(float)), static_cast<float>(x));
      return;
    case ffi::Kind::kDouble:
      Store(Bytes(kMethod, sizeof(double)), x);
      return;
    case ffi::Kind::kInvalid:
    case ffi::Kind::kInt8:
    case ffi::Kind::kInt16:
    case ffi::Kind::kInt32:
    case ffi::Kind::kInt64:
    case ffi::Kind::kUint8:
    case ffi::Kind::kUint16:
    case ffi::Kind::kUint32:
    case ffi::Kind::kUint64:
    case ffi::Kind::kPointer:
    case ffi::Kind::kArray:
    case ffi::Kind::kStruct:
    case ffi::Kind::kFunction:
      break;
  }
  throw KindError(kMethod, k);
}

// Pointers

auto Value::Elem() const -> Value {
  constexpr const char* kMethod = "ffi::Value::Elem";
  MustBe(ffi::Kind::kPointer, kMethod);
  auto* target =
      static_cast<std::byte*>(Load<void*>(Bytes(kMethod, sizeof(void*))));
  const auto& elem = type_->Elem();

  // Keep the pointee's storage alive when this value knows about it;
  // otherwise the pointee is foreign memory managed by the caller.
  std::shared_ptr<Storage> owner;
  if (storage_ != nullptr && target != nullptr) {
    owner = storage_->Owner(target);
  }
  return Value(&elem, target, std::move(owner));
}

auto Value::IsNil() const -> bool {
  constexpr const char* kMethod = "ffi::Value::IsNil";
  MustBe(ffi::Kind::kPointer, kMethod);
  return Load<void*>(Bytes(kMethod, sizeof(void*))) == nullptr;
}

// Structs

auto Value::NumField() const -> int {
  MustBe(ffi::Kind::kStruct, "ffi::Value::NumField");
  return static_cast<int>(type_->NumField());
}

auto Value::Field(int i) const -> Value {
  constexpr const char* kMethod = "ffi::Value::Field";
  MustBe(ffi::Kind::kStruct, kMethod);
  auto nfields = static_cast<int>(type_->NumField());
  if (i < 0 || i >= nfields) {
    throw InternalError(
        kMethod,
        fmt::format(
            "field index {} out of range [0, {}) for {}", i, nfields, *type_));
  }
  const auto& field = type_->Field(static_cast<size_t>(i));
  return Derive(kMethod, *field.type, field.offset);
}

auto Value::FieldByIndex(std::span<const int> index) const -> Value {
  MustBe(ffi::Kind::kStruct, "ffi::Value::FieldByIndex");
  Value v = *this;
  for (size_t hop = 0; hop < index.size(); ++hop) {
    if (hop > 0 && v.Kind() == ffi::Kind::kPointer &&
        v.Type().Elem().Kind() == ffi::Kind::kStruct) {
      v = v.Elem();
    }
    v = v.Field(index[hop]);
  }
  return v;
}

auto Value::FieldByName(std::string_view name) const -> Value {
  MustBe(ffi::Kind::kStruct, "ffi::Value::FieldByName");
  const auto& fields = type_->Fields();
  for (size_t i = 0; i < fields.size(); ++i) {
    if (fields[i].name == name) {
      return Field(static_cast<int>(i));
    }
  }
  Logger().debug("FieldByName: no field '{}' in {}", name, *type_);
  return Value{};
}

// Arrays

auto Value::Index(int64_t i) const -> Value {
  constexpr const char* kMethod = "ffi::Value::Index";
  MustBe(ffi::Kind::kArray, kMethod);
  auto len = static_cast<int64_t>(type_->Len());
  // Inclusive of len: the slot one past the last element is addressable.
  // Bytes() still rejects touching it outside the backing storage.
  if (i < 0 || i > len) {
    throw InternalError(
        kMethod,
        fmt::format("array index {} out of range [0, {}] for {}", i, len,
                    *type_));
  }
  const auto& elem = type_->Elem();
  return Derive(kMethod, elem, static_cast<size_t>(i) * elem.Size());
}

auto Value::Len() const -> int64_t {
  MustBe(ffi::Kind::kArray, "ffi::Value::Len");
  return static_cast<int64_t>(type_->Len());
}

auto Value::Cap() const -> int64_t {
  MustBe(ffi::Kind::kArray, "ffi::Value::Cap");
  return static_cast<int64_t>(type_->Len());
}

}  // namespace ffi
