#include "ffi/type/kind.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace ffi {

auto ToString(Kind kind) -> std::string_view {
  switch (kind) {
    case Kind::kInvalid:
      return "invalid";
    case Kind::kInt8:
      return "int8";
    case Kind::kInt16:
      return "int16";
    case Kind::kInt32:
      return "int32";
    case Kind::kInt64:
      return "int64";
    case Kind::kUint8:
      return "uint8";
    case Kind::kUint16:
      return "uint16";
    case Kind::kUint32:
      return "uint32";
    case Kind::kUint64:
      return "uint64";
    case Kind::kFloat:
      return "float";
    case Kind::kDouble:
      return "double";
    case Kind::kPointer:
      return "pointer";
    case Kind::kArray:
      return "array";
    case Kind::kStruct:
      return "struct";
    case Kind::kFunction:
      return "func";
  }
  return "unknown";
}

auto IntrinsicSize(Kind kind) -> std::optional<size_t> {
  switch (kind) {
    case Kind::kInt8:
    case Kind::kUint8:
      return 1;
    case Kind::kInt16:
    case Kind::kUint16:
      return 2;
    case Kind::kInt32:
    case Kind::kUint32:
    case Kind::kFloat:
      return 4;
    case Kind::kInt64:
    case Kind::kUint64:
    case Kind::kDouble:
      return 8;
    // A function type stands for a code address, as in C.
    case Kind::kPointer:
    case Kind::kFunction:
      return sizeof(void*);
    case Kind::kInvalid:
    case Kind::kArray:
    case Kind::kStruct:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace ffi
