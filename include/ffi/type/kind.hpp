#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

#include <fmt/format.h>

namespace ffi {

// Shape tag of a foreign datum. kInvalid is the tag reported for the zero
// Value and is never carried by a Type.
enum class Kind : uint8_t {
  kInvalid = 0,
  kInt8,
  kInt16,
  kInt32,
  kInt64,
  kUint8,
  kUint16,
  kUint32,
  kUint64,
  kFloat,
  kDouble,
  kPointer,
  kArray,
  kStruct,
  kFunction,  // Reserved: no Value accessor consumes it
};

inline constexpr int kKindBits = 5;
inline constexpr int kNumKinds = static_cast<int>(Kind::kFunction) + 1;
static_assert(kNumKinds <= (1 << kKindBits), "Kind must fit in 5 bits");

auto ToString(Kind kind) -> std::string_view;

// Byte width of a kind whose width does not depend on composition.
// Returns nullopt for kArray, kStruct and kInvalid.
auto IntrinsicSize(Kind kind) -> std::optional<size_t>;

[[nodiscard]] constexpr auto IsSignedInt(Kind kind) -> bool {
  return kind >= Kind::kInt8 && kind <= Kind::kInt64;
}

[[nodiscard]] constexpr auto IsUnsignedInt(Kind kind) -> bool {
  return kind >= Kind::kUint8 && kind <= Kind::kUint64;
}

[[nodiscard]] constexpr auto IsFloat(Kind kind) -> bool {
  return kind == Kind::kFloat || kind == Kind::kDouble;
}

[[nodiscard]] constexpr auto IsScalar(Kind kind) -> bool {
  return IsSignedInt(kind) || IsUnsignedInt(kind) || IsFloat(kind);
}

inline auto operator<<(std::ostream& os, Kind kind) -> std::ostream& {
  return os << ToString(kind);
}

}  // namespace ffi

template <>
struct fmt::formatter<ffi::Kind> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(ffi::Kind kind, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(ffi::ToString(kind), ctx);
  }
};
