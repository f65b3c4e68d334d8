#include "ffi/type/kind_error.hpp"

#include <string>
#include <utility>

#include <fmt/core.h>

namespace ffi {

namespace {

auto FormatKindError(
    const std::string& method, Kind kind, KindErrorSubject subject)
    -> std::string {
  const char* noun = subject == KindErrorSubject::kType ? "Type" : "Value";
  if (kind == Kind::kInvalid) {
    return fmt::format("ffi: call of {} on zero {}", method, noun);
  }
  return fmt::format("ffi: call of {} on {} {}", method, kind, noun);
}

}  // namespace

KindError::KindError(std::string method, ffi::Kind kind, KindErrorSubject subject)
    : InternalError(FormatKindError(method, kind, subject)),
      method_(std::move(method)),
      kind_(kind) {
}

}  // namespace ffi
