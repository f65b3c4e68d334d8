#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace ffi {

// Exception type for precondition violations (caller bugs, not recoverable
// runtime conditions). Raised by accessors invoked on the wrong kind, by
// out-of-range indices and construction from a null Type.
class InternalError : public std::logic_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::logic_error(fmt::format("ffi: {}: {}", context, detail)) {
  }

 protected:
  explicit InternalError(const std::string& message)
      : std::logic_error(message) {
  }
};

}  // namespace ffi
