#pragma once

#include <string>

#include "ffi/common/internal_error.hpp"
#include "ffi/type/kind.hpp"

namespace ffi {

// What a mismatched accessor was invoked on. Only affects the message.
enum class KindErrorSubject { kValue, kType };

// Raised when a Value or Type operation is invoked on a kind it does not
// support. kind() is Kind::kInvalid for the zero Value.
class KindError final : public InternalError {
 public:
  KindError(
      std::string method, ffi::Kind kind,
      KindErrorSubject subject = KindErrorSubject::kValue);

  [[nodiscard]] auto Method() const -> const std::string& {
    return method_;
  }

  [[nodiscard]] auto Kind() const -> ffi::Kind {
    return kind_;
  }

 private:
  std::string method_;
  ffi::Kind kind_;
};

}  // namespace ffi
