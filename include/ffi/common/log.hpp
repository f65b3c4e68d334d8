#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace ffi {

inline constexpr const char* kLoggerName = "ffi";

// Process-wide logger for the runtime. Writes to stderr so that stdout stays
// free for the host program. Created on first use at level warn; the level
// is changed through ApplyConfig.
auto Logger() -> spdlog::logger&;

}  // namespace ffi
