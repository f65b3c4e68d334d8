#include "ffi/common/log.hpp"

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ffi {

auto Logger() -> spdlog::logger& {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    auto existing = spdlog::get(kLoggerName);
    if (existing) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[ffi][%H:%M:%S][%l] %v");
    return created;
  }();
  return *logger;
}

}  // namespace ffi
