#include "ffi/config/runtime_config.hpp"

#include <bit>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

#include <fmt/core.h>
#include <spdlog/common.h>

#include "ffi/common/log.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace ffi::config {

namespace fs = std::filesystem;

namespace {

std::mutex g_config_mutex;
RuntimeConfig g_config;

auto ParseLogLevel(const std::string& name)
    -> std::optional<spdlog::level::level_enum> {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;
  return std::nullopt;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  std::error_code ec;
  fs::path dir = fs::weakly_canonical(fs::absolute(start_dir), ec);
  if (ec) {
    dir = fs::absolute(start_dir);
  }

  for (; !dir.empty(); dir = dir.parent_path()) {
    fs::path candidate = dir / kConfigFileName;
    auto status = fs::status(candidate, ec);
    if (ec && ec != std::errc::no_such_file_or_directory &&
        ec != std::errc::not_a_directory) {
      Logger().debug(
          "stopping config search at {}: {}", dir.string(), ec.message());
      return std::nullopt;
    }
    if (fs::is_regular_file(status)) {
      Logger().debug("found config {}", candidate.string());
      return candidate;
    }
    if (dir == dir.root_path()) {
      break;
    }
  }
  return std::nullopt;
}

auto LoadConfig(const fs::path& config_path)
    -> std::expected<RuntimeConfig, std::string> {
  RuntimeConfig config;
  config.source = config_path;

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        fmt::format("failed to parse {}: {}", config_path.string(), e.what()));
  }

  // [log] section (optional)
  if (auto log_section = tbl["log"]) {
    if (auto level_node = log_section["level"]) {
      auto level_name = level_node.value<std::string>();
      if (!level_name) {
        return std::unexpected(
            fmt::format(
                "{}: 'log.level' must be a string", config_path.string()));
      }
      auto level = ParseLogLevel(*level_name);
      if (!level) {
        return std::unexpected(
            fmt::format(
                "{}: unknown log level '{}'", config_path.string(),
                *level_name));
      }
      config.log_level = *level;
    }
  }

  // [allocator] section (optional)
  if (auto allocator = tbl["allocator"]) {
    if (auto alignment_node = allocator["alignment"]) {
      auto alignment = alignment_node.value<int64_t>();
      if (!alignment || *alignment <= 0 ||
          !std::has_single_bit(static_cast<uint64_t>(*alignment))) {
        return std::unexpected(
            fmt::format(
                "{}: 'allocator.alignment' must be a positive power of two",
                config_path.string()));
      }
      config.alignment = static_cast<size_t>(*alignment);
    }
  }

  return config;
}

void ApplyConfig(const RuntimeConfig& config) {
  {
    std::lock_guard lock(g_config_mutex);
    g_config = config;
  }
  Logger().set_level(config.log_level);
  Logger().info(
      "applied config from {} (log level {}, alignment {})",
      config.source.empty() ? std::string("defaults") : config.source.string(),
      spdlog::level::to_string_view(config.log_level), config.alignment);
}

auto CurrentConfig() -> RuntimeConfig {
  std::lock_guard lock(g_config_mutex);
  return g_config;
}

}  // namespace ffi::config
