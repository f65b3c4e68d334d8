#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace ffi::config {

inline constexpr const char* kConfigFileName = "ffi.toml";

struct RuntimeConfig {
  // [log]
  spdlog::level::level_enum log_level = spdlog::level::warn;

  // [allocator]
  // Alignment of buffers returned by Allocate. Always a power of two.
  size_t alignment = alignof(std::max_align_t);

  // Path of the file the settings came from; empty for defaults.
  std::filesystem::path source;
};

// Nearest regular file named ffi.toml in start_dir or one of its ancestors.
// Entries of another type are skipped. A directory that cannot be inspected
// ends the search with nullopt.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse ffi.toml. Every section is optional; present keys must be valid.
auto LoadConfig(const std::filesystem::path& config_path)
    -> std::expected<RuntimeConfig, std::string>;

// Make config the active process-wide settings and set the logger level.
void ApplyConfig(const RuntimeConfig& config);

// The settings last passed to ApplyConfig, or the defaults.
auto CurrentConfig() -> RuntimeConfig;

}  // namespace ffi::config
