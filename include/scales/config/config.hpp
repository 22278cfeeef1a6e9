#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "scales/common/error.hpp"

namespace scales::config {

// Test execution timeouts, matching the catalog's deployment presets.
enum class TimeoutProfile {
  kDefault,      // 30s
  kDevelopment,  // 60s
  kProduction,   // 20s
};

auto ParseTimeoutProfile(std::string_view name)
    -> std::optional<TimeoutProfile>;
auto ProfileTimeout(TimeoutProfile profile) -> std::chrono::milliseconds;

struct EngineConfig {
  TimeoutProfile profile = TimeoutProfile::kDefault;
  std::chrono::milliseconds timeout = ProfileTimeout(TimeoutProfile::kDefault);
  size_t max_output_bytes = size_t{1} << 20;
  std::string default_function = "solution";
  bool keep_temp = false;

  // language -> command override ("{file}" and "{dir}" are substituted)
  std::map<std::string, std::vector<std::string>> commands;

  // Directory where scales.toml was found (empty for built-in defaults)
  std::filesystem::path root_dir;
};

inline constexpr std::string_view kConfigFileName = "scales.toml";

// Search for scales.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse scales.toml. Missing sections keep their defaults.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<EngineConfig>;

// Parse config text; `source` names the document in error messages.
auto ParseConfig(std::string_view text, std::string_view source)
    -> Result<EngineConfig>;

// Apply environment overrides (SCALES_KEEP_TMP).
void ApplyEnvironment(EngineConfig& config);

}  // namespace scales::config
