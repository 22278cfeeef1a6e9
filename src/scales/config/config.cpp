#include "scales/config/config.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.hpp>

#include "scales/common/error.hpp"

namespace scales::config {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 5> kEngineKeys = {
    "profile", "timeout_ms", "max_output_bytes", "default_function",
    "keep_temp"};

auto ValidEngineKeys() -> std::string {
  std::string out;
  for (auto key : kEngineKeys) {
    if (!out.empty()) {
      out += ", ";
    }
    out += key;
  }
  return out;
}

auto FormatLocation(std::string_view source, const toml::source_region& region)
    -> std::string {
  return std::format("{}:{}", source, region.begin.line);
}

auto ParseEngineTable(
    const toml::table& engine, std::string_view source, EngineConfig& config)
    -> Result<void> {
  for (auto&& [key, node] : engine) {
    if (std::ranges::find(kEngineKeys, key.str()) == kEngineKeys.end()) {
      return std::unexpected(
          Error::Config(
              std::format(
                  "{}: unknown field '{}' in [engine]",
                  FormatLocation(source, node.source()), key.str()))
              .WithNote(
                  std::format("valid fields are: {}", ValidEngineKeys())));
    }
  }

  if (auto node = engine["profile"]) {
    auto name = node.value<std::string>();
    auto profile = name ? ParseTimeoutProfile(*name) : std::nullopt;
    if (!profile) {
      return std::unexpected(
          Error::Config(
              std::format(
                  "{}: 'engine.profile' must be one of default, development, "
                  "production",
                  source)));
    }
    config.profile = *profile;
    config.timeout = ProfileTimeout(*profile);
  }

  // An explicit timeout wins over the profile preset
  if (auto node = engine["timeout_ms"]) {
    auto ms = node.value<int64_t>();
    if (!ms || *ms <= 0) {
      return std::unexpected(
          Error::Config(
              std::format(
                  "{}: 'engine.timeout_ms' must be a positive integer",
                  source)));
    }
    config.timeout = std::chrono::milliseconds(*ms);
  }

  if (auto node = engine["max_output_bytes"]) {
    auto bytes = node.value<int64_t>();
    if (!bytes || *bytes <= 0) {
      return std::unexpected(
          Error::Config(
              std::format(
                  "{}: 'engine.max_output_bytes' must be a positive integer",
                  source)));
    }
    config.max_output_bytes = static_cast<size_t>(*bytes);
  }

  if (auto name = engine["default_function"].value<std::string>()) {
    config.default_function = *name;
  }
  if (auto keep = engine["keep_temp"].value<bool>()) {
    config.keep_temp = *keep;
  }
  return {};
}

auto ParseLanguagesTable(
    const toml::table& languages, std::string_view source,
    EngineConfig& config) -> Result<void> {
  for (auto&& [key, node] : languages) {
    std::string language(key.str());
    const auto* table = node.as_table();
    const auto* command =
        table != nullptr ? (*table)["command"].as_array() : nullptr;
    if (command == nullptr || command->empty()) {
      return std::unexpected(
          Error::Config(
              std::format(
                  "{}: 'languages.{}.command' must be a non-empty list",
                  FormatLocation(source, node.source()), language)));
    }
    std::vector<std::string> argv;
    for (const auto& elem : *command) {
      auto str = elem.value<std::string>();
      if (!str) {
        return std::unexpected(
            Error::Config(
                std::format(
                    "{}: 'languages.{}.command' must contain strings",
                    FormatLocation(source, elem.source()), language)));
      }
      argv.push_back(*str);
    }
    config.commands[language] = std::move(argv);
  }
  return {};
}

}  // namespace

auto ParseTimeoutProfile(std::string_view name)
    -> std::optional<TimeoutProfile> {
  if (name == "default") {
    return TimeoutProfile::kDefault;
  }
  if (name == "development") {
    return TimeoutProfile::kDevelopment;
  }
  if (name == "production") {
    return TimeoutProfile::kProduction;
  }
  return std::nullopt;
}

auto ProfileTimeout(TimeoutProfile profile) -> std::chrono::milliseconds {
  using std::chrono::seconds;
  switch (profile) {
    case TimeoutProfile::kDefault:
      return seconds(30);
    case TimeoutProfile::kDevelopment:
      return seconds(60);
    case TimeoutProfile::kProduction:
      return seconds(20);
  }
  return seconds(30);
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto ParseConfig(std::string_view text, std::string_view source)
    -> Result<EngineConfig> {
  EngineConfig config;

  toml::table tbl;
  try {
    tbl = toml::parse(text, source);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Error::Config(
            std::format(
                "failed to parse {}: {}", source, e.description())));
  }

  if (auto* engine = tbl["engine"].as_table()) {
    if (auto parsed = ParseEngineTable(*engine, source, config); !parsed) {
      return std::unexpected(std::move(parsed.error()));
    }
  }

  if (auto* languages = tbl["languages"].as_table()) {
    if (auto parsed = ParseLanguagesTable(*languages, source, config);
        !parsed) {
      return std::unexpected(std::move(parsed.error()));
    }
  }

  return config;
}

auto LoadConfig(const fs::path& config_path) -> Result<EngineConfig> {
  std::ifstream in(config_path);
  if (!in) {
    return std::unexpected(
        Error::Config(
            std::format("cannot open config file '{}'", config_path.string())));
  }
  std::ostringstream text;
  text << in.rdbuf();

  auto config = ParseConfig(text.str(), config_path.string());
  if (config) {
    config->root_dir = config_path.parent_path();
  }
  return config;
}

void ApplyEnvironment(EngineConfig& config) {
  if (std::getenv("SCALES_KEEP_TMP") != nullptr) {
    config.keep_temp = true;
  }
}

}  // namespace scales::config
