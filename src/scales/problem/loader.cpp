#include "scales/problem/loader.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <expected>
#include <filesystem>
#include <format>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "scales/common/error.hpp"
#include "scales/problem/problem.hpp"

namespace scales {

namespace {

namespace fs = std::filesystem;

auto FormatLocation(const std::string& path, const YAML::Mark& mark)
    -> std::string {
  return std::format("{}:{}", path, mark.line + 1);
}

// Scalars keep their source text; structured values (an expected array
// written unquoted in YAML) are re-emitted in flow style.
auto NodeToText(const YAML::Node& node) -> std::string {
  if (node.IsScalar()) {
    return node.Scalar();
  }
  YAML::Emitter out;
  out.SetSeqFormat(YAML::Flow);
  out.SetMapFormat(YAML::Flow);
  out << node;
  return out.c_str();
}

auto ReadLanguageMap(
    const YAML::Node& node, std::string_view field, const std::string& path)
    -> Result<std::map<std::string, std::string>> {
  std::map<std::string, std::string> result;
  if (!node) {
    return result;
  }
  if (!node.IsMap()) {
    return std::unexpected(
        Error::Catalog(
            std::format(
                "{}: '{}' must be a map of language to code",
                FormatLocation(path, node.Mark()), field)));
  }
  for (const auto& pair : node) {
    result[pair.first.as<std::string>()] = pair.second.as<std::string>("");
  }
  return result;
}

}  // namespace

auto LoadProblem(const fs::path& path) -> Result<Problem> {
  const auto path_str = path.string();
  YAML::Node root;
  try {
    // NOLINTNEXTLINE(misc-include-cleaner): LoadFile is provided by yaml.h
    root = YAML::LoadFile(path_str);
  } catch (const YAML::BadFile&) {
    return std::unexpected(
        Error::Catalog(std::format("cannot open problem file '{}'", path_str)));
  } catch (const YAML::ParserException& e) {
    return std::unexpected(
        Error::Catalog(
            std::format("failed to parse {}: {}", path_str, e.what())));
  }

  if (!root.IsMap()) {
    return std::unexpected(
        Error::Catalog(
            std::format("{}: problem file must be an object", path_str)));
  }

  Problem problem;
  try {
    problem.id = root["id"].as<std::string>("");
    problem.title = root["title"].as<std::string>("");
    if (problem.id.empty()) {
      problem.id = path.stem().string();
    }

    const auto& cases = root["test_cases"];
    if (cases && !cases.IsSequence()) {
      return std::unexpected(
          Error::Catalog(
              std::format(
                  "{}: 'test_cases' must be a list",
                  FormatLocation(path_str, cases.Mark()))));
    }
    for (const auto& node : cases) {
      if (!node.IsMap() || !node["input"] || !node["expected"]) {
        return std::unexpected(
            Error::Catalog(
                std::format(
                    "{}: test case needs 'input' and 'expected'",
                    FormatLocation(path_str, node.Mark()))));
      }
      problem.test_cases.push_back(
          TestCase{
              .input = NodeToText(node["input"]),
              .expected = NodeToText(node["expected"]),
          });
    }

    auto starter =
        ReadLanguageMap(root["starter_code"], "starter_code", path_str);
    if (!starter) {
      return std::unexpected(std::move(starter.error()));
    }
    problem.starter_code = std::move(*starter);

    auto solutions = ReadLanguageMap(root["solutions"], "solutions", path_str);
    if (!solutions) {
      return std::unexpected(std::move(solutions.error()));
    }
    problem.solutions = std::move(*solutions);
  } catch (const YAML::Exception& e) {
    return std::unexpected(
        Error::Catalog(std::format("{}: {}", path_str, e.what())));
  }

  return problem;
}

auto FindProblem(const fs::path& root, const std::string& id)
    -> Result<fs::path> {
  constexpr std::array<std::string_view, 3> kExtensions = {
      ".json", ".yaml", ".yml"};
  auto problems_dir = root / "problems";
  std::error_code ec;
  if (!fs::is_directory(problems_dir, ec)) {
    return std::unexpected(
        Error::Catalog(
            std::format(
                "problem directory not found: {}", problems_dir.string())));
  }

  // Sorted so that lookups are deterministic across filesystems
  std::vector<fs::path> pattern_dirs;
  for (const auto& entry : fs::directory_iterator(problems_dir, ec)) {
    if (entry.is_directory()) {
      pattern_dirs.push_back(entry.path());
    }
  }
  std::ranges::sort(pattern_dirs);

  for (const auto& dir : pattern_dirs) {
    for (auto ext : kExtensions) {
      auto candidate = dir / (id + std::string(ext));
      if (fs::exists(candidate, ec)) {
        return candidate;
      }
    }
  }
  return std::unexpected(
      Error::Catalog(std::format("problem not found: {}", id)));
}

}  // namespace scales
