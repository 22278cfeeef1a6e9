#pragma once

#include <filesystem>
#include <string>

#include "scales/common/error.hpp"
#include "scales/problem/problem.hpp"

namespace scales {

// Load a problem file. JSON catalog files load unchanged since YAML is a
// superset of JSON.
auto LoadProblem(const std::filesystem::path& path) -> Result<Problem>;

// Locate <root>/problems/<pattern>/<id>.json (or .yaml) for a problem id.
auto FindProblem(const std::filesystem::path& root, const std::string& id)
    -> Result<std::filesystem::path>;

}  // namespace scales
