#pragma once

#include <string>

#include "scales/common/error.hpp"
#include "scales/engine/test_result.hpp"

namespace scales::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);

// Error message followed by its notes.
void PrintError(const Error& error);

// Per-test report on stdout followed by a pass count summary.
void PrintOutcome(const std::string& label, const ExecutionOutcome& outcome);

// 0 when every test passed, 1 when some failed, 2 on an engine error.
auto ExitCodeFor(const ExecutionOutcome& outcome) -> int;

}  // namespace scales::driver
