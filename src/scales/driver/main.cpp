#include <argparse/argparse.hpp>
#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "print.hpp"
#include "scales/common/error.hpp"
#include "scales/config/config.hpp"
#include "scales/engine/registry.hpp"
#include "scales/engine/test_result.hpp"
#include "scales/log/logger.hpp"
#include "scales/problem/loader.hpp"
#include "scales/problem/problem.hpp"

namespace {

namespace fs = std::filesystem;

// Exit code for engine, usage and I/O errors.
constexpr int kEngineError = 2;

auto LoadEngineConfig(const argparse::ArgumentParser& program)
    -> scales::Result<scales::config::EngineConfig> {
  std::optional<fs::path> config_path;
  if (auto explicit_path = program.present("--config")) {
    config_path = fs::path(*explicit_path);
  } else {
    config_path = scales::config::FindConfig();
  }

  scales::config::EngineConfig config;
  if (config_path) {
    auto loaded = scales::config::LoadConfig(*config_path);
    if (!loaded) {
      return loaded;
    }
    config = std::move(*loaded);
    scales::log::Logger()->info("using config {}", config_path->string());
  }
  scales::config::ApplyEnvironment(config);
  return config;
}

// Accepts a problem file path, or an id looked up in the catalog next to
// scales.toml (the current directory without one).
auto ResolveProblem(
    const std::string& problem_arg, const scales::config::EngineConfig& config)
    -> scales::Result<scales::Problem> {
  fs::path as_path(problem_arg);
  if (fs::is_regular_file(as_path)) {
    return scales::LoadProblem(as_path);
  }
  auto root = config.root_dir.empty() ? fs::current_path() : config.root_dir;
  auto found = scales::FindProblem(root, problem_arg);
  if (!found) {
    return std::unexpected(std::move(found.error()));
  }
  return scales::LoadProblem(*found);
}

auto ReadSolution(const std::string& path) -> scales::Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(scales::Error::Setup(
        std::format("cannot open solution file '{}'", path)));
  }
  std::ostringstream text;
  text << in.rdbuf();
  return text.str();
}

auto EffectiveTimeout(
    const argparse::ArgumentParser& cmd,
    const scales::config::EngineConfig& config) -> std::chrono::milliseconds {
  if (auto ms = cmd.present<int>("-t")) {
    return std::chrono::milliseconds(*ms);
  }
  return config.timeout;
}

auto RunCommand(
    const argparse::ArgumentParser& program,
    const argparse::ArgumentParser& cmd) -> int {
  auto config = LoadEngineConfig(program);
  if (!config) {
    scales::driver::PrintError(config.error());
    return kEngineError;
  }

  auto problem = ResolveProblem(cmd.get<std::string>("-p"), *config);
  if (!problem) {
    scales::driver::PrintError(problem.error());
    return kEngineError;
  }

  auto code = ReadSolution(cmd.get<std::string>("solution"));
  if (!code) {
    scales::driver::PrintError(code.error());
    return kEngineError;
  }

  auto timeout = EffectiveTimeout(cmd, *config);
  if (timeout.count() <= 0) {
    scales::driver::PrintError("timeout must be positive");
    return kEngineError;
  }

  auto registry = scales::MakeDefaultRegistry(*config);
  auto language = cmd.get<std::string>("-l");
  auto outcome = scales::ExecuteTests(
      *registry, *problem, *code, language, timeout);
  scales::driver::PrintOutcome(problem->id, outcome);
  return scales::driver::ExitCodeFor(outcome);
}

auto HarnessCommand(
    const argparse::ArgumentParser& program,
    const argparse::ArgumentParser& cmd) -> int {
  auto config = LoadEngineConfig(program);
  if (!config) {
    scales::driver::PrintError(config.error());
    return kEngineError;
  }

  auto problem = ResolveProblem(cmd.get<std::string>("-p"), *config);
  if (!problem) {
    scales::driver::PrintError(problem.error());
    return kEngineError;
  }

  auto code = ReadSolution(cmd.get<std::string>("solution"));
  if (!code) {
    scales::driver::PrintError(code.error());
    return kEngineError;
  }

  auto registry = scales::MakeDefaultRegistry(*config);
  auto language = scales::NormalizeLanguage(cmd.get<std::string>("-l"));
  auto runner = registry->GetRunner(language);
  if (!runner) {
    scales::driver::PrintError(runner.error());
    return kEngineError;
  }

  auto source = (*runner)->GenerateTestCode(*problem, *code);
  if (!source) {
    scales::driver::PrintError(source.error());
    return kEngineError;
  }
  std::cout << *source;
  return 0;
}

auto LanguagesCommand(const argparse::ArgumentParser& program) -> int {
  auto config = LoadEngineConfig(program);
  if (!config) {
    scales::driver::PrintError(config.error());
    return kEngineError;
  }

  auto registry = scales::MakeDefaultRegistry(*config);
  for (const auto& language : registry->GetSupportedLanguages()) {
    std::cout << language << "\n";
  }
  return 0;
}

// Runs the problem's reference solutions against its own test cases.
auto VerifyCommand(
    const argparse::ArgumentParser& program,
    const argparse::ArgumentParser& cmd) -> int {
  auto config = LoadEngineConfig(program);
  if (!config) {
    scales::driver::PrintError(config.error());
    return kEngineError;
  }

  auto problem = ResolveProblem(cmd.get<std::string>("-p"), *config);
  if (!problem) {
    scales::driver::PrintError(problem.error());
    return kEngineError;
  }

  auto registry = scales::MakeDefaultRegistry(*config);
  std::optional<std::string> only;
  if (auto language = cmd.present("-l")) {
    only = scales::NormalizeLanguage(*language);
  }

  int exit_code = 0;
  size_t verified = 0;
  for (const auto& [language, code] : problem->solutions) {
    auto normalized = scales::NormalizeLanguage(language);
    if (only && normalized != *only) {
      continue;
    }
    if (!registry->GetRunner(normalized)) {
      scales::driver::PrintWarning(
          std::format("skipping solution in unsupported language '{}'",
                      language));
      continue;
    }
    ++verified;
    auto outcome = scales::ExecuteTests(
        *registry, *problem, code, normalized, config->timeout);
    scales::driver::PrintOutcome(
        std::format("{} [{}]", problem->id, normalized), outcome);
    exit_code = std::max(exit_code, scales::driver::ExitCodeFor(outcome));
  }

  if (verified == 0) {
    scales::driver::PrintError(
        only ? std::format(
                   "problem '{}' has no {} solution", problem->id, *only)
             : std::format(
                   "problem '{}' has no runnable solutions", problem->id));
    return kEngineError;
  }
  return exit_code;
}

void AddProblemFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("-p", "--problem")
      .required()
      .help("Problem file, or problem id searched under problems/");
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  int verbosity = 0;

  // -v is taken by verbosity, so no built-in --version flag
  argparse::ArgumentParser program(
      "scales", "0.1.0", argparse::default_arguments::help);
  program.add_description("Run solutions against problem test cases");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("--config")
      .help("Config file (default: nearest scales.toml)")
      .metavar("path");
  program.add_argument("-v", "--verbose")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Increase log verbosity (repeatable)");

  // Subcommand: run
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Execute a solution against a problem's tests");
  run_cmd.add_argument("-l", "--language").required().help("Language id");
  AddProblemFlags(run_cmd);
  run_cmd.add_argument("-t", "--timeout")
      .scan<'i', int>()
      .help("Timeout in milliseconds (overrides scales.toml)");
  run_cmd.add_argument("solution").help("Solution source file");

  // Subcommand: harness
  argparse::ArgumentParser harness_cmd("harness");
  harness_cmd.add_description(
      "Print the generated test harness (for debugging)");
  harness_cmd.add_argument("-l", "--language").required().help("Language id");
  AddProblemFlags(harness_cmd);
  harness_cmd.add_argument("solution").help("Solution source file");

  // Subcommand: languages
  argparse::ArgumentParser languages_cmd("languages");
  languages_cmd.add_description("List supported languages");

  // Subcommand: verify
  argparse::ArgumentParser verify_cmd("verify");
  verify_cmd.add_description("Run a problem's reference solutions");
  AddProblemFlags(verify_cmd);
  verify_cmd.add_argument("-l", "--language")
      .help("Only verify the solution in this language");

  program.add_subparser(run_cmd);
  program.add_subparser(harness_cmd);
  program.add_subparser(languages_cmd);
  program.add_subparser(verify_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    scales::driver::PrintError(err.what());
    std::cerr << program;
    return kEngineError;
  }

  scales::log::SetVerbosity(verbosity);

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      scales::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return kEngineError;
    }
  }

  try {
    if (program.is_subcommand_used("run")) {
      return RunCommand(program, run_cmd);
    }
    if (program.is_subcommand_used("harness")) {
      return HarnessCommand(program, harness_cmd);
    }
    if (program.is_subcommand_used("languages")) {
      return LanguagesCommand(program);
    }
    if (program.is_subcommand_used("verify")) {
      return VerifyCommand(program, verify_cmd);
    }
  } catch (const scales::ErrorException& e) {
    scales::driver::PrintError(e.GetError());
    return kEngineError;
  } catch (const std::exception& e) {
    scales::driver::PrintError(e.what());
    return kEngineError;
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
