#ifndef CODEJUDGE_TOOLS_RUNNER_H_
#define CODEJUDGE_TOOLS_RUNNER_H_

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// everything a language needs to build its commands
struct RunContext {
  fs::path workdir; // private copy of the source lives here
  std::string source; // file name inside workdir
  std::string stem; // source without extension
  int timeout; // seconds
  int memory_limit; // MB
};

using CommandBuilder = std::vector<std::string> (*)(const RunContext&);
using PathBuilder = std::string (*)(const RunContext&);

struct LanguageSpec {
  const char* display_name;
  std::vector<std::string> extensions; // with the leading dot
  // compiled languages print COMPILATION; interpreted ones print SYNTAX CHECK
  bool compiled;
  int check_timeout; // seconds
  CommandBuilder check_command;
  CommandBuilder run_command;
  // file the check phase must produce, relative to workdir; nullptr for none
  PathBuilder artifact;
  // runtimes reserving huge virtual memory (JVM, V8, Go) cannot run under RLIMIT_AS
  bool limit_address_space;
  int max_processes;
  // appended to the environment of both phases; ${WORKDIR} is replaced by the work directory
  std::vector<std::string> extra_env;
  // extra "Key: value" lines of the resource usage section
  std::vector<std::string> resource_lines;
};

// Implements the runner protocol: <source> [input] [timeout=5] [memory_mb=128].
// Returns the process exit code.
int RunnerMain(int argc, char** argv, const LanguageSpec& spec);

#endif  // CODEJUDGE_TOOLS_RUNNER_H_
