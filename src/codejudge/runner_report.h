#ifndef CODEJUDGE_RUNNER_REPORT_H_
#define CODEJUDGE_RUNNER_REPORT_H_

#include <string>
#include <optional>
#include <string_view>

#include <codejudge/submission.h>

// Section headers of the runner protocol. The runners print them and the
// executor parses them, so both sides include this header.
constexpr char kSectionCompilation[] = "=== COMPILATION ===";
constexpr char kSectionSyntaxCheck[] = "=== SYNTAX CHECK ===";
constexpr char kSectionCompilerOutput[] = "=== COMPILER OUTPUT ===";
constexpr char kSectionSyntaxErrorOutput[] = "=== SYNTAX ERROR OUTPUT ===";
constexpr char kSectionExecution[] = "=== EXECUTION ===";
constexpr char kSectionProgramOutput[] = "=== PROGRAM OUTPUT ===";
constexpr char kSectionDebugInfo[] = "=== DEBUG INFO ===";
constexpr char kSectionResourceUsage[] = "=== RESOURCE USAGE ===";

constexpr int kExitTimeLimit = 124;
constexpr int kExitMemoryLimit = 137;
constexpr int kExitAborted = 134;
constexpr int kExitFloatingPoint = 136;
constexpr int kExitSegmentationFault = 139;

struct RunnerReport {
  // compile phase; also set for the syntax check of interpreted languages
  bool has_compile_section;
  std::string compile_status; // SUCCESS, COMPILATION_ERROR or SYNTAX_ERROR
  double compile_time; // seconds
  std::string compiler_output;

  bool has_execution_section;
  std::string execution_status;
  std::optional<int> exit_code;
  double execution_time; // seconds
  std::string program_output;
  std::string debug_info;

  std::optional<long> memory_used_kib;
  std::optional<int> memory_limit_mb;
  std::optional<int> time_limit_s;

  std::string error; // "ERROR: ..." printed by a runner that could not start

  RunnerReport() :
      has_compile_section(false), compile_time(0),
      has_execution_section(false), execution_time(0) {}
};

// nullopt if the text is not a runner report at all
std::optional<RunnerReport> ParseRunnerReport(std::string_view text);

struct ReportClass {
  FailureKind failure;
  std::string message;
};

// The printed status words win over the exit code, which is the fallback.
// A run longer than time_limit is always TIME_LIMIT_EXCEEDED.
ReportClass ClassifyReport(const RunnerReport&, int time_limit);

#endif  // CODEJUDGE_RUNNER_REPORT_H_
