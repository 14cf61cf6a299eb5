#include "runner_report.h"

#include <cstdlib>
#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

bool StartsWith(std::string_view str, std::string_view prefix) {
  return str.substr(0, prefix.size()) == prefix;
}

// "Compile Time: 0.53s" -> 0.53
std::optional<double> ParseField(std::string_view line, std::string_view key) {
  if (!StartsWith(line, key)) return std::nullopt;
  std::string val(line.substr(key.size()));
  char* end = nullptr;
  double ret = strtod(val.c_str(), &end);
  if (end == val.c_str()) return std::nullopt;
  return ret;
}

// start of the last line in [begin, end) that is exactly marker; npos if none
size_t FindLastMarker(std::string_view text, std::string_view marker, size_t begin, size_t end) {
  std::string_view range = text.substr(begin, end - begin);
  for (size_t pos = range.rfind(marker); pos != std::string_view::npos;
       pos = pos ? range.rfind(marker, pos - 1) : std::string_view::npos) {
    size_t after = pos + marker.size();
    bool at_line_start = pos == 0 || range[pos - 1] == '\n';
    bool at_line_end = after == range.size() || range[after] == '\n';
    if (at_line_start && at_line_end) return begin + pos;
  }
  return std::string_view::npos;
}

size_t FindFirstMarker(std::string_view text, std::string_view marker) {
  for (size_t pos = text.find(marker); pos != std::string_view::npos; pos = text.find(marker, pos + 1)) {
    size_t after = pos + marker.size();
    bool at_line_start = pos == 0 || text[pos - 1] == '\n';
    bool at_line_end = after == text.size() || text[after] == '\n';
    if (at_line_start && at_line_end) return pos;
  }
  return std::string_view::npos;
}

size_t LineEnd(std::string_view text, size_t pos) {
  size_t ret = text.find('\n', pos);
  return ret == std::string_view::npos ? text.size() : ret;
}

size_t NextLine(std::string_view text, size_t pos) {
  size_t ret = LineEnd(text, pos);
  return ret == text.size() ? ret : ret + 1;
}

// the runner terminates the program output with one newline of its own
std::string_view StripSeparator(std::string_view str) {
  if (!str.empty() && str.back() == '\n') str.remove_suffix(1);
  return str;
}

bool IsRuntimeErrorWord(const std::string& str) {
  return str == "RUNTIME_ERROR" || str == "SEGMENTATION_FAULT" ||
         str == "ABORTED" || str == "FLOATING_POINT_ERROR";
}

std::string ExitCodeDesc(int code) {
  switch (code) {
    case kExitSegmentationFault: return "Segmentation fault";
    case kExitAborted: return "Aborted";
    case kExitFloatingPoint: return "Floating point error";
    default: return "Runtime error";
  }
}

} // namespace

std::optional<RunnerReport> ParseRunnerReport(std::string_view text) {
  RunnerReport ret;
  // the first marker is the runner's own; the program may print the marker itself
  size_t output_begin = FindFirstMarker(text, kSectionProgramOutput);
  size_t header_end = output_begin == std::string_view::npos ? text.size() : output_begin;

  enum { NONE, COMPILE, EXECUTION } section = NONE;
  bool expect_status = false;
  for (size_t pos = 0; pos < header_end;) {
    size_t end = std::min(LineEnd(text, pos), header_end);
    std::string_view line = text.substr(pos, end - pos);
    size_t next = NextLine(text, pos);
    if (line == kSectionCompilation || line == kSectionSyntaxCheck) {
      section = COMPILE;
      ret.has_compile_section = true;
      expect_status = true;
    } else if (line == kSectionExecution) {
      section = EXECUTION;
      ret.has_execution_section = true;
      expect_status = true;
    } else if (line == kSectionCompilerOutput || line == kSectionSyntaxErrorOutput) {
      // the runner stops after printing the compiler output
      next = std::min(next, header_end);
      ret.compiler_output = std::string(StripSeparator(text.substr(next, header_end - next)));
      break;
    } else if (StartsWith(line, "ERROR: ")) {
      ret.error = std::string(line.substr(7));
    } else if (expect_status) {
      if (section == COMPILE) {
        ret.compile_status = std::string(line);
      } else {
        ret.execution_status = std::string(line);
      }
      expect_status = false;
    } else if (auto val = ParseField(line, "Compile Time: "); val && section == COMPILE) {
      ret.compile_time = *val;
    } else if (auto val = ParseField(line, "Syntax Check Time: "); val && section == COMPILE) {
      ret.compile_time = *val;
    } else if (auto val = ParseField(line, "Exit Code: "); val && section == EXECUTION) {
      ret.exit_code = static_cast<int>(*val);
    } else if (auto val = ParseField(line, "Execution Time: "); val && section == EXECUTION) {
      ret.execution_time = *val;
    }
    pos = next;
  }

  if (output_begin != std::string_view::npos) {
    size_t body = NextLine(text, output_begin);
    size_t usage = FindLastMarker(text, kSectionResourceUsage, body, text.size());
    size_t body_end = usage == std::string_view::npos ? text.size() : usage;
    if (ret.exit_code && (*ret.exit_code == kExitSegmentationFault ||
          *ret.exit_code == kExitAborted || *ret.exit_code == kExitFloatingPoint)) {
      size_t debug = FindLastMarker(text, kSectionDebugInfo, body, body_end);
      if (debug != std::string_view::npos) {
        size_t debug_body = NextLine(text, debug);
        ret.debug_info = std::string(StripSeparator(text.substr(debug_body, body_end - debug_body)));
        body_end = debug;
      }
    }
    ret.program_output = std::string(StripSeparator(text.substr(body, body_end - body)));
    if (ret.program_output.size() > kMaxOutputBytes) ret.program_output.resize(kMaxOutputBytes);
    if (usage != std::string_view::npos) {
      for (size_t pos = NextLine(text, usage); pos < text.size(); pos = NextLine(text, pos)) {
        std::string_view line = text.substr(pos, LineEnd(text, pos) - pos);
        if (auto val = ParseField(line, "Memory Used: ")) {
          ret.memory_used_kib = static_cast<long>(*val);
        } else if (auto val = ParseField(line, "Memory Limit: ")) {
          ret.memory_limit_mb = static_cast<int>(*val);
        } else if (auto val = ParseField(line, "Time Limit: ")) {
          ret.time_limit_s = static_cast<int>(*val);
        }
      }
    }
  }

  if (!ret.has_compile_section && !ret.has_execution_section && ret.error.empty()) {
    return std::nullopt;
  }
  return ret;
}

ReportClass ClassifyReport(const RunnerReport& report, int time_limit) {
  if (report.has_compile_section && report.compile_status != "SUCCESS") {
    if (report.compile_status == "COMPILATION_ERROR" || report.compile_status == "SYNTAX_ERROR") {
      return {FailureKind::COMPILATION_ERROR, report.compiler_output};
    }
    if (!report.has_execution_section) {
      return {FailureKind::SYSTEM_ERROR, "Unknown compile status: " + report.compile_status};
    }
  }
  if (!report.has_execution_section) {
    if (!report.error.empty()) return {FailureKind::SYSTEM_ERROR, "Runner error: " + report.error};
    return {FailureKind::SYSTEM_ERROR, "Runner report has no execution section"};
  }
  if (report.execution_time > time_limit) {
    return {FailureKind::TIME_LIMIT_EXCEEDED,
            fmt::format("Execution time {:.3f}s exceeds the limit of {}s", report.execution_time, time_limit)};
  }
  const std::string& status = report.execution_status;
  int code = report.exit_code.value_or(0);
  if (status == "TIME_LIMIT_EXCEEDED") return {FailureKind::TIME_LIMIT_EXCEEDED, "Time limit exceeded"};
  if (status == "MEMORY_LIMIT_EXCEEDED") return {FailureKind::MEMORY_LIMIT_EXCEEDED, "Memory limit exceeded"};
  if (IsRuntimeErrorWord(status)) {
    return {FailureKind::RUNTIME_ERROR, fmt::format("{} (exit code {})", ExitCodeDesc(code), code)};
  }
  if (status != "SUCCESS") {
    spdlog::warn("Unknown execution status in runner report: {}", status);
  }
  switch (code) {
    case 0: return {FailureKind::NONE, ""};
    case kExitTimeLimit: return {FailureKind::TIME_LIMIT_EXCEEDED, "Time limit exceeded"};
    case kExitMemoryLimit: return {FailureKind::MEMORY_LIMIT_EXCEEDED, "Memory limit exceeded"};
    default: return {FailureKind::RUNTIME_ERROR, fmt::format("{} (exit code {})", ExitCodeDesc(code), code)};
  }
}
