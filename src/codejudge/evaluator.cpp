#include <codejudge/evaluator.h>

#include <iomanip>
#include <sstream>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <codejudge/utils.h>

namespace {

constexpr char kWhites[] = " \n\r\t";

std::string NormalizeNewlines(const std::string& str) {
  std::string ret;
  ret.reserve(str.size());
  for (size_t i = 0; i < str.size(); i++) {
    if (str[i] == '\r') {
      ret.push_back('\n');
      if (i + 1 < str.size() && str[i + 1] == '\n') i++;
    } else {
      ret.push_back(str[i]);
    }
  }
  return ret;
}

void EOFMessage(std::ostream& message, bool ans_eof, size_t line, size_t user_lines) {
  if (ans_eof) message << "Unexpected line " << line;
  else message << "Unexpected EOF after line " << user_lines;
}

void DifferMessage(std::ostream& message, const std::string& ans, const std::string& usr) {
  size_t pos = 0;
  for (; pos < ans.size() && pos < usr.size() && ans[pos] == usr[pos]; pos++);
  message << "Expected: ";
  if (pos <= 40 || ans.size() <= 80) {
    message << ans;
  } else {
    message << "..." << ans.substr(pos - 40, 80);
    if (ans.size() > pos + 40) message << "...";
  }
  message << "\nGot: ";
  if (pos <= 40 || usr.size() <= 80) {
    message << usr;
  } else {
    message << "..." << usr.substr(pos - 40, 80);
    if (usr.size() > pos + 40) message << "...";
  }
}

CompareResult LineCompare(const std::string& expected, const std::string& actual) {
  std::istringstream f_ans(NormalizeNewlines(expected)), f_usr(NormalizeNewlines(actual));
  std::ostringstream message;
  size_t line = 1;
  for (; f_ans.eof() == f_usr.eof(); line++) {
    if (f_ans.eof()) return {true, 0, ""};
    std::string s, t;
    getline(f_ans, s);
    getline(f_usr, t);
    // std::string::npos + 1 == 0
    s.erase(s.find_last_not_of(kWhites) + 1);
    t.erase(t.find_last_not_of(kWhites) + 1);
    if (s != t) {
      message << "Line " << line << " differ.\n";
      DifferMessage(message, s, t);
      return {false, line, message.str()};
    }
  }
  // one side has ended; the rest of the other side may only be whitespace
  size_t user_lines = line - 1;
  while (!f_ans.eof() || !f_usr.eof()) {
    std::string s;
    bool ans_left = !f_ans.eof();
    if (ans_left) {
      getline(f_ans, s);
    } else {
      getline(f_usr, s);
    }
    if (s.find_last_not_of(kWhites) != std::string::npos) {
      EOFMessage(message, !ans_left, line, user_lines);
      return {false, line, message.str()};
    }
    line++;
  }
  return {true, 0, ""};
}

CompareResult StrictCompare(const std::string& expected, const std::string& actual) {
  if (expected == actual) return {true, 0, ""};
  size_t offset = 0;
  for (; offset < expected.size() && offset < actual.size() && expected[offset] == actual[offset]; offset++);
  size_t line = 1 + std::count(expected.begin(), expected.begin() + offset, '\n');
  std::ostringstream message;
  if (offset == expected.size() || offset == actual.size()) {
    message << "Length differ: expected " << expected.size() << " bytes, got " << actual.size() << " bytes";
  } else {
    message << "Byte " << offset << " differ: expected 0x"
        << std::hex << std::setfill('0') << std::setw(2) << (uint32_t)(uint8_t)expected[offset] << ", got 0x"
        << std::setw(2) << (uint32_t)(uint8_t)actual[offset];
  }
  return {false, line, message.str()};
}

} // namespace

CompareResult CompareOutput(const std::string& expected, const std::string& actual, CompareMode mode) {
  switch (mode) {
    case CompareMode::TRAILING_WHITESPACE: return LineCompare(expected, actual);
    case CompareMode::EXACT: return StrictCompare(expected, actual);
  }
  __builtin_unreachable();
}

ExecutionOutcome Evaluate(Executor& executor, const std::string& code, Language lang,
                          const TestCase& test_case, const ProblemLimits& limits) {
  ExecutionResult res = executor.Run(lang, code, test_case.input, limits.time_limit, limits.memory_limit);
  ExecutionOutcome ret;
  ret.output = std::move(res.output);
  ret.time_ms = res.run_time_ms;
  ret.memory_kib = res.memory_used_kib;
  ret.failure = res.failure;
  ret.exit_code = res.exit_code;
  if (ret.failure != FailureKind::NONE) {
    ret.passed = false;
    ret.message = std::move(res.message);
  } else {
    CompareResult cmp = CompareOutput(test_case.expected_output, ret.output, limits.compare_mode);
    ret.passed = cmp.match;
    ret.message = std::move(cmp.message);
  }
  spdlog::debug("Test case evaluated: id={} failure={} passed={} time={}ms memory={}KiB",
                test_case.id, FailureKindName(ret.failure), ret.passed, ret.time_ms, ret.memory_kib);
  return ret;
}
