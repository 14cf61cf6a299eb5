#ifndef INCLUDE_CODEJUDGE_EVALUATOR_H_
#define INCLUDE_CODEJUDGE_EVALUATOR_H_

#include <string>

#include "executor.h"
#include "submission.h"

struct CompareResult {
  bool match;
  size_t line; // first differing line (1-based); 0 if match
  std::string message; // "Line 2 differ." style description; empty if match
};

CompareResult CompareOutput(const std::string& expected, const std::string& actual, CompareMode);

// result of one test case
struct ExecutionOutcome {
  bool passed; // outputs match and no failure was recorded
  std::string output;
  long time_ms;
  long memory_kib;
  FailureKind failure;
  std::string message; // compile/runtime error text or the output difference
  int exit_code;

  ExecutionOutcome() : passed(false), time_ms(0), memory_kib(0), failure(FailureKind::NONE), exit_code(0) {}
};

ExecutionOutcome Evaluate(Executor&, const std::string& code, Language,
                          const TestCase&, const ProblemLimits&);

#endif  // INCLUDE_CODEJUDGE_EVALUATOR_H_
