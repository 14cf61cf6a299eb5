#include <codejudge/judge.h>

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <codejudge/utils.h>

int AllOrNothingScore(SubmissionStatus verdict, const std::vector<ExecutionOutcome>&, int max_score) {
  return verdict == SubmissionStatus::ACCEPTED ? max_score : 0;
}

int VerdictRank(SubmissionStatus status) {
  switch (status) {
    case SubmissionStatus::ACCEPTED: return 0;
    case SubmissionStatus::PRESENTATION_ERROR: return 1;
    case SubmissionStatus::WRONG_ANSWER: return 2;
    case SubmissionStatus::RUNTIME_ERROR: return 3;
    case SubmissionStatus::MEMORY_LIMIT_EXCEEDED: return 4;
    case SubmissionStatus::TIME_LIMIT_EXCEEDED: return 5;
    case SubmissionStatus::SYSTEM_ERROR: return 6;
    case SubmissionStatus::COMPILATION_ERROR: return 7;
    default: return -1; // not a verdict
  }
}

SubmissionStatus OutcomeVerdict(const ExecutionOutcome& outcome) {
  if (outcome.failure != FailureKind::NONE) return FailureKindToStatus(outcome.failure);
  return outcome.passed ? SubmissionStatus::ACCEPTED : SubmissionStatus::WRONG_ANSWER;
}

namespace {

std::string CaseMessage(const TestCase& test_case, size_t index, const ExecutionOutcome& outcome) {
  SubmissionStatus verdict = OutcomeVerdict(outcome);
  std::string ret = fmt::format("{} on test case {}", StatusToDesc(verdict), index + 1);
  if (test_case.hidden) {
    ret += " (hidden)";
    // runtime diagnostics do not depend on the test data
    if (verdict == SubmissionStatus::RUNTIME_ERROR && !outcome.message.empty()) {
      ret += ": " + outcome.message;
    }
    return ret;
  }
  if (!outcome.message.empty()) ret += "\n" + outcome.message;
  return ret;
}

} // namespace

JudgeResult Judge::Run(const Submission& sub, const std::vector<TestCase>& test_cases,
                       const ProblemLimits& limits) {
  JudgeResult ret;
  if (test_cases.empty()) {
    ret.verdict = SubmissionStatus::SYSTEM_ERROR;
    ret.message = "Problem has no test cases";
    return ret;
  }
  for (size_t i = 0; i < test_cases.size(); i++) {
    ret.outcomes.push_back(Evaluate(executor_, sub.code, sub.language, test_cases[i], limits));
    const ExecutionOutcome& outcome = ret.outcomes.back();
    ret.max_time_ms = std::max(ret.max_time_ms, outcome.time_ms);
    ret.max_memory_kib = std::max(ret.max_memory_kib, outcome.memory_kib);
    SubmissionStatus verdict = OutcomeVerdict(outcome);
    spdlog::debug("Test case finished: submission={} case={} verdict={}", sub.id, i + 1, StatusName(verdict));
    if (i == 0 && (verdict == SubmissionStatus::COMPILATION_ERROR || verdict == SubmissionStatus::SYSTEM_ERROR)) {
      ret.skipped = test_cases.size() - 1;
      break;
    }
  }

  // first case (in stored order) holding the highest ranked verdict
  size_t first = 0;
  ret.verdict = OutcomeVerdict(ret.outcomes[0]);
  for (size_t i = 1; i < ret.outcomes.size(); i++) {
    SubmissionStatus verdict = OutcomeVerdict(ret.outcomes[i]);
    if (VerdictRank(verdict) > VerdictRank(ret.verdict)) ret.verdict = verdict, first = i;
  }
  ret.score = scoring_(ret.verdict, ret.outcomes, max_score_);

  size_t passed = std::count_if(ret.outcomes.begin(), ret.outcomes.end(),
                                [](const ExecutionOutcome& x) { return x.passed; });
  std::string message;
  switch (ret.verdict) {
    case SubmissionStatus::ACCEPTED:
      message = fmt::format("All {} test cases passed successfully", test_cases.size());
      break;
    case SubmissionStatus::COMPILATION_ERROR:
      message = "Compilation error";
      if (!ret.outcomes[first].message.empty()) message += ":\n" + ret.outcomes[first].message;
      break;
    default:
      message = fmt::format("Passed {}/{} test cases. ", passed, test_cases.size()) +
                CaseMessage(test_cases[first], first, ret.outcomes[first]);
      if (ret.skipped) message += fmt::format("\n{} test cases skipped", ret.skipped);
  }
  ret.message = TruncateMessage(message);
  spdlog::info("Judge finished: submission={} verdict={} score={} passed={}/{} time={}ms memory={}KiB",
               sub.id, StatusName(ret.verdict), ret.score, passed, test_cases.size(),
               ret.max_time_ms, ret.max_memory_kib);
  return ret;
}
