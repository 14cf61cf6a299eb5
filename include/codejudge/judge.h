#ifndef INCLUDE_CODEJUDGE_JUDGE_H_
#define INCLUDE_CODEJUDGE_JUDGE_H_

#include <vector>
#include <functional>

#include "evaluator.h"
#include "submission.h"

struct JudgeResult {
  SubmissionStatus verdict;
  int score;
  long max_time_ms;
  long max_memory_kib;
  std::string message;
  std::vector<ExecutionOutcome> outcomes; // in test case order; skipped cases are absent
  size_t skipped;

  JudgeResult() : verdict(SubmissionStatus::SYSTEM_ERROR), score(0), max_time_ms(0), max_memory_kib(0), skipped(0) {}
};

// Turns the per-case outcomes into a score. The reference policy gives no partial credit;
// a weighted policy can be plugged in here.
using ScoringPolicy = std::function<int(SubmissionStatus verdict, const std::vector<ExecutionOutcome>&, int max_score)>;
int AllOrNothingScore(SubmissionStatus verdict, const std::vector<ExecutionOutcome>&, int max_score);

// Higher value wins when combining test case results.
// ACCEPTED < WRONG_ANSWER < RUNTIME_ERROR < MEMORY_LIMIT_EXCEEDED < TIME_LIMIT_EXCEEDED
//   < SYSTEM_ERROR < COMPILATION_ERROR
int VerdictRank(SubmissionStatus);
SubmissionStatus OutcomeVerdict(const ExecutionOutcome&);

class Judge {
  Executor& executor_;
  int max_score_;
  ScoringPolicy scoring_;
 public:
  explicit Judge(Executor& executor, int max_score = 100, ScoringPolicy scoring = AllOrNothingScore) :
      executor_(executor), max_score_(max_score), scoring_(std::move(scoring)) {}

  // Runs every test case sequentially in the given order. Remaining cases are skipped only if
  // the first one ends in a compilation or system error.
  JudgeResult Run(const Submission&, const std::vector<TestCase>&, const ProblemLimits&);

  int MaxScore() const { return max_score_; }
  bool Supports(Language lang) const { return executor_.Supports(lang); }
};

#endif  // INCLUDE_CODEJUDGE_JUDGE_H_
