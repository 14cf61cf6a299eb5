#ifndef INCLUDE_CODEJUDGE_STORE_H_
#define INCLUDE_CODEJUDGE_STORE_H_

#include <vector>
#include <optional>

#include "submission.h"

bool IsTerminal(SubmissionStatus);

// Transition contract of a submission status:
//   PENDING -> QUEUED -> RUNNING -> (terminal)
//   QUEUED -> SYSTEM_ERROR (rejected before judging started)
// terminal statuses are absorbing
bool IsValidTransition(SubmissionStatus from, SubmissionStatus to);

// Durable record of submissions. Implementations must be safe to call from
// multiple worker threads at once.
class SubmissionStore {
 public:
  virtual ~SubmissionStore() = default;

  virtual std::optional<Submission> FetchSubmission(long id) = 0;
  // Apply the whole update as one write iff IsValidTransition(current, update.status)
  // and current matches update.expected_from when that is set.
  // Returns false (and writes nothing) if the transition is refused or id is unknown.
  virtual bool Transition(long id, const StatusUpdate& update) = 0;
};

// Read-only access to problems and their test cases.
class ProblemStore {
 public:
  virtual ~ProblemStore() = default;

  // in stored order; empty if the problem has none
  virtual std::vector<TestCase> FetchTestCases(long problem_id) = 0;
  virtual std::optional<ProblemLimits> FetchLimits(long problem_id) = 0;
};

#endif  // INCLUDE_CODEJUDGE_STORE_H_
