#include <codejudge/store.h>

bool IsTerminal(SubmissionStatus status) {
  switch (status) {
    case SubmissionStatus::PENDING: [[fallthrough]];
    case SubmissionStatus::QUEUED: [[fallthrough]];
    case SubmissionStatus::RUNNING: return false;
    case SubmissionStatus::ACCEPTED: [[fallthrough]];
    case SubmissionStatus::WRONG_ANSWER: [[fallthrough]];
    case SubmissionStatus::TIME_LIMIT_EXCEEDED: [[fallthrough]];
    case SubmissionStatus::MEMORY_LIMIT_EXCEEDED: [[fallthrough]];
    case SubmissionStatus::RUNTIME_ERROR: [[fallthrough]];
    case SubmissionStatus::COMPILATION_ERROR: [[fallthrough]];
    case SubmissionStatus::PRESENTATION_ERROR: [[fallthrough]];
    case SubmissionStatus::SYSTEM_ERROR: return true;
  }
  __builtin_unreachable();
}

bool IsValidTransition(SubmissionStatus from, SubmissionStatus to) {
  switch (from) {
    case SubmissionStatus::PENDING:
      return to == SubmissionStatus::QUEUED;
    case SubmissionStatus::QUEUED:
      return to == SubmissionStatus::RUNNING || to == SubmissionStatus::SYSTEM_ERROR;
    case SubmissionStatus::RUNNING:
      return IsTerminal(to);
    default:
      return false; // terminal statuses are absorbing
  }
}
