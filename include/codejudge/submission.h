#ifndef INCLUDE_CODEJUDGE_SUBMISSION_H_
#define INCLUDE_CODEJUDGE_SUBMISSION_H_

#include <string>
#include <cstdint>
#include <optional>

constexpr size_t kMaxCodeLength = 50000;
// the result column of a submission holds at most this many characters
constexpr size_t kMaxResultLength = 500;
// program output kept by the runners (and by the executor as a second guard)
constexpr size_t kMaxOutputBytes = 4096;

#define ENUM_LANGUAGE_ \
  X(C, "C", "run-c", "solution.c") \
  X(CPP, "CPP", "run-cpp", "solution.cpp") \
  X(JAVA, "JAVA", "run-java", "Solution.java") \
  X(PYTHON, "PYTHON", "run-python", "solution.py") \
  X(JAVASCRIPT, "JAVASCRIPT", "run-javascript", "solution.js") \
  X(GO, "GO", "run-go", "solution.go") \
  X(RUST, "RUST", "run-rust", "solution.rs")
enum class Language {
#define X(name, str, runner, source) name,
  ENUM_LANGUAGE_
#undef X
};

// PENDING and QUEUED are written by the intake flow;
// RUNNING and everything after it only by the submission processor
#define ENUM_SUBMISSION_STATUS_ \
  X(PENDING, "PENDING", "Pending") \
  X(QUEUED, "QUEUED", "Queued") \
  X(RUNNING, "RUNNING", "Running") \
  /* terminal statuses */ \
  X(ACCEPTED, "ACCEPTED", "Accepted") \
  X(WRONG_ANSWER, "WRONG_ANSWER", "Wrong answer") \
  X(TIME_LIMIT_EXCEEDED, "TIME_LIMIT_EXCEEDED", "Time limit exceeded") \
  X(MEMORY_LIMIT_EXCEEDED, "MEMORY_LIMIT_EXCEEDED", "Memory limit exceeded") \
  X(RUNTIME_ERROR, "RUNTIME_ERROR", "Runtime error") \
  X(COMPILATION_ERROR, "COMPILATION_ERROR", "Compilation error") \
  X(PRESENTATION_ERROR, "PRESENTATION_ERROR", "Presentation error") \
  X(SYSTEM_ERROR, "SYSTEM_ERROR", "System error")
enum class SubmissionStatus {
#define X(name, str, desc) name,
  ENUM_SUBMISSION_STATUS_
#undef X
};

// failure observed while compiling/running one test case
#define ENUM_FAILURE_KIND_ \
  X(NONE) \
  X(COMPILATION_ERROR) \
  X(TIME_LIMIT_EXCEEDED) \
  X(MEMORY_LIMIT_EXCEEDED) \
  X(RUNTIME_ERROR) \
  X(SYSTEM_ERROR)
enum class FailureKind {
#define X(name) name,
  ENUM_FAILURE_KIND_
#undef X
};

#define ENUM_COMPARE_MODE_ \
  X(TRAILING_WHITESPACE) \
  X(EXACT)
enum class CompareMode {
#define X(name) name,
  ENUM_COMPARE_MODE_
#undef X
};

struct Submission {
  long id;
  long user_id;
  long problem_id;
  long contest_id;
  std::string code;
  Language language;
  SubmissionStatus status;
  std::string result;
  int score;
  std::optional<long> execution_time_ms;
  std::optional<long> memory_used_kib;
  int64_t created_at; // UNIX timestamp, microseconds

  Submission() :
      id(0), user_id(0), problem_id(0), contest_id(0),
      language(Language::CPP),
      status(SubmissionStatus::PENDING),
      score(0),
      created_at(0) {}
};

struct TestCase {
  long id;
  long problem_id;
  std::string input;
  std::string expected_output;
  bool hidden; // only changes what is shown in the result message

  TestCase() : id(0), problem_id(0), hidden(false) {}
  TestCase(long id, long problem_id, std::string input, std::string expected_output, bool hidden = false) :
      id(id), problem_id(problem_id),
      input(std::move(input)), expected_output(std::move(expected_output)),
      hidden(hidden) {}
};

struct ProblemLimits {
  int time_limit; // seconds
  int memory_limit; // MB
  CompareMode compare_mode;

  ProblemLimits() : time_limit(10), memory_limit(256), compare_mode(CompareMode::TRAILING_WHITESPACE) {}
  ProblemLimits(int time_limit, int memory_limit, CompareMode mode = CompareMode::TRAILING_WHITESPACE) :
      time_limit(time_limit), memory_limit(memory_limit), compare_mode(mode) {}
};

// status and (result, score, time, memory) are always written together
struct StatusUpdate {
  SubmissionStatus status;
  std::string result;
  int score;
  std::optional<long> execution_time_ms;
  std::optional<long> memory_used_kib;
  // if set, the update is applied only while the stored status equals it
  std::optional<SubmissionStatus> expected_from;

  StatusUpdate() : status(SubmissionStatus::SYSTEM_ERROR), score(0) {}
  StatusUpdate(SubmissionStatus status, std::string result, int score = 0,
               std::optional<long> time = std::nullopt, std::optional<long> memory = std::nullopt) :
      status(status), result(std::move(result)), score(score),
      execution_time_ms(time), memory_used_kib(memory) {}
};

#endif  // INCLUDE_CODEJUDGE_SUBMISSION_H_
