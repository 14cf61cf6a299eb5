#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <mutex>
#include <atomic>
#include <string>
#include <vector>
#include <functional>
#include <filesystem>

#include <gtest/gtest.h>
#include <codejudge/store.h>
#include <codejudge/executor.h>

namespace fs = std::filesystem;

// Executor whose results are produced by a script; thread-safe.
class FakeExecutor : public Executor {
 public:
  struct Call {
    Language lang;
    std::string code;
    std::string input;
    int time_limit;
    int memory_limit;
  };
  using Script = std::function<ExecutionResult(const Call&)>;

 private:
  Script script_;
  std::mutex mtx_;
  std::vector<Call> calls_;
  std::vector<Language> unsupported_;

 public:
  // by default echoes the input back as a successful run
  explicit FakeExecutor(Script script = nullptr) : script_(std::move(script)) {}

  ExecutionResult Run(Language lang, const std::string& code, const std::string& input,
                      int time_limit, int memory_limit) override;
  bool Supports(Language lang) const override;

  void SetUnsupported(std::vector<Language> langs) { unsupported_ = std::move(langs); }
  std::vector<Call> Calls();
};

ExecutionResult OkResult(const std::string& output, long time_ms = 10, long memory_kib = 1024);
ExecutionResult FailResult(FailureKind failure, const std::string& message = "", int exit_code = 1);

// In-memory submission and problem store enforcing the transition contract.
class InMemoryStore : public SubmissionStore, public ProblemStore {
  std::mutex mtx_;
  std::map<long, Submission> submissions_;
  std::map<long, std::vector<TestCase>> test_cases_;
  std::map<long, ProblemLimits> limits_;
  std::map<long, int> terminal_writes_;
  std::map<long, std::vector<SubmissionStatus>> history_;

 public:
  std::atomic_bool fail_fetch{false};
  std::atomic_bool fail_terminal_write{false};
  // called with the problem id before test cases are returned
  std::function<void(long)> on_fetch_test_cases;

  std::optional<Submission> FetchSubmission(long id) override;
  bool Transition(long id, const StatusUpdate& update) override;
  std::vector<TestCase> FetchTestCases(long problem_id) override;
  std::optional<ProblemLimits> FetchLimits(long problem_id) override;

  void AddSubmission(const Submission& sub);
  void AddProblem(long problem_id, const ProblemLimits& limits, std::vector<TestCase> test_cases);
  Submission Get(long id);
  int TerminalWrites(long id);
  std::vector<SubmissionStatus> History(long id);
};

Submission MakeSubmission(long id, long problem_id, Language lang, const std::string& code,
                          SubmissionStatus status = SubmissionStatus::QUEUED);

// output and exit code of a language runner started directly, without a sandbox
struct RunnerOutput {
  int exit_code;
  std::string report;
};

RunnerOutput RunRunner(Language lang, const std::string& code, const std::string& input,
                       int time_limit, int memory_limit);
// the program is found in PATH
bool HasProgram(const std::string& name);

// Temporary directory removed at destruction.
class TempDir {
  fs::path path_;
 public:
  TempDir();
  ~TempDir();
  const fs::path& Path() const { return path_; }
};

#endif // TEST_UTILS_H_
