#ifndef DATABASE_H_
#define DATABASE_H_

#include <mutex>
#include <memory>
#include <filesystem>

#include <sqlite_orm/sqlite_orm.h>
#include <codejudge/store.h>

namespace fs = std::filesystem;

// rows keep the column layout of the web application's tables
struct SubmissionRow {
  int64_t id;
  int64_t user_id;
  int64_t problem_id;
  int64_t contest_id;
  std::string code;
  std::string language;
  std::string status;
  std::optional<std::string> result;
  int score;
  int64_t submitted_at; // UNIX timestamp, microseconds
  std::optional<int64_t> execution_time; // ms
  std::optional<int64_t> memory_used; // KiB
  int64_t updated_at; // UNIX timestamp, microseconds
};

struct TestCaseRow {
  int64_t id;
  int64_t problem_id;
  std::string input;
  std::string expected_output;
  bool is_hidden;
};

struct ProblemRow {
  int64_t id;
  int64_t contest_id;
  std::string title;
  int time_limit; // seconds
  int memory_limit; // MB
  std::string compare_mode;
};

inline auto InitStorage(const fs::path& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path.string(),
      make_index("idx_submissions_status", &SubmissionRow::status),
      make_index("idx_test_cases_problem_id", &TestCaseRow::problem_id),
      make_table("submissions",
                 make_column("id", &SubmissionRow::id, primary_key()),
                 make_column("user_id", &SubmissionRow::user_id),
                 make_column("problem_id", &SubmissionRow::problem_id),
                 make_column("contest_id", &SubmissionRow::contest_id),
                 make_column("code", &SubmissionRow::code),
                 make_column("language", &SubmissionRow::language),
                 make_column("status", &SubmissionRow::status, default_value("PENDING")),
                 make_column("result", &SubmissionRow::result),
                 make_column("score", &SubmissionRow::score, default_value(0)),
                 make_column("submitted_at", &SubmissionRow::submitted_at),
                 make_column("execution_time", &SubmissionRow::execution_time),
                 make_column("memory_used", &SubmissionRow::memory_used),
                 make_column("updated_at", &SubmissionRow::updated_at, default_value(0))),
      make_table("test_cases",
                 make_column("id", &TestCaseRow::id, primary_key()),
                 make_column("problem_id", &TestCaseRow::problem_id),
                 make_column("input", &TestCaseRow::input),
                 make_column("expected_output", &TestCaseRow::expected_output),
                 make_column("is_hidden", &TestCaseRow::is_hidden, default_value(false))),
      make_table("problems",
                 make_column("id", &ProblemRow::id, primary_key()),
                 make_column("contest_id", &ProblemRow::contest_id),
                 make_column("title", &ProblemRow::title),
                 make_column("time_limit", &ProblemRow::time_limit),
                 make_column("memory_limit", &ProblemRow::memory_limit),
                 make_column("compare_mode", &ProblemRow::compare_mode, default_value("TRAILING_WHITESPACE"))));
  storage.sync_schema(true);
  return storage;
}

// SQLite adapter of the submission and problem stores. One connection, serialized by a mutex.
class SqliteStore : public SubmissionStore, public ProblemStore {
 public:
  using Storage = decltype(InitStorage(fs::path()));

 private:
  fs::path path_;
  std::mutex mtx_;
  std::unique_ptr<Storage> db_;

  void Init();

 public:
  explicit SqliteStore(fs::path path) : path_(std::move(path)) {}

  std::optional<Submission> FetchSubmission(long id) override;
  bool Transition(long id, const StatusUpdate& update) override;

  std::vector<TestCase> FetchTestCases(long problem_id) override;
  std::optional<ProblemLimits> FetchLimits(long problem_id) override;

  // ascending id
  std::vector<long> ListByStatus(SubmissionStatus status, size_t limit);
  // RUNNING submissions not updated since the given time (UNIX microseconds)
  std::vector<long> ListRunningBefore(int64_t updated_before);

  // intake side; used by tools and tests
  long InsertSubmission(const Submission& sub);
  long InsertProblem(long contest_id, const std::string& title, const ProblemLimits& limits);
  long InsertTestCase(const TestCase& test_case);
};

int64_t NowMicros();

#endif  // DATABASE_H_
