#include "database.h"

#include <chrono>

#include <spdlog/spdlog.h>
#include <codejudge/utils.h>

int64_t NowMicros() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

void SqliteStore::Init() {
  if (!db_) {
    db_ = std::make_unique<Storage>(InitStorage(path_));
    spdlog::info("Database opened: {}", path_.c_str());
  }
}

std::optional<Submission> SqliteStore::FetchSubmission(long id) {
  std::lock_guard lck(mtx_);
  Init();
  auto row = db_->get_pointer<SubmissionRow>(id);
  if (!row) return std::nullopt;
  auto lang = ParseLanguage(row->language);
  auto status = ParseStatus(row->status);
  if (status == SubmissionStatus::QUEUED && !lang) {
    // would otherwise stay QUEUED and be listed again on every poll
    spdlog::warn("Unknown language, rejected: id={} language={}", id, row->language);
    row->status = StatusName(SubmissionStatus::SYSTEM_ERROR);
    row->result = TruncateMessage("Language " + row->language + " is not supported");
    row->score = 0;
    row->execution_time = std::nullopt;
    row->memory_used = std::nullopt;
    row->updated_at = NowMicros();
    db_->update(*row);
    return std::nullopt;
  }
  if (!lang || !status) {
    // unreadable rows are reported as missing; nothing can be judged from them
    spdlog::warn("Malformed submission row: id={} language={} status={}", id, row->language, row->status);
    return std::nullopt;
  }
  Submission ret;
  ret.id = row->id;
  ret.user_id = row->user_id;
  ret.problem_id = row->problem_id;
  ret.contest_id = row->contest_id;
  ret.code = std::move(row->code);
  ret.language = *lang;
  ret.status = *status;
  ret.result = row->result.value_or("");
  ret.score = row->score;
  ret.execution_time_ms = row->execution_time;
  ret.memory_used_kib = row->memory_used;
  ret.created_at = row->submitted_at;
  return ret;
}

bool SqliteStore::Transition(long id, const StatusUpdate& update) {
  std::lock_guard lck(mtx_);
  Init();
  bool applied = false;
  db_->transaction([&] {
    auto row = db_->get_pointer<SubmissionRow>(id);
    if (!row) return false;
    auto current = ParseStatus(row->status);
    if (!current || !IsValidTransition(*current, update.status) ||
        (update.expected_from && *current != *update.expected_from)) {
      spdlog::debug("Transition refused: id={} from={} to={}", id, row->status, StatusName(update.status));
      return false;
    }
    row->status = StatusName(update.status);
    row->result = TruncateMessage(update.result);
    row->score = update.score;
    row->execution_time = update.execution_time_ms;
    row->memory_used = update.memory_used_kib;
    row->updated_at = NowMicros();
    db_->update(*row);
    applied = true;
    return true;
  });
  return applied;
}

std::vector<TestCase> SqliteStore::FetchTestCases(long problem_id) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init();
  std::vector<TestCase> ret;
  for (auto& row : db_->get_all<TestCaseRow>(where(c(&TestCaseRow::problem_id) == problem_id),
                                             order_by(&TestCaseRow::id))) {
    ret.emplace_back(row.id, row.problem_id, std::move(row.input), std::move(row.expected_output), row.is_hidden);
  }
  return ret;
}

std::optional<ProblemLimits> SqliteStore::FetchLimits(long problem_id) {
  std::lock_guard lck(mtx_);
  Init();
  auto row = db_->get_pointer<ProblemRow>(problem_id);
  if (!row) return std::nullopt;
  ProblemLimits ret(row->time_limit, row->memory_limit);
  if (auto mode = ParseCompareMode(row->compare_mode)) ret.compare_mode = *mode;
  return ret;
}

std::vector<long> SqliteStore::ListByStatus(SubmissionStatus status, size_t max_count) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init();
  auto ids = db_->select(&SubmissionRow::id, where(c(&SubmissionRow::status) == std::string(StatusName(status))),
                         order_by(&SubmissionRow::id), limit((int)max_count));
  return std::vector<long>(ids.begin(), ids.end());
}

std::vector<long> SqliteStore::ListRunningBefore(int64_t updated_before) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init();
  auto ids = db_->select(&SubmissionRow::id,
      where(c(&SubmissionRow::status) == std::string(StatusName(SubmissionStatus::RUNNING)) &&
            c(&SubmissionRow::updated_at) < updated_before),
      order_by(&SubmissionRow::id));
  return std::vector<long>(ids.begin(), ids.end());
}

long SqliteStore::InsertSubmission(const Submission& sub) {
  std::lock_guard lck(mtx_);
  Init();
  SubmissionRow row{};
  row.user_id = sub.user_id;
  row.problem_id = sub.problem_id;
  row.contest_id = sub.contest_id;
  row.code = sub.code;
  row.language = LanguageName(sub.language);
  row.status = StatusName(sub.status);
  if (!sub.result.empty()) row.result = sub.result;
  row.score = sub.score;
  row.submitted_at = sub.created_at ? sub.created_at : NowMicros();
  row.execution_time = sub.execution_time_ms;
  row.memory_used = sub.memory_used_kib;
  row.updated_at = row.submitted_at;
  return db_->insert(row);
}

long SqliteStore::InsertProblem(long contest_id, const std::string& title, const ProblemLimits& limits) {
  std::lock_guard lck(mtx_);
  Init();
  ProblemRow row{0, contest_id, title, limits.time_limit, limits.memory_limit,
                 CompareModeName(limits.compare_mode)};
  return db_->insert(row);
}

long SqliteStore::InsertTestCase(const TestCase& test_case) {
  std::lock_guard lck(mtx_);
  Init();
  TestCaseRow row{0, test_case.problem_id, test_case.input, test_case.expected_output, test_case.hidden};
  return db_->insert(row);
}
