#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <codejudge/paths.h>
#include <codejudge/utils.h>

ExecutionResult FakeExecutor::Run(Language lang, const std::string& code, const std::string& input,
                                  int time_limit, int memory_limit) {
  Call call{lang, code, input, time_limit, memory_limit};
  {
    std::lock_guard lck(mtx_);
    calls_.push_back(call);
  }
  if (script_) return script_(call);
  return OkResult(input);
}

bool FakeExecutor::Supports(Language lang) const {
  return std::find(unsupported_.begin(), unsupported_.end(), lang) == unsupported_.end();
}

std::vector<FakeExecutor::Call> FakeExecutor::Calls() {
  std::lock_guard lck(mtx_);
  return calls_;
}

ExecutionResult OkResult(const std::string& output, long time_ms, long memory_kib) {
  ExecutionResult ret;
  ret.output = output;
  ret.run_time_ms = time_ms;
  ret.memory_used_kib = memory_kib;
  return ret;
}

ExecutionResult FailResult(FailureKind failure, const std::string& message, int exit_code) {
  ExecutionResult ret;
  ret.failure = failure;
  ret.message = message;
  ret.exit_code = exit_code;
  return ret;
}

std::optional<Submission> InMemoryStore::FetchSubmission(long id) {
  if (fail_fetch) throw std::runtime_error("store unreachable");
  std::lock_guard lck(mtx_);
  auto it = submissions_.find(id);
  if (it == submissions_.end()) return std::nullopt;
  return it->second;
}

bool InMemoryStore::Transition(long id, const StatusUpdate& update) {
  if (fail_terminal_write && IsTerminal(update.status)) throw std::runtime_error("store unreachable");
  std::lock_guard lck(mtx_);
  auto it = submissions_.find(id);
  if (it == submissions_.end()) return false;
  Submission& sub = it->second;
  if (!IsValidTransition(sub.status, update.status)) return false;
  if (update.expected_from && sub.status != *update.expected_from) return false;
  sub.status = update.status;
  sub.result = update.result;
  sub.score = update.score;
  sub.execution_time_ms = update.execution_time_ms;
  sub.memory_used_kib = update.memory_used_kib;
  if (IsTerminal(update.status)) terminal_writes_[id]++;
  history_[id].push_back(update.status);
  return true;
}

std::vector<TestCase> InMemoryStore::FetchTestCases(long problem_id) {
  if (on_fetch_test_cases) on_fetch_test_cases(problem_id);
  std::lock_guard lck(mtx_);
  auto it = test_cases_.find(problem_id);
  if (it == test_cases_.end()) return {};
  return it->second;
}

std::optional<ProblemLimits> InMemoryStore::FetchLimits(long problem_id) {
  std::lock_guard lck(mtx_);
  auto it = limits_.find(problem_id);
  if (it == limits_.end()) return std::nullopt;
  return it->second;
}

void InMemoryStore::AddSubmission(const Submission& sub) {
  std::lock_guard lck(mtx_);
  submissions_[sub.id] = sub;
}

void InMemoryStore::AddProblem(long problem_id, const ProblemLimits& limits, std::vector<TestCase> test_cases) {
  std::lock_guard lck(mtx_);
  limits_[problem_id] = limits;
  test_cases_[problem_id] = std::move(test_cases);
}

Submission InMemoryStore::Get(long id) {
  std::lock_guard lck(mtx_);
  return submissions_.at(id);
}

int InMemoryStore::TerminalWrites(long id) {
  std::lock_guard lck(mtx_);
  auto it = terminal_writes_.find(id);
  return it == terminal_writes_.end() ? 0 : it->second;
}

std::vector<SubmissionStatus> InMemoryStore::History(long id) {
  std::lock_guard lck(mtx_);
  return history_[id];
}

Submission MakeSubmission(long id, long problem_id, Language lang, const std::string& code,
                          SubmissionStatus status) {
  Submission sub;
  sub.id = id;
  sub.user_id = 1;
  sub.problem_id = problem_id;
  sub.contest_id = 1;
  sub.language = lang;
  sub.code = code;
  sub.status = status;
  return sub;
}

TempDir::TempDir() {
  std::string templ = (fs::temp_directory_path() / "codejudge_test.XXXXXX").string();
  if (!mkdtemp(templ.data())) throw std::runtime_error("mkdtemp failed");
  path_ = templ;
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

RunnerOutput RunRunner(Language lang, const std::string& code, const std::string& input,
                       int time_limit, int memory_limit) {
  TempDir dir;
  fs::path source = dir.Path() / LanguageSourceName(lang);
  fs::path input_file = dir.Path() / "input.txt";
  std::ofstream(source) << code;
  std::ofstream(input_file) << input;
  std::string runner = RunnerPath(lang).string();
  std::string src = source.string(), inp = input_file.string();
  std::string t = std::to_string(time_limit), m = std::to_string(memory_limit);
  fs::path report = dir.Path() / "report";

  pid_t pid = fork();
  if (pid < 0) throw std::runtime_error("fork failed");
  if (pid == 0) {
    int fd = open(report.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) _exit(126);
    dup2(fd, 1);
    execl(runner.c_str(), runner.c_str(), src.c_str(), inp.c_str(), t.c_str(), m.c_str(), (char*)nullptr);
    _exit(127);
  }
  int status;
  waitpid(pid, &status, 0);
  RunnerOutput ret;
  ret.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
  std::ifstream fin(report);
  std::stringstream ss;
  ss << fin.rdbuf();
  ret.report = ss.str();
  return ret;
}

bool HasProgram(const std::string& name) {
  const char* path = getenv("PATH");
  if (!path) return false;
  std::stringstream ss(path);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (!dir.empty() && access((fs::path(dir) / name).c_str(), X_OK) == 0) return true;
  }
  return false;
}
