#include <codejudge/executor.h>

#include <unistd.h>
#include <sys/stat.h>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"
#include "runner_report.h"
#include "sandbox_exec.h"

namespace {

// the runner writes its compiler output into the report; keep it bounded
constexpr size_t kMaxReportBytes = 1 << 20;

inline long ToMs(const struct timeval& tv) {
  return tv.tv_sec * 1000L + tv.tv_usec / 1000;
}

} // namespace

SandboxedExecutor::SandboxedExecutor(const SandboxedExecutorOptions& opt) : opt_(opt) {
  for (int i = 0; i < opt_.uid_pool_size; i++) uid_pool_.push_back(opt_.uid_base + i);
}

int SandboxedExecutor::AcquireUid() {
  std::unique_lock lck(uid_mtx_);
  uid_cv_.wait(lck, [this] { return !uid_pool_.empty(); });
  int uid = uid_pool_.back();
  uid_pool_.pop_back();
  return uid;
}

void SandboxedExecutor::ReleaseUid(int uid) {
  {
    std::lock_guard lck(uid_mtx_);
    uid_pool_.push_back(uid);
  }
  uid_cv_.notify_one();
}

bool SandboxedExecutor::Supports(Language lang) const {
  return access(RunnerPath(lang).c_str(), X_OK) == 0;
}

ExecutionResult SandboxedExecutor::Run(Language lang, const std::string& code, const std::string& input,
                                       int time_limit, int memory_limit) {
  ExecutionResult ret;
  if (!Supports(lang)) {
    spdlog::error("Runner not installed: lang={} path={}", LanguageName(lang), RunnerPath(lang).c_str());
    ret.failure = FailureKind::SYSTEM_ERROR;
    ret.message = fmt::format("Language {} is not supported on this judge", LanguageName(lang));
    return ret;
  }

  const long id = GetUniqueExecutionId();
  const fs::path box = ExecutionBoxPath(id);
  ScopedDir box_guard(box);
  int uid = AcquireUid();
  struct UidGuard {
    SandboxedExecutor* self;
    int uid;
    ~UidGuard() { self->ReleaseUid(uid); }
  } uid_guard{this, uid};

  // infrastructure failures: the processor turns them into SYSTEM_ERROR
  const fs::path workdir = Workdir(fs::path(box));
  if (!CreateDirs(workdir, fs::perms::owner_all | fs::perms::group_all | fs::perms::others_read |
                           fs::perms::others_exec)) {
    throw std::runtime_error("Cannot create box " + box.string());
  }
  if (chown(workdir.c_str(), uid, uid) < 0) {
    throw std::system_error(errno, std::generic_category(), "chown " + workdir.string());
  }
  if (!WriteFile(ExecutionBoxSource(id, lang), code, kPerm666) ||
      !WriteFile(ExecutionBoxInput(id), input, kPerm666)) {
    throw std::runtime_error("Cannot write source or input into box " + box.string());
  }

  SandboxOptions opt;
  opt.boxdir = box;
  opt.command = {
    RunnerPath(lang),
    ExecutionBoxSource(id, lang, true),
    ExecutionBoxInput(id, true),
    std::to_string(time_limit),
    std::to_string(memory_limit),
  };
  opt.envs = {"PATH=/usr/local/bin:/usr/bin:/bin", "LANG=C.UTF-8", "HOME=" + Workdir("/").string()};
  opt.workdir = Workdir("/");
  opt.output = ExecutionBoxReport(id, true);
  opt.error = ExecutionBoxRunnerError(id, true);
  opt.uid = opt.gid = uid;
  opt.wall_time = (time_limit + opt_.wall_time_margin) * 1'000'000L;
  opt.rss = (memory_limit + opt_.extra_memory_mb) * 1024L;
  opt.proc_num = opt_.max_processes;
  opt.file_num = opt_.max_open_files;
  opt.fsize = opt_.max_file_size_kib;
  opt.share_net = false;
  opt.dirs = {"/usr", "/lib", "/lib64", "/lib32", "/bin", "/etc/alternatives", "/var/lib",
              internal::kDataDir.string()};
  opt.FilterDirs();

  struct cjail_result res = SandboxExec(opt);
  if (res.timekill == -1) {
    ret.failure = FailureKind::SYSTEM_ERROR;
    ret.message = fmt::format("Sandbox failed to start: {}", strerror(res.oomkill));
    return ret;
  }

  std::string text = ReadFileHead(ExecutionBoxReport(id), kMaxReportBytes);
  auto report = ParseRunnerReport(text);
  bool compile_failed = report && report->has_compile_section && report->compile_status != "SUCCESS";
  bool finished_execution = report && report->has_execution_section;
  spdlog::debug("Execute finished: id={} lang={} timekill={} oomkill={} real={}ms report={}B",
                id, LanguageName(lang), res.timekill, res.oomkill, ToMs(res.time), text.size());

  if (!finished_execution && !compile_failed) {
    // the runner itself was stopped by the sandbox before it could report
    if (res.timekill) {
      ret.failure = FailureKind::TIME_LIMIT_EXCEEDED;
      ret.message = "Time limit exceeded";
      ret.run_time_ms = ToMs(res.time);
      return ret;
    }
    if (res.oomkill) {
      ret.failure = FailureKind::MEMORY_LIMIT_EXCEEDED;
      ret.message = "Memory limit exceeded";
      ret.memory_used_kib = res.rus.ru_maxrss;
      return ret;
    }
  }
  if (!report) {
    std::string err = ReadFileHead(ExecutionBoxRunnerError(id), 1024);
    spdlog::warn("Unparseable runner report: id={} lang={} stderr={}", id, LanguageName(lang), err);
    ret.failure = FailureKind::SYSTEM_ERROR;
    ret.message = "Runner produced no report" + (err.empty() ? std::string() : ": " + err);
    return ret;
  }

  ReportClass cls = ClassifyReport(*report, time_limit);
  ret.failure = cls.failure;
  ret.message = cls.message;
  ret.output = report->program_output;
  if (ret.output.size() > kMaxOutputBytes) ret.output.resize(kMaxOutputBytes);
  ret.compile_time_ms = static_cast<long>(report->compile_time * 1000 + 0.5);
  ret.run_time_ms = static_cast<long>(report->execution_time * 1000 + 0.5);
  ret.memory_used_kib = report->memory_used_kib.value_or(res.rus.ru_maxrss);
  ret.exit_code = report->exit_code.value_or(0);
  if (ret.failure == FailureKind::SYSTEM_ERROR) {
    spdlog::warn("Runner reported a system error: id={} lang={} msg={}", id, LanguageName(lang), ret.message);
  }
  return ret;
}
