#include "runner.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <chrono>
#include <cstring>
#include <fstream>
#include <algorithm>
#include <system_error>

#include <fmt/format.h>
#include "runner_report.h"

extern char** environ;

namespace {

constexpr size_t kMaxCompilerOutput = 64 * 1024;
constexpr long kCompileFileSize = 256L * 1024 * 1024;
constexpr long kRunFileSize = 1024L * 1024;
constexpr int kMaxOpenFiles = 64;
constexpr int kPollIntervalMs = 10;

struct ChildLimits {
  long cpu_seconds;
  long address_space; // bytes; 0 for no limit
  long file_size; // bytes
  long processes; // 0 for no limit
  long open_files;
};

struct ChildResult {
  int status;
  bool timed_out;
  bool memory_killed;
  double wall_time; // seconds
  long max_rss_kib;
  std::string output;
};

struct TempDir {
  fs::path path;
  ~TempDir() {
    std::error_code ec;
    if (!path.empty()) fs::remove_all(path, ec);
  }
};

void SetLimit(int resource, long value) {
  struct rlimit lim;
  lim.rlim_cur = lim.rlim_max = value;
  setrlimit(resource, &lim);
}

// VmRSS of a live process in KiB; -1 if unavailable
long ReadRss(pid_t pid) {
  char path[64];
  snprintf(path, sizeof(path), "/proc/%d/status", (int)pid);
  std::ifstream fin(path);
  std::string line;
  while (std::getline(fin, line)) {
    if (line.compare(0, 6, "VmRSS:") == 0) return atol(line.c_str() + 6);
  }
  return -1;
}

std::vector<std::string> BuildEnv(const LanguageSpec& spec, const fs::path& workdir) {
  std::vector<std::string> ret;
  for (char** p = environ; p && *p; p++) ret.emplace_back(*p);
  for (std::string i : spec.extra_env) {
    constexpr char kWorkdirVar[] = "${WORKDIR}";
    if (size_t pos = i.find(kWorkdirVar); pos != std::string::npos) {
      i.replace(pos, sizeof(kWorkdirVar) - 1, workdir.string());
    }
    ret.push_back(std::move(i));
  }
  return ret;
}

// Runs cmd in its own process group with stdout and stderr captured together.
// Only the first output_cap bytes are kept; the rest is drained and dropped.
ChildResult RunChild(const std::vector<std::string>& cmd, const std::vector<std::string>& env,
                     const fs::path& cwd, const std::string& input_file, const ChildLimits& lim,
                     int wall_timeout, long rss_limit_kib, size_t output_cap) {
  ChildResult ret{};
  std::vector<char*> argv, envp;
  for (auto& i : cmd) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  for (auto& i : env) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);

  int in_fd = -1;
  if (!input_file.empty()) in_fd = open(input_file.c_str(), O_RDONLY | O_CLOEXEC);
  if (in_fd < 0) {
    // no input: an empty pipe gives EOF immediately
    int in_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) < 0) throw std::system_error(errno, std::generic_category(), "pipe");
    close(in_pipe[1]);
    in_fd = in_pipe[0];
  }
  int out_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) < 0) {
    int err = errno;
    close(in_fd);
    throw std::system_error(err, std::generic_category(), "pipe");
  }

  auto start = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close(in_fd);
    close(out_pipe[0]);
    close(out_pipe[1]);
    throw std::system_error(err, std::generic_category(), "fork");
  }
  if (pid == 0) {
    setpgid(0, 0);
    if (chdir(cwd.c_str()) < 0) _exit(127);
    dup2(in_fd, 0);
    dup2(out_pipe[1], 1);
    dup2(out_pipe[1], 2);
    SetLimit(RLIMIT_CPU, lim.cpu_seconds);
    if (lim.address_space) SetLimit(RLIMIT_AS, lim.address_space);
    SetLimit(RLIMIT_FSIZE, lim.file_size);
    if (lim.processes) SetLimit(RLIMIT_NPROC, lim.processes);
    SetLimit(RLIMIT_NOFILE, lim.open_files);
    SetLimit(RLIMIT_CORE, 0);
    execvpe(argv[0], argv.data(), envp.data());
    const char msg[] = "Failed to execute the program\n";
    if (write(2, msg, sizeof(msg) - 1) < 0) _exit(127);
    _exit(127);
  }
  setpgid(pid, pid);
  close(in_fd);
  close(out_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);

  auto deadline = start + std::chrono::seconds(wall_timeout);
  bool exited = false, eof = false;
  struct rusage usage{};
  char buf[8192];
  while (!exited || !eof) {
    if (!eof) {
      struct pollfd pfd = {out_pipe[0], POLLIN, 0};
      poll(&pfd, 1, exited ? 0 : kPollIntervalMs);
      while (true) {
        ssize_t r = read(out_pipe[0], buf, sizeof(buf));
        if (r > 0) {
          size_t keep = std::min(output_cap - std::min(output_cap, ret.output.size()), (size_t)r);
          ret.output.append(buf, keep);
          continue;
        }
        if (r == 0) eof = true;
        break;
      }
    } else {
      usleep(kPollIntervalMs * 1000);
    }
    if (!exited) {
      int status;
      pid_t r = wait4(pid, &status, WNOHANG, &usage);
      if (r == pid) {
        exited = true;
        ret.status = status;
        ret.wall_time = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        // descendants still holding the pipe must not keep us waiting
        kill(-pid, SIGKILL);
      } else if (std::chrono::steady_clock::now() >= deadline) {
        ret.timed_out = true;
        kill(-pid, SIGKILL);
      } else if (rss_limit_kib > 0 && ReadRss(pid) > rss_limit_kib) {
        ret.memory_killed = true;
        kill(-pid, SIGKILL);
      }
    } else if (!eof) {
      // the group is dead; whatever is left in the pipe is read on the next round
      struct pollfd pfd = {out_pipe[0], POLLIN, 0};
      if (poll(&pfd, 1, kPollIntervalMs) == 0) eof = true;
    }
  }
  close(out_pipe[0]);
  ret.max_rss_kib = usage.ru_maxrss;
  return ret;
}

std::string JoinExtensions(const std::vector<std::string>& exts) {
  std::string ret;
  for (size_t i = 0; i < exts.size(); i++) {
    if (i) ret += i + 1 == exts.size() ? (exts.size() > 2 ? ", or " : " or ") : ", ";
    ret += exts[i];
  }
  return ret;
}

bool ParseInt(const char* str, int& val) {
  char* end = nullptr;
  long r = strtol(str, &end, 10);
  if (end == str || *end != '\0' || r <= 0 || r > 3600 * 24) return false;
  val = r;
  return true;
}

const char* ExecutionStatus(int code) {
  switch (code) {
    case 0: return "SUCCESS";
    case kExitTimeLimit: return "TIME_LIMIT_EXCEEDED";
    case kExitMemoryLimit: return "MEMORY_LIMIT_EXCEEDED";
    case kExitSegmentationFault: return "SEGMENTATION_FAULT";
    case kExitAborted: return "ABORTED";
    case kExitFloatingPoint: return "FLOATING_POINT_ERROR";
    default: return "RUNTIME_ERROR";
  }
}

void PrintDebugInfo(int code) {
  switch (code) {
    case kExitSegmentationFault:
      fmt::print("{}\nSegmentation fault detected. Possible causes:\n"
                 "- Array index out of bounds\n- Null pointer dereference\n"
                 "- Stack overflow\n- Memory corruption\n", kSectionDebugInfo);
      break;
    case kExitAborted:
      fmt::print("{}\nProgram aborted. Possible causes:\n"
                 "- Assertion failure\n- Memory allocation failure\n"
                 "- Uncaught exception\n", kSectionDebugInfo);
      break;
    case kExitFloatingPoint:
      fmt::print("{}\nFloating point error. Possible causes:\n"
                 "- Division by zero\n- Invalid floating point operation\n"
                 "- Overflow/underflow\n", kSectionDebugInfo);
      break;
  }
}

int ExitCodeOf(const ChildResult& res, int timeout, long rss_limit_kib) {
  if (res.timed_out) return kExitTimeLimit;
  if (res.memory_killed) return kExitMemoryLimit;
  if (WIFEXITED(res.status)) {
    int code = WEXITSTATUS(res.status);
    // allocation failures under the limit surface as ordinary errors
    if (code != 0 && rss_limit_kib > 0 && res.max_rss_kib > rss_limit_kib) return kExitMemoryLimit;
    if (res.wall_time > timeout) return kExitTimeLimit;
    return code;
  }
  int sig = WTERMSIG(res.status);
  if (sig == SIGXCPU) return kExitTimeLimit;
  if (sig == SIGKILL) return kExitMemoryLimit;
  if (rss_limit_kib > 0 && res.max_rss_kib > rss_limit_kib) return kExitMemoryLimit;
  return 128 + sig;
}

} // namespace

int RunnerMain(int argc, char** argv, const LanguageSpec& spec) {
  setvbuf(stdout, nullptr, _IOFBF, 1 << 16);
  if (argc < 2 || argv[1][0] == '\0') {
    fmt::print("ERROR: Source file not specified\n");
    return 1;
  }
  fs::path source = argv[1];
  std::error_code ec;
  if (!fs::is_regular_file(source, ec)) {
    fmt::print("ERROR: Source file '{}' not found\n", source.string());
    return 1;
  }
  if (std::find(spec.extensions.begin(), spec.extensions.end(), source.extension().string()) ==
      spec.extensions.end()) {
    fmt::print("ERROR: Source file must have {} extension\n", JoinExtensions(spec.extensions));
    return 1;
  }
  std::string input_file = argc >= 3 ? argv[2] : "";
  if (!input_file.empty() && !fs::is_regular_file(input_file, ec)) input_file.clear();
  RunContext ctx;
  ctx.timeout = 5;
  ctx.memory_limit = 128;
  if ((argc >= 4 && !ParseInt(argv[3], ctx.timeout)) || (argc >= 5 && !ParseInt(argv[4], ctx.memory_limit))) {
    fmt::print("ERROR: Timeout and memory limit must be positive integers\n");
    return 1;
  }

  // private work directory next to the source
  TempDir tmp;
  {
    std::string templ = (fs::absolute(source).parent_path() / "execution.XXXXXX").string();
    if (!mkdtemp(templ.data())) {
      fmt::print("ERROR: Cannot create work directory: {}\n", strerror(errno));
      return 1;
    }
    tmp.path = templ;
  }
  ctx.workdir = tmp.path;
  ctx.source = source.filename().string();
  ctx.stem = source.stem().string();
  if (!fs::copy_file(source, ctx.workdir / ctx.source, ec)) {
    fmt::print("ERROR: Cannot copy source file: {}\n", ec.message());
    return 1;
  }
  std::vector<std::string> env = BuildEnv(spec, ctx.workdir);

  try {
    // compile or syntax check
    fmt::print("{}\n", spec.compiled ? kSectionCompilation : kSectionSyntaxCheck);
    // compilers fork freely; the sandbox bounds the process count of the whole box
    ChildLimits check_lim{spec.check_timeout + 1, 0, kCompileFileSize, 0, 256};
    ChildResult check = RunChild(spec.check_command(ctx), env, ctx.workdir, "", check_lim,
                                 spec.check_timeout, 0, kMaxCompilerOutput);
    int check_code = ExitCodeOf(check, spec.check_timeout, 0);
    const char* time_key = spec.compiled ? "Compile Time" : "Syntax Check Time";
    if (check_code != 0) {
      fmt::print("{}\nExit Code: {}\n{}: {:.3f}s\n", spec.compiled ? "COMPILATION_ERROR" : "SYNTAX_ERROR",
                 check_code, time_key, check.wall_time);
      if (spec.compiled) fmt::print("Language: {}\n", spec.display_name);
      fmt::print("{}\n", spec.compiled ? kSectionCompilerOutput : kSectionSyntaxErrorOutput);
      if (check.timed_out) {
        fmt::print("{} timed out after {}s\n", spec.compiled ? "Compilation" : "Syntax check", spec.check_timeout);
      }
      fmt::print("{}\n", check.output.empty() ? std::string("No compiler output") : check.output);
      return 1;
    }
    fmt::print("SUCCESS\n{}: {:.3f}s\n", time_key, check.wall_time);
    if (spec.compiled) fmt::print("Language: {}\n", spec.display_name);
    if (spec.artifact) {
      std::string artifact = spec.artifact(ctx);
      if (!fs::exists(ctx.workdir / artifact, ec)) {
        fmt::print("ERROR: Executable '{}' was not created\n", artifact);
        return 1;
      }
    }

    // execution
    fmt::print("{}\n", kSectionExecution);
    fflush(stdout);
    long rss_limit = ctx.memory_limit * 1024L;
    long address_space = 0;
    if (spec.limit_address_space) address_space = (ctx.memory_limit * 2L + 64) * 1024 * 1024;
    ChildLimits run_lim{ctx.timeout + 1, address_space, kRunFileSize, spec.max_processes, kMaxOpenFiles};
    ChildResult run = RunChild(spec.run_command(ctx), env, ctx.workdir, input_file, run_lim,
                               ctx.timeout, rss_limit, kMaxOutputBytes);
    int code = ExitCodeOf(run, ctx.timeout, rss_limit);
    fmt::print("{}\nExit Code: {}\nExecution Time: {:.3f}s\n", ExecutionStatus(code), code, run.wall_time);
    // the output is always followed by one separating newline
    fmt::print("{}\n{}\n", kSectionProgramOutput, run.output);
    PrintDebugInfo(code);
    fmt::print("{}\nMemory Limit: {}MB\nTime Limit: {}s\nMemory Used: {}KB\n",
               kSectionResourceUsage, ctx.memory_limit, ctx.timeout, run.max_rss_kib);
    for (auto& i : spec.resource_lines) fmt::print("{}\n", i);
    return code;
  } catch (const std::exception& e) {
    fmt::print("ERROR: {}\n", e.what());
    return 1;
  }
}
