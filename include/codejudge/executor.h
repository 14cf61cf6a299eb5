#ifndef INCLUDE_CODEJUDGE_EXECUTOR_H_
#define INCLUDE_CODEJUDGE_EXECUTOR_H_

#include <mutex>
#include <condition_variable>
#include <string>
#include <vector>

#include "submission.h"

struct ExecutionResult {
  std::string output; // at most kMaxOutputBytes
  FailureKind failure;
  std::string message; // compiler output or runtime diagnostic
  long compile_time_ms;
  long run_time_ms;
  long memory_used_kib;
  int exit_code;

  ExecutionResult() :
      failure(FailureKind::NONE),
      compile_time_ms(0), run_time_ms(0), memory_used_kib(0),
      exit_code(0) {}
};

// Compiles (if needed) and runs one source against one input under limits.
// Judging outcomes are reported through ExecutionResult::failure; exceptions
// are reserved for failures of the machinery itself.
class Executor {
 public:
  virtual ~Executor() = default;

  virtual ExecutionResult Run(Language lang, const std::string& code, const std::string& input,
                              int time_limit, int memory_limit) = 0;
  virtual bool Supports(Language) const { return true; }
};

struct SandboxedExecutorOptions {
  int uid_base;
  int uid_pool_size;
  // compile phase of the runners plus slack for sandbox setup
  int wall_time_margin; // seconds
  // memory of the whole box on top of the memory limit; the compilers run in it as well
  int extra_memory_mb;
  int max_processes;
  int max_open_files;
  long max_file_size_kib;

  SandboxedExecutorOptions() :
      uid_base(50000), uid_pool_size(100),
      wall_time_margin(45),
      extra_memory_mb(1024),
      max_processes(256), max_open_files(256),
      max_file_size_kib(64 * 1024) {}
};

// Runs the language runner of the data directory inside a cjail sandbox,
// one exclusive box directory per invocation.
class SandboxedExecutor : public Executor {
  SandboxedExecutorOptions opt_;
  std::mutex uid_mtx_;
  std::condition_variable uid_cv_;
  std::vector<int> uid_pool_;

  int AcquireUid();
  void ReleaseUid(int uid);
 public:
  explicit SandboxedExecutor(const SandboxedExecutorOptions& opt = SandboxedExecutorOptions());

  ExecutionResult Run(Language lang, const std::string& code, const std::string& input,
                      int time_limit, int memory_limit) override;
  // true if the runner executable of the language is installed
  bool Supports(Language) const override;
};

#endif  // INCLUDE_CODEJUDGE_EXECUTOR_H_
