#ifndef INCLUDE_CODEJUDGE_PROCESSOR_H_
#define INCLUDE_CODEJUDGE_PROCESSOR_H_

#include <mutex>
#include <queue>
#include <atomic>
#include <future>
#include <thread>
#include <vector>
#include <optional>
#include <functional>
#include <condition_variable>

#include "judge.h"
#include "store.h"

#define ENUM_ADMISSION_ \
  X(QUEUED) /* handed to a worker */ \
  X(RAN_INLINE) /* pool saturated or stopped; judged on the caller's thread */
enum class Admission {
#define X(name) name,
  ENUM_ADMISSION_
#undef X
};
const char* AdmissionName(Admission);

struct SubmitTicket {
  Admission admission;
  std::future<void> done; // never holds an exception
};

struct ProcessorOptions {
  int workers;
  size_t queue_capacity;
  // used when the problem store has no limits for a problem
  ProblemLimits default_limits;
  // called once per Submit after processing ends; status is the terminal status written,
  // or nullopt if nothing was written (unknown id, already taken by another worker, store down)
  std::function<void(long id, std::optional<SubmissionStatus> status)> on_finalized;

  ProcessorOptions() : workers(8), queue_capacity(200) {}
};

// Drives QUEUED submissions to a terminal status on a bounded pool of long-lived workers.
class SubmissionProcessor {
 public:
  struct Stats {
    long submitted;
    long queued;
    long ran_inline;
    long finished;
    long system_errors;
    long in_flight;
  };

 private:
  SubmissionStore& submissions_;
  ProblemStore& problems_;
  Judge& judge_;
  const ProcessorOptions opt_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::queue<std::packaged_task<void()>> queue_;
  std::vector<std::thread> workers_;
  int idle_workers_;
  bool running_;

  std::atomic_long submitted_;
  std::atomic_long queued_;
  std::atomic_long ran_inline_;
  std::atomic_long finished_;
  std::atomic_long system_errors_;
  std::atomic_long in_flight_;

  void WorkerLoop();
  std::optional<SubmissionStatus> ProcessImpl(long id);
  // owned: this worker moved the submission to RUNNING
  bool WriteSystemError(long id, const std::string& message, bool owned);

 public:
  SubmissionProcessor(SubmissionStore&, ProblemStore&, Judge&, ProcessorOptions opt = ProcessorOptions());
  ~SubmissionProcessor();
  SubmissionProcessor(const SubmissionProcessor&) = delete;
  SubmissionProcessor& operator=(const SubmissionProcessor&) = delete;

  void Start();
  // Stops accepting work for the pool, finishes everything already queued and joins the workers.
  void Stop();
  bool Running() const;

  // Called from any thread. Returns immediately unless the pool is saturated (or stopped),
  // in which case the submission is judged before returning.
  SubmitTicket Submit(long id);

  // Judge one submission synchronously on the calling thread. Never throws.
  void Process(long id);

  Stats GetStats() const;
  size_t QueueSize() const;
};

#endif  // INCLUDE_CODEJUDGE_PROCESSOR_H_
