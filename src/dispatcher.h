#ifndef DISPATCHER_H_
#define DISPATCHER_H_

#include <mutex>
#include <atomic>
#include <optional>
#include <unordered_set>

#include <codejudge/processor.h>
#include "database.h"

struct DispatcherOptions {
  int poll_interval_ms;
  size_t batch_size;
  // 0 disables the sweep of RUNNING submissions left behind by a previous process
  int stale_running_minutes;

  DispatcherOptions() : poll_interval_ms(1000), batch_size(64), stale_running_minutes(0) {}
};

// Feeds QUEUED submissions of the database to the processor.
class Dispatcher {
  SqliteStore& store_;
  const DispatcherOptions opt_;
  std::atomic_bool stop_;

  std::mutex mtx_;
  std::unordered_set<long> in_flight_;

  void Poll(SubmissionProcessor& processor);
  void SweepStaleRunning();
 public:
  Dispatcher(SqliteStore& store, DispatcherOptions opt) : store_(store), opt_(opt), stop_(false) {}

  // Blocks until Stop() is called.
  void Run(SubmissionProcessor& processor);
  // async-signal-safe
  void Stop() { stop_ = true; }
  // to be called from ProcessorOptions::on_finalized
  void Finalized(long id, std::optional<SubmissionStatus> status);
  size_t InFlight();
};

#endif  // DISPATCHER_H_
