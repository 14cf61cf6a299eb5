#include "dispatcher.h"

#include <thread>
#include <chrono>

#include <spdlog/spdlog.h>
#include <codejudge/utils.h>

namespace {

constexpr int kSleepSliceMs = 100;

} // namespace

void Dispatcher::Finalized(long id, std::optional<SubmissionStatus> status) {
  {
    std::lock_guard lck(mtx_);
    in_flight_.erase(id);
  }
  if (status) {
    spdlog::debug("Dispatcher: finalized id={} status={}", id, StatusName(*status));
  } else {
    spdlog::debug("Dispatcher: finalized id={} without a status write", id);
  }
}

size_t Dispatcher::InFlight() {
  std::lock_guard lck(mtx_);
  return in_flight_.size();
}

void Dispatcher::Poll(SubmissionProcessor& processor) {
  std::vector<long> ids = store_.ListByStatus(SubmissionStatus::QUEUED, opt_.batch_size);
  for (long id : ids) {
    {
      std::lock_guard lck(mtx_);
      if (!in_flight_.insert(id).second) continue;
    }
    SubmitTicket ticket = processor.Submit(id);
    spdlog::debug("Dispatcher: submitted id={} admission={}", id, AdmissionName(ticket.admission));
  }
}

void Dispatcher::SweepStaleRunning() {
  int64_t before = NowMicros() - opt_.stale_running_minutes * 60'000'000L;
  for (long id : store_.ListRunningBefore(before)) {
    {
      std::lock_guard lck(mtx_);
      if (in_flight_.count(id)) continue;
    }
    StatusUpdate update(SubmissionStatus::SYSTEM_ERROR,
                        "Judging interrupted; please resubmit", 0);
    if (store_.Transition(id, update)) {
      spdlog::warn("Stale RUNNING submission marked SYSTEM_ERROR: id={} minutes={}",
                   id, opt_.stale_running_minutes);
    }
  }
}

void Dispatcher::Run(SubmissionProcessor& processor) {
  spdlog::info("Dispatcher started: poll_interval={}ms batch_size={} stale_running_minutes={}",
               opt_.poll_interval_ms, opt_.batch_size, opt_.stale_running_minutes);
  while (!stop_) {
    try {
      if (opt_.stale_running_minutes > 0) SweepStaleRunning();
      Poll(processor);
    } catch (const std::exception& e) {
      spdlog::error("Dispatcher poll failed: {}", e.what());
    }
    for (int slept = 0; slept < opt_.poll_interval_ms && !stop_; slept += kSleepSliceMs) {
      std::this_thread::sleep_for(std::chrono::milliseconds(kSleepSliceMs));
    }
  }
  spdlog::info("Dispatcher stopped: in_flight={}", InFlight());
}
