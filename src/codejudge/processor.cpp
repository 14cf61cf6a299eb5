#include <codejudge/processor.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <codejudge/utils.h>

const char* AdmissionName(Admission admission) {
  switch (admission) {
#define X(name) case Admission::name: return #name;
    ENUM_ADMISSION_
#undef X
  }
  __builtin_unreachable();
}

SubmissionProcessor::SubmissionProcessor(SubmissionStore& submissions, ProblemStore& problems, Judge& judge,
                                         ProcessorOptions opt) :
    submissions_(submissions), problems_(problems), judge_(judge), opt_(std::move(opt)),
    idle_workers_(0), running_(false),
    submitted_(0), queued_(0), ran_inline_(0), finished_(0), system_errors_(0), in_flight_(0) {}

SubmissionProcessor::~SubmissionProcessor() {
  Stop();
}

void SubmissionProcessor::Start() {
  std::lock_guard lck(mtx_);
  if (running_) return;
  running_ = true;
  for (int i = 0; i < opt_.workers; i++) workers_.emplace_back(&SubmissionProcessor::WorkerLoop, this);
  spdlog::info("Submission processor started: workers={} queue_capacity={}", opt_.workers, opt_.queue_capacity);
}

void SubmissionProcessor::Stop() {
  std::vector<std::thread> workers;
  {
    std::lock_guard lck(mtx_);
    running_ = false;
    workers.swap(workers_);
  }
  cv_.notify_all();
  for (auto& i : workers) i.join();
  if (!workers.empty()) spdlog::info("Submission processor stopped: finished={}", finished_.load());
}

bool SubmissionProcessor::Running() const {
  std::lock_guard lck(mtx_);
  return running_;
}

void SubmissionProcessor::WorkerLoop() {
  while (true) {
    std::packaged_task<void()> task;
    {
      std::unique_lock lck(mtx_);
      idle_workers_++;
      cv_.wait(lck, [this] { return !queue_.empty() || !running_; });
      idle_workers_--;
      // stopped and drained
      if (queue_.empty()) return;
      task = std::move(queue_.front());
      queue_.pop();
    }
    task();
  }
}

SubmitTicket SubmissionProcessor::Submit(long id) {
  submitted_++;
  std::packaged_task<void()> task([this, id] { Process(id); });
  SubmitTicket ret{Admission::QUEUED, task.get_future()};
  {
    std::lock_guard lck(mtx_);
    if (running_ && (queue_.size() < opt_.queue_capacity || queue_.size() < (size_t)idle_workers_)) {
      queue_.push(std::move(task));
      queued_++;
      spdlog::debug("Submission queued: id={} queue_size={}", id, queue_.size());
      cv_.notify_one();
      return ret;
    }
  }
  // caller-runs backpressure
  ran_inline_++;
  spdlog::warn("Processor saturated or stopped, judging on the caller thread: id={}", id);
  ret.admission = Admission::RAN_INLINE;
  task();
  return ret;
}

void SubmissionProcessor::Process(long id) {
  in_flight_++;
  std::optional<SubmissionStatus> status = ProcessImpl(id);
  in_flight_--;
  finished_++;
  if (opt_.on_finalized) {
    try {
      opt_.on_finalized(id, status);
    } catch (const std::exception& e) {
      spdlog::error("Finalize callback failed: id={} error={}", id, e.what());
    }
  }
}

bool SubmissionProcessor::WriteSystemError(long id, const std::string& message, bool owned) {
  StatusUpdate update(SubmissionStatus::SYSTEM_ERROR, TruncateMessage(message), 0);
  // another worker may have taken the submission since we read it
  if (!owned) update.expected_from = SubmissionStatus::QUEUED;
  try {
    if (submissions_.Transition(id, update)) {
      system_errors_++;
      return true;
    }
    spdlog::warn("SYSTEM_ERROR transition refused: id={}", id);
  } catch (const std::exception& e) {
    spdlog::error("Failed writing SYSTEM_ERROR: id={} error={}", id, e.what());
  }
  return false;
}

std::optional<SubmissionStatus> SubmissionProcessor::ProcessImpl(long id) {
  std::string error;
  bool owned = false;
  try {
    std::optional<Submission> sub = submissions_.FetchSubmission(id);
    if (!sub) {
      spdlog::warn("Submission not found: id={}", id);
      return std::nullopt;
    }
    if (sub->status != SubmissionStatus::QUEUED) {
      spdlog::info("Submission not queued, skipped: id={} status={}", id, StatusName(sub->status));
      return std::nullopt;
    }

    // rejected before judging starts
    std::string reject;
    std::vector<TestCase> test_cases;
    if (sub->code.size() > kMaxCodeLength) {
      reject = fmt::format("Source code exceeds {} characters", kMaxCodeLength);
    } else if (!judge_.Supports(sub->language)) {
      reject = fmt::format("Language {} is not supported", LanguageName(sub->language));
    } else {
      test_cases = problems_.FetchTestCases(sub->problem_id);
      if (test_cases.empty()) reject = fmt::format("Problem {} has no test cases", sub->problem_id);
    }
    if (!reject.empty()) {
      spdlog::warn("Submission rejected: id={} reason={}", id, reject);
      if (WriteSystemError(id, reject, false)) return SubmissionStatus::SYSTEM_ERROR;
      return std::nullopt;
    }
    ProblemLimits limits = problems_.FetchLimits(sub->problem_id).value_or(opt_.default_limits);

    if (!submissions_.Transition(id, StatusUpdate(SubmissionStatus::RUNNING, ""))) {
      spdlog::info("Submission already taken: id={}", id);
      return std::nullopt;
    }
    owned = true;
    spdlog::info("Judging submission: id={} lang={} problem={} cases={} time_limit={}s memory_limit={}MB",
                 id, LanguageName(sub->language), sub->problem_id, test_cases.size(),
                 limits.time_limit, limits.memory_limit);

    JudgeResult res = judge_.Run(*sub, test_cases, limits);
    StatusUpdate update(res.verdict, res.message, res.score);
    if (res.verdict != SubmissionStatus::COMPILATION_ERROR && !res.outcomes.empty()) {
      update.execution_time_ms = res.max_time_ms;
      update.memory_used_kib = res.max_memory_kib;
    }
    if (!submissions_.Transition(id, update)) {
      spdlog::error("Terminal transition refused: id={} status={}", id, StatusName(res.verdict));
      return std::nullopt;
    }
    if (res.verdict == SubmissionStatus::SYSTEM_ERROR) system_errors_++;
    spdlog::info("Submission finished: id={} status={} score={}", id, StatusName(res.verdict), res.score);
    return res.verdict;
  } catch (const std::exception& e) {
    error = e.what();
  } catch (...) {
    error = "unknown exception";
  }
  spdlog::error("Judging failed: id={} error={}", id, error);
  if (WriteSystemError(id, "Execution failed - " + error, owned)) return SubmissionStatus::SYSTEM_ERROR;
  return std::nullopt;
}

SubmissionProcessor::Stats SubmissionProcessor::GetStats() const {
  Stats ret;
  ret.submitted = submitted_.load();
  ret.queued = queued_.load();
  ret.ran_inline = ran_inline_.load();
  ret.finished = finished_.load();
  ret.system_errors = system_errors_.load();
  ret.in_flight = in_flight_.load();
  return ret;
}

size_t SubmissionProcessor::QueueSize() const {
  std::lock_guard lck(mtx_);
  return queue_.size();
}
