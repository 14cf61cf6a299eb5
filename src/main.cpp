#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <fstream>
#include <algorithm>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <codejudge/judge.h>
#include <codejudge/paths.h>
#include <codejudge/logger.h>
#include <codejudge/executor.h>
#include <codejudge/processor.h>
#include "database.h"
#include "dispatcher.h"

namespace {

bool to_lock = true;
fs::path database_path = "/var/lib/codejudge/db.sqlite";
int max_score = 100;
ProcessorOptions processor_opt;
SandboxedExecutorOptions executor_opt;
DispatcherOptions dispatcher_opt;

Dispatcher* running_dispatcher = nullptr;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  std::string database = ini[""]["database"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  if (database.size()) database_path = database;
  processor_opt.workers = ini[""]["workers"] | processor_opt.workers;
  processor_opt.queue_capacity = ini[""]["queue_capacity"] | (int)processor_opt.queue_capacity;
  processor_opt.default_limits.time_limit =
      ini[""]["default_time_limit"] | processor_opt.default_limits.time_limit;
  processor_opt.default_limits.memory_limit =
      ini[""]["default_memory_limit_mb"] | processor_opt.default_limits.memory_limit;
  max_score = ini[""]["max_score"] | max_score;
  executor_opt.uid_base = ini[""]["sandbox_uid_base"] | executor_opt.uid_base;
  dispatcher_opt.poll_interval_ms = ini[""]["poll_interval_ms"] | dispatcher_opt.poll_interval_ms;
  dispatcher_opt.stale_running_minutes =
      ini[""]["stale_running_minutes"] | dispatcher_opt.stale_running_minutes;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codejudged");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/codejudge.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--workers")
    .scan<'d', int>()
    .help("Number of judge workers");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--workers")) {
    processor_opt.workers = val.value();
  }
  to_lock = parser["--no-lock"] == false;
  // one uid per concurrently running sandbox; inline runs need one more each
  executor_opt.uid_pool_size = std::max(executor_opt.uid_pool_size, processor_opt.workers * 2);
}

bool LockFile() {
  fs::path lock_file = internal::kDataDir / "lock";
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

void HandleSignal(int) {
  if (running_dispatcher) running_dispatcher->Stop();
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  ParseArgs(argc, argv);
  if (to_lock && !LockFile()) {
    spdlog::error("Another judge instance is running.");
    return 1;
  }

  SqliteStore store(database_path);
  SandboxedExecutor executor(executor_opt);
  Judge judge(executor, max_score);
  Dispatcher dispatcher(store, dispatcher_opt);
  processor_opt.on_finalized = [&dispatcher](long id, std::optional<SubmissionStatus> status) {
    dispatcher.Finalized(id, status);
  };
  SubmissionProcessor processor(store, store, judge, processor_opt);

  running_dispatcher = &dispatcher;
  struct sigaction act{};
  act.sa_handler = HandleSignal;
  sigemptyset(&act.sa_mask);
  sigaction(SIGINT, &act, nullptr);
  sigaction(SIGTERM, &act, nullptr);

  processor.Start();
  dispatcher.Run(processor);
  processor.Stop();
  running_dispatcher = nullptr;
  auto stats = processor.GetStats();
  spdlog::info("Judge exited: submitted={} queued={} ran_inline={} finished={} system_errors={}",
               stats.submitted, stats.queued, stats.ran_inline, stats.finished, stats.system_errors);
}
