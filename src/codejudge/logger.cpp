#include <codejudge/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// The sandbox launcher forks from worker threads; the console mutex held by
// another thread at that moment would stay locked forever in the child.
// All color console sinks share this one mutex.
void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Child() {
  spdlog::details::console_mutex::mutex().unlock();
}

void Parent() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}
