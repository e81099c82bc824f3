#include <fluxflow/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// every console sink shares this mutex; a child forked while another thread
// holds it would deadlock on its first log line
using ConsoleMutex = spdlog::details::console_mutex;

void Prepare() {
  ConsoleMutex::mutex().lock();
}

void Parent() {
  ConsoleMutex::mutex().unlock();
}

void Child() {
  ConsoleMutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}
