#include <datajail/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// A child forked while another thread holds the console mutex would deadlock on its
// first log call.
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
