#include "cancellation.h"

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}

CancellationWatcher::CancellationWatcher(CancellationToken& token, std::function<bool()> trigger,
                                         std::chrono::milliseconds interval)
    : thread_([this, &token, trigger = std::move(trigger), interval]() {
          while (!stop_.isCancelled()) {
              if (trigger()) {
                  token.cancel();
                  return;
              }
              stop_.sleepFor(interval);
          }
      }) {}

CancellationWatcher::~CancellationWatcher() {
    stop_.cancel();
    thread_.join();
}
