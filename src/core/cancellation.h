#ifndef CANCELLATION_H
#define CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// Shared cooperative cancellation flag.
// Workers poll isCancelled() between steps; sleepFor() wakes early on cancel().
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool isCancelled() const { return cancelled_.load(); }

    // Sleep up to duration. Returns false if cancelled before or during the sleep
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

// Polls trigger on its own thread and cancels the token the first time it
// returns true. The thread is stopped and joined when the watcher goes out of
// scope, including during stack unwinding.
class CancellationWatcher {
public:
    CancellationWatcher(CancellationToken& token, std::function<bool()> trigger,
                        std::chrono::milliseconds interval = std::chrono::milliseconds(100));
    ~CancellationWatcher();

    CancellationWatcher(const CancellationWatcher&) = delete;
    CancellationWatcher& operator=(const CancellationWatcher&) = delete;

private:
    CancellationToken stop_;
    std::thread thread_;
};

#endif // CANCELLATION_H
