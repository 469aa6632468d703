#pragma once
#include <stdexcept>
#include <string>
#include <mutex>
#include <condition_variable>
#include <chrono>

namespace chanflow {

// Raised when a run observes cancellation. Distinct from ordinary failures:
// the scheduler never retries it.
class RunCancelled : public std::runtime_error {
public:
    explicit RunCancelled(const std::string& what = "run cancelled")
        : std::runtime_error(what) {}
};

// Cooperative cancellation flag shared between the scheduler and a run.
// Runners check it at their own suspension points.
class CancelToken {
public:
    void cancel();
    bool cancelled() const;

    // Throws RunCancelled if cancel() has been called.
    void throw_if_cancelled() const;

    // Sleep for up to `duration`, waking early on cancel().
    // Throws RunCancelled if cancelled before or during the sleep.
    void sleep_for(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

} // namespace chanflow
