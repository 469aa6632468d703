#include "cancel_token.hpp"

namespace chanflow {

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancelToken::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void CancelToken::throw_if_cancelled() const {
    if (cancelled()) throw RunCancelled();
}

void CancelToken::sleep_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, duration, [this] { return cancelled_; });
    if (cancelled_) throw RunCancelled();
}

} // namespace chanflow
