#include "scheduler.hpp"
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <thread>

namespace chanflow {

const char* channel_state_name(ChannelState state) {
    switch (state) {
        case ChannelState::Idle:       return "idle";
        case ChannelState::Debouncing: return "debouncing";
        case ChannelState::Running:    return "running";
    }
    return "idle";
}

// Per-channel state. Everything below `mutex` is guarded by it.
struct ChannelScheduler::ChannelSlot {
    std::string chat_key;
    std::chrono::milliseconds debounce{0};
    std::thread worker;

    std::mutex mutex;
    std::condition_variable cv;

    std::optional<ChatMessage> pending;
    uint64_t debounce_stamp = 0;
    std::chrono::steady_clock::time_point requested_at;
    bool debounce_armed = false;

    bool running = false;
    std::shared_ptr<CancelToken> token;
    uint64_t runs_started = 0;
    uint64_t runs_finished = 0;

    bool stopping = false;
};

ChannelScheduler::ChannelScheduler(AgentRunner& runner, SchedulerConfig config)
    : runner_(runner), config_(std::move(config)) {
    if (config_.max_attempts == 0) {
        throw std::invalid_argument("ChannelScheduler requires max_attempts >= 1");
    }
}

ChannelScheduler::~ChannelScheduler() {
    shutdown();
}

std::shared_ptr<ChannelScheduler::ChannelSlot>
ChannelScheduler::slot_for(const std::string& chat_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) return nullptr;

    auto it = slots_.find(chat_key);
    if (it != slots_.end()) return it->second;

    auto slot = std::make_shared<ChannelSlot>();
    slot->chat_key = chat_key;
    slot->debounce = config_.debounce_for(chat_key);
    ChannelSlot* raw = slot.get();
    slot->worker = std::thread([this, raw]() { worker_loop(*raw); });
    slots_.emplace(chat_key, slot);
    return slot;
}

std::shared_ptr<ChannelScheduler::ChannelSlot>
ChannelScheduler::find_slot(const std::string& chat_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(chat_key);
    if (it == slots_.end()) return nullptr;
    return it->second;
}

void ChannelScheduler::submit(const ChatMessage& message) {
    if (message.chat_key.empty()) {
        std::cerr << "[scheduler] Refusing to schedule a message without chat_key\n";
        return;
    }

    for (;;) {
        auto slot = slot_for(message.chat_key);
        if (!slot) {
            std::cerr << "[scheduler] Shut down, dropping message for "
                      << message.chat_key << "\n";
            return;
        }

        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->stopping) continue; // evicted under us; look up again

        slot->pending = message;
        ++slot->debounce_stamp;
        slot->requested_at = std::chrono::steady_clock::now();
        // A running task picks the pending message up on completion
        if (!slot->running) slot->debounce_armed = true;
        slot->cv.notify_all();
        return;
    }
}

void ChannelScheduler::trigger(const std::string& chat_key) {
    if (chat_key.empty()) {
        std::cerr << "[scheduler] Cannot trigger agent: empty chat_key\n";
        return;
    }
    submit(ChatMessage::empty(chat_key));
}

void ChannelScheduler::worker_loop(ChannelSlot& slot) {
    std::unique_lock<std::mutex> lock(slot.mutex);
    std::optional<ChatMessage> next; // set when re-chaining after a run

    for (;;) {
        if (!next) {
            slot.cv.wait(lock, [&slot] { return slot.stopping || slot.debounce_armed; });
            if (slot.stopping) return;

            uint64_t stamp = slot.debounce_stamp;
            auto deadline = slot.requested_at + slot.debounce;
            bool interrupted = slot.cv.wait_until(lock, deadline, [&slot, stamp] {
                return slot.stopping || !slot.debounce_armed ||
                       slot.debounce_stamp != stamp;
            });
            if (slot.stopping) return;
            // Newer submission restarts the window; cancel() disarms it
            if (interrupted) continue;

            slot.debounce_armed = false;
            if (!slot.pending) continue;
            next = std::move(slot.pending);
            slot.pending.reset();
        }

        ChatMessage message = std::move(*next);
        next.reset();
        auto token = std::make_shared<CancelToken>();
        slot.running = true;
        slot.token = token;
        uint64_t run_id = ++slot.runs_started;

        lock.unlock();
        execute(slot.chat_key, message, *token);
        lock.lock();

        // Completion: runs after success, failure and cancellation alike
        slot.running = false;
        slot.token.reset();
        slot.runs_finished = run_id;
        slot.debounce_armed = false;
        if (slot.pending && !slot.stopping) {
            if (token->cancelled()) {
                std::cerr << "[scheduler] Run for " << slot.chat_key
                          << " was cancelled, continuing with pending message\n";
            }
            next = std::move(slot.pending);
            slot.pending.reset();
        }
        slot.cv.notify_all();
        if (slot.stopping) return;
    }
}

void ChannelScheduler::execute(const std::string& chat_key,
                               const ChatMessage& message,
                               const CancelToken& token) {
    std::cerr << "[scheduler] Running agent for " << chat_key << "\n";
    set_presence(message, true);
    try {
        run_with_retry(chat_key, message, token);
    } catch (const RunCancelled&) {
        std::cerr << "[scheduler] Agent run for " << chat_key << " cancelled\n";
    }
    set_presence(message, false);
}

void ChannelScheduler::run_with_retry(const std::string& chat_key,
                                      const ChatMessage& message,
                                      const CancelToken& token) {
    std::string last_error;
    for (uint32_t attempt = 1; attempt <= config_.max_attempts; ++attempt) {
        token.throw_if_cancelled();
        try {
            runner_.run(chat_key, message, token);
            return;
        } catch (const RunCancelled&) {
            throw;
        } catch (const std::exception& e) {
            last_error = e.what();
            std::cerr << "[scheduler] Agent for " << chat_key
                      << " attempt " << attempt << "/" << config_.max_attempts
                      << " failed: " << last_error << '\n';
        }
    }
    std::cerr << "[scheduler] Failed to run agent for " << chat_key
              << " after " << config_.max_attempts
              << " attempts. Last error: " << last_error << '\n';
}

void ChannelScheduler::set_presence(const ChatMessage& message, bool active) {
    if (!presence_ || message.is_empty() || message.message_id.empty()) return;
    try {
        presence_->set_active(message, active);
    } catch (const std::exception& e) {
        std::cerr << "[scheduler] Presence hook failed for " << message.chat_key
                  << ": " << e.what() << '\n';
    }
}

bool ChannelScheduler::cancel(const std::string& chat_key) {
    auto slot = find_slot(chat_key);
    bool stopped = false;

    // Only the debounce bookkeeping goes; the pending message stays
    if (slot) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->debounce_armed = false;
        slot->cv.notify_all();
    }

    if (sandbox_) {
        try {
            if (sandbox_->stop(chat_key)) {
                std::cerr << "[scheduler] Stopped sandbox for " << chat_key << "\n";
                stopped = true;
            }
        } catch (const std::exception& e) {
            std::cerr << "[scheduler] Sandbox stop failed for " << chat_key
                      << ": " << e.what() << '\n';
        }
    }

    if (slot) {
        std::unique_lock<std::mutex> lock(slot->mutex);
        if (slot->running) {
            uint64_t run_id = slot->runs_started;
            slot->token->cancel();
            slot->cv.wait(lock, [&slot, run_id] { return slot->runs_finished >= run_id; });
            std::cerr << "[scheduler] Cancelled agent task for " << chat_key << "\n";
            stopped = true;
        }
    }

    return stopped;
}

ChannelStatus ChannelScheduler::status(const std::string& chat_key) const {
    ChannelStatus st;
    auto slot = find_slot(chat_key);
    if (!slot) return st;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->running) {
        st.state = ChannelState::Running;
    } else if (slot->debounce_armed) {
        st.state = ChannelState::Debouncing;
    }
    st.has_pending = slot->pending.has_value();
    return st;
}

bool ChannelScheduler::is_running(const std::string& chat_key) const {
    return status(chat_key).state == ChannelState::Running;
}

bool ChannelScheduler::has_pending(const std::string& chat_key) const {
    return status(chat_key).has_pending;
}

std::vector<std::string> ChannelScheduler::channel_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(slots_.size());
    for (const auto& [key, _] : slots_) {
        keys.push_back(key);
    }
    return keys;
}

size_t ChannelScheduler::evict_idle() {
    std::vector<std::shared_ptr<ChannelSlot>> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = slots_.begin(); it != slots_.end(); ) {
            auto& slot = it->second;
            std::lock_guard<std::mutex> slot_lock(slot->mutex);
            if (!slot->running && !slot->debounce_armed && !slot->pending) {
                slot->stopping = true;
                slot->cv.notify_all();
                evicted.push_back(slot);
                it = slots_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& slot : evicted) {
        if (slot->worker.joinable()) slot->worker.join();
    }
    return evicted.size();
}

void ChannelScheduler::shutdown() {
    std::vector<std::shared_ptr<ChannelSlot>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
        all.reserve(slots_.size());
        for (auto& [key, slot] : slots_) {
            all.push_back(slot);
        }
        slots_.clear();
    }

    for (auto& slot : all) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->stopping = true;
        slot->debounce_armed = false;
        if (slot->token) slot->token->cancel();
        slot->cv.notify_all();
    }
    for (auto& slot : all) {
        if (slot->worker.joinable()) slot->worker.join();
    }
}

} // namespace chanflow
