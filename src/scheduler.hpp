#pragma once
#include "chat_message.hpp"
#include "collaborators.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <cstddef>

namespace chanflow {

enum class ChannelState { Idle, Debouncing, Running };

const char* channel_state_name(ChannelState state);

struct ChannelStatus {
    ChannelState state = ChannelState::Idle;
    bool has_pending = false;
};

// Debounced, single-flight agent scheduling per channel.
//
// Each channel gets one worker thread that loops: wait for a submission,
// wait out the debounce window (restarting it whenever a newer submission
// arrives), then run the agent with the latest pending message. Messages
// that arrive while a run is in flight replace the pending slot and are
// picked up as soon as the run completes, without another debounce wait.
class ChannelScheduler {
public:
    // Throws std::invalid_argument if config.max_attempts is zero.
    ChannelScheduler(AgentRunner& runner, SchedulerConfig config);
    ~ChannelScheduler();

    ChannelScheduler(const ChannelScheduler&) = delete;
    ChannelScheduler& operator=(const ChannelScheduler&) = delete;

    // Optional collaborators (non-owning, nullptr = disabled).
    // Set before the first submit().
    void set_sandbox_controller(SandboxController* sandbox) { sandbox_ = sandbox; }
    void set_presence_hook(PresenceHook* presence) { presence_ = presence; }

    // Record `message` as the pending message of message.chat_key and
    // (re)start the debounce window. Never blocks on the agent.
    void submit(const ChatMessage& message);

    // Submit a content-less trigger for chat_key.
    void trigger(const std::string& chat_key);

    // Disarm the debounce window, stop the channel's sandbox and cancel the
    // in-flight run, waiting for its completion. The pending message is kept.
    // Returns true if anything was stopped. Must not be called from inside
    // AgentRunner::run for the same channel.
    bool cancel(const std::string& chat_key);

    ChannelStatus status(const std::string& chat_key) const;
    bool is_running(const std::string& chat_key) const;
    bool has_pending(const std::string& chat_key) const;

    // Known channel keys (order unspecified)
    std::vector<std::string> channel_keys() const;

    // Drop state for channels that are idle with nothing pending.
    // Returns the number of channels evicted.
    size_t evict_idle();

    // Cancel all runs and join all workers. Later submissions are ignored.
    void shutdown();

private:
    struct ChannelSlot;

    std::shared_ptr<ChannelSlot> slot_for(const std::string& chat_key);
    std::shared_ptr<ChannelSlot> find_slot(const std::string& chat_key) const;

    void worker_loop(ChannelSlot& slot);
    void execute(const std::string& chat_key, const ChatMessage& message,
                 const CancelToken& token);
    void run_with_retry(const std::string& chat_key, const ChatMessage& message,
                        const CancelToken& token);
    void set_presence(const ChatMessage& message, bool active);

    AgentRunner& runner_;
    SchedulerConfig config_;
    SandboxController* sandbox_ = nullptr;
    PresenceHook* presence_ = nullptr;

    mutable std::mutex mutex_;  // guards slots_ and shut_down_ only
    std::unordered_map<std::string, std::shared_ptr<ChannelSlot>> slots_;
    bool shut_down_ = false;
};

} // namespace chanflow
