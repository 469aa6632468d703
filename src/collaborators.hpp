#pragma once
#include "chat_message.hpp"
#include "cancel_token.hpp"
#include <string>

namespace chanflow {

// Runs the agent for one channel. May be slow, may throw on transient
// failure (the scheduler retries), and should throw RunCancelled once it
// observes `token` cancelled.
class AgentRunner {
public:
    virtual ~AgentRunner() = default;

    virtual void run(const std::string& chat_key,
                     const ChatMessage& message,
                     const CancelToken& token) = 0;
};

// Stops the sandbox container backing a channel. Best-effort and idempotent.
// Returns true if something was actually stopped.
class SandboxController {
public:
    virtual ~SandboxController() = default;
    virtual bool stop(const std::string& chat_key) = 0;
};

// Toggles a "working on it" indicator for a message (e.g. a reaction emoji).
class PresenceHook {
public:
    virtual ~PresenceHook() = default;
    virtual void set_active(const ChatMessage& message, bool active) = 0;
};

} // namespace chanflow
