#pragma once
#include "collaborators.hpp"
#include "broadcaster.hpp"
#include "quota.hpp"
#include <string>
#include <mutex>
#include <chrono>
#include <unordered_map>
#include <cstdint>

namespace chanflow {

// Demo agent for the driver: waits `work` (cancellable), then publishes a
// reply on the channel's message topic and counts it against today's limit.
class EchoAgentRunner : public AgentRunner {
public:
    EchoAgentRunner(MessageBroadcaster& messages, std::chrono::milliseconds work,
                    DateSource today = {});

    void run(const std::string& chat_key,
             const ChatMessage& message,
             const CancelToken& token) override;

    // Replies sent today for chat_key
    int64_t daily_replies(const std::string& chat_key) const;

private:
    MessageBroadcaster& messages_;
    std::chrono::milliseconds work_;
    DateSource today_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, int64_t> replies_; // "date|chat_key" -> count
};

} // namespace chanflow
