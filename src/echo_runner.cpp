#include "echo_runner.hpp"
#include "util.hpp"
#include <iostream>

namespace chanflow {

EchoAgentRunner::EchoAgentRunner(MessageBroadcaster& messages,
                                 std::chrono::milliseconds work,
                                 DateSource today)
    : messages_(messages), work_(work),
      today_(today ? std::move(today) : DateSource(local_date_today))
{}

void EchoAgentRunner::run(const std::string& chat_key,
                          const ChatMessage& message,
                          const CancelToken& token) {
    token.sleep_for(work_);

    ChatMessage reply;
    reply.message_id = generate_id();
    reply.chat_key = chat_key;
    reply.sender_id = "-1";
    reply.sender_name = "chanflow";
    reply.content_text = message.is_empty()
        ? std::string("(woke up without a message)")
        : "echo: " + message.content_text;
    reply.timestamp = epoch_seconds();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++replies_[today_() + "|" + chat_key];
    }
    std::cout << "[" << chat_key << "] " << reply.content_text << "\n" << std::flush;
    messages_.publish(chat_key, reply);
}

int64_t EchoAgentRunner::daily_replies(const std::string& chat_key) const {
    std::string key = today_() + "|" + chat_key;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = replies_.find(key);
    return it == replies_.end() ? 0 : it->second;
}

} // namespace chanflow
