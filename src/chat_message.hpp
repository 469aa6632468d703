#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

namespace chanflow {

// One inbound chat message, as handed over by a platform adapter.
// This is the event the scheduler coalesces and the message topic carries.
struct ChatMessage {
    std::string message_id;
    std::string chat_key;
    std::string sender_id;
    std::string sender_name;
    std::string content_text;
    bool is_tome = false;     // addressed to the bot
    uint64_t timestamp = 0;   // epoch seconds

    // Content-less trigger: asks the agent to run for a channel
    // without a specific inbound message.
    static ChatMessage empty(const std::string& chat_key);

    bool is_empty() const { return message_id.empty() && content_text.empty(); }
};

enum class ChannelEventType { Created, Updated, Deleted, Activated, Deactivated };

const char* channel_event_type_name(ChannelEventType type);

// Returns nullopt for unknown names
std::optional<ChannelEventType> parse_channel_event_type(const std::string& name);

// Channel-list change record published on the global channel topic.
struct ChannelEvent {
    ChannelEventType type = ChannelEventType::Updated;
    std::string chat_key;
    std::optional<std::string> channel_name;
    std::optional<bool> is_active;
};

// JSON forms for collaborators that serialise onto a transport.
nlohmann::json message_to_json(const ChatMessage& msg);
ChatMessage message_from_json(const nlohmann::json& item);

nlohmann::json channel_event_to_json(const ChannelEvent& ev);
// Throws std::invalid_argument on an unknown event type
ChannelEvent channel_event_from_json(const nlohmann::json& item);

} // namespace chanflow
