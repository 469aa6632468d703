#include "chat_message.hpp"
#include <stdexcept>

namespace chanflow {

ChatMessage ChatMessage::empty(const std::string& chat_key) {
    ChatMessage msg;
    msg.chat_key = chat_key;
    return msg;
}

const char* channel_event_type_name(ChannelEventType type) {
    switch (type) {
        case ChannelEventType::Created:     return "created";
        case ChannelEventType::Updated:     return "updated";
        case ChannelEventType::Deleted:     return "deleted";
        case ChannelEventType::Activated:   return "activated";
        case ChannelEventType::Deactivated: return "deactivated";
    }
    return "updated";
}

std::optional<ChannelEventType> parse_channel_event_type(const std::string& name) {
    if (name == "created")     return ChannelEventType::Created;
    if (name == "updated")     return ChannelEventType::Updated;
    if (name == "deleted")     return ChannelEventType::Deleted;
    if (name == "activated")   return ChannelEventType::Activated;
    if (name == "deactivated") return ChannelEventType::Deactivated;
    return std::nullopt;
}

nlohmann::json message_to_json(const ChatMessage& msg) {
    return {
        {"message_id", msg.message_id},
        {"chat_key", msg.chat_key},
        {"sender_id", msg.sender_id},
        {"sender_name", msg.sender_name},
        {"content_text", msg.content_text},
        {"is_tome", msg.is_tome},
        {"timestamp", msg.timestamp}
    };
}

ChatMessage message_from_json(const nlohmann::json& item) {
    ChatMessage msg;
    msg.message_id = item.value("message_id", "");
    msg.chat_key = item.value("chat_key", "");
    msg.sender_id = item.value("sender_id", "");
    msg.sender_name = item.value("sender_name", "");
    msg.content_text = item.value("content_text", "");
    msg.is_tome = item.value("is_tome", false);
    msg.timestamp = item.value("timestamp", uint64_t{0});
    return msg;
}

nlohmann::json channel_event_to_json(const ChannelEvent& ev) {
    nlohmann::json item = {
        {"event_type", channel_event_type_name(ev.type)},
        {"chat_key", ev.chat_key},
        {"channel_name", nullptr},
        {"is_active", nullptr}
    };
    if (ev.channel_name) item["channel_name"] = *ev.channel_name;
    if (ev.is_active) item["is_active"] = *ev.is_active;
    return item;
}

ChannelEvent channel_event_from_json(const nlohmann::json& item) {
    std::string type_name = item.value("event_type", "");
    auto type = parse_channel_event_type(type_name);
    if (!type) {
        throw std::invalid_argument("Unknown channel event type: " + type_name);
    }

    ChannelEvent ev;
    ev.type = *type;
    ev.chat_key = item.value("chat_key", "");
    if (item.contains("channel_name") && item["channel_name"].is_string())
        ev.channel_name = item["channel_name"].get<std::string>();
    if (item.contains("is_active") && item["is_active"].is_boolean())
        ev.is_active = item["is_active"].get<bool>();
    return ev;
}

} // namespace chanflow
