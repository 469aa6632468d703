#include "broadcaster.hpp"
#include <atomic>
#include <iostream>

namespace chanflow {

static std::atomic<bool> g_broadcast_debug{false};

void set_broadcast_debug(bool enabled) {
    g_broadcast_debug.store(enabled);
}

namespace detail {

bool broadcast_debug() {
    return g_broadcast_debug.load();
}

void log_subscriber_change(const std::string& label, const std::string& topic,
                           const char* what, size_t count) {
    if (!broadcast_debug()) return;
    std::cerr << "[" << label << "] Subscriber " << what << " " << topic
              << ", subscribers: " << count << "\n";
}

void log_publish(const std::string& label, const std::string& topic, size_t count) {
    if (!broadcast_debug()) return;
    std::cerr << "[" << label << "] Publishing to " << topic
              << ", subscribers: " << count << "\n";
}

void log_inbox_full(const std::string& label, const std::string& topic) {
    std::cerr << "[" << label << "] Subscriber inbox full on " << topic
              << ", dropping event\n";
}

} // namespace detail

ChannelBroadcaster::ChannelBroadcaster(size_t inbox_capacity)
    : topics_(inbox_capacity, "channels")
{}

Subscription<ChannelEvent> ChannelBroadcaster::subscribe() {
    return topics_.subscribe(kChannelListTopic);
}

size_t ChannelBroadcaster::publish(const ChannelEvent& event) {
    return topics_.publish(kChannelListTopic, event);
}

size_t ChannelBroadcaster::publish_update(ChannelEventType type,
                                          const std::string& chat_key,
                                          std::optional<std::string> channel_name,
                                          std::optional<bool> is_active) {
    ChannelEvent event;
    event.type = type;
    event.chat_key = chat_key;
    event.channel_name = std::move(channel_name);
    event.is_active = is_active;
    return publish(event);
}

size_t ChannelBroadcaster::subscriber_count() const {
    return topics_.subscriber_count(kChannelListTopic);
}

} // namespace chanflow
