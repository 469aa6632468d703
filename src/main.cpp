#include "config.hpp"
#include "scheduler.hpp"
#include "broadcaster.hpp"
#include "quota.hpp"
#include "echo_runner.hpp"
#include "chat_message.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <memory>
#include <vector>
#include <chrono>
#include <optional>

namespace {

void print_usage() {
    std::cout << "Usage: chanflow [options]\n"
              << "\n"
              << "Options:\n"
              << "  --debounce MS        Debounce window in milliseconds\n"
              << "  --attempts N         Agent attempts per run\n"
              << "  --work MS            Simulated agent latency (default 2000)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Input lines of the form '<chat_key>: <text>' are scheduled.\n"
              << "Type /help for commands.\n"
              << "\n"
              << "Environment variables:\n"
              << "  CHANFLOW_DEBOUNCE_MS         Debounce window override\n"
              << "  CHANFLOW_MAX_ATTEMPTS        Attempts per run override\n"
              << "  CHANFLOW_INBOX_CAPACITY      Message inbox capacity override\n"
              << "  CHANFLOW_DAILY_REPLY_LIMIT   Daily reply limit override\n";
}

void print_help() {
    std::cout << "Commands:\n"
              << "  <key>: <text>        Submit a message for channel <key>\n"
              << "  /trigger <key>       Run the agent without a message\n"
              << "  /cancel <key>        Cancel the running task\n"
              << "  /status [key]        Show channel state\n"
              << "  /boost <key> <n>     Add n to today's reply boost\n"
              << "  /setboost <key> <n>  Set today's reply boost\n"
              << "  /clearboost <key>    Remove the reply boost\n"
              << "  /watch <key>         Print messages published on <key>\n"
              << "  /channels            Print channel-list events\n"
              << "  /channel <type> <key>  Publish a channel-list event\n"
              << "  /evict               Drop idle channel state\n"
              << "  /quit                Exit\n";
}

bool parse_int(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (*end != '\0') return false;
    out = v;
    return true;
}

void print_status(const chanflow::ChannelScheduler& scheduler,
                  const chanflow::DailyQuota& quota,
                  const chanflow::EchoAgentRunner& runner,
                  const chanflow::Config& config,
                  const std::string& key) {
    auto st = scheduler.status(key);
    std::cout << key << ": " << chanflow::channel_state_name(st.state)
              << (st.has_pending ? " (pending message)" : "")
              << " | replies today: " << runner.daily_replies(key);
    if (config.quota.daily_reply_limit > 0) {
        std::cout << "/" << quota.effective_limit(key, config.quota.daily_reply_limit);
    }
    std::cout << " | boost: " << quota.get_boost(key) << "\n";
}

} // namespace

int main(int argc, char* argv[]) try {
    int64_t debounce_ms = -1;
    int64_t attempts = -1;
    int64_t work_ms = 2000;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--debounce") == 0 && i + 1 < argc) {
            if (!parse_int(argv[++i], debounce_ms) || debounce_ms < 0) {
                std::cerr << "Invalid --debounce value: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--attempts") == 0 && i + 1 < argc) {
            if (!parse_int(argv[++i], attempts) || attempts < 1) {
                std::cerr << "Invalid --attempts value: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--work") == 0 && i + 1 < argc) {
            if (!parse_int(argv[++i], work_ms) || work_ms < 0) {
                std::cerr << "Invalid --work value: " << argv[i] << "\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = chanflow::Config::load();
    if (debounce_ms >= 0) config.scheduler.debounce_ms = static_cast<uint32_t>(debounce_ms);
    if (attempts > 0) config.scheduler.max_attempts = static_cast<uint32_t>(attempts);
    chanflow::set_broadcast_debug(config.verbose);

    chanflow::MessageBroadcaster messages(config.broadcast.message_inbox_capacity, "messages");
    chanflow::ChannelBroadcaster channels(config.broadcast.channel_inbox_capacity);
    chanflow::DailyQuota quota;
    chanflow::EchoAgentRunner runner(messages, std::chrono::milliseconds(work_ms));
    chanflow::ChannelScheduler scheduler(runner, config.scheduler);

    // Destroyed before the scheduler and broadcasters, also on unwind
    std::vector<std::unique_ptr<chanflow::SubscriptionReader<chanflow::ChatMessage>>> watchers;
    std::vector<std::unique_ptr<chanflow::SubscriptionReader<chanflow::ChannelEvent>>> channel_watchers;

    std::cout << "chanflow scheduler\n"
              << "Debounce: " << config.scheduler.debounce_ms << " ms"
              << " | Attempts: " << config.scheduler.max_attempts << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (true) {
        std::cout << "chanflow> " << std::flush;

        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }

        line = chanflow::trim(line);
        if (line.empty()) continue;

        if (line[0] == '/') {
            auto parts = chanflow::split(line, ' ');
            const std::string& cmd = parts[0];
            if (cmd == "/quit" || cmd == "/exit") {
                break;
            } else if (cmd == "/help") {
                print_help();
            } else if (cmd == "/trigger" && parts.size() >= 2) {
                scheduler.trigger(parts[1]);
            } else if (cmd == "/cancel" && parts.size() >= 2) {
                bool stopped = scheduler.cancel(parts[1]);
                std::cout << (stopped ? "Stopped " : "Nothing running for ") << parts[1] << "\n";
            } else if (cmd == "/status") {
                if (parts.size() >= 2) {
                    print_status(scheduler, quota, runner, config, parts[1]);
                } else {
                    auto keys = scheduler.channel_keys();
                    if (keys.empty()) std::cout << "No channels.\n";
                    for (const auto& key : keys) {
                        print_status(scheduler, quota, runner, config, key);
                    }
                }
            } else if ((cmd == "/boost" || cmd == "/setboost") && parts.size() >= 3) {
                int64_t amount = 0;
                if (!parse_int(parts[2], amount)) {
                    std::cout << "Invalid amount: " << parts[2] << "\n";
                    continue;
                }
                if (cmd == "/boost") {
                    std::cout << "Boost for " << parts[1] << ": "
                              << quota.add_boost(parts[1], amount) << "\n";
                } else {
                    quota.set_boost(parts[1], amount);
                    std::cout << "Boost for " << parts[1] << ": " << amount << "\n";
                }
            } else if (cmd == "/clearboost" && parts.size() >= 2) {
                quota.clear_boost(parts[1]);
                std::cout << "Boost cleared for " << parts[1] << "\n";
            } else if (cmd == "/watch" && parts.size() >= 2) {
                std::string topic = parts[1];
                watchers.push_back(
                    std::make_unique<chanflow::SubscriptionReader<chanflow::ChatMessage>>(
                        messages.subscribe(topic),
                        [topic](const chanflow::ChatMessage& msg) {
                            std::cout << "[watch " << topic << "] "
                                      << chanflow::message_to_json(msg).dump() << "\n"
                                      << std::flush;
                        }));
                std::cout << "Watching " << parts[1] << " ("
                          << messages.subscriber_count(parts[1]) << " subscribers)\n";
            } else if (cmd == "/channels") {
                channel_watchers.push_back(
                    std::make_unique<chanflow::SubscriptionReader<chanflow::ChannelEvent>>(
                        channels.subscribe(),
                        [](const chanflow::ChannelEvent& ev) {
                            std::cout << "[channels] "
                                      << chanflow::channel_event_to_json(ev).dump() << "\n"
                                      << std::flush;
                        }));
            } else if (cmd == "/channel" && parts.size() >= 3) {
                auto type = chanflow::parse_channel_event_type(parts[1]);
                if (!type) {
                    std::cout << "Unknown event type: " << parts[1] << "\n";
                    continue;
                }
                std::optional<bool> active;
                if (*type == chanflow::ChannelEventType::Activated) active = true;
                if (*type == chanflow::ChannelEventType::Deactivated) active = false;
                size_t n = channels.publish_update(*type, parts[2], std::nullopt, active);
                std::cout << "Delivered to " << n << " subscribers\n";
            } else if (cmd == "/evict") {
                std::cout << "Evicted " << scheduler.evict_idle() << " idle channels\n";
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            std::cout << "Expected '<chat_key>: <text>'\n";
            continue;
        }

        chanflow::ChatMessage msg;
        msg.message_id = chanflow::generate_id();
        msg.chat_key = chanflow::trim(line.substr(0, colon));
        msg.sender_id = "console";
        msg.sender_name = "console";
        msg.content_text = chanflow::trim(line.substr(colon + 1));
        msg.is_tome = true;
        msg.timestamp = chanflow::epoch_seconds();

        messages.publish(msg.chat_key, msg);

        if (!config.quota.is_whitelisted(msg.sender_id) &&
            quota.limit_reached(msg.chat_key, runner.daily_replies(msg.chat_key),
                                config.quota.daily_reply_limit)) {
            std::cout << "Daily reply limit reached for " << msg.chat_key << " ("
                      << runner.daily_replies(msg.chat_key) << "/"
                      << quota.effective_limit(msg.chat_key, config.quota.daily_reply_limit)
                      << ")\n";
            continue;
        }
        scheduler.submit(msg);
    }

    scheduler.shutdown();
    watchers.clear();
    channel_watchers.clear();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
