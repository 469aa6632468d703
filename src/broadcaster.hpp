#pragma once
#include "chat_message.hpp"
#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <unordered_map>
#include <algorithm>
#include <optional>
#include <chrono>
#include <cstddef>
#include <functional>
#include <thread>

namespace chanflow {

// Enables debug-level subscribe/unsubscribe/publish lines on stderr.
void set_broadcast_debug(bool enabled);

namespace detail {
bool broadcast_debug();
void log_subscriber_change(const std::string& label, const std::string& topic,
                           const char* what, size_t count);
void log_publish(const std::string& label, const std::string& topic, size_t count);
void log_inbox_full(const std::string& label, const std::string& topic);
} // namespace detail

enum class PushResult { Accepted, Full, Closed };

// Bounded FIFO owned by one subscriber. Pushes never block.
template <typename E>
class Inbox {
public:
    explicit Inbox(size_t capacity) : capacity_(capacity) {}

    PushResult try_push(const E& event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return PushResult::Closed;
            if (queue_.size() >= capacity_) {
                ++dropped_;
                return PushResult::Full;
            }
            queue_.push_back(event);
        }
        cv_.notify_one();
        return PushResult::Accepted;
    }

    // Blocks until an event arrives; nullopt once closed
    std::optional<E> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return take_locked();
    }

    std::optional<E> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return take_locked();
    }

    std::optional<E> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            queue_.clear();
        }
        cv_.notify_all();
    }

    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    std::optional<E> take_locked() {
        if (closed_ || queue_.empty()) return std::nullopt;
        E event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<E> queue_;
    size_t dropped_ = 0;
    bool closed_ = false;
};

namespace detail {

// topic -> inboxes. Shared between a broadcaster and its subscriptions so a
// subscription can outlive the broadcaster safely.
template <typename E>
struct TopicTable {
    std::mutex mutex;
    std::unordered_map<std::string, std::vector<std::shared_ptr<Inbox<E>>>> topics;
    std::string label;

    size_t add(const std::string& topic, std::shared_ptr<Inbox<E>> inbox) {
        std::lock_guard<std::mutex> lock(mutex);
        auto& subs = topics[topic];
        subs.push_back(std::move(inbox));
        return subs.size();
    }

    // Returns the remaining subscriber count; erases empty topics
    size_t remove(const std::string& topic, const Inbox<E>* inbox) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = topics.find(topic);
        if (it == topics.end()) return 0;
        auto& subs = it->second;
        subs.erase(std::remove_if(subs.begin(), subs.end(),
                                  [inbox](const auto& s) { return s.get() == inbox; }),
                   subs.end());
        size_t remaining = subs.size();
        if (subs.empty()) topics.erase(it);
        return remaining;
    }
};

} // namespace detail

// Consumer handle for one topic. Cancelling (or destroying) it unregisters
// the inbox and wakes a blocked reader.
template <typename E>
class Subscription {
public:
    Subscription(std::weak_ptr<detail::TopicTable<E>> table, std::string topic,
                 std::shared_ptr<Inbox<E>> inbox)
        : table_(std::move(table)), topic_(std::move(topic)), inbox_(std::move(inbox)) {}

    ~Subscription() { cancel(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : table_(std::move(other.table_)),
          topic_(std::move(other.topic_)),
          inbox_(std::move(other.inbox_)) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            cancel();
            std::lock_guard<std::mutex> lock(mutex_);
            table_ = std::move(other.table_);
            topic_ = std::move(other.topic_);
            inbox_ = std::move(other.inbox_);
        }
        return *this;
    }

    // Next event; blocks. nullopt once cancelled.
    std::optional<E> next() {
        if (!inbox_) return std::nullopt;
        return inbox_->pop();
    }

    std::optional<E> next_for(std::chrono::milliseconds timeout) {
        if (!inbox_) return std::nullopt;
        return inbox_->pop_for(timeout);
    }

    std::optional<E> try_next() {
        if (!inbox_) return std::nullopt;
        return inbox_->try_pop();
    }

    // Safe to call from several threads at once, including while a reader
    // is blocked in next(). Must not race the destructor.
    void cancel() {
        if (!inbox_) return;
        inbox_->close();
        std::shared_ptr<detail::TopicTable<E>> table;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            table = table_.lock();
            table_.reset();
        }
        if (table) {
            size_t remaining = table->remove(topic_, inbox_.get());
            detail::log_subscriber_change(table->label, topic_, "left", remaining);
        }
    }

    const std::string& topic() const { return topic_; }
    size_t dropped() const { return inbox_ ? inbox_->dropped() : 0; }
    bool active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return inbox_ && !table_.expired();
    }

private:
    mutable std::mutex mutex_; // guards table_
    std::weak_ptr<detail::TopicTable<E>> table_;
    std::string topic_;
    std::shared_ptr<Inbox<E>> inbox_;
};

// Drains a subscription on its own thread, calling on_event for each event.
// Destruction cancels the subscription and joins the thread.
template <typename E>
class SubscriptionReader {
public:
    SubscriptionReader(Subscription<E> sub, std::function<void(const E&)> on_event)
        : sub_(std::make_unique<Subscription<E>>(std::move(sub))) {
        Subscription<E>* source = sub_.get();
        thread_ = std::thread([source, fn = std::move(on_event)]() {
            while (auto event = source->next()) fn(*event);
        });
    }

    ~SubscriptionReader() { stop(); }

    SubscriptionReader(const SubscriptionReader&) = delete;
    SubscriptionReader& operator=(const SubscriptionReader&) = delete;

    // Owner thread only
    void stop() {
        sub_->cancel();
        if (thread_.joinable()) thread_.join();
    }

    const std::string& topic() const { return sub_->topic(); }

private:
    std::unique_ptr<Subscription<E>> sub_;
    std::thread thread_;
};

// Topic-keyed publish/subscribe with a bounded inbox per subscriber.
// publish() never blocks: a full inbox loses that one event.
template <typename E>
class TopicBroadcaster {
public:
    explicit TopicBroadcaster(size_t inbox_capacity, std::string label = "broadcast")
        : table_(std::make_shared<detail::TopicTable<E>>()),
          inbox_capacity_(inbox_capacity == 0 ? 1 : inbox_capacity) {
        table_->label = std::move(label);
    }

    TopicBroadcaster(const TopicBroadcaster&) = delete;
    TopicBroadcaster& operator=(const TopicBroadcaster&) = delete;

    Subscription<E> subscribe(const std::string& topic) {
        auto inbox = std::make_shared<Inbox<E>>(inbox_capacity_);
        size_t count = table_->add(topic, inbox);
        detail::log_subscriber_change(table_->label, topic, "joined", count);
        return Subscription<E>(table_, topic, std::move(inbox));
    }

    // Deliver to the inboxes registered at call time.
    // Returns how many accepted the event.
    size_t publish(const std::string& topic, const E& event) {
        std::vector<std::shared_ptr<Inbox<E>>> targets;
        {
            std::lock_guard<std::mutex> lock(table_->mutex);
            auto it = table_->topics.find(topic);
            if (it == table_->topics.end()) return 0;
            targets = it->second;
        }
        detail::log_publish(table_->label, topic, targets.size());

        size_t delivered = 0;
        for (const auto& inbox : targets) {
            switch (inbox->try_push(event)) {
                case PushResult::Accepted:
                    ++delivered;
                    break;
                case PushResult::Full:
                    detail::log_inbox_full(table_->label, topic);
                    break;
                case PushResult::Closed:
                    break; // unsubscribed since the snapshot
            }
        }
        return delivered;
    }

    size_t subscriber_count(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(table_->mutex);
        auto it = table_->topics.find(topic);
        if (it == table_->topics.end()) return 0;
        return it->second.size();
    }

    // Topics with at least one subscriber
    std::vector<std::string> topics() const {
        std::lock_guard<std::mutex> lock(table_->mutex);
        std::vector<std::string> names;
        names.reserve(table_->topics.size());
        for (const auto& [name, _] : table_->topics) {
            names.push_back(name);
        }
        return names;
    }

    size_t inbox_capacity() const { return inbox_capacity_; }

private:
    std::shared_ptr<detail::TopicTable<E>> table_;
    size_t inbox_capacity_;
};

// New chat messages, one topic per chat key.
using MessageBroadcaster = TopicBroadcaster<ChatMessage>;

constexpr const char* kChannelListTopic = "__channels__";

// Channel-list changes on a single global topic.
class ChannelBroadcaster {
public:
    explicit ChannelBroadcaster(size_t inbox_capacity);

    Subscription<ChannelEvent> subscribe();
    size_t publish(const ChannelEvent& event);
    size_t publish_update(ChannelEventType type, const std::string& chat_key,
                          std::optional<std::string> channel_name = std::nullopt,
                          std::optional<bool> is_active = std::nullopt);
    size_t subscriber_count() const;

private:
    TopicBroadcaster<ChannelEvent> topics_;
};

} // namespace chanflow
