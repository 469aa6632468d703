#include <catch2/catch_test_macros.hpp>
#include "scheduler.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace chanflow;
using namespace std::chrono_literals;

// ── Test doubles ─────────────────────────────────────────────────

// Records every attempt. Runs can be held open with hold(), and made to
// fail a number of times before succeeding.
class RecordingRunner : public AgentRunner {
public:
    void run(const std::string& chat_key,
             const ChatMessage& message,
             const CancelToken& token) override {
        int now_active = ++active_;
        int prev = max_active_.load();
        while (now_active > prev && !max_active_.compare_exchange_weak(prev, now_active)) {}

        struct Leave {
            std::atomic<int>& n;
            ~Leave() { --n; }
        } leave{active_};

        {
            std::lock_guard<std::mutex> lock(mutex_);
            attempts_.push_back(chat_key + "/" + message.content_text);
        }
        cv_.notify_all();

        // Hold until released or cancelled
        for (;;) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!held_) break;
            }
            token.sleep_for(5ms);
        }

        if (failures_left_ > 0) {
            --failures_left_;
            throw std::runtime_error("transient failure");
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_.push_back(message.content_text);
        }
        cv_.notify_all();
    }

    void hold() { std::lock_guard<std::mutex> lock(mutex_); held_ = true; }
    void release() { std::lock_guard<std::mutex> lock(mutex_); held_ = false; }
    void fail_times(int n) { failures_left_ = n; }

    std::vector<std::string> attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }
    std::vector<std::string> completed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_;
    }
    size_t attempt_count() const { return attempts().size(); }
    int max_active() const { return max_active_.load(); }

    // Wait until at least n attempts have started
    bool wait_attempts(size_t n, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return attempts_.size() >= n; });
    }

    bool wait_completed(size_t n, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return completed_.size() >= n; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> attempts_;
    std::vector<std::string> completed_;
    bool held_ = false;
    std::atomic<int> failures_left_{0};
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};
};

class FakeSandbox : public SandboxController {
public:
    bool result = false;
    bool throws = false;
    std::vector<std::string> stopped;

    bool stop(const std::string& chat_key) override {
        stopped.push_back(chat_key);
        if (throws) throw std::runtime_error("docker unavailable");
        return result;
    }
};

class FakePresence : public PresenceHook {
public:
    std::mutex mutex;
    std::vector<std::string> calls;
    bool throws = false;

    void set_active(const ChatMessage& message, bool active) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            calls.push_back(message.message_id + (active ? ":on" : ":off"));
        }
        if (throws) throw std::runtime_error("reaction API down");
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }
};

static ChatMessage make_message(const std::string& chat_key, const std::string& text,
                                const std::string& id = "") {
    ChatMessage msg;
    msg.chat_key = chat_key;
    msg.content_text = text;
    msg.message_id = id.empty() ? text : id;
    return msg;
}

static SchedulerConfig fast_config(uint32_t debounce_ms = 60) {
    SchedulerConfig cfg;
    cfg.debounce_ms = debounce_ms;
    cfg.max_attempts = 3;
    return cfg;
}

static bool wait_for_state(const ChannelScheduler& s, const std::string& key,
                           ChannelState state,
                           std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (s.status(key).state == state) return true;
        std::this_thread::sleep_for(2ms);
    }
    return false;
}

// ── Construction ─────────────────────────────────────────────────

TEST_CASE("ChannelScheduler: zero max_attempts is rejected", "[scheduler]") {
    RecordingRunner runner;
    SchedulerConfig cfg;
    cfg.max_attempts = 0;
    REQUIRE_THROWS_AS(ChannelScheduler(runner, cfg), std::invalid_argument);
}

TEST_CASE("ChannelScheduler: unknown channel reports idle", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config());
    auto st = scheduler.status("nope");
    REQUIRE(st.state == ChannelState::Idle);
    REQUIRE_FALSE(st.has_pending);
    REQUIRE(scheduler.channel_keys().empty());
}

// ── Debounce ─────────────────────────────────────────────────────

TEST_CASE("ChannelScheduler: burst within window coalesces to latest", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(150));

    scheduler.submit(make_message("c1", "E1"));
    scheduler.submit(make_message("c1", "E2"));
    scheduler.submit(make_message("c1", "E3"));
    REQUIRE(scheduler.status("c1").state == ChannelState::Debouncing);

    REQUIRE(runner.wait_completed(1));
    std::this_thread::sleep_for(300ms);

    auto attempts = runner.attempts();
    REQUIRE(attempts.size() == 1);
    REQUIRE(attempts[0] == "c1/E3");
}

TEST_CASE("ChannelScheduler: run does not start before the window elapses", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(300));

    scheduler.submit(make_message("c1", "E1"));
    std::this_thread::sleep_for(100ms);
    REQUIRE(runner.attempt_count() == 0);
    REQUIRE(scheduler.has_pending("c1"));

    REQUIRE(runner.wait_completed(1));
    REQUIRE_FALSE(scheduler.has_pending("c1"));
}

TEST_CASE("ChannelScheduler: newer submission restarts the window", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(200));

    scheduler.submit(make_message("c1", "E1"));
    std::this_thread::sleep_for(120ms);
    scheduler.submit(make_message("c1", "E2"));
    // E1's window would have ended here; E2's has not
    std::this_thread::sleep_for(120ms);
    REQUIRE(runner.attempt_count() == 0);

    REQUIRE(runner.wait_completed(1));
    REQUIRE(runner.attempts() == std::vector<std::string>{"c1/E2"});
}

TEST_CASE("ChannelScheduler: submissions spaced beyond the window run separately", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(50));

    scheduler.submit(make_message("c1", "E1"));
    REQUIRE(runner.wait_completed(1));
    REQUIRE(wait_for_state(scheduler, "c1", ChannelState::Idle));

    scheduler.submit(make_message("c1", "E2"));
    REQUIRE(runner.wait_completed(2));

    REQUIRE(runner.completed() == std::vector<std::string>{"E1", "E2"});
}

TEST_CASE("ChannelScheduler: per-channel debounce override", "[scheduler]") {
    RecordingRunner runner;
    auto cfg = fast_config(5000);
    cfg.debounce_overrides["fast"] = 20;
    ChannelScheduler scheduler(runner, cfg);

    scheduler.submit(make_message("fast", "hi"));
    REQUIRE(runner.wait_completed(1, 1000ms));
}

// ── Single-flight and re-chaining ────────────────────────────────

TEST_CASE("ChannelScheduler: submissions during a run never overlap it", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(20));
    runner.hold();

    scheduler.submit(make_message("c1", "E1"));
    REQUIRE(runner.wait_attempts(1));
    REQUIRE(scheduler.is_running("c1"));

    scheduler.submit(make_message("c1", "E2"));
    scheduler.submit(make_message("c1", "E3"));
    std::this_thread::sleep_for(100ms);

    REQUIRE(runner.attempt_count() == 1);
    REQUIRE(scheduler.has_pending("c1"));
    REQUIRE(scheduler.status("c1").state == ChannelState::Running);

    runner.release();
    REQUIRE(runner.wait_completed(2));
    std::this_thread::sleep_for(50ms);

    REQUIRE(runner.max_active() == 1);
    // Latest pending wins; E2 is never run
    REQUIRE(runner.completed() == std::vector<std::string>{"E1", "E3"});
}

TEST_CASE("ChannelScheduler: pending message re-chains without another debounce", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(400));
    runner.hold();

    scheduler.submit(make_message("c1", "E1"));
    REQUIRE(runner.wait_attempts(1, 2000ms));
    scheduler.submit(make_message("c1", "E2"));
    runner.release();

    auto released = std::chrono::steady_clock::now();
    REQUIRE(runner.wait_attempts(2, 2000ms));
    auto elapsed = std::chrono::steady_clock::now() - released;

    // Well under the 400ms window
    REQUIRE(elapsed < 200ms);
    REQUIRE(runner.wait_completed(2));
    REQUIRE(runner.completed() == std::vector<std::string>{"E1", "E2"});
}

TEST_CASE("ChannelScheduler: channels run independently", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(30));
    runner.hold();

    scheduler.submit(make_message("a", "A1"));
    scheduler.submit(make_message("b", "B1"));
    REQUIRE(runner.wait_attempts(2));
    REQUIRE(scheduler.is_running("a"));
    REQUIRE(scheduler.is_running("b"));
    REQUIRE(runner.max_active() == 2);

    runner.release();
    REQUIRE(runner.wait_completed(2));
}

// ── Retry ────────────────────────────────────────────────────────

TEST_CASE("ChannelScheduler: always-failing runner is attempted exactly 3 times", "[scheduler]") {
    RecordingRunner runner;
    runner.fail_times(1000);
    ChannelScheduler scheduler(runner, fast_config(10));

    scheduler.submit(make_message("c1", "E1"));
    REQUIRE(runner.wait_attempts(3));
    REQUIRE(wait_for_state(scheduler, "c1", ChannelState::Idle));
    std::this_thread::sleep_for(50ms);

    REQUIRE(runner.attempt_count() == 3);
    REQUIRE(runner.completed().empty());

    // Channel is still usable afterwards
    runner.fail_times(0);
    scheduler.submit(make_message("c1", "E2"));
    REQUIRE(runner.wait_completed(1));
    REQUIRE(runner.completed() == std::vector<std::string>{"E2"});
}

TEST_CASE("ChannelScheduler: transient failure then success stops retrying", "[scheduler]") {
    RecordingRunner runner;
    runner.fail_times(1);
    ChannelScheduler scheduler(runner, fast_config(10));

    scheduler.submit(make_message("c1", "E1"));
    REQUIRE(runner.wait_completed(1));
    std::this_thread::sleep_for(50ms);
    REQUIRE(runner.attempt_count() == 2);
}

TEST_CASE("ChannelScheduler: max_attempts is configurable", "[scheduler]") {
    RecordingRunner runner;
    runner.fail_times(1000);
    auto cfg = fast_config(10);
    cfg.max_attempts = 5;
    ChannelScheduler scheduler(runner, cfg);

    scheduler.submit(make_message("c1", "E1"));
    REQUIRE(runner.wait_attempts(5));
    REQUIRE(wait_for_state(scheduler, "c1", ChannelState::Idle));
    std::this_thread::sleep_for(50ms);
    REQUIRE(runner.attempt_count() == 5);
}

// ── Cancellation ─────────────────────────────────────────────────

TEST_CASE("ChannelScheduler: cancel with nothing running returns false", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config());
    REQUIRE_FALSE(scheduler.cancel("idle"));
}

TEST_CASE("ChannelScheduler: cancel stops a running task and is not retried", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(10));
    runner.hold();

    scheduler.submit(make_message("c1", "E1"));
    REQUIRE(runner.wait_attempts(1));

    REQUIRE(scheduler.cancel("c1"));
    // cancel() waits for completion
    REQUIRE_FALSE(scheduler.is_running("c1"));

    runner.release();
    std::this_thread::sleep_for(50ms);
    REQUIRE(runner.attempt_count() == 1);
    REQUIRE(runner.completed().empty());
}

TEST_CASE("ChannelScheduler: cancel keeps the pending message and re-chains it", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(10));
    runner.hold();

    scheduler.submit(make_message("c1", "E1"));
    REQUIRE(runner.wait_attempts(1));
    scheduler.submit(make_message("c1", "E2"));
    REQUIRE(scheduler.has_pending("c1"));

    REQUIRE(scheduler.cancel("c1"));

    // E2 was not dropped: the completion path picked it up
    REQUIRE(runner.wait_attempts(2));
    REQUIRE(runner.attempts()[1] == "c1/E2");
    runner.release();
    REQUIRE(runner.wait_completed(1));
    REQUIRE(runner.completed() == std::vector<std::string>{"E2"});
}

TEST_CASE("ChannelScheduler: cancel during debounce keeps the pending message", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(100));

    scheduler.submit(make_message("c1", "E1"));
    REQUIRE(scheduler.status("c1").state == ChannelState::Debouncing);

    REQUIRE_FALSE(scheduler.cancel("c1"));
    std::this_thread::sleep_for(200ms);

    REQUIRE(runner.attempt_count() == 0);
    auto st = scheduler.status("c1");
    REQUIRE(st.state == ChannelState::Idle);
    REQUIRE(st.has_pending);

    // The next submission runs normally
    scheduler.submit(make_message("c1", "E2"));
    REQUIRE(runner.wait_completed(1));
    REQUIRE(runner.completed() == std::vector<std::string>{"E2"});
}

TEST_CASE("ChannelScheduler: sandbox stop counts as stopped", "[scheduler]") {
    RecordingRunner runner;
    FakeSandbox sandbox;
    sandbox.result = true;
    ChannelScheduler scheduler(runner, fast_config());
    scheduler.set_sandbox_controller(&sandbox);

    REQUIRE(scheduler.cancel("c1"));
    REQUIRE(sandbox.stopped == std::vector<std::string>{"c1"});
}

TEST_CASE("ChannelScheduler: sandbox failure does not block cancellation", "[scheduler]") {
    RecordingRunner runner;
    FakeSandbox sandbox;
    sandbox.throws = true;
    ChannelScheduler scheduler(runner, fast_config(10));
    scheduler.set_sandbox_controller(&sandbox);
    runner.hold();

    scheduler.submit(make_message("c1", "E1"));
    REQUIRE(runner.wait_attempts(1));
    REQUIRE(scheduler.cancel("c1"));
    REQUIRE_FALSE(scheduler.is_running("c1"));
    REQUIRE_FALSE(scheduler.cancel("idle-channel"));
}

// ── Presence hook ────────────────────────────────────────────────

TEST_CASE("ChannelScheduler: presence toggled around a run", "[scheduler]") {
    RecordingRunner runner;
    FakePresence presence;
    ChannelScheduler scheduler(runner, fast_config(10));
    scheduler.set_presence_hook(&presence);

    scheduler.submit(make_message("c1", "hello", "m-1"));
    REQUIRE(runner.wait_completed(1));
    REQUIRE(wait_for_state(scheduler, "c1", ChannelState::Idle));
    std::this_thread::sleep_for(20ms);

    REQUIRE(presence.snapshot() == std::vector<std::string>{"m-1:on", "m-1:off"});
}

TEST_CASE("ChannelScheduler: failing presence hook does not affect the run", "[scheduler]") {
    RecordingRunner runner;
    FakePresence presence;
    presence.throws = true;
    ChannelScheduler scheduler(runner, fast_config(10));
    scheduler.set_presence_hook(&presence);

    scheduler.submit(make_message("c1", "hello", "m-1"));
    REQUIRE(runner.wait_completed(1));
    REQUIRE(wait_for_state(scheduler, "c1", ChannelState::Idle));
    REQUIRE(runner.attempt_count() == 1);
}

TEST_CASE("ChannelScheduler: presence skipped for empty trigger", "[scheduler]") {
    RecordingRunner runner;
    FakePresence presence;
    ChannelScheduler scheduler(runner, fast_config(10));
    scheduler.set_presence_hook(&presence);

    scheduler.trigger("c1");
    REQUIRE(runner.wait_completed(1));
    REQUIRE(runner.attempts() == std::vector<std::string>{"c1/"});
    REQUIRE(presence.snapshot().empty());
}

TEST_CASE("ChannelScheduler: empty chat_key is ignored", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(10));
    scheduler.trigger("");
    scheduler.submit(make_message("", "orphan"));
    REQUIRE(scheduler.channel_keys().empty());
}

// ── Eviction and shutdown ────────────────────────────────────────

TEST_CASE("ChannelScheduler: evict_idle drops only idle channels", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(10));

    scheduler.submit(make_message("done", "E1"));
    REQUIRE(runner.wait_completed(1));
    REQUIRE(wait_for_state(scheduler, "done", ChannelState::Idle));

    runner.hold();
    scheduler.submit(make_message("busy", "B1"));
    REQUIRE(runner.wait_attempts(2));

    REQUIRE(scheduler.evict_idle() == 1);
    REQUIRE(scheduler.channel_keys() == std::vector<std::string>{"busy"});

    runner.release();
    REQUIRE(runner.wait_completed(2));

    // An evicted channel comes back on the next submission
    scheduler.submit(make_message("done", "E2"));
    REQUIRE(runner.wait_completed(3));
}

TEST_CASE("ChannelScheduler: shutdown cancels runs and ignores later submits", "[scheduler]") {
    RecordingRunner runner;
    ChannelScheduler scheduler(runner, fast_config(10));
    runner.hold();

    scheduler.submit(make_message("c1", "E1"));
    REQUIRE(runner.wait_attempts(1));

    scheduler.shutdown();
    REQUIRE(scheduler.channel_keys().empty());

    scheduler.submit(make_message("c1", "E2"));
    std::this_thread::sleep_for(50ms);
    REQUIRE(runner.attempt_count() == 1);
}

TEST_CASE("channel_state_name: names", "[scheduler]") {
    REQUIRE(std::string(channel_state_name(ChannelState::Idle)) == "idle");
    REQUIRE(std::string(channel_state_name(ChannelState::Debouncing)) == "debouncing");
    REQUIRE(std::string(channel_state_name(ChannelState::Running)) == "running");
}
