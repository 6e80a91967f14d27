/**
 * @file test_speech_request_queue.cpp
 * @brief Tests for the speaking worker, its ordering and its gates
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_helpers.h"
#include "voxgate/echo/echo_suppressor.h"
#include "voxgate/speech/presence_gate.h"
#include "voxgate/speech/speech_lock.h"
#include "voxgate/speech/speech_request_queue.h"

using namespace std::chrono_literals;
using voxgate::speech::LocalSpeechLock;
using voxgate::speech::PresenceGate;
using voxgate::speech::SpeechQueueConfig;
using voxgate::speech::SpeechRequest;
using voxgate::speech::SpeechRequestQueue;
using voxgate::test::ManualClock;
using voxgate::test::wait_for;

namespace {

SpeechQueueConfig fast_config() {
    SpeechQueueConfig config;
    config.poll_interval_ms = 10;
    config.lock_timeout_ms = 200;
    return config;
}

/// Synthesizer that records what it was asked to say
struct RecordingSynth {
    std::mutex mutex;
    std::vector<std::string> spoken;
    std::vector<std::string> emotions;

    voxgate::speech::SynthesizeFn fn() {
        return [this](const std::string& text, const std::string& emotion) {
            std::lock_guard<std::mutex> lock(mutex);
            spoken.push_back(text);
            emotions.push_back(emotion);
            return true;
        };
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return spoken;
    }
};

/// Blocks the synthesizer until opened
class Latch {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

}  // namespace

// =============================================================================
// ORDERING
// =============================================================================

TEST(SpeechRequestQueue, PendingOrderIsPriorityThenSubmission) {
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock);

    queue.enqueue("low", "neutral", 9);
    queue.enqueue("normal-a", "neutral", 5);
    queue.enqueue("urgent", "urgent", 1);
    queue.enqueue("normal-b", "neutral", 5);
    queue.enqueue("clamped-high", "neutral", -3);
    queue.enqueue("clamped-low", "neutral", 42);

    auto pending = queue.pending_snapshot();
    ASSERT_EQ(pending.size(), 6u);
    EXPECT_EQ(pending[0].text, "urgent");
    EXPECT_EQ(pending[1].text, "clamped-high");
    EXPECT_EQ(pending[1].priority, 1);
    EXPECT_EQ(pending[2].text, "normal-a");
    EXPECT_EQ(pending[3].text, "normal-b");
    EXPECT_EQ(pending[4].text, "low");
    EXPECT_EQ(pending[5].text, "clamped-low");
    EXPECT_EQ(pending[5].priority, 10);
}

TEST(SpeechRequestQueue, WorkerSpeaksInPriorityOrder) {
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock);
    RecordingSynth synth;
    queue.set_synthesizer(synth.fn());

    queue.enqueue("third", "neutral", 7);
    queue.enqueue("first", "neutral", 2);
    queue.enqueue("second", "neutral", 2);

    ASSERT_TRUE(queue.start());
    ASSERT_TRUE(queue.wait_until_idle(3000ms));

    EXPECT_EQ(synth.snapshot(), (std::vector<std::string>{"first", "second", "third"}));
    EXPECT_EQ(queue.stats().spoken, 3u);
}

TEST(SpeechRequestQueue, UrgentRequestJumpsAheadWhileSpeaking) {
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock);

    Latch latch;
    std::atomic<bool> first_started{false};
    std::mutex mutex;
    std::vector<std::string> order;
    queue.set_synthesizer([&](const std::string& text, const std::string&) {
        {
            std::lock_guard<std::mutex> guard(mutex);
            order.push_back(text);
        }
        if (text == "blocking") {
            first_started = true;
            latch.wait();
        }
        return true;
    });

    ASSERT_TRUE(queue.start());
    queue.enqueue("blocking", "neutral", 5);
    ASSERT_TRUE(wait_for([&] { return first_started.load(); }));

    queue.enqueue("later", "neutral", 8);
    queue.enqueue("alert", "urgent", 1);
    latch.open();
    ASSERT_TRUE(queue.wait_until_idle(3000ms));

    std::lock_guard<std::mutex> guard(mutex);
    EXPECT_EQ(order, (std::vector<std::string>{"blocking", "alert", "later"}));
}

// =============================================================================
// SPEAK NOW / CLEAR
// =============================================================================

TEST(SpeechRequestQueue, SpeakNowReplacesPendingRequests) {
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock);

    queue.enqueue("a");
    queue.enqueue("b", "neutral", 2);
    queue.enqueue("c", "neutral", 9);
    ASSERT_TRUE(queue.speak_now("stop everything", "urgent"));

    auto pending = queue.pending_snapshot();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].text, "stop everything");
    EXPECT_EQ(pending[0].priority, 1);
    EXPECT_EQ(queue.stats().cleared, 3u);
}

TEST(SpeechRequestQueue, SpeakNowWithEmptyTextLeavesQueueAlone) {
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock);
    queue.enqueue("keep me");

    EXPECT_FALSE(queue.speak_now(""));
    EXPECT_EQ(queue.pending_count(), 1u);
}

TEST(SpeechRequestQueue, EmptyTextIsIgnored) {
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock);
    EXPECT_FALSE(queue.enqueue(""));
    EXPECT_EQ(queue.pending_count(), 0u);
    EXPECT_EQ(queue.stats().enqueued, 0u);
}

TEST(SpeechRequestQueue, ClearDropsPending) {
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock);
    queue.enqueue("one");
    queue.enqueue("two");
    EXPECT_EQ(queue.clear(), 2u);
    EXPECT_EQ(queue.pending_count(), 0u);
}

// =============================================================================
// WORKER GATES
// =============================================================================

TEST(SpeechRequestQueue, SynthesizesOnceWhileHoldingTheLock) {
    LocalSpeechLock lock("assistant");
    SpeechRequestQueue queue(fast_config(), lock);

    std::atomic<int> calls{0};
    std::atomic<bool> held_during_call{false};
    std::string said;
    std::string emotion;
    queue.set_synthesizer([&](const std::string& text, const std::string& tag) {
        ++calls;
        held_during_call = lock.held();
        said = text;
        emotion = tag;
        return true;
    });

    ASSERT_TRUE(queue.start());
    queue.enqueue("hello", "warm", 5);
    ASSERT_TRUE(queue.wait_until_idle(3000ms));
    queue.stop();

    EXPECT_EQ(calls.load(), 1);
    EXPECT_TRUE(held_during_call.load());
    EXPECT_EQ(said, "hello");
    EXPECT_EQ(emotion, "warm");
    EXPECT_FALSE(lock.held());
}

TEST(SpeechRequestQueue, ArmsEchoWindowBeforeSynthesis) {
    ManualClock clock;
    voxgate::echo::EchoSuppressor echo(voxgate::echo::EchoSuppressorConfig(), &clock);
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock, &echo, nullptr, &clock);

    std::atomic<bool> speaking_during_call{false};
    queue.set_synthesizer([&](const std::string&, const std::string&) {
        speaking_during_call = echo.is_speaking();
        return true;
    });

    ASSERT_TRUE(queue.start());
    queue.enqueue("the build is green");
    ASSERT_TRUE(queue.wait_until_idle(3000ms));

    EXPECT_TRUE(speaking_during_call.load());
    EXPECT_FALSE(echo.should_process("the build is green", 1.0f));
}

TEST(SpeechRequestQueue, DropsWhenUserAbsent) {
    voxgate::test::QuietLogs quiet;
    LocalSpeechLock lock;
    PresenceGate presence([] { return false; });
    SpeechRequestQueue queue(fast_config(), lock, nullptr, &presence);
    RecordingSynth synth;
    queue.set_synthesizer(synth.fn());

    ASSERT_TRUE(queue.start());
    queue.enqueue("nobody hears this");
    queue.enqueue("boot chime", "neutral", 5, true);  // skips the presence check
    ASSERT_TRUE(queue.wait_until_idle(3000ms));

    EXPECT_EQ(synth.snapshot(), std::vector<std::string>{"boot chime"});
    EXPECT_EQ(queue.stats().dropped_absent, 1u);
    EXPECT_EQ(queue.stats().spoken, 1u);
}

TEST(SpeechRequestQueue, DropsWhenDeviceStaysBusy) {
    voxgate::test::QuietLogs quiet;
    LocalSpeechLock::Domain domain;
    LocalSpeechLock other_process(domain, "music-player");
    LocalSpeechLock ours(domain, "assistant");
    ASSERT_TRUE(other_process.acquire(10ms));

    auto config = fast_config();
    config.lock_timeout_ms = 30;
    SpeechRequestQueue queue(config, ours);
    RecordingSynth synth;
    queue.set_synthesizer(synth.fn());

    ASSERT_TRUE(queue.start());
    queue.enqueue("can't get a word in");
    ASSERT_TRUE(queue.wait_until_idle(3000ms));

    EXPECT_TRUE(synth.snapshot().empty());
    EXPECT_EQ(queue.stats().dropped_busy, 1u);
}

TEST(SpeechRequestQueue, SynthesizerFailuresAreCountedAndWorkerContinues) {
    voxgate::test::QuietLogs quiet;
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock);

    std::mutex mutex;
    std::vector<std::pair<std::string, bool>> ends;
    queue.set_synthesizer([](const std::string& text, const std::string&) {
        if (text == "throws") {
            throw std::runtime_error("audio device unplugged");
        }
        return text != "returns false";
    });
    queue.set_on_speak_end([&](const SpeechRequest& request, bool success) {
        std::lock_guard<std::mutex> guard(mutex);
        ends.emplace_back(request.text, success);
    });

    ASSERT_TRUE(queue.start());
    queue.enqueue("throws", "neutral", 1);
    queue.enqueue("returns false", "neutral", 2);
    queue.enqueue("fine", "neutral", 3);
    ASSERT_TRUE(queue.wait_until_idle(3000ms));

    auto stats = queue.stats();
    EXPECT_EQ(stats.failed, 2u);
    EXPECT_EQ(stats.spoken, 1u);
    EXPECT_FALSE(lock.held());

    std::lock_guard<std::mutex> guard(mutex);
    ASSERT_EQ(ends.size(), 3u);
    EXPECT_FALSE(ends[0].second);
    EXPECT_FALSE(ends[1].second);
    EXPECT_TRUE(ends[2].second);
}

TEST(SpeechRequestQueue, NonStandardExceptionsDoNotStopWorker) {
    voxgate::test::QuietLogs quiet;
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock);

    std::mutex mutex;
    std::vector<std::string> spoken;
    std::atomic<int> calls{0};
    queue.set_synthesizer([&](const std::string& text, const std::string&) {
        if (calls.fetch_add(1) == 0) {
            throw 42;
        }
        std::lock_guard<std::mutex> guard(mutex);
        spoken.push_back(text);
        return true;
    });
    queue.set_on_speak_start([](const SpeechRequest& request) {
        if (request.text == "second") {
            throw "start hook failed";
        }
    });
    queue.set_on_speak_end([](const SpeechRequest&, bool) { throw 7; });

    ASSERT_TRUE(queue.start());
    queue.enqueue("first", "neutral", 1);
    queue.enqueue("second", "neutral", 2);
    ASSERT_TRUE(queue.wait_until_idle(3000ms));

    EXPECT_TRUE(queue.is_running());
    auto stats = queue.stats();
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.spoken, 1u);
    EXPECT_FALSE(lock.held());

    std::lock_guard<std::mutex> guard(mutex);
    ASSERT_EQ(spoken.size(), 1u);
    EXPECT_EQ(spoken[0], "second");
}

TEST(SpeechRequestQueue, StartCallbackSeesRequest) {
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock);
    RecordingSynth synth;
    queue.set_synthesizer(synth.fn());

    std::atomic<int> priority_seen{0};
    queue.set_on_speak_start([&](const SpeechRequest& request) {
        priority_seen = request.priority;
    });

    ASSERT_TRUE(queue.start());
    queue.enqueue("note", "neutral", 4);
    ASSERT_TRUE(queue.wait_until_idle(3000ms));
    EXPECT_EQ(priority_seen.load(), 4);
}

// =============================================================================
// LIFECYCLE
// =============================================================================

TEST(SpeechRequestQueue, StartRequiresSynthesizer) {
    voxgate::test::QuietLogs quiet;
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock);
    EXPECT_FALSE(queue.start());
    EXPECT_FALSE(queue.is_running());
}

TEST(SpeechRequestQueue, StopKeepsPendingRequests) {
    LocalSpeechLock lock;
    SpeechRequestQueue queue(fast_config(), lock);
    RecordingSynth synth;
    queue.set_synthesizer(synth.fn());

    ASSERT_TRUE(queue.start());
    queue.stop();
    EXPECT_FALSE(queue.is_running());

    queue.enqueue("after stop");
    EXPECT_EQ(queue.pending_count(), 1u);
    EXPECT_TRUE(synth.snapshot().empty());

    ASSERT_TRUE(queue.start());
    ASSERT_TRUE(queue.wait_until_idle(3000ms));
    EXPECT_EQ(synth.snapshot(), std::vector<std::string>{"after stop"});
}

// =============================================================================
// PRESENCE GATE
// =============================================================================

TEST(PresenceGate, CachesProbeResult) {
    ManualClock clock;
    std::atomic<int> probes{0};
    bool present = true;
    PresenceGate gate(
        [&] {
            ++probes;
            return present;
        },
        5000, &clock);

    EXPECT_TRUE(gate.is_user_present());
    present = false;
    clock.advance_ms(4000);
    EXPECT_TRUE(gate.is_user_present());
    EXPECT_EQ(probes.load(), 1);

    clock.advance_ms(1500);
    EXPECT_FALSE(gate.is_user_present());
    EXPECT_EQ(probes.load(), 2);

    present = true;
    gate.invalidate();
    EXPECT_TRUE(gate.is_user_present());
    EXPECT_EQ(probes.load(), 3);
}

TEST(PresenceGate, MissingOrFailingProbeMeansPresent) {
    voxgate::test::QuietLogs quiet;
    PresenceGate no_probe;
    EXPECT_FALSE(no_probe.has_probe());
    EXPECT_TRUE(no_probe.is_user_present());

    PresenceGate failing([]() -> bool { throw std::runtime_error("camera offline"); });
    EXPECT_TRUE(failing.is_user_present());

    PresenceGate foreign([]() -> bool { throw 3; });
    EXPECT_TRUE(foreign.is_user_present());
}
