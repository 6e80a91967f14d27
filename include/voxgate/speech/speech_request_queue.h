/**
 * @file speech_request_queue.h
 * @brief voxgate - Priority queue with a single speaking worker
 *
 * Every producer (chat replies, boot narration, alerts, interjections)
 * submits through this queue. One worker thread pops the most urgent
 * request (lowest priority number, then submission order), checks the
 * presence gate, takes the speech lock, arms the echo window and runs the
 * host's blocking synthesize-and-play call.
 *
 * Usage:
 *   SpeechRequestQueue queue(config, lock, &echo, &presence);
 *   queue.set_synthesizer([](const std::string& text, const std::string& emotion) {
 *       return engine.speak(text, emotion);
 *   });
 *   queue.start();
 *   queue.enqueue("Build finished", "satisfied", 3);
 */

#ifndef VOXGATE_SPEECH_REQUEST_QUEUE_H
#define VOXGATE_SPEECH_REQUEST_QUEUE_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "voxgate/core/vg_clock.h"
#include "voxgate/echo/echo_suppressor.h"
#include "voxgate/speech/presence_gate.h"
#include "voxgate/speech/speech_lock.h"
#include "voxgate/speech/speech_request.h"

namespace voxgate {
namespace speech {

/// Blocking synthesize-and-play; false or an exception means the utterance failed
using SynthesizeFn = std::function<bool(const std::string& text, const std::string& emotion)>;
using SpeakStartCallback = std::function<void(const SpeechRequest& request)>;
using SpeakEndCallback = std::function<void(const SpeechRequest& request, bool success)>;

// =============================================================================
// Configuration
// =============================================================================

struct SpeechQueueConfig {
    int64_t lock_timeout_ms = 10000;    // Per request; on timeout the request is dropped
    int poll_interval_ms = 500;         // Worker wake-up interval while idle
    int64_t presence_cache_ms = 5000;   // TTL of the presence gate cache
    bool check_presence = true;         // Consult the presence gate at all
    std::string caller = "voxgate";     // Name reported as lock holder
};

struct SpeechQueueStats {
    uint64_t enqueued = 0;
    uint64_t spoken = 0;
    uint64_t failed = 0;
    uint64_t dropped_absent = 0;
    uint64_t dropped_busy = 0;
    uint64_t cleared = 0;
};

// =============================================================================
// SpeechRequestQueue
// =============================================================================

class SpeechRequestQueue {
public:
    /**
     * @param lock Device lock; must outlive the queue
     * @param echo Echo window armed before each utterance (may be nullptr)
     * @param presence Presence gate (may be nullptr: always present)
     */
    SpeechRequestQueue(const SpeechQueueConfig& config, SpeechLock& lock,
                       echo::EchoSuppressor* echo = nullptr, PresenceGate* presence = nullptr,
                       const Clock* clock = nullptr);
    ~SpeechRequestQueue();

    // Non-copyable
    SpeechRequestQueue(const SpeechRequestQueue&) = delete;
    SpeechRequestQueue& operator=(const SpeechRequestQueue&) = delete;

    // Callbacks must be set before start()
    void set_synthesizer(SynthesizeFn synthesize);
    void set_on_speak_start(SpeakStartCallback callback);
    void set_on_speak_end(SpeakEndCallback callback);

    /**
     * Queues text without blocking. Priority is clamped into [1, 10].
     *
     * @return false if text is empty (nothing queued)
     */
    bool enqueue(const std::string& text, const std::string& emotion = "neutral",
                 int priority = kDefaultPriority, bool skip_presence_check = false);

    /**
     * Drops everything not yet started and queues text at priority 1.
     * Audio already playing is not interrupted.
     *
     * @return false if text is empty (queue untouched)
     */
    bool speak_now(const std::string& text, const std::string& emotion = "neutral");

    /// Drops all pending requests; returns how many were dropped
    size_t clear();

    size_t pending_count() const;

    /**
     * Starts the worker thread.
     *
     * @return false if no synthesizer is set
     */
    bool start();

    /// Stops the worker after the current utterance; pending requests are kept
    void stop();

    bool is_running() const { return running_.load(); }

    /// True while the worker is handling a request
    bool is_busy() const;

    /// Waits until nothing is pending and the worker is idle
    bool wait_until_idle(std::chrono::milliseconds timeout);

    SpeechQueueStats stats() const;

    /// Pending requests in the order they will be spoken
    std::vector<SpeechRequest> pending_snapshot() const;

    const SpeechQueueConfig& config() const { return config_; }

private:
    void worker_loop();
    void process(const SpeechRequest& request);
    void push_locked(const std::string& text, const std::string& emotion, int priority,
                     bool skip_presence_check);

    SpeechQueueConfig config_;
    SpeechLock& lock_;
    echo::EchoSuppressor* echo_;
    PresenceGate* presence_;
    const Clock& clock_;

    SynthesizeFn synthesize_;
    SpeakStartCallback on_speak_start_;
    SpeakEndCallback on_speak_end_;

    std::priority_queue<SpeechRequest, std::vector<SpeechRequest>, SpeechRequestOrder> queue_;
    uint64_t next_sequence_ = 0;
    bool busy_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;

    std::thread worker_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> enqueued_{0};
    std::atomic<uint64_t> spoken_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_absent_{0};
    std::atomic<uint64_t> dropped_busy_{0};
    std::atomic<uint64_t> cleared_{0};
};

}  // namespace speech
}  // namespace voxgate

#endif  // VOXGATE_SPEECH_REQUEST_QUEUE_H
