/**
 * @file interjection_scheduler.h
 * @brief voxgate - Decides when the assistant speaks up unprompted
 *
 * Transcripts, camera descriptions and screen descriptions update a shared
 * SensorContext. Each update (and a background tick) runs the rule table;
 * a match becomes an interjection with probability
 * compute_interjection_probability(), subject to a cooldown that is longer
 * while the user seems busy. The host callback receives the event and a
 * JSON context to turn into words (normally through the speech queue).
 *
 * friend_threshold in [0, 1] controls chattiness; 0 means never interject.
 */

#ifndef VOXGATE_INTERJECTION_SCHEDULER_H
#define VOXGATE_INTERJECTION_SCHEDULER_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "voxgate/ambient/interjection_rules.h"
#include "voxgate/ambient/sensor_context.h"
#include "voxgate/core/vg_clock.h"
#include "voxgate/util/json_utils.h"

namespace voxgate {
namespace ambient {

enum class VisionSource { Camera, Screen };

const char* vision_source_name(VisionSource source);

// =============================================================================
// Configuration
// =============================================================================

struct AmbientConfig {
    float friend_threshold = 0.5f;

    // Cooldown between interjections (seconds)
    double min_interval_s = 30.0;
    double busy_interval_s = 300.0;

    int tick_interval_ms = 1000;

    // Periodic vision polling, only above the given thresholds
    double screen_poll_interval_s = 60.0;
    float screen_poll_threshold = 0.3f;
    double camera_poll_interval_s = 45.0;
    float camera_poll_threshold = 0.4f;

    // Long-silence check-in
    double long_silence_s = 300.0;
    float long_silence_threshold = 0.6f;
    double long_silence_chance = 0.1;

    size_t transcript_capacity = 10;
};

// =============================================================================
// Events / status
// =============================================================================

struct InterjectionEvent {
    InterjectReason reason = InterjectReason::Comment;
    std::string hint;
    std::string evidence;           // Text that triggered it (may be empty)
    TriggerSource source = TriggerSource::Audio;
    float boost = 0.0f;
    float probability = 0.0f;
    int64_t timestamp_ms = 0;
};

/// Receives each interjection and its JSON context; exceptions are logged and ignored
using InterjectionCallback =
    std::function<void(const InterjectionEvent& event, const std::string& context_json)>;

/// Returns a text description of what the camera or screen shows ("" if none)
using VisionProbeFn = std::function<std::string(VisionSource source)>;

/// Uniform draw in [0, 1)
using RandomFn = std::function<double()>;

/// Thread-safe mt19937-backed RandomFn
RandomFn make_default_random();

struct SchedulerStatus {
    bool running = false;
    float friend_threshold = 0.0f;
    std::string user_activity;
    std::string user_expression;
    std::string user_mood;
    bool user_busy = false;
    bool user_stressed = false;
    double silence_duration_s = 0.0;
    uint64_t interjection_count = 0;
    std::optional<double> seconds_since_last_interjection;
    size_t recent_transcripts = 0;

    util::Json to_json() const;
};

// =============================================================================
// InterjectionScheduler
// =============================================================================

class InterjectionScheduler {
public:
    explicit InterjectionScheduler(const AmbientConfig& config = AmbientConfig(),
                                   const Clock* clock = nullptr, RandomFn random = nullptr);
    ~InterjectionScheduler();

    // Non-copyable
    InterjectionScheduler(const InterjectionScheduler&) = delete;
    InterjectionScheduler& operator=(const InterjectionScheduler&) = delete;

    // Set before start()
    void set_vision_probe(VisionProbeFn probe);
    void set_rules(std::vector<InterjectionRule> rules);

    /**
     * Starts the background tick with a fresh context.
     *
     * @return false if on_interject is empty
     */
    bool start(InterjectionCallback on_interject, float friend_threshold);

    /// Joins the tick thread and clears the context
    void stop();

    bool is_running() const { return running_.load(); }

    /// Clamped into [0, 1]
    void set_friend_threshold(float threshold);
    float friend_threshold() const { return friend_threshold_.load(); }

    /// Records a transcript, then evaluates it as an audio trigger
    void update_audio_context(const std::string& transcript);

    /// Records camera and/or screen descriptions (empty strings are ignored)
    void update_visual_context(const std::string& camera_text, const std::string& screen_text);

    /**
     * Runs cooldown, rule table and the probability draw for text.
     *
     * @return true if an interjection fired
     */
    bool evaluate_trigger(const std::string& text, TriggerSource source);

    /// One background step: silence accounting, due vision polls, long-silence check-in
    void tick();

    SchedulerStatus get_status() const;
    SensorContext context_snapshot() const;

    const AmbientConfig& config() const { return config_; }

private:
    void tick_loop();
    void poll_vision(VisionSource source);
    bool cooldown_elapsed_locked(int64_t now_ms) const;
    /// Records the fire and builds the event; returns the callback to invoke
    InterjectionCallback fire_locked(const RuleMatch& match, const std::string& evidence,
                                     TriggerSource source, float probability, int64_t now_ms,
                                     InterjectionEvent* event, std::string* context_json);
    void deliver(const InterjectionCallback& callback, const InterjectionEvent& event,
                 const std::string& context_json);

    AmbientConfig config_;
    const Clock& clock_;
    RandomFn random_;
    VisionProbeFn vision_probe_;
    std::vector<InterjectionRule> rules_;

    std::atomic<float> friend_threshold_{0.0f};
    std::atomic<bool> running_{false};

    // Guarded by context_mutex_
    SensorContext context_;
    InterjectionCallback on_interject_;
    int64_t last_tick_ms_ = 0;
    int64_t last_screen_poll_ms_ = 0;
    int64_t last_camera_poll_ms_ = 0;
    bool screen_polled_ = false;
    bool camera_polled_ = false;
    mutable std::mutex context_mutex_;

    std::thread tick_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

}  // namespace ambient
}  // namespace voxgate

#endif  // VOXGATE_INTERJECTION_SCHEDULER_H
