/**
 * @file mood_state.h
 * @brief voxgate - Decaying mood vector
 *
 * Four scalars in [-1, 1] that shift on events and decay back toward their
 * resting targets over time (0 for happiness/energy/engagement, 0.5 for
 * patience). Response generators read the derived mood label and its
 * modifier to flavour tone. Thread-safe.
 */

#ifndef VOXGATE_MOOD_STATE_H
#define VOXGATE_MOOD_STATE_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "voxgate/core/vg_clock.h"

namespace voxgate {
namespace mood {

enum class MoodEvent {
    TaskCompleted,
    Error,
    Greeting,
    Frustration,
    Compliment,
    Insult,
    Busy,
    Idle,
    HelpGiven,
    Repetitive,
};

enum class Mood {
    Excited,
    Happy,
    Annoyed,
    Frustrated,
    Tired,
    Engaged,
    Bored,
    Neutral,
};

struct MoodVector {
    float happiness = 0.0f;
    float energy = 0.0f;
    float patience = 0.5f;
    float engagement = 0.0f;
};

/// Per-component shift applied (scaled by intensity) for one event
struct MoodDelta {
    float happiness = 0.0f;
    float energy = 0.0f;
    float patience = 0.0f;
    float engagement = 0.0f;
};

struct ResponseModifier {
    float temperature = 0.7f;
    const char* style = "normal";
    bool allow_exclamations = false;
};

struct MoodHistoryEntry {
    int64_t time_ms = 0;
    MoodEvent event = MoodEvent::Idle;
    Mood mood = Mood::Neutral;
};

struct MoodConfig {
    float decay_rate = 0.01f;           // Units per second toward the resting target
    float default_intensity = 0.3f;     // Used by callers that have no intensity of their own
    size_t history_capacity = 100;
};

// Resting targets
constexpr float kRestingHappiness = 0.0f;
constexpr float kRestingEnergy = 0.0f;
constexpr float kRestingPatience = 0.5f;
constexpr float kRestingEngagement = 0.0f;

MoodDelta mood_event_delta(MoodEvent event);
ResponseModifier response_modifier_for(Mood mood);

const char* mood_event_name(MoodEvent event);
bool parse_mood_event(const std::string& name, MoodEvent* out_event);
const char* mood_label(Mood mood);

/// Ordered decision tree over the vector; first matching rule wins
Mood classify_mood(const MoodVector& vector);

/// Moves value toward target by amount without crossing it
float decay_towards(float value, float target, float amount);

class MoodState {
public:
    explicit MoodState(const MoodConfig& config = MoodConfig(), const Clock* clock = nullptr);

    // Non-copyable
    MoodState(const MoodState&) = delete;
    MoodState& operator=(const MoodState&) = delete;

    void apply_event(MoodEvent event, float intensity);

    /**
     * Applies an event by name ("task_completed", "error", ...).
     *
     * @return false if the name is unknown (state unchanged)
     */
    bool apply_event(const std::string& event_name, float intensity);

    /// Applies time-based decay up to now
    void update();

    Mood get_mood();
    ResponseModifier get_response_modifier();

    /// Snapshot after decay
    MoodVector get_vector();

    std::vector<MoodHistoryEntry> history() const;

    /// Back to resting values, history cleared
    void reset();

    const MoodConfig& config() const { return config_; }

private:
    void update_locked(int64_t now_ms);

    MoodConfig config_;
    const Clock& clock_;

    MoodVector vector_;
    int64_t last_update_ms_;
    std::deque<MoodHistoryEntry> history_;
    mutable std::mutex mutex_;
};

}  // namespace mood
}  // namespace voxgate

#endif  // VOXGATE_MOOD_STATE_H
