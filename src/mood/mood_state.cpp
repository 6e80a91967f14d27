/**
 * @file mood_state.cpp
 * @brief voxgate - Decaying mood vector implementation
 */

#include "voxgate/mood/mood_state.h"

#include <algorithm>

#include "voxgate/core/vg_logger.h"

#define LOG_TAG "Mood"
#define LOGD(...) VG_LOG_DEBUG(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VG_LOG_WARNING(LOG_TAG, __VA_ARGS__)

namespace voxgate {
namespace mood {

namespace {

float clamp_unit(float value) {
    return std::max(-1.0f, std::min(1.0f, value));
}

}  // namespace

// =============================================================================
// Event and mood tables
// =============================================================================

MoodDelta mood_event_delta(MoodEvent event) {
    MoodDelta d;
    switch (event) {
        case MoodEvent::TaskCompleted:
            d.happiness = 0.3f;
            d.energy = 0.1f;
            d.engagement = 0.2f;
            break;
        case MoodEvent::Error:
            d.happiness = -0.2f;
            d.patience = -0.1f;
            break;
        case MoodEvent::Greeting:
            d.happiness = 0.2f;
            d.engagement = 0.3f;
            break;
        case MoodEvent::Frustration:
            d.patience = -0.3f;
            d.happiness = -0.1f;
            break;
        case MoodEvent::Compliment:
            d.happiness = 0.4f;
            d.engagement = 0.2f;
            break;
        case MoodEvent::Insult:
            d.happiness = -0.3f;
            d.patience = -0.2f;
            break;
        case MoodEvent::Busy:
            d.energy = -0.2f;
            d.patience = -0.1f;
            break;
        case MoodEvent::Idle:
            d.patience = 0.1f;
            d.energy = -0.1f;
            break;
        case MoodEvent::HelpGiven:
            d.happiness = 0.2f;
            d.engagement = 0.1f;
            break;
        case MoodEvent::Repetitive:
            d.patience = -0.2f;
            d.engagement = -0.1f;
            break;
    }
    return d;
}

ResponseModifier response_modifier_for(Mood mood) {
    switch (mood) {
        case Mood::Excited:
            return {0.8f, "enthusiastic", true};
        case Mood::Happy:
            return {0.7f, "warm", false};
        case Mood::Annoyed:
            return {0.6f, "curt", false};
        case Mood::Frustrated:
            return {0.5f, "blunt", false};
        case Mood::Tired:
            return {0.6f, "brief", false};
        case Mood::Engaged:
            return {0.7f, "detailed", false};
        case Mood::Bored:
            return {0.6f, "minimal", false};
        case Mood::Neutral:
            return {0.7f, "normal", false};
    }
    return {0.7f, "normal", false};
}

const char* mood_event_name(MoodEvent event) {
    switch (event) {
        case MoodEvent::TaskCompleted:
            return "task_completed";
        case MoodEvent::Error:
            return "error";
        case MoodEvent::Greeting:
            return "greeting";
        case MoodEvent::Frustration:
            return "frustration";
        case MoodEvent::Compliment:
            return "compliment";
        case MoodEvent::Insult:
            return "insult";
        case MoodEvent::Busy:
            return "busy";
        case MoodEvent::Idle:
            return "idle";
        case MoodEvent::HelpGiven:
            return "help_given";
        case MoodEvent::Repetitive:
            return "repetitive";
    }
    return "unknown";
}

bool parse_mood_event(const std::string& name, MoodEvent* out_event) {
    static const MoodEvent kAll[] = {
        MoodEvent::TaskCompleted, MoodEvent::Error,     MoodEvent::Greeting,
        MoodEvent::Frustration,   MoodEvent::Compliment, MoodEvent::Insult,
        MoodEvent::Busy,          MoodEvent::Idle,      MoodEvent::HelpGiven,
        MoodEvent::Repetitive,
    };
    for (MoodEvent event : kAll) {
        if (name == mood_event_name(event)) {
            if (out_event != nullptr) {
                *out_event = event;
            }
            return true;
        }
    }
    return false;
}

const char* mood_label(Mood mood) {
    switch (mood) {
        case Mood::Excited:
            return "excited";
        case Mood::Happy:
            return "happy";
        case Mood::Annoyed:
            return "annoyed";
        case Mood::Frustrated:
            return "frustrated";
        case Mood::Tired:
            return "tired";
        case Mood::Engaged:
            return "engaged";
        case Mood::Bored:
            return "bored";
        case Mood::Neutral:
            return "neutral";
    }
    return "neutral";
}

Mood classify_mood(const MoodVector& v) {
    if (v.happiness > 0.5f && v.energy > 0.3f) return Mood::Excited;
    if (v.happiness > 0.3f) return Mood::Happy;
    if (v.happiness < -0.3f && v.patience < 0.2f) return Mood::Annoyed;
    if (v.patience < 0.0f) return Mood::Frustrated;
    if (v.energy < -0.3f) return Mood::Tired;
    if (v.engagement > 0.5f) return Mood::Engaged;
    if (v.engagement < -0.3f) return Mood::Bored;
    return Mood::Neutral;
}

float decay_towards(float value, float target, float amount) {
    if (value > target) {
        return std::max(target, value - amount);
    }
    if (value < target) {
        return std::min(target, value + amount);
    }
    return value;
}

// =============================================================================
// MoodState
// =============================================================================

MoodState::MoodState(const MoodConfig& config, const Clock* clock)
    : config_(config), clock_(clock_or_system(clock)), last_update_ms_(clock_.now_ms()) {
    if (config_.decay_rate < 0.0f) {
        LOGW("Negative decay rate %.3f, using 0", config_.decay_rate);
        config_.decay_rate = 0.0f;
    }
    if (config_.history_capacity == 0) {
        config_.history_capacity = 1;
    }
}

void MoodState::update_locked(int64_t now_ms) {
    int64_t elapsed_ms = now_ms - last_update_ms_;
    if (elapsed_ms <= 0) {
        return;
    }

    float amount = config_.decay_rate * static_cast<float>(elapsed_ms) / 1000.0f;

    vector_.happiness = decay_towards(vector_.happiness, kRestingHappiness, amount);
    vector_.energy = decay_towards(vector_.energy, kRestingEnergy, amount);
    vector_.patience = decay_towards(vector_.patience, kRestingPatience, amount);
    vector_.engagement = decay_towards(vector_.engagement, kRestingEngagement, amount);

    last_update_ms_ = now_ms;
}

void MoodState::update() {
    std::lock_guard<std::mutex> lock(mutex_);
    update_locked(clock_.now_ms());
}

void MoodState::apply_event(MoodEvent event, float intensity) {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t now = clock_.now_ms();
    update_locked(now);

    MoodDelta delta = mood_event_delta(event);
    vector_.happiness = clamp_unit(vector_.happiness + delta.happiness * intensity);
    vector_.energy = clamp_unit(vector_.energy + delta.energy * intensity);
    vector_.patience = clamp_unit(vector_.patience + delta.patience * intensity);
    vector_.engagement = clamp_unit(vector_.engagement + delta.engagement * intensity);

    MoodHistoryEntry entry;
    entry.time_ms = now;
    entry.event = event;
    entry.mood = classify_mood(vector_);
    history_.push_back(entry);
    while (history_.size() > config_.history_capacity) {
        history_.pop_front();
    }

    LOGD("%s x%.2f -> %s (h=%.2f e=%.2f p=%.2f g=%.2f)", mood_event_name(event), intensity,
         mood_label(entry.mood), vector_.happiness, vector_.energy, vector_.patience,
         vector_.engagement);
}

bool MoodState::apply_event(const std::string& event_name, float intensity) {
    MoodEvent event;
    if (!parse_mood_event(event_name, &event)) {
        LOGW("Unknown mood event '%s' ignored", event_name.c_str());
        return false;
    }
    apply_event(event, intensity);
    return true;
}

Mood MoodState::get_mood() {
    std::lock_guard<std::mutex> lock(mutex_);
    update_locked(clock_.now_ms());
    return classify_mood(vector_);
}

ResponseModifier MoodState::get_response_modifier() {
    return response_modifier_for(get_mood());
}

MoodVector MoodState::get_vector() {
    std::lock_guard<std::mutex> lock(mutex_);
    update_locked(clock_.now_ms());
    return vector_;
}

std::vector<MoodHistoryEntry> MoodState::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<MoodHistoryEntry>(history_.begin(), history_.end());
}

void MoodState::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    vector_ = MoodVector();
    history_.clear();
    last_update_ms_ = clock_.now_ms();
}

}  // namespace mood
}  // namespace voxgate
