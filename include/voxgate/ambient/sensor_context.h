/**
 * @file sensor_context.h
 * @brief voxgate - What the assistant currently knows about the user
 *
 * Fused from independently arriving summaries: speech transcripts, camera
 * descriptions and screen descriptions. Classification is keyword based.
 */

#ifndef VOXGATE_SENSOR_CONTEXT_H
#define VOXGATE_SENSOR_CONTEXT_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace voxgate {
namespace ambient {

enum class Sentiment { Neutral, Positive, Stressed };

const char* sentiment_name(Sentiment sentiment);

/// Phrases that mark a transcript as stressed
const std::vector<std::string>& stress_indicators();

/// Classifies a transcript; stress wins over positive
Sentiment classify_sentiment(const std::string& transcript);

/**
 * @brief Reading of one camera description
 *
 * Empty activity/expression means no keyword matched; busy_changed is false
 * when the description says nothing about whether the user is occupied.
 */
struct CameraAssessment {
    std::string activity;     // working, talking, relaxing, chilling, away
    std::string expression;   // happy, focused, stressed
    bool busy_changed = false;
    bool busy = false;
    bool stressed = false;
};

CameraAssessment assess_camera_view(const std::string& description);

struct SensorContext {
    std::deque<std::string> recent_transcripts;
    std::string last_visual_summary;
    std::string last_screen_summary;

    std::string user_activity = "unknown";
    std::string user_expression = "neutral";
    std::string user_mood = "neutral";    // Sentiment of the latest transcript

    bool user_seems_busy = false;
    bool user_seems_stressed = false;     // speech_stressed || visual_stressed
    bool speech_stressed = false;
    bool visual_stressed = false;

    double silence_duration_s = 0.0;
    int64_t last_interaction_ms = 0;
    int64_t last_interjection_ms = 0;
    bool has_interjected = false;
    uint64_t interjection_count = 0;

    /**
     * Appends a transcript, evicting the oldest beyond capacity, and updates
     * mood and speech stress from it.
     */
    void add_transcript(const std::string& transcript, size_t capacity, int64_t now_ms);

    /// Applies a camera description (activity, expression, busy, visual stress)
    void apply_camera_view(const std::string& description);
};

}  // namespace ambient
}  // namespace voxgate

#endif  // VOXGATE_SENSOR_CONTEXT_H
