#include "voxgate/ambient/sensor_context.h"

#include "voxgate/util/text_match.h"

namespace voxgate {
namespace ambient {

namespace {

const std::vector<std::string> kPositiveWords = {"happy", "great", "awesome", "nice", "good", "love"};

struct ActivityKeywords {
    const char* activity;
    std::vector<std::string> keywords;
    bool sets_busy;
    bool busy;
};

// First match wins
const std::vector<ActivityKeywords>& activity_table() {
    static const std::vector<ActivityKeywords> table = {
        {"working", {"typing", "keyboard", "working", "computer"}, true, true},
        {"talking", {"phone", "talking", "speaking"}, false, false},
        {"relaxing", {"relaxing", "sitting", "couch", "leaning back"}, true, false},
        {"chilling", {"smoking", "blunt", "joint", "vape"}, true, false},
        {"away", {"not visible", "empty", "no one"}, false, false},
    };
    return table;
}

const std::vector<std::string> kHappyExpression = {"smiling", "happy", "laughing"};
const std::vector<std::string> kFocusedExpression = {"focused", "concentrating", "serious"};
const std::vector<std::string> kStressedExpression = {"stressed", "frustrated", "frowning", "tired"};

}  // namespace

const char* sentiment_name(Sentiment sentiment) {
    switch (sentiment) {
        case Sentiment::Neutral:
            return "neutral";
        case Sentiment::Positive:
            return "positive";
        case Sentiment::Stressed:
            return "stressed";
    }
    return "neutral";
}

const std::vector<std::string>& stress_indicators() {
    static const std::vector<std::string> indicators = {
        "frustrated", "angry", "stressed", "tired", "exhausted", "hate",   "stupid", "broken",
        "not working", "fuck", "shit",    "damn",  "ugh",       "why",    "come on",
    };
    return indicators;
}

Sentiment classify_sentiment(const std::string& transcript) {
    std::string lowered = util::to_lower(transcript);
    if (util::contains_any(lowered, stress_indicators())) {
        return Sentiment::Stressed;
    }
    if (util::contains_any(lowered, kPositiveWords)) {
        return Sentiment::Positive;
    }
    return Sentiment::Neutral;
}

CameraAssessment assess_camera_view(const std::string& description) {
    CameraAssessment assessment;
    std::string lowered = util::to_lower(description);

    for (const auto& entry : activity_table()) {
        if (util::contains_any(lowered, entry.keywords)) {
            assessment.activity = entry.activity;
            assessment.busy_changed = entry.sets_busy;
            assessment.busy = entry.busy;
            break;
        }
    }

    if (util::contains_any(lowered, kHappyExpression)) {
        assessment.expression = "happy";
    } else if (util::contains_any(lowered, kFocusedExpression)) {
        assessment.expression = "focused";
        assessment.busy_changed = true;
        assessment.busy = true;
    } else if (util::contains_any(lowered, kStressedExpression)) {
        assessment.expression = "stressed";
        assessment.stressed = true;
    }
    return assessment;
}

// =============================================================================
// SensorContext
// =============================================================================

void SensorContext::add_transcript(const std::string& transcript, size_t capacity,
                                   int64_t now_ms) {
    recent_transcripts.push_back(transcript);
    while (recent_transcripts.size() > capacity) {
        recent_transcripts.pop_front();
    }

    Sentiment sentiment = classify_sentiment(transcript);
    user_mood = sentiment_name(sentiment);
    speech_stressed = sentiment == Sentiment::Stressed;
    user_seems_stressed = speech_stressed || visual_stressed;

    silence_duration_s = 0.0;
    last_interaction_ms = now_ms;
}

void SensorContext::apply_camera_view(const std::string& description) {
    CameraAssessment assessment = assess_camera_view(description);

    if (!assessment.activity.empty()) {
        user_activity = assessment.activity;
    }
    if (!assessment.expression.empty()) {
        user_expression = assessment.expression;
    }
    if (assessment.busy_changed) {
        user_seems_busy = assessment.busy;
    }
    visual_stressed = assessment.stressed;
    user_seems_stressed = speech_stressed || visual_stressed;
    last_visual_summary = description;
}

}  // namespace ambient
}  // namespace voxgate
