/**
 * @file emotion_text.cpp
 * @brief voxgate - Keyword emotion tagging implementation
 */

#include "voxgate/mood/emotion_text.h"

#include <cmath>
#include <vector>

#include "voxgate/util/text_match.h"

namespace voxgate {
namespace mood {

namespace {

struct EmotionKeywords {
    EmotionTag tag;
    std::vector<const char*> keywords;
};

// Order matters: the first category with a hit wins
const std::vector<EmotionKeywords>& keyword_table() {
    static const std::vector<EmotionKeywords> table = {
        {EmotionTag::Excited,
         {"!", "great", "awesome", "excellent", "amazing", "congrats", "fantastic", "wonderful",
          "perfect", "brilliant", "yay", "woohoo"}},
        {EmotionTag::Concerned,
         {"sorry", "unfortunately", "failed", "error", "problem", "issue", "wrong", "broken",
          "warning", "careful", "danger", "bad"}},
        {EmotionTag::Satisfied,
         {"done", "complete", "finished", "success", "nice", "good", "accomplished", "achieved",
          "completed", "saved"}},
        {EmotionTag::Urgent,
         {"remember", "don't forget", "deadline", "overdue", "urgent", "immediately", "now",
          "asap", "critical", "important"}},
        {EmotionTag::Questioning, {"?", "what", "how", "why", "when", "where", "which"}},
        {EmotionTag::Warm, {"hello", "hi", "hey", "welcome", "greetings", "morning", "evening"}},
        {EmotionTag::Gentle, {"goodbye", "bye", "see you", "later", "goodnight", "farewell"}},
        {EmotionTag::Annoyed, {"ugh", "again", "really", "seriously", "whatever", "fine"}},
        {EmotionTag::Playful, {"haha", "lol", "hehe", "joke", "funny", "kidding", "tease"}},
    };
    return table;
}

}  // namespace

EmotionTag detect_emotion(const std::string& text) {
    if (text.empty()) {
        return EmotionTag::Neutral;
    }

    std::string lowered = util::to_lower(text);
    for (const auto& entry : keyword_table()) {
        for (const char* keyword : entry.keywords) {
            if (lowered.find(keyword) != std::string::npos) {
                return entry.tag;
            }
        }
    }
    return EmotionTag::Neutral;
}

const char* emotion_tag_name(EmotionTag tag) {
    switch (tag) {
        case EmotionTag::Excited:
            return "excited";
        case EmotionTag::Concerned:
            return "concerned";
        case EmotionTag::Satisfied:
            return "satisfied";
        case EmotionTag::Urgent:
            return "urgent";
        case EmotionTag::Questioning:
            return "questioning";
        case EmotionTag::Warm:
            return "warm";
        case EmotionTag::Gentle:
            return "gentle";
        case EmotionTag::Annoyed:
            return "annoyed";
        case EmotionTag::Playful:
            return "playful";
        case EmotionTag::Neutral:
            return "neutral";
    }
    return "neutral";
}

EmotionTag parse_emotion_tag(const std::string& name) {
    static const EmotionTag kAll[] = {
        EmotionTag::Excited, EmotionTag::Concerned, EmotionTag::Satisfied, EmotionTag::Urgent,
        EmotionTag::Questioning, EmotionTag::Warm, EmotionTag::Gentle, EmotionTag::Annoyed,
        EmotionTag::Playful,
    };
    std::string lowered = util::to_lower(name);
    for (EmotionTag tag : kAll) {
        if (lowered == emotion_tag_name(tag)) {
            return tag;
        }
    }
    return EmotionTag::Neutral;
}

const char* emotion_instruction(EmotionTag tag) {
    switch (tag) {
        case EmotionTag::Excited:
            return "speak enthusiastically with energy";
        case EmotionTag::Concerned:
            return "speak with concern and care";
        case EmotionTag::Satisfied:
            return "speak with contentment";
        case EmotionTag::Urgent:
            return "speak with urgency and emphasis";
        case EmotionTag::Questioning:
            return "speak with curiosity, rising intonation";
        case EmotionTag::Warm:
            return "speak warmly and friendly";
        case EmotionTag::Gentle:
            return "speak softly and gently";
        case EmotionTag::Annoyed:
            return "speak with slight exasperation";
        case EmotionTag::Playful:
            return "speak playfully with humor";
        case EmotionTag::Neutral:
            return "speak normally";
    }
    return "speak normally";
}

VoiceParams voice_params(EmotionTag tag, int base_rate, float base_pitch) {
    float rate_mod = 1.0f;
    float pitch_mod = 1.0f;

    switch (tag) {
        case EmotionTag::Excited:
            rate_mod = 1.1f;
            pitch_mod = 1.1f;
            break;
        case EmotionTag::Concerned:
            rate_mod = 0.9f;
            pitch_mod = 0.95f;
            break;
        case EmotionTag::Satisfied:
            break;
        case EmotionTag::Urgent:
            rate_mod = 1.15f;
            pitch_mod = 1.05f;
            break;
        case EmotionTag::Questioning:
            pitch_mod = 1.1f;
            break;
        case EmotionTag::Warm:
            rate_mod = 0.95f;
            break;
        case EmotionTag::Gentle:
            rate_mod = 0.85f;
            pitch_mod = 0.95f;
            break;
        case EmotionTag::Annoyed:
            rate_mod = 1.05f;
            pitch_mod = 0.9f;
            break;
        case EmotionTag::Playful:
            rate_mod = 1.1f;
            pitch_mod = 1.05f;
            break;
        case EmotionTag::Neutral:
            break;
    }

    VoiceParams params;
    params.rate = static_cast<int>(std::lround(static_cast<float>(base_rate) * rate_mod));
    params.pitch = base_pitch * pitch_mod;
    return params;
}

}  // namespace mood
}  // namespace voxgate
