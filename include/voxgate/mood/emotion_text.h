/**
 * @file emotion_text.h
 * @brief voxgate - Keyword emotion tagging for outgoing speech
 *
 * Producers use detect_emotion() to pick the emotion tag of a SpeechRequest;
 * the synthesizer maps the tag to an instruction or rate/pitch modifiers.
 */

#ifndef VOXGATE_EMOTION_TEXT_H
#define VOXGATE_EMOTION_TEXT_H

#include <string>

namespace voxgate {
namespace mood {

enum class EmotionTag {
    Excited,
    Concerned,
    Satisfied,
    Urgent,
    Questioning,
    Warm,
    Gentle,
    Annoyed,
    Playful,
    Neutral,
};

struct VoiceParams {
    int rate = 150;
    float pitch = 1.0f;
};

/// First category (in fixed order) with a keyword contained in text; Neutral otherwise
EmotionTag detect_emotion(const std::string& text);

const char* emotion_tag_name(EmotionTag tag);

/// Unknown names map to Neutral
EmotionTag parse_emotion_tag(const std::string& name);

/// Delivery instruction for instruction-following TTS engines
const char* emotion_instruction(EmotionTag tag);

VoiceParams voice_params(EmotionTag tag, int base_rate = 150, float base_pitch = 1.0f);

}  // namespace mood
}  // namespace voxgate

#endif  // VOXGATE_EMOTION_TEXT_H
