/**
 * @file speech_request.h
 * @brief voxgate - One queued utterance
 */

#ifndef VOXGATE_SPEECH_REQUEST_H
#define VOXGATE_SPEECH_REQUEST_H

#include <cstdint>
#include <string>

namespace voxgate {
namespace speech {

constexpr int kHighestPriority = 1;
constexpr int kLowestPriority = 10;
constexpr int kDefaultPriority = 5;

inline int clamp_priority(int priority) {
    if (priority < kHighestPriority) return kHighestPriority;
    if (priority > kLowestPriority) return kLowestPriority;
    return priority;
}

struct SpeechRequest {
    std::string text;
    std::string emotion_tag = "neutral";
    int priority = kDefaultPriority;     // 1 = highest
    int64_t enqueue_time_ms = 0;
    uint64_t sequence = 0;               // Submission order, FIFO tie-break
    bool skip_presence_check = false;
};

/// Orders a max-heap so the lowest (priority, sequence) pair is on top
struct SpeechRequestOrder {
    bool operator()(const SpeechRequest& a, const SpeechRequest& b) const {
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        return a.sequence > b.sequence;
    }
};

}  // namespace speech
}  // namespace voxgate

#endif  // VOXGATE_SPEECH_REQUEST_H
