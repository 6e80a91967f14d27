/**
 * @file interjection_rules.h
 * @brief voxgate - Ordered rule table deciding why the assistant might speak up
 *
 * Rules are evaluated top to bottom and the first whose predicate holds
 * decides the reason and the probability boost. Whether the interjection
 * actually happens is a separate Bernoulli draw (see
 * compute_interjection_probability()).
 */

#ifndef VOXGATE_INTERJECTION_RULES_H
#define VOXGATE_INTERJECTION_RULES_H

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace voxgate {
namespace ambient {

enum class InterjectReason {
    HelpfulInfo,
    Joke,
    CheckIn,
    Comment,
    Question,
    Alert,
    Vibe,
};

const char* interject_reason_name(InterjectReason reason);

/// Where the text under evaluation came from
enum class TriggerSource {
    Audio,
    Screen,
    Camera,
    Silence,
};

const char* trigger_source_name(TriggerSource source);

struct RuleInput {
    std::string text;                 // As received
    std::string lowered;              // Lower-cased text
    TriggerSource source = TriggerSource::Audio;
    bool user_busy = false;
    bool user_stressed = false;
    std::string user_activity;
    float friend_threshold = 0.0f;
    double vibe_roll = 1.0;           // Uniform [0, 1) draw for the idle vibe rule
};

struct InterjectionRule {
    const char* name;
    InterjectReason reason;
    float boost;
    /// Returns true on a match and fills hint with a short explanation
    std::function<bool(const RuleInput& input, std::string* hint)> predicate;
};

struct RuleMatch {
    const char* rule = "";
    InterjectReason reason = InterjectReason::Comment;
    float boost = 0.0f;
    std::string hint;
};

// Topic lists
const std::vector<std::string>& helpful_topics();
const std::vector<std::string>& fun_topics();

/**
 * Default table, highest priority first:
 *   stress (CheckIn 0.5), helpful topic (HelpfulInfo 0.4),
 *   screen assist (HelpfulInfo 0.4), question (HelpfulInfo 0.35),
 *   fun topic (Comment 0.3), chill scene (Vibe 0.2), idle vibe (Vibe 0.1)
 */
const std::vector<InterjectionRule>& default_interjection_rules();

/// First matching rule, if any
std::optional<RuleMatch> evaluate_rules(const std::vector<InterjectionRule>& rules,
                                        const RuleInput& input);

/// clamp01(friend_threshold * 0.3 + boost), scaled by 0.3 when the user is busy
float compute_interjection_probability(float friend_threshold, float boost, bool user_busy);

}  // namespace ambient
}  // namespace voxgate

#endif  // VOXGATE_INTERJECTION_RULES_H
