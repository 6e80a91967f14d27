/**
 * @file interjection_rules.cpp
 * @brief voxgate - Default interjection rule table
 */

#include "voxgate/ambient/interjection_rules.h"

#include <algorithm>
#include <utility>

#include "voxgate/ambient/sensor_context.h"
#include "voxgate/util/text_match.h"

namespace voxgate {
namespace ambient {

namespace {

constexpr float kBaseProbabilityScale = 0.3f;
constexpr float kBusyMultiplier = 0.3f;
constexpr double kIdleVibeScale = 0.02;

const std::vector<std::string> kScreenAssistKeywords = {"error", "stuck", "searching",
                                                        "looking for"};
const std::vector<std::string> kCameraChillKeywords = {"smoking", "blunt", "relaxing", "drink"};
const std::vector<std::string> kCameraStressKeywords = {"stressed", "frustrated", "tired",
                                                        "head in hands"};
const std::vector<std::string> kQuestionOpeners = {"what", "how", "why", "where",
                                                   "when", "who",  "can"};

std::string heard_mention(const std::string& topic) {
    return "heard mention of '" + topic + "'";
}

bool stress_rule(const RuleInput& in, std::string* hint) {
    if (in.source == TriggerSource::Camera &&
        util::contains_any(in.lowered, kCameraStressKeywords)) {
        *hint = "user looks stressed: " + util::truncate(in.text, 100);
        return true;
    }
    if (in.source == TriggerSource::Audio && util::contains_any(in.lowered, stress_indicators())) {
        *hint = "user seems stressed";
        return true;
    }
    if (in.user_stressed) {
        *hint = "user seems stressed";
        return true;
    }
    return false;
}

bool helpful_topic_rule(const RuleInput& in, std::string* hint) {
    std::string topic;
    if (in.source == TriggerSource::Audio && util::contains_any(in.lowered, helpful_topics(), &topic)) {
        *hint = heard_mention(topic);
        return true;
    }
    return false;
}

bool screen_assist_rule(const RuleInput& in, std::string* hint) {
    if (in.source == TriggerSource::Screen &&
        util::contains_any(in.lowered, kScreenAssistKeywords)) {
        *hint = "noticed on screen: " + util::truncate(in.text, 100);
        return true;
    }
    return false;
}

bool question_rule(const RuleInput& in, std::string* hint) {
    if (in.source != TriggerSource::Audio || in.user_busy) {
        return false;
    }
    if (in.text.find('?') != std::string::npos ||
        util::starts_with_any(util::trim(in.lowered), kQuestionOpeners)) {
        *hint = "heard a question: " + util::truncate(in.text, 50);
        return true;
    }
    return false;
}

bool fun_topic_rule(const RuleInput& in, std::string* hint) {
    std::string topic;
    if (in.source == TriggerSource::Audio && !in.user_busy &&
        util::contains_any(in.lowered, fun_topics(), &topic)) {
        *hint = heard_mention(topic);
        return true;
    }
    return false;
}

bool chill_scene_rule(const RuleInput& in, std::string* hint) {
    if (in.source == TriggerSource::Camera &&
        util::contains_any(in.lowered, kCameraChillKeywords)) {
        *hint = "saw user: " + util::truncate(in.text, 100);
        return true;
    }
    return false;
}

bool idle_vibe_rule(const RuleInput& in, std::string* hint) {
    if (in.source == TriggerSource::Audio && !in.user_busy && in.user_activity == "chilling" &&
        in.vibe_roll < kIdleVibeScale * in.friend_threshold) {
        *hint = "just vibing";
        return true;
    }
    return false;
}

}  // namespace

const char* interject_reason_name(InterjectReason reason) {
    switch (reason) {
        case InterjectReason::HelpfulInfo:
            return "helpful_info";
        case InterjectReason::Joke:
            return "joke";
        case InterjectReason::CheckIn:
            return "check_in";
        case InterjectReason::Comment:
            return "comment";
        case InterjectReason::Question:
            return "question";
        case InterjectReason::Alert:
            return "alert";
        case InterjectReason::Vibe:
            return "vibe";
    }
    return "comment";
}

const char* trigger_source_name(TriggerSource source) {
    switch (source) {
        case TriggerSource::Audio:
            return "audio";
        case TriggerSource::Screen:
            return "screen";
        case TriggerSource::Camera:
            return "camera";
        case TriggerSource::Silence:
            return "silence";
    }
    return "audio";
}

const std::vector<std::string>& helpful_topics() {
    static const std::vector<std::string> topics = {
        "weather", "time",  "reminder", "schedule", "meeting", "email",   "message", "call",
        "todo",    "task",  "deadline", "code",     "error",   "bug",     "fix",     "help",
        "how to",  "what is", "recipe", "directions", "address", "phone number",
    };
    return topics;
}

const std::vector<std::string>& fun_topics() {
    static const std::vector<std::string> topics = {
        "music", "movie",   "game", "food",  "drink", "party", "weekend", "vacation", "funny",
        "crazy", "awesome", "weed", "smoke", "blunt", "high",  "chill",   "relax",
    };
    return topics;
}

const std::vector<InterjectionRule>& default_interjection_rules() {
    static const std::vector<InterjectionRule> rules = {
        {"stress", InterjectReason::CheckIn, 0.5f, stress_rule},
        {"helpful_topic", InterjectReason::HelpfulInfo, 0.4f, helpful_topic_rule},
        {"screen_assist", InterjectReason::HelpfulInfo, 0.4f, screen_assist_rule},
        {"question", InterjectReason::HelpfulInfo, 0.35f, question_rule},
        {"fun_topic", InterjectReason::Comment, 0.3f, fun_topic_rule},
        {"chill_scene", InterjectReason::Vibe, 0.2f, chill_scene_rule},
        {"idle_vibe", InterjectReason::Vibe, 0.1f, idle_vibe_rule},
    };
    return rules;
}

std::optional<RuleMatch> evaluate_rules(const std::vector<InterjectionRule>& rules,
                                        const RuleInput& input) {
    for (const auto& rule : rules) {
        std::string hint;
        if (rule.predicate && rule.predicate(input, &hint)) {
            RuleMatch match;
            match.rule = rule.name;
            match.reason = rule.reason;
            match.boost = rule.boost;
            match.hint = std::move(hint);
            return match;
        }
    }
    return std::nullopt;
}

float compute_interjection_probability(float friend_threshold, float boost, bool user_busy) {
    float probability = friend_threshold * kBaseProbabilityScale + boost;
    probability = std::max(0.0f, std::min(1.0f, probability));
    if (user_busy) {
        probability *= kBusyMultiplier;
    }
    return probability;
}

}  // namespace ambient
}  // namespace voxgate
