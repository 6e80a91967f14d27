/**
 * @file test_interjection_rules.cpp
 * @brief Tests for the rule table, the probability formula and sensor fusion
 */

#include <gtest/gtest.h>

#include <string>

#include "voxgate/ambient/interjection_rules.h"
#include "voxgate/ambient/sensor_context.h"
#include "voxgate/util/text_match.h"

using namespace voxgate::ambient;

namespace {

RuleInput make_input(const std::string& text, TriggerSource source = TriggerSource::Audio,
                     bool busy = false) {
    RuleInput input;
    input.text = text;
    input.lowered = voxgate::util::to_lower(text);
    input.source = source;
    input.user_busy = busy;
    input.friend_threshold = 0.5f;
    return input;
}

RuleMatch must_match(const RuleInput& input) {
    auto match = evaluate_rules(default_interjection_rules(), input);
    EXPECT_TRUE(match.has_value()) << "no rule matched: " << input.text;
    return match.value_or(RuleMatch());
}

}  // namespace

// =============================================================================
// RULE TABLE
// =============================================================================

TEST(InterjectionRules, StressedSpeechGetsCheckIn) {
    RuleMatch match = must_match(make_input("ugh this is so frustrating"));
    EXPECT_EQ(match.reason, InterjectReason::CheckIn);
    EXPECT_GE(match.boost, 0.5f);
    EXPECT_STREQ(match.rule, "stress");
    EXPECT_EQ(match.hint, "user seems stressed");
}

TEST(InterjectionRules, StressOutranksHelpfulTopic) {
    RuleMatch match = must_match(make_input("this stupid code is broken"));
    EXPECT_EQ(match.reason, InterjectReason::CheckIn);
}

TEST(InterjectionRules, StickyStressFlagMatchesAnySource) {
    RuleInput input = make_input("a calm spreadsheet", TriggerSource::Screen);
    input.user_stressed = true;
    EXPECT_EQ(must_match(input).reason, InterjectReason::CheckIn);
}

TEST(InterjectionRules, HelpfulTopicReportsFirstListedTopic) {
    RuleMatch match = must_match(make_input("remind me to check email about the meeting"));
    EXPECT_EQ(match.reason, InterjectReason::HelpfulInfo);
    EXPECT_FLOAT_EQ(match.boost, 0.4f);
    EXPECT_EQ(match.hint, "heard mention of 'meeting'");
}

TEST(InterjectionRules, ScreenAssistOnlyForScreenSource) {
    RuleMatch match = must_match(make_input("Terminal shows a build Error", TriggerSource::Screen));
    EXPECT_STREQ(match.rule, "screen_assist");
    EXPECT_EQ(match.hint, "noticed on screen: Terminal shows a build Error");

    auto camera = evaluate_rules(default_interjection_rules(),
                                 make_input("person looking for keys", TriggerSource::Camera));
    EXPECT_FALSE(camera.has_value());
}

TEST(InterjectionRules, QuestionRuleSkippedWhenBusy) {
    RuleMatch match = must_match(make_input("can you pass the salt"));
    EXPECT_STREQ(match.rule, "question");
    EXPECT_FLOAT_EQ(match.boost, 0.35f);

    auto busy = evaluate_rules(default_interjection_rules(),
                               make_input("where did I put it?", TriggerSource::Audio, true));
    EXPECT_FALSE(busy.has_value());
}

TEST(InterjectionRules, FunTopicIsCommentUnlessBusy) {
    RuleMatch match = must_match(make_input("that movie last night"));
    EXPECT_EQ(match.reason, InterjectReason::Comment);
    EXPECT_FLOAT_EQ(match.boost, 0.3f);

    auto busy = evaluate_rules(default_interjection_rules(),
                               make_input("that movie last night", TriggerSource::Audio, true));
    EXPECT_FALSE(busy.has_value());
}

TEST(InterjectionRules, CameraRules) {
    RuleMatch stressed = must_match(make_input("Person with head in hands", TriggerSource::Camera));
    EXPECT_EQ(stressed.reason, InterjectReason::CheckIn);
    EXPECT_EQ(stressed.hint, "user looks stressed: Person with head in hands");

    RuleMatch chill = must_match(make_input("Person relaxing with a drink", TriggerSource::Camera));
    EXPECT_EQ(chill.reason, InterjectReason::Vibe);
    EXPECT_FLOAT_EQ(chill.boost, 0.2f);
}

TEST(InterjectionRules, IdleVibeNeedsChillingAndLowRoll) {
    RuleInput input = make_input("nice");
    input.user_activity = "chilling";
    input.friend_threshold = 1.0f;

    input.vibe_roll = 0.019;
    RuleMatch match = must_match(input);
    EXPECT_STREQ(match.rule, "idle_vibe");
    EXPECT_EQ(match.hint, "just vibing");

    input.vibe_roll = 0.021;
    EXPECT_FALSE(evaluate_rules(default_interjection_rules(), input).has_value());

    input.vibe_roll = 0.0;
    input.user_activity = "working";
    EXPECT_FALSE(evaluate_rules(default_interjection_rules(), input).has_value());
}

TEST(InterjectionRules, NothingMatchesPlainChatter) {
    EXPECT_FALSE(evaluate_rules(default_interjection_rules(), make_input("okay")).has_value());
}

TEST(InterjectionRules, CustomTableIsEvaluatedInOrder) {
    std::vector<InterjectionRule> rules = {
        {"never", InterjectReason::Alert, 0.9f,
         [](const RuleInput&, std::string*) { return false; }},
        {"always", InterjectReason::Joke, 0.1f,
         [](const RuleInput&, std::string* hint) {
             *hint = "always";
             return true;
         }},
    };
    auto match = evaluate_rules(rules, make_input("anything"));
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->reason, InterjectReason::Joke);
    EXPECT_STREQ(interject_reason_name(match->reason), "joke");
}

// =============================================================================
// PROBABILITY
// =============================================================================

TEST(InterjectionProbability, Formula) {
    EXPECT_NEAR(compute_interjection_probability(0.5f, 0.4f, false), 0.55f, 1e-6);
    EXPECT_NEAR(compute_interjection_probability(0.5f, 0.4f, true), 0.165f, 1e-6);
    EXPECT_FLOAT_EQ(compute_interjection_probability(1.0f, 0.9f, false), 1.0f);
    EXPECT_NEAR(compute_interjection_probability(1.0f, 0.9f, true), 0.3f, 1e-6);
    EXPECT_FLOAT_EQ(compute_interjection_probability(0.0f, 0.0f, false), 0.0f);
}

// =============================================================================
// SENSOR FUSION
// =============================================================================

TEST(SensorContext, SentimentClassification) {
    EXPECT_EQ(classify_sentiment("I am so tired of this"), Sentiment::Stressed);
    EXPECT_EQ(classify_sentiment("this is great"), Sentiment::Positive);
    EXPECT_EQ(classify_sentiment("love it but it's broken"), Sentiment::Stressed);
    EXPECT_EQ(classify_sentiment("okay"), Sentiment::Neutral);
}

TEST(SensorContext, CameraAssessment) {
    CameraAssessment working = assess_camera_view("Person typing at a keyboard, smiling");
    EXPECT_EQ(working.activity, "working");
    EXPECT_EQ(working.expression, "happy");
    EXPECT_TRUE(working.busy_changed);
    EXPECT_TRUE(working.busy);

    CameraAssessment phone = assess_camera_view("Person on the phone");
    EXPECT_EQ(phone.activity, "talking");
    EXPECT_FALSE(phone.busy_changed);

    CameraAssessment focused = assess_camera_view("Person on the couch, concentrating");
    EXPECT_EQ(focused.activity, "relaxing");
    EXPECT_EQ(focused.expression, "focused");
    EXPECT_TRUE(focused.busy);

    CameraAssessment frowning = assess_camera_view("someone frowning");
    EXPECT_TRUE(frowning.stressed);
    EXPECT_TRUE(frowning.activity.empty());
}

TEST(SensorContext, StressFlagsResetIndependently) {
    SensorContext context;
    context.add_transcript("ugh", 10, 1000);
    context.apply_camera_view("person looks tired");
    EXPECT_TRUE(context.speech_stressed);
    EXPECT_TRUE(context.visual_stressed);
    EXPECT_TRUE(context.user_seems_stressed);

    context.add_transcript("that's nice", 10, 2000);
    EXPECT_FALSE(context.speech_stressed);
    EXPECT_TRUE(context.user_seems_stressed);
    EXPECT_EQ(context.user_mood, "positive");

    context.apply_camera_view("person sitting");
    EXPECT_FALSE(context.user_seems_stressed);
    EXPECT_EQ(context.user_activity, "relaxing");
}

TEST(SensorContext, TranscriptBufferIsBounded) {
    SensorContext context;
    context.silence_duration_s = 42.0;
    for (int i = 0; i < 15; ++i) {
        context.add_transcript("line " + std::to_string(i), 10, 1000 + i);
    }
    ASSERT_EQ(context.recent_transcripts.size(), 10u);
    EXPECT_EQ(context.recent_transcripts.front(), "line 5");
    EXPECT_EQ(context.last_interaction_ms, 1014);
    EXPECT_DOUBLE_EQ(context.silence_duration_s, 0.0);
}
