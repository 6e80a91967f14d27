/**
 * @file test_echo_suppressor.cpp
 * @brief Tests for the echo window
 */

#include <gtest/gtest.h>

#include "test_helpers.h"
#include "voxgate/echo/echo_suppressor.h"

using voxgate::echo::EchoSuppressor;
using voxgate::echo::EchoSuppressorConfig;
using voxgate::test::ManualClock;

// =============================================================================
// TIME WINDOW
// =============================================================================

TEST(EchoSuppressor, RejectsSpokenTextUntilWindowAndGraceElapse) {
    ManualClock clock;
    EchoSuppressor echo(EchoSuppressorConfig(), &clock);   // grace 0.5 s

    echo.start_speaking(2.0, "The meeting starts at noon");

    // t0 .. t0 + 2.5 s: rejected
    for (int ms = 0; ms < 2500; ms += 100) {
        EXPECT_FALSE(echo.should_process("The meeting starts at noon", 1.0f)) << "at " << ms;
        clock.advance_ms(100);
    }

    // t0 + 2.5 s: accepted
    EXPECT_TRUE(echo.should_process("The meeting starts at noon", 1.0f));
}

TEST(EchoSuppressor, RejectsAnyTextWhileSpeaking) {
    ManualClock clock;
    EchoSuppressor echo(EchoSuppressorConfig(), &clock);

    echo.start_speaking(3.0, "hello there");
    EXPECT_TRUE(echo.is_speaking());
    EXPECT_FALSE(echo.should_process("completely different words", 1.0f));
    EXPECT_NEAR(echo.time_until_clear(), 3.5, 1e-9);
}

TEST(EchoSuppressor, StopSpeakingClearsWindowButKeepsTextMatch) {
    ManualClock clock;
    EchoSuppressor echo(EchoSuppressorConfig(), &clock);

    echo.start_speaking(5.0, "I found three results");
    clock.advance_s(1.0);
    echo.stop_speaking();

    EXPECT_FALSE(echo.is_speaking());
    EXPECT_DOUBLE_EQ(echo.time_until_clear(), 0.0);
    EXPECT_TRUE(echo.should_process("what about the fourth one", 1.0f));
    EXPECT_FALSE(echo.should_process("three results", 1.0f));

    // Text memory ends with the originally planned window
    clock.advance_s(5.0);
    EXPECT_TRUE(echo.should_process("three results", 1.0f));
}

TEST(EchoSuppressor, OverlappingUtterancesNeverShortenWindow) {
    ManualClock clock;
    EchoSuppressor echo(EchoSuppressorConfig(), &clock);

    echo.start_speaking(10.0, "long sentence");
    echo.start_speaking(1.0, "short");
    clock.advance_s(5.0);
    EXPECT_TRUE(echo.is_speaking());
}

// =============================================================================
// TEXT MATCHING
// =============================================================================

TEST(EchoSuppressor, TextMemoryExtendsMatchingPastWindow) {
    ManualClock clock;
    EchoSuppressorConfig config;
    config.text_memory_s = 10.0;
    EchoSuppressor echo(config, &clock);

    echo.start_speaking(1.0, "Turning on the lights");
    clock.advance_s(2.0);

    EXPECT_FALSE(echo.should_process("turning on the lights", 1.0f));   // equal
    EXPECT_FALSE(echo.should_process("on the lights", 1.0f));           // substring of
    EXPECT_FALSE(echo.should_process("ok turning on the lights now", 1.0f));  // contains
    EXPECT_TRUE(echo.should_process("turn them off", 1.0f));

    clock.advance_s(10.0);
    EXPECT_TRUE(echo.should_process("turning on the lights", 1.0f));
}

TEST(EchoSuppressor, HistoryMatchesPastWindowOnlyWithTextMemory) {
    ManualClock clock;
    EchoSuppressor plain(EchoSuppressorConfig(), &clock);
    EchoSuppressorConfig config;
    config.text_memory_s = 30.0;
    EchoSuppressor remembering(config, &clock);

    plain.start_speaking(1.0, "The laundry is done");
    remembering.start_speaking(1.0, "The laundry is done");
    clock.advance_s(2.0);
    plain.start_speaking(1.0, "Dinner is at seven");
    remembering.start_speaking(1.0, "Dinner is at seven");
    clock.advance_s(2.0);

    // Both windows are over; only the older history entry is asked about
    EXPECT_TRUE(plain.should_process("the laundry is done", 1.0f));
    EXPECT_FALSE(remembering.should_process("the laundry is done", 1.0f));
    EXPECT_TRUE(remembering.should_process("is it raining", 1.0f));
}

TEST(EchoSuppressor, LowConfidenceIsRejected) {
    ManualClock clock;
    EchoSuppressor echo(EchoSuppressorConfig(), &clock);

    EXPECT_FALSE(echo.should_process("hello", 0.5f));
    EXPECT_TRUE(echo.should_process("hello", 0.7f));
}

TEST(EchoSuppressor, EmptyCandidateIsNotAnEcho) {
    ManualClock clock;
    EchoSuppressorConfig config;
    config.text_memory_s = 60.0;
    EchoSuppressor echo(config, &clock);

    echo.start_speaking(1.0, "something");
    clock.advance_s(2.0);
    EXPECT_TRUE(echo.should_process("   ", 1.0f));
}

TEST(EchoSuppressor, MarkAsEchoBlacklistsPermanently) {
    ManualClock clock;
    EchoSuppressor echo(EchoSuppressorConfig(), &clock);

    echo.mark_as_echo("  Okay Boss ");
    clock.advance_s(3600.0);

    EXPECT_FALSE(echo.should_process("okay boss", 1.0f));
    EXPECT_FALSE(echo.should_process("okay boss, done", 1.0f));
    EXPECT_TRUE(echo.should_process("play some music", 1.0f));
    EXPECT_EQ(echo.get_status().blacklist_size, 1u);

    echo.clear_history();
    EXPECT_FALSE(echo.should_process("okay boss", 1.0f));
}

TEST(EchoSuppressor, HistoryIsBoundedOldestFirst) {
    ManualClock clock;
    EchoSuppressorConfig config;
    config.history_capacity = 3;
    config.text_memory_s = 600.0;
    EchoSuppressor echo(config, &clock);

    echo.start_speaking(1.0, "alpha");
    echo.start_speaking(1.0, "bravo");
    echo.start_speaking(1.0, "charlie");
    echo.start_speaking(1.0, "delta");
    clock.advance_s(5.0);

    EXPECT_EQ(echo.get_status().history_size, 3u);
    EXPECT_TRUE(echo.should_process("alpha", 1.0f));
    EXPECT_FALSE(echo.should_process("bravo", 1.0f));
    EXPECT_FALSE(echo.should_process("delta", 1.0f));
}

// =============================================================================
// ADAPTIVE DURATION
// =============================================================================

TEST(EchoSuppressor, AdaptiveEstimate) {
    EchoSuppressorConfig config;
    EXPECT_DOUBLE_EQ(voxgate::echo::estimate_speech_duration("hi", config), 1.0);
    EXPECT_DOUBLE_EQ(voxgate::echo::estimate_speech_duration("one two three four five", config),
                     2.0);

    std::string long_text;
    for (int i = 0; i < 100; ++i) long_text += "word ";
    EXPECT_DOUBLE_EQ(voxgate::echo::estimate_speech_duration(long_text, config), 15.0);
}

TEST(EchoSuppressor, StartSpeakingWithoutDurationUsesEstimate) {
    ManualClock clock;
    EchoSuppressor echo(EchoSuppressorConfig(), &clock);

    echo.start_speaking("one two three four five");   // 2.0 s + 0.5 s
    clock.advance_ms(2400);
    EXPECT_TRUE(echo.is_speaking());
    clock.advance_ms(100);
    EXPECT_FALSE(echo.is_speaking());
}

TEST(EchoSuppressor, StatusCountsDecisions) {
    voxgate::test::QuietLogs quiet;
    ManualClock clock;
    EchoSuppressor echo(EchoSuppressorConfig(), &clock);

    echo.start_speaking(1.0, "ping");
    EXPECT_FALSE(echo.should_process("pong", 1.0f));
    clock.advance_s(2.0);
    EXPECT_TRUE(echo.should_process("pong", 1.0f));

    auto status = echo.get_status();
    EXPECT_EQ(status.filtered_count, 1u);
    EXPECT_EQ(status.passed_count, 1u);
    EXPECT_EQ(status.last_spoken, "ping");
}
