/**
 * @file echo_suppressor.h
 * @brief voxgate - Time/text window that rejects the assistant's own voice
 *
 * The speech worker arms a window before each utterance. While the window is
 * open every recognised transcript is rejected; for a while afterwards (until
 * the utterance's planned window plus text_memory_s has passed) transcripts
 * that match recently spoken text are rejected too. Confirmed echoes can be
 * blacklisted permanently with mark_as_echo().
 *
 * No signal processing is involved: this is a coarse text/time filter.
 */

#ifndef VOXGATE_ECHO_SUPPRESSOR_H
#define VOXGATE_ECHO_SUPPRESSOR_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "voxgate/core/vg_clock.h"

namespace voxgate {
namespace echo {

// =============================================================================
// Configuration
// =============================================================================

struct EchoSuppressorConfig {
    // Timing (seconds)
    double filter_duration_s = 3.0;     // Window when no estimate is made (adaptive off)
    double grace_period_s = 0.5;        // Added after every window for room reverb
    // Extra time spoken text stays matchable. At 0 the time gate already covers
    // every text match, so history only matters after stop_speaking(); matching
    // recent utterances past their window requires text_memory_s > 0.
    double text_memory_s = 0.0;

    // Adaptive duration estimate: max(min, words * seconds_per_word), capped at max
    bool adaptive = true;
    double seconds_per_word = 0.4;
    double min_estimate_s = 1.0;
    double max_estimate_s = 15.0;

    float min_confidence = 0.7f;        // Below this a transcript is rejected
    size_t history_capacity = 10;       // Spoken-text ring buffer
};

struct EchoStatus {
    bool speaking = false;
    double time_until_clear_s = 0.0;
    std::string last_spoken;
    size_t history_size = 0;
    size_t blacklist_size = 0;
    uint64_t filtered_count = 0;
    uint64_t passed_count = 0;
};

/// Adaptive speaking-time estimate for text, in seconds
double estimate_speech_duration(const std::string& text, const EchoSuppressorConfig& config);

// =============================================================================
// EchoSuppressor
// =============================================================================

class EchoSuppressor {
public:
    explicit EchoSuppressor(const EchoSuppressorConfig& config = EchoSuppressorConfig(),
                            const Clock* clock = nullptr);

    // Non-copyable
    EchoSuppressor(const EchoSuppressor&) = delete;
    EchoSuppressor& operator=(const EchoSuppressor&) = delete;

    /**
     * Opens the window for duration_s plus the grace period and remembers text.
     * A non-positive duration falls back to filter_duration_s.
     */
    void start_speaking(double duration_s, const std::string& text);

    /// Duration taken from the adaptive estimate (or filter_duration_s when adaptive is off)
    void start_speaking(const std::string& text);

    /// Closes the time window now; remembered text keeps matching until its own expiry
    void stop_speaking();

    /**
     * Decides whether a recognised transcript is genuine user speech.
     *
     * @return false while the window is open, when confidence is below the
     *         minimum, or when the text matches recent speech or the blacklist
     */
    bool should_process(const std::string& candidate_text, float confidence);

    /// Permanently rejects text (and anything containing or contained in it)
    void mark_as_echo(const std::string& text);

    void add_blacklist_phrase(const std::string& phrase);

    /// Forgets spoken text (blacklist is kept)
    void clear_history();

    bool is_speaking() const;

    /// Seconds until the time window closes (0 when clear)
    double time_until_clear() const;

    EchoStatus get_status() const;

    const EchoSuppressorConfig& config() const { return config_; }

private:
    struct SpokenEntry {
        std::string text;
        int64_t match_until_ms = 0;
    };

    bool matches_locked(const std::string& candidate, int64_t now_ms, std::string* matched) const;
    void add_blacklist_locked(const std::string& phrase);

    EchoSuppressorConfig config_;
    const Clock& clock_;

    int64_t expires_at_ms_ = 0;
    SpokenEntry last_spoken_;
    std::deque<SpokenEntry> history_;
    std::vector<std::string> blacklist_;

    uint64_t filtered_count_ = 0;
    uint64_t passed_count_ = 0;

    mutable std::mutex mutex_;
};

}  // namespace echo
}  // namespace voxgate

#endif  // VOXGATE_ECHO_SUPPRESSOR_H
