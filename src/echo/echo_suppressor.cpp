/**
 * @file echo_suppressor.cpp
 * @brief voxgate - Echo window implementation
 */

#include "voxgate/echo/echo_suppressor.h"

#include <algorithm>
#include <cmath>

#include "voxgate/core/vg_logger.h"
#include "voxgate/util/text_match.h"

#define LOG_TAG "EchoSuppressor"
#define LOGD(...) VG_LOG_DEBUG(LOG_TAG, __VA_ARGS__)
#define LOGI(...) VG_LOG_INFO(LOG_TAG, __VA_ARGS__)

namespace voxgate {
namespace echo {

namespace {

int64_t seconds_to_ms(double seconds) {
    return static_cast<int64_t>(std::llround(seconds * 1000.0));
}

// Equal, substring of, or containing
bool texts_overlap(const std::string& candidate, const std::string& reference) {
    if (candidate.empty() || reference.empty()) {
        return false;
    }
    return candidate == reference || reference.find(candidate) != std::string::npos ||
           candidate.find(reference) != std::string::npos;
}

}  // namespace

double estimate_speech_duration(const std::string& text, const EchoSuppressorConfig& config) {
    double words = static_cast<double>(util::word_count(text));
    double estimate = std::max(config.min_estimate_s, words * config.seconds_per_word);
    return std::min(estimate, config.max_estimate_s);
}

EchoSuppressor::EchoSuppressor(const EchoSuppressorConfig& config, const Clock* clock)
    : config_(config), clock_(clock_or_system(clock)) {
    if (config_.history_capacity == 0) {
        config_.history_capacity = 1;
    }
    if (config_.grace_period_s < 0.0) {
        config_.grace_period_s = 0.0;
    }
    if (config_.text_memory_s < 0.0) {
        config_.text_memory_s = 0.0;
    }
}

// =============================================================================
// Window control
// =============================================================================

void EchoSuppressor::start_speaking(double duration_s, const std::string& text) {
    if (duration_s <= 0.0) {
        duration_s = config_.filter_duration_s;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_.now_ms();
    int64_t window_end = now + seconds_to_ms(duration_s + config_.grace_period_s);

    // Overlapping utterances extend, never shorten, the window
    expires_at_ms_ = std::max(expires_at_ms_, window_end);

    SpokenEntry entry;
    entry.text = util::normalize(text);
    entry.match_until_ms = window_end + seconds_to_ms(config_.text_memory_s);

    last_spoken_ = entry;
    if (!entry.text.empty()) {
        history_.push_back(entry);
        while (history_.size() > config_.history_capacity) {
            history_.pop_front();
        }
    }

    LOGD("Speaking for %.2fs (+%.2fs grace): \"%s\"", duration_s, config_.grace_period_s,
         util::truncate(entry.text, 60).c_str());
}

void EchoSuppressor::start_speaking(const std::string& text) {
    double duration = config_.adaptive ? estimate_speech_duration(text, config_)
                                       : config_.filter_duration_s;
    start_speaking(duration, text);
}

void EchoSuppressor::stop_speaking() {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_.now_ms();
    if (expires_at_ms_ > now) {
        expires_at_ms_ = now;
    }
}

// =============================================================================
// Filtering
// =============================================================================

bool EchoSuppressor::matches_locked(const std::string& candidate, int64_t now_ms,
                                    std::string* matched) const {
    for (const auto& phrase : blacklist_) {
        if (texts_overlap(candidate, phrase)) {
            *matched = "blacklist";
            return true;
        }
    }

    if (now_ms < last_spoken_.match_until_ms && texts_overlap(candidate, last_spoken_.text)) {
        *matched = "last spoken";
        return true;
    }

    for (const auto& entry : history_) {
        if (now_ms < entry.match_until_ms && texts_overlap(candidate, entry.text)) {
            *matched = "history";
            return true;
        }
    }
    return false;
}

bool EchoSuppressor::should_process(const std::string& candidate_text, float confidence) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_.now_ms();

    if (now < expires_at_ms_) {
        ++filtered_count_;
        LOGD("Filtered (speaking, %.2fs left)",
             static_cast<double>(expires_at_ms_ - now) / 1000.0);
        return false;
    }

    if (confidence < config_.min_confidence) {
        ++filtered_count_;
        LOGD("Filtered (confidence %.2f < %.2f)", confidence, config_.min_confidence);
        return false;
    }

    std::string candidate = util::normalize(candidate_text);
    std::string matched;
    if (matches_locked(candidate, now, &matched)) {
        ++filtered_count_;
        LOGD("Filtered (%s match): \"%s\"", matched.c_str(),
             util::truncate(candidate, 60).c_str());
        return false;
    }

    ++passed_count_;
    return true;
}

// =============================================================================
// Blacklist / history
// =============================================================================

void EchoSuppressor::add_blacklist_locked(const std::string& phrase) {
    std::string normalized = util::normalize(phrase);
    if (normalized.empty()) {
        return;
    }
    if (std::find(blacklist_.begin(), blacklist_.end(), normalized) != blacklist_.end()) {
        return;
    }
    blacklist_.push_back(normalized);
}

void EchoSuppressor::mark_as_echo(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    add_blacklist_locked(text);
    LOGI("Marked as echo: \"%s\"", util::truncate(util::normalize(text), 60).c_str());
}

void EchoSuppressor::add_blacklist_phrase(const std::string& phrase) {
    std::lock_guard<std::mutex> lock(mutex_);
    add_blacklist_locked(phrase);
}

void EchoSuppressor::clear_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
    last_spoken_ = SpokenEntry();
}

// =============================================================================
// Status
// =============================================================================

bool EchoSuppressor::is_speaking() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clock_.now_ms() < expires_at_ms_;
}

double EchoSuppressor::time_until_clear() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t remaining = expires_at_ms_ - clock_.now_ms();
    return remaining > 0 ? static_cast<double>(remaining) / 1000.0 : 0.0;
}

EchoStatus EchoSuppressor::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t remaining = expires_at_ms_ - clock_.now_ms();

    EchoStatus status;
    status.speaking = remaining > 0;
    status.time_until_clear_s = remaining > 0 ? static_cast<double>(remaining) / 1000.0 : 0.0;
    status.last_spoken = last_spoken_.text;
    status.history_size = history_.size();
    status.blacklist_size = blacklist_.size();
    status.filtered_count = filtered_count_;
    status.passed_count = passed_count_;
    return status;
}

}  // namespace echo
}  // namespace voxgate
