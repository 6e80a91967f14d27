#include "voxgate/speech/presence_gate.h"

#include <exception>
#include <utility>

#include "voxgate/core/vg_error.h"
#include "voxgate/core/vg_logger.h"

#define LOG_TAG "Presence"
#define LOGD(...) VG_LOG_DEBUG(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VG_LOG_WARNING(LOG_TAG, __VA_ARGS__)

namespace voxgate {
namespace speech {

PresenceGate::PresenceGate(PresenceProbeFn probe, int64_t cache_ttl_ms, const Clock* clock)
    : probe_(std::move(probe)), cache_ttl_ms_(cache_ttl_ms), clock_(clock_or_system(clock)) {}

bool PresenceGate::is_user_present() {
    if (!probe_) {
        return true;
    }

    // The probe runs under the gate's mutex so concurrent callers share one result
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_.now_ms();
    if (has_cached_ && now - checked_at_ms_ < cache_ttl_ms_) {
        return cached_;
    }

    bool present = true;
    try {
        present = probe_();
    } catch (const std::exception& e) {
        LOGW("%s: presence probe threw (%s), assuming present",
             vg_error_message(VG_ERROR_EXTERNAL_CALL), e.what());
        present = true;
    } catch (...) {
        LOGW("%s: presence probe threw an unknown exception, assuming present",
             vg_error_message(VG_ERROR_EXTERNAL_CALL));
        present = true;
    }

    if (has_cached_ && present != cached_) {
        LOGD("User %s", present ? "returned" : "left");
    }
    cached_ = present;
    has_cached_ = true;
    checked_at_ms_ = now;
    return present;
}

void PresenceGate::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    has_cached_ = false;
}

}  // namespace speech
}  // namespace voxgate
