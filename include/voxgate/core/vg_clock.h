/**
 * @file vg_clock.h
 * @brief voxgate - Wall-clock source shared by all components
 *
 * Components read time only through a Clock so tests can drive windows,
 * cooldowns and decay deterministically. Wall time (not steady time) is used
 * because the speech lock sidecar is compared across processes.
 */

#ifndef VOXGATE_VG_CLOCK_H
#define VOXGATE_VG_CLOCK_H

#include <cstdint>

namespace voxgate {

class Clock {
public:
    virtual ~Clock() = default;

    /// Milliseconds since the Unix epoch
    virtual int64_t now_ms() const = 0;

    double now_seconds() const { return static_cast<double>(now_ms()) / 1000.0; }
};

class SystemClock : public Clock {
public:
    int64_t now_ms() const override;

    /// Process-wide instance used when no clock is injected
    static const SystemClock& instance();
};

/// Returns clock if non-null, otherwise SystemClock::instance()
inline const Clock& clock_or_system(const Clock* clock) {
    return clock != nullptr ? *clock : SystemClock::instance();
}

}  // namespace voxgate

#endif  // VOXGATE_VG_CLOCK_H
