/**
 * @file presence_gate.h
 * @brief voxgate - Cached "is the user present" check
 */

#ifndef VOXGATE_PRESENCE_GATE_H
#define VOXGATE_PRESENCE_GATE_H

#include <cstdint>
#include <functional>
#include <mutex>

#include "voxgate/core/vg_clock.h"

namespace voxgate {
namespace speech {

using PresenceProbeFn = std::function<bool()>;

/**
 * Wraps the host's presence probe with a short-lived cache. Without a probe,
 * or when the probe throws, the user counts as present.
 */
class PresenceGate {
public:
    explicit PresenceGate(PresenceProbeFn probe = nullptr, int64_t cache_ttl_ms = 5000,
                          const Clock* clock = nullptr);

    PresenceGate(const PresenceGate&) = delete;
    PresenceGate& operator=(const PresenceGate&) = delete;

    bool is_user_present();

    /// Forces the next call to probe again
    void invalidate();

    bool has_probe() const { return static_cast<bool>(probe_); }

private:
    PresenceProbeFn probe_;
    int64_t cache_ttl_ms_;
    const Clock& clock_;

    bool cached_ = true;
    bool has_cached_ = false;
    int64_t checked_at_ms_ = 0;
    std::mutex mutex_;
};

}  // namespace speech
}  // namespace voxgate

#endif  // VOXGATE_PRESENCE_GATE_H
