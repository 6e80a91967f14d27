#include "voxgate/core/vg_clock.h"

#include <chrono>

namespace voxgate {

int64_t SystemClock::now_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

const SystemClock& SystemClock::instance() {
    static SystemClock clock;
    return clock;
}

}  // namespace voxgate
