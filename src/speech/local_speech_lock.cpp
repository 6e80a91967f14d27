/**
 * @file local_speech_lock.cpp
 * @brief voxgate - In-process speech lock
 */

#include "voxgate/speech/speech_lock.h"

#include <utility>

#include "voxgate/core/vg_logger.h"

#define LOG_TAG "SpeechLock"
#define LOGD(...) VG_LOG_DEBUG(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VG_LOG_WARNING(LOG_TAG, __VA_ARGS__)

namespace voxgate {
namespace speech {

LocalSpeechLock::LocalSpeechLock(std::string caller)
    : domain_(own_domain_), caller_(std::move(caller)) {}

LocalSpeechLock::LocalSpeechLock(Domain& shared_domain, std::string caller)
    : domain_(shared_domain), caller_(std::move(caller)) {}

LocalSpeechLock::~LocalSpeechLock() {
    release();
}

bool LocalSpeechLock::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(domain_.mutex);
    if (held_) {
        LOGW("%s already holds the lock", caller_.c_str());
        return false;
    }

    if (!domain_.released.wait_for(lock, timeout, [this] { return !domain_.locked; })) {
        LOGD("%s timed out waiting for %s", caller_.c_str(), domain_.holder.c_str());
        return false;
    }

    domain_.locked = true;
    domain_.holder = caller_;
    held_ = true;
    LOGD("Acquired by %s", caller_.c_str());
    return true;
}

void LocalSpeechLock::release() {
    {
        std::lock_guard<std::mutex> lock(domain_.mutex);
        if (!held_) {
            return;
        }
        held_ = false;
        domain_.locked = false;
        domain_.holder.clear();
    }
    domain_.released.notify_all();
    LOGD("Released by %s", caller_.c_str());
}

bool LocalSpeechLock::is_locked() const {
    std::lock_guard<std::mutex> lock(domain_.mutex);
    return domain_.locked;
}

std::optional<std::string> LocalSpeechLock::who_holds() const {
    std::lock_guard<std::mutex> lock(domain_.mutex);
    if (!domain_.locked) {
        return std::nullopt;
    }
    return domain_.holder;
}

bool LocalSpeechLock::held() const {
    std::lock_guard<std::mutex> lock(domain_.mutex);
    return held_;
}

}  // namespace speech
}  // namespace voxgate
