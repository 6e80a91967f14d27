/**
 * @file speech_lock.h
 * @brief voxgate - Exclusive access to the audio output device
 *
 * SpeechLock serializes speech across everything sharing one speaker.
 * FileSpeechLock extends exclusion across processes; LocalSpeechLock is the
 * in-process variant for single-process hosts and tests.
 */

#ifndef VOXGATE_SPEECH_LOCK_H
#define VOXGATE_SPEECH_LOCK_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace voxgate {
namespace speech {

/**
 * @brief Snapshot of who holds the device
 */
struct LockState {
    std::string status = "free";   // "locked" or "free"
    std::string held_by;           // Caller name of the holder
    std::string owner_token;       // Unique per acquisition
    int64_t pid = 0;
    int64_t acquired_at_ms = 0;
    int64_t ttl_ms = 0;
    int64_t released_at_ms = 0;

    bool is_held() const { return status == "locked"; }

    /// Held but older than its TTL
    bool is_stale(int64_t now_ms) const {
        return is_held() && ttl_ms > 0 && now_ms - acquired_at_ms > ttl_ms;
    }
};

class SpeechLock {
public:
    virtual ~SpeechLock() = default;

    /**
     * Waits up to timeout for exclusive access.
     *
     * @return true if this instance now holds the lock
     */
    virtual bool acquire(std::chrono::milliseconds timeout) = 0;

    /// Idempotent; never clears state owned by another holder
    virtual void release() = 0;

    /// True if anyone (this instance included) holds a non-stale lock
    virtual bool is_locked() const = 0;

    /// Caller name of the current non-stale holder
    virtual std::optional<std::string> who_holds() const = 0;

    /// True if this instance holds the lock
    virtual bool held() const = 0;
};

// =============================================================================
// ScopedSpeechLock
// =============================================================================

class ScopedSpeechLock {
public:
    ScopedSpeechLock(SpeechLock& lock, std::chrono::milliseconds timeout)
        : lock_(lock), owns_(lock.acquire(timeout)) {}

    ~ScopedSpeechLock() {
        if (owns_) {
            lock_.release();
        }
    }

    ScopedSpeechLock(const ScopedSpeechLock&) = delete;
    ScopedSpeechLock& operator=(const ScopedSpeechLock&) = delete;

    bool owns_lock() const { return owns_; }
    explicit operator bool() const { return owns_; }

private:
    SpeechLock& lock_;
    bool owns_;
};

// =============================================================================
// LocalSpeechLock
// =============================================================================

/**
 * Process-local lock. Several LocalSpeechLock handles constructed over the
 * same Domain exclude each other; TTL is not applied.
 */
class LocalSpeechLock : public SpeechLock {
public:
    struct Domain {
        std::mutex mutex;
        std::condition_variable released;
        std::string holder;
        bool locked = false;
    };

    explicit LocalSpeechLock(std::string caller = "voxgate");
    LocalSpeechLock(Domain& shared_domain, std::string caller);
    ~LocalSpeechLock() override;

    LocalSpeechLock(const LocalSpeechLock&) = delete;
    LocalSpeechLock& operator=(const LocalSpeechLock&) = delete;

    bool acquire(std::chrono::milliseconds timeout) override;
    void release() override;
    bool is_locked() const override;
    std::optional<std::string> who_holds() const override;
    bool held() const override;

private:
    Domain own_domain_;
    Domain& domain_;
    std::string caller_;
    bool held_ = false;  // Guarded by domain_.mutex
};

}  // namespace speech
}  // namespace voxgate

#endif  // VOXGATE_SPEECH_LOCK_H
