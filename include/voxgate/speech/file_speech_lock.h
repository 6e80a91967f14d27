/**
 * @file file_speech_lock.h
 * @brief voxgate - Cross-process speech lock backed by flock(2)
 *
 * Exclusion comes from an exclusive flock on <dir>/tts_mutex.lock. A JSON
 * sidecar (<dir>/tts_state.json) records who holds it and since when so
 * other processes can report the holder and reclaim a lock whose holder
 * has exceeded its TTL. Reclaiming unlinks the lock file under a short-lived
 * break lock (<dir>/tts_mutex.lock.break); acquirers verify that the file
 * they locked is still the one on disk.
 */

#ifndef VOXGATE_FILE_SPEECH_LOCK_H
#define VOXGATE_FILE_SPEECH_LOCK_H

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

#include "voxgate/core/vg_clock.h"
#include "voxgate/core/vg_error.h"
#include "voxgate/speech/speech_lock.h"

namespace voxgate {
namespace speech {

constexpr const char* kLockFileName = "tts_mutex.lock";
constexpr const char* kStateFileName = "tts_state.json";

struct FileSpeechLockConfig {
    std::string directory;          // Empty: default_lock_directory()
    std::string caller = "voxgate"; // Reported to other processes
    int64_t ttl_ms = 30000;         // Held longer than this = abandoned
    int retry_interval_ms = 50;     // Sleep between lock attempts
};

/**
 * $VOXGATE_MUTEX_DIR, else $XDG_RUNTIME_DIR/voxgate, else /tmp/voxgate.
 */
std::string default_lock_directory();

/// Creates directory and its parents (mode 0755)
vg_result_t ensure_directory(const std::string& directory);

class FileSpeechLock : public SpeechLock {
public:
    explicit FileSpeechLock(const FileSpeechLockConfig& config = FileSpeechLockConfig(),
                            const Clock* clock = nullptr);
    ~FileSpeechLock() override;

    FileSpeechLock(const FileSpeechLock&) = delete;
    FileSpeechLock& operator=(const FileSpeechLock&) = delete;

    /// Creates the lock directory; VG_ERROR_IO if it cannot be created
    vg_result_t prepare();

    bool acquire(std::chrono::milliseconds timeout) override;
    void release() override;
    bool is_locked() const override;
    std::optional<std::string> who_holds() const override;
    bool held() const override;

    /// Sidecar contents (a default LockState if missing or unreadable)
    LockState read_state() const;

    const std::string& directory() const { return directory_; }
    const std::string& lock_path() const { return lock_path_; }
    const std::string& state_path() const { return state_path_; }

private:
    enum class Attempt { Acquired, Busy, Retry, Failed };

    Attempt try_lock_once();
    bool reclaim_stale(const LockState& observed);
    bool write_state(const LockState& state) const;
    std::string make_owner_token() const;

    // RAII over the break-lock file; locked() is false if it could not be taken
    class BreakLock {
    public:
        explicit BreakLock(const std::string& path);
        ~BreakLock();
        BreakLock(const BreakLock&) = delete;
        BreakLock& operator=(const BreakLock&) = delete;
        bool locked() const { return fd_ >= 0; }

    private:
        int fd_ = -1;
    };

    FileSpeechLockConfig config_;
    const Clock& clock_;
    std::string directory_;
    std::string lock_path_;
    std::string state_path_;
    std::string break_path_;

    int fd_ = -1;
    std::atomic<bool> held_{false};
    std::string owner_token_;
    std::mutex mutex_;  // Serializes acquire/release on this instance
};

}  // namespace speech
}  // namespace voxgate

#endif  // VOXGATE_FILE_SPEECH_LOCK_H
