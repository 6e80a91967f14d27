/**
 * @file file_speech_lock.cpp
 * @brief voxgate - flock(2) speech lock with JSON sidecar
 */

#include "voxgate/speech/file_speech_lock.h"

#include <algorithm>
#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "voxgate/core/vg_logger.h"
#include "voxgate/util/json_utils.h"

#define LOG_TAG "SpeechLock"
#define LOGD(...) VG_LOG_DEBUG(LOG_TAG, __VA_ARGS__)
#define LOGI(...) VG_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VG_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) VG_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace voxgate {
namespace speech {

using util::Json;

namespace {

const char* kStatusLocked = "locked";
const char* kStatusFree = "free";

int flock_retry(int fd, int operation) {
    int rc;
    do {
        rc = ::flock(fd, operation);
    } while (rc != 0 && errno == EINTR);
    return rc;
}

}  // namespace

// =============================================================================
// Directory helpers
// =============================================================================

std::string default_lock_directory() {
    const char* explicit_dir = std::getenv("VOXGATE_MUTEX_DIR");
    if (explicit_dir != nullptr && explicit_dir[0] != '\0') {
        return explicit_dir;
    }
    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_dir != nullptr && runtime_dir[0] != '\0') {
        return std::string(runtime_dir) + "/voxgate";
    }
    return "/tmp/voxgate";
}

vg_result_t ensure_directory(const std::string& directory) {
    if (directory.empty()) {
        return VG_ERROR_INVALID_ARGUMENT;
    }

    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = directory.find('/', pos + 1);
        std::string partial = directory.substr(0, pos);
        if (partial.empty()) {
            continue;
        }
        if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            LOGE("Cannot create %s: %s", partial.c_str(), std::strerror(errno));
            return VG_ERROR_IO;
        }
    }

    struct stat info;
    if (::stat(directory.c_str(), &info) != 0 || !S_ISDIR(info.st_mode)) {
        LOGE("%s is not a directory", directory.c_str());
        return VG_ERROR_IO;
    }
    return VG_SUCCESS;
}

// =============================================================================
// BreakLock
// =============================================================================

FileSpeechLock::BreakLock::BreakLock(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        LOGE("Cannot open break lock %s: %s", path.c_str(), std::strerror(errno));
        return;
    }
    if (flock_retry(fd_, LOCK_EX) != 0) {
        LOGE("Cannot lock %s: %s", path.c_str(), std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
    }
}

FileSpeechLock::BreakLock::~BreakLock() {
    if (fd_ >= 0) {
        flock_retry(fd_, LOCK_UN);
        ::close(fd_);
    }
}

// =============================================================================
// FileSpeechLock
// =============================================================================

FileSpeechLock::FileSpeechLock(const FileSpeechLockConfig& config, const Clock* clock)
    : config_(config),
      clock_(clock_or_system(clock)),
      directory_(config.directory.empty() ? default_lock_directory() : config.directory) {
    while (directory_.size() > 1 && directory_.back() == '/') {
        directory_.pop_back();
    }
    lock_path_ = directory_ + "/" + kLockFileName;
    state_path_ = directory_ + "/" + kStateFileName;
    break_path_ = lock_path_ + ".break";
    if (config_.retry_interval_ms <= 0) {
        config_.retry_interval_ms = 50;
    }
}

FileSpeechLock::~FileSpeechLock() {
    release();
}

vg_result_t FileSpeechLock::prepare() {
    return ensure_directory(directory_);
}

std::string FileSpeechLock::make_owner_token() const {
    static std::atomic<uint64_t> counter{0};
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer), "%ld-%" PRId64 "-%" PRIu64 "-%p",
                  static_cast<long>(::getpid()), clock_.now_ms(), counter.fetch_add(1) + 1,
                  static_cast<const void*>(this));
    return config_.caller + "-" + buffer;
}

FileSpeechLock::Attempt FileSpeechLock::try_lock_once() {
    int fd = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOGE("Cannot open %s: %s", lock_path_.c_str(), std::strerror(errno));
        return Attempt::Failed;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK || err == EINTR) {
            return Attempt::Busy;
        }
        LOGE("flock(%s) failed: %s", lock_path_.c_str(), std::strerror(err));
        return Attempt::Failed;
    }

    // Verification and the sidecar write must not interleave with a reclaim
    BreakLock guard(break_path_);
    if (!guard.locked()) {
        flock_retry(fd, LOCK_UN);
        ::close(fd);
        return Attempt::Failed;
    }

    struct stat fd_info;
    struct stat path_info;
    if (::fstat(fd, &fd_info) != 0 || ::stat(lock_path_.c_str(), &path_info) != 0 ||
        fd_info.st_ino != path_info.st_ino || fd_info.st_dev != path_info.st_dev) {
        // Locked a file that was unlinked by a reclaim
        flock_retry(fd, LOCK_UN);
        ::close(fd);
        return Attempt::Retry;
    }

    LockState state;
    state.status = kStatusLocked;
    state.held_by = config_.caller;
    state.owner_token = make_owner_token();
    state.pid = static_cast<int64_t>(::getpid());
    state.acquired_at_ms = clock_.now_ms();
    state.ttl_ms = config_.ttl_ms;
    if (!write_state(state)) {
        LOGW("Holding the lock without a sidecar; other processes cannot see the holder");
    }

    fd_ = fd;
    owner_token_ = state.owner_token;
    held_.store(true);
    return Attempt::Acquired;
}

bool FileSpeechLock::reclaim_stale(const LockState& observed) {
    BreakLock guard(break_path_);
    if (!guard.locked()) {
        return false;
    }

    int64_t now = clock_.now_ms();
    LockState current = read_state();
    if (!current.is_stale(now) || current.owner_token != observed.owner_token) {
        return false;
    }

    if (::unlink(lock_path_.c_str()) != 0 && errno != ENOENT) {
        LOGE("Cannot remove stale lock %s: %s", lock_path_.c_str(), std::strerror(errno));
        return false;
    }

    LockState cleared;
    cleared.status = kStatusFree;
    cleared.held_by = current.held_by;
    cleared.released_at_ms = now;
    if (!write_state(cleared)) {
        LOGW("Cannot rewrite sidecar after reclaim");
    }

    LOGI("%s: reclaimed from %s (pid %" PRId64 ", held %" PRId64 "ms, ttl %" PRId64 "ms)",
         vg_error_message(VG_ERROR_STALE_LOCK), current.held_by.c_str(), current.pid,
         now - current.acquired_at_ms, current.ttl_ms);
    return true;
}

bool FileSpeechLock::acquire(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (held_.load()) {
        LOGW("%s already holds the lock", config_.caller.c_str());
        return false;
    }
    if (prepare() != VG_SUCCESS) {
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool logged_wait = false;

    while (true) {
        Attempt attempt = try_lock_once();
        if (attempt == Attempt::Acquired) {
            LOGD("Acquired by %s", config_.caller.c_str());
            return true;
        }
        if (attempt == Attempt::Failed) {
            return false;
        }

        if (attempt == Attempt::Busy) {
            LockState observed = read_state();
            if (observed.is_stale(clock_.now_ms()) && reclaim_stale(observed)) {
                continue;
            }
            if (!logged_wait) {
                LOGD("%s waiting for %s", config_.caller.c_str(),
                     observed.held_by.empty() ? "unknown holder" : observed.held_by.c_str());
                logged_wait = true;
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            LockState holder = read_state();
            LOGW("%s: %s timed out after %lldms (held by %s)",
                 vg_error_message(VG_ERROR_RESOURCE_BUSY), config_.caller.c_str(),
                 static_cast<long long>(timeout.count()),
                 holder.held_by.empty() ? "unknown" : holder.held_by.c_str());
            return false;
        }

        if (attempt == Attempt::Busy) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(
                std::min(remaining, std::chrono::milliseconds(config_.retry_interval_ms)));
        }
    }
}

void FileSpeechLock::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_.load()) {
        return;
    }

    {
        BreakLock guard(break_path_);
        LockState current = read_state();
        if (current.owner_token == owner_token_) {
            LockState freed;
            freed.status = kStatusFree;
            freed.held_by = config_.caller;
            freed.released_at_ms = clock_.now_ms();
            if (!write_state(freed)) {
                LOGW("Cannot clear sidecar %s", state_path_.c_str());
            }
        } else {
            LOGW("Lock held by %s was reclaimed by %s", config_.caller.c_str(),
                 current.held_by.empty() ? "another process" : current.held_by.c_str());
        }
    }

    flock_retry(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
    owner_token_.clear();
    held_.store(false);
    LOGD("Released by %s", config_.caller.c_str());
}

bool FileSpeechLock::is_locked() const {
    LockState state = read_state();
    return state.is_held() && !state.is_stale(clock_.now_ms());
}

std::optional<std::string> FileSpeechLock::who_holds() const {
    LockState state = read_state();
    if (!state.is_held() || state.is_stale(clock_.now_ms())) {
        return std::nullopt;
    }
    return state.held_by;
}

bool FileSpeechLock::held() const {
    return held_.load();
}

// =============================================================================
// Sidecar
// =============================================================================

LockState FileSpeechLock::read_state() const {
    LockState state;
    Json document;
    if (util::read_json_file(state_path_, document) != VG_SUCCESS || !document.is_object()) {
        return state;
    }

    state.status = util::json_value_or<std::string>(document, "status", kStatusFree);
    state.held_by = util::json_value_or<std::string>(document, "caller", "");
    state.owner_token = util::json_value_or<std::string>(document, "owner", "");
    state.pid = util::json_value_or<int64_t>(document, "pid", 0);
    state.acquired_at_ms = util::json_value_or<int64_t>(document, "acquired_at_ms", 0);
    state.ttl_ms = util::json_value_or<int64_t>(document, "ttl_ms", 0);
    state.released_at_ms = util::json_value_or<int64_t>(document, "released_at_ms", 0);
    return state;
}

bool FileSpeechLock::write_state(const LockState& state) const {
    Json document = {
        {"status", state.status},
        {"caller", state.held_by},
        {"owner", state.owner_token},
        {"pid", state.pid},
        {"acquired_at_ms", state.acquired_at_ms},
        {"ttl_ms", state.ttl_ms},
        {"released_at_ms", state.released_at_ms},
    };
    return util::write_json_file_atomic(state_path_, document) == VG_SUCCESS;
}

}  // namespace speech
}  // namespace voxgate
