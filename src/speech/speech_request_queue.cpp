// =============================================================================
// Speech Request Queue - Implementation
// =============================================================================

#include "voxgate/speech/speech_request_queue.h"

#include <exception>
#include <utility>

#include "voxgate/core/vg_error.h"
#include "voxgate/core/vg_logger.h"
#include "voxgate/util/text_match.h"

#define LOG_TAG "SpeechQueue"
#define LOGD(...) VG_LOG_DEBUG(LOG_TAG, __VA_ARGS__)
#define LOGI(...) VG_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VG_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) VG_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace voxgate {
namespace speech {

namespace {

constexpr size_t kLogPreviewChars = 50;

}  // namespace

SpeechRequestQueue::SpeechRequestQueue(const SpeechQueueConfig& config, SpeechLock& lock,
                                       echo::EchoSuppressor* echo, PresenceGate* presence,
                                       const Clock* clock)
    : config_(config),
      lock_(lock),
      echo_(echo),
      presence_(presence),
      clock_(clock_or_system(clock)) {
    if (config_.poll_interval_ms <= 0) {
        config_.poll_interval_ms = 500;
    }
    if (config_.lock_timeout_ms < 0) {
        config_.lock_timeout_ms = 0;
    }
}

SpeechRequestQueue::~SpeechRequestQueue() {
    stop();
}

void SpeechRequestQueue::set_synthesizer(SynthesizeFn synthesize) {
    synthesize_ = std::move(synthesize);
}

void SpeechRequestQueue::set_on_speak_start(SpeakStartCallback callback) {
    on_speak_start_ = std::move(callback);
}

void SpeechRequestQueue::set_on_speak_end(SpeakEndCallback callback) {
    on_speak_end_ = std::move(callback);
}

// =============================================================================
// Producers
// =============================================================================

void SpeechRequestQueue::push_locked(const std::string& text, const std::string& emotion,
                                     int priority, bool skip_presence_check) {
    SpeechRequest request;
    request.text = text;
    request.emotion_tag = emotion.empty() ? "neutral" : emotion;
    request.priority = clamp_priority(priority);
    request.enqueue_time_ms = clock_.now_ms();
    request.sequence = next_sequence_++;
    request.skip_presence_check = skip_presence_check;
    queue_.push(std::move(request));
    enqueued_.fetch_add(1);
}

bool SpeechRequestQueue::enqueue(const std::string& text, const std::string& emotion,
                                 int priority, bool skip_presence_check) {
    if (text.empty()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        push_locked(text, emotion, priority, skip_presence_check);
    }
    cv_.notify_one();
    LOGD("Queued (p%d): %s", clamp_priority(priority),
         util::truncate(text, kLogPreviewChars).c_str());
    return true;
}

bool SpeechRequestQueue::speak_now(const std::string& text, const std::string& emotion) {
    if (text.empty()) {
        return false;
    }

    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = queue_.size();
        while (!queue_.empty()) {
            queue_.pop();
        }
        push_locked(text, emotion, kHighestPriority, false);
    }
    cleared_.fetch_add(dropped);
    cv_.notify_one();

    if (dropped > 0) {
        LOGI("speak_now dropped %zu pending request(s)", dropped);
    }
    return true;
}

size_t SpeechRequestQueue::clear() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = queue_.size();
        while (!queue_.empty()) {
            queue_.pop();
        }
    }
    cleared_.fetch_add(dropped);
    idle_cv_.notify_all();
    return dropped;
}

size_t SpeechRequestQueue::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::vector<SpeechRequest> SpeechRequestQueue::pending_snapshot() const {
    std::priority_queue<SpeechRequest, std::vector<SpeechRequest>, SpeechRequestOrder> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = queue_;
    }
    std::vector<SpeechRequest> ordered;
    ordered.reserve(copy.size());
    while (!copy.empty()) {
        ordered.push_back(copy.top());
        copy.pop();
    }
    return ordered;
}

// =============================================================================
// Lifecycle
// =============================================================================

bool SpeechRequestQueue::start() {
    if (!synthesize_) {
        LOGE("%s: no synthesizer set", vg_error_message(VG_ERROR_NOT_CONFIGURED));
        return false;
    }
    if (running_.exchange(true)) {
        return true;
    }
    worker_ = std::thread(&SpeechRequestQueue::worker_loop, this);
    LOGI("Worker started (%s)", config_.caller.c_str());
    return true;
}

void SpeechRequestQueue::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    idle_cv_.notify_all();
    LOGI("Worker stopped (%zu pending)", pending_count());
}

bool SpeechRequestQueue::is_busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

bool SpeechRequestQueue::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !busy_; });
}

SpeechQueueStats SpeechRequestQueue::stats() const {
    SpeechQueueStats s;
    s.enqueued = enqueued_.load();
    s.spoken = spoken_.load();
    s.failed = failed_.load();
    s.dropped_absent = dropped_absent_.load();
    s.dropped_busy = dropped_busy_.load();
    s.cleared = cleared_.load();
    return s;
}

// =============================================================================
// Worker
// =============================================================================

void SpeechRequestQueue::worker_loop() {
    const auto poll = std::chrono::milliseconds(config_.poll_interval_ms);

    while (running_.load()) {
        SpeechRequest request;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, poll, [this] { return !queue_.empty() || !running_.load(); });

            if (!running_.load()) break;
            if (queue_.empty()) continue;

            request = queue_.top();
            queue_.pop();
            busy_ = true;
        }

        process(request);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

void SpeechRequestQueue::process(const SpeechRequest& request) {
    const std::string preview = util::truncate(request.text, kLogPreviewChars);

    if (config_.check_presence && !request.skip_presence_check && presence_ != nullptr &&
        !presence_->is_user_present()) {
        dropped_absent_.fetch_add(1);
        LOGI("User not present, skipped: %s", preview.c_str());
        return;
    }

    ScopedSpeechLock device(lock_, std::chrono::milliseconds(config_.lock_timeout_ms));
    if (!device) {
        dropped_busy_.fetch_add(1);
        auto holder = lock_.who_holds();
        LOGW("%s: dropped after %lldms (held by %s): %s", vg_error_message(VG_ERROR_RESOURCE_BUSY),
             static_cast<long long>(config_.lock_timeout_ms),
             holder ? holder->c_str() : "unknown", preview.c_str());
        return;
    }

    // Echo window opens before any audio leaves the speaker
    if (echo_ != nullptr) {
        echo_->start_speaking(request.text);
    }

    if (on_speak_start_) {
        try {
            on_speak_start_(request);
        } catch (const std::exception& e) {
            LOGW("on_speak_start threw: %s", e.what());
        } catch (...) {
            LOGW("on_speak_start threw an unknown exception");
        }
    }

    bool success = false;
    try {
        success = synthesize_(request.text, request.emotion_tag);
    } catch (const std::exception& e) {
        LOGE("%s: synthesizer threw: %s", vg_error_message(VG_ERROR_EXTERNAL_CALL), e.what());
    } catch (...) {
        LOGE("%s: synthesizer threw an unknown exception",
             vg_error_message(VG_ERROR_EXTERNAL_CALL));
        success = false;
    }

    if (success) {
        spoken_.fetch_add(1);
        LOGD("Spoke [%s]: %s", request.emotion_tag.c_str(), preview.c_str());
    } else {
        failed_.fetch_add(1);
        LOGW("%s: synthesis failed: %s", vg_error_message(VG_ERROR_EXTERNAL_CALL),
             preview.c_str());
    }

    if (on_speak_end_) {
        try {
            on_speak_end_(request, success);
        } catch (const std::exception& e) {
            LOGW("on_speak_end threw: %s", e.what());
        } catch (...) {
            LOGW("on_speak_end threw an unknown exception");
        }
    }
}

}  // namespace speech
}  // namespace voxgate
