/**
 * @file voxgate.cpp
 * @brief voxgate - SpeechCoordinator implementation
 */

#include "voxgate/voxgate.h"

#include <utility>

#include "voxgate/core/vg_logger.h"

#define LOG_TAG "Coordinator"
#define LOGI(...) VG_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VG_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) VG_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace voxgate {

using util::Json;

SpeechCoordinator::SpeechCoordinator(const VoxgateConfig& config, CoordinatorCallbacks callbacks,
                                     const Clock* clock, ambient::RandomFn random)
    : config_(config), callbacks_(std::move(callbacks)), clock_(clock_or_system(clock)) {
    config_.queue.caller = config_.caller;

    if (config_.lock.cross_process) {
        speech::FileSpeechLockConfig lock_config;
        lock_config.directory = config_.lock.directory;
        lock_config.caller = config_.caller;
        lock_config.ttl_ms = config_.lock.ttl_ms;
        lock_config.retry_interval_ms = config_.lock.retry_interval_ms;
        auto file_lock = std::make_unique<speech::FileSpeechLock>(lock_config, &clock_);
        file_lock_ = file_lock.get();
        lock_ = std::move(file_lock);
    } else {
        lock_ = std::make_unique<speech::LocalSpeechLock>(config_.caller);
    }

    echo_ = std::make_unique<echo::EchoSuppressor>(config_.echo, &clock_);
    mood_ = std::make_unique<mood::MoodState>(config_.mood, &clock_);
    presence_ = std::make_unique<speech::PresenceGate>(callbacks_.is_user_present,
                                                       config_.queue.presence_cache_ms, &clock_);
    queue_ = std::make_unique<speech::SpeechRequestQueue>(config_.queue, *lock_, echo_.get(),
                                                          presence_.get(), &clock_);
    scheduler_ = std::make_unique<ambient::InterjectionScheduler>(config_.ambient, &clock_,
                                                                  std::move(random));

    if (callbacks_.synthesize_and_play) {
        queue_->set_synthesizer(callbacks_.synthesize_and_play);
    }
    if (callbacks_.capture_description) {
        scheduler_->set_vision_probe(callbacks_.capture_description);
    }
}

SpeechCoordinator::~SpeechCoordinator() {
    shutdown();
}

// =============================================================================
// Lifecycle
// =============================================================================

vg_result_t SpeechCoordinator::initialize() {
    if (initialized_) {
        return VG_ERROR_ALREADY_RUNNING;
    }
    if (!callbacks_.synthesize_and_play) {
        LOGE("%s: synthesize_and_play is required", vg_error_message(VG_ERROR_NOT_CONFIGURED));
        return VG_ERROR_NOT_CONFIGURED;
    }

    if (file_lock_ != nullptr) {
        vg_result_t rc = file_lock_->prepare();
        if (rc != VG_SUCCESS) {
            LOGE("Lock directory %s unusable: %s", file_lock_->directory().c_str(),
                 vg_error_message(rc));
            return VG_ERROR_IO;
        }
    }

    if (!queue_->start()) {
        return VG_ERROR_NOT_CONFIGURED;
    }

    initialized_ = true;
    LOGI("Initialized as '%s' (%s lock)", config_.caller.c_str(),
         file_lock_ != nullptr ? file_lock_->directory().c_str() : "in-process");
    return VG_SUCCESS;
}

void SpeechCoordinator::shutdown() {
    if (!initialized_) {
        return;
    }
    scheduler_->stop();
    queue_->stop();
    lock_->release();
    initialized_ = false;
    LOGI("Shut down");
}

// =============================================================================
// Input / output
// =============================================================================

bool SpeechCoordinator::handle_transcript(const std::string& text, float confidence) {
    if (!echo_->should_process(text, confidence)) {
        return false;
    }
    scheduler_->update_audio_context(text);
    return true;
}

TranscriptHandler SpeechCoordinator::transcript_handler() {
    return [this](const std::string& text, float confidence) {
        return handle_transcript(text, confidence);
    };
}

bool SpeechCoordinator::say(const std::string& text, const std::string& emotion, int priority) {
    std::string tag = emotion.empty() ? mood::emotion_tag_name(mood::detect_emotion(text)) : emotion;
    return queue_->enqueue(text, tag, priority);
}

bool SpeechCoordinator::start_ambient(ambient::InterjectionCallback on_interject,
                                      float friend_threshold) {
    return scheduler_->start(std::move(on_interject), friend_threshold);
}

bool SpeechCoordinator::start_ambient(ambient::InterjectionCallback on_interject) {
    return start_ambient(std::move(on_interject), config_.ambient.friend_threshold);
}

void SpeechCoordinator::stop_ambient() {
    scheduler_->stop();
}

// =============================================================================
// Diagnostics
// =============================================================================

Json SpeechCoordinator::status_json() {
    auto holder = lock_->who_holds();
    speech::SpeechQueueStats stats = queue_->stats();
    echo::EchoStatus echo_status = echo_->get_status();
    mood::MoodVector vector = mood_->get_vector();
    mood::Mood current = mood::classify_mood(vector);

    Json lock = {
        {"locked", lock_->is_locked()},
        {"holder", holder ? Json(*holder) : Json(nullptr)},
        {"held_here", lock_->held()},
    };
    if (file_lock_ != nullptr) {
        lock["directory"] = file_lock_->directory();
    }

    return Json{
        {"initialized", initialized_},
        {"caller", config_.caller},
        {"lock", lock},
        {"queue",
         {{"running", queue_->is_running()},
          {"pending", queue_->pending_count()},
          {"enqueued", stats.enqueued},
          {"spoken", stats.spoken},
          {"failed", stats.failed},
          {"dropped_absent", stats.dropped_absent},
          {"dropped_busy", stats.dropped_busy},
          {"cleared", stats.cleared}}},
        {"echo",
         {{"speaking", echo_status.speaking},
          {"time_until_clear", echo_status.time_until_clear_s},
          {"last_spoken", echo_status.last_spoken},
          {"history_size", echo_status.history_size},
          {"blacklist_size", echo_status.blacklist_size},
          {"filtered", echo_status.filtered_count},
          {"passed", echo_status.passed_count}}},
        {"mood",
         {{"mood", mood::mood_label(current)},
          {"style", mood::response_modifier_for(current).style},
          {"happiness", vector.happiness},
          {"energy", vector.energy},
          {"patience", vector.patience},
          {"engagement", vector.engagement}}},
        {"ambient", scheduler_->get_status().to_json()},
    };
}

}  // namespace voxgate
