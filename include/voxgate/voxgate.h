/**
 * @file voxgate.h
 * @brief voxgate - Speech output coordination for a voice assistant
 *
 * SpeechCoordinator owns one instance of each service: the speech lock,
 * echo suppressor, mood state, presence gate, speech queue and interjection
 * scheduler. Hosts supply the blocking synthesize-and-play call and,
 * optionally, presence and vision probes.
 *
 * Usage:
 *   voxgate::VoxgateConfig config;
 *   voxgate::apply_env_overrides(config);
 *
 *   voxgate::CoordinatorCallbacks callbacks;
 *   callbacks.synthesize_and_play = [&](const std::string& text, const std::string& emotion) {
 *       return tts.speak(text, emotion);
 *   };
 *
 *   voxgate::SpeechCoordinator coordinator(config, callbacks);
 *   if (coordinator.initialize() != VG_SUCCESS) { ... }
 *
 *   stt.on_transcript(coordinator.transcript_handler());
 *   coordinator.say("Good morning");
 */

#ifndef VOXGATE_VOXGATE_H
#define VOXGATE_VOXGATE_H

#include <functional>
#include <memory>
#include <string>

#include "voxgate/ambient/interjection_scheduler.h"
#include "voxgate/core/vg_clock.h"
#include "voxgate/core/vg_config.h"
#include "voxgate/core/vg_error.h"
#include "voxgate/echo/echo_suppressor.h"
#include "voxgate/mood/emotion_text.h"
#include "voxgate/mood/mood_state.h"
#include "voxgate/speech/file_speech_lock.h"
#include "voxgate/speech/presence_gate.h"
#include "voxgate/speech/speech_lock.h"
#include "voxgate/speech/speech_request_queue.h"
#include "voxgate/util/json_utils.h"

namespace voxgate {

struct CoordinatorCallbacks {
    speech::SynthesizeFn synthesize_and_play;      // Required
    speech::PresenceProbeFn is_user_present;       // Optional: always present
    ambient::VisionProbeFn capture_description;    // Optional: no vision polling
};

using TranscriptHandler = std::function<bool(const std::string& text, float confidence)>;

class SpeechCoordinator {
public:
    SpeechCoordinator(const VoxgateConfig& config, CoordinatorCallbacks callbacks,
                      const Clock* clock = nullptr, ambient::RandomFn random = nullptr);
    ~SpeechCoordinator();

    // Non-copyable
    SpeechCoordinator(const SpeechCoordinator&) = delete;
    SpeechCoordinator& operator=(const SpeechCoordinator&) = delete;

    /**
     * Prepares the lock directory and starts the speech worker.
     *
     * @return VG_SUCCESS, VG_ERROR_NOT_CONFIGURED (no synthesizer),
     *         VG_ERROR_IO (lock directory unusable) or VG_ERROR_ALREADY_RUNNING
     */
    vg_result_t initialize();

    /// Stops the scheduler and the speech worker; safe to call repeatedly
    void shutdown();

    bool is_initialized() const { return initialized_; }

    /**
     * Entry point for recognised speech. Text that passes the echo filter
     * is fed to the interjection scheduler.
     *
     * @return true if the text was accepted as user speech
     */
    bool handle_transcript(const std::string& text, float confidence);

    /// handle_transcript bound to this coordinator, for the host's STT callback
    TranscriptHandler transcript_handler();

    /**
     * Queues text; an empty emotion is filled in by detect_emotion().
     *
     * @return false if text is empty
     */
    bool say(const std::string& text, const std::string& emotion = "",
             int priority = speech::kDefaultPriority);

    bool start_ambient(ambient::InterjectionCallback on_interject, float friend_threshold);

    /// Uses the configured friend threshold
    bool start_ambient(ambient::InterjectionCallback on_interject);

    void stop_ambient();

    speech::SpeechRequestQueue& queue() { return *queue_; }
    speech::SpeechLock& lock() { return *lock_; }
    echo::EchoSuppressor& echo() { return *echo_; }
    mood::MoodState& mood() { return *mood_; }
    speech::PresenceGate& presence() { return *presence_; }
    ambient::InterjectionScheduler& scheduler() { return *scheduler_; }

    const VoxgateConfig& config() const { return config_; }

    /// Snapshot of every component for diagnostics
    util::Json status_json();

private:
    VoxgateConfig config_;
    CoordinatorCallbacks callbacks_;
    const Clock& clock_;

    std::unique_ptr<speech::SpeechLock> lock_;
    speech::FileSpeechLock* file_lock_ = nullptr;   // Non-owning view of lock_ when cross-process
    std::unique_ptr<echo::EchoSuppressor> echo_;
    std::unique_ptr<mood::MoodState> mood_;
    std::unique_ptr<speech::PresenceGate> presence_;
    std::unique_ptr<speech::SpeechRequestQueue> queue_;
    std::unique_ptr<ambient::InterjectionScheduler> scheduler_;

    bool initialized_ = false;
};

}  // namespace voxgate

#endif  // VOXGATE_VOXGATE_H
