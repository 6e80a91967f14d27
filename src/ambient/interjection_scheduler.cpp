/**
 * @file interjection_scheduler.cpp
 * @brief voxgate - Ambient interjection scheduler implementation
 */

#include "voxgate/ambient/interjection_scheduler.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <random>
#include <utility>

#include "voxgate/core/vg_error.h"
#include "voxgate/core/vg_logger.h"
#include "voxgate/util/text_match.h"

#define LOG_TAG "Ambient"
#define LOGD(...) VG_LOG_DEBUG(LOG_TAG, __VA_ARGS__)
#define LOGI(...) VG_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VG_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) VG_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace voxgate {
namespace ambient {

namespace {

struct RandomState {
    std::mutex mutex;
    std::mt19937 engine{std::random_device{}()};
    std::uniform_real_distribution<double> distribution{0.0, 1.0};
};

int64_t seconds_to_ms(double seconds) {
    return static_cast<int64_t>(seconds * 1000.0);
}

float clamp01(float value) {
    return std::max(0.0f, std::min(1.0f, value));
}

}  // namespace

const char* vision_source_name(VisionSource source) {
    switch (source) {
        case VisionSource::Camera:
            return "camera";
        case VisionSource::Screen:
            return "screen";
    }
    return "camera";
}

RandomFn make_default_random() {
    auto state = std::make_shared<RandomState>();
    return [state]() {
        std::lock_guard<std::mutex> lock(state->mutex);
        return state->distribution(state->engine);
    };
}

util::Json SchedulerStatus::to_json() const {
    util::Json json = {
        {"running", running},
        {"friend_threshold", friend_threshold},
        {"user_activity", user_activity},
        {"user_expression", user_expression},
        {"user_mood", user_mood},
        {"user_busy", user_busy},
        {"user_stressed", user_stressed},
        {"silence_duration", silence_duration_s},
        {"interjection_count", interjection_count},
        {"recent_transcripts", recent_transcripts},
    };
    if (seconds_since_last_interjection) {
        json["last_interjection"] = *seconds_since_last_interjection;
    } else {
        json["last_interjection"] = nullptr;
    }
    return json;
}

// =============================================================================
// Constructor / Destructor
// =============================================================================

InterjectionScheduler::InterjectionScheduler(const AmbientConfig& config, const Clock* clock,
                                             RandomFn random)
    : config_(config),
      clock_(clock_or_system(clock)),
      random_(random ? std::move(random) : make_default_random()),
      rules_(default_interjection_rules()) {
    if (config_.tick_interval_ms <= 0) {
        config_.tick_interval_ms = 1000;
    }
    if (config_.transcript_capacity == 0) {
        config_.transcript_capacity = 1;
    }
    friend_threshold_.store(clamp01(config_.friend_threshold));
}

InterjectionScheduler::~InterjectionScheduler() {
    stop();
}

void InterjectionScheduler::set_vision_probe(VisionProbeFn probe) {
    vision_probe_ = std::move(probe);
}

void InterjectionScheduler::set_rules(std::vector<InterjectionRule> rules) {
    std::lock_guard<std::mutex> lock(context_mutex_);
    rules_ = std::move(rules);
}

// =============================================================================
// Lifecycle
// =============================================================================

bool InterjectionScheduler::start(InterjectionCallback on_interject, float friend_threshold) {
    if (!on_interject) {
        LOGE("%s: no interjection callback", vg_error_message(VG_ERROR_NOT_CONFIGURED));
        return false;
    }
    if (running_.load()) {
        LOGW("%s", vg_error_message(VG_ERROR_ALREADY_RUNNING));
        return false;
    }

    set_friend_threshold(friend_threshold);
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        context_ = SensorContext();
        on_interject_ = std::move(on_interject);
        last_tick_ms_ = clock_.now_ms();
        screen_polled_ = false;
        camera_polled_ = false;
    }

    running_.store(true);
    tick_thread_ = std::thread(&InterjectionScheduler::tick_loop, this);
    LOGI("Started (friend threshold %.2f)", friend_threshold_.load());
    return true;
}

void InterjectionScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        // Pairs with the predicate check in tick_loop so the wake-up is not lost
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();
    if (tick_thread_.joinable()) {
        tick_thread_.join();
    }

    std::lock_guard<std::mutex> lock(context_mutex_);
    LOGI("Stopped after %llu interjection(s)",
         static_cast<unsigned long long>(context_.interjection_count));
    context_ = SensorContext();
    on_interject_ = nullptr;
}

void InterjectionScheduler::set_friend_threshold(float threshold) {
    friend_threshold_.store(clamp01(threshold));
    LOGD("Friend threshold set to %.2f", friend_threshold_.load());
}

// =============================================================================
// Context updates
// =============================================================================

void InterjectionScheduler::update_audio_context(const std::string& transcript) {
    if (util::trim(transcript).empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        context_.add_transcript(transcript, config_.transcript_capacity, clock_.now_ms());
    }
    evaluate_trigger(transcript, TriggerSource::Audio);
}

void InterjectionScheduler::update_visual_context(const std::string& camera_text,
                                                  const std::string& screen_text) {
    std::lock_guard<std::mutex> lock(context_mutex_);
    if (!util::trim(camera_text).empty()) {
        context_.apply_camera_view(camera_text);
    }
    if (!util::trim(screen_text).empty()) {
        context_.last_screen_summary = screen_text;
    }
}

// =============================================================================
// Trigger evaluation
// =============================================================================

bool InterjectionScheduler::cooldown_elapsed_locked(int64_t now_ms) const {
    if (!context_.has_interjected) {
        return true;
    }
    double interval = context_.user_seems_busy ? config_.busy_interval_s : config_.min_interval_s;
    return now_ms - context_.last_interjection_ms >= seconds_to_ms(interval);
}

bool InterjectionScheduler::evaluate_trigger(const std::string& text, TriggerSource source) {
    InterjectionCallback callback;
    InterjectionEvent event;
    std::string context_json;
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        if (!running_.load() || !on_interject_) {
            return false;
        }

        float threshold = friend_threshold_.load();
        if (threshold <= 0.0f) {
            return false;
        }

        int64_t now = clock_.now_ms();
        if (!cooldown_elapsed_locked(now)) {
            return false;
        }

        RuleInput input;
        input.text = text;
        input.lowered = util::to_lower(text);
        input.source = source;
        input.user_busy = context_.user_seems_busy;
        input.user_stressed = context_.user_seems_stressed;
        input.user_activity = context_.user_activity;
        input.friend_threshold = threshold;
        input.vibe_roll = random_();

        std::optional<RuleMatch> match = evaluate_rules(rules_, input);
        if (!match) {
            return false;
        }

        float probability =
            compute_interjection_probability(threshold, match->boost, context_.user_seems_busy);
        double roll = random_();
        if (roll >= probability) {
            LOGD("%s matched (%s), roll %.3f >= p %.3f", match->rule,
                 interject_reason_name(match->reason), roll, probability);
            return false;
        }

        callback = fire_locked(*match, text, source, probability, now, &event, &context_json);
    }

    deliver(callback, event, context_json);
    return true;
}

InterjectionCallback InterjectionScheduler::fire_locked(const RuleMatch& match,
                                                        const std::string& evidence,
                                                        TriggerSource source, float probability,
                                                        int64_t now_ms, InterjectionEvent* event,
                                                        std::string* context_json) {
    context_.last_interjection_ms = now_ms;
    context_.has_interjected = true;
    context_.interjection_count++;

    event->reason = match.reason;
    event->hint = match.hint;
    event->evidence = evidence;
    event->source = source;
    event->boost = match.boost;
    event->probability = probability;
    event->timestamp_ms = now_ms;

    util::Json json = {
        {"reason", interject_reason_name(match.reason)},
        {"hint", match.hint},
        {"recent_speech", evidence},
        {"source", trigger_source_name(source)},
        {"user_activity", context_.user_activity},
        {"user_expression", context_.user_expression},
        {"user_mood", context_.user_mood},
        {"user_busy", context_.user_seems_busy},
        {"friend_threshold", friend_threshold_.load()},
    };
    // Transcripts are not guaranteed to be valid UTF-8
    *context_json = json.dump(-1, ' ', false, util::Json::error_handler_t::replace);

    LOGI("Interjection triggered: %s - %s", interject_reason_name(match.reason),
         match.hint.c_str());
    return on_interject_;
}

void InterjectionScheduler::deliver(const InterjectionCallback& callback,
                                    const InterjectionEvent& event,
                                    const std::string& context_json) {
    if (!callback) {
        return;
    }
    try {
        callback(event, context_json);
    } catch (const std::exception& e) {
        LOGE("%s: interjection callback threw: %s", vg_error_message(VG_ERROR_EXTERNAL_CALL),
             e.what());
    } catch (...) {
        LOGE("%s: interjection callback threw an unknown exception",
             vg_error_message(VG_ERROR_EXTERNAL_CALL));
    }
}

// =============================================================================
// Background tick
// =============================================================================

void InterjectionScheduler::tick() {
    bool poll_screen = false;
    bool poll_camera = false;
    InterjectionCallback callback;
    InterjectionEvent event;
    std::string context_json;
    {
        std::lock_guard<std::mutex> lock(context_mutex_);
        if (!running_.load()) {
            return;
        }

        int64_t now = clock_.now_ms();
        int64_t elapsed = now - last_tick_ms_;
        if (elapsed > 0) {
            context_.silence_duration_s += static_cast<double>(elapsed) / 1000.0;
        }
        last_tick_ms_ = now;

        float threshold = friend_threshold_.load();

        if (vision_probe_ && threshold >= config_.screen_poll_threshold &&
            (!screen_polled_ ||
             now - last_screen_poll_ms_ >= seconds_to_ms(config_.screen_poll_interval_s))) {
            screen_polled_ = true;
            last_screen_poll_ms_ = now;
            poll_screen = true;
        }
        if (vision_probe_ && threshold >= config_.camera_poll_threshold &&
            (!camera_polled_ ||
             now - last_camera_poll_ms_ >= seconds_to_ms(config_.camera_poll_interval_s))) {
            camera_polled_ = true;
            last_camera_poll_ms_ = now;
            poll_camera = true;
        }

        if (threshold > 0.0f && threshold >= config_.long_silence_threshold &&
            context_.silence_duration_s > config_.long_silence_s && on_interject_ &&
            cooldown_elapsed_locked(now)) {
            double roll = random_();
            if (roll < config_.long_silence_chance) {
                RuleMatch match;
                match.rule = "long_silence";
                match.reason = InterjectReason::CheckIn;
                match.hint = "been quiet for a while";
                callback = fire_locked(match, "", TriggerSource::Silence,
                                       static_cast<float>(config_.long_silence_chance), now,
                                       &event, &context_json);
                context_.silence_duration_s = 0.0;
            }
        }
    }

    deliver(callback, event, context_json);

    if (poll_screen) {
        poll_vision(VisionSource::Screen);
    }
    if (poll_camera) {
        poll_vision(VisionSource::Camera);
    }
}

void InterjectionScheduler::poll_vision(VisionSource source) {
    std::string description;
    try {
        description = vision_probe_(source);
    } catch (const std::exception& e) {
        LOGW("%s: %s probe threw: %s", vg_error_message(VG_ERROR_EXTERNAL_CALL),
             vision_source_name(source), e.what());
        return;
    } catch (...) {
        LOGW("%s: %s probe threw an unknown exception", vg_error_message(VG_ERROR_EXTERNAL_CALL),
             vision_source_name(source));
        return;
    }
    if (util::trim(description).empty()) {
        return;
    }

    if (source == VisionSource::Camera) {
        update_visual_context(description, "");
        evaluate_trigger(description, TriggerSource::Camera);
    } else {
        update_visual_context("", description);
        evaluate_trigger(description, TriggerSource::Screen);
    }
}

void InterjectionScheduler::tick_loop() {
    const auto interval = std::chrono::milliseconds(config_.tick_interval_ms);

    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
        }
        if (!running_.load()) break;

        try {
            tick();
        } catch (const std::exception& e) {
            LOGE("Tick failed: %s", e.what());
        } catch (...) {
            LOGE("Tick failed with an unknown exception");
        }
    }
}

// =============================================================================
// Status
// =============================================================================

SchedulerStatus InterjectionScheduler::get_status() const {
    std::lock_guard<std::mutex> lock(context_mutex_);

    SchedulerStatus status;
    status.running = running_.load();
    status.friend_threshold = friend_threshold_.load();
    status.user_activity = context_.user_activity;
    status.user_expression = context_.user_expression;
    status.user_mood = context_.user_mood;
    status.user_busy = context_.user_seems_busy;
    status.user_stressed = context_.user_seems_stressed;
    status.silence_duration_s = context_.silence_duration_s;
    status.interjection_count = context_.interjection_count;
    status.recent_transcripts = context_.recent_transcripts.size();
    if (context_.has_interjected) {
        status.seconds_since_last_interjection =
            static_cast<double>(clock_.now_ms() - context_.last_interjection_ms) / 1000.0;
    }
    return status;
}

SensorContext InterjectionScheduler::context_snapshot() const {
    std::lock_guard<std::mutex> lock(context_mutex_);
    return context_;
}

}  // namespace ambient
}  // namespace voxgate
