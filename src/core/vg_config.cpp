/**
 * @file vg_config.cpp
 * @brief voxgate - Settings file and environment overrides
 */

#include "voxgate/core/vg_config.h"

#include <cerrno>
#include <cstdlib>

#define LOG_TAG "Config"
#define LOGI(...) VG_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VG_LOG_WARNING(LOG_TAG, __VA_ARGS__)

namespace voxgate {

using util::Json;

namespace {

// Reads key into out if present. Returns false on a type mismatch.
template <typename T>
bool read_field(const Json& section, const char* key, T& out) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) {
        return true;
    }
    try {
        out = it->template get<T>();
        return true;
    } catch (const Json::exception& e) {
        LOGW("Invalid value for '%s': %s", key, e.what());
        return false;
    }
}

// Missing sections are fine; anything other than an object is not
bool section_of(const Json& document, const char* name, const Json** out) {
    auto it = document.find(name);
    if (it == document.end() || it->is_null()) {
        *out = nullptr;
        return true;
    }
    if (!it->is_object()) {
        LOGW("Section '%s' must be an object", name);
        return false;
    }
    *out = &*it;
    return true;
}

bool apply_queue(const Json& s, speech::SpeechQueueConfig& q) {
    return read_field(s, "lock_timeout_ms", q.lock_timeout_ms) &&
           read_field(s, "poll_interval_ms", q.poll_interval_ms) &&
           read_field(s, "presence_cache_ms", q.presence_cache_ms) &&
           read_field(s, "check_presence", q.check_presence);
}

bool apply_lock(const Json& s, LockConfig& l) {
    return read_field(s, "cross_process", l.cross_process) &&
           read_field(s, "directory", l.directory) && read_field(s, "ttl_ms", l.ttl_ms) &&
           read_field(s, "retry_interval_ms", l.retry_interval_ms);
}

bool apply_echo(const Json& s, echo::EchoSuppressorConfig& e) {
    return read_field(s, "filter_duration_s", e.filter_duration_s) &&
           read_field(s, "grace_period_s", e.grace_period_s) &&
           read_field(s, "text_memory_s", e.text_memory_s) &&
           read_field(s, "adaptive", e.adaptive) &&
           read_field(s, "seconds_per_word", e.seconds_per_word) &&
           read_field(s, "min_estimate_s", e.min_estimate_s) &&
           read_field(s, "max_estimate_s", e.max_estimate_s) &&
           read_field(s, "min_confidence", e.min_confidence) &&
           read_field(s, "history_capacity", e.history_capacity);
}

bool apply_mood(const Json& s, mood::MoodConfig& m) {
    return read_field(s, "decay_rate", m.decay_rate) &&
           read_field(s, "default_intensity", m.default_intensity) &&
           read_field(s, "history_capacity", m.history_capacity);
}

bool apply_ambient(const Json& s, ambient::AmbientConfig& a) {
    return read_field(s, "friend_threshold", a.friend_threshold) &&
           read_field(s, "min_interval_s", a.min_interval_s) &&
           read_field(s, "busy_interval_s", a.busy_interval_s) &&
           read_field(s, "tick_interval_ms", a.tick_interval_ms) &&
           read_field(s, "screen_poll_interval_s", a.screen_poll_interval_s) &&
           read_field(s, "screen_poll_threshold", a.screen_poll_threshold) &&
           read_field(s, "camera_poll_interval_s", a.camera_poll_interval_s) &&
           read_field(s, "camera_poll_threshold", a.camera_poll_threshold) &&
           read_field(s, "long_silence_s", a.long_silence_s) &&
           read_field(s, "long_silence_threshold", a.long_silence_threshold) &&
           read_field(s, "long_silence_chance", a.long_silence_chance) &&
           read_field(s, "transcript_capacity", a.transcript_capacity);
}

float clamp_threshold(float value) {
    if (value < 0.0f) return 0.0f;
    if (value > 1.0f) return 1.0f;
    return value;
}

}  // namespace

vg_result_t apply_config_json(const Json& document, VoxgateConfig& config) {
    if (!document.is_object()) {
        LOGW("Settings must be a JSON object");
        return VG_ERROR_PARSE;
    }

    VoxgateConfig updated = config;

    if (!read_field(document, "caller", updated.caller)) {
        return VG_ERROR_PARSE;
    }

    std::string level_name;
    if (!read_field(document, "log_level", level_name)) {
        return VG_ERROR_PARSE;
    }
    if (!level_name.empty() && !vg_log_parse_level(level_name.c_str(), &updated.log_level)) {
        LOGW("Unknown log level '%s'", level_name.c_str());
        return VG_ERROR_PARSE;
    }

    const Json* section = nullptr;
    if (!section_of(document, "queue", &section) ||
        (section != nullptr && !apply_queue(*section, updated.queue))) {
        return VG_ERROR_PARSE;
    }
    if (!section_of(document, "lock", &section) ||
        (section != nullptr && !apply_lock(*section, updated.lock))) {
        return VG_ERROR_PARSE;
    }
    if (!section_of(document, "echo", &section) ||
        (section != nullptr && !apply_echo(*section, updated.echo))) {
        return VG_ERROR_PARSE;
    }
    if (!section_of(document, "mood", &section) ||
        (section != nullptr && !apply_mood(*section, updated.mood))) {
        return VG_ERROR_PARSE;
    }
    if (!section_of(document, "ambient", &section) ||
        (section != nullptr && !apply_ambient(*section, updated.ambient))) {
        return VG_ERROR_PARSE;
    }

    updated.ambient.friend_threshold = clamp_threshold(updated.ambient.friend_threshold);
    config = updated;
    return VG_SUCCESS;
}

vg_result_t load_config_file(const std::string& path, VoxgateConfig& config) {
    Json document;
    vg_result_t rc = util::read_json_file(path, document);
    if (rc != VG_SUCCESS) {
        LOGW("Cannot load %s: %s", path.c_str(), vg_error_message(rc));
        return rc;
    }

    rc = apply_config_json(document, config);
    if (rc == VG_SUCCESS) {
        LOGI("Loaded settings from %s", path.c_str());
    }
    return rc;
}

void apply_env_overrides(VoxgateConfig& config) {
    const char* dir = std::getenv("VOXGATE_MUTEX_DIR");
    if (dir != nullptr && dir[0] != '\0') {
        config.lock.directory = dir;
    }

    const char* caller = std::getenv("VOXGATE_CALLER");
    if (caller != nullptr && caller[0] != '\0') {
        config.caller = caller;
    }

    const char* threshold = std::getenv("VOXGATE_FRIEND_THRESHOLD");
    if (threshold != nullptr && threshold[0] != '\0') {
        char* end = nullptr;
        errno = 0;
        float value = std::strtof(threshold, &end);
        if (errno != 0 || end == threshold || *end != '\0') {
            LOGW("Ignoring VOXGATE_FRIEND_THRESHOLD='%s'", threshold);
        } else {
            config.ambient.friend_threshold = clamp_threshold(value);
        }
    }

    const char* level = std::getenv("VOXGATE_LOG_LEVEL");
    if (level != nullptr && level[0] != '\0') {
        if (!vg_log_parse_level(level, &config.log_level)) {
            LOGW("Ignoring VOXGATE_LOG_LEVEL='%s'", level);
        }
    }
}

Json config_to_json(const VoxgateConfig& config) {
    return Json{
        {"caller", config.caller},
        {"log_level", vg_log_level_name(config.log_level)},
        {"queue",
         {{"lock_timeout_ms", config.queue.lock_timeout_ms},
          {"poll_interval_ms", config.queue.poll_interval_ms},
          {"presence_cache_ms", config.queue.presence_cache_ms},
          {"check_presence", config.queue.check_presence}}},
        {"lock",
         {{"cross_process", config.lock.cross_process},
          {"directory", config.lock.directory},
          {"ttl_ms", config.lock.ttl_ms},
          {"retry_interval_ms", config.lock.retry_interval_ms}}},
        {"echo",
         {{"filter_duration_s", config.echo.filter_duration_s},
          {"grace_period_s", config.echo.grace_period_s},
          {"text_memory_s", config.echo.text_memory_s},
          {"adaptive", config.echo.adaptive},
          {"min_confidence", config.echo.min_confidence},
          {"history_capacity", config.echo.history_capacity}}},
        {"mood", {{"decay_rate", config.mood.decay_rate}}},
        {"ambient",
         {{"friend_threshold", config.ambient.friend_threshold},
          {"min_interval_s", config.ambient.min_interval_s},
          {"busy_interval_s", config.ambient.busy_interval_s},
          {"tick_interval_ms", config.ambient.tick_interval_ms}}},
    };
}

}  // namespace voxgate
