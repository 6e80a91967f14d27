/**
 * @file vg_config.h
 * @brief voxgate - Aggregated configuration
 *
 * Defaults live in the component config structs. A JSON settings file and
 * then environment variables override them:
 *
 *   {
 *     "caller": "chat",
 *     "log_level": "info",
 *     "queue":   { "lock_timeout_ms": 10000, "poll_interval_ms": 500,
 *                  "presence_cache_ms": 5000, "check_presence": true },
 *     "lock":    { "cross_process": true, "directory": "/run/user/1000/voxgate",
 *                  "ttl_ms": 30000 },
 *     "echo":    { "grace_period_s": 0.5, "min_confidence": 0.7, "adaptive": true, ... },
 *     "mood":    { "decay_rate": 0.01 },
 *     "ambient": { "friend_threshold": 0.5, "min_interval_s": 30, ... }
 *   }
 *
 * Environment: VOXGATE_MUTEX_DIR, VOXGATE_CALLER, VOXGATE_FRIEND_THRESHOLD,
 * VOXGATE_LOG_LEVEL.
 */

#ifndef VOXGATE_VG_CONFIG_H
#define VOXGATE_VG_CONFIG_H

#include <cstdint>
#include <string>

#include "voxgate/ambient/interjection_scheduler.h"
#include "voxgate/core/vg_error.h"
#include "voxgate/core/vg_logger.h"
#include "voxgate/echo/echo_suppressor.h"
#include "voxgate/mood/mood_state.h"
#include "voxgate/speech/speech_request_queue.h"
#include "voxgate/util/json_utils.h"

namespace voxgate {

struct LockConfig {
    bool cross_process = true;      // FileSpeechLock; false selects LocalSpeechLock
    std::string directory;          // Empty: speech::default_lock_directory()
    int64_t ttl_ms = 30000;
    int retry_interval_ms = 50;
};

struct VoxgateConfig {
    std::string caller = "voxgate"; // Name this process reports as lock holder
    vg_log_level_t log_level = VG_LOG_INFO;

    speech::SpeechQueueConfig queue;
    LockConfig lock;
    echo::EchoSuppressorConfig echo;
    mood::MoodConfig mood;
    ambient::AmbientConfig ambient;
};

/**
 * @brief Applies a parsed settings document
 *
 * On error config is left unchanged.
 *
 * @return VG_SUCCESS, or VG_ERROR_PARSE for a non-object document or a field of the wrong type
 */
vg_result_t apply_config_json(const util::Json& document, VoxgateConfig& config);

/**
 * @brief Loads a JSON settings file over config
 *
 * @return VG_SUCCESS, VG_ERROR_FILE_NOT_FOUND or VG_ERROR_PARSE (config unchanged on error)
 */
vg_result_t load_config_file(const std::string& path, VoxgateConfig& config);

/// Applies VOXGATE_* environment variables; malformed values are logged and ignored
void apply_env_overrides(VoxgateConfig& config);

/// Effective configuration, for --status style dumps
util::Json config_to_json(const VoxgateConfig& config);

}  // namespace voxgate

#endif  // VOXGATE_VG_CONFIG_H
