/**
 * @file vg_error.h
 * @brief voxgate - Result codes and structured error model
 *
 * Codes are grouped in ranges so a category can be derived from the code:
 *   -100..-119  Configuration
 *   -120..-139  Lock
 *   -140..-159  External
 *   -160..-179  Storage
 *   -180..-199  Validation
 */

#ifndef VOXGATE_VG_ERROR_H
#define VOXGATE_VG_ERROR_H

#include <cstdint>

typedef int32_t vg_result_t;

#define VG_SUCCESS ((vg_result_t)0)

// Configuration
#define VG_ERROR_NOT_CONFIGURED ((vg_result_t)-100)
#define VG_ERROR_ALREADY_RUNNING ((vg_result_t)-101)
#define VG_ERROR_NOT_RUNNING ((vg_result_t)-102)

// Lock
#define VG_ERROR_RESOURCE_BUSY ((vg_result_t)-120)
#define VG_ERROR_STALE_LOCK ((vg_result_t)-121)
#define VG_ERROR_LOCK_NOT_HELD ((vg_result_t)-122)

// External collaborators (synth/play, vision probe, presence, host callback)
#define VG_ERROR_EXTERNAL_CALL ((vg_result_t)-140)

// Storage
#define VG_ERROR_IO ((vg_result_t)-160)
#define VG_ERROR_FILE_NOT_FOUND ((vg_result_t)-161)

// Validation
#define VG_ERROR_INVALID_ARGUMENT ((vg_result_t)-180)
#define VG_ERROR_PARSE ((vg_result_t)-181)

/**
 * @brief Structured error for logs and diagnostics
 */
typedef struct {
    vg_result_t code;      /**< Numeric result code */
    const char* message;   /**< Human-readable message */
    const char* category;  /**< Category derived from the code range */
} vg_error_model_t;

const char* vg_error_message(vg_result_t code);

const char* vg_error_category(vg_result_t code);

vg_error_model_t vg_make_error_model(vg_result_t code);

#endif  // VOXGATE_VG_ERROR_H
