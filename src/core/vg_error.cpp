#include "voxgate/core/vg_error.h"

const char* vg_error_message(vg_result_t code) {
    switch (code) {
        case VG_SUCCESS:
            return "Success";
        case VG_ERROR_NOT_CONFIGURED:
            return "Required collaborator or setting is missing";
        case VG_ERROR_ALREADY_RUNNING:
            return "Component is already running";
        case VG_ERROR_NOT_RUNNING:
            return "Component is not running";
        case VG_ERROR_RESOURCE_BUSY:
            return "Speech lock is held by another speaker";
        case VG_ERROR_STALE_LOCK:
            return "Speech lock exceeded its TTL and was reclaimed";
        case VG_ERROR_LOCK_NOT_HELD:
            return "Speech lock is not held by this owner";
        case VG_ERROR_EXTERNAL_CALL:
            return "External call failed";
        case VG_ERROR_IO:
            return "I/O error";
        case VG_ERROR_FILE_NOT_FOUND:
            return "File not found";
        case VG_ERROR_INVALID_ARGUMENT:
            return "Invalid argument";
        case VG_ERROR_PARSE:
            return "Parse error";
        default:
            return "Unknown error";
    }
}

// ------------------------------------------------------------
// Category from code range
// ------------------------------------------------------------
const char* vg_error_category(vg_result_t code) {
    if (code == VG_SUCCESS) return "Success";
    if (code >= -119 && code <= -100) return "Configuration";
    if (code >= -139 && code <= -120) return "Lock";
    if (code >= -159 && code <= -140) return "External";
    if (code >= -179 && code <= -160) return "Storage";
    if (code >= -199 && code <= -180) return "Validation";
    return "Unknown";
}

vg_error_model_t vg_make_error_model(vg_result_t code) {
    vg_error_model_t model;
    model.code = code;
    model.message = vg_error_message(code);
    model.category = vg_error_category(code);
    return model;
}
