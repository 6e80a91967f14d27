/**
 * @file vg_logger.cpp
 * @brief voxgate - Logging implementation
 */

#include "voxgate/core/vg_logger.h"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <string>

namespace {

struct LogSinkState {
    vg_log_callback_fn callback = nullptr;
    void* user_data = nullptr;
    std::mutex mutex;
};

LogSinkState& get_sink_state() {
    static LogSinkState state;
    return state;
}

std::atomic<int> g_min_level{VG_LOG_INFO};

bool equals_ignore_case(const char* a, const char* b) {
    while (*a != '\0' && *b != '\0') {
        if (std::tolower(static_cast<unsigned char>(*a)) !=
            std::tolower(static_cast<unsigned char>(*b))) {
            return false;
        }
        ++a;
        ++b;
    }
    return *a == *b;
}

}  // namespace

void vg_log_set_callback(vg_log_callback_fn callback, void* user_data) {
    auto& state = get_sink_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.callback = callback;
    state.user_data = user_data;
}

void vg_log_set_min_level(vg_log_level_t level) {
    g_min_level.store(level);
}

vg_log_level_t vg_log_get_min_level(void) {
    return static_cast<vg_log_level_t>(g_min_level.load());
}

bool vg_log_parse_level(const char* name, vg_log_level_t* out_level) {
    if (name == nullptr || out_level == nullptr) {
        return false;
    }
    if (equals_ignore_case(name, "trace")) {
        *out_level = VG_LOG_TRACE;
    } else if (equals_ignore_case(name, "debug")) {
        *out_level = VG_LOG_DEBUG;
    } else if (equals_ignore_case(name, "info")) {
        *out_level = VG_LOG_INFO;
    } else if (equals_ignore_case(name, "warning") || equals_ignore_case(name, "warn")) {
        *out_level = VG_LOG_WARNING;
    } else if (equals_ignore_case(name, "error")) {
        *out_level = VG_LOG_ERROR;
    } else {
        return false;
    }
    return true;
}

const char* vg_log_level_name(vg_log_level_t level) {
    switch (level) {
        case VG_LOG_TRACE:
            return "TRACE";
        case VG_LOG_DEBUG:
            return "DEBUG";
        case VG_LOG_INFO:
            return "INFO";
        case VG_LOG_WARNING:
            return "WARN";
        case VG_LOG_ERROR:
            return "ERROR";
    }
    return "?";
}

void vg_log(vg_log_level_t level, const char* category, const char* message) {
    if (static_cast<int>(level) < g_min_level.load()) {
        return;
    }

    const char* cat = (category != nullptr) ? category : "voxgate";
    const char* msg = (message != nullptr) ? message : "";

    auto& state = get_sink_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (state.callback != nullptr) {
        state.callback(level, cat, msg, state.user_data);
        return;
    }

    std::fprintf(stderr, "[%s][%s] %s\n", vg_log_level_name(level), cat, msg);
}

void vg_logv(vg_log_level_t level, const char* category, const char* fmt, va_list args) {
    if (static_cast<int>(level) < g_min_level.load() || fmt == nullptr) {
        return;
    }

    char stack_buf[512];
    va_list args_copy;
    va_copy(args_copy, args);
    int needed = std::vsnprintf(stack_buf, sizeof(stack_buf), fmt, args_copy);
    va_end(args_copy);

    if (needed < 0) {
        vg_log(level, category, fmt);
        return;
    }

    if (static_cast<size_t>(needed) < sizeof(stack_buf)) {
        vg_log(level, category, stack_buf);
        return;
    }

    // Long message: format again into a heap buffer
    std::string heap_buf(static_cast<size_t>(needed) + 1, '\0');
    std::vsnprintf(&heap_buf[0], heap_buf.size(), fmt, args);
    heap_buf.resize(static_cast<size_t>(needed));
    vg_log(level, category, heap_buf.c_str());
}

void vg_logf(vg_log_level_t level, const char* category, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vg_logv(level, category, fmt, args);
    va_end(args);
}
