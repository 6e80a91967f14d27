/**
 * @file voxgate-cli.cpp
 * @brief voxgate CLI - Inspect the speech lock, speak through the queue, or run ambient awareness
 *
 * Usage:
 *   voxgate-cli --status
 *   voxgate-cli --say "Build finished" [--emotion satisfied] [--priority 3]
 *   voxgate-cli --listen [--friend 0.8]
 *
 * Options:
 *   --status               Print the lock holder, sidecar state and effective config
 *   --say <text>           Speak text through the queue (console synthesizer)
 *   --emotion <tag>        Emotion tag for --say (default: detected from text)
 *   --priority <n>         Priority for --say, 1 = highest (default: 5)
 *   --listen               Read transcripts from stdin and print interjections
 *   --friend <v>           Friend threshold 0.0-1.0 for --listen
 *   --config, -c <path>    JSON settings file
 *   --caller <name>        Name reported as lock holder
 *   --local                Use an in-process lock instead of the shared one
 *   --verbose, -v          Enable debug logging
 *   --help, -h             Show this help message
 *
 * In --listen mode each stdin line is a transcript. Lines starting with
 * "camera:" or "screen:" are treated as vision descriptions instead.
 *
 * Environment Variables:
 *   VOXGATE_MUTEX_DIR         Lock directory
 *   VOXGATE_CALLER            Lock holder name
 *   VOXGATE_FRIEND_THRESHOLD  Default friend threshold
 *   VOXGATE_LOG_LEVEL         trace, debug, info, warning, error
 */

#include "voxgate/voxgate.h"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#include "voxgate/core/vg_logger.h"
#include "voxgate/util/text_match.h"

using voxgate::util::Json;

// =============================================================================
// SIGNAL HANDLING
// =============================================================================

static volatile sig_atomic_t g_shouldStop = 0;

static void signalHandler(int signum) {
    (void)signum;
    g_shouldStop = 1;
}

// =============================================================================
// ARGUMENT PARSING
// =============================================================================

enum class Mode { None, Status, Say, Listen };

struct CliOptions {
    Mode mode = Mode::None;
    std::string sayText;
    std::string emotion;
    int priority = voxgate::speech::kDefaultPriority;
    std::string configPath;
    std::string caller;
    float friendThreshold = -1.0f;   // < 0: keep configured value
    bool localLock = false;
    bool verbose = false;
    bool showHelp = false;
    bool invalid = false;
};

static void printUsage(const char* programName) {
    printf("voxgate - speech output coordination for voice assistants\n\n");
    printf("Usage: %s (--status | --say <text> | --listen) [options]\n\n", programName);
    printf("Modes:\n");
    printf("  --status               Print lock holder, sidecar state and effective config\n");
    printf("  --say <text>           Speak text through the queue (console synthesizer)\n");
    printf("  --listen               Read transcripts from stdin, print interjections\n\n");
    printf("Options:\n");
    printf("  --emotion <tag>        Emotion tag for --say (default: detected)\n");
    printf("  --priority <n>         Priority for --say, 1 = highest (default: 5)\n");
    printf("  --friend <v>           Friend threshold 0.0-1.0 for --listen\n");
    printf("  --config, -c <path>    JSON settings file\n");
    printf("  --caller <name>        Name reported as lock holder\n");
    printf("  --local                Use an in-process lock\n");
    printf("  --verbose, -v          Enable debug logging\n");
    printf("  --help, -h             Show this help message\n\n");
    printf("Environment Variables:\n");
    printf("  VOXGATE_MUTEX_DIR         Lock directory\n");
    printf("  VOXGATE_CALLER            Lock holder name\n");
    printf("  VOXGATE_FRIEND_THRESHOLD  Default friend threshold\n");
    printf("  VOXGATE_LOG_LEVEL         trace, debug, info, warning, error\n\n");
    printf("In --listen mode, lines starting with \"camera:\" or \"screen:\" are vision\n");
    printf("descriptions; every other line is a transcript.\n");
}

static CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            opts.showHelp = true;
        }
        else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            opts.verbose = true;
        }
        else if (std::strcmp(arg, "--status") == 0) {
            opts.mode = Mode::Status;
        }
        else if (std::strcmp(arg, "--listen") == 0) {
            opts.mode = Mode::Listen;
        }
        else if (std::strcmp(arg, "--local") == 0) {
            opts.localLock = true;
        }
        else if (std::strcmp(arg, "--say") == 0 && i + 1 < argc) {
            opts.mode = Mode::Say;
            opts.sayText = argv[++i];
        }
        else if (std::strcmp(arg, "--emotion") == 0 && i + 1 < argc) {
            opts.emotion = argv[++i];
        }
        else if (std::strcmp(arg, "--priority") == 0 && i + 1 < argc) {
            opts.priority = std::atoi(argv[++i]);
        }
        else if (std::strcmp(arg, "--friend") == 0 && i + 1 < argc) {
            opts.friendThreshold = static_cast<float>(std::atof(argv[++i]));
        }
        else if ((std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "-c") == 0) && i + 1 < argc) {
            opts.configPath = argv[++i];
        }
        else if (std::strcmp(arg, "--caller") == 0 && i + 1 < argc) {
            opts.caller = argv[++i];
        }
        else {
            fprintf(stderr, "Error: Unknown or incomplete option '%s'\n", arg);
            opts.invalid = true;
        }
    }

    return opts;
}

// =============================================================================
// CONSOLE SYNTHESIZER
// =============================================================================

// Prints instead of playing audio and blocks for roughly the speaking time
static voxgate::speech::SynthesizeFn makeConsoleSynth(const voxgate::echo::EchoSuppressorConfig& echo) {
    return [echo](const std::string& text, const std::string& emotion) {
        double seconds = voxgate::echo::estimate_speech_duration(text, echo);
        printf("[speak:%s] %s\n", emotion.c_str(), text.c_str());
        fflush(stdout);

        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
        while (!g_shouldStop && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return true;
    };
}

// =============================================================================
// MODES
// =============================================================================

static int runStatus(const voxgate::VoxgateConfig& config) {
    voxgate::speech::FileSpeechLockConfig lockConfig;
    lockConfig.directory = config.lock.directory;
    lockConfig.caller = config.caller;
    lockConfig.ttl_ms = config.lock.ttl_ms;
    voxgate::speech::FileSpeechLock lock(lockConfig);

    voxgate::speech::LockState state = lock.read_state();
    auto holder = lock.who_holds();

    Json status = {
        {"directory", lock.directory()},
        {"locked", lock.is_locked()},
        {"holder", holder ? Json(*holder) : Json(nullptr)},
        {"sidecar",
         {{"status", state.status},
          {"caller", state.held_by},
          {"pid", state.pid},
          {"acquired_at_ms", state.acquired_at_ms},
          {"ttl_ms", state.ttl_ms},
          {"released_at_ms", state.released_at_ms}}},
        {"config", voxgate::config_to_json(config)},
    };
    printf("%s\n", status.dump(2, ' ', false, Json::error_handler_t::replace).c_str());
    return 0;
}

static int runSay(const voxgate::VoxgateConfig& config, const CliOptions& opts) {
    voxgate::CoordinatorCallbacks callbacks;
    callbacks.synthesize_and_play = makeConsoleSynth(config.echo);

    voxgate::SpeechCoordinator coordinator(config, callbacks);
    vg_result_t rc = coordinator.initialize();
    if (rc != VG_SUCCESS) {
        fprintf(stderr, "Error: %s\n", vg_error_message(rc));
        return 1;
    }

    if (!coordinator.say(opts.sayText, opts.emotion, opts.priority)) {
        fprintf(stderr, "Error: Nothing to say\n");
        return 1;
    }

    double speakSeconds = voxgate::echo::estimate_speech_duration(opts.sayText, config.echo);
    auto budget = std::chrono::milliseconds(config.queue.lock_timeout_ms +
                                            static_cast<int64_t>(speakSeconds * 1000.0) + 2000);
    coordinator.queue().wait_until_idle(budget);

    voxgate::speech::SpeechQueueStats stats = coordinator.queue().stats();
    coordinator.shutdown();

    if (stats.spoken == 0) {
        fprintf(stderr, "Not spoken (busy: %llu, failed: %llu)\n",
                static_cast<unsigned long long>(stats.dropped_busy),
                static_cast<unsigned long long>(stats.failed));
        return 2;
    }
    return 0;
}

static int runListen(const voxgate::VoxgateConfig& config) {
    voxgate::CoordinatorCallbacks callbacks;
    callbacks.synthesize_and_play = makeConsoleSynth(config.echo);

    voxgate::SpeechCoordinator coordinator(config, callbacks);
    vg_result_t rc = coordinator.initialize();
    if (rc != VG_SUCCESS) {
        fprintf(stderr, "Error: %s\n", vg_error_message(rc));
        return 1;
    }

    voxgate::speech::SpeechRequestQueue& queue = coordinator.queue();
    bool started = coordinator.start_ambient(
        [&queue](const voxgate::ambient::InterjectionEvent& event, const std::string& context) {
            printf("[interject] %s\n", context.c_str());
            std::string line = std::string("(") +
                               voxgate::ambient::interject_reason_name(event.reason) + ") " +
                               event.hint;
            queue.enqueue(line, "warm", 7);
        });
    if (!started) {
        fprintf(stderr, "Error: Could not start ambient awareness\n");
        return 1;
    }

    printf("Listening on stdin (friend threshold %.2f). Ctrl-D to stop.\n",
           coordinator.scheduler().friend_threshold());

    std::string line;
    while (!g_shouldStop && std::getline(std::cin, line)) {
        std::string trimmed = voxgate::util::trim(line);
        if (trimmed.empty()) {
            continue;
        }
        if (trimmed.compare(0, 7, "camera:") == 0) {
            std::string description = voxgate::util::trim(trimmed.substr(7));
            coordinator.scheduler().update_visual_context(description, "");
            coordinator.scheduler().evaluate_trigger(description,
                                                     voxgate::ambient::TriggerSource::Camera);
        } else if (trimmed.compare(0, 7, "screen:") == 0) {
            std::string description = voxgate::util::trim(trimmed.substr(7));
            coordinator.scheduler().update_visual_context("", description);
            coordinator.scheduler().evaluate_trigger(description,
                                                     voxgate::ambient::TriggerSource::Screen);
        } else if (!coordinator.handle_transcript(trimmed, 1.0f)) {
            printf("[echo] ignored: %s\n", trimmed.c_str());
        }
    }

    printf("%s\n", coordinator.status_json().dump(2, ' ', false, Json::error_handler_t::replace).c_str());
    coordinator.shutdown();
    return 0;
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char* argv[]) {
    CliOptions opts = parseArgs(argc, argv);

    if (opts.showHelp) {
        printUsage(argv[0]);
        return 0;
    }
    if (opts.invalid || opts.mode == Mode::None) {
        if (!opts.invalid) {
            fprintf(stderr, "Error: One of --status, --say or --listen is required\n\n");
        }
        printUsage(argv[0]);
        return 1;
    }

    // Defaults, then settings file, then environment, then command line
    voxgate::VoxgateConfig config;
    if (!opts.configPath.empty()) {
        vg_result_t rc = voxgate::load_config_file(opts.configPath, config);
        if (rc != VG_SUCCESS) {
            fprintf(stderr, "Error: %s: %s\n", opts.configPath.c_str(), vg_error_message(rc));
            return 1;
        }
    }
    voxgate::apply_env_overrides(config);

    if (!opts.caller.empty()) config.caller = opts.caller;
    if (opts.friendThreshold >= 0.0f) config.ambient.friend_threshold = opts.friendThreshold;
    if (opts.localLock) config.lock.cross_process = false;

    vg_log_set_min_level(opts.verbose ? VG_LOG_DEBUG : config.log_level);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    switch (opts.mode) {
        case Mode::Status:
            return runStatus(config);
        case Mode::Say:
            return runSay(config, opts);
        case Mode::Listen:
            return runListen(config);
        case Mode::None:
            break;
    }
    return 1;
}
