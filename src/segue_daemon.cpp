#include "core/config_loader.h"
#include "core/error_codes.h"
#include "daemon/app/app.h"
#include "daemon/core/pid_lock.h"
#include "logging/logger.h"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>

namespace {

void printUsage(const char* programName) {
    std::cout << "segue - multi-stream audio playback daemon" << '\n';
    std::cout << "Usage: " << programName << " [options]" << '\n';
    std::cout << '\n';
    std::cout << "Options:" << '\n';
    std::cout << "  --config <path>    Config file (default: " << segue::DEFAULT_CONFIG_FILE
              << ")" << '\n';
    std::cout << "  --device <name>    ALSA output device (overrides audio.device)" << '\n';
    std::cout << "  --endpoint <uri>   ZeroMQ command endpoint (overrides ipc.endpoint)" << '\n';
    std::cout << "  --pid-file <path>  PID lock file (overrides daemon.pidFile, default: "
              << segue::EngineConstants::DEFAULT_PID_FILE << ")" << '\n';
    std::cout << "  --help             Show this help message" << '\n';
    std::cout << '\n';
    std::cout << "Environment:" << '\n';
    std::cout << "  SEGUE_ALSA_DEVICE  Output device when --device is not given" << '\n';
}

struct Options {
    std::string configPath = segue::DEFAULT_CONFIG_FILE;
    std::optional<std::string> pidFile;
    segue::daemon_app::AppOverrides overrides;
    bool showHelp = false;
};

bool parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
            return false;
        } else if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            options.overrides.device = argv[++i];
        } else if (arg == "--endpoint" && i + 1 < argc) {
            options.overrides.endpoint = argv[++i];
        } else if (arg == "--pid-file" && i + 1 < argc) {
            options.pidFile = argv[++i];
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << '\n';
            return false;
        }
    }
    if (!options.overrides.device) {
        if (const char* envDevice = std::getenv("SEGUE_ALSA_DEVICE")) {
            options.overrides.device = envDevice;
        }
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return options.showHelp ? 0 : 2;
    }

    // stderr only until the PID lock is held.
    segue::logging::initializeEarly();

    segue::AppConfig config;
    if (!segue::loadAppConfig(options.configPath, config, false)) {
        LOG_DEBUG("Config {} not usable, PID file settings from defaults", options.configPath);
    }
    const std::string pidFile = options.pidFile.value_or(config.daemon.pidFile);
    segue::daemon_core::PidLock::Policy policy;
    policy.reclaimStale = config.daemon.reclaimStalePidFile;

    std::optional<segue::daemon_core::PidLock> pidLock;
    try {
        pidLock.emplace(segue::daemon_core::PidLock::acquire(pidFile, policy));
    } catch (const segue::EngineError& e) {
        LOG_ERROR("[{}] {}", segue::errorCodeToString(e.code()), e.what());
        return e.code() == segue::ErrorCode::RESOURCE_ALREADY_RUNNING ? 3 : 1;
    }

    segue::logging::initializeFromConfig(options.configPath);

    LOG_INFO("========================================");
    LOG_INFO("  segue playback daemon");
    LOG_INFO("========================================");
    LOG_INFO("PID: {} (file: {})", getpid(), pidLock->path());

    segue::daemon_app::App app(options.configPath);
    const int exitCode = app.run(options.overrides);

    segue::logging::shutdown();
    return exitCode;
}
