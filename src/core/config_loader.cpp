#include "core/config_loader.h"

#include "core/tick_clock.h"
#include "logging/logger.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace segue {

namespace {

// Reads an integer field and clamps it, warning when the value was out of range.
template <typename T>
void readClamped(const nlohmann::json& section, const char* key, T& value, T lo, T hi,
                 const char* sectionName, bool verbose) {
    if (!section.contains(key)) {
        return;
    }
    const auto& field = section[key];
    if (!field.is_number()) {
        throw nlohmann::json::type_error::create(
            302, std::string(sectionName) + "." + key + " must be a number", &field);
    }
    const T raw = field.get<T>();
    const T clamped = std::clamp(raw, lo, hi);
    if (clamped != raw && verbose) {
        LOG_WARN("Config: {}.{} out of range ({}), using {}", sectionName, key, raw, clamped);
    }
    value = clamped;
}

void readString(const nlohmann::json& section, const char* key, std::string& value) {
    if (section.contains(key)) {
        value = section[key].get<std::string>();
    }
}

void parseAudio(const nlohmann::json& j, AppConfig::AudioConfig& audio, bool verbose) {
    readString(j, "device", audio.device);
    if (j.contains("sampleRate")) {
        const int rate = j["sampleRate"].get<int>();
        if (timing::isSupportedRate(rate)) {
            audio.sampleRate = rate;
        } else if (verbose) {
            LOG_WARN("Config: audio.sampleRate {} not supported, using {}", rate,
                     audio.sampleRate);
        }
    }
    readClamped(j, "periodFrames", audio.periodFrames, 64, 16384, "audio", verbose);
    readClamped(j, "bufferFrames", audio.bufferFrames, 128, 262144, "audio", verbose);
    if (audio.bufferFrames < audio.periodFrames * 2) {
        if (verbose) {
            LOG_WARN("Config: audio.bufferFrames {} below two periods, using {}",
                     audio.bufferFrames, audio.periodFrames * 2);
        }
        audio.bufferFrames = audio.periodFrames * 2;
    }
    if (j.contains("resampleQuality")) {
        const auto name = j["resampleQuality"].get<std::string>();
        if (auto quality = audio::parseResampleQuality(name)) {
            audio.resampleQuality = *quality;
        } else if (verbose) {
            LOG_WARN("Config: unknown audio.resampleQuality '{}', using {}", name,
                     audio::resampleQualityToString(audio.resampleQuality));
        }
    }
}

void parseEngine(const nlohmann::json& j, AppConfig::EngineConfig& engine, bool verbose) {
    readClamped(j, "maxDecodeStreams", engine.maxDecodeStreams,
                EngineConstants::MIN_DECODE_STREAMS, EngineConstants::MAX_DECODE_STREAMS, "engine",
                verbose);
    readClamped(j, "decodeChunkMs", engine.decodeChunkMs, 250, 5000, "engine", verbose);
    readClamped(j, "decodeWorkPeriodMs", engine.decodeWorkPeriodMs, 100, 60000, "engine",
                verbose);
    readClamped(j, "minBufferThresholdMs", engine.minBufferThresholdMs, 100, 12000, "engine",
                verbose);
    readClamped(j, "firstPassageThresholdMs", engine.firstPassageThresholdMs, 100, 12000,
                "engine", verbose);
    readClamped(j, "watchdogIntervalMs", engine.watchdogIntervalMs, 10, 5000, "engine", verbose);
    readClamped(j, "completionDedupWindowMs", engine.completionDedupWindowMs, 100, 60000,
                "engine", verbose);
    readClamped(j, "positionIntervalMs", engine.positionIntervalMs, 100, 5000, "engine", verbose);
    readClamped(j, "frameAuditToleranceFrames", engine.frameAuditToleranceFrames, 0, 1000000,
                "engine", verbose);
    readClamped(j, "markerQueueCapacity", engine.markerQueueCapacity, 16, 65536, "engine",
                verbose);
    readClamped(j, "markerPollMs", engine.markerPollMs, 1, 50, "engine", verbose);
}

void parseBuffer(const nlohmann::json& j, AppConfig::BufferConfig& buffer, bool verbose) {
    readClamped<size_t>(j, "capacityFrames", buffer.capacityFrames, 44100, 10000000, "buffer",
                        verbose);
    readClamped<size_t>(j, "headroomFrames", buffer.headroomFrames, 2205, 88200, "buffer",
                        verbose);
    readClamped<size_t>(j, "resumeHysteresisFrames", buffer.resumeHysteresisFrames, 2205, 441000,
                        "buffer", verbose);
    if (buffer.capacityFrames <= buffer.headroomFrames) {
        throw nlohmann::json::other_error::create(
            501, "buffer.capacityFrames must exceed buffer.headroomFrames", nullptr);
    }
    if (buffer.capacityFrames < buffer.headroomFrames * 2 && verbose) {
        LOG_WARN("Config: buffer.capacityFrames {} is less than twice the headroom {}",
                 buffer.capacityFrames, buffer.headroomFrames);
    }
}

void parseMixer(const nlohmann::json& j, AppConfig::MixerConfig& mixer, bool verbose) {
    readClamped(j, "volume", mixer.volume, 0.0f, 1.0f, "mixer", verbose);
    readClamped(j, "pauseDecayFactor", mixer.pauseDecayFactor, 0.5f, 0.99f, "mixer", verbose);
    readClamped(j, "pauseDecayFloor", mixer.pauseDecayFloor, 0.00001f, 0.001f, "mixer", verbose);
    readClamped(j, "resumeFadeMs", mixer.resumeFadeMs, 0, 5000, "mixer", verbose);
    readClamped(j, "clipCeiling", mixer.clipCeiling, 0.1f, 1.0f, "mixer", verbose);
    if (j.contains("resumeFadeCurve")) {
        const auto name = j["resumeFadeCurve"].get<std::string>();
        if (auto curve = audio::parseFadeCurve(name)) {
            mixer.resumeFadeCurve = *curve;
        } else if (verbose) {
            LOG_WARN("Config: unknown mixer.resumeFadeCurve '{}', using exponential", name);
        }
    }
}

void parseOutput(const nlohmann::json& j, AppConfig::OutputConfig& output, bool verbose) {
    readClamped(j, "retryAttempts", output.retryAttempts, 1, 100, "output", verbose);
    readClamped(j, "retryDelayMs", output.retryDelayMs, 10, 10000, "output", verbose);
}

void parseDaemon(const nlohmann::json& j, AppConfig::DaemonConfig& daemon, bool verbose) {
    readString(j, "pidFile", daemon.pidFile);
    if (j.contains("reclaimStalePidFile")) {
        daemon.reclaimStalePidFile = j["reclaimStalePidFile"].get<bool>();
    }
    if (j.contains("realtime")) {
        daemon.realtime = j["realtime"].get<bool>();
    }
    readClamped(j, "realtimePriority", daemon.realtimePriority, 1, 99, "daemon", verbose);
}

// Applies @p parse to j[name]; on a type error the section keeps its defaults.
template <typename Section, typename Parser>
void applySection(const nlohmann::json& j, const char* name, Section& section, Parser parse,
                  bool verbose) {
    if (!j.contains(name)) {
        return;
    }
    if (!j[name].is_object()) {
        if (verbose) {
            LOG_WARN("Config: '{}' must be an object, using defaults", name);
        }
        return;
    }
    Section parsed = section;
    try {
        parse(j[name], parsed, verbose);
        section = parsed;
    } catch (const nlohmann::json::exception& e) {
        if (verbose) {
            LOG_WARN("Config: Invalid {} settings, using defaults: {}", name, e.what());
        }
        section = Section{};
    }
}

bool applyConfig(const nlohmann::json& j, AppConfig& outConfig, bool verbose) {
    if (!j.is_object()) {
        if (verbose) {
            LOG_WARN("Config: top level must be an object, using defaults");
        }
        return false;
    }
    applySection(j, "audio", outConfig.audio, parseAudio, verbose);
    applySection(j, "engine", outConfig.engine, parseEngine, verbose);
    applySection(j, "buffer", outConfig.buffer, parseBuffer, verbose);
    applySection(j, "mixer", outConfig.mixer, parseMixer, verbose);
    applySection(j, "output", outConfig.output, parseOutput, verbose);
    applySection(j, "daemon", outConfig.daemon, parseDaemon, verbose);
    applySection(
        j, "ipc", outConfig.ipc,
        [](const nlohmann::json& s, AppConfig::IpcConfig& ipc, bool) {
            readString(s, "endpoint", ipc.endpoint);
        },
        verbose);
    applySection(
        j, "storage", outConfig.storage,
        [](const nlohmann::json& s, AppConfig::StorageConfig& storage, bool) {
            readString(s, "queueFile", storage.queueFile);
            readString(s, "passageCatalog", storage.passageCatalog);
        },
        verbose);
    if (j.contains("logging") && j["logging"].is_object()) {
        logging::parseLogConfig(j["logging"].dump(), outConfig.logging);
    }
    return true;
}

}  // namespace

bool parseAppConfig(const std::string& jsonText, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};
    try {
        return applyConfig(nlohmann::json::parse(jsonText), outConfig, verbose);
    } catch (const nlohmann::json::parse_error& e) {
        if (verbose) {
            LOG_ERROR("Config: parse error: {}", e.what());
        }
        outConfig = AppConfig{};
        return false;
    }
}

bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig, bool verbose) {
    outConfig = AppConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }
    std::stringstream text;
    text << file.rdbuf();
    const bool ok = parseAppConfig(text.str(), outConfig, verbose);
    if (ok && verbose) {
        LOG_INFO("Config: loaded {} (device {}, {} Hz, {} decode streams)", configPath.string(),
                 outConfig.audio.device, outConfig.audio.sampleRate,
                 outConfig.engine.maxDecodeStreams);
    }
    return ok;
}

}  // namespace segue
