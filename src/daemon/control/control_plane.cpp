#include "daemon/control/control_plane.h"

#include "core/tick_clock.h"
#include "logging/logger.h"
#include "playback/entry_json.h"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace segue::daemon_control {
namespace {

using daemon_ipc::ZmqRequest;

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// String parameter from JSON params or, for raw requests, the payload.
std::optional<std::string> stringParam(const ZmqRequest& request, const char* key) {
    if (request.isJson) {
        auto params = request.params();
        if (params.contains(key) && params[key].is_string()) {
            return params[key].get<std::string>();
        }
        return std::nullopt;
    }
    auto value = trim(request.payload);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> numberParam(const ZmqRequest& request, const char* key) {
    if (request.isJson) {
        auto params = request.params();
        if (params.contains(key) && params[key].is_number()) {
            return params[key].get<double>();
        }
        return std::nullopt;
    }
    auto text = trim(request.payload);
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

nlohmann::json optionalString(const std::optional<std::string>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

std::string invalidParams(const ZmqRequest& request, const std::string& message) {
    return daemon_ipc::buildErrorResponse(request, errorCodeToString(ErrorCode::IPC_INVALID_PARAMS),
                                          message);
}

}  // namespace

ControlPlane::ControlPlane(ControlPlaneDependencies deps)
    : deps_(std::move(deps)),
      zmqServer_(std::make_shared<daemon_ipc::ZmqCommandServer>(deps_.endpoint,
                                                                 deps_.recvTimeoutMs)) {
    if (!deps_.engine) {
        throw std::invalid_argument("ControlPlane requires a playback engine");
    }
    registerHandlers();

    std::weak_ptr<daemon_ipc::ZmqCommandServer> server = zmqServer_;
    deps_.engine->bus().subscribe(
        playback::EventBus::PlaybackHandler([server](const playback::PlaybackEvent& event) {
            if (auto live = server.lock()) {
                live->publish(eventToJson(event).dump());
            }
        }));
}

ControlPlane::~ControlPlane() {
    stop();
}

bool ControlPlane::start() {
    return zmqServer_->start();
}

void ControlPlane::stop() {
    zmqServer_->stop();
}

std::string ControlPlane::handle(const std::string& raw) {
    return zmqServer_->handleRaw(raw);
}

void ControlPlane::registerHandlers() {
    zmqServer_->registerCommand("PING", [this](const auto& req) { return handlePing(req); });
    zmqServer_->registerCommand("ENQUEUE", [this](const auto& req) { return handleEnqueue(req); });
    zmqServer_->registerCommand("REMOVE", [this](const auto& req) { return handleRemove(req); });
    zmqServer_->registerCommand("SKIP", [this](const auto& req) { return handleSkip(req); });
    zmqServer_->registerCommand("PAUSE", [this](const auto& req) { return handlePause(req); });
    zmqServer_->registerCommand("PLAY", [this](const auto& req) { return handlePlay(req); });
    zmqServer_->registerCommand("SEEK", [this](const auto& req) { return handleSeek(req); });
    zmqServer_->registerCommand("VOLUME", [this](const auto& req) { return handleVolume(req); });
    zmqServer_->registerCommand("CLEAR", [this](const auto& req) { return handleClear(req); });
    zmqServer_->registerCommand("STATUS", [this](const auto& req) { return handleStatus(req); });
    zmqServer_->registerCommand("QUEUE", [this](const auto& req) { return handleQueue(req); });
    zmqServer_->registerCommand("BUFFERS", [this](const auto& req) { return handleBuffers(req); });
}

std::string ControlPlane::respond(const ZmqRequest& request, const CommandResult& result,
                                  const nlohmann::json& data) {
    if (!result.ok()) {
        LOG_DEBUG("Command {} rejected: {} ({})", request.command, result.message,
                  errorCodeToString(result.code));
        return daemon_ipc::buildErrorResponse(request, errorCodeToString(result.code),
                                              result.message);
    }
    return daemon_ipc::buildOkResponse(request, data);
}

std::string ControlPlane::handlePing(const ZmqRequest& request) {
    return daemon_ipc::buildOkResponse(request, "PONG");
}

std::string ControlPlane::handleEnqueue(const ZmqRequest& request) {
    playback::EnqueueRequest enqueue;
    if (request.isJson) {
        auto params = request.params();
        if (params.contains("passage_id") && params["passage_id"].is_string()) {
            enqueue.passageId = params["passage_id"].get<std::string>();
        }
        if (params.contains("file") && params["file"].is_string()) {
            enqueue.filePath = params["file"].get<std::string>();
        }
        if (params.contains("timing") && !params["timing"].is_null()) {
            try {
                enqueue.timing = playback::timingFromJson(params["timing"]);
            } catch (const EngineError& e) {
                return respond(request, CommandResult::failure(e.code(), e.what()));
            }
        }
    } else {
        auto file = stringParam(request, "file");
        if (file) {
            enqueue.filePath = *file;
        }
    }

    auto result = deps_.engine->orchestrator().enqueue(enqueue);
    nlohmann::json data;
    if (result.result.ok()) {
        data["queue_entry_id"] = result.queueEntryId;
        data["position"] = playback::toString(result.position);
    }
    return respond(request, result.result, data);
}

std::string ControlPlane::handleRemove(const ZmqRequest& request) {
    auto id = stringParam(request, "queue_entry_id");
    if (!id) {
        return invalidParams(request, "REMOVE needs a queue_entry_id");
    }
    bool removed = false;
    auto result = deps_.engine->orchestrator().removeEntry(*id, &removed);
    nlohmann::json data;
    if (result.ok()) {
        data["removed"] = removed;
    }
    return respond(request, result, data);
}

std::string ControlPlane::handleSkip(const ZmqRequest& request) {
    return respond(request, deps_.engine->orchestrator().skip());
}

std::string ControlPlane::handlePause(const ZmqRequest& request) {
    return respond(request, deps_.engine->orchestrator().pause());
}

std::string ControlPlane::handlePlay(const ZmqRequest& request) {
    return respond(request, deps_.engine->orchestrator().play());
}

std::string ControlPlane::handleSeek(const ZmqRequest& request) {
    auto position = numberParam(request, "position_ms");
    if (!position || !std::isfinite(*position)) {
        return invalidParams(request, "SEEK needs a numeric position_ms");
    }
    // Beyond the tick range no passage can contain it; also keeps the cast defined.
    if (*position < 0.0 || *position > static_cast<double>(timing::MAX_TICK_MS)) {
        return respond(request, CommandResult::failure(ErrorCode::PLAYBACK_SEEK_OUT_OF_RANGE,
                                                       "position_ms out of range"));
    }
    return respond(request,
                   deps_.engine->orchestrator().seek(static_cast<std::int64_t>(*position)));
}

std::string ControlPlane::handleVolume(const ZmqRequest& request) {
    auto volume = numberParam(request, "volume");
    if (!volume) {
        return invalidParams(request, "VOLUME needs a numeric volume");
    }
    auto result = deps_.engine->orchestrator().setVolume(static_cast<float>(*volume));
    nlohmann::json data;
    if (result.ok()) {
        data["volume"] = deps_.engine->mixer().volume();
    }
    return respond(request, result, data);
}

std::string ControlPlane::handleClear(const ZmqRequest& request) {
    return respond(request, deps_.engine->orchestrator().clearQueue());
}

std::string ControlPlane::handleStatus(const ZmqRequest& request) {
    return daemon_ipc::buildOkResponse(request,
                                       statusToJson(deps_.engine->status()));
}

std::string ControlPlane::handleQueue(const ZmqRequest& request) {
    nlohmann::json entries = nlohmann::json::array();
    size_t index = 0;
    for (const auto& entry : deps_.engine->orchestrator().queueSnapshot()) {
        auto item = playback::entryToJson(entry);
        item["position"] = index == 0   ? "current"
                           : index == 1 ? "next"
                                        : "queued";
        entries.push_back(std::move(item));
        ++index;
    }
    return daemon_ipc::buildOkResponse(request, entries);
}

std::string ControlPlane::handleBuffers(const ZmqRequest& request) {
    nlohmann::json buffers = nlohmann::json::array();
    for (const auto& snapshot : deps_.engine->buffers().snapshot()) {
        buffers.push_back({{"queue_entry_id", snapshot.entryId},
                           {"state", playback::toString(snapshot.state)},
                           {"occupancy_frames", snapshot.occupancyFrames},
                           {"occupancy_ms", snapshot.occupancyMs},
                           {"capacity_frames", snapshot.capacityFrames},
                           {"decode_complete", snapshot.decodeComplete}});
    }
    return daemon_ipc::buildOkResponse(request, buffers);
}

nlohmann::json ControlPlane::eventToJson(const playback::PlaybackEvent& event) {
    nlohmann::json j;
    j["event"] = playback::toString(event.kind);
    if (!event.entryId.empty()) {
        j["queue_entry_id"] = event.entryId;
    }
    switch (event.kind) {
    case playback::PlaybackEventKind::PositionUpdate:
        j["position_ms"] = event.positionMs;
        break;
    case playback::PlaybackEventKind::PlaybackStateChanged:
        j["paused"] = event.paused;
        break;
    case playback::PlaybackEventKind::VolumeChanged:
        j["volume"] = event.volume;
        break;
    case playback::PlaybackEventKind::Error:
        j["error_code"] = errorCodeToString(event.error);
        break;
    default:
        break;
    }
    if (!event.detail.empty()) {
        j["detail"] = event.detail;
    }
    return j;
}

nlohmann::json ControlPlane::statusToJson(const playback::EngineStatus& status) {
    nlohmann::json j;
    j["mode"] = playback::toString(status.mode);
    j["paused"] = status.paused;
    j["volume"] = status.volume;
    j["current"] = optionalString(status.currentEntry);
    j["next"] = optionalString(status.nextEntry);
    j["mixing"] = optionalString(status.mixingEntry);
    j["position_ms"] = status.positionMs;
    j["queue_length"] = status.queueLength;
    j["watchdog_interventions"] = status.watchdogInterventions;
    j["underruns"] = status.underruns;
    j["frame_audits"] = status.frameAudits;
    j["frame_mismatches"] = status.frameMismatches;
    j["dropped_markers"] = status.droppedMarkers;
    j["callbacks"] = {{"count", status.callbacks.callbacks},
                      {"late", status.callbacks.lateCallbacks},
                      {"missed_periods", status.callbacks.missedPeriods},
                      {"last_interval_us", status.callbacks.lastIntervalUs},
                      {"max_interval_us", status.callbacks.maxIntervalUs}};
    return j;
}

}  // namespace segue::daemon_control
