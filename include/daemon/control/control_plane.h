#pragma once

#include "daemon/control/zmq_server.h"
#include "playback/events.h"
#include "playback/playback_engine.h"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace segue::daemon_control {

struct ControlPlaneDependencies {
    playback::PlaybackEngine* engine = nullptr;
    std::string endpoint = EngineConstants::ZEROMQ_IPC_PATH;
    int recvTimeoutMs = 200;
};

// Maps ZeroMQ commands onto the playback engine and republishes every
// PlaybackEvent on the PUB socket.
class ControlPlane {
   public:
    explicit ControlPlane(ControlPlaneDependencies deps);
    ~ControlPlane();

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;

    bool start();
    void stop();

    // Handles one request without the socket (same path as the REP loop).
    std::string handle(const std::string& raw);

    const daemon_ipc::ZmqCommandServer& server() const {
        return *zmqServer_;
    }

    static nlohmann::json eventToJson(const playback::PlaybackEvent& event);
    static nlohmann::json statusToJson(const playback::EngineStatus& status);

   private:
    void registerHandlers();

    std::string respond(const daemon_ipc::ZmqRequest& request, const CommandResult& result,
                        const nlohmann::json& data = {});

    std::string handlePing(const daemon_ipc::ZmqRequest& request);
    std::string handleEnqueue(const daemon_ipc::ZmqRequest& request);
    std::string handleRemove(const daemon_ipc::ZmqRequest& request);
    std::string handleSkip(const daemon_ipc::ZmqRequest& request);
    std::string handlePause(const daemon_ipc::ZmqRequest& request);
    std::string handlePlay(const daemon_ipc::ZmqRequest& request);
    std::string handleSeek(const daemon_ipc::ZmqRequest& request);
    std::string handleVolume(const daemon_ipc::ZmqRequest& request);
    std::string handleClear(const daemon_ipc::ZmqRequest& request);
    std::string handleStatus(const daemon_ipc::ZmqRequest& request);
    std::string handleQueue(const daemon_ipc::ZmqRequest& request);
    std::string handleBuffers(const daemon_ipc::ZmqRequest& request);

    ControlPlaneDependencies deps_;
    // Shared with the event-bus subscription, which may outlive this object.
    std::shared_ptr<daemon_ipc::ZmqCommandServer> zmqServer_;
};

}  // namespace segue::daemon_control
