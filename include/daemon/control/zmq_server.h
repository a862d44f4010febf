#pragma once

#include "core/engine_constants.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

namespace zmq {
class context_t;
class socket_t;
}  // namespace zmq

namespace segue::daemon_ipc {

// One decoded request: either JSON {"cmd": ..., "params": {...}} or raw CMD:payload.
struct ZmqRequest {
    std::string raw;
    std::optional<nlohmann::json> json;
    std::string command;
    std::string payload;
    bool isJson = false;
    std::string parseError;

    // JSON "params" object, or an empty object.
    nlohmann::json params() const;
};

// REP socket for commands plus a PUB socket for events.
class ZmqCommandServer {
   public:
    using Handler = std::function<std::string(const ZmqRequest&)>;

    explicit ZmqCommandServer(std::string endpoint = EngineConstants::ZEROMQ_IPC_PATH,
                              int recvTimeoutMs = 200);
    ~ZmqCommandServer();

    ZmqCommandServer(const ZmqCommandServer&) = delete;
    ZmqCommandServer& operator=(const ZmqCommandServer&) = delete;

    void registerCommand(const std::string& command, Handler handler);

    bool start();
    void stop();
    bool isRunning() const {
        return running_.load();
    }
    bool hasBindError() const {
        return bindFailed_.load();
    }

    // Thread-safe; drops the message when the server is stopped.
    bool publish(const std::string& message);

    // Dispatches @p raw as if it had arrived on the REP socket.
    std::string handleRaw(const std::string& raw);

    const std::string& endpoint() const {
        return endpoint_;
    }
    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }

    static ZmqRequest buildRequest(const std::string& raw);
    static std::string derivePubEndpoint(const std::string& endpoint);

   private:
    std::string dispatchRequest(const ZmqRequest& request);
    void serverLoop();
    void cleanupSockets();
    void cleanupIpcPath(const std::string& endpoint) const;

    std::string endpoint_;
    std::string pubEndpoint_;
    int recvTimeoutMs_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> repSocket_;
    std::unique_ptr<zmq::socket_t> pubSocket_;
    std::thread serverThread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> bindFailed_{false};
    std::map<std::string, Handler> handlers_;
    mutable std::mutex pubMutex_;
};

// Shared response shapes.
std::string buildOkResponse(const ZmqRequest& request, const nlohmann::json& data = {});
std::string buildErrorResponse(const ZmqRequest& request, const std::string& code,
                               const std::string& message);

}  // namespace segue::daemon_ipc
