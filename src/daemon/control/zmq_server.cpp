#include "daemon/control/zmq_server.h"

#include "logging/logger.h"

#include <cstdio>
#include <stdexcept>
#include <zmq.hpp>

namespace segue::daemon_ipc {
namespace {

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

void trimNull(std::string& value) {
    auto pos = value.find('\0');
    if (pos != std::string::npos) {
        value.erase(pos);
    }
}

}  // namespace

nlohmann::json ZmqRequest::params() const {
    if (json && json->contains("params") && (*json)["params"].is_object()) {
        return (*json)["params"];
    }
    return nlohmann::json::object();
}

std::string buildOkResponse(const ZmqRequest& request, const nlohmann::json& data) {
    if (request.isJson) {
        nlohmann::json resp;
        resp["status"] = "ok";
        if (!data.is_null()) {
            resp["data"] = data;
        }
        return resp.dump();
    }
    if (data.is_null()) {
        return "OK";
    }
    if (data.is_string()) {
        return "OK:" + data.get<std::string>();
    }
    return "OK:" + data.dump();
}

std::string buildErrorResponse(const ZmqRequest& request, const std::string& code,
                               const std::string& message) {
    if (request.isJson) {
        nlohmann::json resp;
        resp["status"] = "error";
        resp["error_code"] = code;
        resp["message"] = message;
        return resp.dump();
    }
    return "ERR:" + code + ":" + message;
}

ZmqCommandServer::ZmqCommandServer(std::string endpoint, int recvTimeoutMs)
    : endpoint_(std::move(endpoint)),
      pubEndpoint_(derivePubEndpoint(endpoint_)),
      recvTimeoutMs_(recvTimeoutMs) {}

ZmqCommandServer::~ZmqCommandServer() {
    stop();
}

void ZmqCommandServer::registerCommand(const std::string& command, Handler handler) {
    handlers_[command] = std::move(handler);
}

bool ZmqCommandServer::start() {
    if (running_.load()) {
        return true;
    }

    try {
        context_ = std::make_unique<zmq::context_t>(1);
        repSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
        repSocket_->set(zmq::sockopt::rcvtimeo, recvTimeoutMs_);
        repSocket_->set(zmq::sockopt::linger, 0);

        cleanupIpcPath(endpoint_);
        repSocket_->bind(endpoint_);

        {
            std::lock_guard<std::mutex> lock(pubMutex_);
            pubSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
            pubSocket_->set(zmq::sockopt::linger, 0);
            cleanupIpcPath(pubEndpoint_);
            pubSocket_->bind(pubEndpoint_);
        }

        running_.store(true);
        bindFailed_.store(false);
        serverThread_ = std::thread(&ZmqCommandServer::serverLoop, this);

        LOG_INFO("ZeroMQ: Listening on {}", endpoint_);
        LOG_INFO("ZeroMQ: PUB socket on {}", pubEndpoint_);
        return true;
    } catch (const zmq::error_t& e) {
        LOG_ERROR("ZeroMQ: Cannot bind {}: {}", endpoint_, e.what());
        bindFailed_.store(true);
        running_.store(false);
        cleanupSockets();
        return false;
    }
}

void ZmqCommandServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // The REP receive timeout bounds how long the loop takes to notice.
    if (serverThread_.joinable()) {
        serverThread_.join();
    }
    cleanupSockets();
    cleanupIpcPath(endpoint_);
    cleanupIpcPath(pubEndpoint_);
    LOG_INFO("ZeroMQ: Server stopped");
}

bool ZmqCommandServer::publish(const std::string& message) {
    std::lock_guard<std::mutex> lock(pubMutex_);
    if (!pubSocket_) {
        return false;
    }
    try {
        auto sent = pubSocket_->send(zmq::buffer(message), zmq::send_flags::dontwait);
        return sent.has_value();
    } catch (const zmq::error_t& e) {
        LOG_EVERY_N(WARN, 100, "ZeroMQ: PUB send failed: {}", e.what());
        return false;
    }
}

std::string ZmqCommandServer::handleRaw(const std::string& raw) {
    return dispatchRequest(buildRequest(raw));
}

ZmqRequest ZmqCommandServer::buildRequest(const std::string& raw) {
    ZmqRequest request;
    request.raw = raw;

    if (raw.empty()) {
        return request;
    }

    if (raw.front() == '{') {
        request.isJson = true;
        try {
            request.json = nlohmann::json::parse(raw);
            if (request.json->contains("cmd") && (*request.json)["cmd"].is_string()) {
                request.command = (*request.json)["cmd"].get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            request.parseError = e.what();
        }
        return request;
    }

    auto colonPos = raw.find(':');
    if (colonPos != std::string::npos) {
        request.command = raw.substr(0, colonPos);
        request.payload = raw.substr(colonPos + 1);
    } else {
        request.command = raw;
    }
    trimNull(request.command);
    trimNull(request.payload);
    return request;
}

std::string ZmqCommandServer::dispatchRequest(const ZmqRequest& request) {
    if (!request.parseError.empty()) {
        return buildErrorResponse(request, "IPC_PROTOCOL_ERROR",
                                  "JSON parse error: " + request.parseError);
    }

    auto it = handlers_.find(request.command);
    if (it == handlers_.end()) {
        std::string name = request.command.empty() ? "<empty>" : request.command;
        return buildErrorResponse(request, "IPC_INVALID_COMMAND", "Unknown command: " + name);
    }

    try {
        return it->second(request);
    } catch (const std::exception& e) {
        LOG_ERROR("ZeroMQ: {} handler failed: {}", request.command, e.what());
        return buildErrorResponse(request, "INTERNAL_UNKNOWN",
                                  std::string("Handler exception: ") + e.what());
    }
}

void ZmqCommandServer::serverLoop() {
    while (running_.load()) {
        try {
            zmq::message_t request;
            auto recvResult = repSocket_->recv(request, zmq::recv_flags::none);
            if (!recvResult) {
                continue;
            }
            std::string raw(static_cast<char*>(request.data()), request.size());
            LOG_DEBUG("ZeroMQ: <- {}", raw);
            std::string response = handleRaw(raw);
            repSocket_->send(zmq::buffer(response), zmq::send_flags::none);
        } catch (const zmq::error_t& e) {
            if (running_.load()) {
                LOG_ERROR("ZeroMQ: Listener error: {}", e.what());
            }
        }
    }
}

void ZmqCommandServer::cleanupSockets() {
    if (repSocket_) {
        repSocket_->close();
        repSocket_.reset();
    }
    {
        std::lock_guard<std::mutex> lock(pubMutex_);
        if (pubSocket_) {
            pubSocket_->close();
            pubSocket_.reset();
        }
    }
    context_.reset();
}

void ZmqCommandServer::cleanupIpcPath(const std::string& endpoint) const {
    if (!startsWith(endpoint, "ipc://")) {
        return;
    }
    std::string path = endpoint.substr(6);
    if (path.empty()) {
        return;
    }
    std::remove(path.c_str());
}

std::string ZmqCommandServer::derivePubEndpoint(const std::string& endpoint) {
    if (startsWith(endpoint, "tcp://")) {
        auto colonPos = endpoint.rfind(':');
        if (colonPos != std::string::npos && colonPos > 5) {
            try {
                int port = std::stoi(endpoint.substr(colonPos + 1));
                return endpoint.substr(0, colonPos + 1) + std::to_string(port + 1);
            } catch (const std::logic_error& e) {
                LOG_WARN("ZeroMQ: Cannot parse port in {}: {}", endpoint, e.what());
            }
        }
    }
    return endpoint + EngineConstants::ZEROMQ_PUB_SUFFIX;
}

}  // namespace segue::daemon_ipc
