// server_session.cpp - Server runtime state for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/server/server_session.hpp>
#include <ekrut/common/utils.hpp>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace EKrut {
    std::shared_ptr<ServerState> loadServerState(const std::string& configPath) {
        auto state = std::make_shared<ServerState>();
        state->configPath = configPath;
        state->serverConfig = Utils::getConfigMap(configPath, {"USERS_FILE"});

        uint64_t idleMs = Utils::getConfigNumber(state->serverConfig, "IDLE_TIMEOUT_MS",
                                                 static_cast<uint64_t>(Utils::defaultIdleTimeout().count()));
        if (idleMs == 0)
            throw std::runtime_error("IDLE_TIMEOUT_MS must be greater than 0");
        state->idleTimeout = std::chrono::milliseconds(idleMs);

        uint64_t port = Utils::getConfigNumber(state->serverConfig, "PORT", Utils::serverPort());
        if (port == 0 || port > 65535)
            throw std::runtime_error("PORT must be between 1 and 65535, got " + std::to_string(port));
        state->port = static_cast<uint16_t>(port);

        uint64_t workers = Utils::getConfigNumber(state->serverConfig, "WORKER_THREADS", std::thread::hardware_concurrency());
        state->workerThreads = static_cast<unsigned>(std::clamp<uint64_t>(workers, 1, 256));

        return state;
    }

    std::shared_ptr<ServerState> ServerSession::getServerState() const {
        std::shared_lock lock(mMutex);
        return mServerState;
    }

    void ServerSession::setServerState(std::shared_ptr<ServerState> state) {
        std::unique_lock lock(mMutex);
        mServerState = std::move(state);
    }

    std::string ServerSession::getConfigPath() const {
        std::shared_lock lock(mMutex);
        return mServerState ? mServerState->configPath : std::string();
    }

    std::unordered_map<std::string, std::string> ServerSession::getRawServerConfig() const {
        std::shared_lock lock(mMutex);
        return mServerState ? mServerState->serverConfig : std::unordered_map<std::string, std::string>();
    }

    std::chrono::milliseconds ServerSession::getIdleTimeout() const {
        std::shared_lock lock(mMutex);
        return mServerState ? mServerState->idleTimeout : std::chrono::milliseconds(300000);
    }

    uint16_t ServerSession::getPort() const {
        std::shared_lock lock(mMutex);
        return mServerState ? mServerState->port : 5555;
    }

    unsigned ServerSession::getWorkerThreads() const {
        std::shared_lock lock(mMutex);
        return mServerState ? mServerState->workerThreads : 1;
    }

    bool ServerSession::isIPv4Only() const {
        std::shared_lock lock(mMutex);
        return mServerState ? mServerState->ipv4Only : false;
    }

    bool ServerSession::isHostRunning() const {
        std::shared_lock lock(mMutex);
        return mServerState ? mServerState->hostRunning : false;
    }

    void ServerSession::setHostRunning(bool hostRunning) {
        std::unique_lock lock(mMutex);
        if (!mServerState)
            mServerState = std::make_shared<ServerState>();
        mServerState->hostRunning = hostRunning;
    }
}
