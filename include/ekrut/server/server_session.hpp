// server_session.hpp - Server runtime state for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace EKrut {
    struct ServerState {
        std::string configPath;
        std::unordered_map<std::string, std::string> serverConfig;
        std::chrono::milliseconds idleTimeout{300000};
        uint16_t port = 5555;
        unsigned workerThreads = 1;
        bool ipv4Only = false;
        bool hostRunning = false;

        ~ServerState() = default;
        ServerState(const ServerState&) = delete;
        ServerState& operator=(const ServerState&) = delete;
        ServerState(ServerState&&) = default;
        ServerState& operator=(ServerState&&) = default;

        explicit ServerState() = default;
    };

    // Build server state from the config file at configPath (KEY=VALUE lines).
    // USERS_FILE is required; IDLE_TIMEOUT_MS, PORT and WORKER_THREADS fall back to defaults.
    // Throws std::runtime_error on a missing file, missing key or malformed value.
    std::shared_ptr<ServerState> loadServerState(const std::string& configPath);

    class ServerSession {
        public:
            // Return a reference to the Server Session instance
            static ServerSession& getInstance() { static ServerSession instance; return instance; }

            // Return the current server state
            std::shared_ptr<ServerState> getServerState() const;

            // Set the server state
            void setServerState(std::shared_ptr<ServerState> state);

            // Getters
            std::string getConfigPath() const;
            std::unordered_map<std::string, std::string> getRawServerConfig() const;
            std::chrono::milliseconds getIdleTimeout() const;
            uint16_t getPort() const;
            unsigned getWorkerThreads() const;
            bool isIPv4Only() const;
            bool isHostRunning() const;

            // Setters
            void setHostRunning(bool hostRunning);

        private:
            mutable std::shared_mutex mMutex;
            std::shared_ptr<struct ServerState> mServerState{nullptr};
    };
}
