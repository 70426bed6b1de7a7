// main.cpp - Server entry point for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <asio.hpp>
#include <iostream>
#include <thread>
#include <vector>
#include <cxxopts.hpp>
#include <ekrut/common/utils.hpp>
#include <ekrut/common/panic_handler.hpp>
#include <ekrut/common/libsodium_wrapper.hpp>
#include <ekrut/server/server_session.hpp>
#include <ekrut/server/credential_store.hpp>
#include <ekrut/server/timer_service.hpp>
#include <ekrut/server/session_registry.hpp>
#include <ekrut/server/user_manager.hpp>
#include <ekrut/server/user_notifier.hpp>
#include <ekrut/server/request_dispatcher.hpp>
#include <ekrut/server/net/tcp/tcp_server.hpp>

using namespace EKrut::Utils;
using namespace EKrut::Net::TCP;
using namespace EKrut::Server;
using namespace EKrut;

int main(int argc, char** argv) {
    cxxopts::Options options("ekrut_server", "EKrut Session Server");

    options.add_options()
        ("h,help", "Print help")
        ("4,ipv4-only", "Force IPv4 only operation", cxxopts::value<bool>()->default_value("false"))
        ("p,port", "Override listening port", cxxopts::value<uint16_t>())
        ("t,idle-timeout", "Override idle session timeout in milliseconds", cxxopts::value<uint64_t>())
        ("config", "Override config file path", cxxopts::value<std::string>()->default_value("./server_config"));

    PanicHandler::init();

    try {
        auto optionsObj = options.parse(argc, argv);
        if (optionsObj.count("help")) {
            std::cout << options.help() << std::endl;
            std::cout << "This software is licensed under the GPLv2-only license OR the GPLv3 license.\n";
            std::cout << "This software is provided under ABSOLUTELY NO WARRANTY, to the extent permitted by law.\n";
            return 0;
        }

        log("EKrut Server, Version " + getVersion() + " on " + getHostname());

        LibSodiumWrapper::init();

        std::shared_ptr<ServerState> state = loadServerState(optionsObj["config"].as<std::string>());
        if (optionsObj["ipv4-only"].as<bool>())
            state->ipv4Only = true;
        if (optionsObj.count("port")) {
            uint16_t port = optionsObj["port"].as<uint16_t>();
            if (port == 0)
                throw std::runtime_error("--port must be greater than 0");
            state->port = port;
        }
        if (optionsObj.count("idle-timeout")) {
            uint64_t idleMs = optionsObj["idle-timeout"].as<uint64_t>();
            if (idleMs == 0)
                throw std::runtime_error("--idle-timeout must be greater than 0");
            state->idleTimeout = std::chrono::milliseconds(idleMs);
        }
        state->hostRunning = true;

        InMemoryCredentialStore store;
        store.loadUsers(state->serverConfig.at("USERS_FILE"));
        auto itRegistrations = state->serverConfig.find("REGISTRATIONS_FILE");
        if (itRegistrations != state->serverConfig.end() && !itRegistrations->second.empty()) {
            store.loadRegistrations(itRegistrations->second);
        }

        ServerSession::getInstance().setServerState(state);

        asio::io_context io;
        // Keep the workers alive while no timers or sockets are pending
        auto workGuard = asio::make_work_guard(io);

        AsioTimerService timers(io);
        auto server = std::make_shared<TCPServer>(io, state->port, state->ipv4Only);
        LogUserNotifier notifier;
        SessionRegistry registry(store, timers, *server, state->idleTimeout);
        UserManager users(store, notifier);
        RequestDispatcher dispatcher(registry, users);

        registry.connectedClients().subscribe([](ViewChange change, const ConnectedClient& client) {
            debug(std::string(change == ViewChange::ADDED ? "Online: " : "Offline: ") + client.username +
                  " (" + userTypeToString(client.type) + ") " + client.address);
        });

        server->start(dispatcher);

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const std::error_code&, int) {
            log("Received termination signal. Shutting down server gracefully.");
            ServerSession::getInstance().setHostRunning(false);
            server->stop();
            // Requests still queued on client strands must not keep io.run() alive with fresh idle timers
            timers.shutdown();
            workGuard.reset();
        });

        log("Idle session timeout: " + std::to_string(state->idleTimeout.count()) + " ms");
        log("Server started on port " + std::to_string(state->port) + " with " + std::to_string(state->workerThreads) + " worker thread(s)");

        std::vector<std::thread> workers;
        for (unsigned i = 1; i < state->workerThreads; ++i) {
            workers.emplace_back([&io]() {
                io.run();
            });
        }
        io.run();

        for (auto& worker : workers) {
            if (worker.joinable())
                worker.join();
        }

        log("Server stopped with " + std::to_string(registry.size()) + " session(s) still open.");
    } catch (const cxxopts::exceptions::exception& e) {
        error("Invalid arguments: " + std::string(e.what()));
        std::cerr << options.help() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        error("Server error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
