// utils.hpp - Utility functions for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once
#include <iostream>
#include <string>
#include <cstdint>
#include <vector>
#include <fstream>
#include <chrono>
#include <unordered_map>

#include <unistd.h>

namespace EKrut::Utils {
    // General log function. Use for logging important information.
    void log(const std::string &msg);
    // General warning function. Use for logging important warnings.
    void warn(const std::string &msg);
    // General error function. Use for logging failures and general errors.
    void error(const std::string &msg);
    // Debug log function. Use for logging non-important information. These will not print unless the binary is compiled with DEBUG=1
    void debug(const std::string &msg);

    // Returns the hostname of the running platform.
    std::string getHostname();
    // Returns the version of the running release.
    std::string getVersion();
    // Default TCP port of the server.
    unsigned short serverPort();
    // Default idle session timeout.
    std::chrono::milliseconds defaultIdleTimeout();

    // Strip leading and trailing whitespace
    std::string trim(const std::string& str);
    // Split a string on a single character delimiter. Empty fields are kept.
    std::vector<std::string> split(const std::string& str, char delimiter);

    // Returns the config file in an unordered_map format. This purely reads the config file, you still need to parse it manually.
    // Throws std::runtime_error if the file cannot be opened or any of requiredKeys is missing.
    std::unordered_map<std::string, std::string> getConfigMap(const std::string& path, const std::vector<std::string>& requiredKeys = {});

    // Parse an unsigned integer config value, falling back to fallback when the key is absent. Throws on malformed values.
    uint64_t getConfigNumber(const std::unordered_map<std::string, std::string>& config, const std::string& key, uint64_t fallback);
};
