// utils.cpp - Utility functions for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/common/utils.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace EKrut::Utils {
    void log(const std::string &msg) {
        std::cout << "[LOG] " << msg << std::endl;
    }

    void warn(const std::string &msg) {
        std::cerr << "[WARN] " << msg << std::endl;
    }

    void error(const std::string &msg) {
        std::cerr << "[ERROR] " << msg << std::endl;
    }

    void debug(const std::string &msg) {
#if DEBUG
        std::cout << "[DEBUG] " << msg << std::endl;
#else
        (void)msg;
#endif
    }

    std::string getHostname() {
        char hostname[256];
        if (gethostname(hostname, sizeof(hostname)) == 0) {
            return std::string(hostname);
        } else {
            return "UnknownHost";
        }
    }

    std::string getVersion() {
        return "b1.0";
    }

    unsigned short serverPort() {
        return 5555;
    }

    std::chrono::milliseconds defaultIdleTimeout() {
        return std::chrono::minutes(5);
    }

    std::string trim(const std::string& str) {
        auto notSpace = [](unsigned char c) { return !std::isspace(c); };
        auto begin = std::find_if(str.begin(), str.end(), notSpace);
        auto end = std::find_if(str.rbegin(), str.rend(), notSpace).base();
        return (begin < end) ? std::string(begin, end) : std::string();
    }

    std::vector<std::string> split(const std::string& str, char delimiter) {
        std::vector<std::string> parts;
        std::string current;
        for (char c : str) {
            if (c == delimiter) {
                parts.push_back(std::move(current));
                current.clear();
            } else {
                current.push_back(c);
            }
        }
        parts.push_back(std::move(current));
        return parts;
    }

    std::unordered_map<std::string, std::string> getConfigMap(const std::string& path, const std::vector<std::string>& requiredKeys) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open config file at path: " + path);
        }

        std::unordered_map<std::string, std::string> config;
        std::string line;
        int lineNo = 0;

        while (std::getline(file, line)) {
            lineNo++;
            std::string stripped = trim(line);
            if (stripped.empty() || stripped[0] == '#')
                continue;

            auto pos = stripped.find('=');
            if (pos == std::string::npos) {
                warn("Config " + path + ":" + std::to_string(lineNo) + " has no '=', skipping.");
                continue;
            }

            std::string key = trim(stripped.substr(0, pos));
            std::string value = trim(stripped.substr(pos + 1));
            if (key.empty()) {
                warn("Config " + path + ":" + std::to_string(lineNo) + " has an empty key, skipping.");
                continue;
            }

            config[key] = value;
        }

        for (const auto& key : requiredKeys) {
            if (config.find(key) == config.end()) {
                throw std::runtime_error("Config file " + path + " is missing required key: " + key);
            }
        }

        return config;
    }

    uint64_t getConfigNumber(const std::unordered_map<std::string, std::string>& config, const std::string& key, uint64_t fallback) {
        auto it = config.find(key);
        if (it == config.end() || it->second.empty())
            return fallback;

        const std::string& raw = it->second;
        if (!std::all_of(raw.begin(), raw.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw std::runtime_error("Config value for " + key + " is not a number: " + raw);
        }

        try {
            return std::stoull(raw);
        } catch (const std::out_of_range&) {
            throw std::runtime_error("Config value for " + key + " is out of range: " + raw);
        }
    }
}
