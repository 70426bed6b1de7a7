// libsodium_wrapper.hpp - Libsodium Wrapper for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <sodium.h>
#include <stdexcept>
#include <string>
#include <cstdint>
#include <ekrut/common/utils.hpp>

namespace EKrut::Utils {

    class LibSodiumWrapper {
        public:
            // Initializes libsodium; safe to call more than once. Throws std::runtime_error on failure.
            static void init();

            // Constant-time comparison of a supplied credential against the stored one.
            // Both sides are hashed first so differing lengths do not short-circuit.
            static bool credentialsMatch(const std::string& supplied, const std::string& stored);

            // Random 64-bit identifier, never 0
            static uint64_t randomId();
    };
}
