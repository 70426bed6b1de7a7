// libsodium_wrapper.cpp - Libsodium Wrapper for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/common/libsodium_wrapper.hpp>

#include <array>

namespace EKrut::Utils {

    void LibSodiumWrapper::init() {
        // Returns 1 when already initialized
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium");
        }
    }

    bool LibSodiumWrapper::credentialsMatch(const std::string& supplied, const std::string& stored) {
        init();

        std::array<uint8_t, crypto_generichash_BYTES> suppliedHash{};
        std::array<uint8_t, crypto_generichash_BYTES> storedHash{};

        crypto_generichash(suppliedHash.data(), suppliedHash.size(),
                           reinterpret_cast<const unsigned char*>(supplied.data()), supplied.size(),
                           nullptr, 0);
        crypto_generichash(storedHash.data(), storedHash.size(),
                           reinterpret_cast<const unsigned char*>(stored.data()), stored.size(),
                           nullptr, 0);

        bool match = sodium_memcmp(suppliedHash.data(), storedHash.data(), suppliedHash.size()) == 0;

        sodium_memzero(suppliedHash.data(), suppliedHash.size());
        sodium_memzero(storedHash.data(), storedHash.size());
        return match;
    }

    uint64_t LibSodiumWrapper::randomId() {
        init();

        uint64_t id = 0;
        while (id == 0) {
            randombytes_buf(&id, sizeof(id));
        }
        return id;
    }
}
