#pragma once
#ifndef RENDEZVOUS_CRYPTO_BASE_HPP
#define RENDEZVOUS_CRYPTO_BASE_HPP

#include <vector>
#include <string>
#include <cstdint>
#include <sodium.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <iostream>
#include "Types.hpp"

namespace rendezvous {

    class CryptoBase {
    public:
        // Must be called once at startup, before any other function
        static bool initialize();

        // Hashing
        static std::string sha256(const std::vector<uint8_t>& data);
        static std::vector<uint8_t> sha256Bytes(const std::vector<uint8_t>& data);

        // Encoding
        static std::string base58Encode(const std::vector<uint8_t>& data);
        static std::vector<uint8_t> base58Decode(const std::string& encoded);
        static std::string hexEncode(const std::vector<uint8_t>& data);

        // Security utilities
        static void secureClean(std::vector<uint8_t>& sensitiveData);

        // Ed25519 helpers for KeyManager
        static bool ed25519SeedKeypair(std::vector<uint8_t>& publicKey, std::vector<uint8_t>& privateKey, const std::vector<uint8_t>& seed);
        static bool ed25519SkToPk(std::vector<uint8_t>& publicKey, const std::vector<uint8_t>& privateKey);

        // Random bytes
        static bool randomBytes(std::vector<uint8_t>& buffer);
        static bool randomBytes(uint8_t* buffer, size_t size);
    };

} // namespace rendezvous

#endif // RENDEZVOUS_CRYPTO_BASE_HPP
