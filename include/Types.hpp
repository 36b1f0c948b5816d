#pragma once
#ifndef RENDEZVOUS_TYPES_HPP
#define RENDEZVOUS_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <cstddef>

namespace rendezvous {

    // -----------------------------------------------------------------------------------
    // ---------------------------- Libsodium Types --------------------------------------
    // -----------------------------------------------------------------------------------

    // Ed25519 sizes (libsodium)
    inline constexpr size_t PRIVATE_KEY_SIZE = 64;  // seed || public key
    inline constexpr size_t SEED_SIZE = 32;
    inline constexpr size_t PUBLIC_KEY_SIZE = 32;
    inline constexpr size_t SHA256_HASH_SIZE = 32;

    // ==== ENCODED KEYS ====
    // protobuf KeyType enum value for Ed25519
    inline constexpr uint8_t KEY_TYPE_ED25519 = 1;
    // multihash code of the identity hash
    inline constexpr uint8_t MULTIHASH_IDENTITY = 0x00;

    // ============================================================
    //  DISCOVERY
    // ============================================================

    // Maximum age of a room entry before it is pruned
    inline constexpr std::chrono::seconds PEER_TTL{30};

    inline constexpr const char* DISCOVERY_PROTOCOL = "/rendezvous/discovery/1.0.0";
    inline constexpr const char* DISCOVERY_TOPIC = "/rendezvous/discovery";
    inline constexpr const char* AGENT_VERSION = "/rendezvous-relay/0.1.0";

    // ============================================================
    //  WIRE PROTOCOL
    // ============================================================

    inline constexpr uint32_t NETWORK_MAGIC = 0x52445A31; // "RDZ1"
    inline constexpr uint8_t PROTOCOL_VERSION = 1;

    inline constexpr size_t MAX_PAYLOAD_SIZE = 1024 * 1024; // 1 MB
    inline constexpr size_t MESSAGE_HEADER_SIZE = 4 + 1 + 1 + 8; // magic + version + type + payload_len
    inline constexpr size_t CHECKSUM_SIZE = 4; // CRC32
    inline constexpr size_t MAX_FRAME_SIZE = MESSAGE_HEADER_SIZE + MAX_PAYLOAD_SIZE + CHECKSUM_SIZE;

    inline constexpr size_t MAX_PEER_ID_LENGTH = 128;
    inline constexpr size_t MAX_TOPIC_LENGTH = 256;

    // Published message ids remembered for de-duplication
    inline constexpr size_t SEEN_MESSAGE_CACHE_SIZE = 4096;

    // ============================================================
    //  DEFAULT CONFIGURATION
    // ============================================================

    inline constexpr uint16_t DEFAULT_PORT = 4001;
    inline constexpr uint32_t DEFAULT_MAX_RESERVATIONS = 256;
    inline constexpr const char* DEFAULT_IDENTITY_PATH = "identity.key";
    inline constexpr size_t DEFAULT_WORKER_THREADS = 2;

} // namespace rendezvous

#endif // RENDEZVOUS_TYPES_HPP
