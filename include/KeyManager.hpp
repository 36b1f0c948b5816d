#pragma once
#ifndef RENDEZVOUS_KEY_MANAGER_HPP
#define RENDEZVOUS_KEY_MANAGER_HPP

#include "CryptoBase.hpp"
#include "Types.hpp"
#include <vector>
#include <string>
#include <cstdint>

namespace rendezvous {

    /**
     * Ed25519 key handling plus the encoded forms shared with other peer-to-peer nodes:
     *
     *   PrivateKey / PublicKey protobuf  { 1: KeyType (varint), 2: Data (bytes) }
     *   peer id                          base58btc( 0x00 | len | PublicKey protobuf )
     *
     * Private keys are always 64 bytes (seed || public key), as libsodium lays them out.
     */
    class KeyManager {
    public:
        // Key generation
        static bool generateKeyPair(std::vector<uint8_t>& privateKey, std::vector<uint8_t>& publicKey);
        static bool keyPairFromSeed(const std::vector<uint8_t>& seed, std::vector<uint8_t>& privateKey, std::vector<uint8_t>& publicKey);

        // Validation
        static bool derivePublicKey(const std::vector<uint8_t>& privateKey, std::vector<uint8_t>& publicKey);
        static bool isValidPrivateKey(const std::vector<uint8_t>& privateKey);
        static bool isValidPublicKey(const std::vector<uint8_t>& publicKey);

        // Encoded key structures
        static std::vector<uint8_t> encodePrivateKey(const std::vector<uint8_t>& privateKey);
        static bool decodePrivateKey(const std::vector<uint8_t>& encoded, std::vector<uint8_t>& privateKey);
        static std::vector<uint8_t> encodePublicKey(const std::vector<uint8_t>& publicKey);

        // Peer ids

        /**
         * @param publicKey 32-byte Ed25519 public key.
         * @return The base58btc identity multihash, "12D3KooW...".
         * @throws std::invalid_argument if the key is not 32 bytes.
         */
        static std::string peerIdFromPublicKey(const std::vector<uint8_t>& publicKey);

        /**
         * Inverse of peerIdFromPublicKey(). Used to reject HELLO frames that claim a
         * malformed peer id.
         *
         * @param peerId Text form of the peer id.
         * @param publicKey Receives the 32-byte Ed25519 key on success.
         * @return false unless `peerId` is an identity multihash of a valid Ed25519 key.
         */
        static bool publicKeyFromPeerId(const std::string& peerId, std::vector<uint8_t>& publicKey);

        static void secureClean(std::vector<uint8_t>& sensitiveData);

    private:
        static std::vector<uint8_t> encodeKeyMessage(const std::vector<uint8_t>& keyData);
        static bool decodeKeyMessage(const std::vector<uint8_t>& encoded, uint64_t& keyType, std::vector<uint8_t>& keyData);
    };

} // namespace rendezvous

#endif // RENDEZVOUS_KEY_MANAGER_HPP
