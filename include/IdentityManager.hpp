#pragma once
#ifndef RENDEZVOUS_IDENTITY_MANAGER_HPP
#define RENDEZVOUS_IDENTITY_MANAGER_HPP

#include "KeyManager.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace rendezvous {

    /**
     * The node's durable identity: an Ed25519 keypair and the peer id derived from it.
     * Immutable once loaded.
     */
    class Identity {
    public:
        Identity(std::vector<uint8_t> privateKey, std::vector<uint8_t> publicKey);
        Identity(const Identity& other) = default;
        Identity& operator=(const Identity& other) = default;
        ~Identity();

        const std::string& peerId() const { return peerIdText; }
        const std::vector<uint8_t>& publicKey() const { return pub; }

        /**
         * Encoded keypair structure, the form written to the identity file.
         */
        std::vector<uint8_t> encode() const;

    private:
        std::vector<uint8_t> priv;
        std::vector<uint8_t> pub;
        std::string peerIdText;
    };

    class IdentityManager {
    public:
        enum class Source {
            EncodedKeypair,
            RawSecretKey
        };

        /**
         * Loads the identity stored at `path`, or generates a new one and writes it there.
         *
         * An unreadable or undecodable file is reported on stderr and replaced.
         *
         * @throws std::runtime_error if a new identity cannot be generated or persisted.
         */
        static Identity loadOrCreate(const std::string& path);

        /**
         * Decodes identity file contents: the encoded keypair structure first, then a raw
         * 32-byte Ed25519 secret key.
         *
         * @param data Raw file contents.
         * @param source If not null, receives the format that matched.
         * @return std::nullopt when neither format matches.
         */
        static std::optional<Identity> decode(const std::vector<uint8_t>& data, Source* source = nullptr);

        /**
         * @return A fresh random Ed25519 identity.
         * @throws std::runtime_error if libsodium cannot produce a keypair.
         */
        static Identity generate();

        /**
         * Writes the encoded keypair to `path`. The file is restricted to its owner
         * (0600) before any key bytes reach it.
         *
         * @param identity Identity to store.
         * @param path Destination file, created or truncated.
         * @throws std::runtime_error if the file cannot be opened, restricted or written.
         */
        static void persist(const Identity& identity, const std::string& path);
    };

} // namespace rendezvous

#endif // RENDEZVOUS_IDENTITY_MANAGER_HPP
