#include "IdentityManager.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

namespace rendezvous {

    Identity::Identity(std::vector<uint8_t> privateKey, std::vector<uint8_t> publicKey)
        : priv(std::move(privateKey)),
          pub(std::move(publicKey)),
          peerIdText(KeyManager::peerIdFromPublicKey(pub)) {}

    Identity::~Identity() {
        KeyManager::secureClean(priv);
    }

    std::vector<uint8_t> Identity::encode() const {
        return KeyManager::encodePrivateKey(priv);
    }

    std::optional<Identity> IdentityManager::decode(const std::vector<uint8_t>& data, Source* source) {
        std::vector<uint8_t> privateKey;
        std::vector<uint8_t> publicKey;

        if (KeyManager::decodePrivateKey(data, privateKey) && KeyManager::derivePublicKey(privateKey, publicKey)) {
            if (source != nullptr) *source = Source::EncodedKeypair;
            return Identity(std::move(privateKey), std::move(publicKey));
        }

        if (data.size() == SEED_SIZE && KeyManager::keyPairFromSeed(data, privateKey, publicKey)) {
            if (source != nullptr) *source = Source::RawSecretKey;
            return Identity(std::move(privateKey), std::move(publicKey));
        }

        KeyManager::secureClean(privateKey);
        return std::nullopt;
    }

    Identity IdentityManager::generate() {
        std::vector<uint8_t> privateKey;
        std::vector<uint8_t> publicKey;

        if (!KeyManager::generateKeyPair(privateKey, publicKey)) {
            throw std::runtime_error("Failed to generate Ed25519 keypair");
        }

        return Identity(std::move(privateKey), std::move(publicKey));
    }

    void IdentityManager::persist(const Identity& identity, const std::string& path) {
        // Secret material: the file is emptied and restricted to the owner before the key is written
        {
            std::ofstream emptyFile(path, std::ios::binary | std::ios::trunc);
            if (!emptyFile.is_open()) {
                throw std::runtime_error("Cannot open identity file for writing: " + path);
            }
        }

        std::error_code ec;
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
        if (ec) {
            throw std::runtime_error("Could not restrict permissions on " + path + ": " + ec.message());
        }

        std::vector<uint8_t> encoded = identity.encode();
        std::ofstream outputFile(path, std::ios::binary | std::ios::trunc);
        if (!outputFile.is_open()) {
            KeyManager::secureClean(encoded);
            throw std::runtime_error("Cannot open identity file for writing: " + path);
        }

        outputFile.write(reinterpret_cast<const char*>(encoded.data()), static_cast<std::streamsize>(encoded.size()));
        outputFile.flush();
        KeyManager::secureClean(encoded);

        if (!outputFile.good()) {
            throw std::runtime_error("Failed to write identity file: " + path);
        }
    }

    Identity IdentityManager::loadOrCreate(const std::string& path) {
        std::ifstream inputFile(path, std::ios::binary);
        if (inputFile.is_open()) {
            std::vector<uint8_t> data((std::istreambuf_iterator<char>(inputFile)), std::istreambuf_iterator<char>());
            const bool readOk = !inputFile.bad();
            inputFile.close();

            Source source = Source::EncodedKeypair;
            std::optional<Identity> loaded;
            if (readOk) {
                loaded = decode(data, &source);
            }
            KeyManager::secureClean(data);

            if (loaded) {
                if (source == Source::EncodedKeypair) {
                    std::cout << "Loaded identity from " << path << std::endl;
                } else {
                    std::cout << "Loaded raw Ed25519 identity from " << path << std::endl;
                }
                return *loaded;
            }

            // TODO: keep a copy of the undecodable file before overwriting it
            std::cerr << "Warning: Could not decode identity file " << path << ", generating new key" << std::endl;
        }

        Identity identity = generate();
        persist(identity, path);
        std::cout << "Generated new identity, saved to " << path << std::endl;
        return identity;
    }

} // namespace rendezvous
