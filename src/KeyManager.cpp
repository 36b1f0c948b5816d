#include "KeyManager.hpp"
#include <algorithm>

namespace {

    // protobuf wire types
    constexpr uint8_t WIRE_VARINT = 0;
    constexpr uint8_t WIRE_FIXED64 = 1;
    constexpr uint8_t WIRE_LENGTH_DELIMITED = 2;
    constexpr uint8_t WIRE_FIXED32 = 5;

    constexpr uint64_t FIELD_KEY_TYPE = 1;
    constexpr uint64_t FIELD_KEY_DATA = 2;

    void writeVarint(std::vector<uint8_t>& out, uint64_t value) {
        while (value >= 0x80) {
            out.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
            value >>= 7;
        }
        out.push_back(static_cast<uint8_t>(value));
    }

    bool readVarint(const std::vector<uint8_t>& in, size_t& pos, uint64_t& value) {
        value = 0;
        for (unsigned shift = 0; shift < 64; shift += 7) {
            if (pos >= in.size()) {
                return false;
            }
            uint8_t byte = in[pos++];
            value |= static_cast<uint64_t>(byte & 0x7F) << shift;
            if ((byte & 0x80) == 0) {
                return true;
            }
        }
        return false; // varint longer than 10 bytes
    }

    bool isAllZero(const std::vector<uint8_t>& data) {
        return std::all_of(data.begin(), data.end(), [](uint8_t b) { return b == 0; });
    }
}

namespace rendezvous {

    // ============================================================
    //  KEY GENERATION
    // ============================================================

    bool KeyManager::generateKeyPair(std::vector<uint8_t>& privateKey, std::vector<uint8_t>& publicKey) {
        std::vector<uint8_t> seed(SEED_SIZE);
        if (!CryptoBase::randomBytes(seed)) {
            std::cerr << "Error: Failed to generate random seed" << std::endl;
            return false;
        }

        bool result = keyPairFromSeed(seed, privateKey, publicKey);
        secureClean(seed);
        return result;
    }

    bool KeyManager::keyPairFromSeed(const std::vector<uint8_t>& seed, std::vector<uint8_t>& privateKey, std::vector<uint8_t>& publicKey) {
        if (seed.size() != SEED_SIZE || isAllZero(seed)) {
            return false;
        }

        if (!CryptoBase::ed25519SeedKeypair(publicKey, privateKey, seed)) {
            std::cerr << "Error: crypto_sign_ed25519_seed_keypair failed" << std::endl;
            secureClean(privateKey);
            secureClean(publicKey);
            return false;
        }

        return true;
    }

    // ============================================================
    //  VALIDATION
    // ============================================================

    bool KeyManager::derivePublicKey(const std::vector<uint8_t>& privateKey, std::vector<uint8_t>& publicKey) {
        if (privateKey.size() != PRIVATE_KEY_SIZE || isAllZero(privateKey)) {
            return false;
        }

        return CryptoBase::ed25519SkToPk(publicKey, privateKey);
    }

    bool KeyManager::isValidPrivateKey(const std::vector<uint8_t>& privateKey) {
        if (privateKey.size() != PRIVATE_KEY_SIZE) {
            return false;
        }

        // The trailing 32 bytes must be the public key derived from the seed
        std::vector<uint8_t> seed(privateKey.begin(), privateKey.begin() + SEED_SIZE);
        std::vector<uint8_t> derivedPrivate;
        std::vector<uint8_t> derivedPublic;

        bool isValid = keyPairFromSeed(seed, derivedPrivate, derivedPublic) &&
                       std::equal(derivedPublic.begin(), derivedPublic.end(), privateKey.begin() + SEED_SIZE);

        secureClean(seed);
        secureClean(derivedPrivate);
        return isValid;
    }

    bool KeyManager::isValidPublicKey(const std::vector<uint8_t>& publicKey) {
        return publicKey.size() == PUBLIC_KEY_SIZE && !isAllZero(publicKey);
    }

    // ============================================================
    //  ENCODED KEY STRUCTURES
    // ============================================================

    std::vector<uint8_t> KeyManager::encodeKeyMessage(const std::vector<uint8_t>& keyData) {
        std::vector<uint8_t> out;
        out.reserve(4 + keyData.size());

        writeVarint(out, (FIELD_KEY_TYPE << 3) | WIRE_VARINT);
        writeVarint(out, KEY_TYPE_ED25519);
        writeVarint(out, (FIELD_KEY_DATA << 3) | WIRE_LENGTH_DELIMITED);
        writeVarint(out, keyData.size());
        out.insert(out.end(), keyData.begin(), keyData.end());

        return out;
    }

    bool KeyManager::decodeKeyMessage(const std::vector<uint8_t>& encoded, uint64_t& keyType, std::vector<uint8_t>& keyData) {
        bool hasType = false;
        bool hasData = false;
        size_t pos = 0;

        while (pos < encoded.size()) {
            uint64_t tag = 0;
            if (!readVarint(encoded, pos, tag)) {
                return false;
            }

            const uint64_t field = tag >> 3;
            const uint8_t wireType = static_cast<uint8_t>(tag & 0x07);

            if (field == FIELD_KEY_TYPE && wireType == WIRE_VARINT) {
                if (!readVarint(encoded, pos, keyType)) {
                    return false;
                }
                hasType = true;
            } else if (wireType == WIRE_LENGTH_DELIMITED) {
                uint64_t length = 0;
                if (!readVarint(encoded, pos, length) || length > encoded.size() - pos) {
                    return false;
                }
                if (field == FIELD_KEY_DATA) {
                    keyData.assign(encoded.begin() + static_cast<std::ptrdiff_t>(pos),
                                   encoded.begin() + static_cast<std::ptrdiff_t>(pos + length));
                    hasData = true;
                }
                pos += static_cast<size_t>(length);
            } else if (wireType == WIRE_VARINT) {
                uint64_t ignored = 0;
                if (!readVarint(encoded, pos, ignored)) {
                    return false;
                }
            } else if (wireType == WIRE_FIXED64 || wireType == WIRE_FIXED32) {
                const size_t width = wireType == WIRE_FIXED64 ? 8 : 4;
                if (width > encoded.size() - pos) {
                    return false;
                }
                pos += width;
            } else {
                return false;
            }
        }

        return hasType && hasData;
    }

    std::vector<uint8_t> KeyManager::encodePrivateKey(const std::vector<uint8_t>& privateKey) {
        if (privateKey.size() != PRIVATE_KEY_SIZE) {
            throw std::invalid_argument("Private key must be " + std::to_string(PRIVATE_KEY_SIZE) + " bytes");
        }
        return encodeKeyMessage(privateKey);
    }

    bool KeyManager::decodePrivateKey(const std::vector<uint8_t>& encoded, std::vector<uint8_t>& privateKey) {
        uint64_t keyType = 0;
        std::vector<uint8_t> keyData;

        if (!decodeKeyMessage(encoded, keyType, keyData) || keyType != KEY_TYPE_ED25519) {
            secureClean(keyData);
            return false;
        }

        // Older encoders append a redundant copy of the public key
        if (keyData.size() == PRIVATE_KEY_SIZE + PUBLIC_KEY_SIZE) {
            if (!std::equal(keyData.begin() + SEED_SIZE, keyData.begin() + PRIVATE_KEY_SIZE,
                            keyData.begin() + PRIVATE_KEY_SIZE)) {
                secureClean(keyData);
                return false;
            }
            keyData.resize(PRIVATE_KEY_SIZE);
        }

        if (!isValidPrivateKey(keyData)) {
            secureClean(keyData);
            return false;
        }

        privateKey = keyData;
        secureClean(keyData);
        return true;
    }

    std::vector<uint8_t> KeyManager::encodePublicKey(const std::vector<uint8_t>& publicKey) {
        if (publicKey.size() != PUBLIC_KEY_SIZE) {
            throw std::invalid_argument("Public key must be " + std::to_string(PUBLIC_KEY_SIZE) + " bytes");
        }
        return encodeKeyMessage(publicKey);
    }

    // ============================================================
    //  PEER IDS
    // ============================================================

    std::string KeyManager::peerIdFromPublicKey(const std::vector<uint8_t>& publicKey) {
        const std::vector<uint8_t> encodedKey = encodePublicKey(publicKey);

        // Short keys are embedded verbatim under the identity multihash
        std::vector<uint8_t> multihash;
        multihash.reserve(2 + encodedKey.size());
        multihash.push_back(MULTIHASH_IDENTITY);
        multihash.push_back(static_cast<uint8_t>(encodedKey.size()));
        multihash.insert(multihash.end(), encodedKey.begin(), encodedKey.end());

        return CryptoBase::base58Encode(multihash);
    }

    bool KeyManager::publicKeyFromPeerId(const std::string& peerId, std::vector<uint8_t>& publicKey) {
        std::vector<uint8_t> multihash;
        try {
            multihash = CryptoBase::base58Decode(peerId);
        } catch (const std::invalid_argument&) {
            return false;
        }

        if (multihash.size() < 2 || multihash[0] != MULTIHASH_IDENTITY ||
            multihash[1] != multihash.size() - 2) {
            return false;
        }

        uint64_t keyType = 0;
        std::vector<uint8_t> keyData;
        const std::vector<uint8_t> encodedKey(multihash.begin() + 2, multihash.end());
        if (!decodeKeyMessage(encodedKey, keyType, keyData) || keyType != KEY_TYPE_ED25519 ||
            !isValidPublicKey(keyData)) {
            return false;
        }

        publicKey = keyData;
        return true;
    }

    void KeyManager::secureClean(std::vector<uint8_t>& sensitiveData) {
        CryptoBase::secureClean(sensitiveData);
    }

} // namespace rendezvous
