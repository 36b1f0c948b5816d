#include "CryptoBase.hpp"

// -----------------------------------------------------------------------------------
// ---------------------------- PRIVATE HELPERS --------------------------------------
// -----------------------------------------------------------------------------------

namespace {
    // Bitcoin alphabet, as used by multibase base58btc
    const std::string B58_CHARS =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    std::vector<int> buildDecodeTable() {
        std::vector<int> decode_table(256, -1);
        for (size_t i = 0; i < B58_CHARS.size(); ++i) {
            decode_table[static_cast<unsigned char>(B58_CHARS[i])] = static_cast<int>(i);
        }
        return decode_table;
    }
}

namespace rendezvous {

    bool CryptoBase::initialize() {
        if (sodium_init() < 0) {
            std::cerr << "Error: Failed to initialize libsodium" << std::endl;
            return false;
        }

        return true;
    }

    // -----------------------------------------------------------------------------------
    // ---------------------------- HASHING ----------------------------------------------
    // -----------------------------------------------------------------------------------

    std::vector<uint8_t> CryptoBase::sha256Bytes(const std::vector<uint8_t>& data) {
        std::vector<uint8_t> hash(crypto_hash_sha256_BYTES);

        if (crypto_hash_sha256(hash.data(), data.data(), data.size()) != 0) {
            throw std::runtime_error("SHA-256 computation failed");
        }

        return hash;
    }

    std::string CryptoBase::sha256(const std::vector<uint8_t>& data) {
        return hexEncode(sha256Bytes(data));
    }

    // -----------------------------------------------------------------------------------
    // ---------------------------- ENCODING ---------------------------------------------
    // -----------------------------------------------------------------------------------

    std::string CryptoBase::base58Encode(const std::vector<uint8_t>& data) {
        // Leading zero bytes map one-to-one onto leading '1's
        size_t zeros = 0;
        while (zeros < data.size() && data[zeros] == 0) {
            ++zeros;
        }

        // log(256) / log(58), rounded up
        std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1);
        size_t length = 0;

        for (size_t i = zeros; i < data.size(); ++i) {
            int carry = data[i];
            size_t j = 0;
            for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
                carry += 256 * (*it);
                *it = static_cast<uint8_t>(carry % 58);
                carry /= 58;
            }
            length = j;
        }

        auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
        while (it != digits.end() && *it == 0) {
            ++it;
        }

        std::string result(zeros, '1');
        result.reserve(zeros + static_cast<size_t>(digits.end() - it));
        for (; it != digits.end(); ++it) {
            result.push_back(B58_CHARS[*it]);
        }

        return result;
    }

    std::vector<uint8_t> CryptoBase::base58Decode(const std::string& encoded) {
        static const std::vector<int> decode_table = buildDecodeTable();

        size_t zeros = 0;
        while (zeros < encoded.size() && encoded[zeros] == '1') {
            ++zeros;
        }

        // log(58) / log(256), rounded up
        std::vector<uint8_t> bytes((encoded.size() - zeros) * 733 / 1000 + 1);
        size_t length = 0;

        for (size_t i = zeros; i < encoded.size(); ++i) {
            int carry = decode_table[static_cast<unsigned char>(encoded[i])];
            if (carry < 0) {
                throw std::invalid_argument("Invalid base58 character: " + std::string(1, encoded[i]));
            }

            size_t j = 0;
            for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
                carry += 58 * (*it);
                *it = static_cast<uint8_t>(carry % 256);
                carry /= 256;
            }
            length = j;
        }

        auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
        while (it != bytes.end() && *it == 0) {
            ++it;
        }

        std::vector<uint8_t> result(zeros, 0x00);
        result.insert(result.end(), it, bytes.end());
        return result;
    }

    std::string CryptoBase::hexEncode(const std::vector<uint8_t>& data) {
        std::stringstream hexStream;
        hexStream << std::hex << std::setfill('0');

        for (uint8_t byte : data) {
            hexStream << std::setw(2) << static_cast<int>(byte);
        }

        return hexStream.str();
    }

    // -----------------------------------------------------------------------------------
    // ---------------------------- KEYS & RANDOMNESS ------------------------------------
    // -----------------------------------------------------------------------------------

    void CryptoBase::secureClean(std::vector<uint8_t>& sensitiveData) {
        if (!sensitiveData.empty()) {
            sodium_memzero(sensitiveData.data(), sensitiveData.size());
        }
    }

    bool CryptoBase::ed25519SeedKeypair(std::vector<uint8_t>& publicKey,
                                        std::vector<uint8_t>& privateKey,
                                        const std::vector<uint8_t>& seed) {
        if (seed.size() != SEED_SIZE) {
            std::cerr << "Error: Seed must be " << SEED_SIZE << " bytes" << std::endl;
            return false;
        }

        publicKey.resize(PUBLIC_KEY_SIZE);
        privateKey.resize(PRIVATE_KEY_SIZE);

        return crypto_sign_ed25519_seed_keypair(publicKey.data(), privateKey.data(), seed.data()) == 0;
    }

    bool CryptoBase::ed25519SkToPk(std::vector<uint8_t>& publicKey, const std::vector<uint8_t>& privateKey) {
        if (privateKey.size() != PRIVATE_KEY_SIZE) {
            return false;
        }

        publicKey.resize(PUBLIC_KEY_SIZE);
        return crypto_sign_ed25519_sk_to_pk(publicKey.data(), privateKey.data()) == 0;
    }

    bool CryptoBase::randomBytes(std::vector<uint8_t>& buffer) {
        if (buffer.empty()) {
            return true;
        }

        return randomBytes(buffer.data(), buffer.size());
    }

    bool CryptoBase::randomBytes(uint8_t* buffer, size_t size) {
        if (buffer == nullptr) {
            std::cerr << "Error: Null buffer provided to randomBytes" << std::endl;
            return false;
        }

        if (size == 0) {
            return true;
        }

        if (sodium_init() < 0) {
            std::cerr << "Error: libsodium not initialized in randomBytes" << std::endl;
            return false;
        }

        randombytes_buf(buffer, size);
        return true;
    }

} // namespace rendezvous
