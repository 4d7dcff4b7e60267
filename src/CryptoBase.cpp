#include "tacmesh/CryptoBase.hpp"
#include "tacmesh/Types.hpp"

#include <sodium.h>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace tacmesh {

bool CryptoBase::initialize() {
    if (sodium_init() < 0) {
        std::cerr << "Error: Failed to initialize libsodium" << std::endl;
        return false;
    }
    return true;
}

// ==== HASHING ====

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

std::string CryptoBase::sha256(const std::string& data) {
    return sha256(std::vector<uint8_t>(data.begin(), data.end()));
}

// ==== ENCODING ====

std::string CryptoBase::base64Encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return "";

    const size_t capacity = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(capacity, '\0');
    sodium_bin2base64(&encoded[0], capacity, data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);
    encoded.resize(capacity - 1); // drop the terminator
    return encoded;
}

std::vector<uint8_t> CryptoBase::base64Decode(const std::string& encoded) {
    if (encoded.empty()) return {};

    std::vector<uint8_t> decoded(encoded.size() / 4 * 3 + 3);
    size_t length = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(), encoded.data(), encoded.size(),
                          nullptr, &length, &end, sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != encoded.data() + encoded.size()) {
        throw std::invalid_argument("Invalid base64 input");
    }
    decoded.resize(length);
    return decoded;
}

std::string CryptoBase::hexEncode(const std::vector<uint8_t>& data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), data.data(), data.size());
    hex.pop_back();
    return hex;
}

std::vector<uint8_t> CryptoBase::hexDecode(const std::string& hexStr) {
    if (hexStr.empty()) return {};
    if (hexStr.size() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<uint8_t> bytes(hexStr.size() / 2);
    size_t length = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(bytes.data(), bytes.size(), hexStr.data(), hexStr.size(),
                       nullptr, &length, &end) != 0 ||
        end != hexStr.data() + hexStr.size()) {
        throw std::invalid_argument("Invalid hex string");
    }
    bytes.resize(length);
    return bytes;
}

bool CryptoBase::isHexDigest(const std::string& value) {
    if (value.size() != HASH_HEX_LENGTH) return false;
    for (char c : value) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// ==== RANDOM ====

bool CryptoBase::randomBytes(std::vector<uint8_t>& buffer) {
    if (buffer.empty()) return true;

    if (sodium_init() < 0) {
        std::cerr << "Error: libsodium not initialized in randomBytes" << std::endl;
        return false;
    }
    randombytes_buf(buffer.data(), buffer.size());
    return true;
}

std::string CryptoBase::randomId(size_t bytes) {
    std::vector<uint8_t> buffer(bytes);
    if (!randomBytes(buffer)) {
        throw std::runtime_error("Random generator unavailable");
    }
    return hexEncode(buffer);
}

void CryptoBase::secureClean(std::vector<uint8_t>& sensitiveData) {
    if (!sensitiveData.empty()) {
        sodium_memzero(sensitiveData.data(), sensitiveData.size());
    }
}

} // namespace tacmesh
