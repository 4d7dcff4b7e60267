#include "tacmesh/Signer.hpp"
#include "tacmesh/CryptoBase.hpp"
#include "tacmesh/Types.hpp"

#include <sodium.h>
#include <iostream>
#include <stdexcept>

namespace tacmesh {

// -----------------------------------------------------------------------------------
// ---------------------------- KeyRing ----------------------------------------------
// -----------------------------------------------------------------------------------

bool KeyRing::addKey(const std::string& nodeId, const std::vector<uint8_t>& publicKey) {
    if (nodeId.empty() || publicKey.size() != PUBLIC_KEY_SIZE) {
        std::cerr << "Error: Invalid public key for node '" << nodeId << "'" << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lk(mtx);
    auto it = keys.find(nodeId);
    if (it != keys.end() && it->second != publicKey) {
        std::cerr << "Error: Conflicting public key for node '" << nodeId << "'" << std::endl;
        return false;
    }
    keys[nodeId] = publicKey;
    return true;
}

bool KeyRing::addKeyEncoded(const std::string& nodeId, const std::string& publicKeyBase64) {
    std::vector<uint8_t> decoded;
    try {
        decoded = CryptoBase::base64Decode(publicKeyBase64);
    } catch (const std::exception& e) {
        std::cerr << "Error decoding public key for '" << nodeId << "': " << e.what() << std::endl;
        return false;
    }
    return addKey(nodeId, decoded);
}

bool KeyRing::hasKey(const std::string& nodeId) const {
    std::lock_guard<std::mutex> lk(mtx);
    return keys.count(nodeId) > 0;
}

std::vector<uint8_t> KeyRing::keyFor(const std::string& nodeId) const {
    std::lock_guard<std::mutex> lk(mtx);
    auto it = keys.find(nodeId);
    if (it == keys.end()) return {};
    return it->second;
}

size_t KeyRing::size() const {
    std::lock_guard<std::mutex> lk(mtx);
    return keys.size();
}

// -----------------------------------------------------------------------------------
// ---------------------------- Ed25519Signer ----------------------------------------
// -----------------------------------------------------------------------------------

Ed25519Signer::Ed25519Signer(std::string nodeId, KeyRing& keyRing)
    : id(std::move(nodeId)), ring(keyRing), secretKey(PRIVATE_KEY_SIZE), pubKey(PUBLIC_KEY_SIZE) {

    std::vector<uint8_t> seed(SEED_SIZE);
    if (!CryptoBase::randomBytes(seed)) {
        throw std::runtime_error("Failed to generate random seed");
    }
    int result = crypto_sign_ed25519_seed_keypair(pubKey.data(), secretKey.data(), seed.data());
    CryptoBase::secureClean(seed);
    if (result != 0) {
        throw std::runtime_error("crypto_sign_ed25519_seed_keypair failed");
    }
    if (!ring.addKey(id, pubKey)) {
        throw std::invalid_argument("Key ring already holds another key for " + id);
    }
}

Ed25519Signer::Ed25519Signer(std::string nodeId, const std::vector<uint8_t>& seed, KeyRing& keyRing)
    : id(std::move(nodeId)), ring(keyRing), secretKey(PRIVATE_KEY_SIZE), pubKey(PUBLIC_KEY_SIZE) {

    if (seed.size() != SEED_SIZE) {
        throw std::invalid_argument("Seed must be 32 bytes");
    }
    if (crypto_sign_ed25519_seed_keypair(pubKey.data(), secretKey.data(), seed.data()) != 0) {
        throw std::runtime_error("crypto_sign_ed25519_seed_keypair failed");
    }
    if (!ring.addKey(id, pubKey)) {
        throw std::invalid_argument("Seed does not match the provisioned key of " + id);
    }
}

Ed25519Signer::~Ed25519Signer() {
    CryptoBase::secureClean(secretKey);
}

const std::string& Ed25519Signer::signerId() const {
    return id;
}

std::vector<uint8_t> Ed25519Signer::sign(const std::vector<uint8_t>& data) const {
    std::vector<uint8_t> signature(SIGNATURE_SIZE);
    int result = crypto_sign_detached(signature.data(), nullptr,
                                      data.data(), data.size(),
                                      secretKey.data());
    if (result != 0) {
        throw std::runtime_error("crypto_sign_detached failed with code " + std::to_string(result));
    }
    return signature;
}

bool Ed25519Signer::verify(const std::string& signerId,
                           const std::vector<uint8_t>& data,
                           const std::vector<uint8_t>& signature) const {
    std::vector<uint8_t> key = ring.keyFor(signerId);
    if (key.empty()) {
        std::cerr << "Error: No public key known for '" << signerId << "'" << std::endl;
        return false;
    }
    return verifyDetached(key, data, signature);
}

const std::vector<uint8_t>& Ed25519Signer::publicKey() const {
    return pubKey;
}

bool Ed25519Signer::verifyDetached(const std::vector<uint8_t>& publicKey,
                                   const std::vector<uint8_t>& data,
                                   const std::vector<uint8_t>& signature) {
    if (publicKey.size() != PUBLIC_KEY_SIZE || signature.size() != SIGNATURE_SIZE) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), data.data(), data.size(),
                                       publicKey.data()) == 0;
}

} // namespace tacmesh
