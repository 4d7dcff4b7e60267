#ifndef TACMESH_SIGNER_HPP
#define TACMESH_SIGNER_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tacmesh {

    /**
     * Opaque signing capability. The ledger and the agent only ever ask for
     * sign(bytes) and verify(signerId, bytes, signature).
     */
    class Signer {
    public:
        virtual ~Signer() = default;

        virtual const std::string& signerId() const = 0;
        virtual std::vector<uint8_t> sign(const std::vector<uint8_t>& data) const = 0;
        virtual bool verify(const std::string& signerId,
                            const std::vector<uint8_t>& data,
                            const std::vector<uint8_t>& signature) const = 0;
    };

    /**
     * Provisioned public keys, node id -> Ed25519 public key. Thread-safe.
     */
    class KeyRing {
    public:
        bool addKey(const std::string& nodeId, const std::vector<uint8_t>& publicKey);
        bool addKeyEncoded(const std::string& nodeId, const std::string& publicKeyBase64);
        bool hasKey(const std::string& nodeId) const;
        std::vector<uint8_t> keyFor(const std::string& nodeId) const;
        size_t size() const;

    private:
        mutable std::mutex mtx;
        std::unordered_map<std::string, std::vector<uint8_t>> keys;
    };

    /**
     * Ed25519 signer backed by libsodium. Verification looks the signer's
     * public key up in a shared KeyRing.
     */
    class Ed25519Signer : public Signer {
    public:
        // Fresh random key pair
        Ed25519Signer(std::string nodeId, KeyRing& keyRing);
        // Deterministic key pair from a 32-byte seed
        Ed25519Signer(std::string nodeId, const std::vector<uint8_t>& seed, KeyRing& keyRing);
        ~Ed25519Signer() override;

        Ed25519Signer(const Ed25519Signer&) = delete;
        Ed25519Signer& operator=(const Ed25519Signer&) = delete;

        const std::string& signerId() const override;
        std::vector<uint8_t> sign(const std::vector<uint8_t>& data) const override;
        bool verify(const std::string& signerId,
                    const std::vector<uint8_t>& data,
                    const std::vector<uint8_t>& signature) const override;

        const std::vector<uint8_t>& publicKey() const;

        static bool verifyDetached(const std::vector<uint8_t>& publicKey,
                                   const std::vector<uint8_t>& data,
                                   const std::vector<uint8_t>& signature);

    private:
        std::string id;
        KeyRing& ring;
        std::vector<uint8_t> secretKey;
        std::vector<uint8_t> pubKey;
    };

} // namespace tacmesh

#endif // TACMESH_SIGNER_HPP
