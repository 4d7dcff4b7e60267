#ifndef TACMESH_CRYPTO_BASE_HPP
#define TACMESH_CRYPTO_BASE_HPP

#include <vector>
#include <string>
#include <cstdint>

namespace tacmesh {

    class CryptoBase {
    public:
        // Must be called once at startup
        static bool initialize();

        // SHA-256 (libsodium)
        static std::vector<uint8_t> sha256Bytes(const std::vector<uint8_t>& data);
        static std::string sha256(const std::vector<uint8_t>& data);
        static std::string sha256(const std::string& data);

        // Encoding (libsodium codecs, original base64 alphabet with padding)
        static std::string base64Encode(const std::vector<uint8_t>& data);
        static std::vector<uint8_t> base64Decode(const std::string& encoded);
        static std::string hexEncode(const std::vector<uint8_t>& data);
        static std::vector<uint8_t> hexDecode(const std::string& hexStr);
        static bool isHexDigest(const std::string& value);

        // Random
        static bool randomBytes(std::vector<uint8_t>& buffer);
        static std::string randomId(size_t bytes);

        static void secureClean(std::vector<uint8_t>& sensitiveData);
    };

} // namespace tacmesh

#endif // TACMESH_CRYPTO_BASE_HPP
