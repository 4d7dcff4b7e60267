#ifndef TACMESH_TYPES_HPP
#define TACMESH_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string>

namespace tacmesh {

    using SteadyTime = std::chrono::steady_clock::time_point;
    using Millis = std::chrono::milliseconds;

    // ==== HASHING / SIGNATURES (libsodium) ====
    inline constexpr size_t SHA256_HASH_SIZE = 32;
    inline constexpr size_t HASH_HEX_LENGTH = 64;
    inline constexpr size_t SEED_SIZE = 32;
    inline constexpr size_t PRIVATE_KEY_SIZE = 64;
    inline constexpr size_t PUBLIC_KEY_SIZE = 32;
    inline constexpr size_t SIGNATURE_SIZE = 64;
    inline constexpr size_t MESSAGE_ID_BYTES = 16;

    // prev_hash of the genesis block
    inline const std::string GENESIS_PREV_HASH(HASH_HEX_LENGTH, '0');

    // ==== SERIALIZATION ====
    inline constexpr uint32_t SERIALIZATION_VERSION = 1;
    inline constexpr uint32_t BLOCK_MAGIC = 0xB10CDA7A;
    inline constexpr uint32_t CHAIN_MAGIC = 0xC4A1D0C5;
    inline constexpr size_t MAX_MESSAGES_PER_BLOCK = 1000;
    inline constexpr size_t MAX_FIELD_SIZE = 4 * 1024 * 1024;
    inline constexpr size_t MAX_CHAIN_FILE_SIZE = 64 * 1024 * 1024;

    // ==== WIRE PROTOCOL ====
    inline constexpr uint32_t NETWORK_MAGIC = 0x7AC3E5B1;
    inline constexpr uint8_t  PROTOCOL_VERSION = 1;
    inline constexpr size_t   MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;
    inline constexpr size_t   FRAME_HEADER_SIZE = 4 + 1 + 1 + 8; // magic + version + type + payload_len
    inline constexpr size_t   CHECKSUM_SIZE = 4; // CRC32

    // ==== ROUTING ====
    inline constexpr uint8_t DEFAULT_TTL = 3;
    inline constexpr size_t  MAX_DEDUP_ENTRIES = 100000;
    inline constexpr Millis  DEFAULT_DEDUP_RETENTION{10 * 60 * 1000};
    inline constexpr Millis  DEFAULT_PEER_TIMEOUT{90 * 1000};
    inline constexpr double  LINK_QUALITY_ALPHA = 0.2;

    // ==== NODE STATE MACHINE ====
    inline constexpr Millis   DEFAULT_HEARTBEAT_INTERVAL{30 * 1000};
    inline constexpr uint32_t DEFAULT_HEARTBEAT_MISS_THRESHOLD = 2;
    inline constexpr size_t   DEFAULT_MIN_PEERS = 1;
    inline constexpr double   DEFAULT_DEGRADED_QUALITY = 0.3;
    inline constexpr Millis   DEFAULT_SYNC_TIMEOUT{20 * 1000};
    inline constexpr Millis   DEFAULT_RESYNC_RETRY{5 * 1000};

    // ==== OUTBOUND QUEUE ====
    inline constexpr Millis DEFAULT_RETRY_INITIAL{1000};
    inline constexpr Millis DEFAULT_RETRY_MAX{60 * 1000};
    inline constexpr Millis DEFAULT_QUEUE_EXPIRY{10 * 60 * 1000};
    inline constexpr size_t MAX_MESSAGE_QUEUE = 10000;

    // ==== RUNTIME ====
    inline constexpr uint16_t DEFAULT_LISTEN_PORT = 30717;
    inline constexpr Millis   MAINTENANCE_PERIOD{1000};

} // namespace tacmesh

#endif // TACMESH_TYPES_HPP
