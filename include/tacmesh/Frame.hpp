#ifndef TACMESH_FRAME_HPP
#define TACMESH_FRAME_HPP

#include "tacmesh/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tacmesh {

    // ============================================================
    //  FRAME TYPES
    // ============================================================
    enum class FrameType : uint8_t {
        HELLO        = 1,
        HEARTBEAT    = 2,
        MESH_MESSAGE = 3,
        SYNC_OFFER   = 4,
        SYNC_RESULT  = 5,
        SYNC_ABORT   = 6,
        SYNC_ACK     = 7,
        DISCONNECT   = 255
    };

    // ============================================================
    //  FRAME
    // ============================================================
    struct Frame {
        uint32_t magic   = NETWORK_MAGIC;
        uint8_t  version = PROTOCOL_VERSION;
        FrameType type   = FrameType::HEARTBEAT;
        std::vector<uint8_t> payload;
    };

    // ============================================================
    //  FUNCTIONS
    // ============================================================

    /** Serializes a frame to wire format:
     * [magic(4) big-endian] [version(1)] [type(1)] [payload_len(8) big-endian]
     * [payload] [crc32(4) big-endian]
     */
    std::vector<uint8_t> serializeFrame(const Frame& frame);

    /** Parses ONLY the header to get magic, version, type and payload size.
     * Returns false on short input, foreign magic, other version, unknown type
     * or oversized payload.
     */
    bool parseFrameHeader(const std::vector<uint8_t>& headerBuf, Frame& outHeader, uint64_t& payloadLen);

    uint32_t crc32_buf(const void* data, size_t len);

    /** Parses a COMPLETE frame (header + payload + checksum). Returns false if
     *  bytes are missing or the checksum does not match.
     */
    bool parseFullFrame(const std::vector<uint8_t>& buf, Frame& outFrame);

    std::string frameTypeToString(FrameType t);

} // namespace tacmesh

#endif // TACMESH_FRAME_HPP
