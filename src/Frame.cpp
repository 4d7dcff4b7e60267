#include "tacmesh/Frame.hpp"
#include "tacmesh/Serialization.hpp"

#include <cstring>
#include <zlib.h>

namespace tacmesh {

    namespace {
        bool isKnownFrameType(uint8_t raw) {
            return (raw >= static_cast<uint8_t>(FrameType::HELLO) &&
                    raw <= static_cast<uint8_t>(FrameType::SYNC_ACK)) ||
                   raw == static_cast<uint8_t>(FrameType::DISCONNECT);
        }
    }

    // ------------------------------------------------------------
    // CRC32
    // ------------------------------------------------------------
    uint32_t crc32_buf(const void* data, size_t length) {
        return static_cast<uint32_t>(::crc32(0L,
            reinterpret_cast<const unsigned char*>(data),
            static_cast<uInt>(length)));
    }

    // ------------------------------------------------------------
    // SERIALIZATION
    // ------------------------------------------------------------
    std::vector<uint8_t> serializeFrame(const Frame& frame) {
        std::vector<uint8_t> buffer;
        const uint64_t payloadLength = frame.payload.size();
        buffer.reserve(FRAME_HEADER_SIZE + payloadLength + CHECKSUM_SIZE);

        uint32_t magicBigEndian = hton32(frame.magic);
        buffer.insert(buffer.end(),
            reinterpret_cast<uint8_t*>(&magicBigEndian),
            reinterpret_cast<uint8_t*>(&magicBigEndian) + 4);

        buffer.push_back(frame.version);
        buffer.push_back(static_cast<uint8_t>(frame.type));

        uint64_t lengthBigEndian = hton64(payloadLength);
        buffer.insert(buffer.end(),
            reinterpret_cast<uint8_t*>(&lengthBigEndian),
            reinterpret_cast<uint8_t*>(&lengthBigEndian) + 8);

        if (!frame.payload.empty()) {
            buffer.insert(buffer.end(), frame.payload.begin(), frame.payload.end());
        }

        // checksum over everything above
        uint32_t checksumBigEndian = hton32(crc32_buf(buffer.data(), buffer.size()));
        buffer.insert(buffer.end(),
            reinterpret_cast<uint8_t*>(&checksumBigEndian),
            reinterpret_cast<uint8_t*>(&checksumBigEndian) + 4);

        return buffer;
    }

    // ------------------------------------------------------------
    // HEADER
    // ------------------------------------------------------------
    bool parseFrameHeader(const std::vector<uint8_t>& headerBuffer, Frame& outputHeader, uint64_t& payloadLength) {
        if (headerBuffer.size() < FRAME_HEADER_SIZE) return false;

        size_t position = 0;
        uint32_t magicBigEndian;
        std::memcpy(&magicBigEndian, &headerBuffer[position], 4);
        position += 4;
        outputHeader.magic = ntoh32(magicBigEndian);

        outputHeader.version = headerBuffer[position++];
        uint8_t rawType = headerBuffer[position++];

        uint64_t lengthBigEndian;
        std::memcpy(&lengthBigEndian, &headerBuffer[position], 8);
        payloadLength = ntoh64(lengthBigEndian);

        if (outputHeader.magic != NETWORK_MAGIC) return false;
        if (outputHeader.version != PROTOCOL_VERSION) return false;
        if (!isKnownFrameType(rawType)) return false;
        if (payloadLength > MAX_PAYLOAD_SIZE) return false;

        outputHeader.type = static_cast<FrameType>(rawType);
        return true;
    }

    // ------------------------------------------------------------
    // FULL FRAME
    // ------------------------------------------------------------
    bool parseFullFrame(const std::vector<uint8_t>& buffer, Frame& outputFrame) {
        if (buffer.size() < FRAME_HEADER_SIZE + CHECKSUM_SIZE) return false;

        Frame header;
        uint64_t payloadLength;
        if (!parseFrameHeader(buffer, header, payloadLength)) return false;

        const size_t totalLength = FRAME_HEADER_SIZE + payloadLength + CHECKSUM_SIZE;
        if (buffer.size() != totalLength) return false;

        uint32_t receivedChecksumBigEndian;
        std::memcpy(&receivedChecksumBigEndian, &buffer[FRAME_HEADER_SIZE + payloadLength], 4);
        uint32_t receivedChecksum = ntoh32(receivedChecksumBigEndian);

        if (crc32_buf(buffer.data(), FRAME_HEADER_SIZE + payloadLength) != receivedChecksum) return false;

        outputFrame = header;
        outputFrame.payload.assign(
            buffer.begin() + FRAME_HEADER_SIZE,
            buffer.begin() + static_cast<std::ptrdiff_t>(FRAME_HEADER_SIZE + payloadLength));
        return true;
    }

    std::string frameTypeToString(FrameType type) {
        switch (type) {
            case FrameType::HELLO:        return "HELLO";
            case FrameType::HEARTBEAT:    return "HEARTBEAT";
            case FrameType::MESH_MESSAGE: return "MESH_MESSAGE";
            case FrameType::SYNC_OFFER:   return "SYNC_OFFER";
            case FrameType::SYNC_RESULT:  return "SYNC_RESULT";
            case FrameType::SYNC_ABORT:   return "SYNC_ABORT";
            case FrameType::SYNC_ACK:     return "SYNC_ACK";
            case FrameType::DISCONNECT:   return "DISCONNECT";
            default:                      return "UNKNOWN";
        }
    }

} // namespace tacmesh
