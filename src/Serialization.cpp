#include "tacmesh/Serialization.hpp"
#include "tacmesh/Types.hpp"

#include <stdexcept>

namespace tacmesh {

    // ------------------------------------------------------------
    // Endianness (wire order is big-endian, hosts are little-endian)
    // ------------------------------------------------------------
    uint32_t hton32(uint32_t value) {
        return ((value & 0xFF000000) >> 24) |
               ((value & 0x00FF0000) >> 8)  |
               ((value & 0x0000FF00) << 8)  |
               ((value & 0x000000FF) << 24);
    }

    uint32_t ntoh32(uint32_t value) {
        return hton32(value);
    }

    uint64_t hton64(uint64_t value) {
        return ((value & 0xFF00000000000000ULL) >> 56) |
               ((value & 0x00FF000000000000ULL) >> 40) |
               ((value & 0x0000FF0000000000ULL) >> 24) |
               ((value & 0x000000FF00000000ULL) >> 8)  |
               ((value & 0x00000000FF000000ULL) << 8)  |
               ((value & 0x0000000000FF0000ULL) << 24) |
               ((value & 0x000000000000FF00ULL) << 40) |
               ((value & 0x00000000000000FFULL) << 56);
    }

    uint64_t ntoh64(uint64_t value) {
        return hton64(value);
    }

    // ------------------------------------------------------------
    // ByteWriter
    // ------------------------------------------------------------
    void ByteWriter::writeU8(uint8_t value) {
        buffer.push_back(value);
    }

    void ByteWriter::writeU32(uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            buffer.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

    void ByteWriter::writeU64(uint64_t value) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            buffer.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

    void ByteWriter::writeBytes(const std::vector<uint8_t>& data) {
        if (data.size() > MAX_FIELD_SIZE) {
            throw std::length_error("Field too large: " + std::to_string(data.size()));
        }
        writeU32(static_cast<uint32_t>(data.size()));
        buffer.insert(buffer.end(), data.begin(), data.end());
    }

    void ByteWriter::writeString(const std::string& str) {
        if (str.size() > MAX_FIELD_SIZE) {
            throw std::length_error("String too large: " + std::to_string(str.size()));
        }
        writeU32(static_cast<uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }

    void ByteWriter::writeStringList(const std::vector<std::string>& items) {
        writeU32(static_cast<uint32_t>(items.size()));
        for (const auto& item : items) writeString(item);
    }

    void ByteWriter::writeCounterMap(const std::map<std::string, uint64_t>& counters) {
        writeU32(static_cast<uint32_t>(counters.size()));
        for (const auto& kv : counters) {
            writeString(kv.first);
            writeU64(kv.second);
        }
    }

    // ------------------------------------------------------------
    // ByteReader
    // ------------------------------------------------------------
    ByteReader::ByteReader(const std::vector<uint8_t>& data) : source(data) {}

    void ByteReader::require(size_t count) const {
        if (source.size() - position < count) {
            throw std::runtime_error("Truncated input: need " + std::to_string(count) +
                                     " bytes, have " + std::to_string(source.size() - position));
        }
    }

    uint8_t ByteReader::readU8() {
        require(1);
        return source[position++];
    }

    uint32_t ByteReader::readU32() {
        require(4);
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | source[position++];
        }
        return value;
    }

    uint64_t ByteReader::readU64() {
        require(8);
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | source[position++];
        }
        return value;
    }

    uint32_t ByteReader::readLength() {
        uint32_t length = readU32();
        if (length > MAX_FIELD_SIZE) {
            throw std::runtime_error("Field size too large: " + std::to_string(length));
        }
        require(length);
        return length;
    }

    std::vector<uint8_t> ByteReader::readBytes() {
        uint32_t length = readLength();
        std::vector<uint8_t> out(source.begin() + position, source.begin() + position + length);
        position += length;
        return out;
    }

    std::string ByteReader::readString() {
        uint32_t length = readLength();
        std::string out(source.begin() + position, source.begin() + position + length);
        position += length;
        return out;
    }

    std::vector<std::string> ByteReader::readStringList() {
        uint32_t count = readU32();
        // every entry needs at least its 4-byte length prefix
        require(static_cast<size_t>(count) * 4);
        std::vector<std::string> items;
        items.reserve(count);
        for (uint32_t i = 0; i < count; ++i) items.push_back(readString());
        return items;
    }

    std::map<std::string, uint64_t> ByteReader::readCounterMap() {
        uint32_t count = readU32();
        require(static_cast<size_t>(count) * 12);
        std::map<std::string, uint64_t> counters;
        for (uint32_t i = 0; i < count; ++i) {
            std::string key = readString();
            counters[key] = readU64();
        }
        return counters;
    }

} // namespace tacmesh
