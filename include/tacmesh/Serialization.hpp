#ifndef TACMESH_SERIALIZATION_HPP
#define TACMESH_SERIALIZATION_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tacmesh {

    // Portable endianness helpers
    uint32_t hton32(uint32_t value);
    uint32_t ntoh32(uint32_t value);
    uint64_t hton64(uint64_t value);
    uint64_t ntoh64(uint64_t value);

    /**
     * Appends big-endian, length-prefixed fields to a byte buffer.
     */
    class ByteWriter {
    public:
        void writeU8(uint8_t value);
        void writeU32(uint32_t value);
        void writeU64(uint64_t value);
        void writeBytes(const std::vector<uint8_t>& data);
        void writeString(const std::string& str);
        void writeStringList(const std::vector<std::string>& items);
        void writeCounterMap(const std::map<std::string, uint64_t>& counters);

        const std::vector<uint8_t>& data() const { return buffer; }
        std::vector<uint8_t> release() { return std::move(buffer); }

    private:
        std::vector<uint8_t> buffer;
    };

    /**
     * Reads fields written by ByteWriter. Every read throws std::runtime_error
     * on truncated or oversized input.
     */
    class ByteReader {
    public:
        explicit ByteReader(const std::vector<uint8_t>& data);

        uint8_t readU8();
        uint32_t readU32();
        uint64_t readU64();
        std::vector<uint8_t> readBytes();
        std::string readString();
        std::vector<std::string> readStringList();
        std::map<std::string, uint64_t> readCounterMap();

        bool atEnd() const { return position == source.size(); }
        size_t remaining() const { return source.size() - position; }

    private:
        void require(size_t count) const;
        uint32_t readLength();

        const std::vector<uint8_t>& source;
        size_t position = 0;
    };

} // namespace tacmesh

#endif // TACMESH_SERIALIZATION_HPP
