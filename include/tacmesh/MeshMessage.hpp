#ifndef TACMESH_MESH_MESSAGE_HPP
#define TACMESH_MESH_MESSAGE_HPP

#include "tacmesh/ClockService.hpp"
#include "tacmesh/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tacmesh {

    class Signer;
    class ByteWriter;
    class ByteReader;

    enum class MessageType : uint8_t {
        CHAT    = 1,
        COMMAND = 2,
        ALERT   = 3,
        STATUS  = 4
    };

    std::string messageTypeToString(MessageType type);
    bool messageTypeFromString(const std::string& name, MessageType& out);

    // Lower rank drains first: ALERT > COMMAND > STATUS > CHAT
    int priorityRank(MessageType type);

    /**
     * Application message carried by the mesh. Immutable: hop progress is
     * expressed by new copies (relayCopy, arrivedAt).
     */
    class MeshMessage {
    public:
        MeshMessage() = default;

        /**
         * Creates a signed message originating at signer.signerId(). The route
         * starts with the origin.
         */
        static MeshMessage create(const Signer& signer,
                                  MessageType type,
                                  std::vector<uint8_t> payload,
                                  std::string destination,
                                  const ClockStamp& stamp,
                                  uint8_t ttl = DEFAULT_TTL);

        // Copy handed to a neighbour: TTL - 1. Throws std::logic_error at TTL 0.
        MeshMessage relayCopy() const;
        // Copy as recorded by the node it just reached: route + nodeId.
        MeshMessage arrivedAt(const std::string& nodeId) const;

        // Bytes covered by the sender signature (TTL and route excluded)
        std::vector<uint8_t> signingBytes() const;
        bool verify(const Signer& verifier) const;

        bool isBroadcast() const { return destination_.empty(); }
        bool addressedTo(const std::string& nodeId) const { return !destination_.empty() && destination_ == nodeId; }
        bool visited(const std::string& nodeId) const;
        size_t hops() const { return route_.empty() ? 0 : route_.size() - 1; }

        const std::string& id() const { return id_; }
        const std::string& sender() const { return sender_; }
        const std::string& destination() const { return destination_; }
        MessageType type() const { return type_; }
        const std::vector<uint8_t>& payload() const { return payload_; }
        uint64_t lamport() const { return lamport_; }
        const VectorClock& vectorClock() const { return vector_; }
        uint8_t ttl() const { return ttl_; }
        const std::vector<std::string>& route() const { return route_; }
        const std::vector<uint8_t>& signature() const { return signature_; }

        void writeTo(ByteWriter& out) const;
        static MeshMessage readFrom(ByteReader& in);

        std::vector<uint8_t> encode() const;
        static MeshMessage decode(const std::vector<uint8_t>& bytes);

        bool operator==(const MeshMessage& other) const;
        bool operator!=(const MeshMessage& other) const { return !(*this == other); }

    private:
        std::string id_;
        std::string sender_;
        std::string destination_;
        MessageType type_ = MessageType::CHAT;
        std::vector<uint8_t> payload_;
        uint64_t lamport_ = 0;
        VectorClock vector_;
        uint8_t ttl_ = 0;
        std::vector<std::string> route_;
        std::vector<uint8_t> signature_;
    };

} // namespace tacmesh

#endif // TACMESH_MESH_MESSAGE_HPP
