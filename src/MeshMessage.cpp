#include "tacmesh/MeshMessage.hpp"
#include "tacmesh/CryptoBase.hpp"
#include "tacmesh/Serialization.hpp"
#include "tacmesh/Signer.hpp"

#include <algorithm>
#include <stdexcept>

namespace tacmesh {

std::string messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::CHAT:    return "CHAT";
        case MessageType::COMMAND: return "COMMAND";
        case MessageType::ALERT:   return "ALERT";
        case MessageType::STATUS:  return "STATUS";
    }
    return "UNKNOWN";
}

bool messageTypeFromString(const std::string& name, MessageType& out) {
    if (name == "CHAT")    { out = MessageType::CHAT;    return true; }
    if (name == "COMMAND") { out = MessageType::COMMAND; return true; }
    if (name == "ALERT")   { out = MessageType::ALERT;   return true; }
    if (name == "STATUS")  { out = MessageType::STATUS;  return true; }
    return false;
}

int priorityRank(MessageType type) {
    switch (type) {
        case MessageType::ALERT:   return 0;
        case MessageType::COMMAND: return 1;
        case MessageType::STATUS:  return 2;
        case MessageType::CHAT:    return 3;
    }
    return 4;
}

MeshMessage MeshMessage::create(const Signer& signer,
                                MessageType type,
                                std::vector<uint8_t> payload,
                                std::string destination,
                                const ClockStamp& stamp,
                                uint8_t ttl) {
    MeshMessage msg;
    msg.id_ = CryptoBase::randomId(MESSAGE_ID_BYTES);
    msg.sender_ = signer.signerId();
    msg.destination_ = std::move(destination);
    msg.type_ = type;
    msg.payload_ = std::move(payload);
    msg.lamport_ = stamp.lamport;
    msg.vector_ = stamp.vector;
    msg.ttl_ = ttl;
    msg.route_.push_back(msg.sender_);
    msg.signature_ = signer.sign(msg.signingBytes());
    return msg;
}

MeshMessage MeshMessage::relayCopy() const {
    if (ttl_ == 0) {
        throw std::logic_error("Message " + id_ + " has no hops left");
    }
    MeshMessage copy = *this;
    copy.ttl_ = static_cast<uint8_t>(ttl_ - 1);
    return copy;
}

MeshMessage MeshMessage::arrivedAt(const std::string& nodeId) const {
    MeshMessage copy = *this;
    copy.route_.push_back(nodeId);
    return copy;
}

std::vector<uint8_t> MeshMessage::signingBytes() const {
    ByteWriter out;
    out.writeString(id_);
    out.writeString(sender_);
    out.writeString(destination_);
    out.writeU8(static_cast<uint8_t>(type_));
    out.writeBytes(payload_);
    out.writeU64(lamport_);
    out.writeCounterMap(vector_);
    return out.release();
}

bool MeshMessage::verify(const Signer& verifier) const {
    return verifier.verify(sender_, signingBytes(), signature_);
}

bool MeshMessage::visited(const std::string& nodeId) const {
    return std::find(route_.begin(), route_.end(), nodeId) != route_.end();
}

void MeshMessage::writeTo(ByteWriter& out) const {
    out.writeString(id_);
    out.writeString(sender_);
    out.writeString(destination_);
    out.writeU8(static_cast<uint8_t>(type_));
    out.writeBytes(payload_);
    out.writeU64(lamport_);
    out.writeCounterMap(vector_);
    out.writeU8(ttl_);
    out.writeStringList(route_);
    out.writeBytes(signature_);
}

MeshMessage MeshMessage::readFrom(ByteReader& in) {
    MeshMessage msg;
    msg.id_ = in.readString();
    msg.sender_ = in.readString();
    msg.destination_ = in.readString();

    uint8_t rawType = in.readU8();
    if (rawType < static_cast<uint8_t>(MessageType::CHAT) ||
        rawType > static_cast<uint8_t>(MessageType::STATUS)) {
        throw std::runtime_error("Unknown message type: " + std::to_string(rawType));
    }
    msg.type_ = static_cast<MessageType>(rawType);

    msg.payload_ = in.readBytes();
    msg.lamport_ = in.readU64();
    msg.vector_ = in.readCounterMap();
    msg.ttl_ = in.readU8();
    msg.route_ = in.readStringList();
    msg.signature_ = in.readBytes();

    if (msg.id_.empty() || msg.sender_.empty()) {
        throw std::runtime_error("Message without id or sender");
    }
    if (msg.route_.empty() || msg.route_.front() != msg.sender_) {
        throw std::runtime_error("Message route does not start at its sender");
    }
    return msg;
}

std::vector<uint8_t> MeshMessage::encode() const {
    ByteWriter out;
    writeTo(out);
    return out.release();
}

MeshMessage MeshMessage::decode(const std::vector<uint8_t>& bytes) {
    ByteReader in(bytes);
    MeshMessage msg = readFrom(in);
    if (!in.atEnd()) {
        throw std::runtime_error("Trailing bytes after message");
    }
    return msg;
}

bool MeshMessage::operator==(const MeshMessage& other) const {
    return id_ == other.id_ && sender_ == other.sender_ &&
           destination_ == other.destination_ && type_ == other.type_ &&
           payload_ == other.payload_ && lamport_ == other.lamport_ &&
           vector_ == other.vector_ && ttl_ == other.ttl_ &&
           route_ == other.route_ && signature_ == other.signature_;
}

} // namespace tacmesh
