#include "tacmesh/LedgerBlock.hpp"
#include "tacmesh/CryptoBase.hpp"
#include "tacmesh/Serialization.hpp"
#include "tacmesh/Signer.hpp"
#include "tacmesh/Types.hpp"

#include <sstream>
#include <stdexcept>

namespace tacmesh {

LedgerBlock LedgerBlock::genesis(const std::string& networkId) {
    if (networkId.empty()) {
        throw std::invalid_argument("Genesis block needs a network id");
    }
    LedgerBlock block;
    block.index_ = 0;
    block.previousHash_ = GENESIS_PREV_HASH;
    block.payloadHash_ = computePayloadHash({});
    block.creator_ = networkId;
    block.lamport_ = 0;
    block.hash_ = block.computeHash();
    return block;
}

LedgerBlock LedgerBlock::create(uint64_t index,
                                const std::string& previousHash,
                                std::vector<MeshMessage> messages,
                                const ClockStamp& stamp,
                                const Signer& signer) {
    if (index == 0) {
        throw std::invalid_argument("Index 0 is reserved for the genesis block");
    }
    if (!CryptoBase::isHexDigest(previousHash)) {
        throw std::invalid_argument("Invalid previous hash format");
    }
    if (messages.empty()) {
        throw std::invalid_argument("Block must carry at least one message");
    }
    if (messages.size() > MAX_MESSAGES_PER_BLOCK) {
        throw std::invalid_argument("Block exceeds maximum message count");
    }

    LedgerBlock block;
    block.index_ = index;
    block.previousHash_ = previousHash;
    block.messages_ = std::move(messages);
    block.payloadHash_ = computePayloadHash(block.messages_);
    block.creator_ = signer.signerId();
    block.lamport_ = stamp.lamport;
    block.vector_ = stamp.vector;
    block.signature_ = signer.sign(contentDigest(block.creator_, block.lamport_, block.payloadHash_));
    block.hash_ = block.computeHash();
    return block;
}

LedgerBlock LedgerBlock::relinked(uint64_t newIndex, const std::string& newPreviousHash) const {
    if (isGenesis()) {
        throw std::logic_error("The genesis block cannot be relinked");
    }
    LedgerBlock copy = *this;
    copy.index_ = newIndex;
    copy.previousHash_ = newPreviousHash;
    copy.superseded_ = false;
    copy.hash_ = copy.computeHash();
    return copy;
}

LedgerBlock LedgerBlock::markedSuperseded() const {
    LedgerBlock copy = *this;
    copy.superseded_ = true;
    return copy;
}

std::string LedgerBlock::computePayloadHash(const std::vector<MeshMessage>& messages) {
    ByteWriter out;
    out.writeU32(static_cast<uint32_t>(messages.size()));
    for (const auto& msg : messages) {
        msg.writeTo(out);
    }
    return CryptoBase::sha256(out.data());
}

std::vector<uint8_t> LedgerBlock::contentDigest(const std::string& creator,
                                                uint64_t lamport,
                                                const std::string& payloadHash) {
    ByteWriter out;
    out.writeString(creator);
    out.writeU64(lamport);
    out.writeString(payloadHash);
    return CryptoBase::sha256Bytes(out.data());
}

std::vector<uint8_t> LedgerBlock::headerBytes() const {
    ByteWriter out;
    out.writeU64(index_);
    out.writeString(previousHash_);
    out.writeString(payloadHash_);
    out.writeString(creator_);
    out.writeU64(lamport_);
    out.writeCounterMap(vector_);
    out.writeBytes(signature_);
    return out.release();
}

std::string LedgerBlock::computeHash() const {
    return CryptoBase::sha256(headerBytes());
}

bool LedgerBlock::hasValidHashes() const {
    return computePayloadHash(messages_) == payloadHash_ && computeHash() == hash_;
}

bool LedgerBlock::containsMessage(const std::string& messageId) const {
    for (const auto& msg : messages_) {
        if (msg.id() == messageId) return true;
    }
    return false;
}

std::string LedgerBlock::toString() const {
    std::stringstream ss;
    ss << "Block #" << index_
       << " hash=" << hash_.substr(0, 16)
       << " prev=" << previousHash_.substr(0, 16)
       << " payload=" << payloadHash_.substr(0, 16)
       << " creator=" << creator_
       << " lamport=" << lamport_
       << " messages=" << messages_.size();
    if (superseded_) ss << " [superseded]";
    return ss.str();
}

void LedgerBlock::writeTo(ByteWriter& out) const {
    out.writeU32(BLOCK_MAGIC);
    out.writeU64(index_);
    out.writeString(previousHash_);
    out.writeString(payloadHash_);
    out.writeString(creator_);
    out.writeU64(lamport_);
    out.writeCounterMap(vector_);
    out.writeBytes(signature_);
    out.writeU32(static_cast<uint32_t>(messages_.size()));
    for (const auto& msg : messages_) {
        msg.writeTo(out);
    }
    out.writeString(hash_);
    out.writeU8(superseded_ ? 1 : 0);
}

LedgerBlock LedgerBlock::readFrom(ByteReader& in) {
    if (in.readU32() != BLOCK_MAGIC) {
        throw std::runtime_error("Invalid block magic");
    }
    LedgerBlock block;
    block.index_ = in.readU64();
    block.previousHash_ = in.readString();
    block.payloadHash_ = in.readString();
    block.creator_ = in.readString();
    block.lamport_ = in.readU64();
    block.vector_ = in.readCounterMap();
    block.signature_ = in.readBytes();

    uint32_t count = in.readU32();
    if (count > MAX_MESSAGES_PER_BLOCK) {
        throw std::runtime_error("Block message count too large: " + std::to_string(count));
    }
    block.messages_.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        block.messages_.push_back(MeshMessage::readFrom(in));
    }
    block.hash_ = in.readString();
    block.superseded_ = in.readU8() != 0;
    return block;
}

} // namespace tacmesh
