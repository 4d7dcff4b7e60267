#include "tacmesh/Protocol.hpp"
#include "tacmesh/Serialization.hpp"
#include "tacmesh/Types.hpp"

#include <stdexcept>

namespace tacmesh {

namespace {

    void writeChain(ByteWriter& out, const std::vector<LedgerBlock>& chain) {
        out.writeU64(chain.size());
        for (const auto& block : chain) {
            block.writeTo(out);
        }
    }

    std::vector<LedgerBlock> readChain(ByteReader& in) {
        uint64_t count = in.readU64();
        if (count > in.remaining()) {
            throw std::runtime_error("Chain block count exceeds payload size");
        }
        std::vector<LedgerBlock> chain;
        chain.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            chain.push_back(LedgerBlock::readFrom(in));
        }
        return chain;
    }

    void expectEnd(const ByteReader& in, const char* what) {
        if (!in.atEnd()) {
            throw std::runtime_error(std::string("Trailing bytes after ") + what);
        }
    }

} // namespace

std::vector<uint8_t> Hello::encode() const {
    ByteWriter out;
    out.writeString(nodeId);
    return out.release();
}

Hello Hello::decode(const std::vector<uint8_t>& bytes) {
    ByteReader in(bytes);
    Hello hello;
    hello.nodeId = in.readString();
    expectEnd(in, "HELLO");
    if (hello.nodeId.empty()) {
        throw std::runtime_error("HELLO without node id");
    }
    return hello;
}

std::vector<uint8_t> Heartbeat::encode() const {
    ByteWriter out;
    out.writeString(nodeId);
    out.writeU8(fromAuthority ? 1 : 0);
    out.writeU64(chainLength);
    return out.release();
}

Heartbeat Heartbeat::decode(const std::vector<uint8_t>& bytes) {
    ByteReader in(bytes);
    Heartbeat beat;
    beat.nodeId = in.readString();
    beat.fromAuthority = in.readU8() != 0;
    beat.chainLength = in.readU64();
    expectEnd(in, "HEARTBEAT");
    return beat;
}

std::vector<uint8_t> SyncOffer::encode() const {
    ByteWriter out;
    out.writeString(sessionId);
    out.writeString(nodeId);
    writeChain(out, chain);
    return out.release();
}

SyncOffer SyncOffer::decode(const std::vector<uint8_t>& bytes) {
    ByteReader in(bytes);
    SyncOffer offer;
    offer.sessionId = in.readString();
    offer.nodeId = in.readString();
    offer.chain = readChain(in);
    expectEnd(in, "SYNC_OFFER");
    return offer;
}

std::vector<uint8_t> SyncResult::encode() const {
    ByteWriter out;
    out.writeString(sessionId);
    out.writeU8(forkIndex ? 1 : 0);
    out.writeU64(forkIndex.value_or(0));
    writeChain(out, chain);
    out.writeU32(conflictCount);
    return out.release();
}

SyncResult SyncResult::decode(const std::vector<uint8_t>& bytes) {
    ByteReader in(bytes);
    SyncResult result;
    result.sessionId = in.readString();
    bool hasFork = in.readU8() != 0;
    uint64_t fork = in.readU64();
    if (hasFork) result.forkIndex = fork;
    result.chain = readChain(in);
    result.conflictCount = in.readU32();
    expectEnd(in, "SYNC_RESULT");
    return result;
}

std::vector<uint8_t> SyncAbort::encode() const {
    ByteWriter out;
    out.writeString(sessionId);
    out.writeString(reason);
    return out.release();
}

SyncAbort SyncAbort::decode(const std::vector<uint8_t>& bytes) {
    ByteReader in(bytes);
    SyncAbort abort;
    abort.sessionId = in.readString();
    abort.reason = in.readString();
    expectEnd(in, "SYNC_ABORT");
    return abort;
}

std::vector<uint8_t> SyncAck::encode() const {
    ByteWriter out;
    out.writeString(sessionId);
    return out.release();
}

SyncAck SyncAck::decode(const std::vector<uint8_t>& bytes) {
    ByteReader in(bytes);
    SyncAck ack;
    ack.sessionId = in.readString();
    expectEnd(in, "SYNC_ACK");
    return ack;
}

Frame makeFrame(FrameType type, std::vector<uint8_t> payload) {
    Frame frame;
    frame.type = type;
    frame.payload = std::move(payload);
    return frame;
}

} // namespace tacmesh
