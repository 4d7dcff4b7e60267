#ifndef TACMESH_PROTOCOL_HPP
#define TACMESH_PROTOCOL_HPP

#include "tacmesh/Frame.hpp"
#include "tacmesh/LedgerBlock.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tacmesh {

    // Payloads carried inside frames. decode() throws std::runtime_error on
    // malformed input.

    struct Hello {
        std::string nodeId;

        std::vector<uint8_t> encode() const;
        static Hello decode(const std::vector<uint8_t>& bytes);
    };

    struct Heartbeat {
        std::string nodeId;
        bool fromAuthority = false;
        uint64_t chainLength = 0;

        std::vector<uint8_t> encode() const;
        static Heartbeat decode(const std::vector<uint8_t>& bytes);
    };

    // Initiator -> responder: "here is my chain, merge it with yours"
    struct SyncOffer {
        std::string sessionId;
        std::string nodeId;
        std::vector<LedgerBlock> chain;

        std::vector<uint8_t> encode() const;
        static SyncOffer decode(const std::vector<uint8_t>& bytes);
    };

    // Responder -> initiator: the canonical chain both sides adopt
    struct SyncResult {
        std::string sessionId;
        std::optional<uint64_t> forkIndex;
        std::vector<LedgerBlock> chain;
        uint32_t conflictCount = 0;

        std::vector<uint8_t> encode() const;
        static SyncResult decode(const std::vector<uint8_t>& bytes);
    };

    struct SyncAbort {
        std::string sessionId;
        std::string reason;

        std::vector<uint8_t> encode() const;
        static SyncAbort decode(const std::vector<uint8_t>& bytes);
    };

    // Initiator -> responder: result adopted, the responder may adopt too
    struct SyncAck {
        std::string sessionId;

        std::vector<uint8_t> encode() const;
        static SyncAck decode(const std::vector<uint8_t>& bytes);
    };

    Frame makeFrame(FrameType type, std::vector<uint8_t> payload);

} // namespace tacmesh

#endif // TACMESH_PROTOCOL_HPP
