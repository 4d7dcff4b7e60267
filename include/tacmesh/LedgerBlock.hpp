#ifndef TACMESH_LEDGER_BLOCK_HPP
#define TACMESH_LEDGER_BLOCK_HPP

#include "tacmesh/ClockService.hpp"
#include "tacmesh/MeshMessage.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tacmesh {

    class Signer;
    class ByteWriter;
    class ByteReader;

    /**
     * One entry of a hash-chained ledger. Immutable once built.
     *
     * The creator's signature covers the content digest (creator, lamport,
     * payload hash) and not the position, so a block can be relinked at a new
     * index during reconciliation without being re-signed. The block hash covers
     * everything except the superseded flag.
     */
    class LedgerBlock {
    public:
        LedgerBlock() = default;

        // Network-wide genesis block for networkId
        static LedgerBlock genesis(const std::string& networkId);

        static LedgerBlock create(uint64_t index,
                                  const std::string& previousHash,
                                  std::vector<MeshMessage> messages,
                                  const ClockStamp& stamp,
                                  const Signer& signer);

        // Same content (creator, clock, messages, signature) at a new position
        LedgerBlock relinked(uint64_t newIndex, const std::string& newPreviousHash) const;
        LedgerBlock markedSuperseded() const;

        static std::string computePayloadHash(const std::vector<MeshMessage>& messages);
        static std::vector<uint8_t> contentDigest(const std::string& creator,
                                                  uint64_t lamport,
                                                  const std::string& payloadHash);
        std::string computeHash() const;

        // Recomputed payload hash and block hash both match
        bool hasValidHashes() const;
        bool isGenesis() const { return index_ == 0; }
        bool containsMessage(const std::string& messageId) const;
        LogicalTimestamp orderKey() const { return LogicalTimestamp(lamport_, creator_); }

        uint64_t index() const { return index_; }
        const std::string& previousHash() const { return previousHash_; }
        const std::string& payloadHash() const { return payloadHash_; }
        const std::string& creator() const { return creator_; }
        uint64_t lamport() const { return lamport_; }
        const VectorClock& vectorClock() const { return vector_; }
        const std::vector<uint8_t>& signature() const { return signature_; }
        const std::vector<MeshMessage>& messages() const { return messages_; }
        const std::string& hash() const { return hash_; }
        bool superseded() const { return superseded_; }

        std::string toString() const;

        void writeTo(ByteWriter& out) const;
        static LedgerBlock readFrom(ByteReader& in);

    private:
        std::vector<uint8_t> headerBytes() const;

        uint64_t index_ = 0;
        std::string previousHash_;
        std::string payloadHash_;
        std::string creator_;
        uint64_t lamport_ = 0;
        VectorClock vector_;
        std::vector<uint8_t> signature_;
        std::vector<MeshMessage> messages_;
        std::string hash_;
        bool superseded_ = false;
    };

} // namespace tacmesh

#endif // TACMESH_LEDGER_BLOCK_HPP
