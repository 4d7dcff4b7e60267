#ifndef TACMESH_LEDGER_HPP
#define TACMESH_LEDGER_HPP

#include "tacmesh/ClockService.hpp"
#include "tacmesh/LedgerBlock.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace tacmesh {

    class Signer;

    struct ChainValidation {
        bool valid = true;
        int64_t offendingIndex = -1;
        std::string reason;

        explicit operator bool() const { return valid; }
    };

    struct AdoptionResult {
        std::optional<uint64_t> forkIndex;
        std::vector<LedgerBlock> superseded;
        size_t rebased = 0;
    };

    /**
     * Append-only hash-chained ledger of one node. The only place that hashes
     * and links blocks. Appends are serialized: two blocks can never claim the
     * same index.
     */
    class Ledger {
    public:
        Ledger(const std::string& networkId, ClockService& clock, const Signer& signer);

        // ==== BASIC OPERATIONS ====

        /**
         * Appends a block carrying messages at the current tail. The block is
         * stamped with the owner's clock and signed by the owner.
         */
        LedgerBlock append(const std::vector<MeshMessage>& messages);

        /**
         * Same as append(), but only if the new block would land at
         * expectedIndex. Throws IntegrityError when another writer got there
         * first.
         */
        LedgerBlock append(const std::vector<MeshMessage>& messages, uint64_t expectedIndex);

        /**
         * Replaces the chain by a canonical chain produced by reconciliation.
         * preMergeLength is the length of the local chain that was handed to the
         * merge; blocks appended since are rebased on top of the canonical chain.
         * Throws IntegrityError or DivergentLedgerError; on throw nothing changes.
         */
        AdoptionResult adopt(const std::vector<LedgerBlock>& canonical, uint64_t preMergeLength);

        // ==== QUERIES ====
        std::vector<LedgerBlock> blocks() const;
        std::vector<LedgerBlock> superseded() const;
        LedgerBlock tip() const;
        LedgerBlock genesisBlock() const;
        uint64_t size() const;
        bool containsMessage(const std::string& messageId) const;
        std::vector<std::string> messageIds() const;

        // Replaces an empty (genesis-only) ledger with a stored chain
        bool restore(const std::vector<LedgerBlock>& chain, const std::vector<LedgerBlock>& archive);

        // ==== CHAIN OPERATIONS ====
        static ChainValidation validate(const std::vector<LedgerBlock>& chain,
                                        const Signer* signer = nullptr);

        /**
         * Lowest index at which the chains disagree on hash; empty when one
         * chain is a prefix of the other.
         */
        static std::optional<uint64_t> diff(const std::vector<LedgerBlock>& chainA,
                                            const std::vector<LedgerBlock>& chainB);

        static std::vector<uint8_t> exportChain(const std::vector<LedgerBlock>& chain);
        static std::vector<LedgerBlock> importChain(const std::vector<uint8_t>& data);

    private:
        LedgerBlock appendLocked(const std::vector<MeshMessage>& messages);
        void indexMessages(const LedgerBlock& block);

        ClockService& clock;
        const Signer& signer;

        mutable std::mutex mtx;
        std::vector<LedgerBlock> chain;
        std::vector<LedgerBlock> archive;
        std::unordered_set<std::string> knownMessages;
    };

} // namespace tacmesh

#endif // TACMESH_LEDGER_HPP
