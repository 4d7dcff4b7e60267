#ifndef TACMESH_RECONCILIATION_HPP
#define TACMESH_RECONCILIATION_HPP

#include "tacmesh/LedgerBlock.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tacmesh {

    class Signer;

    enum class ConflictSide {
        LOCAL,
        REMOTE
    };

    std::string conflictSideToString(ConflictSide side);

    inline constexpr const char* CONFLICT_RULE = "lamport-then-node-id";
    inline constexpr const char* CONFLICT_REASON = "superseded-by-total-order";

    // A fork block that did not survive at its position in the canonical chain
    struct SyncConflict {
        ConflictSide side = ConflictSide::LOCAL;
        uint64_t contestedIndex = 0;
        std::string supersededHash;
        std::string supersededCreator;
        uint64_t supersededLamport = 0;
        std::optional<std::string> canonicalHash;   // block now holding the index
        std::string winnerCreator;
        std::string rule = CONFLICT_RULE;
        std::string reason = CONFLICT_REASON;
        bool contentRetained = false;   // every message survives elsewhere
        bool concurrent = false;        // vector clocks say neither came first

        std::string toString() const;
    };

    struct ReconciliationResult {
        std::vector<LedgerBlock> canonical;
        std::optional<uint64_t> forkIndex;
        std::vector<SyncConflict> conflicts;
    };

    /**
     * Deterministic merge of two ledgers sharing a genesis block.
     *
     * Blocks before the fork are kept. Every block from the fork on, from
     * either side, is re-appended in (lamport, creator, payload hash) order;
     * blocks whose messages are all already present are dropped. The result
     * does not depend on which side calls it.
     */
    class ReconciliationService {
    public:
        // verifier is optional; when set, block and message signatures are checked
        explicit ReconciliationService(const Signer* verifier = nullptr);

        /**
         * Throws IntegrityError when either chain fails validation and
         * DivergentLedgerError when they do not share a genesis block.
         */
        ReconciliationResult reconcile(const std::vector<LedgerBlock>& local,
                                       const std::vector<LedgerBlock>& remote) const;

    private:
        const Signer* verifier;
    };

} // namespace tacmesh

#endif // TACMESH_RECONCILIATION_HPP
