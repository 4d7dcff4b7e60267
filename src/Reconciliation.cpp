#include "tacmesh/Reconciliation.hpp"
#include "tacmesh/Errors.hpp"
#include "tacmesh/Ledger.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <tuple>
#include <unordered_set>

namespace tacmesh {

namespace {

    struct SuffixBlock {
        LedgerBlock block;
        ConflictSide side;
    };

    using ContentKey = std::tuple<uint64_t, std::string, std::string>;

    ContentKey contentKey(const LedgerBlock& block) {
        return ContentKey(block.lamport(), block.creator(), block.payloadHash());
    }

    void checkChain(const std::vector<LedgerBlock>& chain, const Signer* verifier, const char* side) {
        ChainValidation check = Ledger::validate(chain, verifier);
        if (!check) {
            throw IntegrityError(std::string(side) + " chain invalid at index " +
                                 std::to_string(check.offendingIndex) + ": " + check.reason,
                                 check.offendingIndex);
        }
    }

    bool allPresent(const LedgerBlock& block, const std::unordered_set<std::string>& ids) {
        for (const auto& msg : block.messages()) {
            if (!ids.count(msg.id())) return false;
        }
        return true;
    }

} // namespace

std::string conflictSideToString(ConflictSide side) {
    return side == ConflictSide::LOCAL ? "LOCAL" : "REMOTE";
}

std::string SyncConflict::toString() const {
    std::stringstream ss;
    ss << conflictSideToString(side) << " block " << supersededHash.substr(0, 16)
       << " (" << supersededCreator << "@" << supersededLamport << ") lost index "
       << contestedIndex;
    if (canonicalHash) {
        ss << " to " << canonicalHash->substr(0, 16) << " (" << winnerCreator << ")";
    }
    ss << " rule=" << rule << " reason=" << reason
       << " retained=" << (contentRetained ? "yes" : "no")
       << " concurrent=" << (concurrent ? "yes" : "no");
    return ss.str();
}

ReconciliationService::ReconciliationService(const Signer* verifier) : verifier(verifier) {}

ReconciliationResult ReconciliationService::reconcile(const std::vector<LedgerBlock>& local,
                                                      const std::vector<LedgerBlock>& remote) const {
    if (local.empty() || remote.empty()) {
        throw DivergentLedgerError("Cannot reconcile against an empty chain");
    }
    checkChain(local, verifier, "Local");
    checkChain(remote, verifier, "Remote");

    if (local.front().hash() != remote.front().hash()) {
        throw DivergentLedgerError("Ledgers share no genesis block (" + local.front().creator() +
                                   " vs " + remote.front().creator() + ")");
    }

    ReconciliationResult result;
    result.forkIndex = Ledger::diff(local, remote);

    if (!result.forkIndex) {
        result.canonical = remote.size() > local.size() ? remote : local;
        return result;
    }

    const uint64_t fork = *result.forkIndex;
    result.canonical.assign(local.begin(), local.begin() + static_cast<std::ptrdiff_t>(fork));

    std::unordered_set<std::string> ids;
    for (const auto& block : result.canonical) {
        for (const auto& msg : block.messages()) ids.insert(msg.id());
    }

    std::vector<SuffixBlock> suffix;
    for (size_t i = fork; i < local.size(); ++i) suffix.push_back({local[i], ConflictSide::LOCAL});
    for (size_t i = fork; i < remote.size(); ++i) suffix.push_back({remote[i], ConflictSide::REMOTE});

    // ==== TOTAL ORDER ====
    std::vector<LedgerBlock> ordered;
    std::set<ContentKey> seenContent;
    for (const auto& item : suffix) {
        if (seenContent.insert(contentKey(item.block)).second) {
            ordered.push_back(item.block);
        }
    }
    std::sort(ordered.begin(), ordered.end(), [](const LedgerBlock& a, const LedgerBlock& b) {
        return contentKey(a) < contentKey(b);
    });

    for (const auto& block : ordered) {
        if (allPresent(block, ids)) continue;
        result.canonical.push_back(block.relinked(result.canonical.size(), result.canonical.back().hash()));
        for (const auto& msg : block.messages()) ids.insert(msg.id());
    }

    // ==== CONFLICTS ====
    std::unordered_set<std::string> canonicalHashes;
    for (const auto& block : result.canonical) canonicalHashes.insert(block.hash());

    for (const auto& item : suffix) {
        const LedgerBlock& block = item.block;
        if (canonicalHashes.count(block.hash())) continue;

        SyncConflict conflict;
        conflict.side = item.side;
        conflict.contestedIndex = block.index();
        conflict.supersededHash = block.hash();
        conflict.supersededCreator = block.creator();
        conflict.supersededLamport = block.lamport();
        conflict.contentRetained = allPresent(block, ids);

        if (block.index() < result.canonical.size()) {
            const LedgerBlock& winner = result.canonical[block.index()];
            conflict.canonicalHash = winner.hash();
            conflict.winnerCreator = winner.creator();
            conflict.concurrent = ClockService::compare(block.vectorClock(), winner.vectorClock()) ==
                                  Causality::CONCURRENT;
        }
        result.conflicts.push_back(conflict);
    }

    return result;
}

} // namespace tacmesh
