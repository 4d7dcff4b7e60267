#include "tacmesh/Ledger.hpp"
#include "tacmesh/Errors.hpp"
#include "tacmesh/Serialization.hpp"
#include "tacmesh/Signer.hpp"
#include "tacmesh/Types.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace tacmesh {

Ledger::Ledger(const std::string& networkId, ClockService& clock, const Signer& signer)
    : clock(clock), signer(signer) {
    chain.push_back(LedgerBlock::genesis(networkId));
}

// ==== BASIC OPERATIONS ====

LedgerBlock Ledger::append(const std::vector<MeshMessage>& messages) {
    std::lock_guard<std::mutex> lock(mtx);
    return appendLocked(messages);
}

LedgerBlock Ledger::append(const std::vector<MeshMessage>& messages, uint64_t expectedIndex) {
    std::lock_guard<std::mutex> lock(mtx);
    if (expectedIndex != chain.size()) {
        throw IntegrityError("Index " + std::to_string(expectedIndex) +
                             " already claimed; tail is at " + std::to_string(chain.size() - 1),
                             static_cast<int64_t>(expectedIndex));
    }
    return appendLocked(messages);
}

LedgerBlock Ledger::appendLocked(const std::vector<MeshMessage>& messages) {
    const LedgerBlock& tail = chain.back();
    ClockStamp stamp = clock.stamp();
    LedgerBlock block = LedgerBlock::create(tail.index() + 1, tail.hash(), messages, stamp, signer);
    chain.push_back(block);
    indexMessages(block);
    return block;
}

void Ledger::indexMessages(const LedgerBlock& block) {
    for (const auto& msg : block.messages()) {
        knownMessages.insert(msg.id());
    }
}

AdoptionResult Ledger::adopt(const std::vector<LedgerBlock>& canonical, uint64_t preMergeLength) {
    ChainValidation check = validate(canonical, &signer);
    if (!check) {
        throw IntegrityError("Canonical chain rejected: " + check.reason, check.offendingIndex);
    }

    std::lock_guard<std::mutex> lock(mtx);

    if (canonical.front().hash() != chain.front().hash()) {
        throw DivergentLedgerError("Canonical chain starts from a different genesis block");
    }
    if (preMergeLength == 0 || preMergeLength > chain.size()) {
        throw std::invalid_argument("Pre-merge length " + std::to_string(preMergeLength) +
                                    " outside local chain of " + std::to_string(chain.size()));
    }

    std::unordered_set<std::string> canonicalIds;
    for (const auto& block : canonical) {
        for (const auto& msg : block.messages()) canonicalIds.insert(msg.id());
    }

    std::vector<LedgerBlock> preMerge(chain.begin(), chain.begin() + static_cast<std::ptrdiff_t>(preMergeLength));
    for (const auto& block : preMerge) {
        for (const auto& msg : block.messages()) {
            if (!canonicalIds.count(msg.id())) {
                throw IntegrityError("Canonical chain drops local message " + msg.id(),
                                     static_cast<int64_t>(block.index()));
            }
        }
    }

    AdoptionResult result;
    result.forkIndex = diff(preMerge, canonical);

    std::vector<LedgerBlock> next = canonical;
    for (size_t i = preMergeLength; i < chain.size(); ++i) {
        const LedgerBlock& block = chain[i];
        bool hasNewContent = false;
        for (const auto& msg : block.messages()) {
            if (!canonicalIds.count(msg.id())) hasNewContent = true;
        }
        if (!hasNewContent) continue;

        next.push_back(block.relinked(next.size(), next.back().hash()));
        for (const auto& msg : block.messages()) canonicalIds.insert(msg.id());
        ++result.rebased;
    }

    std::unordered_set<std::string> kept;
    for (const auto& block : next) kept.insert(block.hash());
    for (const auto& block : chain) {
        if (!kept.count(block.hash())) {
            LedgerBlock old = block.markedSuperseded();
            archive.push_back(old);
            result.superseded.push_back(old);
        }
    }

    chain = std::move(next);
    knownMessages.clear();
    for (const auto& block : chain) indexMessages(block);

    return result;
}

// ==== QUERIES ====

std::vector<LedgerBlock> Ledger::blocks() const {
    std::lock_guard<std::mutex> lock(mtx);
    return chain;
}

std::vector<LedgerBlock> Ledger::superseded() const {
    std::lock_guard<std::mutex> lock(mtx);
    return archive;
}

LedgerBlock Ledger::tip() const {
    std::lock_guard<std::mutex> lock(mtx);
    return chain.back();
}

LedgerBlock Ledger::genesisBlock() const {
    std::lock_guard<std::mutex> lock(mtx);
    return chain.front();
}

uint64_t Ledger::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return chain.size();
}

bool Ledger::containsMessage(const std::string& messageId) const {
    std::lock_guard<std::mutex> lock(mtx);
    return knownMessages.count(messageId) > 0;
}

std::vector<std::string> Ledger::messageIds() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> ids;
    for (const auto& block : chain) {
        for (const auto& msg : block.messages()) ids.push_back(msg.id());
    }
    return ids;
}

bool Ledger::restore(const std::vector<LedgerBlock>& stored, const std::vector<LedgerBlock>& storedArchive) {
    ChainValidation check = validate(stored, &signer);
    if (!check) {
        std::cerr << "Error: Stored chain invalid at index " << check.offendingIndex
                  << ": " << check.reason << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(mtx);
    if (chain.size() != 1) {
        std::cerr << "Error: Cannot restore into a ledger that already has blocks" << std::endl;
        return false;
    }
    if (stored.front().hash() != chain.front().hash()) {
        std::cerr << "Error: Stored chain belongs to another network" << std::endl;
        return false;
    }

    chain = stored;
    archive = storedArchive;
    knownMessages.clear();
    for (const auto& block : chain) indexMessages(block);
    return true;
}

// ==== CHAIN OPERATIONS ====

ChainValidation Ledger::validate(const std::vector<LedgerBlock>& chain, const Signer* signer) {
    ChainValidation result;
    auto fail = [&result](int64_t index, const std::string& reason) {
        result.valid = false;
        result.offendingIndex = index;
        result.reason = reason;
        return result;
    };

    if (chain.empty()) {
        return fail(-1, "empty chain");
    }

    for (size_t i = 0; i < chain.size(); ++i) {
        const LedgerBlock& block = chain[i];
        const int64_t at = static_cast<int64_t>(i);

        if (block.index() != i) {
            return fail(at, "index " + std::to_string(block.index()) + " at position " + std::to_string(i));
        }
        if (!block.hasValidHashes()) {
            return fail(at, "hash mismatch");
        }

        if (i == 0) {
            if (block.previousHash() != GENESIS_PREV_HASH || !block.messages().empty()) {
                return fail(at, "malformed genesis block");
            }
            continue;
        }

        if (block.previousHash() != chain[i - 1].hash()) {
            return fail(at, "prev_hash does not match predecessor");
        }
        if (block.messages().empty()) {
            return fail(at, "block without messages");
        }

        if (signer != nullptr) {
            auto digest = LedgerBlock::contentDigest(block.creator(), block.lamport(), block.payloadHash());
            if (!signer->verify(block.creator(), digest, block.signature())) {
                return fail(at, "invalid creator signature");
            }
            for (const auto& msg : block.messages()) {
                if (!msg.verify(*signer)) {
                    return fail(at, "invalid signature on message " + msg.id());
                }
            }
        }
    }

    return result;
}

std::optional<uint64_t> Ledger::diff(const std::vector<LedgerBlock>& chainA,
                                     const std::vector<LedgerBlock>& chainB) {
    const size_t common = std::min(chainA.size(), chainB.size());
    for (size_t i = 0; i < common; ++i) {
        if (chainA[i].hash() != chainB[i].hash()) {
            return static_cast<uint64_t>(i);
        }
    }
    return std::nullopt;
}

std::vector<uint8_t> Ledger::exportChain(const std::vector<LedgerBlock>& chain) {
    ByteWriter out;
    out.writeU32(CHAIN_MAGIC);
    out.writeU32(SERIALIZATION_VERSION);
    out.writeU64(chain.size());
    for (const auto& block : chain) {
        block.writeTo(out);
    }
    return out.release();
}

std::vector<LedgerBlock> Ledger::importChain(const std::vector<uint8_t>& data) {
    ByteReader in(data);
    if (in.readU32() != CHAIN_MAGIC) {
        throw std::runtime_error("Invalid chain magic");
    }
    uint32_t version = in.readU32();
    if (version != SERIALIZATION_VERSION) {
        throw std::runtime_error("Unsupported chain version: " + std::to_string(version));
    }
    uint64_t count = in.readU64();
    if (count > in.remaining()) {
        throw std::runtime_error("Chain block count exceeds input size");
    }

    std::vector<LedgerBlock> chain;
    chain.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        chain.push_back(LedgerBlock::readFrom(in));
    }
    if (!in.atEnd()) {
        throw std::runtime_error("Trailing bytes after chain");
    }
    return chain;
}

} // namespace tacmesh
