#include "tacmesh/ClockService.hpp"

#include <algorithm>

namespace tacmesh {

std::string causalityToString(Causality c) {
    switch (c) {
        case Causality::BEFORE:     return "BEFORE";
        case Causality::AFTER:      return "AFTER";
        case Causality::EQUAL:      return "EQUAL";
        case Causality::CONCURRENT: return "CONCURRENT";
    }
    return "UNKNOWN";
}

ClockService::ClockService(std::string ownerId) : ownerId(std::move(ownerId)) {}

ClockStamp ClockService::stamp() {
    std::lock_guard<std::mutex> lk(mtx);
    ++lamportCounter;
    ++vectorClock[ownerId];
    return ClockStamp{lamportCounter, vectorClock};
}

ClockStamp ClockService::merge(const VectorClock& incomingVector, uint64_t incomingLamport) {
    std::lock_guard<std::mutex> lk(mtx);
    auto merged = merge(vectorClock, lamportCounter, incomingVector, incomingLamport);
    vectorClock = std::move(merged.first);
    lamportCounter = merged.second;
    // the receive itself is an event of the owner
    ++vectorClock[ownerId];
    return ClockStamp{lamportCounter, vectorClock};
}

std::pair<VectorClock, uint64_t> ClockService::merge(const VectorClock& localVector,
                                                     uint64_t localLamport,
                                                     const VectorClock& incomingVector,
                                                     uint64_t incomingLamport) {
    VectorClock result = localVector;
    for (const auto& kv : incomingVector) {
        auto it = result.find(kv.first);
        if (it == result.end()) {
            result.emplace(kv.first, kv.second);
        } else {
            it->second = std::max(it->second, kv.second);
        }
    }
    return {result, std::max(localLamport, incomingLamport) + 1};
}

Causality ClockService::compare(const VectorClock& a, const VectorClock& b) {
    bool aBehind = false; // some a[k] < b[k]
    bool bBehind = false; // some b[k] < a[k]

    auto valueOf = [](const VectorClock& v, const std::string& key) -> uint64_t {
        auto it = v.find(key);
        return it == v.end() ? 0 : it->second;
    };

    for (const auto& kv : a) {
        uint64_t other = valueOf(b, kv.first);
        if (kv.second < other) aBehind = true;
        if (kv.second > other) bBehind = true;
    }
    for (const auto& kv : b) {
        uint64_t mine = valueOf(a, kv.first);
        if (mine < kv.second) aBehind = true;
        if (mine > kv.second) bBehind = true;
    }

    if (aBehind && bBehind) return Causality::CONCURRENT;
    if (aBehind) return Causality::BEFORE;
    if (bBehind) return Causality::AFTER;
    return Causality::EQUAL;
}

ClockStamp ClockService::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx);
    return ClockStamp{lamportCounter, vectorClock};
}

uint64_t ClockService::lamport() const {
    std::lock_guard<std::mutex> lk(mtx);
    return lamportCounter;
}

} // namespace tacmesh
