#include "tacmesh/NodeEvent.hpp"

#include <sstream>

namespace tacmesh {

std::string networkStateToString(NetworkState state) {
    switch (state) {
        case NetworkState::CENTRALIZED:  return "CENTRALIZED";
        case NetworkState::P2P_FALLBACK: return "P2P_FALLBACK";
        case NetworkState::DEGRADED:     return "DEGRADED";
        case NetworkState::ISOLATED:     return "ISOLATED";
    }
    return "UNKNOWN";
}

std::string eventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::STATE_CHANGED:          return "STATE_CHANGED";
        case EventKind::LEDGER_APPENDED:        return "LEDGER_APPENDED";
        case EventKind::MESSAGE_RECEIVED:       return "MESSAGE_RECEIVED";
        case EventKind::DELIVERY_OUTCOME:       return "DELIVERY_OUTCOME";
        case EventKind::PEER_LOST:              return "PEER_LOST";
        case EventKind::PEER_FOUND:             return "PEER_FOUND";
        case EventKind::CONFLICT_REPORT:        return "CONFLICT_REPORT";
        case EventKind::RECONCILIATION_ABORTED: return "RECONCILIATION_ABORTED";
        case EventKind::INTEGRITY_ALERT:        return "INTEGRITY_ALERT";
        case EventKind::DIVERGENT_LEDGER:       return "DIVERGENT_LEDGER";
    }
    return "UNKNOWN";
}

std::string NodeEvent::toString() const {
    std::stringstream ss;
    ss << "[" << nodeId << " L" << lamport << " " << networkStateToString(state) << "] "
       << eventKindToString(kind);
    if (!messageId.empty()) ss << " msg=" << messageId;
    if (!detail.empty()) ss << " " << detail;
    return ss.str();
}

} // namespace tacmesh
