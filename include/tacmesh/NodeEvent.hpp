#ifndef TACMESH_NODE_EVENT_HPP
#define TACMESH_NODE_EVENT_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace tacmesh {

    enum class NetworkState {
        CENTRALIZED,    // authority reachable
        P2P_FALLBACK,   // authority lost, enough peers
        DEGRADED,       // authority lost, too few or poor peers
        ISOLATED        // no authority, no peer
    };

    std::string networkStateToString(NetworkState state);

    enum class EventKind {
        STATE_CHANGED,
        LEDGER_APPENDED,
        MESSAGE_RECEIVED,
        DELIVERY_OUTCOME,
        PEER_LOST,
        PEER_FOUND,
        CONFLICT_REPORT,
        RECONCILIATION_ABORTED,
        INTEGRITY_ALERT,
        DIVERGENT_LEDGER
    };

    std::string eventKindToString(EventKind kind);

    // Read-only record of something that happened on a node
    struct NodeEvent {
        EventKind kind = EventKind::STATE_CHANGED;
        std::string nodeId;
        std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
        uint64_t lamport = 0;
        NetworkState state = NetworkState::CENTRALIZED;
        std::string messageId;
        std::string detail;

        std::string toString() const;
    };

    using EventHandler = std::function<void(const NodeEvent&)>;

} // namespace tacmesh

#endif // TACMESH_NODE_EVENT_HPP
