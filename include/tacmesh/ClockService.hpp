#ifndef TACMESH_CLOCK_SERVICE_HPP
#define TACMESH_CLOCK_SERVICE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace tacmesh {

    // node id -> counter, only for nodes that have been observed
    using VectorClock = std::map<std::string, uint64_t>;

    struct ClockStamp {
        uint64_t lamport = 0;
        VectorClock vector;
    };

    enum class Causality {
        BEFORE,      // a happened before b
        AFTER,       // b happened before a
        EQUAL,
        CONCURRENT
    };

    std::string causalityToString(Causality c);

    /**
     * System-wide total order: Lamport value first, lower node id on ties.
     */
    struct LogicalTimestamp {
        uint64_t lamport = 0;
        std::string nodeId;

        LogicalTimestamp() = default;
        LogicalTimestamp(uint64_t l, std::string n) : lamport(l), nodeId(std::move(n)) {}

        bool operator<(const LogicalTimestamp& other) const {
            if (lamport != other.lamport) return lamport < other.lamport;
            return nodeId < other.nodeId;
        }
        bool operator==(const LogicalTimestamp& other) const {
            return lamport == other.lamport && nodeId == other.nodeId;
        }
        bool operator!=(const LogicalTimestamp& other) const { return !(*this == other); }
    };

    /**
     * Lamport scalar + vector clock of a single node. Thread-safe; one instance
     * per node, never shared.
     */
    class ClockService {
    public:
        explicit ClockService(std::string ownerId);

        /**
         * Increments the owner's Lamport counter and its own vector entry and
         * returns a snapshot of both.
         */
        ClockStamp stamp();

        /**
         * Folds an incoming stamp into the owner's clock (receive event).
         * Returns the resulting snapshot.
         */
        ClockStamp merge(const VectorClock& incomingVector, uint64_t incomingLamport);

        /**
         * Pure merge rule: lamport' = max(local, incoming) + 1 and
         * vector'[k] = max(local[k], incoming[k]) for every k in either input.
         */
        static std::pair<VectorClock, uint64_t> merge(const VectorClock& localVector,
                                                      uint64_t localLamport,
                                                      const VectorClock& incomingVector,
                                                      uint64_t incomingLamport);

        static Causality compare(const VectorClock& a, const VectorClock& b);

        ClockStamp snapshot() const;
        uint64_t lamport() const;
        const std::string& owner() const { return ownerId; }

    private:
        std::string ownerId;
        mutable std::mutex mtx;
        uint64_t lamportCounter = 0;
        VectorClock vectorClock;
    };

} // namespace tacmesh

#endif // TACMESH_CLOCK_SERVICE_HPP
