#ifndef TACMESH_NODE_CONFIG_HPP
#define TACMESH_NODE_CONFIG_HPP

#include "tacmesh/Types.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace tacmesh {

    struct PeerAddress {
        std::string host;
        uint16_t port = 0;
        std::string nodeId;
    };

    struct NodeConfig {
        std::string nodeId;
        std::string networkId = "tacmesh";
        std::string authorityId;
        uint16_t listenPort = DEFAULT_LISTEN_PORT;
        std::vector<PeerAddress> peers;
        std::vector<std::pair<std::string, std::string>> keys; // nodeId, base64 public key
        std::string keyFile;
        std::string dataDir = "tacmesh_data";

        Millis heartbeatInterval = DEFAULT_HEARTBEAT_INTERVAL;
        uint32_t heartbeatMissThreshold = DEFAULT_HEARTBEAT_MISS_THRESHOLD;
        Millis peerTimeout = DEFAULT_PEER_TIMEOUT;
        size_t minPeers = DEFAULT_MIN_PEERS;
        double degradedQuality = DEFAULT_DEGRADED_QUALITY;
        uint8_t initialTtl = DEFAULT_TTL;
        Millis dedupRetention = DEFAULT_DEDUP_RETENTION;
        Millis retryInitial = DEFAULT_RETRY_INITIAL;
        Millis retryMax = DEFAULT_RETRY_MAX;
        Millis queueExpiry = DEFAULT_QUEUE_EXPIRY;
        Millis syncTimeout = DEFAULT_SYNC_TIMEOUT;
        Millis resyncRetry = DEFAULT_RESYNC_RETRY;

        bool isAuthority() const { return !authorityId.empty() && nodeId == authorityId; }

        // Authority liveness window: interval * miss threshold
        Millis authorityTimeout() const { return heartbeatInterval * heartbeatMissThreshold; }

        // Returns false and fills error when a field is out of range
        bool validate(std::string& error) const;
    };

    /**
     * Reads "key = value" lines; '#' starts a comment. peer and key may repeat.
     * Unknown keys or malformed values print an error and return false.
     */
    bool parseConfig(std::istream& in, NodeConfig& config);
    bool loadConfigFile(const std::string& path, NodeConfig& config);

} // namespace tacmesh

#endif // TACMESH_NODE_CONFIG_HPP
