#include "tacmesh/NodeConfig.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace tacmesh {

namespace {

    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t begin = s.find_first_not_of(ws);
        if (begin == std::string::npos) return "";
        size_t end = s.find_last_not_of(ws);
        return s.substr(begin, end - begin + 1);
    }

    bool parseUnsigned(const std::string& value, uint64_t maxValue, uint64_t& out) {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        try {
            unsigned long long parsed = std::stoull(value);
            if (parsed > maxValue) return false;
            out = parsed;
            return true;
        } catch (const std::out_of_range&) {
            return false;
        }
    }

    bool parseMillis(const std::string& value, Millis& out) {
        uint64_t raw = 0;
        if (!parseUnsigned(value, static_cast<uint64_t>(std::numeric_limits<int64_t>::max()), raw) || raw == 0) {
            return false;
        }
        out = Millis(static_cast<int64_t>(raw));
        return true;
    }

    // host:port:nodeId
    bool parsePeer(const std::string& value, PeerAddress& peer) {
        size_t p1 = value.find(':');
        size_t p2 = p1 == std::string::npos ? std::string::npos : value.find(':', p1 + 1);
        if (p1 == 0 || p2 == std::string::npos || p2 + 1 >= value.size()) return false;

        uint64_t port = 0;
        if (!parseUnsigned(value.substr(p1 + 1, p2 - p1 - 1), 65535, port) || port == 0) return false;

        peer.host = value.substr(0, p1);
        peer.port = static_cast<uint16_t>(port);
        peer.nodeId = value.substr(p2 + 1);
        return true;
    }

    bool applySetting(const std::string& key, const std::string& value, NodeConfig& config) {
        uint64_t number = 0;

        if (key == "node_id")      { config.nodeId = value; return !value.empty(); }
        if (key == "network_id")   { config.networkId = value; return !value.empty(); }
        if (key == "authority_id") { config.authorityId = value; return !value.empty(); }
        if (key == "key_file")     { config.keyFile = value; return !value.empty(); }
        if (key == "data_dir")     { config.dataDir = value; return !value.empty(); }

        if (key == "listen_port") {
            if (!parseUnsigned(value, 65535, number) || number == 0) return false;
            config.listenPort = static_cast<uint16_t>(number);
            return true;
        }
        if (key == "peer") {
            PeerAddress peer;
            if (!parsePeer(value, peer)) return false;
            config.peers.push_back(peer);
            return true;
        }
        if (key == "key") {
            size_t sep = value.find(':');
            if (sep == 0 || sep == std::string::npos || sep + 1 >= value.size()) return false;
            config.keys.emplace_back(value.substr(0, sep), value.substr(sep + 1));
            return true;
        }
        if (key == "heartbeat_miss_threshold") {
            if (!parseUnsigned(value, 1000, number) || number == 0) return false;
            config.heartbeatMissThreshold = static_cast<uint32_t>(number);
            return true;
        }
        if (key == "min_peers") {
            if (!parseUnsigned(value, 1000, number)) return false;
            config.minPeers = static_cast<size_t>(number);
            return true;
        }
        if (key == "initial_ttl") {
            if (!parseUnsigned(value, 255, number) || number == 0) return false;
            config.initialTtl = static_cast<uint8_t>(number);
            return true;
        }
        if (key == "degraded_quality") {
            try {
                size_t used = 0;
                double q = std::stod(value, &used);
                if (used != value.size() || q < 0.0 || q > 1.0) return false;
                config.degradedQuality = q;
                return true;
            } catch (const std::exception&) {
                return false;
            }
        }

        if (key == "heartbeat_interval_ms") return parseMillis(value, config.heartbeatInterval);
        if (key == "peer_timeout_ms")       return parseMillis(value, config.peerTimeout);
        if (key == "dedup_retention_ms")    return parseMillis(value, config.dedupRetention);
        if (key == "retry_initial_ms")      return parseMillis(value, config.retryInitial);
        if (key == "retry_max_ms")          return parseMillis(value, config.retryMax);
        if (key == "queue_expiry_ms")       return parseMillis(value, config.queueExpiry);
        if (key == "sync_timeout_ms")       return parseMillis(value, config.syncTimeout);
        if (key == "resync_retry_ms")       return parseMillis(value, config.resyncRetry);

        throw std::invalid_argument("unknown key");
    }

} // namespace

bool NodeConfig::validate(std::string& error) const {
    if (nodeId.empty()) {
        error = "node_id is required";
        return false;
    }
    if (authorityId.empty()) {
        error = "authority_id is required";
        return false;
    }
    if (retryMax < retryInitial) {
        error = "retry_max_ms must not be below retry_initial_ms";
        return false;
    }
    for (const auto& peer : peers) {
        if (peer.nodeId == nodeId) {
            error = "node lists itself as a peer";
            return false;
        }
    }
    return true;
}

bool parseConfig(std::istream& in, NodeConfig& config) {
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "Error: Config line " << lineNumber << " is not key = value" << std::endl;
            return false;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        try {
            if (!applySetting(key, value, config)) {
                std::cerr << "Error: Invalid value for '" << key << "' on config line "
                          << lineNumber << ": " << value << std::endl;
                return false;
            }
        } catch (const std::invalid_argument&) {
            std::cerr << "Error: Unknown config key '" << key << "' on line " << lineNumber << std::endl;
            return false;
        }
    }

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Error: " << error << std::endl;
        return false;
    }
    return true;
}

bool loadConfigFile(const std::string& path, NodeConfig& config) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Error: Cannot open config file: " << path << std::endl;
        return false;
    }
    return parseConfig(in, config);
}

} // namespace tacmesh
