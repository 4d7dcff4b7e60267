#include "tacmesh/PeerTable.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace tacmesh {

    PeerTable::PeerTable(Millis peerTimeout) : peerTimeout(peerTimeout) {}

    double PeerTable::blend(double quality, double sample) {
        return (1.0 - LINK_QUALITY_ALPHA) * quality + LINK_QUALITY_ALPHA * sample;
    }

    void PeerTable::addKnownPeer(const PeerLink& link) {
        if (link.nodeId.empty()) {
            throw std::invalid_argument("Peer without node id");
        }
        std::lock_guard<std::mutex> lk(mtx);
        auto it = peers.find(link.nodeId);
        if (it == peers.end()) {
            peers[link.nodeId] = link;
            return;
        }
        if (link.isDialable()) {
            it->second.host = link.host;
            it->second.port = link.port;
        }
    }

    bool PeerTable::removePeer(const std::string& nodeId) {
        std::lock_guard<std::mutex> lk(mtx);
        return peers.erase(nodeId) > 0;
    }

    LinkChange PeerTable::markSeen(const std::string& nodeId, SteadyTime now) {
        std::lock_guard<std::mutex> lk(mtx);
        PeerLink& link = peers[nodeId];
        link.nodeId = nodeId;
        link.lastSeen = now;
        link.failedAttempts = 0;

        if (!link.everSeen) {
            link.everSeen = true;
            link.alive = true;
            link.quality = 1.0;
            return LinkChange::FOUND;
        }

        link.quality = blend(link.quality, 1.0);
        if (!link.alive) {
            link.alive = true;
            return LinkChange::RESTORED;
        }
        return LinkChange::NONE;
    }

    LinkChange PeerTable::markFailed(const std::string& nodeId) {
        std::lock_guard<std::mutex> lk(mtx);
        auto it = peers.find(nodeId);
        if (it == peers.end()) return LinkChange::NONE;

        it->second.failedAttempts++;
        it->second.quality = blend(it->second.quality, 0.0);
        if (it->second.alive) {
            it->second.alive = false;
            return LinkChange::LOST;
        }
        return LinkChange::NONE;
    }

    std::vector<std::string> PeerTable::sweep(SteadyTime now) {
        std::lock_guard<std::mutex> lk(mtx);
        std::vector<std::string> lost;
        for (auto& kv : peers) {
            PeerLink& link = kv.second;
            if (link.alive && now - link.lastSeen > peerTimeout) {
                link.alive = false;
                link.quality = blend(link.quality, 0.0);
                lost.push_back(kv.first);
            }
        }
        std::sort(lost.begin(), lost.end());
        return lost;
    }

    void PeerTable::setGated(const std::string& nodeId, bool gated) {
        std::lock_guard<std::mutex> lk(mtx);
        PeerLink& link = peers[nodeId];
        link.nodeId = nodeId;
        link.gated = gated;
    }

    bool PeerTable::isGated(const std::string& nodeId) const {
        std::lock_guard<std::mutex> lk(mtx);
        auto it = peers.find(nodeId);
        return it != peers.end() && it->second.gated;
    }

    bool PeerTable::isAlive(const std::string& nodeId) const {
        std::lock_guard<std::mutex> lk(mtx);
        auto it = peers.find(nodeId);
        return it != peers.end() && it->second.alive;
    }

    std::vector<std::string> PeerTable::liveLinks(bool includeGated) const {
        std::lock_guard<std::mutex> lk(mtx);
        std::vector<std::string> out;
        for (const auto& kv : peers) {
            if (!kv.second.alive) continue;
            if (kv.second.gated && !includeGated) continue;
            out.push_back(kv.first);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    size_t PeerTable::liveCount() const {
        std::lock_guard<std::mutex> lk(mtx);
        return static_cast<size_t>(std::count_if(peers.begin(), peers.end(),
            [](const auto& kv) { return kv.second.alive; }));
    }

    double PeerTable::meanQuality(bool includeGated) const {
        std::lock_guard<std::mutex> lk(mtx);
        double sum = 0.0;
        size_t live = 0;
        for (const auto& kv : peers) {
            if (!kv.second.alive) continue;
            if (kv.second.gated && !includeGated) continue;
            sum += kv.second.quality;
            ++live;
        }
        return live == 0 ? 0.0 : sum / static_cast<double>(live);
    }

    std::optional<PeerLink> PeerTable::getPeer(const std::string& nodeId) const {
        std::lock_guard<std::mutex> lk(mtx);
        auto it = peers.find(nodeId);
        if (it == peers.end()) return std::nullopt;
        return it->second;
    }

    std::vector<PeerLink> PeerTable::getKnownPeers() const {
        std::lock_guard<std::mutex> lk(mtx);
        std::vector<PeerLink> out;
        out.reserve(peers.size());
        for (const auto& kv : peers) out.push_back(kv.second);
        return out;
    }

    std::vector<PeerLink> PeerTable::selectPeersToConnect(size_t maxCount) const {
        std::lock_guard<std::mutex> lk(mtx);
        std::vector<PeerLink> list;
        for (const auto& kv : peers) {
            if (!kv.second.alive && kv.second.isDialable()) list.push_back(kv.second);
        }
        std::sort(list.begin(), list.end(), [](const PeerLink& a, const PeerLink& b) {
            if (a.failedAttempts != b.failedAttempts) return a.failedAttempts < b.failedAttempts;
            return a.quality > b.quality;
        });
        if (list.size() > maxCount) list.resize(maxCount);
        return list;
    }

    bool PeerTable::persist(const std::string& filename) const {
        std::lock_guard<std::mutex> lk(mtx);
        std::ofstream out(filename, std::ios::trunc);
        if (!out) return false;

        for (const auto& kv : peers) {
            if (!kv.second.isDialable()) continue;
            out << kv.second.host << ":" << kv.second.port << ":" << kv.first << "\n";
        }
        return out.good();
    }

    bool PeerTable::loadFromDisk(const std::string& filename) {
        std::lock_guard<std::mutex> lk(mtx);
        std::ifstream in(filename);
        if (!in) return false;

        std::string line;
        while (std::getline(in, line)) {
            if (line.empty()) continue;
            // format host:port:nodeId
            size_t p1 = line.find(':');
            size_t p2 = p1 == std::string::npos ? std::string::npos : line.find(':', p1 + 1);
            if (p2 == std::string::npos || p2 + 1 >= line.size()) {
                std::cerr << "Warning: Skipping malformed peer line: " << line << std::endl;
                continue;
            }

            unsigned long port = 0;
            try {
                port = std::stoul(line.substr(p1 + 1, p2 - p1 - 1));
            } catch (const std::exception&) {
                std::cerr << "Warning: Skipping peer line with bad port: " << line << std::endl;
                continue;
            }
            if (port == 0 || port > 65535) continue;

            std::string nodeId = line.substr(p2 + 1);
            PeerLink& link = peers[nodeId];
            link.nodeId = nodeId;
            link.host = line.substr(0, p1);
            link.port = static_cast<uint16_t>(port);
        }
        return true;
    }

    size_t PeerTable::size() const {
        std::lock_guard<std::mutex> lk(mtx);
        return peers.size();
    }

} // namespace tacmesh
