#include "tacmesh/SimulatedNetwork.hpp"

#include <iostream>
#include <stdexcept>

namespace tacmesh {

Transport& SimulatedNetwork::attach(const std::string& nodeId) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = endpoints.find(nodeId);
    if (it != endpoints.end()) {
        throw std::invalid_argument("Node already attached: " + nodeId);
    }
    auto endpoint = std::make_unique<Endpoint>(*this, nodeId);
    Transport& ref = *endpoint;
    endpoints.emplace(nodeId, std::move(endpoint));
    return ref;
}

void SimulatedNetwork::setHandler(const std::string& nodeId, FrameHandler handler) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!endpoints.count(nodeId)) {
        throw std::invalid_argument("Unknown node: " + nodeId);
    }
    handlers[nodeId] = std::move(handler);
}

// ==== TOPOLOGY ====

std::pair<std::string, std::string> SimulatedNetwork::linkKey(const std::string& a, const std::string& b) {
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

void SimulatedNetwork::connect(const std::string& a, const std::string& b) {
    if (a == b) {
        throw std::invalid_argument("A node cannot link to itself");
    }
    std::lock_guard<std::mutex> lock(mtx);
    links.insert(linkKey(a, b));
}

void SimulatedNetwork::disconnect(const std::string& a, const std::string& b) {
    std::lock_guard<std::mutex> lock(mtx);
    links.erase(linkKey(a, b));
}

void SimulatedNetwork::isolate(const std::string& nodeId) {
    std::lock_guard<std::mutex> lock(mtx);
    for (auto it = links.begin(); it != links.end();) {
        if (it->first == nodeId || it->second == nodeId) {
            it = links.erase(it);
        } else {
            ++it;
        }
    }
}

bool SimulatedNetwork::linked(const std::string& a, const std::string& b) const {
    std::lock_guard<std::mutex> lock(mtx);
    return links.count(linkKey(a, b)) > 0;
}

std::vector<std::string> SimulatedNetwork::neighbours(const std::string& nodeId) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> out;
    for (const auto& link : links) {
        if (link.first == nodeId) out.push_back(link.second);
        else if (link.second == nodeId) out.push_back(link.first);
    }
    return out;
}

void SimulatedNetwork::setDuplicateDelivery(bool enabled) {
    std::lock_guard<std::mutex> lock(mtx);
    duplicate = enabled;
}

// ==== DELIVERY ====

bool SimulatedNetwork::enqueue(const std::string& from, const std::string& to, const Frame& frame) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!endpoints.count(to) || !links.count(linkKey(from, to))) {
        return false;
    }
    InFlight item{from, to, serializeFrame(frame)};
    if (duplicate) {
        queue.push_back(item);
    }
    queue.push_back(std::move(item));
    return true;
}

size_t SimulatedNetwork::pump() {
    std::deque<InFlight> round;
    {
        std::lock_guard<std::mutex> lock(mtx);
        round.swap(queue);
    }

    size_t count = 0;
    for (auto& item : round) {
        FrameHandler handler;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = handlers.find(item.to);
            if (!links.count(linkKey(item.from, item.to)) || it == handlers.end()) {
                ++dropped;
                continue;
            }
            handler = it->second;
            ++delivered;
        }

        Frame frame;
        if (!parseFullFrame(item.bytes, frame)) {
            std::cerr << "Warning: Dropping corrupt frame " << item.from << " -> " << item.to << std::endl;
            continue;
        }
        handler(item.from, frame);
        ++count;
    }
    return count;
}

size_t SimulatedNetwork::pumpUntilIdle(size_t maxRounds) {
    size_t total = 0;
    for (size_t round = 0; round < maxRounds && pending() > 0; ++round) {
        total += pump();
    }
    return total;
}

size_t SimulatedNetwork::pending() const {
    std::lock_guard<std::mutex> lock(mtx);
    return queue.size();
}

uint64_t SimulatedNetwork::framesDelivered() const {
    std::lock_guard<std::mutex> lock(mtx);
    return delivered;
}

uint64_t SimulatedNetwork::framesDropped() const {
    std::lock_guard<std::mutex> lock(mtx);
    return dropped;
}

} // namespace tacmesh
