#ifndef TACMESH_TRANSPORT_HPP
#define TACMESH_TRANSPORT_HPP

#include "tacmesh/Frame.hpp"

#include <functional>
#include <string>

namespace tacmesh {

    // Called for every frame that arrives from a neighbour
    using FrameHandler = std::function<void(const std::string& fromNodeId, const Frame& frame)>;

    /**
     * Point-to-point link layer between neighbouring nodes. send() returns
     * false when the peer cannot be reached right now; it never blocks on the
     * network.
     */
    class Transport {
    public:
        virtual ~Transport() = default;

        virtual bool send(const std::string& peerId, const Frame& frame) = 0;
    };

} // namespace tacmesh

#endif // TACMESH_TRANSPORT_HPP
