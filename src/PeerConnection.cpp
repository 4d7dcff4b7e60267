#include "tacmesh/PeerConnection.hpp"

#include <iostream>

namespace tacmesh {

    PeerConnection::PeerConnection(boost::asio::io_context& ctx)
        : io(ctx), sock(ctx), headerBuf(FRAME_HEADER_SIZE) {}

    PeerConnection::~PeerConnection() {
        boost::system::error_code ec;
        sock.close(ec);
    }

    tcp::socket& PeerConnection::socket() { return sock; }

    void PeerConnection::setFrameHandler(FrameCallback cb) { onFrame = std::move(cb); }

    void PeerConnection::setCloseHandler(CloseCallback cb) { onClose = std::move(cb); }

    std::string PeerConnection::remoteNodeId() const {
        std::lock_guard<std::mutex> lk(stateMtx);
        return nodeId;
    }

    void PeerConnection::setRemoteNodeId(const std::string& id) {
        std::lock_guard<std::mutex> lk(stateMtx);
        nodeId = id;
    }

    void PeerConnection::start() {
        asyncReadHeader();
    }

    void PeerConnection::connectTo(const PeerLink& peer, ConnectCallback onConnected) {
        auto self = shared_from_this();
        auto resolver = std::make_shared<tcp::resolver>(io);
        resolver->async_resolve(peer.host, std::to_string(peer.port),
            [this, self, resolver, peer, onConnected](const boost::system::error_code& ec,
                                                      tcp::resolver::results_type results) {
                if (ec) {
                    std::cerr << "Warning: Cannot resolve " << peer.address() << ": " << ec.message() << std::endl;
                    closed = true;
                    onConnected(self, false);
                    return;
                }
                boost::asio::async_connect(sock, results,
                    [this, self, peer, onConnected](const boost::system::error_code& ec2, const tcp::endpoint&) {
                        if (ec2) {
                            closed = true;
                            onConnected(self, false);
                            return;
                        }
                        onConnected(self, true);
                        start();
                    });
            });
    }

    void PeerConnection::asyncReadHeader() {
        auto self = shared_from_this();
        boost::asio::async_read(sock, boost::asio::buffer(headerBuf),
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    handleDisconnect();
                    return;
                }
                Frame header;
                uint64_t payloadLen = 0;
                if (!parseFrameHeader(headerBuf, header, payloadLen)) {
                    std::cerr << "Error: Malformed frame header from " << remoteNodeId() << std::endl;
                    handleDisconnect();
                    return;
                }
                asyncReadPayload(payloadLen);
            });
    }

    void PeerConnection::asyncReadPayload(uint64_t payloadLen) {
        // payload + checksum
        payloadBuf.resize(static_cast<size_t>(payloadLen + CHECKSUM_SIZE));
        auto self = shared_from_this();
        boost::asio::async_read(sock, boost::asio::buffer(payloadBuf),
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    handleDisconnect();
                    return;
                }
                std::vector<uint8_t> full;
                full.reserve(headerBuf.size() + payloadBuf.size());
                full.insert(full.end(), headerBuf.begin(), headerBuf.end());
                full.insert(full.end(), payloadBuf.begin(), payloadBuf.end());

                Frame frame;
                if (!parseFullFrame(full, frame)) {
                    std::cerr << "Error: Corrupted frame from " << remoteNodeId() << std::endl;
                    handleDisconnect();
                    return;
                }
                if (onFrame) {
                    onFrame(self, frame);
                }
                asyncReadHeader();
            });
    }

    void PeerConnection::sendFrame(const Frame& frame) {
        if (closed) return;
        auto buf = serializeFrame(frame);
        auto self = shared_from_this();
        boost::asio::post(io, [this, self, buf = std::move(buf)]() mutable {
            bool idle = false;
            {
                std::lock_guard<std::mutex> lk(stateMtx);
                idle = writeQueue.empty();
                writeQueue.push_back(std::move(buf));
            }
            if (idle) doWrite();
        });
    }

    void PeerConnection::doWrite() {
        auto self = shared_from_this();
        std::lock_guard<std::mutex> lk(stateMtx);
        if (writeQueue.empty()) return;
        boost::asio::async_write(sock, boost::asio::buffer(writeQueue.front()),
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    handleDisconnect();
                    return;
                }
                bool more = false;
                {
                    std::lock_guard<std::mutex> lk2(stateMtx);
                    writeQueue.pop_front();
                    more = !writeQueue.empty();
                }
                if (more) doWrite();
            });
    }

    void PeerConnection::close() {
        auto self = shared_from_this();
        boost::asio::post(io, [this, self]() { handleDisconnect(); });
    }

    void PeerConnection::handleDisconnect() {
        if (closed.exchange(true)) return;

        boost::system::error_code ec;
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
        {
            std::lock_guard<std::mutex> lk(stateMtx);
            writeQueue.clear();
        }
        if (onClose) {
            onClose(shared_from_this());
        }
    }

} // namespace tacmesh
