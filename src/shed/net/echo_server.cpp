#include "shed/net/echo_server.hpp"
#include "shed/net/udp_endpoint.hpp"

namespace shed::net {

LineEchoServer::LineEchoServer(size_t max_log_entries)
    : LineEchoServer(std::make_unique<UdpEndpoint>(), max_log_entries) {}

LineEchoServer::LineEchoServer(std::unique_ptr<DatagramTransport> transport,
                               size_t max_log_entries)
    : transport_(std::move(transport)), log_(max_log_entries) {}

LineEchoServer::~LineEchoServer() { stop(); }

void LineEchoServer::start(uint16_t port, const std::string &bind_address) {
    if (state_ == ServerState::Listening) {
        return;
    }

    transport_->open(bind_address, port);
    registry_.clear();
    state_ = ServerState::Listening;
    log_.add(data::LogKind::System,
             "Listening on " + bind_address + ":" + std::to_string(transport_->local_port()));
}

void LineEchoServer::stop() {
    if (state_ == ServerState::Stopped) {
        return;
    }

    const size_t dropped = registry_.size();
    registry_.clear();
    transport_->close();
    state_ = ServerState::Stopped;
    log_.add(data::LogKind::System, "Stopped (" + std::to_string(dropped) + " peers dropped)");
}

void LineEchoServer::on_receive(const data::PeerId &peer, std::span<const uint8_t> bytes) {
    if (state_ != ServerState::Listening) {
        log_.add(data::LogKind::Error, "Datagram ignored: server is stopped", peer.to_string());
        return;
    }

    if (registry_.append(peer, bytes)) {
        log_.add(data::LogKind::Peer, "connected", peer.to_string());
    }
    flush_lines(peer);
}

void LineEchoServer::flush_lines(const data::PeerId &peer) {
    // One line per iteration, in the order their newlines arrived.
    while (auto line = registry_.pop_line(peer)) {
        if (echo_) {
            const auto *begin = reinterpret_cast<const uint8_t *>(line->data());
            if (!transport_->send_to(peer, std::span<const uint8_t>(begin, line->size()))) {
                log_.add(data::LogKind::Error, "Failed to echo line", peer.to_string());
            }
        }
        log_.add(data::LogKind::Line, *line, peer.to_string());
    }
}

void LineEchoServer::on_disconnect(const data::PeerId &peer) {
    const bool known = registry_.remove(peer);
    log_.add(data::LogKind::Peer, known ? "disconnected" : "disconnected (unknown peer)",
             peer.to_string());
}

bool LineEchoServer::poll(std::chrono::milliseconds timeout) {
    if (state_ != ServerState::Listening) {
        return false;
    }

    auto datagram = transport_->receive(timeout);
    if (!datagram.has_value()) {
        return false;
    }

    if (datagram->payload.empty()) {
        on_disconnect(datagram->peer);
    } else {
        on_receive(datagram->peer, datagram->payload);
    }
    return true;
}

uint16_t LineEchoServer::port() const {
    return state_ == ServerState::Listening ? transport_->local_port() : 0;
}

const char *server_state_name(ServerState state) {
    switch (state) {
    case ServerState::Stopped:
        return "stopped";
    case ServerState::Listening:
        return "listening";
    }
    return "unknown";
}

} // namespace shed::net
