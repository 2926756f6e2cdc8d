#pragma once

#include "shed/data/client_registry.hpp"
#include "shed/data/log_sink.hpp"
#include "shed/net/transport.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace shed::net {

enum class ServerState { Stopped, Listening };

/// Line reassembly server.
/// Buffers datagrams per peer and, for every completed newline-terminated
/// line, sends the line back to the peer that sent it and logs it. Lines are
/// never forwarded to other peers.
///
/// Single-threaded: all handlers run to completion on the caller's thread,
/// one event at a time, so the registry needs no locking.
class LineEchoServer {
  public:
    static constexpr uint16_t kDefaultPort = 62824;
    static constexpr const char *kDefaultBindAddress = "0.0.0.0";

    /// Server over a real UDP socket.
    explicit LineEchoServer(size_t max_log_entries = data::LogSink::kDefaultMaxEntries);
    /// Server over a caller-supplied transport.
    explicit LineEchoServer(std::unique_ptr<DatagramTransport> transport,
                            size_t max_log_entries = data::LogSink::kDefaultMaxEntries);
    ~LineEchoServer();

    LineEchoServer(const LineEchoServer &) = delete;
    LineEchoServer &operator=(const LineEchoServer &) = delete;

    /// Stopped -> Listening: bind the transport and start a fresh registry.
    /// No-op when already listening. Throws std::system_error if binding
    /// fails; the server then stays Stopped.
    void start(uint16_t port = kDefaultPort, const std::string &bind_address = kDefaultBindAddress);

    /// Listening -> Stopped: drop every peer and close the transport.
    /// No-op when already stopped.
    void stop();

    /// Handle one datagram from `peer`.
    void on_receive(const data::PeerId &peer, std::span<const uint8_t> bytes);

    /// Forget `peer` and its unflushed bytes.
    void on_disconnect(const data::PeerId &peer);

    /// Wait up to `timeout` for one datagram and dispatch it. A zero-length
    /// datagram is the peer's disconnect notification.
    /// Returns true if a datagram was handled.
    bool poll(std::chrono::milliseconds timeout);

    /// When disabled, completed lines are logged but not sent back.
    void set_echo(bool echo) { echo_ = echo; }
    [[nodiscard]] bool echo() const { return echo_; }

    [[nodiscard]] ServerState state() const { return state_; }
    [[nodiscard]] bool listening() const { return state_ == ServerState::Listening; }
    /// Bound port, 0 when stopped.
    [[nodiscard]] uint16_t port() const;

    [[nodiscard]] const data::ClientRegistry &registry() const { return registry_; }
    [[nodiscard]] data::LogSink &log() { return log_; }
    [[nodiscard]] const data::LogSink &log() const { return log_; }
    [[nodiscard]] DatagramTransport &transport() { return *transport_; }

  private:
    void flush_lines(const data::PeerId &peer);

    std::unique_ptr<DatagramTransport> transport_;
    data::ClientRegistry registry_;
    data::LogSink log_;
    ServerState state_ = ServerState::Stopped;
    bool echo_ = true;
};

[[nodiscard]] const char *server_state_name(ServerState state);

} // namespace shed::net
