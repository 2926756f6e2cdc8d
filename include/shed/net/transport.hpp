#pragma once

#include "shed/data/client_registry.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace shed::net {

/// One received datagram and its sender.
struct Datagram {
    data::PeerId peer;
    std::vector<uint8_t> payload;
};

/// Datagram I/O boundary of the line echo server.
/// The server hands it already-formed bytes and is handed already-received ones.
class DatagramTransport {
  public:
    virtual ~DatagramTransport() = default;

    /// Bind to `bind_address:port` (port 0 picks an ephemeral port).
    /// Throws std::system_error on failure.
    virtual void open(const std::string &bind_address, uint16_t port) = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual bool is_open() const = 0;

    /// Port actually bound, 0 when closed.
    [[nodiscard]] virtual uint16_t local_port() const = 0;

    /// Send one datagram. Returns false if the datagram could not be sent.
    virtual bool send_to(const data::PeerId &peer, std::span<const uint8_t> bytes) = 0;

    /// Wait up to `timeout` for one datagram. nullopt on timeout or interruption.
    /// Throws std::system_error on socket failure.
    virtual std::optional<Datagram> receive(std::chrono::milliseconds timeout) = 0;
};

} // namespace shed::net
