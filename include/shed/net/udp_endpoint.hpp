#pragma once

#include "shed/net/transport.hpp"

#include <cstddef>

namespace shed::net {

/// IPv4 UDP socket bound to a local port.
class UdpEndpoint : public DatagramTransport {
  public:
    /// Largest datagram accepted by receive(); longer ones are truncated by the kernel.
    static constexpr size_t kMaxDatagramSize = 65507;

    UdpEndpoint() = default;
    ~UdpEndpoint() override;

    UdpEndpoint(const UdpEndpoint &) = delete;
    UdpEndpoint &operator=(const UdpEndpoint &) = delete;

    void open(const std::string &bind_address, uint16_t port) override;
    void close() override;
    [[nodiscard]] bool is_open() const override { return fd_ >= 0; }
    [[nodiscard]] uint16_t local_port() const override { return port_; }

    bool send_to(const data::PeerId &peer, std::span<const uint8_t> bytes) override;
    std::optional<Datagram> receive(std::chrono::milliseconds timeout) override;

    [[nodiscard]] int fd() const { return fd_; }

  private:
    int fd_ = -1;
    uint16_t port_ = 0;
    std::vector<uint8_t> recv_buffer_;
};

/// Parse a dotted IPv4 address into host byte order. Throws std::invalid_argument.
uint32_t parse_ipv4_address(const std::string &dotted);

} // namespace shed::net
