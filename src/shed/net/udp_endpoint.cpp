#include "shed/net/udp_endpoint.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace shed::net {

namespace {

[[noreturn]] void throw_errno(const std::string &what) {
    throw std::system_error(errno, std::generic_category(), what);
}

sockaddr_in to_sockaddr(uint32_t address, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(address);
    return addr;
}

} // namespace

uint32_t parse_ipv4_address(const std::string &dotted) {
    in_addr addr{};
    if (inet_pton(AF_INET, dotted.c_str(), &addr) != 1) {
        throw std::invalid_argument("Invalid IPv4 address '" + dotted + "'");
    }
    return ntohl(addr.s_addr);
}

UdpEndpoint::~UdpEndpoint() { close(); }

void UdpEndpoint::open(const std::string &bind_address, uint16_t port) {
    if (is_open()) {
        return;
    }

    const uint32_t address = parse_ipv4_address(bind_address);

    const int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
        throw_errno("socket");
    }

    int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        const int err = errno;
        ::close(fd);
        throw std::system_error(err, std::generic_category(), "setsockopt(SO_REUSEADDR)");
    }

    const sockaddr_in local = to_sockaddr(address, port);
    if (::bind(fd, reinterpret_cast<const sockaddr *>(&local), sizeof(local)) < 0) {
        const int err = errno;
        ::close(fd);
        throw std::system_error(err, std::generic_category(),
                                "bind " + bind_address + ":" + std::to_string(port));
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &len) < 0) {
        const int err = errno;
        ::close(fd);
        throw std::system_error(err, std::generic_category(), "getsockname");
    }

    fd_ = fd;
    port_ = ntohs(bound.sin_port);
    recv_buffer_.resize(kMaxDatagramSize);
}

void UdpEndpoint::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    port_ = 0;
}

bool UdpEndpoint::send_to(const data::PeerId &peer, std::span<const uint8_t> bytes) {
    if (!is_open()) {
        return false;
    }
    const sockaddr_in dest = to_sockaddr(peer.address, peer.port);
    const ssize_t sent = ::sendto(fd_, bytes.data(), bytes.size(), 0,
                                  reinterpret_cast<const sockaddr *>(&dest), sizeof(dest));
    return sent == static_cast<ssize_t>(bytes.size());
}

std::optional<Datagram> UdpEndpoint::receive(std::chrono::milliseconds timeout) {
    if (!is_open()) {
        return std::nullopt;
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return std::nullopt;
        }
        throw_errno("poll");
    }
    if (ready == 0) {
        return std::nullopt;
    }

    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t n = ::recvfrom(fd_, recv_buffer_.data(), recv_buffer_.size(), 0,
                                 reinterpret_cast<sockaddr *>(&from), &from_len);
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            return std::nullopt;
        }
        throw_errno("recvfrom");
    }

    Datagram datagram;
    datagram.peer = data::PeerId{.address = ntohl(from.sin_addr.s_addr), .port = ntohs(from.sin_port)};
    datagram.payload.assign(recv_buffer_.begin(), recv_buffer_.begin() + n);
    return datagram;
}

} // namespace shed::net
