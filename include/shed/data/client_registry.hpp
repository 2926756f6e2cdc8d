#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace shed::data {

/// Remote UDP peer: IPv4 address and port, both in host byte order.
struct PeerId {
    uint32_t address = 0;
    uint16_t port = 0;

    bool operator==(const PeerId &) const = default;
    auto operator<=>(const PeerId &) const = default;

    /// "a.b.c.d:port"
    [[nodiscard]] std::string to_string() const;
};

struct PeerIdHash {
    size_t operator()(const PeerId &peer) const {
        return std::hash<uint64_t>{}((static_cast<uint64_t>(peer.address) << 16) | peer.port);
    }
};

/// Bytes received from one peer that do not yet end in a newline.
using ClientBuffer = std::string;

/// Per-peer line reassembly state.
/// A buffer exists from the first datagram of a peer until it disconnects
/// or the registry is cleared. Nothing is dropped on a partial line.
class ClientRegistry {
  public:
    /// Append received bytes to `peer`'s buffer, creating it if needed.
    /// Returns true if the peer was not known before.
    bool append(const PeerId &peer, std::span<const uint8_t> bytes);

    /// Remove and return the first complete line (including its '\n'),
    /// or nullopt if the buffer holds no newline.
    std::optional<std::string> pop_line(const PeerId &peer);

    /// Drop a peer's buffer. Returns false if the peer was unknown.
    bool remove(const PeerId &peer);

    /// Pending bytes for `peer`, or nullptr if unknown.
    [[nodiscard]] const ClientBuffer *buffer(const PeerId &peer) const;

    [[nodiscard]] bool contains(const PeerId &peer) const;
    [[nodiscard]] size_t size() const { return buffers_.size(); }
    [[nodiscard]] bool empty() const { return buffers_.empty(); }

    /// Known peers in ascending (address, port) order.
    [[nodiscard]] std::vector<PeerId> peers() const;

    void clear() { buffers_.clear(); }

  private:
    std::unordered_map<PeerId, ClientBuffer, PeerIdHash> buffers_;
};

} // namespace shed::data
