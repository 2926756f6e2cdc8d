#include "shed/data/client_registry.hpp"

#include <algorithm>

namespace shed::data {

std::string PeerId::to_string() const {
    return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) +
           "." + std::to_string((address >> 8) & 0xFF) + "." + std::to_string(address & 0xFF) +
           ":" + std::to_string(port);
}

bool ClientRegistry::append(const PeerId &peer, std::span<const uint8_t> bytes) {
    auto [it, inserted] = buffers_.try_emplace(peer);
    it->second.append(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    return inserted;
}

std::optional<std::string> ClientRegistry::pop_line(const PeerId &peer) {
    auto it = buffers_.find(peer);
    if (it == buffers_.end()) {
        return std::nullopt;
    }
    auto &buffer = it->second;
    const auto newline = buffer.find('\n');
    if (newline == ClientBuffer::npos) {
        return std::nullopt;
    }
    std::string line = buffer.substr(0, newline + 1);
    buffer.erase(0, newline + 1);
    return line;
}

bool ClientRegistry::remove(const PeerId &peer) { return buffers_.erase(peer) != 0; }

const ClientBuffer *ClientRegistry::buffer(const PeerId &peer) const {
    auto it = buffers_.find(peer);
    if (it == buffers_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool ClientRegistry::contains(const PeerId &peer) const { return buffers_.count(peer) != 0; }

std::vector<PeerId> ClientRegistry::peers() const {
    std::vector<PeerId> result;
    result.reserve(buffers_.size());
    for (const auto &[peer, buffer] : buffers_) {
        result.push_back(peer);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace shed::data
