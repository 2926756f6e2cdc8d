#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

namespace shed::data {

/// Kinds of log records, used for the terminal prefix and for filtering.
enum class LogKind {
    Line,   // a completed line echoed back to its peer
    Peer,   // peer lifecycle (first datagram, disconnect)
    System, // server lifecycle
    Error,
};

/// One append-only log record.
struct LogRecord {
    LogKind kind = LogKind::System;
    std::string message;
    std::optional<std::string> peer;
    std::chrono::system_clock::time_point timestamp;
    double wall_time = 0.0; // seconds since the sink was created
};

/// Rolling log of server records, mirrored to stdout as they arrive.
/// Thread safety: event loop thread only.
class LogSink {
  public:
    static constexpr size_t kDefaultMaxEntries = 1000;

    explicit LogSink(size_t max_entries = kDefaultMaxEntries, bool mirror = true);

    void add(LogKind kind, const std::string &message,
             const std::optional<std::string> &peer = std::nullopt);

    [[nodiscard]] const std::deque<LogRecord> &entries() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] size_t max_entries() const { return max_entries_; }

    void clear();
    [[nodiscard]] double elapsed() const;

    /// Enable or disable the stdout mirror.
    void set_mirror(bool mirror) { mirror_ = mirror; }
    [[nodiscard]] bool mirror() const { return mirror_; }

    /// Terminal form of a record: "[LINE] 127.0.0.1:4000 hello".
    /// One trailing newline is dropped from the message.
    [[nodiscard]] static std::string format(const LogRecord &record);
    [[nodiscard]] static const char *kind_prefix(LogKind kind);

  private:
    size_t max_entries_ = kDefaultMaxEntries;
    bool mirror_ = true;
    std::deque<LogRecord> entries_;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace shed::data
