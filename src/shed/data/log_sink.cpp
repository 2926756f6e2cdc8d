#include "shed/data/log_sink.hpp"

#include <algorithm>
#include <cstdio>

namespace shed::data {

LogSink::LogSink(size_t max_entries, bool mirror)
    : max_entries_(std::max<size_t>(max_entries, 1)), mirror_(mirror),
      start_time_(std::chrono::steady_clock::now()) {}

void LogSink::add(LogKind kind, const std::string &message,
                  const std::optional<std::string> &peer) {
    if (entries_.size() >= max_entries_) {
        entries_.pop_front();
    }

    entries_.push_back(LogRecord{
        .kind = kind,
        .message = message,
        .peer = peer,
        .timestamp = std::chrono::system_clock::now(),
        .wall_time = elapsed(),
    });

    if (mirror_) {
        FILE *stream = kind == LogKind::Error ? stderr : stdout;
        std::fprintf(stream, "%s\n", format(entries_.back()).c_str());
        std::fflush(stream);
    }
}

const std::deque<LogRecord> &LogSink::entries() const { return entries_; }

size_t LogSink::size() const { return entries_.size(); }

bool LogSink::empty() const { return entries_.empty(); }

void LogSink::clear() { entries_.clear(); }

double LogSink::elapsed() const {
    const auto now = std::chrono::steady_clock::now();
    const auto delta = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_time_);
    return delta.count();
}

std::string LogSink::format(const LogRecord &record) {
    std::string out = "[";
    out += kind_prefix(record.kind);
    out += "] ";
    if (record.peer.has_value()) {
        out += record.peer.value();
        out += ' ';
    }
    std::string_view message = record.message;
    if (!message.empty() && message.back() == '\n') {
        message.remove_suffix(1);
    }
    out += message;
    return out;
}

const char *LogSink::kind_prefix(LogKind kind) {
    switch (kind) {
    case LogKind::Line:
        return "LINE";
    case LogKind::Peer:
        return "PEER";
    case LogKind::System:
        return "SYS";
    case LogKind::Error:
        return "ERR";
    }
    return "SYS";
}

} // namespace shed::data
