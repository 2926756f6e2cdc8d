#pragma once

#include "shed/data/log_sink.hpp"
#include "shed/net/echo_server.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace shed {

/// Runtime settings of shed-server.
/// Precedence: built-in defaults < JSON config file < command line flags.
struct ServerConfig {
    std::string bind_address = net::LineEchoServer::kDefaultBindAddress;
    uint16_t port = net::LineEchoServer::kDefaultPort;
    size_t max_log_entries = data::LogSink::kDefaultMaxEntries;
    bool echo_lines = true;
    bool quiet = false;
};

/// Overlay the keys present in `json` onto `base`.
/// Expects: {"bind_address": "0.0.0.0", "port": 62824, "max_log_entries": 1000,
///           "echo_lines": true, "quiet": false}
/// Unknown keys are ignored. Throws std::runtime_error on a wrong type or range.
ServerConfig config_from_json(const nlohmann::json &json, ServerConfig base = {});

/// Read and apply a JSON config file. Throws std::runtime_error.
ServerConfig load_config_file(const std::string &path, ServerConfig base = {});

struct CommandLine {
    ServerConfig config;
    bool show_help = false;
};

/// Parse `--config FILE`, `--port N`, `--bind ADDR`, `--max-log N`,
/// `--no-echo`, `--quiet`, `--help`. The config file is applied first
/// regardless of its position. Throws std::runtime_error on bad input.
CommandLine parse_command_line(int argc, char *argv[]);

[[nodiscard]] std::string usage(const std::string &program);

} // namespace shed
