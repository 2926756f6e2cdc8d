#include "shed/config.hpp"

#include <charconv>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace shed {

namespace {

uint16_t checked_port(int64_t value) {
    if (value < 1 || value > std::numeric_limits<uint16_t>::max()) {
        throw std::runtime_error("Port out of range: " + std::to_string(value));
    }
    return static_cast<uint16_t>(value);
}

int64_t parse_integer(const std::string &flag, const std::string &text) {
    int64_t value = 0;
    const char *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        throw std::runtime_error("Invalid value for " + flag + ": '" + text + "'");
    }
    return value;
}

} // namespace

ServerConfig config_from_json(const nlohmann::json &json, ServerConfig base) {
    if (!json.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    if (json.contains("bind_address")) {
        if (!json["bind_address"].is_string()) {
            throw std::runtime_error("Config 'bind_address' must be a string");
        }
        base.bind_address = json["bind_address"].get<std::string>();
    }
    if (json.contains("port")) {
        if (!json["port"].is_number_integer()) {
            throw std::runtime_error("Config 'port' must be an integer");
        }
        base.port = checked_port(json["port"].get<int64_t>());
    }
    if (json.contains("max_log_entries")) {
        if (!json["max_log_entries"].is_number_unsigned() ||
            json["max_log_entries"].get<size_t>() == 0) {
            throw std::runtime_error("Config 'max_log_entries' must be a positive integer");
        }
        base.max_log_entries = json["max_log_entries"].get<size_t>();
    }
    if (json.contains("echo_lines")) {
        if (!json["echo_lines"].is_boolean()) {
            throw std::runtime_error("Config 'echo_lines' must be a boolean");
        }
        base.echo_lines = json["echo_lines"].get<bool>();
    }
    if (json.contains("quiet")) {
        if (!json["quiet"].is_boolean()) {
            throw std::runtime_error("Config 'quiet' must be a boolean");
        }
        base.quiet = json["quiet"].get<bool>();
    }
    return base;
}

ServerConfig load_config_file(const std::string &path, ServerConfig base) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file '" + path + "'");
    }
    auto json = nlohmann::json::parse(in, nullptr, false);
    if (json.is_discarded()) {
        throw std::runtime_error("Malformed JSON in config file '" + path + "'");
    }
    return config_from_json(json, std::move(base));
}

CommandLine parse_command_line(int argc, char *argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    CommandLine cmd;

    auto value_after = [&](size_t &i) -> const std::string & {
        if (i + 1 >= args.size()) {
            throw std::runtime_error("Missing value for " + args[i]);
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            cmd.config = load_config_file(value_after(i), cmd.config);
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];
        if (arg == "--config") {
            ++i;
        } else if (arg == "--port" || arg == "-p") {
            cmd.config.port = checked_port(parse_integer(arg, value_after(i)));
        } else if (arg == "--bind") {
            cmd.config.bind_address = value_after(i);
        } else if (arg == "--max-log") {
            const int64_t n = parse_integer(arg, value_after(i));
            if (n <= 0) {
                throw std::runtime_error("--max-log must be positive");
            }
            cmd.config.max_log_entries = static_cast<size_t>(n);
        } else if (arg == "--no-echo") {
            cmd.config.echo_lines = false;
        } else if (arg == "--quiet" || arg == "-q") {
            cmd.config.quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            cmd.show_help = true;
        } else {
            throw std::runtime_error("Unknown argument '" + arg + "'");
        }
    }
    return cmd;
}

std::string usage(const std::string &program) {
    return "Usage: " + program +
           " [options]\n"
           "  --config FILE   JSON config file\n"
           "  --port, -p N    UDP port (default 62824)\n"
           "  --bind ADDR     IPv4 bind address (default 0.0.0.0)\n"
           "  --max-log N     log records kept in memory (default 1000)\n"
           "  --no-echo       log completed lines without sending them back\n"
           "  --quiet, -q     do not mirror log records to the terminal\n"
           "  --help, -h      show this help\n";
}

} // namespace shed
