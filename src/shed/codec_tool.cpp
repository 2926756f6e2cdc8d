#include "shed/codec_tool.hpp"
#include "shed/protocol/errors.hpp"
#include "shed/protocol/packet_codec.hpp"
#include "shed/protocol/packets.hpp"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace shed {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

protocol::SchemaSet load_schema_file(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open schema file '" + path + "'");
    }
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw std::runtime_error("Malformed JSON in schema file '" + path + "'");
    }
    return protocol::parse_schema(doc);
}

std::string codec_usage(const std::string &program) {
    return "Usage: " + program +
           " [--schema FILE] --struct NAME (encode JSON | decode HEX)\n"
           "Built-in structs: address_header, data_record, packet\n";
}

} // namespace

std::string to_hex(const std::vector<uint8_t> &bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

std::vector<uint8_t> from_hex(std::string_view text) {
    std::vector<uint8_t> out;
    int high = -1;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        const int digit = hex_digit(c);
        if (digit < 0) {
            throw std::runtime_error(std::string("Invalid hex digit '") + c + "'");
        }
        if (high < 0) {
            high = digit;
        } else {
            out.push_back(static_cast<uint8_t>((high << 4) | digit));
            high = -1;
        }
    }
    if (high >= 0) {
        throw std::runtime_error("Odd number of hex digits");
    }
    return out;
}

protocol::SchemaSet builtin_schemas() {
    protocol::SchemaSet schemas;
    schemas.add(protocol::packets::address_header());
    schemas.add(protocol::packets::data_record());
    schemas.add(protocol::packets::packet());
    return schemas;
}

int run_codec_tool(int argc, char *argv[]) {
    const std::string program = argc > 0 ? argv[0] : "shed-codec";
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string schema_path;
    std::string struct_name;
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        if ((args[i] == "--schema" || args[i] == "--struct") && i + 1 < args.size()) {
            (args[i] == "--schema" ? schema_path : struct_name) = args[i + 1];
            ++i;
        } else if (args[i] == "--help" || args[i] == "-h") {
            std::printf("%s", codec_usage(program).c_str());
            return 0;
        } else {
            positional.push_back(args[i]);
        }
    }

    if (struct_name.empty() || positional.size() != 2 ||
        (positional[0] != "encode" && positional[0] != "decode")) {
        std::fprintf(stderr, "%s", codec_usage(program).c_str());
        return 2;
    }

    try {
        const auto schemas = schema_path.empty() ? builtin_schemas() : load_schema_file(schema_path);
        const auto spec = schemas.get(struct_name);

        if (positional[0] == "encode") {
            auto json = nlohmann::json::parse(positional[1], nullptr, false);
            if (json.is_discarded()) {
                throw std::runtime_error("Malformed JSON value");
            }
            const auto bytes = protocol::encode(*spec, protocol::value_from_json(*spec, json));
            std::printf("%s\n", to_hex(bytes).c_str());
        } else {
            const auto bytes = from_hex(positional[1]);
            size_t consumed = 0;
            const auto value = protocol::decode(*spec, bytes, consumed);
            std::printf("%s\n", protocol::value_to_json(*spec, value).dump(2).c_str());
            if (consumed < bytes.size()) {
                std::fprintf(stderr, "[shed-codec] %zu trailing bytes ignored\n",
                             bytes.size() - consumed);
            }
        }
    } catch (const protocol::CodecError &e) {
        std::fprintf(stderr, "[shed-codec] Codec error: %s\n", e.what());
        return 1;
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[shed-codec] Error: %s\n", e.what());
        return 1;
    }
    return 0;
}

} // namespace shed
