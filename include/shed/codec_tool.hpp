#pragma once

#include "shed/protocol/schema.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace shed {

/// Lowercase hex, no separators.
std::string to_hex(const std::vector<uint8_t> &bytes);

/// Parse hex digits; whitespace is skipped. Throws std::runtime_error.
std::vector<uint8_t> from_hex(std::string_view text);

/// Schemas available without a schema file: address_header, data_record, packet.
protocol::SchemaSet builtin_schemas();

/// shed-codec entry point:
///   shed-codec [--schema FILE] --struct NAME encode JSON
///   shed-codec [--schema FILE] --struct NAME decode HEX
/// Writes the result to stdout. Returns exit code (0 = success).
int run_codec_tool(int argc, char *argv[]);

} // namespace shed
