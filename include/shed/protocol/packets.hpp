#pragma once

#include "shed/protocol/field_spec.hpp"

#include <memory>

namespace shed::protocol::packets {

/// 12-byte address header:
///   dest_ip(ipv4) + src_ip(ipv4) + dest_port(u16 BE) + src_port(u16 BE)
std::shared_ptr<const StructSpec> address_header();

/// Variable-length data record:
///   type(u8) + opcode(u8) + length(u16 LE) + id(str 8) + data(vec length) + align 4
std::shared_ptr<const StructSpec> data_record();

/// Enclosing packet:
///   header(address_header) + sequence(u32 LE) + item_count(u32 LE)
///   + items(repeat item_count x data_record) + fill(pad 3)
std::shared_ptr<const StructSpec> packet();

} // namespace shed::protocol::packets
