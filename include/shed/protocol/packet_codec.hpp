#pragma once

#include "shed/protocol/field_spec.hpp"
#include "shed/protocol/packet_value.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace shed::protocol {

/// Encode `value` (a record) against `spec`.
/// Fields are emitted in declared order. Vector and Repeat lengths come from
/// the referenced sibling in `value`, not from the produced bytes.
/// Throws ValueError if `value` does not fit the schema.
std::vector<uint8_t> encode(const StructSpec &spec, const PacketValue &value);

/// Encoded length of `value`, without producing bytes.
/// Throws ValueError exactly where encode() would.
size_t encoded_size(const StructSpec &spec, const PacketValue &value);

/// Decode one record from the front of `data`; trailing bytes are ignored.
/// Throws TruncatedInputError if `data` ends before a field does.
PacketValue decode(const StructSpec &spec, std::span<const uint8_t> data);

/// As above, and reports how many bytes the record occupied.
PacketValue decode(const StructSpec &spec, std::span<const uint8_t> data, size_t &consumed);

} // namespace shed::protocol
