#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace shed::protocol {

enum class Endianness { Big, Little };

/// Encode `value` as a `width_bits`-wide two's complement integer.
/// Out-of-range values wrap modulo 2^width; this is never an error.
/// Throws std::invalid_argument if width_bits is not 8, 16 or 32.
std::vector<uint8_t> encode_int(int64_t value, unsigned width_bits, Endianness order);

/// Append-variant used by the packet codec.
void encode_int(int64_t value, unsigned width_bits, Endianness order, std::vector<uint8_t> &out);

/// Decode the first width_bits/8 bytes of `data`.
/// With `is_signed`, the top bit is sign-extended.
/// Throws TruncatedInputError if `data` is too short.
int64_t decode_int(std::span<const uint8_t> data, unsigned width_bits, Endianness order,
                   bool is_signed = false);

/// True for the widths the codec supports (8, 16, 32).
[[nodiscard]] constexpr bool is_supported_width(unsigned width_bits) {
    return width_bits == 8 || width_bits == 16 || width_bits == 32;
}

} // namespace shed::protocol
