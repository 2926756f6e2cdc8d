#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace shed::protocol {

/// Bit pattern chosen for +/- infinity.
/// Reference: exponent 255 with mantissa 0x7FFFFF, the pattern historic shed
/// peers emit (NaN-shaped on a strict IEEE reader).
/// Canonical: exponent 255 with mantissa 0.
enum class InfinityEncoding { Reference, Canonical };

inline constexpr uint32_t kReferenceInfinityMantissa = 0x7FFFFF;
inline constexpr uint32_t kNaNMantissa = 1;
inline constexpr int kFloat32Bias = 127;
inline constexpr uint32_t kMaxBiasedExponent = 255;

/// Sign / biased exponent / 23-bit mantissa triple of a single precision value.
struct Float32Fields {
    bool sign = false;
    uint32_t exponent = 0;
    uint32_t mantissa = 0;

    bool operator==(const Float32Fields &) const = default;
};

/// Split a real into single precision fields.
/// The magnitude is normalized into [1, 2) by repeated doubling/halving and
/// the fraction rounded (ties to even) to 23 bits. Values past the largest
/// exponent become infinity; values below the smallest normal become signed zero.
Float32Fields float32_fields(double value, InfinityEncoding infinity = InfinityEncoding::Reference);

/// Pack fields into 4 big-endian bytes.
std::array<uint8_t, 4> pack_float32(const Float32Fields &fields);

/// Unpack 4 big-endian bytes into fields.
Float32Fields unpack_float32(std::span<const uint8_t, 4> bytes);

/// Encode a real as 4 big-endian IEEE-754 single precision bytes.
std::array<uint8_t, 4> encode_float32(double value,
                                      InfinityEncoding infinity = InfinityEncoding::Reference);

/// Decode 4 big-endian bytes. Both infinity patterns decode to infinity;
/// any other exponent-255 pattern decodes to NaN.
/// Throws TruncatedInputError if fewer than 4 bytes are given.
double decode_float32(std::span<const uint8_t> data);

} // namespace shed::protocol
