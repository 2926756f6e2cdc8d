#include "shed/protocol/float32.hpp"
#include "shed/protocol/errors.hpp"

#include <cmath>
#include <limits>

namespace shed::protocol {

namespace {

constexpr double kMantissaScale = 8388608.0; // 2^23
constexpr uint32_t kMantissaMask = 0x7FFFFF;

Float32Fields infinity_fields(bool sign, InfinityEncoding infinity) {
    return Float32Fields{
        .sign = sign,
        .exponent = kMaxBiasedExponent,
        .mantissa = infinity == InfinityEncoding::Reference ? kReferenceInfinityMantissa : 0,
    };
}

} // namespace

Float32Fields float32_fields(double value, InfinityEncoding infinity) {
    if (std::isnan(value)) {
        return Float32Fields{.sign = false, .exponent = kMaxBiasedExponent, .mantissa = kNaNMantissa};
    }

    const bool sign = std::signbit(value);
    if (std::isinf(value)) {
        return infinity_fields(sign, infinity);
    }
    if (value == 0.0) {
        return Float32Fields{.sign = sign, .exponent = 0, .mantissa = 0};
    }

    double normalized = std::fabs(value);
    int exponent = 0;
    while (normalized >= 2.0) {
        normalized /= 2.0;
        ++exponent;
    }
    while (normalized < 1.0) {
        normalized *= 2.0;
        --exponent;
    }

    int biased = exponent + kFloat32Bias;
    auto mantissa = static_cast<uint32_t>(std::nearbyint((normalized - 1.0) * kMantissaScale));
    if (mantissa > kMantissaMask) {
        // Rounded up to 2.0: carry into the exponent.
        mantissa = 0;
        ++biased;
    }

    if (biased >= static_cast<int>(kMaxBiasedExponent)) {
        return infinity_fields(sign, infinity);
    }
    if (biased <= 0) {
        return Float32Fields{.sign = sign, .exponent = 0, .mantissa = 0};
    }
    return Float32Fields{.sign = sign, .exponent = static_cast<uint32_t>(biased), .mantissa = mantissa};
}

std::array<uint8_t, 4> pack_float32(const Float32Fields &fields) {
    const uint32_t sign = fields.sign ? 1U : 0U;
    return {
        static_cast<uint8_t>((sign << 7) | ((fields.exponent >> 1) & 0x7F)),
        static_cast<uint8_t>(((fields.exponent & 1U) << 7) | ((fields.mantissa >> 16) & 0x7F)),
        static_cast<uint8_t>((fields.mantissa >> 8) & 0xFF),
        static_cast<uint8_t>(fields.mantissa & 0xFF),
    };
}

Float32Fields unpack_float32(std::span<const uint8_t, 4> bytes) {
    return Float32Fields{
        .sign = (bytes[0] & 0x80) != 0,
        .exponent = (static_cast<uint32_t>(bytes[0] & 0x7F) << 1) | (bytes[1] >> 7),
        .mantissa = (static_cast<uint32_t>(bytes[1] & 0x7F) << 16) |
                    (static_cast<uint32_t>(bytes[2]) << 8) | bytes[3],
    };
}

std::array<uint8_t, 4> encode_float32(double value, InfinityEncoding infinity) {
    return pack_float32(float32_fields(value, infinity));
}

double decode_float32(std::span<const uint8_t> data) {
    if (data.size() < 4) {
        throw TruncatedInputError("f32", 0, 4, data.size());
    }
    const auto fields = unpack_float32(data.first<4>());

    double magnitude = 0.0;
    if (fields.exponent == kMaxBiasedExponent) {
        if (fields.mantissa == 0 || fields.mantissa == kReferenceInfinityMantissa) {
            magnitude = std::numeric_limits<double>::infinity();
        } else {
            return std::numeric_limits<double>::quiet_NaN();
        }
    } else if (fields.exponent == 0) {
        // Subnormal (or zero): no implicit leading one.
        magnitude = std::ldexp(static_cast<double>(fields.mantissa), -149);
    } else {
        magnitude = std::ldexp(1.0 + static_cast<double>(fields.mantissa) / kMantissaScale,
                               static_cast<int>(fields.exponent) - kFloat32Bias);
    }
    return fields.sign ? -magnitude : magnitude;
}

} // namespace shed::protocol
