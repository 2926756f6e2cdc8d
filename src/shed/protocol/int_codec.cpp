#include "shed/protocol/int_codec.hpp"
#include "shed/protocol/errors.hpp"

#include <stdexcept>
#include <string>

namespace shed::protocol {

namespace {

void check_width(unsigned width_bits) {
    if (!is_supported_width(width_bits)) {
        throw std::invalid_argument("Unsupported integer width: " + std::to_string(width_bits));
    }
}

} // namespace

void encode_int(int64_t value, unsigned width_bits, Endianness order, std::vector<uint8_t> &out) {
    check_width(width_bits);
    const size_t n = width_bits / 8;
    // Two's complement truncation: the low `width_bits` bits survive.
    const auto bits = static_cast<uint64_t>(value);
    for (size_t i = 0; i < n; ++i) {
        const size_t shift = (order == Endianness::Big) ? (n - 1 - i) * 8 : i * 8;
        out.push_back(static_cast<uint8_t>((bits >> shift) & 0xFF));
    }
}

std::vector<uint8_t> encode_int(int64_t value, unsigned width_bits, Endianness order) {
    std::vector<uint8_t> out;
    out.reserve(width_bits / 8);
    encode_int(value, width_bits, order, out);
    return out;
}

int64_t decode_int(std::span<const uint8_t> data, unsigned width_bits, Endianness order,
                   bool is_signed) {
    check_width(width_bits);
    const size_t n = width_bits / 8;
    if (data.size() < n) {
        throw TruncatedInputError("u" + std::to_string(width_bits), 0, n, data.size());
    }

    uint64_t bits = 0;
    for (size_t i = 0; i < n; ++i) {
        const size_t shift = (order == Endianness::Big) ? (n - 1 - i) * 8 : i * 8;
        bits |= static_cast<uint64_t>(data[i]) << shift;
    }

    if (is_signed) {
        const uint64_t sign_bit = uint64_t{1} << (width_bits - 1);
        if ((bits & sign_bit) != 0) {
            bits |= ~((sign_bit << 1) - 1);
        }
    }
    return static_cast<int64_t>(bits);
}

} // namespace shed::protocol
