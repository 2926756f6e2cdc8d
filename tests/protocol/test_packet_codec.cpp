#include "shed/protocol/errors.hpp"
#include "shed/protocol/packet_codec.hpp"
#include "shed/protocol/packets.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using namespace shed::protocol;

namespace {

using Bytes = std::vector<uint8_t>;

PacketValue make_header() {
    PacketValue header;
    header["dest_ip"] = parse_ipv4("192.168.1.1");
    header["src_ip"] = parse_ipv4("10.0.0.2");
    header["dest_port"] = 80;
    header["src_port"] = 8080;
    return header;
}

PacketValue make_record(int type, int opcode, const std::string &id, const std::string &data) {
    PacketValue record;
    record["type"] = type;
    record["opcode"] = opcode;
    record["length"] = static_cast<PacketValue::Integer>(data.size());
    record["id"] = PacketValue::from_string(id);
    record["data"] = PacketValue::from_string(data);
    return record;
}

PacketValue make_packet() {
    PacketValue packet;
    packet["header"] = make_header();
    packet["sequence"] = 7;
    packet["item_count"] = 2;
    packet["items"] = PacketValue::List{make_record(1, 2, "abc", "hello"),
                                        make_record(3, 4, "longid77", "xy")};
    return packet;
}

} // namespace

TEST(PacketCodec, AddressHeaderExactBytes) {
    const auto bytes = encode(*packets::address_header(), make_header());
    const Bytes expected = {0xC0, 0xA8, 0x01, 0x01, 0x0A, 0x00, 0x00, 0x02,
                            0x00, 0x50, 0x1F, 0x90};
    EXPECT_EQ(bytes, expected);

    const auto decoded = decode(*packets::address_header(), bytes);
    EXPECT_EQ(decoded, make_header());
    EXPECT_EQ(format_ipv4(decoded.at("src_ip").as_bytes()), "10.0.0.2");
    EXPECT_EQ(decoded.at("src_port").as_integer(), 8080);
}

TEST(PacketCodec, DataRecordLayout) {
    const auto bytes = encode(*packets::data_record(), make_record(1, 2, "abc", "hello"));

    const Bytes expected = {
        0x01, 0x02,                                     // type, opcode
        0x05, 0x00,                                     // length, little-endian
        'a',  'b',  'c', 0x00, 0x00, 0x00, 0x00, 0x00, // id, no padding needed
        'h',  'e',  'l', 'l',  'o',                     // data
        0x00, 0x00, 0x00,                               // align 4
    };
    EXPECT_EQ(bytes, expected);
    EXPECT_EQ(decode(*packets::data_record(), bytes), make_record(1, 2, "abc", "hello"));
}

TEST(PacketCodec, PacketRoundTrip) {
    const auto value = make_packet();
    const auto bytes = encode(*packets::packet(), value);

    // header 12 + counters 8, record 17 -> 20, record 14 -> 16, fill 3
    EXPECT_EQ(bytes.size(), 59u);
    EXPECT_EQ(encoded_size(*packets::packet(), value), bytes.size());

    // Counters are little-endian.
    EXPECT_EQ(bytes[12], 7);
    EXPECT_EQ(bytes[16], 2);
    EXPECT_EQ(bytes[13], 0);

    size_t consumed = 0;
    const auto decoded = decode(*packets::packet(), bytes, consumed);
    EXPECT_EQ(consumed, bytes.size());
    EXPECT_EQ(decoded, value);

    const auto &items = decoded.at("items").as_list();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[1].at("id").as_string(), "longid77");
    EXPECT_EQ(items[1].at("data").as_string(), "xy");
}

TEST(PacketCodec, EncodedSizeChecksValue) {
    EXPECT_EQ(encoded_size(*packets::address_header(), make_header()), 12u);
    EXPECT_THROW((void)encoded_size(*packets::address_header(), PacketValue{}), ValueError);

    PacketValue header = make_header();
    header["dest_ip"] = PacketValue::Bytes{10, 0, 0};
    EXPECT_THROW((void)encoded_size(*packets::address_header(), header), ValueError);
}

TEST(PacketCodec, EmptyRepeat) {
    PacketValue value = make_packet();
    value["item_count"] = 0;
    value["items"] = PacketValue::List{};

    const auto bytes = encode(*packets::packet(), value);
    EXPECT_EQ(bytes.size(), 12u + 8u + 3u);
    EXPECT_EQ(decode(*packets::packet(), bytes), value);
}

TEST(PacketCodec, FixedStringPadding) {
    auto six = StructBuilder("six").add("s", field::fixed_string(6)).build();
    auto eight = StructBuilder("eight").add("s", field::fixed_string(8)).build();

    PacketValue value;
    value["s"] = PacketValue::from_string("abc");

    EXPECT_EQ(encode(*six, value), (Bytes{'a', 'b', 'c', 0, 0, 0, 0, 0}));
    EXPECT_EQ(encode(*eight, value).size(), 8u);
    EXPECT_EQ(decode(*six, encode(*six, value)), value);
}

TEST(PacketCodec, FixedStringTruncatesLongValues) {
    auto spec = StructBuilder("s").add("id", field::fixed_string(8)).build();
    PacketValue value;
    value["id"] = PacketValue::from_string("abcdefghij");

    const auto bytes = encode(*spec, value);
    EXPECT_EQ(bytes, (Bytes{'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h'}));
    EXPECT_EQ(decode(*spec, bytes).at("id").as_string(), "abcdefgh");
}

TEST(PacketCodec, VectorUsesReferencedLength) {
    auto spec = StructBuilder("v")
                    .add("len", field::u8())
                    .add("data", field::vector("len"))
                    .build();
    PacketValue value;
    value["len"] = 4;
    value["data"] = PacketValue::from_string("ab");

    // Short values are zero filled up to the referenced length.
    const auto bytes = encode(*spec, value);
    EXPECT_EQ(bytes, (Bytes{4, 'a', 'b', 0, 0}));
    EXPECT_EQ(decode(*spec, bytes).at("data").as_bytes(), (Bytes{'a', 'b', 0, 0}));

    // Long values are cut to the referenced length.
    value["data"] = PacketValue::from_string("abcdef");
    EXPECT_EQ(encode(*spec, value), (Bytes{4, 'a', 'b', 'c', 'd'}));
}

TEST(PacketCodec, IntegerFieldsWrap) {
    auto spec = StructBuilder("w").add("b", field::u8()).add("h", field::u16()).build();
    PacketValue value;
    value["b"] = 256;
    value["h"] = -1;
    EXPECT_EQ(encode(*spec, value), (Bytes{0x00, 0xFF, 0xFF}));
}

TEST(PacketCodec, Float32Field) {
    auto spec = StructBuilder("f")
                    .add("gain", field::float32())
                    .add("limit", field::float32(InfinityEncoding::Canonical))
                    .build();
    PacketValue value;
    value["gain"] = 1.5;
    value["limit"] = std::numeric_limits<double>::infinity();

    const auto bytes = encode(*spec, value);
    EXPECT_EQ(bytes, (Bytes{0x3F, 0xC0, 0x00, 0x00, 0x7F, 0x80, 0x00, 0x00}));
    EXPECT_EQ(decode(*spec, bytes), value);
}

TEST(PacketCodec, AlignIsRelativeToOutermostBuffer) {
    auto inner = StructBuilder("inner").add("b", field::u8()).add("al", field::align(4)).build();
    auto outer = StructBuilder("outer")
                     .add("a0", field::u8())
                     .add("a1", field::u8())
                     .add("inner", field::structure(inner))
                     .build();

    PacketValue in;
    in["b"] = 9;
    PacketValue out;
    out["a0"] = 1;
    out["a1"] = 2;
    out["inner"] = in;

    EXPECT_EQ(encode(*inner, in).size(), 4u);
    EXPECT_EQ(encode(*outer, out), (Bytes{1, 2, 9, 0}));
    EXPECT_EQ(decode(*outer, encode(*outer, out)), out);
}

TEST(PacketCodec, PaddingIsDiscardedOnDecode) {
    auto spec = StructBuilder("p")
                    .add("a", field::u8())
                    .add("gap", field::padding(2))
                    .add("b", field::u8())
                    .build();
    const Bytes bytes = {1, 0xEE, 0xEE, 2};
    const auto value = decode(*spec, bytes);
    EXPECT_FALSE(value.contains("gap"));
    EXPECT_EQ(value.at("b").as_integer(), 2);
}

TEST(PacketCodec, DecodeIgnoresTrailingBytes) {
    Bytes bytes = encode(*packets::address_header(), make_header());
    bytes.push_back(0xAA);

    size_t consumed = 0;
    EXPECT_EQ(decode(*packets::address_header(), bytes, consumed), make_header());
    EXPECT_EQ(consumed, 12u);
}

TEST(PacketCodec, TruncatedFixedField) {
    Bytes bytes = encode(*packets::address_header(), make_header());
    bytes.resize(11);

    try {
        (void)decode(*packets::address_header(), bytes);
        FAIL() << "expected TruncatedInputError";
    } catch (const TruncatedInputError &e) {
        EXPECT_EQ(e.field(), "address_header.src_port");
        EXPECT_EQ(e.offset(), 10u);
        EXPECT_EQ(e.needed(), 2u);
        EXPECT_EQ(e.available(), 1u);
    }
}

TEST(PacketCodec, TruncatedVector) {
    Bytes bytes = encode(*packets::data_record(), make_record(1, 2, "id", "hello"));
    bytes.resize(14); // header fields + 2 of the 5 data bytes

    try {
        (void)decode(*packets::data_record(), bytes);
        FAIL() << "expected TruncatedInputError";
    } catch (const TruncatedInputError &e) {
        EXPECT_EQ(e.field(), "data_record.data");
        EXPECT_EQ(e.needed(), 5u);
    }
}

TEST(PacketCodec, TruncatedRepeatCount) {
    // item_count claims 1000 records but none follow.
    PacketValue value = make_packet();
    value["item_count"] = 0;
    value["items"] = PacketValue::List{};
    Bytes bytes = encode(*packets::packet(), value);
    bytes[16] = 0xE8;
    bytes[17] = 0x03;

    EXPECT_THROW((void)decode(*packets::packet(), bytes), TruncatedInputError);
}

TEST(PacketCodec, RepeatCountMismatchRejected) {
    PacketValue value = make_packet();
    value["item_count"] = 3;
    EXPECT_THROW((void)encode(*packets::packet(), value), ValueError);
}

TEST(PacketCodec, MissingFieldRejected) {
    PacketValue header = make_header();
    header.as_record().erase("src_port");
    EXPECT_THROW((void)encode(*packets::address_header(), header), ValueError);
}

TEST(PacketCodec, WrongValueKindRejected) {
    PacketValue header = make_header();
    header["dest_port"] = PacketValue::from_string("80");
    EXPECT_THROW((void)encode(*packets::address_header(), header), ValueError);

    header = make_header();
    header["dest_ip"] = PacketValue::Bytes{10, 0, 0};
    EXPECT_THROW((void)encode(*packets::address_header(), header), ValueError);

    EXPECT_THROW((void)encode(*packets::address_header(), PacketValue(5)), ValueError);
}

TEST(PacketCodec, NegativeReferencedLengthRejected) {
    PacketValue record = make_record(1, 1, "x", "");
    record["length"] = -1;
    EXPECT_THROW((void)encode(*packets::data_record(), record), ValueError);
}
