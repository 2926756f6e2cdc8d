#include "shed/protocol/packets.hpp"

namespace shed::protocol::packets {

std::shared_ptr<const StructSpec> address_header() {
    static const auto spec = StructBuilder("address_header")
                                 .add("dest_ip", field::ipv4())
                                 .add("src_ip", field::ipv4())
                                 .add("dest_port", field::u16())
                                 .add("src_port", field::u16())
                                 .build();
    return spec;
}

std::shared_ptr<const StructSpec> data_record() {
    static const auto spec = StructBuilder("data_record")
                                 .add("type", field::u8())
                                 .add("opcode", field::u8())
                                 .add("length", field::u16(Endianness::Little))
                                 .add("id", field::fixed_string(8))
                                 .add("data", field::vector("length"))
                                 .add("align", field::align(4))
                                 .build();
    return spec;
}

std::shared_ptr<const StructSpec> packet() {
    static const auto spec =
        StructBuilder("packet")
            .add("header", field::structure(address_header()))
            .add("sequence", field::u32(Endianness::Little))
            .add("item_count", field::u32(Endianness::Little))
            .add("items", field::repeat("item_count", field::structure(data_record())))
            .add("fill", field::padding(3))
            .build();
    return spec;
}

} // namespace shed::protocol::packets
