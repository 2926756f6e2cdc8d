#include "shed/protocol/packet_codec.hpp"
#include "shed/protocol/errors.hpp"

#include <algorithm>
#include <string>

namespace shed::protocol {

namespace {

/// Appends encoded bytes.
class ByteWriter {
  public:
    void put(std::span<const uint8_t> bytes) { out_.insert(out_.end(), bytes.begin(), bytes.end()); }
    void put_int(int64_t value, unsigned width_bits, Endianness order) {
        encode_int(value, width_bits, order, out_);
    }
    void zeros(size_t count) { out_.insert(out_.end(), count, 0); }
    [[nodiscard]] size_t offset() const { return out_.size(); }
    std::vector<uint8_t> take() { return std::move(out_); }

  private:
    std::vector<uint8_t> out_;
};

/// Counts encoded bytes without storing them.
class SizeCounter {
  public:
    void put(std::span<const uint8_t> bytes) { offset_ += bytes.size(); }
    void put_int(int64_t /*value*/, unsigned width_bits, Endianness /*order*/) {
        offset_ += width_bits / 8;
    }
    void zeros(size_t count) { offset_ += count; }
    [[nodiscard]] size_t offset() const { return offset_; }

  private:
    size_t offset_ = 0;
};

size_t align_gap(size_t offset, size_t boundary) {
    const size_t rem = offset % boundary;
    return rem == 0 ? 0 : boundary - rem;
}

/// Resolved length/count of a Vector or Repeat field.
size_t referenced_count(const StructSpec &spec, const NamedField &f, const PacketValue &record,
                        const std::string &path) {
    const auto &target = spec.fields()[f.ref_index];
    const auto count = record.at(target.name).as_integer();
    if (count < 0) {
        throw ValueError(path + ": reference '" + target.name + "' holds negative value " +
                         std::to_string(count));
    }
    return static_cast<size_t>(count);
}

template <typename Writer> class Encoder {
  public:
    explicit Encoder(Writer &writer) : w_(writer) {}

    void encode_struct(const StructSpec &spec, const PacketValue &record, const std::string &path) {
        if (!record.is_record()) {
            throw ValueError(path + ": expected record value, got " +
                             PacketValue::kind_name(record.kind()));
        }
        for (const auto &f : spec.fields()) {
            const std::string field_path = path + "." + f.name;
            switch (f.spec.kind) {
            case FieldKind::Padding:
                w_.zeros(f.spec.length);
                break;
            case FieldKind::Align:
                w_.zeros(align_gap(w_.offset(), f.spec.length));
                break;
            case FieldKind::Vector: {
                const size_t n = referenced_count(spec, f, record, field_path);
                const auto &bytes = lookup(record, f.name, field_path).as_bytes();
                const size_t copied = std::min(n, bytes.size());
                w_.put(std::span<const uint8_t>(bytes.data(), copied));
                w_.zeros(n - copied);
                break;
            }
            case FieldKind::Repeat: {
                const size_t n = referenced_count(spec, f, record, field_path);
                const auto &items = lookup(record, f.name, field_path).as_list();
                if (items.size() != n) {
                    throw ValueError(field_path + ": expected " + std::to_string(n) +
                                     " elements, got " + std::to_string(items.size()));
                }
                for (size_t i = 0; i < n; ++i) {
                    encode_value(*f.spec.element, items[i],
                                 field_path + "[" + std::to_string(i) + "]");
                }
                break;
            }
            default:
                encode_value(f.spec, lookup(record, f.name, field_path), field_path);
                break;
            }
        }
    }

  private:
    static const PacketValue &lookup(const PacketValue &record, const std::string &name,
                                     const std::string &path) {
        if (!record.contains(name)) {
            throw ValueError(path + ": missing field");
        }
        return record.at(name);
    }

    /// Fields whose encoding needs nothing but their own value.
    void encode_value(const FieldSpec &spec, const PacketValue &value, const std::string &path) {
        switch (spec.kind) {
        case FieldKind::IPv4: {
            const auto &bytes = value.as_bytes();
            if (bytes.size() != 4) {
                throw ValueError(path + ": IPv4 value must be 4 bytes, got " +
                                 std::to_string(bytes.size()));
            }
            w_.put(bytes);
            break;
        }
        case FieldKind::UInt:
            w_.put_int(value.as_integer(), spec.width_bits, spec.endianness);
            break;
        case FieldKind::Float32: {
            const auto bytes = encode_float32(value.as_real(), spec.infinity);
            w_.put(bytes);
            break;
        }
        case FieldKind::FixedString: {
            const auto &bytes = value.as_bytes();
            const size_t copied = std::min(spec.length, bytes.size());
            w_.put(std::span<const uint8_t>(bytes.data(), copied));
            w_.zeros(spec.length - copied + string_padding(spec.length));
            break;
        }
        case FieldKind::Struct:
            encode_struct(*spec.nested, value, path);
            break;
        default:
            // Vector/Repeat/Padding/Align are handled with their struct context.
            throw SchemaError(path + ": field kind '" + field_kind_name(spec.kind) +
                              "' needs an enclosing struct");
        }
    }

    Writer &w_;
};

class Decoder {
  public:
    explicit Decoder(std::span<const uint8_t> data) : data_(data) {}

    PacketValue decode_struct(const StructSpec &spec, const std::string &path) {
        PacketValue record;
        for (const auto &f : spec.fields()) {
            const std::string field_path = path + "." + f.name;
            switch (f.spec.kind) {
            case FieldKind::Padding:
                take(f.spec.length, field_path);
                break;
            case FieldKind::Align:
                take(align_gap(pos_, f.spec.length), field_path);
                break;
            case FieldKind::Vector: {
                const size_t n = referenced_count(spec, f, record, field_path);
                auto bytes = take(n, field_path);
                record[f.name] = PacketValue::Bytes(bytes.begin(), bytes.end());
                break;
            }
            case FieldKind::Repeat: {
                const size_t n = referenced_count(spec, f, record, field_path);
                PacketValue::List items;
                items.reserve(std::min<size_t>(n, remaining()));
                for (size_t i = 0; i < n; ++i) {
                    items.push_back(
                        decode_value(*f.spec.element, field_path + "[" + std::to_string(i) + "]"));
                }
                record[f.name] = std::move(items);
                break;
            }
            default:
                record[f.name] = decode_value(f.spec, field_path);
                break;
            }
        }
        return record;
    }

    [[nodiscard]] size_t position() const { return pos_; }

  private:
    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }

    std::span<const uint8_t> take(size_t n, const std::string &path) {
        if (n > remaining()) {
            throw TruncatedInputError(path, pos_, n, remaining());
        }
        auto out = data_.subspan(pos_, n);
        pos_ += n;
        return out;
    }

    PacketValue decode_value(const FieldSpec &spec, const std::string &path) {
        switch (spec.kind) {
        case FieldKind::IPv4: {
            auto bytes = take(4, path);
            return PacketValue::Bytes(bytes.begin(), bytes.end());
        }
        case FieldKind::UInt:
            return decode_int(take(spec.width_bits / 8, path), spec.width_bits, spec.endianness);
        case FieldKind::Float32:
            return decode_float32(take(4, path));
        case FieldKind::FixedString: {
            auto window = take(spec.length, path);
            take(string_padding(spec.length), path);
            // Zero-terminated: the value stops at the first NUL.
            auto nul = std::find(window.begin(), window.end(), uint8_t{0});
            return PacketValue::Bytes(window.begin(), nul);
        }
        case FieldKind::Struct:
            return decode_struct(*spec.nested, path);
        default:
            throw SchemaError(path + ": field kind '" + std::string(field_kind_name(spec.kind)) +
                              "' needs an enclosing struct");
        }
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace

std::vector<uint8_t> encode(const StructSpec &spec, const PacketValue &value) {
    ByteWriter writer;
    Encoder<ByteWriter>(writer).encode_struct(spec, value, spec.name());
    return writer.take();
}

size_t encoded_size(const StructSpec &spec, const PacketValue &value) {
    // Always walk the value, even for fixed layouts, so it is checked like encode().
    SizeCounter counter;
    Encoder<SizeCounter>(counter).encode_struct(spec, value, spec.name());
    return counter.offset();
}

PacketValue decode(const StructSpec &spec, std::span<const uint8_t> data, size_t &consumed) {
    Decoder decoder(data);
    auto value = decoder.decode_struct(spec, spec.name());
    consumed = decoder.position();
    return value;
}

PacketValue decode(const StructSpec &spec, std::span<const uint8_t> data) {
    size_t consumed = 0;
    return decode(spec, data, consumed);
}

} // namespace shed::protocol
