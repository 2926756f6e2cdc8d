#include "shed/protocol/field_spec.hpp"
#include "shed/protocol/errors.hpp"

#include <algorithm>
#include <charconv>
#include <unordered_set>

namespace shed::protocol {

namespace field {

FieldSpec ipv4() { return FieldSpec{.kind = FieldKind::IPv4}; }

FieldSpec integer(unsigned width_bits, Endianness order) {
    return FieldSpec{.kind = FieldKind::UInt, .width_bits = width_bits, .endianness = order};
}

FieldSpec u8() { return integer(8); }
FieldSpec u16(Endianness order) { return integer(16, order); }
FieldSpec u32(Endianness order) { return integer(32, order); }

FieldSpec float32(InfinityEncoding infinity) {
    return FieldSpec{.kind = FieldKind::Float32, .infinity = infinity};
}

FieldSpec fixed_string(size_t length) {
    return FieldSpec{.kind = FieldKind::FixedString, .length = length};
}

FieldSpec vector(std::string length_ref) {
    return FieldSpec{.kind = FieldKind::Vector, .ref = std::move(length_ref)};
}

FieldSpec structure(std::shared_ptr<const StructSpec> spec) {
    return FieldSpec{.kind = FieldKind::Struct, .nested = std::move(spec)};
}

FieldSpec repeat(std::string count_ref, FieldSpec element) {
    return FieldSpec{.kind = FieldKind::Repeat,
                     .ref = std::move(count_ref),
                     .element = std::make_shared<const FieldSpec>(std::move(element))};
}

FieldSpec padding(size_t count) { return FieldSpec{.kind = FieldKind::Padding, .length = count}; }

FieldSpec align(size_t boundary) { return FieldSpec{.kind = FieldKind::Align, .length = boundary}; }

} // namespace field

namespace {

/// Fewest bytes a field can occupy. Vector, Repeat and Align may be empty.
size_t field_min_size(const FieldSpec &spec) {
    switch (spec.kind) {
    case FieldKind::IPv4:
    case FieldKind::Float32:
        return 4;
    case FieldKind::UInt:
        return spec.width_bits / 8;
    case FieldKind::FixedString:
        return spec.length + string_padding(spec.length);
    case FieldKind::Padding:
        return spec.length;
    case FieldKind::Struct: {
        size_t total = 0;
        for (const auto &f : spec.nested->fields()) {
            total += field_min_size(f.spec);
        }
        return total;
    }
    case FieldKind::Vector:
    case FieldKind::Repeat:
    case FieldKind::Align:
        return 0;
    }
    return 0;
}

void validate_leaf(const std::string &where, const FieldSpec &spec) {
    switch (spec.kind) {
    case FieldKind::UInt:
        if (!is_supported_width(spec.width_bits)) {
            throw SchemaError(where + ": unsupported integer width " +
                              std::to_string(spec.width_bits));
        }
        break;
    case FieldKind::Align:
        if (spec.length == 0) {
            throw SchemaError(where + ": alignment boundary must be positive");
        }
        break;
    case FieldKind::Struct:
        if (!spec.nested) {
            throw SchemaError(where + ": struct field has no nested spec");
        }
        break;
    case FieldKind::Repeat: {
        if (!spec.element) {
            throw SchemaError(where + ": repeat field has no element spec");
        }
        const auto &element = *spec.element;
        if (element.has_reference() || !element.carries_value()) {
            throw SchemaError(where + ": repeat element of kind '" +
                              field_kind_name(element.kind) + "' is not allowed");
        }
        validate_leaf(where + "[]", element);
        // Every element must consume input, so the decoded count is bounded by the buffer.
        if (field_min_size(element) == 0) {
            throw SchemaError(where + ": repeat element may encode to zero bytes");
        }
        break;
    }
    default:
        break;
    }
}

std::optional<size_t> field_fixed_size(const FieldSpec &spec) {
    switch (spec.kind) {
    case FieldKind::IPv4:
    case FieldKind::Float32:
        return 4;
    case FieldKind::UInt:
        return spec.width_bits / 8;
    case FieldKind::FixedString:
        return spec.length + string_padding(spec.length);
    case FieldKind::Padding:
        return spec.length;
    case FieldKind::Struct:
        return spec.nested->fixed_size();
    case FieldKind::Vector:
    case FieldKind::Repeat:
    case FieldKind::Align:
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace

StructSpec::StructSpec(std::string name, std::vector<NamedField> fields)
    : name_(std::move(name)), fields_(std::move(fields)) {
    validate();
}

void StructSpec::validate() {
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < fields_.size(); ++i) {
        auto &f = fields_[i];
        const std::string where = name_ + "." + f.name;

        if (f.name.empty()) {
            throw SchemaError(name_ + ": field #" + std::to_string(i) + " has no name");
        }
        if (!seen.insert(f.name).second) {
            throw SchemaError(name_ + ": duplicate field name '" + f.name + "'");
        }

        validate_leaf(where, f.spec);

        f.ref_index = NamedField::kNoRef;
        if (!f.spec.has_reference()) {
            continue;
        }

        // References resolve against fields strictly before this one.
        std::optional<size_t> target;
        for (size_t j = 0; j < i; ++j) {
            if (fields_[j].name == f.spec.ref) {
                target = j;
                break;
            }
        }
        if (!target) {
            const bool later = std::any_of(fields_.begin() + static_cast<std::ptrdiff_t>(i),
                                           fields_.end(),
                                           [&](const NamedField &o) { return o.name == f.spec.ref; });
            throw SchemaError(where + ": reference '" + f.spec.ref + "' " +
                              (later ? "is not defined before this field" : "is undefined"));
        }
        if (fields_[*target].spec.kind != FieldKind::UInt) {
            throw SchemaError(where + ": reference '" + f.spec.ref + "' is a " +
                              field_kind_name(fields_[*target].spec.kind) +
                              " field, expected uint");
        }
        f.ref_index = *target;
    }
}

std::optional<size_t> StructSpec::index_of(std::string_view field_name) const {
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == field_name) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<size_t> StructSpec::fixed_size() const {
    size_t total = 0;
    for (const auto &f : fields_) {
        const auto size = field_fixed_size(f.spec);
        if (!size) {
            return std::nullopt;
        }
        total += *size;
    }
    return total;
}

StructBuilder::StructBuilder(std::string name) : name_(std::move(name)) {}

StructBuilder &StructBuilder::add(std::string field_name, FieldSpec spec) {
    fields_.push_back(NamedField{.name = std::move(field_name), .spec = std::move(spec)});
    return *this;
}

std::shared_ptr<const StructSpec> StructBuilder::build() const {
    return std::make_shared<const StructSpec>(name_, fields_);
}

PacketValue::Bytes parse_ipv4(std::string_view dotted) {
    PacketValue::Bytes out;
    out.reserve(4);

    const char *p = dotted.data();
    const char *end = dotted.data() + dotted.size();
    for (int octet = 0; octet < 4; ++octet) {
        if (octet > 0) {
            if (p == end || *p != '.') {
                throw ValueError("Malformed IPv4 address '" + std::string(dotted) + "'");
            }
            ++p;
        }
        unsigned value = 0;
        auto [next, ec] = std::from_chars(p, end, value);
        if (ec != std::errc{} || next == p || value > 255) {
            throw ValueError("Malformed IPv4 address '" + std::string(dotted) + "'");
        }
        out.push_back(static_cast<uint8_t>(value));
        p = next;
    }
    if (p != end) {
        throw ValueError("Malformed IPv4 address '" + std::string(dotted) + "'");
    }
    return out;
}

std::string format_ipv4(const PacketValue::Bytes &address) {
    if (address.size() != 4) {
        throw ValueError("IPv4 address must be 4 bytes, got " + std::to_string(address.size()));
    }
    return std::to_string(address[0]) + "." + std::to_string(address[1]) + "." +
           std::to_string(address[2]) + "." + std::to_string(address[3]);
}

const char *field_kind_name(FieldKind kind) {
    switch (kind) {
    case FieldKind::IPv4:
        return "ipv4";
    case FieldKind::UInt:
        return "uint";
    case FieldKind::Float32:
        return "f32";
    case FieldKind::FixedString:
        return "str";
    case FieldKind::Vector:
        return "vec";
    case FieldKind::Struct:
        return "struct";
    case FieldKind::Repeat:
        return "repeat";
    case FieldKind::Padding:
        return "pad";
    case FieldKind::Align:
        return "align";
    }
    return "unknown";
}

} // namespace shed::protocol
