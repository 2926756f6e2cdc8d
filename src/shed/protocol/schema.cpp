#include "shed/protocol/schema.hpp"
#include "shed/protocol/errors.hpp"

#include <algorithm>
#include <cmath>

namespace shed::protocol {

namespace {

size_t require_size(const nlohmann::json &desc, const char *key, const std::string &where) {
    if (!desc.contains(key) || !desc[key].is_number_unsigned()) {
        throw SchemaError(where + ": missing unsigned '" + key + "'");
    }
    return desc[key].get<size_t>();
}

std::string require_string(const nlohmann::json &desc, const char *key, const std::string &where) {
    if (!desc.contains(key) || !desc[key].is_string()) {
        throw SchemaError(where + ": missing string '" + key + "'");
    }
    return desc[key].get<std::string>();
}

Endianness parse_endianness(const nlohmann::json &desc, Endianness fallback,
                            const std::string &where) {
    if (!desc.contains("endian")) {
        return fallback;
    }
    const std::string endian = require_string(desc, "endian", where);
    if (endian == "big") {
        return Endianness::Big;
    }
    if (endian == "little") {
        return Endianness::Little;
    }
    throw SchemaError(where + ": unknown endian '" + endian + "'");
}

PacketValue::Bytes bytes_from_json(const nlohmann::json &json, const std::string &where) {
    if (json.is_string()) {
        const auto text = json.get<std::string>();
        return PacketValue::Bytes(text.begin(), text.end());
    }
    if (json.is_array()) {
        PacketValue::Bytes out;
        out.reserve(json.size());
        for (const auto &b : json) {
            if (!b.is_number_unsigned() || b.get<unsigned>() > 255) {
                throw ValueError(where + ": byte values must be in 0..255");
            }
            out.push_back(static_cast<uint8_t>(b.get<unsigned>()));
        }
        return out;
    }
    throw ValueError(where + ": expected string or byte array");
}

/// Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF.
bool is_valid_utf8(const PacketValue::Bytes &bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        const uint8_t lead = bytes[i];
        size_t extra = 0;
        uint32_t code = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        }
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= bytes.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            if ((bytes[i + k] & 0xC0) != 0x80) {
                return false;
            }
            code = (code << 6) | (bytes[i + k] & 0x3F);
        }
        static constexpr uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (code < kMinForLength[extra] || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

PacketValue element_from_json(const FieldSpec &spec, const nlohmann::json &json,
                              const std::string &where) {
    switch (spec.kind) {
    case FieldKind::IPv4:
        if (!json.is_string()) {
            throw ValueError(where + ": expected dotted IPv4 string");
        }
        return parse_ipv4(json.get<std::string>());
    case FieldKind::UInt:
        if (!json.is_number_integer()) {
            throw ValueError(where + ": expected integer");
        }
        return json.get<int64_t>();
    case FieldKind::Float32:
        if (json.is_null()) {
            // JSON has no NaN literal; null stands in for it.
            return std::nan("");
        }
        if (!json.is_number()) {
            throw ValueError(where + ": expected number");
        }
        return json.get<double>();
    case FieldKind::FixedString:
    case FieldKind::Vector:
        return bytes_from_json(json, where);
    case FieldKind::Struct:
        return value_from_json(*spec.nested, json);
    default:
        throw ValueError(where + ": field kind '" + std::string(field_kind_name(spec.kind)) +
                         "' has no JSON value");
    }
}

nlohmann::json element_to_json(const FieldSpec &spec, const PacketValue &value) {
    switch (spec.kind) {
    case FieldKind::IPv4:
        return format_ipv4(value.as_bytes());
    case FieldKind::UInt:
        return value.as_integer();
    case FieldKind::Float32: {
        const double real = value.as_real();
        if (std::isnan(real)) {
            return nullptr;
        }
        return real;
    }
    case FieldKind::FixedString: {
        // nlohmann::json only serializes UTF-8 strings; other bytes go out
        // as an array, which value_from_json accepts too.
        const auto &bytes = value.as_bytes();
        if (!is_valid_utf8(bytes)) {
            return bytes;
        }
        return value.as_string();
    }
    case FieldKind::Vector:
        return value.as_bytes();
    case FieldKind::Struct:
        return value_to_json(*spec.nested, value);
    default:
        return nullptr;
    }
}

void collect_dependencies(const nlohmann::json &desc, std::vector<std::string> &out) {
    if (!desc.is_object()) {
        return;
    }
    // Malformed entries are reported by parse_field_spec.
    const bool is_struct = desc.contains("type") && desc["type"].is_string() &&
                           desc["type"].get<std::string>() == "struct";
    if (is_struct && desc.contains("struct") && desc["struct"].is_string()) {
        out.push_back(desc["struct"].get<std::string>());
    }
    if (desc.contains("element")) {
        collect_dependencies(desc["element"], out);
    }
}

/// Names of the structs a struct's field list refers to.
std::vector<std::string> struct_dependencies(const nlohmann::json &fields) {
    std::vector<std::string> deps;
    for (const auto &desc : fields) {
        collect_dependencies(desc, deps);
    }
    return deps;
}

} // namespace

void SchemaSet::add(std::shared_ptr<const StructSpec> spec) {
    const std::string name = spec->name();
    if (!specs_.emplace(name, std::move(spec)).second) {
        throw SchemaError("Duplicate struct '" + name + "'");
    }
}

bool SchemaSet::contains(const std::string &name) const { return specs_.count(name) != 0; }

std::shared_ptr<const StructSpec> SchemaSet::get(const std::string &name) const {
    auto it = specs_.find(name);
    if (it == specs_.end()) {
        throw SchemaError("Unknown struct '" + name + "'");
    }
    return it->second;
}

std::vector<std::string> SchemaSet::names() const {
    std::vector<std::string> result;
    result.reserve(specs_.size());
    for (const auto &[name, spec] : specs_) {
        result.push_back(name);
    }
    return result;
}

FieldSpec parse_field_spec(const nlohmann::json &desc, const SchemaSet &known,
                           const std::string &where) {
    if (!desc.is_object()) {
        throw SchemaError(where + ": field description must be an object");
    }
    const std::string type = require_string(desc, "type", where);

    if (type == "ipv4") {
        return field::ipv4();
    }
    if (type == "u8") {
        return field::u8();
    }
    if (type == "u16" || type == "u32") {
        const unsigned width = type == "u16" ? 16 : 32;
        return field::integer(width, parse_endianness(desc, Endianness::Big, where));
    }
    if (type == "u16le" || type == "u32le") {
        const unsigned width = type == "u16le" ? 16 : 32;
        return field::integer(width, Endianness::Little);
    }
    if (type == "f32") {
        auto spec = field::float32();
        if (desc.contains("infinity")) {
            const std::string infinity = require_string(desc, "infinity", where);
            if (infinity == "canonical") {
                spec.infinity = InfinityEncoding::Canonical;
            } else if (infinity != "reference") {
                throw SchemaError(where + ": unknown infinity encoding '" + infinity + "'");
            }
        }
        return spec;
    }
    if (type == "str") {
        return field::fixed_string(require_size(desc, "length", where));
    }
    if (type == "vec") {
        return field::vector(require_string(desc, "length_ref", where));
    }
    if (type == "struct") {
        return field::structure(known.get(require_string(desc, "struct", where)));
    }
    if (type == "repeat") {
        if (!desc.contains("element")) {
            throw SchemaError(where + ": repeat missing 'element'");
        }
        return field::repeat(require_string(desc, "count_ref", where),
                             parse_field_spec(desc["element"], known, where + "[]"));
    }
    if (type == "pad") {
        return field::padding(require_size(desc, "length", where));
    }
    if (type == "align") {
        return field::align(require_size(desc, "to", where));
    }
    throw SchemaError(where + ": unknown field type '" + type + "'");
}

SchemaSet parse_schema(const nlohmann::json &doc) {
    if (!doc.is_object() || !doc.contains("structs") || !doc["structs"].is_object()) {
        throw SchemaError("Schema missing 'structs' object");
    }
    const auto &structs = doc["structs"];

    // Structs may reference each other in any key order; build each one
    // once everything it references has been built.
    std::vector<std::string> pending;
    for (auto &[name, fields] : structs.items()) {
        if (!fields.is_array()) {
            throw SchemaError("Struct '" + name + "' must be an array of fields");
        }
        for (const auto &dep : struct_dependencies(fields)) {
            if (!structs.contains(dep)) {
                throw SchemaError("Struct '" + name + "' references unknown struct '" + dep + "'");
            }
        }
        pending.push_back(name);
    }

    SchemaSet schema;
    while (!pending.empty()) {
        std::vector<std::string> deferred;
        for (const auto &name : pending) {
            const auto &fields_json = structs[name];
            const auto deps = struct_dependencies(fields_json);
            const bool ready = std::all_of(deps.begin(), deps.end(),
                                           [&](const std::string &d) { return schema.contains(d); });
            if (!ready) {
                deferred.push_back(name);
                continue;
            }

            std::vector<NamedField> fields;
            for (const auto &desc : fields_json) {
                const std::string field_name = require_string(desc, "name", name);
                fields.push_back(NamedField{
                    .name = field_name,
                    .spec = parse_field_spec(desc, schema, name + "." + field_name)});
            }
            schema.add(std::make_shared<const StructSpec>(name, std::move(fields)));
        }

        if (deferred.size() == pending.size()) {
            throw SchemaError("Cyclic struct references involving '" + deferred.front() + "'");
        }
        pending = std::move(deferred);
    }

    return schema;
}

PacketValue value_from_json(const StructSpec &spec, const nlohmann::json &json) {
    if (!json.is_object()) {
        throw ValueError(spec.name() + ": expected JSON object");
    }

    PacketValue record;
    for (const auto &f : spec.fields()) {
        if (!f.spec.carries_value()) {
            continue;
        }
        const std::string where = spec.name() + "." + f.name;
        if (!json.contains(f.name)) {
            throw ValueError(where + ": missing field");
        }
        const auto &field_json = json[f.name];

        if (f.spec.kind == FieldKind::Repeat) {
            if (!field_json.is_array()) {
                throw ValueError(where + ": expected array");
            }
            PacketValue::List items;
            for (size_t i = 0; i < field_json.size(); ++i) {
                items.push_back(element_from_json(*f.spec.element, field_json[i],
                                                  where + "[" + std::to_string(i) + "]"));
            }
            record[f.name] = std::move(items);
        } else {
            record[f.name] = element_from_json(f.spec, field_json, where);
        }
    }
    return record;
}

nlohmann::json value_to_json(const StructSpec &spec, const PacketValue &value) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto &f : spec.fields()) {
        if (!f.spec.carries_value()) {
            continue;
        }
        const auto &field_value = value.at(f.name);
        if (f.spec.kind == FieldKind::Repeat) {
            nlohmann::json items = nlohmann::json::array();
            for (const auto &item : field_value.as_list()) {
                items.push_back(element_to_json(*f.spec.element, item));
            }
            out[f.name] = std::move(items);
        } else {
            out[f.name] = element_to_json(f.spec, field_value);
        }
    }
    return out;
}

} // namespace shed::protocol
