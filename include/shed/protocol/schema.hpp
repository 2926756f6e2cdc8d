#pragma once

#include "shed/protocol/field_spec.hpp"
#include "shed/protocol/packet_value.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace shed::protocol {

/// Named StructSpecs loaded from one schema document.
class SchemaSet {
  public:
    void add(std::shared_ptr<const StructSpec> spec);

    [[nodiscard]] bool contains(const std::string &name) const;
    /// Throws SchemaError if `name` is unknown.
    [[nodiscard]] std::shared_ptr<const StructSpec> get(const std::string &name) const;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] size_t size() const { return specs_.size(); }

  private:
    std::map<std::string, std::shared_ptr<const StructSpec>> specs_;
};

/// Parse a schema document.
/// Expects: {"structs": {"name": [{"name": "f", "type": "u16", ...}, ...], ...}}
/// Struct references may name any struct in the document; cycles are rejected.
/// Throws SchemaError on any malformed entry.
SchemaSet parse_schema(const nlohmann::json &doc);

/// Parse one field description. `known` supplies nested struct references.
FieldSpec parse_field_spec(const nlohmann::json &desc, const SchemaSet &known,
                           const std::string &where);

/// Schema-directed conversion from JSON. IPv4 fields take dotted strings,
/// str fields take strings, vec fields take strings or arrays of byte values.
/// Throws ValueError when `json` does not match the spec.
PacketValue value_from_json(const StructSpec &spec, const nlohmann::json &json);

/// Inverse of value_from_json.
nlohmann::json value_to_json(const StructSpec &spec, const PacketValue &value);

} // namespace shed::protocol
