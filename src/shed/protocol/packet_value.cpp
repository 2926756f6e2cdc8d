#include "shed/protocol/packet_value.hpp"
#include "shed/protocol/errors.hpp"

#include <cmath>

namespace shed::protocol {

namespace {

[[noreturn]] void kind_mismatch(PacketValue::Kind expected, PacketValue::Kind actual) {
    throw ValueError(std::string("Expected ") + PacketValue::kind_name(expected) + " value, got " +
                     PacketValue::kind_name(actual));
}

} // namespace

PacketValue PacketValue::from_string(std::string_view text) {
    return PacketValue(Bytes(text.begin(), text.end()));
}

PacketValue::Integer PacketValue::as_integer() const {
    if (!is_integer()) {
        kind_mismatch(Kind::Integer, kind());
    }
    return std::get<Integer>(value_);
}

PacketValue::Real PacketValue::as_real() const {
    // Integers widen so callers can write record["x"] = 1 for a Float32 field.
    if (is_integer()) {
        return static_cast<Real>(std::get<Integer>(value_));
    }
    if (!is_real()) {
        kind_mismatch(Kind::Real, kind());
    }
    return std::get<Real>(value_);
}

const PacketValue::Bytes &PacketValue::as_bytes() const {
    if (!is_bytes()) {
        kind_mismatch(Kind::Bytes, kind());
    }
    return std::get<Bytes>(value_);
}

const PacketValue::Record &PacketValue::as_record() const {
    if (!is_record()) {
        kind_mismatch(Kind::Record, kind());
    }
    return std::get<Record>(value_);
}

PacketValue::Record &PacketValue::as_record() {
    if (!is_record()) {
        kind_mismatch(Kind::Record, kind());
    }
    return std::get<Record>(value_);
}

const PacketValue::List &PacketValue::as_list() const {
    if (!is_list()) {
        kind_mismatch(Kind::List, kind());
    }
    return std::get<List>(value_);
}

PacketValue::List &PacketValue::as_list() {
    if (!is_list()) {
        kind_mismatch(Kind::List, kind());
    }
    return std::get<List>(value_);
}

std::string PacketValue::as_string() const {
    const auto &bytes = as_bytes();
    return std::string(bytes.begin(), bytes.end());
}

PacketValue &PacketValue::operator[](const std::string &name) {
    auto &record = as_record();
    auto it = record.find(name);
    if (it == record.end()) {
        it = record.emplace(name, PacketValue{}).first;
    }
    return it->second;
}

const PacketValue &PacketValue::at(std::string_view name) const {
    const auto &record = as_record();
    auto it = record.find(name);
    if (it == record.end()) {
        throw ValueError("Missing field '" + std::string(name) + "'");
    }
    return it->second;
}

bool PacketValue::contains(std::string_view name) const {
    return is_record() && std::get<Record>(value_).find(name) != std::get<Record>(value_).end();
}

const char *PacketValue::kind_name(Kind kind) {
    switch (kind) {
    case Kind::Integer:
        return "integer";
    case Kind::Real:
        return "real";
    case Kind::Bytes:
        return "bytes";
    case Kind::Record:
        return "record";
    case Kind::List:
        return "list";
    }
    return "unknown";
}

bool PacketValue::operator==(const PacketValue &other) const {
    // NaN reals compare equal to each other so decoded NaN fields round-trip.
    if (is_real() && other.is_real()) {
        const Real a = std::get<Real>(value_);
        const Real b = std::get<Real>(other.value_);
        if (std::isnan(a) && std::isnan(b)) {
            return true;
        }
        return a == b;
    }
    return value_ == other.value_;
}

} // namespace shed::protocol
