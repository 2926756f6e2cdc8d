#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace shed::protocol {

/// Decoded, structured representation of one record instance.
/// A value is an integer, a real (Float32 fields), a byte string, a record
/// (field name -> value) or an ordered list of values (Repeat fields).
class PacketValue {
  public:
    using Integer = int64_t;
    using Real = double;
    using Bytes = std::vector<uint8_t>;
    using Record = std::map<std::string, PacketValue, std::less<>>;
    using List = std::vector<PacketValue>;

    enum class Kind { Integer, Real, Bytes, Record, List };

    /// Default: an empty record.
    PacketValue() : value_(Record{}) {}
    template <typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
    PacketValue(T v) : value_(static_cast<Integer>(v)) {}
    PacketValue(Real v) : value_(v) {}
    PacketValue(Bytes v) : value_(std::move(v)) {}
    PacketValue(Record v) : value_(std::move(v)) {}
    PacketValue(List v) : value_(std::move(v)) {}

    /// Byte string from text (no terminator).
    static PacketValue from_string(std::string_view text);

    [[nodiscard]] Kind kind() const { return static_cast<Kind>(value_.index()); }
    [[nodiscard]] bool is_integer() const { return kind() == Kind::Integer; }
    [[nodiscard]] bool is_real() const { return kind() == Kind::Real; }
    [[nodiscard]] bool is_bytes() const { return kind() == Kind::Bytes; }
    [[nodiscard]] bool is_record() const { return kind() == Kind::Record; }
    [[nodiscard]] bool is_list() const { return kind() == Kind::List; }

    /// Typed accessors. Throw ValueError on a kind mismatch.
    [[nodiscard]] Integer as_integer() const;
    [[nodiscard]] Real as_real() const;
    [[nodiscard]] const Bytes &as_bytes() const;
    [[nodiscard]] const Record &as_record() const;
    [[nodiscard]] const List &as_list() const;
    Record &as_record();
    List &as_list();

    /// Byte string as text (embedded zeros kept).
    [[nodiscard]] std::string as_string() const;

    /// Record field access. `operator[]` inserts an empty record if missing.
    PacketValue &operator[](const std::string &name);
    /// Throws ValueError if this is not a record or `name` is missing.
    [[nodiscard]] const PacketValue &at(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;

    [[nodiscard]] static const char *kind_name(Kind kind);

    bool operator==(const PacketValue &other) const;

  private:
    std::variant<Integer, Real, Bytes, Record, List> value_;
};

} // namespace shed::protocol
