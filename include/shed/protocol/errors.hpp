#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace shed::protocol {

/// Base class for every failure raised by the packet codec.
class CodecError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Ill-formed StructSpec: duplicate field name, undefined or forward
/// length/count reference, unsupported width, unknown nested struct.
/// Raised when a schema is validated, before any encode/decode.
class SchemaError : public CodecError {
  public:
    using CodecError::CodecError;
};

/// Decode ran past the end of the supplied buffer.
class TruncatedInputError : public CodecError {
  public:
    TruncatedInputError(const std::string &field, size_t offset, size_t needed, size_t available)
        : CodecError("Truncated input at field '" + field + "': need " + std::to_string(needed) +
                     " bytes at offset " + std::to_string(offset) + ", have " +
                     std::to_string(available)),
          field_(field), offset_(offset), needed_(needed), available_(available) {}

    [[nodiscard]] const std::string &field() const { return field_; }
    [[nodiscard]] size_t offset() const { return offset_; }
    [[nodiscard]] size_t needed() const { return needed_; }
    [[nodiscard]] size_t available() const { return available_; }

  private:
    std::string field_;
    size_t offset_;
    size_t needed_;
    size_t available_;
};

/// A PacketValue does not fit the schema it is encoded against
/// (missing field, wrong kind, repeat count mismatch).
class ValueError : public CodecError {
  public:
    using CodecError::CodecError;
};

} // namespace shed::protocol
