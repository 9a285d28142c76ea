#pragma once
// TypePlugin.hpp – Per-kind validation and payload encoding.
//
// Payload encodings (the bytes a chunk frames):
//   Boolean  [01] true / [00] false
//   Integer  minimal big-endian two's complement (signed) or unsigned
//   Bytes    [01][raw bytes]
//   String   [01][UTF-8 bytes]
//   List     [01][chunk][chunk]…       one chunk per element
//   Record   [01][chunk][chunk]…       full wire value of the nested record

#include "Schema.hpp"
#include "Types.hpp"

#include <cstdint>
#include <span>

namespace encodium {

constexpr std::uint8_t kPresenceByte = 0x01;

// Capability contract every field kind implements.
// `owner` is the schema declaring the field; nested schema references are
// resolved through it.
class TypePlugin {
public:
    virtual ~TypePlugin() = default;

    [[nodiscard]] virtual FieldKind kind() const noexcept = 0;

    // Throws ValidationError(TypeMismatch). Value is never absent here.
    virtual void checkType(const FieldSpec& spec, const Value& value, const Schema& owner) const;

    // Throws ValidationError(ConstraintViolation/TooLong). Runs before
    // checkType, so values of the wrong kind are left for checkType to reject.
    virtual void checkConstraints(const FieldSpec& spec, const Value& value,
                                  const Schema& owner) const;

    [[nodiscard]] virtual Bytes serializeValue(const FieldSpec& spec, const Value& value,
                                               const Schema& owner) const = 0;

    // Throws WireError(MalformedData/TruncatedData) on a bad payload.
    [[nodiscard]] virtual Value deserializeValue(const FieldSpec& spec,
                                                 std::span<const std::uint8_t> payload,
                                                 const Schema& owner) const = 0;
};

[[nodiscard]] const TypePlugin& pluginFor(FieldKind kind);

// The per-field validation pipeline: optionality, then constraints, then type.
// Errors are not annotated with spec.name; callers add their own segment.
void checkValue(const FieldSpec& spec, const Value& value, const Schema& owner);

} // namespace encodium
