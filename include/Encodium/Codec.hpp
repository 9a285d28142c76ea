#pragma once
// Codec.hpp – Public Encodium serialize / deserialize API.
//
// Wire value:
//   [0x01 format marker][chunk for field 0][chunk for field 1]…
//
// Chunks follow the schema's declaration order; see LengthCodec.hpp for the
// chunk framing and TypePlugin.hpp for per-kind payloads. No schema id is
// embedded: both ends agree on the schema out of band.
//
// Usage example:
//   Bytes wire = serialize(person);
//   Record copy = deserialize(registry.resolve("Person"), wire);

#include "Record.hpp"
#include "Schema.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace encodium {

constexpr std::uint8_t kFormatMarker = 0x01;

// Deepest chain of nested records deserialize() accepts, the outermost record
// counting as level 1. Deeper input raises WireError(MalformedData).
constexpr std::size_t kMaxNestingDepth = 512;

// Encode a validated record. Throws WireError(LengthTooLarge) only for
// payloads beyond 2^48 - 1 bytes.
[[nodiscard]] Bytes serialize(const Record& record);

// Decode bytes produced by serialize() for the same schema and validate the
// result through construct().
//
// Chunks pair with fields by position. Fewer chunks than fields leave the
// trailing fields absent (defaults and optionality then apply); more chunks
// than fields raise WireError(ExtraChunks).
//
// Records nested deeper than kMaxNestingDepth are rejected before the stack
// is at risk.
//
// Throws WireError (TruncatedData, MalformedData, UnsupportedFormat,
// ExtraChunks), ValidationError or SchemaError.
[[nodiscard]] Record deserialize(SchemaPtr schema, std::span<const std::uint8_t> bytes);

// Convenience: resolve the schema by name first.
[[nodiscard]] Record deserialize(const SchemaRegistry& registry, std::string_view schemaName,
                                 std::span<const std::uint8_t> bytes);

} // namespace encodium
