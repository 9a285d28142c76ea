// Codec.cpp – Encodium wire encode/decode engine.
//
// Wire-format reminder:
//   Wire value = [0x01][chunk…]          one chunk per schema field
//   Chunk      = [0x00]                  absent
//              | [length prefix][payload]
//
// Example – Person{age=25, name="Jo", diabetic=absent}:
//   01  01 19  03 01 4A 6F  00

#include "Encodium/Codec.hpp"
#include "Encodium/LengthCodec.hpp"
#include "Encodium/TypePlugin.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string>

namespace encodium {

// ─────────────────────────────────────────────────────────────────────────────
//  Encode
// ─────────────────────────────────────────────────────────────────────────────

Bytes serialize(const Record& record) {
    const Schema& schema = record.schema();
    const auto&   fields = schema.fields();
    const auto&   values = record.values();

    ByteWriter w;
    w.writeU8(kFormatMarker);

    for (std::size_t i = 0; i < fields.size(); ++i) {
        const FieldSpec& spec = fields[i];
        if (values[i].isAbsent()) {
            writeAbsentChunk(w);
            continue;
        }
        try {
            writeChunk(w, pluginFor(spec.kind).serializeValue(spec, values[i], schema));
        } catch (Error& e) {
            e.prependField(spec.name);
            throw;
        }
    }

    SPDLOG_TRACE("Serialized '{}' record into {} byte(s)", schema.name(), w.size());
    return w.take();
}

// ─────────────────────────────────────────────────────────────────────────────
//  Decode
// ─────────────────────────────────────────────────────────────────────────────

// Nested records decode recursively (RecordPlugin → deserialize), so the
// depth of the current thread's decode is tracked for the length of each call.
static thread_local std::size_t decodeDepth = 0;

class DecodeDepthGuard {
public:
    DecodeDepthGuard() {
        if (decodeDepth >= kMaxNestingDepth)
            throw WireError(ErrorKind::MalformedData,
                            "nesting too deep (more than " + std::to_string(kMaxNestingDepth) +
                                " levels of records)");
        ++decodeDepth;
    }
    ~DecodeDepthGuard() { --decodeDepth; }

    DecodeDepthGuard(const DecodeDepthGuard&)            = delete;
    DecodeDepthGuard& operator=(const DecodeDepthGuard&) = delete;
};

Record deserialize(SchemaPtr schema, std::span<const std::uint8_t> bytes) {
    if (!schema)
        throw SchemaError(ErrorKind::UnknownSchema, "deserialize called without a schema");

    const DecodeDepthGuard depth;

    ByteReader r{bytes};
    if (r.atEnd())
        throw WireError(ErrorKind::TruncatedData,
                        "empty buffer for '" + schema->name() + "' (format marker missing)");
    const std::uint8_t marker = r.readU8();
    if (marker != kFormatMarker)
        throw WireError(ErrorKind::UnsupportedFormat,
                        fmt::format("unsupported format marker {:#04x} for '{}'", marker,
                                    schema->name()));

    const std::vector<Chunk> chunks = readChunks(r);
    const auto&              fields = schema->fields();

    if (chunks.size() > fields.size())
        throw WireError(ErrorKind::ExtraChunks,
                        "'" + schema->name() + "' has " + std::to_string(fields.size()) +
                            " field(s) but the message carries " + std::to_string(chunks.size()) +
                            " chunk(s)");
    if (chunks.size() < fields.size())
        SPDLOG_DEBUG("'{}' message carries {} of {} field chunk(s); the rest are absent",
                     schema->name(), chunks.size(), fields.size());

    FieldValues values;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const FieldSpec& spec = fields[i];
        if (!chunks[i]) continue;
        try {
            values.emplace(spec.name, pluginFor(spec.kind).deserializeValue(spec, *chunks[i], *schema));
        } catch (Error& e) {
            e.prependField(spec.name);
            throw;
        }
    }

    SPDLOG_TRACE("Deserialized '{}' record from {} byte(s)", schema->name(), bytes.size());
    return construct(std::move(schema), std::move(values));
}

Record deserialize(const SchemaRegistry& registry, std::string_view schemaName,
                   std::span<const std::uint8_t> bytes) {
    return deserialize(registry.resolve(schemaName), bytes);
}

} // namespace encodium
