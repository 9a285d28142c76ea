// TypePlugins.cpp – Built-in field kinds.

#include "Encodium/TypePlugin.hpp"
#include "Encodium/Codec.hpp"
#include "Encodium/LengthCodec.hpp"
#include "Encodium/Record.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace encodium {

// ─────────────────────────────────────────────────────────────────────────────
//  Shared helpers
// ─────────────────────────────────────────────────────────────────────────────

void TypePlugin::checkType(const FieldSpec& spec, const Value& value, const Schema&) const {
    const ValueKind expected = valueKindOf(spec.kind);
    if (value.kind() != expected)
        throw ValidationError(ErrorKind::TypeMismatch,
                              std::string("is of type ") + kindName(value.kind()) + ", expected " +
                                  kindName(expected));
}

void TypePlugin::checkConstraints(const FieldSpec&, const Value&, const Schema&) const {}

void checkValue(const FieldSpec& spec, const Value& value, const Schema& owner) {
    if (value.isAbsent()) {
        if (!spec.options.optional)
            throw ValidationError(ErrorKind::MissingValue, "cannot be absent");
        return;
    }
    const TypePlugin& plugin = pluginFor(spec.kind);
    plugin.checkConstraints(spec, value, owner);
    plugin.checkType(spec, value, owner);
}

static void tooLong(std::size_t actual, std::size_t limit, const char* unit) {
    throw ValidationError(ErrorKind::TooLong, "is too long (" + std::to_string(actual) + " " +
                                                  unit + ", max " + std::to_string(limit) + ")");
}

// Strip and verify the leading presence byte of a Bytes/String/List payload.
static std::span<const std::uint8_t> body(std::span<const std::uint8_t> payload, FieldKind kind) {
    if (payload.empty() || payload[0] != kPresenceByte)
        throw WireError(ErrorKind::MalformedData,
                        std::string(kindName(kind)) + " payload lacks its presence byte");
    return payload.subspan(1);
}

static Bytes withPresence(std::span<const std::uint8_t> data) {
    ByteWriter w;
    w.writeU8(kPresenceByte);
    w.writeBytes(data);
    return w.take();
}

// Structural UTF-8 check: lead/continuation pattern, no overlongs, no
// surrogates, nothing past U+10FFFF.
static bool validUtf8(const std::string& s) {
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        const auto c = static_cast<std::uint8_t>(s[i]);
        std::size_t   len;
        std::uint32_t cp;
        if (c < 0x80)           { ++i; continue; }
        else if ((c >> 5) == 6) { len = 2; cp = c & 0x1Fu; }
        else if ((c >> 4) == 14){ len = 3; cp = c & 0x0Fu; }
        else if ((c >> 3) == 30){ len = 4; cp = c & 0x07u; }
        else return false;

        if (i + len > n) return false;
        for (std::size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<std::uint8_t>(s[i + k]);
            if ((cc >> 6) != 2) return false;
            cp = (cp << 6) | (cc & 0x3Fu);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

static std::size_t codePoints(const std::string& s) {
    std::size_t count = 0;
    for (char ch : s)
        if ((static_cast<std::uint8_t>(ch) & 0xC0u) != 0x80u) ++count;
    return count;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Boolean
// ─────────────────────────────────────────────────────────────────────────────

class BooleanPlugin final : public TypePlugin {
public:
    FieldKind kind() const noexcept override { return FieldKind::Boolean; }

    Bytes serializeValue(const FieldSpec&, const Value& value, const Schema&) const override {
        return {static_cast<std::uint8_t>(value.asBool() ? 0x01 : 0x00)};
    }

    Value deserializeValue(const FieldSpec&, std::span<const std::uint8_t> payload,
                           const Schema&) const override {
        if (payload.size() != 1 || payload[0] > 0x01)
            throw WireError(ErrorKind::MalformedData,
                            "boolean payload must be a single 00 or 01 byte");
        return Value{payload[0] == 0x01};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
//  Integer
// ─────────────────────────────────────────────────────────────────────────────
// Signed values use the fewest bytes n for which
//   -2^(8n-1) ≤ value ≤ 2^(8n-1) - 1
// so a positive value whose bit length is a multiple of 8 gains a leading zero
// byte (128 → 00 80). Unsigned values use the fewest bytes, at least one.

class IntegerPlugin final : public TypePlugin {
public:
    FieldKind kind() const noexcept override { return FieldKind::Integer; }

    void checkConstraints(const FieldSpec& spec, const Value& value,
                          const Schema&) const override {
        if (value.kind() != ValueKind::Integer) return;
        const std::int64_t   v = value.asInt();
        const FieldOptions& o = spec.options;
        if (!o.isSigned && v < 0)
            throw ValidationError(ErrorKind::ConstraintViolation,
                                  "cannot be negative (" + std::to_string(v) + ")");
        if (o.minValue && v < *o.minValue)
            throw ValidationError(ErrorKind::ConstraintViolation,
                                  "is below the minimum (" + std::to_string(v) + " < " +
                                      std::to_string(*o.minValue) + ")");
        if (o.maxValue && v > *o.maxValue)
            throw ValidationError(ErrorKind::ConstraintViolation,
                                  "is above the maximum (" + std::to_string(v) + " > " +
                                      std::to_string(*o.maxValue) + ")");
    }

    Bytes serializeValue(const FieldSpec& spec, const Value& value, const Schema&) const override {
        const std::int64_t v = value.asInt();
        ByteWriter w;
        if (spec.options.isSigned) {
            std::size_t n = 1;
            while (n < 8) {
                const std::int64_t hi = (std::int64_t{1} << (8 * n - 1)) - 1;
                const std::int64_t lo = -hi - 1;
                if (v >= lo && v <= hi) break;
                ++n;
            }
            w.writeUBE(static_cast<std::uint64_t>(v), n);
        } else {
            if (v < 0)
                throw ValidationError(ErrorKind::ConstraintViolation,
                                      "cannot be negative (" + std::to_string(v) + ")");
            const auto u = static_cast<std::uint64_t>(v);
            w.writeUBE(u, std::max<std::size_t>(byteWidth(u), 1));
        }
        return w.take();
    }

    Value deserializeValue(const FieldSpec& spec, std::span<const std::uint8_t> payload,
                           const Schema&) const override {
        if (payload.empty() || payload.size() > 8)
            throw WireError(ErrorKind::MalformedData,
                            "integer payload of " + std::to_string(payload.size()) +
                                " byte(s) (expected 1..8)");
        ByteReader r{payload};
        const std::size_t   n   = payload.size();
        const std::uint64_t raw = r.readUBE(n);

        if (spec.options.isSigned) {
            // Sign-extend if the top bit of the payload is set
            if (n < 8 && (payload[0] & 0x80u))
                return Value{static_cast<std::int64_t>(raw | (~std::uint64_t{0} << (8 * n)))};
            return Value{static_cast<std::int64_t>(raw)};
        }
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            throw WireError(ErrorKind::MalformedData,
                            "unsigned integer " + std::to_string(raw) + " exceeds the integer range");
        return Value{static_cast<std::int64_t>(raw)};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
//  Bytes
// ─────────────────────────────────────────────────────────────────────────────

class BytesPlugin final : public TypePlugin {
public:
    FieldKind kind() const noexcept override { return FieldKind::Bytes; }

    void checkConstraints(const FieldSpec& spec, const Value& value,
                          const Schema&) const override {
        if (value.kind() != ValueKind::Bytes) return;
        const auto& max = spec.options.maxLength;
        if (max && value.asBytes().size() > *max)
            tooLong(value.asBytes().size(), *max, "bytes");
    }

    Bytes serializeValue(const FieldSpec&, const Value& value, const Schema&) const override {
        return withPresence(value.asBytes());
    }

    Value deserializeValue(const FieldSpec&, std::span<const std::uint8_t> payload,
                           const Schema&) const override {
        auto raw = body(payload, FieldKind::Bytes);
        return Value{Bytes(raw.begin(), raw.end())};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
//  String
// ─────────────────────────────────────────────────────────────────────────────

class StringPlugin final : public TypePlugin {
public:
    FieldKind kind() const noexcept override { return FieldKind::String; }

    void checkType(const FieldSpec& spec, const Value& value, const Schema& owner) const override {
        TypePlugin::checkType(spec, value, owner);
        if (!validUtf8(value.asString()))
            throw ValidationError(ErrorKind::TypeMismatch, "is not valid UTF-8");
    }

    void checkConstraints(const FieldSpec& spec, const Value& value,
                          const Schema&) const override {
        if (value.kind() != ValueKind::String) return;
        const auto& max = spec.options.maxLength;
        if (!max) return;
        const std::size_t len = codePoints(value.asString());
        if (len > *max) tooLong(len, *max, "characters");
    }

    Bytes serializeValue(const FieldSpec&, const Value& value, const Schema&) const override {
        const std::string& s = value.asString();
        return withPresence({reinterpret_cast<const std::uint8_t*>(s.data()), s.size()});
    }

    Value deserializeValue(const FieldSpec&, std::span<const std::uint8_t> payload,
                           const Schema&) const override {
        auto        raw = body(payload, FieldKind::String);
        std::string text(raw.begin(), raw.end());
        if (!validUtf8(text))
            throw WireError(ErrorKind::MalformedData, "string payload is not valid UTF-8");
        return Value{std::move(text)};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
//  List<T>
// ─────────────────────────────────────────────────────────────────────────────
// Element checks delegate to the element kind's plugin; failures are annotated
// with the element index ("inner element ...").

class ListPlugin final : public TypePlugin {
public:
    FieldKind kind() const noexcept override { return FieldKind::List; }

    void checkType(const FieldSpec& spec, const Value& value, const Schema& owner) const override {
        TypePlugin::checkType(spec, value, owner);
        const FieldSpec&  elem   = *spec.element;
        const TypePlugin& plugin = pluginFor(elem.kind);
        const auto&       items  = value.asList();
        for (std::size_t i = 0; i < items.size(); ++i) {
            try {
                if (items[i].isAbsent()) {
                    if (!elem.options.optional)
                        throw ValidationError(ErrorKind::MissingValue, "cannot be absent");
                    continue;
                }
                plugin.checkType(elem, items[i], owner);
            } catch (Error& e) {
                e.prependElement(i);
                throw;
            }
        }
    }

    void checkConstraints(const FieldSpec& spec, const Value& value,
                          const Schema& owner) const override {
        if (value.kind() != ValueKind::List) return;
        const auto& items = value.asList();
        const auto& max   = spec.options.maxLength;
        if (max && items.size() > *max) tooLong(items.size(), *max, "elements");

        const FieldSpec&  elem   = *spec.element;
        const TypePlugin& plugin = pluginFor(elem.kind);
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (items[i].isAbsent()) continue;
            try {
                plugin.checkConstraints(elem, items[i], owner);
            } catch (Error& e) {
                e.prependElement(i);
                throw;
            }
        }
    }

    Bytes serializeValue(const FieldSpec& spec, const Value& value,
                         const Schema& owner) const override {
        const FieldSpec&  elem   = *spec.element;
        const TypePlugin& plugin = pluginFor(elem.kind);
        const auto&       items  = value.asList();

        ByteWriter w;
        w.writeU8(kPresenceByte);
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (items[i].isAbsent()) {
                writeAbsentChunk(w);
                continue;
            }
            try {
                writeChunk(w, plugin.serializeValue(elem, items[i], owner));
            } catch (Error& e) {
                e.prependElement(i);
                throw;
            }
        }
        return w.take();
    }

    Value deserializeValue(const FieldSpec& spec, std::span<const std::uint8_t> payload,
                           const Schema& owner) const override {
        const FieldSpec&  elem   = *spec.element;
        const TypePlugin& plugin = pluginFor(elem.kind);

        ByteReader r{body(payload, FieldKind::List)};
        const std::vector<Chunk> chunks = readChunks(r);

        Value::List items;
        items.reserve(chunks.size());
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            if (!chunks[i]) {
                items.emplace_back();
                continue;
            }
            try {
                items.push_back(plugin.deserializeValue(elem, *chunks[i], owner));
            } catch (Error& e) {
                e.prependElement(i);
                throw;
            }
        }
        return Value::list(std::move(items));
    }
};

// ─────────────────────────────────────────────────────────────────────────────
//  Nested record
// ─────────────────────────────────────────────────────────────────────────────
// The referenced schema is looked up by name at every use, which is what lets
// a schema refer to itself or to one registered later.

class RecordPlugin final : public TypePlugin {
public:
    FieldKind kind() const noexcept override { return FieldKind::Record; }

    void checkType(const FieldSpec& spec, const Value& value, const Schema& owner) const override {
        TypePlugin::checkType(spec, value, owner);
        const SchemaPtr expected = owner.resolve(spec.schemaName);
        const Schema&   actual   = value.asRecord().schema();
        if (&actual != expected.get())
            throw ValidationError(ErrorKind::TypeMismatch,
                                  "is of type record<" + actual.name() + ">, expected record<" +
                                      expected->name() + ">");
    }

    Bytes serializeValue(const FieldSpec&, const Value& value, const Schema&) const override {
        return serialize(value.asRecord());
    }

    Value deserializeValue(const FieldSpec& spec, std::span<const std::uint8_t> payload,
                           const Schema& owner) const override {
        return Value{deserialize(owner.resolve(spec.schemaName), payload)};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
//  Dispatch
// ─────────────────────────────────────────────────────────────────────────────

const TypePlugin& pluginFor(FieldKind kind) {
    static const BooleanPlugin boolean{};
    static const IntegerPlugin integer{};
    static const BytesPlugin bytes{};
    static const StringPlugin string{};
    static const ListPlugin list{};
    static const RecordPlugin record{};

    switch (kind) {
    case FieldKind::Boolean: return boolean;
    case FieldKind::Integer: return integer;
    case FieldKind::Bytes:   return bytes;
    case FieldKind::String:  return string;
    case FieldKind::List:    return list;
    case FieldKind::Record:  return record;
    }
    throw SchemaError(ErrorKind::InvalidSchema,
                      "no plugin for field kind " + std::to_string(static_cast<int>(kind)));
}

} // namespace encodium
