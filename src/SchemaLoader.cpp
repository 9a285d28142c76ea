// SchemaLoader.cpp – Parses Encodium XML schema documents.
// Uses pugixml for robust, zero-copy XML parsing.

#include "Encodium/SchemaLoader.hpp"

#include <pugixml.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <string>

namespace encodium {

// ─── Small parsing helpers ────────────────────────────────────────────────────

static std::uint64_t parseU64(const char* s, const std::string& ctx) {
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s, s + std::strlen(s), v);
    if (ec != std::errc{} || *ptr != '\0')
        throw SchemaLoadError(ctx + ": cannot parse unsigned integer '" + s + "'");
    return v;
}

static std::int64_t parseI64(const char* s, const std::string& ctx) {
    std::int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s, s + std::strlen(s), v);
    if (ec != std::errc{} || *ptr != '\0')
        throw SchemaLoadError(ctx + ": cannot parse integer '" + s + "'");
    return v;
}

static bool parseBool(const char* s, const std::string& ctx) {
    if (strcmp(s, "true") == 0 || strcmp(s, "1") == 0)  return true;
    if (strcmp(s, "false") == 0 || strcmp(s, "0") == 0) return false;
    throw SchemaLoadError(ctx + ": expected true/false, got '" + s + "'");
}

static FieldKind parseKind(const char* s, const std::string& ctx) {
    if (!s || *s == '\0')              throw SchemaLoadError(ctx + ": missing 'type'");
    if (strcmp(s, "boolean") == 0)     return FieldKind::Boolean;
    if (strcmp(s, "integer") == 0)     return FieldKind::Integer;
    if (strcmp(s, "bytes")   == 0)     return FieldKind::Bytes;
    if (strcmp(s, "string")  == 0)     return FieldKind::String;
    if (strcmp(s, "list")    == 0)     return FieldKind::List;
    if (strcmp(s, "record")  == 0)     return FieldKind::Record;
    throw SchemaLoadError(ctx + ": unknown type '" + s + "'");
}

static int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// "0a 0B ff" → {0x0A, 0x0B, 0xFF}; whitespace is ignored.
static Bytes parseHex(const char* s, const std::string& ctx) {
    Bytes out;
    int   hi = -1;
    for (const char* p = s; *p; ++p) {
        if (std::isspace(static_cast<unsigned char>(*p))) continue;
        const int d = hexDigit(*p);
        if (d < 0) throw SchemaLoadError(ctx + ": invalid hex digit in '" + s + "'");
        if (hi < 0) {
            hi = d;
        } else {
            out.push_back(static_cast<std::uint8_t>((hi << 4) | d));
            hi = -1;
        }
    }
    if (hi >= 0) throw SchemaLoadError(ctx + ": odd number of hex digits in '" + s + "'");
    return out;
}

static Value parseDefault(FieldKind kind, const char* s, const std::string& ctx) {
    switch (kind) {
    case FieldKind::Boolean: return Value{parseBool(s, ctx + ".default")};
    case FieldKind::Integer: return Value{parseI64(s, ctx + ".default")};
    case FieldKind::Bytes:   return Value{parseHex(s, ctx + ".default")};
    case FieldKind::String:  return Value{std::string(s)};
    default:
        throw SchemaLoadError(ctx + ": defaults are not supported for " + kindName(kind) +
                              " fields");
    }
}

// ─── Parse a <Field> or <Element> node into a FieldSpec ───────────────────────

static FieldSpec parseFieldNode(pugi::xml_node node, const std::string& ctx) {
    FieldSpec f;
    f.name = node.attribute("name").as_string("");
    f.kind = parseKind(node.attribute("type").as_string(""), ctx);

    FieldOptions& o = f.options;
    if (auto a = node.attribute("optional");  a) o.optional  = parseBool(a.as_string(), ctx + ".optional");
    if (auto a = node.attribute("maxLength"); a) o.maxLength = parseU64(a.as_string(), ctx + ".maxLength");
    if (auto a = node.attribute("signed");    a) o.isSigned  = parseBool(a.as_string(), ctx + ".signed");
    if (auto a = node.attribute("min");       a) o.minValue  = parseI64(a.as_string(), ctx + ".min");
    if (auto a = node.attribute("max");       a) o.maxValue  = parseI64(a.as_string(), ctx + ".max");
    if (auto a = node.attribute("default");   a) o.defaultValue = parseDefault(f.kind, a.as_string(), ctx);

    if (f.kind == FieldKind::Record) {
        f.schemaName = node.attribute("schema").as_string("");
        if (f.schemaName.empty())
            throw SchemaLoadError(ctx + ": record field needs a 'schema' attribute");
    }

    if (f.kind == FieldKind::List) {
        auto elem_node = node.child("Element");
        if (!elem_node)
            throw SchemaLoadError(ctx + ": list field has no <Element>");
        f.element = std::make_shared<const FieldSpec>(parseFieldNode(elem_node, ctx + "[]"));
    }

    return f;
}

// ─── Parse one <Schema> node ──────────────────────────────────────────────────

static Schema parseSchemaNode(pugi::xml_node node, const CrossFieldChecks& checks) {
    const std::string name = node.attribute("name").as_string("");
    if (name.empty())
        throw SchemaLoadError("<Schema> missing 'name' attribute");

    SchemaBuilder builder(name);
    for (auto field_node : node.children("Field")) {
        const std::string ctx = name + "." + field_node.attribute("name").as_string("?");
        if (!field_node.attribute("name"))
            throw SchemaLoadError(ctx + ": <Field> missing 'name' attribute");
        builder.add(parseFieldNode(field_node, ctx));
    }

    if (auto it = checks.find(name); it != checks.end())
        builder.check(it->second);

    try {
        return builder.build();
    } catch (const SchemaError& e) {
        throw SchemaLoadError(e.what());
    }
}

static std::vector<std::string> loadDocument(const pugi::xml_document& doc,
                                             SchemaRegistry& registry,
                                             const CrossFieldChecks& checks,
                                             const std::string& source) {
    pugi::xml_node root = doc.child("Schemas");
    if (!root)
        throw SchemaLoadError(source + ": XML root element must be <Schemas>");

    std::vector<std::string> names;
    for (auto schema_node : root.children("Schema")) {
        Schema schema = parseSchemaNode(schema_node, checks);
        names.push_back(schema.name());
        registry.add(std::move(schema));
    }

    for (const auto& [name, check] : checks)
        if (std::find(names.begin(), names.end(), name) == names.end())
            SPDLOG_WARN("{}: cross-field check given for undeclared schema '{}'", source, name);

    SPDLOG_INFO("Loaded {} schema(s) from {}", names.size(), source);
    return names;
}

// ─── Public entry points ──────────────────────────────────────────────────────

std::vector<std::string> loadSchemas(const std::filesystem::path& xml_path,
                                     SchemaRegistry& registry,
                                     const CrossFieldChecks& checks) {
    pugi::xml_document     doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw SchemaLoadError("Failed to parse XML '" + xml_path.string() +
                              "': " + result.description());
    return loadDocument(doc, registry, checks, xml_path.string());
}

std::vector<std::string> loadSchemasFromString(std::string_view xml,
                                               SchemaRegistry& registry,
                                               const CrossFieldChecks& checks) {
    pugi::xml_document     doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result)
        throw SchemaLoadError(std::string("Failed to parse XML: ") + result.description());
    return loadDocument(doc, registry, checks, "<string>");
}

} // namespace encodium
