// Schema.cpp – Schema declaration checks and the schema registry.

#include "Encodium/Schema.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

namespace encodium {

// ─────────────────────────────────────────────────────────────────────────────
//  Schema
// ─────────────────────────────────────────────────────────────────────────────

std::size_t Schema::indexOf(std::string_view field) const noexcept {
    for (std::size_t i = 0; i < fields_.size(); ++i)
        if (fields_[i].name == field) return i;
    return fields_.size();
}

const FieldSpec* Schema::field(std::string_view name) const noexcept {
    const std::size_t i = indexOf(name);
    return i < fields_.size() ? &fields_[i] : nullptr;
}

SchemaPtr Schema::resolve(std::string_view name) const {
    if (!registry_)
        throw SchemaError(ErrorKind::UnknownSchema,
                          "schema '" + std::string(name) + "' referenced from unregistered schema '" +
                              name_ + "'");
    return registry_->resolve(name);
}

// ─────────────────────────────────────────────────────────────────────────────
//  SchemaBuilder
// ─────────────────────────────────────────────────────────────────────────────

SchemaBuilder::SchemaBuilder(std::string name) : name_(std::move(name)) {}

SchemaBuilder& SchemaBuilder::add(FieldSpec spec) {
    spec.sequence = next_seq_++;
    fields_.push_back(std::move(spec));
    return *this;
}

SchemaBuilder& SchemaBuilder::check(CrossFieldCheck fn) {
    check_ = std::move(fn);
    return *this;
}

static void invalid(const std::string& schema, const std::string& field, const std::string& why) {
    throw SchemaError(ErrorKind::InvalidSchema,
                      "schema '" + schema + "' field '" + field + "': " + why);
}

// Reject options that have no meaning for the field's kind.
static void validateSpec(const std::string& schema, const std::string& label, const FieldSpec& f) {
    const FieldOptions& o = f.options;

    if (o.maxLength && f.kind != FieldKind::String && f.kind != FieldKind::Bytes &&
        f.kind != FieldKind::List)
        invalid(schema, label, std::string("maxLength does not apply to ") + kindName(f.kind));

    if (f.kind != FieldKind::Integer && (!o.isSigned || o.minValue || o.maxValue))
        invalid(schema, label, std::string("signed/min/max do not apply to ") + kindName(f.kind));

    if (o.minValue && o.maxValue && *o.minValue > *o.maxValue)
        invalid(schema, label, "min is greater than max");

    switch (f.kind) {
    case FieldKind::List:
        if (!f.element)
            invalid(schema, label, "list has no element spec");
        validateSpec(schema, label + "[]", *f.element);
        break;
    case FieldKind::Record:
        if (f.schemaName.empty())
            invalid(schema, label, "record field names no schema");
        break;
    default:
        if (f.element || !f.schemaName.empty())
            invalid(schema, label, std::string("element/schema given for ") + kindName(f.kind));
        break;
    }
}

Schema SchemaBuilder::build() const {
    if (name_.empty())
        throw SchemaError(ErrorKind::InvalidSchema, "schema name must not be empty");

    Schema s;
    s.name_   = name_;
    s.fields_ = fields_;
    s.check_  = check_;

    std::stable_sort(s.fields_.begin(), s.fields_.end(),
                     [](const FieldSpec& a, const FieldSpec& b) { return a.sequence < b.sequence; });

    for (std::size_t i = 0; i < s.fields_.size(); ++i) {
        const FieldSpec& f = s.fields_[i];
        if (f.name.empty())
            invalid(name_, "#" + std::to_string(i), "field name must not be empty");
        for (std::size_t j = 0; j < i; ++j)
            if (s.fields_[j].name == f.name)
                invalid(name_, f.name, "declared twice");
        validateSpec(name_, f.name, f);
    }
    return s;
}

// ─────────────────────────────────────────────────────────────────────────────
//  SchemaRegistry
// ─────────────────────────────────────────────────────────────────────────────

SchemaPtr SchemaRegistry::add(Schema schema) {
    if (frozen_)
        throw SchemaError(ErrorKind::RegistryFrozen,
                          "cannot register '" + schema.name() + "': registry is frozen");
    if (schemas_.count(schema.name()))
        throw SchemaError(ErrorKind::DuplicateSchema,
                          "schema '" + schema.name() + "' already registered");

    auto owned       = std::make_shared<Schema>(std::move(schema));
    owned->registry_ = this;
    SPDLOG_DEBUG("Registered schema '{}' with {} field(s)", owned->name(), owned->fields().size());

    SchemaPtr ptr = owned;
    schemas_.emplace(ptr->name(), ptr);
    return ptr;
}

SchemaPtr SchemaRegistry::resolve(std::string_view name) const {
    auto it = schemas_.find(name);
    if (it == schemas_.end())
        throw SchemaError(ErrorKind::UnknownSchema,
                          "schema '" + std::string(name) + "' is not registered");
    return it->second;
}

bool SchemaRegistry::contains(std::string_view name) const {
    return schemas_.find(name) != schemas_.end();
}

std::vector<std::string> SchemaRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(schemas_.size());
    for (const auto& [name, schema] : schemas_)
        out.push_back(name);
    return out;
}

void SchemaRegistry::freeze() {
    if (frozen_) return;
    frozen_ = true;
    SPDLOG_INFO("Schema registry frozen with {} schema(s)", schemas_.size());
}

} // namespace encodium
