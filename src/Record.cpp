// Record.cpp – Construction, validated mutation and equality.

#include "Encodium/Record.hpp"
#include "Encodium/TypePlugin.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <string>

namespace encodium {

// ─────────────────────────────────────────────────────────────────────────────
//  Field pipeline
// ─────────────────────────────────────────────────────────────────────────────

// Default, then optionality / constraints / type. Errors gain the field name.
static Value prepareField(const FieldSpec& spec, Value value, const Schema& owner) {
    try {
        if (value.isAbsent())
            value = spec.options.defaultValue.evaluate();
        checkValue(spec, value, owner);
    } catch (Error& e) {
        e.prependField(spec.name);
        throw;
    }
    return value;
}

[[noreturn]] static void unknownField(const Schema& schema, std::string_view field) {
    ValidationError e(ErrorKind::UnknownField,
                      "is not a field of schema '" + schema.name() + "'");
    e.prependField(field);
    throw e;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Record
// ─────────────────────────────────────────────────────────────────────────────

Record::Record(SchemaPtr schema, std::vector<Value> values)
    : schema_(std::move(schema)), values_(std::move(values)) {}

const Value& Record::get(std::string_view field) const {
    const std::size_t i = schema_->indexOf(field);
    if (i >= values_.size()) unknownField(*schema_, field);
    return values_[i];
}

void Record::set(std::string_view field, Value value) {
    mutate(*this, field, std::move(value));
}

Record Record::with(std::string_view field, Value value) const {
    Record copy = *this;
    mutate(copy, field, std::move(value));
    return copy;
}

bool Record::operator==(const Record& other) const {
    return equals(*this, other);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Engine operations
// ─────────────────────────────────────────────────────────────────────────────

Record construct(SchemaPtr schema, FieldValues values) {
    if (!schema)
        throw SchemaError(ErrorKind::UnknownSchema, "construct called without a schema");

    for (const auto& [name, value] : values)
        if (!schema->field(name)) unknownField(*schema, name);

    const auto& fields = schema->fields();
    std::vector<Value> slots;
    slots.reserve(fields.size());
    for (const FieldSpec& spec : fields) {
        Value v;
        if (auto it = values.find(spec.name); it != values.end())
            v = std::move(it->second);
        slots.push_back(prepareField(spec, std::move(v), *schema));
    }

    Record rec{schema, std::move(slots)};

    if (const auto& check = schema->check()) {
        std::set<std::string> changed;
        for (const FieldSpec& spec : fields) changed.insert(spec.name);
        check(rec, changed);
    }

    SPDLOG_TRACE("Constructed '{}' record", schema->name());
    return rec;
}

void mutate(Record& record, std::string_view field, Value value) {
    const Schema&     schema = *record.schema_;
    const std::size_t i      = schema.indexOf(field);
    if (i >= record.values_.size()) unknownField(schema, field);

    const FieldSpec& spec    = schema.fields()[i];
    Value            checked = prepareField(spec, std::move(value), schema);

    if (const auto& check = schema.check()) {
        Record candidate = record;
        candidate.values_[i] = std::move(checked);
        check(candidate, std::set<std::string>{spec.name});
        record.values_ = std::move(candidate.values_);
    } else {
        record.values_[i] = std::move(checked);
    }
    SPDLOG_TRACE("Assigned '{}.{}'", schema.name(), spec.name);
}

bool equals(const Record& a, const Record& b) {
    if (a.schemaPtr() != b.schemaPtr()) return false;
    return a.values() == b.values();
}

} // namespace encodium
