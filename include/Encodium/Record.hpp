#pragma once
// Record.hpp – Validated record instances.
//
// A Record only ever exists in a valid state: construct() and mutate() run the
// full validation pipeline and leave nothing behind when it fails.
//
//   auto person = construct(registry.resolve("Person"),
//                           {{"age", 25}, {"name", "John"}});
//   person.set("age", 26);                    // re-validated
//   person.set("age", -1);                    // throws, person unchanged

#include "Schema.hpp"
#include "Types.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace encodium {

// Values supplied to construct(), keyed by field name.
using FieldValues = std::map<std::string, Value, std::less<>>;

// Build a record. For each field in declaration order: missing → absent,
// absent → default, then optionality, constraints and type are checked. The
// schema's cross-field check then runs once with every field name.
// Throws ValidationError (path-annotated) or SchemaError.
[[nodiscard]] Record construct(SchemaPtr schema, FieldValues values = {});

// Validate and assign one field. The cross-field check runs with {field} on
// the updated record; on any failure the record keeps its previous state.
void mutate(Record& record, std::string_view field, Value value);

// Same schema object and equal values in every field.
[[nodiscard]] bool equals(const Record& a, const Record& b);

class Record {
public:
    [[nodiscard]] const Schema&    schema()    const noexcept { return *schema_; }
    [[nodiscard]] const SchemaPtr& schemaPtr() const noexcept { return schema_; }

    // Current value of a field (absent values included).
    // Throws ValidationError(UnknownField).
    [[nodiscard]] const Value& get(std::string_view field) const;
    [[nodiscard]] const Value& operator[](std::string_view field) const { return get(field); }
    [[nodiscard]] bool         has(std::string_view field) const { return !get(field).isAbsent(); }

    // Values in schema field order.
    [[nodiscard]] const std::vector<Value>& values() const noexcept { return values_; }

    // Validated assignment; equivalent to mutate(*this, field, value).
    void set(std::string_view field, Value value);

    // Copy with one field replaced, validated like set().
    [[nodiscard]] Record with(std::string_view field, Value value) const;

    [[nodiscard]] bool operator==(const Record& other) const;

private:
    Record(SchemaPtr schema, std::vector<Value> values);

    friend Record construct(SchemaPtr schema, FieldValues values);
    friend void   mutate(Record& record, std::string_view field, Value value);

    SchemaPtr          schema_;
    std::vector<Value> values_; // parallel to schema_->fields()
};

} // namespace encodium
