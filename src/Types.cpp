// Types.cpp – Value accessors, kind names and FieldSpec factories.

#include "Encodium/Types.hpp"
#include "Encodium/Record.hpp"

#include <string>

namespace encodium {

const char* kindName(FieldKind kind) noexcept {
    switch (kind) {
    case FieldKind::Boolean: return "boolean";
    case FieldKind::Integer: return "integer";
    case FieldKind::Bytes:   return "bytes";
    case FieldKind::String:  return "string";
    case FieldKind::List:    return "list";
    case FieldKind::Record:  return "record";
    }
    return "unknown";
}

const char* kindName(ValueKind kind) noexcept {
    switch (kind) {
    case ValueKind::Absent:  return "absent";
    case ValueKind::Boolean: return "boolean";
    case ValueKind::Integer: return "integer";
    case ValueKind::Bytes:   return "bytes";
    case ValueKind::String:  return "string";
    case ValueKind::List:    return "list";
    case ValueKind::Record:  return "record";
    }
    return "unknown";
}

ValueKind valueKindOf(FieldKind kind) noexcept {
    switch (kind) {
    case FieldKind::Boolean: return ValueKind::Boolean;
    case FieldKind::Integer: return ValueKind::Integer;
    case FieldKind::Bytes:   return ValueKind::Bytes;
    case FieldKind::String:  return ValueKind::String;
    case FieldKind::List:    return ValueKind::List;
    case FieldKind::Record:  return ValueKind::Record;
    }
    return ValueKind::Absent;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Value
// ─────────────────────────────────────────────────────────────────────────────

Value::Value(Record r) : data_(std::make_shared<const Record>(std::move(r))) {}

Value::Value(std::shared_ptr<const Record> r) {
    if (r) data_ = std::move(r);
}

ValueKind Value::kind() const noexcept {
    // Alternative order matches ValueKind.
    return static_cast<ValueKind>(data_.index());
}

void Value::wrongKind(ValueKind expected) const {
    throw ValidationError(ErrorKind::TypeMismatch,
                          std::string("is of type ") + kindName(kind()) + ", expected " +
                              kindName(expected));
}

bool Value::asBool() const {
    if (auto p = std::get_if<bool>(&data_)) return *p;
    wrongKind(ValueKind::Boolean);
}

std::int64_t Value::asInt() const {
    if (auto p = std::get_if<std::int64_t>(&data_)) return *p;
    wrongKind(ValueKind::Integer);
}

const Bytes& Value::asBytes() const {
    if (auto p = std::get_if<Bytes>(&data_)) return *p;
    wrongKind(ValueKind::Bytes);
}

const std::string& Value::asString() const {
    if (auto p = std::get_if<std::string>(&data_)) return *p;
    wrongKind(ValueKind::String);
}

const Value::List& Value::asList() const {
    if (auto p = std::get_if<List>(&data_)) return *p;
    wrongKind(ValueKind::List);
}

const Record& Value::asRecord() const {
    return *recordHandle();
}

const std::shared_ptr<const Record>& Value::recordHandle() const {
    if (auto p = std::get_if<std::shared_ptr<const Record>>(&data_)) return *p;
    wrongKind(ValueKind::Record);
}

bool Value::operator==(const Value& other) const {
    if (kind() != other.kind()) return false;
    if (kind() == ValueKind::Record) {
        const auto& a = recordHandle();
        const auto& b = other.recordHandle();
        return a == b || equals(*a, *b);
    }
    return data_ == other.data_;
}

Value DefaultValue::evaluate() const {
    if (auto v = std::get_if<Value>(&data_)) return *v;
    if (auto f = std::get_if<Factory>(&data_)) return (*f)();
    return Value{};
}

// ─────────────────────────────────────────────────────────────────────────────
//  FieldSpec factories
// ─────────────────────────────────────────────────────────────────────────────

namespace field {

static FieldSpec make(std::string name, FieldKind kind, FieldOptions opts) {
    FieldSpec f;
    f.name    = std::move(name);
    f.kind    = kind;
    f.options = std::move(opts);
    return f;
}

FieldSpec boolean(std::string name, FieldOptions opts) {
    return make(std::move(name), FieldKind::Boolean, std::move(opts));
}

FieldSpec integer(std::string name, FieldOptions opts) {
    return make(std::move(name), FieldKind::Integer, std::move(opts));
}

FieldSpec bytes(std::string name, FieldOptions opts) {
    return make(std::move(name), FieldKind::Bytes, std::move(opts));
}

FieldSpec string(std::string name, FieldOptions opts) {
    return make(std::move(name), FieldKind::String, std::move(opts));
}

FieldSpec list(std::string name, FieldSpec element, FieldOptions opts) {
    FieldSpec f = make(std::move(name), FieldKind::List, std::move(opts));
    f.element   = std::make_shared<const FieldSpec>(std::move(element));
    return f;
}

FieldSpec record(std::string name, std::string schemaName, FieldOptions opts) {
    FieldSpec f  = make(std::move(name), FieldKind::Record, std::move(opts));
    f.schemaName = std::move(schemaName);
    return f;
}

} // namespace field

} // namespace encodium
