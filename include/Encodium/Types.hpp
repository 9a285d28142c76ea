#pragma once
// Types.hpp – Field metadata and the dynamic value type.
// Every record field, default and decoded payload flows through these.

#include "ByteStream.hpp"
#include "Error.hpp"

#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace encodium {

class Record;

// ─── Declared kind of a field ─────────────────────────────────────────────────
enum class FieldKind {
    Boolean,
    Integer,
    Bytes,
    String,
    List,    // homogeneous; element kind given by FieldSpec::element
    Record,  // nested record; schema named by FieldSpec::schemaName
};

// ─── Runtime kind of a value ──────────────────────────────────────────────────
enum class ValueKind {
    Absent,
    Boolean,
    Integer,
    Bytes,
    String,
    List,
    Record,
};

[[nodiscard]] const char* kindName(FieldKind kind) noexcept;
[[nodiscard]] const char* kindName(ValueKind kind) noexcept;

// The value kind a field of the given kind must hold.
[[nodiscard]] ValueKind valueKindOf(FieldKind kind) noexcept;

// ─── Value ────────────────────────────────────────────────────────────────────
// A closed tagged union over everything a field can hold. Default-constructed
// values are absent. Nested records are shared immutable handles, so copying a
// Value never aliases mutable state.
class Value {
public:
    using List = std::vector<Value>;

    Value() = default;
    Value(bool b) : data_(b) {}
    // Unsigned 64-bit inputs above INT64_MAX throw ValidationError(ConstraintViolation).
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T i) : data_(toInteger(i)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Bytes b) : data_(std::move(b)) {}
    Value(List l) : data_(std::move(l)) {}
    Value(Record r);
    Value(std::shared_ptr<const Record> r);

    [[nodiscard]] static Value absent() { return Value{}; }
    [[nodiscard]] static Value list(List elements) { return Value{std::move(elements)}; }

    [[nodiscard]] ValueKind kind() const noexcept;
    [[nodiscard]] bool isAbsent() const noexcept { return kind() == ValueKind::Absent; }

    // Typed accessors; throw ValidationError(TypeMismatch) on the wrong kind.
    [[nodiscard]] bool               asBool()   const;
    [[nodiscard]] std::int64_t       asInt()    const;
    [[nodiscard]] const Bytes&       asBytes()  const;
    [[nodiscard]] const std::string& asString() const;
    [[nodiscard]] const List&        asList()   const;
    [[nodiscard]] const Record&      asRecord() const;
    [[nodiscard]] const std::shared_ptr<const Record>& recordHandle() const;

    // Deep comparison; nested records compare with equals().
    [[nodiscard]] bool operator==(const Value& other) const;

private:
    std::variant<std::monostate,
                 bool,
                 std::int64_t,
                 Bytes,
                 std::string,
                 List,
                 std::shared_ptr<const Record>> data_;

    [[noreturn]] void wrongKind(ValueKind expected) const;

    template <std::integral T>
    static std::int64_t toInteger(T i) {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t)) {
            if (i > static_cast<T>(std::numeric_limits<std::int64_t>::max()))
                throw ValidationError(ErrorKind::ConstraintViolation,
                                      "integer " + std::to_string(i) +
                                          " exceeds the integer range");
        }
        return static_cast<std::int64_t>(i);
    }
};

// ─── Default value: a fixed value or a factory evaluated at each use ──────────
class DefaultValue {
public:
    using Factory = std::function<Value()>;

    DefaultValue() = default;
    DefaultValue(Value v) : data_(std::move(v)) {}
    // Plain literals: {.defaultValue = true}, {.defaultValue = "n/a"}
    template <typename V>
        requires(!std::same_as<V, Value> && !std::same_as<V, DefaultValue> &&
                 !std::invocable<V> && std::constructible_from<Value, V>)
    DefaultValue(V v) : data_(Value(std::move(v))) {}
    template <std::invocable F>
        requires std::convertible_to<std::invoke_result_t<F>, Value>
    DefaultValue(F f) : data_(Factory(std::move(f))) {}

    [[nodiscard]] bool empty()     const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool isFactory() const noexcept { return data_.index() == 2; }

    // Absent when empty.
    [[nodiscard]] Value evaluate() const;

private:
    std::variant<std::monostate, Value, Factory> data_;
};

// ─── Per-field options ────────────────────────────────────────────────────────
// Which constraint applies depends on the kind:
//   maxLength          String (code points), Bytes (bytes), List (elements)
//   isSigned, min/max  Integer
struct FieldOptions {
    bool                        optional{false};
    DefaultValue                defaultValue{};
    std::optional<std::size_t>  maxLength{};
    bool                        isSigned{true};
    std::optional<std::int64_t> minValue{};
    std::optional<std::int64_t> maxValue{};
};

// ─── Declared metadata of one schema field ────────────────────────────────────
struct FieldSpec {
    std::string  name;
    FieldKind    kind{FieldKind::Boolean};
    FieldOptions options;

    // Record: name of the nested schema, resolved through the registry at use.
    std::string schemaName;

    // List: spec every element is checked against.
    std::shared_ptr<const FieldSpec> element;

    // Declaration order, assigned by SchemaBuilder.
    std::uint32_t sequence{0};
};

// Factories for FieldSpec. Element specs of lists may leave the name empty.
namespace field {

[[nodiscard]] FieldSpec boolean(std::string name, FieldOptions opts = {});
[[nodiscard]] FieldSpec integer(std::string name, FieldOptions opts = {});
[[nodiscard]] FieldSpec bytes(std::string name, FieldOptions opts = {});
[[nodiscard]] FieldSpec string(std::string name, FieldOptions opts = {});
[[nodiscard]] FieldSpec list(std::string name, FieldSpec element, FieldOptions opts = {});
[[nodiscard]] FieldSpec record(std::string name, std::string schemaName, FieldOptions opts = {});

} // namespace field

} // namespace encodium
