#pragma once
// Error.hpp – Exception hierarchy shared by validation, schema and wire code.
//
// Every failure carries an ErrorKind and the path of the field it concerns.
// Errors raised deep inside nested values are annotated on the way out:
//
//   Tree.left  → Tree.value  fails with "cannot be absent"
//   what() == "left value cannot be absent"
//   path() == "left.value"
//
// List elements contribute an "inner element" prefix to the message and an
// "[index]" segment to the path.

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace encodium {

enum class ErrorKind {
    // Validation
    MissingValue,        // required field absent
    TypeMismatch,        // value kind disagrees with the declared kind
    ConstraintViolation, // per-kind rule failed (sign, range, ...)
    TooLong,             // maxLength exceeded
    UnknownField,        // value supplied for a name the schema lacks
    CheckFailed,         // user cross-field check rejected the record

    // Wire
    LengthTooLarge,      // length-of-length would exceed 6 bytes
    TruncatedData,       // buffer ended before a declared length
    MalformedData,       // payload does not match its kind's encoding
    UnsupportedFormat,   // unknown format marker byte
    ExtraChunks,         // more chunks than the schema has fields

    // Schema
    UnknownSchema,
    DuplicateSchema,
    InvalidSchema,
    RegistryFrozen,
};

[[nodiscard]] const char* errorKindName(ErrorKind kind) noexcept;

// True for ConstraintViolation and its refinements (TooLong).
[[nodiscard]] bool isConstraintViolation(ErrorKind kind) noexcept;

class Error : public std::exception {
public:
    Error(ErrorKind kind, std::string message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    // Message without any path prefix, e.g. "cannot be absent".
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    // Dotted field path, e.g. "left.tags[2]". Empty for top-level errors.
    [[nodiscard]] std::string path() const;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    // Annotate with the enclosing field; used while unwinding out of nested values.
    void prependField(std::string_view name);
    void prependElement(std::size_t index);

private:
    struct Segment {
        std::string name;
        bool        element{false};
        std::size_t index{0};
    };

    ErrorKind            kind_;
    std::string          detail_;
    std::vector<Segment> segments_; // outermost first
    std::string          what_;

    void render();
};

// Raised by the Record Engine and the Type Plugins' checks.
class ValidationError : public Error {
public:
    using Error::Error;
    explicit ValidationError(std::string message)
        : Error(ErrorKind::CheckFailed, std::move(message)) {}
};

// Raised while framing or parsing bytes.
class WireError : public Error {
public:
    using Error::Error;
};

// Raised by the Schema Registry and the SchemaBuilder.
class SchemaError : public Error {
public:
    using Error::Error;
};

} // namespace encodium
