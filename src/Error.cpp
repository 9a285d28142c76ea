// Error.cpp – Path-annotated exceptions.

#include "Encodium/Error.hpp"

#include <string>

namespace encodium {

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::MissingValue:        return "MissingValue";
    case ErrorKind::TypeMismatch:        return "TypeMismatch";
    case ErrorKind::ConstraintViolation: return "ConstraintViolation";
    case ErrorKind::TooLong:             return "TooLong";
    case ErrorKind::UnknownField:        return "UnknownField";
    case ErrorKind::CheckFailed:         return "CheckFailed";
    case ErrorKind::LengthTooLarge:      return "LengthTooLarge";
    case ErrorKind::TruncatedData:       return "TruncatedData";
    case ErrorKind::MalformedData:       return "MalformedData";
    case ErrorKind::UnsupportedFormat:   return "UnsupportedFormat";
    case ErrorKind::ExtraChunks:         return "ExtraChunks";
    case ErrorKind::UnknownSchema:       return "UnknownSchema";
    case ErrorKind::DuplicateSchema:     return "DuplicateSchema";
    case ErrorKind::InvalidSchema:       return "InvalidSchema";
    case ErrorKind::RegistryFrozen:      return "RegistryFrozen";
    }
    return "Unknown";
}

bool isConstraintViolation(ErrorKind kind) noexcept {
    return kind == ErrorKind::ConstraintViolation || kind == ErrorKind::TooLong;
}

Error::Error(ErrorKind kind, std::string message)
    : kind_(kind), detail_(std::move(message)) {
    render();
}

std::string Error::path() const {
    std::string out;
    for (const auto& seg : segments_) {
        if (seg.element) {
            out += '[' + std::to_string(seg.index) + ']';
        } else {
            if (!out.empty()) out += '.';
            out += seg.name;
        }
    }
    return out;
}

void Error::prependField(std::string_view name) {
    segments_.insert(segments_.begin(), Segment{std::string(name), false, 0});
    render();
}

void Error::prependElement(std::size_t index) {
    segments_.insert(segments_.begin(), Segment{{}, true, index});
    render();
}

// "left inner element value cannot be absent"
void Error::render() {
    what_.clear();
    for (const auto& seg : segments_) {
        what_ += seg.element ? std::string("inner element") : seg.name;
        what_ += ' ';
    }
    what_ += detail_;
}

} // namespace encodium
