// Format.cpp – Text renderings of bytes, values and records.

#include "Encodium/Format.hpp"

#include <fmt/format.h>

#include <iterator>

namespace encodium {

std::string toHex(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size() * 3);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i) out += ' ';
        fmt::format_to(std::back_inserter(out), "{:02X}", bytes[i]);
    }
    return out;
}

std::string describe(const Value& value) {
    switch (value.kind()) {
    case ValueKind::Absent:
        return "absent";
    case ValueKind::Boolean:
        return value.asBool() ? "true" : "false";
    case ValueKind::Integer:
        return fmt::format("{}", value.asInt());
    case ValueKind::Bytes:
        return fmt::format("b[{}]", toHex(value.asBytes()));
    case ValueKind::String:
        return fmt::format("\"{}\"", value.asString());
    case ValueKind::List: {
        std::string out = "[";
        const auto& items = value.asList();
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i) out += ", ";
            out += describe(items[i]);
        }
        return out + "]";
    }
    case ValueKind::Record:
        return describe(value.asRecord());
    }
    return "?";
}

std::string describe(const Record& record) {
    std::string out = record.schema().name() + "{";
    const auto& fields = record.schema().fields();
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i) out += ", ";
        fmt::format_to(std::back_inserter(out), "{}={}", fields[i].name,
                       describe(record.values()[i]));
    }
    return out + "}";
}

} // namespace encodium
