#pragma once
// Format.hpp – Human-readable renderings for logs, errors and test output.
//
//   toHex({0x01, 0x02})       → "01 02"
//   describe(person)          → "Person{age=25, name=\"John\", diabetic=true}"

#include "Record.hpp"
#include "Types.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace encodium {

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::string describe(const Value& value);
[[nodiscard]] std::string describe(const Record& record);

} // namespace encodium
