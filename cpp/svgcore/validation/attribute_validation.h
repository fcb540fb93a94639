#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace svgcore {

struct ValidationResult {
    bool valid = true;
    std::string message;
};

// Checks a proposed value against the rule for its attribute name.
// Names without a rule accept any value.
ValidationResult validateAttribute(std::string_view name, std::string_view value);

bool isValidNumber(std::string_view value) noexcept;
bool isValidLength(std::string_view value) noexcept;
bool isValidColor(std::string_view value);
bool isValidIdentifier(std::string_view value) noexcept;
bool isValidViewBox(std::string_view value);

// XML qualified name: an optional prefix and a local part, split by one colon.
// Bytes above 0x7F pass so UTF-8 names survive.
bool isValidAttributeName(std::string_view name) noexcept;

// Allowed keywords for enumerated attributes; empty when name is not one.
const std::vector<std::string>& enumValuesFor(std::string_view name);

} // namespace svgcore
