#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace wasistub
{
struct ValidationReport
{
    bool valid{true};
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return valid; }
};

struct ValidationError final : std::runtime_error
{
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

// Validation of a module binary: section framing and order, that every
// section parses completely, that every index resolves, that constant
// expressions produce the type their context needs, and that every function
// body is a well-typed instruction sequence (see validate_function_body).
ValidationReport validate_module(std::span<const uint8_t> bytes);

// Same as validate_module but throws ValidationError on failure.
void require_valid(std::span<const uint8_t> bytes);

} // namespace wasistub
