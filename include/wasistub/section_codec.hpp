#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "wasistub/module.hpp"

namespace wasistub
{
// Splits a module into its sections. Type, import, function and code sections
// are decoded into typed views; every other section is kept as RawSection.
// Throws DecodeError.
std::vector<Section> decode_module(std::span<const uint8_t> bytes);

// Serializes sections, in the given order, behind the module header.
std::vector<uint8_t> encode_module(const std::vector<Section>& sections);

// Section payload parsers shared with the validator. All throw DecodeError.
TypeSection parse_type_section(std::span<const uint8_t> payload);
ImportSection parse_import_section(std::span<const uint8_t> payload);
FunctionSection parse_function_section(std::span<const uint8_t> payload);
CodeSection parse_code_section(std::span<const uint8_t> payload);

struct FunctionBody
{
    std::vector<LocalDecl> locals;
    std::span<const uint8_t> expression;
};

// Splits a code entry into its local declarations and expression bytes. The
// returned span points into `entry`.
FunctionBody split_code_entry(std::span<const uint8_t> entry);

std::vector<uint8_t> encode_section_payload(const Section& section);

} // namespace wasistub
