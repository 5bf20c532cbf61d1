#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

#include "wasistub/types.hpp"
#include "wasistub/validator.hpp"

namespace wasistub
{
struct GlobalInfo
{
    ValueType type{ValueType::I32};
    bool is_mutable{false};
};

struct MemoryInfo
{
    bool is_64{false};
    bool shared{false};

    [[nodiscard]] ValueType address_type() const noexcept { return is_64 ? ValueType::I64 : ValueType::I32; }
};

// What a function body may refer to, collected from the sections that precede
// the code section. Lookups throw ValidationError for a missing index.
struct ModuleContext
{
    std::vector<FunctionType> types;
    std::vector<uint32_t> functions; // type index of every function, imports first
    std::vector<ValueType> tables;   // element type
    std::vector<MemoryInfo> memories;
    std::vector<GlobalInfo> globals;
    std::vector<uint32_t> tags; // type index
    std::vector<ValueType> element_segments;
    std::optional<uint32_t> data_count;
    // Functions named outside of function bodies (exports, element segments,
    // global initializers); only these may be used by ref.func in a body.
    std::unordered_set<uint32_t> declared_references;

    [[nodiscard]] const FunctionType& type(uint32_t index) const;
    [[nodiscard]] const FunctionType& function_type(uint32_t index) const;
    [[nodiscard]] ValueType table(uint32_t index) const;
    [[nodiscard]] const MemoryInfo& memory(uint32_t index) const;
    [[nodiscard]] const GlobalInfo& global(uint32_t index) const;
    [[nodiscard]] const FunctionType& tag_type(uint32_t index) const;
};

// Type-checks one code entry (local declarations plus expression) against
// `type`: every instruction's operands and immediates, block signatures, and
// the values left at each end, branch and return. Throws ValidationError.
void validate_function_body(const ModuleContext& module, const FunctionType& type, std::span<const uint8_t> entry);

} // namespace wasistub
