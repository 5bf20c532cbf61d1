#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "wasistub/types.hpp"

namespace wasistub
{
constexpr uint32_t kWasmMagic = 0x6D736100; // "\0asm"
constexpr uint32_t kWasmVersion = 0x00000001;

enum class SectionId : uint8_t
{
    Custom = 0,
    Type = 1,
    Import = 2,
    Function = 3,
    Table = 4,
    Memory = 5,
    Global = 6,
    Export = 7,
    Start = 8,
    Element = 9,
    Code = 10,
    Data = 11,
    DataCount = 12,
    Tag = 13,
};

// Position of a non-custom section in the order the binary format requires.
// Returns nullopt for custom sections and unknown ids.
constexpr std::optional<int> section_rank(uint8_t id)
{
    switch (static_cast<SectionId>(id))
    {
    case SectionId::Type:
        return 1;
    case SectionId::Import:
        return 2;
    case SectionId::Function:
        return 3;
    case SectionId::Table:
        return 4;
    case SectionId::Memory:
        return 5;
    case SectionId::Tag:
        return 6;
    case SectionId::Global:
        return 7;
    case SectionId::Export:
        return 8;
    case SectionId::Start:
        return 9;
    case SectionId::Element:
        return 10;
    case SectionId::DataCount:
        return 11;
    case SectionId::Code:
        return 12;
    case SectionId::Data:
        return 13;
    default:
        return std::nullopt;
    }
}

struct Limits
{
    uint8_t flags{0}; // bit 0: has max, bit 1: shared, bit 2: 64-bit
    uint64_t min{0};
    std::optional<uint64_t> max;
};

struct TableType
{
    uint8_t element_type{0x70};
    Limits limits;
};

struct MemoryType
{
    Limits limits;
};

struct GlobalType
{
    ValueType value_type{ValueType::I32};
    bool is_mutable{false};
};

struct TagType
{
    uint8_t attribute{0};
    uint32_t type_index{0};
};

struct Import
{
    std::string module;
    std::string name;
    ExternalKind kind{ExternalKind::Function};
    uint32_t type_index{0}; // for functions
    TableType table_type;
    MemoryType memory_type;
    GlobalType global_type;
    TagType tag_type;
};

struct LocalDecl
{
    uint32_t count{0};
    ValueType type{ValueType::I32};
};

struct TypeSection
{
    std::vector<FunctionType> types;
    // Payload as read from the source module; re-emitted as is when present.
    std::vector<uint8_t> raw;
};

struct ImportSection
{
    std::vector<Import> imports;
};

struct FunctionSection
{
    std::vector<uint32_t> type_indices;
};

// One function body without its size prefix: local declarations followed by
// the expression, exactly as stored in the binary.
struct CodeEntry
{
    std::vector<uint8_t> bytes;
};

struct CodeSection
{
    std::vector<CodeEntry> entries;
};

// Any section the rewrite does not interpret, kept byte for byte.
struct RawSection
{
    uint8_t id{0};
    std::vector<uint8_t> payload;
};

using Section = std::variant<TypeSection, ImportSection, FunctionSection, CodeSection, RawSection>;

template <typename... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

uint8_t section_id(const Section& section);

} // namespace wasistub
