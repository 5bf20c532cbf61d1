#include "wasistub/validator.hpp"

#include <exception>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "wasistub/binary_reader.hpp"
#include "wasistub/body_validator.hpp"
#include "wasistub/module.hpp"
#include "wasistub/section_codec.hpp"

namespace wasistub
{
namespace
{
constexpr uint64_t kMaxPages32 = 65536;
constexpr uint64_t kMaxPages64 = 1ULL << 48;

bool is_valid_utf8(const std::string& text)
{
    size_t i = 0;
    while (i < text.size())
    {
        auto byte = static_cast<uint8_t>(text[i]);
        size_t extra = 0;
        uint32_t code_point = 0;
        if (byte < 0x80)
        {
            ++i;
            continue;
        }
        if ((byte & 0xE0U) == 0xC0)
        {
            extra = 1;
            code_point = byte & 0x1FU;
        }
        else if ((byte & 0xF0U) == 0xE0)
        {
            extra = 2;
            code_point = byte & 0x0FU;
        }
        else if ((byte & 0xF8U) == 0xF0)
        {
            extra = 3;
            code_point = byte & 0x07U;
        }
        else
        {
            return false;
        }
        if (i + extra >= text.size())
        {
            return false;
        }
        for (size_t j = 1; j <= extra; ++j)
        {
            auto next = static_cast<uint8_t>(text[i + j]);
            if ((next & 0xC0U) != 0x80)
            {
                return false;
            }
            code_point = (code_point << 6U) | (next & 0x3FU);
        }
        const bool overlong = (extra == 1 && code_point < 0x80) || (extra == 2 && code_point < 0x800) ||
                              (extra == 3 && code_point < 0x10000);
        if (overlong || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF))
        {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

class ModuleValidator
{
public:
    explicit ModuleValidator(std::span<const uint8_t> data)
        : reader_(data)
    {
    }

    void validate()
    {
        if (reader_.read_u32() != kWasmMagic)
        {
            fail("invalid wasm magic number");
        }
        if (reader_.read_u32() != kWasmVersion)
        {
            fail("unsupported wasm version");
        }

        int last_rank = 0;
        while (!reader_.eof())
        {
            auto id = reader_.read_u8();
            auto size = reader_.read_varuint32();
            if (size > reader_.remaining())
            {
                fail("section " + std::to_string(id) + " exceeds module bounds");
            }
            auto payload = reader_.read_bytes(size);

            if (id == static_cast<uint8_t>(SectionId::Custom))
            {
                validate_custom_section(payload);
                continue;
            }
            auto rank = section_rank(id);
            if (!rank)
            {
                fail("unknown section id " + std::to_string(id));
            }
            if (*rank <= last_rank)
            {
                fail("section " + std::to_string(id) + " is out of order or duplicated");
            }
            last_rank = *rank;
            validate_section(static_cast<SectionId>(id), payload);
        }

        if (declared_functions_ != code_count_)
        {
            fail("function section declares " + std::to_string(declared_functions_) +
                 " function(s) but code section holds " + std::to_string(code_count_));
        }
        if (context_.data_count && *context_.data_count != data_segments_)
        {
            fail("data count section does not match data section");
        }
    }

private:
    [[noreturn]] void fail(const std::string& message) { throw ValidationError(message); }

    void validate_custom_section(std::span<const uint8_t> payload)
    {
        BinaryReader reader(payload);
        auto name = reader.read_name();
        if (!is_valid_utf8(name))
        {
            fail("custom section name is not valid UTF-8");
        }
    }

    void validate_section(SectionId id, std::span<const uint8_t> payload)
    {
        BinaryReader reader(payload);
        switch (id)
        {
        case SectionId::Type:
            context_.types = parse_type_section(payload).types;
            return;
        case SectionId::Import:
            validate_imports(parse_import_section(payload));
            return;
        case SectionId::Function:
        {
            const auto declared = parse_function_section(payload).type_indices;
            for (auto type_index : declared)
            {
                check_type_index(type_index, "function declaration");
                context_.functions.push_back(type_index);
            }
            declared_functions_ = declared.size();
            return;
        }
        case SectionId::Code:
            validate_code(parse_code_section(payload));
            return;
        case SectionId::Table:
            validate_tables(reader);
            break;
        case SectionId::Memory:
            validate_memories(reader);
            break;
        case SectionId::Tag:
            validate_tags(reader);
            break;
        case SectionId::Global:
            validate_globals(reader);
            break;
        case SectionId::Export:
            validate_exports(reader);
            break;
        case SectionId::Start:
            validate_start(reader);
            break;
        case SectionId::Element:
            validate_elements(reader);
            break;
        case SectionId::DataCount:
            context_.data_count = reader.read_varuint32();
            break;
        case SectionId::Data:
            validate_data(reader);
            break;
        default:
            fail("unexpected section");
        }
        if (!reader.eof())
        {
            fail("section " + std::to_string(static_cast<int>(id)) + " has trailing bytes");
        }
    }

    void check_type_index(uint32_t index, const std::string& what)
    {
        if (index >= context_.types.size())
        {
            fail(what + " references missing type " + std::to_string(index));
        }
    }

    void check_function_index(uint32_t index, const std::string& what)
    {
        if (index >= context_.functions.size())
        {
            fail(what + " references missing function " + std::to_string(index));
        }
    }

    Limits read_limits(BinaryReader& reader)
    {
        Limits limits;
        limits.flags = reader.read_u8();
        if (limits.flags > 0x07)
        {
            fail("invalid limits flags " + std::to_string(limits.flags));
        }
        const bool is_64 = (limits.flags & 0x04U) != 0;
        limits.min = is_64 ? reader.read_varuint64() : reader.read_varuint32();
        if ((limits.flags & 0x01U) != 0)
        {
            limits.max = is_64 ? reader.read_varuint64() : reader.read_varuint32();
        }
        return limits;
    }

    void check_bounds(const Limits& limits, uint64_t bound, const char* what)
    {
        if (limits.min > bound || (limits.max && *limits.max > bound))
        {
            fail(std::string(what) + " limits exceed " + std::to_string(bound));
        }
        if (limits.max && *limits.max < limits.min)
        {
            fail(std::string(what) + " maximum is smaller than its minimum");
        }
    }

    ValueType check_table_type(uint8_t element_type, const Limits& limits)
    {
        if (element_type != 0x70 && element_type != 0x6F)
        {
            fail("invalid table element type " + std::to_string(element_type));
        }
        if ((limits.flags & ~0x01U) != 0)
        {
            fail("invalid table limits flags " + std::to_string(limits.flags));
        }
        check_bounds(limits, 0xFFFFFFFFULL, "table");
        return static_cast<ValueType>(element_type);
    }

    MemoryInfo check_memory_type(const Limits& limits)
    {
        MemoryInfo memory{(limits.flags & 0x04U) != 0, (limits.flags & 0x02U) != 0};
        check_bounds(limits, memory.is_64 ? kMaxPages64 : kMaxPages32, "memory");
        if (memory.shared && !limits.max)
        {
            fail("shared memory requires a maximum");
        }
        return memory;
    }

    void check_tag_type(uint8_t attribute, uint32_t type_index)
    {
        if (attribute != 0)
        {
            fail("invalid tag attribute " + std::to_string(attribute));
        }
        check_type_index(type_index, "tag");
        if (!context_.types[type_index].results.empty())
        {
            fail("tag type " + std::to_string(type_index) + " must not have results");
        }
    }

    void validate_imports(const ImportSection& section)
    {
        for (const auto& import : section.imports)
        {
            switch (import.kind)
            {
            case ExternalKind::Function:
                check_type_index(import.type_index, "import " + import.module + "::" + import.name);
                context_.functions.push_back(import.type_index);
                break;
            case ExternalKind::Table:
                context_.tables.push_back(
                    check_table_type(import.table_type.element_type, import.table_type.limits));
                break;
            case ExternalKind::Memory:
                context_.memories.push_back(check_memory_type(import.memory_type.limits));
                break;
            case ExternalKind::Global:
                context_.globals.push_back(GlobalInfo{import.global_type.value_type, import.global_type.is_mutable});
                break;
            case ExternalKind::Tag:
                check_tag_type(import.tag_type.attribute, import.tag_type.type_index);
                context_.tags.push_back(import.tag_type.type_index);
                break;
            }
        }
    }

    ValueType read_ref_type(BinaryReader& reader)
    {
        auto raw = reader.read_u8();
        if (raw != 0x70 && raw != 0x6F)
        {
            fail("invalid reference type " + std::to_string(raw));
        }
        return static_cast<ValueType>(raw);
    }

    ValueType read_value_type(BinaryReader& reader)
    {
        auto raw = reader.read_u8();
        auto type = value_type_from_byte(raw);
        if (!type)
        {
            fail("invalid value type " + std::to_string(raw));
        }
        return *type;
    }

    void validate_tables(BinaryReader& reader)
    {
        auto count = reader.read_varuint32();
        for (uint32_t i = 0; i < count; ++i)
        {
            auto element_type = reader.read_u8();
            context_.tables.push_back(check_table_type(element_type, read_limits(reader)));
        }
    }

    void validate_memories(BinaryReader& reader)
    {
        auto count = reader.read_varuint32();
        for (uint32_t i = 0; i < count; ++i)
        {
            context_.memories.push_back(check_memory_type(read_limits(reader)));
        }
    }

    void validate_tags(BinaryReader& reader)
    {
        auto count = reader.read_varuint32();
        for (uint32_t i = 0; i < count; ++i)
        {
            auto attribute = reader.read_u8();
            auto type_index = reader.read_varuint32();
            check_tag_type(attribute, type_index);
            context_.tags.push_back(type_index);
        }
    }

    // Constant expressions: constants, global.get of an immutable global,
    // ref.null, ref.func and the extended-const integer arithmetic,
    // terminated by end and leaving exactly one value of `expected` type.
    void validate_constant_expression(BinaryReader& reader, ValueType expected)
    {
        std::vector<ValueType> stack;
        auto arithmetic = [&](ValueType type) {
            if (stack.size() < 2 || stack[stack.size() - 1] != type || stack[stack.size() - 2] != type)
            {
                fail("type mismatch in constant expression");
            }
            stack.pop_back();
        };

        while (true)
        {
            auto opcode = reader.read_u8();
            switch (opcode)
            {
            case 0x0B:
                if (stack.size() != 1 || stack.front() != expected)
                {
                    fail("constant expression does not produce a single " + to_string(expected));
                }
                return;
            case 0x41:
                reader.read_varint32();
                stack.push_back(ValueType::I32);
                break;
            case 0x42:
                reader.read_varint64();
                stack.push_back(ValueType::I64);
                break;
            case 0x43:
                reader.skip_bytes(4);
                stack.push_back(ValueType::F32);
                break;
            case 0x44:
                reader.skip_bytes(8);
                stack.push_back(ValueType::F64);
                break;
            case 0x23:
            {
                const auto& global = context_.global(reader.read_varuint32());
                if (global.is_mutable)
                {
                    fail("constant expression reads a mutable global");
                }
                stack.push_back(global.type);
                break;
            }
            case 0xD0:
            {
                auto heap_type = reader.read_u8();
                if (heap_type != 0x70 && heap_type != 0x6F && heap_type != 0x69)
                {
                    fail("invalid heap type for ref.null");
                }
                stack.push_back(static_cast<ValueType>(heap_type));
                break;
            }
            case 0xD2:
            {
                auto index = reader.read_varuint32();
                check_function_index(index, "ref.func");
                context_.declared_references.insert(index);
                stack.push_back(ValueType::FuncRef);
                break;
            }
            case 0x6A:
            case 0x6B:
            case 0x6C:
                arithmetic(ValueType::I32);
                break;
            case 0x7C:
            case 0x7D:
            case 0x7E:
                arithmetic(ValueType::I64);
                break;
            case 0xFD:
                if (reader.read_varuint32() != 12)
                {
                    fail("unsupported instruction in constant expression");
                }
                reader.skip_bytes(16);
                stack.push_back(ValueType::V128);
                break;
            default:
                fail("unsupported opcode " + std::to_string(opcode) + " in constant expression");
            }
        }
    }

    void validate_globals(BinaryReader& reader)
    {
        auto count = reader.read_varuint32();
        for (uint32_t i = 0; i < count; ++i)
        {
            auto type = read_value_type(reader);
            auto mutability = reader.read_u8();
            if (mutability > 1)
            {
                fail("invalid global mutability");
            }
            validate_constant_expression(reader, type);
            context_.globals.push_back(GlobalInfo{type, mutability == 1});
        }
    }

    void validate_exports(BinaryReader& reader)
    {
        std::unordered_set<std::string> names;
        auto count = reader.read_varuint32();
        for (uint32_t i = 0; i < count; ++i)
        {
            auto name = reader.read_name();
            if (!is_valid_utf8(name))
            {
                fail("export name is not valid UTF-8");
            }
            if (!names.insert(name).second)
            {
                fail("duplicate export name '" + name + "'");
            }
            auto kind = reader.read_u8();
            auto index = reader.read_varuint32();
            size_t limit = 0;
            switch (kind)
            {
            case 0x00:
                limit = context_.functions.size();
                context_.declared_references.insert(index);
                break;
            case 0x01:
                limit = context_.tables.size();
                break;
            case 0x02:
                limit = context_.memories.size();
                break;
            case 0x03:
                limit = context_.globals.size();
                break;
            case 0x04:
                limit = context_.tags.size();
                break;
            default:
                fail("export '" + name + "' has invalid kind " + std::to_string(kind));
            }
            if (index >= limit)
            {
                fail("export '" + name + "' references missing index " + std::to_string(index));
            }
        }
    }

    void validate_start(BinaryReader& reader)
    {
        auto index = reader.read_varuint32();
        check_function_index(index, "start section");
        const auto& type = context_.function_type(index);
        if (!type.params.empty() || !type.results.empty())
        {
            fail("start function must have type () -> ()");
        }
    }

    void validate_elements(BinaryReader& reader)
    {
        auto count = reader.read_varuint32();
        for (uint32_t i = 0; i < count; ++i)
        {
            // bit 0: passive or declarative, bit 1: explicit table index (active)
            // or declarative (otherwise), bit 2: initializers are expressions.
            auto flags = reader.read_varuint32();
            if (flags > 7)
            {
                fail("invalid element segment flags " + std::to_string(flags));
            }
            const bool active = (flags & 0x01U) == 0;
            const bool expressions = (flags & 0x04U) != 0;

            std::optional<ValueType> table_type;
            if (active)
            {
                const uint32_t table = (flags & 0x02U) != 0 ? reader.read_varuint32() : 0;
                table_type = context_.table(table);
                validate_constant_expression(reader, ValueType::I32);
            }

            ValueType element_type = ValueType::FuncRef;
            if ((flags & 0x03U) != 0)
            {
                if (expressions)
                {
                    element_type = read_ref_type(reader);
                }
                else if (reader.read_u8() != 0x00)
                {
                    fail("invalid element kind");
                }
            }

            auto item_count = reader.read_varuint32();
            for (uint32_t item = 0; item < item_count; ++item)
            {
                if (expressions)
                {
                    validate_constant_expression(reader, element_type);
                    continue;
                }
                auto function_index = reader.read_varuint32();
                check_function_index(function_index, "element segment");
                context_.declared_references.insert(function_index);
            }

            if (table_type && *table_type != element_type)
            {
                fail("element segment type does not match its table");
            }
            context_.element_segments.push_back(element_type);
        }
    }

    void validate_data(BinaryReader& reader)
    {
        auto count = reader.read_varuint32();
        for (uint32_t i = 0; i < count; ++i)
        {
            auto mode = reader.read_varuint32();
            switch (mode)
            {
            case 0:
                validate_constant_expression(reader, context_.memory(0).address_type());
                break;
            case 1:
                break;
            case 2:
            {
                const auto address = context_.memory(reader.read_varuint32()).address_type();
                validate_constant_expression(reader, address);
                break;
            }
            default:
                fail("invalid data segment mode " + std::to_string(mode));
            }
            auto size = reader.read_varuint32();
            reader.skip_bytes(size);
        }
        data_segments_ = count;
    }

    void validate_code(const CodeSection& section)
    {
        code_count_ = section.entries.size();
        if (code_count_ != declared_functions_)
        {
            fail("function section declares " + std::to_string(declared_functions_) +
                 " function(s) but code section holds " + std::to_string(code_count_));
        }
        const auto imported_functions = context_.functions.size() - declared_functions_;
        for (size_t i = 0; i < section.entries.size(); ++i)
        {
            const auto function_index = imported_functions + i;
            try
            {
                validate_function_body(context_, context_.function_type(static_cast<uint32_t>(function_index)),
                                       section.entries[i].bytes);
            }
            catch (const std::exception& ex)
            {
                fail("function " + std::to_string(function_index) + ": " + ex.what());
            }
        }
    }

    BinaryReader reader_;
    ModuleContext context_;
    size_t declared_functions_{0};
    size_t code_count_{0};
    uint32_t data_segments_{0};
};
} // namespace

ValidationReport validate_module(std::span<const uint8_t> bytes)
{
    ModuleValidator validator(bytes);
    try
    {
        validator.validate();
    }
    catch (const std::exception& ex)
    {
        return ValidationReport{false, ex.what()};
    }
    return ValidationReport{};
}

void require_valid(std::span<const uint8_t> bytes)
{
    auto report = validate_module(bytes);
    if (!report.ok())
    {
        throw ValidationError(report.message);
    }
}

} // namespace wasistub
