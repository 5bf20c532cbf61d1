#include "wasistub/section_codec.hpp"

#include <exception>
#include <string>
#include <utility>

#include "wasistub/binary_reader.hpp"
#include "wasistub/binary_writer.hpp"
#include "wasistub/errors.hpp"

namespace wasistub
{
namespace
{
template <typename Fn>
auto decoding(const char* what, Fn&& fn)
{
    try
    {
        return fn();
    }
    catch (const DecodeError&)
    {
        throw;
    }
    catch (const std::exception& ex)
    {
        throw DecodeError(std::string(what) + ": " + ex.what());
    }
}

void expect_consumed(const BinaryReader& reader, const char* what)
{
    if (!reader.eof())
    {
        throw DecodeError(std::string(what) + ": " + std::to_string(reader.remaining()) +
                          " trailing byte(s)");
    }
}

ValueType read_value_type(BinaryReader& reader)
{
    auto raw = reader.read_u8();
    auto type = value_type_from_byte(raw);
    if (!type)
    {
        throw DecodeError("unknown value type byte " + std::to_string(raw));
    }
    return *type;
}

Limits read_limits(BinaryReader& reader)
{
    Limits limits;
    limits.flags = reader.read_u8();
    if (limits.flags > 0x07)
    {
        throw DecodeError("invalid limits flags " + std::to_string(limits.flags));
    }
    const bool is_64 = (limits.flags & 0x04U) != 0;
    limits.min = is_64 ? reader.read_varuint64() : reader.read_varuint32();
    if ((limits.flags & 0x01U) != 0)
    {
        limits.max = is_64 ? reader.read_varuint64() : reader.read_varuint32();
    }
    return limits;
}

void write_limits(BinaryWriter& writer, const Limits& limits)
{
    writer.write_u8(limits.flags);
    const bool is_64 = (limits.flags & 0x04U) != 0;
    auto write_bound = [&](uint64_t value) {
        if (is_64)
        {
            writer.write_varuint64(value);
        }
        else
        {
            writer.write_varuint32(static_cast<uint32_t>(value));
        }
    };
    write_bound(limits.min);
    if (limits.max)
    {
        write_bound(*limits.max);
    }
}

Import read_import(BinaryReader& reader)
{
    Import import;
    import.module = reader.read_name();
    import.name = reader.read_name();
    auto kind = reader.read_u8();
    switch (kind)
    {
    case 0x00:
        import.kind = ExternalKind::Function;
        import.type_index = reader.read_varuint32();
        break;
    case 0x01:
        import.kind = ExternalKind::Table;
        import.table_type.element_type = reader.read_u8();
        if (import.table_type.element_type != 0x70 && import.table_type.element_type != 0x6F)
        {
            throw DecodeError("unsupported table element type " +
                              std::to_string(import.table_type.element_type));
        }
        import.table_type.limits = read_limits(reader);
        break;
    case 0x02:
        import.kind = ExternalKind::Memory;
        import.memory_type.limits = read_limits(reader);
        break;
    case 0x03:
    {
        import.kind = ExternalKind::Global;
        import.global_type.value_type = read_value_type(reader);
        auto mutability = reader.read_u8();
        if (mutability > 1)
        {
            throw DecodeError("invalid global mutability " + std::to_string(mutability));
        }
        import.global_type.is_mutable = mutability != 0;
        break;
    }
    case 0x04:
        import.kind = ExternalKind::Tag;
        import.tag_type.attribute = reader.read_u8();
        import.tag_type.type_index = reader.read_varuint32();
        break;
    default:
        throw DecodeError("unsupported import kind " + std::to_string(kind) + " for " + import.module +
                          "::" + import.name);
    }
    return import;
}

void write_import(BinaryWriter& writer, const Import& import)
{
    writer.write_name(import.module);
    writer.write_name(import.name);
    writer.write_u8(static_cast<uint8_t>(import.kind));
    switch (import.kind)
    {
    case ExternalKind::Function:
        writer.write_varuint32(import.type_index);
        break;
    case ExternalKind::Table:
        writer.write_u8(import.table_type.element_type);
        write_limits(writer, import.table_type.limits);
        break;
    case ExternalKind::Memory:
        write_limits(writer, import.memory_type.limits);
        break;
    case ExternalKind::Global:
        writer.write_u8(static_cast<uint8_t>(import.global_type.value_type));
        writer.write_u8(import.global_type.is_mutable ? 1 : 0);
        break;
    case ExternalKind::Tag:
        writer.write_u8(import.tag_type.attribute);
        writer.write_varuint32(import.tag_type.type_index);
        break;
    }
}

void write_function_type(BinaryWriter& writer, const FunctionType& type)
{
    writer.write_u8(0x60);
    writer.write_varuint32(static_cast<uint32_t>(type.params.size()));
    for (auto param : type.params)
    {
        writer.write_u8(static_cast<uint8_t>(param));
    }
    writer.write_varuint32(static_cast<uint32_t>(type.results.size()));
    for (auto result : type.results)
    {
        writer.write_u8(static_cast<uint8_t>(result));
    }
}
} // namespace

TypeSection parse_type_section(std::span<const uint8_t> payload)
{
    return decoding("type section", [&] {
        BinaryReader reader(payload);
        TypeSection section;
        auto count = reader.read_varuint32();
        section.types.reserve(count);
        for (uint32_t i = 0; i < count; ++i)
        {
            auto form = reader.read_u8();
            if (form != 0x60)
            {
                throw DecodeError("type " + std::to_string(i) + ": expected function type form 0x60");
            }
            FunctionType type;
            auto param_count = reader.read_varuint32();
            type.params.reserve(param_count);
            for (uint32_t j = 0; j < param_count; ++j)
            {
                type.params.push_back(read_value_type(reader));
            }
            auto result_count = reader.read_varuint32();
            type.results.reserve(result_count);
            for (uint32_t j = 0; j < result_count; ++j)
            {
                type.results.push_back(read_value_type(reader));
            }
            section.types.push_back(std::move(type));
        }
        expect_consumed(reader, "type section");
        section.raw.assign(payload.begin(), payload.end());
        return section;
    });
}

ImportSection parse_import_section(std::span<const uint8_t> payload)
{
    return decoding("import section", [&] {
        BinaryReader reader(payload);
        ImportSection section;
        auto count = reader.read_varuint32();
        section.imports.reserve(count);
        for (uint32_t i = 0; i < count; ++i)
        {
            section.imports.push_back(read_import(reader));
        }
        expect_consumed(reader, "import section");
        return section;
    });
}

FunctionSection parse_function_section(std::span<const uint8_t> payload)
{
    return decoding("function section", [&] {
        BinaryReader reader(payload);
        FunctionSection section;
        auto count = reader.read_varuint32();
        section.type_indices.reserve(count);
        for (uint32_t i = 0; i < count; ++i)
        {
            section.type_indices.push_back(reader.read_varuint32());
        }
        expect_consumed(reader, "function section");
        return section;
    });
}

CodeSection parse_code_section(std::span<const uint8_t> payload)
{
    return decoding("code section", [&] {
        BinaryReader reader(payload);
        CodeSection section;
        auto count = reader.read_varuint32();
        section.entries.reserve(count);
        for (uint32_t i = 0; i < count; ++i)
        {
            auto size = reader.read_varuint32();
            if (size > reader.remaining())
            {
                throw DecodeError("code entry " + std::to_string(i) + " exceeds section bounds");
            }
            auto entry = reader.read_bytes(size);
            section.entries.push_back(CodeEntry{std::vector<uint8_t>(entry.begin(), entry.end())});
        }
        expect_consumed(reader, "code section");
        return section;
    });
}

FunctionBody split_code_entry(std::span<const uint8_t> entry)
{
    return decoding("code entry", [&] {
        BinaryReader reader(entry);
        FunctionBody body;
        auto group_count = reader.read_varuint32();
        body.locals.reserve(group_count);
        for (uint32_t i = 0; i < group_count; ++i)
        {
            LocalDecl decl;
            decl.count = reader.read_varuint32();
            decl.type = read_value_type(reader);
            body.locals.push_back(decl);
        }
        body.expression = entry.subspan(reader.offset());
        return body;
    });
}

uint8_t section_id(const Section& section)
{
    return std::visit(Overloaded{
                          [](const TypeSection&) { return static_cast<uint8_t>(SectionId::Type); },
                          [](const ImportSection&) { return static_cast<uint8_t>(SectionId::Import); },
                          [](const FunctionSection&) { return static_cast<uint8_t>(SectionId::Function); },
                          [](const CodeSection&) { return static_cast<uint8_t>(SectionId::Code); },
                          [](const RawSection& raw) { return raw.id; },
                      },
                      section);
}

std::vector<uint8_t> encode_section_payload(const Section& section)
{
    BinaryWriter writer;
    std::visit(Overloaded{
                   [&](const TypeSection& types) {
                       if (!types.raw.empty())
                       {
                           writer.write_bytes(types.raw);
                           return;
                       }
                       writer.write_varuint32(static_cast<uint32_t>(types.types.size()));
                       for (const auto& type : types.types)
                       {
                           write_function_type(writer, type);
                       }
                   },
                   [&](const ImportSection& imports) {
                       writer.write_varuint32(static_cast<uint32_t>(imports.imports.size()));
                       for (const auto& import : imports.imports)
                       {
                           write_import(writer, import);
                       }
                   },
                   [&](const FunctionSection& functions) {
                       writer.write_varuint32(static_cast<uint32_t>(functions.type_indices.size()));
                       for (auto type_index : functions.type_indices)
                       {
                           writer.write_varuint32(type_index);
                       }
                   },
                   [&](const CodeSection& code) {
                       writer.write_varuint32(static_cast<uint32_t>(code.entries.size()));
                       for (const auto& entry : code.entries)
                       {
                           writer.write_sized(entry.bytes);
                       }
                   },
                   [&](const RawSection& raw) { writer.write_bytes(raw.payload); },
               },
               section);
    return writer.take();
}

std::vector<Section> decode_module(std::span<const uint8_t> bytes)
{
    return decoding("module", [&] {
        BinaryReader reader(bytes);
        if (reader.read_u32() != kWasmMagic)
        {
            throw DecodeError("invalid wasm magic number");
        }
        if (reader.read_u32() != kWasmVersion)
        {
            throw DecodeError("unsupported wasm version");
        }

        std::vector<Section> sections;
        while (!reader.eof())
        {
            auto id = reader.read_u8();
            auto size = reader.read_varuint32();
            if (size > reader.remaining())
            {
                throw DecodeError("section " + std::to_string(id) + " exceeds module bounds");
            }
            auto payload = reader.read_bytes(size);
            switch (static_cast<SectionId>(id))
            {
            case SectionId::Type:
                sections.emplace_back(parse_type_section(payload));
                break;
            case SectionId::Import:
                sections.emplace_back(parse_import_section(payload));
                break;
            case SectionId::Function:
                sections.emplace_back(parse_function_section(payload));
                break;
            case SectionId::Code:
                sections.emplace_back(parse_code_section(payload));
                break;
            default:
                sections.emplace_back(RawSection{id, std::vector<uint8_t>(payload.begin(), payload.end())});
                break;
            }
        }
        return sections;
    });
}

std::vector<uint8_t> encode_module(const std::vector<Section>& sections)
{
    BinaryWriter writer;
    writer.write_u32(kWasmMagic);
    writer.write_u32(kWasmVersion);
    for (const auto& section : sections)
    {
        writer.write_u8(section_id(section));
        writer.write_sized(encode_section_payload(section));
    }
    return writer.take();
}

} // namespace wasistub
