#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wasistub
{
enum class ValueType : uint8_t
{
    I32 = 0x7F,
    I64 = 0x7E,
    F32 = 0x7D,
    F64 = 0x7C,
    V128 = 0x7B,
    FuncRef = 0x70,
    ExternRef = 0x6F,
    ExnRef = 0x69,
};

inline std::string to_string(ValueType type)
{
    switch (type)
    {
    case ValueType::I32:
        return "i32";
    case ValueType::I64:
        return "i64";
    case ValueType::F32:
        return "f32";
    case ValueType::F64:
        return "f64";
    case ValueType::V128:
        return "v128";
    case ValueType::FuncRef:
        return "funcref";
    case ValueType::ExternRef:
        return "externref";
    case ValueType::ExnRef:
        return "exnref";
    default:
        return "unknown";
    }
}

inline std::optional<ValueType> value_type_from_byte(uint8_t raw)
{
    switch (raw)
    {
    case 0x7F:
    case 0x7E:
    case 0x7D:
    case 0x7C:
    case 0x7B:
    case 0x70:
    case 0x6F:
    case 0x69:
        return static_cast<ValueType>(raw);
    default:
        return std::nullopt;
    }
}

constexpr bool is_reference(ValueType type)
{
    return type == ValueType::FuncRef || type == ValueType::ExternRef || type == ValueType::ExnRef;
}

struct FunctionType
{
    std::vector<ValueType> params;
    std::vector<ValueType> results;

    bool operator==(const FunctionType&) const = default;
};

inline std::string to_string(const FunctionType& type)
{
    auto join = [](const std::vector<ValueType>& types) {
        std::string text = "(";
        for (size_t i = 0; i < types.size(); ++i)
        {
            if (i != 0)
            {
                text += ", ";
            }
            text += to_string(types[i]);
        }
        return text + ")";
    };
    return join(type.params) + " -> " + join(type.results);
}

enum class ExternalKind : uint8_t
{
    Function = 0x00,
    Table = 0x01,
    Memory = 0x02,
    Global = 0x03,
    Tag = 0x04,
};

inline std::string to_string(ExternalKind kind)
{
    switch (kind)
    {
    case ExternalKind::Function:
        return "func";
    case ExternalKind::Table:
        return "table";
    case ExternalKind::Memory:
        return "memory";
    case ExternalKind::Global:
        return "global";
    case ExternalKind::Tag:
        return "tag";
    default:
        return "unknown";
    }
}
} // namespace wasistub
