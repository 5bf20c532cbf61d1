#include "wasistub/body_validator.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "wasistub/binary_reader.hpp"
#include "wasistub/section_codec.hpp"

namespace wasistub
{
namespace
{
constexpr uint64_t kMaxLocals = 0xFFFFFFFFULL;

[[noreturn]] void fail(const std::string& message) { throw ValidationError(message); }

template <typename T>
const T& lookup(const std::vector<T>& items, uint32_t index, const char* what)
{
    if (index >= items.size())
    {
        fail("references missing " + std::string(what) + " " + std::to_string(index));
    }
    return items[index];
}

enum class FrameKind
{
    Function,
    Block,
    Loop,
    If,
    Else,
    Try,
    Catch,
    CatchAll,
    TryTable,
};

// nullopt stands for an operand of unknown type, produced by popping past
// the bottom of an unreachable frame.
using Operand = std::optional<ValueType>;

struct ControlFrame
{
    FrameKind kind{FrameKind::Block};
    std::vector<ValueType> start_types;
    std::vector<ValueType> end_types;
    size_t height{0};
    bool unreachable{false};
};

struct BlockSignature
{
    std::vector<ValueType> params;
    std::vector<ValueType> results;
};

struct MemoryAccess
{
    ValueType type;
    uint32_t alignment; // log2 of the access width in bytes
};

// Loads 0x28..0x35 followed by stores 0x36..0x3E.
constexpr std::array<MemoryAccess, 23> kMemoryAccesses = {{
    {ValueType::I32, 2}, {ValueType::I64, 3}, {ValueType::F32, 2}, {ValueType::F64, 3}, {ValueType::I32, 0},
    {ValueType::I32, 0}, {ValueType::I32, 1}, {ValueType::I32, 1}, {ValueType::I64, 0}, {ValueType::I64, 0},
    {ValueType::I64, 1}, {ValueType::I64, 1}, {ValueType::I64, 2}, {ValueType::I64, 2}, {ValueType::I32, 2},
    {ValueType::I64, 3}, {ValueType::F32, 2}, {ValueType::F64, 3}, {ValueType::I32, 0}, {ValueType::I32, 1},
    {ValueType::I64, 0}, {ValueType::I64, 1}, {ValueType::I64, 2},
}};

// Width pattern shared by each group of seven atomic read-modify-write
// instructions: i32, i64, i32 8-bit, i32 16-bit, i64 8-bit, i64 16-bit,
// i64 32-bit.
constexpr std::array<MemoryAccess, 7> kAtomicGroup = {{
    {ValueType::I32, 2},
    {ValueType::I64, 3},
    {ValueType::I32, 0},
    {ValueType::I32, 1},
    {ValueType::I64, 0},
    {ValueType::I64, 1},
    {ValueType::I64, 2},
}};

enum class SimdShape
{
    Unary,   // v128 -> v128
    Binary,  // v128 v128 -> v128
    Ternary, // v128 v128 v128 -> v128
    Test,    // v128 -> i32
    Shift,   // v128 i32 -> v128
    Reserved,
};

constexpr bool in_range(uint32_t value, uint32_t low, uint32_t high) { return value >= low && value <= high; }

// Shape of the 0xFD instructions that take no immediates.
SimdShape simd_shape(uint32_t op)
{
    if (op == 83 || op == 99 || op == 100 || op == 131 || op == 132 || op == 163 || op == 164 || op == 195 ||
        op == 196)
    {
        return SimdShape::Test;
    }
    if (in_range(op, 107, 109) || in_range(op, 139, 141) || in_range(op, 171, 173) || in_range(op, 203, 205))
    {
        return SimdShape::Shift;
    }
    if (op == 82 || in_range(op, 261, 268) || op == 275)
    {
        return SimdShape::Ternary;
    }
    if (op == 77 || in_range(op, 94, 98) || in_range(op, 103, 106) || op == 116 || op == 117 || op == 122 ||
        in_range(op, 124, 129) || in_range(op, 135, 138) || op == 148 || op == 160 || op == 161 ||
        in_range(op, 167, 170) || op == 192 || op == 193 || in_range(op, 199, 202) || op == 224 || op == 225 ||
        op == 227 || op == 236 || op == 237 || op == 239 || in_range(op, 248, 255) || in_range(op, 257, 260))
    {
        return SimdShape::Unary;
    }
    if (op == 14 || in_range(op, 35, 76) || in_range(op, 78, 81) || op == 101 || op == 102 ||
        in_range(op, 110, 115) || in_range(op, 118, 121) || op == 123 || op == 130 || op == 133 || op == 134 ||
        in_range(op, 142, 147) || in_range(op, 149, 153) || in_range(op, 155, 159) || op == 174 || op == 177 ||
        in_range(op, 181, 186) || in_range(op, 188, 191) || op == 206 || op == 209 || in_range(op, 213, 223) ||
        in_range(op, 228, 235) || in_range(op, 240, 247) || op == 256 || in_range(op, 269, 274))
    {
        return SimdShape::Binary;
    }
    return SimdShape::Reserved;
}

class FunctionValidator
{
public:
    FunctionValidator(const ModuleContext& module, const FunctionType& type)
        : module_(module)
        , type_(type)
    {
    }

    void validate(std::span<const uint8_t> entry)
    {
        const auto body = split_code_entry(entry);
        uint64_t local_count = type_.params.size();
        for (auto param : type_.params)
        {
            add_locals(1, param);
        }
        for (const auto& decl : body.locals)
        {
            local_count += decl.count;
            if (local_count > kMaxLocals)
            {
                fail("too many locals");
            }
            add_locals(decl.count, decl.type);
        }

        BinaryReader reader(body.expression);
        push_frame(FrameKind::Function, {}, type_.results);
        while (!frames_.empty())
        {
            if (reader.eof())
            {
                fail("function body is missing its final end");
            }
            const auto offset = reader.offset();
            const auto opcode = reader.read_u8();
            try
            {
                validate_instruction(reader, opcode);
            }
            catch (const ValidationError& ex)
            {
                fail("at offset " + std::to_string(offset) + ": " + ex.what());
            }
        }
        if (!reader.eof())
        {
            fail("trailing bytes after the final end");
        }
    }

private:
    // Locals are kept as runs so a declaration of millions of locals stays
    // cheap.
    void add_locals(uint64_t count, ValueType type)
    {
        if (count == 0)
        {
            return;
        }
        const uint64_t end = (local_runs_.empty() ? 0 : local_runs_.back().first) + count;
        local_runs_.emplace_back(end, type);
    }

    ValueType local_type(uint32_t index) const
    {
        auto run = std::upper_bound(local_runs_.begin(), local_runs_.end(), static_cast<uint64_t>(index),
                                    [](uint64_t value, const auto& entry) { return value < entry.first; });
        if (run == local_runs_.end())
        {
            fail("references missing local " + std::to_string(index));
        }
        return run->second;
    }

    void push(Operand operand) { operands_.push_back(operand); }

    void push_all(const std::vector<ValueType>& types)
    {
        for (auto type : types)
        {
            push(type);
        }
    }

    Operand pop()
    {
        const auto& frame = frames_.back();
        if (operands_.size() == frame.height)
        {
            if (frame.unreachable)
            {
                return std::nullopt;
            }
            fail("operand stack underflow");
        }
        auto operand = operands_.back();
        operands_.pop_back();
        return operand;
    }

    Operand pop(ValueType expected)
    {
        auto actual = pop();
        if (actual && *actual != expected)
        {
            fail("type mismatch: expected " + to_string(expected) + ", found " + to_string(*actual));
        }
        return actual;
    }

    std::vector<Operand> pop_all(const std::vector<ValueType>& types)
    {
        std::vector<Operand> popped(types.size());
        for (size_t i = types.size(); i-- > 0;)
        {
            popped[i] = pop(types[i]);
        }
        return popped;
    }

    void push_frame(FrameKind kind, std::vector<ValueType> start_types, std::vector<ValueType> end_types)
    {
        ControlFrame frame{kind, std::move(start_types), std::move(end_types), operands_.size(), false};
        push_all(frame.start_types);
        frames_.push_back(std::move(frame));
    }

    ControlFrame pop_frame()
    {
        pop_all(frames_.back().end_types);
        if (operands_.size() != frames_.back().height)
        {
            fail("block leaves " + std::to_string(operands_.size() - frames_.back().height) +
                 " extra value(s) on the stack");
        }
        auto frame = std::move(frames_.back());
        frames_.pop_back();
        return frame;
    }

    const ControlFrame& label(uint32_t depth) const
    {
        if (depth >= frames_.size())
        {
            fail("branch depth " + std::to_string(depth) + " exceeds block nesting");
        }
        return frames_[frames_.size() - 1 - depth];
    }

    static const std::vector<ValueType>& label_types(const ControlFrame& frame)
    {
        return frame.kind == FrameKind::Loop ? frame.start_types : frame.end_types;
    }

    void mark_unreachable()
    {
        operands_.resize(frames_.back().height);
        frames_.back().unreachable = true;
    }

    void unary(ValueType operand, ValueType result)
    {
        pop(operand);
        push(result);
    }

    void binary(ValueType operand, ValueType result)
    {
        pop(operand);
        pop(operand);
        push(result);
    }

    BlockSignature read_block_type(BinaryReader& reader)
    {
        auto value = reader.read_varint33();
        if (value >= 0)
        {
            const auto& type = module_.type(static_cast<uint32_t>(value));
            return BlockSignature{type.params, type.results};
        }
        // Single-byte encodings arrive as negative s33 values.
        if (value == -0x40)
        {
            return {};
        }
        auto type = value_type_from_byte(static_cast<uint8_t>(value & 0x7F));
        if (!type || value < -0x40)
        {
            fail("invalid block type");
        }
        return BlockSignature{{}, {*type}};
    }

    // Reads a memarg and returns the address type of the memory it names.
    // Atomic accesses must be naturally aligned, others at most that.
    ValueType read_memarg(BinaryReader& reader, uint32_t natural_alignment, bool exact = false)
    {
        auto flags = reader.read_varuint32();
        uint32_t memory_index = 0;
        if ((flags & 0x40U) != 0)
        {
            memory_index = reader.read_varuint32();
        }
        const auto alignment = flags & ~0x40U;
        const auto offset = reader.read_varuint64();
        const auto& memory = module_.memory(memory_index);
        if (exact ? alignment != natural_alignment : alignment > natural_alignment)
        {
            fail("alignment 2^" + std::to_string(alignment) + " does not fit a " +
                 std::to_string(1U << natural_alignment) + "-byte access");
        }
        if (!memory.is_64 && offset > 0xFFFFFFFFULL)
        {
            fail("offset out of range for a 32-bit memory");
        }
        return memory.address_type();
    }

    const FunctionType& read_tag(BinaryReader& reader) { return module_.tag_type(reader.read_varuint32()); }

    void check_label_types(uint32_t depth, const std::vector<ValueType>& produced)
    {
        if (label_types(label(depth)) != produced)
        {
            fail("catch clause does not match the types of label " + std::to_string(depth));
        }
    }

    void validate_try_table_catches(BinaryReader& reader)
    {
        auto count = reader.read_varuint32();
        for (uint32_t i = 0; i < count; ++i)
        {
            auto kind = reader.read_u8();
            std::vector<ValueType> produced;
            if (kind == 0x00 || kind == 0x01) // catch, catch_ref
            {
                produced = read_tag(reader).params;
            }
            else if (kind != 0x02 && kind != 0x03) // catch_all, catch_all_ref
            {
                fail("invalid catch clause kind " + std::to_string(kind));
            }
            if (kind == 0x01 || kind == 0x03)
            {
                produced.push_back(ValueType::ExnRef);
            }
            check_label_types(reader.read_varuint32(), produced);
        }
    }

    void validate_instruction(BinaryReader& reader, uint8_t opcode)
    {
        switch (opcode)
        {
        case 0x00: // unreachable
            mark_unreachable();
            return;
        case 0x01: // nop
            return;
        case 0x02: // block
        case 0x03: // loop
        {
            auto signature = read_block_type(reader);
            pop_all(signature.params);
            push_frame(opcode == 0x02 ? FrameKind::Block : FrameKind::Loop, std::move(signature.params),
                       std::move(signature.results));
            return;
        }
        case 0x04: // if
        {
            auto signature = read_block_type(reader);
            pop(ValueType::I32);
            pop_all(signature.params);
            push_frame(FrameKind::If, std::move(signature.params), std::move(signature.results));
            return;
        }
        case 0x05: // else
        {
            if (frames_.back().kind != FrameKind::If)
            {
                fail("else outside of if");
            }
            auto frame = pop_frame();
            push_frame(FrameKind::Else, std::move(frame.start_types), std::move(frame.end_types));
            return;
        }
        case 0x06: // try
        {
            auto signature = read_block_type(reader);
            pop_all(signature.params);
            push_frame(FrameKind::Try, std::move(signature.params), std::move(signature.results));
            return;
        }
        case 0x07: // catch
        {
            const auto& tag = read_tag(reader);
            if (frames_.back().kind != FrameKind::Try && frames_.back().kind != FrameKind::Catch)
            {
                fail("catch outside of try");
            }
            auto frame = pop_frame();
            push_frame(FrameKind::Catch, tag.params, std::move(frame.end_types));
            return;
        }
        case 0x08: // throw
            pop_all(read_tag(reader).params);
            mark_unreachable();
            return;
        case 0x09: // rethrow
        {
            const auto& target = label(reader.read_varuint32());
            if (target.kind != FrameKind::Catch && target.kind != FrameKind::CatchAll)
            {
                fail("rethrow target is not a catch block");
            }
            mark_unreachable();
            return;
        }
        case 0x0A: // throw_ref
            pop(ValueType::ExnRef);
            mark_unreachable();
            return;
        case 0x0B: // end
        {
            auto frame = pop_frame();
            if (frame.kind == FrameKind::If && frame.start_types != frame.end_types)
            {
                fail("if without else must leave its parameters as results");
            }
            push_all(frame.end_types);
            return;
        }
        case 0x0C: // br
            pop_all(label_types(label(reader.read_varuint32())));
            mark_unreachable();
            return;
        case 0x0D: // br_if
        {
            pop(ValueType::I32);
            const auto types = label_types(label(reader.read_varuint32()));
            pop_all(types);
            push_all(types);
            return;
        }
        case 0x0E: // br_table
        {
            auto target_count = reader.read_varuint32();
            std::vector<uint32_t> targets;
            for (uint32_t i = 0; i < target_count; ++i)
            {
                targets.push_back(reader.read_varuint32());
            }
            const auto default_target = reader.read_varuint32();
            pop(ValueType::I32);
            const auto arity = label_types(label(default_target)).size();
            for (auto target : targets)
            {
                const auto types = label_types(label(target));
                if (types.size() != arity)
                {
                    fail("br_table targets have different arities");
                }
                for (const auto& operand : pop_all(types))
                {
                    push(operand);
                }
            }
            pop_all(label_types(label(default_target)));
            mark_unreachable();
            return;
        }
        case 0x0F: // return
            pop_all(type_.results);
            mark_unreachable();
            return;
        case 0x10: // call
        {
            const auto& callee = module_.function_type(reader.read_varuint32());
            pop_all(callee.params);
            push_all(callee.results);
            return;
        }
        case 0x11: // call_indirect
        {
            const auto& callee = module_.type(reader.read_varuint32());
            if (module_.table(reader.read_varuint32()) != ValueType::FuncRef)
            {
                fail("call_indirect through a table that does not hold funcref");
            }
            pop(ValueType::I32);
            pop_all(callee.params);
            push_all(callee.results);
            return;
        }
        case 0x12: // return_call
        {
            const auto& callee = module_.function_type(reader.read_varuint32());
            if (callee.results != type_.results)
            {
                fail("return_call to a function with different results");
            }
            pop_all(callee.params);
            mark_unreachable();
            return;
        }
        case 0x13: // return_call_indirect
        {
            const auto& callee = module_.type(reader.read_varuint32());
            if (module_.table(reader.read_varuint32()) != ValueType::FuncRef)
            {
                fail("return_call_indirect through a table that does not hold funcref");
            }
            if (callee.results != type_.results)
            {
                fail("return_call_indirect to a type with different results");
            }
            pop(ValueType::I32);
            pop_all(callee.params);
            mark_unreachable();
            return;
        }
        case 0x18: // delegate
        {
            if (frames_.back().kind != FrameKind::Try)
            {
                fail("delegate outside of try");
            }
            auto frame = pop_frame();
            label(reader.read_varuint32());
            push_all(frame.end_types);
            return;
        }
        case 0x19: // catch_all
            if (frames_.back().kind != FrameKind::Try && frames_.back().kind != FrameKind::Catch)
            {
                fail("catch_all outside of try");
            }
            push_frame(FrameKind::CatchAll, {}, pop_frame().end_types);
            return;
        case 0x1A: // drop
            pop();
            return;
        case 0x1B: // select
        {
            pop(ValueType::I32);
            auto first = pop();
            auto second = pop();
            if ((first && is_reference(*first)) || (second && is_reference(*second)))
            {
                fail("untyped select over reference operands");
            }
            if (first && second && *first != *second)
            {
                fail("select operands have different types");
            }
            push(first ? first : second);
            return;
        }
        case 0x1C: // select t*
        {
            if (reader.read_varuint32() != 1)
            {
                fail("typed select must name exactly one type");
            }
            auto type = value_type_from_byte(reader.read_u8());
            if (!type)
            {
                fail("invalid select type");
            }
            pop(ValueType::I32);
            pop(*type);
            pop(*type);
            push(*type);
            return;
        }
        case 0x1F: // try_table
        {
            auto signature = read_block_type(reader);
            validate_try_table_catches(reader);
            pop_all(signature.params);
            push_frame(FrameKind::TryTable, std::move(signature.params), std::move(signature.results));
            return;
        }
        case 0x20: // local.get
            push(local_type(reader.read_varuint32()));
            return;
        case 0x21: // local.set
            pop(local_type(reader.read_varuint32()));
            return;
        case 0x22: // local.tee
        {
            const auto type = local_type(reader.read_varuint32());
            pop(type);
            push(type);
            return;
        }
        case 0x23: // global.get
            push(module_.global(reader.read_varuint32()).type);
            return;
        case 0x24: // global.set
        {
            const auto& global = module_.global(reader.read_varuint32());
            if (!global.is_mutable)
            {
                fail("global.set on an immutable global");
            }
            pop(global.type);
            return;
        }
        case 0x25: // table.get
        {
            const auto element = module_.table(reader.read_varuint32());
            pop(ValueType::I32);
            push(element);
            return;
        }
        case 0x26: // table.set
        {
            const auto element = module_.table(reader.read_varuint32());
            pop(element);
            pop(ValueType::I32);
            return;
        }
        case 0x3F: // memory.size
            push(module_.memory(reader.read_varuint32()).address_type());
            return;
        case 0x40: // memory.grow
        {
            const auto address = module_.memory(reader.read_varuint32()).address_type();
            pop(address);
            push(address);
            return;
        }
        case 0x41: // i32.const
            reader.read_varint32();
            push(ValueType::I32);
            return;
        case 0x42: // i64.const
            reader.read_varint64();
            push(ValueType::I64);
            return;
        case 0x43: // f32.const
            reader.skip_bytes(4);
            push(ValueType::F32);
            return;
        case 0x44: // f64.const
            reader.skip_bytes(8);
            push(ValueType::F64);
            return;
        case 0xD0: // ref.null
        {
            auto heap_type = reader.read_u8();
            if (heap_type != 0x70 && heap_type != 0x6F && heap_type != 0x69)
            {
                fail("invalid heap type for ref.null");
            }
            push(static_cast<ValueType>(heap_type));
            return;
        }
        case 0xD1: // ref.is_null
        {
            auto operand = pop();
            if (operand && !is_reference(*operand))
            {
                fail("ref.is_null on a non-reference operand");
            }
            push(ValueType::I32);
            return;
        }
        case 0xD2: // ref.func
        {
            auto index = reader.read_varuint32();
            lookup(module_.functions, index, "function");
            if (module_.declared_references.count(index) == 0)
            {
                fail("ref.func of undeclared function " + std::to_string(index));
            }
            push(ValueType::FuncRef);
            return;
        }
        case 0xFC:
            validate_misc(reader);
            return;
        case 0xFD:
            validate_simd(reader);
            return;
        case 0xFE:
            validate_atomic(reader);
            return;
        default:
            break;
        }

        if (opcode >= 0x28 && opcode <= 0x3E) // loads and stores
        {
            const auto& access = kMemoryAccesses[opcode - 0x28];
            const auto address = read_memarg(reader, access.alignment);
            if (opcode <= 0x35)
            {
                unary(address, access.type);
            }
            else
            {
                pop(access.type);
                pop(address);
            }
            return;
        }
        if (!validate_numeric(opcode))
        {
            fail("unknown opcode " + std::to_string(opcode));
        }
    }

    // Numeric instructions 0x45..0xC4; none takes immediates.
    bool validate_numeric(uint8_t op)
    {
        using VT = ValueType;
        if (op == 0x45 || in_range(op, 0x67, 0x69) || op == 0xC0 || op == 0xC1)
        {
            unary(VT::I32, VT::I32);
        }
        else if (in_range(op, 0x46, 0x4F))
        {
            binary(VT::I32, VT::I32);
        }
        else if (op == 0x50 || op == 0xA7)
        {
            unary(VT::I64, VT::I32);
        }
        else if (in_range(op, 0x51, 0x5A))
        {
            binary(VT::I64, VT::I32);
        }
        else if (in_range(op, 0x5B, 0x60))
        {
            binary(VT::F32, VT::I32);
        }
        else if (in_range(op, 0x61, 0x66))
        {
            binary(VT::F64, VT::I32);
        }
        else if (in_range(op, 0x6A, 0x78))
        {
            binary(VT::I32, VT::I32);
        }
        else if (in_range(op, 0x79, 0x7B) || in_range(op, 0xC2, 0xC4))
        {
            unary(VT::I64, VT::I64);
        }
        else if (in_range(op, 0x7C, 0x8A))
        {
            binary(VT::I64, VT::I64);
        }
        else if (in_range(op, 0x8B, 0x91))
        {
            unary(VT::F32, VT::F32);
        }
        else if (in_range(op, 0x92, 0x98))
        {
            binary(VT::F32, VT::F32);
        }
        else if (in_range(op, 0x99, 0x9F))
        {
            unary(VT::F64, VT::F64);
        }
        else if (in_range(op, 0xA0, 0xA6))
        {
            binary(VT::F64, VT::F64);
        }
        else if (op == 0xA8 || op == 0xA9 || op == 0xBC)
        {
            unary(VT::F32, VT::I32);
        }
        else if (op == 0xAA || op == 0xAB)
        {
            unary(VT::F64, VT::I32);
        }
        else if (op == 0xAC || op == 0xAD)
        {
            unary(VT::I32, VT::I64);
        }
        else if (op == 0xAE || op == 0xAF)
        {
            unary(VT::F32, VT::I64);
        }
        else if (op == 0xB0 || op == 0xB1 || op == 0xBD)
        {
            unary(VT::F64, VT::I64);
        }
        else if (op == 0xB2 || op == 0xB3 || op == 0xBE)
        {
            unary(VT::I32, VT::F32);
        }
        else if (op == 0xB4 || op == 0xB5)
        {
            unary(VT::I64, VT::F32);
        }
        else if (op == 0xB6)
        {
            unary(VT::F64, VT::F32);
        }
        else if (op == 0xB7 || op == 0xB8)
        {
            unary(VT::I32, VT::F64);
        }
        else if (op == 0xB9 || op == 0xBA || op == 0xBF)
        {
            unary(VT::I64, VT::F64);
        }
        else if (op == 0xBB)
        {
            unary(VT::F32, VT::F64);
        }
        else
        {
            return false;
        }
        return true;
    }

    void require_data_segment(uint32_t index)
    {
        if (!module_.data_count)
        {
            fail("data segment instruction without a data count section");
        }
        if (index >= *module_.data_count)
        {
            fail("references missing data segment " + std::to_string(index));
        }
    }

    ValueType element_segment(uint32_t index)
    {
        return lookup(module_.element_segments, index, "element segment");
    }

    void validate_misc(BinaryReader& reader)
    {
        using VT = ValueType;
        auto sub_opcode = reader.read_varuint32();
        switch (sub_opcode)
        {
        case 0x00: // saturating truncations
        case 0x01:
            unary(VT::F32, VT::I32);
            return;
        case 0x02:
        case 0x03:
            unary(VT::F64, VT::I32);
            return;
        case 0x04:
        case 0x05:
            unary(VT::F32, VT::I64);
            return;
        case 0x06:
        case 0x07:
            unary(VT::F64, VT::I64);
            return;
        case 0x08: // memory.init
        {
            require_data_segment(reader.read_varuint32());
            const auto address = module_.memory(reader.read_varuint32()).address_type();
            pop(VT::I32);
            pop(VT::I32);
            pop(address);
            return;
        }
        case 0x09: // data.drop
            require_data_segment(reader.read_varuint32());
            return;
        case 0x0A: // memory.copy
        {
            const auto& destination = module_.memory(reader.read_varuint32());
            const auto& source = module_.memory(reader.read_varuint32());
            const bool both_64 = destination.is_64 && source.is_64;
            pop(both_64 ? VT::I64 : VT::I32);
            pop(source.address_type());
            pop(destination.address_type());
            return;
        }
        case 0x0B: // memory.fill
        {
            const auto address = module_.memory(reader.read_varuint32()).address_type();
            pop(address);
            pop(VT::I32);
            pop(address);
            return;
        }
        case 0x0C: // table.init
        {
            const auto segment = element_segment(reader.read_varuint32());
            if (module_.table(reader.read_varuint32()) != segment)
            {
                fail("table.init element type mismatch");
            }
            pop(VT::I32);
            pop(VT::I32);
            pop(VT::I32);
            return;
        }
        case 0x0D: // elem.drop
            element_segment(reader.read_varuint32());
            return;
        case 0x0E: // table.copy
        {
            const auto destination = module_.table(reader.read_varuint32());
            if (module_.table(reader.read_varuint32()) != destination)
            {
                fail("table.copy element type mismatch");
            }
            pop(VT::I32);
            pop(VT::I32);
            pop(VT::I32);
            return;
        }
        case 0x0F: // table.grow
        {
            const auto element = module_.table(reader.read_varuint32());
            pop(VT::I32);
            pop(element);
            push(VT::I32);
            return;
        }
        case 0x10: // table.size
            static_cast<void>(module_.table(reader.read_varuint32()));
            push(VT::I32);
            return;
        case 0x11: // table.fill
        {
            const auto element = module_.table(reader.read_varuint32());
            pop(VT::I32);
            pop(element);
            pop(VT::I32);
            return;
        }
        default:
            fail("unknown 0xFC instruction " + std::to_string(sub_opcode));
        }
    }

    void read_lane(BinaryReader& reader, uint32_t lanes)
    {
        if (reader.read_u8() >= lanes)
        {
            fail("lane index out of range");
        }
    }

    void validate_simd(BinaryReader& reader)
    {
        using VT = ValueType;
        auto op = reader.read_varuint32();
        if (op <= 10) // v128.load and its extending and splatting variants
        {
            static constexpr std::array<uint32_t, 11> kAlignments = {4, 3, 3, 3, 3, 3, 3, 0, 1, 2, 3};
            unary(read_memarg(reader, kAlignments[op]), VT::V128);
            return;
        }
        if (in_range(op, 84, 91)) // load_lane, store_lane
        {
            const uint32_t width = (op - 84) % 4;
            const auto address = read_memarg(reader, width);
            read_lane(reader, 16U >> width);
            pop(VT::V128);
            pop(address);
            if (op <= 87)
            {
                push(VT::V128);
            }
            return;
        }
        if (op == 92 || op == 93) // load32_zero, load64_zero
        {
            unary(read_memarg(reader, op == 92 ? 2 : 3), VT::V128);
            return;
        }
        if (in_range(op, 21, 34)) // extract_lane, replace_lane
        {
            struct Lane
            {
                uint32_t lanes;
                ValueType scalar;
                bool replace;
            };
            static constexpr std::array<Lane, 14> kLanes = {{
                {16, VT::I32, false},
                {16, VT::I32, false},
                {16, VT::I32, true},
                {8, VT::I32, false},
                {8, VT::I32, false},
                {8, VT::I32, true},
                {4, VT::I32, false},
                {4, VT::I32, true},
                {2, VT::I64, false},
                {2, VT::I64, true},
                {4, VT::F32, false},
                {4, VT::F32, true},
                {2, VT::F64, false},
                {2, VT::F64, true},
            }};
            const auto& lane = kLanes[op - 21];
            read_lane(reader, lane.lanes);
            if (lane.replace)
            {
                pop(lane.scalar);
                unary(VT::V128, VT::V128);
            }
            else
            {
                unary(VT::V128, lane.scalar);
            }
            return;
        }
        switch (op)
        {
        case 11: // v128.store
        {
            const auto address = read_memarg(reader, 4);
            pop(VT::V128);
            pop(address);
            return;
        }
        case 12: // v128.const
            reader.skip_bytes(16);
            push(VT::V128);
            return;
        case 13: // i8x16.shuffle
            for (int i = 0; i < 16; ++i)
            {
                read_lane(reader, 32);
            }
            binary(VT::V128, VT::V128);
            return;
        case 15: // splats
        case 16:
        case 17:
            unary(VT::I32, VT::V128);
            return;
        case 18:
            unary(VT::I64, VT::V128);
            return;
        case 19:
            unary(VT::F32, VT::V128);
            return;
        case 20:
            unary(VT::F64, VT::V128);
            return;
        default:
            break;
        }

        switch (simd_shape(op))
        {
        case SimdShape::Unary:
            unary(VT::V128, VT::V128);
            return;
        case SimdShape::Binary:
            binary(VT::V128, VT::V128);
            return;
        case SimdShape::Ternary:
            pop(VT::V128);
            binary(VT::V128, VT::V128);
            return;
        case SimdShape::Test:
            unary(VT::V128, VT::I32);
            return;
        case SimdShape::Shift:
            pop(VT::I32);
            unary(VT::V128, VT::V128);
            return;
        case SimdShape::Reserved:
            break;
        }
        fail("unknown 0xFD instruction " + std::to_string(op));
    }

    void validate_atomic(BinaryReader& reader)
    {
        using VT = ValueType;
        auto op = reader.read_varuint32();
        switch (op)
        {
        case 0x00: // memory.atomic.notify
        {
            const auto address = read_memarg(reader, 2, true);
            pop(VT::I32);
            unary(address, VT::I32);
            return;
        }
        case 0x01: // memory.atomic.wait32
        case 0x02: // memory.atomic.wait64
        {
            const auto expected = op == 0x01 ? VT::I32 : VT::I64;
            const auto address = read_memarg(reader, op == 0x01 ? 2 : 3, true);
            pop(VT::I64);
            pop(expected);
            unary(address, VT::I32);
            return;
        }
        case 0x03: // atomic.fence
            if (reader.read_u8() != 0x00)
            {
                fail("atomic.fence takes a zero byte");
            }
            return;
        default:
            break;
        }

        if (in_range(op, 0x10, 0x16)) // atomic loads
        {
            const auto& access = kAtomicGroup[op - 0x10];
            unary(read_memarg(reader, access.alignment, true), access.type);
        }
        else if (in_range(op, 0x17, 0x1D)) // atomic stores
        {
            const auto& access = kAtomicGroup[op - 0x17];
            const auto address = read_memarg(reader, access.alignment, true);
            pop(access.type);
            pop(address);
        }
        else if (in_range(op, 0x1E, 0x47)) // add, sub, and, or, xor, xchg
        {
            const auto& access = kAtomicGroup[(op - 0x1E) % 7];
            const auto address = read_memarg(reader, access.alignment, true);
            pop(access.type);
            unary(address, access.type);
        }
        else if (in_range(op, 0x48, 0x4E)) // cmpxchg
        {
            const auto& access = kAtomicGroup[op - 0x48];
            const auto address = read_memarg(reader, access.alignment, true);
            pop(access.type);
            pop(access.type);
            unary(address, access.type);
        }
        else
        {
            fail("unknown 0xFE instruction " + std::to_string(op));
        }
    }

    const ModuleContext& module_;
    const FunctionType& type_;
    std::vector<std::pair<uint64_t, ValueType>> local_runs_; // (end index, type)
    std::vector<Operand> operands_;
    std::vector<ControlFrame> frames_;
};
} // namespace

const FunctionType& ModuleContext::type(uint32_t index) const { return lookup(types, index, "type"); }

const FunctionType& ModuleContext::function_type(uint32_t index) const
{
    return type(lookup(functions, index, "function"));
}

ValueType ModuleContext::table(uint32_t index) const { return lookup(tables, index, "table"); }

const MemoryInfo& ModuleContext::memory(uint32_t index) const { return lookup(memories, index, "memory"); }

const GlobalInfo& ModuleContext::global(uint32_t index) const { return lookup(globals, index, "global"); }

const FunctionType& ModuleContext::tag_type(uint32_t index) const { return type(lookup(tags, index, "tag")); }

void validate_function_body(const ModuleContext& module, const FunctionType& type, std::span<const uint8_t> entry)
{
    FunctionValidator validator(module, type);
    validator.validate(entry);
}

} // namespace wasistub
