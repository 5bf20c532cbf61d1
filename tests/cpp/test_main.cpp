#include "wasistub/binary_reader.hpp"
#include "wasistub/binary_writer.hpp"
#include "wasistub/file_io.hpp"
#include "wasistub/import_partitioner.hpp"
#include "wasistub/index_space.hpp"
#include "wasistub/section_codec.hpp"
#include "wasistub/stub_synthesizer.hpp"
#include "wasistub/stubber.hpp"
#include "wasistub/validator.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#ifndef WASISTUB_TEST_TEMP_DIR
#error "WASISTUB_TEST_TEMP_DIR must be defined"
#endif

namespace
{
using Bytes = std::vector<uint8_t>;
using wasistub::ExternalKind;
using wasistub::FunctionType;
using wasistub::Import;
using wasistub::ValueType;

constexpr const char* kWasi = "wasi_snapshot_preview1";

struct TestFailure final : std::runtime_error
{
    explicit TestFailure(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

void check(bool condition, const std::string& message)
{
    if (!condition)
    {
        throw TestFailure(message);
    }
}

template <typename Error, typename Fn>
Error expect_throws(Fn&& fn, const std::string& what)
{
    try
    {
        fn();
    }
    catch (const Error& ex)
    {
        return ex;
    }
    catch (const std::exception& ex)
    {
        throw TestFailure(what + ": threw the wrong exception: " + ex.what());
    }
    throw TestFailure(what + ": did not throw");
}

Bytes name(std::string_view text)
{
    wasistub::BinaryWriter writer;
    writer.write_name(text);
    return writer.take();
}

Bytes cat(std::initializer_list<Bytes> parts)
{
    Bytes joined;
    for (const auto& part : parts)
    {
        joined.insert(joined.end(), part.begin(), part.end());
    }
    return joined;
}

Bytes module_bytes(std::initializer_list<std::pair<uint8_t, Bytes>> sections)
{
    wasistub::BinaryWriter writer;
    writer.write_u32(wasistub::kWasmMagic);
    writer.write_u32(wasistub::kWasmVersion);
    for (const auto& [id, payload] : sections)
    {
        writer.write_u8(id);
        writer.write_sized(payload);
    }
    return writer.take();
}

Bytes import_func(std::string_view module, std::string_view field, uint8_t type_index)
{
    return cat({name(module), name(field), {0x00, type_index}});
}

Bytes sized(const Bytes& entry)
{
    wasistub::BinaryWriter writer;
    writer.write_sized(entry);
    return writer.take();
}

// Code section holding one body without locals.
Bytes single_body(const Bytes& expression)
{
    return cat({{0x01}, sized(cat({{0x00}, expression}))});
}

Bytes v128_bytes()
{
    return Bytes(16, 0x00);
}

// Type 0: (i32) -> ()
// Type 1: (i32, i32, i32, i32) -> (i32)
const Bytes kTypes = {0x02, 0x60, 0x01, 0x7F, 0x00, 0x60, 0x04, 0x7F, 0x7F, 0x7F, 0x7F, 0x01, 0x7F};

// local.get 0; call 0; i32.const 1..4; call 1; drop; end
const Bytes kRunBody = {0x00, 0x20, 0x00, 0x10, 0x00, 0x41, 0x01, 0x41, 0x02,
                        0x41, 0x03, 0x41, 0x04, 0x10, 0x01, 0x1A, 0x0B};

const Bytes kMemory = {0x01, 0x00, 0x01};
const Bytes kCustom = cat({name("note"), {0x2A, 0x2B}});

Bytes exports_memory_and(uint8_t function_index)
{
    return cat({{0x02}, name("memory"), {0x02, 0x00}, name("run"), {0x00, function_index}});
}

// imports: env::log (type 0), wasi::fd_write (type 1); one local function
// "run" of type 0 calling both.
Bytes make_example_module()
{
    return module_bytes({
        {1, kTypes},
        {2, cat({{0x02}, import_func("env", "log", 0), import_func(kWasi, "fd_write", 1)})},
        {3, {0x01, 0x00}},
        {5, kMemory},
        {7, exports_memory_and(2)},
        {10, cat({{0x01}, sized(kRunBody)})},
        {0, kCustom},
    });
}

Bytes make_reversed_module()
{
    return module_bytes({
        {1, kTypes},
        {2, cat({{0x02}, import_func(kWasi, "fd_write", 1), import_func("env", "log", 0)})},
        {3, {0x01, 0x00}},
        {10, cat({{0x01}, sized({0x00, 0x0B})})},
    });
}

Import make_import(std::string module, std::string field, uint32_t type_index = 0)
{
    Import import;
    import.module = std::move(module);
    import.name = std::move(field);
    import.type_index = type_index;
    return import;
}

template <typename T>
const T& section_at(const std::vector<wasistub::Section>& sections, size_t index)
{
    check(index < sections.size(), "missing section " + std::to_string(index));
    const auto* typed = std::get_if<T>(&sections[index]);
    check(typed != nullptr, "section " + std::to_string(index) + " has an unexpected kind");
    return *typed;
}

// --- binary reader / writer ---

void test_reader_leb()
{
    const Bytes data = {0xE5, 0x8E, 0x26, 0x7F, 0x80, 0x7F};
    wasistub::BinaryReader reader(data);
    check(reader.read_varuint32() == 624485, "varuint32 decodes a three byte value");
    check(reader.read_varint32() == -1, "varint32 sign extends 0x7F");
    check(reader.read_varint32() == -128, "varint32 decodes -128");
    check(reader.eof(), "reader consumed everything");

    const Bytes overlong = {0x80, 0x80, 0x80, 0x80, 0x80, 0x00};
    wasistub::BinaryReader overflow_reader(overlong);
    expect_throws<std::runtime_error>([&] { overflow_reader.read_varuint32(); }, "six byte varuint32");

    const Bytes truncated = {0x80};
    wasistub::BinaryReader truncated_reader(truncated);
    expect_throws<std::out_of_range>([&] { truncated_reader.read_varuint32(); }, "truncated varuint32");

    const Bytes widest = {0x80, 0x80, 0x80, 0x80, 0x0F, 0xFF, 0xFF, 0xFF, 0xFF, 0x7F};
    wasistub::BinaryReader widest_reader(widest);
    check(widest_reader.read_varuint32() == 0xF0000000U, "five byte varuint32 using all 32 bits");
    check(widest_reader.read_varint32() == -1, "five byte varint32 with sign-extended high bits");

    const Bytes unused_bits = {0x80, 0x80, 0x80, 0x80, 0x70};
    wasistub::BinaryReader unused_reader(unused_bits);
    expect_throws<std::runtime_error>([&] { unused_reader.read_varuint32(); }, "varuint32 with bits above 31");

    const Bytes bad_sign = {0xFF, 0xFF, 0xFF, 0xFF, 0x0F};
    wasistub::BinaryReader sign_reader(bad_sign);
    expect_throws<std::runtime_error>([&] { sign_reader.read_varint32(); }, "varint32 with mismatched sign bits");

    // Local declaration count 80 80 80 80 70, then nop; end.
    const auto module = module_bytes({
        {1, {0x01, 0x60, 0x00, 0x00}},
        {3, {0x01, 0x00}},
        {10, {0x01, 0x07, 0x80, 0x80, 0x80, 0x80, 0x70, 0x01, 0x0B}},
    });
    check(!wasistub::validate_module(module).ok(), "validator rejects a local count with unused high bits");
}

void test_writer_leb()
{
    wasistub::BinaryWriter writer;
    writer.write_varint32(76);
    check(writer.bytes() == Bytes{0xCC, 0x00}, "76 needs two signed LEB bytes");

    wasistub::BinaryWriter unsigned_writer;
    unsigned_writer.write_varuint32(624485);
    check(unsigned_writer.bytes() == Bytes{0xE5, 0x8E, 0x26}, "unsigned LEB of 624485");

    wasistub::BinaryWriter negative_writer;
    negative_writer.write_varint64(-1);
    negative_writer.write_varint32(-128);
    check(negative_writer.bytes() == Bytes{0x7F, 0x80, 0x7F}, "negative signed LEB values");
}

// --- section codec ---

void test_decode_classifies_sections()
{
    const auto bytes = make_example_module();
    const auto sections = wasistub::decode_module(bytes);
    check(sections.size() == 7, "seven sections decoded");

    const auto& types = section_at<wasistub::TypeSection>(sections, 0);
    check(types.types.size() == 2, "two types");
    check(types.types[1].params.size() == 4 && types.types[1].results == std::vector<ValueType>{ValueType::I32},
          "type 1 is (i32 x4) -> (i32)");

    const auto& imports = section_at<wasistub::ImportSection>(sections, 1);
    check(imports.imports.size() == 2, "two imports");
    check(imports.imports[1].module == kWasi && imports.imports[1].name == "fd_write", "second import is fd_write");
    check(imports.imports[1].type_index == 1, "fd_write uses type 1");

    check(section_at<wasistub::FunctionSection>(sections, 2).type_indices == std::vector<uint32_t>{0},
          "one local function of type 0");
    check(section_at<wasistub::RawSection>(sections, 3).id == 5, "memory section is opaque");
    check(section_at<wasistub::RawSection>(sections, 4).id == 7, "export section is opaque");

    const auto& code = section_at<wasistub::CodeSection>(sections, 5);
    check(code.entries.size() == 1 && code.entries[0].bytes == kRunBody, "code entry kept byte for byte");
    check(section_at<wasistub::RawSection>(sections, 6).payload == kCustom, "custom section payload kept");
}

void test_encode_reproduces_canonical_module()
{
    const auto bytes = make_example_module();
    check(wasistub::encode_module(wasistub::decode_module(bytes)) == bytes,
          "decoding and encoding a canonical module is the identity");
}

void test_decode_rejects_malformed_imports()
{
    const auto bytes = module_bytes({
        {1, kTypes},
        {2, cat({{0x01}, name("env"), name("log"), {0x07, 0x00}})},
    });
    auto error = expect_throws<wasistub::DecodeError>([&] { wasistub::decode_module(bytes); },
                                                      "unknown import kind");
    check(error.kind() == wasistub::ErrorKind::DecodeError, "error kind is DecodeError");

    const auto truncated = module_bytes({{1, {0x01, 0x60, 0x02, 0x7F}}});
    expect_throws<wasistub::DecodeError>([&] { wasistub::decode_module(truncated); }, "truncated type");
}

void test_split_code_entry()
{
    const Bytes entry = {0x02, 0x01, 0x7F, 0x03, 0x7E, 0x0B};
    const auto body = wasistub::split_code_entry(entry);
    check(body.locals.size() == 2, "two local groups");
    check(body.locals[1].count == 3 && body.locals[1].type == ValueType::I64, "second group is 3 x i64");
    check(body.expression.size() == 1 && body.expression[0] == 0x0B, "expression is a lone end");
}

// --- validator ---

void test_validator_accepts_example()
{
    auto report = wasistub::validate_module(make_example_module());
    check(report.ok(), "example module validates: " + report.message);
}

void test_validator_rejects_structural_errors()
{
    check(!wasistub::validate_module(Bytes{0x00, 0x61, 0x73, 0x6E, 0x01, 0x00, 0x00, 0x00}).ok(), "bad magic");

    const auto count_mismatch = module_bytes({{1, kTypes}, {3, {0x02, 0x00, 0x00}}, {10, cat({{0x01}, sized({0x00, 0x0B})})}});
    check(!wasistub::validate_module(count_mismatch).ok(), "function/code count mismatch");

    const auto out_of_order = module_bytes({{3, {0x00}}, {1, kTypes}});
    check(!wasistub::validate_module(out_of_order).ok(), "function section before type section");

    const auto missing_callee = module_bytes({
        {1, kTypes},
        {3, {0x01, 0x00}},
        {10, cat({{0x01}, sized({0x00, 0x41, 0x00, 0x10, 0x05, 0x0B})})},
    });
    check(!wasistub::validate_module(missing_callee).ok(), "call to a missing function");

    const auto missing_end = module_bytes({
        {1, kTypes},
        {3, {0x01, 0x00}},
        {10, cat({{0x01}, sized({0x00, 0x02, 0x40, 0x0B})})},
    });
    check(!wasistub::validate_module(missing_end).ok(), "body without its final end");

    const auto bad_local = module_bytes({
        {1, kTypes},
        {3, {0x01, 0x00}},
        {10, cat({{0x01}, sized({0x00, 0x20, 0x01, 0x1A, 0x0B})})},
    });
    check(!wasistub::validate_module(bad_local).ok(), "local index beyond params and locals");
}

void test_validator_checks_constant_bodies()
{
    // Type 0: () -> (i32)
    const Bytes types = {0x01, 0x60, 0x00, 0x01, 0x7F};
    const auto good = module_bytes({{1, types}, {3, {0x01, 0x00}}, {10, cat({{0x01}, sized({0x00, 0x41, 0xCC, 0x00, 0x0B})})}});
    check(wasistub::validate_module(good).ok(), "i32.const body for an i32 result");

    const auto wrong_kind = module_bytes({{1, types}, {3, {0x01, 0x00}}, {10, cat({{0x01}, sized({0x00, 0x42, 0x01, 0x0B})})}});
    check(!wasistub::validate_module(wrong_kind).ok(), "i64.const body for an i32 result");

    const auto empty = module_bytes({{1, types}, {3, {0x01, 0x00}}, {10, cat({{0x01}, sized({0x00, 0x0B})})}});
    check(!wasistub::validate_module(empty).ok(), "empty body for an i32 result");

    expect_throws<wasistub::ValidationError>([&] { wasistub::require_valid(empty); }, "require_valid");
}

void test_validator_types_operand_stack()
{
    // Type 0: () -> (i32), type 1: (i32) -> (i32)
    const Bytes types = {0x02, 0x60, 0x00, 0x01, 0x7F, 0x60, 0x01, 0x7F, 0x01, 0x7F};
    auto module_of = [&](uint8_t type_index, const Bytes& expression) {
        return module_bytes({{1, types}, {3, {0x01, type_index}}, {10, single_body(expression)}});
    };
    auto accepts = [&](uint8_t type_index, const Bytes& expression, const std::string& what) {
        auto report = wasistub::validate_module(module_of(type_index, expression));
        check(report.ok(), what + ": " + report.message);
    };
    auto rejects = [&](uint8_t type_index, const Bytes& expression, const std::string& what) {
        check(!wasistub::validate_module(module_of(type_index, expression)).ok(), what);
    };

    // block (result i32) i32.const 1 local.get 0 br_if 0 end local.get 0 i32.add end
    accepts(1, {0x02, 0x7F, 0x41, 0x01, 0x20, 0x00, 0x0D, 0x00, 0x0B, 0x20, 0x00, 0x6A, 0x0B}, "br_if keeps the label value");
    accepts(0, {0x00, 0x0B}, "unreachable satisfies any result");
    accepts(0, {0x00, 0x6A, 0x0B}, "operands below an unreachable frame are polymorphic");
    // local.get 0 if (result i32) i32.const 1 else i32.const 2 end end
    accepts(1, {0x20, 0x00, 0x04, 0x7F, 0x41, 0x01, 0x05, 0x41, 0x02, 0x0B, 0x0B}, "if/else with a result");
    // v128.const 0 i32x4.extract_lane 3 end
    accepts(0, cat({{0xFD, 0x0C}, v128_bytes(), {0xFD, 0x1B, 0x03, 0x0B}}), "SIMD lane extraction");

    rejects(0, {0x01, 0x0B}, "nop leaves no i32 result");
    rejects(0, {0x41, 0x01, 0x42, 0x02, 0x6A, 0x0B}, "i32.add over an i64 operand");
    rejects(0, {0x41, 0x01, 0x41, 0x02, 0x0B}, "two values for a single result");
    rejects(1, {0x20, 0x00, 0x04, 0x7F, 0x41, 0x01, 0x0B, 0x0B}, "if with a result but no else");
    rejects(0, {0x02, 0x7F, 0x0C, 0x00, 0x0B, 0x0B}, "br without the label value");
    rejects(0, {0x41, 0x00, 0x02, 0x40, 0x0F, 0x0B, 0x1A, 0x0B}, "return without the function result");
    rejects(0, {0x41, 0x00, 0x41, 0x01, 0x1B, 0x0B}, "select without a condition");
    rejects(0, cat({{0xFD, 0x0C}, v128_bytes(), {0xFD, 0x1B, 0x04, 0x0B}}), "lane index out of range");

    const auto immutable_global = module_bytes({
        {1, {0x01, 0x60, 0x00, 0x00}},
        {3, {0x01, 0x00}},
        {6, {0x01, 0x7F, 0x00, 0x41, 0x00, 0x0B}},
        {10, single_body({0x41, 0x01, 0x24, 0x00, 0x0B})},
    });
    check(!wasistub::validate_module(immutable_global).ok(), "global.set on an immutable global");

    const auto undeclared_ref = module_bytes({
        {1, {0x01, 0x60, 0x00, 0x00}},
        {3, {0x01, 0x00}},
        {10, single_body({0xD2, 0x00, 0x1A, 0x0B})},
    });
    check(!wasistub::validate_module(undeclared_ref).ok(), "ref.func of a function never declared");

    // Type 0: () -> (i32) for the local function, type 1: (i32) -> () for the import.
    const auto ill_typed = module_bytes({
        {1, {0x02, 0x60, 0x00, 0x01, 0x7F, 0x60, 0x01, 0x7F, 0x00}},
        {2, cat({{0x01}, import_func(kWasi, "proc_exit", 1)})},
        {3, {0x01, 0x00}},
        {10, single_body({0x01, 0x0B})},
    });
    auto outcome = wasistub::try_stub_module(ill_typed);
    check(!outcome.ok(), "an ill-typed module is not rewritten");
    check(outcome.error_kind == wasistub::ErrorKind::InputNotValid, "ill-typed input is InputNotValid");
}

// Type 0: () -> (), type 1: (i32) -> (); tag 0 carries an i32. The wasi
// import comes first so the module can be stubbed.
Bytes make_exception_module(const Bytes& expression)
{
    return module_bytes({
        {1, {0x02, 0x60, 0x00, 0x00, 0x60, 0x01, 0x7F, 0x00}},
        {2, cat({{0x01}, import_func(kWasi, "proc_exit", 1)})},
        {3, {0x01, 0x00}},
        {13, {0x01, 0x00, 0x01}},
        {10, single_body(expression)},
    });
}

void test_validator_exception_handling()
{
    const std::vector<std::pair<std::string, Bytes>> valid = {
        {"throw", {0x41, 0x07, 0x08, 0x00, 0x0B}},
        // try i32.const 7 throw 0 catch 0 drop catch_all end end
        {"try/catch/catch_all", {0x06, 0x40, 0x41, 0x07, 0x08, 0x00, 0x07, 0x00, 0x1A, 0x19, 0x0B, 0x0B}},
        // try catch_all rethrow 0 end end
        {"rethrow", {0x06, 0x40, 0x19, 0x09, 0x00, 0x0B, 0x0B}},
        // block try delegate 0 end end
        {"delegate", {0x02, 0x40, 0x06, 0x40, 0x18, 0x00, 0x0B, 0x0B}},
        // block try_table (catch_all 0) i32.const 7 throw 0 end end end
        {"try_table", {0x02, 0x40, 0x1F, 0x40, 0x01, 0x02, 0x00, 0x41, 0x07, 0x08, 0x00, 0x0B, 0x0B, 0x0B}},
        // block (result exnref) try_table (catch_all_ref 0) end unreachable end throw_ref end
        {"throw_ref", {0x02, 0x69, 0x1F, 0x40, 0x01, 0x03, 0x00, 0x0B, 0x00, 0x0B, 0x0A, 0x0B}},
    };
    for (const auto& [what, expression] : valid)
    {
        const auto input = make_exception_module(expression);
        auto report = wasistub::validate_module(input);
        check(report.ok(), what + ": " + report.message);
        auto outcome = wasistub::try_stub_module(input);
        check(outcome.ok(), what + " module is stubbed: " + outcome.error_message);
    }

    const std::vector<std::pair<std::string, Bytes>> invalid = {
        {"throw without the tag payload", {0x08, 0x00, 0x0B}},
        {"catch outside of try", {0x02, 0x40, 0x07, 0x00, 0x0B, 0x0B}},
        {"rethrow outside of catch", {0x02, 0x40, 0x09, 0x00, 0x0B, 0x0B}},
        {"missing tag", {0x41, 0x07, 0x08, 0x01, 0x0B}},
        // block try_table (catch 0 0) end end: the tag's i32 has no place in the label
        {"catch clause mismatching its label", {0x02, 0x40, 0x1F, 0x40, 0x01, 0x00, 0x00, 0x00, 0x0B, 0x0B, 0x0B}},
    };
    for (const auto& [what, expression] : invalid)
    {
        check(!wasistub::validate_module(make_exception_module(expression)).ok(), what);
    }

    const auto tag_with_results = module_bytes({{1, {0x01, 0x60, 0x00, 0x01, 0x7F}}, {13, {0x01, 0x00, 0x00}}});
    check(!wasistub::validate_module(tag_with_results).ok(), "tag type with results");
}

// Type 0: () -> (), type 1: (i32) -> (); one shared memory of one page.
Bytes make_atomic_module(const Bytes& memory, const Bytes& expression)
{
    return module_bytes({
        {1, {0x02, 0x60, 0x00, 0x00, 0x60, 0x01, 0x7F, 0x00}},
        {2, cat({{0x01}, import_func(kWasi, "proc_exit", 1)})},
        {3, {0x01, 0x00}},
        {5, memory},
        {10, single_body(expression)},
    });
}

void test_validator_atomics()
{
    const Bytes shared = {0x01, 0x03, 0x01, 0x01};
    const std::vector<std::pair<std::string, Bytes>> valid = {
        {"atomic.fence", {0xFE, 0x03, 0x00, 0x0B}},
        {"i32.atomic.load", {0x41, 0x00, 0xFE, 0x10, 0x02, 0x00, 0x1A, 0x0B}},
        {"i64.atomic.store32", {0x41, 0x00, 0x42, 0x01, 0xFE, 0x1D, 0x02, 0x00, 0x0B}},
        {"i32.atomic.rmw.cmpxchg", {0x41, 0x00, 0x41, 0x01, 0x41, 0x02, 0xFE, 0x48, 0x02, 0x00, 0x1A, 0x0B}},
        {"memory.atomic.wait32", {0x41, 0x00, 0x41, 0x00, 0x42, 0x7F, 0xFE, 0x01, 0x02, 0x00, 0x1A, 0x0B}},
    };
    for (const auto& [what, expression] : valid)
    {
        const auto input = make_atomic_module(shared, expression);
        auto report = wasistub::validate_module(input);
        check(report.ok(), what + ": " + report.message);
        auto outcome = wasistub::try_stub_module(input);
        check(outcome.ok(), what + " module is stubbed: " + outcome.error_message);
    }

    check(!wasistub::validate_module(make_atomic_module(shared, {0x41, 0x00, 0xFE, 0x10, 0x01, 0x00, 0x1A, 0x0B})).ok(),
          "atomic load below natural alignment");
    check(!wasistub::validate_module(make_atomic_module(shared, {0x42, 0x00, 0xFE, 0x10, 0x02, 0x00, 0x1A, 0x0B})).ok(),
          "atomic load from an i64 address in a 32-bit memory");
    check(!wasistub::validate_module(make_atomic_module(shared, {0xFE, 0x03, 0x01, 0x0B})).ok(),
          "atomic.fence with a non-zero immediate");
    check(!wasistub::validate_module(make_atomic_module({0x01, 0x02, 0x01}, {0xFE, 0x03, 0x00, 0x0B})).ok(),
          "shared memory without a maximum");
}

// --- import partitioner ---

void test_partition_suffix_layout()
{
    const std::vector<Import> imports = {
        make_import("env", "log"),
        make_import(kWasi, "fd_write", 1),
        make_import(kWasi, "proc_exit"),
    };
    std::vector<std::string> reported;
    auto partition = wasistub::partition_imports(imports, kWasi, [&](const Import& import) {
        reported.push_back(import.module + "::" + import.name);
    });

    check(partition.layout_supported(), "suffix layout is supported");
    check(partition.passthrough.size() == 1 && partition.passthrough[0].name == "log", "env::log passes through");
    check(partition.stub_candidates.size() == 2, "two candidates");
    check(partition.stub_candidates[0].import.name == "fd_write" && partition.stub_candidates[0].import_position == 1,
          "fd_write is the first candidate at position 1");
    check(partition.stub_candidates[1].import.name == "proc_exit", "proc_exit is the second candidate");
    check(reported == std::vector<std::string>{std::string(kWasi) + "::fd_write", std::string(kWasi) + "::proc_exit"},
          "each candidate is reported once, in order");
}

void test_partition_is_idempotent()
{
    const std::vector<Import> imports = {
        make_import("env", "a"),
        make_import("env", "b"),
        make_import(kWasi, "c", 2),
    };
    auto first = wasistub::partition_imports(imports, kWasi);
    auto second = wasistub::partition_imports(imports, kWasi);
    check(first.stub_candidates.size() == second.stub_candidates.size(), "same candidate count");
    for (size_t i = 0; i < first.stub_candidates.size(); ++i)
    {
        check(first.stub_candidates[i].import.name == second.stub_candidates[i].import.name &&
                  first.stub_candidates[i].import_position == second.stub_candidates[i].import_position,
              "same candidates");
    }
    check(first.passthrough.size() == second.passthrough.size(), "same passthrough count");
    for (size_t i = 0; i < first.passthrough.size(); ++i)
    {
        check(first.passthrough[i].name == second.passthrough[i].name, "same passthrough imports");
    }
}

void test_partition_records_violation()
{
    const std::vector<Import> imports = {
        make_import(kWasi, "fd_write", 1),
        make_import("env", "log"),
        make_import("env", "abort"),
    };
    size_t reported = 0;
    auto partition = wasistub::partition_imports(imports, kWasi, [&](const Import&) { ++reported; });
    check(!partition.layout_supported(), "non-target import after target import is rejected");
    check(reported == 0, "no candidate is reported for a rejected layout");
    check(partition.violation->import_position == 1, "first offender is at position 1");
    check(partition.violation->name == "log", "first offender is env::log");
    check(partition.violation->trailing_imports == 2, "both trailing imports counted");
    check(partition.violation->describe(kWasi).find("env::log") != std::string::npos, "message names the import");
}

void test_partition_keeps_non_function_target_imports()
{
    auto memory = make_import(kWasi, "memory");
    memory.kind = ExternalKind::Memory;
    memory.memory_type.limits.min = 1;
    const std::vector<Import> imports = {make_import("env", "log"), memory, make_import(kWasi, "fd_write")};

    auto partition = wasistub::partition_imports(imports, kWasi);
    check(partition.layout_supported(), "target memory import does not break the suffix");
    check(partition.stub_candidates.size() == 1, "only the function import is a candidate");
    check(partition.passthrough.size() == 2 && partition.passthrough[1].kind == ExternalKind::Memory,
          "memory import passes through");
}

// --- stub synthesizer ---

void test_stub_without_results()
{
    const FunctionType type{{ValueType::I32, ValueType::I64}, {}};
    auto body = wasistub::synthesize_stub(type);
    check(body.locals.size() == 2, "one local per parameter");
    check(body.locals[0].count == 1 && body.locals[0].type == ValueType::I32, "first local is one i32");
    check(body.locals[1].count == 1 && body.locals[1].type == ValueType::I64, "second local is one i64");
    check(body.instructions == Bytes{0x0B}, "no-result stub is a lone end");
    check(wasistub::encode_stub(body).bytes == Bytes{0x02, 0x01, 0x7F, 0x01, 0x7E, 0x0B}, "encoded stub body");
}

void test_stub_with_i32_result()
{
    const FunctionType type{{ValueType::I32, ValueType::I32, ValueType::I32, ValueType::I32}, {ValueType::I32}};
    auto body = wasistub::synthesize_stub(type);
    check(body.locals.size() == 4, "four unused locals");
    check(body.instructions == Bytes{0x41, 0xCC, 0x00, 0x0B}, "pushes i32 76 then ends");
}

void test_stub_rejects_unsupported_results()
{
    const std::vector<FunctionType> unsupported = {
        {{}, {ValueType::I64}},
        {{}, {ValueType::F32}},
        {{ValueType::I32}, {ValueType::F64}},
        {{}, {ValueType::I32, ValueType::I32}},
    };
    for (const auto& type : unsupported)
    {
        auto error = expect_throws<wasistub::UnsupportedSignature>([&] { wasistub::synthesize_stub(type); },
                                                                  wasistub::to_string(type));
        check(error.kind() == wasistub::ErrorKind::UnsupportedSignature, "error kind is UnsupportedSignature");
    }
}

// --- function index space ---

void test_rebuild_function_section()
{
    std::vector<wasistub::StubCandidate> candidates = {
        {make_import(kWasi, "a", 3), 1, FunctionType{}},
        {make_import(kWasi, "b", 1), 2, FunctionType{}},
    };
    wasistub::FunctionSection original{{0, 2, 0}};
    auto rebuilt = wasistub::rebuild_function_section(candidates, original);
    check(rebuilt.type_indices == std::vector<uint32_t>{3, 1, 0, 2, 0}, "stubs first, then original declarations");
}

void test_rebuild_code_section()
{
    std::vector<wasistub::StubCandidate> candidates = {
        {make_import(kWasi, "a"), 0, FunctionType{{ValueType::I32}, {ValueType::I32}}},
    };
    wasistub::CodeSection original;
    original.entries.push_back(wasistub::CodeEntry{kRunBody});
    original.entries.push_back(wasistub::CodeEntry{{0x00, 0x0B}});

    auto rebuilt = wasistub::rebuild_code_section(candidates, original);
    check(rebuilt.entries.size() == 3, "one stub plus two originals");
    check(rebuilt.entries[0].bytes == Bytes{0x01, 0x01, 0x7F, 0x41, 0xCC, 0x00, 0x0B}, "stub body first");
    check(rebuilt.entries[1].bytes == kRunBody, "first original untouched");
    check(rebuilt.entries[2].bytes == Bytes{0x00, 0x0B}, "second original untouched");
}

// --- module assembler ---

void test_stub_example_module()
{
    const auto input = make_example_module();
    std::vector<std::string> reported;
    wasistub::StubOptions options;
    options.on_candidate = [&](const Import& import) { reported.push_back(import.name); };

    auto result = wasistub::stub_module(input, options);
    check(reported == std::vector<std::string>{"fd_write"}, "fd_write reported");
    check(result.stubbed.size() == 1 && result.stubbed[0].name == "fd_write", "fd_write stubbed");
    check(result.passthrough_imports == 1, "one import kept");
    check(wasistub::validate_module(result.bytes).ok(), "output validates");

    const auto sections = wasistub::decode_module(result.bytes);
    check(sections.size() == 7, "section count unchanged");

    const auto& imports = section_at<wasistub::ImportSection>(sections, 1);
    check(imports.imports.size() == 1 && imports.imports[0].module == "env" && imports.imports[0].name == "log",
          "only env::log stays imported");

    check(section_at<wasistub::FunctionSection>(sections, 2).type_indices == std::vector<uint32_t>{1, 0},
          "stub declared with fd_write's type, then the original function");

    const auto& code = section_at<wasistub::CodeSection>(sections, 5);
    check(code.entries.size() == 2, "two bodies");
    check(code.entries[0].bytes == Bytes{0x04, 0x01, 0x7F, 0x01, 0x7F, 0x01, 0x7F, 0x01, 0x7F, 0x41, 0xCC, 0x00, 0x0B},
          "stub has four unused locals and returns 76");
    check(code.entries[1].bytes == kRunBody, "original body and its call instructions are bit-identical");
}

void test_stub_passthrough_fidelity()
{
    const auto input = make_example_module();
    const auto before = wasistub::decode_module(input);
    const auto after = wasistub::decode_module(wasistub::stub_module(input).bytes);

    auto raw_sections = [](const std::vector<wasistub::Section>& sections) {
        std::vector<std::pair<uint8_t, Bytes>> raw;
        for (const auto& section : sections)
        {
            if (const auto* opaque = std::get_if<wasistub::RawSection>(&section))
            {
                raw.emplace_back(opaque->id, opaque->payload);
            }
        }
        return raw;
    };
    check(raw_sections(before) == raw_sections(after), "opaque sections identical and in the same order");
    check(section_at<wasistub::TypeSection>(after, 0).raw == kTypes, "type section re-emitted unchanged");
}

void test_stub_rejects_reversed_layout()
{
    const auto input = make_reversed_module();
    std::vector<std::string> reported;
    wasistub::StubOptions options;
    options.on_candidate = [&](const Import& import) { reported.push_back(import.name); };
    auto error = expect_throws<wasistub::UnsupportedImportLayout>([&] { wasistub::stub_module(input, options); },
                                                                 "target import before env import");
    check(reported.empty(), "nothing reported as stubbed before the layout is rejected");
    check(error.kind() == wasistub::ErrorKind::UnsupportedImportLayout, "error kind is UnsupportedImportLayout");

    auto outcome = wasistub::try_stub_module(input);
    check(!outcome.ok(), "no result produced");
    check(outcome.error_kind == wasistub::ErrorKind::UnsupportedImportLayout, "outcome carries the error kind");
    check(outcome.error_message.find("env::log") != std::string::npos, "outcome names the offending import");
}

void test_stub_rejects_invalid_input()
{
    const Bytes garbage = {0x00, 0x61, 0x73, 0x6D, 0x01, 0x00, 0x00, 0x00, 0x03, 0x05, 0x01};
    auto error = expect_throws<wasistub::InputNotValid>([&] { wasistub::stub_module(garbage); }, "truncated module");
    check(error.kind() == wasistub::ErrorKind::InputNotValid, "error kind is InputNotValid");
}

void test_stub_rejects_unsupported_signature()
{
    // Type 0: () -> (i64)
    const auto input = module_bytes({
        {1, {0x01, 0x60, 0x00, 0x01, 0x7E}},
        {2, cat({{0x01}, import_func(kWasi, "clock", 0)})},
    });
    auto outcome = wasistub::try_stub_module(input);
    check(!outcome.ok(), "i64 result cannot be stubbed");
    check(outcome.error_kind == wasistub::ErrorKind::UnsupportedSignature, "error kind is UnsupportedSignature");
}

void test_stub_module_without_local_functions()
{
    const auto input = module_bytes({
        {1, kTypes},
        {2, cat({{0x02}, import_func(kWasi, "fd_write", 1), import_func(kWasi, "proc_exit", 0)})},
        {7, cat({{0x01}, name("fd_write"), {0x00, 0x00}})},
        {0, kCustom},
    });
    auto result = wasistub::stub_module(input);
    check(result.stubbed.size() == 2, "both imports stubbed");

    const auto sections = wasistub::decode_module(result.bytes);
    check(sections.size() == 6, "function and code sections added");
    check(section_at<wasistub::ImportSection>(sections, 1).imports.empty(), "import section left empty");
    check(section_at<wasistub::FunctionSection>(sections, 2).type_indices == std::vector<uint32_t>{1, 0},
          "function section inserted before the export section");
    check(section_at<wasistub::RawSection>(sections, 3).id == 7, "export section follows");
    check(section_at<wasistub::RawSection>(sections, 4).id == 0, "custom section keeps its place");
    const auto& code = section_at<wasistub::CodeSection>(sections, 5);
    check(code.entries.size() == 2 && code.entries[1].bytes == Bytes{0x01, 0x01, 0x7F, 0x0B},
          "code section appended with both stubs");
}

void test_stub_without_target_imports_is_identity()
{
    const auto input = module_bytes({
        {1, kTypes},
        {2, cat({{0x02}, import_func("env", "log", 0), import_func("env", "write", 1)})},
        {3, {0x01, 0x00}},
        {5, kMemory},
        {7, exports_memory_and(2)},
        {10, cat({{0x01}, sized(kRunBody)})},
    });
    auto result = wasistub::stub_module(input);
    check(result.stubbed.empty(), "nothing stubbed");
    check(result.bytes == input, "module is reproduced unchanged");
}

void test_stub_custom_namespace()
{
    const auto input = module_bytes({
        {1, kTypes},
        {2, cat({{0x02}, import_func(kWasi, "fd_write", 1), import_func("env", "log", 0)})},
        {3, {0x01, 0x00}},
        {10, cat({{0x01}, sized({0x00, 0x0B})})},
    });
    wasistub::StubOptions options;
    options.target_namespace = "env";
    auto result = wasistub::stub_module(input, options);
    check(result.stubbed.size() == 1 && result.stubbed[0].module == "env", "env::log stubbed");

    const auto sections = wasistub::decode_module(result.bytes);
    const auto& imports = section_at<wasistub::ImportSection>(sections, 1);
    check(imports.imports.size() == 1 && imports.imports[0].module == kWasi, "wasi import kept");
    check(section_at<wasistub::CodeSection>(sections, 3).entries[0].bytes == Bytes{0x01, 0x01, 0x7F, 0x0B},
          "env::log became a no-op with one unused local");
}

void test_stub_layout_violation_without_code()
{
    const auto input = module_bytes({
        {1, kTypes},
        {2, cat({{0x02}, import_func(kWasi, "fd_write", 1), import_func("env", "log", 0)})},
        {7, cat({{0x01}, name("log"), {0x00, 0x01}})},
    });
    check(wasistub::validate_module(input).ok(), "input is valid");
    auto error = expect_throws<wasistub::UnsupportedImportLayout>([&] { wasistub::stub_module(input); },
                                                                 "violation in a module without code");
    check(std::string(error.what()).find("env::log") != std::string::npos, "message names env::log");
}

void test_stub_non_function_target_then_other()
{
    const auto input = module_bytes({
        {1, kTypes},
        {2, cat({{0x02}, name(kWasi), name("memory"), {0x02, 0x00, 0x01}, import_func("env", "log", 0)})},
        {3, {0x01, 0x00}},
        {10, cat({{0x01}, sized({0x00, 0x0B})})},
    });
    check(wasistub::validate_module(input).ok(), "input is valid");
    auto outcome = wasistub::try_stub_module(input);
    check(!outcome.ok(), "ordinary import after a target memory import is rejected");
    check(outcome.error_kind == wasistub::ErrorKind::UnsupportedImportLayout, "error kind is UnsupportedImportLayout");
}

// --- file helpers ---

std::filesystem::path fresh_temp_dir(const std::string& leaf)
{
    const auto dir = std::filesystem::path(WASISTUB_TEST_TEMP_DIR) / leaf;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void test_write_read_roundtrip()
{
    const auto dir = fresh_temp_dir("write_read_roundtrip");
    Bytes all_values(256);
    for (size_t i = 0; i < all_values.size(); ++i)
    {
        all_values[i] = static_cast<uint8_t>(i);
    }
    const auto path = dir / "bytes.bin";
    wasistub::write_file(path, all_values);
    check(wasistub::read_file(path) == all_values, "every byte value read back");

    wasistub::write_file(path, Bytes{0x2A});
    check(wasistub::read_file(path) == Bytes{0x2A}, "rewriting truncates the old contents");

    wasistub::write_file(path, Bytes{});
    check(wasistub::read_file(path).empty(), "empty file");

    expect_throws<std::runtime_error>([&] { wasistub::read_file(dir / "missing.wasm"); }, "missing file");
    std::filesystem::remove_all(dir);
}

void test_copy_permissions()
{
    const auto dir = fresh_temp_dir("copy_permissions");
    const auto source = dir / "source.wasm";
    const auto target = dir / "target.wasm";
    wasistub::write_file(source, Bytes{});
    wasistub::write_file(target, Bytes{});

    namespace fs = std::filesystem;
    fs::permissions(source, fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec,
                    fs::perm_options::replace);
    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                                fs::perms::others_read,
                    fs::perm_options::replace);
    wasistub::copy_permissions(source, target);
    check(fs::status(target).permissions() == fs::status(source).permissions(), "permission bits copied");

    expect_throws<std::runtime_error>([&] { wasistub::copy_permissions(dir / "missing.wasm", target); },
                                      "missing source");
    fs::remove_all(dir);
}

void test_stub_file_writes_output()
{
    namespace fs = std::filesystem;
    const auto dir = fresh_temp_dir("stub_file_writes_output");
    const auto input = dir / "app.wasm";
    wasistub::write_file(input, make_example_module());
    fs::permissions(input, fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec,
                    fs::perm_options::replace);

    auto report = wasistub::stub_file(wasistub::FileJob{input, std::nullopt, false});
    check(report.written && *report.written == dir / "app - stubbed.wasm", "output path derived from the input");
    check(wasistub::read_file(*report.written) == report.result.bytes, "stubbed module written");
    check(fs::status(*report.written).permissions() == fs::status(input).permissions(),
          "output has the input's permissions");
    fs::remove_all(dir);
}

void test_stub_file_list_mode()
{
    const auto dir = fresh_temp_dir("stub_file_list_mode");
    const auto input = dir / "app.wasm";
    wasistub::write_file(input, make_example_module());

    std::vector<std::string> reported;
    wasistub::StubOptions options;
    options.on_candidate = [&](const Import& import) { reported.push_back(import.name); };
    auto report = wasistub::stub_file(wasistub::FileJob{input, dir / "explicit.wasm", true}, options);

    check(!report.written, "list mode reports no output path");
    check(report.result.stubbed.size() == 1, "transformation still ran");
    check(reported == std::vector<std::string>{"fd_write"}, "candidate still reported");
    const auto files = std::distance(std::filesystem::directory_iterator(dir), std::filesystem::directory_iterator{});
    check(files == 1, "only the input file exists");
    std::filesystem::remove_all(dir);
}


void test_derive_output_path()
{
    const auto dir = fresh_temp_dir("derive_output_path");

    const auto input = dir / "app.wasm";
    wasistub::write_file(input, make_example_module());
    check(wasistub::read_file(input) == make_example_module(), "file contents read back");

    const auto first = wasistub::derive_output_path(input);
    check(first == dir / "app - stubbed.wasm", "first choice: " + first.string());

    wasistub::write_file(first, Bytes{});
    const auto second = wasistub::derive_output_path(input);
    check(second == dir / "app - stubbed (1).wasm", "second choice: " + second.string());

    wasistub::write_file(second, Bytes{});
    check(wasistub::derive_output_path(input) == dir / "app - stubbed (2).wasm", "third choice");

    std::filesystem::remove_all(dir);
}

struct TestCase
{
    std::string group;
    std::string name;
    std::function<void()> run;
};

const std::vector<TestCase> kTests = {
    {"reader", "leb", test_reader_leb},
    {"writer", "leb", test_writer_leb},
    {"codec", "classifies_sections", test_decode_classifies_sections},
    {"codec", "canonical_identity", test_encode_reproduces_canonical_module},
    {"codec", "malformed_imports", test_decode_rejects_malformed_imports},
    {"codec", "split_code_entry", test_split_code_entry},
    {"validator", "accepts_example", test_validator_accepts_example},
    {"validator", "structural_errors", test_validator_rejects_structural_errors},
    {"validator", "constant_bodies", test_validator_checks_constant_bodies},
    {"validator", "operand_stack", test_validator_types_operand_stack},
    {"validator", "exception_handling", test_validator_exception_handling},
    {"validator", "atomics", test_validator_atomics},
    {"partitioner", "suffix_layout", test_partition_suffix_layout},
    {"partitioner", "idempotent", test_partition_is_idempotent},
    {"partitioner", "violation", test_partition_records_violation},
    {"partitioner", "non_function_target", test_partition_keeps_non_function_target_imports},
    {"synthesizer", "no_results", test_stub_without_results},
    {"synthesizer", "i32_result", test_stub_with_i32_result},
    {"synthesizer", "unsupported_results", test_stub_rejects_unsupported_results},
    {"index_space", "function_section", test_rebuild_function_section},
    {"index_space", "code_section", test_rebuild_code_section},
    {"stubber", "example_module", test_stub_example_module},
    {"stubber", "passthrough_fidelity", test_stub_passthrough_fidelity},
    {"stubber", "reversed_layout", test_stub_rejects_reversed_layout},
    {"stubber", "invalid_input", test_stub_rejects_invalid_input},
    {"stubber", "unsupported_signature", test_stub_rejects_unsupported_signature},
    {"stubber", "no_local_functions", test_stub_module_without_local_functions},
    {"stubber", "no_target_imports", test_stub_without_target_imports_is_identity},
    {"stubber", "custom_namespace", test_stub_custom_namespace},
    {"stubber", "layout_violation_without_code", test_stub_layout_violation_without_code},
    {"stubber", "non_function_target_then_other", test_stub_non_function_target_then_other},
    {"file_io", "derive_output_path", test_derive_output_path},
    {"file_io", "write_read_roundtrip", test_write_read_roundtrip},
    {"file_io", "copy_permissions", test_copy_permissions},
    {"file_io", "stub_file_writes_output", test_stub_file_writes_output},
    {"file_io", "stub_file_list_mode", test_stub_file_list_mode},
};

bool run_test_case(const TestCase& test_case)
{
    try
    {
        test_case.run();
    }
    catch (const std::exception& ex)
    {
        std::cerr << "[FAIL] (" << test_case.group << ") " << test_case.name << ": " << ex.what() << "\n";
        return false;
    }
    std::cout << "[PASS] (" << test_case.group << ") " << test_case.name << "\n";
    return true;
}

std::optional<std::pair<std::string, std::optional<std::string>>> parse_group_case(const std::string& spec)
{
    if (spec.empty())
    {
        return std::nullopt;
    }

    const auto dot_pos = spec.find('.');
    if (dot_pos == std::string::npos)
    {
        return std::make_pair(spec, std::optional<std::string>{});
    }

    auto group = spec.substr(0, dot_pos);
    auto test = spec.substr(dot_pos + 1);
    if (group.empty() || test.empty())
    {
        return std::nullopt;
    }
    return std::make_pair(group, std::optional<std::string>{test});
}

void print_usage(const std::string& program_name)
{
    std::cerr << "Usage: " << program_name << " [group[.case]]\n"
              << "       " << program_name << " --list\n";
}

} // namespace

int main(int argc, char** argv)
try
{
    const std::string program_name = (argc > 0 && argv ? argv[0] : "wasistub_tests");
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }

    if (!args.empty() && args[0] == "--list")
    {
        for (const auto& test_case : kTests)
        {
            std::cout << test_case.group << "." << test_case.name << "\n";
        }
        return 0;
    }
    if (args.size() > 1)
    {
        print_usage(program_name);
        return 1;
    }

    std::optional<std::pair<std::string, std::optional<std::string>>> filter;
    if (args.size() == 1)
    {
        filter = parse_group_case(args[0]);
        if (!filter)
        {
            print_usage(program_name);
            return 1;
        }
    }

    int total_runs = 0;
    int total_failures = 0;
    for (const auto& test_case : kTests)
    {
        if (filter && (filter->first != test_case.group || (filter->second && *filter->second != test_case.name)))
        {
            continue;
        }
        ++total_runs;
        if (!run_test_case(test_case))
        {
            ++total_failures;
        }
    }

    if (total_runs == 0)
    {
        std::cerr << "No tests matched " << args[0] << "\n";
        return 1;
    }
    if (total_failures == 0)
    {
        std::cout << "All " << total_runs << " test(s) passed." << std::endl;
    }
    else
    {
        std::cerr << total_failures << " test(s) failed\n";
    }
    return total_failures == 0 ? 0 : 1;
}
catch (const std::exception& ex)
{
    std::cerr << "Unhandled exception: " << ex.what() << "\n";
    return 1;
}
