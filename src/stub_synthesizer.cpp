#include "wasistub/stub_synthesizer.hpp"

#include "wasistub/binary_writer.hpp"
#include "wasistub/errors.hpp"

namespace wasistub
{
namespace
{
constexpr uint8_t kOpEnd = 0x0B;
constexpr uint8_t kOpI32Const = 0x41;
} // namespace

StubBody synthesize_stub(const FunctionType& type)
{
    StubBody body;
    body.locals.reserve(type.params.size());
    for (auto param : type.params)
    {
        body.locals.push_back(LocalDecl{1, param});
    }

    if (type.results.empty())
    {
        body.instructions.push_back(kOpEnd);
        return body;
    }

    // The sentinel only types as a lone i32 result. Anything else would need a
    // real zero value per result kind, which stubs do not attempt.
    if (type.results.size() != 1 || type.results.front() != ValueType::I32)
    {
        throw UnsupportedSignature("cannot synthesize a stub for signature " + to_string(type) +
                                   ": only () and (i32) results are supported");
    }

    BinaryWriter writer;
    writer.write_u8(kOpI32Const);
    writer.write_varint32(kStubResultSentinel);
    writer.write_u8(kOpEnd);
    body.instructions = writer.take();
    return body;
}

CodeEntry encode_stub(const StubBody& body)
{
    BinaryWriter writer;
    writer.write_varuint32(static_cast<uint32_t>(body.locals.size()));
    for (const auto& decl : body.locals)
    {
        writer.write_varuint32(decl.count);
        writer.write_u8(static_cast<uint8_t>(decl.type));
    }
    writer.write_bytes(body.instructions);
    return CodeEntry{writer.take()};
}

} // namespace wasistub
