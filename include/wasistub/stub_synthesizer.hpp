#pragma once

#include <cstdint>
#include <vector>

#include "wasistub/module.hpp"
#include "wasistub/types.hpp"

namespace wasistub
{
// Value returned by every stub whose signature has a result.
constexpr int32_t kStubResultSentinel = 76;

struct StubBody
{
    std::vector<LocalDecl> locals;
    std::vector<uint8_t> instructions;
};

// Builds the body of a stub for `type`: one unused local per parameter, then
// either `end` (no results) or `i32.const 76; end` (a single i32 result).
// Throws UnsupportedSignature for any other result list.
StubBody synthesize_stub(const FunctionType& type);

CodeEntry encode_stub(const StubBody& body);

} // namespace wasistub
