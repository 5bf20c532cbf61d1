#pragma once

#include <vector>

#include "wasistub/import_partitioner.hpp"
#include "wasistub/module.hpp"

namespace wasistub
{
// Function declarations of the rewritten module: one per stub candidate, in
// import order, followed by the original declarations. Pass an empty section
// when the source module has none.
FunctionSection rebuild_function_section(const std::vector<StubCandidate>& candidates,
                                         const FunctionSection& original);

// Code of the rewritten module: synthesized stub bodies, then every original
// body byte for byte. Throws UnsupportedSignature.
CodeSection rebuild_code_section(const std::vector<StubCandidate>& candidates, const CodeSection& original);

} // namespace wasistub
