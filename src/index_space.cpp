#include "wasistub/index_space.hpp"

#include "wasistub/stub_synthesizer.hpp"

namespace wasistub
{
FunctionSection rebuild_function_section(const std::vector<StubCandidate>& candidates,
                                         const FunctionSection& original)
{
    FunctionSection rebuilt;
    rebuilt.type_indices.reserve(candidates.size() + original.type_indices.size());
    for (const auto& candidate : candidates)
    {
        rebuilt.type_indices.push_back(candidate.import.type_index);
    }
    rebuilt.type_indices.insert(rebuilt.type_indices.end(), original.type_indices.begin(),
                                original.type_indices.end());
    return rebuilt;
}

CodeSection rebuild_code_section(const std::vector<StubCandidate>& candidates, const CodeSection& original)
{
    CodeSection rebuilt;
    rebuilt.entries.reserve(candidates.size() + original.entries.size());
    for (const auto& candidate : candidates)
    {
        rebuilt.entries.push_back(encode_stub(synthesize_stub(candidate.type)));
    }
    rebuilt.entries.insert(rebuilt.entries.end(), original.entries.begin(), original.entries.end());
    return rebuilt;
}

} // namespace wasistub
