#include "wasistub/import_partitioner.hpp"

#include <string>

namespace wasistub
{
std::string LayoutViolation::describe(std::string_view target_namespace) const
{
    return "cannot stub '" + std::string(target_namespace) + "' imports followed by other imports: import #" +
           std::to_string(import_position) + " (" + module + "::" + name + ") comes after a '" +
           std::string(target_namespace) + "' import (" + std::to_string(trailing_imports) +
           " trailing import(s) in total)";
}

ImportPartition partition_imports(const std::vector<Import>& imports,
                                  std::string_view target_namespace,
                                  const CandidateObserver& observer)
{
    ImportPartition partition;
    // Unset until the first target import; then counts the non-target
    // imports seen after it.
    std::optional<uint32_t> after_target;

    for (uint32_t position = 0; position < imports.size(); ++position)
    {
        const auto& import = imports[position];
        if (import.module == target_namespace)
        {
            if (!after_target)
            {
                after_target = 0;
            }
            if (import.kind != ExternalKind::Function)
            {
                partition.passthrough.push_back(import);
                continue;
            }
            partition.stub_candidates.push_back(StubCandidate{import, position, {}});
            continue;
        }

        if (after_target)
        {
            ++*after_target;
            if (!partition.violation)
            {
                partition.violation = LayoutViolation{position, import.module, import.name, 0};
            }
        }
        partition.passthrough.push_back(import);
    }

    if (partition.violation)
    {
        partition.violation->trailing_imports = *after_target;
        return partition;
    }
    if (observer)
    {
        for (const auto& candidate : partition.stub_candidates)
        {
            observer(candidate.import);
        }
    }
    return partition;
}

} // namespace wasistub
