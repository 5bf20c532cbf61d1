#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wasistub/module.hpp"

namespace wasistub
{
// A function import of the target namespace, to be replaced by a local stub.
struct StubCandidate
{
    Import import;
    uint32_t import_position{0};
    FunctionType type; // resolved once the type table is known
};

// A non-target import found after the first target import. Such a layout
// cannot be rewritten without renumbering call sites.
struct LayoutViolation
{
    uint32_t import_position{0};
    std::string module;
    std::string name;
    uint32_t trailing_imports{0};

    [[nodiscard]] std::string describe(std::string_view target_namespace) const;
};

struct ImportPartition
{
    std::vector<StubCandidate> stub_candidates;
    std::vector<Import> passthrough;
    std::optional<LayoutViolation> violation;

    [[nodiscard]] bool layout_supported() const noexcept { return !violation.has_value(); }
};

using CandidateObserver = std::function<void(const Import&)>;

// Splits `imports` into stub candidates (function imports of
// `target_namespace`) and pass-through imports, both in source order. A
// non-target import following a target import is recorded in `violation`
// rather than thrown, so the caller decides how fatal it is. `observer` is
// called for each candidate, in order, once the whole list has been
// partitioned and only when the layout is supported.
ImportPartition partition_imports(const std::vector<Import>& imports,
                                  std::string_view target_namespace,
                                  const CandidateObserver& observer = {});

} // namespace wasistub
