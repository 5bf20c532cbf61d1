#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "wasistub/errors.hpp"
#include "wasistub/import_partitioner.hpp"
#include "wasistub/module.hpp"

namespace wasistub
{
inline constexpr const char* kDefaultTargetNamespace = "wasi_snapshot_preview1";

struct StubOptions
{
    std::string target_namespace{kDefaultTargetNamespace};
    CandidateObserver on_candidate;
};

struct StubbedImport
{
    std::string module;
    std::string name;
    FunctionType type;
};

struct StubResult
{
    std::vector<uint8_t> bytes;
    std::vector<StubbedImport> stubbed;
    size_t passthrough_imports{0};
};

// Type table of the source module, collected before anything else runs.
struct TypeTable
{
    std::vector<FunctionType> types;

    // Throws DecodeError for an index outside the table.
    [[nodiscard]] const FunctionType& at(uint32_t index) const;
};

// Import partition with every candidate's signature resolved against the
// type table.
struct ImportPlan
{
    std::string target_namespace;
    ImportPartition partition;
};

TypeTable collect_types(const std::vector<Section>& sections);

ImportPlan plan_imports(const std::vector<Section>& sections, const TypeTable& types, const StubOptions& options);

// Rewrites the section sequence according to `plan`. Throws
// UnsupportedImportLayout and UnsupportedSignature.
std::vector<Section> assemble_sections(const std::vector<Section>& sections, const ImportPlan& plan);

// Full pipeline: validate input, decode, collect types, plan imports,
// assemble, encode, validate output. Throws a StubError subclass; never
// returns a partially rewritten module.
StubResult stub_module(std::span<const uint8_t> input, const StubOptions& options = {});

struct StubOutcome
{
    std::optional<StubResult> result;
    std::optional<ErrorKind> error_kind;
    std::string error_message;

    [[nodiscard]] bool ok() const noexcept { return result.has_value(); }
};

// stub_module with its StubError reported as a value, for callers that
// process several modules and want to skip the ones that fail.
StubOutcome try_stub_module(std::span<const uint8_t> input, const StubOptions& options = {});

} // namespace wasistub
