#include "wasistub/stubber.hpp"

#include <string>
#include <utility>
#include <variant>

#include "wasistub/index_space.hpp"
#include "wasistub/section_codec.hpp"
#include "wasistub/validator.hpp"

namespace wasistub
{
namespace
{
enum class AssemblyStage
{
    Start,
    TypesSeen,
    ImportsPartitioned,
    FunctionsRebuilt,
    InCodeSection,
    Done,
};

constexpr int kFunctionRank = *section_rank(static_cast<uint8_t>(SectionId::Function));
constexpr int kCodeRank = *section_rank(static_cast<uint8_t>(SectionId::Code));

class ModuleAssembler
{
public:
    explicit ModuleAssembler(const ImportPlan& plan)
        : plan_(plan)
        , candidates_(plan.partition.stub_candidates)
    {
    }

    std::vector<Section> assemble(const std::vector<Section>& sections)
    {
        for (const auto& section : sections)
        {
            emit_missing_before(section_id(section));
            std::visit(Overloaded{
                           [&](const TypeSection& types) {
                               output_.emplace_back(types);
                               advance(AssemblyStage::TypesSeen);
                           },
                           [&](const ImportSection&) {
                               if (stage_ >= AssemblyStage::ImportsPartitioned)
                               {
                                   throw DecodeError("import section after function or code section");
                               }
                               output_.emplace_back(ImportSection{plan_.partition.passthrough});
                               advance(AssemblyStage::ImportsPartitioned);
                           },
                           [&](const FunctionSection& functions) { emit_functions(functions); },
                           [&](const CodeSection& code) { emit_code(code); },
                           [&](const RawSection& raw) { output_.emplace_back(raw); },
                       },
                       section);
        }
        finish();
        return std::move(output_);
    }

private:
    void advance(AssemblyStage stage)
    {
        if (stage > stage_)
        {
            stage_ = stage;
        }
    }

    // A module with stub candidates but no local functions has no function or
    // code section to extend, so they are created at their canonical place.
    void emit_missing_before(uint8_t id)
    {
        if (candidates_.empty())
        {
            return;
        }
        auto rank = section_rank(id);
        if (!rank)
        {
            return;
        }
        if (*rank > kFunctionRank && stage_ < AssemblyStage::FunctionsRebuilt)
        {
            emit_functions(FunctionSection{});
        }
        if (*rank > kCodeRank && stage_ != AssemblyStage::Done)
        {
            emit_code(CodeSection{});
        }
    }

    void emit_functions(const FunctionSection& original)
    {
        if (stage_ >= AssemblyStage::FunctionsRebuilt)
        {
            throw DecodeError("function section after function or code section");
        }
        output_.emplace_back(rebuild_function_section(candidates_, original));
        advance(AssemblyStage::FunctionsRebuilt);
    }

    void emit_code(const CodeSection& original)
    {
        if (stage_ == AssemblyStage::Done)
        {
            throw DecodeError("duplicate code section");
        }
        require_supported_layout();
        advance(AssemblyStage::InCodeSection);
        output_.emplace_back(rebuild_code_section(candidates_, original));
        advance(AssemblyStage::Done);
    }

    void require_supported_layout() const
    {
        if (plan_.partition.violation)
        {
            throw UnsupportedImportLayout(plan_.partition.violation->describe(plan_.target_namespace));
        }
    }

    void finish()
    {
        if (!candidates_.empty())
        {
            if (stage_ < AssemblyStage::FunctionsRebuilt)
            {
                emit_functions(FunctionSection{});
            }
            if (stage_ != AssemblyStage::Done)
            {
                emit_code(CodeSection{});
            }
        }
        require_supported_layout();
    }

    const ImportPlan& plan_;
    const std::vector<StubCandidate>& candidates_;
    std::vector<Section> output_;
    AssemblyStage stage_{AssemblyStage::Start};
};

template <typename T>
const T* find_section(const std::vector<Section>& sections)
{
    for (const auto& section : sections)
    {
        if (const auto* typed = std::get_if<T>(&section))
        {
            return typed;
        }
    }
    return nullptr;
}
} // namespace

const FunctionType& TypeTable::at(uint32_t index) const
{
    if (index >= types.size())
    {
        throw DecodeError("type index " + std::to_string(index) + " out of range (" +
                          std::to_string(types.size()) + " types)");
    }
    return types[index];
}

TypeTable collect_types(const std::vector<Section>& sections)
{
    TypeTable table;
    if (const auto* section = find_section<TypeSection>(sections))
    {
        table.types = section->types;
    }
    return table;
}

ImportPlan plan_imports(const std::vector<Section>& sections, const TypeTable& types, const StubOptions& options)
{
    ImportPlan plan;
    plan.target_namespace = options.target_namespace;
    if (const auto* section = find_section<ImportSection>(sections))
    {
        plan.partition = partition_imports(section->imports, options.target_namespace, options.on_candidate);
    }
    for (auto& candidate : plan.partition.stub_candidates)
    {
        candidate.type = types.at(candidate.import.type_index);
    }
    return plan;
}

std::vector<Section> assemble_sections(const std::vector<Section>& sections, const ImportPlan& plan)
{
    ModuleAssembler assembler(plan);
    return assembler.assemble(sections);
}

StubResult stub_module(std::span<const uint8_t> input, const StubOptions& options)
{
    auto input_report = validate_module(input);
    if (!input_report.ok())
    {
        throw InputNotValid(input_report.message);
    }

    const auto sections = decode_module(input);
    const auto types = collect_types(sections);
    const auto plan = plan_imports(sections, types, options);
    const auto rewritten = assemble_sections(sections, plan);

    StubResult result;
    result.bytes = encode_module(rewritten);
    auto output_report = validate_module(result.bytes);
    if (!output_report.ok())
    {
        throw OutputNotValid(output_report.message);
    }

    result.passthrough_imports = plan.partition.passthrough.size();
    result.stubbed.reserve(plan.partition.stub_candidates.size());
    for (const auto& candidate : plan.partition.stub_candidates)
    {
        result.stubbed.push_back(StubbedImport{candidate.import.module, candidate.import.name, candidate.type});
    }
    return result;
}

StubOutcome try_stub_module(std::span<const uint8_t> input, const StubOptions& options)
{
    StubOutcome outcome;
    try
    {
        outcome.result = stub_module(input, options);
    }
    catch (const StubError& ex)
    {
        outcome.error_kind = ex.kind();
        outcome.error_message = ex.what();
    }
    return outcome;
}

} // namespace wasistub
