#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "wasistub/stubber.hpp"

namespace wasistub
{
std::vector<uint8_t> read_file(const std::filesystem::path& path);

void write_file(const std::filesystem::path& path, std::span<const uint8_t> bytes);

// First unused path among "<stem> - stubbed.wasm", "<stem> - stubbed (1).wasm",
// "<stem> - stubbed (2).wasm", ... in the directory of `input`.
std::filesystem::path derive_output_path(const std::filesystem::path& input);

// Gives `target` the permission bits of `source`.
void copy_permissions(const std::filesystem::path& source, const std::filesystem::path& target);

struct FileJob
{
    std::filesystem::path input;
    std::optional<std::filesystem::path> output; // derived from `input` when unset
    bool list_only{false};
};

struct FileReport
{
    StubResult result;
    std::optional<std::filesystem::path> written; // unset in list mode
};

// Stubs one module file. Outside list mode the result is written to the
// job's output path and given the input's permissions; in list mode nothing
// is written. Throws StubError for the module and std::runtime_error for I/O.
FileReport stub_file(const FileJob& job, const StubOptions& options = {});

} // namespace wasistub
