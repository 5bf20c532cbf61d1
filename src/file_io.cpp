#include "wasistub/file_io.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace wasistub
{
std::vector<uint8_t> read_file(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
    file.seekg(0, std::ios::end);
    const auto size = static_cast<size_t>(file.tellg());
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> buffer(size);
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size));
    if (!file)
    {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return buffer;
}

void write_file(const std::filesystem::path& path, std::span<const uint8_t> bytes)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file)
    {
        throw std::runtime_error("Failed to create file: " + path.string());
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file)
    {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}

std::filesystem::path derive_output_path(const std::filesystem::path& input)
{
    const auto stem = input.stem().string();
    auto candidate = input;
    candidate.replace_filename(stem + " - stubbed.wasm");
    for (unsigned i = 1; std::filesystem::exists(candidate); ++i)
    {
        candidate.replace_filename(stem + " - stubbed (" + std::to_string(i) + ").wasm");
    }
    return candidate;
}

void copy_permissions(const std::filesystem::path& source, const std::filesystem::path& target)
{
    std::error_code error;
    const auto status = std::filesystem::status(source, error);
    if (error || !std::filesystem::exists(status))
    {
        throw std::runtime_error("Failed to read permissions of " + source.string() + ": " +
                                 (error ? error.message() : std::string("no such file")));
    }
    std::filesystem::permissions(target, status.permissions(), std::filesystem::perm_options::replace, error);
    if (error)
    {
        throw std::runtime_error("Failed to set permissions of " + target.string() + ": " + error.message());
    }
}

FileReport stub_file(const FileJob& job, const StubOptions& options)
{
    FileReport report;
    report.result = stub_module(read_file(job.input), options);
    if (job.list_only)
    {
        return report;
    }

    const auto output = job.output ? *job.output : derive_output_path(job.input);
    write_file(output, report.result.bytes);
    copy_permissions(job.input, output);
    report.written = output;
    return report;
}

} // namespace wasistub
