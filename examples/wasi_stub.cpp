#include "wasistub/file_io.hpp"
#include "wasistub/stubber.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
struct Options
{
    std::filesystem::path module_path;
    std::optional<std::filesystem::path> output_path;
    std::string target_namespace{wasistub::kDefaultTargetNamespace};
    bool list_only{false};
    bool quiet{false};
};

[[noreturn]] void print_usage_and_exit(const std::string& program, int status)
{
    std::cerr << "Usage: " << program << " [options] <module.wasm>\n"
              << "Replaces the function imports of one namespace with local stubs.\n"
              << "Options:\n"
              << "  -o, --output <path>      Output file (default: '<name> - stubbed.wasm' next to the input)\n"
              << "  -l, --list               List the imports that would be stubbed, write nothing\n"
              << "  -n, --namespace <name>   Import namespace to stub (default: "
              << wasistub::kDefaultTargetNamespace << ")\n"
              << "  -q, --quiet              Do not print stubbed imports\n"
              << "  -h, --help               Show this message\n";
    std::exit(status);
}

Options parse_options(int argc, char** argv)
{
    const std::string program = argc > 0 ? argv[0] : "wasi-stub";
    if (argc < 2)
    {
        print_usage_and_exit(program, EXIT_FAILURE);
    }

    Options options;
    bool have_module = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage_and_exit(program, EXIT_SUCCESS);
        }
        else if (arg == "--output" || arg == "-o")
        {
            if (i + 1 >= argc)
            {
                throw std::runtime_error("--output requires a path");
            }
            options.output_path = argv[++i];
        }
        else if (arg == "--namespace" || arg == "-n")
        {
            if (i + 1 >= argc)
            {
                throw std::runtime_error("--namespace requires a name");
            }
            options.target_namespace = argv[++i];
        }
        else if (arg == "--list" || arg == "-l")
        {
            options.list_only = true;
        }
        else if (arg == "--quiet" || arg == "-q")
        {
            options.quiet = true;
        }
        else if (!arg.empty() && arg.front() == '-')
        {
            throw std::runtime_error("unknown option '" + std::string(arg) + "'");
        }
        else if (have_module)
        {
            throw std::runtime_error("only one module may be given");
        }
        else
        {
            options.module_path = std::string(arg);
            have_module = true;
        }
    }

    if (!have_module)
    {
        print_usage_and_exit(program, EXIT_FAILURE);
    }
    if (options.list_only && options.output_path)
    {
        throw std::runtime_error("--output cannot be combined with --list");
    }
    return options;
}
} // namespace

int main(int argc, char** argv)
{
    try
    {
        const auto options = parse_options(argc, argv);

        wasistub::StubOptions stub_options;
        stub_options.target_namespace = options.target_namespace;
        if (!options.quiet || options.list_only)
        {
            stub_options.on_candidate = [](const wasistub::Import& import) {
                std::cout << "found " << import.module << "::" << import.name << ": stubbing...\n";
            };
        }

        const auto report =
            wasistub::stub_file(wasistub::FileJob{options.module_path, options.output_path, options.list_only},
                                stub_options);

        if (!report.written)
        {
            std::cout << "NOTE: no output produced because the '--list' option was specified\n";
        }
        else if (!options.quiet)
        {
            std::cout << "stubbed " << report.result.stubbed.size() << " import(s), kept "
                      << report.result.passthrough_imports << ", wrote " << report.written->string() << '\n';
        }
        return EXIT_SUCCESS;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "error: " << ex.what() << '\n';
        return EXIT_FAILURE;
    }
}
