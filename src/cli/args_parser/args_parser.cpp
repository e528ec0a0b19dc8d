#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>

namespace cverify::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code)
{
    CLIArgs args{};
    std::vector<std::string> paths;

    CLI::App app{"Copy files with SHA-256 and prove each copy by re-reading it from storage", "cverify"};

    app.add_option("paths", paths, "SOURCE... DESTINATION, or FILE... with --hash-only");
    app.add_flag("--no-verify", args.no_verify, "Skip hashing and destination verification");
    app.add_flag("--no-preserve-metadata", args.no_preserve_metadata,
                 "Do not copy permissions and modification time");
    app.add_flag("--no-progress", args.no_progress, "Disable the progress line");
    app.add_flag("-q,--quiet", args.quiet, "Only print errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("--hash-only", args.hash_only, "Print SHA-256 of each FILE, copy nothing");
    app.add_flag("--version", args.version, "Print build information");
    app.add_option("-j,--jobs", args.threads, "Files copied concurrently")
        ->check(CLI::PositiveNumber);
    app.add_option("--buffer-size", args.buffer_size, "Chunk size, e.g. 4M (clamped to 8K..10M)")
        ->transform(CLI::AsSizeValue(false));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit_code = app.exit(e);
        return std::nullopt;
    }

    if (args.version) {
        return args;
    }

    const std::size_t min_paths = args.hash_only ? 1 : 2;
    if (paths.size() < min_paths) {
        fmt::print(stderr, "{}\nRun with --help for more information.\n",
                   args.hash_only ? "At least one FILE is required"
                                  : "Expected at least one SOURCE and a DESTINATION");
        exit_code = 64;
        return std::nullopt;
    }

    if (!args.hash_only) {
        args.destination = paths.back();
        paths.pop_back();
    }
    args.sources = std::move(paths);
    return args;
}

} // namespace cverify::args_parser
