#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>



namespace cverify::args_parser {
    struct CLIArgs
{
    std::vector<std::string> sources;       // позиционные аргументы
    std::string destination;                // последний позиционный аргумент
    bool no_verify{false};                  // --no-verify
    bool no_preserve_metadata{false};       // --no-preserve-metadata
    bool no_progress{false};                // --no-progress
    bool quiet{false};                      // -q, --quiet
    bool verbose{false};                    // -v, --verbose
    bool hash_only{false};                  // --hash-only
    bool version{false};                    // --version
    std::optional<std::uint32_t> threads;   // -j, --jobs=N
    std::optional<std::size_t> buffer_size; // --buffer-size=SIZE (4M, 512K, ...)
};



/// Parses command-line arguments and returns a CLIArgs struct.
/// nullopt: --help or a parse error (already printed); exit_code holds the status.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code);

} // namespace cverify::args_parser
