#pragma once

#include <string>
#include <cstdint>
#include <optional>



namespace mlprogress::args_parser {
    struct CLIArgs
{
    std::optional<std::uint64_t> total;            // -t, --total
    std::uint64_t steps{200};                      // -n, --steps
    std::uint32_t delay_ms{20};                    // --delay-ms, пауза между шагами
    std::uint32_t threads{1};                      // -j, --threads
    bool pre_inc{false};                           // --pre-inc
    std::optional<std::string> items;              // -i, --items "bar_fill \" \" pos"
    std::optional<std::string> thousands_separator;// --separator
    std::optional<std::uint32_t> refresh_interval_ms; // --refresh-ms
    std::optional<std::string> config_path;        // -c, --config
    bool clear{false};                             // --clear: finish_and_clear()
    bool at_current_pos{false};                    // --at-current-pos: finish_at_current_pos()
    bool verbose{false};                           // -v, --verbose
    bool version{false};                           // --version
};



/// Parses command-line arguments and returns a CLIArgs struct.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

} // namespace mlprogress::args_parser
