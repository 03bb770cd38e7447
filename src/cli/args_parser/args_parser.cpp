#include "args_parser.hpp"
#include <CLI/CLI.hpp>

namespace mlprogress::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv) {
    CLI::App app{"mlprogress-demo: single-line terminal progress indicator"};
    CLIArgs args;

    std::uint64_t total = 0;
    std::string items;
    std::string separator;
    std::uint32_t refresh_ms = 0;
    std::string config_path;

    auto* total_opt = app.add_option("-t,--total", total, "Total number of steps (omit for an open-ended run)");
    app.add_option("-n,--steps", args.steps, "Number of steps to perform")->capture_default_str();
    app.add_option("--delay-ms", args.delay_ms, "Pause between steps in each worker")->capture_default_str();
    app.add_option("-j,--threads", args.threads, "Worker threads incrementing the same indicator")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    auto* items_opt = app.add_option("-i,--items", items, "Template, e.g. 'bar_fill \" \" pos \"/\" total'");
    auto* sep_opt = app.add_option("--separator", separator, "Thousands separator");
    auto* refresh_opt = app.add_option("--refresh-ms", refresh_ms, "Redraw interval in milliseconds")
        ->check(CLI::PositiveNumber);
    auto* config_opt = app.add_option("-c,--config", config_path, "YAML config file");

    app.add_flag("--pre-inc", args.pre_inc, "Position is incremented before the step's work");
    auto* clear_flag = app.add_flag("--clear", args.clear, "Clear the line when done");
    auto* at_pos_flag = app.add_flag("--at-current-pos", args.at_current_pos,
                                     "Finish at the current position instead of the total");
    clear_flag->excludes(at_pos_flag);
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("--version", args.version, "Print build information and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        (void)app.exit(e);
        return std::nullopt;
    }

    if (*total_opt) args.total = total;
    if (*items_opt) args.items = items;
    if (*sep_opt) args.thousands_separator = separator;
    if (*refresh_opt) args.refresh_interval_ms = refresh_ms;
    if (*config_opt) args.config_path = config_path;

    return args;
}

} // namespace mlprogress::args_parser
