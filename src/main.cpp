#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/progress/progress.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using GIT = mlprogress::build_info::GitInfo;
using ARGS = mlprogress::args_parser::CLIArgs;

constexpr auto load_from_cli = mlprogress::infra::config_from_cli;
constexpr auto load_config_file = mlprogress::infra::load_config_from_file;
constexpr auto args_parser = mlprogress::args_parser::parse_args;
constexpr auto git = mlprogress::build_info::get_git_info();

static auto out_git_verse(const GIT& info) -> void {
    fmt::print("mlprogress-demo {}\n", info.version);
    fmt::print("Git branch: {}\n", info.branch);
    fmt::print("Git commit: {}\n", info.commit);
    fmt::print("Git dirty: {}\n", info.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", info.timestamp);
}

// Воркеры разбирают шаги из общего счётчика и двигают один индикатор
static auto run_workers(mlprogress::core::Progress& progress, const ARGS& args) -> std::uint64_t {
    std::atomic<std::uint64_t> next_step{0};
    std::atomic<std::uint64_t> done{0};
    const auto delay = std::chrono::milliseconds(args.delay_ms);

    {
        std::vector<std::jthread> workers;
        workers.reserve(args.threads);
        for (std::uint32_t id = 0; id < args.threads; ++id) {
            workers.emplace_back([&, id](std::stop_token st) {
                while (!st.stop_requested() && !mlprogress::infra::is_interrupted()) {
                    const auto step = next_step.fetch_add(1, std::memory_order_relaxed);
                    if (step >= args.steps) {
                        break;
                    }
                    progress.message(fmt::format("worker {} step {}", id, step + 1));
                    std::this_thread::sleep_for(delay);
                    progress.inc();
                    done.fetch_add(1, std::memory_order_relaxed);
                }
            });
        }
    }

    return done.load(std::memory_order_relaxed);
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        mlprogress::infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return 1; // --help или ошибка
        }
        const auto& args = *args_opt;

        if (args.verbose) {
            spdlog::set_level(spdlog::level::debug);
        }

        if (args.version) {
            out_git_verse(git);
            return 0;
        }

        // 1. Загрузить из файла
        std::optional<std::filesystem::path> config_path;
        if (args.config_path) {
            config_path = *args.config_path;
        }
        auto config_res = load_config_file(config_path);
        if (!config_res) {
            auto err = mlprogress::infra::log_and_return(std::move(config_res.error()));
            return err.to_exit_code();
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        spdlog::debug("Merging CLI config with file config...");
        config.merge_with(load_from_cli(args)); // CLI имеет приоритет

        auto builder = mlprogress::core::ProgressBuilder::from_config(config);
        if (!builder) {
            auto err = mlprogress::infra::log_and_return(std::move(builder.error()));
            return err.to_exit_code();
        }
        auto progress_res = builder->build();
        if (!progress_res) {
            auto err = mlprogress::infra::log_and_return(std::move(progress_res.error()));
            return err.to_exit_code();
        }
        auto& progress = *progress_res;

        const auto start_time = std::chrono::steady_clock::now();
        const auto done = run_workers(progress, args);
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (mlprogress::infra::is_interrupted()) {
            progress.finish_at_current_pos();
            spdlog::warn("Interrupted after {} of {} steps", done, args.steps);
            return 130;
        }

        if (args.clear) {
            progress.finish_and_clear();
        } else if (args.at_current_pos) {
            progress.finish_at_current_pos();
        } else {
            progress.finish();
        }

        spdlog::info("Done: {} steps in {:.2f} s", done, duration.count() / 1000.0);
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
