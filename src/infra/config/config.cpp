#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <charconv>
#include <cstdlib>
#include <system_error>
#include <vector>

#include "config.hpp"
#include "cli/args_parser/args_parser.hpp"

namespace mlprogress::infra {
    void Config::merge_with(const Config& other) {
        if (other.total) total = other.total;
        if (other.pre_inc) pre_inc = true;
        if (other.items) items = other.items;
        if (other.thousands_separator) thousands_separator = other.thousands_separator;
        if (other.fallback_width) fallback_width = other.fallback_width;
        if (other.refresh_interval) refresh_interval = other.refresh_interval;
        if (other.draw_delay) draw_delay = other.draw_delay;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".mlprogress.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "mlprogress" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "mlprogress" / "config.yaml");
            }
        }

        return paths;
    }

    // Неотрицательное целое. Отрицательный total: TotalIsOutOfRange, как и в ProgressBuilder
    static auto read_unsigned(const YAML::Node& node, std::string_view key) -> Result<std::uint64_t> {
        const auto text = node.as<std::string>();
        if (!text.empty() && text.front() == '-') {
            const auto code = key == "total" ? ErrorCode::TotalIsOutOfRange : ErrorCode::ConfigInvalid;
            return std::unexpected(make_error(code,
                fmt::format("'{}' must not be negative, got {}", key, text)));
        }

        std::uint64_t value = 0;
        const auto* begin = text.data();
        const auto* end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec == std::errc::result_out_of_range) {
            const auto code = key == "total" ? ErrorCode::TotalIsOutOfRange : ErrorCode::ConfigInvalid;
            return std::unexpected(make_error(code,
                fmt::format("'{}' is out of range: {}", key, text)));
        }
        if (ec != std::errc{} || ptr != end) {
            return std::unexpected(make_error(ErrorCode::ConfigInvalid,
                fmt::format("'{}' must be an integer, got '{}'", key, text)));
        }
        return value;
    }

    static auto config_from_node(const YAML::Node& config) -> Result<Config> {
        Config cfg{};

        if (config["total"] && !config["total"].IsNull()) {
            auto total = read_unsigned(config["total"], "total");
            if (!total) return std::unexpected(std::move(total.error()));
            cfg.total = *total;
        }
        if (config["pre_inc"]) cfg.pre_inc = config["pre_inc"].as<bool>();
        if (config["items"]) cfg.items = config["items"].as<std::string>();
        if (config["thousands_separator"]) cfg.thousands_separator = config["thousands_separator"].as<std::string>();

        if (config["fallback_width"]) {
            auto width = read_unsigned(config["fallback_width"], "fallback_width");
            if (!width) return std::unexpected(std::move(width.error()));
            cfg.fallback_width = static_cast<std::size_t>(*width);
        }
        if (config["refresh_interval_ms"]) {
            auto ms = read_unsigned(config["refresh_interval_ms"], "refresh_interval_ms");
            if (!ms) return std::unexpected(std::move(ms.error()));
            if (*ms == 0) {
                return std::unexpected(make_error(ErrorCode::ConfigInvalid,
                    "'refresh_interval_ms' must be positive"));
            }
            cfg.refresh_interval = std::chrono::milliseconds(*ms);
        }
        if (config["draw_delay_ms"]) {
            auto ms = read_unsigned(config["draw_delay_ms"], "draw_delay_ms");
            if (!ms) return std::unexpected(std::move(ms.error()));
            cfg.draw_delay = std::chrono::milliseconds(*ms);
        }

        return cfg;
    }

    auto load_config_from_yaml(std::string_view yaml) -> Result<Config> {
        try {
            return config_from_node(YAML::Load(std::string(yaml)));
        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::ConfigInvalid,
                fmt::format("Failed to parse config: {}", e.what())));
        }
    }

    auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path) -> Result<Config> {
        std::vector<std::filesystem::path> paths;
        if (explicit_path) {
            if (!std::filesystem::exists(*explicit_path)) {
                return std::unexpected(make_error(ErrorCode::ConfigInvalid,
                    fmt::format("Config file not found: {}", explicit_path->string())));
            }
            paths.push_back(*explicit_path);
        } else {
            paths = get_config_paths();
        }

        for (const auto& path : paths) {
            if (!std::filesystem::exists(path)) continue;

            try {
                auto cfg = config_from_node(YAML::LoadFile(path.string()));
                if (cfg) {
                    spdlog::debug("Loaded config from {}", path.string());
                }
                return cfg;
            } catch (const YAML::Exception& e) {
                return std::unexpected(make_error(ErrorCode::ConfigInvalid,
                    fmt::format("Failed to parse {}: {}", path.string(), e.what())));
            }
        }

        // Файл не найден: возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.total = args.total;
        cfg.pre_inc = args.pre_inc;
        cfg.items = args.items;
        cfg.thousands_separator = args.thousands_separator;
        if (args.refresh_interval_ms) {
            cfg.refresh_interval = std::chrono::milliseconds(*args.refresh_interval_ms);
        }
        return cfg;
    }

} // namespace mlprogress::infra
