#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace mlprogress::args_parser {
    struct CLIArgs;
}

namespace mlprogress::infra {

struct Config {
    // Прогресс
    std::optional<std::uint64_t> total;
    bool pre_inc = false;

    // Отображение
    std::optional<std::string> items;               // текст шаблона, см. parse_template()
    std::optional<std::string> thousands_separator; // по умолчанию " "
    std::optional<std::size_t> fallback_width;      // если ширина терминала неизвестна

    // Перерисовка
    std::optional<std::chrono::milliseconds> refresh_interval;
    std::optional<std::chrono::milliseconds> draw_delay;

    // Слияние с другим Config (например, из CLI); заданные поля other имеют приоритет
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из YAML.
/// Если explicit_path не задан, ищет файл в порядке:
///   1. ./.mlprogress.yaml
///   2. $XDG_CONFIG_HOME/mlprogress/config.yaml или ~/.config/mlprogress/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path = std::nullopt)
    -> Result<Config>;

// Разбор YAML-документа из строки
[[nodiscard]] auto load_config_from_yaml(std::string_view yaml) -> Result<Config>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

} // namespace mlprogress::infra
