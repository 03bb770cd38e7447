#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include "item.hpp"

namespace mlprogress::core::item_format {

// Все функции бросают fmt::format_error, если форматная строка
// не подходит к аргументам режима.

[[nodiscard]] auto format_integer(std::string_view pattern, NumberMode mode,
                                  std::uint64_t value, std::string_view separator) -> std::string;

// speed_int / speed_group округляют до целого
[[nodiscard]] auto format_real(std::string_view pattern, NumberMode mode,
                               double value, std::string_view separator) -> std::string;

[[nodiscard]] auto format_percent(std::string_view pattern, double percent) -> std::string;

[[nodiscard]] auto format_eta(std::string_view pattern, std::chrono::nanoseconds eta,
                              std::string_view separator) -> std::string;

// H:MM:SS при ненулевых часах, иначе M:SS
[[nodiscard]] auto format_eta_hms(std::chrono::nanoseconds eta) -> std::string;

} // namespace mlprogress::core::item_format
