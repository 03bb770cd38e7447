#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mlprogress::core::format {

inline constexpr std::size_t kDefaultFitWidth = 4;

enum class PrefixBase : unsigned {
    Binary = 1024,  // Ki, Mi, Gi, ...
    Decimal = 1000, // k, M, G, ...
};

struct ScaledValue {
    double value = 0.0;
    std::string_view label;
};

struct ApproxDuration {
    std::uint64_t amount = 0;
    std::string_view unit; // "h", "m" или "s"
};

struct HmsDuration {
    std::uint64_t hours = 0;
    std::uint64_t minutes = 0;
    std::uint64_t seconds = 0;
};

/// Разбивает число на группы по три цифры: group_digits(12345, " ") == "12 345".
[[nodiscard]] auto group_digits(std::uint64_t value, std::string_view separator) -> std::string;

/// Делит на base, пока |value| >= base. На последней приставке (Yi / Y)
/// деление прекращается, и результат может быть >= base.
[[nodiscard]] auto scale_prefix(double value, PrefixBase base) -> ScaledValue;
[[nodiscard]] auto binary_prefix(double value) -> ScaledValue;
[[nodiscard]] auto decimal_prefix(double value) -> ScaledValue;

/// Максимальное число знаков после запятой, при котором строка не длиннее fit_width.
/// Если не помещается даже целая часть, возвращается она без дробной.
[[nodiscard]] auto fit_width_decimals(double value, std::size_t fit_width = kDefaultFitWidth) -> std::string;

[[nodiscard]] auto format_prefix_label(std::string_view label, bool alternate) -> std::string;

// Обе функции отбрасывают дробную часть, без округления.
[[nodiscard]] auto duration_approx(std::chrono::nanoseconds duration) -> ApproxDuration;
[[nodiscard]] auto duration_hms(std::chrono::nanoseconds duration) -> HmsDuration;

// Ширина в символах (UTF-8 code points), а не в байтах
[[nodiscard]] auto display_width(std::string_view text) -> std::size_t;

/// Обрезает или дополняет пробелами до ровно width символов.
[[nodiscard]] auto fit_to_width(std::string_view text, std::size_t width) -> std::string;

} // namespace mlprogress::core::format
