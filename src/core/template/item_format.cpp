#include "item_format.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/core.h>
#include "core/format/number_format.hpp"
#include "core/format/value_format.hpp"

namespace mlprogress::core::item_format {

namespace {

auto format_scaled(std::string_view pattern, format::ScaledValue scaled, bool ignore_precision) -> std::string {
    return fmt::format(fmt::runtime(pattern),
                       format::FitFloat{.value = scaled.value, .ignore_precision = ignore_precision},
                       format::PrefixLabel{.label = scaled.label});
}

} // namespace

auto format_integer(std::string_view pattern, NumberMode mode,
                    std::uint64_t value, std::string_view separator) -> std::string
{
    switch (mode) {
        case NumberMode::BinaryPrefix: {
            const auto scaled = format::binary_prefix(static_cast<double>(value));
            return format_scaled(pattern, scaled, scaled.label.empty());
        }
        case NumberMode::DecimalPrefix: {
            const auto scaled = format::decimal_prefix(static_cast<double>(value));
            return format_scaled(pattern, scaled, scaled.label.empty());
        }
        case NumberMode::Float:
            return fmt::format(fmt::runtime(pattern),
                               format::FitFloat{.value = static_cast<double>(value)});
        case NumberMode::Plain:
        case NumberMode::Grouped:
            break;
    }
    return fmt::format(fmt::runtime(pattern),
                       format::GroupedInteger{.value = value, .separator = separator});
}

auto format_real(std::string_view pattern, NumberMode mode,
                 double value, std::string_view separator) -> std::string
{
    switch (mode) {
        case NumberMode::BinaryPrefix:
            return format_scaled(pattern, format::binary_prefix(value), false);
        case NumberMode::DecimalPrefix:
            return format_scaled(pattern, format::decimal_prefix(value), false);
        case NumberMode::Float:
            return fmt::format(fmt::runtime(pattern), format::FitFloat{.value = value});
        case NumberMode::Plain:
        case NumberMode::Grouped:
            break;
    }
    const auto rounded = static_cast<std::uint64_t>(std::llround(std::max(value, 0.0)));
    return fmt::format(fmt::runtime(pattern),
                       format::GroupedInteger{.value = rounded, .separator = separator});
}

auto format_percent(std::string_view pattern, double percent) -> std::string {
    return fmt::format(fmt::runtime(pattern), format::FitFloat{.value = percent});
}

auto format_eta(std::string_view pattern, std::chrono::nanoseconds eta,
                std::string_view separator) -> std::string
{
    const auto approx = format::duration_approx(eta);
    return fmt::format(fmt::runtime(pattern),
                       format::GroupedInteger{.value = approx.amount, .separator = separator},
                       approx.unit);
}

auto format_eta_hms(std::chrono::nanoseconds eta) -> std::string {
    const auto hms = format::duration_hms(eta);
    if (hms.hours > 0) {
        return fmt::format("{}:{:02}:{:02}", hms.hours, hms.minutes, hms.seconds);
    }
    return fmt::format("{}:{:02}", hms.minutes, hms.seconds);
}

} // namespace mlprogress::core::item_format
