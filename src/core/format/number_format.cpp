#include "number_format.hpp"
#include <array>
#include <cmath>
#include <fmt/core.h>

namespace mlprogress::core::format {

namespace {

constexpr std::array<std::string_view, 9> kBinaryPrefixes{
    "", "Ki", "Mi", "Gi", "Ti", "Pi", "Ei", "Zi", "Yi"
};
constexpr std::array<std::string_view, 9> kDecimalPrefixes{
    "", "k", "M", "G", "T", "P", "E", "Z", "Y"
};

constexpr bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

auto group_digits(std::uint64_t value, std::string_view separator) -> std::string {
    // u64 содержит не больше 7 групп
    std::array<std::uint64_t, 7> groups{};
    std::size_t count = 0;
    do {
        groups[count++] = value % 1000;
        value /= 1000;
    } while (value > 0);

    std::string result = fmt::format("{}", groups[count - 1]);
    result.reserve(count * 3 + (count - 1) * separator.size());
    for (std::size_t i = count - 1; i > 0; --i) {
        result.append(separator);
        result.append(fmt::format("{:03}", groups[i - 1]));
    }
    return result;
}

auto scale_prefix(double value, PrefixBase base) -> ScaledValue {
    const auto& labels = base == PrefixBase::Binary ? kBinaryPrefixes : kDecimalPrefixes;
    const auto divisor = static_cast<double>(static_cast<unsigned>(base));

    std::size_t scale = 0;
    while (std::abs(value) >= divisor && scale < labels.size() - 1) {
        value /= divisor;
        ++scale;
    }
    return ScaledValue{.value = value, .label = labels[scale]};
}

auto binary_prefix(double value) -> ScaledValue {
    return scale_prefix(value, PrefixBase::Binary);
}

auto decimal_prefix(double value) -> ScaledValue {
    return scale_prefix(value, PrefixBase::Decimal);
}

auto fit_width_decimals(double value, std::size_t fit_width) -> std::string {
    for (std::size_t decimals = fit_width + 1; decimals-- > 0;) {
        auto text = fmt::format("{:.{}f}", value, static_cast<int>(decimals));
        if (text.size() <= fit_width) {
            return text;
        }
    }
    return fmt::format("{:.0f}", value);
}

auto format_prefix_label(std::string_view label, bool alternate) -> std::string {
    if (label.empty()) {
        return {};
    }
    return alternate ? fmt::format(" {}", label) : std::string(label);
}

auto duration_approx(std::chrono::nanoseconds duration) -> ApproxDuration {
    const auto secs = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(duration).count());
    if (secs < 60) {
        return {.amount = secs, .unit = "s"};
    }
    if (secs < 3600) {
        return {.amount = secs / 60, .unit = "m"};
    }
    return {.amount = secs / 3600, .unit = "h"};
}

auto duration_hms(std::chrono::nanoseconds duration) -> HmsDuration {
    const auto secs = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(duration).count());
    return HmsDuration{
        .hours = secs / 3600,
        .minutes = (secs % 3600) / 60,
        .seconds = secs % 60
    };
}

auto display_width(std::string_view text) -> std::size_t {
    std::size_t width = 0;
    for (char c : text) {
        if (!is_continuation_byte(c)) ++width;
    }
    return width;
}

auto fit_to_width(std::string_view text, std::size_t width) -> std::string {
    std::size_t chars = 0;
    std::size_t bytes = 0;
    while (bytes < text.size()) {
        if (!is_continuation_byte(text[bytes])) {
            if (chars == width) break;
            ++chars;
        }
        ++bytes;
    }

    std::string result(text.substr(0, bytes));
    result.append(width - chars, ' ');
    return result;
}

} // namespace mlprogress::core::format
