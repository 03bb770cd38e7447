#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <fmt/format.h>

// Обёртки значений для форматных строк элементов шаблона.
// Поддерживаемый синтаксис спецификатора: [[fill]align]['#'][width]['.' precision]
//
//   FitFloat        '#' -> подбор точности под ширину precision (по умолчанию 4)
//   GroupedInteger  '#' -> разбиение на группы разрядов
//   PrefixLabel     '#' -> пробел перед непустой приставкой

namespace mlprogress::core::format {

struct FitFloat {
    double value = 0.0;
    // Для '#': без дробной части (значение без приставки целое)
    bool ignore_precision = false;
};

struct GroupedInteger {
    std::uint64_t value = 0;
    std::string_view separator;
};

struct PrefixLabel {
    std::string_view label;
};

namespace detail {

// Верхняя граница width и precision в форматной строке
inline constexpr std::size_t kMaxSpecValue = 1024;

enum class Align { Default, Left, Right, Center };

struct PadSpec {
    char fill = ' ';
    Align align = Align::Default;
    bool alternate = false;
    std::size_t width = 0;
    int precision = -1;

    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) -> typename ParseContext::iterator {
        constexpr auto to_align = [](char c) {
            switch (c) {
                case '<': return Align::Left;
                case '>': return Align::Right;
                case '^': return Align::Center;
                default:  return Align::Default;
            }
        };
        constexpr auto is_digit = [](char c) { return c >= '0' && c <= '9'; };

        auto it = ctx.begin();
        const auto end = ctx.end();
        if (it == end || *it == '}') return it;

        if (it + 1 != end && to_align(*(it + 1)) != Align::Default) {
            fill = *it;
            align = to_align(*(it + 1));
            it += 2;
        } else if (to_align(*it) != Align::Default) {
            align = to_align(*it);
            ++it;
        }

        if (it != end && *it == '#') {
            alternate = true;
            ++it;
        }

        while (it != end && is_digit(*it)) {
            width = width * 10 + static_cast<std::size_t>(*it - '0');
            if (width > kMaxSpecValue) {
                throw fmt::format_error("width is too big");
            }
            ++it;
        }

        if (it != end && *it == '.') {
            ++it;
            if (it == end || !is_digit(*it)) {
                throw fmt::format_error("missing precision in format specifier");
            }
            precision = 0;
            while (it != end && is_digit(*it)) {
                precision = precision * 10 + (*it - '0');
                if (precision > static_cast<int>(kMaxSpecValue)) {
                    throw fmt::format_error("precision is too big");
                }
                ++it;
            }
        }

        if (it != end && *it != '}') {
            throw fmt::format_error("invalid format specifier");
        }
        return it;
    }
};

[[nodiscard]] auto pad(std::string_view text, const PadSpec& spec, Align default_align) -> std::string;

} // namespace detail
} // namespace mlprogress::core::format

template<>
struct fmt::formatter<mlprogress::core::format::FitFloat> {
    mlprogress::core::format::detail::PadSpec spec;

    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) { return spec.parse(ctx); }

    auto format(const mlprogress::core::format::FitFloat& v, format_context& ctx) const
        -> format_context::iterator;
};

template<>
struct fmt::formatter<mlprogress::core::format::GroupedInteger> {
    mlprogress::core::format::detail::PadSpec spec;

    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) { return spec.parse(ctx); }

    auto format(const mlprogress::core::format::GroupedInteger& v, format_context& ctx) const
        -> format_context::iterator;
};

template<>
struct fmt::formatter<mlprogress::core::format::PrefixLabel> {
    mlprogress::core::format::detail::PadSpec spec;

    template<typename ParseContext>
    constexpr auto parse(ParseContext& ctx) { return spec.parse(ctx); }

    auto format(const mlprogress::core::format::PrefixLabel& v, format_context& ctx) const
        -> format_context::iterator;
};
