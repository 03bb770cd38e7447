#include "value_format.hpp"
#include "number_format.hpp"
#include <algorithm>

namespace mlprogress::core::format::detail {

auto pad(std::string_view text, const PadSpec& spec, Align default_align) -> std::string {
    const auto width = display_width(text);
    if (width >= spec.width) {
        return std::string(text);
    }

    const auto padding = spec.width - width;
    const auto align = spec.align == Align::Default ? default_align : spec.align;

    std::size_t left = 0;
    switch (align) {
        case Align::Right:  left = padding; break;
        case Align::Center: left = padding / 2; break;
        default:            left = 0; break;
    }

    std::string result;
    result.reserve(text.size() + padding);
    result.append(left, spec.fill);
    result.append(text);
    result.append(padding - left, spec.fill);
    return result;
}

} // namespace mlprogress::core::format::detail

namespace fmtns = mlprogress::core::format;

auto fmt::formatter<fmtns::FitFloat>::format(const fmtns::FitFloat& v, format_context& ctx) const
    -> format_context::iterator
{
    std::string text;
    if (spec.alternate) {
        if (v.ignore_precision) {
            text = fmt::format("{:.0f}", v.value);
        } else {
            const auto fit_width = spec.precision >= 0
                ? static_cast<std::size_t>(spec.precision)
                : fmtns::kDefaultFitWidth;
            text = fmtns::fit_width_decimals(v.value, fit_width);
        }
    } else if (spec.precision >= 0) {
        text = fmt::format("{:.{}f}", v.value, spec.precision);
    } else {
        text = fmt::format("{}", v.value);
    }

    const auto padded = fmtns::detail::pad(text, spec, fmtns::detail::Align::Right);
    return std::copy(padded.begin(), padded.end(), ctx.out());
}

auto fmt::formatter<fmtns::GroupedInteger>::format(const fmtns::GroupedInteger& v, format_context& ctx) const
    -> format_context::iterator
{
    const auto text = spec.alternate
        ? fmtns::group_digits(v.value, v.separator)
        : fmt::format("{}", v.value);

    const auto padded = fmtns::detail::pad(text, spec, fmtns::detail::Align::Right);
    return std::copy(padded.begin(), padded.end(), ctx.out());
}

auto fmt::formatter<fmtns::PrefixLabel>::format(const fmtns::PrefixLabel& v, format_context& ctx) const
    -> format_context::iterator
{
    const auto text = fmtns::format_prefix_label(v.label, spec.alternate);

    const auto padded = fmtns::detail::pad(text, spec, fmtns::detail::Align::Left);
    return std::copy(padded.begin(), padded.end(), ctx.out());
}
