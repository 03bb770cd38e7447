#include "renderer.hpp"
#include <algorithm>
#include <cmath>
#include <vector>
#include "core/format/number_format.hpp"
#include "core/template/item_format.hpp"

namespace mlprogress::core::render {

auto render_item(const ItemSpec& item, const StateSnapshot& snapshot) -> std::string {
    const auto& separator = snapshot.thousands_separator();

    switch (item.kind) {
        case ItemKind::Literal:
            return item.text;

        case ItemKind::Custom:
            return item.custom(snapshot);

        case ItemKind::Pos:
            return item_format::format_integer(item.text, item.mode, snapshot.pos(), separator);

        case ItemKind::Total:
            if (const auto total = snapshot.total()) {
                return item_format::format_integer(item.text, item.mode, *total, separator);
            }
            return item.none;

        case ItemKind::Percent:
            if (const auto percent = snapshot.percent()) {
                // Позиция за пределами total показывается как 100%
                return item_format::format_percent(item.text, std::min(*percent, 100.0));
            }
            return item.none;

        case ItemKind::Speed:
            if (const auto speed = snapshot.speed()) {
                return item_format::format_real(item.text, item.mode, *speed, separator);
            }
            return item.none;

        case ItemKind::Eta:
            if (const auto eta = snapshot.eta()) {
                return item_format::format_eta(item.text, *eta, separator);
            }
            return item.none;

        case ItemKind::EtaHms:
            if (const auto eta = snapshot.eta()) {
                return item_format::format_eta_hms(*eta);
            }
            return {};

        // Заполнители рисует render()
        case ItemKind::BarFill:
        case ItemKind::MessageFill:
            break;
    }
    return {};
}

auto render_bar(const StateSnapshot& snapshot, std::size_t fill_width) -> std::string {
    const auto percent = snapshot.percent();
    if (!percent) {
        return std::string(fill_width, ' ');
    }

    const double ratio = std::clamp(*percent / 100.0, 0.0, 1.0);
    const auto done = std::min(
        static_cast<std::size_t>(std::floor(static_cast<double>(fill_width) * ratio)),
        fill_width);

    std::string bar(done, kBarDone);
    bar.append(fill_width - done, kBarLeft);
    return bar;
}

auto render_message(const StateSnapshot& snapshot, std::size_t fill_width) -> std::string {
    return format::fit_to_width(snapshot.message(), fill_width);
}

auto render(const Template& tpl, const StateSnapshot& snapshot, std::size_t line_width) -> std::string {
    const auto& items = tpl.items();
    const auto fill_index = tpl.fill_index();

    std::vector<std::string> parts;
    parts.reserve(items.size());

    std::size_t fixed_width = 0;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (fill_index && *fill_index == i) {
            parts.emplace_back();
            continue;
        }
        parts.push_back(render_item(items[i], snapshot));
        fixed_width += format::display_width(parts.back());
    }

    if (fill_index) {
        const auto fill_width = line_width > fixed_width ? line_width - fixed_width : 0;
        parts[*fill_index] = items[*fill_index].kind == ItemKind::BarFill
            ? render_bar(snapshot, fill_width)
            : render_message(snapshot, fill_width);
    }

    std::string line;
    line.reserve(std::max(line_width, fixed_width));
    for (const auto& part : parts) {
        line.append(part);
    }
    return line;
}

} // namespace mlprogress::core::render
