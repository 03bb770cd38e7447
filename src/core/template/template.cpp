#include "template.hpp"
#include <chrono>
#include <exception>
#include <fmt/format.h>
#include "item_format.hpp"

namespace mlprogress::core {

namespace {

// Пробное форматирование нулевым значением: fmt проверяет спецификаторы
// и количество аргументов только во время выполнения.
void probe_format(const ItemSpec& item) {
    constexpr std::string_view separator = " ";
    switch (item.kind) {
        case ItemKind::Eta:
            (void)item_format::format_eta(item.text, std::chrono::nanoseconds::zero(), separator);
            break;
        case ItemKind::Percent:
            (void)item_format::format_percent(item.text, 0.0);
            break;
        case ItemKind::Pos:
        case ItemKind::Total:
            (void)item_format::format_integer(item.text, item.mode, 0, separator);
            break;
        case ItemKind::Speed:
            (void)item_format::format_real(item.text, item.mode, 0.0, separator);
            break;
        default:
            break;
    }
}

auto kind_name(ItemKind kind) -> std::string_view {
    switch (kind) {
        case ItemKind::Eta:     return "eta";
        case ItemKind::Percent: return "percent";
        case ItemKind::Pos:     return "pos";
        case ItemKind::Speed:   return "speed";
        case ItemKind::Total:   return "total";
        case ItemKind::Custom:  return "custom";
        default:                return "item";
    }
}

} // namespace

auto default_items() -> std::vector<ItemSpec> {
    return {
        items::bar_fill(),
        items::literal(" "),
        items::pos(),
        items::literal("/"),
        items::total(),
        items::literal(" ("),
        items::eta(),
        items::literal(")"),
    };
}

auto build_template(std::vector<ItemSpec> items) -> infra::Result<Template> {
    std::optional<std::size_t> fill_index;

    for (std::size_t i = 0; i < items.size(); ++i) {
        const auto& item = items[i];

        if (item.is_fill()) {
            if (fill_index) {
                return std::unexpected(infra::make_error(infra::ErrorCode::MultipleFillItems,
                    "got multiple fill items, at most one is allowed"));
            }
            fill_index = i;
            continue;
        }

        if (item.kind == ItemKind::Custom && !item.custom) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidFormatSpec,
                fmt::format("item #{} ({}) has no callback", i, kind_name(item.kind))));
        }

        try {
            probe_format(item);
        } catch (const fmt::format_error& e) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidFormatSpec,
                fmt::format("item #{} ({}): bad format \"{}\": {}", i, kind_name(item.kind), item.text, e.what())));
        } catch (const std::exception& e) {
            // Например, bad_alloc при огромной ширине у встроенных спецификаторов fmt
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidFormatSpec,
                fmt::format("item #{} ({}): format \"{}\" failed: {}", i, kind_name(item.kind), item.text, e.what())));
        }
    }

    return Template{std::move(items), fill_index};
}

} // namespace mlprogress::core
