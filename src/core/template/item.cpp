#include "item.hpp"
#include <utility>

namespace mlprogress::core {

auto default_format(ItemKind kind, NumberMode mode) -> std::string {
    switch (kind) {
        case ItemKind::Eta:     return "{}{}";
        case ItemKind::Percent: return "{:3.0}%";
        case ItemKind::Pos:
        case ItemKind::Speed:
        case ItemKind::Total:
            switch (mode) {
                case NumberMode::Plain:         return "{}";
                case NumberMode::Grouped:       return "{:#}";
                case NumberMode::BinaryPrefix:
                case NumberMode::DecimalPrefix: return "{:#} {}";
                case NumberMode::Float:         return "{:#}";
            }
            break;
        default:
            break;
    }
    return {};
}

namespace items {

namespace {

auto numeric(ItemKind kind, NumberMode mode, std::string format, std::string none = {}) -> ItemSpec {
    return ItemSpec{
        .kind = kind,
        .mode = mode,
        .text = std::move(format),
        .none = std::move(none),
        .custom = {}
    };
}

} // namespace

auto literal(std::string text) -> ItemSpec {
    return ItemSpec{.kind = ItemKind::Literal, .text = std::move(text)};
}

auto bar_fill() -> ItemSpec {
    return ItemSpec{.kind = ItemKind::BarFill};
}

auto message_fill() -> ItemSpec {
    return ItemSpec{.kind = ItemKind::MessageFill};
}

auto eta(std::string format, std::string none) -> ItemSpec {
    return numeric(ItemKind::Eta, NumberMode::Plain, std::move(format), std::move(none));
}

auto eta_hms() -> ItemSpec {
    return ItemSpec{.kind = ItemKind::EtaHms};
}

auto percent(std::string format, std::string none) -> ItemSpec {
    return numeric(ItemKind::Percent, NumberMode::Float, std::move(format), std::move(none));
}

auto pos(std::string format) -> ItemSpec {
    return numeric(ItemKind::Pos, NumberMode::Plain, std::move(format));
}

auto pos_group() -> ItemSpec {
    return numeric(ItemKind::Pos, NumberMode::Grouped, "{:#}");
}

auto pos_bin(std::string format) -> ItemSpec {
    return numeric(ItemKind::Pos, NumberMode::BinaryPrefix, std::move(format));
}

auto pos_dec(std::string format) -> ItemSpec {
    return numeric(ItemKind::Pos, NumberMode::DecimalPrefix, std::move(format));
}

auto speed(std::string format, std::string none) -> ItemSpec {
    return numeric(ItemKind::Speed, NumberMode::Float, std::move(format), std::move(none));
}

auto speed_int(std::string format, std::string none) -> ItemSpec {
    return numeric(ItemKind::Speed, NumberMode::Plain, std::move(format), std::move(none));
}

auto speed_group() -> ItemSpec {
    return numeric(ItemKind::Speed, NumberMode::Grouped, "{:#}");
}

auto speed_bin(std::string format, std::string none) -> ItemSpec {
    return numeric(ItemKind::Speed, NumberMode::BinaryPrefix, std::move(format), std::move(none));
}

auto speed_dec(std::string format, std::string none) -> ItemSpec {
    return numeric(ItemKind::Speed, NumberMode::DecimalPrefix, std::move(format), std::move(none));
}

auto total(std::string format, std::string none) -> ItemSpec {
    return numeric(ItemKind::Total, NumberMode::Plain, std::move(format), std::move(none));
}

auto total_group() -> ItemSpec {
    return numeric(ItemKind::Total, NumberMode::Grouped, "{:#}");
}

auto total_bin(std::string format, std::string none) -> ItemSpec {
    return numeric(ItemKind::Total, NumberMode::BinaryPrefix, std::move(format), std::move(none));
}

auto total_dec(std::string format, std::string none) -> ItemSpec {
    return numeric(ItemKind::Total, NumberMode::DecimalPrefix, std::move(format), std::move(none));
}

auto custom(CustomFn fn) -> ItemSpec {
    return ItemSpec{.kind = ItemKind::Custom, .custom = std::move(fn)};
}

} // namespace items
} // namespace mlprogress::core
