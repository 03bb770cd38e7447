#pragma once

#include <functional>
#include <string>

namespace mlprogress::core {

class StateSnapshot;

enum class ItemKind {
    Literal,
    BarFill,
    MessageFill,
    Eta,
    EtaHms,
    Percent,
    Pos,
    Speed,
    Total,
    Custom,
};

// Как число превращается в аргументы форматной строки
enum class NumberMode {
    Plain,         // GroupedInteger, "{}"
    Grouped,       // GroupedInteger, "{:#}"
    BinaryPrefix,  // FitFloat + PrefixLabel, "{:#} {}"
    DecimalPrefix, // FitFloat + PrefixLabel, "{:#} {}"
    Float,         // FitFloat, "{:#}" (только speed)
};

using CustomFn = std::function<std::string(const StateSnapshot&)>;

struct ItemSpec {
    ItemKind kind = ItemKind::Literal;
    NumberMode mode = NumberMode::Plain;
    std::string text;   // Literal: сам текст, иначе форматная строка
    std::string none;   // выводится, когда значения нет
    CustomFn custom;

    [[nodiscard]] auto is_fill() const -> bool {
        return kind == ItemKind::BarFill || kind == ItemKind::MessageFill;
    }
};

[[nodiscard]] auto default_format(ItemKind kind, NumberMode mode) -> std::string;

namespace items {

[[nodiscard]] auto literal(std::string text) -> ItemSpec;
[[nodiscard]] auto bar_fill() -> ItemSpec;
[[nodiscard]] auto message_fill() -> ItemSpec;

[[nodiscard]] auto eta(std::string format = "{}{}", std::string none = "") -> ItemSpec;
[[nodiscard]] auto eta_hms() -> ItemSpec;
[[nodiscard]] auto percent(std::string format = "{:3.0}%", std::string none = "") -> ItemSpec;

[[nodiscard]] auto pos(std::string format = "{}") -> ItemSpec;
[[nodiscard]] auto pos_group() -> ItemSpec;
[[nodiscard]] auto pos_bin(std::string format = "{:#} {}") -> ItemSpec;
[[nodiscard]] auto pos_dec(std::string format = "{:#} {}") -> ItemSpec;

[[nodiscard]] auto speed(std::string format = "{:#}", std::string none = "") -> ItemSpec;
[[nodiscard]] auto speed_int(std::string format = "{}", std::string none = "") -> ItemSpec;
[[nodiscard]] auto speed_group() -> ItemSpec;
[[nodiscard]] auto speed_bin(std::string format = "{:#} {}", std::string none = "") -> ItemSpec;
[[nodiscard]] auto speed_dec(std::string format = "{:#} {}", std::string none = "") -> ItemSpec;

[[nodiscard]] auto total(std::string format = "{}", std::string none = "") -> ItemSpec;
[[nodiscard]] auto total_group() -> ItemSpec;
[[nodiscard]] auto total_bin(std::string format = "{:#} {}", std::string none = "") -> ItemSpec;
[[nodiscard]] auto total_dec(std::string format = "{:#} {}", std::string none = "") -> ItemSpec;

[[nodiscard]] auto custom(CustomFn fn) -> ItemSpec;

} // namespace items
} // namespace mlprogress::core
