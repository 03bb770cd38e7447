#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>
#include "item.hpp"
#include "infra/error_handler/error.hpp"

namespace mlprogress::core {

/// Проверенный неизменяемый список элементов строки прогресса.
/// Создаётся только через build_template().
class Template {
public:
    [[nodiscard]] auto items() const -> const std::vector<ItemSpec>& { return items_; }
    [[nodiscard]] auto fill_index() const -> std::optional<std::size_t> { return fill_index_; }
    [[nodiscard]] auto has_fill() const -> bool { return fill_index_.has_value(); }

private:
    friend auto build_template(std::vector<ItemSpec> items) -> infra::Result<Template>;

    Template(std::vector<ItemSpec> items, std::optional<std::size_t> fill_index)
        : items_(std::move(items)), fill_index_(fill_index) {}

    std::vector<ItemSpec> items_;
    std::optional<std::size_t> fill_index_;
};

// bar_fill " " pos "/" total " (" eta ")"
[[nodiscard]] auto default_items() -> std::vector<ItemSpec>;

/// Ошибки:
///   MultipleFillItems: больше одного bar_fill/message_fill
///   InvalidFormatSpec: форматная строка не подходит к значению элемента
[[nodiscard]] auto build_template(std::vector<ItemSpec> items) -> infra::Result<Template>;

} // namespace mlprogress::core
