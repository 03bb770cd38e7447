#pragma once

#include <cstddef>
#include <string>
#include "core/state/state.hpp"
#include "core/template/template.hpp"

namespace mlprogress::core::render {

inline constexpr char kBarDone = '#';
inline constexpr char kBarLeft = '-';

/// Собирает строку прогресса без "\r" и перевода строки.
///
/// Элемент-заполнитель (bar_fill / message_fill) получает
/// max(0, line_width - ширина остальных элементов) символов.
/// Без заполнителя результат: простая конкатенация, line_width не учитывается.
///
/// Исключения пользовательских элементов пробрасываются наружу.
[[nodiscard]] auto render(const Template& tpl, const StateSnapshot& snapshot,
                          std::size_t line_width) -> std::string;

// Текст одного элемента, который не является заполнителем
[[nodiscard]] auto render_item(const ItemSpec& item, const StateSnapshot& snapshot) -> std::string;

[[nodiscard]] auto render_bar(const StateSnapshot& snapshot, std::size_t fill_width) -> std::string;
[[nodiscard]] auto render_message(const StateSnapshot& snapshot, std::size_t fill_width) -> std::string;

} // namespace mlprogress::core::render
