#pragma once

#include <string_view>
#include <vector>
#include "item.hpp"
#include "infra/error_handler/error.hpp"

namespace mlprogress::core {

/// Разбирает текстовое описание шаблона, например
///
///     bar_fill " " pos "/" total " (" (eta "{}{}" "?") ")"
///
/// Токены: имя элемента, строка в двойных кавычках (литерал),
/// (имя "формат" ["текст_при_отсутствии"]).
/// Пустой текст даёт шаблон по умолчанию.
[[nodiscard]] auto parse_template(std::string_view text) -> infra::Result<std::vector<ItemSpec>>;

} // namespace mlprogress::core
