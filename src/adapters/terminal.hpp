#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace mlprogress::adapters::terminal {

// Число колонок терминала на stderr; nullopt, если stderr не терминал
[[nodiscard]] auto stderr_width() -> std::optional<std::size_t>;

[[nodiscard]] auto stderr_is_terminal() -> bool;

/// Пишет в stderr без буферизации. Если stderr не терминал, ничего не делает:
/// строки с "\r" в файле или пайпе бесполезны.
void write_stderr(std::string_view text);

} // namespace mlprogress::adapters::terminal
