#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "core/scheduler/scheduler.hpp"
#include "core/state/state.hpp"
#include "core/template/item.hpp"
#include "core/template/template.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"

namespace mlprogress::core {

/// Индикатор прогресса в одну строку.
///
/// Рисуется фоновым потоком с момента создания до finish*() или деструктора.
/// По умолчанию пишет в stderr (только если это терминал), строка начинается с "\r".
/// Методы можно вызывать из любых потоков.
class Progress {
public:
    Progress(Progress&&) noexcept = default;
    Progress& operator=(Progress&&) = delete;
    ~Progress();

    void inc(std::uint64_t steps = 1);
    void set_position(std::uint64_t pos);

    // Текст для message_fill
    void message(std::string text);

    /// Завершение на 100%: pos = total (или total = pos, если total не задан),
    /// финальная отрисовка и перевод строки.
    void finish();

    /// Затирает строку пробелами, курсор остаётся в начале пустой строки.
    void finish_and_clear();

    /// total = pos, финальная отрисовка и перевод строки.
    void finish_at_current_pos();

    [[nodiscard]] auto state() const -> StateSnapshot;
    [[nodiscard]] auto is_finished() const -> bool;

private:
    friend class ProgressBuilder;

    Progress(Template tpl, StateOptions state_options, WidthSource width_source,
             OutputSink sink, SchedulerOptions scheduler_options);

    void finish_with_newline_(const std::function<void()>& on_finish);

    std::unique_ptr<Template> template_;
    std::unique_ptr<State> state_;
    OutputSink sink_;
    std::unique_ptr<RedrawScheduler> scheduler_;
};

/// Настройка и создание Progress.
///
///     auto progress = ProgressBuilder{parse_template("pos \"/\" total \" \" bar_fill").value()}
///         .total(1000)
///         .thousands_separator(",")
///         .build();
class ProgressBuilder {
public:
    // Пустой список: bar_fill " " pos "/" total " (" eta ")"
    explicit ProgressBuilder(std::vector<ItemSpec> items = {});

    /// Строит builder из Config: шаблон разбирается parse_template().
    [[nodiscard]] static auto from_config(const infra::Config& config) -> infra::Result<ProgressBuilder>;

    template<std::integral T>
    auto total(T value) -> ProgressBuilder& {
        if constexpr (std::is_signed_v<T>) {
            if (value < 0) {
                total_error_ = true;
                return *this;
            }
        }
        total_error_ = false;
        state_options_.total = static_cast<std::uint64_t>(value);
        return *this;
    }

    auto total(std::optional<std::uint64_t> value) -> ProgressBuilder&;

    // Позиция увеличивается перед работой шага, а не после
    auto pre_inc() -> ProgressBuilder&;
    auto thousands_separator(std::string separator) -> ProgressBuilder&;
    auto refresh_interval(std::chrono::milliseconds interval) -> ProgressBuilder&;
    auto draw_delay(std::chrono::milliseconds delay) -> ProgressBuilder&;
    auto fallback_width(std::size_t width) -> ProgressBuilder&;
    auto width_source(WidthSource source) -> ProgressBuilder&;
    auto output_sink(OutputSink sink) -> ProgressBuilder&;

    /// Ошибки: MultipleFillItems, InvalidFormatSpec, TotalIsOutOfRange.
    [[nodiscard]] auto build() const -> infra::Result<Progress>;

private:
    std::vector<ItemSpec> items_;
    StateOptions state_options_;
    SchedulerOptions scheduler_options_;
    WidthSource width_source_;
    OutputSink sink_;
    bool total_error_ = false;
};

} // namespace mlprogress::core
