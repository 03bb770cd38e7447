#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>
#include "core/state/state.hpp"
#include "core/template/template.hpp"

namespace mlprogress::core {

// Ширина терминала; nullopt, если неизвестна
using WidthSource = std::function<std::optional<std::size_t>()>;
// Приёмник готовой строки (с "\r" в начале)
using OutputSink = std::function<void(std::string_view)>;

enum class FinishMode {
    Draw,  // финальная отрисовка
    Clear, // строка затирается пробелами
    Quiet, // без вывода (деструктор)
};

struct SchedulerOptions {
    std::chrono::milliseconds refresh_interval{100};
    std::chrono::milliseconds draw_delay{5}; // задержка первой отрисовки
    std::size_t fallback_width = 80;
};

/// Фоновый поток перерисовки: Created -> Running -> Finished.
///
/// Поток только читает State и пишет в sink. После finish() поток
/// гарантированно остановлен, и дальнейших записей из него не будет.
class RedrawScheduler {
public:
    enum class Phase { Created, Running, Finished };

    RedrawScheduler(const Template& tpl, State& state,
                    WidthSource width_source, OutputSink sink,
                    SchedulerOptions options = {});
    ~RedrawScheduler();

    RedrawScheduler(const RedrawScheduler&) = delete;
    RedrawScheduler& operator=(const RedrawScheduler&) = delete;

    void start();

    /// Срабатывает один раз, повторные вызовы ничего не делают и возвращают false.
    /// on_finish правит State до остановки потока, финальная отрисовка его уже видит.
    /// Возвращается после join() фонового потока.
    auto finish(FinishMode mode,
                const std::function<void()>& on_finish = {}) -> bool;

    [[nodiscard]] auto phase() const -> Phase { return phase_.load(std::memory_order_acquire); }

    // true, если отрисовка в фоне упала и поток остановился
    [[nodiscard]] auto faulted() const -> bool { return faulted_.load(std::memory_order_acquire); }

    [[nodiscard]] auto line_width() const -> std::size_t;

private:
    void run_(std::stop_token st);
    void draw_();
    void clear_();

    const Template& template_;
    State& state_;
    WidthSource width_source_;
    OutputSink sink_;
    const SchedulerOptions options_;

    std::atomic<Phase> phase_{Phase::Created};
    std::atomic<bool> faulted_{false};
    std::mutex lifecycle_mutex_;

    std::mutex wait_mutex_;
    std::condition_variable_any wakeup_;
    std::jthread render_thread_;
};

} // namespace mlprogress::core
