#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace mlprogress::core {

using Clock = std::chrono::steady_clock;

// Минимальное время от создания до первой оценки скорости / ETA
inline constexpr std::chrono::milliseconds kMinSpeedElapsed{100};

/// Копия состояния на момент отрисовки. Передаётся в пользовательские элементы.
class StateSnapshot {
public:
    [[nodiscard]] auto pos() const -> std::uint64_t { return pos_; }
    [[nodiscard]] auto total() const -> std::optional<std::uint64_t> { return total_; }
    [[nodiscard]] auto message() const -> const std::string& { return message_; }
    [[nodiscard]] auto thousands_separator() const -> const std::string& { return thousands_separator_; }
    [[nodiscard]] auto speed() const -> std::optional<double> { return speed_; }
    [[nodiscard]] auto elapsed() const -> std::chrono::nanoseconds { return taken_at_ - start_time_; }
    [[nodiscard]] auto is_finished() const -> bool { return finished_; }

    // Выполненные шаги: при pre_inc позиция указывает на начатый шаг
    [[nodiscard]] auto completed() const -> std::uint64_t;

    /// Процент выполнения, nullopt без total. Может быть больше 100.
    [[nodiscard]] auto percent() const -> std::optional<double>;

    /// Оставшееся время: (total - completed) / speed.
    /// nullopt без total, без скорости, при нулевой скорости или completed > total.
    [[nodiscard]] auto eta() const -> std::optional<std::chrono::nanoseconds>;

private:
    friend class State;

    std::uint64_t pos_ = 0;
    std::optional<std::uint64_t> total_;
    std::string message_;
    std::string thousands_separator_;
    std::optional<double> speed_;
    bool pre_inc_ = false;
    bool finished_ = false;
    Clock::time_point start_time_{};
    Clock::time_point taken_at_{};
};

struct StateOptions {
    std::optional<std::uint64_t> total;
    bool pre_inc = false;
    std::string thousands_separator = " ";
};

/// Разделяемое состояние индикатора. Пишет вызывающий код (любые потоки),
/// читает фоновый поток отрисовки через snapshot().
/// Каждое поле согласовано само по себе, между полями согласованность не гарантируется.
class State {
public:
    explicit State(StateOptions options = {});

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    void inc(std::uint64_t steps);

    // Позиция не уменьшается: меньшее значение игнорируется
    void set_position(std::uint64_t pos);

    void set_message(std::string message);

    // Для finish(): pos = total, либо total = pos, если total не задан
    void complete();

    // Для finish_at_current_pos(): total = pos
    void freeze_total_at_position();

    /// true только для первого вызова
    [[nodiscard]] auto mark_finished() -> bool;

    [[nodiscard]] auto is_finished() const -> bool { return finished_.load(std::memory_order_acquire); }
    [[nodiscard]] auto pos() const -> std::uint64_t { return position_.load(std::memory_order_relaxed); }
    [[nodiscard]] auto total() const -> std::optional<std::uint64_t>;
    [[nodiscard]] auto start_time() const -> Clock::time_point { return start_time_; }

    [[nodiscard]] auto snapshot() const -> StateSnapshot;

private:
    void update_speed_(Clock::time_point now);

    std::atomic<std::uint64_t> position_{0};
    std::atomic<bool> finished_{false};

    mutable std::mutex mutex_;
    std::optional<std::uint64_t> total_;
    std::string message_;
    std::optional<double> speed_;

    const bool pre_inc_;
    const std::string thousands_separator_;
    const Clock::time_point start_time_;
};

} // namespace mlprogress::core
