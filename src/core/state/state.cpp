#include "state.hpp"
#include <limits>
#include <utility>
#include <spdlog/spdlog.h>

namespace mlprogress::core {

auto StateSnapshot::completed() const -> std::uint64_t {
    if (pre_inc_ && !finished_) {
        return pos_ > 0 ? pos_ - 1 : 0;
    }
    return pos_;
}

auto StateSnapshot::percent() const -> std::optional<double> {
    if (!total_) {
        return std::nullopt;
    }
    // Пустая работа считается выполненной
    if (*total_ == 0) {
        return 100.0;
    }
    return static_cast<double>(completed()) / static_cast<double>(*total_) * 100.0;
}

auto StateSnapshot::eta() const -> std::optional<std::chrono::nanoseconds> {
    if (finished_) {
        return std::chrono::nanoseconds::zero();
    }
    if (!total_ || !speed_ || *speed_ <= 0.0) {
        return std::nullopt;
    }

    const auto done = completed();
    if (done > *total_) {
        return std::nullopt;
    }

    const double remaining = static_cast<double>(*total_ - done) / *speed_;
    constexpr double max_seconds =
        static_cast<double>(std::numeric_limits<std::chrono::nanoseconds::rep>::max()) / 1e9;
    if (remaining >= max_seconds) {
        return std::chrono::nanoseconds::max();
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double>(remaining));
}

State::State(StateOptions options)
    : total_(options.total)
    , pre_inc_(options.pre_inc)
    , thousands_separator_(std::move(options.thousands_separator))
    , start_time_(Clock::now())
{}

void State::inc(std::uint64_t steps) {
    auto current = position_.load(std::memory_order_relaxed);
    std::uint64_t next;
    do {
        // Насыщение вместо переполнения: позиция не уменьшается
        next = steps > std::numeric_limits<std::uint64_t>::max() - current
            ? std::numeric_limits<std::uint64_t>::max()
            : current + steps;
    } while (!position_.compare_exchange_weak(current, next, std::memory_order_relaxed));

    std::lock_guard lock(mutex_);
    update_speed_(Clock::now());
}

void State::set_position(std::uint64_t pos) {
    auto current = position_.load(std::memory_order_relaxed);
    while (current < pos) {
        if (position_.compare_exchange_weak(current, pos, std::memory_order_relaxed)) {
            std::lock_guard lock(mutex_);
            update_speed_(Clock::now());
            return;
        }
    }
    if (current > pos) {
        spdlog::debug("Ignoring set_position({}) below current position {}", pos, current);
    }
}

void State::set_message(std::string message) {
    std::lock_guard lock(mutex_);
    message_ = std::move(message);
}

void State::complete() {
    std::lock_guard lock(mutex_);
    if (total_) {
        // Только вверх: параллельный inc мог уже уйти за total
        auto current = position_.load(std::memory_order_relaxed);
        while (current < *total_
               && !position_.compare_exchange_weak(current, *total_, std::memory_order_relaxed)) {
        }
    } else {
        total_ = position_.load(std::memory_order_relaxed);
    }
}

void State::freeze_total_at_position() {
    std::lock_guard lock(mutex_);
    total_ = position_.load(std::memory_order_relaxed);
}

auto State::mark_finished() -> bool {
    bool expected = false;
    return finished_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

auto State::total() const -> std::optional<std::uint64_t> {
    std::lock_guard lock(mutex_);
    return total_;
}

auto State::snapshot() const -> StateSnapshot {
    StateSnapshot snap;
    snap.pos_ = position_.load(std::memory_order_relaxed);
    snap.finished_ = finished_.load(std::memory_order_acquire);
    snap.pre_inc_ = pre_inc_;
    snap.thousands_separator_ = thousands_separator_;
    snap.start_time_ = start_time_;
    {
        std::lock_guard lock(mutex_);
        snap.total_ = total_;
        snap.message_ = message_;
        snap.speed_ = speed_;
    }
    snap.taken_at_ = Clock::now();
    return snap;
}

// Средняя скорость с момента создания. Вызывается под mutex_.
void State::update_speed_(Clock::time_point now) {
    const auto elapsed = now - start_time_;
    if (elapsed < kMinSpeedElapsed) {
        return;
    }

    const auto pos = position_.load(std::memory_order_relaxed);
    const auto completed = pre_inc_ ? (pos > 0 ? pos - 1 : 0) : pos;
    if (completed == 0) {
        return;
    }

    speed_ = static_cast<double>(completed) / std::chrono::duration<double>(elapsed).count();
}

} // namespace mlprogress::core
