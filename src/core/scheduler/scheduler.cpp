#include "scheduler.hpp"
#include <string>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "core/format/number_format.hpp"
#include "core/render/renderer.hpp"
#include "infra/error_handler/error.hpp"

namespace mlprogress::core {

RedrawScheduler::RedrawScheduler(const Template& tpl, State& state,
                                 WidthSource width_source, OutputSink sink,
                                 SchedulerOptions options)
    : template_(tpl)
    , state_(state)
    , width_source_(std::move(width_source))
    , sink_(std::move(sink))
    , options_(options)
{}

RedrawScheduler::~RedrawScheduler() {
    (void)finish(FinishMode::Quiet);
}

void RedrawScheduler::start() {
    std::lock_guard lock(lifecycle_mutex_);
    if (phase_.load(std::memory_order_acquire) != Phase::Created) {
        return;
    }

    phase_.store(Phase::Running, std::memory_order_release);
    render_thread_ = std::jthread([this](std::stop_token st) { run_(st); });
    spdlog::debug("Redraw thread started, interval {} ms", options_.refresh_interval.count());
}

auto RedrawScheduler::finish(FinishMode mode, const std::function<void()>& on_finish) -> bool {
    std::lock_guard lock(lifecycle_mutex_);
    if (phase_.load(std::memory_order_acquire) == Phase::Finished) {
        return false;
    }

    if (on_finish) {
        on_finish();
    }
    (void)state_.mark_finished();
    phase_.store(Phase::Finished, std::memory_order_release);

    if (render_thread_.joinable()) {
        render_thread_.request_stop();
        wakeup_.notify_all();
        render_thread_.join();
    }

    // Фоновый поток остановлен: дальше пишем только мы
    try {
        if (mode == FinishMode::Draw) {
            draw_();
        } else if (mode == FinishMode::Clear) {
            clear_();
        }
    } catch (const std::exception& e) {
        (void)infra::log_and_return(infra::make_error(infra::ErrorCode::RenderFault,
            fmt::format("final redraw failed: {}", e.what())));
    } catch (...) {
        (void)infra::log_and_return(infra::make_error(infra::ErrorCode::RenderFault,
            "final redraw failed: unknown exception"));
    }

    spdlog::debug("Progress finished at {}", state_.pos());
    return true;
}

auto RedrawScheduler::line_width() const -> std::size_t {
    if (width_source_) {
        if (const auto width = width_source_()) {
            return *width;
        }
    }
    return options_.fallback_width;
}

void RedrawScheduler::run_(std::stop_token st) {
    auto delay = options_.draw_delay;
    while (!st.stop_requested()) {
        {
            std::unique_lock lock(wait_mutex_);
            (void)wakeup_.wait_for(lock, st, delay, [] { return false; });
        }
        if (st.stop_requested()) {
            break;
        }

        try {
            draw_();
        } catch (const std::exception& e) {
            faulted_.store(true, std::memory_order_release);
            (void)infra::log_and_return(infra::make_error(infra::ErrorCode::RenderFault,
                fmt::format("background redraw stopped: {}", e.what())));
            return;
        } catch (...) {
            faulted_.store(true, std::memory_order_release);
            (void)infra::log_and_return(infra::make_error(infra::ErrorCode::RenderFault,
                "background redraw stopped: unknown exception"));
            return;
        }

        delay = options_.refresh_interval;
    }
}

void RedrawScheduler::draw_() {
    const auto width = line_width();
    const auto line = render::render(template_, state_.snapshot(), width);
    if (sink_) {
        sink_(fmt::format("\r{}", format::fit_to_width(line, width)));
    }
}

void RedrawScheduler::clear_() {
    if (sink_) {
        sink_(fmt::format("\r{}\r", std::string(line_width(), ' ')));
    }
}

} // namespace mlprogress::core
