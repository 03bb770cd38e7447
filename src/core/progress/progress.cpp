#include "progress.hpp"
#include <utility>
#include <spdlog/spdlog.h>
#include "adapters/terminal.hpp"
#include "core/template/template_parser.hpp"

namespace mlprogress::core {

Progress::Progress(Template tpl, StateOptions state_options, WidthSource width_source,
                   OutputSink sink, SchedulerOptions scheduler_options)
    : template_(std::make_unique<Template>(std::move(tpl)))
    , state_(std::make_unique<State>(std::move(state_options)))
    , sink_(std::move(sink))
    , scheduler_(std::make_unique<RedrawScheduler>(*template_, *state_, std::move(width_source),
                                                   sink_, scheduler_options))
{
    scheduler_->start();
}

Progress::~Progress() {
    // Без вывода: дорисовку выбирает вызывающий код через finish*()
    if (scheduler_) {
        (void)scheduler_->finish(FinishMode::Quiet);
    }
}

void Progress::inc(std::uint64_t steps) {
    state_->inc(steps);
}

void Progress::set_position(std::uint64_t pos) {
    state_->set_position(pos);
}

void Progress::message(std::string text) {
    state_->set_message(std::move(text));
}

void Progress::finish() {
    finish_with_newline_([this] { state_->complete(); });
}

void Progress::finish_and_clear() {
    (void)scheduler_->finish(FinishMode::Clear);
}

void Progress::finish_at_current_pos() {
    finish_with_newline_([this] { state_->freeze_total_at_position(); });
}

void Progress::finish_with_newline_(const std::function<void()>& on_finish) {
    if (scheduler_->finish(FinishMode::Draw, on_finish) && sink_) {
        sink_("\n");
    }
}

auto Progress::state() const -> StateSnapshot {
    return state_->snapshot();
}

auto Progress::is_finished() const -> bool {
    return state_->is_finished();
}

ProgressBuilder::ProgressBuilder(std::vector<ItemSpec> items)
    : items_(items.empty() ? default_items() : std::move(items))
    , width_source_(&adapters::terminal::stderr_width)
    , sink_(&adapters::terminal::write_stderr)
{}

auto ProgressBuilder::from_config(const infra::Config& config) -> infra::Result<ProgressBuilder> {
    std::vector<ItemSpec> items;
    if (config.items) {
        auto parsed = parse_template(*config.items);
        if (!parsed) {
            return std::unexpected(std::move(parsed.error()));
        }
        items = std::move(*parsed);
    }

    ProgressBuilder builder{std::move(items)};
    builder.total(config.total);
    if (config.pre_inc) builder.pre_inc();
    if (config.thousands_separator) builder.thousands_separator(*config.thousands_separator);
    if (config.fallback_width) builder.fallback_width(*config.fallback_width);
    if (config.refresh_interval) builder.refresh_interval(*config.refresh_interval);
    if (config.draw_delay) builder.draw_delay(*config.draw_delay);
    return builder;
}

auto ProgressBuilder::total(std::optional<std::uint64_t> value) -> ProgressBuilder& {
    total_error_ = false;
    state_options_.total = value;
    return *this;
}

auto ProgressBuilder::pre_inc() -> ProgressBuilder& {
    state_options_.pre_inc = true;
    return *this;
}

auto ProgressBuilder::thousands_separator(std::string separator) -> ProgressBuilder& {
    state_options_.thousands_separator = std::move(separator);
    return *this;
}

auto ProgressBuilder::refresh_interval(std::chrono::milliseconds interval) -> ProgressBuilder& {
    scheduler_options_.refresh_interval = interval;
    return *this;
}

auto ProgressBuilder::draw_delay(std::chrono::milliseconds delay) -> ProgressBuilder& {
    scheduler_options_.draw_delay = delay;
    return *this;
}

auto ProgressBuilder::fallback_width(std::size_t width) -> ProgressBuilder& {
    scheduler_options_.fallback_width = width;
    return *this;
}

auto ProgressBuilder::width_source(WidthSource source) -> ProgressBuilder& {
    width_source_ = std::move(source);
    return *this;
}

auto ProgressBuilder::output_sink(OutputSink sink) -> ProgressBuilder& {
    sink_ = std::move(sink);
    return *this;
}

auto ProgressBuilder::build() const -> infra::Result<Progress> {
    if (total_error_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TotalIsOutOfRange,
            "total must not be negative"));
    }

    auto tpl = build_template(items_);
    if (!tpl) {
        return std::unexpected(std::move(tpl.error()));
    }

    spdlog::debug("Progress: {} items, total {}", tpl->items().size(),
                  state_options_.total ? std::to_string(*state_options_.total) : "unknown");

    return Progress{std::move(*tpl), state_options_, width_source_, sink_, scheduler_options_};
}

} // namespace mlprogress::core
