#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/progress/progress.hpp"
#include "core/scheduler/scheduler.hpp"
#include "core/template/template_parser.hpp"
#include "infra/config/config.hpp"

using namespace mlprogress::core;
using namespace std::chrono_literals;
using mlprogress::infra::ErrorCode;

namespace {

constexpr std::size_t kWidth = 50;

// Records everything the indicator writes
class CapturingSink {
public:
    auto sink() -> OutputSink {
        return [this](std::string_view text) {
            std::lock_guard lock(mutex_);
            writes_.emplace_back(text);
        };
    }

    auto writes() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return writes_;
    }

    auto count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return writes_.size();
    }

    auto wait_for_writes(std::size_t n, std::chrono::milliseconds timeout = 2s) const -> bool {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (count() >= n) return true;
            std::this_thread::sleep_for(1ms);
        }
        return count() >= n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> writes_;
};

auto fixed_width() -> WidthSource {
    return [] { return std::optional<std::size_t>{kWidth}; };
}

auto test_builder(CapturingSink& capture, std::vector<ItemSpec> items = {}) -> ProgressBuilder {
    ProgressBuilder builder{std::move(items)};
    builder.width_source(fixed_width())
        .output_sink(capture.sink())
        .draw_delay(1ms)
        .refresh_interval(5ms);
    return builder;
}

} // namespace

TEST(ProgressTest, BackgroundRedrawWritesFullWidthLines)
{
    CapturingSink capture;
    auto progress = test_builder(capture).total(100).build();
    ASSERT_TRUE(progress);

    progress->inc(10);
    ASSERT_TRUE(capture.wait_for_writes(2));
    progress->finish();

    for (const auto& line : capture.writes()) {
        if (line == "\n") continue;
        ASSERT_FALSE(line.empty());
        EXPECT_EQ(line.front(), '\r');
        EXPECT_EQ(line.size(), kWidth + 1) << line;
    }
}

TEST(ProgressTest, FinishDrawsCompleteLineThenNewline)
{
    CapturingSink capture;
    auto progress = test_builder(capture, {items::pos(), items::literal("/"), items::total()})
        .total(10)
        .build();
    ASSERT_TRUE(progress);

    progress->inc(4);
    progress->finish();

    const auto writes = capture.writes();
    ASSERT_GE(writes.size(), 2u);
    EXPECT_EQ(writes.back(), "\n");
    EXPECT_EQ(writes[writes.size() - 2], "\r10/10" + std::string(kWidth - 5, ' '));
    EXPECT_TRUE(progress->is_finished());
    EXPECT_EQ(progress->state().pos(), 10u);
}

TEST(ProgressTest, FinishTwiceIsNoop)
{
    CapturingSink capture;
    auto progress = test_builder(capture).total(10).build();
    ASSERT_TRUE(progress);

    progress->finish();
    const auto after_first = capture.count();

    // The redraw thread is already stopped: nothing is written over several intervals
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(capture.count(), after_first);

    progress->finish();
    progress->finish_and_clear();
    progress->finish_at_current_pos();
    EXPECT_EQ(capture.count(), after_first);
}

TEST(ProgressTest, FinishAndClearBlanksTheLine)
{
    CapturingSink capture;
    auto progress = test_builder(capture).total(10).build();
    ASSERT_TRUE(progress);

    progress->inc(3);
    progress->finish_and_clear();

    const auto writes = capture.writes();
    ASSERT_FALSE(writes.empty());
    EXPECT_EQ(writes.back(), "\r" + std::string(kWidth, ' ') + "\r");
}

TEST(ProgressTest, FinishAtCurrentPosFreezesTotal)
{
    CapturingSink capture;
    auto progress = test_builder(capture).total(100).build();
    ASSERT_TRUE(progress);

    progress->inc(42);
    progress->finish_at_current_pos();

    const auto snap = progress->state();
    EXPECT_EQ(snap.pos(), 42u);
    EXPECT_EQ(snap.total(), 42u);
    EXPECT_EQ(capture.writes().back(), "\n");
}

TEST(ProgressTest, FinishWithoutTotalUsesPosition)
{
    CapturingSink capture;
    auto progress = test_builder(capture).build();
    ASSERT_TRUE(progress);

    progress->inc(7);
    progress->finish();
    EXPECT_EQ(progress->state().total(), 7u);
}

TEST(ProgressTest, DestructorWithoutFinishEmitsNothing)
{
    CapturingSink capture;
    {
        auto progress = test_builder(capture).total(10).draw_delay(10s).build();
        ASSERT_TRUE(progress);
        progress->inc(5);
    }
    EXPECT_EQ(capture.count(), 0u);
}

TEST(ProgressTest, ConcurrentIncrementsWithBackgroundRedraw)
{
    constexpr int kThreads = 4;
    constexpr int kIncrements = 2000;

    CapturingSink capture;
    auto progress = test_builder(capture).total(kThreads * kIncrements).build();
    ASSERT_TRUE(progress);

    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&progress] {
                for (int i = 0; i < kIncrements; ++i) {
                    progress->inc();
                }
            });
        }
    }

    EXPECT_EQ(progress->state().pos(), static_cast<std::uint64_t>(kThreads * kIncrements));
    progress->finish();
}

TEST(ProgressTest, MessageReachesMessageFill)
{
    CapturingSink capture;
    auto progress = test_builder(capture, {items::literal("> "), items::message_fill()}).build();
    ASSERT_TRUE(progress);

    progress->message("working");
    progress->finish_at_current_pos();

    const auto writes = capture.writes();
    ASSERT_GE(writes.size(), 2u);
    EXPECT_EQ(writes[writes.size() - 2], "\r> working" + std::string(kWidth - 9, ' '));
}

TEST(ProgressBuilderTest, NegativeTotalIsRejected)
{
    CapturingSink capture;
    auto progress = test_builder(capture).total(-5).build();
    ASSERT_FALSE(progress);
    EXPECT_EQ(progress.error().code, ErrorCode::TotalIsOutOfRange);

    // A later valid total replaces the error
    auto fixed = test_builder(capture).total(-5).total(5).build();
    EXPECT_TRUE(fixed);
}

TEST(ProgressBuilderTest, TemplateErrorsAreReturned)
{
    CapturingSink capture;
    auto progress = test_builder(capture, {items::bar_fill(), items::message_fill()}).build();
    ASSERT_FALSE(progress);
    EXPECT_EQ(progress.error().code, ErrorCode::MultipleFillItems);
    EXPECT_EQ(capture.count(), 0u);
}

TEST(ProgressBuilderTest, FromConfig)
{
    mlprogress::infra::Config config;
    config.total = 2000;
    config.items = R"(pos_group "/" total_group)";
    config.thousands_separator = ",";

    auto builder = ProgressBuilder::from_config(config);
    ASSERT_TRUE(builder);

    CapturingSink capture;
    auto progress = builder->width_source(fixed_width())
        .output_sink(capture.sink())
        .build();
    ASSERT_TRUE(progress);

    progress->set_position(1500);
    progress->finish_at_current_pos();
    const auto writes = capture.writes();
    ASSERT_GE(writes.size(), 2u);
    EXPECT_EQ(writes[writes.size() - 2], "\r1,500/1,500" + std::string(kWidth - 11, ' '));
}

TEST(ProgressBuilderTest, FromConfigReportsTemplateSyntax)
{
    mlprogress::infra::Config config;
    config.items = "pos (";
    auto builder = ProgressBuilder::from_config(config);
    ASSERT_FALSE(builder);
    EXPECT_EQ(builder.error().code, ErrorCode::TemplateSyntax);
}

TEST(RedrawSchedulerTest, ThrowingItemStopsRedrawWithoutCrash)
{
    auto tpl = build_template({
        items::custom([](const StateSnapshot&) -> std::string { throw std::runtime_error("boom"); }),
    });
    ASSERT_TRUE(tpl);

    State state;
    CapturingSink capture;
    RedrawScheduler scheduler(*tpl, state, fixed_width(), capture.sink(),
                              SchedulerOptions{.refresh_interval = 5ms, .draw_delay = 1ms});
    scheduler.start();

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!scheduler.faulted() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_TRUE(scheduler.faulted());

    // Final redraw fails too, the error is only logged
    EXPECT_TRUE(scheduler.finish(FinishMode::Draw));
    EXPECT_EQ(capture.count(), 0u);
    EXPECT_TRUE(state.is_finished());
}

TEST(RedrawSchedulerTest, FallbackWidthWhenUnknown)
{
    auto tpl = build_template({items::bar_fill()});
    ASSERT_TRUE(tpl);

    State state{StateOptions{.total = 4}};
    CapturingSink capture;
    RedrawScheduler scheduler(*tpl, state, [] { return std::optional<std::size_t>{}; }, capture.sink(),
                              SchedulerOptions{.draw_delay = 10s, .fallback_width = 20});
    EXPECT_EQ(scheduler.line_width(), 20u);

    scheduler.start();
    state.inc(2);
    EXPECT_TRUE(scheduler.finish(FinishMode::Draw));
    EXPECT_FALSE(scheduler.finish(FinishMode::Draw));

    const auto writes = capture.writes();
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes.front(), "\r" + std::string(10, '#') + std::string(10, '-'));
    EXPECT_EQ(scheduler.phase(), RedrawScheduler::Phase::Finished);
}
