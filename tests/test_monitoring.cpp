#include <cstdint>
#include <thread>
#include <vector>
#include <gtest/gtest.h>

#include "infra/monitoring/monitoring.hpp"

using dcopy::infra::ProgressAggregator;
using dcopy::infra::ProgressEvent;

namespace {

class RecordingSink : public dcopy::infra::ProgressSink {
public:
    void on_progress(const ProgressEvent& event) override { events.push_back(event); }
    std::vector<ProgressEvent> events;
};

} // namespace

TEST(ProgressAggregatorTest, EventsCarryCumulativeBytes)
{
    RecordingSink sink;
    ProgressAggregator progress(&sink);
    progress.set_total(2, 300);

    progress.add_bytes(100);
    progress.add_bytes(200);
    progress.file_done();

    ASSERT_EQ(sink.events.size(), 2u);
    EXPECT_EQ(sink.events[0].bytes_added, 100u);
    EXPECT_EQ(sink.events[1].cumulative_bytes, 300u);

    const auto stats = progress.get_stats();
    EXPECT_EQ(stats.total_files, 2u);
    EXPECT_EQ(stats.processed_files, 1u);
    EXPECT_EQ(stats.total_bytes, 300u);
    EXPECT_EQ(stats.processed_bytes, 300u);
}

TEST(ProgressAggregatorTest, ConcurrentWorkersSumUp)
{
    RecordingSink sink; // вызовы sink сериализованы агрегатором
    ProgressAggregator progress(&sink);

    std::vector<std::jthread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&progress] {
            for (int i = 0; i < 1000; ++i) {
                progress.add_bytes(3);
            }
        });
    }
    workers.clear();

    EXPECT_EQ(progress.bytes(), 12'000u);
    EXPECT_EQ(sink.events.size(), 4000u);
}

TEST(ProgressAggregatorTest, SinkSeesMonotonicBytesAndMayReadStats)
{
    // Sink читает агрегатор изнутри on_progress
    class StatsReadingSink : public dcopy::infra::ProgressSink {
    public:
        void on_progress(const ProgressEvent& event) override {
            if (event.cumulative_bytes < last) {
                ++backwards;
            }
            last = event.cumulative_bytes;
            if (aggregator && aggregator->get_stats().processed_bytes < event.cumulative_bytes) {
                ++stale;
            }
        }
        const ProgressAggregator* aggregator = nullptr;
        std::uint64_t last = 0;
        int backwards = 0;
        int stale = 0;
    };

    StatsReadingSink sink;
    ProgressAggregator progress(&sink);
    sink.aggregator = &progress;

    std::vector<std::jthread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&progress] {
            for (int i = 0; i < 500; ++i) {
                progress.add_bytes(7);
            }
        });
    }
    workers.clear();

    EXPECT_EQ(sink.backwards, 0);
    EXPECT_EQ(sink.stale, 0);
    EXPECT_EQ(sink.last, 14'000u);
}
