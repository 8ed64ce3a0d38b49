#include "monitoring.hpp"

namespace dcopy::infra {

ProgressAggregator::ProgressAggregator(ProgressSink* sink, double smoothing)
    : sink_(sink)
    , smoothing_(smoothing)
    , start_time_(std::chrono::steady_clock::now())
    , last_sample_(start_time_)
{}

void ProgressAggregator::set_total(std::uint64_t files, std::uint64_t bytes) {
    total_files_.store(files, std::memory_order_relaxed);
    total_bytes_.store(bytes, std::memory_order_relaxed);
}

void ProgressAggregator::add_bytes(std::uint64_t bytes) {
    // sink_mutex_ на всём пути: cumulative_bytes в событиях только растёт
    std::lock_guard sink_lock(sink_mutex_);

    ProgressEvent event{
        .bytes_added = bytes,
        .cumulative_bytes = processed_bytes_.fetch_add(bytes, std::memory_order_relaxed) + bytes,
    };

    {
        std::lock_guard lock(rate_mutex_);
        const auto now = std::chrono::steady_clock::now();
        const double dt = std::chrono::duration<double>(now - last_sample_).count();
        last_sample_ = now;

        // Мгновенная скорость шумит на бурстовом I/O, сглаживаем EMA
        if (dt > 0.0) {
            const double instant = static_cast<double>(bytes) / dt;
            if (!has_rate_) {
                ema_bps_ = instant;
                has_rate_ = true;
            } else {
                ema_bps_ = smoothing_ * instant + (1.0 - smoothing_) * ema_bps_;
            }
        }
        event.timestamp = now;
        event.throughput_bps = ema_bps_;
    }

    // rate_mutex_ уже отпущен, sink может читать get_stats()
    if (sink_) {
        sink_->on_progress(event);
    }
}

void ProgressAggregator::file_done() {
    processed_files_.fetch_add(1, std::memory_order_relaxed);
}

auto ProgressAggregator::get_stats() const -> Stats {
    std::lock_guard lock(rate_mutex_);
    return Stats{
        .total_bytes = total_bytes_.load(std::memory_order_relaxed),
        .processed_bytes = processed_bytes_.load(std::memory_order_relaxed),
        .total_files = total_files_.load(std::memory_order_relaxed),
        .processed_files = processed_files_.load(std::memory_order_relaxed),
        .throughput_bps = ema_bps_,
        .start_time = start_time_,
    };
}

} // namespace dcopy::infra
