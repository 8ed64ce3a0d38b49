#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace dcopy::infra {

struct ProgressEvent {
    std::uint64_t bytes_added = 0;
    std::uint64_t cumulative_bytes = 0;
    std::chrono::steady_clock::time_point timestamp{};
    double throughput_bps = 0.0; // сглаженная (EMA) скорость
};

// Потребитель прогресса (рендеринг, логирование) реализует внешний код.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void on_progress(const ProgressEvent& event) = 0;
};

// Общий для всех воркеров агрегатор. Счётчики атомарные, вызовы sink
// сериализованы и идут в порядке роста cumulative_bytes, так что реализациям
// sink синхронизация не нужна. Из on_progress можно звать get_stats() и
// bytes(), но не add_bytes().
class ProgressAggregator {
public:
    struct Stats {
        std::uint64_t total_bytes = 0;
        std::uint64_t processed_bytes = 0;
        std::uint64_t total_files = 0;
        std::uint64_t processed_files = 0;
        double throughput_bps = 0.0;
        std::chrono::steady_clock::time_point start_time{};
    };

    static constexpr double kDefaultSmoothing = 0.3;

    explicit ProgressAggregator(ProgressSink* sink = nullptr,
                                double smoothing = kDefaultSmoothing);

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    void set_total(std::uint64_t files, std::uint64_t bytes);

    // Вызывается из любого потока после записи чанка
    void add_bytes(std::uint64_t bytes);
    void file_done();

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto bytes() const -> std::uint64_t {
        return processed_bytes_.load(std::memory_order_relaxed);
    }

private:
    ProgressSink* sink_;
    const double smoothing_;

    std::atomic<std::uint64_t> processed_bytes_{0};
    std::atomic<std::uint64_t> processed_files_{0};
    std::atomic<std::uint64_t> total_bytes_{0};
    std::atomic<std::uint64_t> total_files_{0};

    std::mutex sink_mutex_;
    mutable std::mutex rate_mutex_;
    double ema_bps_ = 0.0;
    bool has_rate_ = false;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_sample_;
};

} // namespace dcopy::infra
