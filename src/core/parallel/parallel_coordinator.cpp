#include "parallel_coordinator.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"
#include "core/copy_engine/copy_engine.hpp"
#include "infra/thread_pool/thread_pool.hpp"

namespace dcopy::core {

using extensions::ByteRange;

ParallelCoordinator::ParallelCoordinator(const TransferOptions& options, TransferContext& context)
    : options_(options), context_(context) {}

auto ParallelCoordinator::should_split(std::uint64_t size) const -> bool {
    return options_.parallelism > 1
        && size >= options_.parallel_threshold
        && size > options_.chunk_size;
}

auto ParallelCoordinator::partition(std::uint64_t total, std::uint64_t chunk_size,
                                    std::uint32_t workers) -> std::vector<ByteRange>
{
    std::vector<ByteRange> ranges;
    if (total == 0 || chunk_size == 0 || workers == 0) {
        return ranges;
    }

    const std::uint64_t chunks = (total + chunk_size - 1) / chunk_size;
    const std::uint64_t n = std::min<std::uint64_t>(workers, chunks);
    const std::uint64_t base = chunks / n;
    const std::uint64_t extra = chunks % n;

    std::uint64_t next_chunk = 0;
    for (std::uint64_t i = 0; i < n; ++i) {
        const std::uint64_t count = base + (i < extra ? 1 : 0);
        const std::uint64_t begin = next_chunk * chunk_size;
        const std::uint64_t end = std::min(total, (next_chunk + count) * chunk_size);
        ranges.push_back({begin, end});
        next_chunk += count;
    }
    return ranges;
}

auto ParallelCoordinator::transfer_ranges(const std::filesystem::path& source,
                                          const std::filesystem::path& destination)
    -> infra::Result<FileOutcome>
{
    CopyEngine engine(options_, context_);

    auto prepared = engine.prepare(source, destination, /*fold_digest=*/false);
    if (!prepared) {
        return std::unexpected(std::move(prepared.error()));
    }
    auto& session = **prepared;
    engine.set_state(session, TransferState::Copying);

    if (!session.is_pending()) {
        return engine.finalize(session, StrategyKind::ParallelRanges);
    }

    const auto total = session.identity.size;

    // Воркеры пишут в разные места файла, поэтому он сразу получает полный размер
    if (auto res = adapters::fs::resize(session.target_fd.get(), total, session.write_target); !res) {
        return std::unexpected(engine.fail(session, std::move(res.error())));
    }

    // Диапазон воркера пересекается с ещё не записанными участками
    std::vector<std::vector<ByteRange>> assignments;
    for (const auto& range : partition(total, options_.chunk_size, options_.parallelism)) {
        std::vector<ByteRange> parts;
        for (const auto& gap : session.pending) {
            const auto begin = std::max(range.begin, gap.begin);
            const auto end = std::min(range.end, gap.end);
            if (begin < end) {
                parts.push_back({begin, end});
            }
        }
        if (!parts.empty()) {
            assignments.push_back(std::move(parts));
        }
    }

    spdlog::debug("Splitting {} into {} ranges ({} bytes left)", source.string(),
                  assignments.size(), total - session.resumed_bytes);

    std::atomic<bool> stop{false};
    std::vector<std::future<infra::VoidResult>> futures;
    futures.reserve(assignments.size());
    {
        infra::ThreadPool pool(assignments.size());
        for (const auto& parts : assignments) {
            futures.push_back(pool.enqueue_with_future([&engine, &session, &stop, parts]() -> infra::VoidResult {
                for (const auto& part : parts) {
                    if (auto res = engine.copy_range(session, part, &stop); !res) {
                        // Остальные воркеры останавливаются на ближайшей границе чанка
                        stop.store(true, std::memory_order_release);
                        return res;
                    }
                }
                return {};
            }));
        }
        pool.wait();
    }

    std::optional<infra::Error> first_error;
    for (auto& future : futures) {
        auto res = future.get();
        if (!res && !first_error) {
            first_error = std::move(res.error());
        }
    }
    if (first_error) {
        return std::unexpected(engine.fail(session, std::move(*first_error)));
    }

    return engine.finalize(session, StrategyKind::ParallelRanges);
}

auto ParallelCoordinator::run_files(const std::vector<FileJob>& jobs, const FileRunner& run_one)
    -> std::vector<std::optional<infra::Result<FileOutcome>>>
{
    using Slot = std::optional<infra::Result<FileOutcome>>;

    std::vector<Slot> results;
    results.reserve(jobs.size());
    if (jobs.empty()) {
        return results;
    }

    std::atomic<bool> halt{false};
    std::vector<std::future<Slot>> futures;
    futures.reserve(jobs.size());
    {
        infra::ThreadPool pool(std::min<std::size_t>(options_.parallelism, jobs.size()));
        for (const auto& job : jobs) {
            futures.push_back(pool.enqueue_with_future([this, &job, &run_one, &halt]() -> Slot {
                if (halt.load(std::memory_order_acquire) || context_.cancel.is_cancelled()) {
                    return std::nullopt;
                }
                auto res = run_one(job);
                if (!res && (options_.fail_fast || res.error().code == infra::ErrorCode::UserAborted)) {
                    halt.store(true, std::memory_order_release);
                }
                return Slot{std::move(res)};
            }));
        }
        pool.wait();
    }

    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

} // namespace dcopy::core
