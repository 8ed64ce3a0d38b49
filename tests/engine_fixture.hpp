#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

#include "core/transfer_types.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "test_helpers.hpp"

namespace dcopy::test {

inline constexpr std::size_t kChunk = 64 * 1024;

// Контекст передачи, который запоминает каждое чтение источника и
// умеет взвести отмену после заданного числа чтений.
class EngineTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        options_.chunk_size = kChunk;
        options_.reflink = core::ReflinkPolicy::Never;
        options_.ledger_flush_bytes = 1; // ledger на диск после каждого чанка
    }

    [[nodiscard]] auto reads() const -> std::vector<std::uint64_t> {
        std::lock_guard lock(reads_mutex_);
        return reads_;
    }

    void restart() {
        std::lock_guard lock(reads_mutex_);
        reads_.clear();
        cancel_after_ = 0;
        cancel_.reset();
    }

    void on_read(std::uint64_t offset) {
        std::lock_guard lock(reads_mutex_);
        reads_.push_back(offset);
        if (cancel_after_ != 0 && reads_.size() == cancel_after_) {
            cancel_.request_cancel();
        }
    }

    core::TransferOptions options_;
    infra::ProgressAggregator progress_;
    infra::CancelToken cancel_;
    std::size_t cancel_after_ = 0;

    mutable std::mutex reads_mutex_;
    std::vector<std::uint64_t> reads_;

    core::TransferContext context_{progress_, cancel_,
        [this](std::uint64_t offset, std::size_t) { on_read(offset); }};
};

} // namespace dcopy::test
