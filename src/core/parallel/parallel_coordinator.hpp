#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>
#include "core/transfer_types.hpp"
#include "extensions/resumer.hpp"
#include "infra/error_handler/error.hpp"

namespace dcopy::core {

// Два режима параллелизма:
//  - диапазоны одного большого файла, каждый воркер пишет в свой
//    непересекающийся диапазон общего временного файла;
//  - пул файлов, каждый воркер целиком переносит один файл.
class ParallelCoordinator {
public:
    using FileRunner = std::function<infra::Result<FileOutcome>(const FileJob&)>;

    ParallelCoordinator(const TransferOptions& options, TransferContext& context);

    /// Имеет ли смысл дробить файл такого размера на диапазоны.
    [[nodiscard]] auto should_split(std::uint64_t size) const -> bool;

    /// Режим диапазонов. Ledger общий, записи передаются через LedgerWriter.
    [[nodiscard]] auto transfer_ranges(const std::filesystem::path& source,
                                       const std::filesystem::path& destination)
        -> infra::Result<FileOutcome>;

    /// Режим пула файлов. Результаты возвращаются в порядке `jobs`;
    /// nullopt означает, что задача не запускалась (fail_fast или отмена).
    [[nodiscard]] auto run_files(const std::vector<FileJob>& jobs, const FileRunner& run_one)
        -> std::vector<std::optional<infra::Result<FileOutcome>>>;

    /// Делит [0, total) на `workers` непрерывных диапазонов по границам чанков.
    [[nodiscard]] static auto partition(std::uint64_t total, std::uint64_t chunk_size,
                                        std::uint32_t workers) -> std::vector<extensions::ByteRange>;

private:
    const TransferOptions& options_;
    TransferContext& context_;
};

} // namespace dcopy::core
