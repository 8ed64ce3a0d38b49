#pragma once

#include <string>
#include <variant>
#include "core/copy_engine/copy_engine.hpp"
#include "core/move/move_coordinator.hpp"
#include "core/parallel/parallel_coordinator.hpp"
#include "core/transfer_types.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace dcopy::core {

// Стратегия не подходит для этого файла, пробуем следующую
struct Unsupported {
    std::string reason;
};

using Attempt = std::variant<FileOutcome, Unsupported>;

class RenameStrategy {
public:
    explicit RenameStrategy(MoveCoordinator& mover) : mover_(mover) {}
    [[nodiscard]] auto attempt(const FileJob& job) -> infra::Result<Attempt>;

private:
    MoveCoordinator& mover_;
};

class MoveByCopyStrategy {
public:
    explicit MoveByCopyStrategy(MoveCoordinator& mover) : mover_(mover) {}
    [[nodiscard]] auto attempt(const FileJob& job) -> infra::Result<Attempt>;

private:
    MoveCoordinator& mover_;
};

// CoW-клон во временный файл, затем обычная финализация.
// При reflink=always отсутствие поддержки становится ошибкой.
class ReflinkStrategy {
public:
    ReflinkStrategy(const TransferOptions& options, TransferContext& context)
        : options_(options), context_(context) {}
    [[nodiscard]] auto attempt(const FileJob& job) -> infra::Result<Attempt>;

private:
    const TransferOptions& options_;
    TransferContext& context_;
};

class ParallelRangesStrategy {
public:
    explicit ParallelRangesStrategy(ParallelCoordinator& parallel) : parallel_(parallel) {}
    [[nodiscard]] auto attempt(const FileJob& job) -> infra::Result<Attempt>;

private:
    ParallelCoordinator& parallel_;
};

class SequentialStrategy {
public:
    explicit SequentialStrategy(CopyEngine& engine) : engine_(engine) {}
    [[nodiscard]] auto attempt(const FileJob& job) -> infra::Result<Attempt>;

private:
    CopyEngine& engine_;
};

using Strategy = std::variant<RenameStrategy,
                              MoveByCopyStrategy,
                              ReflinkStrategy,
                              ParallelRangesStrategy,
                              SequentialStrategy>;

// Точка входа: разбирает запрос на файлы, решает вопрос перезаписи,
// выбирает стратегию для каждого файла и собирает TransferResult.
class Orchestrator {
public:
    explicit Orchestrator(const infra::CancelToken& cancel, SourceReadHook on_source_read = {});

    [[nodiscard]] auto orchestrate(const TransferRequest& request,
                                   infra::ProgressSink* progress,
                                   ConfirmSink* confirm) -> infra::Result<TransferResult>;

private:
    const infra::CancelToken& cancel_;
    SourceReadHook on_source_read_;
};

} // namespace dcopy::core
