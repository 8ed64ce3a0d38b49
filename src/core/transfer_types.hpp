#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>
#include "adapters/fs.hpp"
#include "extensions/verifier.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace dcopy::core {

enum class OverwritePolicy { Never, Prompt, Always, Smart };
enum class VerifyPolicy { None, Fast, Full };
enum class ReflinkPolicy { Auto, Always, Never };
enum class TransferMode { Copy, Move };

[[nodiscard]] auto to_string(OverwritePolicy policy) -> std::string_view;
[[nodiscard]] auto to_string(VerifyPolicy policy) -> std::string_view;
[[nodiscard]] auto to_string(ReflinkPolicy policy) -> std::string_view;

[[nodiscard]] auto parse_overwrite_policy(std::string_view text) -> infra::Result<OverwritePolicy>;
[[nodiscard]] auto parse_verify_policy(std::string_view text) -> infra::Result<VerifyPolicy>;
[[nodiscard]] auto parse_reflink_policy(std::string_view text) -> infra::Result<ReflinkPolicy>;

inline constexpr std::size_t kDefaultChunkSize = 64ull * 1024 * 1024;
inline constexpr std::uint32_t kDefaultParallelism = 4;
inline constexpr std::uint64_t kDefaultParallelThreshold = 128ull * 1024 * 1024;
inline constexpr std::uint64_t kDefaultLedgerFlushBytes = 100ull * 1024 * 1024;
inline constexpr std::chrono::milliseconds kDefaultLedgerFlushInterval{2000};

struct TransferOptions {
    OverwritePolicy overwrite = OverwritePolicy::Prompt;
    VerifyPolicy verify = VerifyPolicy::Fast;
    bool atomic = true;
    std::size_t chunk_size = kDefaultChunkSize;
    std::uint32_t parallelism = kDefaultParallelism;
    ReflinkPolicy reflink = ReflinkPolicy::Auto;
    bool resume = true;
    bool fail_fast = false;
    bool preserve_metadata = true;
    bool chunk_checksums = false;

    // Ниже порога параллельное копирование одного файла не окупается
    std::uint64_t parallel_threshold = kDefaultParallelThreshold;

    // Ledger сбрасывается на диск по первому из двух порогов
    std::uint64_t ledger_flush_bytes = kDefaultLedgerFlushBytes;
    std::chrono::milliseconds ledger_flush_interval = kDefaultLedgerFlushInterval;

    std::size_t verify_block_size = extensions::kDefaultVerifyBlockSize;

    [[nodiscard]] auto validate() const -> infra::VoidResult;
};

/// Значения по умолчанию с наложенными заданными полями Config.
[[nodiscard]] auto options_from_config(const infra::Config& config) -> infra::Result<TransferOptions>;

// Неизменяем после создания
class TransferRequest {
public:
    TransferRequest(std::vector<std::filesystem::path> sources,
                    std::filesystem::path destination,
                    TransferOptions options = {},
                    TransferMode mode = TransferMode::Copy);

    [[nodiscard]] auto sources() const -> const std::vector<std::filesystem::path>& { return sources_; }
    [[nodiscard]] auto destination() const -> const std::filesystem::path& { return destination_; }
    [[nodiscard]] auto options() const -> const TransferOptions& { return options_; }
    [[nodiscard]] auto mode() const -> TransferMode { return mode_; }

private:
    std::vector<std::filesystem::path> sources_;
    std::filesystem::path destination_;
    TransferOptions options_;
    TransferMode mode_;
};

enum class TransferState {
    Init,
    Validating,
    ResumeCheck,
    Copying,
    Verifying,
    Finalizing,
    Completed,
    Failed,
    Aborted,
};

[[nodiscard]] auto to_string(TransferState state) -> std::string_view;

enum class StrategyKind { None, Rename, Reflink, ParallelRanges, Sequential };

[[nodiscard]] auto to_string(StrategyKind kind) -> std::string_view;

enum class FileStatus { Completed, Skipped, Failed, Aborted };

struct FileOutcome {
    std::filesystem::path source;
    std::filesystem::path destination;
    FileStatus status = FileStatus::Completed;
    StrategyKind strategy = StrategyKind::None;
    TransferState final_state = TransferState::Init;
    std::uint64_t bytes_transferred = 0;
    bool verified = false;
    bool resumed = false;
    std::optional<infra::Error> error;
};

struct TransferResult {
    std::uint64_t bytes_transferred = 0;
    std::chrono::milliseconds elapsed{0};
    bool verified = false;
    std::vector<FileOutcome> files;

    [[nodiscard]] auto count(FileStatus status) const -> std::size_t;
    [[nodiscard]] auto first_error() const -> const infra::Error*;
};

// Одна единица работы оркестратора: файл и его конечный путь
struct FileJob {
    std::filesystem::path source;
    std::filesystem::path destination;
    adapters::fs::FileIdentity identity{};
};

enum class ConfirmChoice { Overwrite, Skip, Abort };

// Интерактивное подтверждение перезаписи реализует внешний код.
class ConfirmSink {
public:
    virtual ~ConfirmSink() = default;
    virtual auto confirm_overwrite(const std::filesystem::path& source,
                                   const std::filesystem::path& destination) -> ConfirmChoice = 0;
};

using SourceReadHook = std::function<void(std::uint64_t offset, std::size_t length)>;

// Разделяемое состояние передачи. Передаётся явно, глобального нет.
struct TransferContext {
    infra::ProgressAggregator& progress;
    const infra::CancelToken& cancel;
    SourceReadHook on_source_read; // инструментирование чтений источника (тесты)
};

} // namespace dcopy::core
