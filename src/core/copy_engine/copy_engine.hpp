#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "adapters/fs.hpp"
#include "core/transfer_types.hpp"
#include "extensions/resumer.hpp"
#include "extensions/verifier.hpp"
#include "infra/error_handler/error.hpp"

namespace dcopy::core {

// Единственный писатель ledger'а. Воркеры передают ему готовые чанки,
// он копит их и сбрасывает на диск пачкой. Перед каждым сохранением
// данные целевого файла доводятся до диска (fdatasync), иначе ledger
// мог бы объявить записанными байты, которых на диске ещё нет.
class LedgerWriter {
public:
    LedgerWriter(extensions::ResumeLedger ledger,
                 std::filesystem::path ledger_file,
                 int data_fd,
                 std::filesystem::path data_path,
                 std::uint64_t flush_bytes,
                 std::chrono::milliseconds flush_interval);

    LedgerWriter(const LedgerWriter&) = delete;
    LedgerWriter& operator=(const LedgerWriter&) = delete;

    [[nodiscard]] auto record(extensions::ChunkRecord chunk) -> infra::VoidResult;
    [[nodiscard]] auto flush() -> infra::VoidResult;

    // Данные уже на диске и дескриптор закрыт: дальнейшие flush без fdatasync
    void detach_data();

    [[nodiscard]] auto snapshot() const -> extensions::ResumeLedger;
    [[nodiscard]] auto is_complete() const -> bool;
    [[nodiscard]] auto missing_ranges() const -> std::vector<extensions::ByteRange>;

    [[nodiscard]] auto ledger_file() const -> const std::filesystem::path& { return ledger_file_; }

private:
    auto flush_locked() -> infra::VoidResult;

    mutable std::mutex mutex_;
    extensions::ResumeLedger ledger_;
    const std::filesystem::path ledger_file_;
    int data_fd_;
    const std::filesystem::path data_path_;
    const std::uint64_t flush_bytes_;
    const std::chrono::milliseconds flush_interval_;

    std::uint64_t pending_bytes_ = 0;
    std::chrono::steady_clock::time_point last_flush_;
};

// Открытая передача одного файла между prepare() и finalize().
struct TransferSession {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::filesystem::path write_target; // временный файл или сам destination
    adapters::fs::FileIdentity identity{};

    adapters::fs::UniqueFd source_fd;
    adapters::fs::UniqueFd target_fd;

    std::unique_ptr<LedgerWriter> ledger; // nullptr, если resume выключен
    std::vector<extensions::ByteRange> pending; // что осталось скопировать

    bool resumed = false;
    std::uint64_t resumed_bytes = 0;
    TransferState state = TransferState::Init;

    // Digest источника по ходу копирования (только последовательный проход с нуля)
    std::optional<extensions::DigestStream> running_digest;
    std::optional<extensions::Digest> source_digest;

    std::atomic<std::uint64_t> bytes_transferred{0};

    [[nodiscard]] auto is_pending() const -> bool { return !pending.empty(); }
};

// Последовательный чанковый перенос одного файла с ledger'ом, проверкой и
// атомарной публикацией. Параллельный координатор использует те же этапы
// (prepare, copy_range, finalize), раздавая диапазоны воркерам.
class CopyEngine {
public:
    CopyEngine(const TransferOptions& options, TransferContext& context);

    /// Полный проход Init -> Completed для одного файла.
    [[nodiscard]] auto transfer_file(const std::filesystem::path& source,
                                     const std::filesystem::path& destination)
        -> infra::Result<FileOutcome>;

    /// Validating + ResumeCheck: проверка источника, загрузка ledger'а,
    /// открытие дескрипторов. `fold_digest` включает потоковый SHA-256.
    [[nodiscard]] auto prepare(const std::filesystem::path& source,
                               const std::filesystem::path& destination,
                               bool fold_digest) -> infra::Result<std::unique_ptr<TransferSession>>;

    /// Копирует [range.begin, range.end) по сетке чанков. Безопасен для
    /// одновременного вызова из нескольких потоков на непересекающихся
    /// диапазонах. Если `stop` взведён, выходит между чанками без ошибки.
    [[nodiscard]] auto copy_range(TransferSession& session,
                                  const extensions::ByteRange& range,
                                  const std::atomic<bool>* stop = nullptr) -> infra::VoidResult;

    /// Verifying + Finalizing: fsync, метаданные, проверка, rename, удаление ledger'а.
    [[nodiscard]] auto finalize(TransferSession& session, StrategyKind strategy)
        -> infra::Result<FileOutcome>;

    /// Failed/Aborted: сохраняет ledger для возобновления и возвращает ошибку.
    [[nodiscard]] auto fail(TransferSession& session, infra::Error error) -> infra::Error;

    void set_state(TransferSession& session, TransferState next) const;

    [[nodiscard]] auto options() const -> const TransferOptions& { return options_; }

private:
    [[nodiscard]] auto check_resume(TransferSession& session,
                                    const std::filesystem::path& ledger_file)
        -> infra::Result<std::optional<extensions::ResumeLedger>>;

    [[nodiscard]] auto verify_target(TransferSession& session) -> infra::Result<bool>;

    // Полностью записанный временный файл уже переименован в destination
    [[nodiscard]] auto published(const TransferSession& session) const -> bool;

    const TransferOptions& options_;
    TransferContext& context_;
};

} // namespace dcopy::core
