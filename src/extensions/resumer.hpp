// src/extensions/resumer.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "adapters/fs.hpp"
#include "infra/error_handler/error.hpp"

namespace dcopy::extensions {

inline constexpr int kLedgerVersion = 1;

struct ChunkRecord {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    std::optional<std::string> checksum; // xxh64 hex

    [[nodiscard]] auto end() const -> std::uint64_t { return offset + length; }
};

// Полуоткрытый интервал [begin, end)
struct ByteRange {
    std::uint64_t begin = 0;
    std::uint64_t end = 0;

    [[nodiscard]] auto length() const -> std::uint64_t { return end - begin; }
    bool operator==(const ByteRange&) const = default;
};

// Какие байты временного файла уже гарантированно на диске.
// Записи отсортированы по offset и не пересекаются.
struct ResumeLedger {
    int version = kLedgerVersion;
    std::filesystem::path source_path;
    std::filesystem::path destination_path;
    std::filesystem::path write_target; // временный файл или сам destination при --no-atomic
    std::uint64_t total_size = 0;
    adapters::fs::FileIdentity source_identity{};
    std::vector<ChunkRecord> chunks;
    std::string updated_at;

    [[nodiscard]] static auto create(const std::filesystem::path& source,
                                     const std::filesystem::path& destination,
                                     const std::filesystem::path& write_target,
                                     const adapters::fs::FileIdentity& identity) -> ResumeLedger;

    /// Описывает ли ledger именно этот файл (пути сравниваются в абсолютной форме).
    [[nodiscard]] auto writes_to(const std::filesystem::path& target) const -> bool;

    [[nodiscard]] auto covered_bytes() const -> std::uint64_t;

    /// Конец непрерывного покрытого префикса, т.е. начало первой дыры.
    [[nodiscard]] auto first_unwritten_offset() const -> std::uint64_t;

    [[nodiscard]] auto missing_ranges() const -> std::vector<ByteRange>;

    [[nodiscard]] auto is_complete() const -> bool;

    /// Вставка с сохранением порядка; пересечение считается ошибкой.
    [[nodiscard]] auto add(ChunkRecord record) -> infra::VoidResult;

    void touch();
};

/// `<destination>.dcopy.state` рядом с целевым файлом
[[nodiscard]] auto ledger_path_for(const std::filesystem::path& destination) -> std::filesystem::path;

[[nodiscard]] auto load_ledger(const std::filesystem::path& ledger_file)
    -> infra::Result<ResumeLedger>;

/// temp + fsync + rename: падение посреди записи не портит прежний ledger
[[nodiscard]] auto save_ledger(const ResumeLedger& ledger,
                               const std::filesystem::path& ledger_file) -> infra::VoidResult;

[[nodiscard]] auto validate_ledger(const ResumeLedger& ledger) -> infra::VoidResult;

[[nodiscard]] auto cleanup_ledger(const std::filesystem::path& ledger_file) -> infra::VoidResult;

/// Удаляет ledger и временный файл, чтобы следующий запуск начал заново.
[[nodiscard]] auto discard_resume_state(const std::filesystem::path& destination) -> infra::VoidResult;

} // namespace dcopy::extensions
