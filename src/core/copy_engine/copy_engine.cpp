#include "copy_engine.hpp"

#include <algorithm>
#include <span>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "extensions/metadata.hpp"
#include "infra/hash/xxhash_checksum.hpp"

namespace dcopy::core {

namespace fs = adapters::fs;

namespace {

std::filesystem::path absolute_or_same(const std::filesystem::path& p) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(p, ec);
    return ec ? p : abs.lexically_normal();
}

infra::Error invalid_resume(std::string_view why, const std::filesystem::path& path) {
    return infra::make_error(infra::ErrorCode::InvalidResumeState, why).with_path(path);
}

} // namespace

// ---------------------------------------------------------------- LedgerWriter

LedgerWriter::LedgerWriter(extensions::ResumeLedger ledger,
                           std::filesystem::path ledger_file,
                           int data_fd,
                           std::filesystem::path data_path,
                           std::uint64_t flush_bytes,
                           std::chrono::milliseconds flush_interval)
    : ledger_(std::move(ledger))
    , ledger_file_(std::move(ledger_file))
    , data_fd_(data_fd)
    , data_path_(std::move(data_path))
    , flush_bytes_(flush_bytes)
    , flush_interval_(flush_interval)
    , last_flush_(std::chrono::steady_clock::now())
{}

auto LedgerWriter::record(extensions::ChunkRecord chunk) -> infra::VoidResult {
    std::lock_guard lock(mutex_);
    const auto length = chunk.length;
    if (auto res = ledger_.add(std::move(chunk)); !res) {
        return res;
    }
    pending_bytes_ += length;

    const auto now = std::chrono::steady_clock::now();
    if (pending_bytes_ >= flush_bytes_ || now - last_flush_ >= flush_interval_) {
        return flush_locked();
    }
    return {};
}

auto LedgerWriter::flush() -> infra::VoidResult {
    std::lock_guard lock(mutex_);
    return flush_locked();
}

void LedgerWriter::detach_data() {
    std::lock_guard lock(mutex_);
    data_fd_ = -1;
}

auto LedgerWriter::flush_locked() -> infra::VoidResult {
    if (data_fd_ >= 0) {
        if (auto res = fs::sync_data(data_fd_, data_path_); !res) {
            return res;
        }
    }
    ledger_.touch();
    if (auto res = extensions::save_ledger(ledger_, ledger_file_); !res) {
        return res;
    }
    pending_bytes_ = 0;
    last_flush_ = std::chrono::steady_clock::now();
    spdlog::trace("Ledger {} saved ({} records)", ledger_file_.string(), ledger_.chunks.size());
    return {};
}

auto LedgerWriter::snapshot() const -> extensions::ResumeLedger {
    std::lock_guard lock(mutex_);
    return ledger_;
}

auto LedgerWriter::is_complete() const -> bool {
    std::lock_guard lock(mutex_);
    return ledger_.is_complete();
}

auto LedgerWriter::missing_ranges() const -> std::vector<extensions::ByteRange> {
    std::lock_guard lock(mutex_);
    return ledger_.missing_ranges();
}

// ---------------------------------------------------------------- CopyEngine

CopyEngine::CopyEngine(const TransferOptions& options, TransferContext& context)
    : options_(options), context_(context) {}

void CopyEngine::set_state(TransferSession& session, TransferState next) const {
    spdlog::debug("{}: {} -> {}", session.destination.filename().string(),
                  to_string(session.state), to_string(next));
    session.state = next;
}

auto CopyEngine::transfer_file(const std::filesystem::path& source,
                               const std::filesystem::path& destination)
    -> infra::Result<FileOutcome>
{
    auto prepared = prepare(source, destination, /*fold_digest=*/true);
    if (!prepared) {
        return std::unexpected(std::move(prepared.error()));
    }
    auto& session = **prepared;

    set_state(session, TransferState::Copying);

    // Пустой файл: одна завершённая запись нулевой длины
    if (session.identity.size == 0 && session.ledger && !session.ledger->is_complete()) {
        if (auto res = session.ledger->record({0, 0, std::nullopt}); !res) {
            return std::unexpected(fail(session, std::move(res.error())));
        }
    }

    for (const auto& range : session.pending) {
        if (auto res = copy_range(session, range); !res) {
            return std::unexpected(fail(session, std::move(res.error())));
        }
    }

    return finalize(session, StrategyKind::Sequential);
}

auto CopyEngine::prepare(const std::filesystem::path& source,
                         const std::filesystem::path& destination,
                         bool fold_digest)
    -> infra::Result<std::unique_ptr<TransferSession>>
{
    auto session = std::make_unique<TransferSession>();
    session->source = source;
    session->destination = destination;

    auto failed = [&](infra::Error err) {
        set_state(*session, TransferState::Failed);
        return std::unexpected(std::move(err));
    };

    set_state(*session, TransferState::Validating);

    auto kind = fs::entry_kind(source);
    if (!kind) {
        return failed(std::move(kind.error()));
    }
    switch (*kind) {
        case fs::EntryKind::Missing:
            return failed(infra::make_error(infra::ErrorCode::SourceNotFound, "Source does not exist").with_path(source));
        case fs::EntryKind::Directory:
            return failed(infra::make_error(infra::ErrorCode::SourceIsDirectory, "Expected a regular file").with_path(source));
        case fs::EntryKind::Other:
            return failed(infra::make_error(infra::ErrorCode::IoError, "Source is not a regular file").with_path(source));
        case fs::EntryKind::Regular:
            break;
    }

    auto identity = fs::identity_of(source);
    if (!identity) {
        return failed(std::move(identity.error()));
    }
    session->identity = *identity;

    if (auto res = fs::ensure_parent_dir(destination); !res) {
        return failed(std::move(res.error()));
    }
    session->write_target = options_.atomic ? fs::partial_path_for(destination) : destination;

    set_state(*session, TransferState::ResumeCheck);

    const auto ledger_file = extensions::ledger_path_for(destination);
    std::optional<extensions::ResumeLedger> existing;
    if (options_.resume) {
        auto checked = check_resume(*session, ledger_file);
        if (!checked) {
            return failed(std::move(checked.error()));
        }
        existing = std::move(*checked);
    }
    session->resumed = existing.has_value();

    auto src_fd = fs::open_source(source);
    if (!src_fd) {
        return failed(std::move(src_fd.error()));
    }
    session->source_fd = std::move(*src_fd);

    // Без ledger'а прежнее содержимое временного файла ничего не значит
    auto dst_fd = fs::open_target(session->write_target, /*truncate=*/!session->resumed);
    if (!dst_fd) {
        return failed(std::move(dst_fd.error()));
    }
    session->target_fd = std::move(*dst_fd);

    const auto total = session->identity.size;
    if (options_.resume) {
        auto ledger = existing
            ? std::move(*existing)
            : extensions::ResumeLedger::create(absolute_or_same(source),
                                               absolute_or_same(destination),
                                               absolute_or_same(session->write_target),
                                               session->identity);
        session->resumed_bytes = ledger.covered_bytes();
        session->pending = ledger.missing_ranges();
        const auto resume_from = ledger.first_unwritten_offset();

        session->ledger = std::make_unique<LedgerWriter>(
            std::move(ledger), ledger_file, session->target_fd.get(), session->write_target,
            options_.ledger_flush_bytes, options_.ledger_flush_interval);

        if (session->resumed) {
            spdlog::info("Resuming {} at offset {} ({} of {} bytes already on disk)",
                         destination.string(), resume_from, session->resumed_bytes, total);
        } else if (auto res = session->ledger->flush(); !res) {
            return failed(std::move(res.error()));
        }
    } else if (total > 0) {
        session->pending.push_back({0, total});
    }

    if (fold_digest && options_.verify == VerifyPolicy::Full && !session->resumed) {
        session->running_digest.emplace();
    }

    return session;
}

auto CopyEngine::check_resume(TransferSession& session,
                              const std::filesystem::path& ledger_file)
    -> infra::Result<std::optional<extensions::ResumeLedger>>
{
    auto kind = fs::entry_kind(ledger_file);
    if (!kind) {
        return std::unexpected(std::move(kind.error()));
    }
    if (*kind == fs::EntryKind::Missing) {
        return std::optional<extensions::ResumeLedger>{};
    }

    auto ledger = extensions::load_ledger(ledger_file);
    if (!ledger) {
        return std::unexpected(std::move(ledger.error()));
    }
    if (auto res = extensions::validate_ledger(*ledger); !res) {
        return std::unexpected(std::move(res.error()));
    }

    if (ledger->source_identity != session.identity) {
        return std::unexpected(invalid_resume(
            fmt::format("Source changed since the ledger was written "
                        "(size {} -> {}, mtime_ns {} -> {})",
                        ledger->source_identity.size, session.identity.size,
                        ledger->source_identity.mtime_ns, session.identity.mtime_ns),
            session.source));
    }
    if (ledger->source_path != absolute_or_same(session.source)) {
        return std::unexpected(invalid_resume(
            fmt::format("Ledger belongs to a different source: {}", ledger->source_path.string()),
            ledger_file));
    }
    if (ledger->destination_path != absolute_or_same(session.destination)) {
        return std::unexpected(invalid_resume(
            fmt::format("Ledger was written for {}", ledger->destination_path.string()),
            ledger_file));
    }
    // Ledger атомарного запуска описывает временный файл, а не destination, и наоборот
    if (!ledger->writes_to(session.write_target)) {
        return std::unexpected(invalid_resume(
            fmt::format("Ledger describes {}, this run writes {}",
                        ledger->write_target.string(), session.write_target.string()),
            ledger_file));
    }

    auto partial_kind = fs::entry_kind(session.write_target);
    if (!partial_kind) {
        return std::unexpected(std::move(partial_kind.error()));
    }
    if (*partial_kind != fs::EntryKind::Regular) {
        return std::unexpected(invalid_resume("Ledger exists but the partial file is missing",
                                              session.write_target));
    }

    std::uint64_t covered_end = 0;
    for (const auto& chunk : ledger->chunks) {
        covered_end = std::max(covered_end, chunk.end());
    }

    std::error_code ec;
    const auto partial_size = std::filesystem::file_size(session.write_target, ec);
    if (ec) {
        return std::unexpected(infra::error_from_error_code(ec, "Cannot stat partial file",
                                                            session.write_target));
    }
    if (partial_size < covered_end) {
        return std::unexpected(invalid_resume(
            fmt::format("Partial file holds {} bytes, ledger claims {}", partial_size, covered_end),
            session.write_target));
    }

    const bool has_checksums = std::ranges::any_of(ledger->chunks,
        [](const extensions::ChunkRecord& c) { return c.checksum.has_value(); });
    if (has_checksums) {
        auto partial = fs::open_source(session.write_target);
        if (!partial) {
            return std::unexpected(std::move(partial.error()));
        }
        for (const auto& chunk : ledger->chunks) {
            if (!chunk.checksum || chunk.length == 0) continue;
            auto actual = infra::XXHashChecksum::hash_range(partial->get(), chunk.offset,
                                                            chunk.length, session.write_target);
            if (!actual) {
                return std::unexpected(std::move(actual.error()));
            }
            if (*actual != *chunk.checksum) {
                return std::unexpected(invalid_resume(
                    fmt::format("Chunk checksum mismatch (expected {}, found {})", *chunk.checksum, *actual),
                    session.write_target).with_offset(chunk.offset));
            }
        }
    }

    return std::optional<extensions::ResumeLedger>{std::move(*ledger)};
}

auto CopyEngine::copy_range(TransferSession& session,
                            const extensions::ByteRange& range,
                            const std::atomic<bool>* stop) -> infra::VoidResult
{
    if (range.length() == 0) {
        return {};
    }

    const std::uint64_t chunk = options_.chunk_size;
    std::vector<char> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(chunk, range.length())));

    std::uint64_t offset = range.begin;
    while (offset < range.end) {
        if (context_.cancel.is_cancelled()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::UserAborted, "Transfer cancelled")
                    .with_path(session.destination)
                    .with_offset(offset));
        }
        if (stop && stop->load(std::memory_order_acquire)) {
            return {};
        }

        // Границы чанков кратны chunk_size от нуля файла
        const auto len = static_cast<std::size_t>(
            std::min(chunk - offset % chunk, range.end - offset));
        std::span<char> view(buffer.data(), len);

        auto got = fs::read_at(session.source_fd.get(), view, offset, session.source);
        if (!got) {
            return std::unexpected(std::move(got.error()));
        }
        if (context_.on_source_read) {
            context_.on_source_read(offset, len);
        }
        if (*got != len) {
            return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
                fmt::format("Source shrank during transfer ({} of {} bytes read)", *got, len))
                    .with_path(session.source)
                    .with_offset(offset));
        }

        if (session.running_digest) {
            if (auto res = session.running_digest->update(view); !res) {
                return res;
            }
        }

        if (auto res = fs::write_at(session.target_fd.get(), view, offset, session.write_target); !res) {
            return res;
        }

        if (session.ledger) {
            std::optional<std::string> checksum;
            if (options_.chunk_checksums) {
                checksum = infra::XXHashChecksum::hash_buffer(view);
            }
            if (auto res = session.ledger->record({offset, len, std::move(checksum)}); !res) {
                return res;
            }
        }

        session.bytes_transferred.fetch_add(len, std::memory_order_relaxed);
        context_.progress.add_bytes(len);
        offset += len;
    }
    return {};
}

auto CopyEngine::verify_target(TransferSession& session) -> infra::Result<bool> {
    switch (options_.verify) {
        case VerifyPolicy::None:
            return false;
        case VerifyPolicy::Fast:
            if (auto res = extensions::verify_fast(session.source, session.write_target,
                                                   options_.preserve_metadata); !res) {
                return std::unexpected(std::move(res.error()));
            }
            return true;
        case VerifyPolicy::Full:
            if (session.running_digest && !session.source_digest) {
                auto digest = session.running_digest->finish();
                if (!digest) {
                    return std::unexpected(std::move(digest.error()));
                }
                session.source_digest = *digest;
                session.running_digest.reset();
            }
            if (auto res = extensions::verify_full(session.source, session.write_target,
                                                   session.source_digest,
                                                   options_.verify_block_size); !res) {
                return std::unexpected(std::move(res.error()));
            }
            return true;
    }
    return false;
}

auto CopyEngine::finalize(TransferSession& session, StrategyKind strategy)
    -> infra::Result<FileOutcome>
{
    if (session.ledger && !session.ledger->is_complete()) {
        return std::unexpected(fail(session, infra::make_error(infra::ErrorCode::IoError,
            "Transfer stopped before all chunks were written").with_path(session.destination)));
    }

    if (session.ledger) {
        if (auto res = session.ledger->flush(); !res) {
            return std::unexpected(fail(session, std::move(res.error())));
        }
    }
    if (auto res = fs::sync_file(session.target_fd.get(), session.write_target); !res) {
        return std::unexpected(fail(session, std::move(res.error())));
    }
    if (session.ledger) {
        session.ledger->detach_data();
    }
    if (auto res = session.target_fd.close(session.write_target); !res) {
        return std::unexpected(fail(session, std::move(res.error())));
    }
    session.source_fd.reset();

    if (options_.preserve_metadata) {
        if (auto res = extensions::copy_metadata(session.source, session.write_target); !res) {
            return std::unexpected(fail(session, std::move(res.error())));
        }
    }

    bool verified = false;
    if (options_.verify != VerifyPolicy::None) {
        set_state(session, TransferState::Verifying);
        auto checked = verify_target(session);
        if (!checked) {
            return std::unexpected(fail(session, std::move(checked.error())));
        }
        verified = *checked;
    }

    set_state(session, TransferState::Finalizing);
    if (options_.atomic) {
        if (auto res = fs::atomic_replace(session.write_target, session.destination); !res) {
            return std::unexpected(fail(session, std::move(res.error())));
        }
    } else if (auto res = fs::sync_parent_dir(session.destination); !res) {
        return std::unexpected(fail(session, std::move(res.error())));
    }

    if (session.ledger) {
        if (auto res = extensions::cleanup_ledger(session.ledger->ledger_file()); !res) {
            spdlog::warn("Transfer finished but ledger {} was not removed: {}",
                         session.ledger->ledger_file().string(), res.error().message);
        }
    }

    set_state(session, TransferState::Completed);

    const auto bytes = session.bytes_transferred.load(std::memory_order_relaxed);
    spdlog::debug("{} -> {}: {} bytes via {}{}", session.source.string(), session.destination.string(),
                  bytes, to_string(strategy), session.resumed ? " (resumed)" : "");

    return FileOutcome{
        .source = session.source,
        .destination = session.destination,
        .status = FileStatus::Completed,
        .strategy = strategy,
        .final_state = TransferState::Completed,
        .bytes_transferred = bytes,
        .verified = verified,
        .resumed = session.resumed,
        .error = std::nullopt,
    };
}

auto CopyEngine::published(const TransferSession& session) const -> bool {
    if (!options_.atomic || !session.ledger || !session.ledger->is_complete()) {
        return false;
    }
    auto partial = fs::entry_kind(session.write_target);
    auto target = fs::entry_kind(session.destination);
    return partial && *partial == fs::EntryKind::Missing
        && target && *target == fs::EntryKind::Regular;
}

auto CopyEngine::fail(TransferSession& session, infra::Error error) -> infra::Error {
    const bool aborted = error.code == infra::ErrorCode::UserAborted;
    set_state(session, aborted ? TransferState::Aborted : TransferState::Failed);

    if (session.ledger && published(session)) {
        // rename уже прошёл (например, не удался только fsync каталога):
        // файл на месте, а полный ledger без временного файла лишь сломал бы resume
        if (auto res = extensions::cleanup_ledger(session.ledger->ledger_file()); !res) {
            spdlog::warn("Cannot remove ledger {}: {}",
                         session.ledger->ledger_file().string(), res.error().message);
        }
    } else if (session.ledger) {
        // Сохраняем всё, что успели записать, чтобы следующий запуск продолжил
        if (auto res = session.ledger->flush(); !res) {
            spdlog::warn("Cannot save resume ledger for {}: {}",
                         session.destination.string(), res.error().message);
        } else {
            spdlog::info("Resume state kept for {} ({} records)",
                         session.destination.string(), session.ledger->snapshot().chunks.size());
        }
    } else if (options_.atomic) {
        // Без ledger'а временный файл возобновить нельзя
        session.target_fd.reset();
        if (auto res = fs::remove_if_exists(session.write_target); !res) {
            spdlog::warn("Cannot remove partial file {}: {}",
                         session.write_target.string(), res.error().message);
        }
    }

    if (error.path.empty()) {
        error.path = session.destination;
    }
    return error;
}

} // namespace dcopy::core
