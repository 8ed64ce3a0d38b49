#include "orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <optional>
#include <system_error>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"
#include "adapters/reflink.hpp"
#include "extensions/metadata.hpp"
#include "extensions/resumer.hpp"
#include "extensions/verifier.hpp"

namespace dcopy::core {

namespace fs = adapters::fs;

// ---------------------------------------------------------------- strategies

auto RenameStrategy::attempt(const FileJob& job) -> infra::Result<Attempt> {
    auto renamed = mover_.try_rename(job.source, job.destination);
    if (!renamed) {
        return std::unexpected(std::move(renamed.error()));
    }
    if (!*renamed) {
        return Unsupported{"source and destination are on different filesystems"};
    }
    return std::move(**renamed);
}

auto MoveByCopyStrategy::attempt(const FileJob& job) -> infra::Result<Attempt> {
    auto moved = mover_.move_via_copy(job.source, job.destination);
    if (!moved) {
        return std::unexpected(std::move(moved.error()));
    }
    return std::move(*moved);
}

auto ReflinkStrategy::attempt(const FileJob& job) -> infra::Result<Attempt> {
    const bool required = options_.reflink == ReflinkPolicy::Always;
    auto unsupported = [&](std::string reason) -> infra::Result<Attempt> {
        if (required) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ReflinkUnsupported,
                fmt::format("Reflink required but unavailable: {}", reason)).with_path(job.destination));
        }
        return Unsupported{std::move(reason)};
    };

    if (options_.reflink == ReflinkPolicy::Never) {
        return Unsupported{"disabled"};
    }

    const auto ledger_file = extensions::ledger_path_for(job.destination);
    if (!required && options_.resume) {
        // Клон перезаписал бы временный файл незавершённой передачи
        auto kind = fs::entry_kind(ledger_file);
        if (!kind) {
            return std::unexpected(std::move(kind.error()));
        }
        if (*kind != fs::EntryKind::Missing) {
            return Unsupported{"unfinished chunked transfer present"};
        }
    }

    auto same = fs::same_filesystem(job.source, job.destination);
    if (!same) {
        return std::unexpected(std::move(same.error()));
    }
    if (!*same) {
        return unsupported("source and destination are on different filesystems");
    }

    if (auto res = fs::ensure_parent_dir(job.destination); !res) {
        return std::unexpected(std::move(res.error()));
    }
    const auto partial = fs::partial_path_for(job.destination);

    auto cloned = adapters::reflink::clone_into(job.source, partial);
    if (!cloned) {
        return std::unexpected(std::move(cloned.error()));
    }
    if (*cloned == adapters::reflink::CloneOutcome::Unsupported) {
        return unsupported("filesystem cannot clone this file");
    }

    auto discard = [&](infra::Error err) -> infra::Result<Attempt> {
        if (auto res = fs::remove_if_exists(partial); !res) {
            spdlog::warn("Cannot remove clone {}: {}", partial.string(), res.error().message);
        }
        return std::unexpected(std::move(err));
    };

    if (options_.preserve_metadata) {
        if (auto res = extensions::copy_metadata(job.source, partial); !res) {
            return discard(std::move(res.error()));
        }
    }

    bool verified = false;
    if (options_.verify == VerifyPolicy::Fast) {
        if (auto res = extensions::verify_fast(job.source, partial, options_.preserve_metadata); !res) {
            return discard(std::move(res.error()));
        }
        verified = true;
    } else if (options_.verify == VerifyPolicy::Full) {
        if (auto res = extensions::verify_full(job.source, partial, std::nullopt,
                                               options_.verify_block_size); !res) {
            return discard(std::move(res.error()));
        }
        verified = true;
    }

    if (auto res = fs::atomic_replace(partial, job.destination); !res) {
        return discard(std::move(res.error()));
    }
    if (auto res = extensions::cleanup_ledger(ledger_file); !res) {
        spdlog::warn("Stale ledger {} left behind: {}", ledger_file.string(), res.error().message);
    }

    context_.progress.add_bytes(job.identity.size);
    spdlog::debug("Reflinked {} -> {}", job.source.string(), job.destination.string());

    return FileOutcome{
        .source = job.source,
        .destination = job.destination,
        .status = FileStatus::Completed,
        .strategy = StrategyKind::Reflink,
        .final_state = TransferState::Completed,
        .bytes_transferred = job.identity.size,
        .verified = verified,
    };
}

auto ParallelRangesStrategy::attempt(const FileJob& job) -> infra::Result<Attempt> {
    if (!parallel_.should_split(job.identity.size)) {
        return Unsupported{"below the parallel threshold"};
    }
    auto outcome = parallel_.transfer_ranges(job.source, job.destination);
    if (!outcome) {
        return std::unexpected(std::move(outcome.error()));
    }
    return std::move(*outcome);
}

auto SequentialStrategy::attempt(const FileJob& job) -> infra::Result<Attempt> {
    auto outcome = engine_.transfer_file(job.source, job.destination);
    if (!outcome) {
        return std::unexpected(std::move(outcome.error()));
    }
    return std::move(*outcome);
}

// ---------------------------------------------------------------- run

namespace {

auto leaf_name(const std::filesystem::path& p) -> std::filesystem::path {
    auto normal = p.lexically_normal();
    if (normal.has_filename()) {
        return normal.filename();
    }
    return normal.parent_path().filename();
}

auto is_within(const std::filesystem::path& inner, const std::filesystem::path& outer) -> bool {
    std::error_code ec;
    auto a = std::filesystem::weakly_canonical(inner, ec);
    if (ec) return false;
    auto b = std::filesystem::weakly_canonical(outer, ec);
    if (ec) return false;
    auto rel = a.lexically_relative(b);
    return !rel.empty() && *rel.begin() != "..";
}

auto failed_outcome(const FileJob& job, infra::Error error) -> FileOutcome {
    const bool aborted = error.code == infra::ErrorCode::UserAborted;
    return FileOutcome{
        .source = job.source,
        .destination = job.destination,
        .status = aborted ? FileStatus::Aborted : FileStatus::Failed,
        .strategy = StrategyKind::None,
        .final_state = aborted ? TransferState::Aborted : TransferState::Failed,
        .error = std::move(error),
    };
}

// Состояние одного вызова orchestrate()
class TransferRun {
public:
    TransferRun(const TransferRequest& request, TransferOptions options,
                TransferContext& context, ConfirmSink* confirm)
        : request_(request)
        , options_(options)
        , context_(context)
        , confirm_(confirm)
        , engine_(options_, context_)
        , parallel_(options_, context_)
    {}

    auto execute() -> infra::Result<TransferResult>;

private:
    enum class Decision { Proceed, Skip };

    auto plan() -> infra::VoidResult;
    auto collect_tree(const std::filesystem::path& src_dir,
                      const std::filesystem::path& dst_dir) -> infra::VoidResult;

    auto resolve_overwrite(const FileJob& job) -> infra::Result<Decision>;
    auto copy_chain(bool allow_ranges) -> std::vector<Strategy>;
    auto run_chain(std::vector<Strategy>& chain, const FileJob& job) -> infra::Result<FileOutcome>;
    auto process_job(const FileJob& job, bool allow_ranges) -> infra::Result<FileOutcome>;
    auto run_job(const FileJob& job, bool allow_ranges) -> infra::Result<FileOutcome>;

    void record_failure(const FileJob& job, infra::Error error);

    const TransferRequest& request_;
    const TransferOptions options_;
    TransferContext& context_;
    ConfirmSink* confirm_;
    std::mutex confirm_mutex_;

    CopyEngine engine_;
    ParallelCoordinator parallel_;

    std::vector<FileJob> jobs_;
    std::vector<FileOutcome> planned_; // результаты, известные ещё до копирования
    std::vector<std::filesystem::path> moved_dirs_;
    bool single_file_ = false;
};

void TransferRun::record_failure(const FileJob& job, infra::Error error) {
    planned_.push_back(failed_outcome(job, infra::log_and_return(std::move(error))));
}

auto TransferRun::plan() -> infra::VoidResult {
    const auto& sources = request_.sources();
    const auto& destination = request_.destination();

    if (sources.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument, "No sources given"));
    }

    auto dest_kind = fs::entry_kind(destination);
    if (!dest_kind) {
        return std::unexpected(std::move(dest_kind.error()));
    }

    const bool into_dir = sources.size() > 1 || *dest_kind == fs::EntryKind::Directory;
    if (into_dir && *dest_kind != fs::EntryKind::Directory) {
        if (*dest_kind != fs::EntryKind::Missing) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                "Destination for several sources must be a directory").with_path(destination));
        }
        std::error_code ec;
        std::filesystem::create_directories(destination, ec);
        if (ec) {
            return std::unexpected(infra::error_from_error_code(ec, "Cannot create destination directory",
                                                                destination));
        }
    }

    for (const auto& source : sources) {
        const auto target = into_dir ? destination / leaf_name(source) : destination;
        const FileJob placeholder{source, target, {}};

        auto kind = fs::entry_kind(source);
        if (!kind) {
            record_failure(placeholder, std::move(kind.error()));
            continue;
        }

        switch (*kind) {
            case fs::EntryKind::Missing:
                if (sources.size() == 1) {
                    return std::unexpected(infra::make_error(infra::ErrorCode::SourceNotFound,
                        "Source does not exist").with_path(source));
                }
                record_failure(placeholder, infra::make_error(infra::ErrorCode::SourceNotFound,
                    "Source does not exist").with_path(source));
                break;

            case fs::EntryKind::Other:
                record_failure(placeholder, infra::make_error(infra::ErrorCode::IoError,
                    "Unsupported file type").with_path(source));
                break;

            case fs::EntryKind::Regular: {
                auto identity = fs::identity_of(source);
                if (!identity) {
                    record_failure(placeholder, std::move(identity.error()));
                    break;
                }
                jobs_.push_back({source, target, *identity});
                single_file_ = sources.size() == 1;
                break;
            }

            case fs::EntryKind::Directory: {
                if (!into_dir && *dest_kind == fs::EntryKind::Regular) {
                    return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                        "Cannot transfer a directory onto a file").with_path(destination));
                }
                if (is_within(target, source)) {
                    return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                        "Cannot transfer a directory into itself").with_path(target));
                }

                if (request_.mode() == TransferMode::Move) {
                    auto target_kind = fs::entry_kind(target);
                    if (!target_kind) {
                        record_failure(placeholder, std::move(target_kind.error()));
                        break;
                    }
                    if (*target_kind == fs::EntryKind::Missing) {
                        // Целиком одним rename, если каталог остаётся на той же ФС
                        MoveCoordinator mover{MoveCoordinator::CopyFn{}};
                        auto renamed = mover.try_rename(source, target);
                        if (!renamed) {
                            record_failure(placeholder, std::move(renamed.error()));
                            break;
                        }
                        if (*renamed) {
                            planned_.push_back(std::move(**renamed));
                            break;
                        }
                    }
                    moved_dirs_.push_back(source);
                }

                if (auto res = collect_tree(source, target); !res) {
                    record_failure(placeholder, std::move(res.error()));
                }
                break;
            }
        }
    }
    return {};
}

auto TransferRun::collect_tree(const std::filesystem::path& src_dir,
                               const std::filesystem::path& dst_dir) -> infra::VoidResult
{
    std::error_code ec;
    std::filesystem::create_directories(dst_dir, ec);
    if (ec) {
        return std::unexpected(infra::error_from_error_code(ec, "Cannot create directory", dst_dir));
    }

    std::vector<std::filesystem::directory_entry> entries;
    for (std::filesystem::directory_iterator it(src_dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        return std::unexpected(infra::error_from_error_code(ec, "Cannot list directory", src_dir));
    }
    std::ranges::sort(entries, {}, &std::filesystem::directory_entry::path);

    for (const auto& entry : entries) {
        const auto& src = entry.path();
        const auto dst = dst_dir / src.filename();
        const FileJob placeholder{src, dst, {}};

        auto kind = fs::entry_kind(src);
        if (!kind) {
            record_failure(placeholder, std::move(kind.error()));
            continue;
        }
        const bool is_link = entry.is_symlink(ec) && !ec;

        switch (*kind) {
            case fs::EntryKind::Regular: {
                auto identity = fs::identity_of(src);
                if (!identity) {
                    record_failure(placeholder, std::move(identity.error()));
                    break;
                }
                jobs_.push_back({src, dst, *identity});
                break;
            }
            case fs::EntryKind::Directory:
                if (is_link) {
                    spdlog::warn("Skipping symlinked directory {}", src.string());
                    planned_.push_back({.source = src, .destination = dst, .status = FileStatus::Skipped});
                    break;
                }
                if (auto res = collect_tree(src, dst); !res) {
                    record_failure(placeholder, std::move(res.error()));
                }
                break;
            case fs::EntryKind::Missing:
                spdlog::warn("Skipping dangling symlink {}", src.string());
                planned_.push_back({.source = src, .destination = dst, .status = FileStatus::Skipped});
                break;
            case fs::EntryKind::Other:
                record_failure(placeholder, infra::make_error(infra::ErrorCode::IoError,
                    "Unsupported file type").with_path(src));
                break;
        }
    }
    return {};
}

auto TransferRun::resolve_overwrite(const FileJob& job) -> infra::Result<Decision> {
    auto kind = fs::entry_kind(job.destination);
    if (!kind) {
        return std::unexpected(std::move(kind.error()));
    }
    if (*kind == fs::EntryKind::Missing) {
        return Decision::Proceed;
    }
    if (*kind == fs::EntryKind::Directory) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TargetExists,
            "Destination is a directory").with_path(job.destination));
    }

    // Без atomic незавершённая передача пишет прямо в destination. Политика
    // не применяется, только если ledger описывает сам destination.
    if (!options_.atomic && options_.resume) {
        const auto ledger_file = extensions::ledger_path_for(job.destination);
        auto ledger_kind = fs::entry_kind(ledger_file);
        if (ledger_kind && *ledger_kind == fs::EntryKind::Regular) {
            auto ledger = extensions::load_ledger(ledger_file);
            if (ledger && ledger->writes_to(job.destination)) {
                return Decision::Proceed;
            }
        }
    }

    switch (options_.overwrite) {
        case OverwritePolicy::Never:
            return std::unexpected(infra::make_error(infra::ErrorCode::TargetExists,
                "Destination exists").with_path(job.destination));

        case OverwritePolicy::Always:
            return Decision::Proceed;

        case OverwritePolicy::Smart: {
            auto existing = fs::identity_of(job.destination);
            if (!existing) {
                return std::unexpected(std::move(existing.error()));
            }
            if (job.identity.mtime_ns > existing->mtime_ns) {
                return Decision::Proceed;
            }
            spdlog::info("Skipping {}: destination is not older than source", job.destination.string());
            return Decision::Skip;
        }

        case OverwritePolicy::Prompt: {
            if (!confirm_) {
                return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                    "Overwrite policy 'prompt' needs a confirmation handler").with_path(job.destination));
            }
            ConfirmChoice choice;
            {
                // Вопросы пользователю не перемешиваются между воркерами
                std::lock_guard lock(confirm_mutex_);
                if (context_.cancel.is_cancelled()) {
                    return std::unexpected(infra::make_error(infra::ErrorCode::UserAborted,
                        "Transfer cancelled").with_path(job.destination));
                }
                choice = confirm_->confirm_overwrite(job.source, job.destination);
            }
            switch (choice) {
                case ConfirmChoice::Overwrite: return Decision::Proceed;
                case ConfirmChoice::Skip:      return Decision::Skip;
                case ConfirmChoice::Abort:
                    return std::unexpected(infra::make_error(infra::ErrorCode::UserAborted,
                        "Aborted at overwrite prompt").with_path(job.destination));
            }
            break;
        }
    }
    return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument, "Unknown overwrite policy"));
}

auto TransferRun::copy_chain(bool allow_ranges) -> std::vector<Strategy> {
    std::vector<Strategy> chain;
    if (options_.reflink != ReflinkPolicy::Never) {
        chain.emplace_back(ReflinkStrategy{options_, context_});
    }
    if (allow_ranges && options_.parallelism > 1) {
        chain.emplace_back(ParallelRangesStrategy{parallel_});
    }
    chain.emplace_back(SequentialStrategy{engine_});
    return chain;
}

auto TransferRun::run_chain(std::vector<Strategy>& chain, const FileJob& job) -> infra::Result<FileOutcome> {
    for (auto& strategy : chain) {
        auto attempt = std::visit([&job](auto& s) { return s.attempt(job); }, strategy);
        if (!attempt) {
            return std::unexpected(std::move(attempt.error()));
        }
        if (auto* outcome = std::get_if<FileOutcome>(&*attempt)) {
            return std::move(*outcome);
        }
        spdlog::debug("{}: strategy skipped ({})", job.source.string(),
                      std::get<Unsupported>(*attempt).reason);
    }
    return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
        "No transfer strategy accepted the file").with_path(job.source));
}

auto TransferRun::process_job(const FileJob& job, bool allow_ranges) -> infra::Result<FileOutcome> {
    if (context_.cancel.is_cancelled()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::UserAborted,
            "Transfer cancelled").with_path(job.destination));
    }

    auto decision = resolve_overwrite(job);
    if (!decision) {
        return std::unexpected(std::move(decision.error()));
    }
    if (*decision == Decision::Skip) {
        return FileOutcome{
            .source = job.source,
            .destination = job.destination,
            .status = FileStatus::Skipped,
        };
    }

    if (request_.mode() == TransferMode::Copy) {
        auto chain = copy_chain(allow_ranges);
        return run_chain(chain, job);
    }

    MoveCoordinator mover([this, allow_ranges, &job](const std::filesystem::path& src,
                                                    const std::filesystem::path& dst) {
        auto chain = copy_chain(allow_ranges);
        return run_chain(chain, FileJob{src, dst, job.identity});
    });
    std::vector<Strategy> chain;
    chain.emplace_back(RenameStrategy{mover});
    chain.emplace_back(MoveByCopyStrategy{mover});
    return run_chain(chain, job);
}

auto TransferRun::run_job(const FileJob& job, bool allow_ranges) -> infra::Result<FileOutcome> {
    auto outcome = process_job(job, allow_ranges);
    context_.progress.file_done();
    if (!outcome) {
        return std::unexpected(infra::log_and_return(std::move(outcome.error())));
    }
    return outcome;
}

auto TransferRun::execute() -> infra::Result<TransferResult> {
    const auto started = std::chrono::steady_clock::now();

    if (auto res = plan(); !res) {
        return std::unexpected(std::move(res.error()));
    }

    if (options_.fail_fast) {
        for (const auto& outcome : planned_) {
            if (outcome.status == FileStatus::Failed && outcome.error) {
                return std::unexpected(*outcome.error);
            }
        }
    }

    std::uint64_t total_bytes = 0;
    for (const auto& job : jobs_) {
        total_bytes += job.identity.size;
    }
    context_.progress.set_total(jobs_.size(), total_bytes);
    spdlog::debug("Planned {} files ({} bytes)", jobs_.size(), total_bytes);

    std::vector<std::optional<infra::Result<FileOutcome>>> slots;
    if (jobs_.size() > 1 && options_.parallelism > 1) {
        slots = parallel_.run_files(jobs_, [this](const FileJob& job) {
            return run_job(job, /*allow_ranges=*/false);
        });
    } else {
        bool halted = false;
        for (const auto& job : jobs_) {
            if (halted || context_.cancel.is_cancelled()) {
                slots.emplace_back(std::nullopt);
                continue;
            }
            auto res = run_job(job, /*allow_ranges=*/true);
            if (!res && (options_.fail_fast || res.error().code == infra::ErrorCode::UserAborted)) {
                halted = true;
            }
            slots.emplace_back(std::move(res));
        }
    }

    TransferResult result;
    result.files = std::move(planned_);
    for (std::size_t i = 0; i < jobs_.size(); ++i) {
        auto& slot = slots[i];
        if (!slot) {
            auto outcome = failed_outcome(jobs_[i], infra::make_error(infra::ErrorCode::UserAborted,
                "Not started").with_path(jobs_[i].destination));
            outcome.final_state = TransferState::Init;
            result.files.push_back(std::move(outcome));
        } else if (*slot) {
            result.files.push_back(std::move(**slot));
        } else {
            result.files.push_back(failed_outcome(jobs_[i], std::move(slot->error())));
        }
    }

    if (request_.mode() == TransferMode::Move) {
        for (const auto& dir : moved_dirs_) {
            if (auto res = MoveCoordinator::prune_empty_dirs(dir); !res) {
                spdlog::warn("Source directory {} not fully removed: {}", dir.string(), res.error().message);
            }
        }
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    bool any_completed = false;
    bool all_verified = true;
    for (const auto& f : result.files) {
        result.bytes_transferred += f.bytes_transferred;
        if (f.status == FileStatus::Completed) {
            any_completed = true;
            all_verified = all_verified && f.verified;
        }
    }
    result.verified = any_completed && all_verified;

    spdlog::info("Done in {} ms: {} completed, {} skipped, {} failed, {} bytes written",
                 result.elapsed.count(), result.count(FileStatus::Completed),
                 result.count(FileStatus::Skipped), result.count(FileStatus::Failed),
                 result.bytes_transferred);

    const auto stats = context_.progress.get_stats();
    spdlog::debug("Progress: {}/{} files, {}/{} bytes, {:.1f} MiB/s at the end",
                  stats.processed_files, stats.total_files,
                  stats.processed_bytes, stats.total_bytes,
                  stats.throughput_bps / (1024.0 * 1024.0));

    // Отмена важнее остальных ошибок
    for (const auto& f : result.files) {
        if (f.status == FileStatus::Aborted && f.final_state != TransferState::Init && f.error) {
            return std::unexpected(*f.error);
        }
    }
    if (context_.cancel.is_cancelled()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::UserAborted, "Transfer cancelled"));
    }

    if (single_file_ || options_.fail_fast) {
        for (const auto& f : result.files) {
            if (f.status == FileStatus::Failed && f.error) {
                return std::unexpected(*f.error);
            }
        }
    }
    return result;
}

} // namespace

// ---------------------------------------------------------------- Orchestrator

Orchestrator::Orchestrator(const infra::CancelToken& cancel, SourceReadHook on_source_read)
    : cancel_(cancel), on_source_read_(std::move(on_source_read)) {}

auto Orchestrator::orchestrate(const TransferRequest& request,
                               infra::ProgressSink* progress,
                               ConfirmSink* confirm) -> infra::Result<TransferResult>
{
    if (auto res = request.options().validate(); !res) {
        return std::unexpected(std::move(res.error()));
    }

    auto options = request.options();
    if (request.mode() == TransferMode::Move && options.verify == VerifyPolicy::None) {
        // Источник удаляется только после проверки копии
        spdlog::info("Move requested with verify=none, using fast verification");
        options.verify = VerifyPolicy::Fast;
    }

    infra::ProgressAggregator aggregator(progress);
    TransferContext context{aggregator, cancel_, on_source_read_};

    TransferRun run(request, options, context, confirm);
    return run.execute();
}

} // namespace dcopy::core
