#include "transfer_types.hpp"

#include <algorithm>
#include <fmt/core.h>

namespace dcopy::core {

auto to_string(OverwritePolicy policy) -> std::string_view {
    switch (policy) {
        case OverwritePolicy::Never:  return "never";
        case OverwritePolicy::Prompt: return "prompt";
        case OverwritePolicy::Always: return "always";
        case OverwritePolicy::Smart:  return "smart";
    }
    return "unknown";
}

auto to_string(VerifyPolicy policy) -> std::string_view {
    switch (policy) {
        case VerifyPolicy::None: return "none";
        case VerifyPolicy::Fast: return "fast";
        case VerifyPolicy::Full: return "full";
    }
    return "unknown";
}

auto to_string(ReflinkPolicy policy) -> std::string_view {
    switch (policy) {
        case ReflinkPolicy::Auto:   return "auto";
        case ReflinkPolicy::Always: return "always";
        case ReflinkPolicy::Never:  return "never";
    }
    return "unknown";
}

auto parse_overwrite_policy(std::string_view text) -> infra::Result<OverwritePolicy> {
    if (text == "never")  return OverwritePolicy::Never;
    if (text == "prompt") return OverwritePolicy::Prompt;
    if (text == "always") return OverwritePolicy::Always;
    if (text == "smart")  return OverwritePolicy::Smart;
    return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
        fmt::format("Unknown overwrite policy '{}' (expected never|prompt|always|smart)", text)));
}

auto parse_verify_policy(std::string_view text) -> infra::Result<VerifyPolicy> {
    if (text == "none") return VerifyPolicy::None;
    if (text == "fast") return VerifyPolicy::Fast;
    if (text == "full") return VerifyPolicy::Full;
    return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
        fmt::format("Unknown verify policy '{}' (expected none|fast|full)", text)));
}

auto parse_reflink_policy(std::string_view text) -> infra::Result<ReflinkPolicy> {
    if (text == "auto")   return ReflinkPolicy::Auto;
    if (text == "always") return ReflinkPolicy::Always;
    if (text == "never")  return ReflinkPolicy::Never;
    return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
        fmt::format("Unknown reflink policy '{}' (expected auto|always|never)", text)));
}

auto TransferOptions::validate() const -> infra::VoidResult {
    if (chunk_size == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            "chunk_size must be greater than zero"));
    }
    if (parallelism == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            "parallelism must be at least 1"));
    }
    if (verify_block_size == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            "verify_block_size must be greater than zero"));
    }
    if (ledger_flush_interval.count() < 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            "ledger_flush_interval must not be negative"));
    }
    return {};
}

auto options_from_config(const infra::Config& config) -> infra::Result<TransferOptions> {
    TransferOptions opts{};
    if (config.overwrite) {
        auto p = parse_overwrite_policy(*config.overwrite);
        if (!p) return std::unexpected(std::move(p.error()));
        opts.overwrite = *p;
    }
    if (config.verify) {
        auto p = parse_verify_policy(*config.verify);
        if (!p) return std::unexpected(std::move(p.error()));
        opts.verify = *p;
    }
    if (config.reflink) {
        auto p = parse_reflink_policy(*config.reflink);
        if (!p) return std::unexpected(std::move(p.error()));
        opts.reflink = *p;
    }
    if (config.parallel) opts.parallelism = *config.parallel;
    if (config.chunk_size) opts.chunk_size = static_cast<std::size_t>(*config.chunk_size);
    if (config.resume) opts.resume = *config.resume;
    if (config.atomic) opts.atomic = *config.atomic;
    if (config.fail_fast) opts.fail_fast = *config.fail_fast;
    if (config.preserve_metadata) opts.preserve_metadata = *config.preserve_metadata;
    if (config.chunk_checksums) opts.chunk_checksums = *config.chunk_checksums;
    if (config.parallel_threshold) opts.parallel_threshold = *config.parallel_threshold;
    if (config.ledger_flush_bytes) opts.ledger_flush_bytes = *config.ledger_flush_bytes;
    if (config.ledger_flush_interval_ms) {
        opts.ledger_flush_interval = std::chrono::milliseconds(*config.ledger_flush_interval_ms);
    }
    return opts;
}

TransferRequest::TransferRequest(std::vector<std::filesystem::path> sources,
                                 std::filesystem::path destination,
                                 TransferOptions options,
                                 TransferMode mode)
    : sources_(std::move(sources))
    , destination_(std::move(destination))
    , options_(options)
    , mode_(mode)
{}

auto to_string(TransferState state) -> std::string_view {
    switch (state) {
        case TransferState::Init:        return "Init";
        case TransferState::Validating:  return "Validating";
        case TransferState::ResumeCheck: return "ResumeCheck";
        case TransferState::Copying:     return "Copying";
        case TransferState::Verifying:   return "Verifying";
        case TransferState::Finalizing:  return "Finalizing";
        case TransferState::Completed:   return "Completed";
        case TransferState::Failed:      return "Failed";
        case TransferState::Aborted:     return "Aborted";
    }
    return "Unknown";
}

auto to_string(StrategyKind kind) -> std::string_view {
    switch (kind) {
        case StrategyKind::None:           return "none";
        case StrategyKind::Rename:         return "rename";
        case StrategyKind::Reflink:        return "reflink";
        case StrategyKind::ParallelRanges: return "parallel";
        case StrategyKind::Sequential:     return "sequential";
    }
    return "unknown";
}

auto TransferResult::count(FileStatus status) const -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(files,
        [status](const FileOutcome& f) { return f.status == status; }));
}

auto TransferResult::first_error() const -> const infra::Error* {
    for (const auto& f : files) {
        if (f.error) return &*f.error;
    }
    return nullptr;
}

} // namespace dcopy::core
