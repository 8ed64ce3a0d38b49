#include "move_coordinator.hpp"

#include <system_error>
#include <vector>
#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"

namespace dcopy::core {

MoveCoordinator::MoveCoordinator(CopyFn copy) : copy_(std::move(copy)) {}

auto MoveCoordinator::try_rename(const std::filesystem::path& source,
                                 const std::filesystem::path& destination)
    -> infra::Result<std::optional<FileOutcome>>
{
    if (auto res = adapters::fs::ensure_parent_dir(destination); !res) {
        return std::unexpected(std::move(res.error()));
    }

    auto renamed = adapters::fs::try_rename(source, destination);
    if (!renamed) {
        return std::unexpected(std::move(renamed.error()));
    }
    if (!*renamed) {
        spdlog::debug("{} and {} are on different filesystems", source.string(), destination.string());
        return std::optional<FileOutcome>{};
    }

    spdlog::debug("Renamed {} -> {}", source.string(), destination.string());
    return std::optional<FileOutcome>{FileOutcome{
        .source = source,
        .destination = destination,
        .status = FileStatus::Completed,
        .strategy = StrategyKind::Rename,
        .final_state = TransferState::Completed,
    }};
}

auto MoveCoordinator::move_via_copy(const std::filesystem::path& source,
                                    const std::filesystem::path& destination)
    -> infra::Result<FileOutcome>
{
    auto copied = copy_(source, destination);
    if (!copied) {
        // Источник не тронут
        return copied;
    }
    if (copied->status != FileStatus::Completed) {
        return copied;
    }
    if (!copied->verified) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            "Destination was not verified, source kept").with_path(source));
    }

    if (auto res = adapters::fs::remove_if_exists(source); !res) {
        auto err = std::move(res.error());
        err.message = "Copied and verified, but cannot remove source: " + err.message;
        return std::unexpected(std::move(err));
    }
    if (auto res = adapters::fs::sync_parent_dir(source); !res) {
        spdlog::warn("Source {} removed but its directory was not synced: {}",
                     source.string(), res.error().message);
    }

    spdlog::debug("Moved {} -> {} by copy", source.string(), destination.string());
    return copied;
}

auto MoveCoordinator::prune_empty_dirs(const std::filesystem::path& root) -> infra::VoidResult {
    std::error_code ec;
    std::vector<std::filesystem::path> children;
    for (std::filesystem::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec) && !it->is_symlink(ec)) {
            children.push_back(it->path());
        }
    }
    if (ec) {
        return std::unexpected(infra::error_from_error_code(ec, "Cannot list directory", root));
    }

    for (const auto& child : children) {
        if (auto res = prune_empty_dirs(child); !res) {
            return res;
        }
    }

    const bool empty = std::filesystem::is_empty(root, ec);
    if (ec) {
        return std::unexpected(infra::error_from_error_code(ec, "Cannot inspect directory", root));
    }
    if (empty) {
        std::filesystem::remove(root, ec);
        if (ec) {
            return std::unexpected(infra::error_from_error_code(ec, "Cannot remove directory", root));
        }
    }
    return {};
}

} // namespace dcopy::core
