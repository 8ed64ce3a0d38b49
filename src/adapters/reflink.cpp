#include "reflink.hpp"

#include <cerrno>
#include <cstring>
#include <spdlog/spdlog.h>
#include "fs.hpp"

#ifdef __linux__
    #include <linux/fs.h>
    #include <sys/ioctl.h>
#endif

namespace dcopy::adapters::reflink {

auto is_unsupported_errno(int err) -> bool {
    // EOPNOTSUPP и ENOTSUP на Linux совпадают, поэтому не switch
    return err == EOPNOTSUPP || err == ENOTSUP || err == EXDEV || err == EINVAL
        || err == ENOTTY || err == ENOSYS;
}

auto clone_into(const std::filesystem::path& source,
                const std::filesystem::path& target)
    -> infra::Result<CloneOutcome>
{
#if defined(__linux__) && defined(FICLONE)
    auto in = fs::open_source(source);
    if (!in) return std::unexpected(std::move(in.error()));

    auto out = fs::open_target(target, /*truncate=*/true);
    if (!out) return std::unexpected(std::move(out.error()));

    if (::ioctl(out->get(), FICLONE, in->get()) == 0) {
        auto synced = fs::sync_file(out->get(), target);
        if (synced) {
            synced = out->close(target);
        }
        if (!synced) {
            out->reset();
            if (auto removed = fs::remove_if_exists(target); !removed) {
                spdlog::warn("Cannot remove clone {}: {}", target.string(), removed.error().message);
            }
            return std::unexpected(std::move(synced.error()));
        }
        spdlog::debug("Reflinked {} -> {}", source.string(), target.string());
        return CloneOutcome::Cloned;
    }

    const int saved_errno = errno;
    out->reset();
    if (auto removed = fs::remove_if_exists(target); !removed) {
        spdlog::warn("Cannot remove failed clone {}: {}", target.string(), removed.error().message);
    }

    if (is_unsupported_errno(saved_errno)) {
        spdlog::debug("Reflink not supported for {}: {}", source.string(), std::strerror(saved_errno));
        return CloneOutcome::Unsupported;
    }
    return std::unexpected(infra::error_from_errno(saved_errno, "FICLONE failed", target));
#else
    (void)source;
    (void)target;
    spdlog::debug("Reflink not supported on this platform");
    return CloneOutcome::Unsupported;
#endif
}

} // namespace dcopy::adapters::reflink
