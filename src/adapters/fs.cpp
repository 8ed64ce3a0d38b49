#include "fs.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fmt/core.h>

namespace dcopy::adapters::fs {

namespace {

constexpr mode_t kCreateMode = 0644;

std::int64_t mtime_ns_of(const struct stat& st) {
    return static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1'000'000'000LL
         + static_cast<std::int64_t>(st.st_mtim.tv_nsec);
}

} // namespace

void UniqueFd::reset(int fd) noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

auto UniqueFd::close(const std::filesystem::path& path) -> infra::VoidResult {
    if (fd_ < 0) {
        return {};
    }
    int fd = release();
    if (::close(fd) != 0) {
        return std::unexpected(infra::error_from_errno(errno, "close failed", path));
    }
    return {};
}

auto entry_kind(const std::filesystem::path& path) -> infra::Result<EntryKind> {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return EntryKind::Missing;
        }
        return std::unexpected(infra::error_from_errno(errno, "stat failed", path));
    }
    if (S_ISREG(st.st_mode)) return EntryKind::Regular;
    if (S_ISDIR(st.st_mode)) return EntryKind::Directory;
    return EntryKind::Other;
}

auto identity_of(const std::filesystem::path& path) -> infra::Result<FileIdentity> {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        const int saved_errno = errno;
        auto err = infra::error_from_errno(saved_errno, "stat failed", path);
        if (saved_errno == ENOENT) {
            err.code = infra::ErrorCode::SourceNotFound;
        }
        return std::unexpected(std::move(err));
    }
    return FileIdentity{
        .size = static_cast<std::uint64_t>(st.st_size),
        .mtime_ns = mtime_ns_of(st),
    };
}

auto open_source(const std::filesystem::path& path) -> infra::Result<UniqueFd> {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int saved_errno = errno;
        auto err = infra::error_from_errno(saved_errno, "Cannot open source", path);
        err.code = infra::code_from_errno(saved_errno, /*missing_is_source=*/true);
        return std::unexpected(std::move(err));
    }
    return UniqueFd{fd};
}

auto open_target(const std::filesystem::path& path, bool truncate) -> infra::Result<UniqueFd> {
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    if (truncate) {
        flags |= O_TRUNC;
    }
    int fd = ::open(path.c_str(), flags, kCreateMode);
    if (fd < 0) {
        return std::unexpected(infra::error_from_errno(errno, "Cannot open destination", path));
    }
    return UniqueFd{fd};
}

auto read_at(int fd, std::span<char> buffer, std::uint64_t offset,
             const std::filesystem::path& path) -> infra::Result<std::size_t> {
    std::size_t done = 0;
    while (done < buffer.size()) {
        ssize_t n = ::pread(fd, buffer.data() + done, buffer.size() - done,
                            static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::error_from_errno(errno, "Read error", path, offset + done));
        }
        if (n == 0) {
            break; // EOF
        }
        done += static_cast<std::size_t>(n);
    }
    return done;
}

auto write_at(int fd, std::span<const char> buffer, std::uint64_t offset,
              const std::filesystem::path& path) -> infra::VoidResult {
    std::size_t done = 0;
    while (done < buffer.size()) {
        ssize_t n = ::pwrite(fd, buffer.data() + done, buffer.size() - done,
                             static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::error_from_errno(errno, "Write error", path, offset + done));
        }
        if (n == 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
                "Write returned zero bytes").with_path(path).with_offset(offset + done));
        }
        done += static_cast<std::size_t>(n);
    }
    return {};
}

auto sync_data(int fd, const std::filesystem::path& path) -> infra::VoidResult {
    if (::fdatasync(fd) != 0) {
        return std::unexpected(infra::error_from_errno(errno, "fdatasync failed", path));
    }
    return {};
}

auto sync_file(int fd, const std::filesystem::path& path) -> infra::VoidResult {
    if (::fsync(fd) != 0) {
        return std::unexpected(infra::error_from_errno(errno, "fsync failed", path));
    }
    return {};
}

auto sync_parent_dir(const std::filesystem::path& path) -> infra::VoidResult {
    auto dir = path.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return std::unexpected(infra::error_from_errno(errno, "Cannot open directory for fsync", dir));
    }
    UniqueFd guard{fd};
    // Некоторые ФС не умеют fsync каталога, это не ошибка данных
    if (::fsync(fd) != 0 && errno != EINVAL && errno != EROFS) {
        return std::unexpected(infra::error_from_errno(errno, "Directory fsync failed", dir));
    }
    return {};
}

auto resize(int fd, std::uint64_t size, const std::filesystem::path& path) -> infra::VoidResult {
    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        return std::unexpected(infra::error_from_errno(errno, "ftruncate failed", path));
    }
    return {};
}

auto atomic_replace(const std::filesystem::path& from,
                    const std::filesystem::path& to) -> infra::VoidResult {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        return std::unexpected(infra::error_from_errno(errno,
            fmt::format("Cannot rename {} onto destination", from.string()), to));
    }
    return sync_parent_dir(to);
}

auto try_rename(const std::filesystem::path& from,
                const std::filesystem::path& to) -> infra::Result<bool> {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        const int saved_errno = errno;
        if (saved_errno == EXDEV) {
            return false;
        }
        auto err = infra::error_from_errno(saved_errno,
            fmt::format("Cannot rename {}", from.string()), to);
        if (saved_errno == ENOENT) {
            err.code = infra::ErrorCode::SourceNotFound;
            err.path = from;
        }
        return std::unexpected(std::move(err));
    }
    if (auto res = sync_parent_dir(to); !res) {
        return std::unexpected(std::move(res.error()));
    }
    return true;
}

auto same_filesystem(const std::filesystem::path& source,
                     const std::filesystem::path& destination) -> infra::Result<bool> {
    struct stat src_st{};
    if (::stat(source.c_str(), &src_st) != 0) {
        const int saved_errno = errno;
        auto err = infra::error_from_errno(saved_errno, "stat failed", source);
        if (saved_errno == ENOENT) {
            err.code = infra::ErrorCode::SourceNotFound;
        }
        return std::unexpected(std::move(err));
    }

    // destination может ещё не существовать: поднимаемся до существующего предка
    auto existing = destination.empty() ? std::filesystem::path{"."} : destination;
    struct stat dst_st{};
    while (::stat(existing.c_str(), &dst_st) != 0) {
        if (errno != ENOENT && errno != ENOTDIR) {
            return std::unexpected(infra::error_from_errno(errno, "stat failed", existing));
        }
        auto parent = existing.parent_path();
        if (parent.empty() || parent == existing) {
            parent = ".";
            if (::stat(parent.c_str(), &dst_st) != 0) {
                return std::unexpected(infra::error_from_errno(errno, "stat failed", parent));
            }
            break;
        }
        existing = parent;
    }
    return src_st.st_dev == dst_st.st_dev;
}

auto partial_path_for(const std::filesystem::path& destination) -> std::filesystem::path {
    auto name = fmt::format(".{}.dcopy.part", destination.filename().string());
    return destination.parent_path() / name;
}

auto remove_if_exists(const std::filesystem::path& path) -> infra::VoidResult {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return std::unexpected(infra::error_from_error_code(ec, "Cannot remove file", path));
    }
    return {};
}

auto ensure_parent_dir(const std::filesystem::path& path) -> infra::VoidResult {
    auto parent = path.parent_path();
    if (parent.empty()) {
        return {};
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(infra::error_from_error_code(ec, "Cannot create parent directory", parent));
    }
    return {};
}

} // namespace dcopy::adapters::fs
