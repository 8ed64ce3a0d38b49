#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include "infra/error_handler/error.hpp"

namespace dcopy::adapters::fs {

// Владеющий POSIX-дескриптор
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept;

    /// Явное закрытие с проверкой ошибки (close после записи может вернуть EIO)
    [[nodiscard]] auto close(const std::filesystem::path& path) -> infra::VoidResult;

private:
    int fd_ = -1;
};

// Подпись источника: если размер или mtime изменились, ledger недействителен
struct FileIdentity {
    std::uint64_t size = 0;
    std::int64_t mtime_ns = 0;

    bool operator==(const FileIdentity&) const = default;
};

enum class EntryKind { Missing, Regular, Directory, Other };

[[nodiscard]] auto entry_kind(const std::filesystem::path& path) -> infra::Result<EntryKind>;

[[nodiscard]] auto identity_of(const std::filesystem::path& path) -> infra::Result<FileIdentity>;

[[nodiscard]] auto open_source(const std::filesystem::path& path) -> infra::Result<UniqueFd>;

[[nodiscard]] auto open_target(const std::filesystem::path& path, bool truncate)
    -> infra::Result<UniqueFd>;

/// Читает до заполнения буфера или EOF; возвращает число прочитанных байт.
[[nodiscard]] auto read_at(int fd, std::span<char> buffer, std::uint64_t offset,
                           const std::filesystem::path& path) -> infra::Result<std::size_t>;

/// Пишет весь буфер целиком, продолжая после коротких записей.
[[nodiscard]] auto write_at(int fd, std::span<const char> buffer, std::uint64_t offset,
                            const std::filesystem::path& path) -> infra::VoidResult;

[[nodiscard]] auto sync_data(int fd, const std::filesystem::path& path) -> infra::VoidResult;
[[nodiscard]] auto sync_file(int fd, const std::filesystem::path& path) -> infra::VoidResult;
[[nodiscard]] auto sync_parent_dir(const std::filesystem::path& path) -> infra::VoidResult;

[[nodiscard]] auto resize(int fd, std::uint64_t size, const std::filesystem::path& path)
    -> infra::VoidResult;

/// rename() поверх destination + fsync каталога. Оба пути на одной ФС.
[[nodiscard]] auto atomic_replace(const std::filesystem::path& from,
                                  const std::filesystem::path& to) -> infra::VoidResult;

/// rename() без подмены EXDEV ошибкой: false означает «разные ФС».
[[nodiscard]] auto try_rename(const std::filesystem::path& from,
                              const std::filesystem::path& to) -> infra::Result<bool>;

/// Сравнивает st_dev источника и ближайшего существующего предка destination.
[[nodiscard]] auto same_filesystem(const std::filesystem::path& source,
                                   const std::filesystem::path& destination) -> infra::Result<bool>;

/// Временный файл рядом с destination (тот же каталог => та же ФС)
[[nodiscard]] auto partial_path_for(const std::filesystem::path& destination) -> std::filesystem::path;

[[nodiscard]] auto remove_if_exists(const std::filesystem::path& path) -> infra::VoidResult;

[[nodiscard]] auto ensure_parent_dir(const std::filesystem::path& path) -> infra::VoidResult;

} // namespace dcopy::adapters::fs
