#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

namespace dcopy::infra {

enum class ErrorCode {
    // Фатальные ошибки (операция над файлом невозможна)
    SourceNotFound,
    SourceIsDirectory,
    TargetExists,
    PermissionDenied,
    InvalidResumeState,
    InvalidArgument,
    ConfigError,

    // Ошибки данных и окружения
    DiskFull,
    ChecksumMismatch,
    ReflinkUnsupported, // наружу только при reflink=always
    UserAborted,

    // Системные
    IoError,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Контекст для диагностики без повторного вычисления состояния
    std::filesystem::path path;
    std::optional<std::uint64_t> offset;
    std::string expected_digest;
    std::string actual_digest;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
    [[nodiscard]] auto describe() const -> std::string;

    auto with_path(std::filesystem::path p) && -> Error {
        path = std::move(p);
        return std::move(*this);
    }

    auto with_offset(std::uint64_t off) && -> Error {
        offset = off;
        return std::move(*this);
    }
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Переводит errno в код таксономии. ENOENT становится SourceNotFound
/// только если `missing_is_source` (открытие источника).
[[nodiscard]] auto code_from_errno(int err, bool missing_is_source = false) -> ErrorCode;

[[nodiscard]] auto error_from_errno(
    int err,
    std::string_view context,
    const std::filesystem::path& path,
    std::optional<std::uint64_t> offset = std::nullopt,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto error_from_error_code(
    const std::error_code& ec,
    std::string_view context,
    const std::filesystem::path& path,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto checksum_mismatch(
    const std::filesystem::path& path,
    std::string expected,
    std::string actual,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace dcopy::infra
