#include "error.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fmt/core.h>

namespace dcopy::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::SourceNotFound:     return "SourceNotFound";
        case ErrorCode::SourceIsDirectory:  return "SourceIsDirectory";
        case ErrorCode::TargetExists:       return "TargetExists";
        case ErrorCode::PermissionDenied:   return "PermissionDenied";
        case ErrorCode::InvalidResumeState: return "InvalidResumeState";
        case ErrorCode::InvalidArgument:    return "InvalidArgument";
        case ErrorCode::ConfigError:        return "ConfigError";
        case ErrorCode::DiskFull:           return "DiskFull";
        case ErrorCode::ChecksumMismatch:   return "ChecksumMismatch";
        case ErrorCode::ReflinkUnsupported: return "ReflinkUnsupported";
        case ErrorCode::UserAborted:        return "UserAborted";
        case ErrorCode::IoError:            return "IoError";
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::SourceNotFound:
        case ErrorCode::SourceIsDirectory:
        case ErrorCode::PermissionDenied:
        case ErrorCode::InvalidArgument:
        case ErrorCode::ConfigError:
        case ErrorCode::ReflinkUnsupported:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::TargetExists:       return 17;
        case ErrorCode::DiskFull:           return 20;
        case ErrorCode::ChecksumMismatch:   return 22;
        case ErrorCode::InvalidResumeState: return 23;
        case ErrorCode::UserAborted:        return 130; // SIGINT
        default:                            return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

std::string Error::describe() const {
    std::string out = fmt::format("{}: {}", to_string(code), message);
    if (!path.empty()) {
        out += fmt::format(" [path={}]", path.string());
    }
    if (offset) {
        out += fmt::format(" [offset={}]", *offset);
    }
    if (code == ErrorCode::ChecksumMismatch) {
        out += fmt::format(" [expected={} actual={}]", expected_digest, actual_digest);
    }
    return out;
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

ErrorCode code_from_errno(int err, bool missing_is_source) {
    switch (err) {
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
        case EFBIG:
            return ErrorCode::DiskFull;
        case ENOENT:
            return missing_is_source ? ErrorCode::SourceNotFound : ErrorCode::IoError;
        case EISDIR:
            return ErrorCode::SourceIsDirectory;
        case EEXIST:
            return ErrorCode::TargetExists;
        default:
            return ErrorCode::IoError;
    }
}

Error error_from_errno(int err, std::string_view context,
                       const std::filesystem::path& path,
                       std::optional<std::uint64_t> offset,
                       const std::source_location& loc) {
    Error e{code_from_errno(err), fmt::format("{}: {}", context, std::strerror(err)), loc};
    e.path = path;
    e.offset = offset;
    return e;
}

Error error_from_error_code(const std::error_code& ec, std::string_view context,
                            const std::filesystem::path& path,
                            const std::source_location& loc) {
    auto code = ec.category() == std::generic_category() || ec.category() == std::system_category()
        ? code_from_errno(ec.value())
        : ErrorCode::IoError;
    Error e{code, fmt::format("{}: {}", context, ec.message()), loc};
    e.path = path;
    return e;
}

Error checksum_mismatch(const std::filesystem::path& path,
                        std::string expected, std::string actual,
                        const std::source_location& loc) {
    Error e{ErrorCode::ChecksumMismatch,
            fmt::format("Checksum mismatch: expected {}, got {}", expected, actual), loc};
    e.path = path;
    e.expected_digest = std::move(expected);
    e.actual_digest = std::move(actual);
    return e;
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}",
        err.file, err.line, err.function,
        err.describe()
    );
    return std::move(err);
}

} // namespace dcopy::infra
