// metadata.cpp
#include "metadata.hpp"

#include <system_error>
#include <fmt/core.h>

namespace dcopy::extensions {

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> infra::VoidResult
{
    std::error_code ec;

    // Временные метки (наносекундная точность на Linux)
    auto time = std::filesystem::last_write_time(src, ec);
    if (ec) {
        return std::unexpected(infra::error_from_error_code(ec, "Cannot read source mtime", src));
    }
    std::filesystem::last_write_time(dst, time, ec);
    if (ec) {
        return std::unexpected(infra::error_from_error_code(ec, "Cannot set destination mtime", dst));
    }

    // Права (только POSIX)
#ifndef _WIN32
    auto perms = std::filesystem::status(src, ec).permissions();
    if (ec) {
        return std::unexpected(infra::error_from_error_code(ec, "Cannot read source permissions", src));
    }
    std::filesystem::permissions(dst, perms, ec);
    if (ec) {
        return std::unexpected(infra::error_from_error_code(ec,
            fmt::format("Metadata copy failed for {}", src.string()), dst));
    }
#endif

    return {};
}

} // namespace dcopy::extensions
