#include "xxhash_checksum.hpp"

#include <algorithm>
#include <cerrno>
#include <memory>
#include <vector>
#include <unistd.h>
#include <fmt/core.h>

namespace dcopy::infra {

namespace {

struct StateDeleter {
    void operator()(XXH64_state_t* state) const noexcept { XXH64_freeState(state); }
};

using StatePtr = std::unique_ptr<XXH64_state_t, StateDeleter>;

} // namespace

auto XXHashChecksum::to_hex(XXH64_hash_t hash) -> std::string {
    return fmt::format("{:016x}", static_cast<std::uint64_t>(hash));
}

auto XXHashChecksum::hash_buffer(std::span<const char> data) -> std::string {
    return to_hex(XXH64(data.data(), data.size(), 0)); // seed = 0
}

auto XXHashChecksum::hash_range(int fd, std::uint64_t offset, std::uint64_t length,
                                const std::filesystem::path& path)
    -> Result<std::string>
{
    StatePtr state{XXH64_createState()};
    if (!state) {
        return std::unexpected(make_error(ErrorCode::IoError, "Failed to create XXH64 state"));
    }
    XXH64_reset(state.get(), 0);

    std::vector<char> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(BUFFER_SIZE, std::max<std::uint64_t>(length, 1))));
    std::uint64_t pos = offset;
    const std::uint64_t end = offset + length;
    while (pos < end) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), end - pos));
        ssize_t n = ::pread(fd, buffer.data(), want, static_cast<off_t>(pos));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(error_from_errno(errno, "Error reading range for hashing", path, pos));
        }
        if (n == 0) {
            return std::unexpected(make_error(ErrorCode::InvalidResumeState,
                fmt::format("Unexpected EOF while hashing [{}, {})", offset, end))
                .with_path(path).with_offset(pos));
        }
        XXH64_update(state.get(), buffer.data(), static_cast<std::size_t>(n));
        pos += static_cast<std::uint64_t>(n);
    }

    return to_hex(XXH64_digest(state.get()));
}

} // namespace dcopy::infra
