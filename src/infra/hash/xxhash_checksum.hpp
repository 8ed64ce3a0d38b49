#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include "infra/error_handler/error.hpp"
#include <xxhash.h>

namespace dcopy::infra {

// Быстрая (не криптографическая) контрольная сумма отдельного чанка.
// Хранится в ledger и перепроверяется по временному файлу при resume.
class XXHashChecksum {
public:
    // xxHash64 буфера в виде 16 hex-символов
    static auto hash_buffer(std::span<const char> data) -> std::string;

    // xxHash64 диапазона [offset, offset + length) открытого файла
    static auto hash_range(int fd, std::uint64_t offset, std::uint64_t length,
                           const std::filesystem::path& path)
        -> Result<std::string>;

    static auto to_hex(XXH64_hash_t hash) -> std::string;

private:
    static constexpr std::size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer
};

} // namespace dcopy::infra
