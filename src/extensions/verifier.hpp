// src/extensions/verifier.hpp
#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include "infra/error_handler/error.hpp"

struct evp_md_ctx_st;

namespace dcopy::extensions {

inline constexpr std::size_t kDefaultVerifyBlockSize = 4 * 1024 * 1024;

struct Digest {
    std::array<unsigned char, 32> bytes{}; // SHA-256

    [[nodiscard]] auto to_hex() const -> std::string;
    bool operator==(const Digest&) const = default;
};

// Потоковый SHA-256: движок сворачивает в него байты по ходу копирования
class DigestStream {
public:
    DigestStream();
    ~DigestStream();
    DigestStream(DigestStream&&) noexcept;
    DigestStream& operator=(DigestStream&&) noexcept;

    [[nodiscard]] auto update(std::span<const char> data) -> infra::VoidResult;
    [[nodiscard]] auto finish() -> infra::Result<Digest>;

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool failed_ = false;
};

/// Хеширует файл блоками `block_size`, не загружая его в память целиком.
[[nodiscard]] auto compute_digest(const std::filesystem::path& path,
                                  std::size_t block_size = kDefaultVerifyBlockSize)
    -> infra::Result<Digest>;

[[nodiscard]] auto verify(const Digest& source, const Digest& destination) -> bool;

/// Эвристика fast: размер и (если метаданные переносились) mtime.
[[nodiscard]] auto verify_fast(const std::filesystem::path& source,
                               const std::filesystem::path& destination,
                               bool compare_mtime) -> infra::VoidResult;

/// Полная проверка: перехеширование обеих сторон. Если digest источника уже
/// посчитан по ходу копирования, источник повторно не читается.
[[nodiscard]] auto verify_full(const std::filesystem::path& source,
                               const std::filesystem::path& destination,
                               const std::optional<Digest>& known_source_digest,
                               std::size_t block_size = kDefaultVerifyBlockSize)
    -> infra::VoidResult;

} // namespace dcopy::extensions
