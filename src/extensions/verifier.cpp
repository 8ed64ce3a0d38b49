// verifier.cpp
#include "verifier.hpp"

#include <vector>
#include <fmt/core.h>
#include <openssl/evp.h>
#include "adapters/fs.hpp"

namespace dcopy::extensions {

void DigestStream::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

DigestStream::DigestStream()
    : ctx_(EVP_MD_CTX_new())
{
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        failed_ = true;
    }
}

DigestStream::~DigestStream() = default;
DigestStream::DigestStream(DigestStream&&) noexcept = default;
DigestStream& DigestStream::operator=(DigestStream&&) noexcept = default;

auto DigestStream::update(std::span<const char> data) -> infra::VoidResult {
    if (failed_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError, "SHA-256 context unavailable"));
    }
    if (!data.empty() && EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        failed_ = true;
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError, "EVP_DigestUpdate failed"));
    }
    return {};
}

auto DigestStream::finish() -> infra::Result<Digest> {
    if (failed_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError, "SHA-256 context unavailable"));
    }
    Digest digest;
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.bytes.data(), &length) != 1 || length != digest.bytes.size()) {
        failed_ = true;
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError, "EVP_DigestFinal_ex failed"));
    }
    failed_ = true; // контекст финализирован
    return digest;
}

auto Digest::to_hex() const -> std::string {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out(bytes.size() * 2, '0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        out[2 * i]     = hex[(bytes[i] >> 4) & 0xF];
        out[2 * i + 1] = hex[bytes[i] & 0xF];
    }
    return out;
}

auto compute_digest(const std::filesystem::path& path, std::size_t block_size)
    -> infra::Result<Digest>
{
    auto fd = adapters::fs::open_source(path);
    if (!fd) return std::unexpected(std::move(fd.error()));

    DigestStream stream;
    std::vector<char> buffer(block_size == 0 ? kDefaultVerifyBlockSize : block_size);
    std::uint64_t offset = 0;
    for (;;) {
        auto n = adapters::fs::read_at(fd->get(), buffer, offset, path);
        if (!n) return std::unexpected(std::move(n.error()));
        if (*n == 0) break;

        if (auto res = stream.update({buffer.data(), *n}); !res) {
            return std::unexpected(std::move(res.error()));
        }
        offset += *n;
    }
    return stream.finish();
}

bool verify(const Digest& source, const Digest& destination) {
    return source == destination;
}

auto verify_fast(const std::filesystem::path& source,
                 const std::filesystem::path& destination,
                 bool compare_mtime) -> infra::VoidResult
{
    auto src = adapters::fs::identity_of(source);
    if (!src) return std::unexpected(std::move(src.error()));
    auto dst = adapters::fs::identity_of(destination);
    if (!dst) return std::unexpected(std::move(dst.error()));

    const bool same_size = src->size == dst->size;
    const bool same_time = !compare_mtime || src->mtime_ns == dst->mtime_ns;
    if (same_size && same_time) {
        return {};
    }
    return std::unexpected(infra::checksum_mismatch(destination,
        fmt::format("size={} mtime_ns={}", src->size, src->mtime_ns),
        fmt::format("size={} mtime_ns={}", dst->size, dst->mtime_ns)));
}

auto verify_full(const std::filesystem::path& source,
                 const std::filesystem::path& destination,
                 const std::optional<Digest>& known_source_digest,
                 std::size_t block_size) -> infra::VoidResult
{
    Digest src_digest;
    if (known_source_digest) {
        src_digest = *known_source_digest;
    } else {
        auto computed = compute_digest(source, block_size);
        if (!computed) return std::unexpected(std::move(computed.error()));
        src_digest = *computed;
    }

    auto dst_digest = compute_digest(destination, block_size);
    if (!dst_digest) return std::unexpected(std::move(dst_digest.error()));

    if (!verify(src_digest, *dst_digest)) {
        spdlog::warn("Hash mismatch: {} (src: {}) vs {} (dst: {})",
                     source.string(), src_digest.to_hex(),
                     destination.string(), dst_digest->to_hex());
        return std::unexpected(infra::checksum_mismatch(destination,
            src_digest.to_hex(), dst_digest->to_hex()));
    }
    return {};
}

} // namespace dcopy::extensions
