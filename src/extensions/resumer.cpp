// resumer.cpp
#include "resumer.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <system_error>
#include <spdlog/spdlog.h>
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace dcopy::extensions {

namespace {

std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(now));
}

std::filesystem::path normalized(const std::filesystem::path& p) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(p, ec);
    return ec ? p.lexically_normal() : abs.lexically_normal();
}

infra::Error invalid_state(std::string_view why, const std::filesystem::path& path,
                           const std::source_location& loc = std::source_location::current()) {
    return infra::make_error(infra::ErrorCode::InvalidResumeState, why, loc).with_path(path);
}

} // namespace

auto ResumeLedger::create(const std::filesystem::path& source,
                          const std::filesystem::path& destination,
                          const std::filesystem::path& write_target,
                          const adapters::fs::FileIdentity& identity) -> ResumeLedger
{
    ResumeLedger ledger;
    ledger.source_path = source;
    ledger.destination_path = destination;
    ledger.write_target = write_target;
    ledger.total_size = identity.size;
    ledger.source_identity = identity;
    ledger.touch();
    return ledger;
}

auto ResumeLedger::writes_to(const std::filesystem::path& target) const -> bool {
    return !write_target.empty() && normalized(write_target) == normalized(target);
}

auto ResumeLedger::covered_bytes() const -> std::uint64_t {
    std::uint64_t sum = 0;
    for (const auto& chunk : chunks) {
        sum += chunk.length;
    }
    return sum;
}

auto ResumeLedger::first_unwritten_offset() const -> std::uint64_t {
    std::uint64_t expected = 0;
    for (const auto& chunk : chunks) {
        if (chunk.offset != expected) {
            break;
        }
        expected = chunk.end();
    }
    return expected;
}

auto ResumeLedger::missing_ranges() const -> std::vector<ByteRange> {
    std::vector<ByteRange> gaps;
    std::uint64_t cursor = 0;
    for (const auto& chunk : chunks) {
        if (chunk.offset > cursor) {
            gaps.push_back({cursor, chunk.offset});
        }
        cursor = std::max(cursor, chunk.end());
    }
    if (cursor < total_size) {
        gaps.push_back({cursor, total_size});
    }
    return gaps;
}

auto ResumeLedger::is_complete() const -> bool {
    if (total_size == 0) {
        // пустой файл: одна завершённая запись нулевой длины
        return !chunks.empty();
    }
    return covered_bytes() == total_size && missing_ranges().empty();
}

auto ResumeLedger::add(ChunkRecord record) -> infra::VoidResult {
    if (record.length == 0) {
        if (total_size != 0 || !chunks.empty() || record.offset != 0) {
            return std::unexpected(invalid_state("Zero-length chunk outside an empty file", destination_path));
        }
        chunks.push_back(std::move(record));
        return {};
    }
    if (record.offset > total_size || record.length > total_size - record.offset) {
        return std::unexpected(invalid_state(
            fmt::format("Chunk [{}, {}) exceeds total size {}", record.offset, record.end(), total_size),
            destination_path));
    }

    auto pos = std::lower_bound(chunks.begin(), chunks.end(), record.offset,
        [](const ChunkRecord& c, std::uint64_t off) { return c.offset < off; });

    if (pos != chunks.begin() && std::prev(pos)->end() > record.offset) {
        return std::unexpected(invalid_state(
            fmt::format("Chunk at {} overlaps previous record", record.offset), destination_path));
    }
    if (pos != chunks.end() && record.end() > pos->offset) {
        return std::unexpected(invalid_state(
            fmt::format("Chunk at {} overlaps next record", record.offset), destination_path));
    }
    chunks.insert(pos, std::move(record));
    return {};
}

void ResumeLedger::touch() {
    updated_at = utc_timestamp();
}

auto ledger_path_for(const std::filesystem::path& destination) -> std::filesystem::path {
    auto path = destination;
    path += ".dcopy.state";
    return path;
}

auto validate_ledger(const ResumeLedger& ledger) -> infra::VoidResult {
    const auto& where = ledger.destination_path;
    if (ledger.version != kLedgerVersion) {
        return std::unexpected(invalid_state(fmt::format("Unsupported ledger version {}", ledger.version), where));
    }
    if (ledger.source_identity.size != ledger.total_size) {
        return std::unexpected(invalid_state("Ledger total_size disagrees with its source signature", where));
    }

    std::uint64_t prev_end = 0;
    std::uint64_t covered = 0;
    for (std::size_t i = 0; i < ledger.chunks.size(); ++i) {
        const auto& chunk = ledger.chunks[i];
        if (chunk.length == 0) {
            if (ledger.total_size != 0 || ledger.chunks.size() != 1 || chunk.offset != 0) {
                return std::unexpected(invalid_state("Zero-length chunk in a non-empty transfer", where));
            }
            continue;
        }
        if (i > 0 && chunk.offset < prev_end) {
            return std::unexpected(invalid_state(
                fmt::format("Chunk records unsorted or overlapping at offset {}", chunk.offset), where));
        }
        if (chunk.offset > ledger.total_size || chunk.length > ledger.total_size - chunk.offset) {
            return std::unexpected(invalid_state(
                fmt::format("Chunk [{}, {}) beyond total size {}", chunk.offset, chunk.end(), ledger.total_size),
                where));
        }
        prev_end = chunk.end();
        covered += chunk.length;
    }
    if (covered > ledger.total_size) {
        return std::unexpected(invalid_state("Ledger coverage exceeds total size", where));
    }
    return {};
}

auto load_ledger(const std::filesystem::path& ledger_file) -> infra::Result<ResumeLedger> {
    if (!std::filesystem::exists(ledger_file)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError, "Ledger file not found")
            .with_path(ledger_file));
    }

    try {
        YAML::Node node = YAML::LoadFile(ledger_file.string());

        // Неизвестную схему не угадываем
        if (!node.IsMap() || !node["version"]) {
            return std::unexpected(invalid_state("Ledger has no version field", ledger_file));
        }

        ResumeLedger ledger;
        ledger.version = node["version"].as<int>();
        if (ledger.version != kLedgerVersion) {
            return std::unexpected(invalid_state(
                fmt::format("Unknown ledger version {}", ledger.version), ledger_file));
        }

        ledger.source_path = node["source_path"].as<std::string>();
        ledger.destination_path = node["destination_path"].as<std::string>();
        if (!node["write_target"]) {
            return std::unexpected(invalid_state("Ledger does not name its write target", ledger_file));
        }
        ledger.write_target = node["write_target"].as<std::string>();
        ledger.total_size = node["total_size"].as<std::uint64_t>();

        const auto signature = node["modified_time_signature"];
        if (!signature || !signature.IsMap()) {
            return std::unexpected(invalid_state("Ledger has no source signature", ledger_file));
        }
        ledger.source_identity.size = signature["size"].as<std::uint64_t>();
        ledger.source_identity.mtime_ns = signature["mtime_ns"].as<std::int64_t>();

        if (const auto chunks = node["chunks"]) {
            if (!chunks.IsSequence()) {
                return std::unexpected(invalid_state("Ledger chunks is not a list", ledger_file));
            }
            for (const auto& c : chunks) {
                ChunkRecord record;
                record.offset = c["offset"].as<std::uint64_t>();
                record.length = c["length"].as<std::uint64_t>();
                if (c["checksum"]) {
                    record.checksum = c["checksum"].as<std::string>();
                }
                ledger.chunks.push_back(std::move(record));
            }
        }
        if (node["updated_at"]) {
            ledger.updated_at = node["updated_at"].as<std::string>();
        }

        return ledger;
    } catch (const YAML::Exception& e) {
        return std::unexpected(invalid_state(fmt::format("Corrupt ledger: {}", e.what()), ledger_file));
    }
}

auto save_ledger(const ResumeLedger& ledger,
                 const std::filesystem::path& ledger_file) -> infra::VoidResult
{
    YAML::Node node;
    node["version"] = ledger.version;
    node["source_path"] = ledger.source_path.string();
    node["destination_path"] = ledger.destination_path.string();
    node["write_target"] = ledger.write_target.string();
    node["total_size"] = ledger.total_size;
    node["modified_time_signature"]["size"] = ledger.source_identity.size;
    node["modified_time_signature"]["mtime_ns"] = ledger.source_identity.mtime_ns;

    YAML::Node chunks(YAML::NodeType::Sequence);
    for (const auto& chunk : ledger.chunks) {
        YAML::Node c;
        c["offset"] = chunk.offset;
        c["length"] = chunk.length;
        if (chunk.checksum) {
            c["checksum"] = *chunk.checksum;
        }
        chunks.push_back(c);
    }
    node["chunks"] = chunks;
    node["updated_at"] = ledger.updated_at;

    YAML::Emitter out;
    out << node;
    if (!out.good()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Cannot serialize ledger: {}", out.GetLastError())).with_path(ledger_file));
    }

    auto tmp = ledger_file;
    tmp += ".tmp";

    auto fd = adapters::fs::open_target(tmp, /*truncate=*/true);
    if (!fd) return std::unexpected(std::move(fd.error()));

    const std::string_view text{out.c_str(), out.size()};
    if (auto res = adapters::fs::write_at(fd->get(), {text.data(), text.size()}, 0, tmp); !res) {
        return res;
    }
    if (auto res = adapters::fs::sync_file(fd->get(), tmp); !res) {
        return res;
    }
    if (auto res = fd->close(tmp); !res) {
        return res;
    }
    return adapters::fs::atomic_replace(tmp, ledger_file);
}

auto cleanup_ledger(const std::filesystem::path& ledger_file) -> infra::VoidResult {
    return adapters::fs::remove_if_exists(ledger_file);
}

auto discard_resume_state(const std::filesystem::path& destination) -> infra::VoidResult {
    if (auto res = cleanup_ledger(ledger_path_for(destination)); !res) {
        return res;
    }
    spdlog::debug("Discarded resume state for {}", destination.string());
    return adapters::fs::remove_if_exists(adapters::fs::partial_path_for(destination));
}

} // namespace dcopy::extensions
