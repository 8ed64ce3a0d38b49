#include "config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace dcopy::infra {

namespace {

template<typename T>
void take(std::optional<T>& into, const std::optional<T>& from) {
    if (from) into = from;
}

auto config_error(std::string_view origin, std::string_view what) -> Error {
    return make_error(ErrorCode::ConfigError, fmt::format("{}: {}", origin, what));
}

auto get_config_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    // 1. Локальный файл
    paths.emplace_back(".dcopy.yaml");

    // 2. Глобальный файл
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && *config_home) {
        paths.push_back(std::filesystem::path(config_home) / "dcopy" / "config.yaml");
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        paths.push_back(std::filesystem::path(home) / ".config" / "dcopy" / "config.yaml");
    }
    return paths;
}

auto read_choice(const YAML::Node& node, std::initializer_list<std::string_view> allowed,
                 std::string_view origin, std::string_view key) -> Result<std::string>
{
    auto text = node.as<std::string>();
    for (auto name : allowed) {
        if (text == name) {
            return text;
        }
    }
    return std::unexpected(config_error(origin,
        fmt::format("{}: unknown value '{}' (expected {})", key, text, fmt::join(allowed, "|"))));
}

auto read_size(const YAML::Node& node, std::string_view origin, std::string_view key)
    -> Result<std::uint64_t>
{
    auto parsed = parse_size(node.as<std::string>());
    if (!parsed) {
        return std::unexpected(config_error(origin, fmt::format("{}: {}", key, parsed.error().message)));
    }
    return *parsed;
}

auto parse_document(const YAML::Node& root, std::string_view origin) -> Result<Config> {
    Config cfg{};
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        return std::unexpected(config_error(origin, "top level must be a mapping"));
    }

    for (const auto& item : root) {
        const auto key = item.first.as<std::string>();
        const auto& value = item.second;

        if (key == "overwrite") {
            auto p = read_choice(value, {"never", "prompt", "always", "smart"}, origin, key);
            if (!p) return std::unexpected(std::move(p.error()));
            cfg.overwrite = *p;
        } else if (key == "verify") {
            auto p = read_choice(value, {"none", "fast", "full"}, origin, key);
            if (!p) return std::unexpected(std::move(p.error()));
            cfg.verify = *p;
        } else if (key == "reflink") {
            auto p = read_choice(value, {"auto", "always", "never"}, origin, key);
            if (!p) return std::unexpected(std::move(p.error()));
            cfg.reflink = *p;
        } else if (key == "parallel") {
            cfg.parallel = value.as<std::uint32_t>();
        } else if (key == "chunk_size" || key == "parallel_threshold" || key == "ledger_flush_bytes") {
            auto size = read_size(value, origin, key);
            if (!size) return std::unexpected(std::move(size.error()));
            if (key == "chunk_size") cfg.chunk_size = *size;
            else if (key == "parallel_threshold") cfg.parallel_threshold = *size;
            else cfg.ledger_flush_bytes = *size;
        } else if (key == "ledger_flush_interval_ms") {
            cfg.ledger_flush_interval_ms = value.as<std::uint64_t>();
        } else if (key == "resume") {
            cfg.resume = value.as<bool>();
        } else if (key == "atomic") {
            cfg.atomic = value.as<bool>();
        } else if (key == "fail_fast") {
            cfg.fail_fast = value.as<bool>();
        } else if (key == "preserve_metadata") {
            cfg.preserve_metadata = value.as<bool>();
        } else if (key == "chunk_checksums") {
            cfg.chunk_checksums = value.as<bool>();
        } else if (key == "quiet") {
            cfg.quiet = value.as<bool>();
        } else if (key == "progress") {
            cfg.progress = value.as<bool>();
        } else {
            spdlog::warn("{}: unknown config key '{}' ignored", origin, key);
        }
    }
    return cfg;
}

} // namespace

void Config::merge_with(const Config& other) {
    take(overwrite, other.overwrite);
    take(verify, other.verify);
    take(reflink, other.reflink);
    take(parallel, other.parallel);
    take(chunk_size, other.chunk_size);
    take(resume, other.resume);
    take(atomic, other.atomic);
    take(fail_fast, other.fail_fast);
    take(preserve_metadata, other.preserve_metadata);
    take(chunk_checksums, other.chunk_checksums);
    take(parallel_threshold, other.parallel_threshold);
    take(ledger_flush_bytes, other.ledger_flush_bytes);
    take(ledger_flush_interval_ms, other.ledger_flush_interval_ms);
    take(quiet, other.quiet);
    take(progress, other.progress);
}

auto parse_size(std::string_view text) -> Result<std::uint64_t> {
    auto invalid = [&] {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          fmt::format("Invalid size '{}'", text)));
    };

    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

    std::uint64_t value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr == first) {
        return invalid();
    }

    std::string suffix(ptr, last);
    for (auto& c : suffix) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (suffix.ends_with("IB")) suffix.resize(suffix.size() - 2);
    else if (suffix.ends_with("B")) suffix.resize(suffix.size() - 1);

    unsigned shift = 0;
    if (suffix.empty())      shift = 0;
    else if (suffix == "K")  shift = 10;
    else if (suffix == "M")  shift = 20;
    else if (suffix == "G")  shift = 30;
    else if (suffix == "T")  shift = 40;
    else return invalid();

    if (shift > 0 && value > (UINT64_MAX >> shift)) {
        return invalid();
    }
    return value << shift;
}

auto load_config_from_string(std::string_view yaml, std::string_view origin) -> Result<Config> {
    try {
        return parse_document(YAML::Load(std::string(yaml)), origin);
    } catch (const YAML::Exception& e) {
        return std::unexpected(config_error(origin, e.what()));
    }
}

auto load_config_from_file(const std::filesystem::path& path) -> Result<Config> {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(config_error(path.string(), "cannot open file"));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto cfg = load_config_from_string(buffer.str(), path.string());
    if (cfg) {
        spdlog::debug("Loaded config from {}", path.string());
    }
    return cfg;
}

auto load_config_from_file() -> Result<Config> {
    for (const auto& path : get_config_paths()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) continue;
        return load_config_from_file(path);
    }

    // Файл не найден: пустой конфиг, не ошибка
    return Config{};
}

} // namespace dcopy::infra
