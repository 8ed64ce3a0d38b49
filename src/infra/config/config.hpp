#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace dcopy::infra {

// Необязательные переопределения поверх значений по умолчанию.
// Незаданное поле не меняет ни другой Config при слиянии, ни итоговые опции.
// Политики хранятся именами ("smart", "full"...), уже проверенными при загрузке.
struct Config {
    std::optional<std::string> overwrite;
    std::optional<std::string> verify;
    std::optional<std::string> reflink;
    std::optional<std::uint32_t> parallel;
    std::optional<std::uint64_t> chunk_size;          // bytes
    std::optional<bool> resume;
    std::optional<bool> atomic;
    std::optional<bool> fail_fast;
    std::optional<bool> preserve_metadata;
    std::optional<bool> chunk_checksums;
    std::optional<std::uint64_t> parallel_threshold;  // bytes
    std::optional<std::uint64_t> ledger_flush_bytes;  // bytes
    std::optional<std::uint64_t> ledger_flush_interval_ms;

    // Только для CLI
    std::optional<bool> quiet;
    std::optional<bool> progress;

    // Слияние с другим Config (например, из CLI): заданные поля other побеждают
    void merge_with(const Config& other);
};

/// "64M", "1G", "4096". Суффиксы двоичные (K = 1024), регистр не важен,
/// допускаются хвосты "B" и "iB".
[[nodiscard]] auto parse_size(std::string_view text) -> Result<std::uint64_t>;

[[nodiscard]] auto load_config_from_string(std::string_view yaml,
                                           std::string_view origin = "<string>") -> Result<Config>;

[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path) -> Result<Config>;

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.dcopy.yaml
///   2. $XDG_CONFIG_HOME/dcopy/config.yaml или ~/.config/dcopy/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> Result<Config>;

} // namespace dcopy::infra
