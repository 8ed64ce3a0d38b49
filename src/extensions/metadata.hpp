// src/extensions/metadata.hpp
#pragma once

#include <filesystem>
#include "infra/error_handler/error.hpp"

namespace dcopy::extensions {

/// Переносит mtime и права источника на `dst` (обычно временный файл до rename).
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> infra::VoidResult;

} // namespace dcopy::extensions
