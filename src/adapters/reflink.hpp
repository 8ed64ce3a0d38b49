#pragma once

#include <filesystem>
#include "infra/error_handler/error.hpp"

namespace dcopy::adapters::reflink {

enum class CloneOutcome {
    Cloned,      // target теперь CoW-клон источника
    Unsupported, // ФС/режим не умеют, можно идти обычным путём
};

/// errno, означающие «клонирование здесь невозможно», а не сбой I/O
[[nodiscard]] auto is_unsupported_errno(int err) -> bool;

/// Клонирует `source` целиком в `target` одним вызовом (FICLONE).
/// При любом исходе, кроме Cloned, `target` удаляется.
/// Ошибки, не связанные с поддержкой (EACCES, ENOSPC, ...), возвращаются как есть.
[[nodiscard]] auto clone_into(const std::filesystem::path& source,
                              const std::filesystem::path& target)
    -> infra::Result<CloneOutcome>;

} // namespace dcopy::adapters::reflink
