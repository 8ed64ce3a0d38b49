#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include "core/transfer_types.hpp"
#include "infra/error_handler/error.hpp"

namespace dcopy::core {

// Перемещение: rename в пределах одной ФС, иначе копирование с проверкой
// и удаление источника. Источник удаляется только после успешной проверки.
class MoveCoordinator {
public:
    using CopyFn = std::function<infra::Result<FileOutcome>(const std::filesystem::path& source,
                                                            const std::filesystem::path& destination)>;

    explicit MoveCoordinator(CopyFn copy);

    /// nullopt, если источник и цель на разных файловых системах.
    [[nodiscard]] auto try_rename(const std::filesystem::path& source,
                                  const std::filesystem::path& destination)
        -> infra::Result<std::optional<FileOutcome>>;

    [[nodiscard]] auto move_via_copy(const std::filesystem::path& source,
                                     const std::filesystem::path& destination)
        -> infra::Result<FileOutcome>;

    /// Удаляет опустевшие каталоги дерева снизу вверх; непустые остаются.
    [[nodiscard]] static auto prune_empty_dirs(const std::filesystem::path& root) -> infra::VoidResult;

private:
    CopyFn copy_;
};

} // namespace dcopy::core
