#pragma once

#include <expected>
#include <string>
#include <vector>
#include "core/transfer_types.hpp"
#include "infra/config/config.hpp"

namespace dcopy::args_parser {

struct CLIArgs {
    core::TransferMode mode{core::TransferMode::Copy}; // cp | mv
    std::vector<std::string> sources;                  // позиционные, кроме последнего
    std::string destination;                           // последний позиционный
    infra::Config overrides;                           // только явно заданные флаги
    bool restart{false};                               // --restart
    bool verbose{false};                               // -v, --verbose
};

/// Разбирает argv. При --help, --version или ошибке возвращает код выхода.
[[nodiscard]] auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>;

} // namespace dcopy::args_parser
