#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <unistd.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "cli/args_parser/args_parser.hpp"
#include "core/orchestrator/orchestrator.hpp"
#include "extensions/resumer.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace {

using ARGS = dcopy::args_parser::CLIArgs;

// Вопросы о перезаписи через stdin; без терминала ответ всегда "skip"
class StdinConfirmSink final : public dcopy::core::ConfirmSink {
public:
    auto confirm_overwrite(const std::filesystem::path& source,
                           const std::filesystem::path& destination) -> dcopy::core::ConfirmChoice override
    {
        using dcopy::core::ConfirmChoice;
        if (!::isatty(STDIN_FILENO)) {
            spdlog::warn("{} exists and stdin is not a terminal, skipping", destination.string());
            return ConfirmChoice::Skip;
        }

        fmt::print(stderr, "Overwrite {} with {}? [y]es / [n]o / [a]bort: ",
                   destination.string(), source.string());
        std::fflush(stderr);

        std::string answer;
        if (!std::getline(std::cin, answer) || answer.empty()) {
            return ConfirmChoice::Skip;
        }
        switch (answer.front()) {
            case 'y': case 'Y': return ConfirmChoice::Overwrite;
            case 'a': case 'A': return ConfirmChoice::Abort;
            default:            return ConfirmChoice::Skip;
        }
    }
};

// Пишет скорость в лог не чаще раза в секунду
class LogProgressSink final : public dcopy::infra::ProgressSink {
public:
    void on_progress(const dcopy::infra::ProgressEvent& event) override {
        if (event.timestamp - last_report_ < std::chrono::seconds(1)) {
            return;
        }
        last_report_ = event.timestamp;
        spdlog::info("{:.1f} MiB transferred, {:.1f} MiB/s",
                     event.cumulative_bytes / 1024.0 / 1024.0,
                     event.throughput_bps / 1024.0 / 1024.0);
    }

private:
    std::chrono::steady_clock::time_point last_report_{};
};

// Куда попадёт источник: та же схема, что и у оркестратора
auto target_for(const ARGS& args, const std::filesystem::path& source) -> std::filesystem::path {
    std::filesystem::path destination(args.destination);
    std::error_code ec;
    if (args.sources.size() > 1 || std::filesystem::is_directory(destination, ec)) {
        auto normal = source.lexically_normal();
        return destination / (normal.has_filename() ? normal.filename() : normal.parent_path().filename());
    }
    return destination;
}

auto discard_state_for(const std::filesystem::path& target) -> bool {
    if (auto res = dcopy::extensions::discard_resume_state(target); !res) {
        spdlog::error("{}", res.error().describe());
        return false;
    }
    return true;
}

// --restart: удалить ledger'ы и временные файлы прежних попыток
auto restart_transfers(const ARGS& args) -> bool {
    bool ok = true;
    for (const auto& src : args.sources) {
        const std::filesystem::path source(src);
        const auto target = target_for(args, source);
        std::error_code ec;
        if (!std::filesystem::is_directory(source, ec)) {
            ok = discard_state_for(target) && ok;
            continue;
        }
        for (std::filesystem::recursive_directory_iterator it(source, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(ec)) {
                ok = discard_state_for(target / std::filesystem::relative(it->path(), source)) && ok;
            }
        }
        if (ec) {
            spdlog::error("Cannot scan {} for resume state: {}", source.string(), ec.message());
            ok = false;
        }
    }
    return ok;
}

} // namespace

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        auto args_res = dcopy::args_parser::parse_args(argc, argv);
        if (!args_res) {
            return args_res.error(); // --help, --version или ошибка разбора
        }
        const auto& args = *args_res;

        // 1. Загрузить из файла
        auto config_res = dcopy::infra::load_config_from_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error().message);
            return config_res.error().to_exit_code();
        }
        auto config = *config_res;

        // 2. Переопределить из CLI
        config.merge_with(args.overrides);

        const bool quiet = config.quiet.value_or(false);
        if (args.verbose) {
            spdlog::set_level(spdlog::level::debug);
        } else if (quiet) {
            spdlog::set_level(spdlog::level::warn);
        }

        static dcopy::infra::CancelToken cancel;
        dcopy::infra::install_signal_handler(cancel);

        if (args.restart && !restart_transfers(args)) {
            return EXIT_FAILURE;
        }

        auto options = dcopy::core::options_from_config(config);
        if (!options) {
            spdlog::error("Config error: {}", options.error().message);
            return options.error().to_exit_code();
        }

        std::vector<std::filesystem::path> sources(args.sources.begin(), args.sources.end());
        const dcopy::core::TransferRequest request(std::move(sources), args.destination,
                                                   *options, args.mode);

        spdlog::debug("{} {} source(s) -> {} (overwrite={}, verify={}, reflink={}, parallel={})",
                      args.mode == dcopy::core::TransferMode::Move ? "Moving" : "Copying",
                      request.sources().size(), request.destination().string(),
                      dcopy::core::to_string(request.options().overwrite),
                      dcopy::core::to_string(request.options().verify),
                      dcopy::core::to_string(request.options().reflink),
                      request.options().parallelism);

        LogProgressSink progress;
        StdinConfirmSink confirm;
        const bool show_progress = config.progress.value_or(true) && !quiet;

        dcopy::core::Orchestrator orchestrator(cancel);
        auto result = orchestrator.orchestrate(request, show_progress ? &progress : nullptr, &confirm);
        if (!result) {
            spdlog::error("{}", result.error().describe());
            return result.error().to_exit_code();
        }

        // Ошибки отдельных файлов уже залогированы оркестратором
        if (result->count(dcopy::core::FileStatus::Failed) > 0) {
            const auto* first = result->first_error();
            return first ? first->to_exit_code() : EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }
}
