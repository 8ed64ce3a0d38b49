#include "args_parser.hpp"

#include <cstdint>
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <build_info.hpp>

namespace dcopy::args_parser {

namespace {

// Общее хранилище флагов: за один запуск разбирается ровно одна подкоманда
struct Flags {
    std::vector<std::string> paths;
    std::string overwrite;
    std::string verify;
    std::string reflink;
    std::string chunk_size;
    std::uint32_t parallel = 0;
    bool no_resume = false;
    bool no_atomic = false;
    bool fail_fast = false;
    bool restart = false;
    bool quiet = false;
    bool verbose = false;
};

const CLI::Validator kSize(
    [](const std::string& text) -> std::string {
        auto parsed = infra::parse_size(text);
        return parsed ? std::string{} : parsed.error().message;
    },
    "SIZE");

void add_transfer_options(CLI::App& sub, Flags& flags) {
    sub.add_option("paths", flags.paths, "SOURCE... DESTINATION")->required();

    sub.add_option("--overwrite", flags.overwrite, "What to do when the destination exists")
        ->check(CLI::IsMember({"never", "prompt", "always", "smart"}));
    sub.add_option("--verify", flags.verify, "Post-transfer verification")
        ->check(CLI::IsMember({"none", "fast", "full"}));
    sub.add_option("--reflink", flags.reflink, "Copy-on-write clone policy")
        ->check(CLI::IsMember({"auto", "always", "never"}));
    sub.add_option("-j,--parallel", flags.parallel, "Number of parallel workers")
        ->check(CLI::Range(1u, 1024u));
    sub.add_option("--chunk-size", flags.chunk_size, "Transfer chunk size (e.g. 64M)")
        ->check(kSize);

    sub.add_flag("--no-resume", flags.no_resume, "Do not keep or use resume ledgers");
    sub.add_flag("--no-atomic", flags.no_atomic, "Write directly into the destination");
    sub.add_flag("--fail-fast", flags.fail_fast, "Stop at the first failed file");
    sub.add_flag("--restart", flags.restart, "Discard existing resume state before starting");
    sub.add_flag("-q,--quiet", flags.quiet, "Only warnings and errors");
    sub.add_flag("-v,--verbose", flags.verbose, "Debug logging");
}

auto to_cli_args(const CLI::App& sub, const Flags& flags, core::TransferMode mode)
    -> std::expected<CLIArgs, int>
{
    if (flags.paths.size() < 2) {
        fmt::print(stderr, "{}: expected at least one SOURCE and a DESTINATION\n", sub.get_name());
        return std::unexpected(1);
    }

    CLIArgs args;
    args.mode = mode;
    args.sources.assign(flags.paths.begin(), flags.paths.end() - 1);
    args.destination = flags.paths.back();
    args.restart = flags.restart;
    args.verbose = flags.verbose;

    auto& cfg = args.overrides;
    // Значения уже прошли проверку IsMember / kSize
    if (sub.count("--overwrite")) cfg.overwrite = flags.overwrite;
    if (sub.count("--verify"))    cfg.verify = flags.verify;
    if (sub.count("--reflink"))   cfg.reflink = flags.reflink;
    if (sub.count("--parallel"))  cfg.parallel = flags.parallel;
    if (sub.count("--chunk-size")) cfg.chunk_size = infra::parse_size(flags.chunk_size).value();
    if (flags.no_resume) cfg.resume = false;
    if (flags.no_atomic) cfg.atomic = false;
    if (flags.fail_fast) cfg.fail_fast = true;
    if (flags.quiet)     cfg.quiet = true;

    return args;
}

} // namespace

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int> {
    CLI::App app{"dcopy: durable, resumable file copy and move", "dcopy"};
    app.set_version_flag("--version",
        fmt::format("dcopy {} ({})", build_info::version, build_info::git_commit_short));
    app.require_subcommand(1);

    Flags flags;
    auto* cp = app.add_subcommand("cp", "Copy files and directories");
    auto* mv = app.add_subcommand("mv", "Move files and directories");
    add_transfer_options(*cp, flags);
    add_transfer_options(*mv, flags);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help и --version тоже приходят сюда, с кодом 0
        return std::unexpected(app.exit(e));
    }

    if (cp->parsed()) {
        return to_cli_args(*cp, flags, core::TransferMode::Copy);
    }
    return to_cli_args(*mv, flags, core::TransferMode::Move);
}

} // namespace dcopy::args_parser
