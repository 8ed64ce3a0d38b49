#include <chrono>
#include <gtest/gtest.h>

#include "core/transfer_types.hpp"
#include "infra/config/config.hpp"
#include "test_helpers.hpp"

using dcopy::infra::ErrorCode;
using dcopy::infra::parse_size;

TEST(ParseSizeTest, PlainAndSuffixed)
{
    EXPECT_EQ(parse_size("4096").value(), 4096u);
    EXPECT_EQ(parse_size("64M").value(), 64ull << 20);
    EXPECT_EQ(parse_size("1g").value(), 1ull << 30);
    EXPECT_EQ(parse_size("8KiB").value(), 8192u);
    EXPECT_EQ(parse_size("2kb").value(), 2048u);
    EXPECT_EQ(parse_size(" 3M ").value(), 3ull << 20);
    EXPECT_EQ(parse_size("1T").value(), 1ull << 40);
}

TEST(ParseSizeTest, RejectsGarbage)
{
    for (const char* text : {"", "abc", "M", "10X", "-5", "1.5G"}) {
        auto res = parse_size(text);
        ASSERT_FALSE(res) << text;
        EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument) << text;
    }
}

TEST(ParseSizeTest, RejectsOverflow)
{
    EXPECT_FALSE(parse_size("99999999999T"));
}

TEST(ConfigTest, ParsesFullDocument)
{
    auto cfg = dcopy::infra::load_config_from_string(R"(
overwrite: smart
verify: full
reflink: never
parallel: 8
chunk_size: 16M
resume: false
atomic: true
fail_fast: true
preserve_metadata: false
chunk_checksums: true
parallel_threshold: 1G
ledger_flush_bytes: 32M
ledger_flush_interval_ms: 500
quiet: true
)");
    ASSERT_TRUE(cfg) << cfg.error().describe();
    EXPECT_EQ(cfg->overwrite, "smart");
    EXPECT_EQ(cfg->verify, "full");
    EXPECT_EQ(cfg->reflink, "never");
    EXPECT_EQ(cfg->parallel, 8u);
    EXPECT_EQ(cfg->chunk_size, 16ull << 20);
    EXPECT_EQ(cfg->resume, false);
    EXPECT_EQ(cfg->fail_fast, true);
    EXPECT_EQ(cfg->preserve_metadata, false);
    EXPECT_EQ(cfg->chunk_checksums, true);
    EXPECT_EQ(cfg->parallel_threshold, 1ull << 30);
    EXPECT_EQ(cfg->ledger_flush_bytes, 32ull << 20);
    EXPECT_EQ(cfg->ledger_flush_interval_ms, 500u);
    EXPECT_EQ(cfg->quiet, true);
    EXPECT_FALSE(cfg->progress.has_value());
}

TEST(ConfigTest, EmptyDocumentIsEmptyConfig)
{
    auto cfg = dcopy::infra::load_config_from_string("");
    ASSERT_TRUE(cfg);
    EXPECT_FALSE(cfg->overwrite.has_value());
    EXPECT_FALSE(cfg->chunk_size.has_value());
}

TEST(ConfigTest, UnknownKeysAreIgnored)
{
    auto cfg = dcopy::infra::load_config_from_string("verify: none\ncolour: blue\n");
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg->verify, "none");
}

TEST(ConfigTest, BadValuesAreConfigErrors)
{
    for (const char* yaml : {"overwrite: sometimes\n",
                             "chunk_size: lots\n",
                             "parallel: many\n",
                             "- just\n- a list\n",
                             "verify: [unclosed\n"}) {
        auto cfg = dcopy::infra::load_config_from_string(yaml);
        ASSERT_FALSE(cfg) << yaml;
        EXPECT_EQ(cfg.error().code, ErrorCode::ConfigError) << yaml;
    }
}

TEST(ConfigTest, MergeKeepsUnsetFields)
{
    dcopy::infra::Config base;
    base.verify = "full";
    base.parallel = 2;

    dcopy::infra::Config cli;
    cli.parallel = 16;
    cli.resume = false;

    base.merge_with(cli);
    EXPECT_EQ(base.verify, "full");
    EXPECT_EQ(base.parallel, 16u);
    EXPECT_EQ(base.resume, false);
}

TEST(ConfigTest, OptionsTakeOnlySetFields)
{
    const dcopy::core::TransferOptions defaults{};
    dcopy::infra::Config cfg;
    cfg.chunk_size = 1024;
    cfg.ledger_flush_interval_ms = 10;

    const auto converted = dcopy::core::options_from_config(cfg);
    ASSERT_TRUE(converted) << converted.error().describe();
    const auto& opts = *converted;
    EXPECT_EQ(opts.chunk_size, 1024u);
    EXPECT_EQ(opts.ledger_flush_interval, std::chrono::milliseconds(10));
    EXPECT_EQ(opts.overwrite, defaults.overwrite);
    EXPECT_EQ(opts.verify, defaults.verify);
    EXPECT_EQ(opts.parallelism, defaults.parallelism);
    EXPECT_EQ(opts.atomic, defaults.atomic);
    EXPECT_EQ(opts.resume, defaults.resume);
}

TEST(ConfigTest, PolicyNamesBecomeOptions)
{
    auto cfg = dcopy::infra::load_config_from_string("overwrite: smart\nverify: full\nreflink: always\n");
    ASSERT_TRUE(cfg) << cfg.error().describe();

    const auto opts = dcopy::core::options_from_config(*cfg);
    ASSERT_TRUE(opts) << opts.error().describe();
    EXPECT_EQ(opts->overwrite, dcopy::core::OverwritePolicy::Smart);
    EXPECT_EQ(opts->verify, dcopy::core::VerifyPolicy::Full);
    EXPECT_EQ(opts->reflink, dcopy::core::ReflinkPolicy::Always);

    // Config, собранный в коде в обход загрузчика, всё равно проверяется
    dcopy::infra::Config bad;
    bad.verify = "paranoid";
    auto rejected = dcopy::core::options_from_config(bad);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, ErrorCode::InvalidArgument);
}

class ConfigFileTest : public dcopy::test::TempDirTest {};

TEST_F(ConfigFileTest, LoadsFromPath)
{
    const auto file = path("dcopy.yaml");
    dcopy::test::write_file(file, "overwrite: always\nparallel: 3\n");

    auto cfg = dcopy::infra::load_config_from_file(file);
    ASSERT_TRUE(cfg) << cfg.error().describe();
    EXPECT_EQ(cfg->overwrite, "always");
    EXPECT_EQ(cfg->parallel, 3u);
}

TEST_F(ConfigFileTest, MissingExplicitFileIsError)
{
    auto cfg = dcopy::infra::load_config_from_file(path("nope.yaml"));
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::ConfigError);
}

TEST(TransferOptionsTest, Validate)
{
    dcopy::core::TransferOptions opts;
    EXPECT_TRUE(opts.validate());

    opts.chunk_size = 0;
    EXPECT_EQ(opts.validate().error().code, ErrorCode::InvalidArgument);

    opts = {};
    opts.parallelism = 0;
    EXPECT_FALSE(opts.validate());
}

TEST(TransferOptionsTest, PolicyNames)
{
    using namespace dcopy::core;
    EXPECT_EQ(parse_overwrite_policy("smart").value(), OverwritePolicy::Smart);
    EXPECT_EQ(parse_verify_policy("full").value(), VerifyPolicy::Full);
    EXPECT_EQ(parse_reflink_policy("never").value(), ReflinkPolicy::Never);
    EXPECT_FALSE(parse_verify_policy("paranoid"));
    EXPECT_EQ(to_string(OverwritePolicy::Prompt), "prompt");
}
