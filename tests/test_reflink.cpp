#include <cerrno>
#include <filesystem>
#include <variant>
#include <gtest/gtest.h>

#include "adapters/fs.hpp"
#include "adapters/reflink.hpp"
#include "core/orchestrator/orchestrator.hpp"
#include "extensions/resumer.hpp"
#include "engine_fixture.hpp"

using dcopy::core::FileOutcome;
using dcopy::core::ReflinkPolicy;
using dcopy::core::ReflinkStrategy;
using dcopy::core::Unsupported;
using dcopy::infra::ErrorCode;
namespace reflink = dcopy::adapters::reflink;

TEST(ReflinkErrnoTest, UnsupportedErrnos)
{
    EXPECT_TRUE(reflink::is_unsupported_errno(EOPNOTSUPP));
    EXPECT_TRUE(reflink::is_unsupported_errno(EXDEV));
    EXPECT_TRUE(reflink::is_unsupported_errno(EINVAL));
    EXPECT_FALSE(reflink::is_unsupported_errno(EACCES));
    EXPECT_FALSE(reflink::is_unsupported_errno(ENOSPC));
}

class ReflinkTest : public dcopy::test::EngineTest {
protected:
    auto job_for(const std::filesystem::path& src, const std::filesystem::path& dst) -> dcopy::core::FileJob {
        return {src, dst, dcopy::adapters::fs::identity_of(src).value()};
    }
};

// Результат зависит от ФС временного каталога: либо клон, либо чистый отказ
TEST_F(ReflinkTest, CloneOrCleanRefusal)
{
    const auto data = dcopy::test::pattern(10'000);
    const auto src = path("src.bin");
    const auto dst = path("clone.bin");
    dcopy::test::write_file(src, data);

    auto outcome = reflink::clone_into(src, dst);
    ASSERT_TRUE(outcome) << outcome.error().describe();
    if (*outcome == reflink::CloneOutcome::Cloned) {
        EXPECT_EQ(dcopy::test::read_file(dst), data);
    } else {
        EXPECT_FALSE(std::filesystem::exists(dst));
    }
}

TEST_F(ReflinkTest, NeverIsAlwaysUnsupported)
{
    options_.reflink = ReflinkPolicy::Never;
    const auto src = path("src.bin");
    dcopy::test::write_file(src, "data");

    ReflinkStrategy strategy(options_, context_);
    auto attempt = strategy.attempt(job_for(src, path("dst.bin")));
    ASSERT_TRUE(attempt);
    EXPECT_TRUE(std::holds_alternative<Unsupported>(*attempt));
    EXPECT_FALSE(std::filesystem::exists(path("dst.bin")));
}

TEST_F(ReflinkTest, AlwaysEitherClonesOrFails)
{
    options_.reflink = ReflinkPolicy::Always;
    const auto data = dcopy::test::pattern(10'000, 2);
    const auto src = path("src.bin");
    const auto dst = path("dst.bin");
    dcopy::test::write_file(src, data);

    ReflinkStrategy strategy(options_, context_);
    auto attempt = strategy.attempt(job_for(src, dst));
    if (attempt) {
        ASSERT_TRUE(std::holds_alternative<FileOutcome>(*attempt));
        EXPECT_EQ(std::get<FileOutcome>(*attempt).strategy, dcopy::core::StrategyKind::Reflink);
        EXPECT_EQ(dcopy::test::read_file(dst), data);
    } else {
        EXPECT_EQ(attempt.error().code, ErrorCode::ReflinkUnsupported);
        EXPECT_FALSE(std::filesystem::exists(dst));
    }
    EXPECT_FALSE(std::filesystem::exists(dcopy::adapters::fs::partial_path_for(dst)));
}

TEST_F(ReflinkTest, AutoLeavesUnfinishedChunkedTransferAlone)
{
    options_.reflink = ReflinkPolicy::Auto;
    const auto src = path("src.bin");
    const auto dst = path("dst.bin");
    dcopy::test::write_file(src, "data");
    dcopy::test::write_file(dcopy::extensions::ledger_path_for(dst), "version: 1\n");
    dcopy::test::write_file(dcopy::adapters::fs::partial_path_for(dst), "da");

    ReflinkStrategy strategy(options_, context_);
    auto attempt = strategy.attempt(job_for(src, dst));
    ASSERT_TRUE(attempt);
    EXPECT_TRUE(std::holds_alternative<Unsupported>(*attempt));
    EXPECT_EQ(dcopy::test::read_file(dcopy::adapters::fs::partial_path_for(dst)), "da");
}
