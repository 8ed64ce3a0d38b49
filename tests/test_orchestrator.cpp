#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>

#include "core/orchestrator/orchestrator.hpp"
#include "extensions/resumer.hpp"
#include "engine_fixture.hpp"

using dcopy::core::ConfirmChoice;
using dcopy::core::FileStatus;
using dcopy::core::Orchestrator;
using dcopy::core::OverwritePolicy;
using dcopy::core::StrategyKind;
using dcopy::core::TransferMode;
using dcopy::core::TransferRequest;
using dcopy::infra::ErrorCode;
using dcopy::test::kChunk;

namespace {

class ScriptedConfirm : public dcopy::core::ConfirmSink {
public:
    explicit ScriptedConfirm(ConfirmChoice answer) : answer_(answer) {}

    auto confirm_overwrite(const std::filesystem::path&, const std::filesystem::path& destination)
        -> ConfirmChoice override
    {
        asked.push_back(destination);
        return answer_;
    }

    std::vector<std::filesystem::path> asked;

private:
    ConfirmChoice answer_;
};

void set_age(const std::filesystem::path& p, std::chrono::hours age) {
    std::filesystem::last_write_time(p, std::filesystem::file_time_type::clock::now() - age);
}

} // namespace

class OrchestratorTest : public dcopy::test::EngineTest {
protected:
    auto run(std::vector<std::filesystem::path> sources, const std::filesystem::path& destination,
             TransferMode mode = TransferMode::Copy, dcopy::core::ConfirmSink* confirm = nullptr)
    {
        Orchestrator orchestrator(cancel_, [this](std::uint64_t offset, std::size_t) { on_read(offset); });
        TransferRequest request(std::move(sources), destination, options_, mode);
        return orchestrator.orchestrate(request, nullptr, confirm);
    }
};

TEST_F(OrchestratorTest, CopiesSingleFile)
{
    const auto data = dcopy::test::pattern(100 * 1024);
    dcopy::test::write_file(path("a.bin"), data);

    auto result = run({path("a.bin")}, path("b.bin"));
    ASSERT_TRUE(result) << result.error().describe();
    ASSERT_EQ(result->files.size(), 1u);
    EXPECT_EQ(result->files[0].status, FileStatus::Completed);
    EXPECT_EQ(result->files[0].strategy, StrategyKind::Sequential);
    EXPECT_EQ(result->bytes_transferred, data.size());
    EXPECT_TRUE(result->verified);
    EXPECT_EQ(dcopy::test::read_file(path("b.bin")), data);
}

TEST_F(OrchestratorTest, CopiesIntoExistingDirectory)
{
    dcopy::test::write_file(path("a.txt"), "alpha");
    std::filesystem::create_directories(path("out"));

    auto result = run({path("a.txt")}, path("out"));
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(dcopy::test::read_file(path("out/a.txt")), "alpha");
}

TEST_F(OrchestratorTest, OverwriteNeverKeepsDestination)
{
    options_.overwrite = OverwritePolicy::Never;
    dcopy::test::write_file(path("a.txt"), "new");
    dcopy::test::write_file(path("b.txt"), "old");

    auto result = run({path("a.txt")}, path("b.txt"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::TargetExists);
    EXPECT_EQ(result.error().to_exit_code(), 17);
    EXPECT_EQ(dcopy::test::read_file(path("b.txt")), "old");
    EXPECT_TRUE(reads().empty());
}

TEST_F(OrchestratorTest, InPlaceRunHonoursPolicyOverAtomicLedger)
{
    const auto data = dcopy::test::pattern(150 * 1024, 31);
    const auto old = dcopy::test::pattern(150 * 1024, 32);
    dcopy::test::write_file(path("a.bin"), data);
    dcopy::test::write_file(path("b.bin"), old);

    options_.overwrite = OverwritePolicy::Always;
    cancel_after_ = 2;
    ASSERT_FALSE(run({path("a.bin")}, path("b.bin")));
    ASSERT_TRUE(std::filesystem::exists(dcopy::extensions::ledger_path_for(path("b.bin"))));

    restart();
    options_.atomic = false;
    options_.overwrite = OverwritePolicy::Never;
    auto result = run({path("a.bin")}, path("b.bin"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::TargetExists);
    EXPECT_TRUE(reads().empty());
    EXPECT_EQ(dcopy::test::read_file(path("b.bin")), old);

    // С разрешением на перезапись ledger чужого режима всё равно не используется
    restart();
    options_.overwrite = OverwritePolicy::Always;
    auto retried = run({path("a.bin")}, path("b.bin"));
    ASSERT_FALSE(retried);
    EXPECT_EQ(retried.error().code, ErrorCode::InvalidResumeState);
    EXPECT_EQ(dcopy::test::read_file(path("b.bin")), old);
}

TEST_F(OrchestratorTest, OverwriteSmartComparesMtime)
{
    options_.overwrite = OverwritePolicy::Smart;
    dcopy::test::write_file(path("src/a.txt"), "fresh");
    dcopy::test::write_file(path("src/b.txt"), "stale");
    dcopy::test::write_file(path("dst/a.txt"), "older copy");
    dcopy::test::write_file(path("dst/b.txt"), "newer copy");
    set_age(path("src/a.txt"), std::chrono::hours(1));
    set_age(path("dst/a.txt"), std::chrono::hours(2));
    set_age(path("src/b.txt"), std::chrono::hours(2));
    set_age(path("dst/b.txt"), std::chrono::hours(1));

    auto result = run({path("src/a.txt"), path("src/b.txt")}, path("dst"));
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(result->count(FileStatus::Completed), 1u);
    EXPECT_EQ(result->count(FileStatus::Skipped), 1u);
    EXPECT_EQ(dcopy::test::read_file(path("dst/a.txt")), "fresh");
    EXPECT_EQ(dcopy::test::read_file(path("dst/b.txt")), "newer copy");
}

TEST_F(OrchestratorTest, PromptSkipAndAbort)
{
    options_.overwrite = OverwritePolicy::Prompt;
    dcopy::test::write_file(path("a.txt"), "new");
    dcopy::test::write_file(path("b.txt"), "old");

    ScriptedConfirm skip(ConfirmChoice::Skip);
    auto skipped = run({path("a.txt")}, path("b.txt"), TransferMode::Copy, &skip);
    ASSERT_TRUE(skipped) << skipped.error().describe();
    EXPECT_EQ(skipped->count(FileStatus::Skipped), 1u);
    EXPECT_EQ(skip.asked, (std::vector<std::filesystem::path>{path("b.txt")}));
    EXPECT_EQ(dcopy::test::read_file(path("b.txt")), "old");

    ScriptedConfirm refuse(ConfirmChoice::Abort);
    auto aborted = run({path("a.txt")}, path("b.txt"), TransferMode::Copy, &refuse);
    ASSERT_FALSE(aborted);
    EXPECT_EQ(aborted.error().code, ErrorCode::UserAborted);
    EXPECT_EQ(dcopy::test::read_file(path("b.txt")), "old");

    ScriptedConfirm yes(ConfirmChoice::Overwrite);
    ASSERT_TRUE(run({path("a.txt")}, path("b.txt"), TransferMode::Copy, &yes));
    EXPECT_EQ(dcopy::test::read_file(path("b.txt")), "new");
}

TEST_F(OrchestratorTest, PromptWithoutHandlerIsError)
{
    options_.overwrite = OverwritePolicy::Prompt;
    dcopy::test::write_file(path("a.txt"), "new");
    dcopy::test::write_file(path("b.txt"), "old");

    auto result = run({path("a.txt")}, path("b.txt"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(OrchestratorTest, CopiesDirectoryTree)
{
    dcopy::test::write_file(path("tree/top.txt"), "top");
    dcopy::test::write_file(path("tree/a/b/deep.txt"), "deep");
    dcopy::test::write_file(path("tree/a/empty.txt"), "");

    auto result = run({path("tree")}, path("copy"));
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(result->count(FileStatus::Completed), 3u);
    EXPECT_EQ(dcopy::test::read_file(path("copy/top.txt")), "top");
    EXPECT_EQ(dcopy::test::read_file(path("copy/a/b/deep.txt")), "deep");
    EXPECT_TRUE(std::filesystem::exists(path("copy/a/empty.txt")));
    EXPECT_TRUE(std::filesystem::exists(path("tree/top.txt")));
}

TEST_F(OrchestratorTest, ParallelFilePool)
{
    options_.parallelism = 3;
    std::vector<std::filesystem::path> sources;
    for (int i = 0; i < 6; ++i) {
        const auto name = "f" + std::to_string(i);
        dcopy::test::write_file(path("in/" + name), dcopy::test::pattern(20'000, i + 1));
        sources.push_back(path("in/" + name));
    }

    auto result = run(sources, path("out"));
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(result->count(FileStatus::Completed), 6u);
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(dcopy::test::read_file(path("out/f" + std::to_string(i))),
                  dcopy::test::pattern(20'000, i + 1));
    }
}

TEST_F(OrchestratorTest, LargeFileUsesRanges)
{
    options_.parallelism = 4;
    options_.parallel_threshold = 4 * kChunk;
    const auto data = dcopy::test::pattern(10 * kChunk + 5, 21);
    dcopy::test::write_file(path("big.bin"), data);

    auto result = run({path("big.bin")}, path("big.copy"));
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(result->files[0].strategy, StrategyKind::ParallelRanges);
    EXPECT_EQ(dcopy::test::read_file(path("big.copy")), data);
}

TEST_F(OrchestratorTest, MissingSourceAmongSeveral)
{
    dcopy::test::write_file(path("a.txt"), "alpha");

    auto result = run({path("a.txt"), path("missing.txt")}, path("out"));
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(result->count(FileStatus::Completed), 1u);
    EXPECT_EQ(result->count(FileStatus::Failed), 1u);
    ASSERT_NE(result->first_error(), nullptr);
    EXPECT_EQ(result->first_error()->code, ErrorCode::SourceNotFound);

    options_.fail_fast = true;
    std::filesystem::remove_all(path("out"));
    auto strict = run({path("a.txt"), path("missing.txt")}, path("out"));
    ASSERT_FALSE(strict);
    EXPECT_EQ(strict.error().code, ErrorCode::SourceNotFound);
}

TEST_F(OrchestratorTest, RejectsDirectoryIntoItself)
{
    dcopy::test::write_file(path("tree/a.txt"), "a");

    auto result = run({path("tree")}, path("tree/inner"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(OrchestratorTest, MovesFileAndTree)
{
    dcopy::test::write_file(path("one.txt"), "one");
    auto file = run({path("one.txt")}, path("moved.txt"), TransferMode::Move);
    ASSERT_TRUE(file) << file.error().describe();
    EXPECT_EQ(file->files[0].strategy, StrategyKind::Rename);
    EXPECT_FALSE(std::filesystem::exists(path("one.txt")));
    EXPECT_EQ(dcopy::test::read_file(path("moved.txt")), "one");

    dcopy::test::write_file(path("tree/x/y.txt"), "y");
    auto tree = run({path("tree")}, path("tree2"), TransferMode::Move);
    ASSERT_TRUE(tree) << tree.error().describe();
    EXPECT_FALSE(std::filesystem::exists(path("tree")));
    EXPECT_EQ(dcopy::test::read_file(path("tree2/x/y.txt")), "y");
}

TEST_F(OrchestratorTest, MoveMergesIntoExistingDirectory)
{
    options_.overwrite = OverwritePolicy::Always;
    dcopy::test::write_file(path("src/a.txt"), "a");
    dcopy::test::write_file(path("src/sub/b.txt"), "b");
    dcopy::test::write_file(path("dst/src/keep.txt"), "keep");

    auto result = run({path("src")}, path("dst"), TransferMode::Move);
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(result->count(FileStatus::Completed), 2u);
    EXPECT_EQ(dcopy::test::read_file(path("dst/src/a.txt")), "a");
    EXPECT_EQ(dcopy::test::read_file(path("dst/src/sub/b.txt")), "b");
    EXPECT_EQ(dcopy::test::read_file(path("dst/src/keep.txt")), "keep");
    EXPECT_FALSE(std::filesystem::exists(path("src")));
}

TEST_F(OrchestratorTest, CancelledRunReportsAbort)
{
    dcopy::test::write_file(path("a.bin"), dcopy::test::pattern(3 * kChunk));
    cancel_after_ = 1;

    auto result = run({path("a.bin")}, path("b.bin"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::UserAborted);
    EXPECT_EQ(result.error().to_exit_code(), 130);
    EXPECT_FALSE(std::filesystem::exists(path("b.bin")));
}
