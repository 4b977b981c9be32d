#include <gtest/gtest.h>
#include "hash/BatchHasher.hpp"
#include "hash/SsdeepRunner.hpp"
#include "storage/LocalOutputStore.hpp"
#include "log/Registry.hpp"
#include "FakeRunner.hpp"
#include "LogCapture.hpp"
#include "TempDir.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using namespace ssdw;
using namespace ssdw::hash;
using namespace ssdw::task::model;
using ssdw::test::FakeRunner;
using ssdw::test::LogCapture;
using ssdw::test::TempDir;
using ssdw::test::readText;

namespace {

InputFile input(const std::string& path, const std::string& displayName) {
    InputFile f;
    f.path = path;
    f.display_name = displayName;
    return f;
}

// Refuses every allocation, like a full or read-only output volume
class FailingStore final : public storage::OutputStore {
public:
    OutputFile create(const std::string&, const std::string&, const std::string&,
                      const std::optional<std::string>&) override {
        throw std::runtime_error("output volume unavailable");
    }
};

}

class BatchHasherTest : public ::testing::Test {
protected:
    TempDir out{"batch_hasher_test"};
    std::shared_ptr<FakeRunner> runner = std::make_shared<FakeRunner>();
    std::shared_ptr<storage::LocalOutputStore> store = std::make_shared<storage::LocalOutputStore>(out.path());
    std::shared_ptr<spdlog::logger> logger = std::make_shared<spdlog::logger>("batch_hasher_test");
    LogCapture logs{logger};

    [[nodiscard]] BatchHasher hasher() const { return {runner, store, logger}; }
};

TEST_F(BatchHasherTest, SuccessScenarioWritesDigest) {
    runner->on("/data/a.txt", 0, "HASH123,\"a.txt\"");

    const auto result = hasher().run({input("/data/a.txt", "a.txt")}, "wf-1");

    ASSERT_EQ(result.output_files.size(), 1u);
    const auto& artifact = result.output_files.front();
    EXPECT_EQ(readText(artifact.path), "HASH123\n");
    EXPECT_EQ(artifact.display_name, "SSDeep hash for a.txt.ssdeep");
    EXPECT_EQ(artifact.extension, "ssdeep");
    EXPECT_EQ(artifact.data_type, "text/plain");
    EXPECT_EQ(artifact.path.parent_path(), out.path());
    EXPECT_EQ(result.workflow_id, "wf-1");
    EXPECT_EQ(result.command, "ssdeep -s -b");
    EXPECT_TRUE(result.meta.is_object());
    EXPECT_TRUE(result.meta.empty());
    EXPECT_FALSE(logs.has(spdlog::level::warn, {}));
}

TEST_F(BatchHasherTest, ErrorScenarioWritesErrorText) {
    runner->on("/data/b.txt", 1, "", "file not found");

    const auto result = hasher().run({input("/data/b.txt", "b.txt")});

    ASSERT_EQ(result.output_files.size(), 1u);
    EXPECT_EQ(readText(result.output_files[0].path), "Error running ssdeep (code 1): file not found\n");
    EXPECT_TRUE(logs.has(spdlog::level::warn, {"/data/b.txt", "Error running ssdeep (code 1): file not found"}));
}

TEST_F(BatchHasherTest, NoticeScenarioWritesNoticeText) {
    runner->on("/data/c.txt", 0, "c.txt is too small to produce meaningful results");

    const auto result = hasher().run({input("/data/c.txt", "c.txt")});

    ASSERT_EQ(result.output_files.size(), 1u);
    EXPECT_EQ(readText(result.output_files[0].path),
              "SSDeep notice: c.txt is too small to produce meaningful results\n");
}

TEST_F(BatchHasherTest, MissingPathIsSkippedNotCounted) {
    InputFile noPath;
    noPath.display_name = "ghost.txt";
    InputFile emptyPath;
    emptyPath.path = "";

    const auto result = hasher().run({noPath, input("/data/a.txt", "a.txt"), emptyPath});

    EXPECT_EQ(result.output_files.size(), 1u);
    EXPECT_EQ(runner->calls, (std::vector<std::string>{"/data/a.txt"}));
    EXPECT_TRUE(result.meta.empty());
    EXPECT_TRUE(logs.has(spdlog::level::warn, {"Skipping file entry with no path", "ghost.txt"}));
    EXPECT_FALSE(logs.has(spdlog::level::warn, {"generated no output files"}));
}

TEST_F(BatchHasherTest, AllSkippedStillSucceedsWithNoArtifacts) {
    InputFile a, b;
    a.display_name = "a";
    b.filename = "b";

    const auto result = hasher().run({a, b});

    EXPECT_TRUE(result.output_files.empty());
    EXPECT_TRUE(runner->calls.empty());
    EXPECT_TRUE(result.meta.empty());
    EXPECT_TRUE(fs::is_empty(out.path()));
    EXPECT_TRUE(logs.has(spdlog::level::warn, {"generated no output files"}));
}

TEST_F(BatchHasherTest, EmptyInputReportsMessage) {
    const auto result = hasher().run({}, "wf-empty");

    EXPECT_TRUE(result.output_files.empty());
    EXPECT_EQ(result.command, "ssdeep -s -b");
    EXPECT_EQ(result.meta.at("message"), NO_INPUT_MESSAGE);
    EXPECT_TRUE(runner->calls.empty());
    EXPECT_FALSE(logs.has(spdlog::level::warn, {"generated no output files"}));
}

TEST_F(BatchHasherTest, ArtifactsFollowInputOrder) {
    runner->on("/d/1", 0, "ONE,\"1\"").on("/d/2", 1, "", "bad").on("/d/3", 0, "small");

    const auto result = hasher().run({input("/d/1", "1"), input("/d/2", "2"), input("/d/3", "3")});

    ASSERT_EQ(result.output_files.size(), 3u);
    EXPECT_EQ(runner->calls, (std::vector<std::string>{"/d/1", "/d/2", "/d/3"}));
    EXPECT_EQ(readText(result.output_files[0].path), "ONE\n");
    EXPECT_EQ(readText(result.output_files[1].path), "Error running ssdeep (code 1): bad\n");
    EXPECT_EQ(readText(result.output_files[2].path), "SSDeep notice: small\n");
    EXPECT_EQ(result.output_files[1].display_name, "SSDeep hash for 2.ssdeep");
    EXPECT_TRUE(logs.has(spdlog::level::info, {"Processed 3 input(s): 1 hashed, 1 notice(s), 1 error(s), 0 skipped"}));
}

TEST_F(BatchHasherTest, OneFailingFileDoesNotAbortBatch) {
    runner->throws["/d/boom"] = "fork failed: Resource temporarily unavailable";

    const auto result = hasher().run({input("/d/boom", "boom"), input("/d/ok", "ok")});

    ASSERT_EQ(result.output_files.size(), 2u);
    EXPECT_EQ(readText(result.output_files[0].path),
              "Error running ssdeep (code -1): fork failed: Resource temporarily unavailable\n");
    EXPECT_TRUE(logs.has(spdlog::level::warn, {"/d/boom", "fork failed"}));
    EXPECT_EQ(readText(result.output_files[1].path), "3:default:digest\n");
}

TEST_F(BatchHasherTest, MissingToolBecomesErrorArtifact) {
    const BatchHasher realHasher(std::make_shared<SsdeepRunner>((out.path() / "not-installed").string()),
                                 store, log::Registry::hash());

    const auto result = realHasher.run({input("/data/a.txt", "a.txt")});

    ASSERT_EQ(result.output_files.size(), 1u);
    EXPECT_EQ(readText(result.output_files[0].path).rfind("Error running ssdeep (code 127): failed to execute", 0), 0u);
}

TEST_F(BatchHasherTest, DisplayNameFallsBackToFilenameThenPlaceholder) {
    InputFile byFilename;
    byFilename.path = "/d/x";
    byFilename.filename = "x.bin";
    InputFile anonymous;
    anonymous.path = "/d/y";

    const auto result = hasher().run({byFilename, anonymous});

    ASSERT_EQ(result.output_files.size(), 2u);
    EXPECT_EQ(result.output_files[0].display_name, "SSDeep hash for x.bin.ssdeep");
    EXPECT_EQ(result.output_files[1].display_name, "SSDeep hash for input_file.ssdeep");
}

TEST_F(BatchHasherTest, SourceIdCarriedToArtifact) {
    auto in = input("/d/a", "a");
    in.uuid = "file-uuid-1";

    const auto result = hasher().run({in});

    ASSERT_EQ(result.output_files.size(), 1u);
    EXPECT_EQ(result.output_files[0].source_file_id, "file-uuid-1");
}

TEST_F(BatchHasherTest, StoreFailurePropagates) {
    const BatchHasher broken(runner, std::make_shared<FailingStore>(), log::Registry::hash());
    EXPECT_THROW((void)broken.run({input("/d/a", "a")}), std::runtime_error);
}

TEST_F(BatchHasherTest, NullCollaboratorsRejected) {
    EXPECT_THROW(BatchHasher(nullptr, store, log::Registry::hash()), std::invalid_argument);
    EXPECT_THROW(BatchHasher(runner, nullptr, log::Registry::hash()), std::invalid_argument);
    EXPECT_THROW(BatchHasher(runner, store, nullptr), std::invalid_argument);
}
