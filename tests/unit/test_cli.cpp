#include <gtest/gtest.h>
#include "cli.hpp"
#include "TempDir.hpp"

using namespace ssdw;
using namespace ssdw::cli;
using ssdw::test::TempDir;

namespace {

Options parse(std::vector<const char*> args) {
    args.insert(args.begin(), "ssdeep-worker");
    return parseArgs(static_cast<int>(args.size()), args.data());
}

}

TEST(CliTest, PositionalFilesAndFlags) {
    const auto opts = parse({"-o", "/out", "--workflow-id", "wf", "a.txt", "/d/b.txt", "--json"});
    EXPECT_EQ(opts.output_path, "/out");
    EXPECT_EQ(opts.workflow_id, "wf");
    EXPECT_TRUE(opts.json);
    EXPECT_EQ(opts.files, (std::vector<std::string>{"a.txt", "/d/b.txt"}));
}

TEST(CliTest, DoubleDashEndsOptions) {
    const auto opts = parse({"--", "--json"});
    EXPECT_FALSE(opts.json);
    EXPECT_EQ(opts.files, (std::vector<std::string>{"--json"}));
}

TEST(CliTest, UnknownOptionIsUsageError) {
    EXPECT_THROW(parse({"--fuzzy"}), UsageError);
}

TEST(CliTest, MissingValueIsUsageError) {
    EXPECT_THROW(parse({"--output-path"}), UsageError);
}

TEST(CliTest, BuildRequestDefaultsOutputFromConfig) {
    config::Config cfg;
    cfg.worker.output_dir = "/cfg/out";

    const auto req = buildRequest(parse({"/d/evidence.img"}), cfg);

    EXPECT_EQ(req.output_path, "/cfg/out");
    ASSERT_TRUE(req.input_files.has_value());
    ASSERT_EQ(req.input_files->size(), 1u);
    EXPECT_EQ(req.input_files->front().path, "/d/evidence.img");
    EXPECT_EQ(req.input_files->front().displayName(), "evidence.img");
}

TEST(CliTest, NoFilesLeavesInputListAbsent) {
    const auto req = buildRequest(parse({"-p", "abcd"}), config::Config{});
    EXPECT_FALSE(req.input_files.has_value());
    EXPECT_EQ(req.pipe_result, "abcd");
}

TEST(CliTest, FlagsOverrideRequestFile) {
    TempDir dir{"cli_test"};
    const auto reqPath = dir.path() / "request.json";
    ssdw::test::writeText(reqPath, R"({"output_path": "/from/file", "workflow_id": "file-wf",
                                       "input_files": [{"path": "/d/one"}]})");

    const auto req = buildRequest(parse({"-r", reqPath.c_str(), "-w", "cli-wf", "/d/two"}), config::Config{});

    EXPECT_EQ(req.output_path, "/from/file");
    EXPECT_EQ(req.workflow_id, "cli-wf");
    ASSERT_EQ(req.input_files->size(), 2u);
    EXPECT_EQ((*req.input_files)[0].path, "/d/one");
    EXPECT_EQ((*req.input_files)[1].path, "/d/two");
}

TEST(CliTest, UnreadableRequestFileThrows) {
    EXPECT_THROW(buildRequest(parse({"-r", "/nonexistent/request.json"}), config::Config{}), std::runtime_error);
}
