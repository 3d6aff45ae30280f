#include "fakes/temp_dir.h"
#include <core/transfer/gsutil_mechanism.h>
#include <core/transfer/transfer_invoker.h>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace bucketpull::core;
using bucketpull::test::TempDir;

namespace {

std::vector<std::string> commonArgs(int threads) {
    return {
        "-m",
        "-o",
        "GSUtil:parallel_thread_count=" + std::to_string(threads),
        "-o",
        "GSUtil:parallel_process_count=1",
        "-o",
        "GSUtil:sliced_object_download_threshold=64M",
        "-o",
        "GSUtil:sliced_object_download_max_components=" + std::to_string(threads),
        "cp",
    };
}

// Stand-in for gsutil that understands `version`, `du` and `cp`.
std::filesystem::path writeFakeTool(const TempDir& dir) {
    auto tool = dir.path() / "fake-gsutil";
    {
        std::ofstream ofs(tool);
        ofs << "#!/bin/sh\n"
               "if [ \"$1\" = version ]; then echo 'gsutil version: 5.27'; exit 0; fi\n"
               "if [ \"$2\" = du ]; then echo \"2048  $4\"; exit 0; fi\n"
               "for last; do :; done\n"
               "case \"$last\" in */) target=\"${last}copied.bin\" ;; *) target=\"$last\" ;; esac\n"
               "if [ -e \"$target\" ]; then echo \"Skipping existing item: $target\"; exit 0; fi\n"
               "echo \"Copying gs://bucket/object...\"\n"
               "printf 'payload' > \"$target\"\n";
    }
    std::filesystem::permissions(tool,
                                 std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace);
    return tool;
}

} // namespace

TEST(GsutilMechanismTest, FileCopyArguments) {
    GsutilMechanism mechanism(GsutilOptions{});
    TransferTask task{.source_path = "gs://bucket/a.txt",
                      .destination_path = "/dl/a.txt",
                      .kind = TransferKind::kFile};

    auto expected = commonArgs(8);
    expected.insert(expected.end(), {"-n", "gs://bucket/a.txt", "/dl/a.txt"});
    EXPECT_EQ(mechanism.BuildCopyArgs(task, 8), expected);
}

TEST(GsutilMechanismTest, FolderCopyTargetsTheParentDirectory) {
    GsutilMechanism mechanism(GsutilOptions{});
    TransferTask task{.source_path = "gs://bucket/photos/",
                      .destination_path = "/dl/photos",
                      .kind = TransferKind::kFolder};

    auto expected = commonArgs(4);
    expected.insert(expected.end(), {"-r", "-n", "gs://bucket/photos", "/dl/"});
    EXPECT_EQ(mechanism.BuildCopyArgs(task, 4), expected);
}

TEST(GsutilMechanismTest, RelativeFolderDestinationUsesCurrentDirectory) {
    GsutilMechanism mechanism(GsutilOptions{});
    TransferTask task{.source_path = "gs://bucket/photos/",
                      .destination_path = "photos",
                      .kind = TransferKind::kFolder};
    EXPECT_EQ(mechanism.BuildCopyArgs(task, 1).back(), "./");
}

TEST(GsutilMechanismTest, ThreadCountIsAtLeastOne) {
    GsutilMechanism mechanism(GsutilOptions{.tool = "gsutil", .sliced_download_threshold = "1G"});
    TransferTask task{.source_path = "gs://bucket/a", .destination_path = "/dl/a"};
    auto args = mechanism.BuildCopyArgs(task, 0);
    EXPECT_EQ(args[2], "GSUtil:parallel_thread_count=1");
    EXPECT_EQ(args[6], "GSUtil:sliced_object_download_threshold=1G");
}

TEST(GsutilMechanismTest, ParsesCopyOutput) {
    auto counts = GsutilMechanism::ParseCopyOutput(
        "Copying gs://bucket/a.txt...\n"
        "Skipping existing item: file:///dl/b.txt\n"
        "Copying gs://bucket/c.txt...\n"
        "/ [2 files][  1.2 MiB/  1.2 MiB]\n"
        "Operation completed over 2 objects/1.2 MiB.\n");
    EXPECT_EQ(counts.copied, 2u);
    EXPECT_EQ(counts.skipped, 1u);
}

TEST(GsutilMechanismTest, ParsesDuOutput) {
    EXPECT_EQ(GsutilMechanism::ParseDuOutput("123456  gs://bucket/photos\n"), 123456u);
    EXPECT_FALSE(GsutilMechanism::ParseDuOutput(""));
    EXPECT_FALSE(GsutilMechanism::ParseDuOutput("CommandException: No URLs matched"));
}

TEST(GsutilMechanismTest, DrivesTheToolEndToEnd) {
    TempDir dir;
    auto tool = writeFakeTool(dir);
    GsutilMechanism mechanism(GsutilOptions{.tool = tool.string(),
                                            .sliced_download_threshold = "64M"});

    auto version = mechanism.ProbeTool();
    ASSERT_TRUE(version);
    EXPECT_EQ(*version, "gsutil version: 5.27");

    TransferTask task{.source_path = "gs://bucket/a.bin",
                      .destination_path = (dir.path() / "nested" / "a.bin").string()};
    EXPECT_EQ(mechanism.EstimateSize(task, {}), 2048u);

    TransferInvoker invoker(mechanism);
    auto first = invoker.Execute(task, 2, {});
    EXPECT_EQ(first.status, TransferStatus::kSuccess);
    EXPECT_TRUE(std::filesystem::exists(task.destination_path));

    auto second = invoker.Execute(task, 2, {});
    EXPECT_EQ(second.status, TransferStatus::kSkipped);
}

TEST(GsutilMechanismTest, MissingToolFailsTheProbe) {
    GsutilMechanism mechanism(GsutilOptions{.tool = "bucketpull-no-such-tool",
                                            .sliced_download_threshold = "64M"});
    EXPECT_FALSE(mechanism.ProbeTool());
}
