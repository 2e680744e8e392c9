#include "test_base.hpp"
#include "core/directory_scanner.hpp"
#include "core/worker_pool.hpp"
#include <algorithm>
#include <filesystem>
#include <set>
#include <unistd.h>

namespace fs = std::filesystem;

class DirectoryScannerTest : public TestBase
{
protected:
    static std::set<std::string> paths(const ScanOutcome &outcome)
    {
        std::set<std::string> result;
        for (const auto &file : outcome.files)
            result.insert(file.path);
        return result;
    }

    FormatConfig config_ = FormatConfig::defaults();
};

TEST_F(DirectoryScannerTest, FindsMediaRecursivelyAndSkipsOtherFiles)
{
    writeFile("a.jpg", "x");
    writeFile("nested/deeper/b.MOV", "x");
    writeFile("nested/c.png", "x");
    writeFile("notes.txt", "x");
    writeFile("nested/README", "x");

    WorkerPool pool(4);
    DirectoryScanner scanner(&pool);
    auto result = scanner.scan(rootPath(), config_);

    ASSERT_TRUE(result.success) << result.error.message;
    const ScanOutcome &outcome = result.value;
    EXPECT_EQ(outcome.image_count, 2u);
    EXPECT_EQ(outcome.video_count, 1u);
    EXPECT_TRUE(outcome.errors.empty());
    EXPECT_FALSE(outcome.cancelled);

    auto found = paths(outcome);
    EXPECT_EQ(found.count(rootPath("a.jpg")), 1u);
    EXPECT_EQ(found.count(rootPath("nested/deeper/b.MOV")), 1u);
    EXPECT_EQ(found.count(rootPath("nested/c.png")), 1u);

    EXPECT_EQ(scanner.getFilesScanned(), 5u);
    EXPECT_EQ(scanner.getFilesSkipped(), 2u);
    EXPECT_EQ(scanner.getDirectoriesVisited(), 3u);
}

TEST_F(DirectoryScannerTest, ClassifiesWithConfiguredAllowLists)
{
    writeFile("a.jpg", "x");
    writeFile("b.png", "x");
    writeFile("c.mp4", "x");

    FormatConfig config;
    config.image_formats = {"png"};
    config.video_formats = {"mkv"};

    DirectoryScanner scanner;
    auto result = scanner.scan(rootPath(), config);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value.image_count, 1u);
    EXPECT_EQ(result.value.video_count, 0u);
    ASSERT_EQ(result.value.files.size(), 1u);
    EXPECT_EQ(result.value.files[0].media_type, MediaType::IMAGE);
}

TEST_F(DirectoryScannerTest, EmptyDirectoryIsNotAnError)
{
    DirectoryScanner scanner;
    auto result = scanner.scan(rootPath(), config_);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.value.files.empty());
    EXPECT_TRUE(result.value.errors.empty());
}

TEST_F(DirectoryScannerTest, RejectsInvalidRoots)
{
    DirectoryScanner scanner;

    auto missing = scanner.scan(rootPath("does_not_exist"), config_);
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.error.kind, MediaErrorKind::INVALID_ROOT);

    std::string file = writeFile("file.jpg", "x");
    auto not_dir = scanner.scan(file, config_);
    EXPECT_FALSE(not_dir.success);
    EXPECT_EQ(not_dir.error.kind, MediaErrorKind::INVALID_ROOT);

    auto empty = scanner.scan("", config_);
    EXPECT_FALSE(empty.success);
    EXPECT_EQ(empty.error.kind, MediaErrorKind::INVALID_ROOT);
}

TEST_F(DirectoryScannerTest, RootSymlinkLoopIsRejected)
{
    fs::create_symlink(rootPath("loop_b"), rootPath("loop_a"));
    fs::create_symlink(rootPath("loop_a"), rootPath("loop_b"));

    DirectoryScanner scanner;
    auto result = scanner.scan(rootPath("loop_a"), config_);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, MediaErrorKind::SYMLINK_LOOP);
}

TEST_F(DirectoryScannerTest, BrokenAndLoopingLinksAreCollectedAsErrors)
{
    writeFile("good.jpg", "x");
    fs::create_symlink(rootPath("missing.jpg"), rootPath("broken.jpg"));
    fs::create_symlink(rootPath("self.jpg"), rootPath("self.jpg"));

    DirectoryScanner scanner;
    auto result = scanner.scan(rootPath(), config_);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value.files.size(), 1u);
    ASSERT_EQ(result.value.errors.size(), 2u);

    for (const auto &error : result.value.errors)
    {
        if (error.path == rootPath("broken.jpg"))
        {
            EXPECT_EQ(error.message, "UnreadableFile");
            EXPECT_EQ(error.detail, "Broken symbolic link");
        }
        else
        {
            EXPECT_EQ(error.path, rootPath("self.jpg"));
            EXPECT_EQ(error.message, "SymlinkLoop");
        }
    }
}

TEST_F(DirectoryScannerTest, DirectorySymlinksAreNotFollowed)
{
    writeFile("real/a.jpg", "x");
    fs::create_directory_symlink(rootPath("real"), rootPath("alias"));
    fs::create_directory_symlink(rootPath(), rootPath("real/up"));

    DirectoryScanner scanner;
    auto result = scanner.scan(rootPath(), config_);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.value.files.size(), 1u);
    EXPECT_EQ(result.value.files[0].path, rootPath("real/a.jpg"));
    EXPECT_TRUE(result.value.errors.empty());
}

TEST_F(DirectoryScannerTest, FileSymlinksAreIncluded)
{
    writeFile("store/a.jpg", "x");
    fs::create_symlink(rootPath("store/a.jpg"), rootPath("link.jpg"));

    DirectoryScanner scanner;
    auto result = scanner.scan(rootPath(), config_);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value.files.size(), 2u);
}

TEST_F(DirectoryScannerTest, UnreadableSubdirectoryDoesNotAbortScan)
{
    if (geteuid() == 0)
        GTEST_SKIP() << "Permission checks do not apply to root";

    writeFile("ok/a.jpg", "x");
    writeFile("locked/b.jpg", "x");
    fs::permissions(rootPath("locked"), fs::perms::none);

    DirectoryScanner scanner;
    auto result = scanner.scan(rootPath(), config_);
    fs::permissions(rootPath("locked"), fs::perms::owner_all);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value.files.size(), 1u);
    ASSERT_EQ(result.value.errors.size(), 1u);
    EXPECT_EQ(result.value.errors[0].path, rootPath("locked"));
    EXPECT_EQ(result.value.errors[0].message, "UnreadableFile");
}

TEST_F(DirectoryScannerTest, ReportsProgressEveryIntervalAndAtEnd)
{
    for (int i = 0; i < 25; ++i)
        writeFile("dir" + std::to_string(i % 3) + "/img" + std::to_string(i) + ".jpg", "x");

    std::vector<size_t> reported;
    ScanOptions options;
    options.progress_interval = 10;
    options.on_progress = [&reported](const ScanProgress &progress)
    {
        reported.push_back(progress.files_found);
    };

    WorkerPool pool(4);
    DirectoryScanner scanner(&pool);
    auto result = scanner.scan(rootPath(), config_, options);
    ASSERT_TRUE(result.success);

    // Two interval callbacks (10, 20) plus the final one
    ASSERT_EQ(reported.size(), 3u);
    EXPECT_EQ(reported.back(), 25u);
}

TEST_F(DirectoryScannerTest, CancelledScanReturnsPartialOutcome)
{
    for (int i = 0; i < 50; ++i)
        writeFile("d" + std::to_string(i) + "/img.jpg", "x");

    CancellationToken token;
    token.cancel();

    ScanOptions options;
    options.cancel = &token;

    DirectoryScanner scanner;
    auto result = scanner.scan(rootPath(), config_, options);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.value.cancelled);
    EXPECT_LT(result.value.files.size(), 50u);
}

TEST_F(DirectoryScannerTest, ParallelScanMatchesSequentialScan)
{
    for (int d = 0; d < 10; ++d)
        for (int f = 0; f < 10; ++f)
            writeFile("d" + std::to_string(d) + "/s/f" + std::to_string(f) + (f % 2 ? ".jpg" : ".mp4"), "x");

    DirectoryScanner sequential;
    auto a = sequential.scan(rootPath(), config_);

    WorkerPool pool(8);
    DirectoryScanner parallel(&pool);
    auto b = parallel.scan(rootPath(), config_);

    ASSERT_TRUE(a.success);
    ASSERT_TRUE(b.success);
    EXPECT_EQ(paths(a.value), paths(b.value));
    EXPECT_EQ(b.value.image_count, 50u);
    EXPECT_EQ(b.value.video_count, 50u);
}
