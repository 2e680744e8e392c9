#include "test_base.hpp"
#include "core/cache/thumbnail_cache.hpp"
#include "core/file_utils.hpp"
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

class ThumbnailCacheTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        cache_ = std::make_unique<ThumbnailCache>(cachePath());
        ASSERT_TRUE(cache_->initialize().success);
    }

    static ThumbnailCache::Producer producer(std::atomic<int> &calls, uint8_t marker = 0x42)
    {
        return [&calls, marker]()
        {
            calls++;
            EncodedThumbnails encoded;
            encoded.small = {0xFF, 0xD8, marker};
            encoded.medium = {0xFF, 0xD8, marker, marker};
            return MediaResult<EncodedThumbnails>::ok(encoded);
        };
    }

    std::unique_ptr<ThumbnailCache> cache_;
    const std::string checksum_ = std::string(64, 'a');
};

TEST_F(ThumbnailCacheTest, EntryPathsAreDeterministic)
{
    EXPECT_EQ(cache_->entryPath(checksum_, SizeClass::SMALL), (fs::path(cachePath()) / (checksum_ + "_small.jpg")).string());
    EXPECT_EQ(cache_->entryPath(checksum_, SizeClass::MEDIUM), (fs::path(cachePath()) / (checksum_ + "_medium.jpg")).string());
}

TEST_F(ThumbnailCacheTest, GeneratesOnceThenHits)
{
    std::string source = writeFile("a.jpg", "source");
    auto mtime = *FileUtils::getModificationTime(source);
    std::atomic<int> calls{0};

    auto first = cache_->getOrGenerate(source, checksum_, mtime, producer(calls));
    ASSERT_TRUE(first.success);
    EXPECT_TRUE(fs::exists(first.value.small));
    EXPECT_TRUE(fs::exists(first.value.medium));

    auto second = cache_->getOrGenerate(source, checksum_, mtime, producer(calls));
    ASSERT_TRUE(second.success);
    EXPECT_EQ(second.value.small, first.value.small);
    EXPECT_EQ(second.value.medium, first.value.medium);

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(cache_->getGenerations(), 1u);
    EXPECT_EQ(cache_->getHits(), 1u);
    EXPECT_EQ(cache_->getMisses(), 1u);
}

TEST_F(ThumbnailCacheTest, SameContentAtDifferentPathsSharesEntry)
{
    std::string a = writeFile("one/a.jpg", "identical");
    std::string b = writeFile("two/b.jpg", "identical");
    std::string checksum = FileUtils::computeFileHash(a);
    ASSERT_EQ(checksum, FileUtils::computeFileHash(b));

    std::atomic<int> calls{0};
    auto first = cache_->getOrGenerate(a, checksum, *FileUtils::getModificationTime(a), producer(calls));
    auto second = cache_->getOrGenerate(b, checksum, *FileUtils::getModificationTime(a), producer(calls));

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(first.value.small, second.value.small);
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(ThumbnailCacheTest, RegeneratesWhenSourceIsNewer)
{
    std::string source = writeFile("a.jpg", "source");
    std::atomic<int> calls{0};

    auto first = cache_->getOrGenerate(source, checksum_, *FileUtils::getModificationTime(source), producer(calls));
    ASSERT_TRUE(first.success);

    setModificationTime(source, std::chrono::seconds(3600));
    auto lookup = cache_->resolve(source, checksum_, *FileUtils::getModificationTime(source));
    EXPECT_TRUE(lookup.needs_regeneration);

    auto second = cache_->getOrGenerate(source, checksum_, *FileUtils::getModificationTime(source), producer(calls, 0x43));
    ASSERT_TRUE(second.success);
    EXPECT_EQ(calls.load(), 2);
    EXPECT_EQ(FileUtils::readHeader(second.value.small, 8)[2], 0x43);
}

TEST_F(ThumbnailCacheTest, RegeneratesWhenOneSizeIsMissing)
{
    std::string source = writeFile("a.jpg", "source");
    auto mtime = *FileUtils::getModificationTime(source);
    std::atomic<int> calls{0};

    auto first = cache_->getOrGenerate(source, checksum_, mtime, producer(calls));
    ASSERT_TRUE(first.success);
    fs::remove(first.value.medium);

    EXPECT_TRUE(cache_->resolve(source, checksum_, mtime).needs_regeneration);
    auto second = cache_->getOrGenerate(source, checksum_, mtime, producer(calls));
    ASSERT_TRUE(second.success);
    EXPECT_TRUE(fs::exists(second.value.medium));
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(ThumbnailCacheTest, ProducerFailureWritesNothing)
{
    std::string source = writeFile("broken.jpg", "x");
    auto failing = []()
    {
        return MediaResult<EncodedThumbnails>::fail(MediaErrorKind::DECODE_FAILURE, "bad data");
    };

    auto result = cache_->getOrGenerate(source, checksum_, *FileUtils::getModificationTime(source), failing);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, MediaErrorKind::DECODE_FAILURE);
    EXPECT_FALSE(fs::exists(cache_->entryPath(checksum_, SizeClass::SMALL)));
    EXPECT_FALSE(fs::exists(cache_->entryPath(checksum_, SizeClass::MEDIUM)));
    EXPECT_EQ(cache_->getGenerations(), 0u);
}

TEST_F(ThumbnailCacheTest, ConcurrentRequestsForSameChecksumRunProducerOnce)
{
    std::string source = writeFile("a.jpg", "source");
    auto mtime = *FileUtils::getModificationTime(source);
    std::atomic<int> calls{0};

    auto slow = [&calls]()
    {
        calls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        EncodedThumbnails encoded;
        encoded.small = {1, 2, 3};
        encoded.medium = {4, 5, 6};
        return MediaResult<EncodedThumbnails>::ok(encoded);
    };

    std::vector<std::thread> workers;
    std::atomic<int> successes{0};
    for (int i = 0; i < 8; ++i)
    {
        workers.emplace_back([&]()
                             {
            auto result = cache_->getOrGenerate(source, checksum_, mtime, slow);
            if (result.success)
                successes++; });
    }
    for (auto &t : workers)
        t.join();

    EXPECT_EQ(successes.load(), 8);
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(cache_->getGenerations(), 1u);
}

TEST_F(ThumbnailCacheTest, StoreLeavesNoTempFiles)
{
    ASSERT_TRUE(cache_->store(checksum_, SizeClass::SMALL, {9, 9, 9}).success);

    size_t count = 0;
    for (const auto &entry : fs::directory_iterator(cachePath()))
    {
        count++;
        EXPECT_EQ(entry.path().filename().string(), checksum_ + "_small.jpg");
    }
    EXPECT_EQ(count, 1u);
}

TEST_F(ThumbnailCacheTest, ReportsSizeAndClears)
{
    ASSERT_TRUE(cache_->store(checksum_, SizeClass::SMALL, std::vector<uint8_t>(1000, 1)).success);
    ASSERT_TRUE(cache_->store(checksum_, SizeClass::MEDIUM, std::vector<uint8_t>(2000, 1)).success);

    EXPECT_EQ(cache_->getCacheSize(), 3000u);
    EXPECT_EQ(cache_->getCacheSizeString(), "2.9 KB");

    EXPECT_EQ(cache_->clear(), 2u);
    EXPECT_EQ(cache_->getCacheSize(), 0u);
}

TEST_F(ThumbnailCacheTest, InitializeFailsWhenRootIsAFile)
{
    std::string file = writeFile("not_a_dir", "x");
    ThumbnailCache cache(file);
    auto result = cache.initialize();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, MediaErrorKind::CACHE_WRITE_FAILURE);
}
