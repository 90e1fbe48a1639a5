#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <format>
#include <thread>

#include "cache/FileListCache.hpp"
#include "TestHelpers.hpp"

using namespace std::chrono_literals;

class FileListCacheTest : public ::testing::Test {
  protected:
    CTempDir                 state;
    const std::string        DIR   = "/srv/pictures";
    std::vector<std::string> files = {"/srv/pictures/a.jpg", "/srv/pictures/b/c.png", "/srv/pictures/with space.gif"};

    UP<CFileListCache>       open(const std::string& dir, std::chrono::seconds ttl = 3h) {
        auto cache = CFileListCache::open(state.path(), dir, ttl);
        EXPECT_TRUE(cache.has_value());
        return std::move(*cache);
    }
};

TEST_F(FileListCacheTest, MissingRecordLoadsNothing) {
    auto cache = open(DIR);
    EXPECT_FALSE(cache->load().has_value());
}

TEST_F(FileListCacheTest, RoundTrip) {
    {
        auto cache = open(DIR);
        ASSERT_FALSE(cache->load().has_value());
        ASSERT_TRUE(cache->store(files).has_value());
    }

    auto       cache  = open(DIR);
    const auto LOADED = cache->load();
    ASSERT_TRUE(LOADED.has_value());
    EXPECT_EQ(*LOADED, files);
}

TEST_F(FileListCacheTest, OtherDirectoryMisses) {
    {
        auto cache = open(DIR);
        ASSERT_TRUE(cache->store(files).has_value());
    }

    auto other = open("/srv/other");
    EXPECT_FALSE(other->load().has_value());
}

TEST_F(FileListCacheTest, RecordForAnotherDirectoryIsNotServed) {
    auto cache = open(DIR);

    // same record file, different directory inside, as a hash collision would look
    writeFile(cache->recordPath(), std::format("{}\n{}\n/srv/impostor\nx.jpg\n", CFileListCache::RECORD_MAGIC, std::time(nullptr)));

    EXPECT_FALSE(cache->load().has_value());
}

TEST_F(FileListCacheTest, ExpiredRecordMisses) {
    auto cache = open(DIR);
    writeFile(cache->recordPath(), std::format("{}\n{}\n{}\na.jpg\n", CFileListCache::RECORD_MAGIC, std::time(nullptr) - 4 * 3600, DIR));

    EXPECT_FALSE(cache->load().has_value());

    writeFile(cache->recordPath(), std::format("{}\n{}\n{}\na.jpg\n", CFileListCache::RECORD_MAGIC, std::time(nullptr) - 60, DIR));

    const auto LOADED = cache->load();
    ASSERT_TRUE(LOADED.has_value());
    EXPECT_EQ(*LOADED, std::vector<std::string>{"/srv/pictures/a.jpg"});
}

TEST_F(FileListCacheTest, ZeroTTLNeverHits) {
    {
        auto cache = open(DIR, 0s);
        ASSERT_TRUE(cache->store(files).has_value());
    }

    auto cache = open(DIR, 0s);
    EXPECT_FALSE(cache->load().has_value());
}

TEST_F(FileListCacheTest, StoreAfterLoadKeepsRecord) {
    {
        auto cache = open(DIR);
        ASSERT_TRUE(cache->store(files).has_value());
    }

    {
        auto cache = open(DIR);
        ASSERT_TRUE(cache->load().has_value());
        ASSERT_TRUE(cache->store({"/srv/pictures/new.jpg"}).has_value());
    }

    auto       cache  = open(DIR);
    const auto LOADED = cache->load();
    ASSERT_TRUE(LOADED.has_value());
    EXPECT_EQ(*LOADED, files);
}

TEST_F(FileListCacheTest, MalformedRecordMisses) {
    auto cache = open(DIR);
    writeFile(cache->recordPath(), "garbage\n");
    EXPECT_FALSE(cache->load().has_value());

    writeFile(cache->recordPath(), std::format("{}\nnot-a-number\n{}\na.jpg\n", CFileListCache::RECORD_MAGIC, DIR));
    EXPECT_FALSE(cache->load().has_value());
}

TEST_F(FileListCacheTest, InvalidateRemovesRecord) {
    auto cache = open(DIR);
    ASSERT_TRUE(cache->store(files).has_value());
    ASSERT_TRUE(std::filesystem::exists(cache->recordPath()));

    ASSERT_TRUE(cache->invalidate().has_value());
    EXPECT_FALSE(std::filesystem::exists(cache->recordPath()));
    EXPECT_FALSE(cache->load().has_value());
}

TEST_F(FileListCacheTest, NoTemporaryFilesLeftBehind) {
    auto cache = open(DIR);
    ASSERT_TRUE(cache->store(files).has_value());

    for (const auto& entry : std::filesystem::directory_iterator(state / "lists")) {
        EXPECT_FALSE(entry.path().string().contains(".tmp.")) << entry.path();
    }
}

TEST_F(FileListCacheTest, SecondOpenWaitsForFirst) {
    auto              first = open(DIR);
    std::atomic<bool> released{false};
    std::atomic<bool> sawRelease{false};
    std::atomic<bool> sawList{false};

    std::thread       waiter([&] {
        auto second = CFileListCache::open(state.path(), DIR, 3h);
        ASSERT_TRUE(second.has_value());
        sawRelease = released.load();
        sawList    = (*second)->load().has_value();
    });

    std::this_thread::sleep_for(200ms);
    ASSERT_TRUE(first->store(files).has_value());
    released = true;
    first.reset();

    waiter.join();

    EXPECT_TRUE(sawRelease);
    EXPECT_TRUE(sawList);
}
