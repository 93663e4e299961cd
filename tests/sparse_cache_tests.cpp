#include "cache/sparse_cache.h"
#include "mocks/mock_upstream_fetcher.h"
#include "utilities/errors.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace gutex;
using ::testing::InSequence;
using ::testing::Return;

namespace {

std::string makeContent(std::size_t size) {
    std::string out;
    out.reserve(size);
    for (std::size_t i = 0; i < size; ++i)
        out.push_back(static_cast<char>('a' + (i * 7 + i / 26) % 26));
    return out;
}

} // namespace

class SparseCacheTest : public ::testing::Test {
protected:
    std::string dir_;
    std::shared_ptr<MemoryUpstream> upstream_;

    void SetUp() override {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = (std::filesystem::temp_directory_path() /
                (std::string("gutex_sparse_cache_") + info->name()))
                   .string();
        std::filesystem::remove_all(dir_);
        upstream_ = std::make_shared<MemoryUpstream>();
    }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    SparseCacheOptions options(std::int64_t blockSize = 64, std::int64_t gap = 0) const {
        SparseCacheOptions opts;
        opts.cacheDir = dir_;
        opts.blockSize = blockSize;
        opts.maxCoalesceGap = gap;
        return opts;
    }

    std::string file(const std::string &name) const { return dir_ + "/" + name; }
};

TEST_F(SparseCacheTest, SecondOverlappingReadFetchesOnlyMissingBlocks) {
    auto mock = std::make_shared<MockUpstreamFetcher>();
    const std::string content = makeContent(512);
    {
        InSequence seq;
        EXPECT_CALL(*mock, head("1342")).WillOnce(Return(UpstreamHead{512, std::string("\"v1\""), std::nullopt}));
        EXPECT_CALL(*mock, getRange("1342", 0, 63)).WillOnce(Return(content.substr(0, 64)));
        EXPECT_CALL(*mock, getRange("1342", 64, 127)).WillOnce(Return(content.substr(64, 64)));
    }

    SparseCache cache(mock, options());
    EXPECT_EQ(cache.getRange("1342", 0, 63), content.substr(0, 64));
    EXPECT_EQ(cache.getRange("1342", 0, 127), content.substr(0, 128));
}

TEST_F(SparseCacheTest, FullyCachedRangeMakesNoUpstreamCall) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    SparseCache cache(upstream_, options());

    EXPECT_EQ(cache.getRange("doc", 100, 300), content.substr(100, 201));
    upstream_->clearRequests();

    RangeSource source;
    EXPECT_EQ(cache.getRange("doc", 150, 250, &source), content.substr(150, 101));
    EXPECT_TRUE(upstream_->requests().empty());
    EXPECT_EQ(upstream_->headCount(), 0u);
    EXPECT_EQ(source.fromCache, 101);
    EXPECT_EQ(source.fromNetwork, 0);
}

TEST_F(SparseCacheTest, SmallCachedGapIsRefetchedInOneRequest) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    SparseCache cache(upstream_, options(64, 64));

    cache.getRange("doc", 64, 127);
    upstream_->clearRequests();

    EXPECT_EQ(cache.getRange("doc", 0, 255), content.substr(0, 256));
    auto requests = upstream_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].start, 0);
    EXPECT_EQ(requests[0].end, 255);
}

TEST_F(SparseCacheTest, LargeCachedGapSplitsRequests) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    SparseCache cache(upstream_, options(64, 0));

    cache.getRange("doc", 64, 127);
    upstream_->clearRequests();

    EXPECT_EQ(cache.getRange("doc", 0, 255), content.substr(0, 256));
    auto requests = upstream_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].start, 0);
    EXPECT_EQ(requests[0].end, 63);
    EXPECT_EQ(requests[1].start, 128);
    EXPECT_EQ(requests[1].end, 255);
}

TEST_F(SparseCacheTest, LastPartialBlockIsFetchedToEndOfFile) {
    const std::string content = makeContent(500);
    upstream_->setDocument("doc", content);
    SparseCache cache(upstream_, options());

    EXPECT_EQ(cache.getRange("doc", 490, 10000), content.substr(490));
    auto requests = upstream_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].start, 448);
    EXPECT_EQ(requests[0].end, 499);

    auto stats = cache.getResourceStats("doc");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->totalBlocks, 8);
    EXPECT_EQ(stats->blocksCached, 1);
}

TEST_F(SparseCacheTest, CoverageNeverDecreasesWithoutInvalidation) {
    const std::string content = makeContent(4096);
    upstream_->setDocument("doc", content);
    SparseCache cache(upstream_, options());

    const std::pair<std::int64_t, std::int64_t> reads[] = {
        {1000, 1100}, {0, 10}, {3000, 4095}, {1050, 1060}, {500, 2500}, {0, 4095}};
    std::int64_t previous = 0;
    for (const auto &[start, end] : reads) {
        EXPECT_EQ(cache.getRange("doc", start, end), content.substr(start, end - start + 1));
        auto stats = cache.getResourceStats("doc");
        ASSERT_TRUE(stats.has_value());
        EXPECT_GE(stats->blocksCached, previous);
        previous = stats->blocksCached;
    }
    EXPECT_EQ(previous, 64);
    EXPECT_DOUBLE_EQ(cache.getResourceStats("doc")->coveragePercent, 100.0);
}

TEST_F(SparseCacheTest, RangesOutsideResourceAreClampedOrEmpty) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    SparseCache cache(upstream_, options());

    EXPECT_EQ(cache.getRange("doc", 500, 1000), content.substr(500));
    EXPECT_EQ(cache.getRange("doc", -20, 3), content.substr(0, 4));
    EXPECT_EQ(cache.getRange("doc", 600, 700), "");
    EXPECT_THROW(cache.getRange("doc", 10, 9), std::invalid_argument);
}

TEST_F(SparseCacheTest, EmptyResourceYieldsEmptyReads) {
    upstream_->setDocument("empty", "");
    SparseCache cache(upstream_, options());
    EXPECT_EQ(cache.getFileSize("empty"), 0);
    EXPECT_EQ(cache.getRange("empty", 0, 100), "");
    EXPECT_TRUE(upstream_->requests().empty());
}

TEST_F(SparseCacheTest, UnsafeResourceIdsAreRejected) {
    SparseCache cache(upstream_, options());
    EXPECT_THROW(cache.getRange("../etc/passwd", 0, 10), std::invalid_argument);
    EXPECT_THROW(cache.getFileSize(""), std::invalid_argument);
    EXPECT_THROW(cache.getFileSize(".."), std::invalid_argument);
    EXPECT_THROW(cache.invalidate("a/b"), std::invalid_argument);
    EXPECT_NO_THROW(validateResourceId("pg-1342_v2.txt"));
    EXPECT_EQ(upstream_->headCount(), 0u);
}

TEST_F(SparseCacheTest, WritesDataBitmapAndMetadataFiles) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content, std::string("\"abc\""));
    SparseCache cache(upstream_, options());

    cache.getRange("doc", 0, 63);
    EXPECT_EQ(std::filesystem::file_size(file("doc.txt")), 512u);
    EXPECT_EQ(std::filesystem::file_size(file("doc.bitmap")), 1u);
    EXPECT_TRUE(std::filesystem::exists(file("doc.meta.json")));

    auto stats = cache.getResourceStats("doc");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->fileSize, 512);
    EXPECT_EQ(stats->cachedBytes, 64);
    ASSERT_TRUE(stats->etag.has_value());
    EXPECT_EQ(*stats->etag, "\"abc\"");
    EXPECT_FALSE(stats->isStale);
}

TEST_F(SparseCacheTest, CachedBytesSurviveNewInstance) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    {
        SparseCache cache(upstream_, options());
        cache.getRange("doc", 0, 255);
    }
    upstream_->clearRequests();

    SparseCache reopened(upstream_, options());
    EXPECT_EQ(reopened.getFileSize("doc"), 512);
    EXPECT_EQ(reopened.getRange("doc", 10, 200), content.substr(10, 191));
    EXPECT_TRUE(upstream_->requests().empty());
    EXPECT_EQ(upstream_->headCount(), 0u);
}

TEST_F(SparseCacheTest, MissingDataFileIsRecreatedOnLoad) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    {
        SparseCache cache(upstream_, options());
        cache.getRange("doc", 0, 511);
    }
    std::filesystem::remove(file("doc.txt"));
    upstream_->clearRequests();

    SparseCache reopened(upstream_, options());
    EXPECT_EQ(reopened.getRange("doc", 0, 127), content.substr(0, 128));
    EXPECT_EQ(upstream_->requests().size(), 1u);
    EXPECT_EQ(reopened.getResourceStats("doc")->blocksCached, 2);
}

TEST_F(SparseCacheTest, WrongSizedBitmapIsReset) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    {
        SparseCache cache(upstream_, options());
        cache.getRange("doc", 0, 511);
    }
    {
        std::ofstream out(file("doc.bitmap"), std::ios::binary | std::ios::trunc);
        out << "xyz";
    }
    upstream_->clearRequests();

    SparseCache reopened(upstream_, options());
    EXPECT_EQ(reopened.getResourceStats("doc")->blocksCached, 0);
    EXPECT_EQ(reopened.getRange("doc", 0, 63), content.substr(0, 64));
    EXPECT_EQ(upstream_->requests().size(), 1u);
}

TEST_F(SparseCacheTest, CorruptMetadataIsDiscarded) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    {
        SparseCache cache(upstream_, options());
        cache.getRange("doc", 0, 63);
    }
    {
        std::ofstream out(file("doc.meta.json"), std::ios::trunc);
        out << "{not json";
    }

    SparseCache reopened(upstream_, options());
    EXPECT_EQ(reopened.getRange("doc", 0, 63), content.substr(0, 64));
    EXPECT_EQ(upstream_->headCount(), 2u);
}

TEST_F(SparseCacheTest, DataFileDeletedWhileCachedFallsBackToNetwork) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    SparseCache cache(upstream_, options());
    cache.getRange("doc", 0, 127);
    std::filesystem::remove(file("doc.txt"));
    upstream_->clearRequests();

    RangeSource source;
    EXPECT_EQ(cache.getRange("doc", 0, 127, &source), content.substr(0, 128));
    EXPECT_EQ(source.fromNetwork, 128);
    EXPECT_EQ(upstream_->requests().size(), 1u);
}

TEST_F(SparseCacheTest, UnwritableCacheDirectoryReadsThrough) {
    std::filesystem::create_directories(dir_);
    {
        std::ofstream blocker(file("blocker"));
        blocker << "not a directory";
    }
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    SparseCacheOptions opts = options();
    opts.cacheDir = file("blocker") + "/cache";
    SparseCache cache(upstream_, opts);

    EXPECT_EQ(cache.getRange("doc", 10, 20), content.substr(10, 11));
    EXPECT_EQ(cache.getRange("doc", 10, 20), content.substr(10, 11));
    EXPECT_EQ(upstream_->requests().size(), 2u);
    EXPECT_FALSE(cache.getResourceStats("doc").has_value());
}

TEST_F(SparseCacheTest, UpstreamFailurePropagates) {
    upstream_->setDocument("doc", makeContent(512));
    upstream_->setFailing(false, true);
    SparseCache cache(upstream_, options());
    EXPECT_THROW(cache.getRange("doc", 0, 63), GutexError);

    auto mock = std::make_shared<MockUpstreamFetcher>();
    EXPECT_CALL(*mock, head("missing")).WillOnce(::testing::Throw(HttpError(404, "missing")));
    cache.setUpstream(mock);
    EXPECT_THROW(cache.getFileSize("missing"), HttpError);
}

TEST_F(SparseCacheTest, ShortUpstreamReadIsAnError) {
    upstream_->setDocument("doc", makeContent(512));
    upstream_->setShortReads(true);
    SparseCache cache(upstream_, options());
    EXPECT_THROW(cache.getRange("doc", 0, 63), GutexError);
    EXPECT_EQ(cache.getResourceStats("doc")->blocksCached, 0);
}

TEST_F(SparseCacheTest, StaleCacheIsRefetchedAfterResourceChanges) {
    upstream_->setDocument("doc", std::string(256, 'a'), std::string("\"v1\""));
    SparseCacheOptions opts = options();
    opts.validationInterval = std::chrono::seconds(0);
    SparseCache cache(upstream_, opts);
    EXPECT_EQ(cache.getRange("doc", 0, 9), std::string(10, 'a'));

    upstream_->setDocument("doc", std::string(300, 'b'), std::string("\"v2\""));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    EXPECT_EQ(cache.getRange("doc", 0, 9), std::string(10, 'b'));
    EXPECT_EQ(cache.getFileSize("doc"), 300);
    auto stats = cache.getStats();
    EXPECT_GE(stats.validationChecks, 1u);
    EXPECT_EQ(stats.validationRefreshes, 1u);
}

TEST_F(SparseCacheTest, FreshCacheIsNotRevalidated) {
    upstream_->setDocument("doc", makeContent(512));
    SparseCache cache(upstream_, options());
    cache.getRange("doc", 0, 63);
    cache.getRange("doc", 0, 63);
    cache.getFileSize("doc");
    EXPECT_EQ(upstream_->headCount(), 1u);
    EXPECT_EQ(cache.getStats().validationChecks, 0u);
}

TEST_F(SparseCacheTest, ForceValidationDetectsEtagChange) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content, std::string("\"v1\""));
    SparseCache cache(upstream_, options());
    cache.getRange("doc", 0, 63);

    EXPECT_TRUE(cache.forceValidation("doc"));
    EXPECT_EQ(cache.listCachedResources(), std::vector<std::string>{"doc"});

    upstream_->setDocument("doc", content, std::string("\"v2\""));
    EXPECT_FALSE(cache.forceValidation("doc"));
    EXPECT_TRUE(cache.listCachedResources().empty());
    EXPECT_FALSE(std::filesystem::exists(file("doc.txt")));
    EXPECT_FALSE(cache.forceValidation("never-cached"));
}

TEST_F(SparseCacheTest, ValidationFailureKeepsCache) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    SparseCache cache(upstream_, options());
    cache.getRange("doc", 0, 127);

    upstream_->setFailing(true, true);
    EXPECT_TRUE(cache.forceValidation("doc"));
    EXPECT_EQ(cache.getRange("doc", 0, 127), content.substr(0, 128));
}

TEST_F(SparseCacheTest, InvalidateDeletesFilesAndForcesRefetch) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    SparseCache cache(upstream_, options());
    cache.getRange("doc", 0, 63);

    cache.invalidate("doc");
    EXPECT_FALSE(std::filesystem::exists(file("doc.txt")));
    EXPECT_FALSE(std::filesystem::exists(file("doc.bitmap")));
    EXPECT_FALSE(std::filesystem::exists(file("doc.meta.json")));
    EXPECT_FALSE(cache.getResourceStats("doc").has_value());

    upstream_->clearRequests();
    EXPECT_EQ(cache.getRange("doc", 0, 63), content.substr(0, 64));
    EXPECT_EQ(upstream_->headCount(), 1u);
    EXPECT_EQ(upstream_->requests().size(), 1u);
}

TEST_F(SparseCacheTest, PruneKeepsMostRecentlyAccessed) {
    for (const char *id : {"one", "two", "three"})
        upstream_->setDocument(id, makeContent(128));
    SparseCache cache(upstream_, options());
    for (const char *id : {"one", "two", "three"}) {
        cache.getRange(id, 0, 10);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    cache.getRange("one", 0, 10);

    auto removed = cache.pruneByLRU(2);
    EXPECT_EQ(removed, std::vector<std::string>{"two"});
    EXPECT_EQ(cache.listCachedResources(), (std::vector<std::string>{"one", "three"}));
    EXPECT_TRUE(cache.pruneByLRU(5).empty());
}

TEST_F(SparseCacheTest, StatsTrackHitsMissesAndBytes) {
    const std::string content = makeContent(512);
    upstream_->setDocument("doc", content);
    SparseCache cache(upstream_, options());

    cache.getRange("doc", 0, 63);  // miss
    cache.getRange("doc", 0, 63);  // hit
    cache.getRange("doc", 0, 127); // hit and miss

    auto stats = cache.getStats();
    EXPECT_EQ(stats.cacheHits, 2u);
    EXPECT_EQ(stats.cacheMisses, 2u);
    EXPECT_EQ(stats.bytesFromNetwork, 128u);
    EXPECT_EQ(stats.bytesFromCache, 128u);
    EXPECT_DOUBLE_EQ(stats.hitRate, 0.5);

    Json::Value json = stats.toJson();
    EXPECT_EQ(json["cacheHits"].asUInt64(), 2u);

    cache.clearAll();
    EXPECT_TRUE(cache.listCachedResources().empty());
    EXPECT_EQ(cache.getStats().cacheHits, 0u);
    EXPECT_DOUBLE_EQ(cache.getStats().hitRate, 0.0);
}

TEST_F(SparseCacheTest, ConcurrentReadersSeeConsistentBytes) {
    const std::string first = makeContent(8192);
    const std::string second = std::string(8192, 'z');
    upstream_->setDocument("first", first);
    upstream_->setDocument("second", second);
    SparseCache cache(upstream_, options(256, 512));

    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            const std::string &id = t % 2 ? "first" : "second";
            const std::string &expected = t % 2 ? first : second;
            for (int i = 0; i < 20; ++i) {
                const std::int64_t start = (t * 997 + i * 311) % 8000;
                const std::int64_t end = start + 150;
                if (cache.getRange(id, start, end) != expected.substr(start, 151))
                    mismatches++;
            }
        });
    }
    for (auto &thread : threads)
        thread.join();
    EXPECT_EQ(mismatches.load(), 0);
}
