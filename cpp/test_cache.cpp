#include "chunkvault/transform_cache.hpp"
#include "test_support.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

namespace {

using namespace chunkvault;

cache::TransformCache::DecodeFn Counting(std::atomic<int>& calls, Bytes value) {
    return [&calls, value]() {
        ++calls;
        return value;
    };
}

void SecondLookupSkipsDecode() {
    cache::TransformCache cache;
    std::atomic<int> calls{0};
    Bytes value = test::RandomData(1000, 11);
    auto first = cache.GetOrDecode("a.cva", Counting(calls, value));
    auto second = cache.GetOrDecode("a.cva", Counting(calls, value));
    CHUNKVAULT_EXPECT_EQ(calls.load(), 1);
    CHUNKVAULT_EXPECT(*first == value);
    CHUNKVAULT_EXPECT(*second == *first);

    cache::CacheStats stats = cache.Stats();
    CHUNKVAULT_EXPECT_EQ(stats.entries, 1u);
    CHUNKVAULT_EXPECT_EQ(stats.bytes, 1000u);
    CHUNKVAULT_EXPECT_EQ(stats.hits, 1u);
    CHUNKVAULT_EXPECT_EQ(stats.misses, 1u);
    CHUNKVAULT_EXPECT_EQ(stats.keys.size(), 1u);
    CHUNKVAULT_EXPECT_EQ(stats.keys[0], std::string("a.cva"));
}

void ClearAndEraseForceRedecode() {
    cache::TransformCache cache;
    std::atomic<int> calls{0};
    Bytes value(10, 0x5A);
    cache.GetOrDecode("a", Counting(calls, value));
    cache.GetOrDecode("b", Counting(calls, value));
    cache.Erase("a");
    CHUNKVAULT_EXPECT(cache.Find("a") == nullptr);
    CHUNKVAULT_EXPECT(cache.Find("b") != nullptr);
    cache.GetOrDecode("a", Counting(calls, value));
    CHUNKVAULT_EXPECT_EQ(calls.load(), 3);

    cache.Clear();
    cache::CacheStats stats = cache.Stats();
    CHUNKVAULT_EXPECT_EQ(stats.entries, 0u);
    CHUNKVAULT_EXPECT_EQ(stats.bytes, 0u);
    cache.GetOrDecode("b", Counting(calls, value));
    CHUNKVAULT_EXPECT_EQ(calls.load(), 4);
}

void FailedDecodeIsNotCached() {
    cache::TransformCache cache;
    int calls = 0;
    auto failing = [&calls]() -> Bytes {
        ++calls;
        throw std::runtime_error("boom");
    };
    CHUNKVAULT_EXPECT_THROWS(std::runtime_error, cache.GetOrDecode("x", failing));
    CHUNKVAULT_EXPECT_THROWS(std::runtime_error, cache.GetOrDecode("x", failing));
    CHUNKVAULT_EXPECT_EQ(calls, 2);
    CHUNKVAULT_EXPECT_EQ(cache.Stats().entries, 0u);
}

void UnboundedKeepsEverything() {
    cache::TransformCache cache(cache::MakePolicy(0));
    std::atomic<int> calls{0};
    for (int i = 0; i < 50; ++i) {
        cache.GetOrDecode("k" + std::to_string(i), Counting(calls, Bytes(1024, 1)));
    }
    CHUNKVAULT_EXPECT_EQ(cache.Stats().entries, 50u);
    CHUNKVAULT_EXPECT_EQ(cache.Stats().bytes, 50u * 1024u);
}

void LruEvictsLeastRecentlyUsed() {
    cache::TransformCache cache(std::make_unique<cache::LruEviction>(300));
    std::atomic<int> calls{0};
    cache.GetOrDecode("a", Counting(calls, Bytes(100, 1)));
    cache.GetOrDecode("b", Counting(calls, Bytes(100, 2)));
    cache.GetOrDecode("c", Counting(calls, Bytes(100, 3)));
    cache.GetOrDecode("a", Counting(calls, Bytes(100, 1)));
    cache.GetOrDecode("d", Counting(calls, Bytes(100, 4)));

    cache::CacheStats stats = cache.Stats();
    CHUNKVAULT_EXPECT_EQ(stats.entries, 3u);
    CHUNKVAULT_EXPECT_EQ(stats.bytes, 300u);
    CHUNKVAULT_EXPECT(cache.Find("b") == nullptr);
    CHUNKVAULT_EXPECT(cache.Find("a") != nullptr);
    CHUNKVAULT_EXPECT(cache.Find("c") != nullptr);
    CHUNKVAULT_EXPECT(cache.Find("d") != nullptr);
    CHUNKVAULT_EXPECT_EQ(calls.load(), 4);
}

void OversizedEntryIsReturnedButNotKept() {
    cache::TransformCache cache(std::make_unique<cache::LruEviction>(64));
    std::atomic<int> calls{0};
    cache.GetOrDecode("small", Counting(calls, Bytes(32, 1)));
    auto big = cache.GetOrDecode("big", Counting(calls, Bytes(128, 2)));
    CHUNKVAULT_EXPECT_EQ(big->size(), 128u);
    CHUNKVAULT_EXPECT(cache.Find("big") == nullptr);
    CHUNKVAULT_EXPECT(cache.Stats().bytes <= 64u);
}

void ConcurrentPopulationIsSafe() {
    cache::TransformCache cache;
    std::atomic<int> calls{0};
    Bytes value = test::RandomData(4096, 12);
    std::vector<std::shared_ptr<const Bytes>> results(8);
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < results.size(); ++t) {
        threads.emplace_back([&, t]() {
            for (int round = 0; round < 20; ++round) {
                results[t] = cache.GetOrDecode("shared", Counting(calls, value));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    CHUNKVAULT_EXPECT(calls.load() >= 1);
    CHUNKVAULT_EXPECT(calls.load() <= static_cast<int>(results.size()));
    for (const auto& result : results) {
        CHUNKVAULT_EXPECT(result != nullptr && *result == value);
        CHUNKVAULT_EXPECT(result.get() == results[0].get());
    }
    CHUNKVAULT_EXPECT_EQ(cache.Stats().entries, 1u);
    CHUNKVAULT_EXPECT_EQ(cache.Stats().bytes, value.size());
}

}  // namespace

int main() {
    return chunkvault::test::RunTests("cache", {
        {"SecondLookupSkipsDecode", SecondLookupSkipsDecode},
        {"ClearAndEraseForceRedecode", ClearAndEraseForceRedecode},
        {"FailedDecodeIsNotCached", FailedDecodeIsNotCached},
        {"UnboundedKeepsEverything", UnboundedKeepsEverything},
        {"LruEvictsLeastRecentlyUsed", LruEvictsLeastRecentlyUsed},
        {"OversizedEntryIsReturnedButNotKept", OversizedEntryIsReturnedButNotKept},
        {"ConcurrentPopulationIsSafe", ConcurrentPopulationIsSafe},
    });
}
