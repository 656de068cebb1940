// tests/test_layer1_base/test_instance_cache.cpp
/**
 * @file test_instance_cache.cpp
 * @brief Unit tests for InstanceCache: one live instance per key, weakly held.
 */
#include <atomic>
#include <memory>
#include <string>

#include "ct_base.hpp"
#include "shared_test_helpers.h"
#include "gtest/gtest.h"

using calltrace::tests::helper::ThreadRacer;
using calltrace::utils::InstanceCache;

namespace
{

struct Session
{
    Session(std::string h, int p) : host(std::move(h)), port(p) { ++constructed; }
    std::string host;
    int port;
    static inline std::atomic<int> constructed{0};
};

// A distinct type per test keeps the process-wide caches independent.
template <int N> struct Tagged
{
    explicit Tagged(int v) : value(v) { ++constructed; }
    int value;
    static inline std::atomic<int> constructed{0};
};

} // namespace

TEST(InstanceCacheTest, MakeKeyConcatenatesPositionalThenKeywordNames)
{
    EXPECT_EQ(InstanceCache<Session>::make_key({"a", "1"}, {"port"}), "a1port");
    EXPECT_EQ(InstanceCache<Session>::make_key({}), "");
}

TEST(InstanceCacheTest, SameArgumentsShareOneInstance)
{
    auto &cache = InstanceCache<Session>::instance();
    auto a = cache.get(std::string("db"), 5432);
    auto b = cache.get(std::string("db"), 5432);
    auto c = cache.get(std::string("db"), 5433);

    EXPECT_EQ(a.get(), b.get());
    EXPECT_NE(a.get(), c.get());
    EXPECT_EQ(c->port, 5433);
}

TEST(InstanceCacheTest, ExpiredInstanceIsRebuilt)
{
    using T = Tagged<1>;
    auto &cache = InstanceCache<T>::instance();

    auto first = cache.get(7);
    EXPECT_TRUE(cache.contains("7"));
    EXPECT_EQ(T::constructed.load(), 1);

    first.reset();
    EXPECT_FALSE(cache.contains("7"));
    EXPECT_EQ(cache.size(), 0u);

    auto second = cache.get(7);
    EXPECT_EQ(T::constructed.load(), 2);
    EXPECT_EQ(second->value, 7);
}

TEST(InstanceCacheTest, FailedFactoryCachesNothing)
{
    using T = Tagged<2>;
    auto &cache = InstanceCache<T>::instance();

    EXPECT_THROW(cache.get_or_create("k",
                                     []() -> std::shared_ptr<T>
                                     { throw std::runtime_error("boom"); }),
                 std::runtime_error);
    EXPECT_FALSE(cache.contains("k"));

    auto ok = cache.get_or_create("k", []() { return std::make_shared<T>(3); });
    EXPECT_EQ(ok->value, 3);
}

TEST(InstanceCacheTest, ConcurrentFirstUseConstructsOnce)
{
    using T = Tagged<3>;
    constexpr int kThreads = 16;
    auto &cache = InstanceCache<T>::instance();
    std::vector<std::shared_ptr<T>> seen(kThreads);

    ThreadRacer racer(kThreads);
    ASSERT_TRUE(racer.race([&](int i) { seen[static_cast<size_t>(i)] = cache.get(42); }));

    EXPECT_EQ(T::constructed.load(), 1);
    for (const auto &p : seen)
        EXPECT_EQ(p.get(), seen.front().get());
}
