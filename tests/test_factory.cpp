#include <gtest/gtest.h>
#include <rcache/region/region_factory.hpp>
#include <rcache/util/errors.hpp>
#include "test_support.hpp"

namespace rcache::test {

class FactoryTest : public ::testing::Test {
protected:
    Properties props = Properties::from_string(
        "rcache.expiry_in_seconds=60\n"
        "rcache.expiry_in_seconds.short=1\n"
        "rcache.sweep_interval_ms=3600000\n"
        "rcache.log_level=error\n");
    std::shared_ptr<EmbeddedStore> store = std::make_shared<EmbeddedStore>();
    ManualClock clk;
};

TEST_F(FactoryTest, EverythingRequiresStart)
{
    RegionFactory f(props, store, clk);
    EXPECT_FALSE(f.running());
    EXPECT_THROW(f.build_region("users"), RegionStateError);
    EXPECT_THROW(f.build_timestamps_region("stamps"), RegionStateError);
    EXPECT_THROW(f.next_timestamp(), RegionStateError);
    EXPECT_THROW(f.minimal_puts_enabled_by_default(), RegionStateError);
    EXPECT_THROW(f.default_access_type(), RegionStateError);
    EXPECT_THROW(f.flush(), RegionStateError);
}

TEST_F(FactoryTest, StartTwiceFails)
{
    RegionFactory f(props, store, clk);
    f.start();
    EXPECT_THROW(f.start(), RegionStateError);
    f.stop();
    f.stop();
    EXPECT_THROW(f.start(), RegionStateError);
    EXPECT_THROW(f.build_region("users"), RegionStateError);
}

TEST_F(FactoryTest, DefaultsAfterStart)
{
    RegionFactory f(props, store, clk);
    f.start();
    EXPECT_TRUE(f.running());
    EXPECT_TRUE(f.minimal_puts_enabled_by_default());
    EXPECT_EQ(f.default_access_type(), AccessType::ReadWrite);
    EXPECT_EQ(to_string(AccessType::NonstrictReadWrite), "nonstrict-read-write");
    EXPECT_EQ(f.settings().backend, Backend::Embedded);
}

TEST_F(FactoryTest, BuildsRegionsWithConfiguredExpiry)
{
    RegionFactory f(props, store, clk);
    f.start();
    auto users = f.build_region("users");
    auto fast = f.build_region("short");
    EXPECT_EQ(users->settings().expiryInSeconds, 60);
    EXPECT_EQ(fast->settings().expiryInSeconds, 1);
    EXPECT_TRUE(users->settings().timeBasedExpiry);

    Properties over;
    over.set("rcache.expiry_in_seconds.tuned", "5");
    EXPECT_EQ(f.build_region("tuned", over)->settings().expiryInSeconds, 5);

    EXPECT_TRUE(f.registry().contains("users"));
    EXPECT_TRUE(f.registry().contains("short"));
    EXPECT_EQ(f.registry().size(), 3u);
}

TEST_F(FactoryTest, TimestampsRegionIsNotSwept)
{
    RegionFactory f(props, store, clk);
    f.start();
    auto stamps = f.build_timestamps_region("update-timestamps");
    EXPECT_FALSE(stamps->settings().timeBasedExpiry);
    EXPECT_FALSE(f.registry().contains("update-timestamps"));

    stamps->put("users", f.next_timestamp());
    clk.advance_s(3600);
    EXPECT_EQ(f.sweeper().sweep_once(), 0u);
    EXPECT_TRUE(stamps->get("users").has_value());
}

TEST_F(FactoryTest, SweeperPurgesRegisteredRegions)
{
    RegionFactory f(props, store, clk);
    f.start();
    auto fast = f.build_region("short");
    fast->put("k", "v");
    clk.advance_s(2);
    EXPECT_EQ(f.sweeper().sweep_once(), 1u);
    EXPECT_EQ(fast->size(), 0);
}

TEST_F(FactoryTest, RegionsShareTimestampsAndStore)
{
    RegionFactory f(props, store, clk);
    f.start();
    auto a = f.build_region("a");
    auto b = f.build_region("b");
    auto t1 = a->next_timestamp();
    auto t2 = b->next_timestamp();
    auto t3 = f.next_timestamp();
    EXPECT_LT(t1, t2);
    EXPECT_LT(t2, t3);

    a->put("k", 1);
    EXPECT_EQ(b->size_in_store(), 3);   // counter, hash and index
    f.flush();
    EXPECT_EQ(b->size_in_store(), 0);
}

TEST_F(FactoryTest, RegionOutlivesFactory)
{
    std::shared_ptr<Region> users;
    {
        RegionFactory f(props, store, clk);
        f.start();
        users = f.build_region("users");
    }
    users->put("k", 1);
    EXPECT_TRUE(users->exists("k"));
    EXPECT_GT(users->next_timestamp(), 0);
}

TEST(FactoryBackendTest, OwnsEmbeddedStoreWhenConfigured)
{
    RegionFactory f(Properties::from_string("rcache.backend=embedded\nrcache.log_level=error\n"));
    f.start();
    auto r = f.build_region("users");
    r->put("k", "v");
    auto got = r->get("k");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, "v");
    f.stop();
}

TEST(FactoryBackendTest, UnreachableServerDegradesReads)
{
    auto props = Properties::from_string(
        "rcache.host=127.0.0.1\n"
        "rcache.port=1\n"
        "rcache.timeout_ms=200\n"
        "rcache.pool.acquire_timeout_ms=200\n"
        "rcache.log_level=off\n");
    RegionFactory f(props);
    f.start();
    auto r = f.build_region("users");
    EXPECT_FALSE(r->get("k").has_value());
    EXPECT_EQ(r->size(), -1);
    EXPECT_THROW(r->put("k", 1), StoreUnavailable);
    EXPECT_THROW(f.next_timestamp(), StoreUnavailable);
}

} // namespace rcache::test
