#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <rcache/config/properties.hpp>
#include <rcache/util/log.hpp>

namespace rcache::test {

TEST(PropertiesTest, ParsesCommentsAndSeparators)
{
    auto p = Properties::from_string(
        "# comment\n"
        "! also a comment\n"
        "rcache.host = cache-01\n"
        "rcache.port:6380\n"
        "\n"
        "   rcache.flag   \n"
        "rcache.host=cache-02\n");
    EXPECT_EQ(p.get(keys::kHost, ""), "cache-02");
    EXPECT_EQ(p.get_int(keys::kPort, 0), 6380);
    EXPECT_TRUE(p.contains("rcache.flag"));
    EXPECT_EQ(p.get("rcache.flag"), std::optional<std::string>(""));
    EXPECT_EQ(p.size(), 3u);
}

TEST(PropertiesTest, TypedGettersFallBack)
{
    auto p = Properties::from_string("a=12x\nb=0x10\nc=YES\nd=maybe\n");
    EXPECT_EQ(p.get_int("a", 7), 7);
    EXPECT_EQ(p.get_int("b", 0), 16);
    EXPECT_EQ(p.get_int("missing", 3), 3);
    EXPECT_TRUE(p.get_bool("c", false));
    EXPECT_FALSE(p.get_bool("d", false));
    EXPECT_FALSE(p.get("missing").has_value());
}

TEST(PropertiesTest, OverridesWin)
{
    auto base = Properties::from_string("x=1\ny=2\n");
    auto over = Properties::from_string("y=3\nz=4\n");
    auto merged = base.with_overrides(over);
    EXPECT_EQ(merged.get_int("x", 0), 1);
    EXPECT_EQ(merged.get_int("y", 0), 3);
    EXPECT_EQ(merged.get_int("z", 0), 4);
    EXPECT_EQ(base.get_int("y", 0), 2);
}

TEST(PropertiesTest, LoadsFromFile)
{
    std::string path = ::testing::TempDir() + "rcache_props_test.properties";
    {
        std::ofstream out(path);
        out << "rcache.expiry_in_seconds=30\n";
    }
    auto p = Properties::load(path);
    EXPECT_EQ(p.get_int(keys::kExpiryInSeconds, 0), 30);
    std::remove(path.c_str());

    EXPECT_THROW(Properties::load(path + ".missing"), std::runtime_error);
}

TEST(FactorySettingsTest, Defaults)
{
    auto s = FactorySettings::from_properties(Properties{});
    EXPECT_EQ(s.backend, Backend::Tcp);
    EXPECT_EQ(s.server.host, "localhost");
    EXPECT_EQ(s.server.port, 6379);
    EXPECT_EQ(s.server.timeoutMs, 2000);
    EXPECT_EQ(s.pool.maxSize, 8u);
    EXPECT_EQ(s.pool.acquireTimeoutMs, 2000);
    EXPECT_EQ(s.expiryInSeconds, 120);
    EXPECT_EQ(s.cacheLockTimeoutMs, 60000);
    EXPECT_EQ(s.sweepIntervalMs, 1000);
    EXPECT_EQ(s.timestampKey, "rcache:timestamp");
    EXPECT_EQ(s.logLevel, "info");
}

TEST(FactorySettingsTest, ReadsEveryKey)
{
    auto s = FactorySettings::from_properties(Properties::from_string(
        "rcache.backend=Embedded\n"
        "rcache.pool.max_size=0\n"
        "rcache.cache_lock_timeout=5000\n"
        "rcache.timestamp_key=ts\n"));
    EXPECT_EQ(s.backend, Backend::Embedded);
    EXPECT_EQ(s.pool.maxSize, 1u);
    EXPECT_EQ(s.cacheLockTimeoutMs, 5000);
    EXPECT_EQ(s.timestampKey, "ts");
}

TEST(RegionSettingsTest, PerRegionOverrides)
{
    auto props = Properties::from_string(
        "rcache.expiry_in_seconds=300\n"
        "rcache.expiry_in_seconds.users=60\n"
        "rcache.time_based_expiry.stamps=false\n");
    auto defaults = FactorySettings::from_properties(props);

    auto users = RegionSettings::from_properties("users", props, defaults);
    EXPECT_EQ(users.expiryInSeconds, 60);
    EXPECT_TRUE(users.timeBasedExpiry);

    auto orders = RegionSettings::from_properties("orders", props, defaults);
    EXPECT_EQ(orders.expiryInSeconds, 300);

    auto stamps = RegionSettings::from_properties("stamps", props, defaults);
    EXPECT_FALSE(stamps.timeBasedExpiry);
    EXPECT_EQ(stamps.cacheLockTimeoutMs, 60000);
}

TEST(LogLevelTest, ParsesNames)
{
    EXPECT_EQ(log::level_from_string("DEBUG"), log::Level::Debug);
    EXPECT_EQ(log::level_from_string("warn"), log::Level::Warn);
    EXPECT_EQ(log::level_from_string("off"), log::Level::Off);
    EXPECT_EQ(log::level_from_string("bogus"), log::Level::Info);
    EXPECT_EQ(log::to_string(log::Level::Error), "ERROR");
}

} // namespace rcache::test
