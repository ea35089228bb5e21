#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <rcache/client/commands.hpp>
#include <rcache/client/pool.hpp>
#include <rcache/client/store_client.hpp>
#include "test_support.hpp"

namespace rcache::test {

class PoolTest : public ::testing::Test {
protected:
    std::shared_ptr<ConnectionPool> make_pool(std::size_t max_size, int timeout_ms = 100)
    {
        PoolOptions opts;
        opts.maxSize = max_size;
        opts.acquireTimeout = std::chrono::milliseconds(timeout_ms);
        return std::make_shared<ConnectionPool>([this] {
            ++created;
            return std::make_unique<FaultyConnection>(store, down);
            }, opts);
    }

    EmbeddedStore store;
    std::shared_ptr<std::atomic<bool>> down = std::make_shared<std::atomic<bool>>(false);
    std::atomic<int> created{ 0 };
};

TEST_F(PoolTest, ReusesReturnedConnections)
{
    auto pool = make_pool(2);
    {
        auto lease = pool->acquire();
        EXPECT_EQ(pool->open(), 1u);
        EXPECT_EQ(pool->idle(), 0u);
    }
    EXPECT_EQ(pool->idle(), 1u);
    {
        auto lease = pool->acquire();
        lease->execute({ "PING" });
    }
    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(pool->open(), 1u);
}

TEST_F(PoolTest, AcquireTimesOutWhenExhausted)
{
    auto pool = make_pool(1, 50);
    auto held = pool->acquire();
    EXPECT_THROW(pool->acquire(), StoreUnavailable);
}

TEST_F(PoolTest, WaiterGetsReleasedConnection)
{
    auto pool = make_pool(1, 2000);
    auto held = std::make_unique<PooledConnection>(pool->acquire());
    std::thread releaser([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        held.reset();
        });
    auto lease = pool->acquire();
    releaser.join();
    EXPECT_EQ(created.load(), 1);
}

TEST_F(PoolTest, InvalidatedAndBrokenConnectionsAreDropped)
{
    auto pool = make_pool(2);
    {
        auto lease = pool->acquire();
        lease.invalidate();
    }
    EXPECT_EQ(pool->open(), 0u);

    {
        auto lease = pool->acquire();
        down->store(true);
        EXPECT_THROW(lease->execute({ "PING" }), StoreUnavailable);
        EXPECT_TRUE(lease->broken());
    }
    EXPECT_EQ(pool->open(), 0u);
    EXPECT_EQ(pool->idle(), 0u);
}

TEST_F(PoolTest, FailedConnectReleasesSlot)
{
    PoolOptions opts;
    opts.maxSize = 1;
    opts.acquireTimeout = std::chrono::milliseconds(50);
    ConnectionPool pool([]() -> std::unique_ptr<Connection> {
        throw StoreUnavailable("connection refused");
        }, opts);
    EXPECT_THROW(pool.acquire(), StoreUnavailable);
    EXPECT_EQ(pool.open(), 0u);
    // the slot is free again, so this fails on connect rather than on timeout
    EXPECT_THROW(pool.acquire(), StoreUnavailable);
}

class StoreClientTest : public PoolTest {
protected:
    void SetUp() override { client = std::make_shared<StoreClient>(make_pool(2)); }
    std::shared_ptr<StoreClient> client;
};

TEST_F(StoreClientTest, SimpleRunReturnsResult)
{
    client->run([](Commands& c) { c.hset("h", "f", "v"); });
    auto v = client->run([](Commands& c) { return c.hget("h", "f"); });
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "v");
    EXPECT_EQ(client->ping(), "PONG");
    EXPECT_EQ(client->db_size(), 1);
}

TEST_F(StoreClientTest, ExceptionDropsConnection)
{
    client->ping();
    EXPECT_EQ(client->pool().open(), 1u);
    EXPECT_THROW(client->run([](Commands& c) { c.hset("s", "f", "v"); c.get("s"); }), CommandError);
    EXPECT_EQ(client->pool().open(), 0u);
}

TEST_F(StoreClientTest, TransactionCommitsAllCommands)
{
    auto tx = client->run_transaction([](Batch& b) {
        b.hset("h", "k", "v").zadd("z:h", 100, "k");
        });
    EXPECT_TRUE(tx.committed);
    ASSERT_EQ(tx.replies.size(), 2u);
    EXPECT_FALSE(tx.first_error().has_value());
    auto score = client->run([](Commands& c) { return c.zscore("z:h", "k"); });
    EXPECT_EQ(score, 100.0);
}

TEST_F(StoreClientTest, TransactionReportsRuntimeErrors)
{
    client->run([](Commands& c) { c.set("s", "x"); });
    auto tx = client->run_transaction([](Batch& b) { b.hset("s", "f", "v").set("t", "1"); });
    EXPECT_TRUE(tx.committed);
    ASSERT_TRUE(tx.first_error().has_value());
    EXPECT_EQ(tx.first_error()->rfind("WRONGTYPE", 0), 0u);
}

TEST_F(StoreClientTest, TransportFailurePropagatesFromTransaction)
{
    down->store(true);
    EXPECT_THROW(client->run_transaction([](Batch& b) { b.set("k", "v"); }), StoreUnavailable);
}

TEST_F(StoreClientTest, PipelineSwallowsFailures)
{
    EXPECT_TRUE(client->run_pipelined([](Batch& b) { b.hset("h", "a", "1").hdel("h", "b"); }));
    down->store(true);
    EXPECT_FALSE(client->run_pipelined([](Batch& b) { b.hdel("h", "a"); }));
    down->store(false);
    EXPECT_EQ(client->run([](Commands& c) { return c.hlen("h"); }), 1);
}

} // namespace rcache::test
