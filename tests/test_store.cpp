#include <gtest/gtest.h>
#include <rcache/client/local_connection.hpp>
#include <rcache/core/router.hpp>
#include <rcache/core/sorted_set.hpp>

namespace rcache::test {

class RouterTest : public ::testing::Test {
protected:
    EmbeddedStore store{ 4 };
    LocalConnection a{ store };
    LocalConnection b{ store };
};

TEST(SortedSetTest, RangesByScoreInOrder)
{
    SortedSet z;
    EXPECT_TRUE(z.add("c", 30));
    EXPECT_TRUE(z.add("a", 10));
    EXPECT_TRUE(z.add("b", 20));
    EXPECT_FALSE(z.add("a", 40));   // moved, not new

    auto all = z.range_by_score(ScoreBound::inclusive(-1e300), ScoreBound::inclusive(1e300));
    EXPECT_EQ(all, (std::vector<std::string>{ "b", "c", "a" }));

    auto upto30 = z.range_by_score(ScoreBound::inclusive(0), ScoreBound{ 30, true });
    EXPECT_EQ(upto30, (std::vector<std::string>{ "b" }));

    EXPECT_EQ(z.remove_range_by_score(ScoreBound::inclusive(0), ScoreBound::inclusive(30)), 2u);
    EXPECT_EQ(z.size(), 1u);
    EXPECT_EQ(z.score("a"), 40.0);
}

TEST(SortedSetTest, ParsesBoundsAndFormatsScores)
{
    auto neg = parse_score_bound("-inf");
    ASSERT_TRUE(neg.has_value());
    EXPECT_LT(neg->value, -1e308);

    auto excl = parse_score_bound("(1.5");
    ASSERT_TRUE(excl.has_value());
    EXPECT_TRUE(excl->exclusive);
    EXPECT_DOUBLE_EQ(excl->value, 1.5);

    EXPECT_FALSE(parse_score_bound("abc").has_value());
    EXPECT_EQ(format_score(1700000000000.0), "1700000000000");
    EXPECT_EQ(format_score(1.5), "1.5");
}

TEST_F(RouterTest, HashCommands)
{
    EXPECT_EQ(a.execute({ "HSET", "h", "f1", "v1" }).integer, 1);
    EXPECT_EQ(a.execute({ "HSET", "h", "f1", "v2" }).integer, 0);
    EXPECT_EQ(a.execute({ "HGET", "h", "f1" }).str, "v2");
    EXPECT_TRUE(a.execute({ "HGET", "h", "nope" }).is_nil());
    EXPECT_EQ(a.execute({ "HEXISTS", "h", "f1" }).integer, 1);
    EXPECT_EQ(a.execute({ "HLEN", "h" }).integer, 1);

    auto mget = a.execute({ "HMGET", "h", "f1", "missing" });
    ASSERT_TRUE(mget.is_array());
    ASSERT_EQ(mget.elements.size(), 2u);
    EXPECT_EQ(mget.elements[0].str, "v2");
    EXPECT_TRUE(mget.elements[1].is_nil());

    EXPECT_EQ(a.execute({ "HDEL", "h", "f1" }).integer, 1);
    EXPECT_EQ(a.execute({ "HDEL", "h", "f1" }).integer, 0);
    EXPECT_EQ(a.execute({ "EXISTS", "h" }).integer, 0);
}

TEST_F(RouterTest, SortedSetCommands)
{
    a.execute({ "ZADD", "z", "100", "k1" });
    a.execute({ "ZADD", "z", "200", "k2" });
    a.execute({ "ZADD", "z", "300", "k3" });
    EXPECT_EQ(a.execute({ "ZSCORE", "z", "k2" }).str, "200");

    auto due = a.execute({ "ZRANGEBYSCORE", "z", "-inf", "200" });
    ASSERT_EQ(due.elements.size(), 2u);
    EXPECT_EQ(due.elements[0].str, "k1");
    EXPECT_EQ(due.elements[1].str, "k2");

    EXPECT_EQ(a.execute({ "ZREMRANGEBYSCORE", "z", "-inf", "200" }).integer, 2);
    EXPECT_EQ(a.execute({ "ZREM", "z", "k3" }).integer, 1);
    EXPECT_EQ(a.execute({ "TYPE", "z" }).str, "none");
    EXPECT_TRUE(a.execute({ "ZRANGEBYSCORE", "z", "nan?", "1" }).is_error());
}

TEST_F(RouterTest, WrongTypeAndArity)
{
    a.execute({ "SET", "s", "1" });
    auto wrong = a.execute({ "HGET", "s", "f" });
    ASSERT_TRUE(wrong.is_error());
    EXPECT_EQ(wrong.str.rfind("WRONGTYPE", 0), 0u);

    EXPECT_TRUE(a.execute({ "GET" }).is_error());
    EXPECT_TRUE(a.execute({ "NOSUCH", "x" }).is_error());
}

TEST_F(RouterTest, IncrKeepsDecimalString)
{
    EXPECT_EQ(a.execute({ "INCR", "n" }).integer, 1);
    a.execute({ "SET", "n", "41" });
    EXPECT_EQ(a.execute({ "INCR", "n" }).integer, 42);
    EXPECT_EQ(a.execute({ "GET", "n" }).str, "42");
    a.execute({ "SET", "n", "abc" });
    EXPECT_TRUE(a.execute({ "INCR", "n" }).is_error());
}

TEST_F(RouterTest, MultiExecAppliesQueuedCommands)
{
    EXPECT_EQ(a.execute({ "MULTI" }).str, "OK");
    EXPECT_EQ(a.execute({ "HSET", "h", "k", "v" }).str, "QUEUED");
    EXPECT_EQ(a.execute({ "ZADD", "z:h", "5", "k" }).str, "QUEUED");
    // not visible before EXEC
    EXPECT_TRUE(b.execute({ "HGET", "h", "k" }).is_nil());

    auto res = a.execute({ "EXEC" });
    ASSERT_TRUE(res.is_array());
    ASSERT_EQ(res.elements.size(), 2u);
    EXPECT_EQ(res.elements[0].integer, 1);
    EXPECT_EQ(b.execute({ "HGET", "h", "k" }).str, "v");
}

TEST_F(RouterTest, ExecAbortsAfterQueueingError)
{
    a.execute({ "MULTI" });
    a.execute({ "HSET", "h", "k", "v" });
    EXPECT_TRUE(a.execute({ "HSET", "h" }).is_error());
    auto res = a.execute({ "EXEC" });
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.str.rfind("EXECABORT", 0), 0u);
    EXPECT_EQ(b.execute({ "HLEN", "h" }).integer, 0);
}

TEST_F(RouterTest, WatchDetectsConcurrentWrite)
{
    a.execute({ "WATCH", "counter" });
    b.execute({ "SET", "counter", "7" });
    a.execute({ "MULTI" });
    a.execute({ "SET", "counter", "1" });
    EXPECT_TRUE(a.execute({ "EXEC" }).is_nil());
    EXPECT_EQ(b.execute({ "GET", "counter" }).str, "7");
}

TEST_F(RouterTest, WatchSeesDeleteAndRecreate)
{
    a.execute({ "SET", "k", "1" });
    a.execute({ "WATCH", "k" });
    b.execute({ "DEL", "k" });
    b.execute({ "SET", "k", "1" });
    a.execute({ "MULTI" });
    a.execute({ "SET", "k", "2" });
    EXPECT_TRUE(a.execute({ "EXEC" }).is_nil());
}

TEST_F(RouterTest, UntouchedWatchCommitsAndDiscardClears)
{
    a.execute({ "WATCH", "k" });
    a.execute({ "MULTI" });
    a.execute({ "SET", "k", "x" });
    EXPECT_TRUE(a.execute({ "EXEC" }).is_array());

    a.execute({ "MULTI" });
    a.execute({ "SET", "k", "y" });
    EXPECT_EQ(a.execute({ "DISCARD" }).str, "OK");
    EXPECT_EQ(a.execute({ "GET", "k" }).str, "x");
    EXPECT_TRUE(a.execute({ "EXEC" }).is_error());
}

TEST_F(RouterTest, DbSizeAndFlush)
{
    a.execute({ "SET", "a", "1" });
    a.execute({ "HSET", "b", "f", "v" });
    a.execute({ "ZADD", "c", "1", "m" });
    EXPECT_EQ(a.execute({ "DBSIZE" }).integer, 3);
    a.execute({ "FLUSHDB" });
    EXPECT_EQ(a.execute({ "DBSIZE" }).integer, 0);
}

} // namespace rcache::test
