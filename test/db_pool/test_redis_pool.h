#pragma once
#include <gtest/gtest.h>
#include "../../include/db_pool/redis_pool.h"
#include "test_servers.h"
#include <thread>
#include <atomic>
#include <vector>

namespace zstore::zdb
{
    class RedisPoolTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            ZSTORE_REQUIRE_REDIS();
            pool = RedisConnectionPool::create(test_redis_options());
        }

        std::shared_ptr<RedisConnectionPool> pool;
    };

    TEST_F(RedisPoolTest, PoolInitialization)
    {
        EXPECT_TRUE(pool->is_initialized());
        EXPECT_EQ(pool->get_pool_size(), 3u);
    }

    TEST_F(RedisPoolTest, GetConnection)
    {
        auto conn = pool->get_connection();
        ASSERT_TRUE(conn != nullptr);
        EXPECT_TRUE(conn->set("zstore:gtest:pool", "pool_value"));
        EXPECT_EQ(conn->get("zstore:gtest:pool"), std::optional<std::string>("pool_value"));
        EXPECT_TRUE(conn->del("zstore:gtest:pool"));
    }

    TEST_F(RedisPoolTest, ConnectionReturnsToPool)
    {
        const size_t before = pool->get_pool_size();
        {
            auto conn = pool->get_connection();
            EXPECT_EQ(pool->get_pool_size(), before - 1);
        }
        EXPECT_EQ(pool->get_pool_size(), before);
    }

    TEST_F(RedisPoolTest, ExhaustedPoolTimesOut)
    {
        std::vector<std::shared_ptr<RedisConnection> > held;
        for (int i = 0; i < 3; ++i)
        {
            held.push_back(pool->get_connection());
        }
        EXPECT_THROW(pool->get_connection(), DBException);
        held.clear();
        EXPECT_NO_THROW(pool->get_connection());
    }

    TEST_F(RedisPoolTest, ConcurrentGetConnection)
    {
        std::atomic<int> success{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 10; ++i)
        {
            threads.emplace_back([this, &success, i]()
            {
                auto conn = pool->get_connection();
                const std::string key = "zstore:gtest:concurrent:" + std::to_string(i);
                if (conn->set(key, "v") && conn->del(key))
                {
                    ++success;
                }
            });
        }
        for (auto &t: threads)
        {
            t.join();
        }
        EXPECT_EQ(success.load(), 10);
        EXPECT_EQ(pool->get_pool_size(), 3u);
    }

    TEST(RedisPoolFailureTest, UnreachableServerFailsInit)
    {
        zconfig::RedisOptions options;
        options.port = 1;
        options.pool_size = 2;
        options.timeout_ms = 200;
        EXPECT_THROW(RedisConnectionPool::create(options), DBException);
    }
} // namespace zstore::zdb
