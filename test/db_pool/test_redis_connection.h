#pragma once
#include <gtest/gtest.h>
#include "test_servers.h"
#include <thread>
#include <chrono>

namespace zstore::zdb
{
    class RedisConnectionTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            ZSTORE_REQUIRE_REDIS();
            const auto options = test_redis_options();
            conn = std::make_unique<RedisConnection>(options.host, options.port, options.password,
                                                     options.db, options.timeout_ms);
        }

        std::unique_ptr<RedisConnection> conn;
    };

    TEST_F(RedisConnectionTest, IsValid)
    {
        EXPECT_TRUE(conn->is_valid());
        EXPECT_TRUE(conn->ping());
    }

    TEST_F(RedisConnectionTest, SetGetDel)
    {
        const std::string key = "zstore:gtest:key";
        EXPECT_TRUE(conn->set(key, "gtest_value"));
        EXPECT_EQ(conn->get(key), std::optional<std::string>("gtest_value"));
        EXPECT_TRUE(conn->exists(key));
        EXPECT_TRUE(conn->del(key));
        EXPECT_FALSE(conn->exists(key));
        EXPECT_FALSE(conn->get(key).has_value());
    }

    TEST_F(RedisConnectionTest, SetIfAbsent)
    {
        const std::string key = "zstore:gtest:nx";
        conn->del(key);
        EXPECT_TRUE(conn->set(key, "first", std::chrono::seconds(60), true));
        EXPECT_FALSE(conn->set(key, "second", std::chrono::seconds(60), true));
        EXPECT_EQ(conn->get(key), std::optional<std::string>("first"));
        conn->del(key);
    }

    TEST_F(RedisConnectionTest, Expire)
    {
        const std::string key = "zstore:gtest:expire";
        conn->set(key, "1");
        EXPECT_TRUE(conn->expire(key, std::chrono::seconds(1)));
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        EXPECT_FALSE(conn->exists(key));
        EXPECT_FALSE(conn->expire(key, std::chrono::seconds(1)));
    }

    TEST_F(RedisConnectionTest, PersistDropsExpiry)
    {
        const std::string key = "zstore:gtest:persist";
        conn->set(key, "1", std::chrono::seconds(1));
        EXPECT_TRUE(conn->persist(key));
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        EXPECT_TRUE(conn->exists(key));
        conn->del(key);
    }

    TEST_F(RedisConnectionTest, Reconnect)
    {
        EXPECT_NO_THROW(conn->reconnect());
        EXPECT_TRUE(conn->is_valid());
    }

    TEST(RedisConnectionFailureTest, UnreachableServerThrows)
    {
        EXPECT_THROW(RedisConnection("127.0.0.1", 1, "", 0, 200), DBException);
    }
} // namespace zstore::zdb
