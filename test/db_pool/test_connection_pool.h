#pragma once
#include "../../include/db_pool/connection_pool.h"
#include <atomic>
#include <thread>
#include <gtest/gtest.h>

namespace zstore::zdb
{
    // 不依赖服务器的连接，记录同时使用者数量
    class FakeConnection
    {
    public:
        bool ping()
        {
            enter();
            ++pings;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            leave();
            return healthy.load();
        }

        void reconnect()
        {
            ++reconnects;
            if (fail_reconnect)
            {
                throw DBException("fake server unreachable");
            }
            healthy = true;
        }

        void enter()
        {
            if (users.fetch_add(1) > 0)
            {
                ++overlaps;
            }
        }

        void leave()
        {
            --users;
        }

        std::atomic<int> users{0};
        std::atomic<int> overlaps{0};
        std::atomic<int> pings{0};
        std::atomic<int> reconnects{0};
        std::atomic<bool> healthy{true};
        std::atomic<bool> fail_reconnect{false};
    };

    using FakePool = ConnectionPool<FakeConnection>;

    inline std::shared_ptr<FakePool> make_fake_pool(const std::shared_ptr<FakeConnection> &conn,
                                                    const std::chrono::milliseconds check_interval)
    {
        auto pool = std::make_shared<FakePool>("Fake", [conn]() { return conn; },
                                               std::chrono::milliseconds(500), check_interval);
        pool->init(1);
        return pool;
    }

    TEST(ConnectionPoolTest, HealthCheckNeverTouchesLentConnection)
    {
        auto conn = std::make_shared<FakeConnection>();
        auto pool = make_fake_pool(conn, std::chrono::milliseconds(5));

        for (int i = 0; i < 300; ++i)
        {
            auto lent = pool->get_connection();
            lent->enter();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            lent->leave();
        }

        EXPECT_EQ(conn->overlaps.load(), 0);
        EXPECT_GE(conn->pings.load(), 300);
    }

    TEST(ConnectionPoolTest, FailedReconnectKeepsConnectionPooled)
    {
        auto conn = std::make_shared<FakeConnection>();
        auto pool = make_fake_pool(conn, std::chrono::milliseconds(10));

        conn->fail_reconnect = true;
        conn->healthy = false;
        for (int i = 0; i < 200 && conn->reconnects.load() == 0; ++i)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ASSERT_GT(conn->reconnects.load(), 0);

        EXPECT_THROW((void) pool->get_connection(), DBException);

        conn->fail_reconnect = false;
        const auto lent = pool->get_connection();
        EXPECT_TRUE(conn->healthy.load());
    }

    TEST(ConnectionPoolTest, InitRetriesTransientFailures)
    {
        auto conn = std::make_shared<FakeConnection>();
        std::atomic<int> calls{0};
        auto pool = std::make_shared<FakePool>("Fake", [conn, &calls]()
        {
            if (++calls < 3)
            {
                throw DBException("connection refused");
            }
            return conn;
        }, std::chrono::milliseconds(500));

        pool->init(1);
        EXPECT_EQ(calls.load(), 3);
        EXPECT_EQ(pool->get_pool_size(), 1u);
    }

    TEST(ConnectionPoolTest, InitGivesUpAfterBoundedAttempts)
    {
        std::atomic<int> calls{0};
        auto pool = std::make_shared<FakePool>("Fake", [&calls]() -> std::shared_ptr<FakeConnection>
        {
            ++calls;
            throw DBException("connection refused");
        }, std::chrono::milliseconds(500));

        EXPECT_THROW(pool->init(2), DBException);
        EXPECT_EQ(calls.load(), 2 * FakePool::kConnectAttempts);
        EXPECT_FALSE(pool->is_initialized());
    }
} // namespace zstore::zdb
