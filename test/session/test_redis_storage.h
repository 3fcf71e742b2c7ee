#pragma once
#include "../../include/session/redis_storage.h"
#include "../../include/session/session_manager.h"
#include "../../include/session/storage_factory.h"
#include "../../include/session/session_exception.h"
#include "../db_pool/test_servers.h"
#include <gtest/gtest.h>
#include <thread>

namespace zstore::zsession
{
    class RedisStorageTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            ZSTORE_REQUIRE_REDIS();
            pool = zdb::RedisConnectionPool::create(zdb::test_redis_options());
            storage = std::make_shared<RedisStorage>(pool, "zstore:gtest:session:");
            storage->remove("sid1");
        }

        std::shared_ptr<zdb::RedisConnectionPool> pool;
        std::shared_ptr<RedisStorage> storage;
    };

    TEST_F(RedisStorageTest, SaveLoadRemove)
    {
        storage->save("sid1", "payload", std::chrono::seconds(60));
        EXPECT_EQ(storage->load("sid1"), std::optional<std::string>("payload"));

        // 键带前缀
        auto conn = pool->get_connection();
        EXPECT_TRUE(conn->exists("zstore:gtest:session:sid1"));

        storage->remove("sid1");
        EXPECT_FALSE(storage->load("sid1").has_value());
        EXPECT_NO_THROW(storage->remove("sid1"));
    }

    TEST_F(RedisStorageTest, CreateRefusesExistingId)
    {
        EXPECT_TRUE(storage->create("sid1", "first", std::chrono::seconds(60)));
        EXPECT_FALSE(storage->create("sid1", "second", std::chrono::seconds(60)));
        EXPECT_EQ(storage->load("sid1"), std::optional<std::string>("first"));
        storage->remove("sid1");
    }

    TEST_F(RedisStorageTest, TtlExpiresRecord)
    {
        storage->save("sid1", "payload", std::chrono::seconds(1));
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        EXPECT_FALSE(storage->load("sid1").has_value());
    }

    TEST_F(RedisStorageTest, LoadReportsRemainingTtl)
    {
        storage->save("sid1", "payload", std::chrono::seconds(60));
        const auto timed = storage->load_with_expiry("sid1");
        ASSERT_TRUE(timed.has_value());
        ASSERT_TRUE(timed->remaining.has_value());
        EXPECT_LE(*timed->remaining, std::chrono::seconds(60));
        EXPECT_GE(*timed->remaining, std::chrono::seconds(55));

        storage->save("sid1", "payload", std::nullopt);
        const auto forever = storage->load_with_expiry("sid1");
        ASSERT_TRUE(forever.has_value());
        EXPECT_FALSE(forever->remaining.has_value());

        storage->remove("sid1");
        EXPECT_FALSE(storage->load_with_expiry("sid1").has_value());
    }

    TEST_F(RedisStorageTest, TouchAndPersist)
    {
        EXPECT_TRUE(storage->supports_touch());
        EXPECT_FALSE(storage->touch("sid1", std::chrono::seconds(60)));

        storage->save("sid1", "payload", std::chrono::seconds(1));
        EXPECT_TRUE(storage->touch("sid1", std::nullopt));
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        EXPECT_TRUE(storage->load("sid1").has_value());
        EXPECT_TRUE(storage->touch("sid1", std::nullopt));
        storage->remove("sid1");
    }

    TEST_F(RedisStorageTest, LifecycleAgainstRedis)
    {
        auto config = zconfig::SessionConfig::default_config();
        config.ttl = std::chrono::seconds(60);
        SessionManagerBuilder builder;
        builder.build_config(config);
        builder.build_storage(storage);
        auto manager = builder.build();

        auto session = manager->begin_request(std::nullopt);
        session.set_attribute("user", "alice");
        const auto instruction = manager->end_request(session);
        ASSERT_EQ(instruction.action, TokenAction::SET);

        auto reloaded = manager->begin_request(instruction.session_id);
        EXPECT_EQ(reloaded.get_attribute("user"), nlohmann::json("alice"));
        reloaded.invalidate();
        EXPECT_EQ(manager->end_request(reloaded).action, TokenAction::UNSET);
        EXPECT_FALSE(storage->load(instruction.session_id).has_value());
    }

    TEST(RedisStorageFailureTest, FactoryReportsStoreUnavailable)
    {
        auto config = zconfig::SessionConfig::default_config();
        config.storage_type = zconfig::StorageType::REDIS;
        config.redis.port = 1;
        config.redis.pool_size = 1;
        config.redis.timeout_ms = 200;
        EXPECT_THROW(make_storage(config), StoreUnavailable);
    }
} // namespace zstore::zsession
