#pragma once
#include "../../include/session/tiered_storage.h"
#include "test_support.h"
#include <gtest/gtest.h>

namespace zstore::zsession
{
    class TieredStorageTest : public ::testing::Test
    {
    protected:
        std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
        std::shared_ptr<RecordingStorage> cache = std::make_shared<RecordingStorage>(clock);
        std::shared_ptr<RecordingStorage> primary = std::make_shared<RecordingStorage>(clock);
        TieredStorage storage{cache, primary, std::chrono::seconds(30)};
    };

    TEST_F(TieredStorageTest, WritesGoToBothLayers)
    {
        storage.save("sid1", "payload", std::chrono::seconds(600));
        EXPECT_EQ(primary->saves, 1);
        EXPECT_EQ(primary->last_ttl, Ttl(std::chrono::seconds(600)));
        EXPECT_EQ(cache->saves, 1);
        EXPECT_EQ(cache->last_ttl, Ttl(std::chrono::seconds(30)));
        EXPECT_EQ(storage.name(), "recording+recording");
    }

    TEST_F(TieredStorageTest, CacheHitSkipsPrimary)
    {
        storage.save("sid1", "payload", std::chrono::seconds(600));
        primary->reset_counters();
        EXPECT_EQ(storage.load("sid1"), std::optional<std::string>("payload"));
        EXPECT_EQ(primary->loads, 0);
    }

    TEST_F(TieredStorageTest, CacheMissFallsBackAndRefills)
    {
        primary->inner().save("sid2", "from-primary", std::chrono::seconds(600));
        EXPECT_EQ(storage.load("sid2"), std::optional<std::string>("from-primary"));
        EXPECT_EQ(primary->loads, 1);
        EXPECT_EQ(cache->saves, 1);

        EXPECT_EQ(storage.load("sid2"), std::optional<std::string>("from-primary"));
        EXPECT_EQ(primary->loads, 1);
    }

    TEST_F(TieredStorageTest, CacheEntriesExpireBeforePrimary)
    {
        storage.save("sid3", "payload", std::chrono::seconds(600));
        clock->advance(std::chrono::seconds(31));
        primary->reset_counters();
        EXPECT_TRUE(storage.load("sid3").has_value());
        EXPECT_EQ(primary->loads, 1);
    }

    TEST_F(TieredStorageTest, RefillNeverOutlivesPrimaryRecord)
    {
        storage.save("sid10", "payload", std::chrono::seconds(60));

        // 缓存记录在 t=30 过期，t=45 从主存储回填，只剩15秒
        clock->advance(std::chrono::seconds(45));
        EXPECT_EQ(storage.load("sid10"), std::optional<std::string>("payload"));
        EXPECT_EQ(cache->last_ttl, Ttl(std::chrono::seconds(15)));

        clock->advance(std::chrono::seconds(25));
        EXPECT_FALSE(primary->inner().load("sid10").has_value());
        EXPECT_FALSE(storage.load("sid10").has_value());
    }

    TEST_F(TieredStorageTest, PermanentRecordRefillUsesCacheTtl)
    {
        primary->inner().save("sid11", "forever", std::nullopt);
        EXPECT_EQ(storage.load("sid11"), std::optional<std::string>("forever"));
        EXPECT_EQ(cache->last_ttl, Ttl(std::chrono::seconds(30)));

        const auto record = storage.load_with_expiry("sid11");
        ASSERT_TRUE(record.has_value());
        EXPECT_FALSE(record->remaining.has_value());
    }

    TEST_F(TieredStorageTest, RemoveClearsBothLayers)
    {
        storage.save("sid4", "payload", std::chrono::seconds(600));
        storage.remove("sid4");
        EXPECT_FALSE(cache->inner().load("sid4").has_value());
        EXPECT_FALSE(primary->inner().load("sid4").has_value());
        EXPECT_FALSE(storage.load("sid4").has_value());
    }

    TEST_F(TieredStorageTest, CacheFailureIsNotFatal)
    {
        cache->fail_load = true;
        cache->fail_save = true;
        EXPECT_NO_THROW(storage.save("sid5", "payload", std::chrono::seconds(600)));
        EXPECT_EQ(storage.load("sid5"), std::optional<std::string>("payload"));
    }

    TEST_F(TieredStorageTest, PrimaryFailureSurfaces)
    {
        primary->fail_save = true;
        EXPECT_THROW(storage.save("sid6", "payload", std::chrono::seconds(600)), StoreUnavailable);
        EXPECT_FALSE(cache->inner().load("sid6").has_value());
    }

    TEST_F(TieredStorageTest, CreateRespectsPrimaryCollision)
    {
        primary->inner().save("sid7", "taken", std::chrono::seconds(600));
        EXPECT_FALSE(storage.create("sid7", "mine", std::chrono::seconds(600)));
        EXPECT_FALSE(cache->inner().load("sid7").has_value());
        EXPECT_TRUE(storage.create("sid8", "mine", std::chrono::seconds(600)));
        EXPECT_TRUE(cache->inner().load("sid8").has_value());
    }

    TEST_F(TieredStorageTest, TouchFollowsPrimary)
    {
        EXPECT_TRUE(storage.supports_touch());
        storage.save("sid9", "payload", std::chrono::seconds(600));
        EXPECT_TRUE(storage.touch("sid9", std::chrono::seconds(600)));
        EXPECT_EQ(cache->touches, 1);

        EXPECT_FALSE(storage.touch("missing", std::chrono::seconds(600)));
    }
} // namespace zstore::zsession
