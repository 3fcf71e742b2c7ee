#pragma once
#include "../../include/session/storage_factory.h"
#include "../../include/session/session_manager.h"
#include <gtest/gtest.h>

namespace zstore::zsession
{
    TEST(StorageFactoryTest, MemoryByDefault)
    {
        const auto storage = make_storage(zconfig::SessionConfig::default_config());
        ASSERT_NE(storage, nullptr);
        EXPECT_EQ(storage->name(), "memory");
    }

    TEST(StorageFactoryTest, CacheIsNotStackedOnMemory)
    {
        auto config = zconfig::SessionConfig::default_config();
        config.cache_enabled = true;
        EXPECT_EQ(make_storage(config)->name(), "memory");
    }

    TEST(StorageFactoryTest, BuilderFillsDefaults)
    {
        auto config = zconfig::SessionConfig::default_config();
        config.serializer_format = zconfig::SerializerFormat::MSGPACK;
        config.cookie_name = "app_session";

        SessionManagerBuilder builder;
        builder.build_config(config);
        const auto manager = builder.build();
        EXPECT_EQ(manager->get_storage()->name(), "memory");
        EXPECT_EQ(manager->get_config().cookie_name, "app_session");

        auto session = manager->begin_request(std::nullopt);
        session.set_attribute("k", "v");
        const auto instruction = manager->end_request(session);
        EXPECT_EQ(instruction.action, TokenAction::SET);
        EXPECT_EQ(instruction.cookie_name, "app_session");
        EXPECT_EQ(instruction.session_id.size(), 64u);

        const auto payload = manager->get_storage()->load(instruction.session_id);
        ASSERT_TRUE(payload.has_value());
        EXPECT_EQ(Serializer(zconfig::SerializerFormat::MSGPACK).decode(*payload), nlohmann::json({{"k", "v"}}));
    }
} // namespace zstore::zsession
