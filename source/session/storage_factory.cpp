#include "session/storage_factory.h"
#include "session/memory_storage.h"
#include "session/redis_storage.h"
#include "session/mysql_storage.h"
#include "session/tiered_storage.h"
#include "session/session_exception.h"
#include "log/logger.h"

namespace zstore::zsession
{
    namespace
    {
        SessionStorage::ptr make_primary(const zconfig::SessionConfig &config, Clock::ptr clock)
        {
            switch (config.storage_type)
            {
                case zconfig::StorageType::MEMORY:
                    return StorageFactory<MemoryStorage, Clock::ptr>::create(std::move(clock));
                case zconfig::StorageType::REDIS:
                {
                    auto pool = zdb::RedisConnectionPool::create(config.redis);
                    return StorageFactory<RedisStorage, std::shared_ptr<zdb::RedisConnectionPool>, std::string>::create(
                        std::move(pool), std::string(config.key_prefix));
                }
                case zconfig::StorageType::MYSQL:
                {
                    auto pool = zdb::MysqlConnectionPool::create(config.mysql);
                    auto storage = std::make_shared<MysqlStorage>(std::move(pool), config.mysql.table, std::move(clock));
                    storage->ensure_schema();
                    return storage;
                }
            }
            throw std::invalid_argument("Unknown storage type");
        }
    } // namespace

    SessionStorage::ptr make_storage(const zconfig::SessionConfig &config, Clock::ptr clock)
    {
        ZSTORE_LOG_INFO("Creating {} session storage", zconfig::to_string(config.storage_type));

        SessionStorage::ptr primary;
        try
        {
            primary = make_primary(config, clock);
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Cannot connect {} session storage: {}", zconfig::to_string(config.storage_type), e.what());
            throw StoreUnavailable(e.what());
        }

        if (!config.cache_enabled || config.storage_type == zconfig::StorageType::MEMORY)
        {
            return primary;
        }

        auto cache = StorageFactory<MemoryStorage, Clock::ptr>::create(std::move(clock));
        return std::make_shared<TieredStorage>(std::move(cache), std::move(primary), config.cache_ttl);
    }
} // namespace zstore::zsession
