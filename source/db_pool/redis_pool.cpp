#include "db_pool/redis_pool.h"

namespace zstore::zdb
{
    RedisConnectionPool::RedisConnectionPool(const zconfig::RedisOptions &options)
        : ConnectionPool<RedisConnection>(
            "Redis",
            [options]()
            {
                return std::make_shared<RedisConnection>(options.host, options.port, options.password,
                                                         options.db, options.timeout_ms);
            },
            std::chrono::milliseconds(options.timeout_ms))
    {
        ZSTORE_LOG_DEBUG("Redis pool configured for {}:{}/{}", options.host, options.port, options.db);
    }

    std::shared_ptr<RedisConnectionPool> RedisConnectionPool::create(const zconfig::RedisOptions &options)
    {
        auto pool = std::make_shared<RedisConnectionPool>(options);
        pool->init(static_cast<uint32_t>(options.pool_size));
        return pool;
    }
} // namespace zstore::zdb
