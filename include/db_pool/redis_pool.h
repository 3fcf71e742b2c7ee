#pragma once
#include "redis_connection.h"
#include "connection_pool.h"
#include "../config/session_config.h"

namespace zstore::zdb
{
    class RedisConnectionPool final : public ConnectionPool<RedisConnection>
    {
    public:
        explicit RedisConnectionPool(const zconfig::RedisOptions &options);

        // 创建并初始化连接池
        static std::shared_ptr<RedisConnectionPool> create(const zconfig::RedisOptions &options);
    };
} // namespace zstore::zdb
