#include "db_pool/mysql_pool.h"

namespace zstore::zdb
{
    MysqlConnectionPool::MysqlConnectionPool(const zconfig::MysqlOptions &options)
        : ConnectionPool<MysqlConnection>(
            "MySQL",
            [options]()
            {
                return std::make_shared<MysqlConnection>(options.host, options.user, options.password,
                                                         options.database, options.timeout_ms);
            },
            std::chrono::milliseconds(options.timeout_ms))
    {
        ZSTORE_LOG_DEBUG("MySQL pool configured for {}@{}/{}", options.user, options.host, options.database);
    }

    std::shared_ptr<MysqlConnectionPool> MysqlConnectionPool::create(const zconfig::MysqlOptions &options)
    {
        auto pool = std::make_shared<MysqlConnectionPool>(options);
        pool->init(static_cast<uint32_t>(options.pool_size));
        return pool;
    }
} // namespace zstore::zdb
