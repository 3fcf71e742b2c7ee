#pragma once
#include "mysql_connection.h"
#include "connection_pool.h"
#include "../config/session_config.h"

namespace zstore::zdb
{
    class MysqlConnectionPool final : public ConnectionPool<MysqlConnection>
    {
    public:
        explicit MysqlConnectionPool(const zconfig::MysqlOptions &options);

        // 创建并初始化连接池
        static std::shared_ptr<MysqlConnectionPool> create(const zconfig::MysqlOptions &options);
    };
} // namespace zstore::zdb
