#pragma once
#include "../../include/config/session_config.h"
#include "../../include/db_pool/redis_connection.h"
#include "../../include/db_pool/mysql_connection.h"
#include <cstdlib>
#include <gtest/gtest.h>

namespace zstore::zdb
{
    // 测试服务器地址，可用环境变量覆盖
    inline std::string env_or(const char *name, const std::string &fallback)
    {
        const char *value = std::getenv(name);
        return value ? std::string(value) : fallback;
    }

    inline zconfig::RedisOptions test_redis_options()
    {
        zconfig::RedisOptions options;
        options.host = env_or("ZSTORE_TEST_REDIS_HOST", "127.0.0.1");
        options.password = env_or("ZSTORE_TEST_REDIS_PASSWORD", "");
        options.db = 15;
        options.pool_size = 3;
        options.timeout_ms = 1000;
        return options;
    }

    inline zconfig::MysqlOptions test_mysql_options()
    {
        zconfig::MysqlOptions options;
        options.host = env_or("ZSTORE_TEST_MYSQL_HOST", "tcp://127.0.0.1:3306");
        options.user = env_or("ZSTORE_TEST_MYSQL_USER", "root");
        options.password = env_or("ZSTORE_TEST_MYSQL_PASSWORD", "");
        options.database = env_or("ZSTORE_TEST_MYSQL_DATABASE", "zstore_test");
        options.table = "gtest_sessions";
        options.pool_size = 3;
        options.timeout_ms = 1000;
        return options;
    }

    // 只探测一次，结果缓存
    inline bool redis_available()
    {
        static const bool available = []()
        {
            const auto options = test_redis_options();
            try
            {
                RedisConnection conn(options.host, options.port, options.password, options.db, options.timeout_ms);
                return conn.ping();
            }
            catch (const DBException &)
            {
                return false;
            }
        }();
        return available;
    }

    inline bool mysql_available()
    {
        static const bool available = []()
        {
            const auto options = test_mysql_options();
            try
            {
                MysqlConnection conn(options.host, options.user, options.password, options.database,
                                     options.timeout_ms);
                return conn.ping();
            }
            catch (const DBException &)
            {
                return false;
            }
        }();
        return available;
    }
} // namespace zstore::zdb

#define ZSTORE_REQUIRE_REDIS() \
    if (!zstore::zdb::redis_available()) GTEST_SKIP() << "Redis server not reachable"

#define ZSTORE_REQUIRE_MYSQL() \
    if (!zstore::zdb::mysql_available()) GTEST_SKIP() << "MySQL server not reachable"
