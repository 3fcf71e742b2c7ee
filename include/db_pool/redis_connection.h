#pragma once

#include <memory>
#include <string>
#include <optional>
#include <chrono>
#include <mutex>
#include <sw/redis++/redis++.h>
#include "db_exception.h"

namespace zstore::zdb
{
    class RedisConnection
    {
    public:
        explicit RedisConnection(std::string host, int port = 6379, std::string password = "",
                                 int db = 0, int timeout_ms = 5000);

        ~RedisConnection();

        // 禁止拷贝与赋值
        RedisConnection(const RedisConnection &) = delete;
        RedisConnection &operator=(const RedisConnection &) = delete;

        // 判断连接是否有效
        [[nodiscard]] bool is_valid() const;

        // 重新连接
        void reconnect();

        // 检测连接是否有效
        bool ping() const;

        // Redis操作接口，失败时抛出 DBException
        // ttl 为0表示不过期，only_if_absent 对应 SET NX，返回是否写入
        bool set(const std::string &key, const std::string &value,
                 std::chrono::seconds ttl = std::chrono::seconds(0), bool only_if_absent = false) const;
        std::optional<std::string> get(const std::string &key) const;
        bool exists(const std::string &key) const;
        bool del(const std::string &key) const;
        bool expire(const std::string &key, std::chrono::seconds ttl) const;
        bool persist(const std::string &key) const;
        // 剩余毫秒数，-1 表示没有过期时间，-2 表示键不存在
        long long pttl(const std::string &key) const;

    private:
        // 辅助连接并配置
        void connect_helper();

        // 重连失败后句柄为空，此时抛出 DBException
        sw::redis::Redis &handle() const;

    private:
        std::unique_ptr<sw::redis::Redis> redis_{}; // Redis连接
        std::string host_;
        int port_;
        std::string password_;
        int db_;
        int timeout_ms_;
        mutable std::mutex mutex_;
    };
} // namespace zstore::zdb
