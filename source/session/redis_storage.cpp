#include "session/redis_storage.h"
#include "session/session_exception.h"
#include "log/logger.h"

namespace zstore::zsession
{
    RedisStorage::RedisStorage(std::shared_ptr<zdb::RedisConnectionPool> pool, std::string key_prefix)
        : pool_(std::move(pool)), key_prefix_(std::move(key_prefix))
    {
        if (!pool_)
        {
            throw std::invalid_argument("RedisStorage requires a connection pool");
        }
    }

    // 从Redis加载会话
    std::optional<std::string> RedisStorage::load(const std::string &session_id)
    {
        try
        {
            const auto conn = pool_->get_connection();
            auto payload = conn->get(make_key(session_id));
            ZSTORE_LOG_DEBUG("Session {} {} in Redis", session_id, payload ? "found" : "not found");
            return payload;
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Failed to load session {} from Redis: {}", session_id, e.what());
            throw StoreUnavailable(std::string("Redis load failed: ") + e.what());
        }
    }

    std::optional<StoredRecord> RedisStorage::load_with_expiry(const std::string &session_id)
    {
        try
        {
            const auto conn = pool_->get_connection();
            const std::string key = make_key(session_id);
            auto payload = conn->get(key);
            if (!payload)
            {
                return std::nullopt;
            }

            const long long remaining_ms = conn->pttl(key);
            if (remaining_ms == -2)
            {
                // GET 与 PTTL 之间键已过期
                return std::nullopt;
            }
            Ttl remaining;
            if (remaining_ms >= 0)
            {
                remaining = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::milliseconds(remaining_ms));
            }
            return StoredRecord{std::move(*payload), remaining};
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Failed to load session {} from Redis: {}", session_id, e.what());
            throw StoreUnavailable(std::string("Redis load failed: ") + e.what());
        }
    }

    // 存储会话到Redis
    void RedisStorage::save(const std::string &session_id, const std::string &payload, const Ttl ttl)
    {
        try
        {
            const auto conn = pool_->get_connection();
            // ttl为0时SET会同时清除旧的过期时间
            conn->set(make_key(session_id), payload, ttl.value_or(std::chrono::seconds(0)));
            ZSTORE_LOG_DEBUG("Session {} stored to Redis with TTL {} seconds",
                             session_id, ttl ? ttl->count() : 0);
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Failed to store session {} to Redis: {}", session_id, e.what());
            throw StoreUnavailable(std::string("Redis save failed: ") + e.what());
        }
    }

    bool RedisStorage::create(const std::string &session_id, const std::string &payload, const Ttl ttl)
    {
        try
        {
            const auto conn = pool_->get_connection();
            return conn->set(make_key(session_id), payload, ttl.value_or(std::chrono::seconds(0)), true);
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Failed to create session {} in Redis: {}", session_id, e.what());
            throw StoreUnavailable(std::string("Redis create failed: ") + e.what());
        }
    }

    // 删除会话
    void RedisStorage::remove(const std::string &session_id)
    {
        try
        {
            const auto conn = pool_->get_connection();
            if (!conn->del(make_key(session_id)))
            {
                ZSTORE_LOG_DEBUG("Session {} not found for removal in Redis", session_id);
            }
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Failed to remove session {} from Redis: {}", session_id, e.what());
            throw StoreUnavailable(std::string("Redis remove failed: ") + e.what());
        }
    }

    bool RedisStorage::supports_touch() const
    {
        return true;
    }

    bool RedisStorage::touch(const std::string &session_id, const Ttl ttl)
    {
        try
        {
            const auto conn = pool_->get_connection();
            const std::string key = make_key(session_id);
            if (ttl)
            {
                return conn->expire(key, *ttl);
            }
            // PERSIST 对没有过期时间的键返回0，需要再确认键是否存在
            return conn->persist(key) || conn->exists(key);
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Failed to touch session {} in Redis: {}", session_id, e.what());
            throw StoreUnavailable(std::string("Redis touch failed: ") + e.what());
        }
    }

    std::string RedisStorage::name() const
    {
        return "redis";
    }

    std::string RedisStorage::make_key(const std::string &session_id) const
    {
        return key_prefix_ + session_id;
    }
} // namespace zstore::zsession
