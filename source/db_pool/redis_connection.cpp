#include "db_pool/redis_connection.h"
#include "log/logger.h"

namespace zstore::zdb
{
    RedisConnection::RedisConnection(std::string host, int port, std::string password,
                                     int db, int timeout_ms)
        : host_(std::move(host)), port_(port), password_(std::move(password)),
          db_(db), timeout_ms_(timeout_ms)
    {
        ZSTORE_LOG_DEBUG("Creating Redis connection to {}:{}/{}", host_, port_, db_);
        std::lock_guard<std::mutex> lockGuard(mutex_);
        connect_helper();
    }

    RedisConnection::~RedisConnection()
    {
        ZSTORE_LOG_DEBUG("Redis connection to {}:{} closed", host_, port_);
    }

    bool RedisConnection::ping() const
    {
        try
        {
            std::lock_guard<std::mutex> lockGuard(mutex_);
            if (!redis_)
            {
                ZSTORE_LOG_WARN("Redis connection is null, ping failed");
                return false;
            }

            redis_->ping();
            return true;
        }
        catch (const std::exception &e)
        {
            ZSTORE_LOG_WARN("Redis ping failed: {}", e.what());
            return false;
        }
    }

    bool RedisConnection::is_valid() const
    {
        return ping();
    }

    void RedisConnection::reconnect()
    {
        ZSTORE_LOG_INFO("Attempting to reconnect to Redis {}:{}/{}", host_, port_, db_);
        std::lock_guard<std::mutex> lockGuard(mutex_);

        redis_.reset();
        connect_helper();
        ZSTORE_LOG_INFO("Redis reconnection successful");
    }

    void RedisConnection::connect_helper()
    {
        try
        {
            sw::redis::ConnectionOptions opts;
            opts.host = host_;
            opts.port = port_;
            opts.db = db_;
            opts.socket_timeout = std::chrono::milliseconds(timeout_ms_);
            opts.connect_timeout = std::chrono::milliseconds(timeout_ms_);

            if (!password_.empty())
            {
                opts.password = password_;
            }

            sw::redis::ConnectionPoolOptions pool_opts;
            pool_opts.size = 1; // 每个连接对象内部只维护一个连接
            pool_opts.wait_timeout = std::chrono::milliseconds(timeout_ms_);

            redis_ = std::make_unique<sw::redis::Redis>(opts, pool_opts);

            // 测试连接
            redis_->ping();
            ZSTORE_LOG_DEBUG("Redis connection established to {}:{}", host_, port_);
        }
        catch (const std::exception &e)
        {
            redis_.reset();
            ZSTORE_LOG_ERROR("Failed to create Redis connection to {}:{}: {}", host_, port_, e.what());
            throw DBException("Failed to create Redis connection: " + std::string(e.what()));
        }
    }

    sw::redis::Redis &RedisConnection::handle() const
    {
        if (!redis_)
        {
            throw DBException("Redis connection to " + host_ + ":" + std::to_string(port_) + " is not established");
        }
        return *redis_;
    }

    bool RedisConnection::set(const std::string &key, const std::string &value,
                              const std::chrono::seconds ttl, const bool only_if_absent) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            const auto type = only_if_absent ? sw::redis::UpdateType::NOT_EXIST : sw::redis::UpdateType::ALWAYS;
            return handle().set(key, value, std::chrono::duration_cast<std::chrono::milliseconds>(ttl), type);
        }
        catch (const std::exception &e)
        {
            ZSTORE_LOG_ERROR("Redis SET failed for key {}: {}", key, e.what());
            throw DBException(e.what());
        }
    }

    std::optional<std::string> RedisConnection::get(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            auto value = handle().get(key);
            if (!value)
            {
                return std::nullopt;
            }
            return std::string(*value);
        }
        catch (const std::exception &e)
        {
            ZSTORE_LOG_ERROR("Redis GET failed for key {}: {}", key, e.what());
            throw DBException(e.what());
        }
    }

    bool RedisConnection::exists(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            return handle().exists(key) > 0;
        }
        catch (const std::exception &e)
        {
            ZSTORE_LOG_ERROR("Redis EXISTS failed for key {}: {}", key, e.what());
            throw DBException(e.what());
        }
    }

    bool RedisConnection::del(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            return handle().del(key) > 0;
        }
        catch (const std::exception &e)
        {
            ZSTORE_LOG_ERROR("Redis DEL failed for key {}: {}", key, e.what());
            throw DBException(e.what());
        }
    }

    bool RedisConnection::expire(const std::string &key, const std::chrono::seconds ttl) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            return handle().expire(key, ttl);
        }
        catch (const std::exception &e)
        {
            ZSTORE_LOG_ERROR("Redis EXPIRE failed for key {}: {}", key, e.what());
            throw DBException(e.what());
        }
    }

    bool RedisConnection::persist(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            return handle().persist(key);
        }
        catch (const std::exception &e)
        {
            ZSTORE_LOG_ERROR("Redis PERSIST failed for key {}: {}", key, e.what());
            throw DBException(e.what());
        }
    }

    long long RedisConnection::pttl(const std::string &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            return handle().pttl(key);
        }
        catch (const std::exception &e)
        {
            ZSTORE_LOG_ERROR("Redis PTTL failed for key {}: {}", key, e.what());
            throw DBException(e.what());
        }
    }
} // namespace zstore::zdb
