#include "config/session_config.h"
#include "log/logger.h"
#include <fstream>

namespace zstore::zconfig
{
    namespace
    {
        template<typename T>
        void read_field(const nlohmann::json &j, const char *key, T &out)
        {
            const auto it = j.find(key);
            if (it == j.end() || it->is_null())
            {
                return;
            }
            try
            {
                out = it->get<T>();
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ConfigException(std::string("Invalid value for '") + key + "': " + e.what());
            }
        }

        const nlohmann::json &section(const nlohmann::json &j, const char *key)
        {
            static const nlohmann::json empty = nlohmann::json::object();
            const auto it = j.find(key);
            if (it == j.end() || it->is_null())
            {
                return empty;
            }
            if (!it->is_object())
            {
                throw ConfigException(std::string("Section '") + key + "' must be an object");
            }
            return *it;
        }

        StorageType parse_storage_type(const std::string &value)
        {
            if (value == "memory") return StorageType::MEMORY;
            if (value == "redis") return StorageType::REDIS;
            if (value == "mysql") return StorageType::MYSQL;
            throw ConfigException("Unknown storage type: " + value);
        }

        SerializerFormat parse_serializer_format(const std::string &value)
        {
            if (value == "json") return SerializerFormat::JSON;
            if (value == "msgpack") return SerializerFormat::MSGPACK;
            throw ConfigException("Unknown serializer format: " + value);
        }
    } // namespace

    SessionConfig SessionConfig::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            throw ConfigException("Session configuration must be a JSON object");
        }

        SessionConfig config;

        std::string storage = to_string(config.storage_type);
        read_field(j, "storage", storage);
        config.storage_type = parse_storage_type(storage);

        read_field(j, "key_prefix", config.key_prefix);

        int64_t ttl_seconds = config.ttl.count();
        read_field(j, "ttl_seconds", ttl_seconds);
        config.ttl = std::chrono::seconds(ttl_seconds);

        read_field(j, "cookie_name", config.cookie_name);
        read_field(j, "permanent", config.permanent_default);
        read_field(j, "strict_mode", config.strict_mode);
        read_field(j, "refresh_each_request", config.refresh_each_request);

        std::string serializer = to_string(config.serializer_format);
        read_field(j, "serializer", serializer);
        config.serializer_format = parse_serializer_format(serializer);

        read_field(j, "id_bytes", config.id_bytes);
        read_field(j, "log_level", config.log_level);

        const auto &cache = section(j, "cache");
        read_field(cache, "enabled", config.cache_enabled);
        int64_t cache_ttl_seconds = config.cache_ttl.count();
        read_field(cache, "ttl_seconds", cache_ttl_seconds);
        config.cache_ttl = std::chrono::seconds(cache_ttl_seconds);

        const auto &redis = section(j, "redis");
        read_field(redis, "host", config.redis.host);
        read_field(redis, "port", config.redis.port);
        read_field(redis, "password", config.redis.password);
        read_field(redis, "db", config.redis.db);
        read_field(redis, "pool_size", config.redis.pool_size);
        read_field(redis, "timeout_ms", config.redis.timeout_ms);

        const auto &mysql = section(j, "mysql");
        read_field(mysql, "host", config.mysql.host);
        read_field(mysql, "user", config.mysql.user);
        read_field(mysql, "password", config.mysql.password);
        read_field(mysql, "database", config.mysql.database);
        read_field(mysql, "table", config.mysql.table);
        read_field(mysql, "pool_size", config.mysql.pool_size);
        read_field(mysql, "timeout_ms", config.mysql.timeout_ms);

        config.validate();
        return config;
    }

    SessionConfig SessionConfig::load_from_file(const std::string &path)
    {
        ZSTORE_LOG_INFO("Loading session configuration from {}", path);

        std::ifstream in(path);
        if (!in.is_open())
        {
            throw ConfigException("Cannot open configuration file: " + path);
        }

        const nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
        if (j.is_discarded())
        {
            throw ConfigException("Malformed JSON in configuration file: " + path);
        }

        auto config = from_json(j);
        ZSTORE_LOG_INFO("Session configuration loaded: storage={}, ttl={}s, serializer={}",
                        to_string(config.storage_type), config.ttl.count(),
                        to_string(config.serializer_format));
        return config;
    }

    void SessionConfig::validate() const
    {
        if (ttl.count() <= 0 || ttl.count() > kMaxTtlSeconds)
        {
            throw ConfigException("ttl_seconds must be between 1 and " + std::to_string(kMaxTtlSeconds));
        }
        if (id_bytes < 16 || id_bytes > 64)
        {
            throw ConfigException("id_bytes must be between 16 and 64");
        }
        if (cookie_name.empty())
        {
            throw ConfigException("cookie_name must not be empty");
        }
        if (cache_enabled && (cache_ttl.count() <= 0 || cache_ttl.count() > kMaxTtlSeconds))
        {
            throw ConfigException("cache.ttl_seconds must be between 1 and " + std::to_string(kMaxTtlSeconds));
        }
        if (redis.pool_size <= 0 || redis.pool_size > kMaxPoolSize ||
            mysql.pool_size <= 0 || mysql.pool_size > kMaxPoolSize)
        {
            throw ConfigException("pool_size must be between 1 and " + std::to_string(kMaxPoolSize));
        }
        if (redis.timeout_ms <= 0 || mysql.timeout_ms <= 0)
        {
            throw ConfigException("timeout_ms must be positive");
        }
        if (mysql.table.empty() ||
            mysql.table.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_") !=
            std::string::npos)
        {
            throw ConfigException("mysql.table must be a plain identifier: " + mysql.table);
        }
        if (log_level != "debug" && log_level != "info" && log_level != "warn" &&
            log_level != "error" && log_level != "fatal")
        {
            throw ConfigException("Unknown log level: " + log_level);
        }
    }

    std::string to_string(const StorageType type)
    {
        switch (type)
        {
            case StorageType::MEMORY:
                return "memory";
            case StorageType::REDIS:
                return "redis";
            case StorageType::MYSQL:
                return "mysql";
        }
        return "unknown";
    }

    std::string to_string(const SerializerFormat format)
    {
        switch (format)
        {
            case SerializerFormat::JSON:
                return "json";
            case SerializerFormat::MSGPACK:
                return "msgpack";
        }
        return "unknown";
    }
} // namespace zstore::zconfig
