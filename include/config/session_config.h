#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace zstore::zconfig
{
    class ConfigException final : public std::runtime_error
    {
    public:
        explicit ConfigException(const std::string &message) : std::runtime_error(message) {}
    };

    enum class StorageType
    {
        MEMORY,
        REDIS,
        MYSQL
    };

    enum class SerializerFormat
    {
        JSON,
        MSGPACK
    };

    struct RedisOptions
    {
        std::string host = "127.0.0.1";
        int port = 6379;
        std::string password;
        int db = 0;
        int pool_size = 10;
        int timeout_ms = 5000; // 连接、读写及借用连接的超时
    };

    struct MysqlOptions
    {
        std::string host = "tcp://127.0.0.1:3306";
        std::string user = "root";
        std::string password;
        std::string database = "zstore";
        std::string table = "sessions";
        int pool_size = 10;
        int timeout_ms = 5000;
    };

    // 会话存储配置，启动时构建一次后按值传入各组件
    struct SessionConfig
    {
        static constexpr int64_t kMaxTtlSeconds = 100LL * 365 * 24 * 3600; // 100年
        static constexpr int kMaxPoolSize = 1024;

        StorageType storage_type = StorageType::MEMORY;
        RedisOptions redis;
        MysqlOptions mysql;

        std::string key_prefix = "session:";                            // 后端键前缀
        std::chrono::seconds ttl = std::chrono::hours(24 * 31);         // 会话默认有效期
        std::string cookie_name = "session_id";                          // 仅透传给框架适配层
        bool permanent_default = false;                                  // 新会话是否永不过期
        bool strict_mode = false;                                        // 加载失败时是否直接抛出
        bool refresh_each_request = false;                               // 未修改的会话是否也续期
        SerializerFormat serializer_format = SerializerFormat::JSON;
        size_t id_bytes = 32;                                            // 会话ID随机字节数

        bool cache_enabled = false;                                      // 是否在后端前加内存缓存
        std::chrono::seconds cache_ttl = std::chrono::seconds(300);

        std::string log_level = "info";

        static SessionConfig default_config()
        {
            return SessionConfig{};
        }

        // 从JSON对象构建，缺省字段使用默认值
        static SessionConfig from_json(const nlohmann::json &j);

        // 从JSON配置文件构建
        static SessionConfig load_from_file(const std::string &path);

        // 校验取值范围，不合法时抛出 ConfigException
        void validate() const;
    };

    std::string to_string(StorageType type);

    std::string to_string(SerializerFormat format);
} // namespace zstore::zconfig
