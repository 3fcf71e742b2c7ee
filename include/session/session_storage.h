#pragma once
#include <memory>
#include <string>
#include <optional>
#include <chrono>

namespace zstore::zsession
{
    // 记录有效期，std::nullopt 表示永不过期
    using Ttl = std::optional<std::chrono::seconds>;

    // 读取结果及其剩余有效期
    struct StoredRecord
    {
        std::string payload;
        Ttl remaining; // std::nullopt 表示永不过期
    };

    /**
     * 会话存储后端抽象，所有操作以会话ID为键。
     *
     * 实现需保证单键操作的原子性(后写者胜出)，连接失败、超时等错误统一抛出 StoreUnavailable。
     */
    class SessionStorage
    {
    public:
        using ptr = std::shared_ptr<SessionStorage>;

        virtual ~SessionStorage() = default;

        // 加载会话数据，不存在或已过期时返回空
        virtual std::optional<std::string> load(const std::string &session_id) = 0;

        // 加载会话数据并返回剩余有效期，默认实现视为永不过期
        virtual std::optional<StoredRecord> load_with_expiry(const std::string &session_id)
        {
            auto payload = load(session_id);
            if (!payload)
            {
                return std::nullopt;
            }
            return StoredRecord{std::move(*payload), std::nullopt};
        }

        // 写入会话数据并重置过期时间
        virtual void save(const std::string &session_id, const std::string &payload, Ttl ttl) = 0;

        // 仅当ID未被占用时写入，返回false表示ID冲突
        virtual bool create(const std::string &session_id, const std::string &payload, Ttl ttl)
        {
            if (load(session_id))
            {
                return false;
            }
            save(session_id, payload, ttl);
            return true;
        }

        // 删除会话，删除不存在的ID不是错误
        virtual void remove(const std::string &session_id) = 0;

        // 是否支持只刷新过期时间
        [[nodiscard]] virtual bool supports_touch() const
        {
            return false;
        }

        // 刷新过期时间，记录不存在时返回false
        virtual bool touch(const std::string &, Ttl)
        {
            return false;
        }

        [[nodiscard]] virtual std::string name() const = 0;
    };

    // 简单工厂模式
    template<typename StorageType, typename... Args>
    class StorageFactory
    {
    public:
        static std::shared_ptr<SessionStorage> create(Args &&... args)
        {
            return std::make_shared<StorageType>(std::forward<Args>(args)...);
        }
    };
} // namespace zstore::zsession
