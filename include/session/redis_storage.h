#pragma once
#include "session_storage.h"
#include "../db_pool/redis_pool.h"

namespace zstore::zsession
{
    // Redis存储，键为 key_prefix + 会话ID，过期由Redis TTL负责
    class RedisStorage final : public SessionStorage
    {
    public:
        RedisStorage(std::shared_ptr<zdb::RedisConnectionPool> pool, std::string key_prefix = "session:");

        ~RedisStorage() override = default;

        std::optional<std::string> load(const std::string &session_id) override;

        std::optional<StoredRecord> load_with_expiry(const std::string &session_id) override;

        void save(const std::string &session_id, const std::string &payload, Ttl ttl) override;

        bool create(const std::string &session_id, const std::string &payload, Ttl ttl) override;

        void remove(const std::string &session_id) override;

        [[nodiscard]] bool supports_touch() const override;

        bool touch(const std::string &session_id, Ttl ttl) override;

        [[nodiscard]] std::string name() const override;

    private:
        [[nodiscard]] std::string make_key(const std::string &session_id) const;

    private:
        std::shared_ptr<zdb::RedisConnectionPool> pool_;
        std::string key_prefix_;
    };
} // namespace zstore::zsession
