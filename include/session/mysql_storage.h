#pragma once
#include "session_storage.h"
#include "clock.h"
#include "../db_pool/mysql_pool.h"

namespace zstore::zsession
{
    /**
     * MySQL存储。
     *
     * 表结构: (id VARCHAR(128) PRIMARY KEY, payload LONGBLOB, expires_at BIGINT)，
     * expires_at 为Unix秒，0 表示永不过期。过期行在读取时视为不存在并顺带删除。
     */
    class MysqlStorage final : public SessionStorage
    {
    public:
        MysqlStorage(std::shared_ptr<zdb::MysqlConnectionPool> pool, std::string table = "sessions",
                     Clock::ptr clock = std::make_shared<SystemClock>());

        ~MysqlStorage() override = default;

        // 建表(已存在则跳过)
        void ensure_schema();

        std::optional<std::string> load(const std::string &session_id) override;

        std::optional<StoredRecord> load_with_expiry(const std::string &session_id) override;

        void save(const std::string &session_id, const std::string &payload, Ttl ttl) override;

        bool create(const std::string &session_id, const std::string &payload, Ttl ttl) override;

        void remove(const std::string &session_id) override;

        [[nodiscard]] bool supports_touch() const override;

        bool touch(const std::string &session_id, Ttl ttl) override;

        [[nodiscard]] std::string name() const override;

    private:
        [[nodiscard]] int64_t expires_at(Ttl ttl) const;

    private:
        std::shared_ptr<zdb::MysqlConnectionPool> pool_;
        std::string table_;
        Clock::ptr clock_;
    };
} // namespace zstore::zsession
