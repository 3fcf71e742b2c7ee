#include "session/mysql_storage.h"
#include "session/session_exception.h"
#include "log/logger.h"

namespace zstore::zsession
{
    MysqlStorage::MysqlStorage(std::shared_ptr<zdb::MysqlConnectionPool> pool, std::string table, Clock::ptr clock)
        : pool_(std::move(pool)), table_(std::move(table)), clock_(std::move(clock))
    {
        if (!pool_)
        {
            throw std::invalid_argument("MysqlStorage requires a connection pool");
        }
        if (!clock_)
        {
            clock_ = std::make_shared<SystemClock>();
        }
    }

    void MysqlStorage::ensure_schema()
    {
        try
        {
            const auto conn = pool_->get_connection();
            conn->execute("CREATE TABLE IF NOT EXISTS " + table_ + " ("
                          "id VARCHAR(128) NOT NULL PRIMARY KEY, "
                          "payload LONGBLOB NOT NULL, "
                          "expires_at BIGINT NOT NULL DEFAULT 0, "
                          "INDEX idx_expires_at (expires_at))");
            ZSTORE_LOG_INFO("MySQL session table {} ready", table_);
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Failed to create session table {}: {}", table_, e.what());
            throw StoreUnavailable(std::string("MySQL schema setup failed: ") + e.what());
        }
    }

    std::optional<std::string> MysqlStorage::load(const std::string &session_id)
    {
        auto record = load_with_expiry(session_id);
        if (!record)
        {
            return std::nullopt;
        }
        return std::move(record->payload);
    }

    std::optional<StoredRecord> MysqlStorage::load_with_expiry(const std::string &session_id)
    {
        try
        {
            const auto conn = pool_->get_connection();
            const auto rows = conn->execute_query(
                "SELECT payload, expires_at FROM " + table_ + " WHERE id = ?", session_id);
            if (rows.empty())
            {
                ZSTORE_LOG_DEBUG("Session {} not found in MySQL", session_id);
                return std::nullopt;
            }

            const int64_t expiry = std::stoll(rows[0][1]);
            const int64_t now = to_epoch_seconds(clock_->now());
            if (expiry != 0 && expiry <= now)
            {
                ZSTORE_LOG_DEBUG("Session {} has expired, removing from MySQL", session_id);
                conn->execute_update("DELETE FROM " + table_ + " WHERE id = ? AND expires_at <> 0 AND expires_at <= ?",
                                     session_id, now);
                return std::nullopt;
            }
            Ttl remaining;
            if (expiry != 0)
            {
                remaining = std::chrono::seconds(expiry - now);
            }
            return StoredRecord{rows[0][0], remaining};
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Failed to load session {} from MySQL: {}", session_id, e.what());
            throw StoreUnavailable(std::string("MySQL load failed: ") + e.what());
        }
        catch (const std::logic_error &e)
        {
            // expires_at 列无法解析
            ZSTORE_LOG_ERROR("Malformed expiry for session {} in MySQL: {}", session_id, e.what());
            return std::nullopt;
        }
    }

    void MysqlStorage::save(const std::string &session_id, const std::string &payload, const Ttl ttl)
    {
        try
        {
            const auto conn = pool_->get_connection();
            conn->execute_update(
                "INSERT INTO " + table_ + " (id, payload, expires_at) VALUES (?, ?, ?) "
                "ON DUPLICATE KEY UPDATE payload = VALUES(payload), expires_at = VALUES(expires_at)",
                session_id, payload, expires_at(ttl));
            ZSTORE_LOG_DEBUG("Session {} stored to MySQL", session_id);
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Failed to store session {} to MySQL: {}", session_id, e.what());
            throw StoreUnavailable(std::string("MySQL save failed: ") + e.what());
        }
    }

    bool MysqlStorage::create(const std::string &session_id, const std::string &payload, const Ttl ttl)
    {
        try
        {
            const auto conn = pool_->get_connection();
            // 先清掉同ID的过期行，再做不覆盖的插入
            conn->execute_update("DELETE FROM " + table_ + " WHERE id = ? AND expires_at <> 0 AND expires_at <= ?",
                                 session_id, to_epoch_seconds(clock_->now()));
            const int inserted = conn->execute_update(
                "INSERT IGNORE INTO " + table_ + " (id, payload, expires_at) VALUES (?, ?, ?)",
                session_id, payload, expires_at(ttl));
            return inserted > 0;
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Failed to create session {} in MySQL: {}", session_id, e.what());
            throw StoreUnavailable(std::string("MySQL create failed: ") + e.what());
        }
    }

    void MysqlStorage::remove(const std::string &session_id)
    {
        try
        {
            const auto conn = pool_->get_connection();
            conn->execute_update("DELETE FROM " + table_ + " WHERE id = ?", session_id);
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Failed to remove session {} from MySQL: {}", session_id, e.what());
            throw StoreUnavailable(std::string("MySQL remove failed: ") + e.what());
        }
    }

    bool MysqlStorage::supports_touch() const
    {
        return true;
    }

    bool MysqlStorage::touch(const std::string &session_id, const Ttl ttl)
    {
        try
        {
            const auto conn = pool_->get_connection();
            const int64_t now = to_epoch_seconds(clock_->now());
            const int changed = conn->execute_update(
                "UPDATE " + table_ + " SET expires_at = ? WHERE id = ? AND (expires_at = 0 OR expires_at > ?)",
                expires_at(ttl), session_id, now);
            if (changed > 0)
            {
                return true;
            }
            // 新旧过期时间相同时 UPDATE 不计入受影响行数
            const auto rows = conn->execute_query(
                "SELECT 1 FROM " + table_ + " WHERE id = ? AND (expires_at = 0 OR expires_at > ?)",
                session_id, now);
            return !rows.empty();
        }
        catch (const zdb::DBException &e)
        {
            ZSTORE_LOG_ERROR("Failed to touch session {} in MySQL: {}", session_id, e.what());
            throw StoreUnavailable(std::string("MySQL touch failed: ") + e.what());
        }
    }

    std::string MysqlStorage::name() const
    {
        return "mysql";
    }

    int64_t MysqlStorage::expires_at(const Ttl ttl) const
    {
        if (!ttl)
        {
            return 0;
        }
        return to_epoch_seconds(clock_->now()) + ttl->count();
    }
} // namespace zstore::zsession
