#include "session/memory_storage.h"
#include "log/logger.h"

namespace zstore::zsession
{
    MemoryStorage::MemoryStorage(Clock::ptr clock, const std::chrono::seconds sweep_interval)
        : clock_(std::move(clock)), sweep_interval_(sweep_interval)
    {
        if (!clock_)
        {
            clock_ = std::make_shared<SystemClock>();
        }
        next_sweep_ = clock_->now() + sweep_interval_;
    }

    // 加载会话
    std::optional<std::string> MemoryStorage::load(const std::string &session_id)
    {
        auto record = load_with_expiry(session_id);
        if (!record)
        {
            return std::nullopt;
        }
        return std::move(record->payload);
    }

    std::optional<StoredRecord> MemoryStorage::load_with_expiry(const std::string &session_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            ZSTORE_LOG_DEBUG("Session {} not found in memory storage", session_id);
            return std::nullopt;
        }

        const auto now = clock_->now();
        if (is_expired(it->second, now))
        {
            ZSTORE_LOG_DEBUG("Session {} has expired, removing from memory storage", session_id);
            sessions_.erase(it);
            return std::nullopt;
        }

        Ttl remaining;
        if (it->second.expiry)
        {
            // 向下取整，调用方据此缓存时不会晚于本记录过期
            remaining = std::chrono::duration_cast<std::chrono::seconds>(*it->second.expiry - now);
        }
        return StoredRecord{it->second.payload, remaining};
    }

    // 存储会话
    void MemoryStorage::save(const std::string &session_id, const std::string &payload, const Ttl ttl)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_sweep_locked();
        sessions_[session_id] = Record{payload, expiry_from(ttl)};
        ZSTORE_LOG_DEBUG("Session {} stored, total sessions: {}", session_id, sessions_.size());
    }

    bool MemoryStorage::create(const std::string &session_id, const std::string &payload, const Ttl ttl)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        maybe_sweep_locked();

        if (const auto it = sessions_.find(session_id); it != sessions_.end())
        {
            if (!is_expired(it->second, clock_->now()))
            {
                return false;
            }
            sessions_.erase(it);
        }

        sessions_.emplace(session_id, Record{payload, expiry_from(ttl)});
        ZSTORE_LOG_DEBUG("Session {} created, total sessions: {}", session_id, sessions_.size());
        return true;
    }

    // 删除会话
    void MemoryStorage::remove(const std::string &session_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.erase(session_id) > 0)
        {
            ZSTORE_LOG_DEBUG("Session {} removed, remaining sessions: {}", session_id, sessions_.size());
        }
    }

    bool MemoryStorage::supports_touch() const
    {
        return true;
    }

    bool MemoryStorage::touch(const std::string &session_id, const Ttl ttl)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            return false;
        }
        if (is_expired(it->second, clock_->now()))
        {
            sessions_.erase(it);
            return false;
        }
        it->second.expiry = expiry_from(ttl);
        return true;
    }

    std::string MemoryStorage::name() const
    {
        return "memory";
    }

    // 清除所有过期会话
    size_t MemoryStorage::clear_expired()
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const size_t removed_count = sweep_locked(clock_->now());
        ZSTORE_LOG_INFO("Expired session cleanup completed: removed {}, remaining {}",
                        removed_count, sessions_.size());
        return removed_count;
    }

    size_t MemoryStorage::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    size_t MemoryStorage::sweep_locked(const Clock::time_point now)
    {
        size_t removed_count = 0;
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            if (is_expired(it->second, now))
            {
                it = sessions_.erase(it);
                removed_count++;
            }
            else
            {
                ++it;
            }
        }
        next_sweep_ = now + sweep_interval_;
        return removed_count;
    }

    void MemoryStorage::maybe_sweep_locked()
    {
        const auto now = clock_->now();
        if (now < next_sweep_)
        {
            return;
        }
        const size_t removed_count = sweep_locked(now);
        if (removed_count > 0)
        {
            ZSTORE_LOG_DEBUG("Swept {} expired sessions from memory storage, remaining {}",
                             removed_count, sessions_.size());
        }
    }

    bool MemoryStorage::is_expired(const Record &record, const Clock::time_point now) const
    {
        return record.expiry.has_value() && *record.expiry <= now;
    }

    std::optional<Clock::time_point> MemoryStorage::expiry_from(const Ttl ttl) const
    {
        if (!ttl)
        {
            return std::nullopt;
        }
        const auto now = clock_->now();
        // 超出时钟可表示范围的有效期按永不过期处理
        if (*ttl >= std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now))
        {
            return std::nullopt;
        }
        return now + *ttl;
    }
} // namespace zstore::zsession
