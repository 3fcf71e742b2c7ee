#include "session/tiered_storage.h"
#include "session/session_exception.h"
#include "log/logger.h"
#include <algorithm>

namespace zstore::zsession
{
    TieredStorage::TieredStorage(SessionStorage::ptr cache, SessionStorage::ptr primary,
                                 const std::chrono::seconds cache_ttl)
        : cache_(std::move(cache)), primary_(std::move(primary)), cache_ttl_(cache_ttl)
    {
        if (!cache_ || !primary_)
        {
            throw std::invalid_argument("TieredStorage requires both a cache and a primary storage");
        }
        ZSTORE_LOG_INFO("Tiered storage: {} cache in front of {} (cache ttl {}s)",
                        cache_->name(), primary_->name(), cache_ttl_.count());
    }

    std::optional<std::string> TieredStorage::load(const std::string &session_id)
    {
        try
        {
            if (auto cached = cache_->load(session_id))
            {
                ZSTORE_LOG_DEBUG("Session {} served from {} cache", session_id, cache_->name());
                return cached;
            }
        }
        catch (const StoreUnavailable &e)
        {
            ZSTORE_LOG_WARN("Cache {} unavailable on load, falling back to {}: {}",
                            cache_->name(), primary_->name(), e.what());
        }

        auto record = primary_->load_with_expiry(session_id);
        if (!record)
        {
            return std::nullopt;
        }
        // 回填的缓存记录不能比主存储中的记录活得更久
        if (!record->remaining || record->remaining->count() > 0)
        {
            fill_cache(session_id, record->payload, record->remaining);
        }
        return std::move(record->payload);
    }

    std::optional<StoredRecord> TieredStorage::load_with_expiry(const std::string &session_id)
    {
        return primary_->load_with_expiry(session_id);
    }

    void TieredStorage::save(const std::string &session_id, const std::string &payload, const Ttl ttl)
    {
        primary_->save(session_id, payload, ttl);
        fill_cache(session_id, payload, ttl);
    }

    bool TieredStorage::create(const std::string &session_id, const std::string &payload, const Ttl ttl)
    {
        if (!primary_->create(session_id, payload, ttl))
        {
            return false;
        }
        fill_cache(session_id, payload, ttl);
        return true;
    }

    void TieredStorage::remove(const std::string &session_id)
    {
        primary_->remove(session_id);
        cache_->remove(session_id);
    }

    bool TieredStorage::supports_touch() const
    {
        return primary_->supports_touch();
    }

    bool TieredStorage::touch(const std::string &session_id, const Ttl ttl)
    {
        const bool touched = primary_->touch(session_id, ttl);
        try
        {
            if (touched)
            {
                cache_->touch(session_id, cache_ttl_for(ttl));
            }
            else
            {
                cache_->remove(session_id);
            }
        }
        catch (const StoreUnavailable &e)
        {
            ZSTORE_LOG_WARN("Cache {} unavailable on touch: {}", cache_->name(), e.what());
        }
        return touched;
    }

    std::string TieredStorage::name() const
    {
        return cache_->name() + "+" + primary_->name();
    }

    std::chrono::seconds TieredStorage::cache_ttl_for(const Ttl ttl) const
    {
        if (!ttl)
        {
            return cache_ttl_;
        }
        return std::min(*ttl, cache_ttl_);
    }

    void TieredStorage::fill_cache(const std::string &session_id, const std::string &payload, const Ttl ttl)
    {
        try
        {
            cache_->save(session_id, payload, cache_ttl_for(ttl));
        }
        catch (const StoreUnavailable &e)
        {
            ZSTORE_LOG_WARN("Cache {} unavailable on save: {}", cache_->name(), e.what());
        }
    }
} // namespace zstore::zsession
