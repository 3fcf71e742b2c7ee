#pragma once
#include "session_storage.h"

namespace zstore::zsession
{
    /**
     * 二级存储: 缓存层在前，主存储在后。
     *
     * 读: 先查缓存，未命中再查主存储并回填缓存，回填有效期不超过记录的剩余有效期。
     * 写: 先写主存储，成功后写缓存；缓存读写失败只记录日志。
     * 删: 两层都删，缓存删除失败会抛出，避免读到已注销的会话。
     * 缓存记录最长保留 cache_ttl。
     */
    class TieredStorage final : public SessionStorage
    {
    public:
        TieredStorage(SessionStorage::ptr cache, SessionStorage::ptr primary, std::chrono::seconds cache_ttl);

        ~TieredStorage() override = default;

        std::optional<std::string> load(const std::string &session_id) override;

        // 剩余有效期以主存储为准
        std::optional<StoredRecord> load_with_expiry(const std::string &session_id) override;

        void save(const std::string &session_id, const std::string &payload, Ttl ttl) override;

        bool create(const std::string &session_id, const std::string &payload, Ttl ttl) override;

        void remove(const std::string &session_id) override;

        [[nodiscard]] bool supports_touch() const override;

        bool touch(const std::string &session_id, Ttl ttl) override;

        [[nodiscard]] std::string name() const override;

    private:
        // 缓存记录的有效期取 ttl 与 cache_ttl 中较短者
        [[nodiscard]] std::chrono::seconds cache_ttl_for(Ttl ttl) const;

        void fill_cache(const std::string &session_id, const std::string &payload, Ttl ttl);

    private:
        SessionStorage::ptr cache_;
        SessionStorage::ptr primary_;
        std::chrono::seconds cache_ttl_;
    };
} // namespace zstore::zsession
