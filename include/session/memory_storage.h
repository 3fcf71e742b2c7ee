#pragma once
#include "session_storage.h"
#include "clock.h"
#include <mutex>
#include <unordered_map>

namespace zstore::zsession
{
    /**
     * 进程内存储，用于单进程部署、测试以及作为二级缓存。
     *
     * 过期记录在读取时删除，写入时每隔 sweep_interval 整体清理一次。
     */
    class MemoryStorage final : public SessionStorage
    {
    public:
        explicit MemoryStorage(Clock::ptr clock = std::make_shared<SystemClock>(),
                               std::chrono::seconds sweep_interval = std::chrono::seconds(60));

        ~MemoryStorage() override = default;

        // 加载会话
        std::optional<std::string> load(const std::string &session_id) override;

        std::optional<StoredRecord> load_with_expiry(const std::string &session_id) override;

        // 存储会话
        void save(const std::string &session_id, const std::string &payload, Ttl ttl) override;

        bool create(const std::string &session_id, const std::string &payload, Ttl ttl) override;

        // 删除会话
        void remove(const std::string &session_id) override;

        [[nodiscard]] bool supports_touch() const override;

        bool touch(const std::string &session_id, Ttl ttl) override;

        [[nodiscard]] std::string name() const override;

        // 清除过期会话
        size_t clear_expired();

        // 当前记录数(含尚未清理的过期记录)
        [[nodiscard]] size_t size() const;

    private:
        struct Record
        {
            std::string payload;
            std::optional<Clock::time_point> expiry; // 空表示永不过期
        };

        [[nodiscard]] bool is_expired(const Record &record, Clock::time_point now) const;

        [[nodiscard]] std::optional<Clock::time_point> expiry_from(Ttl ttl) const;

        // 调用方需持有锁
        size_t sweep_locked(Clock::time_point now);

        // 到达清理时间时清理过期记录，调用方需持有锁
        void maybe_sweep_locked();

    private:
        Clock::ptr clock_;
        std::chrono::seconds sweep_interval_;
        Clock::time_point next_sweep_;
        std::unordered_map<std::string, Record> sessions_; // 存储会话的哈希表
        mutable std::mutex mutex_;
    };
} // namespace zstore::zsession
