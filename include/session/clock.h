#pragma once
#include <chrono>
#include <cstdint>
#include <memory>

namespace zstore::zsession
{
    // 时间源抽象，存储层用它判断记录是否过期
    class Clock
    {
    public:
        using ptr = std::shared_ptr<Clock>;
        using time_point = std::chrono::system_clock::time_point;

        virtual ~Clock() = default;

        [[nodiscard]] virtual time_point now() const = 0;
    };

    class SystemClock final : public Clock
    {
    public:
        [[nodiscard]] time_point now() const override
        {
            return std::chrono::system_clock::now();
        }
    };

    inline int64_t to_epoch_seconds(const Clock::time_point time)
    {
        return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    }
} // namespace zstore::zsession
