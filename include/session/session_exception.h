#pragma once
#include <string>
#include <stdexcept>

namespace zstore::zsession
{
    class SessionException : public std::runtime_error
    {
    public:
        explicit SessionException(const std::string &message) : std::runtime_error(message) {}
    };

    // 存储后端不可用(连接失败、超时、连接池耗尽)
    class StoreUnavailable final : public SessionException
    {
    public:
        explicit StoreUnavailable(const std::string &message) : SessionException(message) {}
    };

    // 存储的会话数据无法解码
    class CorruptPayload final : public SessionException
    {
    public:
        explicit CorruptPayload(const std::string &message) : SessionException(message) {}
    };

    // 会话数据包含不支持的值类型
    class InvalidValueType final : public SessionException
    {
    public:
        explicit InvalidValueType(const std::string &message) : SessionException(message) {}
    };

    // 多次生成的会话ID均已被占用
    class IdentifierCollision final : public SessionException
    {
    public:
        explicit IdentifierCollision(const std::string &message) : SessionException(message) {}
    };

    // 安全随机源不可用
    class EntropyUnavailable final : public SessionException
    {
    public:
        explicit EntropyUnavailable(const std::string &message) : SessionException(message) {}
    };
} // namespace zstore::zsession
