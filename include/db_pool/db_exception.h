#pragma once
#include <string>
#include <stdexcept>

namespace zstore::zdb
{
    // 连接池与数据库连接层的异常，由存储层转换为 StoreUnavailable
    class DBException final : public std::runtime_error
    {
    public:
        explicit DBException(const std::string &message) : std::runtime_error(message) {}

        explicit DBException(const char *message) : std::runtime_error(message) {}
    };
} // namespace zstore::zdb
