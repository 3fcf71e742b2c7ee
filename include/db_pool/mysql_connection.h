#pragma once

#include <memory>
#include <string>
#include <vector>
#include <mutex>
#include <type_traits>
#include <cppconn/connection.h>
#include <cppconn/prepared_statement.h>
#include <cppconn/resultset.h>
#include <cppconn/exception.h>
#include <mysql_driver.h>
#include "../log/logger.h"
#include "db_exception.h"

namespace zstore::zdb
{
    // 一次性拉取所有查询结果：行列表，每行是 string 列表
    using QueryResult = std::vector<std::vector<std::string> >;

    class MysqlConnection
    {
    public:
        MysqlConnection(std::string host, std::string user,
                        std::string password, std::string database, int timeout_ms = 5000);

        ~MysqlConnection();

        // 禁止拷贝与赋值
        MysqlConnection(const MysqlConnection &) = delete;

        MysqlConnection &operator=(const MysqlConnection &) = delete;

        // 判断连接是否有效
        [[nodiscard]] bool is_valid() const;

        // 重新连接
        void reconnect();

        // 执行查询
        template<typename ...Args>
        QueryResult execute_query(const std::string &sql, Args &&... args)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            try
            {
                // 1. 准备语句并绑定参数
                std::unique_ptr<sql::PreparedStatement> stmt(handle().prepareStatement(sql));
                bind_params(stmt.get(), 1, std::forward<Args>(args)...);

                // 2. 执行查询
                std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery());

                // 3. 元数据对象由 ResultSet 管理
                sql::ResultSetMetaData *meta(rs->getMetaData());
                const uint32_t col_count = meta->getColumnCount();

                // 4. 一次性消费所有行
                QueryResult rows;
                while (rs->next())
                {
                    std::vector<std::string> row;
                    row.reserve(col_count);
                    for (uint32_t i = 1; i <= col_count; ++i)
                    {
                        row.emplace_back(rs->getString(i).asStdString());
                    }
                    rows.emplace_back(std::move(row));
                }
                return rows;
            }
            catch (const sql::SQLException &e)
            {
                ZSTORE_LOG_ERROR("execute_query error: {}", e.what());
                throw DBException(e.what());
            }
        }

        // 执行更新，返回受影响行数
        template<typename ...Args>
        int execute_update(const std::string &sql, Args &&... args)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            try
            {
                std::unique_ptr<sql::PreparedStatement> statement(handle().prepareStatement(sql));
                bind_params(statement.get(), 1, std::forward<Args>(args)...);
                return statement->executeUpdate();
            }
            catch (const sql::SQLException &e)
            {
                ZSTORE_LOG_ERROR("execute_update error: {}", e.what());
                throw DBException(e.what());
            }
        }

        // 执行不带参数的语句(DDL)
        void execute(const std::string &sql);

        // 检测连接是否有效
        bool ping() const;

    private:
        // 辅助连接并配置
        void connect_helper();

        // 重连失败后连接为空，此时抛出 DBException
        sql::Connection &handle() const;

        // 辅助递归结束函数
        void bind_params(sql::PreparedStatement *, int) {}

        template<typename T, typename ...Args>
        void bind_params(sql::PreparedStatement *statement, int index, T &&value, Args &&... args)
        {
            using Decayed = std::decay_t<T>;
            if constexpr (std::is_same_v<Decayed, std::string> || std::is_same_v<Decayed, const char *>)
            {
                statement->setString(index, std::forward<T>(value));
            }
            else if constexpr (std::is_integral_v<Decayed>)
            {
                statement->setInt64(index, static_cast<int64_t>(value));
            }
            else
            {
                static_assert(!sizeof(Decayed *), "Unsupported parameter type");
            }
            bind_params(statement, index + 1, std::forward<Args>(args)...);
        }

    private:
        std::shared_ptr<sql::Connection> connection_; // 数据库连接
        std::string host_;                            // 数据库主机
        std::string user_;                            // 数据库用户名
        std::string password_;                        // 数据库密码
        std::string database_;                        // 数据库名
        int timeout_ms_;
        mutable std::mutex mutex_;
    };
} // namespace zstore::zdb
