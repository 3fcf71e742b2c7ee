#include "db_pool/mysql_connection.h"
#include <cppconn/statement.h>
#include <algorithm>
#include <utility>

namespace zstore::zdb
{
    MysqlConnection::MysqlConnection(std::string host, std::string user,
                                     std::string password, std::string database, const int timeout_ms)
        : host_(std::move(host)), user_(std::move(user)), password_(std::move(password)),
          database_(std::move(database)), timeout_ms_(timeout_ms)
    {
        ZSTORE_LOG_DEBUG("Creating database connection to {}@{}/{}", user_, host_, database_);
        std::lock_guard<std::mutex> lockGuard(mutex_);
        connect_helper();
    }

    MysqlConnection::~MysqlConnection()
    {
        ZSTORE_LOG_DEBUG("Database connection to {}/{} closed", host_, database_);
    }

    // 检查连接是否可用
    bool MysqlConnection::ping() const
    {
        try
        {
            std::lock_guard<std::mutex> lockGuard(mutex_);
            if (!connection_)
            {
                ZSTORE_LOG_WARN("Connection is null, ping failed");
                return false;
            }

            std::unique_ptr<sql::Statement> stmt(connection_->createStatement());
            std::unique_ptr<sql::ResultSet> rs(stmt->executeQuery("SELECT 1"));
            while (rs && rs->next())
            {
                // 消费结果
            }
            return true;
        }
        catch (const sql::SQLException &e)
        {
            ZSTORE_LOG_WARN("Database ping failed: {}", e.what());
            return false;
        }
    }

    bool MysqlConnection::is_valid() const
    {
        return ping();
    }

    // 重连
    void MysqlConnection::reconnect()
    {
        ZSTORE_LOG_INFO("Attempting to reconnect to database {}@{}/{}", user_, host_, database_);
        std::lock_guard<std::mutex> lockGuard(mutex_);

        // 释放旧的连接
        connection_.reset();
        connect_helper();
        ZSTORE_LOG_INFO("Database reconnection successful");
    }

    void MysqlConnection::execute(const std::string &sql)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try
        {
            std::unique_ptr<sql::Statement> stmt(handle().createStatement());
            stmt->execute(sql);
        }
        catch (const sql::SQLException &e)
        {
            ZSTORE_LOG_ERROR("execute error: {}", e.what());
            throw DBException(e.what());
        }
    }

    sql::Connection &MysqlConnection::handle() const
    {
        if (!connection_)
        {
            throw DBException("Database connection to " + host_ + "/" + database_ + " is not established");
        }
        return *connection_;
    }

    // 辅助连接函数
    void MysqlConnection::connect_helper()
    {
        try
        {
            sql::mysql::MySQL_Driver *driver = sql::mysql::get_mysql_driver_instance();

            const int timeout_s = std::max(1, timeout_ms_ / 1000);
            sql::ConnectOptionsMap options;
            options["hostName"] = sql::SQLString(host_);
            options["userName"] = sql::SQLString(user_);
            options["password"] = sql::SQLString(password_);
            options["schema"] = sql::SQLString(database_);
            options["OPT_CONNECT_TIMEOUT"] = timeout_s;
            options["OPT_READ_TIMEOUT"] = timeout_s;
            options["OPT_WRITE_TIMEOUT"] = timeout_s;
            options["CLIENT_MULTI_STATEMENTS"] = false;

            connection_.reset(driver->connect(options));
            if (!connection_)
            {
                throw DBException("Failed to create database connection");
            }

            // 设置字符集为 utf8mb4
            std::unique_ptr<sql::Statement> stmt(connection_->createStatement());
            stmt->execute("SET NAMES utf8mb4");

            ZSTORE_LOG_DEBUG("Database connection established to {}@{}/{}", user_, host_, database_);
        }
        catch (const sql::SQLException &e)
        {
            connection_.reset();
            ZSTORE_LOG_ERROR("Failed to create database connection to {}: {}", host_, e.what());
            throw DBException(e.what());
        }
    }
} // namespace zstore::zdb
