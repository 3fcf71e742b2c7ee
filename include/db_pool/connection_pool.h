#pragma once
#include "db_exception.h"
#include "../log/logger.h"
#include <queue>
#include <memory>
#include <string>
#include <chrono>
#include <functional>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace zstore::zdb
{
    /**
     * 通用连接池。
     *
     * Connection 需要提供 ping() 与 reconnect()。借出的连接通过定制删除器归还，
     * 后台线程定期检查空闲连接并重连失效连接，池析构时停止。
     * 检查线程只处理从队列中取出的连接，不会碰到已借出的连接。
     */
    template<typename Connection>
    class ConnectionPool : public std::enable_shared_from_this<ConnectionPool<Connection> >
    {
    public:
        using Factory = std::function<std::shared_ptr<Connection>()>;

        // 初始化时每个连接的尝试次数与间隔
        static constexpr int kConnectAttempts = 5;
        static constexpr std::chrono::milliseconds kConnectRetryDelay{100};

        ConnectionPool(std::string name, Factory factory, std::chrono::milliseconds acquire_timeout,
                       std::chrono::milliseconds check_interval = std::chrono::seconds(60))
            : name_(std::move(name)), factory_(std::move(factory)),
              acquire_timeout_(acquire_timeout), check_interval_(check_interval)
        {
            check_thread_ = std::thread(&ConnectionPool::check_connections, this);
        }

        virtual ~ConnectionPool()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stopped_ = true;
            }
            stop_cv_.notify_all();
            if (check_thread_.joinable())
            {
                check_thread_.join();
            }
            ZSTORE_LOG_INFO("{} connection pool destroyed, released {} idle connections",
                            name_, connections_.size());
        }

        // 禁止拷贝
        ConnectionPool(const ConnectionPool &) = delete;

        ConnectionPool &operator=(const ConnectionPool &) = delete;

        // 初始化连接池，一个连接都建不起来时抛出 DBException
        void init(const uint32_t pool_size)
        {
            ZSTORE_LOG_INFO("Initializing {} connection pool with {} connections", name_, pool_size);

            std::lock_guard<std::mutex> lock(mutex_);
            if (initialized_)
            {
                ZSTORE_LOG_WARN("{} connection pool already initialized, skipping", name_);
                return;
            }

            std::string last_error;
            for (uint32_t i = 0; i < pool_size; ++i)
            {
                for (int attempt = 1; attempt <= kConnectAttempts; ++attempt)
                {
                    try
                    {
                        connections_.emplace(factory_());
                        break;
                    }
                    catch (const std::exception &e)
                    {
                        last_error = e.what();
                        ZSTORE_LOG_ERROR("Exception creating {} connection {}/{} (attempt {}/{}): {}",
                                         name_, i + 1, pool_size, attempt, kConnectAttempts, e.what());
                    }
                    if (attempt < kConnectAttempts)
                    {
                        std::this_thread::sleep_for(kConnectRetryDelay);
                    }
                }
            }

            if (connections_.empty())
            {
                throw DBException(name_ + " connection pool has no usable connection: " + last_error);
            }

            initialized_ = true;
            ZSTORE_LOG_INFO("{} connection pool initialized with {}/{} connections",
                            name_, connections_.size(), pool_size);
        }

        // 获取连接，超时抛出 DBException
        std::shared_ptr<Connection> get_connection()
        {
            std::shared_ptr<Connection> conn;
            {
                std::unique_lock<std::mutex> lock(mutex_);

                if (!initialized_)
                {
                    throw DBException(name_ + " connection pool not initialized");
                }

                if (!cv_.wait_for(lock, acquire_timeout_, [this]() { return !connections_.empty(); }))
                {
                    ZSTORE_LOG_ERROR("Timed out waiting for {} connection after {} ms",
                                     name_, acquire_timeout_.count());
                    throw DBException("Timed out waiting for " + name_ + " connection");
                }

                conn = std::move(connections_.front());
                connections_.pop();
            } // 释放锁

            try
            {
                // 在锁外检查连接
                if (!conn->ping())
                {
                    ZSTORE_LOG_WARN("{} connection lost, attempting to reconnect...", name_);
                    conn->reconnect();
                }
            }
            catch (const std::exception &e)
            {
                ZSTORE_LOG_ERROR("Failed to get {} connection: {}", name_, e.what());
                give_back(conn);
                throw DBException(e.what());
            }

            // 通过定制删除器，确保连接被正确地回收到连接池中
            std::weak_ptr<ConnectionPool> weak_pool = this->weak_from_this();
            return {conn.get(),
                    [weak_pool, conn](Connection *)
                    {
                        if (auto pool = weak_pool.lock())
                        {
                            pool->give_back(conn);
                        }
                    }};
        }

        // 获取空闲连接数
        size_t get_pool_size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return connections_.size();
        }

        bool is_initialized() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return initialized_;
        }

    private:
        void give_back(std::shared_ptr<Connection> conn)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connections_.emplace(std::move(conn));
            cv_.notify_one();
        }

        // 检查空闲连接，逐个取出检查后放回队尾
        void check_connections()
        {
            while (true)
            {
                size_t idle_count = 0;
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    if (stop_cv_.wait_for(lock, check_interval_, [this]() { return stopped_; }))
                    {
                        return;
                    }
                    idle_count = connections_.size();
                }

                size_t checked = 0;
                size_t reconnected = 0;
                for (size_t i = 0; i < idle_count; ++i)
                {
                    std::shared_ptr<Connection> conn;
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        if (stopped_ || connections_.empty())
                        {
                            break;
                        }
                        conn = std::move(connections_.front());
                        connections_.pop();
                    }

                    try
                    {
                        if (!conn->ping())
                        {
                            ZSTORE_LOG_WARN("Unhealthy {} connection detected, attempting reconnect", name_);
                            conn->reconnect();
                            reconnected++;
                        }
                    }
                    catch (const std::exception &e)
                    {
                        // 连接仍放回池中，借出时会再次尝试重连
                        ZSTORE_LOG_ERROR("Failed to reconnect unhealthy {} connection: {}", name_, e.what());
                    }
                    give_back(std::move(conn));
                    checked++;
                }

                ZSTORE_LOG_DEBUG("{} health check completed: {} idle connections checked, {} reconnected",
                                 name_, checked, reconnected);
            }
        }

    private:
        std::string name_;
        Factory factory_;
        std::chrono::milliseconds acquire_timeout_;
        std::chrono::milliseconds check_interval_;
        std::queue<std::shared_ptr<Connection> > connections_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;      // 有连接归还
        std::condition_variable stop_cv_; // 停止检查线程
        bool initialized_ = false;
        bool stopped_ = false;
        std::thread check_thread_;
    };
} // namespace zstore::zdb
