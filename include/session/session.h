#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>

namespace zstore::zsession
{
    /**
     * 单次请求内的会话对象。
     *
     * 由 SessionManager::begin_request 创建并交给请求处理代码独占使用，
     * 任何修改属性的操作都会把会话标记为已修改，由 end_request 决定是否写回。
     */
    class Session
    {
    public:
        // 新建空会话，尚未分配会话ID
        Session();

        // 从存储中恢复的会话
        Session(std::string session_id, nlohmann::json attributes);

        // 获取会话ID，未分配时为空
        [[nodiscard]] const std::string &get_session_id() const;

        [[nodiscard]] bool has_session_id() const;

        // 设置与提取会话属性
        void set_attribute(const std::string &key, nlohmann::json value);

        [[nodiscard]] std::optional<nlohmann::json> get_attribute(const std::string &key) const;

        template<typename T>
        T get_attribute_or(const std::string &key, T default_value) const
        {
            const auto it = attributes_.find(key);
            if (it == attributes_.end())
            {
                return default_value;
            }
            try
            {
                return it->template get<T>();
            }
            catch (const nlohmann::json::exception &)
            {
                return default_value;
            }
        }

        [[nodiscard]] bool contains(const std::string &key) const;

        // 获取可修改的属性引用，不存在时创建为null，调用即视为修改
        nlohmann::json &mutable_attribute(const std::string &key);

        // 移除会话属性
        void remove_attribute(const std::string &key);

        // 清空会话属性
        void clear_attributes();

        // 获取全部属性(只读)
        [[nodiscard]] const nlohmann::json &get_attributes() const;

        [[nodiscard]] size_t size() const;

        [[nodiscard]] bool empty() const;

        // 注销会话: 清空数据，结束请求时删除存储记录并清除客户端令牌
        void invalidate();

        void set_permanent(bool permanent);

        // 显式标记为已修改
        void mark_modified();

        [[nodiscard]] bool is_new() const;
        [[nodiscard]] bool is_modified() const;
        [[nodiscard]] bool is_permanent() const;
        [[nodiscard]] bool is_invalidated() const;
        [[nodiscard]] bool is_ephemeral() const;
        [[nodiscard]] bool is_rotated() const;

        // 最后一次写入存储的时间
        [[nodiscard]] std::chrono::system_clock::time_point get_last_accessed() const;

        // 请求携带的原始令牌(可能无效)
        [[nodiscard]] const std::string &get_incoming_id() const;

    private:
        friend class SessionManager;

        std::string session_id_;                            // 会话ID
        std::string incoming_id_;                           // 请求携带的令牌
        std::string pending_delete_id_;                     // 注销后待删除的旧ID
        nlohmann::json attributes_ = nlohmann::json::object(); // 会话属性
        std::chrono::system_clock::time_point last_accessed_{};
        bool new_ = true;
        bool modified_ = false;
        bool permanent_ = false;
        bool invalidated_ = false;
        bool ephemeral_ = false;
        bool rotated_ = false;
        bool finished_ = false;                             // end_request 已执行
    };
} // namespace zstore::zsession
