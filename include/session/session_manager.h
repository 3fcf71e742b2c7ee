#pragma once

#include "session.h"
#include "session_storage.h"
#include "id_generator.h"
#include "serializer.h"
#include "clock.h"
#include "../config/session_config.h"
#include <memory>
#include <optional>
#include <string>

namespace zstore::zsession
{
    // 框架适配层对客户端令牌的操作
    enum class TokenAction
    {
        NONE,  // 不改动
        SET,   // 下发令牌
        UNSET  // 清除令牌
    };

    struct TokenInstruction
    {
        TokenAction action = TokenAction::NONE;
        std::string session_id;  // SET 时的会话ID
        Ttl ttl;                 // SET 时的有效期，空表示永久
        std::string cookie_name; // 透传配置中的令牌名
    };

    /**
     * 会话生命周期引擎。
     *
     * 每个请求调用 begin_request 得到独立的 Session，处理完毕后调用 end_request，
     * 根据会话状态决定写回、删除或什么都不做。引擎本身不持有可变状态，可被多线程并发调用；
     * 同一会话的并发写以存储层的"后写者胜出"为准。
     */
    class SessionManager
    {
    public:
        // 新会话首次写入时最多尝试的ID个数
        static constexpr int kMaxIdAttempts = 3;

        SessionManager(zconfig::SessionConfig config, SessionStorage::ptr storage,
                       IdGenerator::ptr id_generator, Serializer serializer, Clock::ptr clock);

        SessionManager(const SessionManager &) = delete;

        SessionManager &operator=(const SessionManager &) = delete;

        // 根据请求携带的令牌加载会话，找不到时返回空的新会话
        Session begin_request(const std::optional<std::string> &incoming_id) const;

        // 请求结束时写回会话，并返回对客户端令牌的操作
        TokenInstruction end_request(Session &session) const;

        // 更换会话ID(防会话固定攻击)，失败时会话保持不变
        void regenerate(Session &session) const;

        // 立即删除指定会话
        void destroy_session(const std::string &session_id) const;

        [[nodiscard]] const zconfig::SessionConfig &get_config() const;

        [[nodiscard]] const SessionStorage::ptr &get_storage() const;

    private:
        // 按会话状态执行写回
        TokenInstruction write_back(Session &session) const;

        // 写入会话当前内容，首次写入时分配ID
        TokenInstruction persist(Session &session) const;

        // 编码会话当前内容
        [[nodiscard]] std::string encode(const Session &session, Clock::time_point now) const;

        // 当前会话对应的有效期
        [[nodiscard]] Ttl ttl_for(const Session &session) const;

        // 用新生成的ID写入，遇到冲突时重试
        std::string create_with_fresh_id(const std::string &payload, Ttl ttl) const;

        // 只续期不改内容，记录已不存在时返回false
        bool refresh_expiry(const std::string &session_id, Ttl ttl) const;

        [[nodiscard]] TokenInstruction set_token(const std::string &session_id, Ttl ttl) const;

        [[nodiscard]] TokenInstruction unset_token() const;

        [[nodiscard]] TokenInstruction no_op() const;

    private:
        zconfig::SessionConfig config_;
        SessionStorage::ptr storage_;    // 会话存储
        IdGenerator::ptr id_generator_;  // 会话ID生成器
        Serializer serializer_;
        Clock::ptr clock_;
    };

    // 会话引擎建造者，未指定的组件按配置使用默认实现
    class SessionManagerBuilder
    {
    public:
        void build_config(const zconfig::SessionConfig &config)
        {
            config_ = config;
        }

        void build_storage(SessionStorage::ptr storage)
        {
            storage_ = std::move(storage);
        }

        void build_id_generator(IdGenerator::ptr id_generator)
        {
            id_generator_ = std::move(id_generator);
        }

        void build_serializer(const Serializer &serializer)
        {
            serializer_ = serializer;
        }

        void build_clock(Clock::ptr clock)
        {
            clock_ = std::move(clock);
        }

        // 构建会话引擎，未指定存储时按配置创建
        std::unique_ptr<SessionManager> build();

    private:
        zconfig::SessionConfig config_;
        SessionStorage::ptr storage_;
        IdGenerator::ptr id_generator_;
        std::optional<Serializer> serializer_;
        Clock::ptr clock_;
    };
} // namespace zstore::zsession
