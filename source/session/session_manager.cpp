#include "session/session_manager.h"
#include "session/session_exception.h"
#include "session/storage_factory.h"
#include "log/logger.h"

namespace zstore::zsession
{
    SessionManager::SessionManager(zconfig::SessionConfig config, SessionStorage::ptr storage,
                                   IdGenerator::ptr id_generator, Serializer serializer, Clock::ptr clock)
        : config_(std::move(config)), storage_(std::move(storage)), id_generator_(std::move(id_generator)),
          serializer_(serializer), clock_(std::move(clock))
    {
        if (!storage_ || !id_generator_ || !clock_)
        {
            throw std::invalid_argument("SessionManager requires a storage, an id generator and a clock");
        }
        ZSTORE_LOG_INFO("SessionManager initialized with {} storage, {} serializer, ttl {}s",
                        storage_->name(), zconfig::to_string(serializer_.get_format()), config_.ttl.count());
    }

    // 根据请求携带的令牌加载会话
    Session SessionManager::begin_request(const std::optional<std::string> &incoming_id) const
    {
        Session fresh;
        fresh.permanent_ = config_.permanent_default;

        if (!incoming_id || incoming_id->empty())
        {
            return fresh;
        }
        fresh.incoming_id_ = *incoming_id;

        // 格式不合法的令牌不访问后端
        if (!id_generator_->is_well_formed(*incoming_id))
        {
            ZSTORE_LOG_DEBUG("Rejecting malformed session token '{}'", *incoming_id);
            return fresh;
        }

        std::optional<std::string> payload;
        try
        {
            payload = storage_->load(*incoming_id);
        }
        catch (const StoreUnavailable &e)
        {
            if (config_.strict_mode)
            {
                ZSTORE_LOG_ERROR("Session storage {} unavailable: {}", storage_->name(), e.what());
                throw;
            }
            ZSTORE_LOG_WARN("Session storage {} unavailable, continuing with an ephemeral session: {}",
                            storage_->name(), e.what());
            fresh.ephemeral_ = true;
            return fresh;
        }

        if (!payload)
        {
            ZSTORE_LOG_DEBUG("Session {} not found or expired", *incoming_id);
            return fresh;
        }

        Envelope envelope;
        try
        {
            envelope = serializer_.decode_envelope(*payload);
        }
        catch (const CorruptPayload &e)
        {
            ZSTORE_LOG_WARN("Discarding unreadable session record: {}", e.what());
            return fresh;
        }

        Session session(*incoming_id, std::move(envelope.data));
        session.incoming_id_ = *incoming_id;
        session.permanent_ = envelope.permanent;
        session.last_accessed_ = Clock::time_point(std::chrono::seconds(envelope.accessed_at));
        ZSTORE_LOG_DEBUG("Session {} loaded with {} attributes", *incoming_id, session.size());
        return session;
    }

    TokenInstruction SessionManager::end_request(Session &session) const
    {
        if (session.finished_)
        {
            return no_op();
        }

        try
        {
            TokenInstruction instruction = write_back(session);
            session.finished_ = true;
            return instruction;
        }
        catch (const SessionException &e)
        {
            ZSTORE_LOG_ERROR("Failed to finish session: {}", e.what());
            throw;
        }
    }

    TokenInstruction SessionManager::write_back(Session &session) const
    {
        if (session.ephemeral_)
        {
            ZSTORE_LOG_DEBUG("Ephemeral session is not persisted");
            return no_op();
        }

        if (session.invalidated_)
        {
            const bool held_token = !session.pending_delete_id_.empty() || !session.incoming_id_.empty();
            if (!session.pending_delete_id_.empty())
            {
                storage_->remove(session.pending_delete_id_);
                ZSTORE_LOG_DEBUG("Invalidated session {} removed", session.pending_delete_id_);
                session.pending_delete_id_.clear();
            }
            // 注销后重新写入的数据使用新ID
            if (session.modified_ && !session.empty())
            {
                return persist(session);
            }
            return held_token ? unset_token() : no_op();
        }

        if (session.modified_)
        {
            if (!session.empty())
            {
                return persist(session);
            }
            if (session.has_session_id())
            {
                storage_->remove(session.session_id_);
                ZSTORE_LOG_DEBUG("Emptied session {} removed", session.session_id_);
                session.session_id_.clear();
                session.modified_ = false;
                return unset_token();
            }
            return no_op();
        }

        if (session.new_)
        {
            return no_op();
        }

        const Ttl ttl = ttl_for(session);
        if (session.rotated_)
        {
            return set_token(session.session_id_, ttl);
        }

        if (config_.refresh_each_request)
        {
            if (!refresh_expiry(session.session_id_, ttl))
            {
                ZSTORE_LOG_DEBUG("Session {} vanished before it could be refreshed", session.session_id_);
                return unset_token();
            }
            return set_token(session.session_id_, ttl);
        }
        return no_op();
    }

    TokenInstruction SessionManager::persist(Session &session) const
    {
        const auto now = clock_->now();
        const Ttl ttl = ttl_for(session);
        // 值类型不合法时在写后端之前抛出
        const std::string payload = encode(session, now);

        if (session.has_session_id())
        {
            storage_->save(session.session_id_, payload, ttl);
            ZSTORE_LOG_DEBUG("Session {} saved", session.session_id_);
        }
        else
        {
            session.session_id_ = create_with_fresh_id(payload, ttl);
            ZSTORE_LOG_DEBUG("Session {} created", session.session_id_);
        }

        session.new_ = false;
        session.modified_ = false;
        session.last_accessed_ = now;
        return set_token(session.session_id_, ttl);
    }

    // 更换会话ID
    void SessionManager::regenerate(Session &session) const
    {
        if (session.ephemeral_)
        {
            throw StoreUnavailable("Cannot regenerate a session while its storage is unavailable");
        }
        if (!session.has_session_id())
        {
            ZSTORE_LOG_DEBUG("Session has no identifier yet, nothing to regenerate");
            return;
        }

        const auto now = clock_->now();
        const Ttl ttl = ttl_for(session);
        const std::string payload = encode(session, now);
        const std::string new_id = create_with_fresh_id(payload, ttl);

        try
        {
            storage_->remove(session.session_id_);
        }
        catch (const StoreUnavailable &e)
        {
            ZSTORE_LOG_ERROR("Cannot remove session {} during regeneration: {}", session.session_id_, e.what());
            try
            {
                storage_->remove(new_id);
            }
            catch (const StoreUnavailable &rollback_error)
            {
                ZSTORE_LOG_WARN("Rollback of regenerated session failed: {}", rollback_error.what());
            }
            throw;
        }

        ZSTORE_LOG_DEBUG("Session {} regenerated as {}", session.session_id_, new_id);
        session.session_id_ = new_id;
        session.rotated_ = true;
        session.new_ = false;
        session.modified_ = false;
        session.last_accessed_ = now;
    }

    // 销毁会话
    void SessionManager::destroy_session(const std::string &session_id) const
    {
        if (session_id.empty())
        {
            return;
        }
        storage_->remove(session_id);
        ZSTORE_LOG_INFO("Session destroyed");
        ZSTORE_LOG_DEBUG("Destroyed session id: {}", session_id);
    }

    const zconfig::SessionConfig &SessionManager::get_config() const
    {
        return config_;
    }

    const SessionStorage::ptr &SessionManager::get_storage() const
    {
        return storage_;
    }

    std::string SessionManager::encode(const Session &session, const Clock::time_point now) const
    {
        Envelope envelope;
        envelope.data = session.attributes_;
        envelope.permanent = session.permanent_;
        envelope.accessed_at = to_epoch_seconds(now);
        return serializer_.encode_envelope(envelope);
    }

    Ttl SessionManager::ttl_for(const Session &session) const
    {
        if (session.permanent_)
        {
            return std::nullopt;
        }
        return config_.ttl;
    }

    std::string SessionManager::create_with_fresh_id(const std::string &payload, const Ttl ttl) const
    {
        for (int attempt = 1; attempt <= kMaxIdAttempts; ++attempt)
        {
            std::string session_id = id_generator_->generate();
            if (storage_->create(session_id, payload, ttl))
            {
                return session_id;
            }
            ZSTORE_LOG_WARN("Session identifier collision on {} (attempt {}/{})",
                            storage_->name(), attempt, kMaxIdAttempts);
        }
        throw IdentifierCollision("No free session identifier after " + std::to_string(kMaxIdAttempts) + " attempts");
    }

    bool SessionManager::refresh_expiry(const std::string &session_id, const Ttl ttl) const
    {
        if (storage_->supports_touch())
        {
            return storage_->touch(session_id, ttl);
        }

        // 不支持单独续期的后端: 原样重新写入
        const auto payload = storage_->load(session_id);
        if (!payload)
        {
            return false;
        }
        storage_->save(session_id, *payload, ttl);
        return true;
    }

    TokenInstruction SessionManager::set_token(const std::string &session_id, const Ttl ttl) const
    {
        TokenInstruction instruction;
        instruction.action = TokenAction::SET;
        instruction.session_id = session_id;
        instruction.ttl = ttl;
        instruction.cookie_name = config_.cookie_name;
        return instruction;
    }

    TokenInstruction SessionManager::unset_token() const
    {
        TokenInstruction instruction;
        instruction.action = TokenAction::UNSET;
        instruction.cookie_name = config_.cookie_name;
        return instruction;
    }

    TokenInstruction SessionManager::no_op() const
    {
        TokenInstruction instruction;
        instruction.cookie_name = config_.cookie_name;
        return instruction;
    }

    std::unique_ptr<SessionManager> SessionManagerBuilder::build()
    {
        config_.validate();

        if (!clock_)
        {
            clock_ = std::make_shared<SystemClock>();
        }
        if (!id_generator_)
        {
            id_generator_ = std::make_shared<SecureIdGenerator>(config_.id_bytes);
        }
        if (!storage_)
        {
            storage_ = make_storage(config_, clock_);
        }
        const Serializer serializer = serializer_ ? *serializer_ : Serializer(config_.serializer_format);

        return std::make_unique<SessionManager>(config_, storage_, id_generator_, serializer, clock_);
    }
} // namespace zstore::zsession
