#include "session/session.h"
#include "log/logger.h"

namespace zstore::zsession
{
    Session::Session() = default;

    Session::Session(std::string session_id, nlohmann::json attributes)
        : session_id_(std::move(session_id)), attributes_(std::move(attributes)), new_(false)
    {
        if (!attributes_.is_object())
        {
            attributes_ = nlohmann::json::object();
        }
    }

    // 获取会话ID
    const std::string &Session::get_session_id() const
    {
        return session_id_;
    }

    bool Session::has_session_id() const
    {
        return !session_id_.empty();
    }

    // 设置与提取会话属性
    void Session::set_attribute(const std::string &key, nlohmann::json value)
    {
        ZSTORE_LOG_DEBUG("Setting attribute '{}'", key);
        attributes_[key] = std::move(value);
        modified_ = true;
    }

    std::optional<nlohmann::json> Session::get_attribute(const std::string &key) const
    {
        if (const auto it = attributes_.find(key); it != attributes_.end())
        {
            return *it;
        }
        return std::nullopt;
    }

    bool Session::contains(const std::string &key) const
    {
        return attributes_.contains(key);
    }

    nlohmann::json &Session::mutable_attribute(const std::string &key)
    {
        modified_ = true;
        return attributes_[key];
    }

    // 移除会话属性
    void Session::remove_attribute(const std::string &key)
    {
        if (attributes_.erase(key) > 0)
        {
            ZSTORE_LOG_DEBUG("Attribute '{}' removed", key);
            modified_ = true;
        }
    }

    // 清空会话属性
    void Session::clear_attributes()
    {
        if (attributes_.empty())
        {
            return;
        }
        ZSTORE_LOG_DEBUG("Clearing {} attributes", attributes_.size());
        attributes_ = nlohmann::json::object();
        modified_ = true;
    }

    const nlohmann::json &Session::get_attributes() const
    {
        return attributes_;
    }

    size_t Session::size() const
    {
        return attributes_.size();
    }

    bool Session::empty() const
    {
        return attributes_.empty();
    }

    void Session::invalidate()
    {
        if (!session_id_.empty())
        {
            pending_delete_id_ = session_id_;
        }
        session_id_.clear();
        attributes_ = nlohmann::json::object();
        invalidated_ = true;
        new_ = true;
        modified_ = false;
        rotated_ = false;
    }

    void Session::set_permanent(const bool permanent)
    {
        if (permanent_ != permanent)
        {
            permanent_ = permanent;
            modified_ = true;
        }
    }

    void Session::mark_modified()
    {
        modified_ = true;
    }

    bool Session::is_new() const
    {
        return new_;
    }

    bool Session::is_modified() const
    {
        return modified_;
    }

    bool Session::is_permanent() const
    {
        return permanent_;
    }

    bool Session::is_invalidated() const
    {
        return invalidated_;
    }

    bool Session::is_ephemeral() const
    {
        return ephemeral_;
    }

    bool Session::is_rotated() const
    {
        return rotated_;
    }

    std::chrono::system_clock::time_point Session::get_last_accessed() const
    {
        return last_accessed_;
    }

    const std::string &Session::get_incoming_id() const
    {
        return incoming_id_;
    }
} // namespace zstore::zsession
