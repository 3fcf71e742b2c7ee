#include "../include/log/logger.h"
#include "../include/config/session_config.h"
#include "../include/session/session_manager.h"
#include "../include/session/session_exception.h"

#include <iostream>
#include <optional>
#include <string>

namespace
{
    // 模拟浏览器保存的令牌
    std::optional<std::string> cookie_jar;

    void apply(const zstore::zsession::TokenInstruction &instruction)
    {
        switch (instruction.action)
        {
            case zstore::zsession::TokenAction::SET:
                cookie_jar = instruction.session_id;
                std::cout << "  Set-Cookie: " << instruction.cookie_name << "=" << instruction.session_id;
                if (instruction.ttl)
                {
                    std::cout << "; Max-Age=" << instruction.ttl->count();
                }
                std::cout << std::endl;
                break;
            case zstore::zsession::TokenAction::UNSET:
                cookie_jar.reset();
                std::cout << "  Set-Cookie: " << instruction.cookie_name << "=; Max-Age=0" << std::endl;
                break;
            case zstore::zsession::TokenAction::NONE:
                std::cout << "  (no cookie change)" << std::endl;
                break;
        }
    }

    template<typename Handler>
    void handle_request(const zstore::zsession::SessionManager &manager, const std::string &path, Handler handler)
    {
        std::cout << "GET " << path << std::endl;
        auto session = manager.begin_request(cookie_jar);
        handler(session);
        apply(manager.end_request(session));
    }
} // namespace

int main(int argc, char **argv)
{
    try
    {
        auto config = argc > 1
                          ? zstore::zconfig::SessionConfig::load_from_file(argv[1])
                          : zstore::zconfig::SessionConfig::default_config();

        // 初始化zlog日志系统
        zstore::Log::Init(zstore::Log::parse_level(config.log_level));
        ZSTORE_LOG_INFO("Starting session store example with {} storage", zstore::zconfig::to_string(config.storage_type));

        zstore::zsession::SessionManagerBuilder builder;
        builder.build_config(config);
        const auto manager = builder.build();

        handle_request(*manager, "/", [](zstore::zsession::Session &session)
        {
            session.set_attribute("first_visit", "2024-01-01T00:00:00");
        });

        handle_request(*manager, "/profile", [](zstore::zsession::Session &session)
        {
            std::cout << "  first visit: " << session.get_attribute_or<std::string>("first_visit", "unknown")
                      << std::endl;
        });

        handle_request(*manager, "/login", [&manager](zstore::zsession::Session &session)
        {
            manager->regenerate(session);
            session.set_attribute("user", "alice");
            session.mutable_attribute("roles").push_back("reader");
        });

        handle_request(*manager, "/logout", [](zstore::zsession::Session &session)
        {
            session.invalidate();
        });

        handle_request(*manager, "/", [](zstore::zsession::Session &session)
        {
            std::cout << "  new session: " << std::boolalpha << session.is_new() << std::endl;
        });
    }
    catch (const zstore::zconfig::ConfigException &e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    catch (const zstore::zsession::SessionException &e)
    {
        ZSTORE_LOG_FATAL("Session store failure: {}", e.what());
        std::cerr << "Session store failure: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
