#pragma once
#include <zlog/zlog.h>
#include <memory>
#include <string>

namespace zstore
{
    inline zlog::Logger::ptr store_logger;

    class Log
    {
    public:
        static void Init(zlog::LogLevel::value limitLevel = zlog::LogLevel::value::DEBUG)
        {
            std::unique_ptr<zlog::GlobalLoggerBuilder> builder(new zlog::GlobalLoggerBuilder());
            builder->buildLoggerName("store_logger");
            builder->buildLoggerLevel(limitLevel);
            builder->buildLoggerFormmater("[%c][%d][%f:%l][%p]  %m%n");
            builder->buildLoggerSink<zlog::StdOutSink>();
            store_logger = builder->build();
        }

        // 将配置中的日志级别字符串转换为zlog级别
        static zlog::LogLevel::value parse_level(const std::string &level)
        {
            if (level == "debug") return zlog::LogLevel::value::DEBUG;
            if (level == "warn") return zlog::LogLevel::value::WARN;
            if (level == "error") return zlog::LogLevel::value::ERROR;
            if (level == "fatal") return zlog::LogLevel::value::FATAL;
            return zlog::LogLevel::value::INFO;
        }
    };

    // 日志宏定义 - 使用fmt库格式，未初始化时不输出
#define ZSTORE_LOG_DEBUG(fmt, ...) if(zstore::store_logger) zstore::store_logger->debug(fmt, ##__VA_ARGS__)
#define ZSTORE_LOG_INFO(fmt, ...)  if(zstore::store_logger) zstore::store_logger->info(fmt, ##__VA_ARGS__)
#define ZSTORE_LOG_WARN(fmt, ...)  if(zstore::store_logger) zstore::store_logger->warn(fmt, ##__VA_ARGS__)
#define ZSTORE_LOG_ERROR(fmt, ...) if(zstore::store_logger) zstore::store_logger->error(fmt, ##__VA_ARGS__)
#define ZSTORE_LOG_FATAL(fmt, ...) if(zstore::store_logger) zstore::store_logger->fatal(fmt, ##__VA_ARGS__)
} // namespace zstore
