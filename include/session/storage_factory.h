#pragma once
#include "session_storage.h"
#include "clock.h"
#include "../config/session_config.h"

namespace zstore::zsession
{
    // 按配置构建存储后端(含连接池与可选的内存缓存层)，连接失败抛出 StoreUnavailable
    SessionStorage::ptr make_storage(const zconfig::SessionConfig &config,
                                     Clock::ptr clock = std::make_shared<SystemClock>());
} // namespace zstore::zsession
