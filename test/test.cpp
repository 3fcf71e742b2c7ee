#include "config/test_session_config.h"

#include "session/test_serializer.h"
#include "session/test_id_generator.h"
#include "session/test_session.h"
#include "session/test_memory_storage.h"
#include "session/test_tiered_storage.h"
#include "session/test_storage_factory.h"
#include "session/test_session_manager.h"
#include "session/test_redis_storage.h"
#include "session/test_mysql_storage.h"

#include "db_pool/test_connection_pool.h"
#include "db_pool/test_mysql_connection.h"
#include "db_pool/test_redis_connection.h"
#include "db_pool/test_redis_pool.h"

#include "../include/log/logger.h"
int main(int argc, char **argv)
{
    zstore::Log::Init(zlog::LogLevel::value::INFO);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
