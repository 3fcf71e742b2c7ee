#include "session/id_generator.h"
#include "session/session_exception.h"
#include "log/logger.h"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <stdexcept>
#include <vector>

namespace zstore::zsession
{
    SecureIdGenerator::SecureIdGenerator(const size_t num_bytes)
        : num_bytes_(num_bytes)
    {
        if (num_bytes_ < 16)
        {
            throw std::invalid_argument("Session id needs at least 16 random bytes");
        }
        ZSTORE_LOG_DEBUG("SecureIdGenerator created with {} random bytes", num_bytes_);
    }

    // 生成随机会话ID
    std::string SecureIdGenerator::generate()
    {
        std::vector<unsigned char> buffer(num_bytes_);
        if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1)
        {
            const unsigned long err = ERR_get_error();
            char err_buf[256];
            ERR_error_string_n(err, err_buf, sizeof(err_buf));
            ZSTORE_LOG_FATAL("RAND_bytes failed, cannot allocate session id: {}", err_buf);
            throw EntropyUnavailable(std::string("RAND_bytes failed: ") + err_buf);
        }

        static constexpr char hex_digits[] = "0123456789abcdef";
        std::string session_id;
        session_id.reserve(buffer.size() * 2);
        for (const unsigned char byte : buffer)
        {
            session_id.push_back(hex_digits[byte >> 4]);
            session_id.push_back(hex_digits[byte & 0x0f]);
        }
        return session_id;
    }

    bool SecureIdGenerator::is_well_formed(const std::string &session_id) const
    {
        if (session_id.size() != get_id_length())
        {
            return false;
        }
        return session_id.find_first_not_of("0123456789abcdef") == std::string::npos;
    }

    size_t SecureIdGenerator::get_id_length() const
    {
        return num_bytes_ * 2;
    }
} // namespace zstore::zsession
