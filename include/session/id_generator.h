#pragma once
#include <memory>
#include <string>

namespace zstore::zsession
{
    class IdGenerator
    {
    public:
        using ptr = std::shared_ptr<IdGenerator>;

        virtual ~IdGenerator() = default;

        // 生成新的会话ID
        virtual std::string generate() = 0;

        // 检查客户端传入的ID格式是否合法
        [[nodiscard]] virtual bool is_well_formed(const std::string &session_id) const = 0;
    };

    // 基于OpenSSL安全随机数的会话ID生成器，输出小写十六进制
    class SecureIdGenerator final : public IdGenerator
    {
    public:
        explicit SecureIdGenerator(size_t num_bytes = 32);

        std::string generate() override;

        [[nodiscard]] bool is_well_formed(const std::string &session_id) const override;

        [[nodiscard]] size_t get_id_length() const;

    private:
        size_t num_bytes_; // 随机字节数，至少16字节(128位)
    };
} // namespace zstore::zsession
