#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "config/session_config.h"

namespace zstore::zsession
{
    using zconfig::SerializerFormat;

    // 存储格式的外层信封
    struct Envelope
    {
        nlohmann::json data = nlohmann::json::object(); // 会话属性
        bool permanent = false;                          // 是否永不过期
        int64_t accessed_at = 0;                         // 最后一次写入时间(秒)
    };

    /**
     * 会话数据编解码。
     *
     * 支持的值类型: 字符串、整数、有限浮点数、布尔、null、数组、嵌套对象。
     * 编码时拒绝其他类型(InvalidValueType)，解码失败抛出 CorruptPayload。
     * 存储格式为带版本号的信封 {"v":1,"permanent":..,"accessed":..,"data":{..}}，
     * 可选JSON文本或MessagePack二进制。
     */
    class Serializer
    {
    public:
        static constexpr int kFormatVersion = 1;

        explicit Serializer(SerializerFormat format = SerializerFormat::JSON);

        // 编码会话属性
        [[nodiscard]] std::string encode(const nlohmann::json &mapping) const;

        // 解码会话属性
        [[nodiscard]] nlohmann::json decode(const std::string &bytes) const;

        [[nodiscard]] std::string encode_envelope(const Envelope &envelope) const;

        [[nodiscard]] Envelope decode_envelope(const std::string &bytes) const;

        [[nodiscard]] SerializerFormat get_format() const;

        // 检查值是否都属于支持的类型，不合法时抛出 InvalidValueType
        static void check_value(const nlohmann::json &value, const std::string &path);

    private:
        SerializerFormat format_;
    };
} // namespace zstore::zsession
