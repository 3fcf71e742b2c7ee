#include "session/serializer.h"
#include "session/session_exception.h"
#include <cmath>

namespace zstore::zsession
{
    Serializer::Serializer(const SerializerFormat format)
        : format_(format)
    {
    }

    std::string Serializer::encode(const nlohmann::json &mapping) const
    {
        Envelope envelope;
        envelope.data = mapping;
        return encode_envelope(envelope);
    }

    nlohmann::json Serializer::decode(const std::string &bytes) const
    {
        return decode_envelope(bytes).data;
    }

    std::string Serializer::encode_envelope(const Envelope &envelope) const
    {
        if (!envelope.data.is_object())
        {
            throw InvalidValueType(std::string("Session payload must be an object, got ") +
                                   envelope.data.type_name());
        }
        check_value(envelope.data, "$");

        nlohmann::json doc = {
            {"v", kFormatVersion},
            {"permanent", envelope.permanent},
            {"accessed", envelope.accessed_at},
            {"data", envelope.data}
        };

        try
        {
            if (format_ == SerializerFormat::MSGPACK)
            {
                const std::vector<std::uint8_t> bytes = nlohmann::json::to_msgpack(doc);
                return {bytes.begin(), bytes.end()};
            }
            // 非法UTF-8字符串会在这里抛出 type_error
            return doc.dump();
        }
        catch (const nlohmann::json::exception &e)
        {
            throw InvalidValueType(std::string("Session payload cannot be encoded: ") + e.what());
        }
    }

    Envelope Serializer::decode_envelope(const std::string &bytes) const
    {
        nlohmann::json doc;
        if (format_ == SerializerFormat::MSGPACK)
        {
            doc = nlohmann::json::from_msgpack(bytes, true, false);
        }
        else
        {
            doc = nlohmann::json::parse(bytes, nullptr, false);
        }

        if (doc.is_discarded())
        {
            throw CorruptPayload("Session payload is not valid " + zconfig::to_string(format_));
        }
        if (!doc.is_object())
        {
            throw CorruptPayload("Session payload envelope is not an object");
        }

        const auto version = doc.find("v");
        if (version == doc.end() || !version->is_number_integer() || version->get<int>() != kFormatVersion)
        {
            throw CorruptPayload("Session payload has missing or unsupported version tag");
        }

        const auto data = doc.find("data");
        if (data == doc.end() || !data->is_object())
        {
            throw CorruptPayload("Session payload has no data object");
        }

        // MessagePack 的 bin 等类型能解出来但无法再次编码
        try
        {
            check_value(*data, "$");
        }
        catch (const InvalidValueType &e)
        {
            throw CorruptPayload(std::string("Session payload holds an unsupported value: ") + e.what());
        }

        Envelope envelope;
        envelope.data = std::move(*data);

        if (const auto permanent = doc.find("permanent"); permanent != doc.end())
        {
            if (!permanent->is_boolean())
            {
                throw CorruptPayload("Session payload has malformed permanent flag");
            }
            envelope.permanent = permanent->get<bool>();
        }
        if (const auto accessed = doc.find("accessed"); accessed != doc.end())
        {
            if (!accessed->is_number_integer())
            {
                throw CorruptPayload("Session payload has malformed access time");
            }
            envelope.accessed_at = accessed->get<int64_t>();
        }
        return envelope;
    }

    SerializerFormat Serializer::get_format() const
    {
        return format_;
    }

    void Serializer::check_value(const nlohmann::json &value, const std::string &path)
    {
        switch (value.type())
        {
            case nlohmann::json::value_t::null:
            case nlohmann::json::value_t::boolean:
            case nlohmann::json::value_t::string:
            case nlohmann::json::value_t::number_integer:
            case nlohmann::json::value_t::number_unsigned:
                return;
            case nlohmann::json::value_t::number_float:
                if (!std::isfinite(value.get<double>()))
                {
                    throw InvalidValueType("Non-finite number at " + path);
                }
                return;
            case nlohmann::json::value_t::array:
                for (size_t i = 0; i < value.size(); ++i)
                {
                    check_value(value[i], path + "[" + std::to_string(i) + "]");
                }
                return;
            case nlohmann::json::value_t::object:
                for (auto it = value.begin(); it != value.end(); ++it)
                {
                    check_value(it.value(), path + "." + it.key());
                }
                return;
            default:
                // binary 与 discarded
                throw InvalidValueType(std::string("Unsupported value type '") + value.type_name() + "' at " + path);
        }
    }
} // namespace zstore::zsession
