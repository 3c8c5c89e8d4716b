#include "minipack/json.hpp"

#include <set>
#include <string_view>

#include "minipack/encoding/base64.hpp"
#include "minipack/timestamp.hpp"

namespace minipack
{

    namespace
    {
        bool has_distinct_string_keys(const Value::Map &entries)
        {
            std::set<std::string_view> seen;
            for (const auto &entry : entries)
            {
                const auto *key = entry.first.get_if<std::string>();
                if (key == nullptr || !seen.insert(*key).second)
                {
                    return false;
                }
            }
            return true;
        }

        struct JsonRenderer
        {
            Json operator()(Nil) const
            {
                return nullptr;
            }

            Json operator()(bool value) const
            {
                return value;
            }

            Json operator()(Integer value) const
            {
                if (value.is_negative())
                {
                    return *value.as_i64();
                }
                return *value.as_u64();
            }

            Json operator()(float value) const
            {
                return value;
            }

            Json operator()(double value) const
            {
                return value;
            }

            Json operator()(const std::string &value) const
            {
                return value;
            }

            Json operator()(const Binary &value) const
            {
                return encoding::encode_base64(value);
            }

            Json operator()(const Value::Array &items) const
            {
                Json json = Json::array();
                for (const auto &item : items)
                {
                    json.push_back(to_json_value(item));
                }
                return json;
            }

            Json operator()(const Value::Map &entries) const
            {
                if (has_distinct_string_keys(entries))
                {
                    Json json = Json::object();
                    for (const auto &[key, value] : entries)
                    {
                        json[*key.get_if<std::string>()] = to_json_value(value);
                    }
                    return json;
                }
                Json json = Json::array();
                for (const auto &[key, value] : entries)
                {
                    json.push_back(Json::array({to_json_value(key), to_json_value(value)}));
                }
                return json;
            }

            Json operator()(const Ext &value) const
            {
                Json json = {
                    {"type", value.type},
                    {"data", encoding::encode_base64(value.data)},
                };
                if (value.type == kTimestampExtType)
                {
                    if (auto timestamp = Timestamp::from_ext_payload(value.data))
                    {
                        json["timestamp"] = {
                            {"seconds", timestamp->seconds()},
                            {"nanoseconds", timestamp->nanoseconds()},
                        };
                    }
                }
                return json;
            }
        };
    } // namespace

    Json to_json_value(const Value &value)
    {
        return std::visit(JsonRenderer{}, value.storage());
    }

} // namespace minipack
