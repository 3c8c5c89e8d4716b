#include "minipack/value.hpp"

#include <algorithm>

namespace minipack
{

    namespace
    {
        struct ToOwned
        {
            Value operator()(Nil) const
            {
                return Value();
            }

            Value operator()(bool value) const
            {
                return Value(value);
            }

            Value operator()(Integer value) const
            {
                return Value(value);
            }

            Value operator()(float value) const
            {
                return Value(value);
            }

            Value operator()(double value) const
            {
                return Value(value);
            }

            Value operator()(std::string_view value) const
            {
                return Value(std::string(value));
            }

            Value operator()(const BinaryRef &value) const
            {
                return Value(Binary(value.data.begin(), value.data.end()));
            }

            Value operator()(const ValueRef::Array &items) const
            {
                Value::Array owned;
                owned.reserve(items.size());
                for (const auto &item : items)
                {
                    owned.push_back(item.to_owned());
                }
                return Value(std::move(owned));
            }

            Value operator()(const ValueRef::Map &entries) const
            {
                Value::Map owned;
                owned.reserve(entries.size());
                for (const auto &[key, value] : entries)
                {
                    owned.emplace_back(key.to_owned(), value.to_owned());
                }
                return Value(std::move(owned));
            }

            Value operator()(const ExtRef &value) const
            {
                return Value(Ext{value.type, std::vector<std::uint8_t>(value.data.begin(), value.data.end())});
            }
        };
    } // namespace

    bool operator==(const Value &lhs, const Value &rhs)
    {
        return lhs.storage_ == rhs.storage_;
    }

    bool operator==(const BinaryRef &lhs, const BinaryRef &rhs)
    {
        return std::ranges::equal(lhs.data, rhs.data);
    }

    bool operator==(const ExtRef &lhs, const ExtRef &rhs)
    {
        return lhs.type == rhs.type && std::ranges::equal(lhs.data, rhs.data);
    }

    bool operator==(const ValueRef &lhs, const ValueRef &rhs)
    {
        return lhs.storage_ == rhs.storage_;
    }

    Value ValueRef::to_owned() const
    {
        return std::visit(ToOwned{}, storage_);
    }

} // namespace minipack
