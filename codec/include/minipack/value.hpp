/**
 * MiniPack - Owned and borrowed value trees.
 *
 * `Value` owns every nested buffer. `ValueRef` holds views into the bytes it
 * was decoded from and must not outlive them; `ValueRef::to_owned` copies it
 * into a `Value`. Maps keep entries in encounter order and keep duplicate keys.
 */
#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "minipack/integer.hpp"

namespace minipack
{

    struct Nil
    {
        friend bool operator==(Nil, Nil) noexcept = default;
    };

    using Binary = std::vector<std::uint8_t>;

    struct Ext
    {
        std::int8_t type{};
        std::vector<std::uint8_t> data;

        friend bool operator==(const Ext &lhs, const Ext &rhs) = default;
    };

    class Value
    {
    public:
        using Array = std::vector<Value>;
        using Map = std::vector<std::pair<Value, Value>>;
        using Storage = std::variant<Nil, bool, Integer, float, double, std::string, Binary, Array, Map, Ext>;

        Value() = default;
        Value(Nil) {}
        Value(bool value) : storage_(std::in_place_type<bool>, value) {}
        Value(Integer value) : storage_(value) {}
        template <std::integral T>
            requires(!std::same_as<T, bool>)
        Value(T value) : storage_(Integer(value))
        {
        }
        Value(float value) : storage_(std::in_place_type<float>, value) {}
        Value(double value) : storage_(std::in_place_type<double>, value) {}
        Value(std::string value) : storage_(std::move(value)) {}
        Value(std::string_view value) : storage_(std::string(value)) {}
        Value(const char *value) : storage_(std::string(value)) {}
        Value(Binary value) : storage_(std::move(value)) {}
        Value(Array value) : storage_(std::move(value)) {}
        Value(Map value) : storage_(std::move(value)) {}
        Value(Ext value) : storage_(std::move(value)) {}

        template <typename T>
        bool is() const noexcept
        {
            return std::holds_alternative<T>(storage_);
        }

        template <typename T>
        const T *get_if() const noexcept
        {
            return std::get_if<T>(&storage_);
        }

        template <typename T>
        T *get_if() noexcept
        {
            return std::get_if<T>(&storage_);
        }

        const Storage &storage() const noexcept
        {
            return storage_;
        }

        friend bool operator==(const Value &lhs, const Value &rhs);

    private:
        Storage storage_;
    };

    struct BinaryRef
    {
        std::span<const std::uint8_t> data;

        friend bool operator==(const BinaryRef &lhs, const BinaryRef &rhs);
    };

    struct ExtRef
    {
        std::int8_t type{};
        std::span<const std::uint8_t> data;

        friend bool operator==(const ExtRef &lhs, const ExtRef &rhs);
    };

    class ValueRef
    {
    public:
        using Array = std::vector<ValueRef>;
        using Map = std::vector<std::pair<ValueRef, ValueRef>>;
        using Storage = std::variant<Nil, bool, Integer, float, double, std::string_view, BinaryRef, Array, Map, ExtRef>;

        ValueRef() = default;
        ValueRef(Nil) {}
        ValueRef(bool value) : storage_(std::in_place_type<bool>, value) {}
        ValueRef(Integer value) : storage_(value) {}
        template <std::integral T>
            requires(!std::same_as<T, bool>)
        ValueRef(T value) : storage_(Integer(value))
        {
        }
        ValueRef(float value) : storage_(std::in_place_type<float>, value) {}
        ValueRef(double value) : storage_(std::in_place_type<double>, value) {}
        ValueRef(std::string_view value) : storage_(value) {}
        ValueRef(const char *value) : storage_(std::string_view(value)) {}
        ValueRef(BinaryRef value) : storage_(value) {}
        ValueRef(Array value) : storage_(std::move(value)) {}
        ValueRef(Map value) : storage_(std::move(value)) {}
        ValueRef(ExtRef value) : storage_(value) {}

        template <typename T>
        bool is() const noexcept
        {
            return std::holds_alternative<T>(storage_);
        }

        template <typename T>
        const T *get_if() const noexcept
        {
            return std::get_if<T>(&storage_);
        }

        const Storage &storage() const noexcept
        {
            return storage_;
        }

        /// Deep copy that no longer refers to the source bytes.
        Value to_owned() const;

        friend bool operator==(const ValueRef &lhs, const ValueRef &rhs);

    private:
        Storage storage_;
    };

} // namespace minipack
