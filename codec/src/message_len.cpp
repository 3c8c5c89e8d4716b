#include "minipack/message_len.hpp"

#include <algorithm>
#include <limits>

#include "wire.hpp"

namespace minipack
{

    MessageLen::MessageLen(Limits limits) : limits_(limits) {}

    LenResult MessageLen::len_of(std::span<const std::uint8_t> message, Limits limits)
    {
        MessageLen scanner(limits);
        return scanner.incremental_len(message);
    }

    void MessageLen::reset() noexcept
    {
        step_ = Step::Marker;
        position_ = 0;
        estimate_ = 1;
        error_ = ErrorCode::Ok;
        open_.clear();
        pending_items_ = 0;
        payload_left_ = 0;
        length_have_ = 0;
        length_size_ = 0;
    }

    std::size_t MessageLen::position() const noexcept
    {
        return position_;
    }

    std::size_t MessageLen::bytes_scanned() const noexcept
    {
        return bytes_scanned_;
    }

    ErrorCode MessageLen::error() const noexcept
    {
        return error_;
    }

    const Limits &MessageLen::limits() const noexcept
    {
        return limits_;
    }

    LenResult MessageLen::incremental_len(std::span<const std::uint8_t> next_bytes)
    {
        std::size_t offset = 0;
        while (step_ != Step::Complete && step_ != Step::Invalid)
        {
            const auto available = next_bytes.size() - offset;
            if (step_ == Step::Marker)
            {
                if (available == 0)
                {
                    return truncated();
                }
                const auto byte = next_bytes[offset++];
                ++position_;
                ++bytes_scanned_;
                on_marker(Marker::from_byte(byte));
            }
            else if (step_ == Step::Length)
            {
                const auto take = std::min(length_size_ - length_have_, available);
                std::copy_n(next_bytes.begin() + static_cast<std::ptrdiff_t>(offset), take,
                            length_buffer_.begin() + static_cast<std::ptrdiff_t>(length_have_));
                offset += take;
                length_have_ += take;
                position_ += take;
                bytes_scanned_ += take;
                if (length_have_ < length_size_)
                {
                    return truncated();
                }
                const auto field = std::span<const std::uint8_t>(length_buffer_).first(length_size_);
                on_length(static_cast<std::uint32_t>(wire::load_be(field)));
            }
            else
            {
                const auto take = static_cast<std::size_t>(std::min<std::uint64_t>(payload_left_, available));
                offset += take;
                payload_left_ -= take;
                position_ += take;
                bytes_scanned_ += take;
                if (payload_left_ > 0)
                {
                    return truncated();
                }
                finish_item();
            }
        }

        if (step_ == Step::Complete)
        {
            return LenResult::complete(position_);
        }
        return LenResult::invalid();
    }

    void MessageLen::on_marker(Marker marker)
    {
        if (!open_.empty())
        {
            --open_.back();
            --pending_items_;
        }

        switch (marker.kind())
        {
        case Marker::Kind::FixPos:
        case Marker::Kind::FixNeg:
        case Marker::Kind::Null:
        case Marker::Kind::True:
        case Marker::Kind::False:
            finish_item();
            break;
        case Marker::Kind::Reserved:
            fail(ErrorCode::InvalidMarker);
            break;
        case Marker::Kind::FixMap:
            if (check_len(marker.fix_value()))
            {
                open_container(2ull * marker.fix_value());
            }
            break;
        case Marker::Kind::FixArray:
            if (check_len(marker.fix_value()))
            {
                open_container(marker.fix_value());
            }
            break;
        case Marker::Kind::FixStr:
            if (check_len(marker.fix_value()))
            {
                begin_payload(marker.fix_value());
            }
            break;
        case Marker::Kind::U8:
        case Marker::Kind::I8:
            begin_payload(1);
            break;
        case Marker::Kind::U16:
        case Marker::Kind::I16:
            begin_payload(2);
            break;
        case Marker::Kind::U32:
        case Marker::Kind::I32:
        case Marker::Kind::F32:
            begin_payload(4);
            break;
        case Marker::Kind::U64:
        case Marker::Kind::I64:
        case Marker::Kind::F64:
            begin_payload(8);
            break;
        // Type byte plus data.
        case Marker::Kind::FixExt1:
            begin_payload(2);
            break;
        case Marker::Kind::FixExt2:
            begin_payload(3);
            break;
        case Marker::Kind::FixExt4:
            begin_payload(5);
            break;
        case Marker::Kind::FixExt8:
            begin_payload(9);
            break;
        case Marker::Kind::FixExt16:
            begin_payload(17);
            break;
        case Marker::Kind::Str8:
        case Marker::Kind::Bin8:
            begin_length(LengthOf::Bytes, 1);
            break;
        case Marker::Kind::Str16:
        case Marker::Kind::Bin16:
            begin_length(LengthOf::Bytes, 2);
            break;
        case Marker::Kind::Str32:
        case Marker::Kind::Bin32:
            begin_length(LengthOf::Bytes, 4);
            break;
        case Marker::Kind::Ext8:
            begin_length(LengthOf::Ext, 1);
            break;
        case Marker::Kind::Ext16:
            begin_length(LengthOf::Ext, 2);
            break;
        case Marker::Kind::Ext32:
            begin_length(LengthOf::Ext, 4);
            break;
        case Marker::Kind::Array16:
            begin_length(LengthOf::Array, 2);
            break;
        case Marker::Kind::Array32:
            begin_length(LengthOf::Array, 4);
            break;
        case Marker::Kind::Map16:
            begin_length(LengthOf::Map, 2);
            break;
        case Marker::Kind::Map32:
            begin_length(LengthOf::Map, 4);
            break;
        }
    }

    void MessageLen::on_length(std::uint32_t len)
    {
        if (!check_len(len))
        {
            return;
        }
        switch (length_of_)
        {
        case LengthOf::Bytes:
            begin_payload(len);
            break;
        case LengthOf::Ext:
            begin_payload(static_cast<std::uint64_t>(len) + 1);
            break;
        case LengthOf::Array:
            open_container(len);
            break;
        case LengthOf::Map:
            open_container(2ull * len);
            break;
        }
    }

    void MessageLen::begin_length(LengthOf target, std::size_t width) noexcept
    {
        length_of_ = target;
        length_size_ = width;
        length_have_ = 0;
        step_ = Step::Length;
        if (lower_bound() > limits_.max_size)
        {
            fail(ErrorCode::LimitExceeded);
        }
    }

    void MessageLen::begin_payload(std::uint64_t size)
    {
        if (size == 0)
        {
            finish_item();
            return;
        }
        payload_left_ = size;
        step_ = Step::Payload;
        if (lower_bound() > limits_.max_size)
        {
            fail(ErrorCode::LimitExceeded);
        }
    }

    void MessageLen::open_container(std::uint64_t items)
    {
        if (open_.size() + 1 > limits_.max_depth)
        {
            fail(ErrorCode::LimitExceeded);
            return;
        }
        if (items == 0)
        {
            finish_item();
            return;
        }
        open_.push_back(items);
        pending_items_ += items;
        step_ = Step::Marker;
        if (lower_bound() > limits_.max_size)
        {
            fail(ErrorCode::LimitExceeded);
        }
    }

    void MessageLen::finish_item() noexcept
    {
        while (!open_.empty() && open_.back() == 0)
        {
            open_.pop_back();
        }
        if (!open_.empty())
        {
            step_ = Step::Marker;
            return;
        }
        step_ = Step::Complete;
        if (position_ > limits_.max_size)
        {
            fail(ErrorCode::LimitExceeded);
        }
    }

    bool MessageLen::check_len(std::uint64_t len) noexcept
    {
        if (len > limits_.max_len)
        {
            fail(ErrorCode::LimitExceeded);
            return false;
        }
        return true;
    }

    void MessageLen::fail(ErrorCode reason) noexcept
    {
        step_ = Step::Invalid;
        error_ = reason;
    }

    std::uint64_t MessageLen::lower_bound() const noexcept
    {
        std::uint64_t need = 0;
        if (step_ == Step::Marker)
        {
            need = open_.empty() ? 1 : 0;
        }
        else if (step_ == Step::Length)
        {
            need = length_size_ - length_have_;
        }
        else if (step_ == Step::Payload)
        {
            need = payload_left_;
        }
        return position_ + need + pending_items_;
    }

    LenResult MessageLen::truncated() noexcept
    {
        const auto bound = std::min<std::uint64_t>(lower_bound(), std::numeric_limits<std::size_t>::max());
        estimate_ = std::max(estimate_, static_cast<std::size_t>(bound));
        return LenResult::truncated(estimate_);
    }

} // namespace minipack
