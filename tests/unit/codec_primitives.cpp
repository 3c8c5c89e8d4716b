#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <span>
#include <system_error>
#include <sstream>
#include <string>
#include <vector>

#include "minipack/decode.hpp"
#include "minipack/encode.hpp"
#include "minipack/marker.hpp"
#include "minipack/timestamp.hpp"
#include "minipack/value_codec.hpp"
#include "test_support.hpp"

using namespace minipack;
using minipack::test::ascii;
using minipack::test::concat;
using minipack::test::encoded;
using minipack::test::hex;

void run_message_len_tests();
void run_value_tests();
void run_framing_tests();
void run_support_tests();

namespace
{

    void test_marker_bijection()
    {
        for (int byte = 0; byte <= 0xff; ++byte)
        {
            const auto marker = Marker::from_byte(static_cast<std::uint8_t>(byte));
            assert(marker.to_byte() == byte);
        }

        assert(Marker::from_byte(0xc1).kind() == Marker::Kind::Reserved);
        assert(Marker::from_byte(0x93) == Marker::fix_array(3));
        assert(Marker::from_byte(0x93).fix_value() == 3);
        assert(Marker::from_byte(0xf7).fix_neg_value() == -9);
        assert(Marker::from_byte(0xbf) == Marker::fix_str(31));
        assert(Marker::from_byte(0x00) != Marker::from_byte(0x01));
        assert(Marker::fix_pos(0x85).to_byte() == 0x05);

        assert(to_string(Marker::fix_array(3)) == "FixArray(3)");
        assert(to_string(Marker::fix_neg(-5)) == "FixNeg(-5)");
        assert(to_string(Marker(Marker::Kind::U16)) == "U16");
        assert(to_string(Marker::Kind::Reserved) == "Reserved");
    }

    void test_minimal_unsigned()
    {
        struct Case
        {
            std::uint64_t value;
            const char *bytes;
            Marker::Kind kind;
        };
        const std::array<Case, 10> cases{{
            {0, "00", Marker::Kind::FixPos},
            {42, "2a", Marker::Kind::FixPos},
            {127, "7f", Marker::Kind::FixPos},
            {128, "cc 80", Marker::Kind::U8},
            {255, "cc ff", Marker::Kind::U8},
            {256, "cd 01 00", Marker::Kind::U16},
            {65535, "cd ff ff", Marker::Kind::U16},
            {65536, "ce 00 01 00 00", Marker::Kind::U32},
            {100500, "ce 00 01 88 94", Marker::Kind::U32},
            {0x1'0000'0000, "cf 00 00 00 01 00 00 00 00", Marker::Kind::U64},
        }};

        for (const auto &entry : cases)
        {
            BufferSink sink;
            const auto marker = write_uint(sink, entry.value);
            assert(marker);
            assert(marker->kind() == entry.kind);
            assert(sink.bytes() == hex(entry.bytes));

            SliceSource source(sink.bytes());
            const auto decoded = read_int<std::uint64_t>(source);
            assert(decoded && *decoded == entry.value);
            assert(source.remaining().empty());
        }
    }

    void test_minimal_signed()
    {
        struct Case
        {
            std::int64_t value;
            const char *bytes;
        };
        const std::array<Case, 11> cases{{
            {-1, "ff"},
            {-32, "e0"},
            {-33, "d0 df"},
            {-128, "d0 80"},
            {-129, "d1 ff 7f"},
            {-32768, "d1 80 00"},
            {-32769, "d2 ff ff 7f ff"},
            {std::numeric_limits<std::int64_t>::min(), "d3 80 00 00 00 00 00 00 00"},
            {42, "2a"},
            {200, "cc c8"},
            {std::numeric_limits<std::int64_t>::max(), "cf 7f ff ff ff ff ff ff ff"},
        }};

        for (const auto &entry : cases)
        {
            const auto bytes = encoded([&](ByteSink &sink) { return write_sint(sink, entry.value); });
            assert(bytes == hex(entry.bytes));

            SliceSource source(bytes);
            const auto decoded = read_int<std::int64_t>(source);
            assert(decoded && *decoded == entry.value);
        }

        assert(encoded([](ByteSink &sink) { return write_integer(sink, Integer(-200)); }) == hex("d1 ff 38"));
        assert(encoded([](ByteSink &sink) { return write_integer(sink, Integer(std::uint64_t{300})); }) ==
               hex("cd 01 2c"));
    }

    void test_explicit_widths()
    {
        assert(encoded([](ByteSink &sink) { return write_u8(sink, 1); }) == hex("cc 01"));
        assert(encoded([](ByteSink &sink) { return write_u16(sink, 1); }) == hex("cd 00 01"));
        assert(encoded([](ByteSink &sink) { return write_u32(sink, 1); }) == hex("ce 00 00 00 01"));
        assert(encoded([](ByteSink &sink) { return write_u64(sink, 1); }) == hex("cf 00 00 00 00 00 00 00 01"));
        assert(encoded([](ByteSink &sink) { return write_i8(sink, 1); }) == hex("d0 01"));
        assert(encoded([](ByteSink &sink) { return write_i16(sink, -2); }) == hex("d1 ff fe"));
        assert(encoded([](ByteSink &sink) { return write_i32(sink, -1); }) == hex("d2 ff ff ff ff"));
        assert(encoded([](ByteSink &sink) { return write_i64(sink, -1); }) == hex("d3 ff ff ff ff ff ff ff ff"));
        assert(encoded([](ByteSink &sink) { return write_pfix(sink, 127); }) == hex("7f"));
        assert(encoded([](ByteSink &sink) { return write_nfix(sink, -32); }) == hex("e0"));
        assert(encoded([](ByteSink &sink) { return write_f32(sink, 1.5F); }) == hex("ca 3f c0 00 00"));
        assert(encoded([](ByteSink &sink) { return write_f64(sink, 1.5); }) == hex("cb 3f f8 00 00 00 00 00 00"));
        assert(encoded([](ByteSink &sink) { return write_nil(sink); }) == hex("c0"));
        assert(encoded([](ByteSink &sink) { return write_bool(sink, true); }) == hex("c3"));
        assert(encoded([](ByteSink &sink) { return write_bool(sink, false); }) == hex("c2"));

        BufferSink sink;
        assert(write_pfix(sink, 128).code() == ErrorCode::OutOfRange);
        assert(write_nfix(sink, 0).code() == ErrorCode::OutOfRange);
        assert(write_nfix(sink, -33).code() == ErrorCode::OutOfRange);
        assert(sink.bytes().empty());
    }

    void test_length_headers()
    {
        assert(encoded([](ByteSink &sink) { return write_str_len(sink, 0); }) == hex("a0"));
        assert(encoded([](ByteSink &sink) { return write_str_len(sink, 31); }) == hex("bf"));
        assert(encoded([](ByteSink &sink) { return write_str_len(sink, 32); }) == hex("d9 20"));
        assert(encoded([](ByteSink &sink) { return write_str_len(sink, 256); }) == hex("da 01 00"));
        assert(encoded([](ByteSink &sink) { return write_str_len(sink, 65536); }) == hex("db 00 01 00 00"));

        assert(encoded([](ByteSink &sink) { return write_bin_len(sink, 0); }) == hex("c4 00"));
        assert(encoded([](ByteSink &sink) { return write_bin_len(sink, 300); }) == hex("c5 01 2c"));
        assert(encoded([](ByteSink &sink) { return write_bin_len(sink, 70000); }) == hex("c6 00 01 11 70"));

        assert(encoded([](ByteSink &sink) { return write_array_len(sink, 15); }) == hex("9f"));
        assert(encoded([](ByteSink &sink) { return write_array_len(sink, 16); }) == hex("dc 00 10"));
        assert(encoded([](ByteSink &sink) { return write_array_len(sink, 65536); }) == hex("dd 00 01 00 00"));
        assert(encoded([](ByteSink &sink) { return write_map_len(sink, 1); }) == hex("81"));
        assert(encoded([](ByteSink &sink) { return write_map_len(sink, 16); }) == hex("de 00 10"));
        assert(encoded([](ByteSink &sink) { return write_map_len(sink, 65536); }) == hex("df 00 01 00 00"));

        assert(encoded([](ByteSink &sink) { return write_ext_meta(sink, 1, 5); }) == hex("d4 05"));
        assert(encoded([](ByteSink &sink) { return write_ext_meta(sink, 2, -2); }) == hex("d5 fe"));
        assert(encoded([](ByteSink &sink) { return write_ext_meta(sink, 4, 1); }) == hex("d6 01"));
        assert(encoded([](ByteSink &sink) { return write_ext_meta(sink, 8, 1); }) == hex("d7 01"));
        assert(encoded([](ByteSink &sink) { return write_ext_meta(sink, 16, 1); }) == hex("d8 01"));
        assert(encoded([](ByteSink &sink) { return write_ext_meta(sink, 3, 5); }) == hex("c7 03 05"));
        assert(encoded([](ByteSink &sink) { return write_ext_meta(sink, 0, 7); }) == hex("c7 00 07"));
        assert(encoded([](ByteSink &sink) { return write_ext_meta(sink, 256, 5); }) == hex("c8 01 00 05"));
        assert(encoded([](ByteSink &sink) { return write_ext_meta(sink, 70000, 1); }) == hex("c9 00 01 11 70 01"));
    }

    void test_payload_writers()
    {
        assert(encoded([](ByteSink &sink) { return write_str(sink, ""); }) == hex("a0"));
        assert(encoded([](ByteSink &sink) { return write_str(sink, "hello"); }) == concat(hex("a5"), ascii("hello")));

        const std::string long_text(40, 'x');
        assert(encoded([&](ByteSink &sink) { return write_str(sink, long_text); }) ==
               concat(hex("d9 28"), ascii(long_text)));

        const std::vector<std::uint8_t> blob{1, 2, 3};
        assert(encoded([&](ByteSink &sink) { return write_bin(sink, blob); }) == hex("c4 03 01 02 03"));
        assert(encoded([](ByteSink &sink) { return write_ext(sink, 5, ascii("abc")); }) ==
               concat(hex("c7 03 05"), ascii("abc")));
    }

    void test_typed_readers()
    {
        {
            const auto bytes = hex("cc ff");
            SliceSource source(bytes);
            const auto value = read_u8(source);
            assert(value && *value == 255);
        }
        {
            const auto bytes = hex("ff");
            SliceSource source(bytes);
            const auto value = read_u8(source);
            assert(value.code() == ErrorCode::TypeMismatch);
            assert(value.error().marker == Marker::from_byte(0xff));
        }
        {
            const auto bytes = hex("cd 01");
            SliceSource source(bytes);
            assert(read_u16(source).code() == ErrorCode::InsufficientData);
        }
        {
            SliceSource source(std::span<const std::uint8_t>{});
            assert(read_marker(source).code() == ErrorCode::InsufficientData);
        }
        {
            const auto bytes = hex("c0 c3 c2 7f e0 cb 3f f8 00 00 00 00 00 00 ca 3f c0 00 00");
            SliceSource source(bytes);
            assert(read_nil(source));
            assert(read_bool(source).value() == true);
            assert(read_bool(source).value() == false);
            assert(read_pfix(source).value() == 127);
            assert(read_nfix(source).value() == -32);
            assert(read_f64(source).value() == 1.5);
            assert(read_f32(source).value() == 1.5F);
            assert(source.remaining().empty());
        }
        {
            const auto bytes = hex("c2");
            SliceSource source(bytes);
            assert(read_nil(source).code() == ErrorCode::TypeMismatch);
        }
        {
            const auto bytes = hex("cd 00 05");
            SliceSource source(bytes);
            assert(read_u8(source).code() == ErrorCode::TypeMismatch);
        }
        {
            const auto bytes = hex("d2 ff ff ff fe");
            SliceSource source(bytes);
            assert(read_i32(source).value() == -2);
        }
    }

    void test_loose_integer_reads()
    {
        {
            const auto bytes = hex("d0 df");
            SliceSource source(bytes);
            const auto value = read_integer(source);
            assert(value && *value == Integer(-33));
            assert(value->is_negative());
        }
        {
            const auto bytes = hex("d1 ff 7f");
            SliceSource narrow(bytes);
            assert(read_int<std::uint8_t>(narrow).code() == ErrorCode::OutOfRange);
            SliceSource wide(bytes);
            assert(read_int<std::int16_t>(wide).value() == -129);
        }
        {
            const auto bytes = hex("cf ff ff ff ff ff ff ff ff");
            SliceSource as_unsigned(bytes);
            assert(read_int<std::uint64_t>(as_unsigned).value() == std::numeric_limits<std::uint64_t>::max());
            SliceSource as_signed(bytes);
            assert(read_int<std::int64_t>(as_signed).code() == ErrorCode::OutOfRange);
        }
        {
            // An unsigned 8-bit value read into a signed 8-bit slot only fits up to 127.
            const auto bytes = hex("cc 7f cc 80");
            SliceSource source(bytes);
            assert(read_int<std::int8_t>(source).value() == 127);
            assert(read_int<std::int8_t>(source).code() == ErrorCode::OutOfRange);
        }
        {
            const auto bytes = hex("a1 41");
            SliceSource source(bytes);
            const auto value = read_integer(source);
            assert(value.code() == ErrorCode::TypeMismatch);
            assert(value.error().marker == Marker::fix_str(1));
        }
        assert(Integer(std::uint8_t{7}) == Integer(std::int64_t{7}));
        assert(Integer(-1).as<std::uint32_t>() == std::nullopt);
        assert(Integer(-1).to_string() == "-1");
    }

    void test_reserved_marker()
    {
        const auto bytes = hex("c1");
        {
            SliceSource source(bytes);
            assert(read_integer(source).code() == ErrorCode::TypeMismatch);
        }
        {
            SliceSource source(bytes);
            assert(read_str(source).code() == ErrorCode::TypeMismatch);
        }
        {
            SliceSource source(bytes);
            const auto value = read_value(source);
            assert(value.code() == ErrorCode::InvalidMarker);
            assert(value.error().marker == Marker(Marker::Kind::Reserved));
        }
    }

    void test_string_reads()
    {
        {
            const auto bytes = concat(hex("a5"), ascii("hello"));
            SliceSource source(bytes);
            assert(read_str(source).value() == "hello");
        }
        {
            const auto bytes = concat(hex("d9 03"), ascii("abc"));
            SliceSource source(bytes);
            assert(read_str(source).value() == "abc");
        }
        {
            const auto bytes = concat(hex("a5"), ascii("he"));
            SliceSource source(bytes);
            assert(read_str(source).code() == ErrorCode::InsufficientData);
        }
        {
            const auto bytes = hex("a2 c3 28");
            SliceSource source(bytes);
            const auto value = read_str(source);
            assert(value.code() == ErrorCode::InvalidUtf8);
            assert(value.error().raw == hex("c3 28"));
            assert(value.error().utf8_offset == 0);
        }
        {
            // Encoded surrogate half.
            const auto bytes = hex("a4 61 ed a0 80");
            SliceSource source(bytes);
            const auto value = read_str(source);
            assert(value.code() == ErrorCode::InvalidUtf8);
            assert(value.error().utf8_offset == 1);
        }
        {
            const auto bytes = hex("a4 f0 9f 98 80");
            SliceSource source(bytes);
            assert(read_str(source).value() == "\xf0\x9f\x98\x80");
        }
        {
            const auto bytes = concat(hex("a5"), ascii("hello"));
            std::array<char, 4> small{};
            SliceSource first(bytes);
            assert(read_str_into(first, small).code() == ErrorCode::BufferTooSmall);

            std::array<char, 8> scratch{};
            SliceSource second(bytes);
            const auto view = read_str_into(second, scratch);
            assert(view && *view == "hello");
            assert(view->data() == scratch.data());
        }
        {
            const auto bytes = concat(hex("a3"), ascii("abc"));
            SliceSource source(bytes);
            const auto view = read_str_ref(source);
            assert(view && *view == "abc");
            assert(reinterpret_cast<const std::uint8_t *>(view->data()) == bytes.data() + 1);
        }
    }

    void test_binary_and_lengths()
    {
        {
            const auto bytes = hex("c4 03 01 02 03");
            SliceSource source(bytes);
            assert(read_bin(source).value() == hex("01 02 03"));
        }
        {
            const auto bytes = hex("c4 03 01 02 03");
            SliceSource source(bytes);
            const auto view = read_bin_ref(source);
            assert(view && view->size() == 3 && view->data() == bytes.data() + 2);
        }
        {
            const auto bytes = concat(hex("a1"), ascii("A"));
            SliceSource source(bytes);
            assert(read_bin(source).code() == ErrorCode::TypeMismatch);
        }
        {
            const auto bytes = hex("dc 00 10 83 93 c7 03 05 d6 ff");
            SliceSource source(bytes);
            assert(read_array_len(source).value() == 16);
            assert(read_map_len(source).value() == 3);
            assert(read_map_len(source).code() == ErrorCode::TypeMismatch);

            const auto ext = read_ext_meta(source);
            assert(ext && ext->type == 5 && ext->size == 3);
            const auto fixed = read_ext_meta(source);
            assert(fixed && fixed->type == -1 && fixed->size == 4);
        }
        {
            const auto bytes = hex("d6 05 01 02 03 04 d4 7f 09");
            SliceSource source(bytes);
            const auto four = read_fixext4(source);
            assert(four && four->type == 5);
            assert(four->data == (std::array<std::uint8_t, 4>{1, 2, 3, 4}));
            const auto one = read_fixext1(source);
            assert(one && one->type == 127 && one->data[0] == 9);
        }
        {
            // Declared length far beyond the input must not be trusted for allocation.
            const auto bytes = hex("c6 7f ff ff ff 00");
            SliceSource source(bytes);
            assert(read_bin(source).code() == ErrorCode::InsufficientData);
        }
    }

    void test_timestamps()
    {
        const auto ts32 = Timestamp::from_32(0x66c1de7c);
        assert(ts32.bit_size() == 32);
        const auto bytes32 = encoded([&](ByteSink &sink) { return write_timestamp(sink, ts32); });
        assert(bytes32 == hex("d6 ff 66 c1 de 7c"));

        const auto ts64 = Timestamp::from_64(0x66c1de7c, 0x3b9ac9ff);
        assert(ts64 && ts64->bit_size() == 64);
        const auto bytes64 = encoded([&](ByteSink &sink) { return write_timestamp(sink, *ts64); });
        assert(bytes64 == hex("d7 ff ee 6b 27 fc 66 c1 de 7c"));

        const auto ts96 = Timestamp::from_96(0x66c1de7c, 0x3b9ac9ff);
        assert(ts96 && ts96->bit_size() == 96);
        const auto bytes96 = encoded([&](ByteSink &sink) { return write_timestamp(sink, *ts96); });
        assert(bytes96 == hex("c7 0c ff 3b 9a c9 ff 00 00 00 00 66 c1 de 7c"));

        const auto all = concat(concat(bytes32, bytes64), bytes96);
        SliceSource source(all);
        assert(read_timestamp(source).value() == ts32);
        assert(read_timestamp(source).value() == *ts64);
        assert(read_timestamp(source).value() == *ts96);

        assert(!Timestamp::from_64(0, 1'000'000'000));
        assert(!Timestamp::from_64(Timestamp::kMax64BitSeconds + 1, 0));
        assert(!Timestamp::from_64(-1, 0));
        assert(!Timestamp::from_96(0, 1'000'000'000));

        assert(Timestamp::from_instant(5, 0)->bit_size() == 32);
        assert(Timestamp::from_instant(5, 1)->bit_size() == 64);
        assert(Timestamp::from_instant(-1, 0)->bit_size() == 96);
        assert(Timestamp::from_instant(Timestamp::kMax64BitSeconds + 1, 0)->bit_size() == 96);

        {
            const auto other = hex("d6 05 00 00 00 00");
            SliceSource other_source(other);
            assert(read_timestamp(other_source).code() == ErrorCode::TypeMismatch);
        }
        {
            const auto odd = hex("d5 ff 00 00");
            SliceSource odd_source(odd);
            assert(read_timestamp(odd_source).code() == ErrorCode::InvalidTimestamp);
        }
        {
            const auto overflow = hex("d7 ff ee 6b 28 00 00 00 00 00");
            SliceSource overflow_source(overflow);
            assert(read_timestamp(overflow_source).code() == ErrorCode::InvalidTimestamp);
        }
    }

    void test_sink_faults()
    {
        std::array<std::uint8_t, 3> storage{};
        SpanSink sink(storage);
        assert(write_u8(sink, 1));
        assert(sink.written() == 2);
        const auto overflow = write_u16(sink, 1);
        assert(overflow.code() == ErrorCode::IoFault);
        assert(overflow.error().io_error == std::errc::no_buffer_space);
        assert(sink.written() == 3);
    }

    // Delivers one byte per call and fails every other call with the configured error.
    class FlakySource final : public ByteSource
    {
    public:
        FlakySource(std::span<const std::uint8_t> data, std::errc fault) : data_(data), fault_(fault) {}

        Result<std::size_t> read(std::span<std::uint8_t> buffer) override
        {
            if (fail_next_)
            {
                fail_next_ = false;
                ++faults_;
                return Error::io_fault(std::make_error_code(fault_));
            }
            fail_next_ = true;
            if (buffer.empty() || position_ == data_.size())
            {
                return std::size_t{0};
            }
            buffer[0] = data_[position_++];
            return std::size_t{1};
        }

        std::size_t faults() const noexcept
        {
            return faults_;
        }

    private:
        std::span<const std::uint8_t> data_;
        std::errc fault_;
        std::size_t position_{0};
        std::size_t faults_{0};
        bool fail_next_{true};
    };

    class FlakySink final : public ByteSink
    {
    public:
        explicit FlakySink(std::errc fault) : fault_(fault) {}

        Result<std::size_t> write(std::span<const std::uint8_t> bytes) override
        {
            if (fail_next_)
            {
                fail_next_ = false;
                ++faults_;
                return Error::io_fault(std::make_error_code(fault_));
            }
            fail_next_ = true;
            if (bytes.empty())
            {
                return std::size_t{0};
            }
            written_.push_back(bytes[0]);
            return std::size_t{1};
        }

        const std::vector<std::uint8_t> &written() const noexcept
        {
            return written_;
        }

        std::size_t faults() const noexcept
        {
            return faults_;
        }

    private:
        std::errc fault_;
        std::vector<std::uint8_t> written_;
        std::size_t faults_{0};
        bool fail_next_{true};
    };

    void test_interrupted_io_is_retried()
    {
        const auto bytes = hex("ce 00 01 88 94");
        {
            FlakySource source(bytes, std::errc::interrupted);
            assert(read_int<std::uint32_t>(source).value() == 100500);
            assert(source.faults() == bytes.size());
        }
        {
            FlakySink sink(std::errc::interrupted);
            const auto marker = write_str(sink, "hello");
            assert(marker && *marker == Marker::fix_str(5));
            assert(sink.written() == concat(hex("a5"), ascii("hello")));
            assert(sink.faults() == 6);
        }
        {
            FlakySource source(bytes, std::errc::connection_reset);
            const auto failed = read_int<std::uint32_t>(source);
            assert(failed.code() == ErrorCode::IoFault);
            assert(failed.error().io_error == std::errc::connection_reset);
            assert(source.faults() == 1);
        }
        {
            FlakySink sink(std::errc::broken_pipe);
            const auto failed = write_str(sink, "hello");
            assert(failed.code() == ErrorCode::IoFault);
            assert(failed.error().io_error == std::errc::broken_pipe);
            assert(sink.written().empty());
        }
    }

    void test_stream_io()
    {
        std::ostringstream out;
        StreamSink sink(out);
        assert(write_str(sink, "hi"));
        assert(write_uint(sink, 300));
        assert(sink.flush());

        std::istringstream in(out.str());
        StreamSource source(in);
        assert(read_str(source).value() == "hi");
        assert(read_int<std::uint16_t>(source).value() == 300);
        assert(read_marker(source).code() == ErrorCode::InsufficientData);
    }

} // namespace

int main()
{
    try
    {
        test_marker_bijection();
        test_minimal_unsigned();
        test_minimal_signed();
        test_explicit_widths();
        test_length_headers();
        test_payload_writers();
        test_typed_readers();
        test_loose_integer_reads();
        test_reserved_marker();
        test_string_reads();
        test_binary_and_lengths();
        test_timestamps();
        test_sink_faults();
        test_stream_io();
        test_interrupted_io_is_retried();
        run_message_len_tests();
        run_value_tests();
        run_framing_tests();
        run_support_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
