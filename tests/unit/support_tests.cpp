#include <array>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "minipack/config.hpp"
#include "minipack/decode.hpp"
#include "minipack/encode.hpp"
#include "minipack/encoding/base64.hpp"
#include "minipack/inspect/config.hpp"
#include "minipack/json.hpp"
#include "minipack/shape.hpp"
#include "minipack/timestamp.hpp"
#include "minipack/version.hpp"
#include "test_support.hpp"

using namespace minipack;
using minipack::test::ascii;
using minipack::test::concat;
using minipack::test::hex;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void test_error_values()
    {
        assert(to_string(ErrorCode::FragmentedInput) == "fragmented_input");
        assert(to_string(ErrorCode::Ok) == "ok");
        assert(to_int(ErrorCode::InvalidTimestamp) == 11);

        const auto mismatch = Error::type_mismatch(Marker::fix_str(2));
        assert(mismatch.code == ErrorCode::TypeMismatch);
        assert(mismatch.describe() == "type_mismatch: unexpected marker FixStr(2)");

        Result<int> failed = Error::insufficient_data();
        assert(!failed && failed.code() == ErrorCode::InsufficientData);
        bool thrown = false;
        try
        {
            static_cast<void>(failed.value());
        }
        catch (const BadResultAccess &ex)
        {
            thrown = true;
            assert(ex.error().code == ErrorCode::InsufficientData);
        }
        assert(thrown);

        Result<void> ok;
        assert(ok && ok.code() == ErrorCode::Ok);
        ok.value();
    }

    void test_base64()
    {
        assert(encoding::encode_base64(ascii("")).empty());
        assert(encoding::encode_base64(ascii("f")) == "Zg==");
        assert(encoding::encode_base64(ascii("fo")) == "Zm8=");
        assert(encoding::encode_base64(ascii("foo")) == "Zm9v");
        assert(encoding::encode_base64(ascii("foobar")) == "Zm9vYmFy");
        assert(encoding::encode_base64(hex("ff fe fd")) == "//79");
    }

    void test_json_rendering()
    {
        const Value record(Value::Map{
            {"name", "sensor"},
            {"count", 3},
            {"delta", -2},
            {"ratio", 0.5},
            {"tags", Value::Array{"a", Nil{}, false}},
            {"blob", Binary{1, 2, 3}},
        });
        assert(to_json_value(record).dump() ==
               R"({"name":"sensor","count":3,"delta":-2,"ratio":0.5,"tags":["a",null,false],"blob":"AQID"})");

        const Value duplicates(Value::Map{{"k", 1}, {"k", 2}});
        assert(to_json_value(duplicates).dump() == R"([["k",1],["k",2]])");

        const Value numeric_keys(Value::Map{{1, "one"}});
        assert(to_json_value(numeric_keys).dump() == R"([[1,"one"]])");

        const Value stamp(Ext{kTimestampExtType, {0x66, 0xc1, 0xde, 0x7c}});
        assert(to_json_value(stamp).dump() ==
               R"({"type":-1,"data":"ZsHefA==","timestamp":{"seconds":1723981436,"nanoseconds":0}})");

        const Value opaque(Ext{5, {0x61, 0x62, 0x63}});
        assert(to_json_value(opaque).dump() == R"({"type":5,"data":"YWJj"})");

        assert(to_json_value(Value(std::uint64_t{0xffff'ffff'ffff'ffff})).dump() == "18446744073709551615");
    }

    void test_struct_shapes()
    {
        {
            BufferSink sink;
            StructWriter writer(sink, tuple_shape());
            assert(writer.begin(2));
            assert(writer.field("id", Value(7)));
            assert(writer.field("name", Value("x")));
            assert(sink.bytes() == hex("92 07 a1 78"));

            SliceSource source(sink.bytes());
            const auto header = read_struct_header(source);
            assert(header && header->field_count == 2 && !header->named);
        }
        {
            BufferSink sink;
            StructWriter writer(sink, shape_for(StructShape::Map));
            assert(writer.begin(2));
            assert(writer.field("id", Value(7)));
            assert(writer.field("name"));
            assert(write_str(sink, "x"));
            const auto expected =
                concat(concat(concat(hex("82 a2"), ascii("id")), hex("07 a4")), concat(ascii("name"), hex("a1 78")));
            assert(sink.bytes() == expected);

            SliceSource source(sink.bytes());
            const auto header = read_struct_header(source);
            assert(header && header->field_count == 2 && header->named);
            assert(read_str(source).value() == "id");
        }
        {
            // A caller-supplied shape: every field value is preceded by its position.
            std::uint8_t position = 0;
            ContainerShape indexed{
                .write_container_len = [](ByteSink &sink, std::uint32_t count) { return write_map_len(sink, count); },
                .write_field = [&position](ByteSink &sink, std::string_view) -> Result<void>
                {
                    if (auto outcome = write_pfix(sink, position++); !outcome)
                    {
                        return std::move(outcome).error();
                    }
                    return {};
                },
            };
            BufferSink sink;
            StructWriter writer(sink, indexed);
            assert(writer.begin(2));
            assert(writer.field("id", Value(7)));
            assert(writer.field("name", Value(true)));
            assert(sink.bytes() == hex("82 00 07 01 c3"));
        }
        {
            std::array<std::uint8_t, 2> storage{};
            SpanSink sink(storage);
            StructWriter writer(sink, map_shape());
            assert(writer.begin(1));
            assert(writer.field("long name").code() == ErrorCode::IoFault);
        }
        {
            const auto bytes = hex("c0");
            SliceSource source(bytes);
            const auto header = read_struct_header(source);
            assert(header.code() == ErrorCode::TypeMismatch);
            assert(header.error().marker == Marker(Marker::Kind::Null));
        }
    }

    void test_codec_config()
    {
        assert(to_string(StructShape::Map) == "map");
        assert(struct_shape_from_string("tuple") == StructShape::Tuple);
        assert(!struct_shape_from_string("columns"));

        const CodecConfig config{
            .limits = Limits{.max_depth = 16, .max_len = 1024, .max_size = 4096},
            .struct_shape = StructShape::Map,
        };
        const nlohmann::json json = config;
        assert(json["limits"]["max_depth"] == 16);
        assert(json["struct_shape"] == "map");

        const auto decoded = json.get<CodecConfig>();
        assert(decoded.limits == config.limits);
        assert(decoded.struct_shape == StructShape::Map);

        const auto defaults = nlohmann::json::object().get<CodecConfig>();
        assert(defaults.limits == Limits{});
        assert(defaults.struct_shape == StructShape::Tuple);

        const auto partial = nlohmann::json::parse(R"({"limits":{"max_depth":8}})").get<CodecConfig>();
        assert(partial.limits.max_depth == 8);
        assert(partial.limits.max_size == Limits{}.max_size);

        bool rejected = false;
        try
        {
            static_cast<void>(nlohmann::json::parse(R"({"struct_shape":"columns"})").get<CodecConfig>());
        }
        catch (const std::runtime_error &)
        {
            rejected = true;
        }
        assert(rejected);
    }

    void test_config_files()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "minipack_config_test";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root);

        const auto path = temp_root / "codec.json";
        {
            std::ofstream file(path);
            file << R"({"limits":{"max_depth":32,"max_size":65536},"struct_shape":"map"})";
        }
        const auto loaded = load_config(path);
        assert(loaded.limits.max_depth == 32);
        assert(loaded.limits.max_size == 65536);
        assert(loaded.struct_shape == StructShape::Map);

        const auto broken = temp_root / "broken.json";
        {
            std::ofstream file(broken);
            file << "{ not json";
        }
        bool parse_failed = false;
        try
        {
            static_cast<void>(load_config(broken));
        }
        catch (const std::runtime_error &)
        {
            parse_failed = true;
        }
        assert(parse_failed);

        bool open_failed = false;
        try
        {
            static_cast<void>(load_config(temp_root / "missing.json"));
        }
        catch (const std::runtime_error &)
        {
            open_failed = true;
        }
        assert(open_failed);

        std::vector<std::string> args{"minipack-inspect", "--config", path.string(), "--max-depth", "4", "-"};
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        const auto options = inspect::parse_arguments(static_cast<int>(argv.size()), argv.data());
        const auto resolved = inspect::resolve_codec_config(options);
        assert(resolved.limits.max_depth == 4);
        assert(resolved.limits.max_size == 65536);
        assert(resolved.struct_shape == StructShape::Map);

        cleanup_path(temp_root);
    }

    inspect::InspectConfig parse(std::vector<std::string> args)
    {
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return inspect::parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            static_cast<void>(parse(std::move(args)));
        }
        catch (const std::exception &)
        {
            return true;
        }
        return false;
    }

    void test_inspect_arguments()
    {
        const auto remote = parse({"minipack-inspect", "--connect", "localhost:9000", "--max-size", "1024", "-v"});
        assert(remote.host == "localhost");
        assert(remote.port == 9000);
        assert(remote.max_size == 1024u);
        assert(remote.verbose);
        assert(!remote.input);

        const auto local = parse({"minipack-inspect", "dump.bin", "--log", "inspect.log"});
        assert(local.input == std::filesystem::path("dump.bin"));
        assert(local.log_path == std::filesystem::path("inspect.log"));
        assert(!local.host);

        assert(parse({"minipack-inspect", "--help"}).show_help);

        assert(parse_fails({"minipack-inspect", "--bogus"}));
        assert(parse_fails({"minipack-inspect", "--log"}));
        assert(parse_fails({"minipack-inspect", "--connect", "nohost"}));
        assert(parse_fails({"minipack-inspect", "--connect", "host:70000"}));
        assert(parse_fails({"minipack-inspect", "a.bin", "b.bin"}));
        assert(parse_fails({"minipack-inspect", "a.bin", "--connect", "host:1"}));

        const auto defaults = inspect::resolve_codec_config(parse({"minipack-inspect"}));
        assert(defaults.limits == Limits{});
        assert(!version().empty());
    }

} // namespace

void run_support_tests()
{
    test_error_values();
    test_base64();
    test_json_rendering();
    test_struct_shapes();
    test_codec_config();
    test_config_files();
    test_inspect_arguments();
}
