#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

using namespace Catch;

namespace {

    template<class T>
    T decode_ok(std::string_view json, T start = T{}) {
        auto res = Stanza::unmarshal(json, start);
        if (!res) FAIL(res.error().msg);
        return start;
    }

    template<class T>
    Stanza::Error decode_fail(std::string_view json) {
        T out{};
        auto res = Stanza::unmarshal(json, out);
        REQUIRE_FALSE(res);
        return res.error();
    }

}

TEST_CASE("Decode Scalars") {
    REQUIRE(decode_ok<bool>("true") == true);
    REQUIRE(decode_ok<bool>("false", true) == false);
    REQUIRE(decode_ok<std::int8_t>("-128") == -128);
    REQUIRE(decode_ok<std::int16_t>("-32768") == -32768);
    REQUIRE(decode_ok<std::int32_t>("123") == 123);
    REQUIRE(decode_ok<std::int64_t>("-9223372036854775808") == INT64_MIN);
    REQUIRE(decode_ok<std::uint8_t>("255") == 255);
    REQUIRE(decode_ok<std::uint16_t>("65535") == 65535);
    REQUIRE(decode_ok<std::uint32_t>("4294967295") == 4294967295u);
    REQUIRE(decode_ok<std::uint64_t>("18446744073709551615") == UINT64_MAX);
    REQUIRE(decode_ok<float>("1.25") == Approx(1.25f));
    REQUIRE(decode_ok<double>("1.23") == Approx(1.23));
    REQUIRE(decode_ok<double>("-4e-2") == Approx(-0.04));
    REQUIRE(decode_ok<std::string>(R"("hello \"world\"")") == "hello \"world\"");
}

TEST_CASE("Decode Scalar Errors Leave Destination Untouched") {
    std::int32_t n = 7;
    auto res = Stanza::unmarshal("\"seven\"", n);
    REQUIRE_FALSE(res);
    REQUIRE(n == 7);

    std::uint8_t small = 1;
    res = Stanza::unmarshal("256", small);
    REQUIRE_FALSE(res);
    REQUIRE(res.error().errc == Stanza::Error::code::invalid_number);
    REQUIRE(small == 1);

    REQUIRE(decode_fail<std::int32_t>("1.5").errc == Stanza::Error::code::invalid_number);
    REQUIRE(decode_fail<std::uint32_t>("-1").errc == Stanza::Error::code::invalid_number);
    REQUIRE(decode_fail<bool>("1").errc == Stanza::Error::code::unexpected_character);
    REQUIRE(decode_fail<std::int32_t>("1 2").errc == Stanza::Error::code::trailing_characters);
}

TEST_CASE("Decode Sequences") {
    auto v = decode_ok<std::vector<int>>("[1, 2, 3]");
    REQUIRE(v == std::vector<int>{ 1, 2, 3 });

    // Existing content is replaced, not appended to
    v = decode_ok<std::vector<int>>("[9]", std::vector<int>{ 4, 5, 6 });
    REQUIRE(v == std::vector<int>{ 9 });

    auto empty = decode_ok<std::vector<int>>("[]", std::vector<int>{ 1 });
    REQUIRE(empty.empty());

    auto cleared = decode_ok<std::vector<int>>("null", std::vector<int>{ 1, 2 });
    REQUIRE(cleared.empty());

    auto nested = decode_ok<std::vector<std::vector<std::string>>>(R"([["a"], [], ["b", "c"]])");
    REQUIRE(nested.size() == 3);
    REQUIRE(nested[0] == std::vector<std::string>{ "a" });
    REQUIRE(nested[1].empty());
    REQUIRE(nested[2] == std::vector<std::string>{ "b", "c" });
}

TEST_CASE("Decode Sequence Stops At First Bad Element") {
    std::vector<int> v;
    Stanza::reader r{ "[1, 2, \"three\", 4]" };
    Stanza::decode(&v, r);
    REQUIRE(r.failed());
    REQUIRE(v.size() >= 2);
    REQUIRE(v[0] == 1);
    REQUIRE(v[1] == 2);

    REQUIRE(decode_fail<std::vector<int>>("{}").errc == Stanza::Error::code::unexpected_value_kind);
}

TEST_CASE("Decode Maps") {
    auto m = decode_ok<std::map<std::string, int>>(R"({"a": 1, "b": 2, "a": 3})");
    REQUIRE(m.size() == 2);
    REQUIRE(m.at("a") == 3);
    REQUIRE(m.at("b") == 2);

    // Entries merge into an existing map
    auto merged = decode_ok<std::unordered_map<std::string, std::string>>(
        R"({"y": "new"})", std::unordered_map<std::string, std::string>{ { "x", "old" }, { "y", "old" } });
    REQUIRE(merged.size() == 2);
    REQUIRE(merged.at("x") == "old");
    REQUIRE(merged.at("y") == "new");

    auto cleared = decode_ok<std::map<std::string, int>>("null", std::map<std::string, int>{ { "a", 1 } });
    REQUIRE(cleared.empty());

    auto nested = decode_ok<std::map<std::string, std::vector<double>>>(R"({"xs": [1.5, 2.5], "": []})");
    REQUIRE(nested.size() == 2);
    REQUIRE(nested.at("xs").size() == 2);
    REQUIRE(nested.at("").empty());

    REQUIRE(decode_fail<std::map<std::string, int>>("[1]").errc == Stanza::Error::code::unexpected_value_kind);
}

TEST_CASE("Decode Map Value Error Skips Insert") {
    std::map<std::string, int> m;
    Stanza::reader r{ R"({"ok": 1, "bad": "x", "later": 2})" };
    Stanza::decode(&m, r);
    REQUIRE(r.failed());
    REQUIRE(m.size() == 1);
    REQUIRE(m.contains("ok"));
}

TEST_CASE("Decode Rejects Stray Openers") {
    std::vector<int> v;
    auto res = Stanza::unmarshal("[1[2[3]", v);
    REQUIRE_FALSE(res);
    REQUIRE(res.error().errc == Stanza::Error::code::unexpected_character);

    std::map<std::string, int> m;
    REQUIRE_FALSE(Stanza::unmarshal(R"({"x":1{"y":2})", m));

    std::vector<std::vector<int>> nested;
    REQUIRE_FALSE(Stanza::unmarshal("[[1][2]]", nested));
    REQUIRE(Stanza::unmarshal("[[1],[2]]", nested));
    REQUIRE(nested.size() == 2);

    REQUIRE_FALSE(Stanza::parse("[1[2]"));
    REQUIRE_FALSE(Stanza::parse(R"({"a":1{"b":2}})"));
}

TEST_CASE("Decode Optionals") {
    SECTION("unique_ptr") {
        auto p = decode_ok<std::unique_ptr<int>>("5");
        REQUIRE(p);
        REQUIRE(*p == 5);

        auto null = decode_ok<std::unique_ptr<int>>("null", std::make_unique<int>(1));
        REQUIRE_FALSE(null);
    }

    SECTION("optional") {
        auto o = decode_ok<std::optional<std::string>>("\"x\"");
        REQUIRE(o == "x");

        auto null = decode_ok<std::optional<std::string>>("null", std::optional<std::string>{ "y" });
        REQUIRE_FALSE(null.has_value());
    }

    SECTION("existing storage is reused") {
        auto p = std::make_unique<std::int64_t>(1);
        const std::int64_t* before = p.get();
        REQUIRE(Stanza::unmarshal("42", p));
        REQUIRE(p.get() == before);
        REQUIRE(*p == 42);
    }

    SECTION("nested optionals") {
        auto v = decode_ok<std::vector<std::optional<int>>>("[1, null, 3]");
        REQUIRE(v.size() == 3);
        REQUIRE(v[0] == 1);
        REQUIRE_FALSE(v[1].has_value());
        REQUIRE(v[2] == 3);
    }
}

TEST_CASE("Decode Into Any") {
    auto v = decode_ok<Stanza::any>(R"({"n": -1, "xs": [1, 2.5]})");
    REQUIRE(v.at("n").as_int64() == -1);
    REQUIRE(v.at("xs")[0].as_uint64() == 1u);
    REQUIRE(v.at("xs")[1].as_float64() == Approx(2.5));

    auto m = decode_ok<std::map<std::string, Stanza::any>>(R"({"a": "s", "b": null})");
    REQUIRE(m.at("a").as_text() == "s");
    REQUIRE(m.at("b").is_null());
}

TEST_CASE("Decode From Stream") {
    std::istringstream is{ R"({"values": [10, 20, 30, 40, 50]})" };
    std::map<std::string, std::vector<std::uint16_t>> m;
    auto res = Stanza::unmarshal(is, m, { .buffer_size = 5 });
    REQUIRE(res);
    REQUIRE(m.at("values") == std::vector<std::uint16_t>{ 10, 20, 30, 40, 50 });
}

TEST_CASE("Decode Entry Point") {
    SECTION("non-pointer root is an invalid target") {
        int n = 0;
        Stanza::reader r{ "1" };
        Stanza::decode(Stanza::descriptor_of<int>(), &n, r);
        REQUIRE(r.failed());
        REQUIRE(r.error()->errc == Stanza::Error::code::invalid_target);
        REQUIRE(Stanza::compile(Stanza::descriptor_of<int>()).error().errc == Stanza::Error::code::invalid_target);
    }

    SECTION("null destination is an invalid target") {
        Stanza::reader r{ "1" };
        Stanza::decode(Stanza::descriptor_of<int*>(), nullptr, r);
        REQUIRE(r.error()->errc == Stanza::Error::code::invalid_target);
    }

    SECTION("failed reader is left untouched") {
        int n = 3;
        Stanza::reader r{ "5" };
        r.report_error(Stanza::Error::code::io_error, "earlier failure");
        Stanza::decode(&n, r);
        REQUIRE(n == 3);
        REQUIRE(r.error()->errc == Stanza::Error::code::io_error);

        r.clear_error();
        Stanza::decode(&n, r);
        REQUIRE_FALSE(r.failed());
        REQUIRE(n == 5);
    }

    SECTION("several values from one reader") {
        Stanza::reader r{ "1 [2] \"three\"" };
        int a = 0;
        std::vector<int> b;
        std::string c;
        Stanza::decode(&a, r);
        Stanza::decode(&b, r);
        Stanza::decode(&c, r);
        r.expect_end();
        REQUIRE_FALSE(r.failed());
        REQUIRE(a == 1);
        REQUIRE(b == std::vector<int>{ 2 });
        REQUIRE(c == "three");
    }
}

TEST_CASE("Unsupported Shapes") {
    SECTION("function-like destination") {
        auto err = decode_fail<std::function<void()>>("1");
        REQUIRE(err.errc == Stanza::Error::code::unsupported_type);
        REQUIRE(err.msg.starts_with("ptr: unsupported type"));
    }

    SECTION("breadcrumbs name the nested shape") {
        auto err = decode_fail<std::vector<std::map<std::string, std::function<void()>>>>("[]");
        REQUIRE(err.errc == Stanza::Error::code::unsupported_type);
        REQUIRE(err.msg.starts_with("ptr: [slice]: [map]: unsupported type"));

        auto opt = decode_fail<std::optional<void (*)()>>("null");
        REQUIRE(opt.errc == Stanza::Error::code::unsupported_type);
        REQUIRE(opt.msg.starts_with("ptr: [optional]: "));
    }

    SECTION("non-text map keys") {
        auto err = decode_fail<std::map<int, int>>("{}");
        REQUIRE(err.errc == Stanza::Error::code::unsupported_key_type);
        REQUIRE(err.msg.starts_with("ptr: [map]: "));
    }

    SECTION("nested raw pointers own nothing") {
        auto err = decode_fail<std::vector<int*>>("[]");
        REQUIRE(err.errc == Stanza::Error::code::unsupported_type);
    }

    SECTION("vector<bool> has no addressable elements") {
        auto err = decode_fail<std::vector<bool>>("[true]");
        REQUIRE(err.errc == Stanza::Error::code::unsupported_type);
    }
}
