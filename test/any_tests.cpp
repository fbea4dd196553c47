#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"

#include <memory_resource>
#include <sstream>
#include <string>

using namespace Catch;

namespace {

    Stanza::any parse_ok(std::string_view s, const Stanza::ReaderOptions& opts = {}) {
        auto res = Stanza::parse(s, opts);
        REQUIRE(res);
        return std::move(*res);
    }

    void expect_fail(std::string_view s, Stanza::Error::code code) {
        auto res = Stanza::parse(s);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().errc == code);
    }

}

TEST_CASE("Any Number Classification") {
    auto neg = parse_ok("-42");
    REQUIRE(neg.is_int64());
    REQUIRE(neg.as_int64() == -42);

    auto pos = parse_ok("42");
    REQUIRE(pos.is_uint64());
    REQUIRE(pos.as_uint64() == 42u);

    auto frac = parse_ok("1.5");
    REQUIRE(frac.is_float64());
    REQUIRE(frac.as_float64() == Approx(1.5));

    auto exp = parse_ok("1e3");
    REQUIRE(exp.is_float64());
    REQUIRE(exp.as_float64() == Approx(1000.0));

    auto big = parse_ok("18446744073709551615");
    REQUIRE(big.as_uint64() == 18446744073709551615ull);

    auto neg_exp = parse_ok("-2E-2");
    REQUIRE(neg_exp.is_float64());
    REQUIRE(neg_exp.as_float64() == Approx(-0.02));
}

TEST_CASE("Any Containers") {
    auto seq = parse_ok("[1,2,3]");
    REQUIRE(seq.is_sequence());
    REQUIRE(seq.size() == 3);
    for (size_t i = 0; i < 3; i++) {
        REQUIRE(seq[i].is_uint64());
        REQUIRE(seq[i].as_uint64() == i + 1);
    }

    auto obj = parse_ok(R"({"a":1})");
    REQUIRE(obj.is_mapping());
    REQUIRE(obj.size() == 1);
    REQUIRE(obj.at("a").as_uint64() == 1u);
    REQUIRE(obj.find("b") == nullptr);
    REQUIRE_THROWS_AS(obj.at("b"), std::out_of_range);

    auto nested = parse_ok(R"({"k": [null, true, "x", {"y": -1.25}]})");
    const auto& inner = nested.at("k");
    REQUIRE(inner[0].is_null());
    REQUIRE(inner[1].as_bool());
    REQUIRE(inner[2].as_text() == "x");
    REQUIRE(inner[3].at("y").as_float64() == Approx(-1.25));
}

TEST_CASE("Any Duplicate Keys Keep Last") {
    auto obj = parse_ok(R"({"a":1,"a":2})");
    REQUIRE(obj.size() == 1);
    REQUIRE(obj.at("a").as_uint64() == 2u);
}

TEST_CASE("Any Typed Accessors Throw On Mismatch") {
    auto v = parse_ok("\"text\"");
    REQUIRE(v.as_text() == "text");

    REQUIRE_THROWS_AS(v.as_int64(), Stanza::bad_any_access);
    REQUIRE_THROWS_AS(v.as_uint64(), Stanza::bad_any_access);
    REQUIRE_THROWS_AS(v.as_float64(), Stanza::bad_any_access);
    REQUIRE_THROWS_AS(v.as_bool(), Stanza::bad_any_access);
    REQUIRE_THROWS_AS(v.as_sequence(), Stanza::bad_any_access);
    REQUIRE_THROWS_AS(v.as_mapping(), Stanza::bad_any_access);

    try {
        (void)v.as_int64();
        FAIL("as_int64 did not throw");
    } catch (const Stanza::bad_any_access& e) {
        REQUIRE(e.error().errc == Stanza::Error::code::type_mismatch);
    }

    // The classification is never revisited: a signed literal is not a uint64
    auto neg = parse_ok("-1");
    REQUIRE_THROWS_AS(neg.as_uint64(), Stanza::bad_any_access);
}

TEST_CASE("Any Equality And Copies") {
    auto a = parse_ok(R"({"x":[1,2],"y":"z"})");
    auto b = parse_ok(R"({"y":"z","x":[1,2]})");
    REQUIRE(a == b);

    Stanza::any copy = a;
    REQUIRE(copy == a);
    copy.as_mapping().erase(copy.as_mapping().find("y"));
    REQUIRE_FALSE(copy == a);
    REQUIRE(a.size() == 2);

    REQUIRE(Stanza::any{ std::int64_t{ 1 } } != Stanza::any{ std::uint64_t{ 1 } });
}

TEST_CASE("Any Uses Memory Resource") {
    std::pmr::monotonic_buffer_resource pool;
    Stanza::reader r{ R"({"key": ["a string long enough to allocate on the heap"]})" };
    Stanza::any v = Stanza::parse_any(r, &pool);
    REQUIRE_FALSE(r.failed());
    REQUIRE(v.resource() == &pool);
    REQUIRE(v.as_mapping().get_allocator().resource() == &pool);
    REQUIRE(v.at("key")[0].as_text().get_allocator().resource() == &pool);
}

TEST_CASE("Any Assignment Adopts The Source Resource") {
    std::pmr::monotonic_buffer_resource first;
    std::pmr::monotonic_buffer_resource second;
    auto parse_into = [](std::pmr::memory_resource* res) {
        Stanza::reader r{ R"({"list": [1, 2], "name": "a string long enough to allocate on the heap"})" };
        return Stanza::parse_any(r, res);
    };

    SECTION("copy") {
        Stanza::any dest = parse_into(&first);
        const Stanza::any src = parse_into(&second);
        dest = src;
        REQUIRE(dest == src);
        REQUIRE(dest.resource() == &second);
        REQUIRE(dest.as_mapping().get_allocator().resource() == &second);
    }

    SECTION("move") {
        Stanza::any dest = parse_into(&first);
        Stanza::any src = parse_into(&second);
        dest = std::move(src);
        REQUIRE(dest.resource() == &second);
        REQUIRE(dest.as_mapping().get_allocator().resource() == &second);
        REQUIRE(dest.at("list").size() == 2);
    }

    SECTION("from a nested value") {
        Stanza::any dest = parse_into(&first);
        dest = std::move(dest.as_mapping().find("list")->second);
        REQUIRE(dest.is_sequence());
        REQUIRE(dest.size() == 2);
        REQUIRE(dest[1].as_uint64() == 2u);
        REQUIRE(dest.as_sequence().get_allocator().resource() == &first);
    }
}

TEST_CASE("Any Number Scanner Spans Refills") {
    std::istringstream is{ "[123456789012, -98765, 3.14159265]" };
    auto res = Stanza::parse(is, { .buffer_size = 4 });
    REQUIRE(res);
    REQUIRE((*res)[0].as_uint64() == 123456789012ull);
    REQUIRE((*res)[1].as_int64() == -98765);
    REQUIRE((*res)[2].as_float64() == Approx(3.14159265));
}

TEST_CASE("Any Parse Errors") {
    expect_fail("18446744073709551616", Stanza::Error::code::malformed_number);
    expect_fail("-", Stanza::Error::code::malformed_number);
    expect_fail("1.2.3", Stanza::Error::code::malformed_number);
    expect_fail("[1,2", Stanza::Error::code::unexpected_end_of_input);
    expect_fail("{\"a\" 1}", Stanza::Error::code::unexpected_character);
    expect_fail("1 2", Stanza::Error::code::trailing_characters);
    expect_fail("", Stanza::Error::code::unexpected_end_of_input);

    // A bad element stops the whole container
    Stanza::reader r{ "[1, -, 3]" };
    auto v = Stanza::parse_any(r);
    REQUIRE(r.failed());
    REQUIRE(v.is_null());
}
