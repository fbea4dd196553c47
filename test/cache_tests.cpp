#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace Catch;

namespace {

    struct Sample {
        std::int64_t id = 0;
        std::vector<std::string> names;
        std::map<std::string, double> weights;
        static void describe(Stanza::struct_builder<Sample>& b) {
            b.name("Sample");
            b.field("id", &Sample::id);
            b.field("names", &Sample::names);
            b.field("weights", &Sample::weights);
        }
    };

    struct Opaque {
        std::function<void()> callback;
        static void describe(Stanza::struct_builder<Opaque>& b) {
            b.name("Opaque");
            b.field("callback", &Opaque::callback);
        }
    };

}

TEST_CASE("Decode Populates The Cache Once") {
    Stanza::clear_decoder_cache();
    const auto* key = Stanza::descriptor_of<Sample>();
    REQUIRE_FALSE(Stanza::global_cache().lookup(key));

    Sample s;
    REQUIRE(Stanza::unmarshal(R"({"id": 1})", s));
    Stanza::decoder_ptr first = Stanza::global_cache().lookup(key);
    REQUIRE(first);

    REQUIRE(Stanza::unmarshal(R"({"id": 2})", s));
    REQUIRE(Stanza::global_cache().lookup(key) == first);
    REQUIRE(s.id == 2);

    // Only the root pointee is cached, not its nested shapes
    REQUIRE_FALSE(Stanza::global_cache().lookup(Stanza::descriptor_of<std::vector<std::string>>()));
}

TEST_CASE("Compile Failures Are Not Cached") {
    Stanza::clear_decoder_cache();

    for (int attempt = 0; attempt < 3; attempt++) {
        Opaque o;
        auto res = Stanza::unmarshal("{}", o);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().errc == Stanza::Error::code::unsupported_type);
        REQUIRE(res.error().msg.starts_with("ptr: Opaque.callback: unsupported type"));
        REQUIRE_FALSE(Stanza::global_cache().lookup(Stanza::descriptor_of<Opaque>()));
    }
    REQUIRE(Stanza::global_cache().size() == 0);
}

TEST_CASE("Cache Insert Keeps The First Decoder") {
    Stanza::decoder_cache cache;
    const auto* key = Stanza::descriptor_of<std::int32_t>();
    auto a = Stanza::compile(Stanza::descriptor_of<std::int32_t*>());
    auto b = Stanza::compile(Stanza::descriptor_of<std::int32_t*>());
    REQUIRE(a);
    REQUIRE(b);

    cache.insert(key, *a);
    cache.insert(key, *b);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.lookup(key) == *a);

    cache.clear();
    REQUIRE(cache.size() == 0);
    REQUIRE_FALSE(cache.lookup(key));
}

TEST_CASE("Concurrent Inserts Are Not Lost") {
    constexpr size_t thread_count = 8;
    constexpr size_t per_thread = 32;

    Stanza::decoder_cache cache;
    std::vector<Stanza::type_descriptor> keys(thread_count * per_thread);
    auto dec = Stanza::compile(Stanza::descriptor_of<bool*>());
    REQUIRE(dec);

    std::vector<std::thread> threads;
    for (size_t t = 0; t < thread_count; t++) {
        threads.emplace_back([&, t] {
            for (size_t i = 0; i < per_thread; i++) {
                cache.insert(&keys[t * per_thread + i], *dec);
                // Readers run alongside writers
                (void)cache.lookup(&keys[(t * per_thread + i * 7) % keys.size()]);
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(cache.size() == keys.size());
    for (const auto& k : keys) REQUIRE(cache.lookup(&k) == *dec);
}

TEST_CASE("Concurrent First Use") {
    Stanza::clear_decoder_cache();

    constexpr size_t thread_count = 16;
    std::atomic<bool> go{ false };
    std::vector<Sample> results(thread_count);
    std::vector<std::string> errors(thread_count);

    std::vector<std::thread> threads;
    for (size_t t = 0; t < thread_count; t++) {
        threads.emplace_back([&, t] {
            while (!go.load()) std::this_thread::yield();
            std::string json = R"({"id": )" + std::to_string(t) + R"(, "names": ["n"], "weights": {"w": 0.5}})";
            for (int round = 0; round < 50; round++) {
                auto res = Stanza::unmarshal(json, results[t]);
                if (!res) {
                    errors[t] = res.error().msg;
                    return;
                }
            }
        });
    }
    go.store(true);
    for (auto& th : threads) th.join();

    // Catch assertions are not thread-safe; check after joining
    for (size_t t = 0; t < thread_count; t++) {
        REQUIRE(errors[t].empty());
        REQUIRE(results[t].id == static_cast<std::int64_t>(t));
        REQUIRE(results[t].names == std::vector<std::string>{ "n" });
        REQUIRE(results[t].weights.at("w") == Approx(0.5));
    }
    REQUIRE(Stanza::global_cache().lookup(Stanza::descriptor_of<Sample>()));
}
