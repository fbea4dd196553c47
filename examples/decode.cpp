#include <print>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "stanza/stanza.hpp"

class Player {
    std::string name;
    std::int64_t score = 0;
    std::vector<std::string> tags;
    std::unique_ptr<std::string> team;

public:
    static void describe(Stanza::struct_builder<Player>& b) {
        b.name("Player");
        b.field("name", &Player::name);
        b.field("score", &Player::score, "points,string");
        b.field("tags", &Player::tags);
        b.field("team", &Player::team);
    }

    void print() const {
        std::println("{} ({} points, team {}, {} tags)", name, score, team ? *team : "none", tags.size());
    }
};

int main(int argc, char** argv) {
    std::vector<Player> players;
    auto res = Stanza::unmarshal(R"([
        {"name": "Zetta", "points": "27", "tags": ["c++", "json"], "team": "red"},
        {"name": "Bite", "points": "3", "team": null, "unknown": {"ignored": true}}
    ])", players);
    if (!res) {
        std::println("Decode error! -> {}", res.error().msg);
        return 1;
    }
    for (const auto& p : players) p.print();

    auto doc = Stanza::parse(R"({"n": -1, "u": 1, "f": 1.5, "list": [null, true]})");
    if (!doc) {
        std::println("Parse error! -> {}", doc.error().msg);
        return 1;
    }
    std::println("n={} u={} f={} list={}", doc->at("n").as_int64(), doc->at("u").as_uint64(),
                 doc->at("f").as_float64(), doc->at("list").size());

    // Unsupported shapes fail at compile time with a breadcrumb trail
    std::vector<std::map<int, int>> bad;
    if (auto err = Stanza::unmarshal("[]", bad); !err)
        std::println("Expected failure -> {}: {}", Stanza::to_string(err.error().errc), err.error().msg);

    if (argc < 2) return 0;

    std::ifstream ifs(argv[1]);
    if (!ifs) {
        std::println("Failed to open file");
        return -1;
    }

    std::vector<Player> from_file;
    auto file_r = Stanza::unmarshal(ifs, from_file, { .allow_comments = true });
    if (!file_r) {
        std::println("Decode error! -> {} (line {}, column {})", file_r.error().msg, file_r.error().line, file_r.error().column);
        return 1;
    }
    for (const auto& p : from_file) p.print();

    return 0;
}
