#include <tabula/core/relation.hpp>
#include <tabula/runtime/ops.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tabula;

namespace {

auto ids(const Relation& relation) -> std::vector<std::int64_t> {
    std::vector<std::int64_t> out;
    for (const auto& row : relation) {
        out.push_back(row.at("id").as<std::int64_t>());
    }
    return out;
}

auto staff() -> Relation {
    return Relation{
        Row{{"id", 1}, {"dept", "A"}, {"sal", 100}},
        Row{{"id", 2}, {"dept", "B"}, {"sal", 200}},
        Row{{"id", 3}, {"dept", "A"}, {"sal", 300}},
    };
}

}  // namespace

TEST_CASE("group_by: first row of each group wins", "[group]") {
    auto out = staff().group_by("dept");

    REQUIRE(out.size() == 2);
    CHECK(ids(out) == std::vector<std::int64_t>{1, 2});
    CHECK(out[0] == Row{{"id", 1}, {"dept", "A"}, {"sal", 100}});
    CHECK(out[1].at("sal") == Value{200});
}

TEST_CASE("group_by: output follows first occurrence order", "[group]") {
    Relation rel{
        Row{{"id", 1}, {"k", "z"}},
        Row{{"id", 2}, {"k", "a"}},
        Row{{"id", 3}, {"k", "z"}},
        Row{{"id", 4}, {"k", "m"}},
    };
    CHECK(ids(rel.group_by("k")) == std::vector<std::int64_t>{1, 2, 4});
}

TEST_CASE("group_by: composite keys", "[group]") {
    Relation rel{
        Row{{"id", 1}, {"dept", "A"}, {"level", 1}},
        Row{{"id", 2}, {"dept", "A"}, {"level", 2}},
        Row{{"id", 3}, {"dept", "A"}, {"level", 1}},
        Row{{"id", 4}, {"dept", "B"}, {"level", 1}},
    };
    CHECK(ids(rel.group_by({"dept", "level"})) == std::vector<std::int64_t>{1, 2, 4});
}

TEST_CASE("group_by: signatures come from string forms", "[group]") {
    Relation rel{
        Row{{"id", 1}, {"k", 1}},
        Row{{"id", 2}, {"k", "1"}},
        Row{{"id", 3}, {"k", true}},
        Row{{"id", 4}, {"k", 1.0}},
        Row{{"id", 5}, {"k", nullptr}},
        Row{{"id", 6}, {"k", ""}},
    };
    CHECK(ids(rel.group_by("k")) == std::vector<std::int64_t>{1, 5});
}

TEST_CASE("group_by: values containing the separator may collide", "[group]") {
    Relation rel{
        Row{{"id", 1}, {"a", "x,y"}, {"b", "z"}},
        Row{{"id", 2}, {"a", "x"}, {"b", "y,z"}},
    };
    CHECK(ids(rel.group_by({"a", "b"})) == std::vector<std::int64_t>{1});
}

TEST_CASE("group_by: no two output rows share a signature", "[group]") {
    Relation rel;
    for (std::int64_t i = 0; i < 50; ++i) {
        rel.push_back(Row{{"id", i}, {"bucket", i % 7}});
    }
    auto out = rel.group_by("bucket");

    std::set<std::string> seen;
    for (const auto& row : out) {
        auto signature = runtime::group_signature(row, {"bucket"});
        REQUIRE(signature.has_value());
        CHECK(seen.insert(*signature).second);
    }
    CHECK(out.size() == 7);
}

TEST_CASE("group_by: missing or nested key is an error", "[group]") {
    Relation missing{Row{{"id", 1}, {"k", 1}}, Row{{"id", 2}}};
    CHECK_THROWS_AS(missing.group_by("k"), std::runtime_error);

    Relation nested{Row{{"id", 1}, {"k", make_row_array({})}}};
    auto result = runtime::group_rows(nested.rows(), {"k"});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().find("no string form") != std::string::npos);
}

TEST_CASE("group_by: empty relation", "[group]") {
    CHECK(Relation{}.group_by("k").empty());
}

TEST_CASE("group_by: rows keep their identity", "[group]") {
    auto rel = staff();
    auto out = rel.group_by("dept");
    CHECK(out[0].shares_storage_with(rel[0]));
}
