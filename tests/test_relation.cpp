#include <tabula/core/relation.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <list>
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

TEST_CASE("Relation construction from row sources", "[relation][construct]") {
    SECTION("default is empty") {
        Relation empty;
        REQUIRE(empty.empty());
        REQUIRE(empty.count() == 0);
    }

    SECTION("from a vector of rows") {
        std::vector<Row> rows{Row{{"id", 1}}, Row{{"id", 2}}};
        Relation rel{rows};
        REQUIRE(ids(rel) == std::vector<std::int64_t>{1, 2});
    }

    SECTION("from a single row") {
        auto rel = Relation::make(Row{{"id", 9}});
        REQUIRE(rel.size() == 1);
        REQUIRE(ids(rel) == std::vector<std::int64_t>{9});
    }

    SECTION("from any finite range of rows") {
        std::list<Row> rows{Row{{"id", 4}}, Row{{"id", 5}}};
        auto rel = Relation::make(rows);
        REQUIRE(ids(rel) == std::vector<std::int64_t>{4, 5});
    }

    SECTION("from another relation materializes its rows") {
        Relation inner{Row{{"x", 1}}};
        Relation outer{Row{{"id", 1}, {"child", make_relation_ptr(inner)}}};

        auto copy = Relation::make(outer);
        REQUIRE(copy.size() == 1);
        REQUIRE(copy[0].at("child").kind() == ValueKind::Array);
    }

    SECTION("a row source outlives the relation it was built from") {
        auto build = [] {
            Relation temporary{Row{{"id", 7}}, Row{{"id", 8}}};
            return RowSource(temporary);
        };
        RowSource source = build();
        auto rel = Relation::make(source);
        REQUIRE(ids(rel) == std::vector<std::int64_t>{7, 8});
        REQUIRE(ids(staff().inner_join(source, [](const Row&, const Row&) { return true; })) ==
                std::vector<std::int64_t>{7, 7, 7});
    }

    SECTION("from an empty source") {
        auto rel = Relation::make(std::vector<Row>{});
        REQUIRE(rel.empty());
    }
}

TEST_CASE("select keeps requested fields in row order", "[relation][select]") {
    auto out = staff().select({"sal", "id", "missing"});

    REQUIRE(out.size() == 3);
    REQUIRE(out[0].keys() == std::vector<std::string>{"id", "sal"});
    REQUIRE(out[2].at("sal") == Value{300});
}

TEST_CASE("select with a single key", "[relation][select]") {
    auto out = staff().select("dept");
    REQUIRE(out.size() == 3);
    for (const auto& row : out) {
        REQUIRE(row.keys() == std::vector<std::string>{"dept"});
    }
}

TEST_CASE("select composition narrows to the intersection", "[relation][select]") {
    auto out = staff().select({"id", "dept"}).select({"dept", "sal"});
    for (const auto& row : out) {
        REQUIRE(row.keys() == std::vector<std::string>{"dept"});
    }
}

TEST_CASE("select on heterogeneous rows drops absent keys silently", "[relation][select]") {
    Relation rel{Row{{"a", 1}, {"b", 2}}, Row{{"b", 3}}};
    auto out = rel.select({"a"});
    REQUIRE(out[0].keys() == std::vector<std::string>{"a"});
    REQUIRE(out[1].empty());
}

TEST_CASE("where filters with row and index", "[relation][where]") {
    auto rel = staff();

    SECTION("row-only predicate") {
        auto out = rel.where([](const Row& row) { return row.at("dept") == Value{"A"}; });
        REQUIRE(ids(out) == std::vector<std::int64_t>{1, 3});
    }

    SECTION("predicate receives the source position") {
        auto out = rel.where([](const Row&, std::size_t index) { return index != 1; });
        REQUIRE(ids(out) == std::vector<std::int64_t>{1, 3});
    }

    SECTION("rows keep their identity") {
        auto out = rel.where([](const Row&) { return true; });
        REQUIRE(out[0].shares_storage_with(rel[0]));
    }

    SECTION("where is idempotent") {
        auto pred = [](const Row& row) { return row.at("sal").as<std::int64_t>() > 150; };
        REQUIRE(rel.where(pred).where(pred) == rel.where(pred));
    }

    SECTION("the source relation is unchanged") {
        [[maybe_unused]] auto out = rel.where([](const Row&) { return false; });
        REQUIRE(rel.size() == 3);
    }
}

TEST_CASE("first and last", "[relation][first]") {
    auto rel = staff();
    REQUIRE(rel.first()->at("id") == Value{1});
    REQUIRE(rel.last()->at("id") == Value{3});

    Relation empty;
    REQUIRE_FALSE(empty.first().has_value());
    REQUIRE_FALSE(empty.last().has_value());

    Row fallback{{"id", -1}};
    REQUIRE(empty.first(fallback) == fallback);
    REQUIRE(empty.last(fallback) == fallback);
}

TEST_CASE("to_array produces a detached snapshot", "[relation][to_array]") {
    auto child = make_relation_ptr(Relation{Row{{"x", 1}}, Row{{"x", 2}}});
    Relation rel{Row{{"id", 1}, {"child", child}}};

    auto array = rel.to_array();
    REQUIRE(array.size() == 1);

    const auto* nested = array[0].at("child").get_if<RowArrayPtr>();
    REQUIRE(nested != nullptr);
    REQUIRE((*nested)->rows.size() == 2);
    REQUIRE((*nested)->rows[1].at("x") == Value{2});

    array[0].set("id", 99);
    array.push_back(Row{{"id", 100}});
    REQUIRE(rel.size() == 1);
    REQUIRE(rel[0].at("id") == Value{1});
    REQUIRE(rel[0].at("child").kind() == ValueKind::Relation);
}

TEST_CASE("to_array converts nested relations recursively", "[relation][to_array]") {
    auto leaf = make_relation_ptr(Relation{Row{{"leaf", true}}});
    auto middle = make_relation_ptr(Relation{Row{{"inner", leaf}}});
    Relation rel{Row{{"outer", middle}}};

    auto array = rel.to_array();
    const auto& middle_rows = array[0].at("outer").as<RowArrayPtr>()->rows;
    REQUIRE(middle_rows[0].at("inner").kind() == ValueKind::Array);
}

TEST_CASE("to_array converts relations held inside arrays", "[relation][to_array]") {
    auto shared = make_relation_ptr(Relation{Row{{"x", 1}}});
    auto array_value = make_row_array({Row{{"handle", shared}}});
    Relation rel{Row{{"items", array_value}}};

    auto array = rel.to_array();
    const auto& items = array[0].at("items").as<RowArrayPtr>()->rows;
    REQUIRE(items[0].at("handle").kind() == ValueKind::Array);

    shared->push_back(Row{{"x", 2}});
    REQUIRE(items[0].at("handle").as<RowArrayPtr>()->rows.size() == 1);
}

TEST_CASE("indexed access", "[relation][access]") {
    auto rel = staff();

    SECTION("contains and at") {
        REQUIRE(rel.contains(2));
        REQUIRE_FALSE(rel.contains(3));
        REQUIRE(rel.at(1).at("id") == Value{2});
        REQUIRE_THROWS_AS(rel.at(3), std::out_of_range);
    }

    SECTION("set replaces a position") {
        rel.set(0, Row{{"id", 10}});
        REQUIRE(ids(rel) == std::vector<std::int64_t>{10, 2, 3});
        REQUIRE_THROWS_AS(rel.set(5, Row{{"id", 11}}), std::out_of_range);
    }

    SECTION("set without an index appends") {
        rel.set(std::nullopt, Row{{"id", 4}});
        rel.push_back(Row{{"id", 5}});
        REQUIRE(ids(rel) == std::vector<std::int64_t>{1, 2, 3, 4, 5});
    }

    SECTION("erase removes a position") {
        REQUIRE(rel.erase(1));
        REQUIRE_FALSE(rel.erase(7));
        REQUIRE(ids(rel) == std::vector<std::int64_t>{1, 3});
    }
}

TEST_CASE("iteration is restartable and non-mutating", "[relation][iterate]") {
    auto rel = staff();
    REQUIRE(ids(rel) == ids(rel));
    REQUIRE(std::distance(rel.begin(), rel.end()) == 3);
}
