#include <tabula/core/relation.hpp>
#include <tabula/runtime/print.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <vector>

auto main() -> int {
    using tabula::Direction;
    using tabula::Row;

    tabula::Relation employees{
        Row{{"id", 1}, {"dept", "A"}, {"salary", 100}},
        Row{{"id", 2}, {"dept", "B"}, {"salary", 200}},
        Row{{"id", 3}, {"dept", "A"}, {"salary", 300}},
    };

    fmt::print("=== Relation ===\n");
    tabula::runtime::print(employees);

    fmt::print("\n=== Aggregates ===\n");
    fmt::print("count: {}\n", employees.count());
    fmt::print("sum(salary): {}\n", tabula::display_string(employees.sum("salary")));
    fmt::print("avg(salary): {}\n", tabula::display_string(employees.avg("salary")));

    fmt::print("\n=== order_by salary desc ===\n");
    tabula::runtime::print(employees.order_by("salary", Direction::Desc));

    fmt::print("\n=== group_by dept ===\n");
    tabula::runtime::print(employees.group_by("dept"));

    std::vector<Row> departments{
        Row{{"dept", "A"}, {"dept_name", "Engineering"}},
        Row{{"dept", "C"}, {"dept_name", "Legal"}},
    };
    auto same_dept = [](const Row& l, const Row& r) { return l.at("dept") == r.at("dept"); };

    fmt::print("\n=== left_join departments ===\n");
    tabula::runtime::print(employees.left_join(departments, same_dept));

    fmt::print("\n=== where salary > 150, select id ===\n");
    auto high = employees
                    .where([](const Row& row) {
                        return row.at("salary").as<std::int64_t>() > 150;
                    })
                    .select("id");
    tabula::runtime::print(high);

    return 0;
}
