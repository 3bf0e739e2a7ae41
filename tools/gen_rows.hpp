#pragma once
// gen_rows — synthetic employee/department rows for benchmarks.
//
//   auto employees = gen_employee_rows(100000, 42);
//   auto departments = gen_department_rows(100);

#include <tabula/core/row.hpp>

#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

inline auto gen_employee_rows(std::int64_t n, std::uint64_t seed, std::int64_t departments = 100)
    -> std::vector<tabula::Row> {
    if (n < 0)
        throw std::invalid_argument("gen_employee_rows: n must be non-negative");
    if (departments <= 0)
        throw std::invalid_argument("gen_employee_rows: departments must be positive");

    std::mt19937_64 rng{seed};
    std::uniform_int_distribution<std::int64_t> dept_dist{0, departments - 1};
    std::uniform_int_distribution<std::int64_t> salary_dist{30'000, 150'000};

    std::vector<tabula::Row> rows;
    rows.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        rows.push_back(tabula::Row{
            {"id", i},
            {"dept_id", dept_dist(rng)},
            {"salary", salary_dist(rng)},
            {"name", "emp" + std::to_string(i)},
        });
    }
    return rows;
}

inline auto gen_department_rows(std::int64_t n) -> std::vector<tabula::Row> {
    if (n < 0)
        throw std::invalid_argument("gen_department_rows: n must be non-negative");

    std::vector<tabula::Row> rows;
    rows.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        rows.push_back(tabula::Row{
            {"dept_id", i},
            {"dept_name", "dept" + std::to_string(i)},
        });
    }
    return rows;
}
