#pragma once

#include <tabula/core/row.hpp>
#include <tabula/core/value.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tabula::runtime {

using Rows = std::vector<Row>;

/// Filter predicate: the row and its position in the input.
using RowPredicate = std::function<bool(const Row&, std::size_t)>;

/// Join condition evaluated as on(left_row, right_row).
using JoinPredicate = std::function<bool(const Row&, const Row&)>;

enum class JoinKind : std::uint8_t {
    Inner,
    Left,
    Right,
};

enum class Direction : std::uint8_t {
    Asc,
    Desc,
};

struct OrderKey {
    std::string name;
    Direction direction = Direction::Asc;
};

[[nodiscard]] auto join_kind_name(JoinKind kind) noexcept -> std::string_view;

/// Accepts "asc" and "desc" in any letter case.
[[nodiscard]] auto parse_direction(std::string_view text) -> std::expected<Direction, std::string>;

/// Pair each name with its direction; names past the end of `directions`
/// sort ascending.
[[nodiscard]] auto make_order_keys(const std::vector<std::string>& names,
                                   const std::vector<Direction>& directions)
    -> std::vector<OrderKey>;

// ─── Row set operations ───────────────────────────────────────────────────────
//  Every operation reads its input and returns a new row set; inputs are never
//  modified. Operations that reference fields fail when a row lacks one.

[[nodiscard]] auto project_rows(const Rows& rows, const std::vector<std::string>& names) -> Rows;

[[nodiscard]] auto filter_rows(const Rows& rows, const RowPredicate& pred) -> Rows;

/// Nested loop join. Each left row pairs with at most the first matching
/// right row. Right joins run as left joins with the operands swapped.
[[nodiscard]] auto join_rows(const Rows& left, const Rows& right, JoinKind kind,
                             const JoinPredicate& on) -> Rows;

/// Stable multi-key sort.
[[nodiscard]] auto order_rows(const Rows& rows, const std::vector<OrderKey>& keys)
    -> std::expected<Rows, std::string>;

/// First row of each distinct group signature, in first-seen order.
[[nodiscard]] auto group_rows(const Rows& rows, const std::vector<std::string>& keys)
    -> std::expected<Rows, std::string>;

/// Values at `keys` in string form joined by ','.
[[nodiscard]] auto group_signature(const Row& row, const std::vector<std::string>& keys)
    -> std::expected<std::string, std::string>;

[[nodiscard]] auto sum_field(const Rows& rows, std::string_view key)
    -> std::expected<Value, std::string>;

/// Returns the sum itself when it is zero, otherwise sum / count.
[[nodiscard]] auto avg_field(const Rows& rows, std::string_view key)
    -> std::expected<Value, std::string>;

/// Copy of `rows` with every nested Relation value, at any depth, converted
/// into a RowArray.
[[nodiscard]] auto materialize_rows(const Rows& rows) -> Rows;

}  // namespace tabula::runtime
