#include <tabula/core/relation.hpp>
#include <tabula/runtime/ops.hpp>

#include <fmt/format.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <numeric>
#include <string>
#include <unordered_set>

namespace tabula::runtime {

namespace {

auto lowercase(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

// Right fields are set on top of the left row: a shared key keeps its left
// position and takes the right value, new keys are appended.
auto merge_rows(const Row& left, const Row& right) -> Row {
    Row merged = left;
    for (const auto& field : right) {
        merged.set(field.name, field.value);
    }
    return merged;
}

// Padding only fills keys the left row lacks.
auto pad_row(const Row& left, const Row& null_row) -> Row {
    Row padded = left;
    for (const auto& field : null_row) {
        if (!padded.contains(field.name)) {
            padded.set(field.name, field.value);
        }
    }
    return padded;
}

auto null_row_like(const Rows& rows) -> Row {
    Row out;
    if (rows.empty()) {
        return out;
    }
    for (const auto& field : rows.front()) {
        out.set(field.name, Null{});
    }
    return out;
}

auto materialize_value(const Value& value) -> Value {
    if (const auto* relation = value.get_if<RelationPtr>()) {
        return Value{make_row_array((*relation)->to_array())};
    }
    // Arrays may carry relation handles in their own rows.
    if (const auto* array = value.get_if<RowArrayPtr>()) {
        return Value{make_row_array(materialize_rows((*array)->rows))};
    }
    return value;
}

auto missing_field(std::string_view op, std::string_view key, std::size_t row_index,
                   const Row& row) -> std::string {
    return fmt::format("{} field not found in row {}: {} (available: {})", op, row_index, key,
                       format_fields(row));
}

}  // namespace

auto join_kind_name(JoinKind kind) noexcept -> std::string_view {
    switch (kind) {
        case JoinKind::Inner:
            return "inner";
        case JoinKind::Left:
            return "left";
        case JoinKind::Right:
            return "right";
    }
    return "unknown";
}

auto parse_direction(std::string_view text) -> std::expected<Direction, std::string> {
    auto lowered = lowercase(text);
    if (lowered == "asc") {
        return Direction::Asc;
    }
    if (lowered == "desc") {
        return Direction::Desc;
    }
    return std::unexpected(fmt::format("invalid sort direction: '{}' (expected asc or desc)", text));
}

auto make_order_keys(const std::vector<std::string>& names,
                     const std::vector<Direction>& directions) -> std::vector<OrderKey> {
    std::vector<OrderKey> keys;
    keys.reserve(names.size());
    for (std::size_t i = 0; i < names.size(); ++i) {
        keys.push_back(OrderKey{.name = names[i],
                                .direction = i < directions.size() ? directions[i]
                                                                   : Direction::Asc});
    }
    return keys;
}

auto project_rows(const Rows& rows, const std::vector<std::string>& names) -> Rows {
    std::unordered_set<std::string> wanted(names.begin(), names.end());
    Rows out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        Row projected;
        for (const auto& field : row) {
            if (wanted.contains(field.name)) {
                projected.set(field.name, field.value);
            }
        }
        out.push_back(std::move(projected));
    }
    return out;
}

auto filter_rows(const Rows& rows, const RowPredicate& pred) -> Rows {
    Rows out;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (pred(rows[i], i)) {
            out.push_back(rows[i]);
        }
    }
    return out;
}

auto join_rows(const Rows& left, const Rows& right, JoinKind kind, const JoinPredicate& on)
    -> Rows {
    if (kind == JoinKind::Right) {
        return join_rows(right, left, JoinKind::Left, on);
    }

    Row null_row;
    if (kind == JoinKind::Left) {
        null_row = null_row_like(right);
    }

    Rows out;
    out.reserve(left.size());
    for (const auto& left_row : left) {
        const Row* match = nullptr;
        for (const auto& right_row : right) {
            if (on(left_row, right_row)) {
                match = &right_row;
                break;
            }
        }
        if (match != nullptr) {
            out.push_back(merge_rows(left_row, *match));
        } else if (kind == JoinKind::Left) {
            out.push_back(pad_row(left_row, null_row));
        }
    }

    spdlog::debug("{} join: left={} right={} out={}", join_kind_name(kind), left.size(),
                  right.size(), out.size());
    return out;
}

auto order_rows(const Rows& rows, const std::vector<OrderKey>& keys)
    -> std::expected<Rows, std::string> {
    // Resolve every key up front so the comparator only indexes flat arrays
    // and a missing field fails before any sorting happens.
    std::vector<std::vector<const Value*>> flat_keys(keys.size());
    for (std::size_t k = 0; k < keys.size(); ++k) {
        flat_keys[k].reserve(rows.size());
        for (std::size_t r = 0; r < rows.size(); ++r) {
            const auto* value = rows[r].find(keys[k].name);
            if (value == nullptr) {
                return std::unexpected(missing_field("order", keys[k].name, r, rows[r]));
            }
            flat_keys[k].push_back(value);
        }
    }

    std::vector<std::size_t> order(rows.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::ranges::stable_sort(order, [&](std::size_t a, std::size_t b) {
        for (std::size_t k = 0; k < keys.size(); ++k) {
            auto cmp = compare_values(*flat_keys[k][a], *flat_keys[k][b]);
            if (std::is_eq(cmp)) {
                continue;
            }
            return keys[k].direction == Direction::Desc ? std::is_gt(cmp) : std::is_lt(cmp);
        }
        return false;
    });

    Rows out;
    out.reserve(rows.size());
    for (auto idx : order) {
        out.push_back(rows[idx]);
    }

    spdlog::debug("order: rows={} keys={}", rows.size(), keys.size());
    return out;
}

auto group_signature(const Row& row, const std::vector<std::string>& keys)
    -> std::expected<std::string, std::string> {
    std::string signature;
    for (std::size_t k = 0; k < keys.size(); ++k) {
        const auto* value = row.find(keys[k]);
        if (value == nullptr) {
            return std::unexpected(fmt::format("group key not found: {} (available: {})", keys[k],
                                               format_fields(row)));
        }
        auto text = signature_string(*value);
        if (!text) {
            return std::unexpected(fmt::format("group key {}: {}", keys[k], text.error()));
        }
        if (k > 0) {
            signature.push_back(',');
        }
        signature.append(*text);
    }
    return signature;
}

auto group_rows(const Rows& rows, const std::vector<std::string>& keys)
    -> std::expected<Rows, std::string> {
    robin_hood::unordered_flat_set<std::string> seen;
    seen.reserve(rows.size());

    Rows out;
    for (std::size_t r = 0; r < rows.size(); ++r) {
        auto signature = group_signature(rows[r], keys);
        if (!signature) {
            return std::unexpected(fmt::format("row {}: {}", r, signature.error()));
        }
        if (seen.insert(std::move(*signature)).second) {
            out.push_back(rows[r]);
        }
    }

    spdlog::debug("group: rows={} keys={} groups={}", rows.size(), keys.size(), out.size());
    return out;
}

auto sum_field(const Rows& rows, std::string_view key) -> std::expected<Value, std::string> {
    std::int64_t int_sum = 0;
    double double_sum = 0.0;
    bool integral = true;

    for (std::size_t r = 0; r < rows.size(); ++r) {
        const auto* value = rows[r].find(key);
        if (value == nullptr) {
            return std::unexpected(missing_field("sum", key, r, rows[r]));
        }
        auto number = numeric_value(*value);
        if (!number) {
            return std::unexpected(fmt::format("sum field {} in row {}: {}", key, r, number.error()));
        }
        if (integral) {
            const auto* term = number->get_if<std::int64_t>();
            std::int64_t next = 0;
            if (term != nullptr && !__builtin_add_overflow(int_sum, *term, &next)) {
                int_sum = next;
                continue;
            }
            // A double term or an overflow switches the rest of the sum to double.
            integral = false;
            double_sum = static_cast<double>(int_sum);
        }
        double_sum += *number->as_double();
    }

    if (integral) {
        return Value{int_sum};
    }
    return Value{double_sum};
}

auto avg_field(const Rows& rows, std::string_view key) -> std::expected<Value, std::string> {
    auto sum = sum_field(rows, key);
    if (!sum) {
        return sum;
    }
    if (const auto* total = sum->get_if<std::int64_t>()) {
        if (*total == 0) {
            return sum;
        }
        auto count = static_cast<std::int64_t>(rows.size());
        if (*total % count == 0) {
            return Value{*total / count};
        }
        return Value{static_cast<double>(*total) / static_cast<double>(count)};
    }
    double total = sum->as<double>();
    if (total == 0.0) {
        return sum;
    }
    return Value{total / static_cast<double>(rows.size())};
}

auto materialize_rows(const Rows& rows) -> Rows {
    Rows out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        Row copy = row;
        for (const auto& field : row) {
            if (field.value.is_nested()) {
                copy.set(field.name, materialize_value(field.value));
            }
        }
        out.push_back(std::move(copy));
    }
    return out;
}

}  // namespace tabula::runtime
