#pragma once

#include <tabula/core/row.hpp>
#include <tabula/core/value.hpp>
#include <tabula/runtime/ops.hpp>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tabula {

class Relation;

using runtime::Direction;

/// One field name or an ordered list of field names.
class FieldNames {
   public:
    FieldNames(const char* name) : names_{std::string(name)} {}
    FieldNames(std::string name) : names_{std::move(name)} {}
    FieldNames(std::initializer_list<std::string> names) : names_(names) {}
    FieldNames(std::vector<std::string> names) : names_(std::move(names)) {}

    [[nodiscard]] auto names() const noexcept -> const std::vector<std::string>& { return names_; }

   private:
    std::vector<std::string> names_;
};

/// One direction for every key, or one direction per key.
class Directions {
   public:
    Directions(Direction direction) : single_(direction) {}
    Directions(std::initializer_list<Direction> directions) : list_(directions) {}
    Directions(std::vector<Direction> directions) : list_(std::move(directions)) {}

    /// Directions for `count` keys; a short list is padded with Asc.
    [[nodiscard]] auto expand(std::size_t count) const -> std::vector<Direction> {
        if (single_.has_value()) {
            return std::vector<Direction>(count, *single_);
        }
        auto out = list_;
        if (out.size() < count) {
            out.resize(count, Direction::Asc);
        }
        return out;
    }

   private:
    std::optional<Direction> single_;
    std::vector<Direction> list_;
};

/// Input accepted wherever a row collection is expected.
///
/// The input shape is resolved once, here: a list of rows, another Relation
/// (materialized with to_array()), a single row, or any finite range of rows
/// (copied eagerly).
class RowSource {
   public:
    RowSource() = default;
    RowSource(std::vector<Row> rows) : source_(std::move(rows)) {}
    RowSource(std::initializer_list<Row> rows) : source_(std::vector<Row>(rows)) {}
    RowSource(const Relation& relation);
    RowSource(Row row) : source_(std::move(row)) {}

    template <std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, Row> &&
                 (!std::same_as<std::remove_cvref_t<R>, std::vector<Row>>) &&
                 (!std::same_as<std::remove_cvref_t<R>, Relation>)
    RowSource(R&& range) : source_(std::vector<Row>{}) {
        auto& rows = std::get<std::vector<Row>>(source_);
        for (auto&& row : range) {
            rows.emplace_back(std::forward<decltype(row)>(row));
        }
    }

    /// Concrete, ordered copy of the source rows.
    [[nodiscard]] auto materialize() const& -> std::vector<Row>;
    [[nodiscard]] auto materialize() && -> std::vector<Row>;

   private:
    std::variant<std::vector<Row>, Row> source_;
};

/// An ordered, in-memory collection of rows with a fluent query API.
///
/// Every query returns a new Relation and leaves this one untouched; only the
/// indexed mutators (set, push_back, erase) change a Relation in place.
/// Query methods throw std::runtime_error when a row lacks a referenced field.
class Relation {
   public:
    using value_type = Row;
    using size_type = std::size_t;
    using const_iterator = std::vector<Row>::const_iterator;

    Relation() = default;
    Relation(std::vector<Row> rows) noexcept : rows_(std::move(rows)) {}
    Relation(std::initializer_list<Row> rows) : rows_(rows) {}
    explicit Relation(RowSource source) : rows_(std::move(source).materialize()) {}

    [[nodiscard]] static auto make(RowSource source) -> Relation {
        return Relation{std::move(source)};
    }

    // ─── Queries ──────────────────────────────────────────────────────────

    /// Keep only the named fields of every row, in each row's own field order.
    [[nodiscard]] auto select(const FieldNames& keys) const -> Relation;

    /// Keep rows for which pred(row, index) or pred(row) is true.
    template <typename Pred>
        requires std::predicate<Pred&, const Row&, std::size_t> ||
                 std::predicate<Pred&, const Row&>
    [[nodiscard]] auto where(Pred pred) const -> Relation {
        if constexpr (std::predicate<Pred&, const Row&, std::size_t>) {
            return Relation{runtime::filter_rows(rows_, std::move(pred))};
        } else {
            return Relation{runtime::filter_rows(
                rows_, [&pred](const Row& row, std::size_t) { return pred(row); })};
        }
    }

    [[nodiscard]] auto inner_join(const RowSource& rows, const runtime::JoinPredicate& on) const
        -> Relation;
    [[nodiscard]] auto left_join(const RowSource& rows, const runtime::JoinPredicate& on) const
        -> Relation;
    [[nodiscard]] auto right_join(const RowSource& rows, const runtime::JoinPredicate& on) const
        -> Relation;

    [[nodiscard]] auto order_by(const FieldNames& keys,
                                const Directions& directions = Direction::Asc) const -> Relation;

    /// First row of every distinct combination of values at `keys`.
    [[nodiscard]] auto group_by(const FieldNames& keys) const -> Relation;

    // ─── Reducers ─────────────────────────────────────────────────────────

    [[nodiscard]] auto first(std::optional<Row> fallback = std::nullopt) const
        -> std::optional<Row>;
    [[nodiscard]] auto last(std::optional<Row> fallback = std::nullopt) const
        -> std::optional<Row>;

    [[nodiscard]] auto sum(std::string_view key) const -> Value;
    [[nodiscard]] auto avg(std::string_view key) const -> Value;

    [[nodiscard]] auto count() const noexcept -> size_type { return rows_.size(); }
    [[nodiscard]] auto size() const noexcept -> size_type { return rows_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return rows_.empty(); }

    /// Detached copy of the rows; nested Relations become RowArray values.
    [[nodiscard]] auto to_array() const -> std::vector<Row>;

    [[nodiscard]] auto rows() const noexcept -> const std::vector<Row>& { return rows_; }

    // ─── Indexed access ───────────────────────────────────────────────────

    [[nodiscard]] auto contains(size_type index) const noexcept -> bool {
        return index < rows_.size();
    }

    /// Bounds-checked; throws std::out_of_range.
    [[nodiscard]] auto at(size_type index) const -> const Row&;

    /// Unchecked access.
    [[nodiscard]] auto operator[](size_type index) const noexcept -> const Row& {
        return rows_[index];
    }

    /// Replace the row at `index`, or append when no index is given.
    /// Throws std::out_of_range for an index past the end.
    void set(std::optional<size_type> index, Row row);

    void push_back(Row row) { rows_.push_back(std::move(row)); }

    /// Remove the row at `index`. Returns false when there was none.
    auto erase(size_type index) -> bool;

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return rows_.cbegin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return rows_.cend(); }
    [[nodiscard]] auto cbegin() const noexcept -> const_iterator { return rows_.cbegin(); }
    [[nodiscard]] auto cend() const noexcept -> const_iterator { return rows_.cend(); }

    friend auto operator==(const Relation& lhs, const Relation& rhs) -> bool = default;

   private:
    std::vector<Row> rows_;
};

[[nodiscard]] inline auto make_relation_ptr(Relation relation) -> RelationPtr {
    return std::make_shared<Relation>(std::move(relation));
}

}  // namespace tabula
