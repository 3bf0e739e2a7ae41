#include <tabula/core/relation.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace tabula {

namespace {

template <typename T>
auto unwrap(std::expected<T, std::string> result) -> T {
    if (!result) {
        throw std::runtime_error(result.error());
    }
    return std::move(*result);
}

}  // namespace

RowSource::RowSource(const Relation& relation) : source_(relation.to_array()) {}

auto RowSource::materialize() const& -> std::vector<Row> {
    return std::visit(
        [](const auto& source) -> std::vector<Row> {
            using S = std::decay_t<decltype(source)>;
            if constexpr (std::is_same_v<S, std::vector<Row>>) {
                return source;
            } else {
                return std::vector<Row>{source};
            }
        },
        source_);
}

auto RowSource::materialize() && -> std::vector<Row> {
    if (auto* rows = std::get_if<std::vector<Row>>(&source_)) {
        return std::move(*rows);
    }
    return std::as_const(*this).materialize();
}

auto Relation::select(const FieldNames& keys) const -> Relation {
    return Relation{runtime::project_rows(rows_, keys.names())};
}

auto Relation::inner_join(const RowSource& rows, const runtime::JoinPredicate& on) const
    -> Relation {
    return Relation{runtime::join_rows(rows_, rows.materialize(), runtime::JoinKind::Inner, on)};
}

auto Relation::left_join(const RowSource& rows, const runtime::JoinPredicate& on) const
    -> Relation {
    return Relation{runtime::join_rows(rows_, rows.materialize(), runtime::JoinKind::Left, on)};
}

auto Relation::right_join(const RowSource& rows, const runtime::JoinPredicate& on) const
    -> Relation {
    return Relation{runtime::join_rows(rows_, rows.materialize(), runtime::JoinKind::Right, on)};
}

auto Relation::order_by(const FieldNames& keys, const Directions& directions) const -> Relation {
    const auto& names = keys.names();
    auto order_keys = runtime::make_order_keys(names, directions.expand(names.size()));
    return Relation{unwrap(runtime::order_rows(rows_, order_keys))};
}

auto Relation::group_by(const FieldNames& keys) const -> Relation {
    return Relation{unwrap(runtime::group_rows(rows_, keys.names()))};
}

auto Relation::first(std::optional<Row> fallback) const -> std::optional<Row> {
    if (rows_.empty()) {
        return fallback;
    }
    return rows_.front();
}

auto Relation::last(std::optional<Row> fallback) const -> std::optional<Row> {
    if (rows_.empty()) {
        return fallback;
    }
    return rows_.back();
}

auto Relation::sum(std::string_view key) const -> Value {
    return unwrap(runtime::sum_field(rows_, key));
}

auto Relation::avg(std::string_view key) const -> Value {
    return unwrap(runtime::avg_field(rows_, key));
}

auto Relation::to_array() const -> std::vector<Row> {
    return runtime::materialize_rows(rows_);
}

auto Relation::at(size_type index) const -> const Row& {
    if (index >= rows_.size()) {
        throw std::out_of_range(
            fmt::format("row index {} out of range (size {})", index, rows_.size()));
    }
    return rows_[index];
}

void Relation::set(std::optional<size_type> index, Row row) {
    if (!index.has_value()) {
        rows_.push_back(std::move(row));
        return;
    }
    if (*index >= rows_.size()) {
        throw std::out_of_range(
            fmt::format("row index {} out of range (size {})", *index, rows_.size()));
    }
    rows_[*index] = std::move(row);
}

auto Relation::erase(size_type index) -> bool {
    if (index >= rows_.size()) {
        return false;
    }
    rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

}  // namespace tabula
