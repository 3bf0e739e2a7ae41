#pragma once

#include <tabula/core/value.hpp>

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tabula {

/// An ordered mapping from field name to Value.
///
/// Field names are unique and keep insertion order. Copies share their field
/// storage until one of them is mutated (copy-on-write), so passing rows
/// between relations does not copy their contents.
class Row {
   public:
    struct Field {
        std::string name;
        Value value;
    };

    using container_type = std::vector<Field>;
    using const_iterator = container_type::const_iterator;
    using size_type = std::size_t;

    Row() = default;

    /// Later duplicates of a name overwrite the earlier value in place.
    Row(std::initializer_list<Field> fields);
    explicit Row(container_type fields);

    [[nodiscard]] auto size() const noexcept -> size_type { return fields().size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return fields().empty(); }

    [[nodiscard]] auto contains(std::string_view name) const noexcept -> bool {
        return find(name) != nullptr;
    }

    /// Returns nullptr when the field is absent.
    [[nodiscard]] auto find(std::string_view name) const noexcept -> const Value*;

    /// Throws std::out_of_range when the field is absent.
    [[nodiscard]] auto at(std::string_view name) const -> const Value&;

    /// Replace an existing field in place or append a new one.
    void set(std::string name, Value value);

    /// Remove a field. Returns false when it was not present.
    auto erase(std::string_view name) -> bool;

    [[nodiscard]] auto keys() const -> std::vector<std::string>;

    /// True when both rows still share the same field storage.
    [[nodiscard]] auto shares_storage_with(const Row& other) const noexcept -> bool {
        return fields_ != nullptr && fields_ == other.fields_;
    }

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return fields().begin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return fields().end(); }

    /// Same fields in the same order with equal values.
    friend auto operator==(const Row& lhs, const Row& rhs) -> bool;

   private:
    [[nodiscard]] auto fields() const noexcept -> const container_type&;
    auto mutable_fields() -> container_type&;

    std::shared_ptr<container_type> fields_;
};

/// Plain nested list of rows, the materialized form of a nested Relation.
struct RowArray {
    std::vector<Row> rows;

    friend auto operator==(const RowArray& lhs, const RowArray& rhs) -> bool = default;
};

[[nodiscard]] inline auto make_row_array(std::vector<Row> rows) -> RowArrayPtr {
    return std::make_shared<const RowArray>(RowArray{.rows = std::move(rows)});
}

/// Comma-separated field names, used in error messages.
[[nodiscard]] auto format_fields(const Row& row) -> std::string;

}  // namespace tabula
