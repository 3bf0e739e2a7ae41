#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace tabula {

class Relation;
struct RowArray;

/// Missing value. Used to pad unmatched rows in a left join.
struct Null {
    auto operator<=>(const Null&) const = default;
};

/// Nested values. A RowArray is an immutable, detached list of rows; a
/// Relation is held by handle and may be shared between rows.
using RowArrayPtr = std::shared_ptr<const RowArray>;
using RelationPtr = std::shared_ptr<Relation>;

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Int,
    Double,
    String,
    Array,
    Relation,
};

/// A single field value inside a Row.
///
/// Any integral type is stored as std::int64_t (unsigned values above its
/// range become double) and any floating point type as double, so `Value{1}`
/// and `Value{std::int64_t{1}}` are the same value.
class Value {
   public:
    using Storage =
        std::variant<Null, bool, std::int64_t, double, std::string, RowArrayPtr, RelationPtr>;

    Value() = default;
    Value(std::nullptr_t) noexcept {}
    Value(Null) noexcept {}
    Value(bool value) noexcept : data_(value) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T value) noexcept : data_(from_integral(value)) {}

    template <std::floating_point T>
    Value(T value) noexcept : data_(static_cast<double>(value)) {}

    Value(std::string value) : data_(std::move(value)) {}
    Value(std::string_view value) : data_(std::string(value)) {}
    Value(const char* value) : data_(std::string(value)) {}

    /// A null pointer is stored as Null.
    Value(RowArrayPtr array);
    Value(RelationPtr relation);

    [[nodiscard]] auto kind() const noexcept -> ValueKind {
        return static_cast<ValueKind>(data_.index());
    }

    [[nodiscard]] auto is_null() const noexcept -> bool { return kind() == ValueKind::Null; }
    [[nodiscard]] auto is_number() const noexcept -> bool {
        return kind() == ValueKind::Int || kind() == ValueKind::Double;
    }
    [[nodiscard]] auto is_nested() const noexcept -> bool {
        return kind() == ValueKind::Array || kind() == ValueKind::Relation;
    }

    template <typename T>
    [[nodiscard]] auto holds() const noexcept -> bool {
        return std::holds_alternative<T>(data_);
    }

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&data_);
    }

    /// Checked access; throws std::bad_variant_access on a kind mismatch.
    template <typename T>
    [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(data_);
    }

    /// Numeric view of Int and Double values.
    [[nodiscard]] auto as_double() const noexcept -> std::optional<double>;

    [[nodiscard]] auto storage() const noexcept -> const Storage& { return data_; }

    /// Same kind and equal content. Nested values compare by their rows,
    /// so an Int never equals a Double.
    friend auto operator==(const Value& lhs, const Value& rhs) -> bool;

   private:
    /// Unsigned values that do not fit in std::int64_t are stored as double.
    template <std::integral T>
    static auto from_integral(T value) noexcept -> Storage {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t)) {
            if (value > static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<double>(value);
            }
        }
        return static_cast<std::int64_t>(value);
    }

    Storage data_;
};

[[nodiscard]] auto kind_name(ValueKind kind) noexcept -> std::string_view;

/// Total, deterministic ordering used by order_by.
///
/// Numbers compare numerically across Int and Double (NaN sorts after every
/// other number), strings lexicographically and false before true. Values of
/// different kinds order by rank: Null, Bool, number, String, Array, Relation.
/// Two nested values of the same kind compare by row count.
[[nodiscard]] auto compare_values(const Value& lhs, const Value& rhs) -> std::weak_ordering;

/// String form used to build group signatures: Null and false are empty,
/// true is "1", numbers print in shortest round-trip form. Nested values have
/// no string form.
[[nodiscard]] auto signature_string(const Value& value) -> std::expected<std::string, std::string>;

/// Human-readable rendering used by print(); never fails.
[[nodiscard]] auto display_string(const Value& value) -> std::string;

/// Numeric coercion used by sum/avg. Returns an Int or Double value:
/// bools become 0/1, Null becomes 0, numeric strings are parsed and any other
/// string counts as 0. Nested values cannot be coerced.
[[nodiscard]] auto numeric_value(const Value& value) -> std::expected<Value, std::string>;

}  // namespace tabula
