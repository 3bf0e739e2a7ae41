#include <tabula/core/relation.hpp>
#include <tabula/core/row.hpp>
#include <tabula/core/value.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>

namespace tabula {

namespace {

auto kind_rank(ValueKind kind) -> int {
    switch (kind) {
        case ValueKind::Null:
            return 0;
        case ValueKind::Bool:
            return 1;
        case ValueKind::Int:
        case ValueKind::Double:
            return 2;
        case ValueKind::String:
            return 3;
        case ValueKind::Array:
            return 4;
        case ValueKind::Relation:
            return 5;
    }
    return 6;
}

auto compare_doubles(double lhs, double rhs) -> std::weak_ordering {
    bool lhs_nan = std::isnan(lhs);
    bool rhs_nan = std::isnan(rhs);
    if (lhs_nan || rhs_nan) {
        return lhs_nan <=> rhs_nan;
    }
    if (lhs < rhs) {
        return std::weak_ordering::less;
    }
    if (lhs > rhs) {
        return std::weak_ordering::greater;
    }
    return std::weak_ordering::equivalent;
}

// Exact int64 vs double comparison; converting the int to double would round
// above 2^53 and break transitivity.
auto compare_int_double(std::int64_t lhs, double rhs) -> std::weak_ordering {
    if (std::isnan(rhs)) {
        return std::weak_ordering::less;
    }
    // 2^63 is exactly representable; every int64 lies in [-2^63, 2^63).
    constexpr double two_63 = 9223372036854775808.0;
    if (rhs >= two_63) {
        return std::weak_ordering::less;
    }
    if (rhs < -two_63) {
        return std::weak_ordering::greater;
    }
    double whole = std::trunc(rhs);
    auto whole_int = static_cast<std::int64_t>(whole);
    if (lhs != whole_int) {
        return lhs <=> whole_int;
    }
    double frac = rhs - whole;
    if (frac > 0.0) {
        return std::weak_ordering::less;
    }
    if (frac < 0.0) {
        return std::weak_ordering::greater;
    }
    return std::weak_ordering::equivalent;
}

auto compare_numbers(const Value& lhs, const Value& rhs) -> std::weak_ordering {
    const auto* li = lhs.get_if<std::int64_t>();
    const auto* ri = rhs.get_if<std::int64_t>();
    if (li != nullptr && ri != nullptr) {
        return *li <=> *ri;
    }
    if (li != nullptr) {
        return compare_int_double(*li, rhs.as<double>());
    }
    if (ri != nullptr) {
        return 0 <=> compare_int_double(*ri, lhs.as<double>());
    }
    return compare_doubles(lhs.as<double>(), rhs.as<double>());
}

auto nested_size(const Value& value) -> std::size_t {
    if (const auto* array = value.get_if<RowArrayPtr>()) {
        return (*array)->rows.size();
    }
    if (const auto* relation = value.get_if<RelationPtr>()) {
        return (*relation)->size();
    }
    return 0;
}

auto format_double(double value) -> std::string {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    return fmt::format("{}", value);
}

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// Leading numeric prefix of `text`: "12abc" is 12, "abc" is 0.
auto parse_number(std::string_view text) -> Value {
    text = trim(text);
    const char* first = text.data();
    const char* last = text.data() + text.size();
    // from_chars rejects a leading '+', which numeric strings may carry.
    if (first != last && *first == '+') {
        ++first;
    }
    const char* digits = (first != last && *first == '-') ? first + 1 : first;
    if (digits == last || (std::isdigit(static_cast<unsigned char>(*digits)) == 0 && *digits != '.')) {
        return Value{std::int64_t{0}};
    }
    std::int64_t int_value = 0;
    auto [int_end, int_ec] = std::from_chars(first, last, int_value);
    double double_value = 0.0;
    auto [dbl_end, dbl_ec] = std::from_chars(first, last, double_value);
    bool int_ok = int_ec == std::errc{};
    bool dbl_ok = dbl_ec == std::errc{};
    if (int_ok && (!dbl_ok || int_end >= dbl_end)) {
        return Value{int_value};
    }
    if (dbl_ok) {
        return Value{double_value};
    }
    return Value{std::int64_t{0}};
}

}  // namespace

Value::Value(RowArrayPtr array) {
    if (array != nullptr) {
        data_ = std::move(array);
    }
}

Value::Value(RelationPtr relation) {
    if (relation != nullptr) {
        data_ = std::move(relation);
    }
}

auto Value::as_double() const noexcept -> std::optional<double> {
    if (const auto* i = get_if<std::int64_t>()) {
        return static_cast<double>(*i);
    }
    if (const auto* d = get_if<double>()) {
        return *d;
    }
    return std::nullopt;
}

auto operator==(const Value& lhs, const Value& rhs) -> bool {
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    if (const auto* array = lhs.get_if<RowArrayPtr>()) {
        return **array == *rhs.as<RowArrayPtr>();
    }
    if (const auto* relation = lhs.get_if<RelationPtr>()) {
        return **relation == *rhs.as<RelationPtr>();
    }
    return lhs.storage() == rhs.storage();
}

auto kind_name(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Bool:
            return "bool";
        case ValueKind::Int:
            return "int";
        case ValueKind::Double:
            return "double";
        case ValueKind::String:
            return "string";
        case ValueKind::Array:
            return "array";
        case ValueKind::Relation:
            return "relation";
    }
    return "unknown";
}

auto compare_values(const Value& lhs, const Value& rhs) -> std::weak_ordering {
    int lhs_rank = kind_rank(lhs.kind());
    int rhs_rank = kind_rank(rhs.kind());
    if (lhs_rank != rhs_rank) {
        return lhs_rank <=> rhs_rank;
    }
    switch (lhs.kind()) {
        case ValueKind::Null:
            return std::weak_ordering::equivalent;
        case ValueKind::Bool:
            return lhs.as<bool>() <=> rhs.as<bool>();
        case ValueKind::Int:
        case ValueKind::Double:
            return compare_numbers(lhs, rhs);
        case ValueKind::String:
            return lhs.as<std::string>().compare(rhs.as<std::string>()) <=> 0;
        case ValueKind::Array:
        case ValueKind::Relation:
            return nested_size(lhs) <=> nested_size(rhs);
    }
    return std::weak_ordering::equivalent;
}

auto signature_string(const Value& value) -> std::expected<std::string, std::string> {
    switch (value.kind()) {
        case ValueKind::Null:
            return std::string{};
        case ValueKind::Bool:
            return value.as<bool>() ? std::string{"1"} : std::string{};
        case ValueKind::Int:
            return fmt::format("{}", value.as<std::int64_t>());
        case ValueKind::Double:
            return format_double(value.as<double>());
        case ValueKind::String:
            return value.as<std::string>();
        case ValueKind::Array:
        case ValueKind::Relation:
            break;
    }
    return std::unexpected(fmt::format("{} value has no string form", kind_name(value.kind())));
}

auto display_string(const Value& value) -> std::string {
    switch (value.kind()) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Bool:
            return value.as<bool>() ? "true" : "false";
        case ValueKind::Int:
            return fmt::format("{}", value.as<std::int64_t>());
        case ValueKind::Double:
            return format_double(value.as<double>());
        case ValueKind::String:
            return value.as<std::string>();
        case ValueKind::Array:
        case ValueKind::Relation:
            return fmt::format("[{} rows]", nested_size(value));
    }
    return {};
}

auto numeric_value(const Value& value) -> std::expected<Value, std::string> {
    switch (value.kind()) {
        case ValueKind::Null:
            return Value{std::int64_t{0}};
        case ValueKind::Bool:
            return Value{std::int64_t{value.as<bool>() ? 1 : 0}};
        case ValueKind::Int:
        case ValueKind::Double:
            return value;
        case ValueKind::String:
            return parse_number(value.as<std::string>());
        case ValueKind::Array:
        case ValueKind::Relation:
            break;
    }
    return std::unexpected(fmt::format("{} value is not numeric", kind_name(value.kind())));
}

}  // namespace tabula
