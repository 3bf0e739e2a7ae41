#include <tabula/core/row.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace tabula {

Row::Row(std::initializer_list<Field> fields) {
    for (const auto& field : fields) {
        set(field.name, field.value);
    }
}

Row::Row(container_type fields) {
    for (auto& field : fields) {
        set(std::move(field.name), std::move(field.value));
    }
}

auto Row::fields() const noexcept -> const container_type& {
    static const container_type kEmpty;
    return fields_ != nullptr ? *fields_ : kEmpty;
}

auto Row::mutable_fields() -> container_type& {
    if (fields_ == nullptr) {
        fields_ = std::make_shared<container_type>();
    } else if (fields_.use_count() > 1) {
        // Detach before writing so rows sharing this storage are unaffected.
        fields_ = std::make_shared<container_type>(*fields_);
    }
    return *fields_;
}

auto Row::find(std::string_view name) const noexcept -> const Value* {
    const auto& all = fields();
    auto it = std::ranges::find_if(all, [name](const Field& f) { return f.name == name; });
    return it == all.end() ? nullptr : &it->value;
}

auto Row::at(std::string_view name) const -> const Value& {
    const auto* value = find(name);
    if (value == nullptr) {
        throw std::out_of_range(
            fmt::format("field not found: {} (available: {})", name, format_fields(*this)));
    }
    return *value;
}

void Row::set(std::string name, Value value) {
    auto& all = mutable_fields();
    auto it = std::ranges::find_if(all, [&name](const Field& f) { return f.name == name; });
    if (it != all.end()) {
        it->value = std::move(value);
        return;
    }
    all.push_back(Field{.name = std::move(name), .value = std::move(value)});
}

auto Row::erase(std::string_view name) -> bool {
    if (!contains(name)) {
        return false;
    }
    auto& all = mutable_fields();
    std::erase_if(all, [name](const Field& f) { return f.name == name; });
    return true;
}

auto Row::keys() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(size());
    for (const auto& field : fields()) {
        out.push_back(field.name);
    }
    return out;
}

auto operator==(const Row& lhs, const Row& rhs) -> bool {
    if (lhs.fields_ == rhs.fields_) {
        return true;
    }
    const auto& a = lhs.fields();
    const auto& b = rhs.fields();
    return std::ranges::equal(a, b, [](const Row::Field& x, const Row::Field& y) {
        return x.name == y.name && x.value == y.value;
    });
}

auto format_fields(const Row& row) -> std::string {
    if (row.empty()) {
        return "<none>";
    }
    std::string out;
    for (auto it = row.begin(); it != row.end(); ++it) {
        if (it != row.begin()) {
            out.append(", ");
        }
        out.append(it->name);
    }
    return out;
}

}  // namespace tabula
