#pragma once

#include <tabula/core/relation.hpp>

#include <iostream>
#include <string>

namespace tabula::runtime {

/// Render `relation` as an aligned text table. Columns are the field names in
/// first-seen order across all rows; a field missing from a row prints empty.
void print(const Relation& relation, std::ostream& out = std::cout);

[[nodiscard]] auto format_relation(const Relation& relation) -> std::string;

}  // namespace tabula::runtime
