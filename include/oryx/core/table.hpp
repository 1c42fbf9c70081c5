#pragma once

#include <oryx/core/error.hpp>
#include <oryx/core/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace oryx {

/// One schema entry. `qualifier` is the range variable the column came from
/// (table alias), empty once a projection renames it.
struct Field {
    std::string name;
    TypeKind type = TypeKind::Null;
    bool nullable = true;
    std::string qualifier;
};

/// Ordered column list; names need not be unique.
struct Schema {
    std::vector<Field> fields;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return fields.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return fields.empty(); }
    [[nodiscard]] auto operator[](std::size_t i) const -> const Field& { return fields[i]; }

    /// Case-insensitive lookup of `name` or `qualifier.name`. Fails with
    /// InvalidPlan when absent and TypeMismatch when ambiguous.
    [[nodiscard]] auto resolve(std::string_view name) const -> Result<std::size_t>;

    /// All positions whose name matches `name` case-insensitively.
    [[nodiscard]] auto find_all(std::string_view name) const -> std::vector<std::size_t>;

    [[nodiscard]] auto names() const -> std::vector<std::string>;
};

/// Sort order recorded on a table after ORDER BY.
struct ColumnOrder {
    std::size_t column = 0;
    bool ascending = true;
    bool nulls_first = true;
};

struct Table {
    Schema schema;
    std::vector<Row> rows;
    std::optional<std::vector<ColumnOrder>> ordering;

    [[nodiscard]] auto num_rows() const noexcept -> std::size_t { return rows.size(); }
    [[nodiscard]] auto num_columns() const noexcept -> std::size_t { return schema.size(); }

    /// Values of one column, by name. Intended for inspection and tests.
    [[nodiscard]] auto column(std::string_view name) const -> Result<std::vector<Value>>;
};

using TableRegistry = std::unordered_map<std::string, Table>;

/// Builds a table from column names and rows, inferring each column's type
/// from its first non-NULL value.
[[nodiscard]] auto make_table(const std::vector<std::string>& names, std::vector<Row> rows)
    -> Table;

/// Type of the first non-NULL value in `column`, or Null.
[[nodiscard]] auto infer_column_type(const std::vector<Row>& rows, std::size_t column) -> TypeKind;

/// Case-insensitive ASCII identifier comparison.
[[nodiscard]] auto iequals(std::string_view a, std::string_view b) noexcept -> bool;

/// "a, b, `odd name`" or "<none>", for error messages.
[[nodiscard]] auto format_columns(const Schema& schema) -> std::string;
[[nodiscard]] auto format_tables(const TableRegistry& registry) -> std::string;

}  // namespace oryx
