#include <oryx/core/table.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>

namespace oryx {

namespace {

auto is_simple_identifier(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    auto first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && first != '_') {
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(), [](char c) {
        auto ch = static_cast<unsigned char>(c);
        return std::isalnum(ch) != 0 || ch == '_';
    });
}

auto quote_identifier(std::string_view name) -> std::string {
    if (is_simple_identifier(name)) {
        return std::string(name);
    }
    return fmt::format("`{}`", name);
}

}  // namespace

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

auto Schema::find_all(std::string_view name) const -> std::vector<std::size_t> {
    std::string_view qualifier;
    std::string_view column = name;
    if (auto dot = name.find('.'); dot != std::string_view::npos) {
        qualifier = name.substr(0, dot);
        column = name.substr(dot + 1);
    }
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        const auto& field = fields[i];
        if (!qualifier.empty()) {
            if (iequals(field.qualifier, qualifier) && iequals(field.name, column)) {
                out.push_back(i);
            }
        } else if (iequals(field.name, column)) {
            out.push_back(i);
        }
    }
    // A dotted name may also be a literal column name.
    if (out.empty() && !qualifier.empty()) {
        for (std::size_t i = 0; i < fields.size(); ++i) {
            if (iequals(fields[i].name, name)) {
                out.push_back(i);
            }
        }
    }
    return out;
}

auto Schema::resolve(std::string_view name) const -> Result<std::size_t> {
    auto matches = find_all(name);
    if (matches.empty()) {
        return make_error(ErrorKind::InvalidPlan,
                          fmt::format("column not found: {} (available: {})", name,
                                      format_columns(*this)));
    }
    if (matches.size() > 1) {
        return make_error(ErrorKind::TypeMismatch,
                          fmt::format("column reference is ambiguous: {}", name));
    }
    return matches.front();
}

auto Schema::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(fields.size());
    for (const auto& field : fields) {
        out.push_back(field.name);
    }
    return out;
}

auto Table::column(std::string_view name) const -> Result<std::vector<Value>> {
    auto index = schema.resolve(name);
    if (!index) {
        return std::unexpected(index.error());
    }
    std::vector<Value> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(row[*index]);
    }
    return out;
}

auto infer_column_type(const std::vector<Row>& rows, std::size_t column) -> TypeKind {
    for (const auto& row : rows) {
        if (column < row.size() && !row[column].is_null()) {
            return row[column].kind();
        }
    }
    return TypeKind::Null;
}

auto make_table(const std::vector<std::string>& names, std::vector<Row> rows) -> Table {
    Table table;
    table.schema.fields.reserve(names.size());
    for (std::size_t i = 0; i < names.size(); ++i) {
        table.schema.fields.push_back(Field{.name = names[i],
                                            .type = infer_column_type(rows, i),
                                            .nullable = true,
                                            .qualifier = {}});
    }
    table.rows = std::move(rows);
    return table;
}

auto format_columns(const Schema& schema) -> std::string {
    if (schema.empty()) {
        return "<none>";
    }
    std::string out;
    for (std::size_t i = 0; i < schema.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(quote_identifier(schema[i].name));
    }
    return out;
}

auto format_tables(const TableRegistry& registry) -> std::string {
    if (registry.empty()) {
        return "<none>";
    }
    std::vector<std::string_view> names;
    names.reserve(registry.size());
    for (const auto& entry : registry) {
        names.emplace_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return fmt::format("{}", fmt::join(names, ", "));
}

}  // namespace oryx
