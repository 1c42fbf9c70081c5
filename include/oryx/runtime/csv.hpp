#pragma once

#include <oryx/core/error.hpp>
#include <oryx/core/table.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace oryx::runtime {

struct CsvOptions {
    char delimiter = ',';
    /// Unquoted fields equal to one of these read as NULL.
    std::vector<std::string> null_tokens{""};
    /// When false every column is read as STRING.
    bool infer_types = true;
};

/// RFC 4180 CSV with a header row. Column types are inferred per column:
/// INT64, then DOUBLE, then BOOL (true/false), else STRING.
[[nodiscard]] auto read_csv(std::string_view path, const CsvOptions& options = {})
    -> Result<Table>;

[[nodiscard]] auto read_csv_string(std::string_view text, const CsvOptions& options = {})
    -> Result<Table>;

/// Writes a header row and one record per row; NULL is an empty field.
void write_csv(const Table& table, std::ostream& out, char delimiter = ',');

}  // namespace oryx::runtime
