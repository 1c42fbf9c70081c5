#include <oryx/runtime/csv.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

namespace oryx::runtime {

namespace {

struct CsvField {
    std::string text;
    bool quoted = false;
};

using CsvRecord = std::vector<CsvField>;

auto io_error(std::string message) -> std::unexpected<Error> {
    return make_error(ErrorKind::Io, std::move(message), "csv");
}

/// Splits `text` into records. Quoted fields may contain delimiters, doubled
/// quotes and line breaks; CRLF and LF both end a record.
auto parse_records(std::string_view text, char delimiter) -> Result<std::vector<CsvRecord>> {
    std::vector<CsvRecord> records;
    CsvRecord record;
    CsvField field;
    bool in_quotes = false;
    bool field_started = false;
    std::size_t line = 1;

    auto end_field = [&] {
        record.push_back(std::move(field));
        field = CsvField{};
        field_started = false;
    };
    auto end_record = [&] {
        end_field();
        bool blank = record.size() == 1 && !record.front().quoted && record.front().text.empty();
        if (!blank) {
            records.push_back(std::move(record));
        }
        record.clear();
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.text.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                field.text.push_back(c);
            }
            continue;
        }
        if (c == '"') {
            if (field_started) {
                return io_error(fmt::format("unexpected quote inside an unquoted field on line {}",
                                            line));
            }
            in_quotes = true;
            field.quoted = true;
            field_started = true;
        } else if (c == delimiter) {
            end_field();
        } else if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        } else if (c == '\n') {
            end_record();
            ++line;
        } else {
            if (field.quoted) {
                return io_error(fmt::format("text after a closing quote on line {}", line));
            }
            field.text.push_back(c);
            field_started = true;
        }
    }
    if (in_quotes) {
        return io_error("unterminated quoted field");
    }
    if (field_started || !record.empty()) {
        end_record();
    }
    return records;
}

auto parse_int(std::string_view text) -> std::optional<std::int64_t> {
    std::int64_t out = 0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return out;
}

auto parse_double(const std::string& text) -> std::optional<double> {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        return std::nullopt;
    }
    char* end = nullptr;
    double out = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return out;
}

auto parse_bool(std::string_view text) -> std::optional<bool> {
    if (iequals(text, "true")) {
        return true;
    }
    if (iequals(text, "false")) {
        return false;
    }
    return std::nullopt;
}

auto is_null_token(const CsvField& field, const CsvOptions& options) -> bool {
    return !field.quoted && std::ranges::find(options.null_tokens, field.text) !=
                                options.null_tokens.end();
}

auto infer_type(const std::vector<CsvRecord>& records, std::size_t column,
                const CsvOptions& options) -> TypeKind {
    if (!options.infer_types) {
        return TypeKind::String;
    }
    bool all_int = true;
    bool all_double = true;
    bool all_bool = true;
    bool any = false;
    for (std::size_t r = 1; r < records.size(); ++r) {
        const auto& field = records[r][column];
        if (is_null_token(field, options)) {
            continue;
        }
        any = true;
        all_int = all_int && parse_int(field.text).has_value();
        all_double = all_double && parse_double(field.text).has_value();
        all_bool = all_bool && parse_bool(field.text).has_value();
    }
    if (!any) {
        return TypeKind::String;
    }
    if (all_int) {
        return TypeKind::Int64;
    }
    if (all_double) {
        return TypeKind::Double;
    }
    return all_bool ? TypeKind::Bool : TypeKind::String;
}

auto convert(const CsvField& field, TypeKind type, const CsvOptions& options) -> Value {
    if (is_null_token(field, options)) {
        return Value::null();
    }
    switch (type) {
        case TypeKind::Int64:
            return Value::int64(*parse_int(field.text));
        case TypeKind::Double:
            return Value::float64(*parse_double(field.text));
        case TypeKind::Bool:
            return Value::boolean(*parse_bool(field.text));
        default:
            return Value::string(field.text);
    }
}

auto needs_quotes(std::string_view text, char delimiter) -> bool {
    return text.empty() || text.find_first_of(std::string{delimiter, '"', '\n', '\r'}) !=
                               std::string_view::npos;
}

void write_field(std::ostream& out, const Value& value, char delimiter) {
    if (value.is_null()) {
        return;
    }
    std::string text =
        value.kind() == TypeKind::String ? value.as_text().text : value.to_string();
    if (!needs_quotes(text, delimiter)) {
        out << text;
        return;
    }
    out << '"';
    for (char c : text) {
        if (c == '"') {
            out << '"';
        }
        out << c;
    }
    out << '"';
}

}  // namespace

auto read_csv_string(std::string_view text, const CsvOptions& options) -> Result<Table> {
    auto records = parse_records(text, options.delimiter);
    if (!records) {
        return std::unexpected(records.error());
    }
    if (records->empty()) {
        return io_error("csv has no header row");
    }
    const auto& header = records->front();
    for (std::size_t r = 1; r < records->size(); ++r) {
        if ((*records)[r].size() != header.size()) {
            return io_error(fmt::format("csv record {} has {} fields, expected {}", r + 1,
                                        (*records)[r].size(), header.size()));
        }
    }
    Table table;
    std::vector<TypeKind> types;
    for (std::size_t c = 0; c < header.size(); ++c) {
        types.push_back(infer_type(*records, c, options));
        table.schema.fields.push_back(Field{.name = header[c].text, .type = types.back()});
    }
    table.rows.reserve(records->size() - 1);
    for (std::size_t r = 1; r < records->size(); ++r) {
        Row row;
        row.reserve(header.size());
        for (std::size_t c = 0; c < header.size(); ++c) {
            row.push_back(convert((*records)[r][c], types[c], options));
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

auto read_csv(std::string_view path, const CsvOptions& options) -> Result<Table> {
    std::ifstream input{std::string(path), std::ios::binary};
    if (!input) {
        return io_error(fmt::format("failed to open csv: {}", path));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto table = read_csv_string(buffer.str(), options);
    if (!table) {
        auto error = std::move(table.error());
        error.message = fmt::format("{}: {}", path, error.message);
        return std::unexpected(std::move(error));
    }
    return table;
}

void write_csv(const Table& table, std::ostream& out, char delimiter) {
    for (std::size_t c = 0; c < table.num_columns(); ++c) {
        if (c > 0) {
            out << delimiter;
        }
        write_field(out, Value::string(table.schema[c].name), delimiter);
    }
    out << '\n';
    for (const auto& row : table.rows) {
        for (std::size_t c = 0; c < row.size(); ++c) {
            if (c > 0) {
                out << delimiter;
            }
            write_field(out, row[c], delimiter);
        }
        out << '\n';
    }
}

}  // namespace oryx::runtime
