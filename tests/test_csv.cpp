#include <oryx/runtime/csv.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace oryx;

namespace {

using Strings = std::vector<std::string>;

auto write_file(const std::filesystem::path& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

auto read(const char* text, const runtime::CsvOptions& options = {}) -> Table {
    auto table = runtime::read_csv_string(text, options);
    REQUIRE(table.has_value());
    return std::move(*table);
}

auto values(const Table& t, std::string_view name) -> Strings {
    auto column = t.column(name);
    REQUIRE(column.has_value());
    Strings out;
    for (const auto& v : *column) {
        out.push_back(v.to_string());
    }
    return out;
}

}  // namespace

TEST_CASE("csv: column types are inferred", "[csv]") {
    auto t = read("id,price,flag,name,empty\n1,2.5,true,a,\n2,3,FALSE,b,\n");
    REQUIRE(t.num_columns() == 5);
    CHECK(t.schema[0].type == TypeKind::Int64);
    CHECK(t.schema[1].type == TypeKind::Double);
    CHECK(t.schema[2].type == TypeKind::Bool);
    CHECK(t.schema[3].type == TypeKind::String);
    CHECK(t.schema[4].type == TypeKind::String);
    CHECK(values(t, "price") == Strings{"2.5", "3"});
    CHECK(values(t, "flag") == Strings{"true", "false"});
    CHECK(values(t, "empty") == Strings{"NULL", "NULL"});
}

TEST_CASE("csv: empty fields are NULL but quoted empties are strings", "[csv]") {
    auto t = read("a,b\n1,\"\"\n,x\n");
    CHECK(t.schema[0].type == TypeKind::Int64);
    CHECK(values(t, "a") == Strings{"1", "NULL"});
    REQUIRE(t.rows[0][1].kind() == TypeKind::String);
    CHECK(t.rows[0][1].as_text().text.empty());
}

TEST_CASE("csv: quoted fields hold delimiters, quotes and newlines", "[csv]") {
    auto t = read("name,note\n\"Smith, J\",\"said \"\"hi\"\"\nthen left\"\r\n");
    REQUIRE(t.num_rows() == 1);
    CHECK(t.rows[0][0].as_text().text == "Smith, J");
    CHECK(t.rows[0][1].as_text().text == "said \"hi\"\nthen left");
}

TEST_CASE("csv: blank lines are skipped", "[csv]") {
    auto t = read("n\n1\n\n2\n\n");
    CHECK(values(t, "n") == Strings{"1", "2"});
}

TEST_CASE("csv: options", "[csv]") {
    runtime::CsvOptions options;
    options.delimiter = ';';
    options.null_tokens = {"NA"};
    auto t = read("a;b\n1;NA\n2;\n", options);
    CHECK(values(t, "b") == Strings{"NULL", ""});

    runtime::CsvOptions raw;
    raw.infer_types = false;
    auto s = read("n\n1\n", raw);
    CHECK(s.schema[0].type == TypeKind::String);
}

TEST_CASE("csv: malformed input is an io error", "[csv]") {
    auto ragged = runtime::read_csv_string("a,b\n1,2\n3\n");
    REQUIRE_FALSE(ragged.has_value());
    CHECK(ragged.error().kind == ErrorKind::Io);
    CHECK(ragged.error().op == "csv");
    CHECK(ragged.error().message == "csv record 3 has 1 fields, expected 2");

    auto unterminated = runtime::read_csv_string("a\n\"open\n");
    REQUIRE_FALSE(unterminated.has_value());
    CHECK(unterminated.error().kind == ErrorKind::Io);

    auto stray = runtime::read_csv_string("a\nx\"y\n");
    REQUIRE_FALSE(stray.has_value());

    auto empty = runtime::read_csv_string("");
    REQUIRE_FALSE(empty.has_value());
}

TEST_CASE("csv: reading from a file", "[csv]") {
    auto path = tmp("oryx_test_read.csv");
    write_file(path, "id,name\n1,alice\n2,bob\n");
    auto t = runtime::read_csv(path.string());
    REQUIRE(t.has_value());
    CHECK(values(*t, "name") == Strings{"alice", "bob"});
    std::filesystem::remove(path);

    auto missing = runtime::read_csv(tmp("oryx_missing.csv").string());
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().kind == ErrorKind::Io);
}

TEST_CASE("csv: writing quotes only where needed", "[csv]") {
    auto t = make_table({"id", "text"}, {{Value::int64(1), Value::string("plain")},
                                         {Value::null(), Value::string("a,\"b\"")},
                                         {Value::int64(3), Value::string("")}});
    std::ostringstream out;
    runtime::write_csv(t, out);
    CHECK(out.str() ==
          "id,text\n"
          "1,plain\n"
          ",\"a,\"\"b\"\"\"\n"
          "3,\"\"\n");

    auto back = read(out.str().c_str());
    CHECK(values(back, "id") == Strings{"1", "NULL", "3"});
    CHECK(back.rows[1][1].as_text().text == "a,\"b\"");
}
