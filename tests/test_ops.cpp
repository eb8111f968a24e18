#include <csvq/runtime/ops.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using csvq::Dataset;
using csvq::ir::AggFunc;
using csvq::ir::CompareOp;
using csvq::ir::SortDirection;

auto make_products() -> Dataset {
    Dataset data(std::vector<std::string>{"name", "price", "rating"});
    data.add_row({"A", "500", "4.7"});
    data.add_row({"B", "800", "4.9"});
    data.add_row({"C", "500", "4.5"});
    return data;
}

auto column_values(const Dataset& data, const char* name) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (std::size_t r = 0; r < data.row_count(); ++r) {
        out.push_back(data.cell(r, name));
    }
    return out;
}

using Names = std::vector<std::string>;

}  // namespace

// ─── filter ───────────────────────────────────────────────────────────────────

TEST_CASE("filter keeps rows greater than a numeric operand", "[ops][filter]") {
    auto out = csvq::ops::filter(make_products(), {.column = "price", .op = CompareOp::Gt,
                                                   .operand = "500"});
    REQUIRE(column_values(out, "name") == Names{"B"});
}

TEST_CASE("filter less-than and equality", "[ops][filter]") {
    auto data = make_products();

    auto lt = csvq::ops::filter(data, {.column = "rating", .op = CompareOp::Lt, .operand = "4.8"});
    REQUIRE(column_values(lt, "name") == Names{"A", "C"});

    auto eq = csvq::ops::filter(data, {.column = "name", .op = CompareOp::Eq, .operand = "B"});
    REQUIRE(column_values(eq, "name") == Names{"B"});
}

TEST_CASE("filter equality on numbers is numeric, not textual", "[ops][filter]") {
    auto data = make_products();
    auto out = csvq::ops::filter(data, {.column = "price", .op = CompareOp::Eq,
                                        .operand = "500.0"});
    REQUIRE(column_values(out, "name") == Names{"A", "C"});
}

TEST_CASE("filter on strings is case-sensitive", "[ops][filter]") {
    Dataset data(std::vector<std::string>{"brand"});
    data.add_row({"apple"});
    data.add_row({"Apple"});
    data.add_row({"samsung"});

    auto out = csvq::ops::filter(data, {.column = "brand", .op = CompareOp::Eq,
                                        .operand = "apple"});
    REQUIRE(column_values(out, "brand") == Names{"apple"});

    auto after = csvq::ops::filter(data, {.column = "brand", .op = CompareOp::Gt,
                                          .operand = "apple"});
    REQUIRE(column_values(after, "brand") == Names{"samsung"});
}

TEST_CASE("filter preserves input order and header", "[ops][filter]") {
    Dataset data(std::vector<std::string>{"id", "v"});
    for (int i = 0; i < 10; ++i) {
        data.add_row({std::to_string(i), std::to_string((i * 7) % 10)});
    }
    auto out = csvq::ops::filter(data, {.column = "v", .op = CompareOp::Gt, .operand = "4"});

    REQUIRE(out.columns() == data.columns());
    auto ids = column_values(out, "id");
    REQUIRE(std::is_sorted(ids.begin(), ids.end(),
                           [](const std::string& l, const std::string& r) {
                               return std::stoi(l) < std::stoi(r);
                           }));
    for (std::size_t r = 0; r < out.row_count(); ++r) {
        REQUIRE(std::stoi(out.cell(r, "v")) > 4);
    }
}

TEST_CASE("filter with no match returns an empty dataset", "[ops][filter]") {
    auto out = csvq::ops::filter(make_products(), {.column = "price", .op = CompareOp::Gt,
                                                   .operand = "9999"});
    REQUIRE(out.empty());
    REQUIRE(out.columns() == Names{"name", "price", "rating"});
}

TEST_CASE("filter with a text operand on a numeric column", "[ops][filter]") {
    // Mixed pairs compare as text: '5' and '8' sort before 'a'.
    auto data = make_products();
    auto gt = csvq::ops::filter(data, {.column = "price", .op = CompareOp::Gt, .operand = "abc"});
    REQUIRE(gt.empty());
    auto lt = csvq::ops::filter(data, {.column = "price", .op = CompareOp::Lt, .operand = "abc"});
    REQUIRE(lt.row_count() == 3);
}

TEST_CASE("filter compares mixed cells as text", "[ops][filter]") {
    Dataset data(std::vector<std::string>{"id", "price"});
    data.add_row({"1", "$500"});
    data.add_row({"2", "50"});
    data.add_row({"3", "500"});

    auto lt = csvq::ops::filter(data, {.column = "price", .op = CompareOp::Lt, .operand = "100"});
    REQUIRE(column_values(lt, "id") == Names{"1", "2"});

    Dataset codes(std::vector<std::string>{"code"});
    codes.add_row({"9"});
    codes.add_row({"10"});
    codes.add_row({"10b"});
    auto gt = csvq::ops::filter(codes, {.column = "code", .op = CompareOp::Gt, .operand = "10a"});
    REQUIRE(column_values(gt, "code") == Names{"9", "10b"});
}

TEST_CASE("stages reject a column the dataset does not have", "[ops]") {
    auto data = make_products();
    REQUIRE_THROWS_AS(
        csvq::ops::filter(data, {.column = "cost", .op = CompareOp::Eq, .operand = "1"}),
        std::out_of_range);
    REQUIRE_THROWS_AS(csvq::ops::order(data, {.column = "cost"}), std::out_of_range);
    REQUIRE_THROWS_AS(csvq::ops::aggregate(data, {.column = "cost", .func = AggFunc::Avg}),
                      std::out_of_range);
    REQUIRE_THROWS_AS(
        csvq::ops::aggregate(data.empty_like(), {.column = "cost", .func = AggFunc::Min}),
        std::out_of_range);
}

// ─── order ────────────────────────────────────────────────────────────────────

TEST_CASE("order is stable for equal keys", "[ops][order]") {
    auto data = make_products();

    auto asc = csvq::ops::order(data, {.column = "price", .direction = SortDirection::Asc});
    REQUIRE(column_values(asc, "name") == Names{"A", "C", "B"});

    auto desc = csvq::ops::order(data, {.column = "price", .direction = SortDirection::Desc});
    REQUIRE(column_values(desc, "name") == Names{"B", "A", "C"});
}

TEST_CASE("order sorts numeric columns numerically", "[ops][order]") {
    Dataset data(std::vector<std::string>{"n"});
    for (const char* v : {"10", "9", "100", "-1", "2.5"}) {
        data.add_row({v});
    }
    auto out = csvq::ops::order(data, {.column = "n", .direction = SortDirection::Asc});
    REQUIRE(column_values(out, "n") == Names{"-1", "2.5", "9", "10", "100"});
}

TEST_CASE("order sorts text columns lexicographically", "[ops][order]") {
    Dataset data(std::vector<std::string>{"s"});
    for (const char* v : {"pear", "Apple", "apple", "banana"}) {
        data.add_row({v});
    }
    auto out = csvq::ops::order(data, {.column = "s", .direction = SortDirection::Asc});
    REQUIRE(column_values(out, "s") == Names{"Apple", "apple", "banana", "pear"});
}

TEST_CASE("order puts numbers before strings in a mixed column", "[ops][order]") {
    Dataset data(std::vector<std::string>{"m"});
    for (const char* v : {"b", "10", "a", "9", "N/A"}) {
        data.add_row({v});
    }
    auto asc = csvq::ops::order(data, {.column = "m", .direction = SortDirection::Asc});
    REQUIRE(column_values(asc, "m") == Names{"9", "10", "N/A", "a", "b"});

    auto desc = csvq::ops::order(data, {.column = "m", .direction = SortDirection::Desc});
    REQUIRE(column_values(desc, "m") == Names{"b", "a", "N/A", "10", "9"});
}

TEST_CASE("descending order is the reverse of ascending for distinct keys", "[ops][order]") {
    Dataset data(std::vector<std::string>{"k"});
    for (const char* v : {"3", "x", "1.5", "20", "abc", "-4"}) {
        data.add_row({v});
    }
    auto asc = column_values(csvq::ops::order(data, {.column = "k"}), "k");
    auto desc = column_values(
        csvq::ops::order(data, {.column = "k", .direction = SortDirection::Desc}), "k");
    std::reverse(asc.begin(), asc.end());
    REQUIRE(asc == desc);
}

TEST_CASE("order leaves the input untouched", "[ops][order]") {
    auto data = make_products();
    auto out = csvq::ops::order(data, {.column = "rating", .direction = SortDirection::Desc});
    REQUIRE(column_values(out, "name") == Names{"B", "A", "C"});
    REQUIRE(column_values(data, "name") == Names{"A", "B", "C"});
}

// ─── aggregate ────────────────────────────────────────────────────────────────

TEST_CASE("aggregate avg, min and max", "[ops][aggregate]") {
    auto data = make_products();

    auto avg = csvq::ops::aggregate(data, {.column = "price", .func = AggFunc::Avg});
    REQUIRE(avg.has_value());
    REQUIRE(*avg == Catch::Approx(600.0));

    auto min = csvq::ops::aggregate(data, {.column = "rating", .func = AggFunc::Min});
    REQUIRE(min.has_value());
    REQUIRE(*min == 4.5);

    auto max = csvq::ops::aggregate(data, {.column = "rating", .func = AggFunc::Max});
    REQUIRE(max.has_value());
    REQUIRE(*max == 4.9);
}

TEST_CASE("aggregate avg of a single row is that value", "[ops][aggregate]") {
    Dataset data(std::vector<std::string>{"x"});
    data.add_row({"0.1"});
    auto avg = csvq::ops::aggregate(data, {.column = "x", .func = AggFunc::Avg});
    REQUIRE(avg.has_value());
    REQUIRE(*avg == 0.1);
}

TEST_CASE("aggregate rejects an empty dataset", "[ops][aggregate]") {
    Dataset data(std::vector<std::string>{"x"});
    auto result = csvq::ops::aggregate(data, {.column = "x", .func = AggFunc::Avg});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == csvq::ops::AggregationErrorKind::EmptyInput);
}

TEST_CASE("aggregate rejects non-numeric cells without skipping", "[ops][aggregate]") {
    Dataset data(std::vector<std::string>{"x"});
    data.add_row({"1"});
    data.add_row({"N/A"});
    data.add_row({"3"});

    auto result = csvq::ops::aggregate(data, {.column = "x", .func = AggFunc::Max});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == csvq::ops::AggregationErrorKind::NonNumericColumn);
    REQUIRE(result.error().column == "x");
    REQUIRE(result.error().format().find("'N/A'") != std::string::npos);
}

// ─── rendering ────────────────────────────────────────────────────────────────

TEST_CASE("format_number uses the shortest form", "[ops][print]") {
    REQUIRE(csvq::ops::format_number(600.0) == "600");
    REQUIRE(csvq::ops::format_number(4.9) == "4.9");
    REQUIRE(csvq::ops::format_number(-0.25) == "-0.25");
}

TEST_CASE("print aligns columns", "[ops][print]") {
    std::ostringstream out;
    csvq::ops::print(make_products(), out);
    REQUIRE(out.str() ==
            "name  price  rating\n"
            "----  -----  ------\n"
            "A     500    4.7   \n"
            "B     800    4.9   \n"
            "C     500    4.5   \n");
}

TEST_CASE("print of an empty dataset", "[ops][print]") {
    std::ostringstream out;
    csvq::ops::print(make_products().empty_like(), out);
    REQUIRE(out.str() == "(no rows)\n");
}
