#include <csvq/csvq.hpp>

#include <fmt/core.h>

#include <iostream>
#include <string>
#include <variant>
#include <vector>

auto main() -> int {
    // Build a small dataset in memory
    csvq::Dataset products(std::vector<std::string>{"name", "price", "rating"});
    products.add_row({"iphone 15 pro", "999", "4.9"});
    products.add_row({"galaxy s23", "1199", "4.8"});
    products.add_row({"redmi note 12", "199", "4.6"});
    products.add_row({"poco x5 pro", "299", "4.4"});

    fmt::print("=== Value model ===\n");
    fmt::print("500 == 500.0: {}\n",
               csvq::compare_typed("500", "500.0") == csvq::Ordering::Equal);
    fmt::print("$500 < 100:   {}\n", csvq::compare_typed("$500", "100") == csvq::Ordering::Less);
    fmt::print("sort 9 before 10a: {}\n",
               csvq::sort_order(csvq::parse_typed("9"), csvq::parse_typed("10a")) ==
                   csvq::Ordering::Less);

    // Filter and sort through the pipeline
    fmt::print("\n=== price>250 ordered by rating ===\n");
    csvq::runtime::QueryText text{.where = "price>250", .order_by = "rating=desc"};
    auto query = csvq::runtime::parse_query(text);
    if (!query) {
        fmt::print("parse error: {}\n", query.error().format());
        return 1;
    }
    auto rows = csvq::runtime::run_query(products, *query);
    if (!rows) {
        fmt::print("query error: {}\n", csvq::runtime::describe(rows.error()));
        return 1;
    }
    csvq::ops::print(std::get<csvq::Dataset>(*rows), std::cout);

    // Aggregate
    fmt::print("\n=== average price ===\n");
    auto avg = csvq::runtime::run_query(products, csvq::runtime::QuerySpec{
        .aggregate = csvq::ir::AggregateSpec{.column = "price", .func = csvq::ir::AggFunc::Avg}});
    if (!avg) {
        fmt::print("query error: {}\n", csvq::runtime::describe(avg.error()));
        return 1;
    }
    fmt::print("{}\n", std::get<csvq::runtime::AggregateResult>(*avg).format());

    return 0;
}
