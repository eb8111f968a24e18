#include <csvq/runtime/query.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace csvq::runtime {

namespace {

auto render(const ir::FilterSpec& spec) -> std::string {
    return fmt::format("{}{}{}", spec.column, ir::to_string(spec.op), spec.operand);
}

auto render(const ir::SortSpec& spec) -> std::string {
    return fmt::format("{}={}", spec.column, ir::to_string(spec.direction));
}

auto render(const ir::AggregateSpec& spec) -> std::string {
    return fmt::format("{}={}", spec.column, ir::to_string(spec.func));
}

}  // namespace

auto AggregateResult::format() const -> std::string {
    return fmt::format("{} of {} = {}", ir::to_string(spec.func), spec.column,
                       ops::format_number(value));
}

auto parse_query(const QueryText& text) -> std::expected<QuerySpec, parser::ParseError> {
    QuerySpec query;
    if (text.where.has_value()) {
        auto spec = parser::parse_filter(*text.where);
        if (!spec) {
            return std::unexpected(std::move(spec.error()));
        }
        query.where = std::move(*spec);
    }
    if (text.order_by.has_value()) {
        auto spec = parser::parse_order_by(*text.order_by);
        if (!spec) {
            return std::unexpected(std::move(spec.error()));
        }
        query.order_by = std::move(*spec);
    }
    if (text.aggregate.has_value()) {
        auto spec = parser::parse_aggregate(*text.aggregate);
        if (!spec) {
            return std::unexpected(std::move(spec.error()));
        }
        query.aggregate = std::move(*spec);
    }
    return query;
}

auto validate_query(const QuerySpec& query, const std::vector<std::string>& header)
    -> std::expected<void, parser::ParseError> {
    if (query.where.has_value()) {
        auto ok = parser::validate_column(query.where->column, header, render(*query.where));
        if (!ok) {
            return ok;
        }
    }
    if (query.order_by.has_value()) {
        auto ok =
            parser::validate_column(query.order_by->column, header, render(*query.order_by));
        if (!ok) {
            return ok;
        }
    }
    if (query.aggregate.has_value()) {
        auto ok =
            parser::validate_column(query.aggregate->column, header, render(*query.aggregate));
        if (!ok) {
            return ok;
        }
    }
    return {};
}

auto run_query(const Dataset& input, const QuerySpec& query)
    -> std::expected<QueryResult, QueryError> {
    if (auto ok = validate_query(query, input.columns()); !ok) {
        return std::unexpected(QueryError{std::move(ok.error())});
    }

    // Fixed stage order: filter, then sort, then aggregate.
    Dataset current = input;
    if (query.where.has_value()) {
        current = ops::filter(current, *query.where);
    }
    if (query.order_by.has_value()) {
        current = ops::order(current, *query.order_by);
    }
    if (!query.aggregate.has_value()) {
        return QueryResult{std::move(current)};
    }

    auto value = ops::aggregate(current, *query.aggregate);
    if (!value) {
        return std::unexpected(QueryError{std::move(value.error())});
    }
    spdlog::debug("aggregate {}: {} over {} rows", render(*query.aggregate), *value,
                  current.row_count());
    return QueryResult{AggregateResult{
        .spec = *query.aggregate,
        .value = *value,
        .count = current.row_count(),
    }};
}

auto describe(const QueryError& error) -> std::string {
    return std::visit([](const auto& e) { return e.format(); }, error);
}

}  // namespace csvq::runtime
