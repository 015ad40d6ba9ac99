// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
//    this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.

/**
 * @file clause_builder.h
 * @brief Builds parameterised WHERE / ORDER BY / LIMIT clauses
 *
 * Values never appear in the produced SQL text; every value becomes a '?'
 * placeholder and is appended to the parameter list in the order the
 * placeholders appear. Column names are inserted verbatim and must come
 * from trusted code, never from user input.
 *
 * Usage Example:
 * @code
 * using namespace edge_database::query;
 *
 * query_options options;
 * options.where = { { "status", comparison_operator::equal, "active" },
 *                   { "role", comparison_operator::in, value_list{ "admin", "owner" } } };
 * options.order_by = { { "created_at", sort_direction::desc } };
 * options.limit = 20;
 *
 * auto select = build_select("users", options);
 * // select.sql == "SELECT * FROM users WHERE status = ? AND role IN (?, ?)
 * //                ORDER BY created_at DESC LIMIT 20"
 * @endcode
 */

#pragma once

#include <kcenon/edge_database/core/query_types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace edge_database::query
{

/**
 * @enum comparison_operator
 */
enum class comparison_operator
{
	equal,
	not_equal,
	greater,
	less,
	greater_equal,
	less_equal,
	like,
	in,
	not_in,
	is_null,
	is_not_null
};

/**
 * @brief SQL spelling of an operator ("=", "NOT IN", "IS NULL", ...)
 */
constexpr const char* to_string(comparison_operator op) noexcept
{
	switch (op)
	{
	case comparison_operator::equal:
		return "=";
	case comparison_operator::not_equal:
		return "!=";
	case comparison_operator::greater:
		return ">";
	case comparison_operator::less:
		return "<";
	case comparison_operator::greater_equal:
		return ">=";
	case comparison_operator::less_equal:
		return "<=";
	case comparison_operator::like:
		return "LIKE";
	case comparison_operator::in:
		return "IN";
	case comparison_operator::not_in:
		return "NOT IN";
	case comparison_operator::is_null:
		return "IS NULL";
	case comparison_operator::is_not_null:
		return "IS NOT NULL";
	default:
		return "=";
	}
}

/**
 * @brief Parses an operator from its SQL spelling (case-insensitive).
 * @return The operator, or nullopt for anything outside the fixed set.
 */
std::optional<comparison_operator> parse_operator(std::string_view text);

/// Values for IN / NOT IN.
using value_list = std::vector<sql_value>;

/// Operand of a condition: a single value or a list for IN / NOT IN.
using condition_value = std::variant<sql_value, value_list>;

/**
 * @struct where_condition
 * @brief One "column operator value" predicate
 *
 * The value is ignored for IS NULL / IS NOT NULL.
 */
struct where_condition
{
	std::string column;
	comparison_operator op{ comparison_operator::equal };
	condition_value value;
};

/**
 * @enum sort_direction
 */
enum class sort_direction
{
	asc,
	desc
};

constexpr const char* to_string(sort_direction direction) noexcept
{
	return direction == sort_direction::desc ? "DESC" : "ASC";
}

/**
 * @struct order_by_clause
 */
struct order_by_clause
{
	std::string column;
	sort_direction direction{ sort_direction::asc };
};

/**
 * @enum join_type
 */
enum class join_type
{
	inner,
	left,
	right,
	full
};

constexpr const char* to_string(join_type type) noexcept
{
	switch (type)
	{
	case join_type::inner:
		return "INNER";
	case join_type::left:
		return "LEFT";
	case join_type::right:
		return "RIGHT";
	case join_type::full:
		return "FULL";
	default:
		return "INNER";
	}
}

/**
 * @struct join_clause
 * @brief "<type> JOIN table ON condition"; the condition is trusted SQL text
 */
struct join_clause
{
	join_type type{ join_type::inner };
	std::string table;
	std::string on;
};

/**
 * @struct query_options
 * @brief Filtering, ordering, paging and joins for a SELECT
 */
struct query_options
{
	std::vector<where_condition> where;
	std::vector<order_by_clause> order_by;
	std::optional<uint64_t> limit;
	std::optional<uint64_t> offset;
	std::vector<join_clause> joins;
};

/**
 * @struct where_result
 * @brief Clause text and the parameters its placeholders consume
 */
struct where_result
{
	std::string clause; ///< "WHERE ..." or empty
	query_params params;
};

/**
 * @brief Builds a WHERE clause.
 *
 * Conditions are joined with " AND ". IN / NOT IN expand to one
 * placeholder per list element; an empty list yields "IN ()", which the
 * store rejects, so callers must not pass one. An empty condition list
 * yields an empty clause and no parameters.
 */
where_result build_where_clause(const std::vector<where_condition>& conditions);

/**
 * @brief Builds "ORDER BY a ASC, b DESC", or an empty string.
 */
std::string build_order_by_clause(const std::vector<order_by_clause>& order_by);

/**
 * @brief Builds "LIMIT n", "OFFSET m", "LIMIT n OFFSET m", or an empty string.
 */
std::string build_limit_clause(std::optional<uint64_t> limit, std::optional<uint64_t> offset);

/**
 * @brief Builds "LEFT JOIN t ON ..." clauses separated by spaces.
 */
std::string build_join_clause(const std::vector<join_clause>& joins);

/**
 * @brief Builds "SELECT * FROM table [joins] [where] [order by] [limit]".
 */
query_descriptor build_select(const std::string& table, const query_options& options = {});

/**
 * @brief Builds "SELECT COUNT(*) as count FROM table [where]".
 */
query_descriptor build_count(const std::string& table,
							 const std::vector<where_condition>& where = {});

} // namespace edge_database::query
