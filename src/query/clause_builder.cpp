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

#include <kcenon/edge_database/query/clause_builder.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace edge_database::query
{

namespace
{

std::string to_upper(std::string_view text)
{
	std::string upper(text);
	std::transform(upper.begin(), upper.end(), upper.begin(),
				   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	return upper;
}

/// Appends the non-empty parts separated by single spaces.
std::string join_parts(const std::vector<std::string>& parts)
{
	std::string joined;
	for (const auto& part : parts)
	{
		if (part.empty())
		{
			continue;
		}
		if (!joined.empty())
		{
			joined += ' ';
		}
		joined += part;
	}
	return joined;
}

void append_list_condition(const where_condition& condition,
						   std::ostringstream& clause,
						   query_params& params)
{
	clause << condition.column << " " << to_string(condition.op) << " (";

	if (const auto* list = std::get_if<value_list>(&condition.value))
	{
		for (size_t i = 0; i < list->size(); ++i)
		{
			clause << (i == 0 ? "?" : ", ?");
			params.push_back((*list)[i]);
		}
	}
	else
	{
		// A single value is treated as a one-element list
		clause << "?";
		params.push_back(std::get<sql_value>(condition.value));
	}

	clause << ")";
}

} // namespace

std::optional<comparison_operator> parse_operator(std::string_view text)
{
	const auto op = to_upper(text);

	if (op == "=")
	{
		return comparison_operator::equal;
	}
	if (op == "!=")
	{
		return comparison_operator::not_equal;
	}
	if (op == ">")
	{
		return comparison_operator::greater;
	}
	if (op == "<")
	{
		return comparison_operator::less;
	}
	if (op == ">=")
	{
		return comparison_operator::greater_equal;
	}
	if (op == "<=")
	{
		return comparison_operator::less_equal;
	}
	if (op == "LIKE")
	{
		return comparison_operator::like;
	}
	if (op == "IN")
	{
		return comparison_operator::in;
	}
	if (op == "NOT IN")
	{
		return comparison_operator::not_in;
	}
	if (op == "IS NULL")
	{
		return comparison_operator::is_null;
	}
	if (op == "IS NOT NULL")
	{
		return comparison_operator::is_not_null;
	}
	return std::nullopt;
}

where_result build_where_clause(const std::vector<where_condition>& conditions)
{
	where_result result;
	if (conditions.empty())
	{
		return result;
	}

	std::ostringstream clause;
	clause << "WHERE ";

	for (size_t i = 0; i < conditions.size(); ++i)
	{
		const auto& condition = conditions[i];
		if (i > 0)
		{
			clause << " AND ";
		}

		switch (condition.op)
		{
		case comparison_operator::is_null:
		case comparison_operator::is_not_null:
			clause << condition.column << " " << to_string(condition.op);
			break;
		case comparison_operator::in:
		case comparison_operator::not_in:
			append_list_condition(condition, clause, result.params);
			break;
		default:
			clause << condition.column << " " << to_string(condition.op) << " ?";
			if (const auto* value = std::get_if<sql_value>(&condition.value))
			{
				result.params.push_back(*value);
			}
			else
			{
				// Lists only make sense for IN; bind the first element
				const auto& list = std::get<value_list>(condition.value);
				result.params.push_back(list.empty() ? sql_value{} : list.front());
			}
			break;
		}
	}

	result.clause = clause.str();
	return result;
}

std::string build_order_by_clause(const std::vector<order_by_clause>& order_by)
{
	if (order_by.empty())
	{
		return "";
	}

	std::string clause = "ORDER BY ";
	for (size_t i = 0; i < order_by.size(); ++i)
	{
		if (i > 0)
		{
			clause += ", ";
		}
		clause += order_by[i].column;
		clause += ' ';
		clause += to_string(order_by[i].direction);
	}
	return clause;
}

std::string build_limit_clause(std::optional<uint64_t> limit, std::optional<uint64_t> offset)
{
	std::vector<std::string> parts;
	if (limit)
	{
		parts.push_back("LIMIT " + std::to_string(*limit));
	}
	if (offset)
	{
		parts.push_back("OFFSET " + std::to_string(*offset));
	}
	return join_parts(parts);
}

std::string build_join_clause(const std::vector<join_clause>& joins)
{
	std::vector<std::string> parts;
	parts.reserve(joins.size());
	for (const auto& join : joins)
	{
		parts.push_back(std::string(to_string(join.type)) + " JOIN " + join.table + " ON "
						+ join.on);
	}
	return join_parts(parts);
}

query_descriptor build_select(const std::string& table, const query_options& options)
{
	auto where = build_where_clause(options.where);

	query_descriptor descriptor;
	descriptor.sql = join_parts({ "SELECT * FROM " + table,
								  build_join_clause(options.joins),
								  where.clause,
								  build_order_by_clause(options.order_by),
								  build_limit_clause(options.limit, options.offset) });
	descriptor.params = std::move(where.params);
	return descriptor;
}

query_descriptor build_count(const std::string& table, const std::vector<where_condition>& where)
{
	auto clause = build_where_clause(where);

	query_descriptor descriptor;
	descriptor.sql = join_parts({ "SELECT COUNT(*) as count FROM " + table, clause.clause });
	descriptor.params = std::move(clause.params);
	return descriptor;
}

} // namespace edge_database::query
