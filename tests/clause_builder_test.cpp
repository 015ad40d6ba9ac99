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
 * @file clause_builder_test.cpp
 * @brief Unit tests for SQL clause construction
 *
 * Tests cover:
 * - WHERE rendering for every operator and parameter ordering
 * - ORDER BY, LIMIT / OFFSET and JOIN rendering
 * - SELECT and COUNT composition
 * - Operator parsing
 */

#include <gtest/gtest.h>

#include <kcenon/edge_database/query/clause_builder.h>

#include <string>

using namespace edge_database;
using namespace edge_database::query;

namespace
{

where_condition condition(std::string column, comparison_operator op, sql_value value)
{
	return { std::move(column), op, condition_value{ std::move(value) } };
}

where_condition list_condition(std::string column, comparison_operator op, value_list values)
{
	return { std::move(column), op, condition_value{ std::move(values) } };
}

} // namespace

class ClauseBuilderTest : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}
};

// ============================================================================
// WHERE Tests
// ============================================================================

TEST_F(ClauseBuilderTest, EmptyConditionsProduceNoClause)
{
	auto result = build_where_clause({});

	EXPECT_TRUE(result.clause.empty());
	EXPECT_TRUE(result.params.empty());
}

TEST_F(ClauseBuilderTest, ConditionsAreJoinedWithAnd)
{
	auto result = build_where_clause({ condition("status", comparison_operator::equal,
												 std::string("active")),
									   condition("age", comparison_operator::greater_equal,
												 int64_t{ 18 }) });

	EXPECT_EQ(result.clause, "WHERE status = ? AND age >= ?");
	ASSERT_EQ(result.params.size(), 2u);
	EXPECT_EQ(std::get<std::string>(result.params[0]), "active");
	EXPECT_EQ(std::get<int64_t>(result.params[1]), 18);
}

TEST_F(ClauseBuilderTest, ComparisonOperatorsRender)
{
	EXPECT_EQ(build_where_clause({ condition("a", comparison_operator::not_equal, int64_t{ 1 }) })
				  .clause,
			  "WHERE a != ?");
	EXPECT_EQ(build_where_clause({ condition("a", comparison_operator::less, int64_t{ 1 }) }).clause,
			  "WHERE a < ?");
	EXPECT_EQ(build_where_clause({ condition("a", comparison_operator::greater, int64_t{ 1 }) })
				  .clause,
			  "WHERE a > ?");
	EXPECT_EQ(build_where_clause({ condition("a", comparison_operator::less_equal, int64_t{ 1 }) })
				  .clause,
			  "WHERE a <= ?");
	EXPECT_EQ(build_where_clause({ condition("name", comparison_operator::like,
											 std::string("jo%")) })
				  .clause,
			  "WHERE name LIKE ?");
}

TEST_F(ClauseBuilderTest, NullChecksBindNothing)
{
	auto result = build_where_clause({ condition("deleted_at", comparison_operator::is_null,
												 sql_value{}),
									   condition("email", comparison_operator::is_not_null,
												 sql_value{}) });

	EXPECT_EQ(result.clause, "WHERE deleted_at IS NULL AND email IS NOT NULL");
	EXPECT_TRUE(result.params.empty());
}

TEST_F(ClauseBuilderTest, InListExpandsPlaceholders)
{
	auto result = build_where_clause({ list_condition(
		"role", comparison_operator::in,
		{ std::string("admin"), std::string("editor"), std::string("viewer") }) });

	EXPECT_EQ(result.clause, "WHERE role IN (?, ?, ?)");
	ASSERT_EQ(result.params.size(), 3u);
	EXPECT_EQ(std::get<std::string>(result.params[2]), "viewer");
}

TEST_F(ClauseBuilderTest, NotInWithSingleValue)
{
	auto result = build_where_clause({ condition("id", comparison_operator::not_in,
												 std::string("u1")) });

	EXPECT_EQ(result.clause, "WHERE id NOT IN (?)");
	ASSERT_EQ(result.params.size(), 1u);
}

TEST_F(ClauseBuilderTest, EmptyInListRendersEmptyParentheses)
{
	auto result = build_where_clause({ list_condition("id", comparison_operator::in, {}) });

	EXPECT_EQ(result.clause, "WHERE id IN ()");
	EXPECT_TRUE(result.params.empty());
}

TEST_F(ClauseBuilderTest, ParametersFollowConditionOrder)
{
	auto result = build_where_clause(
		{ condition("a", comparison_operator::equal, int64_t{ 1 }),
		  list_condition("b", comparison_operator::in, { int64_t{ 2 }, int64_t{ 3 } }),
		  condition("c", comparison_operator::is_null, sql_value{}),
		  condition("d", comparison_operator::equal, int64_t{ 4 }) });

	ASSERT_EQ(result.params.size(), 4u);
	for (int64_t i = 0; i < 4; ++i)
	{
		EXPECT_EQ(std::get<int64_t>(result.params[static_cast<size_t>(i)]), i + 1);
	}
}

// ============================================================================
// ORDER BY / LIMIT / JOIN Tests
// ============================================================================

TEST_F(ClauseBuilderTest, OrderByRendersDirections)
{
	EXPECT_EQ(build_order_by_clause({}), "");
	EXPECT_EQ(build_order_by_clause({ { "created_at", sort_direction::desc },
									  { "name", sort_direction::asc } }),
			  "ORDER BY created_at DESC, name ASC");
}

TEST_F(ClauseBuilderTest, LimitAndOffset)
{
	EXPECT_EQ(build_limit_clause(std::nullopt, std::nullopt), "");
	EXPECT_EQ(build_limit_clause(10, std::nullopt), "LIMIT 10");
	EXPECT_EQ(build_limit_clause(10, 20), "LIMIT 10 OFFSET 20");
	EXPECT_EQ(build_limit_clause(std::nullopt, 5), "OFFSET 5");
}

TEST_F(ClauseBuilderTest, JoinsRender)
{
	EXPECT_EQ(build_join_clause({}), "");
	EXPECT_EQ(build_join_clause({ { join_type::left, "sessions", "sessions.user_id = users.id" },
								  { join_type::inner, "config", "config.key = users.id" } }),
			  "LEFT JOIN sessions ON sessions.user_id = users.id "
			  "INNER JOIN config ON config.key = users.id");
}

// ============================================================================
// Composition Tests
// ============================================================================

TEST_F(ClauseBuilderTest, BareSelect)
{
	auto descriptor = build_select("users");

	EXPECT_EQ(descriptor.sql, "SELECT * FROM users");
	EXPECT_TRUE(descriptor.params.empty());
}

TEST_F(ClauseBuilderTest, FullSelect)
{
	query_options options;
	options.joins.push_back({ join_type::left, "sessions", "sessions.user_id = users.id" });
	options.where.push_back(condition("users.status", comparison_operator::equal,
									  std::string("active")));
	options.order_by.push_back({ "users.created_at", sort_direction::desc });
	options.limit = 25;
	options.offset = 50;

	auto descriptor = build_select("users", options);

	EXPECT_EQ(descriptor.sql,
			  "SELECT * FROM users LEFT JOIN sessions ON sessions.user_id = users.id "
			  "WHERE users.status = ? ORDER BY users.created_at DESC LIMIT 25 OFFSET 50");
	ASSERT_EQ(descriptor.params.size(), 1u);
}

TEST_F(ClauseBuilderTest, CountWithAndWithoutWhere)
{
	EXPECT_EQ(build_count("audit_logs").sql, "SELECT COUNT(*) as count FROM audit_logs");

	auto descriptor = build_count("audit_logs", { condition("user_id", comparison_operator::equal,
															std::string("u1")) });
	EXPECT_EQ(descriptor.sql, "SELECT COUNT(*) as count FROM audit_logs WHERE user_id = ?");
	EXPECT_EQ(descriptor.params.size(), 1u);
}

// ============================================================================
// Operator Parsing Tests
// ============================================================================

TEST_F(ClauseBuilderTest, ParseOperatorIsCaseInsensitive)
{
	EXPECT_EQ(parse_operator("like"), comparison_operator::like);
	EXPECT_EQ(parse_operator("not in"), comparison_operator::not_in);
	EXPECT_EQ(parse_operator("Is Not Null"), comparison_operator::is_not_null);
	EXPECT_EQ(parse_operator(">="), comparison_operator::greater_equal);
	EXPECT_FALSE(parse_operator("BETWEEN").has_value());
}

TEST_F(ClauseBuilderTest, OperatorNamesRoundTrip)
{
	for (auto op : { comparison_operator::equal, comparison_operator::not_equal,
					 comparison_operator::greater, comparison_operator::less,
					 comparison_operator::greater_equal, comparison_operator::less_equal,
					 comparison_operator::like, comparison_operator::in,
					 comparison_operator::not_in, comparison_operator::is_null,
					 comparison_operator::is_not_null })
	{
		EXPECT_EQ(parse_operator(to_string(op)), op) << to_string(op);
	}
}
