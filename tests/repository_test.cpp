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
 * @file repository_test.cpp
 * @brief Unit tests for table-scoped CRUD helpers
 *
 * Tests cover:
 * - create / find_by_id / update / remove against an in-memory table
 * - Managed columns (id, created_at, updated_at)
 * - Generated SQL for find_many, find_one, find_by and count
 * - Error propagation from the service
 */

#include <gtest/gtest.h>

#include "fake_remote_store.h"

#include <kcenon/edge_database/core/error_codes.h>
#include <kcenon/edge_database/repository/base_repository.h>

#include <map>
#include <memory>
#include <mutex>

using namespace edge_database;
using namespace edge_database::repository;
using namespace edge_database::test;

namespace
{

std::vector<std::string> split_columns(const std::string& list)
{
	std::vector<std::string> columns;
	size_t start = 0;
	while (start < list.size())
	{
		auto end = list.find(", ", start);
		if (end == std::string::npos)
		{
			end = list.size();
		}
		auto column = list.substr(start, end - start);
		auto assignment = column.find(" = ?");
		if (assignment != std::string::npos)
		{
			column = column.substr(0, assignment);
		}
		columns.push_back(column);
		start = end + 2;
	}
	return columns;
}

/**
 * @class widget_table
 * @brief Minimal in-memory emulation of the statements base_repository issues
 */
class widget_table : public std::enable_shared_from_this<widget_table>
{
public:
	fake_remote_store::handler handler()
	{
		auto self = shared_from_this();
		return [self](const recorded_statement& statement)
				   -> std::optional<kcenon::common::Result<rows_result>>
		{ return self->handle(statement); };
	}

	size_t size() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return rows_.size();
	}

	void drop(const std::string& id)
	{
		std::lock_guard<std::mutex> lock(mutex_);
		rows_.erase(id);
	}

private:
	std::optional<kcenon::common::Result<rows_result>> handle(const recorded_statement& statement)
	{
		std::lock_guard<std::mutex> lock(mutex_);
		const auto& sql = statement.sql;
		rows_result result;
		result.success = true;

		if (sql.rfind("INSERT INTO widgets (", 0) == 0)
		{
			const auto open = sql.find('(');
			const auto close = sql.find(')');
			auto columns = split_columns(sql.substr(open + 1, close - open - 1));

			result_row row;
			for (size_t i = 0; i < columns.size() && i < statement.params.size(); ++i)
			{
				row[columns[i]] = statement.params[i];
			}
			rows_[std::get<std::string>(row.at("id"))] = row;
			result.meta.changes = 1;
			return kcenon::common::Result<rows_result>(result);
		}

		if (sql.rfind("UPDATE widgets SET ", 0) == 0)
		{
			const auto set = sql.find("SET ") + 4;
			const auto where = sql.find(" WHERE");
			auto columns = split_columns(sql.substr(set, where - set));
			const auto& id = std::get<std::string>(statement.params.back());

			auto it = rows_.find(id);
			if (it != rows_.end())
			{
				for (size_t i = 0; i < columns.size(); ++i)
				{
					it->second[columns[i]] = statement.params[i];
				}
				result.meta.changes = 1;
			}
			return kcenon::common::Result<rows_result>(result);
		}

		if (sql.rfind("DELETE FROM widgets WHERE id = ?", 0) == 0)
		{
			result.meta.changes = rows_.erase(std::get<std::string>(statement.params.at(0)));
			return kcenon::common::Result<rows_result>(result);
		}

		if (sql == "SELECT * FROM widgets WHERE id = ?")
		{
			auto it = rows_.find(std::get<std::string>(statement.params.at(0)));
			if (it != rows_.end())
			{
				result.rows.push_back(it->second);
			}
			return kcenon::common::Result<rows_result>(result);
		}

		if (sql == "SELECT COUNT(*) as count FROM widgets WHERE id = ?")
		{
			const auto found = rows_.count(std::get<std::string>(statement.params.at(0)));
			result.rows.push_back(make_row({ { "count", static_cast<int64_t>(found) } }));
			return kcenon::common::Result<rows_result>(result);
		}

		return std::nullopt;
	}

	mutable std::mutex mutex_;
	std::map<std::string, result_row> rows_;
};

class widget_repository : public base_repository
{
public:
	explicit widget_repository(std::shared_ptr<service::database_service> db)
		: base_repository(std::move(db), "widgets")
	{
	}

	kcenon::common::Result<std::vector<result_row>> find_by_color(const std::string& color)
	{
		return find_by("color", color);
	}
};

} // namespace

class RepositoryTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		store_ = std::make_shared<fake_remote_store>();
		table_ = std::make_shared<widget_table>();
		store_->set_handler(table_->handler());

		auto config = core::database_config::default_config();
		config.retry.delay = std::chrono::milliseconds(1);
		config.query.enable_logging = false;
		service_ = std::make_shared<service::database_service>(
			store::connection_accessor::from_store(store_), config);
		repository_ = std::make_unique<widget_repository>(service_);
	}

	void TearDown() override {}

	std::shared_ptr<fake_remote_store> store_;
	std::shared_ptr<widget_table> table_;
	std::shared_ptr<service::database_service> service_;
	std::unique_ptr<widget_repository> repository_;
};

// ============================================================================
// CRUD Tests
// ============================================================================

TEST_F(RepositoryTest, CreateAssignsIdAndTimestamps)
{
	auto created = repository_->create({ { "name", std::string("bolt") },
										 { "color", std::string("red") },
										 { "id", std::string("ignored") },
										 { "created_at", std::string("ignored") } });

	ASSERT_TRUE(created.is_ok());
	const auto& row = created.value();
	auto id = get_string(row, "id");
	ASSERT_TRUE(id.has_value());
	EXPECT_EQ(id->size(), 36u);
	EXPECT_NE(*id, "ignored");
	EXPECT_EQ(get_string(row, "name"), "bolt");
	EXPECT_EQ(get_string(row, "created_at"), get_string(row, "updated_at"));
	EXPECT_NE(get_string(row, "created_at"), "ignored");

	auto statements = store_->statements();
	ASSERT_FALSE(statements.empty());
	EXPECT_EQ(statements[0].sql,
			  "INSERT INTO widgets (id, name, color, created_at, updated_at) VALUES (?, ?, ?, ?, ?)");
}

TEST_F(RepositoryTest, FindByIdReturnsNothingForUnknownId)
{
	auto found = repository_->find_by_id("missing");

	ASSERT_TRUE(found.is_ok());
	EXPECT_FALSE(found.value().has_value());
}

TEST_F(RepositoryTest, UpdateChangesColumnsAndTimestamp)
{
	auto created = repository_->create({ { "name", std::string("bolt") } });
	ASSERT_TRUE(created.is_ok());
	const auto id = *get_string(created.value(), "id");

	auto updated = repository_->update(id, { { "name", std::string("nut") },
											 { "updated_at", std::string("ignored") } });

	ASSERT_TRUE(updated.is_ok());
	EXPECT_EQ(get_string(updated.value(), "name"), "nut");
	EXPECT_NE(get_string(updated.value(), "updated_at"), "ignored");
	EXPECT_EQ(store_->count_matching("UPDATE widgets SET name = ?, updated_at = ? WHERE id = ?"), 1u);
}

TEST_F(RepositoryTest, UpdateOfMissingRecordIsNotFound)
{
	auto updated = repository_->update("missing", { { "name", std::string("nut") } });

	ASSERT_TRUE(updated.is_err());
	EXPECT_EQ(updated.error().code, error_codes::not_found);
	EXPECT_EQ(updated.error().message, "Record missing not found in widgets after update");
}

TEST_F(RepositoryTest, RemoveReportsWhetherRowWasDeleted)
{
	auto created = repository_->create({ { "name", std::string("bolt") } });
	ASSERT_TRUE(created.is_ok());
	const auto id = *get_string(created.value(), "id");

	auto removed = repository_->remove(id);
	ASSERT_TRUE(removed.is_ok());
	EXPECT_TRUE(removed.value());
	EXPECT_EQ(table_->size(), 0u);

	auto again = repository_->remove(id);
	ASSERT_TRUE(again.is_ok());
	EXPECT_FALSE(again.value());
}

TEST_F(RepositoryTest, ExistsUsesCount)
{
	auto created = repository_->create({ { "name", std::string("bolt") } });
	ASSERT_TRUE(created.is_ok());
	const auto id = *get_string(created.value(), "id");

	auto present = repository_->exists(id);
	ASSERT_TRUE(present.is_ok());
	EXPECT_TRUE(present.value());

	table_->drop(id);
	auto absent = repository_->exists(id);
	ASSERT_TRUE(absent.is_ok());
	EXPECT_FALSE(absent.value());
}

// ============================================================================
// Query Shape Tests
// ============================================================================

TEST_F(RepositoryTest, FindManyBuildsSelect)
{
	store_->add_rows("FROM widgets WHERE color",
					 { make_row({ { "id", std::string("w1") } }),
					   make_row({ { "id", std::string("w2") } }) });

	query::query_options options;
	options.where.push_back({ "color", query::comparison_operator::equal,
							  query::condition_value{ sql_value{ std::string("red") } } });
	options.order_by.push_back({ "name", query::sort_direction::asc });
	options.limit = 10;

	auto rows = repository_->find_many(options);

	ASSERT_TRUE(rows.is_ok());
	EXPECT_EQ(rows.value().size(), 2u);
	auto statements = store_->statements();
	ASSERT_EQ(statements.size(), 1u);
	EXPECT_EQ(statements[0].sql, "SELECT * FROM widgets WHERE color = ? ORDER BY name ASC LIMIT 10");
	EXPECT_EQ(statements[0].operation, "all");
}

TEST_F(RepositoryTest, FindOneForcesLimit)
{
	query::query_options options;
	options.limit = 50;

	auto found = repository_->find_one(options);

	ASSERT_TRUE(found.is_ok());
	EXPECT_FALSE(found.value().has_value());
	EXPECT_EQ(store_->statements().back().sql, "SELECT * FROM widgets LIMIT 1");
}

TEST_F(RepositoryTest, DerivedRepositoryQueries)
{
	auto rows = repository_->find_by_color("blue");
	ASSERT_TRUE(rows.is_ok());
	EXPECT_EQ(store_->statements().back().sql, "SELECT * FROM widgets WHERE color = ?");

	auto one = repository_->find_one_by("name", std::string("bolt"));
	ASSERT_TRUE(one.is_ok());
	EXPECT_EQ(store_->statements().back().sql, "SELECT * FROM widgets WHERE name = ? LIMIT 1");
	EXPECT_EQ(repository_->table_name(), "widgets");
}

TEST_F(RepositoryTest, CountReadsCountColumn)
{
	store_->add_rows("SELECT COUNT(*) as count FROM widgets",
					 { make_row({ { "count", 7.0 } }) });

	auto total = repository_->count();

	ASSERT_TRUE(total.is_ok());
	EXPECT_EQ(total.value(), 7u);
}

TEST_F(RepositoryTest, StoreFailurePropagates)
{
	store_->fail_next(3, "network connection lost");

	auto found = repository_->find_by_id("w1");

	ASSERT_TRUE(found.is_err());
	EXPECT_EQ(found.error().code, error_codes::query_failed);
}
