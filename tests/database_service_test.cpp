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
 * @file database_service_test.cpp
 * @brief Unit tests for the database service facade
 *
 * Tests cover:
 * - Startup migrations and their configuration switch
 * - Delegated statements sharing one metrics collector
 * - Transactions: pinned connection, no retry, error and exception paths
 * - Schema validation and introspection
 * - Health and metrics accessors
 */

#include <gtest/gtest.h>

#include "capturing_logger.h"
#include "fake_remote_store.h"
#include "migrations_table_simulator.h"

#include <kcenon/edge_database/core/error_codes.h>
#include <kcenon/edge_database/service/database_service.h>

#include <memory>
#include <set>
#include <stdexcept>

using namespace edge_database;
using namespace edge_database::service;
using namespace edge_database::test;
using kcenon::common::interfaces::log_level;

class DatabaseServiceTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		store_ = std::make_shared<fake_remote_store>();
		logger_ = std::make_shared<capturing_logger>();
		config_ = core::database_config::default_config();
		config_.retry.delay = std::chrono::milliseconds(1);
	}

	void TearDown() override {}

	std::unique_ptr<database_service> make_service()
	{
		return std::make_unique<database_service>(store::connection_accessor::from_store(store_),
												  config_, logger_);
	}

	/// Answers sqlite_master lookups for the given tables only.
	void install_schema(std::set<std::string> tables)
	{
		store_->set_handler(
			[tables](const recorded_statement& statement)
				-> std::optional<kcenon::common::Result<rows_result>>
			{
				if (statement.sql.find("sqlite_master") == std::string::npos)
				{
					return std::nullopt;
				}

				rows_result result;
				result.success = true;
				const auto& name = std::get<std::string>(statement.params.at(0));
				if (tables.count(name) > 0)
				{
					result.rows.push_back(make_row({ { "name", name } }));
				}
				return kcenon::common::Result<rows_result>(result);
			});
	}

	std::shared_ptr<fake_remote_store> store_;
	std::shared_ptr<capturing_logger> logger_;
	core::database_config config_;
};

// ============================================================================
// Initialization Tests
// ============================================================================

TEST_F(DatabaseServiceTest, InitializeRunsBuiltinMigrations)
{
	auto table = std::make_shared<migrations_table_simulator>();
	store_->set_handler(table->handler());
	auto service = make_service();

	auto result = service->initialize();

	ASSERT_TRUE(result.is_ok());
	ASSERT_EQ(table->rows().size(), 1u);
	EXPECT_EQ(get_string(table->rows()[0], "migration_id"), "001");
	EXPECT_EQ(logger_->count(log_level::info, "Database service initialized"), 1u);

	auto status = service->get_migration_status();
	ASSERT_TRUE(status.is_ok());
	EXPECT_EQ(status.value().size(), 1u);
}

TEST_F(DatabaseServiceTest, InitializeCanSkipMigrations)
{
	config_.migrations.run_on_startup = false;
	auto service = make_service();

	auto result = service->initialize();

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(store_->terminal_calls(), 0u);
}

TEST_F(DatabaseServiceTest, InitializeSurfacesMigrationFailure)
{
	auto table = std::make_shared<migrations_table_simulator>();
	table->fail_script("CREATE TABLE IF NOT EXISTS users");
	store_->set_handler(table->handler());
	auto service = make_service();

	auto result = service->initialize();

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::migration_error);
}

TEST_F(DatabaseServiceTest, MigrationDelegates)
{
	auto table = std::make_shared<migrations_table_simulator>();
	store_->set_handler(table->handler());
	auto service = make_service();

	auto applied = service->run_migrations();
	ASSERT_TRUE(applied.is_ok());
	EXPECT_EQ(applied.value(), 1u);

	auto drifted = service->verify_migration_checksums();
	ASSERT_TRUE(drifted.is_ok());
	EXPECT_TRUE(drifted.value().empty());

	auto rollback = service->rollback_migration("001");
	ASSERT_TRUE(rollback.is_err());
	EXPECT_EQ(rollback.error().code, error_codes::unsupported_operation);
}

// ============================================================================
// Statement Tests
// ============================================================================

TEST_F(DatabaseServiceTest, StatementsShareMetrics)
{
	auto service = make_service();

	ASSERT_TRUE(service->query("SELECT * FROM users").is_ok());
	ASSERT_TRUE(service->query_one("SELECT * FROM users WHERE id = ?", { std::string("u1") })
					.is_ok());
	ASSERT_TRUE(service->execute("DELETE FROM sessions WHERE expires_at < ?",
								 { std::string("2024-01-01") })
					.is_ok());
	ASSERT_TRUE(
		service->batch(std::vector<query_descriptor>{ query_descriptor{ "DELETE FROM config", {} } })
			.is_ok());

	auto snapshot = service->get_metrics();
	EXPECT_EQ(snapshot.total_queries, 4u);
	EXPECT_EQ(snapshot.successful_queries, 4u);

	service->reset_metrics();
	EXPECT_EQ(service->get_metrics().total_queries, 0u);
}

TEST_F(DatabaseServiceTest, DisabledMetricsConfiguration)
{
	config_.metrics.enabled = false;
	auto service = make_service();

	ASSERT_TRUE(service->query("SELECT 1").is_ok());
	EXPECT_EQ(service->get_metrics().total_queries, 0u);
}

TEST_F(DatabaseServiceTest, GetConnectionWithoutProvider)
{
	database_service service(store::connection_accessor{}, config_, logger_);

	auto connection = service.get_connection();

	ASSERT_TRUE(connection.is_err());
	EXPECT_EQ(connection.error().code, error_codes::configuration_error);
}

// ============================================================================
// Transaction Tests
// ============================================================================

TEST_F(DatabaseServiceTest, TransactionRunsBatchOnPinnedConnection)
{
	auto service = make_service();

	auto result = service->transaction(
		[](database_transaction& tx) -> kcenon::common::Result<size_t>
		{
			auto debit = tx.prepare("UPDATE accounts SET balance = balance - ? WHERE id = ?",
									{ int64_t{ 10 }, std::string("a") });
			auto credit = tx.prepare("UPDATE accounts SET balance = balance + ? WHERE id = ?",
									 { int64_t{ 10 }, std::string("b") });
			if (debit.is_err() || credit.is_err())
			{
				return kcenon::common::error_info{ -1, "prepare failed", "test" };
			}

			auto results = tx.run_batch({ debit.value(), credit.value() });
			if (results.is_err())
			{
				return results.error();
			}
			return results.value().size();
		});

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value(), 2u);
	EXPECT_EQ(store_->count_matching("UPDATE accounts"), 2u);
	EXPECT_EQ(store_->terminal_calls(), 1u);
	// Transactions bypass the executor's metrics
	EXPECT_EQ(service->get_metrics().total_queries, 0u);
}

TEST_F(DatabaseServiceTest, TransactionIsNotRetried)
{
	store_->fail_next(1, "batch rejected");
	auto service = make_service();

	auto result = service->transaction(
		[](database_transaction& tx) -> kcenon::common::Result<size_t>
		{
			auto statement = tx.prepare("DELETE FROM sessions", {});
			if (statement.is_err())
			{
				return statement.error();
			}
			auto results = tx.run_batch({ statement.value() });
			if (results.is_err())
			{
				return results.error();
			}
			return results.value().size();
		});

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().message, "batch rejected");
	EXPECT_EQ(store_->terminal_calls(), 1u);
	EXPECT_EQ(logger_->count(log_level::error, "Transaction failed"), 1u);
}

TEST_F(DatabaseServiceTest, TransactionExecRunsScript)
{
	auto service = make_service();

	auto result = service->transaction(
		[](database_transaction& tx) -> kcenon::common::Result<exec_result>
		{ return tx.run_exec("DELETE FROM a; DELETE FROM b;"); });

	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.value().count, 2u);
}

TEST_F(DatabaseServiceTest, TransactionCallbackExceptionBecomesError)
{
	auto service = make_service();

	auto result = service->transaction(
		[](database_transaction&) -> kcenon::common::Result<int>
		{ throw std::runtime_error("callback exploded"); });

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::callback_failed);
	EXPECT_EQ(result.error().message, "callback exploded");
	EXPECT_EQ(logger_->count(log_level::error, "callback exploded"), 1u);
}

TEST_F(DatabaseServiceTest, TransactionWithoutConnection)
{
	database_service service(store::connection_accessor{}, config_, logger_);
	bool invoked = false;

	auto result = service.transaction(
		[&invoked](database_transaction&) -> kcenon::common::Result<int>
		{
			invoked = true;
			return 1;
		});

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, error_codes::configuration_error);
	EXPECT_FALSE(invoked);
}

TEST_F(DatabaseServiceTest, TransactionPrepareRefused)
{
	store_->refuse_prepare(true);
	auto service = make_service();

	auto result = service->transaction(
		[](database_transaction& tx) -> kcenon::common::Result<int>
		{
			auto statement = tx.prepare("SELECT 1", {});
			if (statement.is_err())
			{
				return statement.error();
			}
			return 1;
		});

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().message, "Failed to prepare statement");
}

// ============================================================================
// Schema Tests
// ============================================================================

TEST_F(DatabaseServiceTest, ValidateSchemaWithAllTables)
{
	install_schema({ "users", "sessions", "audit_logs", "config", "migrations" });
	auto service = make_service();

	EXPECT_TRUE(service->validate_schema());
	EXPECT_EQ(store_->count_matching("sqlite_master"), 5u);
}

TEST_F(DatabaseServiceTest, ValidateSchemaReportsMissingTables)
{
	install_schema({ "users", "config", "migrations" });
	auto service = make_service();

	EXPECT_FALSE(service->validate_schema());
	EXPECT_EQ(logger_->count(log_level::warning, "tables=sessions, audit_logs"), 1u);
}

TEST_F(DatabaseServiceTest, ValidateSchemaFailsWhenStoreFails)
{
	store_->fail_next(3);
	auto service = make_service();

	EXPECT_FALSE(service->validate_schema());
	EXPECT_EQ(logger_->count(log_level::error, "Schema validation failed"), 1u);
}

TEST_F(DatabaseServiceTest, TableSchemaIntrospectionIsUnsupported)
{
	auto service = make_service();

	auto schema = service->get_table_schema("users");

	ASSERT_TRUE(schema.is_err());
	EXPECT_EQ(schema.error().code, error_codes::unsupported_operation);
	EXPECT_EQ(store_->terminal_calls(), 0u);
}

// ============================================================================
// Health Tests
// ============================================================================

TEST_F(DatabaseServiceTest, HealthCheckUsesSharedMetrics)
{
	auto service = make_service();

	auto health = service->health_check();

	EXPECT_TRUE(health.is_healthy());
	EXPECT_EQ(service->get_metrics().total_queries, 1u);
}
