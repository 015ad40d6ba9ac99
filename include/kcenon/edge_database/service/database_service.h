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
 * @file database_service.h
 * @brief Data-access facade over the remote edge store
 *
 * database_service wires the connection accessor, metrics collector,
 * resilient executor, migration runner and health checker together and
 * exposes the operations repositories and services consume.
 *
 * Usage Example:
 * @code
 * using namespace edge_database;
 *
 * auto config = core::database_config::default_config();
 * auto logger = logging::create_console_logger(
 *     kcenon::common::interfaces::log_level::info, "DatabaseService");
 *
 * service::database_service db(store::connection_accessor([&env]() { return env.db(); }),
 *                              config, logger);
 * if (auto init = db.initialize(); init.is_err()) {
 *     // migrations failed, error_codes::migration_error
 * }
 *
 * auto user = db.query_one("SELECT * FROM users WHERE id = ?", { user_id });
 * auto health = db.health_check();
 * @endcode
 */

#pragma once

#include "database_transaction.h"

#include <kcenon/edge_database/core/database_config.h>
#include <kcenon/edge_database/core/error_codes.h>
#include <kcenon/edge_database/core/query_types.h>
#include <kcenon/edge_database/health/database_health_checker.h>
#include <kcenon/edge_database/logging/service_log.h>
#include <kcenon/edge_database/metrics/database_metrics_collector.h>
#include <kcenon/edge_database/migration/migration_runner.h>
#include <kcenon/edge_database/resilience/resilient_executor.h>
#include <kcenon/edge_database/store/connection_accessor.h>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace edge_database::service
{

/**
 * @struct column_info
 */
struct column_info
{
	std::string name;
	std::string type;
	bool nullable{ true };
	bool primary_key{ false };
	std::optional<std::string> default_value;
};

/**
 * @struct table_schema
 */
struct table_schema
{
	std::string name;
	std::vector<column_info> columns;
	std::vector<std::string> indexes;
};

/**
 * @class database_service
 * @brief Resilient, metered access to the remote store
 *
 * Thread Safety:
 * - query, query_one, execute, batch, transaction and health_check may be
 *   called concurrently
 * - initialize / run_migrations must not run concurrently with each other
 */
class database_service
{
public:
	/**
	 * @brief Constructs the service; performs no I/O
	 * @param connections Accessor resolving the store connection per call
	 * @param config Service configuration
	 * @param logger Optional logger
	 * @param migrations Definitions managed by the migration runner
	 */
	explicit database_service(
		store::connection_accessor connections,
		core::database_config config = core::database_config::default_config(),
		std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr,
		std::vector<migration::migration_definition> migrations
		= migration::builtin_migrations());

	database_service(const database_service&) = delete;
	database_service& operator=(const database_service&) = delete;

	/**
	 * @brief Startup hook: runs pending migrations when
	 *        config().migrations.run_on_startup is set.
	 */
	kcenon::common::VoidResult initialize();

	/**
	 * @brief Current store connection, or configuration_error
	 */
	kcenon::common::Result<std::shared_ptr<store::remote_store>> get_connection() const;

	kcenon::common::Result<rows_result> query(const std::string& sql,
											  const query_params& params = {});

	kcenon::common::Result<rows_result> query(const query_descriptor& descriptor);

	kcenon::common::Result<single_row_result> query_one(const std::string& sql,
														const query_params& params = {});

	kcenon::common::Result<single_row_result> query_one(const query_descriptor& descriptor);

	kcenon::common::Result<write_result> execute(const std::string& sql,
												 const query_params& params = {});

	kcenon::common::Result<write_result> execute(const query_descriptor& descriptor);

	kcenon::common::Result<std::vector<rows_result>> batch(
		const std::vector<query_descriptor>& statements);

	/**
	 * @brief Runs a callback against one pinned connection.
	 *
	 * There is no rollback: statements the callback already issued stay
	 * applied when it fails. Errors and exceptions from the callback are
	 * logged as "Transaction failed" and returned; an exception becomes
	 * error_codes::callback_failed.
	 *
	 * @param callback Invoked as callback(database_transaction&); must
	 *        return a kcenon::common::Result
	 * @return Whatever the callback returned, or the error that stopped it
	 */
	template <typename Callback>
	auto transaction(Callback&& callback)
		-> std::invoke_result_t<Callback&, database_transaction&>
	{
		using result_type = std::invoke_result_t<Callback&, database_transaction&>;

		auto connection = executor_->get_connection();
		if (connection.is_err())
		{
			log_transaction_failure(connection.error().message);
			return result_type(connection.error());
		}

		database_transaction tx(connection.value());
		try
		{
			result_type result = callback(tx);
			if (result.is_err())
			{
				log_transaction_failure(result.error().message);
			}
			return result;
		}
		catch (const std::exception& e)
		{
			log_transaction_failure(e.what());
			return result_type(kcenon::common::error_info{ error_codes::callback_failed,
														   e.what(), "database_service" });
		}
	}

	/**
	 * @brief Applies pending migrations
	 * @return Number applied, or migration_error
	 */
	kcenon::common::Result<size_t> run_migrations();

	kcenon::common::Result<std::vector<migration::migration_record>> get_migration_status();

	/**
	 * @brief Always fails with unsupported_operation
	 */
	kcenon::common::VoidResult rollback_migration(const std::string& migration_id);

	kcenon::common::Result<std::vector<std::string>> verify_migration_checksums();

	/**
	 * @brief Checks that every required table exists.
	 *
	 * Missing tables are logged. A store failure is logged and reported
	 * as false.
	 */
	bool validate_schema();

	/**
	 * @brief Always fails with unsupported_operation
	 */
	kcenon::common::Result<table_schema> get_table_schema(const std::string& table_name);

	health::service_health health_check();

	[[nodiscard]] metrics::database_metrics_snapshot get_metrics() const;

	void reset_metrics();

	[[nodiscard]] const core::database_config& config() const noexcept { return config_; }

	resilience::resilient_executor& executor() noexcept { return *executor_; }

	migration::migration_runner& migrations() noexcept { return *migrations_; }

private:
	void log_transaction_failure(const std::string& message) const;

	core::database_config config_;
	logging::service_log log_;
	std::shared_ptr<metrics::database_metrics_collector> metrics_;
	std::shared_ptr<resilience::resilient_executor> executor_;
	std::unique_ptr<migration::migration_runner> migrations_;
	std::unique_ptr<health::database_health_checker> health_;
};

} // namespace edge_database::service
