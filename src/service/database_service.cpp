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

#include <kcenon/edge_database/service/database_service.h>

#include <kcenon/edge_database/migration/builtin_migrations.h>

namespace edge_database::service
{

database_service::database_service(
	store::connection_accessor connections,
	core::database_config config,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger,
	std::vector<migration::migration_definition> migrations)
	: config_(std::move(config))
	, log_(logger, "DatabaseService")
	, metrics_(std::make_shared<metrics::database_metrics_collector>(
		  metrics::collector_options{ config_.metrics.enabled }))
	, executor_(std::make_shared<resilience::resilient_executor>(std::move(connections), metrics_,
																  config_, logger))
	, migrations_(std::make_unique<migration::migration_runner>(executor_, std::move(migrations),
																logger))
	, health_(std::make_unique<health::database_health_checker>(
		  executor_, metrics_, health::health_thresholds{}, logger))
{
}

kcenon::common::VoidResult database_service::initialize()
{
	if (!config_.migrations.run_on_startup)
	{
		log_.debug("Skipping migrations on startup");
		return kcenon::common::ok();
	}

	auto applied = migrations_->run_migrations();
	if (applied.is_err())
	{
		return applied.error();
	}

	log_.info("Database service initialized",
			  { { "migrations_applied", std::to_string(applied.value()) } });
	return kcenon::common::ok();
}

kcenon::common::Result<std::shared_ptr<store::remote_store>> database_service::get_connection() const
{
	return executor_->get_connection();
}

kcenon::common::Result<rows_result> database_service::query(const std::string& sql,
															const query_params& params)
{
	return executor_->query(sql, params);
}

kcenon::common::Result<rows_result> database_service::query(const query_descriptor& descriptor)
{
	return executor_->query(descriptor);
}

kcenon::common::Result<single_row_result> database_service::query_one(const std::string& sql,
																	  const query_params& params)
{
	return executor_->query_one(sql, params);
}

kcenon::common::Result<single_row_result> database_service::query_one(
	const query_descriptor& descriptor)
{
	return executor_->query_one(descriptor);
}

kcenon::common::Result<write_result> database_service::execute(const std::string& sql,
															   const query_params& params)
{
	return executor_->execute(sql, params);
}

kcenon::common::Result<write_result> database_service::execute(const query_descriptor& descriptor)
{
	return executor_->execute(descriptor);
}

kcenon::common::Result<std::vector<rows_result>> database_service::batch(
	const std::vector<query_descriptor>& statements)
{
	return executor_->batch(statements);
}

kcenon::common::Result<size_t> database_service::run_migrations()
{
	return migrations_->run_migrations();
}

kcenon::common::Result<std::vector<migration::migration_record>>
database_service::get_migration_status()
{
	return migrations_->get_migration_status();
}

kcenon::common::VoidResult database_service::rollback_migration(const std::string& migration_id)
{
	return migrations_->rollback_migration(migration_id);
}

kcenon::common::Result<std::vector<std::string>> database_service::verify_migration_checksums()
{
	return migrations_->verify_checksums();
}

bool database_service::validate_schema()
{
	std::vector<std::string> missing;
	for (const auto& table : migration::required_tables())
	{
		auto result = executor_->query_one(
			"SELECT name FROM sqlite_master WHERE type='table' AND name=?", { table });
		if (result.is_err())
		{
			log_.error("Schema validation failed", { { "error", result.error().message } });
			return false;
		}

		if (!result.value().row)
		{
			missing.push_back(table);
		}
	}

	if (!missing.empty())
	{
		std::string tables;
		for (const auto& table : missing)
		{
			tables += tables.empty() ? table : ", " + table;
		}
		log_.warning("Schema validation found missing tables", { { "tables", tables } });
		return false;
	}

	return true;
}

kcenon::common::Result<table_schema> database_service::get_table_schema(const std::string& table_name)
{
	log_.debug("Schema introspection requested", { { "table", table_name } });
	return kcenon::common::error_info{ error_codes::unsupported_operation,
									   "Schema introspection not implemented",
									   "database_service" };
}

health::service_health database_service::health_check()
{
	return health_->check_now();
}

metrics::database_metrics_snapshot database_service::get_metrics() const
{
	return metrics_->snapshot();
}

void database_service::reset_metrics()
{
	metrics_->reset();
}

void database_service::log_transaction_failure(const std::string& message) const
{
	log_.error("Transaction failed", { { "error", message } });
}

} // namespace edge_database::service
