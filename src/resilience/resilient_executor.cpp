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

#include <kcenon/edge_database/resilience/resilient_executor.h>

#include <kcenon/edge_database/core/error_codes.h>

#include <algorithm>
#include <exception>
#include <future>
#include <thread>

namespace edge_database::resilience
{

namespace
{

constexpr const char* module_name = "resilient_executor";

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start)
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - start);
}

void stamp_duration(rows_result& result, std::chrono::milliseconds duration)
{
	result.meta.duration = duration;
}

void stamp_duration(single_row_result& result, std::chrono::milliseconds duration)
{
	result.meta.duration = duration;
}

void stamp_duration(write_result& result, std::chrono::milliseconds duration)
{
	result.meta.duration = duration;
}

void stamp_duration(exec_result& result, std::chrono::milliseconds duration)
{
	result.duration = duration;
}

kcenon::common::error_info transient_error(std::string message)
{
	return kcenon::common::error_info{ error_codes::transient_execution_error,
									   std::move(message), module_name };
}

} // namespace

resilient_executor::resilient_executor(
	store::connection_accessor connections,
	std::shared_ptr<metrics::database_metrics_collector> collector,
	core::database_config config,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
	: connections_(std::move(connections))
	, metrics_(std::move(collector))
	, config_(std::move(config))
	, log_(std::move(logger), "DatabaseService")
	, sleep_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); })
{
	if (!metrics_)
	{
		metrics_ = std::make_shared<metrics::database_metrics_collector>(
			metrics::collector_options{ config_.metrics.enabled });
	}

	classifier_ = config_.retry.mode == core::retry_mode::transient_only
					  ? message_pattern_classifier()
					  : retry_all_classifier();
}

template <typename T>
kcenon::common::Result<T> resilient_executor::await_result(store::store_future<T> future) const
{
	if (!future.valid())
	{
		return transient_error("Remote store returned no pending result");
	}

	const auto timeout = config_.query.timeout;
	if (timeout.count() > 0 && future.wait_for(timeout) == std::future_status::timeout)
	{
		// The pending operation is abandoned; its outcome is never observed
		return kcenon::common::error_info{ error_codes::query_timeout,
										   "Query timed out after "
											   + std::to_string(timeout.count()) + "ms",
										   module_name };
	}

	try
	{
		return future.get();
	}
	catch (const std::exception& e)
	{
		return transient_error(e.what());
	}
}

template <typename T, typename Attempt>
kcenon::common::Result<T> resilient_executor::execute_with_retry(const char* operation,
																 const std::string& sql,
																 const query_params& params,
																 Attempt&& attempt)
{
	const auto start_time = std::chrono::steady_clock::now();
	const uint32_t max_attempts = std::max<uint32_t>(1, config_.retry.max_retries);
	retry_state state;

	while (state.attempt < max_attempts)
	{
		++state.attempt;

		auto connection = connections_.get_connection();
		if (connection.is_err())
		{
			return report_connection_failure(connection.error(), sql);
		}

		if (config_.query.enable_logging)
		{
			log_.debug("Executing query",
					   { { "sql", sql },
						 { "params", logging::service_log::format_params(params) },
						 { "attempt", std::to_string(state.attempt) } });
		}

		kcenon::common::Result<T> result = [&]() -> kcenon::common::Result<T>
		{
			try
			{
				return attempt(*connection.value());
			}
			catch (const std::exception& e)
			{
				return transient_error(e.what());
			}
		}();

		if (result.is_ok())
		{
			const auto duration = elapsed_since(start_time);
			T value = std::move(result.value());
			stamp_duration(value, duration);

			metrics_->record_success(duration);
			check_slow_query(duration, sql, params);
			return value;
		}

		state.last_error = result.error();
		log_.error(std::string(operation) + " attempt " + std::to_string(state.attempt)
					   + " failed",
				   { { "sql", sql },
					 { "params", logging::service_log::format_params(params) },
					 { "error", state.last_error->message } });

		if (state.last_error->code != error_codes::query_timeout && classifier_
			&& classifier_(*state.last_error) == error_class::permanent)
		{
			break;
		}

		if (state.attempt < max_attempts && sleep_)
		{
			sleep_(backoff_delay(state.attempt));
		}
	}

	const auto duration = elapsed_since(start_time);
	const std::string last_message = state.last_error ? state.last_error->message : "unknown error";

	metrics_->record_failure(last_message);
	check_slow_query(duration, sql, params);

	return kcenon::common::error_info{ error_codes::query_failed,
									   std::string(operation) + " failed after "
										   + std::to_string(state.attempt) + " attempt"
										   + (state.attempt == 1 ? "" : "s") + ": "
										   + last_message,
									   module_name };
}

kcenon::common::Result<rows_result> resilient_executor::query(const std::string& sql,
															  const query_params& params)
{
	return execute_with_retry<rows_result>(
		"Query", sql, params,
		[this, &sql, &params](store::remote_store& connection) -> kcenon::common::Result<rows_result>
		{
			auto statement = prepare_bound(connection, sql, params);
			if (statement.is_err())
			{
				return statement.error();
			}
			return await_result(statement.value()->all());
		});
}

kcenon::common::Result<rows_result> resilient_executor::query(const query_descriptor& descriptor)
{
	return query(descriptor.sql, descriptor.params);
}

kcenon::common::Result<single_row_result> resilient_executor::query_one(
	const std::string& sql, const query_params& params)
{
	return execute_with_retry<single_row_result>(
		"Single query", sql, params,
		[this, &sql, &params](
			store::remote_store& connection) -> kcenon::common::Result<single_row_result>
		{
			auto statement = prepare_bound(connection, sql, params);
			if (statement.is_err())
			{
				return statement.error();
			}

			auto first = await_result(statement.value()->first());
			if (first.is_err())
			{
				return first.error();
			}

			single_row_result result;
			result.row = std::move(first.value());
			result.success = true;
			result.meta.rows_read = result.row ? 1 : 0;
			result.meta.rows_written = 0;
			return result;
		});
}

kcenon::common::Result<single_row_result> resilient_executor::query_one(
	const query_descriptor& descriptor)
{
	return query_one(descriptor.sql, descriptor.params);
}

kcenon::common::Result<write_result> resilient_executor::execute(const std::string& sql,
																 const query_params& params)
{
	return execute_with_retry<write_result>(
		"Execute", sql, params,
		[this, &sql, &params](store::remote_store& connection) -> kcenon::common::Result<write_result>
		{
			auto statement = prepare_bound(connection, sql, params);
			if (statement.is_err())
			{
				return statement.error();
			}
			return await_result(statement.value()->run());
		});
}

kcenon::common::Result<write_result> resilient_executor::execute(const query_descriptor& descriptor)
{
	return execute(descriptor.sql, descriptor.params);
}

kcenon::common::Result<exec_result> resilient_executor::exec_script(const std::string& sql)
{
	return execute_with_retry<exec_result>(
		"Script", sql, {},
		[this, &sql](store::remote_store& connection) -> kcenon::common::Result<exec_result>
		{ return await_result(connection.exec(sql)); });
}

kcenon::common::Result<std::vector<rows_result>> resilient_executor::batch(
	const std::vector<query_descriptor>& statements)
{
	if (statements.empty())
	{
		return std::vector<rows_result>{};
	}

	const auto start_time = std::chrono::steady_clock::now();
	const std::string summary = "batch of " + std::to_string(statements.size()) + " statements";

	auto connection = connections_.get_connection();
	if (connection.is_err())
	{
		return report_connection_failure(connection.error(), summary);
	}

	if (config_.query.enable_logging)
	{
		log_.debug("Executing batch",
				   { { "statement_count", std::to_string(statements.size()) } });
	}

	auto result = [&]() -> kcenon::common::Result<std::vector<rows_result>>
	{
		try
		{
			std::vector<std::shared_ptr<store::prepared_statement>> prepared;
			prepared.reserve(statements.size());
			for (const auto& statement : statements)
			{
				auto bound = prepare_bound(*connection.value(), statement.sql, statement.params);
				if (bound.is_err())
				{
					return bound.error();
				}
				prepared.push_back(bound.value());
			}
			return await_result(connection.value()->batch(prepared));
		}
		catch (const std::exception& e)
		{
			return transient_error(e.what());
		}
	}();

	const auto duration = elapsed_since(start_time);

	if (result.is_err())
	{
		metrics_->record_failure(result.error().message);
		check_slow_query(duration, summary, {});
		log_.error("Batch execution failed",
				   { { "statement_count", std::to_string(statements.size()) },
					 { "error", result.error().message } });
		return result.error();
	}

	metrics_->record_success(duration);
	check_slow_query(duration, summary, {});
	return result;
}

kcenon::common::Result<std::shared_ptr<store::remote_store>> resilient_executor::get_connection() const
{
	return connections_.get_connection();
}

void resilient_executor::set_error_classifier(error_classifier classifier)
{
	classifier_ = std::move(classifier);
}

void resilient_executor::set_sleep_function(sleep_function sleeper)
{
	sleep_ = std::move(sleeper);
}

std::chrono::milliseconds resilient_executor::backoff_delay(uint32_t attempt) const noexcept
{
	return config_.retry.delay * attempt;
}

kcenon::common::Result<std::shared_ptr<store::prepared_statement>> resilient_executor::prepare_bound(
	store::remote_store& connection, const std::string& sql, const query_params& params) const
{
	auto statement = connection.prepare(sql);
	if (!statement)
	{
		return transient_error("Failed to prepare statement");
	}

	if (!params.empty())
	{
		statement = statement->bind(params);
		if (!statement)
		{
			return transient_error("Failed to bind statement parameters");
		}
	}

	return statement;
}

kcenon::common::error_info resilient_executor::report_connection_failure(
	const kcenon::common::error_info& error, const std::string& sql)
{
	metrics_->record_failure(error.message);
	metrics_->record_connection_error();
	log_.error("Database connection unavailable", { { "sql", sql }, { "error", error.message } });
	return error;
}

void resilient_executor::check_slow_query(std::chrono::milliseconds duration,
										  const std::string& sql,
										  const query_params& params)
{
	if (duration <= config_.query.slow_threshold)
	{
		return;
	}

	metrics_->record_slow_query();
	log_.warning("Slow query detected",
				 { { "sql", sql },
				   { "duration", std::to_string(duration.count()) + "ms" },
				   { "params", logging::service_log::format_params(params) } });
}

} // namespace edge_database::resilience
