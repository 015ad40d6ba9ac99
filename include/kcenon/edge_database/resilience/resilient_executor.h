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
 * @file resilient_executor.h
 * @brief Retrying, timed, metered execution of statements against the store
 *
 * Every query, query_one and execute call runs inside a bounded retry loop:
 * up to retry.max_retries attempts, each with a fresh connection from the
 * accessor and a deadline of query.timeout. Between attempts the loop
 * waits retry.delay * attempt (linear backoff). batch is submitted once.
 *
 * Each call records exactly one outcome in the metrics collector, measured
 * over the whole call including retries. Calls slower than
 * query.slow_threshold are counted and logged whatever their outcome.
 *
 * Thread Safety:
 * - Calls may run concurrently; per-call retry state is local
 * - set_error_classifier / set_sleep_function are setup-only: call them
 *   before the executor is shared, never while calls are in flight
 */

#pragma once

#include "error_classifier.h"

#include <kcenon/edge_database/core/database_config.h>
#include <kcenon/edge_database/core/query_types.h>
#include <kcenon/edge_database/logging/service_log.h>
#include <kcenon/edge_database/metrics/database_metrics_collector.h>
#include <kcenon/edge_database/store/connection_accessor.h>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace edge_database::resilience
{

/// Waits between attempts; replaceable so tests do not sleep.
using sleep_function = std::function<void(std::chrono::milliseconds)>;

/**
 * @struct retry_state
 * @brief Progress of one call through the retry loop
 */
struct retry_state
{
	uint32_t attempt{ 0 };
	std::optional<kcenon::common::error_info> last_error;
};

/**
 * @class resilient_executor
 * @brief Executes statements with retry, per-attempt timeout and metrics
 *
 * Design Pattern:
 * - Decorator over remote_store: same operations, plus resilience
 *
 * Usage Example:
 * @code
 * auto metrics = std::make_shared<metrics::database_metrics_collector>();
 * resilient_executor executor(store::connection_accessor::from_store(store),
 *                             metrics, core::database_config::default_config());
 *
 * auto users = executor.query("SELECT * FROM users WHERE status = ?", { "active" });
 * if (users.is_ok()) {
 *     for (const auto& row : users.value().rows) { ... }
 * }
 * @endcode
 */
class resilient_executor
{
public:
	/**
	 * @brief Constructs an executor
	 * @param connections Connection accessor, consulted on every attempt
	 * @param collector Metrics collector shared with the health checker
	 * @param config Retry, timeout and logging settings
	 * @param logger Optional logger
	 */
	resilient_executor(store::connection_accessor connections,
					   std::shared_ptr<metrics::database_metrics_collector> collector,
					   core::database_config config,
					   std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	resilient_executor(const resilient_executor&) = delete;
	resilient_executor& operator=(const resilient_executor&) = delete;

	/**
	 * @brief Executes a read and returns every row.
	 * @return Rows with meta, or query_failed / configuration_error
	 */
	kcenon::common::Result<rows_result> query(const std::string& sql,
											  const query_params& params = {});

	kcenon::common::Result<rows_result> query(const query_descriptor& descriptor);

	/**
	 * @brief Executes a read and returns the first row.
	 *
	 * meta.rows_read is 1 when a row came back and 0 otherwise.
	 */
	kcenon::common::Result<single_row_result> query_one(const std::string& sql,
														const query_params& params = {});

	kcenon::common::Result<single_row_result> query_one(const query_descriptor& descriptor);

	/**
	 * @brief Executes a write.
	 */
	kcenon::common::Result<write_result> execute(const std::string& sql,
												 const query_params& params = {});

	kcenon::common::Result<write_result> execute(const query_descriptor& descriptor);

	/**
	 * @brief Prepares and submits statements as one batch, without retry.
	 *
	 * An empty list returns an empty result without contacting the store.
	 */
	kcenon::common::Result<std::vector<rows_result>> batch(
		const std::vector<query_descriptor>& statements);

	/**
	 * @brief Runs raw SQL through exec(), with the same retry loop as query.
	 *
	 * Used for migration scripts, which carry several statements.
	 */
	kcenon::common::Result<exec_result> exec_script(const std::string& sql);

	/**
	 * @brief Current connection from the accessor
	 */
	kcenon::common::Result<std::shared_ptr<store::remote_store>> get_connection() const;

	/**
	 * @brief Replaces the retry classifier. Setup-only.
	 *
	 * Not synchronised with execute_with_retry; call before any concurrent use.
	 */
	void set_error_classifier(error_classifier classifier);

	/// Replaces the backoff wait. Setup-only, like set_error_classifier.
	void set_sleep_function(sleep_function sleeper);

	/**
	 * @brief Delay before the attempt after @p attempt (retry.delay * attempt)
	 */
	[[nodiscard]] std::chrono::milliseconds backoff_delay(uint32_t attempt) const noexcept;

	[[nodiscard]] const core::database_config& config() const noexcept { return config_; }

	[[nodiscard]] const std::shared_ptr<metrics::database_metrics_collector>& metrics_collector() const noexcept
	{
		return metrics_;
	}

private:
	template <typename T, typename Attempt>
	kcenon::common::Result<T> execute_with_retry(const char* operation,
												 const std::string& sql,
												 const query_params& params,
												 Attempt&& attempt);

	template <typename T>
	kcenon::common::Result<T> await_result(store::store_future<T> future) const;

	kcenon::common::Result<std::shared_ptr<store::prepared_statement>> prepare_bound(
		store::remote_store& connection,
		const std::string& sql,
		const query_params& params) const;

	kcenon::common::error_info report_connection_failure(
		const kcenon::common::error_info& error,
		const std::string& sql);

	void check_slow_query(std::chrono::milliseconds duration,
						  const std::string& sql,
						  const query_params& params);

	store::connection_accessor connections_;
	std::shared_ptr<metrics::database_metrics_collector> metrics_;
	core::database_config config_;
	logging::service_log log_;
	error_classifier classifier_;
	sleep_function sleep_;
};

} // namespace edge_database::resilience
