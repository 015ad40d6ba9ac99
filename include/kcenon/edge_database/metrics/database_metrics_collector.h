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
 * @file database_metrics_collector.h
 * @brief Thread-safe collector of database call metrics
 *
 * Every terminal call of the service records exactly one outcome:
 * record_success or record_failure. Slow calls and connection errors are
 * counted separately and may accompany either outcome.
 *
 * Usage Example:
 * @code
 * database_metrics_collector collector;
 * collector.record_success(std::chrono::milliseconds{ 12 });
 * collector.record_failure("no such table: users");
 *
 * auto snapshot = collector.snapshot();
 * double rate = snapshot.error_rate(); // 0.5
 * @endcode
 */

#pragma once

#include "database_metrics.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace edge_database::metrics
{

/**
 * @struct collector_options
 * @brief Configuration options for the metrics collector
 */
struct collector_options
{
	bool enabled = true; ///< Disabled collectors ignore every record call
};

/**
 * @class database_metrics_collector
 * @brief Aggregates call outcomes into database_metrics
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Outcome recording and snapshot() share one mutex, so a snapshot never
 *   observes a half-recorded call
 * - Slow query and connection error counters are lock-free
 */
class database_metrics_collector
{
public:
	static constexpr const char* collector_name = "database_metrics_collector";

	explicit database_metrics_collector(
		const collector_options& options = collector_options{});

	database_metrics_collector(const database_metrics_collector&) = delete;
	database_metrics_collector& operator=(const database_metrics_collector&) = delete;

	/**
	 * @brief Record a successful call and fold its duration into the mean.
	 * @param duration Wall time of the call, retries included
	 */
	void record_success(std::chrono::milliseconds duration);

	/**
	 * @brief Record a failed call.
	 * @param error_message Stored as last_error
	 * @param when Stored as last_error_time
	 */
	void record_failure(const std::string& error_message,
						std::chrono::system_clock::time_point when
						= std::chrono::system_clock::now());

	void record_slow_query();

	void record_connection_error();

	/**
	 * @brief Copy of the current metrics
	 */
	[[nodiscard]] database_metrics_snapshot snapshot() const;

	/**
	 * @brief Zero every counter and clear last_error
	 */
	void reset();

	/**
	 * @brief Flat view of the snapshot ("total_queries", "error_rate", ...)
	 */
	[[nodiscard]] stats_map get_statistics() const;

	[[nodiscard]] bool is_enabled() const noexcept { return options_.enabled; }

	[[nodiscard]] const collector_options& options() const noexcept { return options_; }

private:
	collector_options options_;
	database_metrics metrics_;

	mutable std::mutex state_mutex_;
	double average_query_time_ms_{ 0.0 };
	std::optional<std::string> last_error_;
	std::optional<std::chrono::system_clock::time_point> last_error_time_;
};

} // namespace edge_database::metrics
