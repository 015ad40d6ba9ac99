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
 * @file database_metrics.h
 * @brief Metric structures for database service calls
 *
 * database_metrics is the live, atomic counter set owned by the collector.
 * database_metrics_snapshot is the copy handed to callers.
 */

#pragma once

#include "metrics_base.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace edge_database::metrics
{

/**
 * @struct database_metrics_snapshot
 * @brief Point-in-time copy of the service metrics
 */
struct database_metrics_snapshot
{
	uint64_t total_queries{ 0 };
	uint64_t successful_queries{ 0 };
	uint64_t failed_queries{ 0 };
	double average_query_time_ms{ 0.0 }; ///< Running mean over successful calls
	uint64_t max_query_time_ms{ 0 };     ///< Slowest successful call
	uint64_t slow_queries{ 0 };
	uint64_t connection_errors{ 0 };
	std::optional<std::string> last_error;
	std::optional<std::chrono::system_clock::time_point> last_error_time;

	/**
	 * @brief failed / total, or 0.0 before the first call
	 */
	[[nodiscard]] double error_rate() const noexcept
	{
		return metrics_utils::calculate_ratio(failed_queries, total_queries);
	}
};

/**
 * @struct database_metrics
 * @brief Live counters for database calls
 *
 * Counter increments are individually atomic; the collector serialises
 * the multi-field updates so that total == successful + failed whenever
 * no call is in flight.
 */
struct database_metrics
{
	std::atomic<uint64_t> total_queries{ 0 };
	std::atomic<uint64_t> successful_queries{ 0 };
	std::atomic<uint64_t> failed_queries{ 0 };
	std::atomic<uint64_t> max_query_time_ms{ 0 };
	std::atomic<uint64_t> slow_queries{ 0 };
	std::atomic<uint64_t> connection_errors{ 0 };

	void reset() noexcept
	{
		metrics_utils::reset_counter(total_queries);
		metrics_utils::reset_counter(successful_queries);
		metrics_utils::reset_counter(failed_queries);
		metrics_utils::reset_counter(max_query_time_ms);
		metrics_utils::reset_counter(slow_queries);
		metrics_utils::reset_counter(connection_errors);
	}
};

/// Flat name/value view used by health details and reporting.
using stats_map = std::map<std::string, double>;

} // namespace edge_database::metrics
