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

#include <kcenon/edge_database/metrics/database_metrics_collector.h>

namespace edge_database::metrics
{

database_metrics_collector::database_metrics_collector(const collector_options& options)
	: options_(options)
{
}

void database_metrics_collector::record_success(std::chrono::milliseconds duration)
{
	if (!options_.enabled)
	{
		return;
	}

	const auto duration_ms = duration.count() < 0 ? uint64_t{ 0 }
												  : static_cast<uint64_t>(duration.count());

	std::lock_guard<std::mutex> lock(state_mutex_);
	metrics_.total_queries.fetch_add(1, std::memory_order_relaxed);
	const auto successes = metrics_.successful_queries.fetch_add(1, std::memory_order_relaxed) + 1;
	average_query_time_ms_ = metrics_utils::fold_mean(
		average_query_time_ms_, static_cast<double>(duration_ms), successes);
	metrics_utils::update_max(metrics_.max_query_time_ms, duration_ms);
}

void database_metrics_collector::record_failure(const std::string& error_message,
												std::chrono::system_clock::time_point when)
{
	if (!options_.enabled)
	{
		return;
	}

	std::lock_guard<std::mutex> lock(state_mutex_);
	metrics_.total_queries.fetch_add(1, std::memory_order_relaxed);
	metrics_.failed_queries.fetch_add(1, std::memory_order_relaxed);
	last_error_ = error_message;
	last_error_time_ = when;
}

void database_metrics_collector::record_slow_query()
{
	if (options_.enabled)
	{
		metrics_.slow_queries.fetch_add(1, std::memory_order_relaxed);
	}
}

void database_metrics_collector::record_connection_error()
{
	if (options_.enabled)
	{
		metrics_.connection_errors.fetch_add(1, std::memory_order_relaxed);
	}
}

database_metrics_snapshot database_metrics_collector::snapshot() const
{
	std::lock_guard<std::mutex> lock(state_mutex_);

	database_metrics_snapshot result;
	result.total_queries = metrics_.total_queries.load(std::memory_order_relaxed);
	result.successful_queries = metrics_.successful_queries.load(std::memory_order_relaxed);
	result.failed_queries = metrics_.failed_queries.load(std::memory_order_relaxed);
	result.average_query_time_ms = average_query_time_ms_;
	result.max_query_time_ms = metrics_.max_query_time_ms.load(std::memory_order_relaxed);
	result.slow_queries = metrics_.slow_queries.load(std::memory_order_relaxed);
	result.connection_errors = metrics_.connection_errors.load(std::memory_order_relaxed);
	result.last_error = last_error_;
	result.last_error_time = last_error_time_;
	return result;
}

void database_metrics_collector::reset()
{
	std::lock_guard<std::mutex> lock(state_mutex_);
	metrics_.reset();
	average_query_time_ms_ = 0.0;
	last_error_.reset();
	last_error_time_.reset();
}

stats_map database_metrics_collector::get_statistics() const
{
	auto current = snapshot();

	stats_map stats;
	stats["total_queries"] = static_cast<double>(current.total_queries);
	stats["successful_queries"] = static_cast<double>(current.successful_queries);
	stats["failed_queries"] = static_cast<double>(current.failed_queries);
	stats["average_query_time_ms"] = current.average_query_time_ms;
	stats["max_query_time_ms"] = static_cast<double>(current.max_query_time_ms);
	stats["slow_queries"] = static_cast<double>(current.slow_queries);
	stats["connection_errors"] = static_cast<double>(current.connection_errors);
	stats["error_rate"] = current.error_rate();
	return stats;
}

} // namespace edge_database::metrics
