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

#include <kcenon/edge_database/health/database_health_checker.h>

#include <kcenon/edge_database/core/error_codes.h>
#include <kcenon/edge_database/metrics/metrics_base.h>

#include <iomanip>
#include <sstream>

namespace edge_database::health
{

namespace
{

std::string format_rate(double rate)
{
	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2) << rate;
	return oss.str();
}

} // namespace

database_health_checker::database_health_checker(
	std::shared_ptr<resilience::resilient_executor> executor,
	std::shared_ptr<metrics::database_metrics_collector> collector,
	health_thresholds thresholds,
	std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
	: executor_(std::move(executor))
	, metrics_(std::move(collector))
	, thresholds_(thresholds)
	, log_(std::move(logger), "DatabaseHealth")
{
}

service_health database_health_checker::check_now()
{
	const auto start_time = std::chrono::steady_clock::now();
	auto probe = executor_->query_one(probe_sql);
	const auto response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - start_time);

	service_health health;
	health.response_time = response_time;
	health.checked_at = std::chrono::system_clock::now();

	if (probe.is_err())
	{
		// Connection acquisition failures were already counted by the executor
		if (probe.error().code != error_codes::configuration_error)
		{
			metrics_->record_connection_error();
		}

		health.status = health_state::unhealthy;
		health.message = "Database connection failed";
		health.metrics_snapshot = metrics_->snapshot();
		health.error_rate = metrics::metrics_utils::round_to(health.metrics_snapshot.error_rate(), 2);
		health.details["error"] = probe.error().message;

		log_.error("Health check failed", { { "error", probe.error().message } });
	}
	else
	{
		health.metrics_snapshot = metrics_->snapshot();
		const double error_rate = health.metrics_snapshot.error_rate();

		health.status = classify(error_rate, thresholds_);
		health.message = "Database service is operational";
		health.error_rate = metrics::metrics_utils::round_to(error_rate, 2);
		health.details["total_queries"] = std::to_string(health.metrics_snapshot.total_queries);
		health.details["slow_queries"] = std::to_string(health.metrics_snapshot.slow_queries);

		if (health.status != health_state::healthy)
		{
			log_.warning("Database service is not healthy",
						 { { "status", to_string(health.status) },
						   { "error_rate", format_rate(health.error_rate) } });
		}
	}

	std::lock_guard<std::mutex> lock(status_mutex_);
	last_status_ = health;
	return health;
}

std::optional<service_health> database_health_checker::last_status() const
{
	std::lock_guard<std::mutex> lock(status_mutex_);
	return last_status_;
}

health_state database_health_checker::classify(double error_rate,
											   const health_thresholds& thresholds) noexcept
{
	if (error_rate < thresholds.degraded_error_rate)
	{
		return health_state::healthy;
	}
	if (error_rate < thresholds.unhealthy_error_rate)
	{
		return health_state::degraded;
	}
	return health_state::unhealthy;
}

} // namespace edge_database::health
