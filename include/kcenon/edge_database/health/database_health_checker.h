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
 * @file database_health_checker.h
 * @brief Health reporting for the database service
 *
 * A health check issues a live round-trip probe through the executor and
 * grades the service by the error rate in the current metrics snapshot.
 */

#pragma once

#include <kcenon/edge_database/logging/service_log.h>
#include <kcenon/edge_database/metrics/database_metrics_collector.h>
#include <kcenon/edge_database/resilience/resilient_executor.h>

#include <kcenon/common/interfaces/logger_interface.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace edge_database::health
{

/**
 * @enum health_state
 */
enum class health_state
{
	healthy,
	degraded,
	unhealthy
};

constexpr const char* to_string(health_state state) noexcept
{
	switch (state)
	{
	case health_state::healthy:
		return "healthy";
	case health_state::degraded:
		return "degraded";
	case health_state::unhealthy:
		return "unhealthy";
	default:
		return "unknown";
	}
}

/**
 * @struct health_thresholds
 * @brief Error rate boundaries between health states
 */
struct health_thresholds
{
	double degraded_error_rate{ 0.1 };  ///< Below this: healthy
	double unhealthy_error_rate{ 0.5 }; ///< Below this: degraded, otherwise unhealthy
};

/**
 * @struct service_health
 * @brief Outcome of one health check
 */
struct service_health
{
	health_state status{ health_state::unhealthy };
	std::string message;
	std::chrono::milliseconds response_time{ 0 }; ///< Probe round trip, retries included
	metrics::database_metrics_snapshot metrics_snapshot; ///< Metrics after the probe
	double error_rate{ 0.0 }; ///< Rounded to two decimals
	std::map<std::string, std::string> details;
	std::chrono::system_clock::time_point checked_at;

	[[nodiscard]] bool is_healthy() const noexcept { return status == health_state::healthy; }
};

/**
 * @class database_health_checker
 * @brief Probes the store and grades the service
 *
 * Thread Safety:
 * - check_now() may run concurrently; the cached status is mutex protected
 */
class database_health_checker
{
public:
	/// SQL issued by every probe.
	static constexpr const char* probe_sql = "SELECT 1 as health_check";

	database_health_checker(std::shared_ptr<resilience::resilient_executor> executor,
							std::shared_ptr<metrics::database_metrics_collector> collector,
							health_thresholds thresholds = health_thresholds{},
							std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	/**
	 * @brief Runs the probe and grades the result.
	 *
	 * A failed probe counts a connection error and reports unhealthy with
	 * details["error"] set. Never returns an error itself.
	 */
	service_health check_now();

	/**
	 * @brief Result of the most recent check, if any
	 */
	[[nodiscard]] std::optional<service_health> last_status() const;

	/**
	 * @brief Maps an error rate to a health state.
	 */
	[[nodiscard]] static health_state classify(double error_rate,
											   const health_thresholds& thresholds) noexcept;

private:
	std::shared_ptr<resilience::resilient_executor> executor_;
	std::shared_ptr<metrics::database_metrics_collector> metrics_;
	health_thresholds thresholds_;
	logging::service_log log_;

	mutable std::mutex status_mutex_;
	std::optional<service_health> last_status_;
};

} // namespace edge_database::health
