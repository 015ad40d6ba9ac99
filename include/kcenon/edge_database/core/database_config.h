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
 * @file database_config.h
 * @brief Configuration structures for the database service
 *
 * Configuration structs are plain data with defaults set in place.
 * They can be loaded from a key=value file or built programmatically.
 *
 * Thread Safety:
 * NOT thread-safe; a config is copied into each component at construction.
 *
 * Usage:
 * @code
 * using namespace edge_database::core;
 *
 * auto config = database_config::load_from_file("edge_database.conf");
 * if (config) {
 *     for (const auto& err : config->validation_errors()) {
 *         std::cerr << "Config error: " << err << std::endl;
 *     }
 * }
 *
 * auto cfg = database_config::default_config();
 * cfg.retry.max_retries = 5;
 * cfg.query.timeout = std::chrono::milliseconds{ 0 }; // no deadline
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edge_database::core
{

/**
 * @enum retry_mode
 * @brief Which failures the retry loop retries
 */
enum class retry_mode
{
	retry_all,     ///< Every failure is retried until attempts run out
	transient_only ///< Failures classified permanent stop the loop early
};

/**
 * @brief Converts retry_mode to its config file spelling.
 */
constexpr const char* to_string(retry_mode mode) noexcept
{
	switch (mode)
	{
	case retry_mode::retry_all:
		return "retry_all";
	case retry_mode::transient_only:
		return "transient_only";
	default:
		return "unknown";
	}
}

/**
 * @brief Parses a retry_mode from its config file spelling.
 * @return The mode, or nullopt for unknown text.
 */
std::optional<retry_mode> parse_retry_mode(std::string_view text);

/**
 * @struct retry_config
 */
struct retry_config
{
	static constexpr uint32_t max_retries_limit = 100;

	uint32_t max_retries = 3;                      ///< Attempts per call, including the first
	std::chrono::milliseconds delay{ 1000 };       ///< Backoff base; attempt n waits delay * n
	retry_mode mode = retry_mode::retry_all;
};

/**
 * @struct query_config
 */
struct query_config
{
	std::chrono::milliseconds timeout{ 30000 };        ///< Per-attempt deadline (0 disables)
	std::chrono::milliseconds slow_threshold{ 5000 };  ///< Calls slower than this are flagged
	bool enable_logging = true;                        ///< Debug log for every attempt
};

/**
 * @struct metrics_config
 */
struct metrics_config
{
	bool enabled = true; ///< Disabled collectors ignore every record call
};

/**
 * @struct migration_config
 */
struct migration_config
{
	bool run_on_startup = true; ///< database_service::initialize runs pending migrations
};

/**
 * @struct logging_config
 */
struct logging_config
{
	std::string level = "info"; ///< trace, debug, info, warning, error, critical
};

/**
 * @struct database_config
 * @brief Complete configuration of a database service instance
 */
struct database_config
{
	retry_config retry;
	query_config query;
	metrics_config metrics;
	migration_config migrations;
	logging_config logging;

	/**
	 * @brief Load configuration from a key=value file.
	 *
	 * Lines starting with '#' are comments. Unknown keys are ignored.
	 * Keys not present keep their defaults.
	 *
	 * @param path Path to configuration file
	 * @return Loaded configuration, or nullopt if the file cannot be read
	 */
	static std::optional<database_config> load_from_file(const std::string& path);

	/**
	 * @brief Create configuration with default values
	 */
	static database_config default_config();

	/**
	 * @brief Returns true if validation_errors() is empty
	 */
	bool validate() const;

	/**
	 * @brief Human readable list of configuration problems
	 */
	std::vector<std::string> validation_errors() const;
};

} // namespace edge_database::core
