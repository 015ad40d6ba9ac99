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
 * @file service_log.h
 * @brief Null-safe structured logging front for edge_database components
 *
 * Components hold an optional ILogger. service_log hides the null check,
 * prefixes the component name and renders key/value context as
 * "message {key=value, key=value}".
 */

#pragma once

#include <kcenon/edge_database/core/query_types.h>

#include <kcenon/common/interfaces/logger_interface.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace edge_database::logging
{

/// Ordered key/value context attached to a log line.
using log_fields = std::vector<std::pair<std::string, std::string>>;

/**
 * @class service_log
 * @brief Thin wrapper that forwards to an optional ILogger
 *
 * A default-constructed or null-logger service_log drops everything.
 */
class service_log
{
public:
	service_log() = default;
	service_log(std::shared_ptr<kcenon::common::interfaces::ILogger> logger,
				std::string component);

	void debug(std::string_view message, const log_fields& fields = {}) const;
	void info(std::string_view message, const log_fields& fields = {}) const;
	void warning(std::string_view message, const log_fields& fields = {}) const;
	void error(std::string_view message, const log_fields& fields = {}) const;

	/**
	 * @brief Returns true if a logger is attached and accepts the level.
	 */
	bool enabled(kcenon::common::interfaces::log_level level) const;

	const std::shared_ptr<kcenon::common::interfaces::ILogger>& logger() const noexcept
	{
		return logger_;
	}

	/**
	 * @brief Renders "[component] message {k=v, ...}".
	 *
	 * The brace block is omitted when there are no fields and the bracket
	 * prefix is omitted when the component is empty.
	 */
	static std::string format(std::string_view component,
							  std::string_view message,
							  const log_fields& fields);

	/**
	 * @brief Renders parameters as "[1, \"a\", NULL]".
	 */
	static std::string format_params(const query_params& params);

private:
	void write(kcenon::common::interfaces::log_level level,
			   std::string_view message,
			   const log_fields& fields) const;

	std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
	std::string component_;
};

} // namespace edge_database::logging
