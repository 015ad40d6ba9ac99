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
 * @file console_logger.h
 * @brief Console logger implementation for edge_database
 *
 * Provides an ILogger implementation that writes to stdout/stderr.
 * Any other kcenon::common::interfaces::ILogger can be injected into the
 * service instead.
 *
 * Features:
 * - Implements kcenon::common::interfaces::ILogger
 * - Thread-safe console output
 * - Configurable log levels and component name
 * - UTC ISO-8601 timestamps and log level prefixes
 */

#pragma once

#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace edge_database::logging
{

/**
 * @class console_logger
 * @brief Console logger implementing the ILogger interface
 *
 * Messages below warning go to stdout, warning and above to stderr.
 * Each line carries a timestamp, the level, and the component name when
 * one is set.
 *
 * Thread Safety:
 * - All logging methods are thread-safe
 * - Level changes are atomic
 *
 * Usage:
 * @code
 *   auto logger = edge_database::logging::create_console_logger(
 *       kcenon::common::interfaces::log_level::debug, "DatabaseService");
 *   logger->log(kcenon::common::interfaces::log_level::info, "Migrations complete");
 * @endcode
 */
class console_logger : public kcenon::common::interfaces::ILogger
{
public:
	/**
	 * @brief Construct a console logger
	 * @param min_level Minimum log level to output (default: info)
	 * @param component Name printed in brackets before each message
	 */
	explicit console_logger(
		kcenon::common::interfaces::log_level min_level
		= kcenon::common::interfaces::log_level::info,
		std::string component = "");

	~console_logger() override = default;

	console_logger(const console_logger&) = delete;
	console_logger& operator=(const console_logger&) = delete;

	kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
								   const std::string& message) override;

	kcenon::common::VoidResult log(
		kcenon::common::interfaces::log_level level,
		std::string_view message,
		const kcenon::common::source_location& loc
		= kcenon::common::source_location::current()) override;

	kcenon::common::VoidResult log(
		const kcenon::common::interfaces::log_entry& entry) override;

	bool is_enabled(kcenon::common::interfaces::log_level level) const override;

	kcenon::common::VoidResult set_level(
		kcenon::common::interfaces::log_level level) override;

	kcenon::common::interfaces::log_level get_level() const override;

	kcenon::common::VoidResult flush() override;

	/**
	 * @brief Component name printed with each line
	 */
	const std::string& component() const noexcept { return component_; }

private:
	void write_message(kcenon::common::interfaces::log_level level, const std::string& message);

	std::atomic<kcenon::common::interfaces::log_level> min_level_;
	std::string component_;
	mutable std::mutex output_mutex_;
};

/**
 * @brief Parses a level name as written in configuration files.
 *
 * Accepts trace, debug, info, warning (or warn), error, critical, off.
 *
 * @return The level, or nullopt for unknown text.
 */
std::optional<kcenon::common::interfaces::log_level> parse_log_level(std::string_view text);

/**
 * @brief Factory function to create a console logger
 * @param min_level Minimum log level (default: info)
 * @param component Component name (default: none)
 * @return Shared pointer to ILogger
 */
std::shared_ptr<kcenon::common::interfaces::ILogger> create_console_logger(
	kcenon::common::interfaces::log_level min_level
	= kcenon::common::interfaces::log_level::info,
	std::string component = "");

} // namespace edge_database::logging
