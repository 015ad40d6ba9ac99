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

#include <kcenon/edge_database/logging/console_logger.h>

#include <kcenon/edge_database/core/record_id_generator.h>

#include <iostream>
#include <utility>

namespace edge_database::logging
{

using kcenon::common::interfaces::log_level;

console_logger::console_logger(log_level min_level, std::string component)
	: min_level_(min_level)
	, component_(std::move(component))
{
}

kcenon::common::VoidResult console_logger::log(log_level level, const std::string& message)
{
	if (is_enabled(level))
	{
		write_message(level, message);
	}
	return kcenon::common::VoidResult(std::monostate{});
}

kcenon::common::VoidResult console_logger::log(log_level level,
											   std::string_view message,
											   const kcenon::common::source_location& /*loc*/)
{
	if (is_enabled(level))
	{
		write_message(level, std::string(message));
	}
	return kcenon::common::VoidResult(std::monostate{});
}

kcenon::common::VoidResult console_logger::log(
	const kcenon::common::interfaces::log_entry& entry)
{
	if (is_enabled(entry.level))
	{
		write_message(entry.level, entry.message);
	}
	return kcenon::common::VoidResult(std::monostate{});
}

bool console_logger::is_enabled(log_level level) const
{
	return static_cast<int>(level) >= static_cast<int>(min_level_.load());
}

kcenon::common::VoidResult console_logger::set_level(log_level level)
{
	min_level_.store(level);
	return kcenon::common::VoidResult(std::monostate{});
}

log_level console_logger::get_level() const
{
	return min_level_.load();
}

kcenon::common::VoidResult console_logger::flush()
{
	std::lock_guard<std::mutex> lock(output_mutex_);
	std::cout.flush();
	std::cerr.flush();
	return kcenon::common::VoidResult(std::monostate{});
}

// One line per entry: "<UTC ISO-8601> [LEVEL] [component] message"
void console_logger::write_message(log_level level, const std::string& message)
{
	std::string line = core::current_timestamp();
	line += " [";
	line += kcenon::common::interfaces::to_string(level);
	line += "] ";
	if (!component_.empty())
	{
		line += "[" + component_ + "] ";
	}
	line += message;
	line += '\n';

	std::lock_guard<std::mutex> lock(output_mutex_);
	(level >= log_level::warning ? std::cerr : std::cout) << line;
}

std::optional<log_level> parse_log_level(std::string_view text)
{
	if (text == "trace")
	{
		return log_level::trace;
	}
	if (text == "debug")
	{
		return log_level::debug;
	}
	if (text == "info")
	{
		return log_level::info;
	}
	if (text == "warning" || text == "warn")
	{
		return log_level::warning;
	}
	if (text == "error")
	{
		return log_level::error;
	}
	if (text == "critical")
	{
		return log_level::critical;
	}
	if (text == "off")
	{
		return log_level::off;
	}
	return std::nullopt;
}

std::shared_ptr<kcenon::common::interfaces::ILogger> create_console_logger(
	log_level min_level, std::string component)
{
	return std::make_shared<console_logger>(min_level, std::move(component));
}

} // namespace edge_database::logging
