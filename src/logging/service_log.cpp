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

#include <kcenon/edge_database/logging/service_log.h>

#include <sstream>

namespace edge_database::logging
{

using kcenon::common::interfaces::log_level;

service_log::service_log(std::shared_ptr<kcenon::common::interfaces::ILogger> logger,
						 std::string component)
	: logger_(std::move(logger))
	, component_(std::move(component))
{
}

void service_log::debug(std::string_view message, const log_fields& fields) const
{
	write(log_level::debug, message, fields);
}

void service_log::info(std::string_view message, const log_fields& fields) const
{
	write(log_level::info, message, fields);
}

void service_log::warning(std::string_view message, const log_fields& fields) const
{
	write(log_level::warning, message, fields);
}

void service_log::error(std::string_view message, const log_fields& fields) const
{
	write(log_level::error, message, fields);
}

bool service_log::enabled(log_level level) const
{
	return logger_ && logger_->is_enabled(level);
}

std::string service_log::format(std::string_view component,
								std::string_view message,
								const log_fields& fields)
{
	std::ostringstream oss;
	if (!component.empty())
	{
		oss << "[" << component << "] ";
	}
	oss << message;

	if (!fields.empty())
	{
		oss << " {";
		bool first = true;
		for (const auto& [key, value] : fields)
		{
			if (!first)
			{
				oss << ", ";
			}
			oss << key << "=" << value;
			first = false;
		}
		oss << "}";
	}

	return oss.str();
}

std::string service_log::format_params(const query_params& params)
{
	std::ostringstream oss;
	oss << "[";
	for (size_t i = 0; i < params.size(); ++i)
	{
		if (i > 0)
		{
			oss << ", ";
		}
		oss << to_display_string(params[i]);
	}
	oss << "]";
	return oss.str();
}

void service_log::write(log_level level, std::string_view message, const log_fields& fields) const
{
	if (!enabled(level))
	{
		return;
	}

	// Logging failures never affect the operation being logged
	[[maybe_unused]] auto result = logger_->log(level, format(component_, message, fields));
}

} // namespace edge_database::logging
