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

#include <kcenon/edge_database/core/database_config.h>

#include <cctype>
#include <filesystem>
#include <fstream>

namespace edge_database::core
{

namespace
{

bool parse_flag(const std::string& value)
{
	return value == "true" || value == "1";
}

/**
 * @brief Parses a non-negative decimal integer no larger than @p limit.
 *
 * Signs, trailing text and out-of-range values yield nullopt so the
 * caller keeps its default.
 */
std::optional<uint64_t> parse_bounded(const std::string& value, uint64_t limit)
{
	if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front())))
	{
		return std::nullopt;
	}

	size_t consumed = 0;
	long long parsed = std::stoll(value, &consumed);
	if (consumed != value.size() || parsed < 0 || static_cast<uint64_t>(parsed) > limit)
	{
		return std::nullopt;
	}
	return static_cast<uint64_t>(parsed);
}

constexpr uint64_t max_duration_ms = 24ULL * 60 * 60 * 1000;

bool is_known_log_level(const std::string& level)
{
	return level == "trace" || level == "debug" || level == "info" || level == "warning"
		   || level == "error" || level == "critical";
}

} // namespace

std::optional<retry_mode> parse_retry_mode(std::string_view text)
{
	if (text == "retry_all")
	{
		return retry_mode::retry_all;
	}
	if (text == "transient_only")
	{
		return retry_mode::transient_only;
	}
	return std::nullopt;
}

std::optional<database_config> database_config::load_from_file(const std::string& path)
{
	if (!std::filesystem::exists(path))
	{
		return std::nullopt;
	}

	std::ifstream file(path);
	if (!file.is_open())
	{
		return std::nullopt;
	}

	database_config config = default_config();

	std::string line;
	while (std::getline(file, line))
	{
		if (line.empty() || line[0] == '#')
		{
			continue;
		}

		auto delimiter_pos = line.find('=');
		if (delimiter_pos == std::string::npos)
		{
			continue;
		}

		std::string key = line.substr(0, delimiter_pos);
		std::string value = line.substr(delimiter_pos + 1);

		auto trim = [](std::string& s)
		{
			s.erase(0, s.find_first_not_of(" \t\r\n"));
			s.erase(s.find_last_not_of(" \t\r\n") + 1);
		};
		trim(key);
		trim(value);

		try
		{
			if (key == "retry.max_retries")
			{
				if (auto parsed = parse_bounded(value, retry_config::max_retries_limit))
				{
					config.retry.max_retries = static_cast<uint32_t>(*parsed);
				}
			}
			else if (key == "retry.delay_ms")
			{
				if (auto parsed = parse_bounded(value, max_duration_ms))
				{
					config.retry.delay = std::chrono::milliseconds{ static_cast<int64_t>(*parsed) };
				}
			}
			else if (key == "retry.mode")
			{
				if (auto mode = parse_retry_mode(value))
				{
					config.retry.mode = *mode;
				}
			}
			else if (key == "query.timeout_ms")
			{
				if (auto parsed = parse_bounded(value, max_duration_ms))
				{
					config.query.timeout = std::chrono::milliseconds{ static_cast<int64_t>(*parsed) };
				}
			}
			else if (key == "query.slow_threshold_ms")
			{
				if (auto parsed = parse_bounded(value, max_duration_ms))
				{
					config.query.slow_threshold = std::chrono::milliseconds{ static_cast<int64_t>(*parsed) };
				}
			}
			else if (key == "query.enable_logging")
			{
				config.query.enable_logging = parse_flag(value);
			}
			else if (key == "metrics.enabled")
			{
				config.metrics.enabled = parse_flag(value);
			}
			else if (key == "migrations.run_on_startup")
			{
				config.migrations.run_on_startup = parse_flag(value);
			}
			else if (key == "logging.level")
			{
				config.logging.level = value;
			}
		}
		catch (const std::exception&)
		{
			// Numbers too large for stoll keep the default for that key
			continue;
		}
	}

	return config;
}

database_config database_config::default_config()
{
	database_config config;
	return config;
}

bool database_config::validate() const
{
	return validation_errors().empty();
}

std::vector<std::string> database_config::validation_errors() const
{
	std::vector<std::string> errors;

	if (retry.max_retries == 0)
	{
		errors.push_back("Retry max_retries must be greater than 0");
	}
	else if (retry.max_retries > retry_config::max_retries_limit)
	{
		errors.push_back("Retry max_retries cannot exceed "
						 + std::to_string(retry_config::max_retries_limit));
	}

	if (retry.delay.count() <= 0)
	{
		errors.push_back("Retry delay must be greater than 0");
	}

	if (query.timeout.count() < 0)
	{
		errors.push_back("Query timeout cannot be negative (use 0 to disable)");
	}

	if (query.slow_threshold.count() <= 0)
	{
		errors.push_back("Slow query threshold must be greater than 0");
	}

	if (!is_known_log_level(logging.level))
	{
		errors.push_back("Invalid log level: " + logging.level
						 + " (valid: trace, debug, info, warning, error, critical)");
	}

	return errors;
}

} // namespace edge_database::core
