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
 * @file capturing_logger.h
 * @brief ILogger that keeps every message for assertions
 */

#pragma once

#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace edge_database::test
{

struct captured_log
{
	kcenon::common::interfaces::log_level level;
	std::string message;
};

class capturing_logger : public kcenon::common::interfaces::ILogger
{
public:
	kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
								   const std::string& message) override
	{
		std::lock_guard<std::mutex> lock(mutex_);
		entries_.push_back({ level, message });
		return kcenon::common::VoidResult(std::monostate{});
	}

	kcenon::common::VoidResult log(
		kcenon::common::interfaces::log_level level,
		std::string_view message,
		const kcenon::common::source_location& loc
		= kcenon::common::source_location::current()) override
	{
		(void)loc;
		return log(level, std::string(message));
	}

	kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override
	{
		return log(entry.level, entry.message);
	}

	bool is_enabled(kcenon::common::interfaces::log_level level) const override
	{
		return static_cast<int>(level) >= static_cast<int>(level_);
	}

	kcenon::common::VoidResult set_level(kcenon::common::interfaces::log_level level) override
	{
		level_ = level;
		return kcenon::common::VoidResult(std::monostate{});
	}

	kcenon::common::interfaces::log_level get_level() const override { return level_; }

	kcenon::common::VoidResult flush() override
	{
		return kcenon::common::VoidResult(std::monostate{});
	}

	std::vector<captured_log> entries() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return entries_;
	}

	/// Number of entries at the level whose text contains the fragment.
	size_t count(kcenon::common::interfaces::log_level level, const std::string& fragment) const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return static_cast<size_t>(
			std::count_if(entries_.begin(), entries_.end(),
						  [&](const captured_log& entry)
						  {
							  return entry.level == level
									 && entry.message.find(fragment) != std::string::npos;
						  }));
	}

private:
	mutable std::mutex mutex_;
	std::vector<captured_log> entries_;
	kcenon::common::interfaces::log_level level_{ kcenon::common::interfaces::log_level::trace };
};

} // namespace edge_database::test
