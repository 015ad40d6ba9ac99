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

#include <kcenon/edge_database/resilience/error_classifier.h>

#include <kcenon/edge_database/core/error_codes.h>

#include <algorithm>
#include <cctype>

namespace edge_database::resilience
{

namespace
{

std::string to_lower(std::string text)
{
	std::transform(text.begin(), text.end(), text.begin(),
				   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return text;
}

} // namespace

error_classifier retry_all_classifier()
{
	return [](const kcenon::common::error_info&) { return error_class::transient; };
}

std::vector<std::string> default_permanent_patterns()
{
	return { "syntax error",
			 "no such table",
			 "no such column",
			 "constraint failed",
			 "datatype mismatch",
			 "already exists",
			 "authorization denied" };
}

error_classifier message_pattern_classifier(std::vector<std::string> permanent_patterns)
{
	for (auto& pattern : permanent_patterns)
	{
		pattern = to_lower(pattern);
	}

	return [patterns = std::move(permanent_patterns)](const kcenon::common::error_info& error)
	{
		if (error.code == error_codes::query_timeout)
		{
			return error_class::transient;
		}

		const auto message = to_lower(error.message);
		for (const auto& pattern : patterns)
		{
			if (!pattern.empty() && message.find(pattern) != std::string::npos)
			{
				return error_class::permanent;
			}
		}
		return error_class::transient;
	};
}

} // namespace edge_database::resilience
