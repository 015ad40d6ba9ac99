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

#include <kcenon/edge_database/core/query_types.h>

#include <cmath>
#include <type_traits>
#include <sstream>

namespace edge_database
{

std::string to_display_string(const sql_value& value)
{
	return std::visit(
		[](const auto& v) -> std::string
		{
			using T = std::decay_t<decltype(v)>;
			if constexpr (std::is_same_v<T, std::monostate>)
			{
				return "NULL";
			}
			else if constexpr (std::is_same_v<T, bool>)
			{
				return v ? "true" : "false";
			}
			else if constexpr (std::is_same_v<T, int64_t>)
			{
				return std::to_string(v);
			}
			else if constexpr (std::is_same_v<T, double>)
			{
				std::ostringstream oss;
				oss << v;
				return oss.str();
			}
			else if constexpr (std::is_same_v<T, std::string>)
			{
				return "\"" + v + "\"";
			}
			else
			{
				return "<blob " + std::to_string(v.size()) + " bytes>";
			}
		},
		value);
}

std::optional<std::string> get_string(const result_row& row, const std::string& column)
{
	auto it = row.find(column);
	if (it == row.end())
	{
		return std::nullopt;
	}

	if (const auto* text = std::get_if<std::string>(&it->second))
	{
		return *text;
	}
	return std::nullopt;
}

std::optional<int64_t> get_integer(const result_row& row, const std::string& column)
{
	auto it = row.find(column);
	if (it == row.end())
	{
		return std::nullopt;
	}

	if (const auto* integer = std::get_if<int64_t>(&it->second))
	{
		return *integer;
	}
	if (const auto* flag = std::get_if<bool>(&it->second))
	{
		return *flag ? 1 : 0;
	}
	if (const auto* real = std::get_if<double>(&it->second))
	{
		// Remote stores sometimes report COUNT(*) as a float
		if (std::floor(*real) == *real)
		{
			return static_cast<int64_t>(*real);
		}
	}
	return std::nullopt;
}

} // namespace edge_database
