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
 * @file error_classifier.h
 * @brief Decides whether a failed attempt is worth retrying
 *
 * The retry loop consults a classifier after every failed attempt. A
 * permanent classification ends the loop early; the call still reports
 * error_codes::query_failed with the attempts made so far.
 *
 * Timeouts are always transient, whatever the classifier says.
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <functional>
#include <string>
#include <vector>

namespace edge_database::resilience
{

/**
 * @enum error_class
 */
enum class error_class
{
	transient, ///< May succeed on a later attempt
	permanent  ///< Will fail the same way every time
};

constexpr const char* to_string(error_class value) noexcept
{
	switch (value)
	{
	case error_class::transient:
		return "transient";
	case error_class::permanent:
		return "permanent";
	default:
		return "unknown";
	}
}

/// Classifies the error of one failed attempt.
using error_classifier = std::function<error_class(const kcenon::common::error_info&)>;

/**
 * @brief Classifier that treats every failure as transient.
 */
error_classifier retry_all_classifier();

/**
 * @brief Message fragments that mark an SQLite-dialect error as permanent.
 *
 * Syntax errors, missing tables or columns, constraint violations and
 * type mismatches do not change between attempts.
 */
std::vector<std::string> default_permanent_patterns();

/**
 * @brief Classifier that matches error messages against patterns.
 *
 * Matching is a case-insensitive substring search. Any match is permanent.
 *
 * @param permanent_patterns Message fragments that mark a failure permanent
 */
error_classifier message_pattern_classifier(
	std::vector<std::string> permanent_patterns = default_permanent_patterns());

} // namespace edge_database::resilience
