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
 * @file error_codes.h
 * @brief Error codes reported through kcenon::common::error_info
 *
 * Every fallible operation in edge_database returns a kcenon::common::Result
 * whose error_info::code is one of the constants below. The module field
 * names the component that produced the error.
 */

#pragma once

namespace edge_database::error_codes
{

/// No connection provider is configured or it yielded no store.
constexpr int configuration_error = -100;

/// A single store round trip failed (rejected, threw, or could not prepare).
constexpr int transient_execution_error = -101;

/// An attempt did not complete within query_timeout.
constexpr int query_timeout = -102;

/// The retry loop gave up; message carries attempt count and last error.
constexpr int query_failed = -103;

/// A migration up script or its bookkeeping insert failed.
constexpr int migration_error = -104;

/// Operation deliberately not supported (rollback, schema introspection).
constexpr int unsupported_operation = -105;

constexpr int invalid_argument = -106;

constexpr int not_found = -107;

/// A transaction callback threw instead of returning an error.
constexpr int callback_failed = -108;

} // namespace edge_database::error_codes

namespace edge_database
{

/**
 * @brief Maps an error code to its category name.
 * @param code One of the error_codes constants.
 * @return Category name such as "QueryFailedError", or "UnknownError".
 */
constexpr const char* error_category_name(int code) noexcept
{
	switch (code)
	{
	case error_codes::configuration_error:
		return "ConfigurationError";
	case error_codes::transient_execution_error:
		return "TransientExecutionError";
	case error_codes::query_timeout:
		return "QueryTimeoutError";
	case error_codes::query_failed:
		return "QueryFailedError";
	case error_codes::migration_error:
		return "MigrationError";
	case error_codes::unsupported_operation:
		return "UnsupportedOperationError";
	case error_codes::invalid_argument:
		return "InvalidArgumentError";
	case error_codes::not_found:
		return "NotFoundError";
	case error_codes::callback_failed:
		return "CallbackFailedError";
	default:
		return "UnknownError";
	}
}

} // namespace edge_database
