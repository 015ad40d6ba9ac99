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
 * @file query_types.h
 * @brief Value, row and result types exchanged with the remote store
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace edge_database
{

/**
 * @brief A single SQL value, either bound as a parameter or read from a row.
 *
 * std::monostate represents SQL NULL.
 */
using sql_value = std::variant<std::monostate, bool, int64_t, double, std::string,
							   std::vector<uint8_t>>;

/// Positional parameters for a statement, bound in order.
using query_params = std::vector<sql_value>;

/// A result row keyed by column name.
using result_row = std::map<std::string, sql_value>;

/**
 * @struct query_descriptor
 * @brief SQL text plus its ordered parameters
 */
struct query_descriptor
{
	std::string sql;
	query_params params;
};

/**
 * @struct query_meta
 * @brief Execution metadata attached to every result
 */
struct query_meta
{
	std::chrono::milliseconds duration{ 0 }; ///< Wall time of the whole call, retries included
	uint64_t rows_read{ 0 };
	uint64_t rows_written{ 0 };
	uint64_t changes{ 0 };
	std::optional<int64_t> last_insert_id;
};

/**
 * @struct rows_result
 * @brief Result of a multi-row read (also used for each batch entry)
 */
struct rows_result
{
	std::vector<result_row> rows;
	bool success{ false };
	query_meta meta;
};

/**
 * @struct single_row_result
 * @brief Result of a first-row read
 */
struct single_row_result
{
	std::optional<result_row> row;
	bool success{ false };
	query_meta meta;
};

/**
 * @struct write_result
 * @brief Result of a write statement
 */
struct write_result
{
	bool success{ false };
	query_meta meta;
};

/**
 * @struct exec_result
 * @brief Result of raw multi-statement execution
 */
struct exec_result
{
	uint64_t count{ 0 }; ///< Number of statements executed
	std::chrono::milliseconds duration{ 0 };
};

/**
 * @brief Returns true if the value is SQL NULL.
 */
inline bool is_null(const sql_value& value) noexcept
{
	return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief Renders a value for log output.
 *
 * Strings are quoted, blobs are shown by size, NULL as "NULL".
 */
std::string to_display_string(const sql_value& value);

/**
 * @brief Reads a column as text.
 * @return The string value, or nullopt if missing or not a string.
 */
std::optional<std::string> get_string(const result_row& row, const std::string& column);

/**
 * @brief Reads a column as an integer.
 * @return The integer value (bool and integral doubles accepted), or nullopt.
 */
std::optional<int64_t> get_integer(const result_row& row, const std::string& column);

} // namespace edge_database
