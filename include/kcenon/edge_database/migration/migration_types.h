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
 * @file migration_types.h
 * @brief Migration definitions, bookkeeping records and run states
 */

#pragma once

#include <string>

namespace edge_database::migration
{

/**
 * @struct migration_definition
 * @brief A schema change shipped with the process
 *
 * Definitions are applied in ascending id order. The checksum recorded
 * after applying is computed from the up script.
 */
struct migration_definition
{
	std::string id;         ///< Sortable identifier, e.g. "001"
	std::string name;       ///< Human readable name, e.g. "initial_schema"
	std::string created_at; ///< Authoring date (informational)
	std::string up;         ///< Script applying the change (may hold several statements)
	std::string down;       ///< Script reverting the change (never executed)
};

/**
 * @struct migration_record
 * @brief Row of the migrations bookkeeping table
 */
struct migration_record
{
	std::string id;           ///< Random UUID of the row
	std::string migration_id; ///< migration_definition::id, unique
	std::string name;
	std::string executed_at;
	std::string checksum;
};

/**
 * @enum migration_state
 * @brief Position of a definition in the last run
 *
 * pending -> applying -> applied, or pending -> applying -> failed.
 * applied and failed are terminal; a failure halts the run.
 */
enum class migration_state
{
	pending,
	applying,
	applied,
	failed
};

constexpr const char* to_string(migration_state state) noexcept
{
	switch (state)
	{
	case migration_state::pending:
		return "pending";
	case migration_state::applying:
		return "applying";
	case migration_state::applied:
		return "applied";
	case migration_state::failed:
		return "failed";
	default:
		return "unknown";
	}
}

} // namespace edge_database::migration
