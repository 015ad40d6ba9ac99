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
 * @file base_repository.h
 * @brief Table-scoped CRUD helpers on top of database_service
 *
 * Records are identified by a TEXT `id` column and carry `created_at` /
 * `updated_at` timestamps. Concrete repositories derive from
 * base_repository and add domain queries.
 */

#pragma once

#include <kcenon/edge_database/core/query_types.h>
#include <kcenon/edge_database/query/clause_builder.h>
#include <kcenon/edge_database/service/database_service.h>

#include <kcenon/common/patterns/result.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace edge_database::repository
{

/// Column/value pairs written by create and update, in column order.
using record_values = std::vector<std::pair<std::string, sql_value>>;

/**
 * @class base_repository
 * @brief CRUD operations for one table
 *
 * @code
 * class user_repository : public base_repository
 * {
 * public:
 *     explicit user_repository(std::shared_ptr<service::database_service> db)
 *         : base_repository(std::move(db), "users") {}
 *
 *     auto find_by_email(const std::string& email) { return find_one_by("email", email); }
 * };
 * @endcode
 */
class base_repository
{
public:
	base_repository(std::shared_ptr<service::database_service> db, std::string table_name);
	virtual ~base_repository() = default;

	kcenon::common::Result<std::optional<result_row>> find_by_id(const std::string& id);

	kcenon::common::Result<std::vector<result_row>> find_many(
		const query::query_options& options = {});

	/**
	 * @brief First row matching the options; the limit is forced to 1.
	 */
	kcenon::common::Result<std::optional<result_row>> find_one(query::query_options options = {});

	kcenon::common::Result<std::vector<result_row>> find_by(const std::string& column,
															const sql_value& value);

	kcenon::common::Result<std::optional<result_row>> find_one_by(const std::string& column,
																  const sql_value& value);

	kcenon::common::Result<uint64_t> count(const std::vector<query::where_condition>& where = {});

	kcenon::common::Result<bool> exists(const std::string& id);

	/**
	 * @brief Inserts a record with a new id and both timestamps.
	 *
	 * Values for id, created_at and updated_at are ignored.
	 *
	 * @return The inserted record as read back from the store
	 */
	kcenon::common::Result<result_row> create(const record_values& values);

	/**
	 * @brief Updates columns and bumps updated_at.
	 * @return The updated record, or not_found if it no longer exists
	 */
	kcenon::common::Result<result_row> update(const std::string& id, const record_values& values);

	/**
	 * @brief Deletes a record.
	 * @return true if a row was deleted
	 */
	kcenon::common::Result<bool> remove(const std::string& id);

	const std::string& table_name() const noexcept { return table_name_; }

protected:
	service::database_service& db() noexcept { return *db_; }

private:
	std::shared_ptr<service::database_service> db_;
	std::string table_name_;
};

} // namespace edge_database::repository
