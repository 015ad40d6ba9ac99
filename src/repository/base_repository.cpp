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

#include <kcenon/edge_database/repository/base_repository.h>

#include <kcenon/edge_database/core/error_codes.h>
#include <kcenon/edge_database/core/record_id_generator.h>

namespace edge_database::repository
{

namespace
{

constexpr const char* module_name = "base_repository";

bool is_managed_column(const std::string& column)
{
	return column == "id" || column == "created_at" || column == "updated_at";
}

query::where_condition id_equals(const std::string& id)
{
	return { "id", query::comparison_operator::equal, sql_value{ id } };
}

} // namespace

base_repository::base_repository(std::shared_ptr<service::database_service> db,
								 std::string table_name)
	: db_(std::move(db))
	, table_name_(std::move(table_name))
{
}

kcenon::common::Result<std::optional<result_row>> base_repository::find_by_id(const std::string& id)
{
	auto result = db_->query_one("SELECT * FROM " + table_name_ + " WHERE id = ?", { id });
	if (result.is_err())
	{
		return result.error();
	}
	return std::optional<result_row>(std::move(result.value().row));
}

kcenon::common::Result<std::vector<result_row>> base_repository::find_many(
	const query::query_options& options)
{
	auto result = db_->query(query::build_select(table_name_, options));
	if (result.is_err())
	{
		return result.error();
	}
	return std::move(result.value().rows);
}

kcenon::common::Result<std::optional<result_row>> base_repository::find_one(
	query::query_options options)
{
	options.limit = 1;
	auto result = db_->query_one(query::build_select(table_name_, options));
	if (result.is_err())
	{
		return result.error();
	}
	return std::optional<result_row>(std::move(result.value().row));
}

kcenon::common::Result<std::vector<result_row>> base_repository::find_by(const std::string& column,
																		 const sql_value& value)
{
	query::query_options options;
	options.where.push_back({ column, query::comparison_operator::equal, value });
	return find_many(options);
}

kcenon::common::Result<std::optional<result_row>> base_repository::find_one_by(
	const std::string& column, const sql_value& value)
{
	query::query_options options;
	options.where.push_back({ column, query::comparison_operator::equal, value });
	return find_one(std::move(options));
}

kcenon::common::Result<uint64_t> base_repository::count(
	const std::vector<query::where_condition>& where)
{
	auto result = db_->query_one(query::build_count(table_name_, where));
	if (result.is_err())
	{
		return result.error();
	}

	const auto& row = result.value().row;
	const auto value = row ? get_integer(*row, "count") : std::nullopt;
	return static_cast<uint64_t>(value.value_or(0));
}

kcenon::common::Result<bool> base_repository::exists(const std::string& id)
{
	auto result = count({ id_equals(id) });
	if (result.is_err())
	{
		return result.error();
	}
	return result.value() > 0;
}

kcenon::common::Result<result_row> base_repository::create(const record_values& values)
{
	const auto id = core::generate_record_id();
	const auto now = core::current_timestamp();

	std::string columns = "id";
	std::string placeholders = "?";
	query_params params{ id };

	for (const auto& [column, value] : values)
	{
		if (is_managed_column(column))
		{
			continue;
		}
		columns += ", " + column;
		placeholders += ", ?";
		params.push_back(value);
	}

	columns += ", created_at, updated_at";
	placeholders += ", ?, ?";
	params.push_back(now);
	params.push_back(now);

	auto inserted = db_->execute("INSERT INTO " + table_name_ + " (" + columns + ") VALUES ("
									 + placeholders + ")",
								 params);
	if (inserted.is_err())
	{
		return inserted.error();
	}

	auto created = find_by_id(id);
	if (created.is_err())
	{
		return created.error();
	}
	if (!created.value())
	{
		return kcenon::common::error_info{ error_codes::not_found,
										   "Created record not found in " + table_name_,
										   module_name };
	}
	return std::move(*created.value());
}

kcenon::common::Result<result_row> base_repository::update(const std::string& id,
														   const record_values& values)
{
	std::string assignments;
	query_params params;

	for (const auto& [column, value] : values)
	{
		if (is_managed_column(column))
		{
			continue;
		}
		assignments += column + " = ?, ";
		params.push_back(value);
	}

	assignments += "updated_at = ?";
	params.push_back(core::current_timestamp());
	params.push_back(id);

	auto updated = db_->execute("UPDATE " + table_name_ + " SET " + assignments + " WHERE id = ?",
								params);
	if (updated.is_err())
	{
		return updated.error();
	}

	auto current = find_by_id(id);
	if (current.is_err())
	{
		return current.error();
	}
	if (!current.value())
	{
		return kcenon::common::error_info{ error_codes::not_found,
										   "Record " + id + " not found in " + table_name_
											   + " after update",
										   module_name };
	}
	return std::move(*current.value());
}

kcenon::common::Result<bool> base_repository::remove(const std::string& id)
{
	auto result = db_->execute("DELETE FROM " + table_name_ + " WHERE id = ?", { id });
	if (result.is_err())
	{
		return result.error();
	}
	return result.value().meta.changes > 0;
}

} // namespace edge_database::repository
