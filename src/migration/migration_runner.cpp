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

#include <kcenon/edge_database/migration/migration_runner.h>

#include <kcenon/edge_database/core/error_codes.h>
#include <kcenon/edge_database/core/record_id_generator.h>

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace edge_database::migration
{

namespace
{

constexpr const char* module_name = "migration_runner";

migration_record to_record(const result_row& row)
{
	migration_record record;
	record.id = get_string(row, "id").value_or("");
	record.migration_id = get_string(row, "migration_id").value_or("");
	record.name = get_string(row, "name").value_or("");
	record.executed_at = get_string(row, "executed_at").value_or("");
	record.checksum = get_string(row, "checksum").value_or("");
	return record;
}

} // namespace

migration_runner::migration_runner(std::shared_ptr<resilience::resilient_executor> executor,
								   std::vector<migration_definition> definitions,
								   std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
	: executor_(std::move(executor))
	, definitions_(std::move(definitions))
	, log_(std::move(logger), "MigrationRunner")
{
	std::stable_sort(definitions_.begin(), definitions_.end(),
					 [](const migration_definition& lhs, const migration_definition& rhs)
					 { return lhs.id < rhs.id; });
}

kcenon::common::VoidResult migration_runner::ensure_migrations_table()
{
	auto result = executor_->execute(std::string(migrations_table_sql));
	if (result.is_err())
	{
		return result.error();
	}
	return kcenon::common::ok();
}

kcenon::common::Result<std::set<std::string>> migration_runner::executed_migration_ids()
{
	auto result = executor_->query("SELECT migration_id FROM migrations ORDER BY executed_at");
	if (result.is_err())
	{
		return result.error();
	}

	std::set<std::string> ids;
	for (const auto& row : result.value().rows)
	{
		if (auto id = get_string(row, "migration_id"))
		{
			ids.insert(*id);
		}
	}
	return ids;
}

kcenon::common::Result<std::vector<migration_definition>> migration_runner::pending_migrations()
{
	auto executed = executed_migration_ids();
	if (executed.is_err())
	{
		return executed.error();
	}

	std::vector<migration_definition> pending;
	for (const auto& definition : definitions_)
	{
		if (executed.value().count(definition.id) == 0)
		{
			pending.push_back(definition);
		}
	}
	return pending;
}

kcenon::common::Result<size_t> migration_runner::run_migrations()
{
	log_.info("Running database migrations");

	auto table = ensure_migrations_table();
	if (table.is_err())
	{
		log_.error("Migration failed", { { "error", table.error().message } });
		return kcenon::common::error_info{ error_codes::migration_error,
										   "Failed to create migrations table: "
											   + table.error().message,
										   module_name };
	}

	auto pending = pending_migrations();
	if (pending.is_err())
	{
		log_.error("Migration failed", { { "error", pending.error().message } });
		return kcenon::common::error_info{ error_codes::migration_error,
										   "Failed to read executed migrations: "
											   + pending.error().message,
										   module_name };
	}

	for (const auto& definition : pending.value())
	{
		set_state(definition.id, migration_state::pending);
	}

	size_t applied = 0;
	for (const auto& definition : pending.value())
	{
		auto result = apply_migration(definition);
		if (result.is_err())
		{
			log_.error("Migration failed", { { "error", result.error().message } });
			return result.error();
		}
		++applied;
	}

	log_.info("Migrations completed", { { "count", std::to_string(applied) } });
	return applied;
}

kcenon::common::VoidResult migration_runner::apply_migration(const migration_definition& definition)
{
	set_state(definition.id, migration_state::applying);

	const logging::log_fields fields = { { "id", definition.id }, { "name", definition.name } };

	auto script = executor_->exec_script(definition.up);
	if (script.is_err())
	{
		set_state(definition.id, migration_state::failed);
		auto failed_fields = fields;
		failed_fields.emplace_back("error", script.error().message);
		log_.error("Migration execution failed", failed_fields);
		return kcenon::common::error_info{ error_codes::migration_error,
										   "Migration " + definition.id + " (" + definition.name
											   + ") failed: " + script.error().message,
										   module_name };
	}

	auto record = executor_->execute(
		"INSERT INTO migrations (id, migration_id, name, checksum) VALUES (?, ?, ?, ?)",
		{ core::generate_record_id(), definition.id, definition.name,
		  calculate_checksum(definition.up) });
	if (record.is_err())
	{
		set_state(definition.id, migration_state::failed);
		auto failed_fields = fields;
		failed_fields.emplace_back("error", record.error().message);
		log_.error("Migration execution failed", failed_fields);
		return kcenon::common::error_info{ error_codes::migration_error,
										   "Migration " + definition.id
											   + " applied but not recorded: "
											   + record.error().message,
										   module_name };
	}

	set_state(definition.id, migration_state::applied);
	log_.info("Migration executed", fields);
	return kcenon::common::ok();
}

kcenon::common::Result<std::vector<migration_record>> migration_runner::get_migration_status()
{
	auto result = executor_->query("SELECT * FROM migrations ORDER BY executed_at DESC");
	if (result.is_err())
	{
		return result.error();
	}

	std::vector<migration_record> records;
	records.reserve(result.value().rows.size());
	for (const auto& row : result.value().rows)
	{
		records.push_back(to_record(row));
	}
	return records;
}

kcenon::common::VoidResult migration_runner::rollback_migration(const std::string& migration_id)
{
	log_.warning("Migration rollback requested", { { "id", migration_id } });
	return kcenon::common::error_info{ error_codes::unsupported_operation,
									   "Migration rollback not implemented", module_name };
}

kcenon::common::Result<std::vector<std::string>> migration_runner::verify_checksums()
{
	auto status = get_migration_status();
	if (status.is_err())
	{
		return status.error();
	}

	std::vector<std::string> drifted;
	for (const auto& record : status.value())
	{
		auto it = std::find_if(definitions_.begin(), definitions_.end(),
							   [&record](const migration_definition& definition)
							   { return definition.id == record.migration_id; });
		if (it == definitions_.end())
		{
			continue;
		}

		if (calculate_checksum(it->up) != record.checksum)
		{
			log_.warning("Migration checksum mismatch",
						 { { "id", record.migration_id },
						   { "stored", record.checksum },
						   { "current", calculate_checksum(it->up) } });
			drifted.push_back(record.migration_id);
		}
	}

	std::sort(drifted.begin(), drifted.end());
	return drifted;
}

migration_state migration_runner::state(const std::string& migration_id) const
{
	std::lock_guard<std::mutex> lock(state_mutex_);
	auto it = states_.find(migration_id);
	return it == states_.end() ? migration_state::pending : it->second;
}

std::string migration_runner::calculate_checksum(std::string_view content)
{
	uint32_t hash = 2166136261u;
	for (unsigned char c : content)
	{
		hash ^= c;
		hash *= 16777619u;
	}

	std::ostringstream oss;
	oss << std::hex << std::setfill('0') << std::setw(8) << hash;
	return oss.str();
}

void migration_runner::set_state(const std::string& migration_id, migration_state state)
{
	std::lock_guard<std::mutex> lock(state_mutex_);
	states_[migration_id] = state;
}

} // namespace edge_database::migration
