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
 * @file migration_runner.h
 * @brief Applies pending schema migrations and keeps their bookkeeping
 *
 * The runner records every applied definition in the `migrations` table.
 * A definition is applied at most once: pending work excludes ids already
 * recorded, and migration_id is UNIQUE in the table.
 *
 * Scripts run through the resilient executor, so each one is retried like
 * any other statement. There is no transaction around a script: a script
 * that fails halfway leaves its completed statements applied.
 *
 * Thread Safety:
 * run_migrations must not run concurrently with itself. state() may be
 * called from any thread.
 */

#pragma once

#include "builtin_migrations.h"
#include "migration_types.h"

#include <kcenon/edge_database/logging/service_log.h>
#include <kcenon/edge_database/resilience/resilient_executor.h>

#include <kcenon/common/interfaces/logger_interface.h>
#include <kcenon/common/patterns/result.h>

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace edge_database::migration
{

/**
 * @class migration_runner
 * @brief Runs migration definitions in ascending id order
 *
 * @code
 * migration_runner runner(executor, builtin_migrations(), logger);
 * auto applied = runner.run_migrations();
 * if (applied.is_err()) {
 *     // error_codes::migration_error, remaining migrations were not run
 * }
 * @endcode
 */
class migration_runner
{
public:
	/**
	 * @brief Constructs a runner
	 * @param executor Executor used for every statement
	 * @param definitions Definitions to manage (sorted by id on construction)
	 * @param logger Optional logger
	 */
	migration_runner(std::shared_ptr<resilience::resilient_executor> executor,
					 std::vector<migration_definition> definitions = builtin_migrations(),
					 std::shared_ptr<kcenon::common::interfaces::ILogger> logger = nullptr);

	migration_runner(const migration_runner&) = delete;
	migration_runner& operator=(const migration_runner&) = delete;

	/**
	 * @brief Creates the bookkeeping table if it does not exist.
	 */
	kcenon::common::VoidResult ensure_migrations_table();

	/**
	 * @brief Definitions whose id is not recorded yet, in ascending id order.
	 */
	kcenon::common::Result<std::vector<migration_definition>> pending_migrations();

	/**
	 * @brief Applies every pending definition.
	 *
	 * The first failure halts the run; later definitions stay pending.
	 *
	 * @return Number of definitions applied, or migration_error
	 */
	kcenon::common::Result<size_t> run_migrations();

	/**
	 * @brief Bookkeeping records, most recently executed first.
	 */
	kcenon::common::Result<std::vector<migration_record>> get_migration_status();

	/**
	 * @brief Always fails with unsupported_operation.
	 */
	kcenon::common::VoidResult rollback_migration(const std::string& migration_id);

	/**
	 * @brief Ids of recorded migrations whose stored checksum no longer
	 *        matches the definition's up script.
	 *
	 * Records without a matching definition are ignored.
	 */
	kcenon::common::Result<std::vector<std::string>> verify_checksums();

	/**
	 * @brief Position of a definition in the last run.
	 *
	 * Definitions not touched by a run report pending.
	 */
	migration_state state(const std::string& migration_id) const;

	const std::vector<migration_definition>& definitions() const noexcept { return definitions_; }

	/**
	 * @brief FNV-1a 32-bit hash of the content as 8 lowercase hex digits.
	 *
	 * Detects accidental drift of a script; not a security control.
	 */
	static std::string calculate_checksum(std::string_view content);

private:
	kcenon::common::Result<std::set<std::string>> executed_migration_ids();

	kcenon::common::VoidResult apply_migration(const migration_definition& definition);

	void set_state(const std::string& migration_id, migration_state state);

	std::shared_ptr<resilience::resilient_executor> executor_;
	std::vector<migration_definition> definitions_;
	logging::service_log log_;

	mutable std::mutex state_mutex_;
	std::map<std::string, migration_state> states_;
};

} // namespace edge_database::migration
