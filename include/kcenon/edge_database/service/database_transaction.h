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
 * @file database_transaction.h
 * @brief Callback scope handed to database_service::transaction
 *
 * The remote store has no transactions. A database_transaction only pins
 * one connection for the duration of a callback and exposes its prepare,
 * batch and exec operations. Statements run as the callback issues them;
 * nothing is rolled back when the callback fails. The only atomic unit is
 * a single batch(), and only as atomic as the store makes it.
 */

#pragma once

#include <kcenon/edge_database/core/query_types.h>
#include <kcenon/edge_database/store/remote_store.h>

#include <kcenon/common/patterns/result.h>

#include <memory>
#include <string>
#include <vector>

namespace edge_database::service
{

/**
 * @class database_transaction
 * @brief Pass-through to one pinned store connection
 *
 * Calls are not retried, timed or counted in metrics.
 */
class database_transaction
{
public:
	explicit database_transaction(std::shared_ptr<store::remote_store> connection);

	/**
	 * @brief Prepares a statement on the pinned connection.
	 * @return The statement, or nullptr if the store refused it
	 */
	std::shared_ptr<store::prepared_statement> prepare(const std::string& sql);

	/**
	 * @brief Prepares and binds in one step.
	 */
	kcenon::common::Result<std::shared_ptr<store::prepared_statement>> prepare(
		const std::string& sql, const query_params& params);

	store::store_future<std::vector<rows_result>> batch(
		const std::vector<std::shared_ptr<store::prepared_statement>>& statements);

	store::store_future<exec_result> exec(const std::string& sql);

	/**
	 * @brief Submits a batch and waits for its outcome.
	 */
	kcenon::common::Result<std::vector<rows_result>> run_batch(
		const std::vector<std::shared_ptr<store::prepared_statement>>& statements);

	/**
	 * @brief Runs exec() and waits for its outcome.
	 */
	kcenon::common::Result<exec_result> run_exec(const std::string& sql);

	const std::shared_ptr<store::remote_store>& connection() const noexcept { return connection_; }

private:
	std::shared_ptr<store::remote_store> connection_;
};

} // namespace edge_database::service
