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
 * @file remote_store.h
 * @brief Abstract surface of the remote SQL store
 *
 * The store is an SQLite-dialect database reached over a network. Every
 * terminal operation is asynchronous and resolves to a kcenon::common::Result.
 * A rejected operation resolves to an error Result or throws from get();
 * both are treated as a failed attempt by the caller.
 *
 * Implementations must return futures whose destructor does not block
 * (std::promise or packaged_task based, never std::async with
 * std::launch::async): a timed-out attempt abandons its future.
 */

#pragma once

#include <kcenon/edge_database/core/query_types.h>

#include <kcenon/common/patterns/result.h>

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace edge_database::store
{

/// Pending outcome of a store operation.
template <typename T>
using store_future = std::future<kcenon::common::Result<T>>;

/**
 * @class prepared_statement
 * @brief A prepared statement, optionally bound to parameters
 */
class prepared_statement
{
public:
	virtual ~prepared_statement() = default;

	/**
	 * @brief Binds positional parameters.
	 * @param params Values for the '?' placeholders, in order
	 * @return The bound statement (may be a new object)
	 */
	virtual std::shared_ptr<prepared_statement> bind(const query_params& params) = 0;

	/**
	 * @brief Resolves to the first row, or nullopt if none matched.
	 */
	virtual store_future<std::optional<result_row>> first() = 0;

	/**
	 * @brief Resolves to every matching row with execution metadata.
	 */
	virtual store_future<rows_result> all() = 0;

	/**
	 * @brief Executes a write and resolves to its metadata.
	 */
	virtual store_future<write_result> run() = 0;

	virtual const std::string& sql() const = 0;
};

/**
 * @class remote_store
 * @brief Connection to the remote store
 */
class remote_store
{
public:
	virtual ~remote_store() = default;

	/**
	 * @brief Prepares a statement.
	 * @return The statement, or nullptr if the store refused it
	 */
	virtual std::shared_ptr<prepared_statement> prepare(const std::string& sql) = 0;

	/**
	 * @brief Submits statements as a single batch.
	 *
	 * Atomicity is whatever the store provides for batches; one result per
	 * statement, in submission order.
	 */
	virtual store_future<std::vector<rows_result>> batch(
		const std::vector<std::shared_ptr<prepared_statement>>& statements)
		= 0;

	/**
	 * @brief Executes raw, possibly multi-statement SQL without parameters.
	 */
	virtual store_future<exec_result> exec(const std::string& sql) = 0;
};

} // namespace edge_database::store
