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

#include <kcenon/edge_database/service/database_transaction.h>

#include <kcenon/edge_database/core/error_codes.h>

namespace edge_database::service
{

namespace
{

constexpr const char* module_name = "database_transaction";

template <typename T>
kcenon::common::Result<T> wait_for_result(store::store_future<T> future)
{
	if (!future.valid())
	{
		return kcenon::common::error_info{ error_codes::transient_execution_error,
										   "Remote store returned no pending result",
										   module_name };
	}

	try
	{
		return future.get();
	}
	catch (const std::exception& e)
	{
		return kcenon::common::error_info{ error_codes::transient_execution_error, e.what(),
										   module_name };
	}
}

} // namespace

database_transaction::database_transaction(std::shared_ptr<store::remote_store> connection)
	: connection_(std::move(connection))
{
}

std::shared_ptr<store::prepared_statement> database_transaction::prepare(const std::string& sql)
{
	return connection_->prepare(sql);
}

kcenon::common::Result<std::shared_ptr<store::prepared_statement>> database_transaction::prepare(
	const std::string& sql, const query_params& params)
{
	auto statement = connection_->prepare(sql);
	if (statement && !params.empty())
	{
		statement = statement->bind(params);
	}

	if (!statement)
	{
		return kcenon::common::error_info{ error_codes::transient_execution_error,
										   "Failed to prepare statement", module_name };
	}
	return statement;
}

store::store_future<std::vector<rows_result>> database_transaction::batch(
	const std::vector<std::shared_ptr<store::prepared_statement>>& statements)
{
	return connection_->batch(statements);
}

store::store_future<exec_result> database_transaction::exec(const std::string& sql)
{
	return connection_->exec(sql);
}

kcenon::common::Result<std::vector<rows_result>> database_transaction::run_batch(
	const std::vector<std::shared_ptr<store::prepared_statement>>& statements)
{
	return wait_for_result(batch(statements));
}

kcenon::common::Result<exec_result> database_transaction::run_exec(const std::string& sql)
{
	return wait_for_result(exec(sql));
}

} // namespace edge_database::service
