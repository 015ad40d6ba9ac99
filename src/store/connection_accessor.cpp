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

#include <kcenon/edge_database/store/connection_accessor.h>

#include <kcenon/edge_database/core/error_codes.h>

#include <exception>
#include <string>

namespace edge_database::store
{

connection_accessor::connection_accessor(store_provider provider)
	: provider_(std::move(provider))
{
}

connection_accessor connection_accessor::from_store(std::shared_ptr<remote_store> store)
{
	return connection_accessor([store = std::move(store)]() { return store; });
}

kcenon::common::Result<std::shared_ptr<remote_store>> connection_accessor::get_connection() const
{
	if (!provider_)
	{
		return kcenon::common::error_info{ error_codes::configuration_error,
										   "No database connection provider configured",
										   "connection_accessor" };
	}

	std::shared_ptr<remote_store> connection;
	try
	{
		connection = provider_();
	}
	catch (const std::exception& e)
	{
		return kcenon::common::error_info{ error_codes::configuration_error,
										   std::string("Database connection provider failed: ")
											   + e.what(),
										   "connection_accessor" };
	}

	if (!connection)
	{
		return kcenon::common::error_info{ error_codes::configuration_error,
										   "Database connection not available",
										   "connection_accessor" };
	}

	return connection;
}

} // namespace edge_database::store
