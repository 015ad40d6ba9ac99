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
 * @file connection_accessor.h
 * @brief Lazy access to the remote store connection
 */

#pragma once

#include <kcenon/edge_database/store/remote_store.h>

#include <kcenon/common/patterns/result.h>

#include <functional>
#include <memory>

namespace edge_database::store
{

/// Supplies the current store connection; may return nullptr.
using store_provider = std::function<std::shared_ptr<remote_store>()>;

/**
 * @class connection_accessor
 * @brief Resolves the store connection on every call
 *
 * The provider is consulted each time so that an environment that swaps
 * the connection (or has none yet) is observed by the next operation.
 * An empty accessor or a provider returning nullptr yields
 * error_codes::configuration_error.
 *
 * Thread Safety:
 * get_connection is safe to call concurrently if the provider is.
 */
class connection_accessor
{
public:
	connection_accessor() = default;
	explicit connection_accessor(store_provider provider);

	/**
	 * @brief Accessor that always returns the given store.
	 */
	static connection_accessor from_store(std::shared_ptr<remote_store> store);

	/**
	 * @brief Returns the current connection.
	 * @return The store, or configuration_error if none is available
	 */
	kcenon::common::Result<std::shared_ptr<remote_store>> get_connection() const;

	bool is_configured() const noexcept { return static_cast<bool>(provider_); }

private:
	store_provider provider_;
};

} // namespace edge_database::store
