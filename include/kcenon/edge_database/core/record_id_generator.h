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
 * @file record_id_generator.h
 * @brief Record identifier and timestamp generation
 *
 * Row ids for migration bookkeeping and repository records are random
 * RFC 4122 version 4 UUIDs. Timestamps are UTC ISO-8601 strings.
 */

#pragma once

#include <chrono>
#include <string>

namespace edge_database::core
{

/**
 * @brief Generate a random UUID (version 4, variant 1)
 *
 * Thread Safety:
 * - Uses a thread-local RNG seeded from std::random_device
 * - No locking between threads
 *
 * @return Lowercase 36-character string, e.g. "3f2b8c1e-9a4d-4e6f-b2c1-0d9e8f7a6b5c"
 */
[[nodiscard]] std::string generate_record_id();

/**
 * @brief Format a time point as UTC ISO-8601 with milliseconds.
 * @return e.g. "2025-01-31T12:34:56.789Z"
 */
[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point time);

/**
 * @brief format_iso8601 of the current time.
 */
[[nodiscard]] std::string current_timestamp();

} // namespace edge_database::core
