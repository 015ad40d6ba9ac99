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

#include <kcenon/edge_database/core/record_id_generator.h>

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace edge_database::core
{

std::string generate_record_id()
{
	thread_local std::random_device rd;
	thread_local std::mt19937_64 gen(rd());
	std::uniform_int_distribution<uint64_t> dis;

	auto high = dis(gen);
	auto low = dis(gen);

	// Version nibble 4, variant bits 10
	high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
	low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

	std::ostringstream ss;
	ss << std::hex << std::setfill('0');
	ss << std::setw(8) << (high >> 32) << '-';
	ss << std::setw(4) << ((high >> 16) & 0xFFFF) << '-';
	ss << std::setw(4) << (high & 0xFFFF) << '-';
	ss << std::setw(4) << (low >> 48) << '-';
	ss << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);

	return ss.str();
}

std::string format_iso8601(std::chrono::system_clock::time_point time)
{
	auto time_t_value = std::chrono::system_clock::to_time_t(time);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch())
			  % 1000;

	std::tm utc{};
	gmtime_r(&time_t_value, &utc);

	std::ostringstream oss;
	oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
	oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
	return oss.str();
}

std::string current_timestamp()
{
	return format_iso8601(std::chrono::system_clock::now());
}

} // namespace edge_database::core
