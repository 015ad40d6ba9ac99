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
 * @file record_id_test.cpp
 * @brief Unit tests for record id and timestamp generation
 *
 * Tests cover:
 * - UUID v4 layout (8-4-4-4-12 lowercase hex, version and variant bits)
 * - Uniqueness across a large sample
 * - Thread-safety with concurrent generation
 * - ISO 8601 timestamp formatting
 */

#include <gtest/gtest.h>

#include <kcenon/edge_database/core/record_id_generator.h>

#include <algorithm>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace edge_database::core;

class RecordIdTest : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}
};

// ============================================================================
// Format Tests
// ============================================================================

TEST_F(RecordIdTest, HasUuidLayout)
{
	auto id = generate_record_id();

	ASSERT_EQ(id.size(), 36u);
	EXPECT_EQ(id[8], '-');
	EXPECT_EQ(id[13], '-');
	EXPECT_EQ(id[18], '-');
	EXPECT_EQ(id[23], '-');

	for (size_t i = 0; i < id.size(); ++i)
	{
		if (i == 8 || i == 13 || i == 18 || i == 23)
		{
			continue;
		}
		const char c = id[i];
		EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))
			<< "Unexpected character '" << c << "' at " << i;
	}
}

TEST_F(RecordIdTest, CarriesVersionAndVariant)
{
	for (int i = 0; i < 100; ++i)
	{
		auto id = generate_record_id();
		EXPECT_EQ(id[14], '4');
		EXPECT_TRUE(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
	}
}

// ============================================================================
// Uniqueness Tests
// ============================================================================

TEST_F(RecordIdTest, UniqueAcrossSample)
{
	constexpr int sample_size = 10000;
	std::unordered_set<std::string> ids;

	for (int i = 0; i < sample_size; ++i)
	{
		ids.insert(generate_record_id());
	}

	EXPECT_EQ(ids.size(), static_cast<size_t>(sample_size));
}

TEST_F(RecordIdTest, UniqueAcrossThreads)
{
	constexpr int thread_count = 8;
	constexpr int per_thread = 1000;

	std::mutex ids_mutex;
	std::unordered_set<std::string> ids;
	std::vector<std::thread> threads;

	for (int t = 0; t < thread_count; ++t)
	{
		threads.emplace_back(
			[&]()
			{
				std::vector<std::string> local;
				local.reserve(per_thread);
				for (int i = 0; i < per_thread; ++i)
				{
					local.push_back(generate_record_id());
				}
				std::lock_guard<std::mutex> lock(ids_mutex);
				ids.insert(local.begin(), local.end());
			});
	}
	for (auto& thread : threads)
	{
		thread.join();
	}

	EXPECT_EQ(ids.size(), static_cast<size_t>(thread_count * per_thread));
}

// ============================================================================
// Timestamp Tests
// ============================================================================

TEST_F(RecordIdTest, FormatsIso8601InUtc)
{
	// 2024-01-02T03:04:05.678Z
	const auto time = std::chrono::system_clock::time_point{ std::chrono::milliseconds{
		1704164645678LL } };

	EXPECT_EQ(format_iso8601(time), "2024-01-02T03:04:05.678Z");
}

TEST_F(RecordIdTest, CurrentTimestampShape)
{
	auto timestamp = current_timestamp();

	ASSERT_EQ(timestamp.size(), 24u);
	EXPECT_EQ(timestamp[10], 'T');
	EXPECT_EQ(timestamp.back(), 'Z');
}
