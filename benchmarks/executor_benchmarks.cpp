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
 * @file executor_benchmarks.cpp
 * @brief Performance benchmarks for the statement execution path
 *
 * Benchmarks cover:
 * - Resilient executor overhead on an in-process store
 * - Metrics collector recording cost, with and without collection enabled
 * - Clause builder SELECT construction
 * - Concurrent executor throughput
 */

#include <benchmark/benchmark.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "fake_remote_store.h"

#include <kcenon/edge_database/query/clause_builder.h>
#include <kcenon/edge_database/resilience/resilient_executor.h>

using namespace edge_database;

// ============================================================================
// Benchmark Fixtures
// ============================================================================

class ExecutorBenchmarkFixture : public benchmark::Fixture
{
public:
	void SetUp(const benchmark::State& /*state*/) override
	{
		store_ = std::make_shared<test::fake_remote_store>();
		store_->set_recording(false);
		store_->add_rows("FROM users",
						 { test::make_row({ { "id", std::string("u1") },
											{ "email", std::string("a@example.com") } }) });

		config_ = core::database_config::default_config();
		config_.query.enable_logging = false;
	}

	void TearDown(const benchmark::State& /*state*/) override { store_.reset(); }

protected:
	std::unique_ptr<resilience::resilient_executor> make_executor(bool metrics_enabled = true)
	{
		config_.metrics.enabled = metrics_enabled;
		return std::make_unique<resilience::resilient_executor>(
			store::connection_accessor::from_store(store_), nullptr, config_);
	}

	std::shared_ptr<test::fake_remote_store> store_;
	core::database_config config_;
};

// ============================================================================
// Executor Benchmarks
// ============================================================================

BENCHMARK_DEFINE_F(ExecutorBenchmarkFixture, QueryOverhead)(benchmark::State& state)
{
	auto executor = make_executor();

	for (auto _ : state)
	{
		auto result = executor->query("SELECT * FROM users WHERE id = ?", { std::string("u1") });
		benchmark::DoNotOptimize(result);
	}

	state.SetItemsProcessed(state.iterations());
	state.counters["avg_query_time_ms"]
		= executor->metrics_collector()->snapshot().average_query_time_ms;
}

BENCHMARK_REGISTER_F(ExecutorBenchmarkFixture, QueryOverhead)->Unit(benchmark::kMicrosecond);

BENCHMARK_DEFINE_F(ExecutorBenchmarkFixture, MetricsOverhead)(benchmark::State& state)
{
	auto executor = make_executor(state.range(0) == 1);

	for (auto _ : state)
	{
		auto result = executor->execute("DELETE FROM sessions WHERE id = ?", { std::string("s1") });
		benchmark::DoNotOptimize(result);
	}

	state.SetItemsProcessed(state.iterations());
	state.counters["metrics_enabled"] = static_cast<double>(state.range(0));
}

BENCHMARK_REGISTER_F(ExecutorBenchmarkFixture, MetricsOverhead)
	->Unit(benchmark::kMicrosecond)
	->Arg(0)
	->Arg(1);

// ============================================================================
// Metrics Collector Benchmarks
// ============================================================================

static void BM_RecordSuccess(benchmark::State& state)
{
	static metrics::database_metrics_collector collector;

	for (auto _ : state)
	{
		collector.record_success(std::chrono::milliseconds(3));
	}

	state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_RecordSuccess)->Unit(benchmark::kNanosecond)->ThreadRange(1, 8);

// ============================================================================
// Clause Builder Benchmarks
// ============================================================================

static void BM_BuildSelect(benchmark::State& state)
{
	query::query_options options;
	options.where.push_back({ "status", query::comparison_operator::equal,
							  query::condition_value{ sql_value{ std::string("active") } } });
	options.where.push_back(
		{ "role", query::comparison_operator::in,
		  query::condition_value{ query::value_list{ std::string("admin"), std::string("editor") } } });
	options.order_by.push_back({ "created_at", query::sort_direction::desc });
	options.limit = 50;
	options.offset = 100;

	for (auto _ : state)
	{
		auto descriptor = query::build_select("users", options);
		benchmark::DoNotOptimize(descriptor);
	}

	state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_BuildSelect)->Unit(benchmark::kNanosecond);

// ============================================================================
// Concurrent Throughput Benchmarks
// ============================================================================

BENCHMARK_DEFINE_F(ExecutorBenchmarkFixture, ConcurrentQueryThroughput)
(benchmark::State& state)
{
	auto executor = make_executor();
	const int num_threads = static_cast<int>(state.range(0));
	const int queries_per_thread = 1000;

	for (auto _ : state)
	{
		std::vector<std::thread> threads;
		threads.reserve(num_threads);
		std::atomic<uint64_t> total_queries{ 0 };

		for (int t = 0; t < num_threads; ++t)
		{
			threads.emplace_back(
				[&]()
				{
					for (int i = 0; i < queries_per_thread; ++i)
					{
						auto result = executor->query("SELECT * FROM users");
						benchmark::DoNotOptimize(result);
						total_queries.fetch_add(1);
					}
				});
		}

		for (auto& thread : threads)
		{
			thread.join();
		}

		benchmark::DoNotOptimize(total_queries.load());
	}

	state.SetItemsProcessed(state.iterations() * num_threads * queries_per_thread);
	state.counters["threads"] = num_threads;
}

BENCHMARK_REGISTER_F(ExecutorBenchmarkFixture, ConcurrentQueryThroughput)
	->Unit(benchmark::kMillisecond)
	->Arg(1)
	->Arg(2)
	->Arg(4)
	->Arg(8);

BENCHMARK_MAIN();
