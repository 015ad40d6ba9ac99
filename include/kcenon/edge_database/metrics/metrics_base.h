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
 * @file metrics_base.h
 * @brief Common utilities for atomic metrics operations
 *
 * ## Thread Safety
 * All functions are static and operate on `std::atomic` parameters passed
 * by the caller. `update_max` is a lock-free CAS loop. The calculation
 * helpers are stateless.
 *
 * @code
 * using namespace edge_database::metrics;
 *
 * std::atomic<uint64_t> max_latency{0};
 * metrics_utils::update_max(max_latency, 1500);
 *
 * double error_rate = metrics_utils::calculate_ratio(failed, total);
 * double shown = metrics_utils::round_to(error_rate, 2);
 * @endcode
 */

#pragma once

#include <atomic>
#include <cmath>
#include <cstdint>

namespace edge_database::metrics
{

/**
 * @struct metrics_utils
 * @brief Static utility functions for atomic metrics operations
 */
struct metrics_utils
{
	/**
	 * @brief Reset an atomic counter to zero
	 * @param counter The atomic counter to reset
	 * @param order Memory ordering (default: relaxed)
	 */
	static void reset_counter(std::atomic<uint64_t>& counter,
							  std::memory_order order = std::memory_order_relaxed) noexcept
	{
		counter.store(0, order);
	}

	/**
	 * @brief Update maximum value using compare-and-swap
	 *
	 * Only stores the new value if it is larger than the current maximum.
	 *
	 * @param max_value The atomic maximum value to update
	 * @param new_value The candidate new maximum
	 * @param order Memory ordering for CAS success (default: relaxed)
	 */
	static void update_max(std::atomic<uint64_t>& max_value, uint64_t new_value,
						   std::memory_order order = std::memory_order_relaxed) noexcept
	{
		uint64_t current = max_value.load(std::memory_order_relaxed);
		while (new_value > current
			   && !max_value.compare_exchange_weak(current, new_value, order,
												   std::memory_order_relaxed))
		{
		}
	}

	/**
	 * @brief Calculate ratio (not percentage)
	 * @return Ratio (0.0 - 1.0), or 0.0 if denominator is zero
	 */
	[[nodiscard]] static double calculate_ratio(uint64_t numerator,
												uint64_t denominator) noexcept
	{
		if (denominator == 0)
		{
			return 0.0;
		}
		return static_cast<double>(numerator) / static_cast<double>(denominator);
	}

	/**
	 * @brief Incremental mean: folds one sample into a running mean.
	 * @param mean Current mean over (count - 1) samples
	 * @param sample New sample
	 * @param count Sample count including the new one
	 */
	[[nodiscard]] static double fold_mean(double mean, double sample, uint64_t count) noexcept
	{
		if (count == 0)
		{
			return 0.0;
		}
		return mean + (sample - mean) / static_cast<double>(count);
	}

	/**
	 * @brief Round half away from zero to a number of decimal places.
	 */
	[[nodiscard]] static double round_to(double value, int places) noexcept
	{
		const double scale = std::pow(10.0, places);
		return std::round(value * scale) / scale;
	}
};

} // namespace edge_database::metrics
