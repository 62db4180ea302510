// Copyright (c) 2025-2026, Brandon Lehmann
//
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file config.cpp
 * @brief Process-wide parallel tuning state.
 *
 * Each setting is a single atomic word. Writers publish with release, readers load with
 * acquire, so a reader never observes a torn or stale-ordered update.
 */

#include "ecfft_config.h"

#include <atomic>

static std::atomic<size_t> parallel_threshold {ECFFT_DEFAULT_PARALLEL_THRESHOLD};
static std::atomic<int> num_threads {0};

void ecfft_set_parallel_threshold(size_t threshold)
{
    // a threshold of 0 or 1 would fork down to single elements
    if (threshold < 2)
        threshold = 2;
    parallel_threshold.store(threshold, std::memory_order_release);
}

size_t ecfft_get_parallel_threshold(void)
{
    return parallel_threshold.load(std::memory_order_acquire);
}

void ecfft_set_num_threads(int threads)
{
    num_threads.store(threads < 0 ? 0 : threads, std::memory_order_release);
}

int ecfft_get_num_threads(void)
{
    return num_threads.load(std::memory_order_acquire);
}

int ecfft_have_multicore(void)
{
#ifdef ECFFT_MULTICORE
    return 1;
#else
    return 0;
#endif
}
