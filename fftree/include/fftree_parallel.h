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
 * @file fftree_parallel.h
 * @brief Fork-join glue for the recursive FFTree routines.
 *
 * With ECFFT_MULTICORE the two independent branches of a recursion are spawned as OpenMP
 * tasks when the sub-problem holds at least `par` elements, and joined with taskwait
 * before the merge step reads their output. The outermost call opens a parallel region
 * with a single producer thread; nested calls reuse the enclosing team. Without
 * ECFFT_MULTICORE both branches run inline, in order.
 */

#ifndef ECFFT_FFTREE_PARALLEL_H
#define ECFFT_FFTREE_PARALLEL_H

#include "ecfft_config.h"

#include <cstddef>

#ifdef ECFFT_MULTICORE
#include <omp.h>
#endif

/* Size at or above which branches fork; SIZE_MAX-like values disable forking */
static inline size_t fftree_fork_threshold(void)
{
    return ecfft_get_parallel_threshold();
}

/* Run both branches, concurrently when size >= par, and return after both completed */
template<typename Left, typename Right>
static inline void fftree_fork_join(size_t size, size_t par, Left &&left, Right &&right)
{
#ifdef ECFFT_MULTICORE
    if (size >= par)
    {
#pragma omp task default(shared)
        left();
        right();
#pragma omp taskwait
        return;
    }
#else
    (void)size;
    (void)par;
#endif
    left();
    right();
}

/* Entry point of a top-level call: open the worker team when the problem is big enough */
template<typename Body> static inline void fftree_parallel_region(size_t size, size_t par, Body &&body)
{
#ifdef ECFFT_MULTICORE
    if (size >= par && !omp_in_parallel())
    {
        const int threads = ecfft_get_num_threads();
        if (threads > 0)
        {
#pragma omp parallel num_threads(threads)
#pragma omp single
            body();
        }
        else
        {
#pragma omp parallel
#pragma omp single
            body();
        }
        return;
    }
#else
    (void)size;
    (void)par;
#endif
    body();
}

#endif // ECFFT_FFTREE_PARALLEL_H
