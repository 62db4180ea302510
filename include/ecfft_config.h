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
 * @file ecfft_config.h
 * @brief Runtime tuning of the fork-join parallel layer.
 *
 * The parallel threshold is the smallest sub-problem size (in field elements) whose two
 * recursive branches are forked as separate tasks; smaller sub-problems run inline. It is
 * a performance knob only: every threshold and thread count yields identical output.
 *
 * Settings are process-wide and published with release/acquire ordering, so they may be
 * changed from any thread. A call that is already running keeps the values it read on entry.
 * When the library is built without OpenMP (ECFFT_MULTICORE undefined) these are stored
 * but have no effect.
 */

#ifndef ECFFT_CONFIG_H
#define ECFFT_CONFIG_H

#include <cstddef>

#define ECFFT_DEFAULT_PARALLEL_THRESHOLD 1024

void ecfft_set_parallel_threshold(size_t threshold);

size_t ecfft_get_parallel_threshold(void);

/* 0 selects the OpenMP runtime default */
void ecfft_set_num_threads(int threads);

int ecfft_get_num_threads(void);

/* Returns 1 when the library was compiled with OpenMP fork-join support */
int ecfft_have_multicore(void);

#endif // ECFFT_CONFIG_H
