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

#ifndef ECFFT_GF_BATCH_INVERT_H
#define ECFFT_GF_BATCH_INVERT_H

/**
 * @file gf_batch_invert.h
 * @brief Batch field inversion for F_p using Montgomery's trick.
 *
 * Inverts n field elements using 1 inversion + 3(n-1) multiplications,
 * instead of n separate inversions. Zero elements are mapped to zero.
 */

#include "gf_invert.h"

#include <vector>

/**
 * Batch-invert n F_p elements using Montgomery's trick.
 *
 * For each in[i], writes in[i]^{-1} to out[i].
 * Zero elements produce zero output (not undefined).
 * out and in may alias (in-place inversion is supported).
 *
 * @param f    Field context
 * @param out  Output array of n inverted elements
 * @param in   Input array of n elements
 * @param n    Number of elements
 */
static inline void gf_batch_invert(const gf_ctx *f, gf_fe *out, const gf_fe *in, size_t n)
{
    if (n == 0)
        return;

    /* Forward pass: cumulative products of the nonzero inputs */
    std::vector<gf_fe> acc(n);
    gf_fe run = 1;
    for (size_t i = 0; i < n; i++)
    {
        if (in[i] != 0)
            run = gf_mul(f, run, in[i]);
        acc[i] = run;
    }

    /* Single inversion */
    gf_fe inv = gf_invert(f, run);

    /* Backward pass: recover individual inverses */
    for (size_t i = n; i-- > 0;)
    {
        if (in[i] == 0)
        {
            out[i] = 0;
            continue;
        }
        gf_fe before = (i > 0) ? acc[i - 1] : 1;
        gf_fe tmp = in[i]; /* save before out[i] overwrites (aliasing) */
        out[i] = gf_mul(f, inv, before);
        inv = gf_mul(f, inv, tmp);
    }
}

#endif // ECFFT_GF_BATCH_INVERT_H
