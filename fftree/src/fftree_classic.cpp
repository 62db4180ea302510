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
 * @file fftree_classic.cpp
 * @brief Radix-2 evaluate / interpolate for trees whose maps are all psi(x) = x^2.
 *
 * P(x) = P0(x^2) + x * P1(x^2) with P0, P1 the even- and odd-indexed coefficients.
 * Evaluating P0 and P1 on layer d + 1 gives P on both members of every fiber pair
 * (i, i + half) of layer d. Interpolation solves the pair system
 *
 *   v0 + x  * v1 = V
 *   v0 + x' * v1 = V'
 *
 * with the precomputed 1 / (x - x'), recurses, and interleaves the coefficients.
 */

#include "ecfft_status.h"
#include "fftree.h"
#include "fftree_ecfft.h"
#include "fftree_parallel.h"

#include <vector>

static void evaluate_rec(const fftree *t, size_t d, const gf_fe *coeffs, gf_fe *values, size_t par)
{
    const size_t m = t->n >> d;
    if (m == 1)
    {
        values[0] = coeffs[0];
        return;
    }

    const gf_ctx *f = &t->field;
    const size_t half = m / 2;
    const gf_fe *layer = t->layers[d].data();

    std::vector<gf_fe> buf(4 * half);
    gf_fe *even = buf.data();
    gf_fe *odd = even + half;
    gf_fe *v_even = odd + half;
    gf_fe *v_odd = v_even + half;

    for (size_t j = 0; j < half; j++)
    {
        even[j] = coeffs[2 * j];
        odd[j] = coeffs[2 * j + 1];
    }

    fftree_fork_join(
        half,
        par,
        [&]() { evaluate_rec(t, d + 1, even, v_even, par); },
        [&]() { evaluate_rec(t, d + 1, odd, v_odd, par); });

    for (size_t i = 0; i < half; i++)
    {
        values[i] = gf_muladd(f, layer[i], v_odd[i], v_even[i]);
        values[i + half] = gf_muladd(f, layer[i + half], v_odd[i], v_even[i]);
    }
}

static void interpolate_rec(const fftree *t, size_t d, const gf_fe *values, gf_fe *coeffs, size_t par)
{
    const size_t m = t->n >> d;
    if (m == 1)
    {
        coeffs[0] = values[0];
        return;
    }

    const gf_ctx *f = &t->field;
    const size_t half = m / 2;
    const gf_fe *layer = t->layers[d].data();
    const gf_fe *pinv = t->pair_inv[d].data();

    std::vector<gf_fe> buf(4 * half);
    gf_fe *v0 = buf.data();
    gf_fe *v1 = v0 + half;
    gf_fe *c_even = v1 + half;
    gf_fe *c_odd = c_even + half;

    for (size_t i = 0; i < half; i++)
    {
        v1[i] = gf_mul(f, gf_sub(f, values[i], values[i + half]), pinv[i]);
        v0[i] = gf_sub(f, values[i], gf_mul(f, layer[i], v1[i]));
    }

    fftree_fork_join(
        half,
        par,
        [&]() { interpolate_rec(t, d + 1, v0, c_even, par); },
        [&]() { interpolate_rec(t, d + 1, v1, c_odd, par); });

    for (size_t j = 0; j < half; j++)
    {
        coeffs[2 * j] = c_even[j];
        coeffs[2 * j + 1] = c_odd[j];
    }
}

static int all_maps_square(const fftree *t)
{
    for (size_t d = 0; d < t->maps.size(); d++)
        if (!gf_ratmap_is_square(&t->maps[d]))
            return 0;
    return 1;
}

int fftree_evaluate_classic(const fftree *t, gf_fe *values, const gf_fe *coeffs, size_t len)
{
    std::vector<gf_fe> padded;
    int rc = fftree_load_coeffs(t, &padded, coeffs, len);
    if (rc != ECFFT_OK)
        return rc;
    if (!all_maps_square(t))
        return ECFFT_ERR_NOT_CLASSIC;

    const size_t par = fftree_fork_threshold();
    fftree_parallel_region(t->n, par, [&]() { evaluate_rec(t, 0, padded.data(), values, par); });
    return ECFFT_OK;
}

int fftree_interpolate_classic(const fftree *t, gf_fe *coeffs, const gf_fe *values)
{
    std::vector<gf_fe> reduced;
    int rc = fftree_load_values(t, &reduced, values);
    if (rc != ECFFT_OK)
        return rc;
    if (!all_maps_square(t))
        return ECFFT_ERR_NOT_CLASSIC;

    const size_t par = fftree_fork_threshold();
    fftree_parallel_region(t->n, par, [&]() { interpolate_rec(t, 0, reduced.data(), coeffs, par); });
    return ECFFT_OK;
}
