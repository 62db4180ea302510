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
 * @file fftree_ecfft.h
 * @brief Internal recursions of the ECFFT engine, shared by the public entry points and
 *        the view precomputation in fftree_build.cpp.
 *
 * s is the view index, d the layer within the view, `par` the fork threshold captured
 * once by the outermost call.
 */

#ifndef ECFFT_FFTREE_ECFFT_H
#define ECFFT_FFTREE_ECFFT_H

#include "fftree.h"

#include <vector>

/*
 * EXTEND: in[0..m) are the values of some Q with deg Q < m on half a (0 = even, 1 = odd
 * view positions) of layer d of view s; writes the values on the other half to out[0..m).
 * m = (n_s >> d) / 2.
 */
void fftree_extend_rec(
    const fftree *t,
    size_t s,
    size_t d,
    int a,
    const gf_fe *in,
    gf_fe *out,
    size_t m,
    size_t par);

/* ENTER: n_s coefficients -> values over layer 0 of view s */
void fftree_enter_rec(const fftree *t, size_t s, const gf_fe *coeffs, gf_fe *values, size_t par);

/* EXIT: n_s values over layer 0 of view s -> the n_s coefficients of the interpolant */
void fftree_exit_rec(const fftree *t, size_t s, const gf_fe *values, gf_fe *coeffs, size_t par);

/*
 * Fill t->views bottom-up from view log_n. Requires layers, maps and pair_inv. Returns
 * ECFFT_ERR_SINGULAR_SYSTEM if a vanishing polynomial is zero on the opposite half,
 * which only happens for a tree with repeated points.
 */
int fftree_precompute_views(fftree *t);

/* Returns 1 for a built tree whose fiber pairs all have nonzero differences */
int fftree_is_consistent(const fftree *t);

/*
 * Copy len coefficients into out, reduced mod p and zero-padded to n. Trailing zeros are
 * ignored when checking deg < n.
 */
int fftree_load_coeffs(const fftree *t, std::vector<gf_fe> *out, const gf_fe *coeffs, size_t len);

/* Copy the n values into out, reduced mod p */
int fftree_load_values(const fftree *t, std::vector<gf_fe> *out, const gf_fe *values);

#endif // ECFFT_FFTREE_ECFFT_H
