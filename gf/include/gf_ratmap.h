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
 * @file gf_ratmap.h
 * @brief Degree-2 rational maps psi(x) = num(x) / den(x) over F_p.
 *
 * These are the halving maps between consecutive FFTree layers: x^2 for multiplicative
 * subgroups, and the Velu x-map (x^2 - x0*x + t) / (x - x0) of a 2-isogeny for curve
 * cosets. The numerator has degree exactly 2 and the denominator degree at most 1.
 */

#ifndef ECFFT_GF_RATMAP_H
#define ECFFT_GF_RATMAP_H

#include "gf_invert.h"
#include "gf_ops.h"

struct gf_ratmap
{
    gf_fe num[3]; /* low degree first */
    gf_fe den[2];
    size_t num_degree;
    size_t den_degree;
};

/* psi(x) = x^2 */
static inline gf_ratmap gf_ratmap_square(void)
{
    gf_ratmap m;
    m.num[0] = 0;
    m.num[1] = 0;
    m.num[2] = 1;
    m.den[0] = 1;
    m.den[1] = 0;
    m.num_degree = 2;
    m.den_degree = 0;
    return m;
}

/* Shape check: deg num == 2 with a nonzero leading term, den nonzero of degree <= 1 */
static inline int gf_ratmap_is_valid(const gf_ratmap *m)
{
    if (m->num_degree != 2 || m->num[2] == 0)
        return 0;
    if (m->den_degree > 1 || m->den[m->den_degree] == 0)
        return 0;
    return 1;
}

/* Returns 1 for the plain squaring map, which admits the even/odd split */
static inline int gf_ratmap_is_square(const gf_ratmap *m)
{
    return m->num_degree == 2 && m->num[0] == 0 && m->num[1] == 0 && m->num[2] == 1 && m->den_degree == 0
           && m->den[0] == 1;
}

static inline gf_fe gf_ratmap_num(const gf_ctx *f, const gf_ratmap *m, gf_fe x)
{
    gf_fe r = m->num[m->num_degree];
    for (size_t i = m->num_degree; i-- > 0;)
        r = gf_muladd(f, r, x, m->num[i]);
    return r;
}

static inline gf_fe gf_ratmap_den(const gf_ctx *f, const gf_ratmap *m, gf_fe x)
{
    gf_fe r = m->den[m->den_degree];
    for (size_t i = m->den_degree; i-- > 0;)
        r = gf_muladd(f, r, x, m->den[i]);
    return r;
}

/*
 * psi(x). Returns 0 and leaves *out untouched if den(x) = 0 (x is the x-coordinate of the
 * kernel point, which the map sends to infinity).
 */
static inline int gf_ratmap_apply(const gf_ctx *f, gf_fe *out, const gf_ratmap *m, gf_fe x)
{
    gf_fe d = gf_ratmap_den(f, m, x);
    if (d == 0)
        return 0;
    *out = gf_mul(f, gf_ratmap_num(f, m, x), gf_invert(f, d));
    return 1;
}

#endif // ECFFT_GF_RATMAP_H
