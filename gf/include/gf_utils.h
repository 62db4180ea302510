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
 * @file gf_utils.h
 * @brief Utility functions for F_p: Legendre symbol, non-residue search, roots of unity.
 */

#ifndef ECFFT_GF_UTILS_H
#define ECFFT_GF_UTILS_H

#include "gf_invert.h"
#include "gf_ops.h"

/* Euler's criterion: 1 for a nonzero square, p - 1 for a non-square, 0 for zero */
static inline gf_fe gf_legendre(const gf_ctx *f, gf_fe a)
{
    return gf_pow(f, a, (f->p - 1) >> 1);
}

/* Smallest quadratic non-residue. Exists for every odd prime and is small in practice. */
static inline gf_fe gf_least_nonresidue(const gf_ctx *f)
{
    gf_fe z = 2;
    while (gf_legendre(f, z) != f->p - 1)
        z++;
    return z;
}

/*
 * Returns 1 if g has multiplicative order exactly 2^k. For k = 0 that is g = 1;
 * otherwise g^(2^(k-1)) must be -1.
 */
static inline int gf_has_order_2k(const gf_ctx *f, gf_fe g, unsigned k)
{
    if (k == 0)
        return g == 1;
    gf_fe t = g;
    for (unsigned i = 1; i < k; i++)
        t = gf_sq(f, t);
    return t == f->p - 1;
}

#endif // ECFFT_GF_UTILS_H
