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
 * @file gf_ops.h
 * @brief Basic F_p arithmetic: add, sub, neg, reduction from integers.
 */

#ifndef ECFFT_GF_OPS_H
#define ECFFT_GF_OPS_H

#include "gf.h"

/* Reduce an arbitrary 64-bit integer into the field */
static inline gf_fe gf_from_u64(const gf_ctx *f, uint64_t v)
{
    return v % f->p;
}

/* Signed small constants such as curve coefficient a = -3 */
static inline gf_fe gf_from_i64(const gf_ctx *f, int64_t v)
{
    if (v >= 0)
        return (uint64_t)v % f->p;
    uint64_t m = (uint64_t)(-(v + 1)) + 1; /* |v| without overflow at INT64_MIN */
    m %= f->p;
    return m ? f->p - m : 0;
}

/*
 * h = f + g. The sum may wrap 2^64 when p is close to 2^64; either the wrap or
 * s >= p means exactly one subtraction of p is needed.
 */
static inline gf_fe gf_add(const gf_ctx *f, gf_fe a, gf_fe b)
{
    gf_fe s = a + b;
    if (s < a || s >= f->p)
        s -= f->p;
    return s;
}

static inline gf_fe gf_sub(const gf_ctx *f, gf_fe a, gf_fe b)
{
    return (a >= b) ? (a - b) : (a - b + f->p);
}

static inline gf_fe gf_neg(const gf_ctx *f, gf_fe a)
{
    return a ? (f->p - a) : 0;
}

static inline gf_fe gf_dbl(const gf_ctx *f, gf_fe a)
{
    return gf_add(f, a, a);
}

#endif // ECFFT_GF_OPS_H
