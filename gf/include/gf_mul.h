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
 * @file gf_mul.h
 * @brief F_p multiplication and squaring via a 128-bit product reduced mod p.
 */

#ifndef ECFFT_GF_MUL_H
#define ECFFT_GF_MUL_H

#include "gf.h"
#include "gf_ops.h"

#if ECFFT_HAVE_INT128

static inline gf_fe gf_mul(const gf_ctx *f, gf_fe a, gf_fe b)
{
    return (gf_fe)(((ecfft_uint128)a * b) % f->p);
}

#else

/* hi < p because a, b < p, so the 128/64 division cannot overflow */
static inline gf_fe gf_mul(const gf_ctx *f, gf_fe a, gf_fe b)
{
    uint64_t hi;
    uint64_t lo = _umul128(a, b, &hi);
    uint64_t rem;
    _udiv128(hi, lo, f->p, &rem);
    return rem;
}

#endif

static inline gf_fe gf_sq(const gf_ctx *f, gf_fe a)
{
    return gf_mul(f, a, a);
}

/* h = a * b + c, the inner step of Horner evaluation */
static inline gf_fe gf_muladd(const gf_ctx *f, gf_fe a, gf_fe b, gf_fe c)
{
    return gf_add(f, gf_mul(f, a, b), c);
}

#endif // ECFFT_GF_MUL_H
