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
 * @file gf_invert.h
 * @brief F_p exponentiation and inversion (Fermat: a^(p-2)).
 */

#ifndef ECFFT_GF_INVERT_H
#define ECFFT_GF_INVERT_H

#include "gf_mul.h"

/* Left-to-right square-and-multiply, variable time in the exponent */
static inline gf_fe gf_pow(const gf_ctx *f, gf_fe base, uint64_t e)
{
    gf_fe result = 1 % f->p;
    for (int i = 63; i >= 0; i--)
    {
        result = gf_sq(f, result);
        if ((e >> i) & 1)
            result = gf_mul(f, result, base);
    }
    return result;
}

/*
 * h = a^{-1}. The inverse of zero is defined as zero; callers that must reject zero
 * check for it before inverting.
 */
static inline gf_fe gf_invert(const gf_ctx *f, gf_fe a)
{
    return gf_pow(f, a, f->p - 2);
}

#endif // ECFFT_GF_INVERT_H
