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
 * @file gf.h
 * @brief Prime field F_p with a runtime 64-bit modulus.
 *
 * Field elements are plain uint64_t values holding the canonical residue in [0, p).
 * Every operation takes the gf_ctx carrying the modulus and returns a canonical result.
 */

#ifndef ECFFT_GF_H
#define ECFFT_GF_H

#include "ecfft_platform.h"

#include <cstddef>
#include <cstdint>

typedef uint64_t gf_fe;

struct gf_ctx
{
    uint64_t p;
    /* largest s with 2^s | p - 1 */
    unsigned two_adicity;
};

/*
 * Initialize a field context. Returns ECFFT_OK, or ECFFT_ERR_INVALID_MODULUS if p is not
 * an odd prime.
 */
int gf_ctx_init(gf_ctx *f, uint64_t p);

/* Deterministic Miller-Rabin for 64-bit n. Returns 1 if n is prime. */
int gf_is_prime(uint64_t n);

#endif // ECFFT_GF_H
