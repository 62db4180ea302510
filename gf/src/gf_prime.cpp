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

// gf_prime.cpp: primality testing and field context setup for the runtime modulus.

#include "ecfft_status.h"
#include "gf.h"
#include "gf_invert.h"
#include "gf_ops.h"

/*
 * Miller-Rabin with the first twelve prime bases. This set is a proven deterministic
 * witness set for every n < 3.1 * 10^23, which covers all 64-bit inputs.
 */
int gf_is_prime(uint64_t n)
{
    static const uint64_t bases[12] = {2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37};

    if (n < 2)
        return 0;
    for (size_t i = 0; i < 12; i++)
    {
        if (n == bases[i])
            return 1;
        if (n % bases[i] == 0)
            return 0;
    }

    uint64_t d = n - 1;
    unsigned r = 0;
    while ((d & 1) == 0)
    {
        d >>= 1;
        r++;
    }

    gf_ctx ring;
    ring.p = n;
    ring.two_adicity = r;

    for (size_t i = 0; i < 12; i++)
    {
        gf_fe x = gf_pow(&ring, bases[i], d);
        if (x == 1 || x == n - 1)
            continue;

        int composite = 1;
        for (unsigned j = 1; j < r; j++)
        {
            x = gf_sq(&ring, x);
            if (x == n - 1)
            {
                composite = 0;
                break;
            }
        }
        if (composite)
            return 0;
    }

    return 1;
}

int gf_ctx_init(gf_ctx *f, uint64_t p)
{
    if (p < 3 || (p & 1) == 0 || !gf_is_prime(p))
        return ECFFT_ERR_INVALID_MODULUS;

    f->p = p;
    f->two_adicity = 0;
    uint64_t t = p - 1;
    while ((t & 1) == 0)
    {
        t >>= 1;
        f->two_adicity++;
    }

    return ECFFT_OK;
}
