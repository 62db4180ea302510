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
 * @file ec_isogeny.h
 * @brief Velu 2-isogenies and the halving chain of an order-2^k subgroup.
 *
 * For a kernel point T = (x0, 0) on y^2 = x^3 + ax + b, let t = 3*x0^2 + a. Then
 *
 *   x-map:     psi(x) = x + t/(x - x0) = (x^2 - x0*x + t) / (x - x0)
 *   y-map:     y * ((x - x0)^2 - t) / (x - x0)^2
 *   codomain:  a' = a - 5t,  b' = b - 7*x0*t
 *
 * The coefficient of x in the numerator is -x0, not -2*x0.
 */

#ifndef ECFFT_EC_ISOGENY_H
#define ECFFT_EC_ISOGENY_H

#include "ec.h"
#include "gf_ratmap.h"

#include <vector>

struct ec_isogeny
{
    ec_curve domain;
    ec_curve codomain;
    gf_fe x0; /* kernel x-coordinate */
    gf_fe t;  /* 3*x0^2 + a */
    gf_ratmap psi;
};

/*
 * Build the 2-isogeny with kernel {O, (x0, 0)}. Returns ECFFT_ERR_INVALID_CURVE if
 * (x0, 0) is not a point of the curve.
 */
int ec_velu_2isogeny(ec_isogeny *iso, const gf_ctx *f, const ec_curve *c, gf_fe x0);

/* Push a point through the isogeny. Kernel points map to the identity. */
ec_affine ec_isogeny_map(const gf_ctx *f, const ec_isogeny *iso, const ec_affine *p);

/*
 * Derive the k x-maps halving <G> down to a point: at step d the kernel is
 * 2^(k-d-1) * G_d and G_{d+1} is the image of G_d.
 *
 * Returns ECFFT_ERR_INVALID_CURVE unless the curve is nonsingular and G is a curve point
 * of order exactly 2^k.
 */
int ec_derive_isogeny_chain(
    std::vector<gf_ratmap> *chain,
    const gf_ctx *f,
    const ec_curve *c,
    const ec_affine *g,
    size_t k);

#endif // ECFFT_EC_ISOGENY_H
