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

#ifndef ECFFT_POLY_H
#define ECFFT_POLY_H

#include "fftree.h"
#include "gf.h"

#include <cstddef>
#include <vector>

/* Polynomial type - coefficients stored low-degree first. The zero polynomial has no
 * coefficients; stripped polynomials never end in a zero coefficient. */
struct gf_poly
{
    std::vector<gf_fe> coeffs;
};

/* Drop trailing zero coefficients */
void gf_poly_strip(gf_poly *p);

/* Degree, or -1 for the zero polynomial (trailing zeros ignored) */
long gf_poly_degree(const gf_poly *p);

void gf_poly_add(const gf_ctx *f, gf_poly *r, const gf_poly *a, const gf_poly *b);

void gf_poly_sub(const gf_ctx *f, gf_poly *r, const gf_poly *a, const gf_poly *b);

/* r = s * a */
void gf_poly_scale(const gf_ctx *f, gf_poly *r, const gf_poly *a, gf_fe s);

/* Multiply: r = a * b, schoolbook below 32 coefficients and Karatsuba above */
void gf_poly_mul(const gf_ctx *f, gf_poly *r, const gf_poly *a, const gf_poly *b);

/* O(n^2) convolution, the reference the fast paths are tested against */
void gf_poly_mul_schoolbook(const gf_ctx *f, gf_poly *r, const gf_poly *a, const gf_poly *b);

/* Evaluate polynomial at point x (Horner's method) */
gf_fe gf_poly_eval(const gf_ctx *f, const gf_poly *p, gf_fe x);

/* out[i] = p(points[i]) for i < n, one Horner pass per point */
void gf_poly_eval_points(const gf_ctx *f, gf_fe *out, const gf_poly *p, const gf_fe *points, size_t n);

/*
 * r = a * b through the tree: evaluate both, multiply pointwise, interpolate.
 * Requires deg a + deg b < n; returns ECFFT_ERR_INSUFFICIENT_DOMAIN_SIZE otherwise.
 * The product is exact and stripped. r may alias a or b.
 */
int gf_poly_mul_fftree(gf_poly *r, const gf_poly *a, const gf_poly *b, const fftree *t);

#endif // ECFFT_POLY_H
