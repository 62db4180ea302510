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

#include "ec_isogeny.h"

#include "ecfft_status.h"

#include <utility>

int ec_velu_2isogeny(ec_isogeny *iso, const gf_ctx *f, const ec_curve *c, gf_fe x0)
{
    if (ec_rhs(f, c, x0) != 0)
        return ECFFT_ERR_INVALID_CURVE;

    /* t = 3*x0^2 + a */
    gf_fe x0_sq = gf_sq(f, x0);
    gf_fe t = gf_add(f, gf_add(f, gf_dbl(f, x0_sq), x0_sq), c->a);

    /* a' = a - 5t, b' = b - 7*x0*t */
    gf_fe five_t = gf_mul(f, gf_from_u64(f, 5), t);
    gf_fe seven_x0_t = gf_mul(f, gf_from_u64(f, 7), gf_mul(f, x0, t));

    iso->domain = *c;
    iso->codomain.a = gf_sub(f, c->a, five_t);
    iso->codomain.b = gf_sub(f, c->b, seven_x0_t);
    iso->x0 = x0;
    iso->t = t;

    gf_fe neg_x0 = gf_neg(f, x0);
    iso->psi.num[0] = t;
    iso->psi.num[1] = neg_x0;
    iso->psi.num[2] = 1;
    iso->psi.num_degree = 2;
    iso->psi.den[0] = neg_x0;
    iso->psi.den[1] = 1;
    iso->psi.den_degree = 1;

    return ECFFT_OK;
}

ec_affine ec_isogeny_map(const gf_ctx *f, const ec_isogeny *iso, const ec_affine *p)
{
    if (p->infinity)
        return *p;

    gf_fe diff = gf_sub(f, p->x, iso->x0);
    if (diff == 0)
        return ec_identity();

    gf_fe diff_inv = gf_invert(f, diff);
    gf_fe diff_inv_sq = gf_sq(f, diff_inv);

    /* x' = (x^2 - x0*x + t) / (x - x0) */
    gf_fe x_new = gf_mul(f, gf_ratmap_num(f, &iso->psi, p->x), diff_inv);

    /* y' = y * ((x - x0)^2 - t) / (x - x0)^2 */
    gf_fe y_num = gf_sub(f, gf_sq(f, diff), iso->t);
    gf_fe y_new = gf_mul(f, gf_mul(f, p->y, y_num), diff_inv_sq);

    return ec_point(x_new, y_new);
}

int ec_derive_isogeny_chain(
    std::vector<gf_ratmap> *chain,
    const gf_ctx *f,
    const ec_curve *c,
    const ec_affine *g,
    size_t k)
{
    chain->clear();

    if (c->a >= f->p || c->b >= f->p || ec_is_singular(f, c) || !ec_on_curve(f, c, g))
        return ECFFT_ERR_INVALID_CURVE;

    if (k == 0)
        return g->infinity ? ECFFT_OK : ECFFT_ERR_INVALID_CURVE;

    /* order exactly 2^k: 2^(k-1) G is a 2-torsion point (y = 0), 2^k G = O */
    ec_affine half = *g;
    for (size_t i = 1; i < k; i++)
        half = ec_dbl(f, c, &half);
    if (half.infinity || half.y != 0)
        return ECFFT_ERR_INVALID_CURVE;

    std::vector<gf_ratmap> maps;
    maps.reserve(k);

    ec_curve cur = *c;
    ec_affine gen = *g;

    for (size_t d = 0; d < k; d++)
    {
        ec_affine kernel = gen;
        for (size_t i = d + 1; i < k; i++)
            kernel = ec_dbl(f, &cur, &kernel);

        ec_isogeny iso;
        int rc = ec_velu_2isogeny(&iso, f, &cur, kernel.x);
        if (rc != ECFFT_OK)
            return rc;
        if (ec_is_singular(f, &iso.codomain))
            return ECFFT_ERR_INVALID_CURVE;

        maps.push_back(iso.psi);
        gen = ec_isogeny_map(f, &iso, &gen);
        cur = iso.codomain;
    }

    *chain = std::move(maps);
    return ECFFT_OK;
}
