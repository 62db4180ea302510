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
 * @file ec.h
 * @brief Short Weierstrass curves y^2 = x^3 + ax + b over F_p in affine coordinates.
 *
 * Only used while deriving FFTree domains, so the formulas favour clarity over speed:
 * affine coordinates with one field inversion per addition, variable time.
 */

#ifndef ECFFT_EC_H
#define ECFFT_EC_H

#include "gf_invert.h"
#include "gf_ops.h"

struct ec_curve
{
    gf_fe a;
    gf_fe b;
};

struct ec_affine
{
    gf_fe x;
    gf_fe y;
    int infinity;
};

static inline ec_affine ec_identity(void)
{
    ec_affine r;
    r.x = 0;
    r.y = 0;
    r.infinity = 1;
    return r;
}

static inline ec_affine ec_point(gf_fe x, gf_fe y)
{
    ec_affine r;
    r.x = x;
    r.y = y;
    r.infinity = 0;
    return r;
}

/* Returns 1 if 4a^3 + 27b^2 = 0 */
static inline int ec_is_singular(const gf_ctx *f, const ec_curve *c)
{
    gf_fe a3 = gf_mul(f, gf_sq(f, c->a), c->a);
    gf_fe b2 = gf_sq(f, c->b);
    gf_fe d = gf_add(f, gf_mul(f, gf_from_u64(f, 4), a3), gf_mul(f, gf_from_u64(f, 27), b2));
    return d == 0;
}

/* x^3 + ax + b */
static inline gf_fe ec_rhs(const gf_ctx *f, const ec_curve *c, gf_fe x)
{
    gf_fe x2a = gf_add(f, gf_sq(f, x), c->a);
    return gf_muladd(f, x2a, x, c->b);
}

static inline int ec_on_curve(const gf_ctx *f, const ec_curve *c, const ec_affine *p)
{
    if (p->infinity)
        return 1;
    if (p->x >= f->p || p->y >= f->p)
        return 0;
    return gf_sq(f, p->y) == ec_rhs(f, c, p->x);
}

static inline ec_affine ec_neg(const gf_ctx *f, const ec_affine *p)
{
    if (p->infinity)
        return *p;
    return ec_point(p->x, gf_neg(f, p->y));
}

static inline ec_affine ec_dbl(const gf_ctx *f, const ec_curve *c, const ec_affine *p)
{
    if (p->infinity || p->y == 0)
        return ec_identity();

    /* lambda = (3x^2 + a) / 2y */
    gf_fe x2 = gf_sq(f, p->x);
    gf_fe num = gf_add(f, gf_add(f, gf_dbl(f, x2), x2), c->a);
    gf_fe lambda = gf_mul(f, num, gf_invert(f, gf_dbl(f, p->y)));

    gf_fe x3 = gf_sub(f, gf_sub(f, gf_sq(f, lambda), p->x), p->x);
    gf_fe y3 = gf_sub(f, gf_mul(f, lambda, gf_sub(f, p->x, x3)), p->y);
    return ec_point(x3, y3);
}

static inline ec_affine ec_add(const gf_ctx *f, const ec_curve *c, const ec_affine *p, const ec_affine *q)
{
    if (p->infinity)
        return *q;
    if (q->infinity)
        return *p;

    if (p->x == q->x)
    {
        if (p->y == q->y)
            return ec_dbl(f, c, p);
        return ec_identity(); /* q = -p */
    }

    gf_fe lambda = gf_mul(f, gf_sub(f, q->y, p->y), gf_invert(f, gf_sub(f, q->x, p->x)));
    gf_fe x3 = gf_sub(f, gf_sub(f, gf_sq(f, lambda), p->x), q->x);
    gf_fe y3 = gf_sub(f, gf_mul(f, lambda, gf_sub(f, p->x, x3)), p->y);
    return ec_point(x3, y3);
}

/* Double-and-add, most significant bit first */
static inline ec_affine ec_scalarmult(const gf_ctx *f, const ec_curve *c, uint64_t k, const ec_affine *p)
{
    ec_affine r = ec_identity();
    for (int i = 63; i >= 0; i--)
    {
        r = ec_dbl(f, c, &r);
        if ((k >> i) & 1)
            r = ec_add(f, c, &r, p);
    }
    return r;
}

#endif // ECFFT_EC_H
