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

#include "poly.h"

#include "ecfft_status.h"
#include "gf_mul.h"
#include "gf_ops.h"

#include <algorithm>
#include <utility>

/* Karatsuba threshold: use schoolbook below this many coefficients */
static const size_t KARATSUBA_THRESHOLD = 32;

/* ---- Strip trailing zero coefficients ---- */

void gf_poly_strip(gf_poly *p)
{
    while (!p->coeffs.empty() && p->coeffs.back() == 0)
        p->coeffs.pop_back();
}

long gf_poly_degree(const gf_poly *p)
{
    size_t n = p->coeffs.size();
    while (n > 0 && p->coeffs[n - 1] == 0)
        n--;
    return (long)n - 1;
}

/* ---- Helpers: polynomial add/sub (used by Karatsuba) ---- */

void gf_poly_add(const gf_ctx *f, gf_poly *r, const gf_poly *a, const gf_poly *b)
{
    size_t na = a->coeffs.size();
    size_t nb = b->coeffs.size();
    size_t nr = (na > nb) ? na : nb;
    std::vector<gf_fe> out(nr);
    for (size_t i = 0; i < nr; i++)
    {
        gf_fe ai = (i < na) ? a->coeffs[i] : 0;
        gf_fe bi = (i < nb) ? b->coeffs[i] : 0;
        out[i] = gf_add(f, ai, bi);
    }
    r->coeffs = std::move(out);
    gf_poly_strip(r);
}

void gf_poly_sub(const gf_ctx *f, gf_poly *r, const gf_poly *a, const gf_poly *b)
{
    size_t na = a->coeffs.size();
    size_t nb = b->coeffs.size();
    size_t nr = (na > nb) ? na : nb;
    std::vector<gf_fe> out(nr);
    for (size_t i = 0; i < nr; i++)
    {
        gf_fe ai = (i < na) ? a->coeffs[i] : 0;
        gf_fe bi = (i < nb) ? b->coeffs[i] : 0;
        out[i] = gf_sub(f, ai, bi);
    }
    r->coeffs = std::move(out);
    gf_poly_strip(r);
}

void gf_poly_scale(const gf_ctx *f, gf_poly *r, const gf_poly *a, gf_fe s)
{
    std::vector<gf_fe> out(a->coeffs.size());
    for (size_t i = 0; i < out.size(); i++)
        out[i] = gf_mul(f, a->coeffs[i], s);
    r->coeffs = std::move(out);
    gf_poly_strip(r);
}

/* ---- Schoolbook multiplication ---- */

void gf_poly_mul_schoolbook(const gf_ctx *f, gf_poly *r, const gf_poly *a, const gf_poly *b)
{
    size_t na = a->coeffs.size();
    size_t nb = b->coeffs.size();

    if (na == 0 || nb == 0)
    {
        r->coeffs.clear();
        return;
    }

    std::vector<gf_fe> out(na + nb - 1, 0);
    for (size_t i = 0; i < na; i++)
    {
        gf_fe ai = a->coeffs[i];
        if (ai == 0)
            continue;
        for (size_t j = 0; j < nb; j++)
            out[i + j] = gf_muladd(f, ai, b->coeffs[j], out[i + j]);
    }

    r->coeffs = std::move(out);
    gf_poly_strip(r);
}

/* ---- Helpers: extract sub-polynomial (slice) ---- */

static void gf_poly_slice(gf_poly *r, const gf_poly *p, size_t start, size_t len)
{
    size_t n = p->coeffs.size();
    if (start >= n || len == 0)
    {
        r->coeffs.clear();
        return;
    }
    size_t actual = (start + len > n) ? (n - start) : len;
    r->coeffs.assign(p->coeffs.begin() + start, p->coeffs.begin() + start + actual);
    gf_poly_strip(r);
}

/* ---- Helpers: shift polynomial by m positions (multiply by x^m) ---- */

static void gf_poly_shift(gf_poly *r, const gf_poly *p, size_t m)
{
    if (p->coeffs.empty())
    {
        r->coeffs.clear();
        return;
    }
    std::vector<gf_fe> out(p->coeffs.size() + m, 0);
    std::copy(p->coeffs.begin(), p->coeffs.end(), out.begin() + m);
    r->coeffs = std::move(out);
}

/*
 * Karatsuba polynomial multiplication (recursive).
 *
 * Given A, B, split at midpoint m:
 *   A = A_lo + x^m * A_hi
 *   B = B_lo + x^m * B_hi
 *   z0 = A_lo * B_lo
 *   z2 = A_hi * B_hi
 *   z1 = (A_lo + A_hi) * (B_lo + B_hi) - z0 - z2
 *   result = z0 + x^m * z1 + x^(2m) * z2
 */
static void gf_poly_mul_karatsuba(const gf_ctx *f, gf_poly *r, const gf_poly *a, const gf_poly *b)
{
    size_t na = a->coeffs.size();
    size_t nb = b->coeffs.size();

    /* Base case: fall through to schoolbook */
    if (na < KARATSUBA_THRESHOLD || nb < KARATSUBA_THRESHOLD)
    {
        gf_poly_mul_schoolbook(f, r, a, b);
        return;
    }

    size_t m = ((na > nb) ? na : nb) / 2;

    gf_poly a_lo, a_hi, b_lo, b_hi;
    gf_poly_slice(&a_lo, a, 0, m);
    gf_poly_slice(&a_hi, a, m, na - m);
    gf_poly_slice(&b_lo, b, 0, m);
    gf_poly_slice(&b_hi, b, m, nb - m);

    /* z0 = a_lo * b_lo */
    gf_poly z0;
    gf_poly_mul(f, &z0, &a_lo, &b_lo);

    /* z2 = a_hi * b_hi */
    gf_poly z2;
    gf_poly_mul(f, &z2, &a_hi, &b_hi);

    /* z1 = (a_lo + a_hi) * (b_lo + b_hi) - z0 - z2 */
    gf_poly a_sum, b_sum, z1_raw, z1_tmp, z1;
    gf_poly_add(f, &a_sum, &a_lo, &a_hi);
    gf_poly_add(f, &b_sum, &b_lo, &b_hi);
    gf_poly_mul(f, &z1_raw, &a_sum, &b_sum);
    gf_poly_sub(f, &z1_tmp, &z1_raw, &z0);
    gf_poly_sub(f, &z1, &z1_tmp, &z2);

    /* result = z0 + x^m * z1 + x^(2m) * z2 */
    gf_poly z1_shifted, z2_shifted, tmp;
    gf_poly_shift(&z1_shifted, &z1, m);
    gf_poly_shift(&z2_shifted, &z2, 2 * m);
    gf_poly_add(f, &tmp, &z0, &z1_shifted);
    gf_poly_add(f, r, &tmp, &z2_shifted);
}

void gf_poly_mul(const gf_ctx *f, gf_poly *r, const gf_poly *a, const gf_poly *b)
{
    size_t na = a->coeffs.size();
    size_t nb = b->coeffs.size();

    if (na == 0 || nb == 0)
    {
        r->coeffs.clear();
        return;
    }

    if (na >= KARATSUBA_THRESHOLD && nb >= KARATSUBA_THRESHOLD)
        gf_poly_mul_karatsuba(f, r, a, b);
    else
        gf_poly_mul_schoolbook(f, r, a, b);
}

gf_fe gf_poly_eval(const gf_ctx *f, const gf_poly *p, gf_fe x)
{
    size_t n = p->coeffs.size();
    if (n == 0)
        return 0;

    /* Horner's method: start from highest coefficient */
    gf_fe result = p->coeffs[n - 1];
    for (size_t i = n - 1; i > 0; i--)
        result = gf_muladd(f, result, x, p->coeffs[i - 1]);
    return result;
}

void gf_poly_eval_points(const gf_ctx *f, gf_fe *out, const gf_poly *p, const gf_fe *points, size_t n)
{
    for (size_t i = 0; i < n; i++)
        out[i] = gf_poly_eval(f, p, points[i]);
}

int gf_poly_mul_fftree(gf_poly *r, const gf_poly *a, const gf_poly *b, const fftree *t)
{
    const gf_ctx *f = &t->field;

    gf_poly ra, rb;
    ra.coeffs.resize(a->coeffs.size());
    rb.coeffs.resize(b->coeffs.size());
    for (size_t i = 0; i < ra.coeffs.size(); i++)
        ra.coeffs[i] = gf_from_u64(f, a->coeffs[i]);
    for (size_t i = 0; i < rb.coeffs.size(); i++)
        rb.coeffs[i] = gf_from_u64(f, b->coeffs[i]);
    gf_poly_strip(&ra);
    gf_poly_strip(&rb);

    if (ra.coeffs.empty() || rb.coeffs.empty())
    {
        r->coeffs.clear();
        return ECFFT_OK;
    }

    /* deg a + deg b < n */
    if (ra.coeffs.size() + rb.coeffs.size() - 2 >= t->n)
        return ECFFT_ERR_INSUFFICIENT_DOMAIN_SIZE;

    std::vector<gf_fe> va(t->n), vb(t->n);
    int rc = fftree_evaluate(t, va.data(), ra.coeffs.data(), ra.coeffs.size());
    if (rc != ECFFT_OK)
        return rc;
    rc = fftree_evaluate(t, vb.data(), rb.coeffs.data(), rb.coeffs.size());
    if (rc != ECFFT_OK)
        return rc;

    for (size_t i = 0; i < t->n; i++)
        va[i] = gf_mul(f, va[i], vb[i]);

    std::vector<gf_fe> out(t->n);
    rc = fftree_interpolate(t, out.data(), va.data());
    if (rc != ECFFT_OK)
        return rc;

    r->coeffs = std::move(out);
    gf_poly_strip(r);
    return ECFFT_OK;
}
