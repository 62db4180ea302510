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
 * @file fftree_ecfft.cpp
 * @brief ECFFT engine: EXTEND, ENTER, REDC, EXIT and the per-view tables they use.
 *
 * For a fiber pair (x, x') with psi(x) = psi(x') = y and deg Q < 2m,
 *
 *   Q(x) = w(x) * (Q0(y) + x * Q1(y)),   w = den^(m-1),   deg Q0, Q1 < m
 *
 * holds for unique Q0, Q1. EXTEND solves this 2x2 system on every pair of one half of a
 * layer, extends Q0 and Q1 one layer down, and recombines on the other half.
 *
 * ENTER and EXIT move between coefficients and values on view s (size N) through the
 * split P = L + X^(N/2) * H. ENTER evaluates L and H on view s + 1 and extends them.
 * EXIT needs L = P mod X^(N/2) from values alone, which is a double Montgomery-style
 * reduction modulo X^(N/2) with the vanishing polynomial Z of the pivot half as radix:
 *
 *   REDC(P) = P * Z^(-1) mod X^(N/2),   L = REDC(REDC(P) * (Z^2 mod X^(N/2)))
 *
 * The pivot half is chosen so X^(N/2) never vanishes on it.
 */

#include "ecfft_status.h"
#include "fftree_ecfft.h"
#include "fftree_parallel.h"
#include "gf_batch_invert.h"

#include <algorithm>
#include <vector>

void fftree_extend_rec(
    const fftree *t,
    size_t s,
    size_t d,
    int a,
    const gf_fe *in,
    gf_fe *out,
    size_t m,
    size_t par)
{
    if (m == 1)
    {
        out[0] = in[0];
        return;
    }

    const gf_ctx *f = &t->field;
    const fftree_view &v = t->views[s];
    const gf_fe *layer = t->layers[d].data();
    const gf_fe *pinv = t->pair_inv[d].data();
    const gf_fe *w = v.weight[d].data();
    const gf_fe *w_inv = v.weight_inv[d].data();

    const size_t h = m / 2;
    const int b = 1 - a;

    std::vector<gf_fe> buf(4 * h);
    gf_fe *q0 = buf.data();
    gf_fe *q1 = q0 + h;
    gf_fe *e0 = q1 + h;
    gf_fe *e1 = e0 + h;

    /* decompose: view positions i0 = 2j + a and i0 + m form a fiber pair */
    for (size_t j = 0; j < h; j++)
    {
        const size_t i0 = 2 * j + a;
        const size_t i1 = i0 + m;
        const size_t g0 = i0 << s;

        gf_fe u0 = gf_mul(f, in[j], w_inv[i0]);
        gf_fe u1 = gf_mul(f, in[j + h], w_inv[i1]);
        q1[j] = gf_mul(f, gf_sub(f, u0, u1), pinv[g0]);
        q0[j] = gf_sub(f, u0, gf_mul(f, layer[g0], q1[j]));
    }

    fftree_fork_join(
        h,
        par,
        [&]() { fftree_extend_rec(t, s, d + 1, a, q0, e0, h, par); },
        [&]() { fftree_extend_rec(t, s, d + 1, a, q1, e1, h, par); });

    /* recombine on the other half; positions j and j + h share the image e[j] */
    for (size_t j = 0; j < m; j++)
    {
        const size_t i = 2 * j + b;
        const size_t jj = (j < h) ? j : (j - h);
        gf_fe x = layer[i << s];
        out[j] = gf_mul(f, w[i], gf_muladd(f, x, e1[jj], e0[jj]));
    }
}

void fftree_enter_rec(const fftree *t, size_t s, const gf_fe *coeffs, gf_fe *values, size_t par)
{
    const size_t n = t->n >> s;
    if (n == 1)
    {
        values[0] = coeffs[0];
        return;
    }

    const gf_ctx *f = &t->field;
    const size_t half = n / 2;
    const gf_fe *xnn = t->views[s].xnn.data();

    std::vector<gf_fe> buf(4 * half);
    gf_fe *lo0 = buf.data();
    gf_fe *hi0 = lo0 + half;
    gf_fe *lo1 = hi0 + half;
    gf_fe *hi1 = lo1 + half;

    /* S0 of view s is view s + 1 */
    fftree_fork_join(
        half,
        par,
        [&]() { fftree_enter_rec(t, s + 1, coeffs, lo0, par); },
        [&]() { fftree_enter_rec(t, s + 1, coeffs + half, hi0, par); });

    fftree_fork_join(
        half,
        par,
        [&]() { fftree_extend_rec(t, s, 0, 0, lo0, lo1, half, par); },
        [&]() { fftree_extend_rec(t, s, 0, 0, hi0, hi1, half, par); });

    for (size_t i = 0; i < half; i++)
    {
        values[2 * i] = gf_muladd(f, xnn[2 * i], hi0[i], lo0[i]);
        values[2 * i + 1] = gf_muladd(f, xnn[2 * i + 1], hi1[i], lo1[i]);
    }
}

/* out = P * Z^(-1) mod X^(n/2) over layer 0 of view s, for deg P < n */
static void fftree_redc(const fftree *t, size_t s, const gf_fe *in, gf_fe *out, size_t par)
{
    const gf_ctx *f = &t->field;
    const fftree_view &v = t->views[s];
    const size_t half = v.n / 2;
    const int h = v.pivot;
    const int o = 1 - h;

    std::vector<gf_fe> buf(4 * half);
    gf_fe *t_h = buf.data();
    gf_fe *t_o = t_h + half;
    gf_fe *r_o = t_o + half;
    gf_fe *r_h = r_o + half;

    /* T = P / X^(n/2) on the pivot half, so that P - T * X^(n/2) vanishes there */
    for (size_t i = 0; i < half; i++)
        t_h[i] = gf_mul(f, in[2 * i + h], v.xnn_inv[2 * i + h]);
    fftree_extend_rec(t, s, 0, h, t_h, t_o, half, par);

    /* R = (P - T * X^(n/2)) / Z on the other half, then back */
    for (size_t i = 0; i < half; i++)
    {
        gf_fe num = gf_sub(f, in[2 * i + o], gf_mul(f, t_o[i], v.xnn[2 * i + o]));
        r_o[i] = gf_mul(f, num, v.z_inv[i]);
    }
    fftree_extend_rec(t, s, 0, o, r_o, r_h, half, par);

    for (size_t i = 0; i < half; i++)
    {
        out[2 * i + o] = r_o[i];
        out[2 * i + h] = r_h[i];
    }
}

void fftree_exit_rec(const fftree *t, size_t s, const gf_fe *values, gf_fe *coeffs, size_t par)
{
    const size_t n = t->n >> s;
    if (n == 1)
    {
        coeffs[0] = values[0];
        return;
    }

    const gf_ctx *f = &t->field;
    const fftree_view &v = t->views[s];
    const size_t half = n / 2;
    const int h = v.pivot;

    /* low half: L = REDC(REDC(P) * C) */
    std::vector<gf_fe> low(n);
    fftree_redc(t, s, values, low.data(), par);
    for (size_t i = 0; i < n; i++)
        low[i] = gf_mul(f, low[i], v.c[i]);
    fftree_redc(t, s, low.data(), low.data(), par);

    /* high half: H = (P - L) / X^(n/2) on the pivot half, moved to S0 if needed */
    std::vector<gf_fe> buf(3 * half);
    gf_fe *lo_even = buf.data();
    gf_fe *hi_even = lo_even + half;
    gf_fe *hi_pivot = hi_even + half;

    for (size_t i = 0; i < half; i++)
    {
        lo_even[i] = low[2 * i];
        hi_pivot[i] = gf_mul(f, gf_sub(f, values[2 * i + h], low[2 * i + h]), v.xnn_inv[2 * i + h]);
    }
    if (h == 0)
        std::copy(hi_pivot, hi_pivot + half, hi_even);
    else
        fftree_extend_rec(t, s, 0, 1, hi_pivot, hi_even, half, par);

    fftree_fork_join(
        half,
        par,
        [&]() { fftree_exit_rec(t, s + 1, lo_even, coeffs, par); },
        [&]() { fftree_exit_rec(t, s + 1, hi_even, coeffs + half, par); });
}

/* coefficients (len <= n_{s+1}, zero padded) -> values on view s + 1 */
static std::vector<gf_fe> enter_padded(const fftree *t, size_t s, const gf_fe *coeffs, size_t len, size_t par)
{
    const size_t n = t->n >> s;
    std::vector<gf_fe> padded(n, 0);
    std::copy(coeffs, coeffs + len, padded.begin());
    std::vector<gf_fe> values(n);
    fftree_enter_rec(t, s, padded.data(), values.data(), par);
    return values;
}

/*
 * C = Z^2 mod X^(n/2) for view s. Writing Z = X^(n/2) + z with deg z < n/2 gives
 * C = z^2 mod X^(n/2). With z = lo + X^(n/4) * hi that is lo^2 + 2 X^(n/4) (lo * hi),
 * and both products have degree < n/2, so view s + 1 multiplies them exactly.
 */
static void fftree_build_c(fftree *t, size_t s, const std::vector<gf_fe> &z, size_t par)
{
    const gf_ctx *f = &t->field;
    const size_t n = t->n >> s;
    const size_t half = n / 2;

    std::vector<gf_fe> c(n, 0);
    if (half == 1)
    {
        c[0] = gf_sq(f, z[0]);
    }
    else
    {
        const size_t q = half / 2;
        std::vector<gf_fe> lo = enter_padded(t, s + 1, z.data(), q, par);
        std::vector<gf_fe> hi = enter_padded(t, s + 1, z.data() + q, q, par);

        std::vector<gf_fe> sq(half), cross(half);
        for (size_t i = 0; i < half; i++)
        {
            sq[i] = gf_sq(f, lo[i]);
            cross[i] = gf_mul(f, lo[i], hi[i]);
        }

        std::vector<gf_fe> sq_c(half), cross_c(half);
        fftree_exit_rec(t, s + 1, sq.data(), sq_c.data(), par);
        fftree_exit_rec(t, s + 1, cross.data(), cross_c.data(), par);

        for (size_t i = 0; i < q; i++)
        {
            c[i] = sq_c[i];
            c[q + i] = gf_add(f, sq_c[q + i], gf_dbl(f, cross_c[i]));
        }
    }

    t->views[s].c.resize(n);
    fftree_enter_rec(t, s, c.data(), t->views[s].c.data(), par);
}

static void fftree_build_weights(fftree *t, size_t s)
{
    const gf_ctx *f = &t->field;
    fftree_view &v = t->views[s];

    v.weight.resize(t->log_n - s + 1);
    v.weight_inv.resize(t->log_n - s + 1);

    for (size_t d = 0; d + s < t->log_n; d++)
    {
        const size_t nd = v.n >> d;
        if (nd < 4)
            continue;

        const uint64_t e = nd / 4 - 1;
        std::vector<gf_fe> w(nd);
        for (size_t i = 0; i < nd; i++)
            w[i] = gf_pow(f, gf_ratmap_den(f, &t->maps[d], t->layers[d][i << s]), e);

        v.weight_inv[d].resize(nd);
        gf_batch_invert(f, v.weight_inv[d].data(), w.data(), nd);
        v.weight[d] = std::move(w);
    }
}

/* View s with views s + 1 .. log_n complete */
static int fftree_build_view(fftree *t, size_t s, size_t par)
{
    const gf_ctx *f = &t->field;
    fftree_view &v = t->views[s];
    const size_t n = t->n >> s;
    const size_t half = n / 2;

    v.n = n;
    fftree_build_weights(t, s);

    v.pivot = 0;
    v.xnn.resize(n);
    for (size_t i = 0; i < n; i++)
    {
        gf_fe x = t->layers[0][i << s];
        v.xnn[i] = gf_pow(f, x, half);
        if (x == 0 && (i & 1) == 0)
            v.pivot = 1;
    }
    v.xnn_inv.resize(n);
    gf_batch_invert(f, v.xnn_inv.data(), v.xnn.data(), n);

    const int h = v.pivot;
    const int o = 1 - h;

    /* z = Z - X^(n/2) has degree < n/2 and equals -X^(n/2) on the pivot half */
    std::vector<gf_fe> z_h(half), z_o(half);
    for (size_t i = 0; i < half; i++)
        z_h[i] = gf_neg(f, v.xnn[2 * i + h]);
    fftree_extend_rec(t, s, 0, h, z_h.data(), z_o.data(), half, par);

    v.z_inv.resize(half);
    for (size_t i = 0; i < half; i++)
    {
        v.z_inv[i] = gf_add(f, v.xnn[2 * i + o], z_o[i]);
        if (v.z_inv[i] == 0)
            return ECFFT_ERR_SINGULAR_SYSTEM;
    }
    gf_batch_invert(f, v.z_inv.data(), v.z_inv.data(), half);

    std::vector<gf_fe> z(half);
    fftree_exit_rec(t, s + 1, (h == 0) ? z_h.data() : z_o.data(), z.data(), par);

    fftree_build_c(t, s, z, par);
    return ECFFT_OK;
}

int fftree_precompute_views(fftree *t)
{
    t->views.assign(t->log_n + 1, fftree_view());

    fftree_view &top = t->views[t->log_n];
    top.n = 1;
    top.pivot = 0;

    const size_t par = fftree_fork_threshold();
    int rc = ECFFT_OK;

    for (size_t s = t->log_n; s-- > 0;)
    {
        fftree_parallel_region(t->n >> s, par, [&]() { rc = fftree_build_view(t, s, par); });
        if (rc != ECFFT_OK)
            return rc;
    }

    return ECFFT_OK;
}

/* ---- public entry points ---- */

int fftree_evaluate_ecfft(const fftree *t, gf_fe *values, const gf_fe *coeffs, size_t len)
{
    std::vector<gf_fe> padded;
    int rc = fftree_load_coeffs(t, &padded, coeffs, len);
    if (rc != ECFFT_OK)
        return rc;

    const size_t par = fftree_fork_threshold();
    fftree_parallel_region(t->n, par, [&]() { fftree_enter_rec(t, 0, padded.data(), values, par); });
    return ECFFT_OK;
}

int fftree_interpolate_ecfft(const fftree *t, gf_fe *coeffs, const gf_fe *values)
{
    std::vector<gf_fe> reduced;
    int rc = fftree_load_values(t, &reduced, values);
    if (rc != ECFFT_OK)
        return rc;

    const size_t par = fftree_fork_threshold();
    fftree_parallel_region(t->n, par, [&]() { fftree_exit_rec(t, 0, reduced.data(), coeffs, par); });
    return ECFFT_OK;
}

int fftree_extend(const fftree *t, gf_fe *odd_values, const gf_fe *even_values)
{
    if (!fftree_is_consistent(t))
        return ECFFT_ERR_SINGULAR_SYSTEM;

    const size_t half = t->n / 2;
    if (half == 0)
        return ECFFT_OK;

    std::vector<gf_fe> reduced(even_values, even_values + half);
    for (size_t i = 0; i < half; i++)
        reduced[i] = gf_from_u64(&t->field, reduced[i]);

    const size_t par = fftree_fork_threshold();
    fftree_parallel_region(
        half, par, [&]() { fftree_extend_rec(t, 0, 0, 0, reduced.data(), odd_values, half, par); });
    return ECFFT_OK;
}
