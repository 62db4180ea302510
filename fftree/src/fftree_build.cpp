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
 * @file fftree_build.cpp
 * @brief FFTree construction: classic subgroups, curve cosets, and layer validation.
 *
 * Every mode ends in the same place: layer 0 in natural order, then fftree_build_layers()
 * pushes it through the maps while checking that each map is exactly 2-to-1 with the
 * fixed fiber pairing (i, i + half), then the fiber inverses and view tables are filled.
 */

#include "ecfft_status.h"
#include "fftree.h"
#include "fftree_ecfft.h"
#include "gf_batch_invert.h"
#include "gf_utils.h"

#include <algorithm>
#include <utility>

/* Returns 1 if the n values are pairwise distinct */
static int all_distinct(const gf_fe *v, size_t n)
{
    std::vector<gf_fe> sorted(v, v + n);
    std::sort(sorted.begin(), sorted.end());
    return std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end();
}

/* Map coefficients must be canonical residues */
static int ratmap_in_field(const gf_ctx *f, const gf_ratmap *m)
{
    for (size_t i = 0; i < 3; i++)
        if (m->num[i] >= f->p)
            return 0;
    for (size_t i = 0; i < 2; i++)
        if (m->den[i] >= f->p)
            return 0;
    return 1;
}

/* Failed builds leave the tree empty, so clear it before any check can fail */
static int check_field_and_size(fftree *t, gf_ctx *f, uint64_t p, size_t k)
{
    fftree_free(t);

    int rc = gf_ctx_init(f, p);
    if (rc != ECFFT_OK)
        return rc;
    if (k > ECFFT_MAX_LOG_SIZE)
        return ECFFT_ERR_INVALID_SIZE;
    return ECFFT_OK;
}

/*
 * Derive layers[1..k] from layers[0] and t->maps, rejecting any map that is not exactly
 * 2-to-1 on its input layer. Map values are computed with one batch inversion per layer.
 */
static int fftree_build_layers(fftree *t)
{
    const gf_ctx *f = &t->field;

    for (size_t d = 0; d < t->log_n; d++)
    {
        const gf_ratmap *m = &t->maps[d];
        if (!gf_ratmap_is_valid(m) || !ratmap_in_field(f, m))
            return ECFFT_ERR_INVALID_ISOGENY_CHAIN;

        const std::vector<gf_fe> &cur = t->layers[d];
        const size_t size = cur.size();
        const size_t half = size / 2;

        std::vector<gf_fe> den(size);
        for (size_t i = 0; i < size; i++)
        {
            den[i] = gf_ratmap_den(f, m, cur[i]);
            if (den[i] == 0)
                return ECFFT_ERR_INVALID_ISOGENY_CHAIN;
        }
        gf_batch_invert(f, den.data(), den.data(), size);

        std::vector<gf_fe> next(half);
        for (size_t i = 0; i < half; i++)
        {
            gf_fe y0 = gf_mul(f, gf_ratmap_num(f, m, cur[i]), den[i]);
            gf_fe y1 = gf_mul(f, gf_ratmap_num(f, m, cur[i + half]), den[i + half]);
            if (y0 != y1)
                return ECFFT_ERR_INVALID_ISOGENY_CHAIN;
            next[i] = y0;
        }

        if (!all_distinct(next.data(), half))
            return ECFFT_ERR_INVALID_ISOGENY_CHAIN;

        t->layers.push_back(std::move(next));
    }

    return ECFFT_OK;
}

static int fftree_build_pair_inverses(fftree *t)
{
    const gf_ctx *f = &t->field;

    t->pair_inv.resize(t->log_n);
    for (size_t d = 0; d < t->log_n; d++)
    {
        const std::vector<gf_fe> &cur = t->layers[d];
        const size_t half = cur.size() / 2;

        std::vector<gf_fe> diff(half);
        for (size_t i = 0; i < half; i++)
        {
            diff[i] = gf_sub(f, cur[i], cur[i + half]);
            if (diff[i] == 0)
                return ECFFT_ERR_SINGULAR_SYSTEM;
        }
        gf_batch_invert(f, diff.data(), diff.data(), half);
        t->pair_inv[d] = std::move(diff);
    }

    return ECFFT_OK;
}

/* Common tail: layer 0, field, mode and maps are set; build everything else */
static int fftree_finish(fftree *t, const gf_ratmap *chain, size_t chain_len)
{
    t->maps.assign(chain, chain + chain_len);

    int rc = fftree_build_layers(t);
    if (rc == ECFFT_OK)
        rc = fftree_build_pair_inverses(t);
    if (rc == ECFFT_OK)
        rc = fftree_precompute_views(t);

    if (rc != ECFFT_OK)
        fftree_free(t);
    return rc;
}

static void fftree_reset(fftree *t, const gf_ctx *f, int mode, size_t k)
{
    fftree_free(t);
    t->field = *f;
    t->mode = mode;
    t->log_n = k;
    t->n = (size_t)1 << k;
}

int fftree_build_classic_with_root(fftree *t, uint64_t p, size_t k, gf_fe g)
{
    gf_ctx f;
    int rc = check_field_and_size(t, &f, p, k);
    if (rc != ECFFT_OK)
        return rc;

    if (k > f.two_adicity)
        return ECFFT_ERR_ORDER_NOT_DIVISIBLE;

    g = gf_from_u64(&f, g);
    if (!gf_has_order_2k(&f, g, (unsigned)k))
        return ECFFT_ERR_INVALID_GENERATOR;

    fftree_reset(t, &f, FFTREE_MODE_CLASSIC, k);

    std::vector<gf_fe> domain(t->n);
    gf_fe x = 1;
    for (size_t i = 0; i < t->n; i++)
    {
        domain[i] = x;
        x = gf_mul(&f, x, g);
    }
    t->layers.push_back(std::move(domain));

    std::vector<gf_ratmap> chain(k, gf_ratmap_square());
    return fftree_finish(t, chain.data(), chain.size());
}

int fftree_build_classic(fftree *t, uint64_t p, size_t k)
{
    gf_ctx f;
    int rc = check_field_and_size(t, &f, p, k);
    if (rc != ECFFT_OK)
        return rc;

    if (k > f.two_adicity)
        return ECFFT_ERR_ORDER_NOT_DIVISIBLE;

    /* z^((p-1)/2^k) has order exactly 2^k when z is a non-residue */
    const gf_fe z = gf_least_nonresidue(&f);
    const gf_fe g = gf_pow(&f, z, (p - 1) >> k);

    return fftree_build_classic_with_root(t, p, k, g);
}

int fftree_build_from_domain(
    fftree *t,
    uint64_t p,
    const gf_fe *domain,
    size_t k,
    const gf_ratmap *chain,
    size_t chain_len)
{
    gf_ctx f;
    int rc = check_field_and_size(t, &f, p, k);
    if (rc != ECFFT_OK)
        return rc;

    if (chain_len != k)
        return ECFFT_ERR_INVALID_ISOGENY_CHAIN;

    const size_t n = (size_t)1 << k;
    for (size_t i = 0; i < n; i++)
        if (domain[i] >= p)
            return ECFFT_ERR_INVALID_DOMAIN;
    if (!all_distinct(domain, n))
        return ECFFT_ERR_INVALID_DOMAIN;

    int mode = FFTREE_MODE_CLASSIC;
    for (size_t d = 0; d < chain_len; d++)
        if (!gf_ratmap_is_square(&chain[d]))
            mode = FFTREE_MODE_EC;

    fftree_reset(t, &f, mode, k);
    t->layers.emplace_back(domain, domain + n);

    return fftree_finish(t, chain, chain_len);
}

int fftree_build_ec(
    fftree *t,
    uint64_t p,
    const ec_curve *c,
    const ec_affine *g,
    const ec_affine *r,
    size_t k,
    const gf_ratmap *chain,
    size_t chain_len)
{
    gf_ctx f;
    int rc = check_field_and_size(t, &f, p, k);
    if (rc != ECFFT_OK)
        return rc;

    if (chain_len != k)
        return ECFFT_ERR_INVALID_ISOGENY_CHAIN;

    if (c->a >= p || c->b >= p || ec_is_singular(&f, c))
        return ECFFT_ERR_INVALID_CURVE;
    if (!ec_on_curve(&f, c, g) || !ec_on_curve(&f, c, r))
        return ECFFT_ERR_INVALID_CURVE;

    /* layer 0 in natural order: the kernel of psi_0 is (n/2)G, so R + iG and
     * R + (i + n/2)G share an image */
    const size_t n = (size_t)1 << k;
    std::vector<gf_fe> domain(n);
    ec_affine cur = *r;
    for (size_t i = 0; i < n; i++)
    {
        if (cur.infinity)
            return ECFFT_ERR_INVALID_CURVE;
        domain[i] = cur.x;
        cur = ec_add(&f, c, &cur, g);
    }
    if (!all_distinct(domain.data(), n))
        return ECFFT_ERR_INVALID_CURVE;

    fftree_reset(t, &f, FFTREE_MODE_EC, k);
    t->layers.push_back(std::move(domain));

    return fftree_finish(t, chain, chain_len);
}

void fftree_free(fftree *t)
{
    t->layers.clear();
    t->maps.clear();
    t->pair_inv.clear();
    t->views.clear();
    t->field = {0, 0};
    t->mode = FFTREE_MODE_CLASSIC;
    t->log_n = 0;
    t->n = 0;
}

int fftree_check_invariants(const fftree *t)
{
    if (t->n == 0 || t->layers.size() != t->log_n + 1 || t->maps.size() != t->log_n)
        return 0;

    for (size_t d = 0; d <= t->log_n; d++)
    {
        const std::vector<gf_fe> &cur = t->layers[d];
        if (cur.size() != (t->n >> d) || !all_distinct(cur.data(), cur.size()))
            return 0;
        if (d == t->log_n)
            break;

        const size_t half = cur.size() / 2;
        for (size_t i = 0; i < cur.size(); i++)
        {
            gf_fe y;
            if (!gf_ratmap_apply(&t->field, &y, &t->maps[d], cur[i]))
                return 0;
            if (y != t->layers[d + 1][i % half])
                return 0;
        }
    }

    return 1;
}
