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
 * @file fftree.h
 * @brief FFTree: layered evaluation domains linked by degree-2 halving maps.
 *
 * Layer d holds 2^(k-d) points. The map psi_d sends layer d onto layer d+1 exactly
 * 2-to-1, and the two preimages of layers[d+1][i] sit at positions i and
 * i + |layer_d|/2 of layers[d]. Both construction modes establish that pairing, so
 * every routine below works on any tree.
 *
 * A built tree is immutable and may be shared read-only by any number of threads.
 *
 * Two evaluation engines exist:
 *   - the radix-2 even/odd recursion, valid only when every map is psi(x) = x^2
 *     (classic trees), O(n log n);
 *   - the ECFFT engine (EXTEND, ENTER, EXIT), valid for any tree, built on the
 *     decomposition P(x) = den(x)^(m-1) * (P0(psi(x)) + x * P1(psi(x))),
 *     O(n log^2 n) for evaluate / interpolate and O(n log n) for extend.
 * fftree_evaluate / fftree_interpolate pick the engine from the tree mode.
 */

#ifndef ECFFT_FFTREE_H
#define ECFFT_FFTREE_H

#include "ec.h"
#include "gf.h"
#include "gf_ratmap.h"

#include <vector>

enum fftree_mode : int
{
    FFTREE_MODE_CLASSIC = 0,
    FFTREE_MODE_EC = 1,
};

/*
 * View s of the tree: the positions i * 2^s of every layer. It is itself an FFTree of
 * size n >> s; its even layer-0 positions (S0) form view s + 1 and its odd positions are
 * S1. Tables are indexed by view position, not by layer position.
 */
struct fftree_view
{
    size_t n = 0;
    /* half (0 or 1) of layer 0 used as the REDC pivot; never contains x = 0 */
    int pivot = 0;
    /* X^(n/2) over layer 0, and its inverse (0 where X^(n/2) is 0) */
    std::vector<gf_fe> xnn;
    std::vector<gf_fe> xnn_inv;
    /* 1 / Z_pivot over the other half, Z_pivot the vanishing polynomial of the pivot half */
    std::vector<gf_fe> z_inv;
    /* Z_pivot^2 mod X^(n/2), evaluated over layer 0 */
    std::vector<gf_fe> c;
    /* weight[d][i] = den_d(x)^(m-1) at view position i of layer d, 2m = (n >> d) / 2 */
    std::vector<std::vector<gf_fe>> weight;
    std::vector<std::vector<gf_fe>> weight_inv;
};

/* A default-constructed tree is empty (n = 0) and rejected by every evaluation call */
struct fftree
{
    gf_ctx field = {0, 0};
    int mode = FFTREE_MODE_CLASSIC;
    size_t log_n = 0;
    size_t n = 0;
    /* layers[0..log_n] */
    std::vector<std::vector<gf_fe>> layers;
    /* maps[0..log_n - 1] */
    std::vector<gf_ratmap> maps;
    /* pair_inv[d][i] = 1 / (layers[d][i] - layers[d][i + |layer_d|/2]) */
    std::vector<std::vector<gf_fe>> pair_inv;
    /* views[0..log_n] */
    std::vector<fftree_view> views;
};

/* ---- construction (fftree_build.cpp) ---- */

/*
 * Multiplicative subgroup of order 2^k: layers[0] = [g^0, g^1, ..., g^(n-1)] with g of
 * order exactly 2^k, psi_d(x) = x^2. The generator is z^((p-1)/2^k) for the least
 * quadratic non-residue z.
 */
int fftree_build_classic(fftree *t, uint64_t p, size_t k);

/* As above with a caller-chosen g, which must have order exactly 2^k. */
int fftree_build_classic_with_root(fftree *t, uint64_t p, size_t k, gf_fe g);

/*
 * Curve coset: layers[0][i] = x(R + i*G), layers[d+1] = psi_d(layers[d]) for the supplied
 * chain. The chain is checked on the actual domain: length k, map shape, nonvanishing
 * denominators, shared fiber images and distinct images.
 */
int fftree_build_ec(
    fftree *t,
    uint64_t p,
    const ec_curve *c,
    const ec_affine *g,
    const ec_affine *r,
    size_t k,
    const gf_ratmap *chain,
    size_t chain_len);

/*
 * Arbitrary layer 0 of size 2^k and a chain of k maps, validated as for fftree_build_ec.
 * Points not below p or repeated points give ECFFT_ERR_INVALID_DOMAIN.
 */
int fftree_build_from_domain(
    fftree *t,
    uint64_t p,
    const gf_fe *domain,
    size_t k,
    const gf_ratmap *chain,
    size_t chain_len);

void fftree_free(fftree *t);

/* Returns 1 if every layer is strictly 2-to-1 onto the next with the fixed pairing */
int fftree_check_invariants(const fftree *t);

/* ---- evaluate / interpolate ---- */

/* values[i] = P(layers[0][i]), coeffs has len <= n entries (shorter means zero-padded) */
int fftree_evaluate(const fftree *t, gf_fe *values, const gf_fe *coeffs, size_t len);

/* coeffs[0..n) of the unique P with deg P < n through the n values */
int fftree_interpolate(const fftree *t, gf_fe *coeffs, const gf_fe *values);

/* Radix-2 path; requires a classic tree (fftree_classic.cpp) */
int fftree_evaluate_classic(const fftree *t, gf_fe *values, const gf_fe *coeffs, size_t len);
int fftree_interpolate_classic(const fftree *t, gf_fe *coeffs, const gf_fe *values);

/* ECFFT path; works on every tree (fftree_ecfft.cpp) */
int fftree_evaluate_ecfft(const fftree *t, gf_fe *values, const gf_fe *coeffs, size_t len);
int fftree_interpolate_ecfft(const fftree *t, gf_fe *coeffs, const gf_fe *values);

/*
 * Low-degree extension: given the values of some Q with deg Q < n/2 at the even positions
 * of layer 0, write its values at the odd positions. Both arrays hold n/2 entries.
 */
int fftree_extend(const fftree *t, gf_fe *odd_values, const gf_fe *even_values);

#endif // ECFFT_FFTREE_H
