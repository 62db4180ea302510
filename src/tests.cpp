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

#include "ecfft.h"
#include "fftree_ecfft.h"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace ecfft;

static int tests_run = 0;
static int tests_passed = 0;
static int tests_failed = 0;

static std::string join(const std::vector<uint64_t> &v)
{
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < v.size(); ++i)
    {
        if (i > 0)
            oss << ", ";
        oss << v[i];
    }
    oss << "]";
    return oss.str();
}

static bool check_values(const char *test_name, const std::vector<uint64_t> &expected, const std::vector<uint64_t> &actual)
{
    ++tests_run;
    if (expected == actual)
    {
        ++tests_passed;
        std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << std::endl;
        std::cout << "    expected: " << join(expected) << std::endl;
        std::cout << "    actual:   " << join(actual) << std::endl;
        return false;
    }
}

static bool check_u64(const char *test_name, uint64_t expected, uint64_t actual)
{
    ++tests_run;
    if (expected == actual)
    {
        ++tests_passed;
        std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << std::endl;
        std::cout << "    expected: " << expected << std::endl;
        std::cout << "    actual:   " << actual << std::endl;
        return false;
    }
}

static bool check_int(const char *test_name, int expected, int actual)
{
    ++tests_run;
    if (expected == actual)
    {
        ++tests_passed;
        std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << std::endl;
        std::cout << "    expected: " << ecfft_status_string(expected) << " (" << expected << ")" << std::endl;
        std::cout << "    actual:   " << ecfft_status_string(actual) << " (" << actual << ")" << std::endl;
        return false;
    }
}

static bool check_nonzero(const char *test_name, int actual)
{
    ++tests_run;
    if (actual != 0)
    {
        ++tests_passed;
        std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << " (expected non-zero, got 0)" << std::endl;
        return false;
    }
}

/* Deterministic pseudo-random coefficients (64-bit LCG), reduced into the field */
static std::vector<gf_fe> sample_coeffs(const gf_ctx *f, size_t n, uint64_t salt)
{
    std::vector<gf_fe> v(n);
    uint64_t x = salt;
    for (size_t i = 0; i < n; i++)
    {
        x = x * 6364136223846793005ULL + 1442695040888963407ULL;
        v[i] = gf_from_u64(f, x);
    }
    return v;
}

/* Reference evaluation of coeffs at every point of layer 0 */
static std::vector<gf_fe> horner_on_layer(const fftree *t, const std::vector<gf_fe> &coeffs)
{
    gf_poly p;
    p.coeffs = coeffs;
    std::vector<gf_fe> out(t->layers[0].size());
    gf_poly_eval_points(&t->field, out.data(), &p, t->layers[0].data(), out.size());
    return out;
}

/* Curve with #E = 998720 over p = 1000003; G has order 64 and p - 1 has 2-adicity 1 */
static const uint64_t EC_P = 1000003;
static const ec_curve EC_CURVE = {113169, 419849};
static const ec_affine EC_G = {849588, 191504, 0};
static const ec_affine EC_R = {223872, 116380, 0};
static const size_t EC_K = 6;

/* p = 0xffffffff00000001 has 2-adicity 32 */
static const uint64_t GOLDILOCKS = 0xffffffff00000001ULL;

static void test_field()
{
    std::cout << std::endl << "=== F_p arithmetic ===" << std::endl;

    gf_ctx f17;
    check_int("gf_ctx_init(17)", ECFFT_OK, gf_ctx_init(&f17, 17));
    check_u64("two_adicity(17)", 4, f17.two_adicity);

    gf_ctx bad;
    check_int("gf_ctx_init(15) rejects composite", ECFFT_ERR_INVALID_MODULUS, gf_ctx_init(&bad, 15));
    check_int("gf_ctx_init(2) rejects even prime", ECFFT_ERR_INVALID_MODULUS, gf_ctx_init(&bad, 2));
    check_int("gf_ctx_init(0)", ECFFT_ERR_INVALID_MODULUS, gf_ctx_init(&bad, 0));
    check_nonzero("gf_is_prime(2^61 - 1)", gf_is_prime((1ULL << 61) - 1));
    check_int("gf_is_prime(3215031751) (strong pseudoprime to 2,3,5,7)", 0, gf_is_prime(3215031751ULL));

    gf_ctx gl;
    check_int("gf_ctx_init(goldilocks)", ECFFT_OK, gf_ctx_init(&gl, GOLDILOCKS));
    check_u64("two_adicity(goldilocks)", 32, gl.two_adicity);

    /* sums that overflow 64 bits */
    check_u64("(p-1) + (p-1) = p-2", GOLDILOCKS - 2, gf_add(&gl, GOLDILOCKS - 1, GOLDILOCKS - 1));
    check_u64("0 - 1 = p-1", GOLDILOCKS - 1, gf_sub(&gl, 0, 1));
    check_u64("muladd 5 * 7 + 9 (mod 17)", 10, gf_muladd(&f17, 5, 7, 9));
    check_u64(
        "muladd (p-1)^2 + (p-1) wraps to 0", 0, gf_muladd(&gl, GOLDILOCKS - 1, GOLDILOCKS - 1, GOLDILOCKS - 1));
    check_u64("(p-1) * (p-1) = 1", 1, gf_mul(&gl, GOLDILOCKS - 1, GOLDILOCKS - 1));
    check_u64("neg(0) = 0", 0, gf_neg(&gl, 0));
    check_u64("from_i64(-1) = p-1", GOLDILOCKS - 1, gf_from_i64(&gl, -1));

    check_u64("3^-1 mod 17", 6, gf_invert(&f17, 3));
    check_u64("3^16 mod 17", 1, gf_pow(&f17, 3, 16));
    check_u64("invert(0) = 0", 0, gf_invert(&f17, 0));

    std::vector<gf_fe> in = {2, 0, 5, 16};
    std::vector<gf_fe> out(in.size());
    gf_batch_invert(&f17, out.data(), in.data(), in.size());
    check_values("batch_invert skips zero", {9, 0, 7, 16}, out);
    gf_batch_invert(&f17, in.data(), in.data(), in.size());
    check_values("batch_invert in place", {9, 0, 7, 16}, in);

    check_u64("least non-residue mod 17", 3, gf_least_nonresidue(&f17));
    check_nonzero("4 has order 4 mod 17", gf_has_order_2k(&f17, 4, 2));
    check_nonzero("13 has order 4 mod 17", gf_has_order_2k(&f17, 13, 2));
    check_int("16 does not have order 4 mod 17", 0, gf_has_order_2k(&f17, 16, 2));

    gf_ratmap sq = gf_ratmap_square();
    gf_fe y = 0;
    check_nonzero("square map is valid", gf_ratmap_is_valid(&sq));
    check_nonzero("square map applies", gf_ratmap_apply(&f17, &y, &sq, 5));
    check_u64("square map: 5 -> 8", 8, y);

    std::cout << "  status string: " << ecfft_status_string(ECFFT_ERR_INVALID_ISOGENY_CHAIN) << std::endl;
    check_nonzero("status strings differ", std::strcmp(ecfft_status_string(ECFFT_OK), ecfft_status_string(ECFFT_ERR_SINGULAR_SYSTEM)));
}

static void test_curve()
{
    std::cout << std::endl << "=== Curve and Velu isogenies ===" << std::endl;

    gf_ctx f;
    gf_ctx_init(&f, EC_P);

    check_int("curve is nonsingular", 0, ec_is_singular(&f, &EC_CURVE));
    check_nonzero("G on curve", ec_on_curve(&f, &EC_CURVE, &EC_G));
    check_nonzero("R on curve", ec_on_curve(&f, &EC_CURVE, &EC_R));

    ec_affine g2 = ec_dbl(&f, &EC_CURVE, &EC_G);
    check_values("2G", {295599, 295897}, {g2.x, g2.y});
    ec_affine g3 = ec_add(&f, &EC_CURVE, &g2, &EC_G);
    check_values("3G", {162412, 445124}, {g3.x, g3.y});
    ec_affine g32 = ec_scalarmult(&f, &EC_CURVE, 32, &EC_G);
    check_values("32G is 2-torsion", {28672, 0}, {g32.x, g32.y});
    ec_affine g64 = ec_scalarmult(&f, &EC_CURVE, 64, &EC_G);
    check_nonzero("64G = O", g64.infinity);
    ec_affine neg = ec_neg(&f, &EC_G);
    ec_affine zero = ec_add(&f, &EC_CURVE, &EC_G, &neg);
    check_nonzero("G + (-G) = O", zero.infinity);

    ec_isogeny iso;
    check_int("velu on (28672, 0)", ECFFT_OK, ec_velu_2isogeny(&iso, &f, &EC_CURVE, 28672));
    check_values("codomain (a', b')", {330560, 42322}, {iso.codomain.a, iso.codomain.b});
    check_values("psi numerator", {356523, 971331, 1}, {iso.psi.num[0], iso.psi.num[1], iso.psi.num[2]});
    check_values("psi denominator", {971331, 1}, {iso.psi.den[0], iso.psi.den[1]});

    ec_affine img = ec_isogeny_map(&f, &iso, &EC_G);
    check_values("phi(G)", {748417, 55410}, {img.x, img.y});
    check_nonzero("phi(G) on codomain", ec_on_curve(&f, &iso.codomain, &img));
    ec_affine kimg = ec_isogeny_map(&f, &iso, &g32);
    check_nonzero("phi(kernel) = O", kimg.infinity);

    check_int(
        "velu rejects a non-root", ECFFT_ERR_INVALID_CURVE, ec_velu_2isogeny(&iso, &f, &EC_CURVE, EC_G.x));

    std::vector<gf_ratmap> chain;
    check_int("derive chain k=6", ECFFT_OK, ec_derive_isogeny_chain(&chain, &f, &EC_CURVE, &EC_G, EC_K));
    check_u64("chain length", EC_K, chain.size());
    check_values("chain[1] numerator", {102107, 840028, 1}, {chain[1].num[0], chain[1].num[1], chain[1].num[2]});
    check_values("chain[1] denominator", {840028, 1}, {chain[1].den[0], chain[1].den[1]});

    check_int(
        "derive chain rejects order 64 for k=5",
        ECFFT_ERR_INVALID_CURVE,
        ec_derive_isogeny_chain(&chain, &f, &EC_CURVE, &EC_G, 5));
    check_int(
        "derive chain rejects order 64 for k=7",
        ECFFT_ERR_INVALID_CURVE,
        ec_derive_isogeny_chain(&chain, &f, &EC_CURVE, &EC_G, 7));
    ec_affine off = ec_point(EC_G.x, EC_G.y + 1);
    check_int(
        "derive chain rejects off-curve G",
        ECFFT_ERR_INVALID_CURVE,
        ec_derive_isogeny_chain(&chain, &f, &EC_CURVE, &off, EC_K));
    check_u64("failed derive leaves chain empty", 0, chain.size());
}

static void test_classic_small()
{
    std::cout << std::endl << "=== Classic tree, p = 17 ===" << std::endl;

    fftree t;
    check_int("build_classic_with_root(17, 2, 4)", ECFFT_OK, fftree_build_classic_with_root(&t, 17, 2, 4));
    check_values("layer 0", {1, 4, 16, 13}, t.layers[0]);
    check_values("layer 1", {1, 16}, t.layers[1]);
    check_values("layer 2", {1}, t.layers[2]);
    check_nonzero("invariants hold", fftree_check_invariants(&t));
    check_int("mode is classic", FFTREE_MODE_CLASSIC, t.mode);

    const std::vector<gf_fe> coeffs = {1, 2, 3, 4};
    std::vector<gf_fe> values(4), back(4);
    check_int("evaluate", ECFFT_OK, fftree_evaluate(&t, values.data(), coeffs.data(), coeffs.size()));
    check_values("evaluate 1 + 2x + 3x^2 + 4x^3", {10, 7, 15, 6}, values);
    check_int("interpolate", ECFFT_OK, fftree_interpolate(&t, back.data(), values.data()));
    check_values("interpolate recovers coefficients", coeffs, back);

    std::vector<gf_fe> ec_values(4);
    check_int(
        "ecfft engine on classic tree", ECFFT_OK, fftree_evaluate_ecfft(&t, ec_values.data(), coeffs.data(), 4));
    check_values("ecfft engine agrees", values, ec_values);

    gf_poly a, b, r;
    a.coeffs = {1, 1};
    b.coeffs = {1, 16};
    check_int("multiply (1 + x)(1 - x)", ECFFT_OK, gf_poly_mul_fftree(&r, &a, &b, &t));
    check_values("product is 1 - x^2", {1, 0, 16}, r.coeffs);

    gf_poly z;
    check_int("multiply by zero", ECFFT_OK, gf_poly_mul_fftree(&r, &a, &z, &t));
    check_u64("zero product", 0, r.coeffs.size());

    a.coeffs = {1, 1, 1};
    b.coeffs = {1, 1, 1};
    check_int(
        "deg 2 * deg 2 on 4 points",
        ECFFT_ERR_INSUFFICIENT_DOMAIN_SIZE,
        gf_poly_mul_fftree(&r, &a, &b, &t));

    const std::vector<gf_fe> too_long = {1, 2, 3, 4, 5};
    check_int(
        "evaluate degree 4 on 4 points",
        ECFFT_ERR_INSUFFICIENT_DOMAIN_SIZE,
        fftree_evaluate(&t, values.data(), too_long.data(), too_long.size()));
    const std::vector<gf_fe> padded = {1, 2, 3, 4, 0, 17};
    check_int(
        "trailing zeros (mod p) beyond n are accepted",
        ECFFT_OK,
        fftree_evaluate(&t, values.data(), padded.data(), padded.size()));
    check_values("padded evaluate", {10, 7, 15, 6}, values);

    fftree d;
    check_int("build_classic(17, 2)", ECFFT_OK, fftree_build_classic(&d, 17, 2));
    check_values("default generator is 3^4 = 13", {1, 13, 16, 4}, d.layers[0]);
    check_int("build_classic(17, 4)", ECFFT_OK, fftree_build_classic(&d, 17, 4));
    check_int("build_classic(17, 5)", ECFFT_ERR_ORDER_NOT_DIVISIBLE, fftree_build_classic(&d, 17, 5));
    check_u64("failed build leaves tree empty", 0, d.n);
    check_int(
        "generator 16 has order 2", ECFFT_ERR_INVALID_GENERATOR, fftree_build_classic_with_root(&d, 17, 2, 16));
    check_int("composite modulus", ECFFT_ERR_INVALID_MODULUS, fftree_build_classic(&d, 15, 1));
    check_int("k above the limit", ECFFT_ERR_INVALID_SIZE, fftree_build_classic(&d, 97, ECFFT_MAX_LOG_SIZE + 1));
    check_int("k = 0", ECFFT_OK, fftree_build_classic(&d, 97, 0));
    check_u64("k = 0 has one point", 1, d.layers[0][0]);
    check_int("build_classic(97, 5)", ECFFT_OK, fftree_build_classic(&d, 97, 5));
    check_u64("97: generator is 5^3 = 28", 28, d.layers[0][1]);
    fftree_free(&d);
    fftree_free(&t);
}

static void test_classic_large()
{
    std::cout << std::endl << "=== Classic tree, p = 2^64 - 2^32 + 1 ===" << std::endl;

    fftree t;
    check_int("build_classic(goldilocks, 10)", ECFFT_OK, fftree_build_classic(&t, GOLDILOCKS, 10));
    check_nonzero("invariants hold", fftree_check_invariants(&t));

    const gf_ctx *f = &t.field;
    const std::vector<gf_fe> coeffs = sample_coeffs(f, t.n, 1);

    std::vector<gf_fe> values(t.n);
    check_int("evaluate", ECFFT_OK, fftree_evaluate(&t, values.data(), coeffs.data(), coeffs.size()));
    check_values("evaluate matches horner", horner_on_layer(&t, coeffs), values);

    std::vector<gf_fe> ec_values(t.n);
    check_int(
        "ecfft evaluate", ECFFT_OK, fftree_evaluate_ecfft(&t, ec_values.data(), coeffs.data(), coeffs.size()));
    check_values("ecfft evaluate matches radix-2", values, ec_values);

    std::vector<gf_fe> back(t.n);
    check_int("interpolate", ECFFT_OK, fftree_interpolate(&t, back.data(), values.data()));
    check_values("round trip", coeffs, back);
    check_int("ecfft interpolate", ECFFT_OK, fftree_interpolate_ecfft(&t, back.data(), values.data()));
    check_values("ecfft round trip", coeffs, back);

    gf_poly a, b, r, expect;
    a.coeffs = sample_coeffs(f, 400, 2);
    b.coeffs = sample_coeffs(f, 500, 3);
    check_int("multiply deg 399 * deg 499", ECFFT_OK, gf_poly_mul_fftree(&r, &a, &b, &t));
    gf_poly_mul_schoolbook(f, &expect, &a, &b);
    check_values("product matches schoolbook", expect.coeffs, r.coeffs);
    gf_poly_mul(f, &expect, &a, &b);
    check_values("karatsuba matches tree product", expect.coeffs, r.coeffs);

    fftree_free(&t);
}

static void test_ec_tree()
{
    std::cout << std::endl << "=== EC tree, p = 1000003 ===" << std::endl;

    gf_ctx f;
    gf_ctx_init(&f, EC_P);

    fftree t;
    check_int("classic build fails (2-adicity 1)", ECFFT_ERR_ORDER_NOT_DIVISIBLE, fftree_build_classic(&t, EC_P, EC_K));

    std::vector<gf_ratmap> chain;
    ec_derive_isogeny_chain(&chain, &f, &EC_CURVE, &EC_G, EC_K);
    check_int(
        "build_ec",
        ECFFT_OK,
        fftree_build_ec(&t, EC_P, &EC_CURVE, &EC_G, &EC_R, EC_K, chain.data(), chain.size()));
    check_int("mode is EC", FFTREE_MODE_EC, t.mode);
    check_nonzero("invariants hold", fftree_check_invariants(&t));
    check_u64("layer 0 starts at x(R)", EC_R.x, t.layers[0][0]);
    check_values(
        "layer 1 prefix",
        {918338, 875538, 635180, 264518},
        std::vector<gf_fe>(t.layers[1].begin(), t.layers[1].begin() + 4));
    check_values("layer 6", {993180}, t.layers[6]);
    check_int("no zero in domain: pivot 0", 0, t.views[0].pivot);

    const std::vector<gf_fe> coeffs = sample_coeffs(&f, t.n, 4);
    std::vector<gf_fe> values(t.n), back(t.n);
    check_int("evaluate", ECFFT_OK, fftree_evaluate(&t, values.data(), coeffs.data(), coeffs.size()));
    check_values("evaluate matches horner", horner_on_layer(&t, coeffs), values);
    check_int("interpolate", ECFFT_OK, fftree_interpolate(&t, back.data(), values.data()));
    check_values("round trip", coeffs, back);

    const std::vector<gf_fe> short_coeffs = {5, 0, 7};
    check_int("evaluate short", ECFFT_OK, fftree_evaluate(&t, values.data(), short_coeffs.data(), 3));
    check_values("short input is zero padded", horner_on_layer(&t, short_coeffs), values);

    check_int(
        "radix-2 path refuses an EC tree",
        ECFFT_ERR_NOT_CLASSIC,
        fftree_evaluate_classic(&t, values.data(), coeffs.data(), coeffs.size()));

    gf_poly a, b, r, expect;
    a.coeffs = sample_coeffs(&f, 21, 5);
    b.coeffs = sample_coeffs(&f, 44, 6);
    check_int("multiply deg 20 * deg 43", ECFFT_OK, gf_poly_mul_fftree(&r, &a, &b, &t));
    gf_poly_mul_schoolbook(&f, &expect, &a, &b);
    check_values("product matches schoolbook", expect.coeffs, r.coeffs);

    a.coeffs = sample_coeffs(&f, 33, 7);
    b.coeffs = sample_coeffs(&f, 33, 8);
    check_int("deg 32 * deg 32 on 64 points", ECFFT_ERR_INSUFFICIENT_DOMAIN_SIZE, gf_poly_mul_fftree(&r, &a, &b, &t));

    /* low-degree extension */
    const std::vector<gf_fe> q = sample_coeffs(&f, t.n / 2, 9);
    const std::vector<gf_fe> full = horner_on_layer(&t, q);
    std::vector<gf_fe> even(t.n / 2), odd_expect(t.n / 2), odd(t.n / 2);
    for (size_t i = 0; i < t.n / 2; i++)
    {
        even[i] = full[2 * i];
        odd_expect[i] = full[2 * i + 1];
    }
    check_int("extend", ECFFT_OK, fftree_extend(&t, odd.data(), even.data()));
    check_values("extend matches horner", odd_expect, odd);

    /* chain and coset errors */
    fftree bad;
    check_int(
        "truncated chain",
        ECFFT_ERR_INVALID_ISOGENY_CHAIN,
        fftree_build_ec(&bad, EC_P, &EC_CURVE, &EC_G, &EC_R, EC_K, chain.data(), chain.size() - 1));
    std::vector<gf_ratmap> corrupt = chain;
    corrupt[2].num[0] = gf_add(&f, corrupt[2].num[0], 1);
    check_int(
        "corrupted chain",
        ECFFT_ERR_INVALID_ISOGENY_CHAIN,
        fftree_build_ec(&bad, EC_P, &EC_CURVE, &EC_G, &EC_R, EC_K, corrupt.data(), corrupt.size()));
    check_u64("failed build leaves tree empty", 0, bad.layers.size());
    std::vector<gf_ratmap> squares(EC_K, gf_ratmap_square());
    check_int(
        "squaring chain on a curve coset",
        ECFFT_ERR_INVALID_ISOGENY_CHAIN,
        fftree_build_ec(&bad, EC_P, &EC_CURVE, &EC_G, &EC_R, EC_K, squares.data(), squares.size()));
    ec_affine off = ec_point(EC_R.x, EC_R.y + 1);
    check_int(
        "R off the curve",
        ECFFT_ERR_INVALID_CURVE,
        fftree_build_ec(&bad, EC_P, &EC_CURVE, &EC_G, &off, EC_K, chain.data(), chain.size()));
    check_int(
        "coset through infinity (R = G)",
        ECFFT_ERR_INVALID_CURVE,
        fftree_build_ec(&bad, EC_P, &EC_CURVE, &EC_G, &EC_G, EC_K, chain.data(), chain.size()));
    const ec_curve singular = {0, 0};
    check_int(
        "singular curve",
        ECFFT_ERR_INVALID_CURVE,
        fftree_build_ec(&bad, EC_P, &singular, &EC_G, &EC_R, EC_K, chain.data(), chain.size()));

    /* the same tree from its raw domain */
    fftree from;
    check_int(
        "build_from_domain",
        ECFFT_OK,
        fftree_build_from_domain(&from, EC_P, t.layers[0].data(), EC_K, chain.data(), chain.size()));
    check_values("same top layer", t.layers[EC_K], from.layers[EC_K]);

    std::vector<gf_fe> raw = t.layers[0];
    raw[5] = raw[2];
    check_int(
        "repeated domain point",
        ECFFT_ERR_INVALID_DOMAIN,
        fftree_build_from_domain(&bad, EC_P, raw.data(), EC_K, chain.data(), chain.size()));
    raw[5] = EC_P;
    check_int(
        "domain point not below p",
        ECFFT_ERR_INVALID_DOMAIN,
        fftree_build_from_domain(&bad, EC_P, raw.data(), EC_K, chain.data(), chain.size()));

    /* freed and unbuilt trees are empty and rejected */
    fftree_free(&from);
    check_int("free resets the mode", FFTREE_MODE_CLASSIC, from.mode);
    check_u64("free resets the modulus", 0, from.field.p);
    std::vector<gf_fe> in(4, 1), out(4, 0);
    check_int(
        "evaluate on a freed tree",
        ECFFT_ERR_SINGULAR_SYSTEM,
        fftree_evaluate(&from, out.data(), in.data(), in.size()));

    fftree empty;
    check_u64("unbuilt tree has no points", 0, empty.n);
    check_u64("unbuilt tree has no layers", 0, empty.log_n);
    check_int(
        "evaluate on an unbuilt tree",
        ECFFT_ERR_SINGULAR_SYSTEM,
        fftree_evaluate(&empty, out.data(), in.data(), in.size()));
    check_int(
        "interpolate on an unbuilt tree", ECFFT_ERR_SINGULAR_SYSTEM, fftree_interpolate(&empty, out.data(), in.data()));

    fftree_free(&t);
}

/* x = 0 in the domain forces the REDC pivot onto the odd half */
static void test_zero_in_domain()
{
    std::cout << std::endl << "=== EC tree with x = 0 in the domain ===" << std::endl;

    struct coset
    {
        const char *name;
        ec_curve curve;
        ec_affine g;
        ec_affine r;
        size_t zero_at;
    };
    const coset cosets[] = {
        {"zero at position 0", {1542, 5991}, {6685, 8703, 0}, {0, 7432, 0}, 0},
        {"zero at position 2", {9570, 5989}, {8965, 7230, 0}, {5962, 9208, 0}, 2},
    };

    for (const auto &c : cosets)
    {
        std::cout << "  -- " << c.name << std::endl;
        gf_ctx f;
        gf_ctx_init(&f, 10007);

        std::vector<gf_ratmap> chain;
        check_int("derive chain", ECFFT_OK, ec_derive_isogeny_chain(&chain, &f, &c.curve, &c.g, 4));

        fftree t;
        check_int("build_ec", ECFFT_OK, fftree_build_ec(&t, 10007, &c.curve, &c.g, &c.r, 4, chain.data(), 4));
        check_u64("domain holds 0", 0, t.layers[0][c.zero_at]);
        check_int("pivot is the odd half", 1, t.views[0].pivot);

        for (uint64_t salt = 10; salt < 13; salt++)
        {
            const std::vector<gf_fe> coeffs = sample_coeffs(&f, t.n, salt);
            std::vector<gf_fe> values(t.n), back(t.n);
            fftree_evaluate(&t, values.data(), coeffs.data(), coeffs.size());
            check_values("evaluate matches horner", horner_on_layer(&t, coeffs), values);
            check_int("interpolate", ECFFT_OK, fftree_interpolate(&t, back.data(), values.data()));
            check_values("round trip", coeffs, back);
        }

        fftree_free(&t);
    }
}

static void test_cpp_api()
{
    std::cout << std::endl << "=== C++ API ===" << std::endl;

    DomainError derr = DomainError::InvalidSize;
    ComputeError cerr = ComputeError::SingularSystem;

    auto tree = FFTree::build_classic(17, 2, 4, &derr);
    check_nonzero("FFTree::build_classic(17, 2, 4)", tree.has_value());
    if (!tree)
        return;
    check_u64("size", 4, tree->size());
    check_u64("log_size", 2, tree->log_size());
    check_nonzero("is_classic", tree->is_classic());
    check_values("layer(0)", {1, 4, 16, 13}, tree->layer(0));

    auto p = Polynomial::from_coefficients(17, {1, 2, 3, 4});
    auto values = tree->evaluate(*p, &cerr);
    check_nonzero("evaluate", values.has_value());
    if (values)
    {
        check_values("evaluate values", {10, 7, 15, 6}, *values);
        auto back = tree->interpolate(*values, &cerr);
        check_nonzero("interpolate returns the polynomial", back.has_value() && *back == *p);
    }

    auto a = Polynomial::from_coefficients(17, {1, 1});
    auto b = Polynomial::from_coefficients(17, {1, 16});
    auto prod = tree->multiply(*a, *b, &cerr);
    check_nonzero("multiply", prod.has_value());
    if (prod)
    {
        check_values("multiply coefficients", {1, 0, 16}, prod->coefficients());
        check_u64("degree", 2, (uint64_t)prod->degree());
        check_nonzero("matches operator*", *prod == *a * *b);
        check_u64("evaluate at 4", 2, prod->evaluate(4));
    }

    auto sum = *a + *b;
    check_values("(1 + x) + (1 - x)", {2}, sum.coefficients());
    auto diff = *a - *a;
    check_nonzero("p - p is zero", diff.is_zero());
    check_int("degree of zero", -1, (int)diff.degree());
    check_values("scale by 3", {3, 3}, a->scale(3).coefficients());

    std::ostringstream oss;
    oss << *a;
    check_nonzero("operator<<", oss.str() == "Polynomial(p=17, deg=1) [1, 1]");

    auto cube = Polynomial::from_coefficients(17, {1, 1, 1});
    check_nonzero("multiply too large fails", !tree->multiply(*cube, *cube, &cerr));
    check_nonzero("error is InsufficientDomainSize", cerr == ComputeError::InsufficientDomainSize);

    check_nonzero("interpolate wrong length fails", !tree->interpolate({1, 2, 3}, &cerr));
    check_nonzero("error is LengthMismatch", cerr == ComputeError::LengthMismatch);

    check_nonzero("extend wrong length fails", !tree->extend({1}, &cerr));
    check_nonzero("error is LengthMismatch (extend)", cerr == ComputeError::LengthMismatch);

    auto other = Polynomial::from_coefficients(97, {1, 2});
    check_nonzero("evaluate over another field fails", !tree->evaluate(*other, &cerr));
    check_nonzero("error is FieldMismatch", cerr == ComputeError::FieldMismatch);
    check_nonzero("mixed-field sum is unbound", (*a + *other).modulus() == 0);

    check_nonzero("from_coefficients(15) fails", !Polynomial::from_coefficients(15, {1}));

    check_nonzero("build_classic(17, 5) fails", !FFTree::build_classic(17, 5, &derr));
    check_nonzero("error is OrderNotDivisible", derr == DomainError::OrderNotDivisible);
    check_nonzero("build_classic(17, 2, 16) fails", !FFTree::build_classic(17, 2, 16, &derr));
    check_nonzero("error is InvalidGenerator", derr == DomainError::InvalidGenerator);
    check_nonzero("from_domain of 3 points fails", !FFTree::from_domain(17, {1, 2, 3}, {}, &derr));
    check_nonzero("error is InvalidSize", derr == DomainError::InvalidSize);
    const std::vector<gf_ratmap> squares(2, gf_ratmap_square());
    check_nonzero("from_domain with a repeated point fails", !FFTree::from_domain(17, {1, 1, 4, 13}, squares, &derr));
    check_nonzero("error is InvalidDomain", derr == DomainError::InvalidDomain);
    check_nonzero(
        "from_domain over classic points", FFTree::from_domain(17, {1, 4, 16, 13}, squares, &derr).has_value());

    auto ec = FFTree::build_ec(EC_P, EC_CURVE, EC_G, EC_R, EC_K, &derr);
    check_nonzero("FFTree::build_ec with derived chain", ec.has_value());
    if (ec)
    {
        check_nonzero("not classic", !ec->is_classic());
        check_u64("map(0) pole", 971331, ec->map(0).den[0]);

        auto chain = FFTree::derive_isogeny_chain(EC_P, EC_CURVE, EC_G, EC_K, &derr);
        check_nonzero("derive_isogeny_chain", chain.has_value() && chain->size() == EC_K);
        if (chain)
        {
            chain->pop_back();
            check_nonzero("short chain fails", !FFTree::build_ec(EC_P, EC_CURVE, EC_G, EC_R, EC_K, *chain, &derr));
            check_nonzero("error is InvalidIsogenyChain", derr == DomainError::InvalidIsogenyChain);
        }

        FFTree shared = *ec;
        auto x = Polynomial::from_coefficients(EC_P, {3, 0, 0, 1});
        auto y = Polynomial::from_coefficients(EC_P, {EC_P - 1, 5});
        auto xy = shared.multiply(*x, *y, &cerr);
        check_nonzero("copies share the tree", xy.has_value() && *xy == *x * *y);

        auto q = Polynomial::from_coefficients(EC_P, {7, 11, 13});
        auto q_values = ec->evaluate(*q);
        if (q_values)
        {
            std::vector<uint64_t> even(ec->size() / 2);
            for (size_t i = 0; i < even.size(); i++)
                even[i] = (*q_values)[2 * i];
            auto odd = ec->extend(even, &cerr);
            bool ok = odd.has_value();
            for (size_t i = 0; ok && i < even.size(); i++)
                ok = (*odd)[i] == (*q_values)[2 * i + 1];
            check_nonzero("extend", ok);
        }
    }

    std::ostringstream eoss;
    eoss << DomainError::InvalidCurve << " " << ComputeError::SingularSystem;
    check_nonzero("error streaming", eoss.str() == "DomainError(InvalidCurve) ComputeError(SingularSystem)");
    check_nonzero(
        "status mapping", domain_error_from_status(ECFFT_ERR_INVALID_MODULUS) == DomainError::InvalidModulus);
    check_nonzero(
        "status mapping (domain)", domain_error_from_status(ECFFT_ERR_INVALID_DOMAIN) == DomainError::InvalidDomain);
    std::ostringstream doss;
    doss << DomainError::InvalidDomain;
    check_nonzero("InvalidDomain streaming", doss.str() == "DomainError(InvalidDomain)");
    check_nonzero(
        "status mapping (compute)", compute_error_from_status(ECFFT_ERR_NOT_CLASSIC) == ComputeError::UnsupportedTree);
}

static void test_config()
{
    std::cout << std::endl << "=== Configuration ===" << std::endl;

    check_u64("default threshold", ECFFT_DEFAULT_PARALLEL_THRESHOLD, ecfft_get_parallel_threshold());
    ecfft_set_parallel_threshold(0);
    check_u64("threshold clamps to 2", 2, ecfft_get_parallel_threshold());

    /* forking at every level must not change results */
    fftree t;
    fftree_build_classic(&t, GOLDILOCKS, 8);
    const std::vector<gf_fe> coeffs = sample_coeffs(&t.field, t.n, 20);
    std::vector<gf_fe> values(t.n);
    fftree_evaluate_ecfft(&t, values.data(), coeffs.data(), coeffs.size());
    check_values("threshold 2: ecfft evaluate", horner_on_layer(&t, coeffs), values);

    ecfft_set_parallel_threshold(ECFFT_DEFAULT_PARALLEL_THRESHOLD);
    ecfft_set_num_threads(-3);
    check_int("negative thread count means default", 0, ecfft_get_num_threads());
    std::cout << "  multicore: " << (ecfft_have_multicore() ? "yes" : "no") << std::endl;
    fftree_free(&t);
}

int main()
{
    std::cout << "ECFFT Unit Tests" << std::endl;
    std::cout << "================" << std::endl;

    test_field();
    test_curve();
    test_classic_small();
    test_classic_large();
    test_ec_tree();
    test_zero_in_domain();
    test_cpp_api();
    test_config();

    std::cout << std::endl << "================" << std::endl;
    std::cout << "Total:  " << tests_run << std::endl;
    std::cout << "Passed: " << tests_passed << std::endl;
    std::cout << "Failed: " << tests_failed << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
