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

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace ecfft;

/* ======================================================================
 * Test framework
 * ====================================================================== */

static int tests_run = 0;
static int tests_passed = 0;
static int tests_failed = 0;
static bool quiet_mode = false;
static uint64_t global_seed = 0ULL;

static bool check_true(const std::string &test_name, bool condition)
{
    ++tests_run;
    if (condition)
    {
        ++tests_passed;
        if (!quiet_mode)
            std::cout << "  PASS: " << test_name << std::endl;
        return true;
    }
    else
    {
        ++tests_failed;
        std::cout << "  FAIL: " << test_name << std::endl;
        return false;
    }
}

/* ======================================================================
 * PRNG: xoshiro256** with splitmix64 seeding
 * ====================================================================== */

struct xoshiro256ss
{
    uint64_t s[4];

    static uint64_t splitmix64(uint64_t &state)
    {
        uint64_t z = (state += 0x9e3779b97f4a7c15ULL);
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }

    void seed(uint64_t seed_val)
    {
        uint64_t sm = seed_val;
        s[0] = splitmix64(sm);
        s[1] = splitmix64(sm);
        s[2] = splitmix64(sm);
        s[3] = splitmix64(sm);
    }

    static uint64_t rotl(uint64_t x, int k)
    {
        return (x << k) | (x >> (64 - k));
    }

    uint64_t next()
    {
        const uint64_t result = rotl(s[1] * 5, 7) * 9;
        const uint64_t t = s[1] << 17;
        s[2] ^= s[0];
        s[3] ^= s[1];
        s[1] ^= s[2];
        s[0] ^= s[3];
        s[2] ^= t;
        s[3] = rotl(s[3], 45);
        return result;
    }

    /* uniform enough for test sizes: bound is tiny next to 2^64 */
    uint64_t below(uint64_t bound)
    {
        return next() % bound;
    }
};

/* ======================================================================
 * Fixtures
 * ====================================================================== */

/* Primes with 2-adicity at least 10 */
static const uint64_t CLASSIC_PRIMES[] = {
    7681ULL, /* 2^9 * 15 + 1 */
    65537ULL,
    998244353ULL, /* 119 * 2^23 + 1 */
    0xffffffff00000001ULL,
};

struct ec_fixture
{
    uint64_t p;
    ec_curve curve;
    ec_affine g;
    ec_affine r;
    size_t k;
};

/* Curve cosets over primes whose p - 1 has 2-adicity 1 */
static const ec_fixture EC_FIXTURES[] = {
    {1000003ULL, {113169, 419849}, {849588, 191504, 0}, {223872, 116380, 0}, 6},
    {10007ULL, {1542, 5991}, {6685, 8703, 0}, {0, 7432, 0}, 4},
    {10007ULL, {9570, 5989}, {8965, 7230, 0}, {5962, 9208, 0}, 4},
    {2147483647ULL, {1497169719, 181085937}, {2048927227, 636545237, 0}, {526963369, 1534385634, 0}, 10},
};

static const size_t NUM_EC_FIXTURES = sizeof(EC_FIXTURES) / sizeof(EC_FIXTURES[0]);

static std::vector<gf_fe> random_coeffs(xoshiro256ss &rng, const gf_ctx *f, size_t n)
{
    std::vector<gf_fe> v(n);
    for (size_t i = 0; i < n; i++)
        v[i] = gf_from_u64(f, rng.next());
    return v;
}

static bool build_ec_fixture(fftree *t, const ec_fixture &fx)
{
    gf_ctx f;
    if (gf_ctx_init(&f, fx.p) != ECFFT_OK)
        return false;
    std::vector<gf_ratmap> chain;
    if (ec_derive_isogeny_chain(&chain, &f, &fx.curve, &fx.g, fx.k) != ECFFT_OK)
        return false;
    return fftree_build_ec(t, fx.p, &fx.curve, &fx.g, &fx.r, fx.k, chain.data(), chain.size()) == ECFFT_OK;
}

static bool build_classic_random(fftree *t, xoshiro256ss &rng)
{
    const uint64_t p = CLASSIC_PRIMES[rng.below(sizeof(CLASSIC_PRIMES) / sizeof(CLASSIC_PRIMES[0]))];
    const size_t k = 1 + rng.below(9);
    return fftree_build_classic(t, p, k) == ECFFT_OK;
}

static std::vector<gf_fe> horner_on_layer(const fftree *t, const std::vector<gf_fe> &coeffs)
{
    gf_poly p;
    p.coeffs = coeffs;
    std::vector<gf_fe> out(t->n);
    gf_poly_eval_points(&t->field, out.data(), &p, t->layers[0].data(), t->n);
    return out;
}

/* ======================================================================
 * 1. Evaluate / interpolate round trip
 * ====================================================================== */

static void fuzz_roundtrip()
{
    std::cout << std::endl << "=== Fuzz: evaluate / interpolate round trip ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 1);

    for (int trial = 0; trial < 40; trial++)
    {
        std::string label = "classic_rt[" + std::to_string(trial) + "]";
        fftree t;
        if (!check_true(label + " build", build_classic_random(&t, rng)))
            continue;

        std::vector<gf_fe> coeffs = random_coeffs(rng, &t.field, t.n);
        std::vector<gf_fe> values(t.n), back(t.n);
        fftree_evaluate(&t, values.data(), coeffs.data(), coeffs.size());
        fftree_interpolate(&t, back.data(), values.data());
        check_true(label, back == coeffs);
    }

    for (int trial = 0; trial < 40; trial++)
    {
        const ec_fixture &fx = EC_FIXTURES[trial % NUM_EC_FIXTURES];
        std::string label = "ec_rt[" + std::to_string(trial) + "] p=" + std::to_string(fx.p);
        fftree t;
        if (!check_true(label + " build", build_ec_fixture(&t, fx)))
            continue;

        std::vector<gf_fe> coeffs = random_coeffs(rng, &t.field, t.n);
        std::vector<gf_fe> values(t.n), back(t.n);
        fftree_evaluate(&t, values.data(), coeffs.data(), coeffs.size());
        check_true(label + " horner", values == horner_on_layer(&t, coeffs));
        fftree_interpolate(&t, back.data(), values.data());
        check_true(label, back == coeffs);
    }
}

/* ======================================================================
 * 2. Linearity: eval(s*a + b) = s*eval(a) + eval(b)
 * ====================================================================== */

static void fuzz_linearity()
{
    std::cout << std::endl << "=== Fuzz: linearity ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 2);

    for (int trial = 0; trial < 24; trial++)
    {
        const ec_fixture &fx = EC_FIXTURES[trial % NUM_EC_FIXTURES];
        std::string label = "linear[" + std::to_string(trial) + "]";
        fftree t;
        if (!build_ec_fixture(&t, fx))
            continue;
        const gf_ctx *f = &t.field;

        std::vector<gf_fe> a = random_coeffs(rng, f, t.n);
        std::vector<gf_fe> b = random_coeffs(rng, f, t.n);
        const gf_fe s = gf_from_u64(f, rng.next());
        std::vector<gf_fe> c(t.n);
        for (size_t i = 0; i < t.n; i++)
            c[i] = gf_muladd(f, s, a[i], b[i]);

        std::vector<gf_fe> va(t.n), vb(t.n), vc(t.n);
        fftree_evaluate(&t, va.data(), a.data(), t.n);
        fftree_evaluate(&t, vb.data(), b.data(), t.n);
        fftree_evaluate(&t, vc.data(), c.data(), t.n);

        bool ok = true;
        for (size_t i = 0; i < t.n; i++)
            if (vc[i] != gf_muladd(f, s, va[i], vb[i]))
                ok = false;
        check_true(label, ok);
    }
}

/* ======================================================================
 * 3. Tree multiplication against the schoolbook reference
 * ====================================================================== */

static void fuzz_multiply()
{
    std::cout << std::endl << "=== Fuzz: tree multiplication ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 3);

    for (int trial = 0; trial < 60; trial++)
    {
        fftree t;
        bool built;
        if (trial % 2 == 0)
            built = build_classic_random(&t, rng);
        else
            built = build_ec_fixture(&t, EC_FIXTURES[(trial / 2) % NUM_EC_FIXTURES]);
        if (!built)
            continue;

        std::string label = std::string(t.mode == FFTREE_MODE_CLASSIC ? "classic" : "ec") + "_mul["
                            + std::to_string(trial) + "] n=" + std::to_string(t.n);

        /* deg a + deg b <= n - 1 */
        const size_t da = rng.below(t.n);
        const size_t db = rng.below(t.n - da);
        gf_poly a, b, r, expect;
        a.coeffs = random_coeffs(rng, &t.field, da + 1);
        b.coeffs = random_coeffs(rng, &t.field, db + 1);

        const int rc = gf_poly_mul_fftree(&r, &a, &b, &t);
        gf_poly_strip(&a);
        gf_poly_strip(&b);
        gf_poly_mul_schoolbook(&t.field, &expect, &a, &b);
        check_true(label, rc == ECFFT_OK && r.coeffs == expect.coeffs);

        /* one past the bound must be refused */
        gf_poly big_a, big_b;
        big_a.coeffs = random_coeffs(rng, &t.field, t.n / 2 + 1);
        big_b.coeffs = random_coeffs(rng, &t.field, t.n / 2 + 1);
        big_a.coeffs.back() = 1;
        big_b.coeffs.back() = 1;
        check_true(
            label + " bound",
            gf_poly_mul_fftree(&r, &big_a, &big_b, &t) == ECFFT_ERR_INSUFFICIENT_DOMAIN_SIZE);
    }
}

/* ======================================================================
 * 4. Low-degree extension
 * ====================================================================== */

static void fuzz_extend()
{
    std::cout << std::endl << "=== Fuzz: extend ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 4);

    for (int trial = 0; trial < 24; trial++)
    {
        fftree t;
        bool built;
        if (trial % 3 == 0)
            built = build_classic_random(&t, rng);
        else
            built = build_ec_fixture(&t, EC_FIXTURES[trial % NUM_EC_FIXTURES]);
        if (!built)
            continue;

        std::string label = "extend[" + std::to_string(trial) + "] n=" + std::to_string(t.n);
        const size_t half = t.n / 2;
        const std::vector<gf_fe> q = random_coeffs(rng, &t.field, half);
        const std::vector<gf_fe> full = horner_on_layer(&t, q);

        std::vector<gf_fe> even(half), odd(half);
        for (size_t i = 0; i < half; i++)
            even[i] = full[2 * i];
        fftree_extend(&t, odd.data(), even.data());

        bool ok = true;
        for (size_t i = 0; i < half; i++)
            if (odd[i] != full[2 * i + 1])
                ok = false;
        check_true(label, ok);
    }
}

/* ======================================================================
 * 5. Engines agree on classic trees
 * ====================================================================== */

static void fuzz_engines_agree()
{
    std::cout << std::endl << "=== Fuzz: radix-2 vs ECFFT engine ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 5);

    for (int trial = 0; trial < 20; trial++)
    {
        std::string label = "engines[" + std::to_string(trial) + "]";
        fftree t;
        if (!build_classic_random(&t, rng))
            continue;

        std::vector<gf_fe> coeffs = random_coeffs(rng, &t.field, t.n);
        std::vector<gf_fe> v_classic(t.n), v_ecfft(t.n), c_ecfft(t.n);
        fftree_evaluate_classic(&t, v_classic.data(), coeffs.data(), t.n);
        fftree_evaluate_ecfft(&t, v_ecfft.data(), coeffs.data(), t.n);
        check_true(label + " evaluate", v_classic == v_ecfft);
        fftree_interpolate_ecfft(&t, c_ecfft.data(), v_classic.data());
        check_true(label + " interpolate", c_ecfft == coeffs);
    }
}

/* ======================================================================
 * 6. Results do not depend on the parallel threshold
 * ====================================================================== */

static void fuzz_thresholds()
{
    std::cout << std::endl << "=== Fuzz: parallel threshold ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 6);

    fftree t;
    if (!check_true("build 1024-point EC tree", build_ec_fixture(&t, EC_FIXTURES[NUM_EC_FIXTURES - 1])))
        return;

    const std::vector<gf_fe> coeffs = random_coeffs(rng, &t.field, t.n);
    std::vector<gf_fe> ref(t.n);
    ecfft_set_parallel_threshold(ECFFT_DEFAULT_PARALLEL_THRESHOLD);
    fftree_evaluate(&t, ref.data(), coeffs.data(), t.n);

    const size_t thresholds[] = {2, 8, 64, 512, size_t(1) << 20};
    for (size_t th : thresholds)
    {
        ecfft_set_parallel_threshold(th);
        std::vector<gf_fe> values(t.n), back(t.n);
        fftree_evaluate(&t, values.data(), coeffs.data(), t.n);
        fftree_interpolate(&t, back.data(), values.data());
        check_true("threshold " + std::to_string(th), values == ref && back == coeffs);
    }
    ecfft_set_parallel_threshold(ECFFT_DEFAULT_PARALLEL_THRESHOLD);
}

/* ======================================================================
 * 7. Coefficient-space multiplication
 * ====================================================================== */

static void fuzz_karatsuba()
{
    std::cout << std::endl << "=== Fuzz: Karatsuba vs schoolbook ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 7);

    gf_ctx f;
    gf_ctx_init(&f, 0xffffffff00000001ULL);

    for (int trial = 0; trial < 30; trial++)
    {
        std::string label = "karatsuba[" + std::to_string(trial) + "]";
        gf_poly a, b, r, expect;
        a.coeffs = random_coeffs(rng, &f, 1 + rng.below(200));
        b.coeffs = random_coeffs(rng, &f, 1 + rng.below(200));
        gf_poly_strip(&a);
        gf_poly_strip(&b);
        gf_poly_mul(&f, &r, &a, &b);
        gf_poly_mul_schoolbook(&f, &expect, &a, &b);
        check_true(label, r.coeffs == expect.coeffs);
    }
}

/* ======================================================================
 * 8. Corrupted chains are rejected
 * ====================================================================== */

static void fuzz_corrupt_chain()
{
    std::cout << std::endl << "=== Fuzz: corrupted isogeny chains ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 8);

    /* Adding delta to num[0] shifts psi by delta / (x - x0), and adding it to num[1] by
     * delta + delta * x0 / (x - x0). Neither keeps a fiber pair's images equal unless
     * x0 = 0, which no kernel of this chain has. */
    const ec_fixture &fx = EC_FIXTURES[NUM_EC_FIXTURES - 1];
    gf_ctx f;
    gf_ctx_init(&f, fx.p);
    std::vector<gf_ratmap> chain;
    ec_derive_isogeny_chain(&chain, &f, &fx.curve, &fx.g, fx.k);

    for (int trial = 0; trial < 30; trial++)
    {
        std::string label = "corrupt[" + std::to_string(trial) + "]";
        std::vector<gf_ratmap> bad = chain;
        gf_ratmap &m = bad[rng.below(fx.k)];
        const gf_fe delta = 1 + rng.below(fx.p - 1);
        if (rng.below(2) == 0)
            m.num[0] = gf_add(&f, m.num[0], delta);
        else
            m.num[1] = gf_add(&f, m.num[1], delta);

        fftree t;
        const int rc = fftree_build_ec(&t, fx.p, &fx.curve, &fx.g, &fx.r, fx.k, bad.data(), bad.size());
        check_true(label, rc == ECFFT_ERR_INVALID_ISOGENY_CHAIN && t.n == 0);
    }
}

/* ======================================================================
 * 9. C++ API over random inputs
 * ====================================================================== */

static void fuzz_cpp_api()
{
    std::cout << std::endl << "=== Fuzz: C++ API ===" << std::endl;
    xoshiro256ss rng;
    rng.seed(global_seed + 9);

    const ec_fixture &fx = EC_FIXTURES[NUM_EC_FIXTURES - 1];
    auto tree = FFTree::build_ec(fx.p, fx.curve, fx.g, fx.r, fx.k);
    if (!check_true("FFTree::build_ec", tree.has_value()))
        return;

    for (int trial = 0; trial < 10; trial++)
    {
        std::string label = "api_mul[" + std::to_string(trial) + "]";
        std::vector<uint64_t> ca(1 + rng.below(tree->size() / 2));
        std::vector<uint64_t> cb(1 + rng.below(tree->size() / 2));
        for (auto &c : ca)
            c = rng.next();
        for (auto &c : cb)
            c = rng.next();

        auto a = Polynomial::from_coefficients(fx.p, ca);
        auto b = Polynomial::from_coefficients(fx.p, cb);
        ComputeError err = ComputeError::SingularSystem;
        auto prod = tree->multiply(*a, *b, &err);
        check_true(label, prod.has_value() && *prod == *a * *b);

        const uint64_t x = rng.next();
        check_true(label + " eval", prod.has_value() && prod->evaluate(x) == gf_mul(&a->field(), a->evaluate(x), b->evaluate(x)));
    }
}

int main(int argc, char *argv[])
{
    uint64_t seed = 0ULL;

    for (int i = 1; i < argc; i++)
    {
        if (std::strcmp(argv[i], "--quiet") == 0)
        {
            quiet_mode = true;
        }
        else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc)
        {
            seed = std::strtoull(argv[++i], nullptr, 0);
        }
        else
        {
            std::cerr << "Usage: " << argv[0] << " [--quiet] [--seed <N>]" << std::endl;
            return 1;
        }
    }

    std::cout << "ECFFT Fuzz Tests" << std::endl;
    std::cout << "================" << std::endl;
    std::cout << "PRNG seed: 0x" << std::hex << seed << std::dec << std::endl;
    std::cout << "Multicore: " << (ecfft_have_multicore() ? "enabled" : "disabled") << std::endl;

    global_seed = seed;

    fuzz_roundtrip();
    fuzz_linearity();
    fuzz_multiply();
    fuzz_extend();
    fuzz_engines_agree();
    fuzz_thresholds();
    fuzz_karatsuba();
    fuzz_corrupt_chain();
    fuzz_cpp_api();

    std::cout << std::endl << "================" << std::endl;
    std::cout << "Total:  " << tests_run << std::endl;
    std::cout << "Passed: " << tests_passed << std::endl;
    std::cout << "Failed: " << tests_failed << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
