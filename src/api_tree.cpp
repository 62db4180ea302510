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

// api_tree.cpp: FFTree C++ API methods.
// Builds through the fftree_build_* routines and translates status codes into the
// DomainError / ComputeError out-parameters.

#include "ec_isogeny.h"
#include "ecfft_status.h"
#include "ecfft_tree.h"

#include <utility>

namespace ecfft
{

    /* ---- helpers ---- */

    template<typename E> static inline void report(E *error, E kind)
    {
        if (error)
            *error = kind;
    }

    FFTree::FFTree(std::shared_ptr<const fftree> tree): tree_(std::move(tree)) {}

    std::optional<FFTree> FFTree::finish_build(int rc, std::unique_ptr<fftree> tree, DomainError *error)
    {
        if (rc != ECFFT_OK)
        {
            report(error, domain_error_from_status(rc));
            return std::nullopt;
        }
        return FFTree(std::shared_ptr<const fftree>(std::move(tree)));
    }

    /* ---- construction ---- */

    std::optional<FFTree> FFTree::build_classic(uint64_t p, size_t k, DomainError *error)
    {
        std::unique_ptr<fftree> tree(new fftree());
        const int rc = fftree_build_classic(tree.get(), p, k);
        return finish_build(rc, std::move(tree), error);
    }

    std::optional<FFTree> FFTree::build_classic(uint64_t p, size_t k, uint64_t generator, DomainError *error)
    {
        std::unique_ptr<fftree> tree(new fftree());
        const int rc = fftree_build_classic_with_root(tree.get(), p, k, generator);
        return finish_build(rc, std::move(tree), error);
    }

    std::optional<FFTree> FFTree::build_ec(
        uint64_t p,
        const ec_curve &curve,
        const ec_affine &g,
        const ec_affine &r,
        size_t k,
        const std::vector<gf_ratmap> &chain,
        DomainError *error)
    {
        std::unique_ptr<fftree> tree(new fftree());
        const int rc = fftree_build_ec(tree.get(), p, &curve, &g, &r, k, chain.data(), chain.size());
        return finish_build(rc, std::move(tree), error);
    }

    std::optional<FFTree> FFTree::build_ec(
        uint64_t p,
        const ec_curve &curve,
        const ec_affine &g,
        const ec_affine &r,
        size_t k,
        DomainError *error)
    {
        const auto chain = derive_isogeny_chain(p, curve, g, k, error);
        if (!chain)
            return std::nullopt;
        return build_ec(p, curve, g, r, k, *chain, error);
    }

    std::optional<FFTree> FFTree::from_domain(
        uint64_t p,
        const std::vector<uint64_t> &domain,
        const std::vector<gf_ratmap> &chain,
        DomainError *error)
    {
        /* layer 0 must hold exactly 2^k points */
        size_t k = 0;
        while (k <= ECFFT_MAX_LOG_SIZE && (size_t(1) << k) < domain.size())
            k++;
        if (domain.empty() || k > ECFFT_MAX_LOG_SIZE || (size_t(1) << k) != domain.size())
        {
            report(error, DomainError::InvalidSize);
            return std::nullopt;
        }

        std::unique_ptr<fftree> tree(new fftree());
        const int rc = fftree_build_from_domain(tree.get(), p, domain.data(), k, chain.data(), chain.size());
        return finish_build(rc, std::move(tree), error);
    }

    std::optional<std::vector<gf_ratmap>> FFTree::derive_isogeny_chain(
        uint64_t p,
        const ec_curve &curve,
        const ec_affine &g,
        size_t k,
        DomainError *error)
    {
        if (k > ECFFT_MAX_LOG_SIZE)
        {
            report(error, DomainError::InvalidSize);
            return std::nullopt;
        }

        gf_ctx field;
        int rc = gf_ctx_init(&field, p);
        if (rc != ECFFT_OK)
        {
            report(error, domain_error_from_status(rc));
            return std::nullopt;
        }

        std::vector<gf_ratmap> chain;
        rc = ec_derive_isogeny_chain(&chain, &field, &curve, &g, k);
        if (rc != ECFFT_OK)
        {
            report(error, domain_error_from_status(rc));
            return std::nullopt;
        }
        return chain;
    }

    /* ---- evaluation ---- */

    std::optional<std::vector<uint64_t>> FFTree::evaluate(const Polynomial &poly, ComputeError *error) const
    {
        if (poly.modulus() != modulus())
        {
            report(error, ComputeError::FieldMismatch);
            return std::nullopt;
        }

        const auto &coeffs = poly.coefficients();
        std::vector<uint64_t> values(tree_->n);
        const int rc = fftree_evaluate(tree_.get(), values.data(), coeffs.data(), coeffs.size());
        if (rc != ECFFT_OK)
        {
            report(error, compute_error_from_status(rc));
            return std::nullopt;
        }
        return values;
    }

    std::optional<Polynomial> FFTree::interpolate(const std::vector<uint64_t> &values, ComputeError *error) const
    {
        if (values.size() != tree_->n)
        {
            report(error, ComputeError::LengthMismatch);
            return std::nullopt;
        }

        gf_poly poly;
        poly.coeffs.resize(tree_->n);
        const int rc = fftree_interpolate(tree_.get(), poly.coeffs.data(), values.data());
        if (rc != ECFFT_OK)
        {
            report(error, compute_error_from_status(rc));
            return std::nullopt;
        }
        return Polynomial(tree_->field, std::move(poly));
    }

    std::optional<std::vector<uint64_t>>
        FFTree::extend(const std::vector<uint64_t> &even_values, ComputeError *error) const
    {
        if (even_values.size() != tree_->n / 2)
        {
            report(error, ComputeError::LengthMismatch);
            return std::nullopt;
        }

        std::vector<uint64_t> odd_values(tree_->n / 2);
        const int rc = fftree_extend(tree_.get(), odd_values.data(), even_values.data());
        if (rc != ECFFT_OK)
        {
            report(error, compute_error_from_status(rc));
            return std::nullopt;
        }
        return odd_values;
    }

    std::optional<Polynomial> FFTree::multiply(const Polynomial &a, const Polynomial &b, ComputeError *error) const
    {
        if (a.modulus() != modulus() || b.modulus() != modulus())
        {
            report(error, ComputeError::FieldMismatch);
            return std::nullopt;
        }

        gf_poly r;
        const int rc = gf_poly_mul_fftree(&r, &a.raw(), &b.raw(), tree_.get());
        if (rc != ECFFT_OK)
        {
            report(error, compute_error_from_status(rc));
            return std::nullopt;
        }
        return Polynomial(tree_->field, std::move(r));
    }

} // namespace ecfft
