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
 * @file ecfft_tree.h
 * @brief C++ handle on an immutable FFTree.
 *
 * An FFTree is built once, from a multiplicative subgroup of order 2^k (classic) or from
 * the x-coordinates of a coset of an order-2^k curve subgroup (EC), and then shared:
 * copies share the same read-only tables and may be used from any number of threads.
 *
 * Multiplication is exact whenever deg a + deg b < size(); evaluation and interpolation
 * pick the radix-2 path on classic trees and the ECFFT path otherwise.
 */

#ifndef ECFFT_API_TREE_H
#define ECFFT_API_TREE_H

#include "ec.h"
#include "ecfft_errors.h"
#include "ecfft_polynomial.h"
#include "fftree.h"
#include "gf_ratmap.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace ecfft
{

    class FFTree
    {
      public:
        /// Order-2^k subgroup of F_p^*, generated from the least quadratic non-residue.
        static std::optional<FFTree> build_classic(uint64_t p, size_t k, DomainError *error = nullptr);

        /// Order-2^k subgroup with a caller-chosen generator of order exactly 2^k.
        static std::optional<FFTree>
            build_classic(uint64_t p, size_t k, uint64_t generator, DomainError *error = nullptr);

        /// Coset R + <G> with a caller-supplied chain of k halving maps.
        static std::optional<FFTree> build_ec(
            uint64_t p,
            const ec_curve &curve,
            const ec_affine &g,
            const ec_affine &r,
            size_t k,
            const std::vector<gf_ratmap> &chain,
            DomainError *error = nullptr);

        /// Coset R + <G> with the Velu chain derived from G (which must have order 2^k).
        static std::optional<FFTree> build_ec(
            uint64_t p,
            const ec_curve &curve,
            const ec_affine &g,
            const ec_affine &r,
            size_t k,
            DomainError *error = nullptr);

        /// Arbitrary layer 0 of size 2^k, validated against the chain.
        static std::optional<FFTree> from_domain(
            uint64_t p,
            const std::vector<uint64_t> &domain,
            const std::vector<gf_ratmap> &chain,
            DomainError *error = nullptr);

        /// The k Velu x-maps halving <G>, usable as the chain argument of build_ec.
        static std::optional<std::vector<gf_ratmap>> derive_isogeny_chain(
            uint64_t p,
            const ec_curve &curve,
            const ec_affine &g,
            size_t k,
            DomainError *error = nullptr);

        size_t size() const
        {
            return tree_->n;
        }

        size_t log_size() const
        {
            return tree_->log_n;
        }

        uint64_t modulus() const
        {
            return tree_->field.p;
        }

        bool is_classic() const
        {
            return tree_->mode == FFTREE_MODE_CLASSIC;
        }

        /// Domain at depth d, 0 <= d <= log_size(); size() >> d points.
        const std::vector<uint64_t> &layer(size_t d) const
        {
            return tree_->layers.at(d);
        }

        /// Halving map from depth d to depth d + 1, 0 <= d < log_size().
        const gf_ratmap &map(size_t d) const
        {
            return tree_->maps.at(d);
        }

        /// P(layer(0)[i]) for every i. Requires deg P < size().
        std::optional<std::vector<uint64_t>> evaluate(const Polynomial &poly, ComputeError *error = nullptr) const;

        /// The unique polynomial of degree < size() taking values[i] at layer(0)[i].
        std::optional<Polynomial> interpolate(const std::vector<uint64_t> &values, ComputeError *error = nullptr) const;

        /**
         * Low-degree extension: the values of some Q with deg Q < size()/2 at the even
         * positions of layer 0 determine its values at the odd positions.
         */
        std::optional<std::vector<uint64_t>>
            extend(const std::vector<uint64_t> &even_values, ComputeError *error = nullptr) const;

        /// a * b, exact when deg a + deg b < size().
        std::optional<Polynomial> multiply(const Polynomial &a, const Polynomial &b, ComputeError *error = nullptr) const;

        const fftree &raw() const
        {
            return *tree_;
        }

      private:
        explicit FFTree(std::shared_ptr<const fftree> tree);

        /// Wrap a freshly built tree, or report the build status.
        static std::optional<FFTree> finish_build(int rc, std::unique_ptr<fftree> tree, DomainError *error);

        std::shared_ptr<const fftree> tree_;
    };

} // namespace ecfft

#endif // ECFFT_API_TREE_H
