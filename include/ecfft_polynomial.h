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
 * @file ecfft_polynomial.h
 * @brief Type-safe C++ wrapper for univariate polynomials over a runtime prime field.
 *
 * A Polynomial is bound to the modulus it was built with. Coefficients are canonical
 * residues stored in ascending degree order with no trailing zeros, so two polynomials
 * compare equal exactly when they are the same element of F_p[x].
 */

#ifndef ECFFT_API_POLYNOMIAL_H
#define ECFFT_API_POLYNOMIAL_H

#include "gf.h"
#include "poly.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <vector>

namespace ecfft
{

    class FFTree;

    /**
     * @brief Univariate polynomial over F_p.
     *
     * Coefficients stored in ascending degree order: coefficients()[i] is the coefficient
     * of x^i. A default-constructed Polynomial is the zero polynomial bound to no field
     * (modulus() == 0); arithmetic between polynomials over different moduli returns one.
     */
    class Polynomial
    {
      public:
        Polynomial() = default;

        /// Reduce coeffs modulo p. Empty if p is not an odd prime or coeffs is too long.
        static std::optional<Polynomial> from_coefficients(uint64_t p, const std::vector<uint64_t> &coeffs);

        /// The zero polynomial over F_p. Empty if p is not an odd prime.
        static std::optional<Polynomial> zero(uint64_t p);

        uint64_t modulus() const
        {
            return field_.p;
        }

        /// -1 for the zero polynomial
        long degree() const;

        bool is_zero() const
        {
            return poly_.coeffs.empty();
        }

        const std::vector<uint64_t> &coefficients() const
        {
            return poly_.coeffs;
        }

        /// Coefficient of x^i (0 past the degree)
        uint64_t coefficient(size_t i) const;

        /// Evaluate at x (reduced mod p) using Horner's method.
        uint64_t evaluate(uint64_t x) const;

        /// Multiply every coefficient by s (reduced mod p).
        Polynomial scale(uint64_t s) const;

        Polynomial operator*(const Polynomial &other) const;
        Polynomial operator+(const Polynomial &other) const;
        Polynomial operator-(const Polynomial &other) const;

        bool operator==(const Polynomial &other) const
        {
            return field_.p == other.field_.p && poly_.coeffs == other.poly_.coeffs;
        }

        bool operator!=(const Polynomial &other) const
        {
            return !(*this == other);
        }

        const gf_ctx &field() const
        {
            return field_;
        }

        const gf_poly &raw() const
        {
            return poly_;
        }

      private:
        friend class FFTree;

        Polynomial(const gf_ctx &field, gf_poly poly);

        gf_ctx field_ = {0, 0};
        gf_poly poly_;
    };

    inline std::ostream &operator<<(std::ostream &os, const Polynomial &poly)
    {
        const auto &coeffs = poly.coefficients();
        os << "Polynomial(p=" << poly.modulus() << ", deg=" << poly.degree() << ") [";
        for (size_t c = 0; c < coeffs.size(); ++c)
        {
            if (c > 0)
                os << ", ";
            os << coeffs[c];
        }
        os << "]";
        return os;
    }

} // namespace ecfft

#endif // ECFFT_API_POLYNOMIAL_H
