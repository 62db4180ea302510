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

// api_polynomial.cpp: Polynomial C++ API methods.
// Validates the modulus once at construction and delegates to the gf_poly routines.

#include "ecfft_polynomial.h"
#include "ecfft_status.h"
#include "gf_ops.h"

#include <utility>

namespace ecfft
{

    /* Upper bound on polynomial size: 16M coefficients (128MB). Prevents
     * unbounded allocations from causing memory exhaustion. */
    static constexpr size_t MAX_POLY_SIZE = size_t(1) << 24;

    Polynomial::Polynomial(const gf_ctx &field, gf_poly poly): field_(field), poly_(std::move(poly))
    {
        gf_poly_strip(&poly_);
    }

    std::optional<Polynomial> Polynomial::from_coefficients(uint64_t p, const std::vector<uint64_t> &coeffs)
    {
        if (coeffs.size() > MAX_POLY_SIZE)
            return std::nullopt;

        gf_ctx field;
        if (gf_ctx_init(&field, p) != ECFFT_OK)
            return std::nullopt;

        gf_poly poly;
        poly.coeffs.resize(coeffs.size());
        for (size_t i = 0; i < coeffs.size(); i++)
            poly.coeffs[i] = gf_from_u64(&field, coeffs[i]);

        return Polynomial(field, std::move(poly));
    }

    std::optional<Polynomial> Polynomial::zero(uint64_t p)
    {
        gf_ctx field;
        if (gf_ctx_init(&field, p) != ECFFT_OK)
            return std::nullopt;
        return Polynomial(field, gf_poly());
    }

    long Polynomial::degree() const
    {
        return gf_poly_degree(&poly_);
    }

    uint64_t Polynomial::coefficient(size_t i) const
    {
        return i < poly_.coeffs.size() ? poly_.coeffs[i] : 0;
    }

    uint64_t Polynomial::evaluate(uint64_t x) const
    {
        if (field_.p == 0)
            return 0;
        return gf_poly_eval(&field_, &poly_, gf_from_u64(&field_, x));
    }

    Polynomial Polynomial::scale(uint64_t s) const
    {
        if (field_.p == 0)
            return Polynomial();
        gf_poly r;
        gf_poly_scale(&field_, &r, &poly_, gf_from_u64(&field_, s));
        return Polynomial(field_, std::move(r));
    }

    Polynomial Polynomial::operator*(const Polynomial &other) const
    {
        if (field_.p == 0 || field_.p != other.field_.p)
            return Polynomial();
        gf_poly r;
        gf_poly_mul(&field_, &r, &poly_, &other.poly_);
        return Polynomial(field_, std::move(r));
    }

    Polynomial Polynomial::operator+(const Polynomial &other) const
    {
        if (field_.p == 0 || field_.p != other.field_.p)
            return Polynomial();
        gf_poly r;
        gf_poly_add(&field_, &r, &poly_, &other.poly_);
        return Polynomial(field_, std::move(r));
    }

    Polynomial Polynomial::operator-(const Polynomial &other) const
    {
        if (field_.p == 0 || field_.p != other.field_.p)
            return Polynomial();
        gf_poly r;
        gf_poly_sub(&field_, &r, &poly_, &other.poly_);
        return Polynomial(field_, std::move(r));
    }

} // namespace ecfft
