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
 * @file ecfft_errors.h
 * @brief Error kinds reported by the C++ API.
 *
 * Construction failures are DomainError, evaluate / interpolate / extend / multiply
 * failures are ComputeError. Fallible calls return an empty std::optional and, when the
 * caller passes a non-null out-parameter, store the kind there.
 */

#ifndef ECFFT_ERRORS_H
#define ECFFT_ERRORS_H

#include <ostream>

namespace ecfft
{

    enum class DomainError
    {
        /// 2^k does not divide p - 1
        OrderNotDivisible,
        /// chain length, map shape, vanishing denominator, or a map that is not 2-to-1
        InvalidIsogenyChain,
        /// modulus is not an odd prime
        InvalidModulus,
        /// log size above ECFFT_MAX_LOG_SIZE
        InvalidSize,
        /// supplied generator does not have order exactly 2^k
        InvalidGenerator,
        /// singular curve, point off the curve, or a degenerate coset
        InvalidCurve,
        /// raw domain point not below p, or a repeated point
        InvalidDomain,
    };

    enum class ComputeError
    {
        InsufficientDomainSize,
        SingularSystem,
        /// value vector length does not match the domain
        LengthMismatch,
        /// polynomial modulus differs from the tree modulus
        FieldMismatch,
        /// radix-2 path requested on a tree whose maps are not all x^2
        UnsupportedTree,
    };

    /// Map an ecfft_status construction code; ECFFT_OK is not a valid input.
    DomainError domain_error_from_status(int status);

    /// Map an ecfft_status compute code; ECFFT_OK is not a valid input.
    ComputeError compute_error_from_status(int status);

    const char *to_string(DomainError error);

    const char *to_string(ComputeError error);

    inline std::ostream &operator<<(std::ostream &os, DomainError error)
    {
        return os << "DomainError(" << to_string(error) << ")";
    }

    inline std::ostream &operator<<(std::ostream &os, ComputeError error)
    {
        return os << "ComputeError(" << to_string(error) << ")";
    }

} // namespace ecfft

#endif // ECFFT_ERRORS_H
