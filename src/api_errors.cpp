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

// api_errors.cpp: translation between C status codes and the C++ error kinds.

#include "ecfft_errors.h"
#include "ecfft_status.h"

namespace ecfft
{

    DomainError domain_error_from_status(int status)
    {
        switch (status)
        {
            case ECFFT_ERR_ORDER_NOT_DIVISIBLE:
                return DomainError::OrderNotDivisible;
            case ECFFT_ERR_INVALID_MODULUS:
                return DomainError::InvalidModulus;
            case ECFFT_ERR_INVALID_SIZE:
                return DomainError::InvalidSize;
            case ECFFT_ERR_INVALID_GENERATOR:
                return DomainError::InvalidGenerator;
            case ECFFT_ERR_INVALID_CURVE:
                return DomainError::InvalidCurve;
            case ECFFT_ERR_INVALID_DOMAIN:
                return DomainError::InvalidDomain;
            case ECFFT_ERR_INVALID_ISOGENY_CHAIN:
            default:
                return DomainError::InvalidIsogenyChain;
        }
    }

    ComputeError compute_error_from_status(int status)
    {
        switch (status)
        {
            case ECFFT_ERR_INSUFFICIENT_DOMAIN_SIZE:
                return ComputeError::InsufficientDomainSize;
            case ECFFT_ERR_LENGTH_MISMATCH:
                return ComputeError::LengthMismatch;
            case ECFFT_ERR_FIELD_MISMATCH:
                return ComputeError::FieldMismatch;
            case ECFFT_ERR_NOT_CLASSIC:
                return ComputeError::UnsupportedTree;
            case ECFFT_ERR_SINGULAR_SYSTEM:
            default:
                return ComputeError::SingularSystem;
        }
    }

    const char *to_string(DomainError error)
    {
        switch (error)
        {
            case DomainError::OrderNotDivisible:
                return "OrderNotDivisible";
            case DomainError::InvalidIsogenyChain:
                return "InvalidIsogenyChain";
            case DomainError::InvalidModulus:
                return "InvalidModulus";
            case DomainError::InvalidSize:
                return "InvalidSize";
            case DomainError::InvalidGenerator:
                return "InvalidGenerator";
            case DomainError::InvalidCurve:
                return "InvalidCurve";
            case DomainError::InvalidDomain:
                return "InvalidDomain";
        }
        return "Unknown";
    }

    const char *to_string(ComputeError error)
    {
        switch (error)
        {
            case ComputeError::InsufficientDomainSize:
                return "InsufficientDomainSize";
            case ComputeError::SingularSystem:
                return "SingularSystem";
            case ComputeError::LengthMismatch:
                return "LengthMismatch";
            case ComputeError::FieldMismatch:
                return "FieldMismatch";
            case ComputeError::UnsupportedTree:
                return "UnsupportedTree";
        }
        return "Unknown";
    }

} // namespace ecfft
