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

#include "ecfft_status.h"

const char *ecfft_status_string(int status)
{
    switch (status)
    {
        case ECFFT_OK:
            return "ok";
        case ECFFT_ERR_INVALID_MODULUS:
            return "modulus is not an odd prime";
        case ECFFT_ERR_INVALID_SIZE:
            return "log2 domain size out of range";
        case ECFFT_ERR_ORDER_NOT_DIVISIBLE:
            return "2^k does not divide p - 1";
        case ECFFT_ERR_INVALID_GENERATOR:
            return "generator does not have order 2^k";
        case ECFFT_ERR_INVALID_CURVE:
            return "invalid curve, point, or coset";
        case ECFFT_ERR_INVALID_ISOGENY_CHAIN:
            return "isogeny chain has the wrong length or is not 2-to-1 on its domain";
        case ECFFT_ERR_INVALID_DOMAIN:
            return "domain point out of range or repeated";
        case ECFFT_ERR_INSUFFICIENT_DOMAIN_SIZE:
            return "polynomial degree exceeds the domain size";
        case ECFFT_ERR_SINGULAR_SYSTEM:
            return "singular fiber system (inconsistent tree)";
        case ECFFT_ERR_LENGTH_MISMATCH:
            return "value vector length does not match the domain size";
        case ECFFT_ERR_FIELD_MISMATCH:
            return "operand modulus differs from the tree modulus";
        case ECFFT_ERR_NOT_CLASSIC:
            return "radix-2 path needs a tree whose maps are all x^2";
        default:
            return "unknown status";
    }
}
