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
 * @file ecfft_status.h
 * @brief Status codes returned by the C-style layer (gf_, ec_, fftree_ and gf_poly_ functions).
 *
 * Codes below ECFFT_ERR_INSUFFICIENT_DOMAIN_SIZE are tree-construction failures; the rest
 * are reported by evaluate / interpolate / extend / multiply. See ecfft_errors.h for the
 * C++ enum classes these map onto.
 */

#ifndef ECFFT_STATUS_H
#define ECFFT_STATUS_H

enum ecfft_status : int
{
    ECFFT_OK = 0,

    /* construction */
    ECFFT_ERR_INVALID_MODULUS = 1,
    ECFFT_ERR_INVALID_SIZE = 2,
    ECFFT_ERR_ORDER_NOT_DIVISIBLE = 3,
    ECFFT_ERR_INVALID_GENERATOR = 4,
    ECFFT_ERR_INVALID_CURVE = 5,
    ECFFT_ERR_INVALID_ISOGENY_CHAIN = 6,
    ECFFT_ERR_INVALID_DOMAIN = 7,

    /* compute */
    ECFFT_ERR_INSUFFICIENT_DOMAIN_SIZE = 16,
    ECFFT_ERR_SINGULAR_SYSTEM = 17,
    ECFFT_ERR_LENGTH_MISMATCH = 18,
    ECFFT_ERR_FIELD_MISMATCH = 19,
    ECFFT_ERR_NOT_CLASSIC = 20,
};

/* Largest supported log2 domain size */
#define ECFFT_MAX_LOG_SIZE 24

/* Stable, human-readable description of a status code */
const char *ecfft_status_string(int status);

#endif // ECFFT_STATUS_H
