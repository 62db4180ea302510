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
 * @file ecfft.h
 * @brief Master include header for the ecfft library.
 *
 * ecfft multiplies polynomials over a prime field F_p (p < 2^64) by evaluating them on an
 * FFTree, a stack of domains each mapped 2-to-1 onto the next by a degree-2 rational map.
 *
 * - **Classic trees**: the order-2^k subgroup of F_p^* with psi(x) = x^2. Requires
 *   2^k | p - 1.
 * - **EC trees**: the x-coordinates of a coset R + <G> of an order-2^k subgroup of an
 *   elliptic curve, halved by a chain of 2-isogenies. Works for any odd prime p.
 *
 * The library is organized in layers:
 *
 * - **Field elements (gf_*)**: arithmetic modulo a runtime 64-bit prime.
 * - **Curves (ec_*)**: affine short-Weierstrass arithmetic and Velu 2-isogenies.
 * - **Trees (fftree_*)**: construction, evaluation, interpolation, extension.
 * - **Polynomials (gf_poly_*)**: coefficient-space arithmetic and tree multiplication.
 * - **C++ API (ecfft::FFTree, ecfft::Polynomial)**: value types over the above.
 *
 * Including this header pulls in everything.
 */

#ifndef ECFFT_H
#define ECFFT_H

/* Platform detection, status codes, runtime configuration */
#include "ecfft_config.h"
#include "ecfft_platform.h"
#include "ecfft_status.h"

/* F_p field arithmetic */
#include "gf.h"
#include "gf_batch_invert.h"
#include "gf_invert.h"
#include "gf_mul.h"
#include "gf_ops.h"
#include "gf_ratmap.h"
#include "gf_utils.h"

/* Curves and isogenies */
#include "ec.h"
#include "ec_isogeny.h"

/* Trees and polynomials */
#include "fftree.h"
#include "poly.h"

/* C++ API */
#include "ecfft_errors.h"
#include "ecfft_polynomial.h"
#include "ecfft_tree.h"

#endif // ECFFT_H
