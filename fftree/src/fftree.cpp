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

// fftree.cpp: engine selection and input checks shared by both evaluation paths.

#include "ecfft_status.h"
#include "fftree.h"
#include "fftree_ecfft.h"
#include "gf_ops.h"

#include <utility>

int fftree_is_consistent(const fftree *t)
{
    if (t->n == 0 || t->layers.size() != t->log_n + 1 || t->pair_inv.size() != t->log_n
        || t->views.size() != t->log_n + 1)
        return 0;

    for (size_t d = 0; d < t->log_n; d++)
    {
        const std::vector<gf_fe> &pinv = t->pair_inv[d];
        if (pinv.size() != (t->n >> (d + 1)))
            return 0;
        for (size_t i = 0; i < pinv.size(); i++)
            if (pinv[i] == 0)
                return 0;
    }

    return 1;
}

int fftree_load_coeffs(const fftree *t, std::vector<gf_fe> *out, const gf_fe *coeffs, size_t len)
{
    if (!fftree_is_consistent(t))
        return ECFFT_ERR_SINGULAR_SYSTEM;

    std::vector<gf_fe> padded(t->n, 0);
    for (size_t i = 0; i < len; i++)
    {
        gf_fe c = gf_from_u64(&t->field, coeffs[i]);
        if (i >= t->n)
        {
            if (c != 0)
                return ECFFT_ERR_INSUFFICIENT_DOMAIN_SIZE;
            continue;
        }
        padded[i] = c;
    }

    *out = std::move(padded);
    return ECFFT_OK;
}

int fftree_load_values(const fftree *t, std::vector<gf_fe> *out, const gf_fe *values)
{
    if (!fftree_is_consistent(t))
        return ECFFT_ERR_SINGULAR_SYSTEM;

    out->resize(t->n);
    for (size_t i = 0; i < t->n; i++)
        (*out)[i] = gf_from_u64(&t->field, values[i]);

    return ECFFT_OK;
}

int fftree_evaluate(const fftree *t, gf_fe *values, const gf_fe *coeffs, size_t len)
{
    if (t->mode == FFTREE_MODE_CLASSIC)
        return fftree_evaluate_classic(t, values, coeffs, len);
    return fftree_evaluate_ecfft(t, values, coeffs, len);
}

int fftree_interpolate(const fftree *t, gf_fe *coeffs, const gf_fe *values)
{
    if (t->mode == FFTREE_MODE_CLASSIC)
        return fftree_interpolate_classic(t, coeffs, values);
    return fftree_interpolate_ecfft(t, coeffs, values);
}
