/*
 * Copyright (C) 2023-2026 Ligero, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <concepts>
#include <cstddef>

#include <gmpxx.h>

#include <k1sig/error.hpp>
#include <k1sig/finite_field.hpp>
#include <k1sig/params.hpp>
#include <util/log.hpp>

namespace k1sig {

/// Anything that fills an mpz_class with `n` random bytes, for instance
/// `seeded_random_engine` or `system_random_engine`. Sources signal failure by
/// throwing `insufficient_entropy`.
template <typename Engine>
concept RandomSource = requires(Engine& e, mpz_class& out, size_t n) {
    { e(out, n) };
};

/// Sample uniformly from [1, m - 1] by rejection.
///
/// @throws insufficient_entropy if the source fails or every one of
///         params::max_sample_attempts draws is rejected
template <typename Tag, RandomSource Engine>
field_element<Tag> sample_nonzero(const prime_field<Tag>& field, Engine& eng) {
    const size_t num_bits  = field.num_bits();
    const size_t num_bytes = field.num_bytes();

    mpz_class v;
    for (size_t attempt = 0; attempt < params::max_sample_attempts; ++attempt) {
        eng(v, num_bytes);
        mpz_fdiv_r_2exp(v.get_mpz_t(), v.get_mpz_t(), num_bits);

        if (sgn(v) > 0 && field.contains(v))
            return field.from_integer(v);

        K1SIG_LOG_TRACE << "rejected random sample on attempt " << attempt;
    }

    throw insufficient_entropy("randomness source produced no usable value in "
                               + std::to_string(params::max_sample_attempts) + " draws");
}

}  // namespace k1sig
