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

#include <utility>

#include <gmpxx.h>

#include <k1sig/finite_field.hpp>
#include <k1sig/random.hpp>
#include <k1sig/ec/curve.hpp>
#include <util/log.hpp>

namespace k1sig {

/// Private scalar d in [1, n - 1] and its public point Q = d * G. The public
/// point is always derived, never supplied.
class key_pair {
public:
    /// @throws invalid_private_key unless 1 <= d < n
    static key_pair from_private_key(const ec::weierstrass_curve& curve,
                                     const scalar_field_element& d);

    const scalar_field_element& private_key() const { return d_; }
    const ec::curve_point&      public_key()  const { return q_; }

private:
    key_pair(scalar_field_element d, ec::curve_point q)
        : d_(std::move(d)), q_(std::move(q)) { }

    scalar_field_element d_;
    ec::curve_point q_;
};

/// @throws invalid_private_key unless 1 <= d < n
scalar_field_element parse_private_key(const ec::weierstrass_curve& curve,
                                       const mpz_class& d);

/// 1 <= d < n. Elements of any `scalar_field` share one type, so an element
/// built over another modulus may hold a value >= n.
bool is_valid_private_key(const ec::weierstrass_curve& curve,
                          const scalar_field_element& d);

/// d * G, @throws invalid_private_key unless 1 <= d < n
ec::curve_point derive_public_key(const ec::weierstrass_curve& curve,
                                  const scalar_field_element& d);

/// Fresh key pair from `rng`
///
/// @throws insufficient_entropy
template <RandomSource Engine>
key_pair generate_keypair(const ec::weierstrass_curve& curve, Engine& rng) {
    const auto d = sample_nonzero(curve.scalars(), rng);
    K1SIG_LOG_DEBUG << "generated private key";
    return key_pair::from_private_key(curve, d);
}

}  // namespace k1sig
