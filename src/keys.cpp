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

#include <k1sig/error.hpp>
#include <k1sig/keys.hpp>

namespace k1sig {

key_pair key_pair::from_private_key(const ec::weierstrass_curve& curve,
                                    const scalar_field_element& d) {
    return key_pair{d, derive_public_key(curve, d)};
}

scalar_field_element parse_private_key(const ec::weierstrass_curve& curve,
                                       const mpz_class& d) {
    if (sgn(d) <= 0 || d >= curve.n())
        throw invalid_private_key("private key must lie in [1, n - 1]");
    return curve.scalars().from_integer(d);
}

bool is_valid_private_key(const ec::weierstrass_curve& curve,
                          const scalar_field_element& d) {
    return sgn(d.data()) > 0 && d.data() < curve.n();
}

ec::curve_point derive_public_key(const ec::weierstrass_curve& curve,
                                  const scalar_field_element& d) {
    if (!is_valid_private_key(curve, d))
        throw invalid_private_key("private key must lie in [1, n - 1]");
    return curve.scalar_mul_generator(d);
}

}  // namespace k1sig
