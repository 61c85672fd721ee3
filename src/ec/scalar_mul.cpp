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
#include <k1sig/ec/curve.hpp>

namespace k1sig::ec {

curve_point weierstrass_curve::multiply(const mpz_class& k, const curve_point& p) const {
    if (sgn(k) < 0)
        throw value_out_of_range("negative multiplier");

    curve_point acc;

    // Most significant bit first: acc = 2 * acc (+ P)
    for (size_t i = mpz_sizeinbase(k.get_mpz_t(), 2); i-- > 0; ) {
        acc = point_double(acc);
        if (mpz_tstbit(k.get_mpz_t(), i))
            acc = point_add(acc, p);
    }
    return acc;
}

curve_point weierstrass_curve::scalar_mul(const scalar_field_element& k,
                                          const curve_point& p) const {
    return multiply(k.data(), p);
}

curve_point weierstrass_curve::scalar_mul_generator(const scalar_field_element& k) const {
    return multiply(k.data(), g_);
}

curve_point weierstrass_curve::mul_add(const scalar_field_element& u1,
                                       const scalar_field_element& u2,
                                       const curve_point& q) const {
    return point_add(scalar_mul_generator(u1), scalar_mul(u2, q));
}

}  // namespace k1sig::ec
