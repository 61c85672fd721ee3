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

#include <k1sig/ec/curve.hpp>

namespace k1sig::ec {

curve_point weierstrass_curve::point_negate(const curve_point& p) const {
    if (p.is_infinity())
        return p;
    return curve_point{affine_point{p.x(), fp_.negate(p.y())}};
}

// x3 = lambda^2 - x1 - x2
// y3 = lambda * (x1 - x3) - y1
curve_point weierstrass_curve::chord(const base_field_element& lambda,
                                     const affine_point& p,
                                     const base_field_element& qx) const {
    const auto lam2 = fp_.square(lambda);
    const auto x3   = fp_.sub(fp_.sub(lam2, p.x), qx);
    const auto y3   = fp_.sub(fp_.mul(lambda, fp_.sub(p.x, x3)), p.y);
    return curve_point{affine_point{x3, y3}};
}

curve_point weierstrass_curve::point_add(const curve_point& p,
                                         const curve_point& q) const {
    if (p.is_infinity())
        return q;
    if (q.is_infinity())
        return p;

    const auto& [x1, y1] = p.affine();
    const auto& [x2, y2] = q.affine();

    if (x1 == x2) {
        // Two points sharing x are either equal or mutual inverses
        if (y1 == fp_.negate(y2))
            return curve_point::infinity();
        return point_double(p);
    }

    const auto lambda = fp_.div(fp_.sub(y2, y1), fp_.sub(x2, x1));
    return chord(lambda, p.affine(), x2);
}

curve_point weierstrass_curve::point_double(const curve_point& p) const {
    if (p.is_infinity())
        return p;

    const auto& [x, y] = p.affine();

    // A point with y = 0 has order two
    if (y.is_zero())
        return curve_point::infinity();

    const auto x2  = fp_.square(x);
    const auto num = fp_.add(fp_.add(fp_.add(x2, x2), x2), a_);
    const auto lambda = fp_.div(num, fp_.add(y, y));
    return chord(lambda, p.affine(), x);
}

}  // namespace k1sig::ec
