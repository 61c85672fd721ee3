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
#include <util/mpz_bytes.hpp>

namespace k1sig::ec {

weierstrass_curve::weierstrass_curve(base_field fp, scalar_field fn,
                                     const mpz_class& a, const mpz_class& b,
                                     const mpz_class& gx, const mpz_class& gy)
    : fp_(std::move(fp)), fn_(std::move(fn))
{
    a_ = fp_.from_integer(a);
    b_ = fp_.from_integer(b);

    // 4a^3 + 27b^2 != 0
    const auto a3 = fp_.mul(fp_.square(a_), a_);
    const auto b2 = fp_.square(b_);
    const auto disc = fp_.add(fp_.mul(fp_.from_integer(4ul), a3),
                              fp_.mul(fp_.from_integer(27ul), b2));
    if (disc.is_zero())
        throw std::invalid_argument("singular curve");

    g_ = make_point(fp_.from_integer(gx), fp_.from_integer(gy));

    if (!multiply(fn_.modulus(), g_).is_infinity())
        throw std::invalid_argument("n * G is not the point at infinity");
}

base_field_element weierstrass_curve::rhs(const base_field_element& x) const {
    const auto x3 = fp_.mul(fp_.square(x), x);
    return fp_.add(fp_.add(x3, fp_.mul(a_, x)), b_);
}

bool weierstrass_curve::contains(const base_field_element& x,
                                 const base_field_element& y) const {
    return fp_.square(y) == rhs(x);
}

bool weierstrass_curve::contains(const curve_point& p) const {
    if (p.is_infinity())
        return true;
    return contains(p.x(), p.y());
}

curve_point weierstrass_curve::make_point(const base_field_element& x,
                                          const base_field_element& y) const {
    if (!contains(x, y))
        throw point_not_on_curve("(" + x.to_hex() + ", " + y.to_hex() + ") is not on the curve");
    return curve_point{affine_point{x, y}};
}

curve_point weierstrass_curve::make_point(std::string_view x_hex,
                                          std::string_view y_hex) const {
    return make_point(fp_.from_hex(x_hex), fp_.from_hex(y_hex));
}

std::optional<curve_point>
weierstrass_curve::lift_x(const base_field_element& x, bool odd_y) const {
    auto y = fp_.sqrt(rhs(x));
    if (!y)
        return std::nullopt;

    if (y->is_odd() != odd_y)
        y = fp_.negate(*y);

    // y == 0 has a single root of either parity
    if (y->is_odd() != odd_y)
        return std::nullopt;

    return curve_point{affine_point{x, *y}};
}

scalar_field_element weierstrass_curve::point_x_to_scalar(const curve_point& p) const {
    return fn_.reduce(p.x().data());
}

const weierstrass_curve& secp256k1() {
    static const weierstrass_curve curve {
        base_field{mpz_from_hex(secp256k1_constants::p)},
        scalar_field{mpz_from_hex(secp256k1_constants::n)},
        mpz_from_hex(secp256k1_constants::a),
        mpz_from_hex(secp256k1_constants::b),
        mpz_from_hex(secp256k1_constants::gx),
        mpz_from_hex(secp256k1_constants::gy),
    };
    return curve;
}

std::ostream& operator<<(std::ostream& os, const curve_point& p) {
    if (p.is_infinity())
        return os << "infinity";
    return os << "(" << p.x() << ", " << p.y() << ")";
}

}  // namespace k1sig::ec
