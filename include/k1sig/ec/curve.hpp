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

#include <optional>
#include <string_view>

#include <k1sig/finite_field.hpp>
#include <k1sig/ec/point.hpp>

namespace k1sig::ec {

/// Published secp256k1 domain parameters (SEC 2 v2, section 2.4.1)
namespace secp256k1_constants {

inline constexpr std::string_view p  = "fffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2f";
inline constexpr std::string_view a  = "0000000000000000000000000000000000000000000000000000000000000000";
inline constexpr std::string_view b  = "0000000000000000000000000000000000000000000000000000000000000007";
inline constexpr std::string_view gx = "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
inline constexpr std::string_view gy = "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8";
inline constexpr std::string_view n  = "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141";

}  // namespace secp256k1_constants

/// Short Weierstrass curve y^2 = x^3 + ax + b over F_p with a generator G of
/// prime order n. Immutable once built; every group operation is a const
/// member and the instance is passed explicitly to whatever needs it.
class weierstrass_curve {
public:
    /// @throws point_not_on_curve if (gx, gy) is not on the curve
    /// @throws std::invalid_argument for a singular curve or if n * G is not
    ///         the point at infinity
    weierstrass_curve(base_field fp, scalar_field fn,
                      const mpz_class& a, const mpz_class& b,
                      const mpz_class& gx, const mpz_class& gy);

    const base_field&   base()    const { return fp_; }
    const scalar_field& scalars() const { return fn_; }

    const mpz_class& p() const { return fp_.modulus(); }
    const mpz_class& n() const { return fn_.modulus(); }

    const base_field_element& coeff_a() const { return a_; }
    const base_field_element& coeff_b() const { return b_; }
    const curve_point& generator()     const { return g_; }

    bool contains(const base_field_element& x, const base_field_element& y) const;
    bool contains(const curve_point& p) const;

    /// Validated affine point
    ///
    /// @throws point_not_on_curve
    curve_point make_point(const base_field_element& x, const base_field_element& y) const;
    curve_point make_point(std::string_view x_hex, std::string_view y_hex) const;

    /// The point with abscissa x and the requested y parity, if x is on the curve
    std::optional<curve_point> lift_x(const base_field_element& x, bool odd_y) const;

    // Group law
    // ------------------------------------------------------------
    curve_point point_negate(const curve_point& p) const;
    curve_point point_add(const curve_point& p, const curve_point& q) const;
    curve_point point_double(const curve_point& p) const;

    // Scalar multiplication
    // ------------------------------------------------------------

    /// k * P for any non-negative integer k, left-to-right double-and-add
    ///
    /// @throws value_out_of_range if k is negative
    curve_point multiply(const mpz_class& k, const curve_point& p) const;

    curve_point scalar_mul(const scalar_field_element& k, const curve_point& p) const;
    curve_point scalar_mul_generator(const scalar_field_element& k) const;

    /// u1 * G + u2 * Q
    curve_point mul_add(const scalar_field_element& u1,
                        const scalar_field_element& u2,
                        const curve_point& q) const;

    /// x(P) mod n. P must not be the point at infinity.
    scalar_field_element point_x_to_scalar(const curve_point& p) const;

private:
    base_field_element rhs(const base_field_element& x) const;

    curve_point chord(const base_field_element& lambda,
                      const affine_point& p,
                      const base_field_element& qx) const;

    base_field   fp_;
    scalar_field fn_;
    base_field_element a_;
    base_field_element b_;
    curve_point g_;
};

/// The secp256k1 curve, built once from `secp256k1_constants`
const weierstrass_curve& secp256k1();

}  // namespace k1sig::ec
