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

#include <ostream>
#include <utility>
#include <variant>

#include <k1sig/finite_field.hpp>

namespace k1sig::ec {

struct point_at_infinity {
    bool operator==(const point_at_infinity&) const { return true; }
};

struct affine_point {
    base_field_element x;
    base_field_element y;

    bool operator==(const affine_point& other) const {
        return x == other.x && y == other.y;
    }
};

class weierstrass_curve;

/// Either the group identity or an affine point on the curve it came from.
/// Affine points are created only by `weierstrass_curve`, either through its
/// validating constructors or as the result of group arithmetic.
class curve_point {
public:
    using variant_type = std::variant<point_at_infinity, affine_point>;

    curve_point() : data_(point_at_infinity{}) { }

    static curve_point infinity() { return curve_point{}; }

    bool is_infinity() const {
        return std::holds_alternative<point_at_infinity>(data_);
    }

    /// @throws std::bad_variant_access on the point at infinity
    const affine_point& affine() const { return std::get<affine_point>(data_); }

    const base_field_element& x() const { return affine().x; }
    const base_field_element& y() const { return affine().y; }

    const variant_type& coordinates() const { return data_; }

    bool operator==(const curve_point& other) const {
        return data_ == other.data_;
    }

private:
    friend class weierstrass_curve;

    explicit curve_point(affine_point p) : data_(std::move(p)) { }

    variant_type data_;
};

std::ostream& operator<<(std::ostream& os, const curve_point& p);

}  // namespace k1sig::ec
