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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <gmp.h>
#include <gmpxx.h>

namespace k1sig {

struct base_field_tag   { };  // integers mod p
struct scalar_field_tag { };  // integers mod n

template <typename Tag>
class prime_field;

/// Canonical residue in [0, m) of the `prime_field<Tag>` that created it.
/// Fields with different tags give different types; two fields sharing a tag
/// but not a modulus do not, so code receiving an element from outside
/// range-checks it against its own modulus.
template <typename Tag>
class field_element {
public:
    using value_type = mpz_class;

    field_element() : data_(0) { }

    const value_type& data() const { return data_; }

    bool is_zero() const { return sgn(data_) == 0; }
    bool is_odd()  const { return mpz_odd_p(data_.get_mpz_t()) != 0; }

    bool operator==(const field_element& other) const {
        return data_ == other.data_;
    }

    /// Big-endian hex, 64 digits
    std::string to_hex() const;

private:
    friend class prime_field<Tag>;

    explicit field_element(value_type v) : data_(std::move(v)) { }

    value_type data_;
};

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const field_element<Tag>& f) {
    return os << f.to_hex();
}

/// Arithmetic modulo an odd prime m. The modulus is instance data; every
/// operation is const and returns a fresh canonical element.
template <typename Tag>
class prime_field {
public:
    using value_type = mpz_class;
    using element    = field_element<Tag>;

    /// @throws std::invalid_argument unless the modulus is an odd prime
    explicit prime_field(value_type modulus);

    const value_type& modulus() const { return modulus_; }
    size_t num_bits()  const { return mpz_sizeinbase(modulus_.get_mpz_t(), 2); }
    size_t num_bytes() const { return (num_bits() + 7) / 8; }

    bool contains(const value_type& v) const { return v >= 0 && v < modulus_; }

    /// @throws value_out_of_range unless 0 <= v < m
    element from_integer(const value_type& v) const;
    element from_integer(unsigned long v) const { return from_integer(value_type{v}); }

    /// @throws invalid_encoding on bad hex, value_out_of_range if >= m
    element from_hex(std::string_view hex) const;

    /// Any integer, negative included, mapped into [0, m)
    element reduce(const value_type& v) const;

    /// Big-endian bytes read as an unsigned integer and reduced
    element reduce_bytes(std::span<const uint8_t> bytes) const;

    element zero() const { return element{0}; }
    element one()  const { return element{1}; }

    element add(const element& a, const element& b) const;
    element sub(const element& a, const element& b) const;
    element negate(const element& a) const;
    element mul(const element& a, const element& b) const;
    element square(const element& a) const { return mul(a, a); }

    /// @throws non_invertible if a is zero
    element inverse(const element& a) const;

    /// a / b, @throws non_invertible if b is zero
    element div(const element& a, const element& b) const;

    element pow(const element& a, const value_type& exp) const;

    /// Square root for m = 3 (mod 4). Empty if a is not a quadratic residue.
    std::optional<element> sqrt(const element& a) const;

    /// a > (m - 1) / 2
    bool is_high(const element& a) const { return a.data() > half_modulus_; }

private:
    value_type modulus_;
    value_type half_modulus_;
};

using base_field   = prime_field<base_field_tag>;
using scalar_field = prime_field<scalar_field_tag>;

using base_field_element   = field_element<base_field_tag>;
using scalar_field_element = field_element<scalar_field_tag>;

extern template class field_element<base_field_tag>;
extern template class field_element<scalar_field_tag>;
extern template class prime_field<base_field_tag>;
extern template class prime_field<scalar_field_tag>;

}  // namespace k1sig
