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
#include <k1sig/finite_field.hpp>
#include <k1sig/params.hpp>
#include <util/mpz_bytes.hpp>

namespace k1sig {

template <typename Tag>
std::string field_element<Tag>::to_hex() const {
    return mpz_to_hex(data_, params::scalar_bytes);
}

template <typename Tag>
prime_field<Tag>::prime_field(value_type modulus)
    : modulus_(std::move(modulus))
{
    if (modulus_ < 3 || mpz_even_p(modulus_.get_mpz_t()))
        throw std::invalid_argument("field modulus must be an odd prime");

    if (mpz_probab_prime_p(modulus_.get_mpz_t(), params::primality_rounds) == 0)
        throw std::invalid_argument("field modulus " + modulus_.get_str(16) + " is composite");

    half_modulus_ = modulus_ >> 1;
}

template <typename Tag>
typename prime_field<Tag>::element
prime_field<Tag>::from_integer(const value_type& v) const {
    if (!contains(v)) {
        throw value_out_of_range("value " + v.get_str(16) +
                                 " outside [0, " + modulus_.get_str(16) + ")");
    }
    return element{v};
}

template <typename Tag>
typename prime_field<Tag>::element
prime_field<Tag>::from_hex(std::string_view hex) const {
    return from_integer(mpz_from_hex(hex));
}

template <typename Tag>
typename prime_field<Tag>::element
prime_field<Tag>::reduce(const value_type& v) const {
    value_type out;
    mpz_fdiv_r(out.get_mpz_t(), v.get_mpz_t(), modulus_.get_mpz_t());
    return element{std::move(out)};
}

template <typename Tag>
typename prime_field<Tag>::element
prime_field<Tag>::reduce_bytes(std::span<const uint8_t> bytes) const {
    return reduce(mpz_from_bytes(bytes));
}

template <typename Tag>
typename prime_field<Tag>::element
prime_field<Tag>::add(const element& a, const element& b) const {
    value_type out = a.data() + b.data();
    if (out >= modulus_)
        out -= modulus_;
    return element{std::move(out)};
}

template <typename Tag>
typename prime_field<Tag>::element
prime_field<Tag>::sub(const element& a, const element& b) const {
    value_type out = a.data() - b.data();
    if (out < 0)
        out += modulus_;
    return element{std::move(out)};
}

template <typename Tag>
typename prime_field<Tag>::element
prime_field<Tag>::negate(const element& a) const {
    if (a.is_zero())
        return a;
    return element{modulus_ - a.data()};
}

template <typename Tag>
typename prime_field<Tag>::element
prime_field<Tag>::mul(const element& a, const element& b) const {
    value_type out = a.data() * b.data();
    mpz_fdiv_r(out.get_mpz_t(), out.get_mpz_t(), modulus_.get_mpz_t());
    return element{std::move(out)};
}

template <typename Tag>
typename prime_field<Tag>::element
prime_field<Tag>::inverse(const element& a) const {
    if (a.is_zero())
        throw non_invertible("inverse of zero");

    value_type out;
    if (mpz_invert(out.get_mpz_t(), a.data().get_mpz_t(), modulus_.get_mpz_t()) == 0)
        throw non_invertible("element " + a.data().get_str(16) + " has no inverse");
    return element{std::move(out)};
}

template <typename Tag>
typename prime_field<Tag>::element
prime_field<Tag>::div(const element& a, const element& b) const {
    return mul(a, inverse(b));
}

template <typename Tag>
typename prime_field<Tag>::element
prime_field<Tag>::pow(const element& a, const value_type& exp) const {
    if (exp < 0)
        throw value_out_of_range("negative exponent");

    value_type out;
    mpz_powm(out.get_mpz_t(), a.data().get_mpz_t(), exp.get_mpz_t(), modulus_.get_mpz_t());
    return element{std::move(out)};
}

template <typename Tag>
std::optional<typename prime_field<Tag>::element>
prime_field<Tag>::sqrt(const element& a) const {
    if (mpz_fdiv_ui(modulus_.get_mpz_t(), 4) != 3)
        throw std::domain_error("sqrt requires a modulus congruent to 3 mod 4");

    // a^((m + 1) / 4) is a root whenever one exists
    const value_type exp = (modulus_ + 1) >> 2;
    element root = pow(a, exp);
    if (square(root) != a)
        return std::nullopt;
    return root;
}

template class field_element<base_field_tag>;
template class field_element<scalar_field_tag>;
template class prime_field<base_field_tag>;
template class prime_field<scalar_field_tag>;

}  // namespace k1sig
