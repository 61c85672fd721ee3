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

#include <k1sig/hash.hpp>
#include <k1sig/nonce.hpp>
#include <util/log.hpp>
#include <util/mpz_bytes.hpp>

namespace k1sig {

namespace {

constexpr uint8_t sep_zero[1] = { 0x00 };
constexpr uint8_t sep_one[1]  = { 0x01 };

std::vector<uint8_t> to_vector(const sha256::digest& d) {
    return { d.data.begin(), d.data.end() };
}

}  // namespace

void rfc6979_nonce_source::seed(const ec::weierstrass_curve& curve,
                                const scalar_field_element& d,
                                const scalar_field_element& e) {
    // int2octets(x) and bits2octets(h1); e is already reduced mod q
    const size_t rlen = curve.scalars().num_bytes();
    const auto x = mpz_to_bytes(d.data(), rlen);
    const auto h = mpz_to_bytes(e.data(), rlen);

    v_.assign(sha256::digest_size, 0x01);
    k_.assign(sha256::digest_size, 0x00);

    k_ = to_vector(hmac_sha256(k_, { v_, sep_zero, x, h }));
    v_ = to_vector(hmac_sha256(k_, { v_ }));
    k_ = to_vector(hmac_sha256(k_, { v_, sep_one, x, h }));
    v_ = to_vector(hmac_sha256(k_, { v_ }));
}

void rfc6979_nonce_source::step() {
    k_ = to_vector(hmac_sha256(k_, { v_, sep_zero }));
    v_ = to_vector(hmac_sha256(k_, { v_ }));
}

scalar_field_element rfc6979_nonce_source::next(const ec::weierstrass_curve& curve,
                                                const scalar_field_element& d,
                                                const scalar_field_element& e,
                                                size_t attempt) {
    if (attempt == 0 || v_.empty())
        seed(curve, d, e);
    else
        step();

    const size_t qlen = curve.scalars().num_bits();

    std::vector<uint8_t> t;
    while (t.size() * 8 < qlen) {
        v_ = to_vector(hmac_sha256(k_, { v_ }));
        t.insert(t.end(), v_.begin(), v_.end());
    }

    // bits2int: keep the leftmost qlen bits
    mpz_class k = mpz_from_bytes(t);
    k >>= t.size() * 8 - qlen;

    if (sgn(k) <= 0 || k >= curve.n()) {
        K1SIG_LOG_TRACE << "RFC 6979 candidate out of range on attempt " << attempt;
        return curve.scalars().zero();
    }
    return curve.scalars().from_integer(k);
}

}  // namespace k1sig
