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

#include <cstdint>
#include <span>
#include <string_view>

#include <gmpxx.h>

#include <k1sig/finite_field.hpp>
#include <k1sig/nonce.hpp>
#include <k1sig/ec/curve.hpp>

namespace k1sig {

/// Raw (r, s) pair. The signer only produces 1 <= r, s < n with s <= n / 2;
/// values read from outside may be anything and the verifier range-checks
/// them.
struct signature {
    mpz_class r;
    mpz_class s;

    bool operator==(const signature& other) const {
        return r == other.r && s == other.s;
    }
};

enum class verify_status : unsigned char {
    valid,
    invalid_signature_format,   // r or s outside [1, n - 1]
    public_key_at_infinity,
    public_key_not_on_curve,
    point_at_infinity,          // u1 * G + u2 * Q vanished
    signature_mismatch,
};

const char* to_string(verify_status status);

/// SEC1 bits2int of a hash (leftmost bits up to the bit length of n) reduced mod n
scalar_field_element digest_to_scalar(const ec::weierstrass_curve& curve,
                                      std::span<const uint8_t> digest);

/************************************************************
 * ECDSA signature generation
 *
 * Nonces come from `nonces`; a candidate yielding k = 0,
 * R = infinity, r = 0 or s = 0 is dropped and another one
 * requested, up to params::max_sign_attempts. The result is
 * low-s normalized.
 *
 * @param curve   Domain parameters
 * @param d       Private scalar
 * @param e       Message digest reduced mod n
 * @param nonces  Nonce source
 * @return  Signature (r, s)
 * @throws  invalid_private_key unless 1 <= d < n
 * @throws  degenerate_nonce if every attempt was unusable
 ************************************************************/
signature sign(const ec::weierstrass_curve& curve,
               const scalar_field_element& d,
               const scalar_field_element& e,
               nonce_source& nonces);

/// Digest given as an integer, reduced mod n
signature sign(const ec::weierstrass_curve& curve,
               const scalar_field_element& d,
               const mpz_class& digest,
               nonce_source& nonces);

/// Digest given as hash output bytes
signature sign(const ec::weierstrass_curve& curve,
               const scalar_field_element& d,
               std::span<const uint8_t> digest,
               nonce_source& nonces);

/// SHA-256 of `message`, then sign
signature sign_message(const ec::weierstrass_curve& curve,
                       const scalar_field_element& d,
                       std::string_view message,
                       nonce_source& nonces);

/************************************************************
 * ECDSA signature verification
 *
 * Never throws on malformed input: out-of-range r or s, a
 * public key at infinity or off the curve all come back as a
 * status other than `valid`. Both s and n - s are accepted.
 ************************************************************/
verify_status verify_signature(const ec::weierstrass_curve& curve,
                               const ec::curve_point& q,
                               const scalar_field_element& e,
                               const signature& sig);

verify_status verify_signature(const ec::weierstrass_curve& curve,
                               const ec::curve_point& q,
                               const mpz_class& digest,
                               const signature& sig);

verify_status verify_signature(const ec::weierstrass_curve& curve,
                               const ec::curve_point& q,
                               std::span<const uint8_t> digest,
                               const signature& sig);

bool verify(const ec::weierstrass_curve& curve,
            const ec::curve_point& q,
            const mpz_class& digest,
            const signature& sig);

bool verify(const ec::weierstrass_curve& curve,
            const ec::curve_point& q,
            std::span<const uint8_t> digest,
            const signature& sig);

bool verify_message(const ec::weierstrass_curve& curve,
                    const ec::curve_point& q,
                    std::string_view message,
                    const signature& sig);

bool is_low_s(const ec::weierstrass_curve& curve, const signature& sig);

/// (r, n - s) when s > n / 2, otherwise sig unchanged
signature normalize_s(const ec::weierstrass_curve& curve, const signature& sig);

}  // namespace k1sig
