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

#include <string>

#include <k1sig/ecdsa.hpp>
#include <k1sig/error.hpp>
#include <k1sig/hash.hpp>
#include <k1sig/keys.hpp>
#include <k1sig/params.hpp>
#include <util/log.hpp>
#include <util/mpz_bytes.hpp>

namespace k1sig {

const char* to_string(verify_status status) {
    switch (status) {
    case verify_status::valid:                    return "valid";
    case verify_status::invalid_signature_format: return "invalid signature format";
    case verify_status::public_key_at_infinity:   return "public key at infinity";
    case verify_status::public_key_not_on_curve:  return "public key not on curve";
    case verify_status::point_at_infinity:        return "verification point at infinity";
    case verify_status::signature_mismatch:       return "signature mismatch";
    }
    return "unknown";
}

scalar_field_element digest_to_scalar(const ec::weierstrass_curve& curve,
                                      std::span<const uint8_t> digest) {
    const size_t qlen = curve.scalars().num_bits();

    mpz_class e = mpz_from_bytes(digest);
    if (digest.size() * 8 > qlen)
        e >>= digest.size() * 8 - qlen;

    return curve.scalars().reduce(e);
}

// Signing
// ------------------------------------------------------------

signature sign(const ec::weierstrass_curve& curve,
               const scalar_field_element& d,
               const scalar_field_element& e,
               nonce_source& nonces)
{
    if (!is_valid_private_key(curve, d))
        throw invalid_private_key("private key must lie in [1, n - 1]");

    const auto& fn = curve.scalars();
    const auto e_n = fn.reduce(e.data());

    for (size_t attempt = 0; attempt < params::max_sign_attempts; ++attempt) {
        const auto k = nonces.next(curve, d, e_n, attempt);
        if (k.is_zero() || k.data() >= curve.n()) {
            K1SIG_LOG_DEBUG << "sign: nonce outside [1, n - 1], attempt " << attempt;
            continue;
        }

        // R = k * G, r = x(R) mod n
        const auto R = curve.scalar_mul_generator(k);
        if (R.is_infinity()) {
            K1SIG_LOG_DEBUG << "sign: k * G at infinity, attempt " << attempt;
            continue;
        }

        const auto r = curve.point_x_to_scalar(R);
        if (r.is_zero()) {
            K1SIG_LOG_DEBUG << "sign: r = 0, attempt " << attempt;
            continue;
        }

        // s = k^-1 * (e + r * d) mod n
        auto s = fn.mul(fn.inverse(k), fn.add(e_n, fn.mul(r, d)));
        if (s.is_zero()) {
            K1SIG_LOG_DEBUG << "sign: s = 0, attempt " << attempt;
            continue;
        }

        if (params::low_s_signatures && fn.is_high(s))
            s = fn.negate(s);

        return signature{ r.data(), s.data() };
    }

    K1SIG_LOG_WARNING << "sign: no usable nonce after " << params::max_sign_attempts << " attempts";
    throw degenerate_nonce("no usable nonce in " + std::to_string(params::max_sign_attempts) + " attempts");
}

signature sign(const ec::weierstrass_curve& curve,
               const scalar_field_element& d,
               const mpz_class& digest,
               nonce_source& nonces)
{
    return sign(curve, d, curve.scalars().reduce(digest), nonces);
}

signature sign(const ec::weierstrass_curve& curve,
               const scalar_field_element& d,
               std::span<const uint8_t> digest,
               nonce_source& nonces)
{
    return sign(curve, d, digest_to_scalar(curve, digest), nonces);
}

signature sign_message(const ec::weierstrass_curve& curve,
                       const scalar_field_element& d,
                       std::string_view message,
                       nonce_source& nonces)
{
    const auto h = sha256::hash(message);
    return sign(curve, d, std::span<const uint8_t>{h.data}, nonces);
}

// Verification
// ------------------------------------------------------------

namespace {

bool in_scalar_range(const ec::weierstrass_curve& curve, const mpz_class& v) {
    return sgn(v) > 0 && v < curve.n();
}

}  // namespace

verify_status verify_signature(const ec::weierstrass_curve& curve,
                               const ec::curve_point& q,
                               const scalar_field_element& e,
                               const signature& sig)
{
    auto reject = [](verify_status status) {
        K1SIG_LOG_DEBUG << "verify: " << to_string(status);
        return status;
    };

    if (!in_scalar_range(curve, sig.r) || !in_scalar_range(curve, sig.s))
        return reject(verify_status::invalid_signature_format);

    if (q.is_infinity())
        return reject(verify_status::public_key_at_infinity);

    if (!curve.contains(q))
        return reject(verify_status::public_key_not_on_curve);

    const auto& fn = curve.scalars();
    const auto r = fn.from_integer(sig.r);
    const auto s = fn.from_integer(sig.s);

    // w = s^-1, u1 = e * w, u2 = r * w
    const auto w  = fn.inverse(s);
    const auto u1 = fn.mul(e, w);
    const auto u2 = fn.mul(r, w);

    const auto X = curve.mul_add(u1, u2, q);
    if (X.is_infinity())
        return reject(verify_status::point_at_infinity);

    if (curve.point_x_to_scalar(X) != r)
        return reject(verify_status::signature_mismatch);

    return verify_status::valid;
}

verify_status verify_signature(const ec::weierstrass_curve& curve,
                               const ec::curve_point& q,
                               const mpz_class& digest,
                               const signature& sig)
{
    return verify_signature(curve, q, curve.scalars().reduce(digest), sig);
}

verify_status verify_signature(const ec::weierstrass_curve& curve,
                               const ec::curve_point& q,
                               std::span<const uint8_t> digest,
                               const signature& sig)
{
    return verify_signature(curve, q, digest_to_scalar(curve, digest), sig);
}

bool verify(const ec::weierstrass_curve& curve,
            const ec::curve_point& q,
            const mpz_class& digest,
            const signature& sig)
{
    return verify_signature(curve, q, digest, sig) == verify_status::valid;
}

bool verify(const ec::weierstrass_curve& curve,
            const ec::curve_point& q,
            std::span<const uint8_t> digest,
            const signature& sig)
{
    return verify_signature(curve, q, digest, sig) == verify_status::valid;
}

bool verify_message(const ec::weierstrass_curve& curve,
                    const ec::curve_point& q,
                    std::string_view message,
                    const signature& sig)
{
    const auto h = sha256::hash(message);
    return verify(curve, q, std::span<const uint8_t>{h.data}, sig);
}

bool is_low_s(const ec::weierstrass_curve& curve, const signature& sig) {
    return in_scalar_range(curve, sig.s) && sig.s <= (curve.n() >> 1);
}

signature normalize_s(const ec::weierstrass_curve& curve, const signature& sig) {
    if (!in_scalar_range(curve, sig.s) || is_low_s(curve, sig))
        return sig;
    return signature{ sig.r, curve.n() - sig.s };
}

}  // namespace k1sig
