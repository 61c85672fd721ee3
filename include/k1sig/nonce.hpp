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
#include <utility>
#include <vector>

#include <k1sig/finite_field.hpp>
#include <k1sig/random.hpp>
#include <k1sig/ec/curve.hpp>

namespace k1sig {

/// Supplies candidate nonces to the signer. `next` is called once per
/// signing attempt, with `attempt` counting from zero within one signing
/// call. A zero result marks the candidate as unusable and the signer asks
/// again. Sources carry per-call state, so give each thread its own.
class nonce_source {
public:
    virtual ~nonce_source() = default;

    virtual scalar_field_element next(const ec::weierstrass_curve& curve,
                                      const scalar_field_element& d,
                                      const scalar_field_element& e,
                                      size_t attempt) = 0;
};


/// Uniform nonces from an injected randomness source
template <RandomSource Engine>
class random_nonce_source : public nonce_source {
public:
    explicit random_nonce_source(Engine& eng) : eng_(eng) { }

    scalar_field_element next(const ec::weierstrass_curve& curve,
                              const scalar_field_element&,
                              const scalar_field_element&,
                              size_t) override {
        return sample_nonzero(curve.scalars(), eng_);
    }

private:
    Engine& eng_;
};


/// Deterministic nonces per RFC 6979 section 3.2, HMAC-SHA-256 as the PRF.
/// Attempt zero seeds the generator from (d, e); later attempts continue it
/// with the K = HMAC_K(V || 0x00), V = HMAC_K(V) step.
class rfc6979_nonce_source : public nonce_source {
public:
    scalar_field_element next(const ec::weierstrass_curve& curve,
                              const scalar_field_element& d,
                              const scalar_field_element& e,
                              size_t attempt) override;

private:
    void seed(const ec::weierstrass_curve& curve,
              const scalar_field_element& d,
              const scalar_field_element& e);
    void step();

    std::vector<uint8_t> k_;
    std::vector<uint8_t> v_;
};


/// The same k on every call. Two signatures under one key with one nonce
/// reveal the key; meant for known-answer tests.
class fixed_nonce_source : public nonce_source {
public:
    explicit fixed_nonce_source(scalar_field_element k) : k_(std::move(k)) { }

    scalar_field_element next(const ec::weierstrass_curve&,
                              const scalar_field_element&,
                              const scalar_field_element&,
                              size_t) override {
        return k_;
    }

private:
    scalar_field_element k_;
};

}  // namespace k1sig
