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

#include <stdexcept>
#include <string>

namespace k1sig {

enum class errc : unsigned char {
    value_out_of_range = 1,
    non_invertible,
    degenerate_nonce,
    invalid_private_key,
    insufficient_entropy,
    invalid_signature_format,
    point_not_on_curve,
    invalid_encoding,
};

const char* to_string(errc code);

/// Base of every exception thrown by k1sig
struct error : std::runtime_error {
    error(errc code, const std::string& what)
        : std::runtime_error(what), code_(code) { }

    errc code() const noexcept { return code_; }

private:
    errc code_;
};

/// A field element or scalar was requested outside [0, modulus)
struct value_out_of_range : error {
    explicit value_out_of_range(const std::string& what)
        : error(errc::value_out_of_range, what) { }
};

/// Inversion of the zero element
struct non_invertible : error {
    explicit non_invertible(const std::string& what)
        : error(errc::non_invertible, what) { }
};

/// Every nonce drawn during signing produced r = 0 or s = 0
struct degenerate_nonce : error {
    explicit degenerate_nonce(const std::string& what)
        : error(errc::degenerate_nonce, what) { }
};

struct invalid_private_key : error {
    explicit invalid_private_key(const std::string& what)
        : error(errc::invalid_private_key, what) { }
};

/// The randomness source failed or kept returning unusable values
struct insufficient_entropy : error {
    explicit insufficient_entropy(const std::string& what)
        : error(errc::insufficient_entropy, what) { }
};

struct point_not_on_curve : error {
    explicit point_not_on_curve(const std::string& what)
        : error(errc::point_not_on_curve, what) { }
};

/// Malformed hex, SEC1, compact or DER input
struct invalid_encoding : error {
    explicit invalid_encoding(const std::string& what)
        : error(errc::invalid_encoding, what) { }
};

}  // namespace k1sig
