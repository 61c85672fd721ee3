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

#include <array>
#include <initializer_list>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include <openssl/evp.h>

namespace k1sig {

/// Incremental SHA-256 over OpenSSL EVP
///
/// Example:
///     sha256 h;
///     h << "hello" << "-world";
///     auto d = h.flush_digest();
struct sha256 {
    constexpr static size_t digest_size = 32;

    struct digest {
        std::array<uint8_t, digest_size> data{};

        bool operator==(const digest&) const = default;
    };

    struct deleter {
        void operator()(EVP_MD_CTX *ctx) { EVP_MD_CTX_free(ctx); }
    };

    sha256();

    sha256& operator<<(std::span<const uint8_t> bytes);
    sha256& operator<<(std::string_view str);

    /// Finalize, return the digest and reset for the next message
    digest flush_digest();

    static digest hash(std::span<const uint8_t> bytes);
    static digest hash(std::string_view str);

private:
    void reset();

    std::unique_ptr<EVP_MD_CTX, deleter> ctx_;
};

/// HMAC-SHA-256 of the concatenation of `parts`
sha256::digest hmac_sha256(std::span<const uint8_t> key,
                           std::initializer_list<std::span<const uint8_t>> parts);

}  // namespace k1sig
