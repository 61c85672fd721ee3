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
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmp.h>
#include <gmpxx.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <k1sig/error.hpp>
#include <k1sig/params.hpp>

namespace k1sig {

/// Deterministic stream of big integers: AES-256-CTR keystream under a
/// caller-supplied 32 byte seed, cut into big-endian integers of the
/// requested width. Reproducible, so it suits tests and seeded key
/// derivation; it is only as unpredictable as its seed.
class seeded_random_engine {
public:
    constexpr static size_t seed_size = 32;

    /// @throws std::invalid_argument unless the seed is seed_size bytes
    /// @throws insufficient_entropy if the cipher cannot be set up
    explicit seeded_random_engine(std::span<const unsigned char> seed)
        : ctx_(EVP_CIPHER_CTX_new())
    {
        if (seed.size() != seed_size)
            throw std::invalid_argument("seed must be " + std::to_string(seed_size) + " bytes");
        if (!ctx_)
            throw insufficient_entropy("cannot allocate cipher context");

        if (1 != EVP_EncryptInit_ex(ctx_.get(), EVP_aes_256_ctr(), nullptr,
                                    seed.data(), params::seeded_iv))
            throw insufficient_entropy("cannot initialize AES-256-CTR");
    }

    void operator()(mpz_class& ret, size_t num_bytes) {
        if (num_bytes == 0)
            throw std::invalid_argument("num_bytes must be nonzero");

        // Encrypting zeros yields the raw keystream
        std::vector<unsigned char> block(num_bytes, 0);
        int out_len = 0;
        if (1 != EVP_EncryptUpdate(ctx_.get(), block.data(), &out_len,
                                   block.data(), static_cast<int>(block.size()))
            || static_cast<size_t>(out_len) != num_bytes)
            throw insufficient_entropy("AES-256-CTR keystream generation failed");

        mpz_import(ret.get_mpz_t(), block.size(), 1, 1, 1, 0, block.data());
    }

private:
    struct cipher_free {
        void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };

    std::unique_ptr<EVP_CIPHER_CTX, cipher_free> ctx_;
};


/// Operating system randomness through OpenSSL's RAND_bytes
struct system_random_engine {
    void operator()(mpz_class& ret, size_t num_bytes) {
        if (num_bytes == 0)
            throw std::invalid_argument("num_bytes must be nonzero");

        std::vector<unsigned char> buf(num_bytes);
        if (1 != RAND_bytes(buf.data(), static_cast<int>(buf.size()))) {
            char reason[256] = { 0 };
            ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
            throw insufficient_entropy(std::string("RAND_bytes failed: ") + reason);
        }

        mpz_import(ret.get_mpz_t(), buf.size(), 1, 1, 1, 0, buf.data());
    }
};

}  // namespace k1sig
