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

#include <stdexcept>
#include <vector>

#include <openssl/hmac.h>

#include <k1sig/hash.hpp>

namespace k1sig {

sha256::sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_)
        throw std::runtime_error("Failed to allocate SHA-256 context");
    reset();
}

void sha256::reset() {
    if (1 != EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr))
        throw std::runtime_error("Cannot initialize SHA-256 context");
}

sha256& sha256::operator<<(std::span<const uint8_t> bytes) {
    if (1 != EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()))
        throw std::runtime_error("SHA-256 update failed");
    return *this;
}

sha256& sha256::operator<<(std::string_view str) {
    const auto *ptr = reinterpret_cast<const uint8_t*>(str.data());
    return *this << std::span<const uint8_t>{ptr, str.size()};
}

sha256::digest sha256::flush_digest() {
    digest d;
    unsigned int len = 0;
    if (1 != EVP_DigestFinal_ex(ctx_.get(), d.data.data(), &len) || len != digest_size)
        throw std::runtime_error("SHA-256 finalization failed");
    reset();
    return d;
}

sha256::digest sha256::hash(std::span<const uint8_t> bytes) {
    sha256 h;
    h << bytes;
    return h.flush_digest();
}

sha256::digest sha256::hash(std::string_view str) {
    sha256 h;
    h << str;
    return h.flush_digest();
}

sha256::digest hmac_sha256(std::span<const uint8_t> key,
                           std::initializer_list<std::span<const uint8_t>> parts) {
    std::vector<uint8_t> msg;
    for (const auto& part : parts)
        msg.insert(msg.end(), part.begin(), part.end());

    sha256::digest d;
    unsigned int len = 0;
    const auto *res = HMAC(EVP_sha256(),
                           key.data(), static_cast<int>(key.size()),
                           msg.data(), msg.size(),
                           d.data.data(), &len);
    if (res == nullptr || len != sha256::digest_size)
        throw std::runtime_error("HMAC-SHA-256 failed");
    return d;
}

}  // namespace k1sig
