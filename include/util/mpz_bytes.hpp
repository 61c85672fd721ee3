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
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <gmpxx.h>

/// @file mpz_bytes.hpp
/// @brief Fixed-width big-endian byte and hex conversion of GMP values

namespace k1sig
{
/// Write a non-negative value into `out` as a big-endian integer, left padded
/// with zeros.
///
/// @param val The GMP integer to convert
/// @param out Destination, its size is the encoding width
/// @throws value_out_of_range if val is negative or needs more than out.size() bytes
void mpz_to_bytes(const mpz_class& val, std::span<uint8_t> out);

/// Big-endian encoding of `val` in exactly `width` bytes
std::vector<uint8_t> mpz_to_bytes(const mpz_class& val, size_t width);

/// Read an unsigned big-endian integer. An empty span reads as zero.
mpz_class mpz_from_bytes(std::span<const uint8_t> bytes);

/// Lowercase hex of `val` zero padded to 2 * width digits
std::string mpz_to_hex(const mpz_class& val, size_t width);

/// Parse an unsigned hex integer with an optional "0x" prefix
///
/// @throws invalid_encoding on an empty string or a non-hex digit
mpz_class mpz_from_hex(std::string_view hex);
}
