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
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <k1sig/ecdsa.hpp>
#include <k1sig/params.hpp>
#include <k1sig/ec/curve.hpp>

/// @file codec.hpp
/// @brief Byte encodings for keys and signatures, kept outside the core

namespace k1sig::codec {

constexpr size_t compact_size = 2 * params::scalar_bytes;

std::string to_hex(std::span<const uint8_t> bytes);

/// @throws invalid_encoding on odd length or non-hex digits
std::vector<uint8_t> from_hex(std::string_view hex);

/// SEC1: 0x04 || x || y, or 0x02 / 0x03 || x when compressed. The point at
/// infinity is the single byte 0x00.
std::vector<uint8_t> encode_point(const ec::weierstrass_curve& curve,
                                  const ec::curve_point& p,
                                  bool compressed = false);

/// @throws invalid_encoding for a bad prefix, length or coordinate >= p
/// @throws point_not_on_curve if the coordinates are not on the curve
ec::curve_point decode_point(const ec::weierstrass_curve& curve,
                             std::span<const uint8_t> bytes);

/// r || s, 32 bytes each, big-endian
///
/// @throws value_out_of_range if r or s is negative or wider than 32 bytes
std::array<uint8_t, compact_size> encode_compact(const signature& sig);

/// @throws invalid_encoding unless exactly 64 bytes
signature decode_compact(std::span<const uint8_t> bytes);

/// SEQUENCE { INTEGER r, INTEGER s }
std::vector<uint8_t> encode_der(const signature& sig);

/// Strict DER: definite short-form lengths, minimal non-negative integers,
/// no trailing data.
///
/// @throws invalid_encoding
signature decode_der(std::span<const uint8_t> bytes);

}  // namespace k1sig::codec
