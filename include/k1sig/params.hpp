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

namespace k1sig::params {

constexpr size_t scalar_bytes = 32;  // big-endian width of p, n and every coordinate
constexpr size_t scalar_bits  = scalar_bytes * 8;

// Retry ceilings keep every loop bounded. Hitting either one with a sound
// source is astronomically unlikely.
constexpr size_t max_sign_attempts   = 64;
constexpr size_t max_sample_attempts = 128;

// Miller-Rabin rounds for field moduli
constexpr int primality_rounds = 32;

// Signer always emits s <= n / 2
constexpr bool low_s_signatures = true;

// Keystream IV of the seeded AES-256-CTR engine. Counter mode, so only the
// key matters.
constexpr unsigned char seeded_iv[16] = { 0 };

}  // namespace k1sig::params
