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

#include <algorithm>
#include <cctype>

#include <k1sig/error.hpp>
#include <util/mpz_bytes.hpp>

namespace k1sig
{
void mpz_to_bytes(const mpz_class& val, std::span<uint8_t> out)
{
  if (sgn(val) < 0)
    throw value_out_of_range("cannot encode a negative integer");

  const size_t num_bytes = (sgn(val) == 0) ? 0 : (mpz_sizeinbase(val.get_mpz_t(), 2) + 7) / 8;
  if (num_bytes > out.size())
    throw value_out_of_range("integer does not fit in " + std::to_string(out.size()) + " bytes");

  std::fill(out.begin(), out.end(), uint8_t{0});

  size_t count = 0;
  mpz_export(out.data() + (out.size() - num_bytes), &count, 1, 1, 1, 0, val.get_mpz_t());
}

std::vector<uint8_t> mpz_to_bytes(const mpz_class& val, size_t width)
{
  std::vector<uint8_t> out(width, 0);
  mpz_to_bytes(val, std::span<uint8_t>{out});
  return out;
}

mpz_class mpz_from_bytes(std::span<const uint8_t> bytes)
{
  mpz_class ret;
  if (!bytes.empty())
    mpz_import(ret.get_mpz_t(), bytes.size(), 1, 1, 1, 0, bytes.data());
  return ret;
}

std::string mpz_to_hex(const mpz_class& val, size_t width)
{
  if (sgn(val) < 0)
    throw value_out_of_range("cannot encode a negative integer");

  std::string digits = val.get_str(16);
  if (digits.size() > 2 * width)
    throw value_out_of_range("integer does not fit in " + std::to_string(width) + " bytes");

  return std::string(2 * width - digits.size(), '0') + digits;
}

mpz_class mpz_from_hex(std::string_view hex)
{
  if (hex.starts_with("0x") || hex.starts_with("0X"))
    hex.remove_prefix(2);

  if (hex.empty())
    throw invalid_encoding("empty hex string");

  // mpz_set_str skips white space, reject it here
  const bool all_hex = std::all_of(hex.begin(), hex.end(), [](char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
  });
  if (!all_hex)
    throw invalid_encoding("invalid hex digit in \"" + std::string(hex) + "\"");

  mpz_class ret;
  if (ret.set_str(std::string(hex), 16) != 0)
    throw invalid_encoding("invalid hex string \"" + std::string(hex) + "\"");
  return ret;
}
}
