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

#include <k1sig/error.hpp>

namespace k1sig {

const char* to_string(errc code) {
    switch (code) {
    case errc::value_out_of_range:       return "value out of range";
    case errc::non_invertible:           return "non-invertible element";
    case errc::degenerate_nonce:         return "degenerate nonce";
    case errc::invalid_private_key:      return "invalid private key";
    case errc::insufficient_entropy:     return "insufficient entropy";
    case errc::invalid_signature_format: return "invalid signature format";
    case errc::point_not_on_curve:       return "point not on curve";
    case errc::invalid_encoding:         return "invalid encoding";
    }
    return "unknown error";
}

}  // namespace k1sig
