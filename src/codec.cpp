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

#include <iterator>
#include <string>

#include <boost/algorithm/hex.hpp>

#include <k1sig/codec.hpp>
#include <k1sig/error.hpp>
#include <util/mpz_bytes.hpp>

namespace k1sig::codec {

namespace {

constexpr uint8_t sec1_infinity     = 0x00;
constexpr uint8_t sec1_even         = 0x02;
constexpr uint8_t sec1_odd          = 0x03;
constexpr uint8_t sec1_uncompressed = 0x04;

constexpr uint8_t der_sequence = 0x30;
constexpr uint8_t der_integer  = 0x02;

void der_append_integer(std::vector<uint8_t>& out, const mpz_class& v) {
    if (sgn(v) < 0)
        throw value_out_of_range("DER integer must be non-negative");

    const size_t width = (sgn(v) == 0) ? 1 : (mpz_sizeinbase(v.get_mpz_t(), 2) + 7) / 8;
    auto body = mpz_to_bytes(v, width);
    if (body.front() & 0x80)
        body.insert(body.begin(), 0x00);

    out.push_back(der_integer);
    out.push_back(static_cast<uint8_t>(body.size()));
    out.insert(out.end(), body.begin(), body.end());
}

mpz_class der_read_integer(std::span<const uint8_t>& in) {
    if (in.size() < 2 || in[0] != der_integer)
        throw invalid_encoding("DER: expected INTEGER");

    const size_t len = in[1];
    if (len == 0 || len & 0x80 || len > in.size() - 2)
        throw invalid_encoding("DER: bad INTEGER length");

    auto body = in.subspan(2, len);
    if (body[0] & 0x80)
        throw invalid_encoding("DER: negative INTEGER");
    if (len > 1 && body[0] == 0x00 && !(body[1] & 0x80))
        throw invalid_encoding("DER: non-minimal INTEGER");

    in = in.subspan(2 + len);
    return mpz_from_bytes(body);
}

}  // namespace

std::string to_hex(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), std::back_inserter(out));
    return out;
}

std::vector<uint8_t> from_hex(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X"))
        hex.remove_prefix(2);

    std::vector<uint8_t> out;
    try {
        boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(out));
    }
    catch (const boost::algorithm::hex_decode_error&) {
        throw invalid_encoding("invalid hex string \"" + std::string(hex) + "\"");
    }
    return out;
}

std::vector<uint8_t> encode_point(const ec::weierstrass_curve& curve,
                                  const ec::curve_point& p,
                                  bool compressed) {
    if (p.is_infinity())
        return { sec1_infinity };

    const size_t width = curve.base().num_bytes();
    std::vector<uint8_t> out;
    out.reserve(1 + 2 * width);

    out.push_back(compressed ? (p.y().is_odd() ? sec1_odd : sec1_even) : sec1_uncompressed);

    const auto x = mpz_to_bytes(p.x().data(), width);
    out.insert(out.end(), x.begin(), x.end());

    if (!compressed) {
        const auto y = mpz_to_bytes(p.y().data(), width);
        out.insert(out.end(), y.begin(), y.end());
    }
    return out;
}

ec::curve_point decode_point(const ec::weierstrass_curve& curve,
                             std::span<const uint8_t> bytes) {
    if (bytes.empty())
        throw invalid_encoding("SEC1: empty point encoding");

    const auto& fp = curve.base();
    const size_t width = fp.num_bytes();

    auto coordinate = [&](std::span<const uint8_t> raw) {
        const mpz_class v = mpz_from_bytes(raw);
        if (!fp.contains(v))
            throw invalid_encoding("SEC1: coordinate not below p");
        return fp.from_integer(v);
    };

    switch (bytes[0]) {
    case sec1_infinity:
        if (bytes.size() != 1)
            throw invalid_encoding("SEC1: trailing bytes after infinity");
        return ec::curve_point::infinity();

    case sec1_even:
    case sec1_odd: {
        if (bytes.size() != 1 + width)
            throw invalid_encoding("SEC1: compressed point must be " + std::to_string(1 + width) + " bytes");

        auto p = curve.lift_x(coordinate(bytes.subspan(1, width)), bytes[0] == sec1_odd);
        if (!p)
            throw point_not_on_curve("SEC1: x has no matching point on the curve");
        return *p;
    }

    case sec1_uncompressed:
        if (bytes.size() != 1 + 2 * width)
            throw invalid_encoding("SEC1: uncompressed point must be " + std::to_string(1 + 2 * width) + " bytes");
        return curve.make_point(coordinate(bytes.subspan(1, width)),
                                coordinate(bytes.subspan(1 + width, width)));

    default:
        throw invalid_encoding("SEC1: unknown prefix byte");
    }
}

std::array<uint8_t, compact_size> encode_compact(const signature& sig) {
    std::array<uint8_t, compact_size> out{};
    std::span<uint8_t> view{out};
    mpz_to_bytes(sig.r, view.first(params::scalar_bytes));
    mpz_to_bytes(sig.s, view.last(params::scalar_bytes));
    return out;
}

signature decode_compact(std::span<const uint8_t> bytes) {
    if (bytes.size() != compact_size)
        throw invalid_encoding("compact signature must be " + std::to_string(compact_size) + " bytes");

    return signature{ mpz_from_bytes(bytes.first(params::scalar_bytes)),
                      mpz_from_bytes(bytes.last(params::scalar_bytes)) };
}

std::vector<uint8_t> encode_der(const signature& sig) {
    std::vector<uint8_t> body;
    der_append_integer(body, sig.r);
    der_append_integer(body, sig.s);

    if (body.size() >= 0x80)
        throw value_out_of_range("DER: signature too long for short-form length");

    std::vector<uint8_t> out{ der_sequence, static_cast<uint8_t>(body.size()) };
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

signature decode_der(std::span<const uint8_t> bytes) {
    if (bytes.size() < 2 || bytes[0] != der_sequence)
        throw invalid_encoding("DER: expected SEQUENCE");

    const size_t len = bytes[1];
    if (len & 0x80 || len != bytes.size() - 2)
        throw invalid_encoding("DER: bad SEQUENCE length");

    auto in = bytes.subspan(2);
    mpz_class r = der_read_integer(in);
    mpz_class s = der_read_integer(in);

    if (!in.empty())
        throw invalid_encoding("DER: trailing data");

    return signature{ std::move(r), std::move(s) };
}

}  // namespace k1sig::codec
