// tests/k1sig/test_codec.cpp
#define BOOST_TEST_MODULE Codec_Tests
#include <boost/test/included/unit_test.hpp>
#include <gmpxx.h>
#include <k1sig/codec.hpp>
#include <k1sig/ecdsa.hpp>
#include <k1sig/error.hpp>
#include <k1sig/keys.hpp>
#include <k1sig/nonce.hpp>
#include <k1sig/ec/curve.hpp>
#include <util/mpz_bytes.hpp>
#include <string>
#include <vector>

using namespace k1sig;

namespace {

const ec::weierstrass_curve& curve = ec::secp256k1();

const std::string gx = std::string(ec::secp256k1_constants::gx);
const std::string gy = std::string(ec::secp256k1_constants::gy);

const char *satoshi_der =
    "3045022100934b1ea10a4b3c1757e2b0c017d0b6143ce3c9a7e6a4a49860d7a6ab210ee3d8"
    "02202442ce9d2b916064108014783e923ec36b49743e2ffa1c4496f01a512aafd9e5";

signature satoshi_signature() {
    return signature{
        mpz_from_hex("934b1ea10a4b3c1757e2b0c017d0b6143ce3c9a7e6a4a49860d7a6ab210ee3d8"),
        mpz_from_hex("2442ce9d2b916064108014783e923ec36b49743e2ffa1c4496f01a512aafd9e5") };
}

ec::curve_point decode_hex_point(const std::string& hex) {
    return codec::decode_point(curve, codec::from_hex(hex));
}

signature decode_hex_der(const std::string& hex) {
    return codec::decode_der(codec::from_hex(hex));
}

}  // namespace

// ============================================================================
// Test Suite: hex helpers
// ============================================================================

BOOST_AUTO_TEST_SUITE(Hex_Tests)

BOOST_AUTO_TEST_CASE(to_hex_lowercase) {
    const std::vector<uint8_t> bytes = { 0x00, 0xab, 0xcd, 0xef };
    BOOST_CHECK_EQUAL(codec::to_hex(bytes), "00abcdef");
    BOOST_CHECK_EQUAL(codec::to_hex({}), "");
}

BOOST_AUTO_TEST_CASE(from_hex_with_prefix) {
    const auto bytes = codec::from_hex("0xDEADbeef");
    const std::vector<uint8_t> expected = { 0xde, 0xad, 0xbe, 0xef };
    BOOST_CHECK_EQUAL_COLLECTIONS(bytes.begin(), bytes.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(from_hex_rejects_bad_input) {
    BOOST_CHECK_THROW(codec::from_hex("abc"), invalid_encoding);
    BOOST_CHECK_THROW(codec::from_hex("zz"), invalid_encoding);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: SEC1 points
// ============================================================================

BOOST_AUTO_TEST_SUITE(Point_Encoding_Tests)

BOOST_AUTO_TEST_CASE(uncompressed_generator) {
    const auto bytes = codec::encode_point(curve, curve.generator());
    BOOST_CHECK_EQUAL(bytes.size(), 65u);
    BOOST_CHECK_EQUAL(codec::to_hex(bytes), "04" + gx + gy);
    BOOST_CHECK_EQUAL(decode_hex_point("04" + gx + gy), curve.generator());
}

BOOST_AUTO_TEST_CASE(compressed_generator) {
    BOOST_CHECK_EQUAL(codec::to_hex(codec::encode_point(curve, curve.generator(), true)), "02" + gx);
    BOOST_CHECK_EQUAL(decode_hex_point("02" + gx), curve.generator());
    BOOST_CHECK_EQUAL(decode_hex_point("03" + gx), curve.point_negate(curve.generator()));
}

BOOST_AUTO_TEST_CASE(compressed_odd_key) {
    const auto q = derive_public_key(curve, curve.scalars().from_integer(0x3424));
    const std::string expected =
        "03ebff929675563a375f7cb0a46c43ba97647b3cbe12fc96421d2a210f230dc67d";

    BOOST_CHECK_EQUAL(codec::to_hex(codec::encode_point(curve, q, true)), expected);
    BOOST_CHECK_EQUAL(decode_hex_point(expected), q);
}

BOOST_AUTO_TEST_CASE(infinity) {
    const auto bytes = codec::encode_point(curve, ec::curve_point::infinity());
    BOOST_CHECK_EQUAL(codec::to_hex(bytes), "00");
    BOOST_CHECK(decode_hex_point("00").is_infinity());
}

BOOST_AUTO_TEST_CASE(malformed_encodings) {
    BOOST_CHECK_THROW(codec::decode_point(curve, {}), invalid_encoding);
    BOOST_CHECK_THROW(decode_hex_point("0000"), invalid_encoding);
    BOOST_CHECK_THROW(decode_hex_point("05" + gx), invalid_encoding);
    BOOST_CHECK_THROW(decode_hex_point("02" + gx + "00"), invalid_encoding);
    BOOST_CHECK_THROW(decode_hex_point("04" + gx), invalid_encoding);
    BOOST_CHECK_THROW(decode_hex_point("02" + std::string(ec::secp256k1_constants::p)), invalid_encoding);
}

BOOST_AUTO_TEST_CASE(points_off_curve) {
    // x = 5 has no y on the curve
    BOOST_CHECK_THROW(decode_hex_point("02" + mpz_to_hex(mpz_class(5), 32)), point_not_on_curve);
    BOOST_CHECK_THROW(decode_hex_point("04" + gx + gx), point_not_on_curve);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: signature encodings
// ============================================================================

BOOST_AUTO_TEST_SUITE(Signature_Encoding_Tests)

BOOST_AUTO_TEST_CASE(der_known_vector) {
    BOOST_CHECK_EQUAL(codec::to_hex(codec::encode_der(satoshi_signature())), satoshi_der);
    BOOST_CHECK(decode_hex_der(satoshi_der) == satoshi_signature());
}

BOOST_AUTO_TEST_CASE(der_small_integers) {
    const signature sig{ mpz_class(1), mpz_class(0x80) };
    BOOST_CHECK_EQUAL(codec::to_hex(codec::encode_der(sig)), "300702010102020080");
    BOOST_CHECK(decode_hex_der("300702010102020080") == sig);
}

BOOST_AUTO_TEST_CASE(der_strictness) {
    BOOST_CHECK_THROW(decode_hex_der(""), invalid_encoding);
    BOOST_CHECK_THROW(decode_hex_der("310702010102020080"), invalid_encoding);    // not a SEQUENCE
    BOOST_CHECK_THROW(decode_hex_der("30070201010202008000"), invalid_encoding);  // trailing byte
    BOOST_CHECK_THROW(decode_hex_der("3009020101020200800500"), invalid_encoding);  // data after s
    BOOST_CHECK_THROW(decode_hex_der("30080202000102020080"), invalid_encoding);  // non-minimal r
    BOOST_CHECK_THROW(decode_hex_der("3006020181020101"), invalid_encoding);      // negative r
    BOOST_CHECK_THROW(decode_hex_der("30050200020101"), invalid_encoding);        // empty r
    BOOST_CHECK_THROW(decode_hex_der("3003020101"), invalid_encoding);            // missing s
}

BOOST_AUTO_TEST_CASE(der_rejects_negative_values) {
    BOOST_CHECK_THROW(codec::encode_der(signature{ mpz_class(-1), mpz_class(1) }), value_out_of_range);
}

BOOST_AUTO_TEST_CASE(compact_layout) {
    const auto bytes = codec::encode_compact(satoshi_signature());
    BOOST_CHECK_EQUAL(codec::to_hex(bytes),
                      "934b1ea10a4b3c1757e2b0c017d0b6143ce3c9a7e6a4a49860d7a6ab210ee3d8"
                      "2442ce9d2b916064108014783e923ec36b49743e2ffa1c4496f01a512aafd9e5");
    BOOST_CHECK(codec::decode_compact(bytes) == satoshi_signature());
}

BOOST_AUTO_TEST_CASE(compact_errors) {
    const std::vector<uint8_t> short_input(63, 0x01);
    BOOST_CHECK_THROW(codec::decode_compact(short_input), invalid_encoding);

    const signature too_wide{ mpz_class(1) << 256, mpz_class(1) };
    BOOST_CHECK_THROW(codec::encode_compact(too_wide), value_out_of_range);
}

BOOST_AUTO_TEST_CASE(signed_then_encoded) {
    const auto kp = key_pair::from_private_key(curve, curve.scalars().from_integer(0x3424));
    rfc6979_nonce_source nonces;
    const auto sig = sign_message(curve, kp.private_key(), "hello-world", nonces);

    const auto q = codec::decode_point(curve, codec::encode_point(curve, kp.public_key(), true));
    const auto from_der = codec::decode_der(codec::encode_der(sig));
    const auto from_compact = codec::decode_compact(codec::encode_compact(sig));

    BOOST_CHECK(verify_message(curve, q, "hello-world", from_der));
    BOOST_CHECK(verify_message(curve, q, "hello-world", from_compact));
}

BOOST_AUTO_TEST_SUITE_END()
