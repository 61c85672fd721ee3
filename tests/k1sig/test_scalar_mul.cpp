// tests/k1sig/test_scalar_mul.cpp
#define BOOST_TEST_MODULE Scalar_Mul_Tests
#include <boost/test/included/unit_test.hpp>
#include <gmpxx.h>
#include <k1sig/error.hpp>
#include <k1sig/ec/curve.hpp>

using namespace k1sig;
using namespace k1sig::ec;

namespace {

const weierstrass_curve& curve = secp256k1();

scalar_field_element scalar(unsigned long v) {
    return curve.scalars().from_integer(v);
}

}  // namespace

// ============================================================================
// Test Suite: edge multipliers
// ============================================================================

BOOST_AUTO_TEST_SUITE(Edge_Multiplier_Tests)

BOOST_AUTO_TEST_CASE(zero_times_point_is_infinity) {
    BOOST_CHECK(curve.scalar_mul(curve.scalars().zero(), curve.generator()).is_infinity());
    BOOST_CHECK(curve.multiply(mpz_class(0), curve.generator()).is_infinity());
}

BOOST_AUTO_TEST_CASE(one_times_point_is_point) {
    BOOST_CHECK_EQUAL(curve.scalar_mul(curve.scalars().one(), curve.generator()), curve.generator());
    BOOST_CHECK_EQUAL(curve.scalar_mul_generator(scalar(1)), curve.generator());
}

BOOST_AUTO_TEST_CASE(multiple_of_infinity) {
    BOOST_CHECK(curve.scalar_mul(scalar(12345), curve_point::infinity()).is_infinity());
}

BOOST_AUTO_TEST_CASE(order_times_generator_is_infinity) {
    BOOST_CHECK(curve.multiply(curve.n(), curve.generator()).is_infinity());
}

BOOST_AUTO_TEST_CASE(order_minus_one_is_negated_generator) {
    const auto p = curve.scalar_mul_generator(curve.scalars().from_integer(curve.n() - 1));

    BOOST_CHECK_EQUAL(p, curve.point_negate(curve.generator()));
    BOOST_CHECK_EQUAL(p.y().to_hex(),
                      "b7c52588d95c3b9aa25b0403f1eef75702e84bb7597aabe663b82f6f04ef2777");
}

BOOST_AUTO_TEST_CASE(order_plus_one_wraps) {
    BOOST_CHECK_EQUAL(curve.multiply(curve.n() + 1, curve.generator()), curve.generator());
}

BOOST_AUTO_TEST_CASE(negative_multiplier_throws) {
    BOOST_CHECK_THROW(curve.multiply(mpz_class(-3), curve.generator()), value_out_of_range);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: known multiples
// ============================================================================

BOOST_AUTO_TEST_SUITE(Known_Multiple_Tests)

BOOST_AUTO_TEST_CASE(seven_g) {
    const auto expected = curve.make_point(
        "5cbdf0646e5db4eaa398f365f2ea7a0e3d419b7e0330e39ce92bddedcac4f9bc",
        "6aebca40ba255960a3178d6d861a54dba813d0b813fde7b5a5082628087264da");
    BOOST_CHECK_EQUAL(curve.scalar_mul_generator(scalar(7)), expected);
}

BOOST_AUTO_TEST_CASE(matches_repeated_addition) {
    curve_point acc;
    for (unsigned long k = 1; k <= 16; ++k) {
        acc = curve.point_add(acc, curve.generator());
        BOOST_CHECK_EQUAL(curve.scalar_mul_generator(scalar(k)), acc);
    }
}

BOOST_AUTO_TEST_CASE(distributes_over_scalar_addition) {
    const auto a = curve.scalars().from_hex("3424");
    const auto b = curve.scalars().from_hex(
        "8f8a276c19f4149656b280621e358cce24f5f52542772691ee69063b74f15d15");

    BOOST_CHECK_EQUAL(curve.scalar_mul_generator(curve.scalars().add(a, b)),
                      curve.point_add(curve.scalar_mul_generator(a), curve.scalar_mul_generator(b)));
}

BOOST_AUTO_TEST_CASE(composes_multiplications) {
    const auto q = curve.scalar_mul_generator(scalar(0x3424));
    BOOST_CHECK_EQUAL(curve.scalar_mul(scalar(9), q), curve.scalar_mul_generator(scalar(9 * 0x3424)));
}

BOOST_AUTO_TEST_CASE(mul_add_combines) {
    const auto q = curve.scalar_mul_generator(scalar(5));
    BOOST_CHECK_EQUAL(curve.mul_add(scalar(2), scalar(3), q), curve.scalar_mul_generator(scalar(17)));
    BOOST_CHECK(curve.mul_add(curve.scalars().zero(), curve.scalars().zero(), q).is_infinity());
}

BOOST_AUTO_TEST_CASE(toy_curve_order) {
    // y^2 = x^3 + 4x + 4 over F_103, prime order 113
    const weierstrass_curve toy{ base_field{ mpz_class(103) }, scalar_field{ mpz_class(113) },
                                 mpz_class(4), mpz_class(4), mpz_class(0), mpz_class(2) };

    BOOST_CHECK(toy.multiply(toy.n(), toy.generator()).is_infinity());

    const auto p = toy.multiply(mpz_class(5), toy.generator());
    BOOST_CHECK_EQUAL(p.x().data(), mpz_class(57));
    BOOST_CHECK_EQUAL(p.y().data(), mpz_class(98));

    const auto q = toy.multiply(mpz_class(112), toy.generator());
    BOOST_CHECK_EQUAL(q.x().data(), mpz_class(0));
    BOOST_CHECK_EQUAL(q.y().data(), mpz_class(101));
}

BOOST_AUTO_TEST_SUITE_END()
