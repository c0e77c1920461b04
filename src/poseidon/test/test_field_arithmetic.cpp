#include <gtest/gtest.h>

#include <random>
#include <vector>

#include "../../common/namespace_utils.hpp"
#include "field_arithmetic.hpp"

using namespace Poseidon;

class FieldArithmeticTest : public ::testing::Test {
 protected:
  void SetUp() override {
    FieldConstants::init();
  }

  // Helper function to create known test values
  FieldElement createTestValue(uint64_t v0, uint64_t v1 = 0, uint64_t v2 = 0, uint64_t v3 = 0) {
    FieldElement result;
    result.limbs[0] = v0;
    result.limbs[1] = v1;
    result.limbs[2] = v2;
    result.limbs[3] = v3;
    return result;
  }

  FieldElement modulusMinusOne() {
    FieldElement result;
    FieldArithmetic::subtract(FieldConstants::MODULUS, FieldConstants::ONE, result);
    return result;
  }

  std::mt19937_64 gen_{20240611};
};

TEST_F(FieldArithmeticTest, FieldElementConstruction) {
  FieldElement zero;
  EXPECT_TRUE(zero.is_zero());

  FieldElement one(1);
  EXPECT_FALSE(one.is_zero());
  EXPECT_EQ(one.limbs[0], 1ULL);
  EXPECT_EQ(one.limbs[1], 0ULL);
  EXPECT_EQ(one.limbs[2], 0ULL);
  EXPECT_EQ(one.limbs[3], 0ULL);

  FieldElement copy(one);
  EXPECT_EQ(copy, one);

  copy.set_zero();
  EXPECT_TRUE(copy.is_zero());
}

TEST_F(FieldArithmeticTest, BasicArithmetic) {
  FieldElement a(5);
  FieldElement b(3);

  EXPECT_EQ(a + b, FieldElement(8));
  EXPECT_EQ(a - b, FieldElement(2));
  EXPECT_EQ(a * b, FieldElement(15));
}

TEST_F(FieldArithmeticTest, CompoundAssignment) {
  FieldElement a(10);
  FieldElement b(5);

  FieldElement original_a = a;
  a += b;
  EXPECT_EQ(a, original_a + b);

  a = FieldElement(10);
  a -= b;
  EXPECT_EQ(a, original_a - b);

  a = FieldElement(10);
  a *= b;
  EXPECT_EQ(a, original_a * b);
}

TEST_F(FieldArithmeticTest, ZeroAndOneProperties) {
  FieldElement zero = FieldConstants::ZERO;
  FieldElement one = FieldConstants::ONE;
  FieldElement a = FieldElement::random(gen_);

  EXPECT_EQ(a + zero, a);
  EXPECT_EQ(a - zero, a);
  EXPECT_EQ(a * zero, zero);
  EXPECT_EQ(a * one, a);
  EXPECT_EQ(one * a, a);
  EXPECT_EQ(a - a, zero);
}

TEST_F(FieldArithmeticTest, FieldReduction) {
  FieldElement result;
  FieldArithmetic::add(FieldConstants::MODULUS, FieldConstants::ONE, result);
  EXPECT_EQ(result, FieldConstants::ONE);

  FieldElement wrapped = modulusMinusOne() + FieldConstants::TWO;
  EXPECT_EQ(wrapped, FieldConstants::ONE);

  // (p - 1)^2 = 1
  EXPECT_EQ(modulusMinusOne() * modulusMinusOne(), FieldConstants::ONE);
}

TEST_F(FieldArithmeticTest, MultiplicationKnownValues) {
  // (2^128 - 1)^2 mod p
  FieldElement a = createTestValue(0xFFFFFFFFFFFFFFFFULL, 0xFFFFFFFFFFFFFFFFULL);
  EXPECT_EQ((a * a).to_hex(),
            "0x0e0a77c19a07df2f666ea36f7879462c36fc76959f60cd29ac96341c4ffffffc");

  FieldElement x = FieldElement::from_hex("0xDEADBEEFCAFEBABE1234567890ABCDEF0011223344556677");
  FieldElement y = FieldElement::from_hex("0x0123456789ABCDEFFEDCBA9876543210");
  EXPECT_EQ((x * y).to_hex(),
            "0x2a4eb77fead353e4eeeda7b55276e37633c5eec02c685007377bbe1dfa36d477");
  EXPECT_EQ(x * y, y * x);
}

TEST_F(FieldArithmeticTest, MontgomeryForm) {
  // mont(a, R^2) = a * R mod p; mont(a * R, 1) = a
  FieldElement a = FieldElement::random(gen_);
  FieldElement a_mont, back;
  FieldArithmetic::montgomery_multiply(a, FieldConstants::R_SQUARED, a_mont);
  FieldArithmetic::montgomery_multiply(a_mont, FieldConstants::ONE, back);
  EXPECT_EQ(back, a);

  // R mod p = 2^256 mod p
  FieldElement r;
  FieldArithmetic::montgomery_multiply(FieldConstants::ONE, FieldConstants::R_SQUARED, r);
  EXPECT_EQ(r.to_hex(),
            "0x0e0a77c19a07df2f666ea36f7879462e36fc76959f60cd29ac96341c4ffffffb");
}

TEST_F(FieldArithmeticTest, MultiplicationProperties) {
  for (int i = 0; i < 20; ++i) {
    FieldElement a = FieldElement::random(gen_);
    FieldElement b = FieldElement::random(gen_);
    FieldElement c = FieldElement::random(gen_);

    EXPECT_EQ(a * b, b * a);
    EXPECT_EQ((a * b) * c, a * (b * c));
    EXPECT_EQ(a * (b + c), a * b + a * c);
    EXPECT_TRUE(a * b < FieldConstants::MODULUS);
  }
}

TEST_F(FieldArithmeticTest, PowerFunction) {
  FieldElement base(3);
  FieldElement result;

  const uint64_t zero_exp[4] = {0, 0, 0, 0};
  FieldArithmetic::power(base, zero_exp, result);
  EXPECT_EQ(result, FieldConstants::ONE);

  const uint64_t five[4] = {5, 0, 0, 0};
  FieldArithmetic::power(base, five, result);
  EXPECT_EQ(result, FieldElement(243));

  // Exponent 2^64 spans a limb boundary: 2^(2^64) is 2 squared 64 times
  const uint64_t two_pow_64[4] = {0, 1, 0, 0};
  FieldArithmetic::power(FieldConstants::TWO, two_pow_64, result);
  FieldElement expected = FieldConstants::TWO;
  for (int i = 0; i < 64; ++i) {
    expected = expected * expected;
  }
  EXPECT_EQ(result, expected);

  // Fermat: a^(p-1) = 1
  const uint64_t p_minus_one[4] = {0x43e1f593f0000000ULL, 0x2833e84879b97091ULL,
                                   0xb85045b68181585dULL, 0x30644e72e131a029ULL};
  FieldArithmetic::power(FieldElement::random(gen_), p_minus_one, result);
  EXPECT_EQ(result, FieldConstants::ONE);
}

TEST_F(FieldArithmeticTest, Inverse) {
  // 2^-1 = (p + 1) / 2
  auto half = FieldConstants::TWO.inverse();
  ASSERT_TRUE(half.has_value());
  EXPECT_EQ(half->to_hex(),
            "0x183227397098d014dc2822db40c0ac2e9419f4243cdcb848a1f0fac9f8000001");

  auto third = FieldElement(3).inverse();
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(third->to_hex(),
            "0x2042def740cbc01bd03583cf0100e59370229adafbd0f5b62d414e62a0000001");

  EXPECT_EQ(*FieldConstants::ONE.inverse(), FieldConstants::ONE);
  EXPECT_EQ(*modulusMinusOne().inverse(), modulusMinusOne());

  for (int i = 0; i < 10; ++i) {
    FieldElement a = FieldElement::random(gen_);
    auto inv = a.inverse();
    ASSERT_TRUE(inv.has_value());
    EXPECT_EQ(a * *inv, FieldConstants::ONE);
  }
}

TEST_F(FieldArithmeticTest, InverseOfZero) {
  EXPECT_FALSE(FieldConstants::ZERO.inverse().has_value());

  FieldElement untouched(7);
  EXPECT_FALSE(FieldArithmetic::inverse(FieldConstants::ZERO, untouched));
  EXPECT_EQ(untouched, FieldElement(7));
}

TEST_F(FieldArithmeticTest, Negation) {
  FieldElement a(5);
  FieldElement neg_a;
  FieldArithmetic::subtract(FieldConstants::MODULUS, a, neg_a);

  EXPECT_EQ(a + neg_a, FieldConstants::ZERO);
  EXPECT_EQ(FieldConstants::ZERO - a, neg_a);
}

TEST_F(FieldArithmeticTest, Comparison) {
  FieldElement a(5);
  FieldElement b(10);
  FieldElement c(5);

  EXPECT_TRUE(a < b);
  EXPECT_FALSE(b < a);
  EXPECT_FALSE(a < c);

  EXPECT_TRUE(a == c);
  EXPECT_FALSE(a == b);

  EXPECT_TRUE(a != b);
  EXPECT_FALSE(a != c);

  // Ordering is decided by the most significant limb
  EXPECT_TRUE(createTestValue(0xFFFFFFFFFFFFFFFFULL) < createTestValue(0, 1));
}

TEST_F(FieldArithmeticTest, HexConversion) {
  FieldElement a(0x123456789ABCDEFULL);
  EXPECT_EQ(a.to_hex(),
            "0x0000000000000000000000000000000000000000000000000123456789abcdef");
  EXPECT_EQ(FieldElement::from_hex(a.to_hex()), a);

  // Without prefix, short input
  EXPECT_EQ(FieldElement::from_hex("ff"), FieldElement(255));

  // Inputs at or above the modulus are reduced
  EXPECT_TRUE(FieldElement::from_hex(FieldConstants::MODULUS.to_hex()).is_zero());
  EXPECT_EQ(FieldElement::from_hex(
                "0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000003"),
            FieldConstants::TWO);
}

TEST_F(FieldArithmeticTest, DecimalConversion) {
  EXPECT_EQ(FieldConstants::ZERO.to_dec(), "0");
  EXPECT_EQ(FieldConstants::ONE.to_dec(), "1");
  EXPECT_EQ(FieldConstants::TWO.to_dec(), "2");
  EXPECT_EQ(FieldElement(123456789ULL).to_dec(), "123456789");
  EXPECT_EQ(FieldElement(0x123456789ABCDEFULL).to_dec(), "81985529216486895");

  EXPECT_EQ(FieldConstants::MODULUS.to_dec(),
            "21888242871839275222246405745257275088548364400416034"
            "343698204186575808495617");
}

TEST_F(FieldArithmeticTest, RandomGeneration) {
  FieldElement r1 = FieldElement::random();
  FieldElement r2 = FieldElement::random();

  // Very unlikely to be equal (but not impossible)
  EXPECT_NE(r1, r2);
  EXPECT_TRUE(r1 < FieldConstants::MODULUS);
  EXPECT_TRUE(r2 < FieldConstants::MODULUS);

  // Seeded generation is reproducible
  std::mt19937_64 gen1(99), gen2(99);
  for (int i = 0; i < 5; ++i) {
    FieldElement s1 = FieldElement::random(gen1);
    EXPECT_EQ(s1, FieldElement::random(gen2));
    EXPECT_TRUE(s1 < FieldConstants::MODULUS);
  }
}

TEST_F(FieldArithmeticTest, FieldIdentityProperties) {
  FieldElement zero = FieldConstants::ZERO;
  FieldElement one = FieldConstants::ONE;
  FieldElement two = FieldConstants::TWO;

  EXPECT_EQ((zero + one) - one, zero) << "(ZERO + ONE) - ONE should equal ZERO";
  EXPECT_EQ(one - one, zero);
  EXPECT_EQ(zero - zero, zero);
  EXPECT_EQ(two - one, one);
  EXPECT_EQ(one + one, two);

  FieldElement a(5), b(3), c(7);
  EXPECT_EQ((a + b) + c, a + (b + c)) << "Addition should be associative";
  EXPECT_EQ((a - b) + b, a) << "a - b + b should equal a";
}

TEST_F(FieldArithmeticTest, SubtractionEdgeCases) {
  FieldElement small(5);
  FieldElement large(10);

  // small - large wraps around the modulus
  FieldElement result = small - large;
  EXPECT_EQ(result + large, small) << "Modular subtraction should satisfy (a - b) + b = a";

  FieldElement zero_minus_one = FieldConstants::ZERO - FieldConstants::ONE;
  EXPECT_EQ(zero_minus_one, modulusMinusOne()) << "ZERO - ONE should equal MODULUS - ONE";

  // Borrow has to ripple through every limb
  FieldElement high = createTestValue(0, 0, 0, 1);
  FieldElement low = createTestValue(1);
  FieldElement diff = high - low;
  EXPECT_EQ(diff, createTestValue(0xFFFFFFFFFFFFFFFFULL, 0xFFFFFFFFFFFFFFFFULL,
                                  0xFFFFFFFFFFFFFFFFULL, 0));
}

TEST_F(FieldArithmeticTest, CoefficientAccumulation) {
  // 1 - 2 - 3 + 4 = 0
  FieldElement result = FieldConstants::ZERO;

  result += FieldElement(1);
  EXPECT_EQ(result.to_dec(), "1");

  result += (FieldConstants::ZERO - FieldElement(2));
  EXPECT_EQ(result.to_dec(), "2188824287183927522224640574525727508854836440041"
                             "6034343698204186575808495616");

  result += (FieldConstants::ZERO - FieldElement(3));
  EXPECT_EQ(result.to_dec(), "2188824287183927522224640574525727508854836440041"
                             "6034343698204186575808495613");

  result += FieldElement(4);
  EXPECT_TRUE(result.is_zero()) << "Result should be zero: " << result.to_dec();
}

TEST_F(FieldArithmeticTest, OutParameterOperations) {
  USING_FIELD_OPS()
  USING_FIELD_CONSTANTS()

  FieldElement a = FieldElement::random(gen_);
  FieldElement b = FieldElement::random(gen_);
  FieldElement out;

  add(a, b, out);
  EXPECT_EQ(out, a + b);
  subtract(a, b, out);
  EXPECT_EQ(out, a - b);
  multiply(a, b, out);
  EXPECT_EQ(out, a * b);
  square(a, out);
  EXPECT_EQ(out, a * a);

  // Results may alias operands
  FieldElement acc = a;
  multiply(acc, acc, acc);
  EXPECT_EQ(acc, a * a);

  ASSERT_TRUE(inverse(a, out));
  multiply(a, out, out);
  EXPECT_EQ(out, ONE);
  EXPECT_NE(MODULUS, ZERO);
}
