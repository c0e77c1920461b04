#include "field_arithmetic.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>

namespace Poseidon {

// BN254 scalar field modulus
namespace FieldConstants {
const FieldElement MODULUS = FieldElement(0x43e1f593f0000001ULL,
                                          0x2833e84879b97091ULL,
                                          0xb85045b68181585dULL,
                                          0x30644e72e131a029ULL);
const FieldElement ZERO = FieldElement(0, 0, 0, 0);
const FieldElement ONE = FieldElement(1, 0, 0, 0);
const FieldElement TWO = FieldElement(2, 0, 0, 0);
const FieldElement R_SQUARED = FieldElement(0x1bb8e645ae216da7ULL,
                                            0x53fe3ab1e35c59e3ULL,
                                            0x8c49833d53bb8085ULL,
                                            0x0216d0b17f4e44a5ULL);

void init() {
  // Constants are statically initialized above
}
}  // namespace FieldConstants

namespace {
// p - 2, the Fermat inversion exponent
const uint64_t INVERSION_EXPONENT[4] = {0x43e1f593efffffffULL,
                                        0x2833e84879b97091ULL,
                                        0xb85045b68181585dULL,
                                        0x30644e72e131a029ULL};
}  // namespace

// FieldElement implementation
FieldElement::FieldElement() {
  std::memset(limbs, 0, sizeof(limbs));
}

FieldElement::FieldElement(uint64_t value) {
  limbs[0] = value;
  limbs[1] = 0;
  limbs[2] = 0;
  limbs[3] = 0;
}

FieldElement::FieldElement(uint64_t v0, uint64_t v1, uint64_t v2, uint64_t v3) {
  limbs[0] = v0;
  limbs[1] = v1;
  limbs[2] = v2;
  limbs[3] = v3;
}

FieldElement::FieldElement(const FieldElement& other) {
  std::memcpy(limbs, other.limbs, sizeof(limbs));
}

FieldElement& FieldElement::operator=(const FieldElement& other) {
  if (this != &other) {
    std::memcpy(limbs, other.limbs, sizeof(limbs));
  }
  return *this;
}

bool FieldElement::operator==(const FieldElement& other) const {
  return std::memcmp(limbs, other.limbs, sizeof(limbs)) == 0;
}

bool FieldElement::operator!=(const FieldElement& other) const {
  return !(*this == other);
}

bool FieldElement::operator<(const FieldElement& other) const {
  for (int i = 3; i >= 0; --i) {
    if (limbs[i] < other.limbs[i]) return true;
    if (limbs[i] > other.limbs[i]) return false;
  }
  return false;
}

FieldElement FieldElement::operator+(const FieldElement& other) const {
  FieldElement result;
  FieldArithmetic::add(*this, other, result);
  return result;
}

FieldElement FieldElement::operator-(const FieldElement& other) const {
  FieldElement result;
  FieldArithmetic::subtract(*this, other, result);
  return result;
}

FieldElement FieldElement::operator*(const FieldElement& other) const {
  FieldElement result;
  FieldArithmetic::multiply(*this, other, result);
  return result;
}

FieldElement& FieldElement::operator+=(const FieldElement& other) {
  FieldArithmetic::add(*this, other, *this);
  return *this;
}

FieldElement& FieldElement::operator-=(const FieldElement& other) {
  FieldArithmetic::subtract(*this, other, *this);
  return *this;
}

FieldElement& FieldElement::operator*=(const FieldElement& other) {
  FieldArithmetic::multiply(*this, other, *this);
  return *this;
}

std::optional<FieldElement> FieldElement::inverse() const {
  FieldElement result;
  if (!FieldArithmetic::inverse(*this, result)) {
    return std::nullopt;
  }
  return result;
}

std::string FieldElement::to_hex() const {
  std::stringstream ss;
  ss << "0x";
  for (int i = 3; i >= 0; --i) {
    ss << std::hex << std::setw(16) << std::setfill('0') << limbs[i];
  }
  return ss.str();
}

std::string FieldElement::to_dec() const {
  if (is_zero()) {
    return "0";
  }

  FieldElement temp = *this;
  std::string result;

  // Repeatedly divide by 10 and collect remainders
  while (!temp.is_zero()) {
    uint64_t remainder = 0;
    for (int i = 3; i >= 0; --i) {
      __uint128_t current = (static_cast<__uint128_t>(remainder) << 64) | temp.limbs[i];
      temp.limbs[i] = static_cast<uint64_t>(current / 10);
      remainder = static_cast<uint64_t>(current % 10);
    }
    result = char('0' + remainder) + result;
  }

  return result;
}

FieldElement FieldElement::from_hex(const std::string& hex) {
  FieldElement result;
  std::string clean_hex = hex;
  if (clean_hex.substr(0, 2) == "0x" || clean_hex.substr(0, 2) == "0X") {
    clean_hex = clean_hex.substr(2);
  }

  // Pad to 64 characters (256 bits)
  while (clean_hex.length() < 64) {
    clean_hex = "0" + clean_hex;
  }

  for (int i = 0; i < 4; ++i) {
    std::string limb_str = clean_hex.substr((3 - i) * 16, 16);
    result.limbs[i] = std::stoull(limb_str, nullptr, 16);
  }

  FieldArithmetic::reduce(result);
  return result;
}

FieldElement FieldElement::random() {
  return FieldArithmetic::random();
}

FieldElement FieldElement::random(std::mt19937_64& gen) {
  return FieldArithmetic::random(gen);
}

bool FieldElement::is_zero() const {
  return limbs[0] == 0 && limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0;
}

void FieldElement::set_zero() {
  std::memset(limbs, 0, sizeof(limbs));
}

// Field arithmetic implementation
namespace FieldArithmetic {

void add(const FieldElement& a, const FieldElement& b, FieldElement& result) {
  // Both operands are < p < 2^254, so the sum never leaves 256 bits
  uint64_t carry = 0;
  for (int i = 0; i < 4; ++i) {
    __uint128_t sum = (__uint128_t)a.limbs[i] + (__uint128_t)b.limbs[i] + (__uint128_t)carry;
    result.limbs[i] = (uint64_t)sum;
    carry = (uint64_t)(sum >> 64);
  }
  reduce(result);
}

void subtract(const FieldElement& a, const FieldElement& b, FieldElement& result) {
  // If a < b, we need to add the modulus first
  if (a < b) {
    FieldElement temp;
    uint64_t carry = 0;
    for (int i = 0; i < 4; ++i) {
      __uint128_t sum = (__uint128_t)a.limbs[i] + (__uint128_t)FieldConstants::MODULUS.limbs[i] + (__uint128_t)carry;
      temp.limbs[i] = (uint64_t)sum;
      carry = (uint64_t)(sum >> 64);
    }
    subtract_internal(temp, b, result);
  } else {
    subtract_internal(a, b, result);
  }
}

void subtract_internal(const FieldElement& a, const FieldElement& b, FieldElement& result) {
  uint64_t borrow = 0;
  for (int i = 0; i < 4; ++i) {
    __uint128_t diff = (__uint128_t)a.limbs[i] - (__uint128_t)b.limbs[i] - (__uint128_t)borrow;
    result.limbs[i] = (uint64_t)diff;
    borrow = (uint64_t)(diff >> 127);
  }
}

void montgomery_multiply(const FieldElement& a, const FieldElement& b, FieldElement& result) {
  const uint64_t* p = FieldConstants::MODULUS.limbs;
  uint64_t t[6] = {0};

  for (int i = 0; i < 4; ++i) {
    // t += a * b[i]
    uint64_t carry = 0;
    for (int j = 0; j < 4; ++j) {
      __uint128_t prod = (__uint128_t)a.limbs[j] * b.limbs[i] + t[j] + carry;
      t[j] = (uint64_t)prod;
      carry = (uint64_t)(prod >> 64);
    }
    __uint128_t sum = (__uint128_t)t[4] + carry;
    t[4] = (uint64_t)sum;
    t[5] = (uint64_t)(sum >> 64);

    // t = (t + m * p) / 2^64
    uint64_t m = t[0] * FieldConstants::MONTGOMERY_INV;
    __uint128_t red = (__uint128_t)m * p[0] + t[0];
    carry = (uint64_t)(red >> 64);
    for (int j = 1; j < 4; ++j) {
      red = (__uint128_t)m * p[j] + t[j] + carry;
      t[j - 1] = (uint64_t)red;
      carry = (uint64_t)(red >> 64);
    }
    sum = (__uint128_t)t[4] + carry;
    t[3] = (uint64_t)sum;
    t[4] = t[5] + (uint64_t)(sum >> 64);
  }

  FieldElement reduced(t[0], t[1], t[2], t[3]);
  if (t[4] != 0 || !(reduced < FieldConstants::MODULUS)) {
    subtract_internal(reduced, FieldConstants::MODULUS, reduced);
  }
  result = reduced;
}

void multiply(const FieldElement& a, const FieldElement& b, FieldElement& result) {
  // mont(a, b) = a*b/R, mont(a*b/R, R^2) = a*b
  FieldElement temp;
  montgomery_multiply(a, b, temp);
  montgomery_multiply(temp, FieldConstants::R_SQUARED, result);
}

void square(const FieldElement& a, FieldElement& result) {
  multiply(a, a, result);
}

void power(const FieldElement& a, const uint64_t exponent[4], FieldElement& result) {
  // Left-to-right square and multiply, entirely in Montgomery form
  FieldElement base;
  montgomery_multiply(a, FieldConstants::R_SQUARED, base);
  FieldElement acc;
  montgomery_multiply(FieldConstants::ONE, FieldConstants::R_SQUARED, acc);

  for (int limb = 3; limb >= 0; --limb) {
    for (int bit = 63; bit >= 0; --bit) {
      montgomery_multiply(acc, acc, acc);
      if ((exponent[limb] >> bit) & 1ULL) {
        montgomery_multiply(acc, base, acc);
      }
    }
  }

  montgomery_multiply(acc, FieldConstants::ONE, result);
}

bool inverse(const FieldElement& a, FieldElement& result) {
  if (a.is_zero()) {
    return false;
  }
  // a^(p-2) = a^-1 by Fermat's little theorem
  power(a, INVERSION_EXPONENT, result);
  return true;
}

void reduce(FieldElement& a) {
  while (!(a < FieldConstants::MODULUS)) {
    subtract_internal(a, FieldConstants::MODULUS, a);
  }
}

FieldElement random(std::mt19937_64& gen) {
  std::uniform_int_distribution<uint64_t> dis;

  // Rejection sampling over [0, 2^254)
  FieldElement result;
  do {
    for (int i = 0; i < 4; ++i) {
      result.limbs[i] = dis(gen);
    }
    result.limbs[3] &= 0x3fffffffffffffffULL;
  } while (!(result < FieldConstants::MODULUS));
  return result;
}

FieldElement random() {
  static std::random_device rd;
  static std::mt19937_64 gen(rd());
  return random(gen);
}

}  // namespace FieldArithmetic

}  // namespace Poseidon
