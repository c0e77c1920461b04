#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace Poseidon {

// Field element structure for 256-bit prime field arithmetic.
// Limbs hold the canonical value (little-endian, always < MODULUS); the
// Montgomery form only exists inside multiply() and inverse().
struct FieldElement {
  // 4 64-bit limbs to represent 256-bit numbers
  uint64_t limbs[4];

  // Constructors
  FieldElement();
  explicit FieldElement(uint64_t value);
  FieldElement(uint64_t v0, uint64_t v1, uint64_t v2, uint64_t v3);
  FieldElement(const FieldElement &other);

  // Assignment operator
  FieldElement &operator=(const FieldElement &other);

  // Comparison operators
  bool operator==(const FieldElement &other) const;
  bool operator!=(const FieldElement &other) const;
  bool operator<(const FieldElement &other) const;

  // Arithmetic operations
  FieldElement operator+(const FieldElement &other) const;
  FieldElement operator-(const FieldElement &other) const;
  FieldElement operator*(const FieldElement &other) const;
  FieldElement &operator+=(const FieldElement &other);
  FieldElement &operator-=(const FieldElement &other);
  FieldElement &operator*=(const FieldElement &other);

  // Multiplicative inverse, std::nullopt for zero
  std::optional<FieldElement> inverse() const;

  // Utility functions
  std::string to_hex() const;
  std::string to_dec() const;
  static FieldElement from_hex(const std::string &hex);
  static FieldElement random();
  static FieldElement random(std::mt19937_64 &gen);
  bool is_zero() const;
  void set_zero();
};

// Field arithmetic operations
namespace FieldArithmetic {
// Basic operations
void add(const FieldElement &a, const FieldElement &b, FieldElement &result);
void subtract(const FieldElement &a, const FieldElement &b,
              FieldElement &result);
void multiply(const FieldElement &a, const FieldElement &b,
              FieldElement &result);
void square(const FieldElement &a, FieldElement &result);

// a^exponent, exponent given as 4 little-endian limbs
void power(const FieldElement &a, const uint64_t exponent[4],
           FieldElement &result);

// Returns false (and leaves result untouched) when a is zero
bool inverse(const FieldElement &a, FieldElement &result);

// Modular operations
void reduce(FieldElement &a);

// Random number generation
FieldElement random();
FieldElement random(std::mt19937_64 &gen);

// Internal helper functions
void subtract_internal(const FieldElement &a, const FieldElement &b,
                       FieldElement &result);
// Montgomery product a * b * 2^-256 mod p (CIOS)
void montgomery_multiply(const FieldElement &a, const FieldElement &b,
                         FieldElement &result);
} // namespace FieldArithmetic

// Constants for the prime field
namespace FieldConstants {
// BN254 scalar field modulus:
// 21888242871839275222246405745257275088548364400416034343698204186575808495617
extern const FieldElement MODULUS;
extern const FieldElement ZERO;
extern const FieldElement ONE;
extern const FieldElement TWO;

// 2^512 mod p, converts into Montgomery form
extern const FieldElement R_SQUARED;
// -p^-1 mod 2^64
constexpr uint64_t MONTGOMERY_INV = 0xc2e1f593efffffffULL;

void init();
} // namespace FieldConstants

} // namespace Poseidon
