#pragma once

#include <array>
#include <cstddef>
#include <string>

#include "../common/error_handling.hpp"
#include "poseidon_params.hpp"

namespace Poseidon {

// Inverse S-box S(x) = x^-1 with Montgomery's simultaneous inversion.
//
// All inversions of one round, across every lane of a batch, share a single
// field inversion: prefix products are accumulated, their total is inverted
// once, and each inverse is peeled off walking backwards. A batch of M
// elements costs one inversion and 3(M-1) multiplications, so a single-lane
// full round is 1 inversion + 6 multiplications, a dual-lane full round is
// 1 inversion + 15 multiplications, and a dual-lane partial round is
// 1 inversion + 3 multiplications.
//
// A zero anywhere in the batch makes the product zero. That is reported as
// an InversionError; no substitute value is ever written.
template <typename F>
class BatchSBox {
 public:
  // S-box on every element of every lane
  template <size_t N>
  static void apply_full(std::array<State<F>, N>& lanes, size_t round) {
    std::array<F*, N * PoseidonParams::STATE_SIZE> elements;
    size_t idx = 0;
    for (auto& lane : lanes) {
      for (auto& element : lane) {
        elements[idx++] = &element;
      }
    }
    invert(elements, round);
  }

  // S-box on lane element 0 only
  template <size_t N>
  static void apply_partial(std::array<State<F>, N>& lanes, size_t round) {
    std::array<F*, N> elements;
    for (size_t i = 0; i < N; ++i) {
      elements[i] = &lanes[i][0];
    }
    invert(elements, round);
  }

  template <size_t M>
  static void invert(const std::array<F*, M>& elements, size_t round) {
    static_assert(M > 0, "empty S-box batch");

    // prefix[i] = x_0 * ... * x_i
    std::array<F, M> prefix;
    prefix[0] = *elements[0];
    for (size_t i = 1; i < M; ++i) {
      prefix[i] = prefix[i - 1] * *elements[i];
    }

    auto product_inverse = prefix[M - 1].inverse();
    if (!product_inverse) {
      std::string message = "zero operand in S-box batch of " +
                            std::to_string(M) + " at round " +
                            std::to_string(round);
      invZK::ErrorHandling::log_error(message);
      throw invZK::ErrorHandling::InversionError(message);
    }

    // acc = (x_0 * ... * x_i)^-1 at the top of each iteration
    F acc = *product_inverse;
    for (size_t i = M - 1; i > 0; --i) {
      F original = *elements[i];
      *elements[i] = acc * prefix[i - 1];
      acc = acc * original;
    }
    *elements[0] = acc;
  }
};

// Unbatched S-box: one inversion per element. Slow reference for BatchSBox.
template <typename F>
class ReferenceSBox {
 public:
  template <size_t N>
  static void apply_full(std::array<State<F>, N>& lanes, size_t round) {
    for (auto& lane : lanes) {
      for (auto& element : lane) {
        invert_one(element, round);
      }
    }
  }

  template <size_t N>
  static void apply_partial(std::array<State<F>, N>& lanes, size_t round) {
    for (auto& lane : lanes) {
      invert_one(lane[0], round);
    }
  }

 private:
  static void invert_one(F& element, size_t round) {
    auto inv = element.inverse();
    if (!inv) {
      std::string message =
          "zero S-box input at round " + std::to_string(round);
      invZK::ErrorHandling::log_error(message);
      throw invZK::ErrorHandling::InversionError(message);
    }
    element = *inv;
  }
};

}  // namespace Poseidon
