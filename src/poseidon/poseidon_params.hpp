#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../common/error_handling.hpp"

namespace Poseidon {

// Poseidon configuration parameters of the BN254 instance
struct PoseidonParams {
  static constexpr size_t STATE_SIZE = 3;                // t = 3
  static constexpr size_t CAPACITY = 1;                  // c = 1
  static constexpr size_t RATE = STATE_SIZE - CAPACITY;  // r = 2
  static constexpr size_t ROUNDS_FULL = 8;               // R_F = 8
  static constexpr size_t ROUNDS_PARTIAL = 57;           // R_P = 57
  static constexpr size_t TOTAL_ROUNDS = ROUNDS_FULL + ROUNDS_PARTIAL;
  static constexpr uint64_t DOMAIN_CONSTANT = 3;         // C2
};

// One permutation state. The width is fixed at three lanes.
template <typename F>
using State = std::array<F, PoseidonParams::STATE_SIZE>;

// Immutable, validated constant bundle for one field.
//
// round_constants holds one width-tuple per round, in consumption order;
// mds_matrix is row-major and multiplies the state from the left.
template <typename F>
class PoseidonParameters {
 public:
  PoseidonParameters(size_t rate, size_t full_rounds, size_t partial_rounds,
                     std::vector<std::vector<F>> round_constants,
                     std::vector<std::vector<F>> mds_matrix,
                     const F& domain_constant,
                     size_t width = PoseidonParams::STATE_SIZE)
      : width_(width),
        rate_(rate),
        capacity_(width >= rate ? width - rate : 0),
        full_rounds_(full_rounds),
        partial_rounds_(partial_rounds),
        round_constants_(std::move(round_constants)),
        mds_matrix_(std::move(mds_matrix)),
        domain_constant_(domain_constant) {
    validate();
  }

  size_t width() const { return width_; }
  size_t rate() const { return rate_; }
  size_t capacity() const { return capacity_; }
  size_t full_rounds() const { return full_rounds_; }
  size_t partial_rounds() const { return partial_rounds_; }
  size_t total_rounds() const { return full_rounds_ + partial_rounds_; }

  const std::vector<F>& round_constants(size_t round) const {
    return round_constants_[round];
  }
  const std::vector<std::vector<F>>& round_constants() const {
    return round_constants_;
  }
  const std::vector<std::vector<F>>& mds_matrix() const { return mds_matrix_; }
  const F& domain_constant() const { return domain_constant_; }

 private:
  void validate() const {
    using invZK::ErrorHandling::ConfigurationError;

    if (width_ != PoseidonParams::STATE_SIZE) {
      throw ConfigurationError("width must be " +
                               std::to_string(PoseidonParams::STATE_SIZE) +
                               ", got " + std::to_string(width_));
    }
    if (rate_ == 0 || rate_ >= width_) {
      throw ConfigurationError("rate must be in [1, " +
                               std::to_string(width_ - 1) + "], got " +
                               std::to_string(rate_));
    }
    if (rate_ + capacity_ != width_) {
      throw ConfigurationError("rate + capacity must equal width");
    }
    if (full_rounds_ == 0 || full_rounds_ % 2 != 0) {
      throw ConfigurationError("full rounds must be even and non-zero, got " +
                               std::to_string(full_rounds_));
    }
    if (round_constants_.size() != total_rounds()) {
      throw ConfigurationError(
          "expected " + std::to_string(total_rounds()) +
          " round constant tuples, got " +
          std::to_string(round_constants_.size()));
    }
    for (size_t k = 0; k < round_constants_.size(); ++k) {
      if (round_constants_[k].size() != width_) {
        throw ConfigurationError("round constant tuple " + std::to_string(k) +
                                 " has " +
                                 std::to_string(round_constants_[k].size()) +
                                 " entries");
      }
    }
    if (mds_matrix_.size() != width_) {
      throw ConfigurationError("MDS matrix must have " +
                               std::to_string(width_) + " rows");
    }
    for (const auto& row : mds_matrix_) {
      if (row.size() != width_) {
        throw ConfigurationError("MDS matrix must be square");
      }
    }
  }

  size_t width_;
  size_t rate_;
  size_t capacity_;
  size_t full_rounds_;
  size_t partial_rounds_;
  std::vector<std::vector<F>> round_constants_;
  std::vector<std::vector<F>> mds_matrix_;
  F domain_constant_;
};

}  // namespace Poseidon
