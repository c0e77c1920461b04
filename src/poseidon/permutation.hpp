#pragma once

#include <array>
#include <cstddef>

#include "poseidon_params.hpp"
#include "sbox.hpp"

namespace Poseidon {

// Poseidon permutation: R_F/2 full rounds, R_P partial rounds, R_F/2 full
// rounds. The last full round skips the MDS mix. Round constants are
// consumed through one running round index across all three blocks.
//
// Batched evaluation runs N independent states through the same schedule;
// constants and MDS are applied per lane, the S-box once for all lanes.
template <typename F, typename SBox = BatchSBox<F>>
class PoseidonPermutation {
 public:
  explicit PoseidonPermutation(const PoseidonParameters<F>& params)
      : params_(params) {}

  void permute(State<F>& state) const {
    std::array<State<F>, 1> lanes = {state};
    permute_batch(lanes);
    state = lanes[0];
  }

  void permute_dual(State<F>& a, State<F>& b) const {
    std::array<State<F>, 2> lanes = {a, b};
    permute_batch(lanes);
    a = lanes[0];
    b = lanes[1];
  }

  template <size_t N>
  void permute_batch(std::array<State<F>, N>& lanes) const {
    const size_t half_full = params_.full_rounds() / 2;
    const size_t last_round = params_.total_rounds() - 1;
    size_t round = 0;

    // First full rounds
    for (size_t r = 0; r < half_full; ++r, ++round) {
      add_round_constants(lanes, round);
      SBox::apply_full(lanes, round);
      apply_mds_matrix(lanes);
    }

    // Partial rounds
    for (size_t r = 0; r < params_.partial_rounds(); ++r, ++round) {
      add_round_constants(lanes, round);
      SBox::apply_partial(lanes, round);
      apply_mds_matrix(lanes);
    }

    // Second full rounds, no mix after the very last one
    for (size_t r = 0; r < half_full; ++r, ++round) {
      add_round_constants(lanes, round);
      SBox::apply_full(lanes, round);
      if (round != last_round) {
        apply_mds_matrix(lanes);
      }
    }
  }

  const PoseidonParameters<F>& parameters() const { return params_; }

 private:
  template <size_t N>
  void add_round_constants(std::array<State<F>, N>& lanes,
                           size_t round) const {
    const auto& constants = params_.round_constants(round);
    for (auto& lane : lanes) {
      for (size_t i = 0; i < PoseidonParams::STATE_SIZE; ++i) {
        lane[i] = lane[i] + constants[i];
      }
    }
  }

  template <size_t N>
  void apply_mds_matrix(std::array<State<F>, N>& lanes) const {
    const auto& mds = params_.mds_matrix();
    for (auto& lane : lanes) {
      State<F> new_state;
      for (size_t i = 0; i < PoseidonParams::STATE_SIZE; ++i) {
        F acc = mds[i][0] * lane[0];
        for (size_t j = 1; j < PoseidonParams::STATE_SIZE; ++j) {
          acc = acc + mds[i][j] * lane[j];
        }
        new_state[i] = acc;
      }
      lane = new_state;
    }
  }

  const PoseidonParameters<F>& params_;
};

}  // namespace Poseidon
