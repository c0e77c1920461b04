#pragma once

#include <atomic>
#include <cstddef>
#include <utility>
#include <vector>

#include "../common/error_handling.hpp"
#include "permutation.hpp"
#include "poseidon_params.hpp"
#include "sbox.hpp"

namespace Poseidon {

// Compression injects the domain constant into the capacity lane before every
// absorption permutation (2-to-1 Merkle hashing). Plain is generic sponge
// absorption without it.
enum class SpongeMode { Compression, Plain };

// Sponge over the Poseidon permutation.
//
//   state = permute(0, 0, 0)
//   for each chunk of rate inputs: state[0..rate) += chunk,
//                                  state[rate] += C2, permute
//   a trailing partial chunk is added into the leading lanes (zero padded),
//   state[rate] += C2, permute
//   digest = state[0]
//
// A length that is a multiple of rate gets no extra padding permutation.
template <typename F, typename SBox = BatchSBox<F>>
class PoseidonSponge {
 public:
  explicit PoseidonSponge(const PoseidonParameters<F>& params,
                          SpongeMode mode = SpongeMode::Compression)
      : params_(params), permutation_(params), mode_(mode) {}

  F hash(const std::vector<F>& inputs) const {
    return hash_from(initial_state(), inputs);
  }

  // Two equal-length sequences through the dual-lane permutation. The second
  // lane starts from a copy of the first lane's initialization output.
  std::pair<F, F> hash_dual(const std::vector<F>& first,
                            const std::vector<F>& second) const {
    invZK::ErrorHandling::validate_size(second.size(), first.size(),
                                        "hash_dual input lengths");
    State<F> state = initial_state();
    return hash_dual_from(state, state, first, second);
  }

  F hash_pair(const F& left, const F& right) const {
    return hash({left, right});
  }

  std::pair<F, F> hash_pair_dual(const F& left1, const F& right1,
                                 const F& left2, const F& right2) const {
    return hash_dual({left1, right1}, {left2, right2});
  }

  // Absorbs inputs on top of an already initialized state
  F hash_from(State<F> state, const std::vector<F>& inputs) const {
    const size_t rate = params_.rate();
    size_t idx = 0;
    for (; idx + rate <= inputs.size(); idx += rate) {
      absorb(state, &inputs[idx], rate);
      permute(state);
    }
    if (idx < inputs.size()) {
      absorb(state, &inputs[idx], inputs.size() - idx);
      permute(state);
    }
    return state[0];
  }

  std::pair<F, F> hash_dual_from(State<F> first_state, State<F> second_state,
                                 const std::vector<F>& first,
                                 const std::vector<F>& second) const {
    invZK::ErrorHandling::validate_size(second.size(), first.size(),
                                        "hash_dual input lengths");
    const size_t rate = params_.rate();
    size_t idx = 0;
    for (; idx + rate <= first.size(); idx += rate) {
      absorb(first_state, &first[idx], rate);
      absorb(second_state, &second[idx], rate);
      permute_dual(first_state, second_state);
    }
    if (idx < first.size()) {
      absorb(first_state, &first[idx], first.size() - idx);
      absorb(second_state, &second[idx], second.size() - idx);
      permute_dual(first_state, second_state);
    }
    return {first_state[0], second_state[0]};
  }

  // Output of the initialization permutation over the all-zero state
  State<F> initial_state() const {
    State<F> state;
    state.fill(F(0));
    permute(state);
    return state;
  }

  // Adds count <= rate inputs into the leading lanes, plus the domain
  // constant in compression mode. Does not permute.
  void absorb(State<F>& state, const F* chunk, size_t count) const {
    for (size_t j = 0; j < count; ++j) {
      state[j] = state[j] + chunk[j];
    }
    if (mode_ == SpongeMode::Compression) {
      state[params_.rate()] = state[params_.rate()] + params_.domain_constant();
    }
  }

  void permute(State<F>& state) const {
    permutation_.permute(state);
    permutation_calls_.fetch_add(1, std::memory_order_relaxed);
  }

  void permute_dual(State<F>& first, State<F>& second) const {
    permutation_.permute_dual(first, second);
    permutation_calls_.fetch_add(1, std::memory_order_relaxed);
  }

  // A dual-lane invocation counts as one call
  size_t permutation_calls() const {
    return permutation_calls_.load(std::memory_order_relaxed);
  }
  void reset_counters() { permutation_calls_.store(0); }

  SpongeMode mode() const { return mode_; }
  const PoseidonParameters<F>& parameters() const { return params_; }
  const PoseidonPermutation<F, SBox>& permutation() const {
    return permutation_;
  }

 private:
  const PoseidonParameters<F>& params_;
  PoseidonPermutation<F, SBox> permutation_;
  SpongeMode mode_;
  mutable std::atomic<size_t> permutation_calls_{0};
};

}  // namespace Poseidon
