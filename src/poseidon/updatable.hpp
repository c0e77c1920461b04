#pragma once

#include <vector>

#include "sponge.hpp"

namespace Poseidon {

// Incremental form of PoseidonSponge::hash. Inputs are buffered until rate of
// them are pending, then absorbed and permuted. finalize() does not consume
// the hasher; it returns the digest hash() would give for every input passed
// to update() so far.
template <typename F, typename SBox = BatchSBox<F>>
class UpdatablePoseidonHash {
 public:
  explicit UpdatablePoseidonHash(const PoseidonParameters<F>& params,
                                 SpongeMode mode = SpongeMode::Compression)
      : sponge_(params, mode), state_(sponge_.initial_state()) {
    pending_.reserve(params.rate());
  }

  UpdatablePoseidonHash& update(const F& input) {
    pending_.push_back(input);
    if (pending_.size() == sponge_.parameters().rate()) {
      State<F> next = state_;
      sponge_.absorb(next, pending_.data(), pending_.size());
      sponge_.permute(next);
      state_ = next;
      pending_.clear();
    }
    return *this;
  }

  F finalize() const {
    if (pending_.empty()) {
      return state_[0];
    }
    State<F> state = state_;
    sponge_.absorb(state, pending_.data(), pending_.size());
    sponge_.permute(state);
    return state[0];
  }

  void reset() {
    state_ = sponge_.initial_state();
    pending_.clear();
  }

  size_t pending() const { return pending_.size(); }

 private:
  PoseidonSponge<F, SBox> sponge_;
  State<F> state_;
  std::vector<F> pending_;
};

}  // namespace Poseidon
