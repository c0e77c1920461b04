#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <string>
#include <thread>
#include <vector>

#include "../common/error_handling.hpp"
#include "sponge.hpp"

namespace Poseidon {

// Many independent 2-to-1 compressions at once.
//
// Input is laid out as consecutive rate-sized groups
//   (d_00, d_01, d_10, d_11, d_20, d_21, ...)
// and output i is the compression of group i. Groups go through the
// dual-lane permutation two at a time. The post-initialization state is
// computed once, in the constructor, and copied into every lane.
template <typename F, typename SBox = BatchSBox<F>>
class PoseidonBatchHash {
 public:
  explicit PoseidonBatchHash(const PoseidonParameters<F>& params)
      : sponge_(params, SpongeMode::Compression),
        initial_state_(sponge_.initial_state()) {}

  std::vector<F> batch_evaluate(const std::vector<F>& inputs,
                                size_t num_threads = 1) const {
    const size_t rate = sponge_.parameters().rate();
    invZK::ErrorHandling::validate_non_empty(inputs.size(),
                                             "batch_evaluate input");
    if (inputs.size() % rate != 0) {
      throw invZK::ErrorHandling::ValidationError(
          "batch_evaluate input length " + std::to_string(inputs.size()) +
          " is not a multiple of the rate " + std::to_string(rate));
    }

    const size_t count = inputs.size() / rate;
    std::vector<F> outputs(count);

    num_threads = std::max<size_t>(1, std::min(num_threads, count));
    if (num_threads == 1) {
      evaluate_range(inputs, outputs, 0, count);
      return outputs;
    }

    // Contiguous chunks per worker; workers only share the parameters
    const size_t chunk = (count + num_threads - 1) / num_threads;
    std::vector<std::thread> workers;
    std::vector<std::exception_ptr> errors(num_threads);
    for (size_t t = 0; t < num_threads; ++t) {
      const size_t begin = t * chunk;
      const size_t end = std::min(count, begin + chunk);
      if (begin >= end) {
        break;
      }
      workers.emplace_back([this, &inputs, &outputs, &errors, t, begin, end] {
        try {
          evaluate_range(inputs, outputs, begin, end);
        } catch (...) {
          errors[t] = std::current_exception();
        }
      });
    }
    for (auto& worker : workers) {
      worker.join();
    }
    for (const auto& error : errors) {
      if (error) {
        std::rethrow_exception(error);
      }
    }
    return outputs;
  }

  const PoseidonSponge<F, SBox>& sponge() const { return sponge_; }

 private:
  std::vector<F> group(const std::vector<F>& inputs, size_t index) const {
    const size_t rate = sponge_.parameters().rate();
    return std::vector<F>(inputs.begin() + index * rate,
                          inputs.begin() + (index + 1) * rate);
  }

  void evaluate_range(const std::vector<F>& inputs, std::vector<F>& outputs,
                      size_t begin, size_t end) const {
    size_t i = begin;
    for (; i + 1 < end; i += 2) {
      auto digests = sponge_.hash_dual_from(initial_state_, initial_state_,
                                            group(inputs, i),
                                            group(inputs, i + 1));
      outputs[i] = digests.first;
      outputs[i + 1] = digests.second;
    }
    if (i < end) {
      outputs[i] = sponge_.hash_from(initial_state_, group(inputs, i));
    }
  }

  PoseidonSponge<F, SBox> sponge_;
  State<F> initial_state_;
};

}  // namespace Poseidon
