#include "poseidon.hpp"

#include <chrono>

namespace Poseidon {

const Sponge& PoseidonHash::sponge() {
  static const Sponge instance(PoseidonConstants::parameters());
  return instance;
}

const BatchHash& PoseidonHash::batch_hasher() {
  static const BatchHash instance(PoseidonConstants::parameters());
  return instance;
}

void PoseidonHash::permutation(State<FieldElement>& state) {
  sponge().permutation().permute(state);
}

void PoseidonHash::permutation_dual(State<FieldElement>& first,
                                    State<FieldElement>& second) {
  sponge().permutation().permute_dual(first, second);
}

FieldElement PoseidonHash::hash_pair(const FieldElement& left,
                                     const FieldElement& right) {
  return sponge().hash_pair(left, right);
}

std::pair<FieldElement, FieldElement> PoseidonHash::hash_pair_dual(
    const FieldElement& left1, const FieldElement& right1,
    const FieldElement& left2, const FieldElement& right2) {
  return sponge().hash_pair_dual(left1, right1, left2, right2);
}

FieldElement PoseidonHash::hash_multiple(
    const std::vector<FieldElement>& inputs) {
  return sponge().hash(inputs);
}

std::vector<FieldElement> PoseidonHash::batch_evaluate(
    const std::vector<FieldElement>& inputs, size_t num_threads) {
  return batch_hasher().batch_evaluate(inputs, num_threads);
}

namespace {

HashingStats make_stats(std::chrono::nanoseconds duration,
                        size_t total_hashes) {
  HashingStats stats;
  stats.total_time_ms = duration.count() / 1000000.0;
  stats.total_hashes = total_hashes;
  stats.avg_time_per_hash_ns = 0.0;
  stats.hashes_per_second = 0;
  if (total_hashes == 0) {
    return stats;
  }

  stats.avg_time_per_hash_ns =
      static_cast<double>(duration.count()) / total_hashes;
  if (stats.avg_time_per_hash_ns > 0.0) {
    stats.hashes_per_second =
        static_cast<size_t>(1000000000.0 / stats.avg_time_per_hash_ns);
  }
  return stats;
}

}  // namespace

// Performance benchmarking
HashingStats benchmark_poseidon(size_t num_iterations) {
  auto start = std::chrono::high_resolution_clock::now();

  for (size_t i = 0; i < num_iterations; ++i) {
    FieldElement input = FieldElement::random();
    FieldElement result = PoseidonHash::hash_multiple({input});
    // Use result to prevent optimization
    (void)result;
  }

  auto end = std::chrono::high_resolution_clock::now();
  return make_stats(
      std::chrono::duration_cast<std::chrono::nanoseconds>(end - start),
      num_iterations);
}

HashingStats benchmark_poseidon_pairs(size_t num_pairs) {
  auto start = std::chrono::high_resolution_clock::now();

  for (size_t i = 0; i < num_pairs; ++i) {
    FieldElement left = FieldElement::random();
    FieldElement right = FieldElement::random();
    FieldElement result = PoseidonHash::hash_pair(left, right);
    (void)result;
  }

  auto end = std::chrono::high_resolution_clock::now();
  return make_stats(
      std::chrono::duration_cast<std::chrono::nanoseconds>(end - start),
      num_pairs);
}

HashingStats benchmark_poseidon_dual(size_t num_pairs) {
  auto start = std::chrono::high_resolution_clock::now();

  // Two compressions per call
  for (size_t i = 0; i + 1 < num_pairs; i += 2) {
    auto result = PoseidonHash::hash_pair_dual(
        FieldElement::random(), FieldElement::random(),
        FieldElement::random(), FieldElement::random());
    (void)result;
  }

  auto end = std::chrono::high_resolution_clock::now();
  return make_stats(
      std::chrono::duration_cast<std::chrono::nanoseconds>(end - start),
      num_pairs - num_pairs % 2);
}

HashingStats benchmark_poseidon_batch(size_t num_pairs, size_t num_threads) {
  std::vector<FieldElement> inputs;
  inputs.reserve(2 * num_pairs);
  for (size_t i = 0; i < 2 * num_pairs; ++i) {
    inputs.push_back(FieldElement::random());
  }

  auto start = std::chrono::high_resolution_clock::now();
  auto outputs = PoseidonHash::batch_evaluate(inputs, num_threads);
  auto end = std::chrono::high_resolution_clock::now();

  return make_stats(
      std::chrono::duration_cast<std::chrono::nanoseconds>(end - start),
      outputs.size());
}

}  // namespace Poseidon
