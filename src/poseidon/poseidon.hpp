#pragma once

#include <utility>
#include <vector>

#include "batch_hash.hpp"
#include "field_arithmetic.hpp"
#include "permutation.hpp"
#include "poseidon_params.hpp"
#include "sbox.hpp"
#include "sponge.hpp"
#include "updatable.hpp"

namespace Poseidon {

// BN254 Poseidon constants
class PoseidonConstants {
 public:
  // Validated bundle, built once on first use and shared read-only
  static const PoseidonParameters<FieldElement>& parameters();

 private:
  static PoseidonParameters<FieldElement> build();
};

using Permutation = PoseidonPermutation<FieldElement>;
using Sponge = PoseidonSponge<FieldElement>;
using UpdatableHash = UpdatablePoseidonHash<FieldElement>;
using BatchHash = PoseidonBatchHash<FieldElement>;

// Poseidon hash over the BN254 scalar field, compression mode
class PoseidonHash {
 public:
  // Core permutation function
  static void permutation(State<FieldElement>& state);
  static void permutation_dual(State<FieldElement>& first,
                               State<FieldElement>& second);

  // 2-to-1 compression for Merkle trees
  static FieldElement hash_pair(const FieldElement& left,
                                const FieldElement& right);
  static std::pair<FieldElement, FieldElement> hash_pair_dual(
      const FieldElement& left1, const FieldElement& right1,
      const FieldElement& left2, const FieldElement& right2);

  // Sponge over an arbitrary number of inputs
  static FieldElement hash_multiple(const std::vector<FieldElement>& inputs);

  // Inputs taken as consecutive pairs, one digest per pair
  static std::vector<FieldElement> batch_evaluate(
      const std::vector<FieldElement>& inputs, size_t num_threads = 1);

 private:
  static const Sponge& sponge();
  static const BatchHash& batch_hasher();
};

// Performance testing utilities
struct HashingStats {
  double total_time_ms;
  double avg_time_per_hash_ns;
  size_t hashes_per_second;
  size_t total_hashes;
};

HashingStats benchmark_poseidon(size_t num_iterations = 10000);
HashingStats benchmark_poseidon_pairs(size_t num_pairs = 10000);
HashingStats benchmark_poseidon_dual(size_t num_pairs = 10000);
HashingStats benchmark_poseidon_batch(size_t num_pairs = 10000,
                                      size_t num_threads = 1);

}  // namespace Poseidon
