#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../common/error_handling.hpp"
#include "../common/namespace_utils.hpp"
#include "../poseidon/poseidon.hpp"

namespace MerkleTree {

using FieldElement = Poseidon::FieldElement;

// Configuration for the binary Poseidon Merkle tree
struct MerkleTreeConfig {
  static constexpr size_t ARITY = Poseidon::PoseidonParams::RATE;  // 2-to-1
  static constexpr size_t MIN_HEIGHT = 1;
  static constexpr size_t MAX_HEIGHT = 32;
  static constexpr size_t DEFAULT_MAX_HEIGHT = 20;
  static constexpr size_t MAX_THREADS = 64;

  size_t max_height;   // levels including the leaf level
  size_t num_threads;  // workers per level when hashing

  explicit MerkleTreeConfig(size_t max_height = DEFAULT_MAX_HEIGHT,
                            size_t num_threads = 1)
      : max_height(max_height), num_threads(num_threads) {
    invZK::ErrorHandling::validate_range(max_height, MIN_HEIGHT, MAX_HEIGHT,
                                         "max_height");
    invZK::ErrorHandling::validate_range(num_threads, 1, MAX_THREADS,
                                         "num_threads");
  }
};

// Merkle proof structure
struct MerkleProof {
  std::vector<FieldElement> path;  // Sibling hash at each level, leaf first
  std::vector<size_t> indices;     // 0 if the path node is a left child
  size_t leaf_index;               // Index of the leaf in the tree

  MerkleProof() : leaf_index(0) {}
};

// Binary Merkle tree whose internal nodes are Poseidon 2-to-1 compressions.
//
// Leaves are padded to a power of two with the empty leaf (zero). Subtrees
// made only of padding take their hash from a precomputed per-level table,
// the rest of each level is hashed in one batch through the dual-lane
// permutation.
class PoseidonMerkleTree {
 private:
  MerkleTreeConfig config_;
  std::vector<FieldElement> leaves_;
  // levels_[0] is the padded leaf level, levels_.back() holds the root
  std::vector<std::vector<FieldElement>> levels_;

  void build_levels();
  void update_path(size_t leaf_index);

 public:
  // Constructors
  explicit PoseidonMerkleTree(const MerkleTreeConfig& config = MerkleTreeConfig());
  explicit PoseidonMerkleTree(const std::vector<FieldElement>& leaves,
                              const MerkleTreeConfig& config = MerkleTreeConfig());

  // Tree operations
  void build_tree(const std::vector<FieldElement>& leaves);
  void insert_leaf(const FieldElement& leaf);
  void update_leaf(size_t index, const FieldElement& new_value);

  // Proof operations
  std::optional<MerkleProof> generate_proof(size_t leaf_index) const;
  bool verify_proof(const MerkleProof& proof,
                    const FieldElement& leaf_value,
                    const FieldElement& root_hash) const;

  // Batch operations
  std::vector<MerkleProof> generate_batch_proofs(const std::vector<size_t>& indices) const;
  bool verify_batch_proofs(const std::vector<MerkleProof>& proofs,
                           const std::vector<FieldElement>& leaf_values,
                           const FieldElement& root_hash) const;

  // Getters
  FieldElement get_root_hash() const;
  size_t get_leaf_count() const {
    return leaves_.size();
  }
  size_t get_tree_height() const;
  size_t get_arity() const {
    return MerkleTreeConfig::ARITY;
  }
  const std::vector<FieldElement>& get_leaves() const {
    return leaves_;
  }
  const MerkleTreeConfig& get_config() const {
    return config_;
  }

  // Utility functions
  void print_tree() const;

  // Static utilities
  // Root of an all-empty subtree whose leaves are `level` levels below it
  static FieldElement compute_empty_hash(size_t level);
  static size_t calculate_tree_height(size_t leaf_count);
  static size_t calculate_max_leaves(size_t height);
};

// Merkle tree utilities
namespace MerkleUtils {
// Proof validation utilities
bool is_valid_proof_structure(const MerkleProof& proof);

// Tree comparison utilities
bool compare_trees(const PoseidonMerkleTree& tree1, const PoseidonMerkleTree& tree2);

// Performance testing
struct TreeBenchmarkResult {
  double build_time_ms;
  double proof_generation_time_ms;
  double proof_verification_time_ms;
  size_t tree_height;
  size_t leaf_count;
  size_t num_threads;
};

TreeBenchmarkResult benchmark_tree(size_t leaf_count, size_t num_threads = 1,
                                   size_t num_proofs = 100);

// Test data generation
std::vector<FieldElement> generate_test_leaves(size_t count, uint64_t seed = 0);

}  // namespace MerkleUtils

}  // namespace MerkleTree
