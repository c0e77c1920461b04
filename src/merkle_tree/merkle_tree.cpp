#include "merkle_tree.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <random>

USING_INVZK_TYPES()
USING_FIELD_CONSTANTS()

namespace MerkleTree {

namespace {
constexpr size_t ARITY = MerkleTreeConfig::ARITY;
constexpr size_t PRINT_NODES_PER_LEVEL = 8;
} // namespace

// PoseidonMerkleTree constructors
PoseidonMerkleTree::PoseidonMerkleTree(const MerkleTreeConfig &config)
    : config_(config) {
  // Validation is done in MerkleTreeConfig constructor
}

PoseidonMerkleTree::PoseidonMerkleTree(const std::vector<FieldElement> &leaves,
                                       const MerkleTreeConfig &config)
    : PoseidonMerkleTree(config) {
  build_tree(leaves);
}

// Tree building
void PoseidonMerkleTree::build_tree(const std::vector<FieldElement> &leaves) {
  const size_t max_leaves = calculate_max_leaves(config_.max_height);
  if (leaves.size() > max_leaves) {
    throw invZK::ErrorHandling::ValidationError(
        "build_tree: " + std::to_string(leaves.size()) +
        " leaves exceed the capacity " + std::to_string(max_leaves) +
        " of a tree with max_height " + std::to_string(config_.max_height));
  }

  leaves_ = leaves;
  build_levels();
}

void PoseidonMerkleTree::build_levels() {
  levels_.clear();
  if (leaves_.empty()) {
    return;
  }

  // Pad to next power of arity with the empty leaf
  size_t padded_size = 1;
  while (padded_size < leaves_.size()) {
    padded_size *= ARITY;
  }
  levels_.emplace_back(leaves_);
  levels_[0].resize(padded_size, ZERO);

  // Only the first `occupied` nodes of a level can differ from the empty hash
  size_t occupied = leaves_.size();
  size_t level = 0;
  while (levels_.back().size() > 1) {
    const std::vector<FieldElement> &children = levels_.back();
    const size_t parent_count = children.size() / ARITY;
    const size_t occupied_parents = (occupied + ARITY - 1) / ARITY;

    std::vector<FieldElement> inputs(children.begin(),
                                     children.begin() + occupied_parents * ARITY);
    std::vector<FieldElement> parents =
        Hash::batch_evaluate(inputs, config_.num_threads);
    parents.resize(parent_count, compute_empty_hash(level + 1));

    levels_.push_back(std::move(parents));
    occupied = occupied_parents;
    ++level;
  }
}

// Recomputes the nodes above one leaf after it changed
void PoseidonMerkleTree::update_path(size_t leaf_index) {
  size_t index = leaf_index;
  for (size_t level = 0; level + 1 < levels_.size(); ++level) {
    const size_t left = index - index % ARITY;
    index /= ARITY;
    levels_[level + 1][index] =
        Hash::hash_pair(levels_[level][left], levels_[level][left + 1]);
  }
}

// Proof generation
std::optional<MerkleProof>
PoseidonMerkleTree::generate_proof(size_t leaf_index) const {
  if (leaf_index >= leaves_.size()) {
    return std::nullopt;
  }

  MerkleProof proof;
  proof.leaf_index = leaf_index;
  proof.path.reserve(levels_.size() - 1);
  proof.indices.reserve(levels_.size() - 1);

  size_t index = leaf_index;
  for (size_t level = 0; level + 1 < levels_.size(); ++level) {
    const size_t position = index % ARITY;
    proof.indices.push_back(position);
    proof.path.push_back(levels_[level][index ^ 1]);
    index /= ARITY;
  }

  return proof;
}

// Proof verification
bool PoseidonMerkleTree::verify_proof(const MerkleProof &proof,
                                      const FieldElement &leaf_value,
                                      const FieldElement &root_hash) const {
  if (!MerkleUtils::is_valid_proof_structure(proof)) {
    return false;
  }
  // A shorter path would accept an interior node as a leaf
  if (levels_.empty() || proof.path.size() != levels_.size() - 1) {
    return false;
  }

  FieldElement current_hash = leaf_value;

  // Work our way up the tree
  for (size_t level = 0; level < proof.path.size(); ++level) {
    const FieldElement &sibling = proof.path[level];
    if (proof.indices[level] == 0) {
      current_hash = Hash::hash_pair(current_hash, sibling);
    } else {
      current_hash = Hash::hash_pair(sibling, current_hash);
    }
  }

  return current_hash == root_hash;
}

// Batch operations
std::vector<MerkleProof> PoseidonMerkleTree::generate_batch_proofs(
    const std::vector<size_t> &indices) const {
  std::vector<MerkleProof> proofs;
  proofs.reserve(indices.size());

  for (size_t index : indices) {
    auto proof = generate_proof(index);
    if (proof) {
      proofs.push_back(*proof);
    }
  }

  return proofs;
}

bool PoseidonMerkleTree::verify_batch_proofs(
    const std::vector<MerkleProof> &proofs,
    const std::vector<FieldElement> &leaf_values,
    const FieldElement &root_hash) const {
  if (proofs.size() != leaf_values.size()) {
    return false;
  }

  for (size_t i = 0; i < proofs.size(); ++i) {
    if (!verify_proof(proofs[i], leaf_values[i], root_hash)) {
      return false;
    }
  }

  return true;
}

// Tree operations
void PoseidonMerkleTree::insert_leaf(const FieldElement &leaf) {
  const size_t max_leaves = calculate_max_leaves(config_.max_height);
  if (leaves_.size() >= max_leaves) {
    throw invZK::ErrorHandling::ValidationError(
        "insert_leaf: tree is full with " + std::to_string(max_leaves) +
        " leaves");
  }

  leaves_.push_back(leaf);

  // A free padding slot only changes the path above it
  if (!levels_.empty() && leaves_.size() <= levels_[0].size()) {
    const size_t index = leaves_.size() - 1;
    levels_[0][index] = leaf;
    update_path(index);
    return;
  }

  build_levels();
}

void PoseidonMerkleTree::update_leaf(size_t index,
                                     const FieldElement &new_value) {
  invZK::ErrorHandling::validate_index(index, leaves_.size(), "update_leaf");

  leaves_[index] = new_value;
  levels_[0][index] = new_value;
  update_path(index);
}

// Getters
FieldElement PoseidonMerkleTree::get_root_hash() const {
  // An empty tree has the same root as a single empty leaf
  if (levels_.empty()) {
    return ZERO;
  }
  return levels_.back()[0];
}

size_t PoseidonMerkleTree::get_tree_height() const {
  return levels_.size();
}

// Utility functions
void PoseidonMerkleTree::print_tree() const {
  if (levels_.empty()) {
    std::cout << "Empty tree\n";
    return;
  }

  std::cout << "Merkle Tree (arity=" << ARITY
            << ", leaves=" << leaves_.size()
            << ", height=" << levels_.size() << "):\n";

  for (size_t level = levels_.size(); level-- > 0;) {
    const auto &nodes = levels_[level];
    std::cout << "Level " << level << " (" << nodes.size() << " nodes):";
    const size_t shown = std::min(nodes.size(), PRINT_NODES_PER_LEVEL);
    for (size_t i = 0; i < shown; ++i) {
      std::cout << " " << nodes[i].to_hex().substr(0, 18) << "...";
    }
    if (shown < nodes.size()) {
      std::cout << " (+" << nodes.size() - shown << " more)";
    }
    std::cout << "\n";
  }
}

// Static utilities
FieldElement PoseidonMerkleTree::compute_empty_hash(size_t level) {
  invZK::ErrorHandling::validate_range(level, 0,
                                       MerkleTreeConfig::MAX_HEIGHT - 1,
                                       "empty hash level");

  static const std::vector<FieldElement> empty_hashes = [] {
    std::vector<FieldElement> hashes;
    hashes.reserve(MerkleTreeConfig::MAX_HEIGHT);
    hashes.push_back(ZERO);
    for (size_t i = 1; i < MerkleTreeConfig::MAX_HEIGHT; ++i) {
      hashes.push_back(Hash::hash_pair(hashes.back(), hashes.back()));
    }
    return hashes;
  }();

  return empty_hashes[level];
}

size_t PoseidonMerkleTree::calculate_tree_height(size_t leaf_count) {
  if (leaf_count == 0) {
    return 0;
  }

  size_t height = 1;
  size_t capacity = 1;
  while (capacity < leaf_count) {
    capacity *= ARITY;
    ++height;
  }
  return height;
}

size_t PoseidonMerkleTree::calculate_max_leaves(size_t height) {
  invZK::ErrorHandling::validate_range(height, MerkleTreeConfig::MIN_HEIGHT,
                                       MerkleTreeConfig::MAX_HEIGHT, "height");
  return static_cast<size_t>(1) << (height - 1);
}

// MerkleUtils namespace implementation
namespace MerkleUtils {

bool is_valid_proof_structure(const MerkleProof &proof) {
  if (proof.path.size() != proof.indices.size() ||
      proof.path.size() >= MerkleTreeConfig::MAX_HEIGHT) {
    return false;
  }

  for (size_t i = 0; i < proof.indices.size(); ++i) {
    if (proof.indices[i] >= ARITY) {
      return false;
    }
    // The position bits spell out the leaf index
    if (((proof.leaf_index >> i) & 1) != proof.indices[i]) {
      return false;
    }
  }

  return (proof.leaf_index >> proof.indices.size()) == 0;
}

bool compare_trees(const PoseidonMerkleTree &tree1,
                   const PoseidonMerkleTree &tree2) {
  return tree1.get_root_hash() == tree2.get_root_hash() &&
         tree1.get_leaf_count() == tree2.get_leaf_count() &&
         tree1.get_tree_height() == tree2.get_tree_height();
}

TreeBenchmarkResult benchmark_tree(size_t leaf_count, size_t num_threads,
                                   size_t num_proofs) {
  invZK::ErrorHandling::validate_non_empty(leaf_count, "benchmark_tree leaves");

  TreeBenchmarkResult result = {};
  result.leaf_count = leaf_count;
  result.num_threads = num_threads;

  // Generate test data
  auto leaves = generate_test_leaves(leaf_count);
  MerkleTreeConfig config(
      std::max(MerkleTreeConfig::DEFAULT_MAX_HEIGHT,
               PoseidonMerkleTree::calculate_tree_height(leaf_count)),
      num_threads);

  // Benchmark tree building
  auto start = std::chrono::high_resolution_clock::now();
  PoseidonMerkleTree tree(leaves, config);
  auto end = std::chrono::high_resolution_clock::now();

  result.build_time_ms =
      std::chrono::duration<double, std::milli>(end - start).count();
  result.tree_height = tree.get_tree_height();

  // Benchmark proof generation
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<size_t> dis(0, leaf_count - 1);

  start = std::chrono::high_resolution_clock::now();
  for (size_t i = 0; i < num_proofs; ++i) {
    size_t index = dis(gen);
    tree.generate_proof(index);
  }
  end = std::chrono::high_resolution_clock::now();

  result.proof_generation_time_ms =
      std::chrono::duration<double, std::milli>(end - start).count();

  // Benchmark proof verification
  auto proof = tree.generate_proof(0);
  if (proof) {
    start = std::chrono::high_resolution_clock::now();
    for (size_t i = 0; i < num_proofs; ++i) {
      tree.verify_proof(*proof, leaves[0], tree.get_root_hash());
    }
    end = std::chrono::high_resolution_clock::now();

    result.proof_verification_time_ms =
        std::chrono::duration<double, std::milli>(end - start).count();
  }

  return result;
}

std::vector<FieldElement> generate_test_leaves(size_t count, uint64_t seed) {
  std::vector<FieldElement> leaves;
  leaves.reserve(count);

  std::mt19937_64 gen(seed);

  for (size_t i = 0; i < count; ++i) {
    leaves.push_back(FieldElement::random(gen));
  }

  return leaves;
}

} // namespace MerkleUtils

} // namespace MerkleTree
