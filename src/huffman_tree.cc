#include "huffman_tree.hh"

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

namespace huffman {
namespace {

struct QueueEntry {
  uint64_t              weight;
  uint64_t              sequence;
  std::unique_ptr<Node> node;
};

// Orders the heap so that the lightest, then the oldest entry is on top.
struct QueueOrder {
  bool operator()(const QueueEntry& a, const QueueEntry& b) const {
    if (a.weight != b.weight) return a.weight > b.weight;
    return a.sequence > b.sequence;
  }
};

class NodeQueue {
 public:
  void push(std::unique_ptr<Node> node) {
    uint64_t weight = node->weight;
    entries_.push_back({weight, next_sequence_++, std::move(node)});
    std::push_heap(entries_.begin(), entries_.end(), QueueOrder{});
  }

  std::unique_ptr<Node> pop() {
    std::pop_heap(entries_.begin(), entries_.end(), QueueOrder{});
    auto node = std::move(entries_.back().node);
    entries_.pop_back();
    return node;
  }

  size_t size() const {
    return entries_.size();
  }

 private:
  std::vector<QueueEntry> entries_;
  uint64_t                next_sequence_{};
};

}  // namespace

std::unique_ptr<Node> Node::make_leaf(uint16_t symbol, uint64_t weight) {
  auto node    = std::make_unique<Node>();
  node->symbol = symbol;
  node->weight = weight;
  return node;
}

std::unique_ptr<Node> Node::make_internal(
    std::unique_ptr<Node> left, std::unique_ptr<Node> right) {
  auto node    = std::make_unique<Node>();
  node->weight = left->weight + right->weight;
  node->left   = std::move(left);
  node->right  = std::move(right);
  return node;
}

FrequencyTable count_frequencies(InputBuffer* source) {
  FrequencyTable counts{};
  counts[kPseudoEof] = 1;

  uint32_t symbol;
  while (source->read_bits(kBitsPerWord, symbol) == Status::Ok) {
    counts[symbol]++;
  }

  return counts;
}

std::unique_ptr<Node> build_tree(const FrequencyTable& counts) {
  std::array<bool, kAlphabetSize> present{};
  size_t                          num_present = 0;

  for (size_t symbol = 0; symbol < kAlphabetSize; ++symbol) {
    present[symbol] = counts[symbol] > 0;
    if (present[symbol]) num_present++;
  }

  // A lone symbol would get an empty code. Pair it with the smallest absent one.
  for (size_t symbol = 0; num_present < 2 && symbol < kAlphabetSize; ++symbol) {
    if (!present[symbol]) {
      present[symbol] = true;
      num_present++;
    }
  }

  NodeQueue queue;
  for (size_t symbol = 0; symbol < kAlphabetSize; ++symbol) {
    if (present[symbol]) {
      queue.push(Node::make_leaf(static_cast<uint16_t>(symbol), counts[symbol]));
    }
  }

  while (queue.size() > 1) {
    auto left  = queue.pop();
    auto right = queue.pop();
    queue.push(Node::make_internal(std::move(left), std::move(right)));
  }

  return queue.pop();
}

size_t count_leaves(const Node& node) {
  if (node.is_leaf()) return 1;
  return count_leaves(*node.left) + count_leaves(*node.right);
}

}  // namespace huffman
