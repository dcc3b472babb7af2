#include "compression/huffman/tree.hpp"

#include "compression/huffman/errors.hpp"

#include <array>
#include <queue>
#include <string>
#include <utility>

namespace hzip::compression::huffman {
namespace {

constexpr std::size_t kMaxInternalNodes = kAlphabetSize - 1U;

struct QueueEntry {
    std::uint64_t weight {0};
    std::size_t sequence {0};
};

struct QueueEntryComparator {
    bool operator()(const QueueEntry& lhs, const QueueEntry& rhs) const noexcept
    {
        if (lhs.weight == rhs.weight) {
            return lhs.sequence > rhs.sequence;
        }
        return lhs.weight > rhs.weight;
    }
};

std::unique_ptr<HuffmanNode> createLeaf(std::uint64_t weight, ByteValue value)
{
    auto node = std::make_unique<HuffmanNode>();
    node->weight = weight;
    node->value = value;
    node->leaf = true;
    return node;
}

std::unique_ptr<HuffmanNode> createInternal(std::unique_ptr<HuffmanNode> left, std::unique_ptr<HuffmanNode> right)
{
    auto node = std::make_unique<HuffmanNode>();
    node->weight = left->weight + (right ? right->weight : 0U);
    node->left = std::move(left);
    node->right = std::move(right);
    return node;
}

struct PendingSlot {
    std::unique_ptr<HuffmanNode>* slot {nullptr};
    const HuffmanNode* parent {nullptr};
    bool isRight {false};
};

} // namespace

HuffmanTree::HuffmanTree(std::unique_ptr<HuffmanNode> root)
    : root_(std::move(root))
{
}

HuffmanTree HuffmanTree::build(const FrequencyTable& frequencies)
{
    if (frequencies.empty()) {
        throw EmptyInputError();
    }

    // Nodes waiting in the queue, indexed by their insertion sequence.
    std::vector<std::unique_ptr<HuffmanNode>> pending;
    pending.reserve(2U * frequencies.distinctCount());
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, QueueEntryComparator> queue;

    for (const auto& [value, count] : frequencies.entries()) {
        queue.push(QueueEntry {count, pending.size()});
        pending.emplace_back(createLeaf(count, value));
    }

    if (queue.size() == 1U) {
        auto only = std::move(pending[queue.top().sequence]);
        return HuffmanTree(createInternal(std::move(only), nullptr));
    }

    while (queue.size() > 1U) {
        auto left = std::move(pending[queue.top().sequence]);
        queue.pop();
        auto right = std::move(pending[queue.top().sequence]);
        queue.pop();

        auto parent = createInternal(std::move(left), std::move(right));
        queue.push(QueueEntry {parent->weight, pending.size()});
        pending.emplace_back(std::move(parent));
    }

    return HuffmanTree(std::move(pending[queue.top().sequence]));
}

CodeBook HuffmanTree::codes() const
{
    if (!root_) {
        throw EmptyTreeError();
    }

    CodeBook book;
    std::vector<std::pair<const HuffmanNode*, BitSequence>> stack;
    stack.emplace_back(root_.get(), BitSequence {});

    while (!stack.empty()) {
        auto [node, prefix] = std::move(stack.back());
        stack.pop_back();

        if (node->isLeaf()) {
            book.assign(node->value, std::move(prefix));
            continue;
        }

        if (node->right) {
            auto rightPrefix = prefix;
            rightPrefix.push_back(true);
            stack.emplace_back(node->right.get(), std::move(rightPrefix));
        }
        if (node->left) {
            prefix.push_back(false);
            stack.emplace_back(node->left.get(), std::move(prefix));
        }
    }

    return book;
}

std::vector<std::uint8_t> HuffmanTree::serialize() const
{
    if (!root_) {
        throw EmptyTreeError();
    }

    std::vector<std::uint8_t> bytes;
    // nullptr entries stand for a missing child.
    std::vector<const HuffmanNode*> stack {root_.get()};

    while (!stack.empty()) {
        const HuffmanNode* node = stack.back();
        stack.pop_back();

        if (!node) {
            bytes.push_back(kAbsentTag);
            continue;
        }
        if (node->isLeaf()) {
            bytes.push_back(kLeafTag);
            bytes.push_back(node->value);
            continue;
        }

        bytes.push_back(kInternalTag);
        stack.push_back(node->right.get());
        stack.push_back(node->left.get());
    }

    return bytes;
}

HuffmanTree HuffmanTree::deserialize(const std::vector<std::uint8_t>& bytes)
{
    if (bytes.empty()) {
        throw MalformedTreeError("description is empty");
    }
    if (bytes.front() != kInternalTag) {
        throw MalformedTreeError("root must be an internal node");
    }

    std::unique_ptr<HuffmanNode> root;
    std::array<bool, kAlphabetSize> seen {};
    std::size_t internalCount = 0;
    std::size_t position = 0;

    std::vector<PendingSlot> stack;
    stack.push_back(PendingSlot {&root, nullptr, false});

    while (!stack.empty()) {
        const auto pending = stack.back();
        stack.pop_back();

        if (position >= bytes.size()) {
            throw MalformedTreeError("description is truncated");
        }
        const auto tag = bytes[position++];

        switch (tag) {
        case kLeafTag: {
            if (position >= bytes.size()) {
                throw MalformedTreeError("leaf value is truncated");
            }
            const auto value = bytes[position++];
            if (seen[value]) {
                throw MalformedTreeError("duplicate leaf value " + std::to_string(value));
            }
            seen[value] = true;
            *pending.slot = createLeaf(0, value);
            break;
        }
        case kInternalTag: {
            if (++internalCount > kMaxInternalNodes) {
                throw MalformedTreeError("too many internal nodes");
            }
            *pending.slot = std::make_unique<HuffmanNode>();
            HuffmanNode* node = pending.slot->get();
            stack.push_back(PendingSlot {&node->right, node, true});
            stack.push_back(PendingSlot {&node->left, node, false});
            break;
        }
        case kAbsentTag: {
            const bool singleSymbolRoot = pending.isRight && pending.parent == root.get()
                && pending.parent->left && pending.parent->left->isLeaf();
            if (!singleSymbolRoot) {
                throw MalformedTreeError("missing child outside a single-symbol root");
            }
            break;
        }
        default:
            throw MalformedTreeError("unknown tag " + std::to_string(tag));
        }
    }

    if (position != bytes.size()) {
        throw MalformedTreeError("trailing bytes after tree description");
    }

    return HuffmanTree(std::move(root));
}

std::uint64_t HuffmanTree::weight() const noexcept
{
    return root_ ? root_->weight : 0U;
}

std::size_t HuffmanTree::leafCount() const
{
    std::size_t count = 0;
    std::vector<const HuffmanNode*> stack;
    if (root_) {
        stack.push_back(root_.get());
    }
    while (!stack.empty()) {
        const HuffmanNode* node = stack.back();
        stack.pop_back();
        if (node->isLeaf()) {
            ++count;
            continue;
        }
        if (node->left) {
            stack.push_back(node->left.get());
        }
        if (node->right) {
            stack.push_back(node->right.get());
        }
    }
    return count;
}

bool HuffmanTree::sameShape(const HuffmanTree& other) const
{
    std::vector<std::pair<const HuffmanNode*, const HuffmanNode*>> stack;
    stack.emplace_back(root_.get(), other.root_.get());

    while (!stack.empty()) {
        const auto [lhs, rhs] = stack.back();
        stack.pop_back();

        if (!lhs || !rhs) {
            if (lhs != rhs) {
                return false;
            }
            continue;
        }
        if (lhs->isLeaf() != rhs->isLeaf()) {
            return false;
        }
        if (lhs->isLeaf()) {
            if (lhs->value != rhs->value) {
                return false;
            }
            continue;
        }
        stack.emplace_back(lhs->left.get(), rhs->left.get());
        stack.emplace_back(lhs->right.get(), rhs->right.get());
    }

    return true;
}

} // namespace hzip::compression::huffman
