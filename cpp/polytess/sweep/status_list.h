#pragma once

#include "polytess/core/types.h"

#include <cstdint>
#include <vector>

namespace polytess {

/**
 * Ordered doubly linked list with caller-supplied ordering, used as the
 * sweep status. The ordering depends on the current sweep position, so it
 * is passed to each insertion or search instead of being stored.
 *
 * Node 0 is the head; it carries the null key and is both before the
 * minimum and after the maximum. Nodes are recycled through a free list.
 */
template <typename Key>
class StatusList {
public:
    using NodeId = std::uint32_t;
    static constexpr NodeId kHead = 0;

    explicit StatusList(Key nullKey) : nullKey_(nullKey) {
        clear();
    }

    void clear() {
        nodes_.clear();
        freeNodes_.clear();
        nodes_.push_back(Node{nullKey_, kHead, kHead});
        size_ = 0;
    }

    /**
     * Inserts key at or before node, walking backwards until leq(prevKey, key)
     * holds. Returns the new node.
     */
    template <typename Leq>
    NodeId insertBefore(NodeId node, Key key, Leq leq) {
        do {
            node = nodes_[node].prev;
        } while (nodes_[node].key != nullKey_ && !leq(nodes_[node].key, key));

        const NodeId created = allocNode(key);
        const NodeId next = nodes_[node].next;
        nodes_[created].next = next;
        nodes_[created].prev = node;
        nodes_[next].prev = created;
        nodes_[node].next = created;
        ++size_;
        return created;
    }

    template <typename Leq>
    NodeId insert(Key key, Leq leq) {
        return insertBefore(kHead, key, leq);
    }

    /**
     * Returns the first node (from the minimum up) whose key satisfies
     * atOrAbove(nodeKey), or the head when none does.
     */
    template <typename Pred>
    NodeId search(Pred atOrAbove) const {
        NodeId node = kHead;
        do {
            node = nodes_[node].next;
        } while (nodes_[node].key != nullKey_ && !atOrAbove(nodes_[node].key));
        return node;
    }

    void erase(NodeId node) {
        const NodeId next = nodes_[node].next;
        const NodeId prev = nodes_[node].prev;
        nodes_[next].prev = prev;
        nodes_[prev].next = next;
        nodes_[node].key = nullKey_;
        freeNodes_.push_back(node);
        --size_;
    }

    NodeId next(NodeId node) const noexcept { return nodes_[node].next; }
    NodeId prev(NodeId node) const noexcept { return nodes_[node].prev; }
    Key key(NodeId node) const noexcept { return nodes_[node].key; }
    void setKey(NodeId node, Key key) noexcept { nodes_[node].key = key; }

    NodeId min() const noexcept { return nodes_[kHead].next; }
    NodeId max() const noexcept { return nodes_[kHead].prev; }
    bool empty() const noexcept { return size_ == 0; }
    std::size_t size() const noexcept { return size_; }

private:
    struct Node {
        Key key;
        NodeId prev;
        NodeId next;
    };

    NodeId allocNode(Key key) {
        if (!freeNodes_.empty()) {
            const NodeId n = freeNodes_.back();
            freeNodes_.pop_back();
            nodes_[n].key = key;
            return n;
        }
        nodes_.push_back(Node{key, kHead, kHead});
        return static_cast<NodeId>(nodes_.size() - 1);
    }

    Key nullKey_;
    std::vector<Node> nodes_;
    std::vector<NodeId> freeNodes_;
    std::size_t size_{0};
};

} // namespace polytess
