#pragma once

#include "polytess/core/types.h"

#include <set>

namespace polytess {

class PlanarMesh;

/**
 * Sweep event queue keyed by (s, t, vertex handle).
 *
 * A vertex's position must not change while it is queued; callers erase
 * and reinsert when they move one.
 */
class EventQueue {
public:
    explicit EventQueue(const PlanarMesh& mesh);

    void insert(VertexId v);
    bool erase(VertexId v);
    bool contains(VertexId v) const;

    // kNullHandle when empty.
    VertexId top() const;
    VertexId pop();

    bool empty() const noexcept { return events_.empty(); }
    std::size_t size() const noexcept { return events_.size(); }
    void clear() noexcept { events_.clear(); }

private:
    struct Order {
        const PlanarMesh* mesh;
        bool operator()(VertexId a, VertexId b) const;
    };

    std::set<VertexId, Order> events_;
};

} // namespace polytess
