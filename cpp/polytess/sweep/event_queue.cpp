#include "polytess/sweep/event_queue.h"

#include "polytess/mesh/planar_mesh.h"

namespace polytess {

bool EventQueue::Order::operator()(VertexId a, VertexId b) const {
    const Point2& pa = mesh->st(a);
    const Point2& pb = mesh->st(b);
    if (pa.s != pb.s) return pa.s < pb.s;
    if (pa.t != pb.t) return pa.t < pb.t;
    return a < b;
}

EventQueue::EventQueue(const PlanarMesh& mesh) : events_(Order{&mesh}) {}

void EventQueue::insert(VertexId v) {
    events_.insert(v);
}

bool EventQueue::erase(VertexId v) {
    return events_.erase(v) > 0;
}

bool EventQueue::contains(VertexId v) const {
    return events_.find(v) != events_.end();
}

VertexId EventQueue::top() const {
    if (events_.empty()) return kNullHandle;
    return *events_.begin();
}

VertexId EventQueue::pop() {
    if (events_.empty()) return kNullHandle;
    const VertexId v = *events_.begin();
    events_.erase(events_.begin());
    return v;
}

} // namespace polytess
