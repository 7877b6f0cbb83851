#include "polytess/mono/monotone_decomposer.h"

#include "polytess/core/geom.h"
#include "polytess/mesh/planar_mesh.h"
#include "polytess/sweep/status_list.h"

#include <algorithm>

namespace polytess {

const char* toString(VertexKind kind) noexcept {
    switch (kind) {
        case VertexKind::Start: return "Start";
        case VertexKind::End: return "End";
        case VertexKind::Split: return "Split";
        case VertexKind::Merge: return "Merge";
        case VertexKind::Regular: return "Regular";
    }
    return "Unknown";
}

VertexKind MonotoneDecomposer::classify(EdgeId e) const noexcept {
    const Point2& prev = mesh_.st(mesh_.org(mesh_.lprev(e)));
    const Point2& v = mesh_.st(mesh_.org(e));
    const Point2& next = mesh_.st(mesh_.dst(e));

    const bool convex = vertCCW(prev, v, next);
    const bool prevRight = vertLeq(v, prev);
    const bool nextRight = vertLeq(v, next);
    if (prevRight && nextRight) {
        return convex ? VertexKind::Start : VertexKind::Split;
    }
    if (!prevRight && !nextRight) {
        return convex ? VertexKind::End : VertexKind::Merge;
    }
    return VertexKind::Regular;
}

bool MonotoneDecomposer::isMonotone(FaceId f) const noexcept {
    const EdgeId start = mesh_.face(f).anEdge;
    EdgeId e = start;
    do {
        const VertexKind kind = classify(e);
        if (kind == VertexKind::Split || kind == VertexKind::Merge) return false;
        e = mesh_.lnext(e);
    } while (e != start);
    return true;
}

/**
 * Helper sweep over one face. The status holds the face edges that run
 * left to right (the face lies above them), each with the last vertex
 * whose nearest edge below it was that edge.
 */
std::vector<std::pair<VertexId, VertexId>> MonotoneDecomposer::collectDiagonals(FaceId f) const {
    std::vector<std::pair<VertexId, VertexId>> diagonals;
    if (isMonotone(f)) return diagonals;

    struct Corner {
        EdgeId edge;
        VertexId v;
        VertexKind kind;
    };
    std::vector<Corner> corners;
    const EdgeId start = mesh_.face(f).anEdge;
    EdgeId e = start;
    do {
        corners.push_back(Corner{e, mesh_.org(e), classify(e)});
        e = mesh_.lnext(e);
    } while (e != start);
    const std::uint32_t n = static_cast<std::uint32_t>(corners.size());

    std::vector<std::uint32_t> order(n);
    for (std::uint32_t i = 0; i < n; ++i) order[i] = i;
    std::sort(order.begin(), order.end(), [&](std::uint32_t a, std::uint32_t b) {
        const Point2& pa = mesh_.st(corners[a].v);
        const Point2& pb = mesh_.st(corners[b].v);
        if (pa.s != pb.s) return pa.s < pb.s;
        if (pa.t != pb.t) return pa.t < pb.t;
        return a < b;
    });

    VertexId event = kNullHandle;
    // a is below b at the current event; both edges span the event's s.
    auto edgeBelow = [&](std::uint32_t a, std::uint32_t b) {
        const EdgeId ea = corners[a].edge;
        const EdgeId eb = corners[b].edge;
        const Point2& ev = mesh_.st(event);
        const Point2& oa = mesh_.st(mesh_.org(ea));
        const Point2& da = mesh_.st(mesh_.dst(ea));
        const Point2& ob = mesh_.st(mesh_.org(eb));
        const Point2& db = mesh_.st(mesh_.dst(eb));
        const bool aAtEvent = mesh_.org(ea) == event;
        const bool bAtEvent = mesh_.org(eb) == event;
        if (aAtEvent && bAtEvent) {
            if (vertLeq(da, db)) return edgeSign(ev, da, db) <= 0;
            return edgeSign(ev, db, da) >= 0;
        }
        if (aAtEvent) return edgeSign(ob, ev, db) <= 0;
        if (bAtEvent) return edgeSign(oa, ev, da) >= 0;
        return edgeEval(oa, ev, da) >= edgeEval(ob, ev, db);
    };

    StatusList<std::uint32_t> status(kNullHandle);
    std::vector<StatusList<std::uint32_t>::NodeId> nodeOf(n, 0);
    std::vector<std::uint32_t> helper(n, kNullHandle);

    auto prevCorner = [n](std::uint32_t i) { return (i + n - 1) % n; };
    auto addDiagonal = [&](std::uint32_t i, std::uint32_t h) {
        if (h == kNullHandle || corners[h].v == corners[i].v) return;
        diagonals.emplace_back(corners[i].v, corners[h].v);
    };
    auto helperIsMerge = [&](std::uint32_t edgeCorner) {
        const std::uint32_t h = helper[edgeCorner];
        return h != kNullHandle && corners[h].kind == VertexKind::Merge;
    };
    auto insertEdge = [&](std::uint32_t i) {
        nodeOf[i] = status.insert(i, edgeBelow);
        helper[i] = i;
    };
    auto removeEdge = [&](std::uint32_t j) {
        if (nodeOf[j] != 0) {
            status.erase(nodeOf[j]);
            nodeOf[j] = 0;
        }
    };
    auto edgeDirectlyBelow = [&](std::uint32_t i) {
        const Point2& pv = mesh_.st(corners[i].v);
        const auto above = status.search([&](std::uint32_t c) {
            const EdgeId ec = corners[c].edge;
            return edgeSign(mesh_.st(mesh_.org(ec)), pv, mesh_.st(mesh_.dst(ec))) < 0;
        });
        return status.key(status.prev(above));
    };

    for (const std::uint32_t i : order) {
        event = corners[i].v;
        switch (corners[i].kind) {
            case VertexKind::Start:
                insertEdge(i);
                break;
            case VertexKind::End: {
                const std::uint32_t j = prevCorner(i);
                if (helperIsMerge(j)) addDiagonal(i, helper[j]);
                removeEdge(j);
                break;
            }
            case VertexKind::Split: {
                const std::uint32_t below = edgeDirectlyBelow(i);
                if (below != kNullHandle) {
                    addDiagonal(i, helper[below]);
                    helper[below] = i;
                }
                insertEdge(i);
                break;
            }
            case VertexKind::Merge: {
                const std::uint32_t j = prevCorner(i);
                if (helperIsMerge(j)) addDiagonal(i, helper[j]);
                removeEdge(j);
                const std::uint32_t below = edgeDirectlyBelow(i);
                if (below != kNullHandle) {
                    if (helperIsMerge(below)) addDiagonal(i, helper[below]);
                    helper[below] = i;
                }
                break;
            }
            case VertexKind::Regular: {
                const std::uint32_t j = prevCorner(i);
                const bool lowerChain = vertLeq(mesh_.st(corners[j].v), mesh_.st(corners[i].v));
                if (lowerChain) {
                    // Face lies above this vertex.
                    if (helperIsMerge(j)) addDiagonal(i, helper[j]);
                    removeEdge(j);
                    insertEdge(i);
                } else {
                    const std::uint32_t below = edgeDirectlyBelow(i);
                    if (below != kNullHandle) {
                        if (helperIsMerge(below)) addDiagonal(i, helper[below]);
                        helper[below] = i;
                    }
                }
                break;
            }
        }
    }

    // Split and merge rules can emit the same pair twice.
    for (auto& d : diagonals) {
        if (d.first > d.second) std::swap(d.first, d.second);
    }
    std::sort(diagonals.begin(), diagonals.end());
    diagonals.erase(std::unique(diagonals.begin(), diagonals.end()), diagonals.end());
    return diagonals;
}

bool MonotoneDecomposer::insertDiagonal(VertexId u, VertexId w, std::vector<FaceId>& pieces) {
    const EdgeId uStart = mesh_.vertex(u).anEdge;
    EdgeId a = uStart;
    do {
        const FaceId f = mesh_.lface(a);
        if (std::find(pieces.begin(), pieces.end(), f) != pieces.end()) {
            const EdgeId wStart = mesh_.vertex(w).anEdge;
            EdgeId b = wStart;
            do {
                if (mesh_.lface(b) == f) {
                    // Already adjacent on this piece.
                    if (mesh_.dst(a) == w || mesh_.dst(b) == u) return false;
                    const EdgeId eNew = mesh_.connect(mesh_.lprev(a), b);
                    pieces.push_back(mesh_.lface(eNew));
                    return true;
                }
                b = mesh_.onext(b);
            } while (b != wStart);
        }
        a = mesh_.onext(a);
    } while (a != uStart);
    return false;
}

std::uint32_t MonotoneDecomposer::decomposeFace(FaceId f) {
    const auto diagonals = collectDiagonals(f);
    if (diagonals.empty()) return 0;

    std::vector<FaceId> pieces{f};
    std::uint32_t inserted = 0;
    for (const auto& [u, w] : diagonals) {
        if (insertDiagonal(u, w, pieces)) ++inserted;
    }
    return inserted;
}

std::uint32_t MonotoneDecomposer::decomposeInterior() {
    std::vector<FaceId> interior;
    for (FaceId f = mesh_.face(PlanarMesh::kFaceHead).next; f != PlanarMesh::kFaceHead; f = mesh_.face(f).next) {
        if (mesh_.face(f).inside) interior.push_back(f);
    }
    std::uint32_t inserted = 0;
    for (const FaceId f : interior) {
        inserted += decomposeFace(f);
    }
    return inserted;
}

} // namespace polytess
