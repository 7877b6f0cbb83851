#include "polytess/mesh/planar_mesh.h"

#include "polytess/core/geom.h"

#include <numeric>

namespace polytess {

PlanarMesh::PlanarMesh() {
    clear();
}

void PlanarMesh::clear() {
    vertices_.clear();
    edges_.clear();
    faces_.clear();
    freeEdgePairs_.clear();
    freeFaces_.clear();

    vertices_.emplace_back();
    vertices_[kVertexHead].next = kVertexHead;
    vertices_[kVertexHead].prev = kVertexHead;

    faces_.emplace_back();
    faces_[kFaceHead].next = kFaceHead;
    faces_[kFaceHead].prev = kFaceHead;

    edges_.emplace_back();
    edges_.emplace_back();
    edges_[kEdgeHead].next = kEdgeHead;
    edges_[sym(kEdgeHead)].next = sym(kEdgeHead);
    edges_[kEdgeHead].onext = kEdgeHead;
    edges_[kEdgeHead].lnext = sym(kEdgeHead);
    edges_[sym(kEdgeHead)].onext = sym(kEdgeHead);
    edges_[sym(kEdgeHead)].lnext = kEdgeHead;

    liveVertices_ = 0;
    liveEdgePairs_ = 0;
    liveFaces_ = 0;
}

bool PlanarMesh::edgeGoesLeft(EdgeId e) const noexcept {
    return vertLeq(st(dst(e)), st(org(e)));
}

bool PlanarMesh::edgeGoesRight(EdgeId e) const noexcept {
    return vertLeq(st(org(e)), st(dst(e)));
}

// =============================================================================
// Allocation and low-level linking
// =============================================================================

EdgeId PlanarMesh::allocEdgePair(EdgeId eNext) {
    EdgeId e;
    if (!freeEdgePairs_.empty()) {
        e = freeEdgePairs_.back();
        freeEdgePairs_.pop_back();
    } else {
        e = static_cast<EdgeId>(edges_.size());
        edges_.emplace_back();
        edges_.emplace_back();
    }
    const EdgeId eSym = sym(e);

    // Insert before eNext; the backward link lives in the odd half.
    if (eNext & 1u) eNext = sym(eNext);
    const EdgeId ePrev = edges_[sym(eNext)].next;
    edges_[eSym].next = ePrev;
    edges_[sym(ePrev)].next = e;
    edges_[e].next = eNext;
    edges_[sym(eNext)].next = eSym;

    for (const EdgeId h : {e, eSym}) {
        MeshHalfEdge& he = edges_[h];
        he.onext = h;
        he.lnext = sym(h);
        he.org = kNullHandle;
        he.lface = kNullHandle;
        he.activeRegion = kNullHandle;
        he.winding = 0;
        he.mark = false;
    }
    ++liveEdgePairs_;
    return e;
}

VertexId PlanarMesh::allocVertex() {
    const VertexId v = static_cast<VertexId>(vertices_.size());
    vertices_.emplace_back();
    return v;
}

FaceId PlanarMesh::allocFace() {
    if (!freeFaces_.empty()) {
        const FaceId f = freeFaces_.back();
        freeFaces_.pop_back();
        return f;
    }
    const FaceId f = static_cast<FaceId>(faces_.size());
    faces_.emplace_back();
    return f;
}

void PlanarMesh::spliceRaw(EdgeId a, EdgeId b) noexcept {
    const EdgeId aOnext = edges_[a].onext;
    const EdgeId bOnext = edges_[b].onext;
    edges_[sym(aOnext)].lnext = b;
    edges_[sym(bOnext)].lnext = a;
    edges_[a].onext = bOnext;
    edges_[b].onext = aOnext;
}

void PlanarMesh::makeVertex(VertexId vNew, EdgeId eOrig, VertexId vNext) noexcept {
    const VertexId vPrev = vertices_[vNext].prev;
    MeshVertex& v = vertices_[vNew];
    v.prev = vPrev;
    v.next = vNext;
    v.anEdge = eOrig;
    v.alive = true;
    vertices_[vPrev].next = vNew;
    vertices_[vNext].prev = vNew;

    EdgeId e = eOrig;
    do {
        edges_[e].org = vNew;
        e = edges_[e].onext;
    } while (e != eOrig);
    ++liveVertices_;
}

void PlanarMesh::makeFace(FaceId fNew, EdgeId eOrig, FaceId fNext) noexcept {
    const FaceId fPrev = faces_[fNext].prev;
    MeshFace& f = faces_[fNew];
    f.prev = fPrev;
    f.next = fNext;
    f.anEdge = eOrig;
    f.n = kUndefIndex;
    f.marked = false;
    // A face split in two keeps its classification on both halves.
    f.inside = faces_[fNext].inside;
    f.alive = true;
    faces_[fPrev].next = fNew;
    faces_[fNext].prev = fNew;

    EdgeId e = eOrig;
    do {
        edges_[e].lface = fNew;
        e = edges_[e].lnext;
    } while (e != eOrig);
    ++liveFaces_;
}

void PlanarMesh::killEdge(EdgeId eDel) noexcept {
    if (eDel & 1u) eDel = sym(eDel);
    const EdgeId eNext = edges_[eDel].next;
    const EdgeId ePrev = edges_[sym(eDel)].next;
    edges_[sym(eNext)].next = ePrev;
    edges_[sym(ePrev)].next = eNext;

    edges_[eDel].org = kNullHandle;
    edges_[sym(eDel)].org = kNullHandle;
    edges_[eDel].lface = kNullHandle;
    edges_[sym(eDel)].lface = kNullHandle;
    freeEdgePairs_.push_back(eDel);
    --liveEdgePairs_;
}

void PlanarMesh::killVertex(VertexId vDel, VertexId newOrg) noexcept {
    const EdgeId eStart = vertices_[vDel].anEdge;
    EdgeId e = eStart;
    do {
        edges_[e].org = newOrg;
        e = edges_[e].onext;
    } while (e != eStart);

    const VertexId vPrev = vertices_[vDel].prev;
    const VertexId vNext = vertices_[vDel].next;
    vertices_[vNext].prev = vPrev;
    vertices_[vPrev].next = vNext;
    vertices_[vDel].alive = false;
    vertices_[vDel].anEdge = kNullHandle;
    --liveVertices_;
}

void PlanarMesh::killFace(FaceId fDel, FaceId newLface) noexcept {
    const EdgeId eStart = faces_[fDel].anEdge;
    EdgeId e = eStart;
    do {
        edges_[e].lface = newLface;
        e = edges_[e].lnext;
    } while (e != eStart);

    const FaceId fPrev = faces_[fDel].prev;
    const FaceId fNext = faces_[fDel].next;
    faces_[fNext].prev = fPrev;
    faces_[fPrev].next = fNext;
    faces_[fDel].alive = false;
    faces_[fDel].anEdge = kNullHandle;
    freeFaces_.push_back(fDel);
    --liveFaces_;
}

// =============================================================================
// Primitive operations
// =============================================================================

EdgeId PlanarMesh::makeEdge() {
    const VertexId v1 = allocVertex();
    const VertexId v2 = allocVertex();
    const FaceId f = allocFace();
    const EdgeId e = allocEdgePair(kEdgeHead);

    makeVertex(v1, e, kVertexHead);
    makeVertex(v2, sym(e), kVertexHead);
    makeFace(f, e, kFaceHead);
    return e;
}

void PlanarMesh::splice(EdgeId eOrg, EdgeId eDst) {
    if (eOrg == eDst) return;

    const bool joiningVertices = org(eDst) != org(eOrg);
    const bool joiningLoops = lface(eDst) != lface(eOrg);
    const VertexId newVertex = joiningVertices ? kNullHandle : allocVertex();
    const FaceId newFace = joiningLoops ? kNullHandle : allocFace();

    if (joiningVertices) {
        killVertex(org(eDst), org(eOrg));
    }
    if (joiningLoops) {
        killFace(lface(eDst), lface(eOrg));
    }

    spliceRaw(eDst, eOrg);

    if (!joiningVertices) {
        // One vertex split in two; the new one is eDst->org.
        makeVertex(newVertex, eDst, org(eOrg));
        vertices_[org(eOrg)].anEdge = eOrg;
    }
    if (!joiningLoops) {
        // One loop split in two; the new one is eDst->lface.
        makeFace(newFace, eDst, lface(eOrg));
        faces_[lface(eOrg)].anEdge = eOrg;
    }
}

void PlanarMesh::deleteEdge(EdgeId eDel) {
    const EdgeId eDelSym = sym(eDel);
    const bool joiningLoops = lface(eDel) != rface(eDel);
    const bool splitsLoop = !joiningLoops && edges_[eDel].onext != eDel;
    const FaceId newFace = splitsLoop ? allocFace() : kNullHandle;

    // Disconnect the origin first, leaving a consistent intermediate state.
    if (joiningLoops) {
        killFace(lface(eDel), rface(eDel));
    }

    if (edges_[eDel].onext == eDel) {
        killVertex(org(eDel), kNullHandle);
    } else {
        faces_[rface(eDel)].anEdge = oprev(eDel);
        vertices_[org(eDel)].anEdge = edges_[eDel].onext;
        spliceRaw(eDel, oprev(eDel));
        if (!joiningLoops) {
            makeFace(newFace, eDel, lface(eDel));
        }
    }

    // Now disconnect the destination.
    if (edges_[eDelSym].onext == eDelSym) {
        killVertex(org(eDelSym), kNullHandle);
        killFace(lface(eDelSym), kNullHandle);
    } else {
        faces_[lface(eDel)].anEdge = oprev(eDelSym);
        vertices_[org(eDelSym)].anEdge = edges_[eDelSym].onext;
        spliceRaw(eDelSym, oprev(eDelSym));
    }

    killEdge(eDel);
}

EdgeId PlanarMesh::addEdgeVertex(EdgeId eOrg) {
    const VertexId newVertex = allocVertex();
    const EdgeId eNew = allocEdgePair(eOrg);
    const EdgeId eNewSym = sym(eNew);

    spliceRaw(eNew, lnext(eOrg));

    edges_[eNew].org = dst(eOrg);
    makeVertex(newVertex, eNewSym, org(eNew));
    edges_[eNew].lface = lface(eOrg);
    edges_[eNewSym].lface = lface(eOrg);
    return eNew;
}

EdgeId PlanarMesh::splitEdge(EdgeId eOrg) {
    const EdgeId eNew = sym(addEdgeVertex(eOrg));

    // Detach eOrg from its destination and reattach it to the new vertex.
    spliceRaw(sym(eOrg), oprev(sym(eOrg)));
    spliceRaw(sym(eOrg), eNew);

    edges_[sym(eOrg)].org = org(eNew);
    vertices_[dst(eNew)].anEdge = sym(eNew);
    edges_[sym(eNew)].lface = rface(eOrg);
    edges_[eNew].winding = edges_[eOrg].winding;
    edges_[sym(eNew)].winding = edges_[sym(eOrg)].winding;
    return eNew;
}

EdgeId PlanarMesh::connect(EdgeId eOrg, EdgeId eDst) {
    const bool joiningLoops = lface(eDst) != lface(eOrg);
    const FaceId newFace = joiningLoops ? kNullHandle : allocFace();
    const EdgeId eNew = allocEdgePair(eOrg);
    const EdgeId eNewSym = sym(eNew);

    if (joiningLoops) {
        killFace(lface(eDst), lface(eOrg));
    }

    spliceRaw(eNew, lnext(eOrg));
    spliceRaw(eNewSym, eDst);

    edges_[eNew].org = dst(eOrg);
    edges_[eNewSym].org = org(eDst);
    edges_[eNew].lface = lface(eOrg);
    edges_[eNewSym].lface = lface(eOrg);

    faces_[lface(eOrg)].anEdge = eNewSym;

    if (!joiningLoops) {
        makeFace(newFace, eNew, lface(eOrg));
    }
    return eNew;
}

void PlanarMesh::flipEdge(EdgeId e) {
    const EdgeId a0 = e;
    const EdgeId a1 = lnext(a0);
    const EdgeId a2 = lnext(a1);
    const EdgeId b0 = sym(e);
    const EdgeId b1 = lnext(b0);
    const EdgeId b2 = lnext(b1);

    const VertexId aOrg = org(a0);
    const VertexId aOpp = org(a2);
    const VertexId bOrg = org(b0);
    const VertexId bOpp = org(b2);

    const FaceId fa = lface(a0);
    const FaceId fb = lface(b0);

    edges_[a0].org = bOpp;
    edges_[a0].onext = sym(b1);
    edges_[b0].org = aOpp;
    edges_[b0].onext = sym(a1);
    edges_[a2].onext = b0;
    edges_[b2].onext = a0;
    edges_[b1].onext = sym(a2);
    edges_[a1].onext = sym(b2);

    edges_[a0].lnext = a2;
    edges_[a2].lnext = b1;
    edges_[b1].lnext = a0;

    edges_[b0].lnext = b2;
    edges_[b2].lnext = a1;
    edges_[a1].lnext = b0;

    edges_[a1].lface = fb;
    edges_[b1].lface = fa;

    faces_[fa].anEdge = a0;
    faces_[fb].anEdge = b0;

    if (vertices_[aOrg].anEdge == a0) vertices_[aOrg].anEdge = b1;
    if (vertices_[bOrg].anEdge == b0) vertices_[bOrg].anEdge = a1;
}

void PlanarMesh::setWindingNumber(int value, bool keepOnlyBoundary) {
    EdgeId eNext;
    for (EdgeId e = edges_[kEdgeHead].next; e != kEdgeHead; e = eNext) {
        eNext = edges_[e].next;
        const bool leftInside = faces_[lface(e)].inside;
        if (faces_[rface(e)].inside != leftInside) {
            edges_[e].winding = leftInside ? value : -value;
            edges_[sym(e)].winding = leftInside ? -value : value;
        } else if (!keepOnlyBoundary) {
            edges_[e].winding = 0;
            edges_[sym(e)].winding = 0;
        } else {
            deleteEdge(e);
        }
    }
}

// =============================================================================
// Queries
// =============================================================================

std::uint32_t PlanarMesh::faceVertexCount(FaceId f) const noexcept {
    std::uint32_t n = 0;
    const EdgeId start = faces_[f].anEdge;
    EdgeId e = start;
    do {
        ++n;
        e = edges_[e].lnext;
    } while (e != start);
    return n;
}

std::size_t PlanarMesh::connectedComponents() const {
    std::vector<VertexId> parent(vertices_.size());
    std::iota(parent.begin(), parent.end(), 0u);
    auto find = [&parent](VertexId v) {
        while (parent[v] != v) {
            parent[v] = parent[parent[v]];
            v = parent[v];
        }
        return v;
    };
    for (EdgeId e = edges_[kEdgeHead].next; e != kEdgeHead; e = edges_[e].next) {
        const VertexId a = find(org(e));
        const VertexId b = find(dst(e));
        if (a != b) parent[a] = b;
    }
    std::size_t count = 0;
    for (VertexId v = vertices_[kVertexHead].next; v != kVertexHead; v = vertices_[v].next) {
        if (find(v) == v) ++count;
    }
    return count;
}

bool PlanarMesh::check() const {
    const std::size_t loopLimit = edges_.size() + 1;

    std::uint32_t faceCount = 0;
    FaceId fPrev = kFaceHead;
    for (FaceId f = faces_[kFaceHead].next; f != kFaceHead; fPrev = f, f = faces_[f].next) {
        if (faces_[f].prev != fPrev || !faces_[f].alive) return false;
        const EdgeId start = faces_[f].anEdge;
        if (start == kNullHandle) return false;
        EdgeId e = start;
        std::size_t steps = 0;
        do {
            if (sym(sym(e)) != e) return false;
            if (sym(onext(lnext(e))) != e) return false;
            if (lnext(sym(onext(e))) != e) return false;
            if (lface(e) != f) return false;
            e = lnext(e);
            if (++steps > loopLimit) return false;
        } while (e != start);
        ++faceCount;
    }
    if (faces_[kFaceHead].prev != fPrev) return false;

    std::uint32_t vertexCount = 0;
    VertexId vPrev = kVertexHead;
    for (VertexId v = vertices_[kVertexHead].next; v != kVertexHead; vPrev = v, v = vertices_[v].next) {
        if (vertices_[v].prev != vPrev || !vertices_[v].alive) return false;
        const EdgeId start = vertices_[v].anEdge;
        if (start == kNullHandle) return false;
        EdgeId e = start;
        std::size_t steps = 0;
        do {
            if (sym(onext(lnext(e))) != e) return false;
            if (lnext(sym(onext(e))) != e) return false;
            if (org(e) != v) return false;
            e = onext(e);
            if (++steps > loopLimit) return false;
        } while (e != start);
        ++vertexCount;
    }
    if (vertices_[kVertexHead].prev != vPrev) return false;

    std::uint32_t edgeCount = 0;
    EdgeId ePrev = kEdgeHead;
    for (EdgeId e = edges_[kEdgeHead].next; e != kEdgeHead; ePrev = e, e = edges_[e].next) {
        if (edges_[sym(e)].next != sym(ePrev)) return false;
        if (org(e) == kNullHandle || dst(e) == kNullHandle) return false;
        if (lface(e) == kNullHandle || rface(e) == kNullHandle) return false;
        if (sym(onext(lnext(e))) != e) return false;
        if (lnext(sym(onext(e))) != e) return false;
        if (++edgeCount > loopLimit) return false;
    }
    if (edges_[sym(kEdgeHead)].next != sym(ePrev)) return false;

    if (faceCount != liveFaces_ || vertexCount != liveVertices_ || edgeCount != liveEdgePairs_) {
        return false;
    }

    // Each connected component is a sphere: V - E + F == 2.
    const long long euler = static_cast<long long>(vertexCount) - static_cast<long long>(edgeCount) +
                            static_cast<long long>(faceCount);
    return euler == 2 * static_cast<long long>(connectedComponents());
}

} // namespace polytess
