#include "polytess/sweep/sweep.h"

#include "polytess/core/geom.h"
#include "polytess/core/logging.h"
#include "polytess/mesh/planar_mesh.h"
#include "polytess/winding/winding_rule.h"

#include <algorithm>

namespace polytess {

SweepScheduler::SweepScheduler(PlanarMesh& mesh, WindingRule rule)
    : mesh_(mesh), rule_(rule), queue_(mesh), dict_(kNullHandle) {}

// =============================================================================
// Status helpers
// =============================================================================

RegionId SweepScheduler::regionBelow(RegionId r) const noexcept {
    return dict_.key(dict_.prev(regions_[r].nodeUp));
}

RegionId SweepScheduler::regionAbove(RegionId r) const noexcept {
    return dict_.key(dict_.next(regions_[r].nodeUp));
}

bool SweepScheduler::isDirty(RegionId r) const noexcept {
    return r != kNullHandle && regions_[r].dirty;
}

/**
 * Orders two status edges at the current event. Both edges must be
 * incident to the sweep line; edges ending at the event are compared by
 * slope, all others by their t-distance to the event.
 */
bool SweepScheduler::edgeLeq(EdgeId e1, EdgeId e2) const noexcept {
    const Point2& ev = mesh_.st(event_);
    const VertexId d1 = mesh_.dst(e1);
    const VertexId d2 = mesh_.dst(e2);
    const VertexId o1 = mesh_.org(e1);
    const VertexId o2 = mesh_.org(e2);

    if (d1 == event_) {
        if (d2 == event_) {
            if (vertLeq(mesh_.st(o1), mesh_.st(o2))) {
                return edgeSign(mesh_.st(d2), mesh_.st(o1), mesh_.st(o2)) <= 0;
            }
            return edgeSign(mesh_.st(d1), mesh_.st(o2), mesh_.st(o1)) >= 0;
        }
        return edgeSign(mesh_.st(d2), ev, mesh_.st(o2)) <= 0;
    }
    if (d2 == event_) {
        return edgeSign(mesh_.st(d1), ev, mesh_.st(o1)) >= 0;
    }

    const double t1 = edgeEval(mesh_.st(d1), ev, mesh_.st(o1));
    const double t2 = edgeEval(mesh_.st(d2), ev, mesh_.st(o2));
    return t1 >= t2;
}

RegionId SweepScheduler::allocRegion() {
    if (!freeRegions_.empty()) {
        const RegionId r = freeRegions_.back();
        freeRegions_.pop_back();
        regions_[r] = ActiveRegion{};
        return r;
    }
    regions_.emplace_back();
    return static_cast<RegionId>(regions_.size() - 1);
}

void SweepScheduler::deleteRegion(RegionId reg) {
    const EdgeId eUp = regions_[reg].eUp;
    if (mesh_.edge(eUp).activeRegion == reg) {
        mesh_.edge(eUp).activeRegion = kNullHandle;
    }
    dict_.erase(regions_[reg].nodeUp);
    freeRegions_.push_back(reg);
}

// Replaces a temporary upper edge with a real one.
void SweepScheduler::fixUpperEdge(RegionId reg, EdgeId newEdge) {
    mesh_.deleteEdge(regions_[reg].eUp);
    regions_[reg].fixUpperEdge = false;
    regions_[reg].eUp = newEdge;
    mesh_.edge(newEdge).activeRegion = reg;
}

RegionId SweepScheduler::topLeftRegion(RegionId reg) {
    const VertexId org = mesh_.org(regions_[reg].eUp);

    // Region above the uppermost edge with the same origin.
    do {
        reg = regionAbove(reg);
    } while (mesh_.org(regions_[reg].eUp) == org);

    if (regions_[reg].fixUpperEdge) {
        const EdgeId e = mesh_.connect(PlanarMesh::sym(regions_[regionBelow(reg)].eUp),
                                       mesh_.lnext(regions_[reg].eUp));
        fixUpperEdge(reg, e);
        reg = regionAbove(reg);
    }
    return reg;
}

RegionId SweepScheduler::topRightRegion(RegionId reg) const {
    const VertexId dst = mesh_.dst(regions_[reg].eUp);
    do {
        reg = regionAbove(reg);
    } while (mesh_.dst(regions_[reg].eUp) == dst);
    return reg;
}

RegionId SweepScheduler::addRegionBelow(RegionId regAbove, EdgeId eNewUp) {
    const RegionId regNew = allocRegion();
    regions_[regNew].eUp = eNewUp;
    const StatusNode node = dict_.insertBefore(regions_[regAbove].nodeUp, regNew,
                                               [this](RegionId a, RegionId b) {
                                                   return edgeLeq(regions_[a].eUp, regions_[b].eUp);
                                               });
    regions_[regNew].nodeUp = node;
    mesh_.edge(eNewUp).activeRegion = regNew;
    return regNew;
}

void SweepScheduler::computeWinding(RegionId reg) {
    const RegionId above = regionAbove(reg);
    regions_[reg].windingNumber = regions_[above].windingNumber + mesh_.edge(regions_[reg].eUp).winding;
    regions_[reg].inside = isWindingInside(rule_, regions_[reg].windingNumber);
}

// The face left of eUp is complete; record its classification.
void SweepScheduler::finishRegion(RegionId reg) {
    const EdgeId e = regions_[reg].eUp;
    MeshFace& f = mesh_.face(mesh_.lface(e));
    f.inside = regions_[reg].inside;
    f.anEdge = e;
    deleteRegion(reg);
}

/**
 * Finishes the regions from regFirst down to (not including) regLast, or
 * until the edges stop sharing an origin when regLast is null. Returns the
 * lowest left-going edge.
 */
EdgeId SweepScheduler::finishLeftRegions(RegionId regFirst, RegionId regLast) {
    RegionId regPrev = regFirst;
    EdgeId ePrev = regions_[regFirst].eUp;
    while (regPrev != regLast) {
        regions_[regPrev].fixUpperEdge = false;
        const RegionId reg = regionBelow(regPrev);
        EdgeId e = regions_[reg].eUp;
        if (mesh_.org(e) != mesh_.org(ePrev)) {
            if (!regions_[reg].fixUpperEdge) {
                // Call finishRegion rather than deleteRegion: processed vertices
                // may gain more left-going edges later.
                finishRegion(regPrev);
                break;
            }
            e = mesh_.connect(mesh_.lprev(ePrev), PlanarMesh::sym(e));
            fixUpperEdge(reg, e);
        }

        // Relink so that ePrev->onext == e.
        if (mesh_.onext(ePrev) != e) {
            mesh_.splice(mesh_.oprev(e), e);
            mesh_.splice(ePrev, e);
        }
        finishRegion(regPrev);
        ePrev = regions_[reg].eUp;
        regPrev = reg;
    }
    return ePrev;
}

/**
 * Inserts the right-going edges eFirst..eLast (exclusive, CCW order around
 * the event) below regUp, updates winding numbers and relinks the mesh to
 * match the status order.
 */
void SweepScheduler::addRightEdges(RegionId regUp, EdgeId eFirst, EdgeId eLast, EdgeId eTopLeft,
                                   bool cleanUp) {
    EdgeId e = eFirst;
    do {
        addRegionBelow(regUp, PlanarMesh::sym(e));
        e = mesh_.onext(e);
    } while (e != eLast);

    if (eTopLeft == kNullHandle) {
        eTopLeft = mesh_.rprev(regions_[regionBelow(regUp)].eUp);
    }

    RegionId regPrev = regUp;
    EdgeId ePrev = eTopLeft;
    bool firstTime = true;
    for (;;) {
        const RegionId reg = regionBelow(regPrev);
        e = PlanarMesh::sym(regions_[reg].eUp);
        if (mesh_.org(e) != mesh_.org(ePrev)) break;

        if (mesh_.onext(e) != ePrev) {
            mesh_.splice(mesh_.oprev(e), e);
            mesh_.splice(mesh_.oprev(ePrev), e);
        }
        regions_[reg].windingNumber = regions_[regPrev].windingNumber - mesh_.edge(e).winding;
        regions_[reg].inside = isWindingInside(rule_, regions_[reg].windingNumber);

        // Two outgoing edges with the same slope are merged before any
        // intersection test.
        regions_[regPrev].dirty = true;
        if (!firstTime && checkForRightSplice(regPrev)) {
            addWinding(e, ePrev);
            deleteRegion(regPrev);
            mesh_.deleteEdge(ePrev);
        }
        firstTime = false;
        regPrev = reg;
        ePrev = e;
    }
    regions_[regPrev].dirty = true;

    if (cleanUp) {
        walkDirtyRegions(regPrev);
    }
}

void SweepScheduler::addWinding(EdgeId eDst, EdgeId eSrc) noexcept {
    mesh_.edge(eDst).winding += mesh_.edge(eSrc).winding;
    mesh_.edge(PlanarMesh::sym(eDst)).winding += mesh_.edge(PlanarMesh::sym(eSrc)).winding;
}

// Combines two vertices at the same position; e1->org survives.
void SweepScheduler::spliceMergeVertices(EdgeId e1, EdgeId e2) {
    mesh_.splice(e1, e2);
    ++stats_.mergedVertexCount;
}

void SweepScheduler::getIntersectData(VertexId isect, VertexId orgUp, VertexId dstUp, VertexId orgLo,
                                      VertexId dstLo) {
    MeshVertex& out = mesh_.vertex(isect);
    out.coords = Vec3{0, 0, 0};
    out.inputIndex = kUndefIndex;

    // Each edge contributes half, split between its endpoints by L1 distance.
    const VertexId ends[2][2] = {{orgUp, dstUp}, {orgLo, dstLo}};
    for (const auto& pair : ends) {
        const MeshVertex& org = mesh_.vertex(pair[0]);
        const MeshVertex& dst = mesh_.vertex(pair[1]);
        const double t1 = vertL1Dist(org.st, out.st);
        const double t2 = vertL1Dist(dst.st, out.st);
        double w0 = 0.25;
        double w1 = 0.25;
        if (t1 + t2 > 0) {
            w0 = 0.5 * t2 / (t1 + t2);
            w1 = 0.5 * t1 / (t1 + t2);
        }
        out.coords.x += w0 * org.coords.x + w1 * dst.coords.x;
        out.coords.y += w0 * org.coords.y + w1 * dst.coords.y;
        out.coords.z += w0 * org.coords.z + w1 * dst.coords.z;
    }
}

// =============================================================================
// Splice and intersection checks
// =============================================================================

/**
 * Checks the upper and lower edges of regUp at their right endpoints
 * (origins) and splices the lower origin into the upper edge, or vice
 * versa, when they are out of order. Returns true when the mesh changed.
 */
bool SweepScheduler::checkForRightSplice(RegionId regUp) {
    const RegionId regLo = regionBelow(regUp);
    const EdgeId eUp = regions_[regUp].eUp;
    const EdgeId eLo = regions_[regLo].eUp;
    const VertexId orgUp = mesh_.org(eUp);
    const VertexId orgLo = mesh_.org(eLo);

    if (vertLeq(mesh_.st(orgUp), mesh_.st(orgLo))) {
        if (edgeSign(mesh_.st(mesh_.dst(eLo)), mesh_.st(orgUp), mesh_.st(orgLo)) > 0) return false;

        // eUp->org appears to be below eLo.
        if (!vertEq(mesh_.st(orgUp), mesh_.st(orgLo))) {
            mesh_.splitEdge(PlanarMesh::sym(eLo));
            mesh_.splice(eUp, mesh_.oprev(eLo));
            regions_[regUp].dirty = true;
            regions_[regLo].dirty = true;
        } else if (orgUp != orgLo) {
            queue_.erase(orgUp);
            spliceMergeVertices(mesh_.oprev(eLo), eUp);
        }
    } else {
        if (edgeSign(mesh_.st(mesh_.dst(eUp)), mesh_.st(orgLo), mesh_.st(orgUp)) < 0) return false;

        // eLo->org appears to be above eUp.
        const RegionId above = regionAbove(regUp);
        regions_[above].dirty = true;
        regions_[regUp].dirty = true;
        mesh_.splitEdge(PlanarMesh::sym(eUp));
        mesh_.splice(mesh_.oprev(eLo), eUp);
    }
    return true;
}

/**
 * Same as checkForRightSplice at the left endpoints (destinations), which
 * are already processed. Splits an edge instead of merging vertices.
 */
bool SweepScheduler::checkForLeftSplice(RegionId regUp) {
    const RegionId regLo = regionBelow(regUp);
    const EdgeId eUp = regions_[regUp].eUp;
    const EdgeId eLo = regions_[regLo].eUp;
    const Point2 dstUp = mesh_.st(mesh_.dst(eUp));
    const Point2 dstLo = mesh_.st(mesh_.dst(eLo));

    if (vertLeq(dstUp, dstLo)) {
        if (edgeSign(dstUp, dstLo, mesh_.st(mesh_.org(eUp))) < 0) return false;

        // eLo->dst is above eUp; splice it into eUp.
        const RegionId above = regionAbove(regUp);
        regions_[above].dirty = true;
        regions_[regUp].dirty = true;
        const EdgeId e = mesh_.splitEdge(eUp);
        mesh_.splice(PlanarMesh::sym(eLo), e);
        mesh_.face(mesh_.lface(e)).inside = regions_[regUp].inside;
    } else {
        if (edgeSign(dstLo, dstUp, mesh_.st(mesh_.org(eLo))) > 0) return false;

        // eUp->dst is below eLo; splice it into eLo.
        regions_[regUp].dirty = true;
        regions_[regLo].dirty = true;
        const EdgeId e = mesh_.splitEdge(eLo);
        mesh_.splice(mesh_.lnext(eUp), PlanarMesh::sym(eLo));
        mesh_.face(mesh_.rface(e)).inside = regions_[regUp].inside;
    }
    return true;
}

/**
 * Checks the upper and lower edges of regUp for an intersection right of
 * the sweep line and splits both at the intersection when found. Returns
 * true when walkDirtyRegions was invoked recursively.
 */
bool SweepScheduler::checkForIntersect(RegionId regUp) {
    RegionId regLo = regionBelow(regUp);
    EdgeId eUp = regions_[regUp].eUp;
    EdgeId eLo = regions_[regLo].eUp;
    const VertexId orgUp = mesh_.org(eUp);
    const VertexId orgLo = mesh_.org(eLo);
    const VertexId dstUp = mesh_.dst(eUp);
    const VertexId dstLo = mesh_.dst(eLo);

    // Right endpoints are the same.
    if (orgUp == orgLo) return false;

    const Point2 pOrgUp = mesh_.st(orgUp);
    const Point2 pOrgLo = mesh_.st(orgLo);
    const Point2 pDstUp = mesh_.st(dstUp);
    const Point2 pDstLo = mesh_.st(dstLo);
    const Point2 pEvent = mesh_.st(event_);

    const double tMinUp = std::min(pOrgUp.t, pDstUp.t);
    const double tMaxLo = std::max(pOrgLo.t, pDstLo.t);
    if (tMinUp > tMaxLo) return false;

    if (vertLeq(pOrgUp, pOrgLo)) {
        if (edgeSign(pDstLo, pOrgUp, pOrgLo) > 0) return false;
    } else {
        if (edgeSign(pDstUp, pOrgLo, pOrgUp) < 0) return false;
    }

    // The edges intersect, at least marginally.
    Point2 isect = edgeIntersect(pDstUp, pOrgUp, pDstLo, pOrgLo);

    if (vertLeq(isect, pEvent)) {
        // Slightly left of the sweep line through rounding: use the event.
        if (!vertEq(isect, pEvent)) {
            ++stats_.degenerateCollapseCount;
            POLYTESS_LOG_DEBUG("sweep: intersection clamped to event (%g, %g)", pEvent.s, pEvent.t);
        }
        isect = pEvent;
    }
    // Right of the rightmost origin: clamp, or degenerate input gets slow.
    const Point2 orgMin = vertLeq(pOrgUp, pOrgLo) ? pOrgUp : pOrgLo;
    if (vertLeq(orgMin, isect)) {
        if (!vertEq(orgMin, isect)) {
            ++stats_.degenerateCollapseCount;
            POLYTESS_LOG_DEBUG("sweep: intersection clamped to origin (%g, %g)", orgMin.s, orgMin.t);
        }
        isect = orgMin;
    }

    if (vertEq(isect, pOrgUp) || vertEq(isect, pOrgLo)) {
        // Intersection at one of the right endpoints.
        (void)checkForRightSplice(regUp);
        return false;
    }

    if ((!vertEq(pDstUp, pEvent) && edgeSign(pDstUp, pEvent, isect) >= 0) ||
        (!vertEq(pDstLo, pEvent) && edgeSign(pDstLo, pEvent, isect) <= 0)) {
        // The new upper or lower edge would pass on the wrong side of the
        // event, or through it, due to rounding in the intersection.
        ++stats_.degenerateCollapseCount;
        POLYTESS_LOG_DEBUG("sweep: near-degenerate intersection at event (%g, %g)", pEvent.s, pEvent.t);
        if (dstLo == event_) {
            // Splice dstLo into eUp and process the new regions.
            mesh_.splitEdge(PlanarMesh::sym(eUp));
            mesh_.splice(PlanarMesh::sym(eLo), eUp);
            regUp = topLeftRegion(regUp);
            eUp = regions_[regionBelow(regUp)].eUp;
            finishLeftRegions(regionBelow(regUp), regLo);
            addRightEdges(regUp, mesh_.oprev(eUp), eUp, eUp, true);
            return true;
        }
        if (dstUp == event_) {
            // Splice dstUp into eLo and process the new regions.
            mesh_.splitEdge(PlanarMesh::sym(eLo));
            mesh_.splice(mesh_.lnext(eUp), mesh_.oprev(eLo));
            regLo = regUp;
            regUp = topRightRegion(regUp);
            const EdgeId e = mesh_.rprev(regions_[regionBelow(regUp)].eUp);
            regions_[regLo].eUp = mesh_.oprev(eLo);
            eLo = finishLeftRegions(regLo, kNullHandle);
            addRightEdges(regUp, mesh_.onext(eLo), mesh_.rprev(eUp), e, true);
            return true;
        }
        // Reached from connectRightVertex. Split the offending edge at the
        // event and let connectRightVertex splice it.
        if (edgeSign(pDstUp, pEvent, isect) >= 0) {
            const RegionId above = regionAbove(regUp);
            regions_[above].dirty = true;
            regions_[regUp].dirty = true;
            mesh_.splitEdge(PlanarMesh::sym(eUp));
            MeshVertex& v = mesh_.vertex(mesh_.org(eUp));
            v.st = pEvent;
            v.coords = mesh_.vertex(event_).coords;
        }
        if (edgeSign(pDstLo, pEvent, isect) <= 0) {
            regions_[regUp].dirty = true;
            regions_[regLo].dirty = true;
            mesh_.splitEdge(PlanarMesh::sym(eLo));
            MeshVertex& v = mesh_.vertex(mesh_.org(eLo));
            v.st = pEvent;
            v.coords = mesh_.vertex(event_).coords;
        }
        return false;
    }

    // General case: split both edges and splice them into a new vertex.
    // eUp->lface is expected to be the smaller face, which keeps the
    // relabelling in splice cheap.
    mesh_.splitEdge(PlanarMesh::sym(eUp));
    mesh_.splitEdge(PlanarMesh::sym(eLo));
    mesh_.splice(mesh_.oprev(eLo), eUp);
    const VertexId v = mesh_.org(eUp);
    mesh_.vertex(v).st = isect;
    queue_.insert(v);
    getIntersectData(v, orgUp, dstUp, orgLo, dstLo);
    ++stats_.intersectionCount;

    const RegionId above = regionAbove(regUp);
    regions_[above].dirty = true;
    regions_[regUp].dirty = true;
    regions_[regLo].dirty = true;
    return false;
}

/**
 * Restores the status invariants for all dirty regions, walking from the
 * lowest dirty region upward: edge order at both endpoints, intersections,
 * and removal of two-edge loops.
 */
void SweepScheduler::walkDirtyRegions(RegionId regUp) {
    RegionId regLo = regionBelow(regUp);

    for (;;) {
        while (isDirty(regLo)) {
            regUp = regLo;
            regLo = regionBelow(regLo);
        }
        if (!regions_[regUp].dirty) {
            regLo = regUp;
            regUp = regionAbove(regUp);
            if (regUp == kNullHandle || !regions_[regUp].dirty) {
                return;
            }
        }
        regions_[regUp].dirty = false;
        EdgeId eUp = regions_[regUp].eUp;
        EdgeId eLo = regions_[regLo].eUp;

        if (mesh_.dst(eUp) != mesh_.dst(eLo)) {
            if (checkForLeftSplice(regUp)) {
                // Temporary edges are only needed for vertices without
                // right-going edges; drop them once a real edge exists.
                if (regions_[regLo].fixUpperEdge) {
                    deleteRegion(regLo);
                    mesh_.deleteEdge(eLo);
                    regLo = regionBelow(regUp);
                    eLo = regions_[regLo].eUp;
                } else if (regions_[regUp].fixUpperEdge) {
                    deleteRegion(regUp);
                    mesh_.deleteEdge(eUp);
                    regUp = regionAbove(regLo);
                    eUp = regions_[regUp].eUp;
                }
            }
        }
        if (mesh_.org(eUp) != mesh_.org(eLo)) {
            if (mesh_.dst(eUp) != mesh_.dst(eLo) && !regions_[regUp].fixUpperEdge &&
                !regions_[regLo].fixUpperEdge && (mesh_.dst(eUp) == event_ || mesh_.dst(eLo) == event_)) {
                // checkForIntersect may fall back to the event as the
                // intersection, which needs the event between both edges.
                if (checkForIntersect(regUp)) {
                    return;
                }
            } else {
                (void)checkForRightSplice(regUp);
            }
        }
        if (mesh_.org(eUp) == mesh_.org(eLo) && mesh_.dst(eUp) == mesh_.dst(eLo)) {
            // Degenerate two-edge loop.
            addWinding(eLo, eUp);
            deleteRegion(regUp);
            mesh_.deleteEdge(eUp);
            regUp = regionAbove(regLo);
        }
    }
}

// =============================================================================
// Event processing
// =============================================================================

/**
 * The event has no right-going edges. Either it closes off regions that
 * are split again by degenerate splices, or a temporary edge to the closer
 * of the two origins is added to keep the faces monotone.
 */
void SweepScheduler::connectRightVertex(RegionId regUp, EdgeId eBottomLeft) {
    EdgeId eTopLeft = mesh_.onext(eBottomLeft);
    const RegionId regLo = regionBelow(regUp);
    const EdgeId eUp = regions_[regUp].eUp;
    const EdgeId eLo = regions_[regLo].eUp;
    bool degenerate = false;

    if (mesh_.dst(eUp) != mesh_.dst(eLo)) {
        (void)checkForIntersect(regUp);
    }

    // The upper or lower edge may now pass through the event.
    if (vertEq(mesh_.st(mesh_.org(eUp)), mesh_.st(event_))) {
        mesh_.splice(mesh_.oprev(eTopLeft), eUp);
        regUp = topLeftRegion(regUp);
        eTopLeft = regions_[regionBelow(regUp)].eUp;
        finishLeftRegions(regionBelow(regUp), regLo);
        degenerate = true;
    }
    if (vertEq(mesh_.st(mesh_.org(eLo)), mesh_.st(event_))) {
        mesh_.splice(eBottomLeft, mesh_.oprev(eLo));
        eBottomLeft = finishLeftRegions(regLo, kNullHandle);
        degenerate = true;
    }
    if (degenerate) {
        addRightEdges(regUp, mesh_.onext(eBottomLeft), eTopLeft, eTopLeft, true);
        return;
    }

    const EdgeId target = vertLeq(mesh_.st(mesh_.org(eLo)), mesh_.st(mesh_.org(eUp))) ? mesh_.oprev(eLo) : eUp;
    const EdgeId eNew = mesh_.connect(mesh_.lprev(eBottomLeft), target);

    // No cleanup yet: eNew must be marked temporary before anything can remove it.
    addRightEdges(regUp, eNew, mesh_.onext(eNew), mesh_.onext(eNew), false);
    regions_[mesh_.edge(PlanarMesh::sym(eNew)).activeRegion].fixUpperEdge = true;
    walkDirtyRegions(regUp);
}

// The event lies exactly on the upper edge of regUp.
void SweepScheduler::connectLeftDegenerate(RegionId regUp, VertexId vEvent) {
    ++stats_.degenerateCollapseCount;
    const EdgeId e = regions_[regUp].eUp;

    if (vertEq(mesh_.st(mesh_.org(e)), mesh_.st(vEvent))) {
        // Unprocessed vertex at the same position: merge and wait for it.
        spliceMergeVertices(e, mesh_.vertex(vEvent).anEdge);
        return;
    }

    if (!vertEq(mesh_.st(mesh_.dst(e)), mesh_.st(vEvent))) {
        // Splice the event into the edge passing through it.
        mesh_.splitEdge(PlanarMesh::sym(e));
        if (regions_[regUp].fixUpperEdge) {
            // Drop the unused part of the temporary edge.
            mesh_.deleteEdge(mesh_.onext(e));
            regions_[regUp].fixUpperEdge = false;
        }
        mesh_.splice(mesh_.vertex(vEvent).anEdge, e);
        sweepEvent(vEvent);
        return;
    }

    // The event coincides with the already processed e->dst.
    regUp = topRightRegion(regUp);
    const RegionId reg = regionBelow(regUp);
    EdgeId eTopRight = PlanarMesh::sym(regions_[reg].eUp);
    EdgeId eTopLeft = mesh_.onext(eTopRight);
    const EdgeId eLast = eTopLeft;
    if (regions_[reg].fixUpperEdge) {
        // e->dst has a single temporary right-going edge; real ones replace it.
        deleteRegion(reg);
        mesh_.deleteEdge(eTopRight);
        eTopRight = mesh_.oprev(eTopLeft);
    }
    mesh_.splice(mesh_.vertex(vEvent).anEdge, eTopRight);
    if (!mesh_.edgeGoesLeft(eTopLeft)) {
        eTopLeft = kNullHandle;
    }
    addRightEdges(regUp, mesh_.onext(eTopRight), eLast, eTopLeft, true);
}

// The event has no processed incident edges: all its edges go right.
void SweepScheduler::connectLeftVertex(VertexId vEvent) {
    const EdgeId eEvent = PlanarMesh::sym(mesh_.vertex(vEvent).anEdge);
    const StatusNode node = dict_.search([this, eEvent](RegionId key) {
        return edgeLeq(eEvent, regions_[key].eUp);
    });
    const RegionId regUp = dict_.key(node);
    if (regUp == kNullHandle) return;
    const RegionId regLo = regionBelow(regUp);
    if (regLo == kNullHandle) {
        // Only possible for collinear input.
        return;
    }
    const EdgeId eUp = regions_[regUp].eUp;
    const EdgeId eLo = regions_[regLo].eUp;

    if (edgeSign(mesh_.st(mesh_.dst(eUp)), mesh_.st(vEvent), mesh_.st(mesh_.org(eUp))) == 0) {
        connectLeftDegenerate(regUp, vEvent);
        return;
    }

    // Connect to the rightmost processed vertex of eLo->dst and eUp->dst.
    const RegionId reg = vertLeq(mesh_.st(mesh_.dst(eLo)), mesh_.st(mesh_.dst(eUp))) ? regUp : regLo;

    if (regions_[regUp].inside || regions_[reg].fixUpperEdge) {
        EdgeId eNew;
        if (reg == regUp) {
            eNew = mesh_.connect(PlanarMesh::sym(mesh_.vertex(vEvent).anEdge), mesh_.lnext(eUp));
        } else {
            eNew = PlanarMesh::sym(mesh_.connect(mesh_.dnext(eLo), mesh_.vertex(vEvent).anEdge));
        }
        if (regions_[reg].fixUpperEdge) {
            fixUpperEdge(reg, eNew);
        } else {
            computeWinding(addRegionBelow(regUp, eNew));
        }
        sweepEvent(vEvent);
    } else {
        // Outside the polygon: no connection needed.
        const EdgeId e = mesh_.vertex(vEvent).anEdge;
        addRightEdges(regUp, e, e, kNullHandle, true);
    }
}

void SweepScheduler::sweepEvent(VertexId vEvent) {
    event_ = vEvent;
    ++stats_.eventCount;

    // Find an edge already in the status, if any.
    const EdgeId start = mesh_.vertex(vEvent).anEdge;
    EdgeId e = start;
    while (mesh_.edge(e).activeRegion == kNullHandle) {
        e = mesh_.onext(e);
        if (e == start) {
            connectLeftVertex(vEvent);
            return;
        }
    }

    // Close the regions bounded on both sides by edges ending here.
    const RegionId regUp = topLeftRegion(mesh_.edge(e).activeRegion);
    const RegionId reg = regionBelow(regUp);
    const EdgeId eTopLeft = regions_[reg].eUp;
    const EdgeId eBottomLeft = finishLeftRegions(reg, kNullHandle);

    // Then open regions for the right-going edges.
    if (mesh_.onext(eBottomLeft) == eTopLeft) {
        connectRightVertex(regUp, eBottomLeft);
    } else {
        addRightEdges(regUp, mesh_.onext(eBottomLeft), eTopLeft, eTopLeft, true);
    }
}

// =============================================================================
// Setup and teardown
// =============================================================================

void SweepScheduler::addSentinel(double smin, double smax, double t) {
    const EdgeId e = mesh_.makeEdge();
    mesh_.vertex(mesh_.org(e)).st = Point2{smax, t};
    mesh_.vertex(mesh_.dst(e)).st = Point2{smin, t};
    event_ = mesh_.dst(e);

    const RegionId reg = allocRegion();
    regions_[reg].eUp = e;
    regions_[reg].sentinel = true;
    const StatusNode node = dict_.insert(reg, [this](RegionId a, RegionId b) {
        return edgeLeq(regions_[a].eUp, regions_[b].eUp);
    });
    regions_[reg].nodeUp = node;
}

void SweepScheduler::initEdgeDict() {
    dict_.clear();
    regions_.clear();
    freeRegions_.clear();

    bool any = false;
    Point2 bmin{0, 0};
    Point2 bmax{0, 0};
    for (VertexId v = mesh_.vertex(PlanarMesh::kVertexHead).next; v != PlanarMesh::kVertexHead;
         v = mesh_.vertex(v).next) {
        const Point2& p = mesh_.st(v);
        if (!any) {
            bmin = p;
            bmax = p;
            any = true;
            continue;
        }
        bmin.s = std::min(bmin.s, p.s);
        bmin.t = std::min(bmin.t, p.t);
        bmax.s = std::max(bmax.s, p.s);
        bmax.t = std::max(bmax.t, p.t);
    }

    // Keep the sentinels apart even for an empty box.
    const double w = bmax.s - bmin.s;
    const double h = bmax.t - bmin.t;
    const double smin = bmin.s - (w > 0 ? w : 0.01);
    const double smax = bmax.s + (w > 0 ? w : 0.01);
    const double tmin = bmin.t - (h > 0 ? h : 0.01);
    const double tmax = bmax.t + (h > 0 ? h : 0.01);

    addSentinel(smin, smax, tmin);
    addSentinel(smin, smax, tmax);
}

void SweepScheduler::doneEdgeDict() {
    // Left over: the two sentinels plus at most one temporary edge. All of
    // them lie between outside faces and leave the mesh with their regions.
    RegionId reg;
    while ((reg = dict_.key(dict_.min())) != kNullHandle) {
        const EdgeId eUp = regions_[reg].eUp;
        const bool synthetic = regions_[reg].sentinel || regions_[reg].fixUpperEdge;
        deleteRegion(reg);
        if (synthetic) {
            mesh_.deleteEdge(eUp);
        }
    }
}

/**
 * Removes zero-length edges and contours with fewer than three edges.
 */
void SweepScheduler::removeDegenerateEdges() {
    EdgeId eNext;
    for (EdgeId e = mesh_.edge(PlanarMesh::kEdgeHead).next; e != PlanarMesh::kEdgeHead; e = eNext) {
        eNext = mesh_.edge(e).next;
        EdgeId eLnext = mesh_.lnext(e);

        if (vertEq(mesh_.st(mesh_.org(e)), mesh_.st(mesh_.dst(e))) && mesh_.lnext(eLnext) != e) {
            // Zero-length edge in a contour of at least three edges.
            spliceMergeVertices(eLnext, e);
            mesh_.deleteEdge(e);
            ++stats_.degenerateCollapseCount;
            e = eLnext;
            eLnext = mesh_.lnext(e);
        }
        if (mesh_.lnext(eLnext) == e) {
            // One or two edges.
            if (eLnext != e) {
                if (eLnext == eNext || eLnext == PlanarMesh::sym(eNext)) {
                    eNext = mesh_.edge(eNext).next;
                }
                mesh_.deleteEdge(eLnext);
            }
            if (e == eNext || e == PlanarMesh::sym(eNext)) {
                eNext = mesh_.edge(eNext).next;
            }
            mesh_.deleteEdge(e);
            ++stats_.degenerateCollapseCount;
        }
    }
}

void SweepScheduler::initEventQueue() {
    queue_.clear();
    for (VertexId v = mesh_.vertex(PlanarMesh::kVertexHead).next; v != PlanarMesh::kVertexHead;
         v = mesh_.vertex(v).next) {
        queue_.insert(v);
    }
}

// Deletes faces with only two edges, folding their winding into the survivor.
void SweepScheduler::removeDegenerateFaces() {
    FaceId fNext;
    for (FaceId f = mesh_.face(PlanarMesh::kFaceHead).next; f != PlanarMesh::kFaceHead; f = fNext) {
        fNext = mesh_.face(f).next;
        const EdgeId e = mesh_.face(f).anEdge;
        if (mesh_.lnext(mesh_.lnext(e)) == e) {
            addWinding(mesh_.onext(e), e);
            mesh_.deleteEdge(e);
        }
    }
}

void SweepScheduler::computeInterior() {
    state_ = SweepState::Scheduling;
    stats_ = SweepStats{};

    removeDegenerateEdges();
    initEventQueue();
    initEdgeDict();

    state_ = SweepState::Sweeping;
    VertexId v;
    while ((v = queue_.pop()) != kNullHandle) {
        for (;;) {
            // Merge all vertices at exactly the same position first, so that
            // coincident edges from different contours are split identically.
            const VertexId vNext = queue_.top();
            if (vNext == kNullHandle || !vertEq(mesh_.st(vNext), mesh_.st(v))) break;
            queue_.pop();
            spliceMergeVertices(mesh_.vertex(v).anEdge, mesh_.vertex(vNext).anEdge);
        }
        sweepEvent(v);
    }

    doneEdgeDict();
    queue_.clear();
    removeDegenerateFaces();
    state_ = SweepState::Done;

    if (stats_.degenerateCollapseCount > 0) {
        POLYTESS_LOG_WARN("sweep: %u degenerate collapses", stats_.degenerateCollapseCount);
    }
}

} // namespace polytess
