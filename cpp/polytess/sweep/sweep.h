#pragma once

#include "polytess/core/types.h"
#include "polytess/sweep/event_queue.h"
#include "polytess/sweep/status_list.h"

#include <cstdint>
#include <vector>

namespace polytess {

class PlanarMesh;

enum class SweepState : std::uint8_t {
    Idle = 0,
    Scheduling = 1,
    Sweeping = 2,
    Done = 3,
};

struct SweepStats {
    std::uint32_t eventCount{0};
    std::uint32_t intersectionCount{0};
    std::uint32_t mergedVertexCount{0};
    std::uint32_t degenerateCollapseCount{0};
};

/**
 * Plane sweep over a mesh of closed contours. Splits edges at their
 * intersections, connects every vertex so that each face between two
 * consecutive status edges is monotone, and marks faces inside or outside
 * according to the winding rule.
 *
 * Vertices must carry projected (s, t) positions. Throws std::bad_alloc.
 */
class SweepScheduler {
public:
    SweepScheduler(PlanarMesh& mesh, WindingRule rule);

    SweepScheduler(const SweepScheduler&) = delete;
    SweepScheduler& operator=(const SweepScheduler&) = delete;

    void computeInterior();

    SweepState state() const noexcept { return state_; }
    const SweepStats& stats() const noexcept { return stats_; }

private:
    using StatusNode = StatusList<RegionId>::NodeId;

    // Region between two consecutive status edges; eUp bounds it from above.
    struct ActiveRegion {
        EdgeId eUp{kNullHandle};
        StatusNode nodeUp{0};
        int windingNumber{0};
        bool inside{false};
        bool sentinel{false};
        bool dirty{false};
        // eUp is a temporary edge added for a vertex without right-going edges.
        bool fixUpperEdge{false};
    };

    RegionId regionBelow(RegionId r) const noexcept;
    RegionId regionAbove(RegionId r) const noexcept;
    bool isDirty(RegionId r) const noexcept;

    bool edgeLeq(EdgeId e1, EdgeId e2) const noexcept;

    RegionId allocRegion();
    void deleteRegion(RegionId reg);
    void fixUpperEdge(RegionId reg, EdgeId newEdge);
    RegionId topLeftRegion(RegionId reg);
    RegionId topRightRegion(RegionId reg) const;
    RegionId addRegionBelow(RegionId regAbove, EdgeId eNewUp);
    void computeWinding(RegionId reg);
    void finishRegion(RegionId reg);
    EdgeId finishLeftRegions(RegionId regFirst, RegionId regLast);
    void addRightEdges(RegionId regUp, EdgeId eFirst, EdgeId eLast, EdgeId eTopLeft, bool cleanUp);

    void addWinding(EdgeId eDst, EdgeId eSrc) noexcept;
    void spliceMergeVertices(EdgeId e1, EdgeId e2);
    void getIntersectData(VertexId isect, VertexId orgUp, VertexId dstUp, VertexId orgLo, VertexId dstLo);

    bool checkForRightSplice(RegionId regUp);
    bool checkForLeftSplice(RegionId regUp);
    bool checkForIntersect(RegionId regUp);
    void walkDirtyRegions(RegionId regUp);

    void connectRightVertex(RegionId regUp, EdgeId eBottomLeft);
    void connectLeftDegenerate(RegionId regUp, VertexId vEvent);
    void connectLeftVertex(VertexId vEvent);
    void sweepEvent(VertexId vEvent);

    void addSentinel(double smin, double smax, double t);
    void initEdgeDict();
    void doneEdgeDict();
    void removeDegenerateEdges();
    void initEventQueue();
    void removeDegenerateFaces();

    PlanarMesh& mesh_;
    WindingRule rule_;
    EventQueue queue_;
    StatusList<RegionId> dict_;
    std::vector<ActiveRegion> regions_;
    std::vector<RegionId> freeRegions_;
    VertexId event_{kNullHandle};
    SweepState state_{SweepState::Idle};
    SweepStats stats_{};
};

} // namespace polytess
