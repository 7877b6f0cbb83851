#pragma once

#include "polytess/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace polytess {

struct MeshVertex {
    VertexId next{0};
    VertexId prev{0};
    EdgeId anEdge{kNullHandle};
    Vec3 coords{0, 0, 0};
    Point2 st{0, 0};
    // Position in the global input order, kUndefIndex for synthesized vertices.
    std::uint32_t inputIndex{kUndefIndex};
    // Output number assigned by the extractor.
    std::uint32_t n{kUndefIndex};
    bool alive{false};
};

struct MeshHalfEdge {
    // Pair list link. Only the even half of a pair is on the forward list;
    // the odd half stores the backward link.
    EdgeId next{0};
    EdgeId onext{0};
    EdgeId lnext{0};
    VertexId org{kNullHandle};
    FaceId lface{kNullHandle};
    RegionId activeRegion{kNullHandle};
    // Change in winding number when crossing from the right face to the left face.
    int winding{0};
    bool mark{false};
};

struct MeshFace {
    FaceId next{0};
    FaceId prev{0};
    EdgeId anEdge{kNullHandle};
    std::uint32_t n{kUndefIndex};
    bool inside{false};
    bool marked{false};
    bool alive{false};
};

/**
 * Half-edge planar subdivision stored in arenas and addressed by handles.
 *
 * Half-edges are allocated in pairs so that sym(e) == e ^ 1. Slot 0 of each
 * arena is the list head; it is never a real element. Vertex slots are not
 * recycled while the mesh lives; edge pairs and faces are.
 *
 * References returned by vertex()/edge()/face() are invalidated by any
 * operation that allocates.
 */
class PlanarMesh {
public:
    static constexpr VertexId kVertexHead = 0;
    static constexpr FaceId kFaceHead = 0;
    static constexpr EdgeId kEdgeHead = 0;

    PlanarMesh();

    void clear();

    // -------------------------------------------------------------------------
    // Navigation
    // -------------------------------------------------------------------------

    static EdgeId sym(EdgeId e) noexcept { return e ^ 1u; }

    EdgeId onext(EdgeId e) const noexcept { return edges_[e].onext; }
    EdgeId lnext(EdgeId e) const noexcept { return edges_[e].lnext; }
    EdgeId oprev(EdgeId e) const noexcept { return edges_[sym(e)].lnext; }
    EdgeId lprev(EdgeId e) const noexcept { return sym(edges_[e].onext); }
    EdgeId dprev(EdgeId e) const noexcept { return sym(edges_[e].lnext); }
    EdgeId rprev(EdgeId e) const noexcept { return edges_[sym(e)].onext; }
    EdgeId dnext(EdgeId e) const noexcept { return sym(rprev(e)); }
    EdgeId rnext(EdgeId e) const noexcept { return sym(oprev(e)); }

    VertexId org(EdgeId e) const noexcept { return edges_[e].org; }
    VertexId dst(EdgeId e) const noexcept { return edges_[sym(e)].org; }
    FaceId lface(EdgeId e) const noexcept { return edges_[e].lface; }
    FaceId rface(EdgeId e) const noexcept { return edges_[sym(e)].lface; }

    const Point2& st(VertexId v) const noexcept { return vertices_[v].st; }

    MeshVertex& vertex(VertexId v) noexcept { return vertices_[v]; }
    const MeshVertex& vertex(VertexId v) const noexcept { return vertices_[v]; }
    MeshHalfEdge& edge(EdgeId e) noexcept { return edges_[e]; }
    const MeshHalfEdge& edge(EdgeId e) const noexcept { return edges_[e]; }
    MeshFace& face(FaceId f) noexcept { return faces_[f]; }
    const MeshFace& face(FaceId f) const noexcept { return faces_[f]; }

    // Left goes toward smaller s in the sweep order.
    bool edgeGoesLeft(EdgeId e) const noexcept;
    bool edgeGoesRight(EdgeId e) const noexcept;

    // -------------------------------------------------------------------------
    // Primitive operations
    // -------------------------------------------------------------------------

    // New edge with two new vertices and one new face (a loop).
    EdgeId makeEdge();

    /**
     * Exchanges eOrg->onext and eDst->onext. Merges or splits the origin
     * vertices and the left faces as needed.
     */
    void splice(EdgeId eOrg, EdgeId eDst);

    /**
     * Removes eDel. Joins the two adjacent faces when they differ, otherwise
     * splits the face. Isolated vertices and faces are destroyed.
     */
    void deleteEdge(EdgeId eDel);

    // New edge eNew = eOrg->lnext with a new destination vertex, same left face.
    EdgeId addEdgeVertex(EdgeId eOrg);

    // Splits eOrg in two by inserting a vertex; returns the new second half.
    EdgeId splitEdge(EdgeId eOrg);

    /**
     * New edge from eOrg->dst to eDst->org. Splits the face when both lie on
     * the same left face, joins two loops otherwise. Returns the new edge.
     */
    EdgeId connect(EdgeId eOrg, EdgeId eDst);

    // Replaces the diagonal of the quad formed by two triangles with the other one.
    void flipEdge(EdgeId e);

    /**
     * Resets edge windings to +value/-value on interior/exterior boundaries.
     * With keepOnlyBoundary, edges between two faces of the same kind are
     * deleted, otherwise their winding is zeroed.
     */
    void setWindingNumber(int value, bool keepOnlyBoundary);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    std::uint32_t faceVertexCount(FaceId f) const noexcept;

    std::uint32_t liveVertexCount() const noexcept { return liveVertices_; }
    std::uint32_t liveEdgeCount() const noexcept { return liveEdgePairs_; }
    std::uint32_t liveFaceCount() const noexcept { return liveFaces_; }

    // Verifies all local invariants and the Euler relation.
    bool check() const;

private:
    EdgeId allocEdgePair(EdgeId eNext);
    VertexId allocVertex();
    FaceId allocFace();

    void spliceRaw(EdgeId a, EdgeId b) noexcept;
    void makeVertex(VertexId vNew, EdgeId eOrig, VertexId vNext) noexcept;
    void makeFace(FaceId fNew, EdgeId eOrig, FaceId fNext) noexcept;
    void killEdge(EdgeId eDel) noexcept;
    void killVertex(VertexId vDel, VertexId newOrg) noexcept;
    void killFace(FaceId fDel, FaceId newLface) noexcept;

    std::size_t connectedComponents() const;

    std::vector<MeshVertex> vertices_;
    std::vector<MeshHalfEdge> edges_;
    std::vector<MeshFace> faces_;
    std::vector<EdgeId> freeEdgePairs_;
    std::vector<FaceId> freeFaces_;
    std::uint32_t liveVertices_{0};
    std::uint32_t liveEdgePairs_{0};
    std::uint32_t liveFaces_{0};
};

} // namespace polytess
