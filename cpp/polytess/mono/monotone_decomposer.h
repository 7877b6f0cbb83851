#pragma once

#include "polytess/core/types.h"

#include <cstdint>
#include <utility>
#include <vector>

namespace polytess {

class PlanarMesh;

enum class VertexKind : std::uint8_t {
    Start = 0,
    End = 1,
    Split = 2,
    Merge = 3,
    Regular = 4,
};

const char* toString(VertexKind kind) noexcept;

/**
 * Splits interior faces into pieces that are monotone with respect to the
 * sweep direction by adding diagonals at split and merge vertices.
 *
 * Faces produced by the sweep are already monotone, so on that input the
 * pass only classifies vertices. Faces are expected to be simple and
 * counter-clockwise in (s, t).
 */
class MonotoneDecomposer {
public:
    explicit MonotoneDecomposer(PlanarMesh& mesh) : mesh_(mesh) {}

    // Kind of the face corner at org(e), with lprev(e) arriving and e leaving.
    VertexKind classify(EdgeId e) const noexcept;

    bool isMonotone(FaceId f) const noexcept;

    // Returns the number of diagonals inserted.
    std::uint32_t decomposeFace(FaceId f);
    std::uint32_t decomposeInterior();

    std::vector<std::pair<VertexId, VertexId>> collectDiagonals(FaceId f) const;

private:
    bool insertDiagonal(VertexId u, VertexId w, std::vector<FaceId>& pieces);

    PlanarMesh& mesh_;
};

} // namespace polytess
