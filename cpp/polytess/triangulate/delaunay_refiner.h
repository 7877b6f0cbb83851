#pragma once

#include "polytess/core/types.h"

#include <cstdint>

namespace polytess {

class PlanarMesh;

struct DelaunayResult {
    std::uint32_t flips{0};
    std::uint32_t iterations{0};
    bool budgetExhausted{false};
};

/**
 * Edge-flip refinement of a triangulated interior toward the constrained
 * Delaunay triangulation. Input segments and interior/exterior boundaries
 * are never flipped.
 */
class DelaunayRefiner {
public:
    explicit DelaunayRefiner(PlanarMesh& mesh) : mesh_(mesh) {}

    // maxIterations == 0 selects the square of the interior face count.
    DelaunayResult refine(std::uint32_t maxIterations = 0);

    // Both sides interior triangles, and not an input segment.
    bool isFlippable(EdgeId e) const noexcept;

    // Sum of the two angles opposite e stays below pi.
    bool isLocallyDelaunay(EdgeId e) const noexcept;

private:
    PlanarMesh& mesh_;
};

} // namespace polytess
