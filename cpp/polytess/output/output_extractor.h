#pragma once

#include "polytess/core/types.h"

#include <cstdint>

namespace polytess {

class PlanarMesh;
struct TessResult;

struct OutputFormat {
    ElementType elementType{ElementType::Polygons};
    std::uint32_t polySize{3};
    std::uint32_t coordWidth{2};
};

/**
 * Merges adjacent interior faces while the union stays convex and has at
 * most maxVertsPerFace vertices. Returns the number of edges removed.
 */
std::uint32_t mergeConvexFaces(PlanarMesh& mesh, std::uint32_t maxVertsPerFace);

/**
 * Writes interior faces as Polygons or ConnectedPolygons. Fails with
 * InvalidInput when a face has more than polySize vertices; out is left
 * empty in that case.
 */
TessError extractPolygons(PlanarMesh& mesh, const OutputFormat& format, TessResult& out);

// Writes each interior boundary loop as a (firstVertex, vertexCount) element.
TessError extractContours(PlanarMesh& mesh, const OutputFormat& format, TessResult& out);

} // namespace polytess
