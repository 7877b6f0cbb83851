#pragma once

#include "polytess/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace polytess {

/**
 * Output of one tessellation run.
 *
 * Polygons: elementCount * polySize vertex indices, padded with kUndefIndex.
 * ConnectedPolygons: per element, polySize vertex indices then polySize
 * neighbour element indices.
 * BoundaryContours: elementCount (firstVertex, vertexCount) pairs.
 */
struct TessResult {
    ElementType elementType{ElementType::Polygons};
    std::uint32_t polySize{3};
    std::uint32_t coordWidth{2};
    std::vector<float> vertices;
    // Input index of each output vertex, kUndefIndex for intersections.
    std::vector<std::uint32_t> vertexIndices;
    std::vector<std::uint32_t> elements;
    std::uint32_t elementCount{0};

    std::uint32_t vertexCount() const noexcept {
        return static_cast<std::uint32_t>(vertexIndices.size());
    }

    void clear() noexcept;

    // FNV-1a over the layout, indices and canonicalized coordinates.
    std::uint64_t digest() const noexcept;
};

} // namespace polytess
