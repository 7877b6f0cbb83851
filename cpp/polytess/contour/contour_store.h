#pragma once

#include "polytess/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace polytess {

class PlanarMesh;

struct Contour {
    std::vector<Vec3> points;
    // +1, or -1 when the contour was added with reversal enabled.
    int sign{1};
    // Input index of points[0]; the rest follow consecutively.
    std::uint32_t firstIndex{0};
};

/**
 * Accepts and validates input contours. Contours are immutable once added;
 * no geometry is computed here.
 */
class ContourStore {
public:
    // Rejects widths other than 2 or 3, empty or ragged input and non-finite values.
    TessError add(int coordWidth, const float* coords, std::size_t coordCount);

    void setReverseContours(bool reverse) noexcept { reverse_ = reverse; }
    bool reverseContours() const noexcept { return reverse_; }

    const std::vector<Contour>& contours() const noexcept { return contours_; }
    std::uint32_t vertexCount() const noexcept { return vertexCount_; }
    bool empty() const noexcept { return contours_.empty(); }

    void clear() noexcept;

    // Appends one closed loop per contour. Vertex inputIndex is the global input order.
    void buildMesh(PlanarMesh& mesh) const;

private:
    std::vector<Contour> contours_;
    std::uint32_t vertexCount_{0};
    bool reverse_{false};
};

} // namespace polytess
