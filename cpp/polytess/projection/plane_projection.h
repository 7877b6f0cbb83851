#pragma once

#include "polytess/core/types.h"

#include <cstdint>

namespace polytess {

class ContourStore;
class PlanarMesh;

/**
 * Maps 3D input onto the (s, t) sweep plane by dropping the coordinate
 * along the normal's dominant axis. A computed normal is oriented so that
 * the signed contour area is non-negative.
 */
class PlaneProjection {
public:
    // normal may be null (computed from the contours) or point to 3 values.
    void setup(const ContourStore& contours, const float* normal);

    Point2 project(const Vec3& p) const noexcept;

    // Fills st for every live mesh vertex.
    void apply(PlanarMesh& mesh) const;

    /**
     * Snaps vertices whose projections lie within relTolerance times the
     * largest coordinate magnitude onto a common position. Returns the number
     * of vertices moved.
     */
    std::uint32_t snapCoincident(PlanarMesh& mesh, double relTolerance) const;

    const Vec3& normal() const noexcept { return normal_; }
    const Vec3& sUnit() const noexcept { return sUnit_; }
    const Vec3& tUnit() const noexcept { return tUnit_; }
    bool normalComputed() const noexcept { return computed_; }
    bool orientationFlipped() const noexcept { return flipped_; }

    static Vec3 computeNormal(const ContourStore& contours);

private:
    Vec3 normal_{0, 0, 1};
    Vec3 sUnit_{1, 0, 0};
    Vec3 tUnit_{0, 1, 0};
    bool computed_{false};
    bool flipped_{false};
};

} // namespace polytess
