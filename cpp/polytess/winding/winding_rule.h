#pragma once

#include "polytess/core/types.h"

#include <cstdint>
#include <vector>

namespace polytess {

class ContourStore;
class PlaneProjection;
class PlanarMesh;

// Classifies a winding number under the given rule.
bool isWindingInside(WindingRule rule, int winding) noexcept;

/**
 * Reference evaluator: winding number of a sweep-plane point computed by
 * casting a ray toward +s against the projected input contours. The sweep
 * computes the same numbers incrementally; this one exists to validate it.
 */
class WindingEvaluator {
public:
    WindingEvaluator(const ContourStore& contours, const PlaneProjection& projection);

    int windingAt(const Point2& p) const noexcept;

    bool isInside(WindingRule rule, const Point2& p) const noexcept {
        return isWindingInside(rule, windingAt(p));
    }

private:
    struct ProjectedContour {
        std::vector<Point2> points;
        int sign;
    };

    std::vector<ProjectedContour> contours_;
};

// Inside triangles whose centroid the evaluator places outside under rule.
// Zero-area triangles are not checked.
std::uint32_t countWindingMismatches(const PlanarMesh& mesh, const WindingEvaluator& evaluator,
                                     WindingRule rule);

} // namespace polytess
