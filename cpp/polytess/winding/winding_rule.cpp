#include "polytess/winding/winding_rule.h"

#include "polytess/contour/contour_store.h"
#include "polytess/core/geom.h"
#include "polytess/core/logging.h"
#include "polytess/mesh/planar_mesh.h"
#include "polytess/projection/plane_projection.h"

#include <utility>

namespace polytess {

bool isWindingInside(WindingRule rule, int winding) noexcept {
    switch (rule) {
        case WindingRule::Odd: return (winding & 1) != 0;
        case WindingRule::NonZero: return winding != 0;
        case WindingRule::Positive: return winding > 0;
        case WindingRule::Negative: return winding < 0;
        case WindingRule::AbsGeqTwo: return winding >= 2 || winding <= -2;
    }
    return false;
}

WindingEvaluator::WindingEvaluator(const ContourStore& contours, const PlaneProjection& projection) {
    contours_.reserve(contours.contours().size());
    for (const Contour& contour : contours.contours()) {
        ProjectedContour projected;
        projected.sign = contour.sign;
        projected.points.reserve(contour.points.size());
        for (const Vec3& p : contour.points) {
            projected.points.push_back(projection.project(p));
        }
        contours_.push_back(std::move(projected));
    }
}

int WindingEvaluator::windingAt(const Point2& p) const noexcept {
    int winding = 0;
    for (const ProjectedContour& contour : contours_) {
        const std::size_t n = contour.points.size();
        int crossings = 0;
        for (std::size_t i = 0; i < n; ++i) {
            const Point2& a = contour.points[i];
            const Point2& b = contour.points[(i + 1) % n];
            const double side = (b.s - a.s) * (p.t - a.t) - (p.s - a.s) * (b.t - a.t);
            if (a.t <= p.t) {
                // Upward crossing with p strictly left of the edge.
                if (b.t > p.t && side > 0) ++crossings;
            } else if (b.t <= p.t && side < 0) {
                --crossings;
            }
        }
        winding += contour.sign * crossings;
    }
    return winding;
}

std::uint32_t countWindingMismatches(const PlanarMesh& mesh, const WindingEvaluator& evaluator,
                                     WindingRule rule) {
    std::uint32_t mismatches = 0;
    for (FaceId f = mesh.face(PlanarMesh::kFaceHead).next; f != PlanarMesh::kFaceHead; f = mesh.face(f).next) {
        if (!mesh.face(f).inside) continue;
        const EdgeId e = mesh.face(f).anEdge;
        if (mesh.lnext(mesh.lnext(mesh.lnext(e))) != e) continue;

        const Point2& a = mesh.st(mesh.org(e));
        const Point2& b = mesh.st(mesh.org(mesh.lnext(e)));
        const Point2& c = mesh.st(mesh.org(mesh.lprev(e)));
        if (vertCCW(a, b, c) && vertCCW(c, b, a)) continue;

        const Point2 centroid{(a.s + b.s + c.s) / 3.0, (a.t + b.t + c.t) / 3.0};
        if (!evaluator.isInside(rule, centroid)) {
            POLYTESS_LOG_DEBUG("winding: face %u centroid (%g, %g) evaluates outside", f, centroid.s, centroid.t);
            ++mismatches;
        }
    }
    return mismatches;
}

} // namespace polytess
