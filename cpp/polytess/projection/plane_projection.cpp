#include "polytess/projection/plane_projection.h"

#include "polytess/contour/contour_store.h"
#include "polytess/mesh/planar_mesh.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace polytess {

namespace {

inline double component(const Vec3& v, int axis) noexcept {
    return axis == 0 ? v.x : (axis == 1 ? v.y : v.z);
}

inline void setComponent(Vec3& v, int axis, double value) noexcept {
    if (axis == 0) v.x = value;
    else if (axis == 1) v.y = value;
    else v.z = value;
}

inline double dot(const Vec3& a, const Vec3& b) noexcept {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

int longAxis(const Vec3& v) noexcept {
    int i = 0;
    if (std::abs(v.y) > std::abs(v.x)) i = 1;
    if (std::abs(v.z) > std::abs(component(v, i))) i = 2;
    return i;
}

int shortAxis(const Vec3& v) noexcept {
    int i = 0;
    if (std::abs(v.y) < std::abs(v.x)) i = 1;
    if (std::abs(v.z) < std::abs(component(v, i))) i = 2;
    return i;
}

} // namespace

Vec3 PlaneProjection::computeNormal(const ContourStore& contours) {
    const Vec3* minVert[3] = {nullptr, nullptr, nullptr};
    const Vec3* maxVert[3] = {nullptr, nullptr, nullptr};
    double minVal[3] = {0, 0, 0};
    double maxVal[3] = {0, 0, 0};

    bool first = true;
    for (const Contour& contour : contours.contours()) {
        for (const Vec3& p : contour.points) {
            for (int i = 0; i < 3; ++i) {
                const double c = component(p, i);
                if (first || c < minVal[i]) {
                    minVal[i] = c;
                    minVert[i] = &p;
                }
                if (first || c > maxVal[i]) {
                    maxVal[i] = c;
                    maxVert[i] = &p;
                }
            }
            first = false;
        }
    }
    if (first) return Vec3{0, 0, 1};

    // Two vertices separated by at least 1/sqrt(3) of the diameter.
    int i = 0;
    if (maxVal[1] - minVal[1] > maxVal[0] - minVal[0]) i = 1;
    if (maxVal[2] - minVal[2] > maxVal[i] - minVal[i]) i = 2;
    if (minVal[i] >= maxVal[i]) {
        // All vertices coincide.
        return Vec3{0, 0, 1};
    }

    // Third vertex maximizing the triangle area.
    const Vec3& v1 = *minVert[i];
    const Vec3& v2 = *maxVert[i];
    const Vec3 d1{v1.x - v2.x, v1.y - v2.y, v1.z - v2.z};
    Vec3 norm{0, 0, 0};
    double maxLen2 = 0;
    for (const Contour& contour : contours.contours()) {
        for (const Vec3& p : contour.points) {
            const Vec3 d2{p.x - v2.x, p.y - v2.y, p.z - v2.z};
            const Vec3 tNorm{d1.y * d2.z - d1.z * d2.y, d1.z * d2.x - d1.x * d2.z, d1.x * d2.y - d1.y * d2.x};
            const double tLen2 = dot(tNorm, tNorm);
            if (tLen2 > maxLen2) {
                maxLen2 = tLen2;
                norm = tNorm;
            }
        }
    }

    if (maxLen2 <= 0) {
        // Collinear: any normal perpendicular to the line works.
        norm = Vec3{0, 0, 0};
        setComponent(norm, shortAxis(d1), 1);
    }
    return norm;
}

void PlaneProjection::setup(const ContourStore& contours, const float* normal) {
    normal_ = normal ? Vec3{normal[0], normal[1], normal[2]} : Vec3{0, 0, 0};
    computed_ = false;
    flipped_ = false;
    if (normal_.x == 0 && normal_.y == 0 && normal_.z == 0) {
        normal_ = computeNormal(contours);
        computed_ = true;
    }

    // Project perpendicular to the dominant axis.
    const int i = longAxis(normal_);
    const double axis = component(normal_, i);
    sUnit_ = Vec3{0, 0, 0};
    tUnit_ = Vec3{0, 0, 0};
    setComponent(sUnit_, (i + 1) % 3, 1);
    setComponent(tUnit_, (i + 2) % 3, axis > 0 ? 1 : -1);

    if (!computed_) return;

    // Orient so that the sum of the signed contour areas is non-negative.
    double area = 0;
    for (const Contour& contour : contours.contours()) {
        const std::size_t n = contour.points.size();
        double contourArea = 0;
        for (std::size_t k = 0; k < n; ++k) {
            const Point2 a = project(contour.points[k]);
            const Point2 b = project(contour.points[(k + 1) % n]);
            contourArea += (a.s - b.s) * (a.t + b.t);
        }
        area += contour.sign * contourArea;
    }
    if (area < 0) {
        tUnit_ = Vec3{-tUnit_.x, -tUnit_.y, -tUnit_.z};
        flipped_ = true;
    }
}

Point2 PlaneProjection::project(const Vec3& p) const noexcept {
    return Point2{dot(p, sUnit_), dot(p, tUnit_)};
}

void PlaneProjection::apply(PlanarMesh& mesh) const {
    for (VertexId v = mesh.vertex(PlanarMesh::kVertexHead).next; v != PlanarMesh::kVertexHead;
         v = mesh.vertex(v).next) {
        MeshVertex& mv = mesh.vertex(v);
        mv.st = project(mv.coords);
    }
}

std::uint32_t PlaneProjection::snapCoincident(PlanarMesh& mesh, double relTolerance) const {
    if (!(relTolerance > 0)) return 0;

    std::vector<VertexId> order;
    double magnitude = 0;
    for (VertexId v = mesh.vertex(PlanarMesh::kVertexHead).next; v != PlanarMesh::kVertexHead;
         v = mesh.vertex(v).next) {
        order.push_back(v);
        const Point2& p = mesh.st(v);
        magnitude = std::max(magnitude, std::max(std::abs(p.s), std::abs(p.t)));
    }
    const double tol = relTolerance * magnitude;
    if (!(tol > 0)) return 0;

    std::sort(order.begin(), order.end(), [&mesh](VertexId a, VertexId b) {
        const Point2& pa = mesh.st(a);
        const Point2& pb = mesh.st(b);
        if (pa.s != pb.s) return pa.s < pb.s;
        if (pa.t != pb.t) return pa.t < pb.t;
        return a < b;
    });

    std::vector<bool> anchored(order.size(), false);
    std::uint32_t snapped = 0;
    for (std::size_t i = 0; i < order.size(); ++i) {
        if (anchored[i]) continue;
        const Point2 anchor = mesh.st(order[i]);
        for (std::size_t j = i + 1; j < order.size(); ++j) {
            Point2& p = mesh.vertex(order[j]).st;
            if (p.s - anchor.s > tol) break;
            if (anchored[j] || std::abs(p.t - anchor.t) > tol) continue;
            anchored[j] = true;
            if (p.s != anchor.s || p.t != anchor.t) {
                p = anchor;
                ++snapped;
            }
        }
    }
    return snapped;
}

} // namespace polytess
