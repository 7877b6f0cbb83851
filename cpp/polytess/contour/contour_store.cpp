#include "polytess/contour/contour_store.h"

#include "polytess/core/logging.h"
#include "polytess/mesh/planar_mesh.h"

#include <cmath>
#include <limits>
#include <utility>

namespace polytess {

TessError ContourStore::add(int coordWidth, const float* coords, std::size_t coordCount) {
    if (coordWidth != 2 && coordWidth != 3) {
        POLYTESS_LOG_WARN("addContour: coordinate width %d not supported", coordWidth);
        return TessError::InvalidInput;
    }
    const std::size_t width = static_cast<std::size_t>(coordWidth);
    if (coords == nullptr || coordCount < width || coordCount % width != 0) {
        POLYTESS_LOG_WARN("addContour: %zu coordinates do not form %d-wide vertices", coordCount, coordWidth);
        return TessError::InvalidInput;
    }
    const std::size_t count = coordCount / width;
    if (count > std::numeric_limits<std::uint32_t>::max() - vertexCount_) {
        return TessError::InvalidInput;
    }
    for (std::size_t i = 0; i < coordCount; ++i) {
        if (!std::isfinite(coords[i])) {
            POLYTESS_LOG_WARN("addContour: non-finite coordinate at %zu", i);
            return TessError::InvalidInput;
        }
    }

    Contour contour;
    contour.sign = reverse_ ? -1 : 1;
    contour.firstIndex = vertexCount_;
    contour.points.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const float* p = coords + i * width;
        contour.points.push_back(Vec3{p[0], p[1], width > 2 ? p[2] : 0.0});
    }
    contours_.push_back(std::move(contour));
    vertexCount_ += static_cast<std::uint32_t>(count);
    return TessError::Ok;
}

void ContourStore::clear() noexcept {
    contours_.clear();
    vertexCount_ = 0;
}

void ContourStore::buildMesh(PlanarMesh& mesh) const {
    for (const Contour& contour : contours_) {
        EdgeId e = kNullHandle;
        std::uint32_t index = contour.firstIndex;
        for (const Vec3& p : contour.points) {
            if (e == kNullHandle) {
                // One vertex, one edge: a self-loop.
                e = mesh.makeEdge();
                mesh.splice(e, PlanarMesh::sym(e));
            } else {
                // New vertex and edge right after e around the left face.
                mesh.splitEdge(e);
                e = mesh.lnext(e);
            }
            MeshVertex& v = mesh.vertex(mesh.org(e));
            v.coords = p;
            v.inputIndex = index++;

            // A CCW contour adds +1 to the winding number of its interior.
            mesh.edge(e).winding = contour.sign;
            mesh.edge(PlanarMesh::sym(e)).winding = -contour.sign;
        }
    }
}

} // namespace polytess
