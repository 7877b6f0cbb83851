#include "polytess/triangulate/delaunay_refiner.h"

#include "polytess/core/geom.h"
#include "polytess/core/logging.h"
#include "polytess/mesh/planar_mesh.h"

#include <cmath>
#include <vector>

namespace polytess {

namespace {

constexpr double kPi = 3.14159265358979323846;

inline bool isTriangle(const PlanarMesh& mesh, EdgeId e) noexcept {
    return mesh.lnext(mesh.lnext(mesh.lnext(e))) == e;
}

} // namespace

bool DelaunayRefiner::isFlippable(EdgeId e) const noexcept {
    const FaceId lf = mesh_.lface(e);
    const FaceId rf = mesh_.rface(e);
    if (lf == kNullHandle || rf == kNullHandle) return false;
    if (!mesh_.face(lf).inside || !mesh_.face(rf).inside) return false;
    if (mesh_.edge(e).winding != 0 || mesh_.edge(PlanarMesh::sym(e)).winding != 0) return false;
    return isTriangle(mesh_, e) && isTriangle(mesh_, PlanarMesh::sym(e));
}

bool DelaunayRefiner::isLocallyDelaunay(EdgeId e) const noexcept {
    const EdgeId s = PlanarMesh::sym(e);
    const double a = vertexAngle(mesh_.st(mesh_.org(mesh_.lnext(e))), mesh_.st(mesh_.org(mesh_.lnext(mesh_.lnext(e)))),
                                 mesh_.st(mesh_.org(e)));
    const double b = vertexAngle(mesh_.st(mesh_.org(mesh_.lnext(s))), mesh_.st(mesh_.org(mesh_.lnext(mesh_.lnext(s)))),
                                 mesh_.st(mesh_.org(s)));
    return a + b < kPi + kDelaunayAngleEpsilon;
}

DelaunayResult DelaunayRefiner::refine(std::uint32_t maxIterations) {
    DelaunayResult result;
    std::vector<EdgeId> stack;

    // Mark flippable edges once per pair and seed the work stack with them.
    std::uint64_t faceCount = 0;
    for (FaceId f = mesh_.face(PlanarMesh::kFaceHead).next; f != PlanarMesh::kFaceHead; f = mesh_.face(f).next) {
        if (!mesh_.face(f).inside) continue;
        const EdgeId start = mesh_.face(f).anEdge;
        EdgeId e = start;
        do {
            const bool flippable = isFlippable(e);
            mesh_.edge(e).mark = flippable;
            if (flippable && !mesh_.edge(PlanarMesh::sym(e)).mark) stack.push_back(e);
            e = mesh_.lnext(e);
        } while (e != start);
        ++faceCount;
    }

    // Flips can cascade across the whole triangulation, hence the quadratic bound.
    std::uint64_t budget = maxIterations;
    if (budget == 0) budget = faceCount * faceCount;

    std::uint64_t iter = 0;
    while (!stack.empty() && iter < budget) {
        const EdgeId e = stack.back();
        stack.pop_back();
        mesh_.edge(e).mark = false;
        mesh_.edge(PlanarMesh::sym(e)).mark = false;
        if (isFlippable(e) && !isLocallyDelaunay(e)) {
            mesh_.flipEdge(e);
            ++result.flips;
            const EdgeId s = PlanarMesh::sym(e);
            const EdgeId neighbours[4] = {mesh_.lnext(e), mesh_.lprev(e), mesh_.lnext(s), mesh_.lprev(s)};
            for (const EdgeId n : neighbours) {
                if (!mesh_.edge(n).mark && isFlippable(n)) {
                    mesh_.edge(n).mark = true;
                    mesh_.edge(PlanarMesh::sym(n)).mark = true;
                    stack.push_back(n);
                }
            }
        }
        ++iter;
    }

    result.iterations = static_cast<std::uint32_t>(iter);
    result.budgetExhausted = !stack.empty();
    if (result.budgetExhausted) {
        POLYTESS_LOG_WARN("delaunay: flip budget of %llu exhausted with %zu edges pending",
                          static_cast<unsigned long long>(budget), stack.size());
    }
    for (const EdgeId e : stack) {
        mesh_.edge(e).mark = false;
        mesh_.edge(PlanarMesh::sym(e)).mark = false;
    }
    return result;
}

} // namespace polytess
