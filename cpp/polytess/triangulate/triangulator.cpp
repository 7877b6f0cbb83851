#include "polytess/triangulate/triangulator.h"

#include "polytess/core/geom.h"
#include "polytess/mesh/planar_mesh.h"

namespace polytess {

std::uint32_t triangulateMonotoneFace(PlanarMesh& mesh, FaceId face) {
    std::uint32_t added = 0;

    // Find the half-edge whose origin is rightmost. The sweep leaves
    // anEdge close to it.
    EdgeId up = mesh.face(face).anEdge;
    if (mesh.lnext(up) == up || mesh.lnext(mesh.lnext(up)) == up) return 0;

    while (vertLeq(mesh.st(mesh.dst(up)), mesh.st(mesh.org(up)))) up = mesh.lprev(up);
    while (vertLeq(mesh.st(mesh.org(up)), mesh.st(mesh.dst(up)))) up = mesh.lnext(up);
    EdgeId lo = mesh.lprev(up);

    while (mesh.lnext(up) != lo) {
        if (vertLeq(mesh.st(mesh.dst(up)), mesh.st(mesh.org(lo)))) {
            // up->dst is on the left: fan from lo->org. edgeGoesLeft
            // guarantees progress even when a triangle comes out clockwise.
            while (mesh.lnext(lo) != up &&
                   (mesh.edgeGoesLeft(mesh.lnext(lo)) ||
                    edgeSign(mesh.st(mesh.org(lo)), mesh.st(mesh.dst(lo)), mesh.st(mesh.dst(mesh.lnext(lo)))) <= 0)) {
                lo = PlanarMesh::sym(mesh.connect(mesh.lnext(lo), lo));
                ++added;
            }
            lo = mesh.lprev(lo);
        } else {
            // lo->org is on the left: CCW triangles from up->dst.
            while (mesh.lnext(lo) != up &&
                   (mesh.edgeGoesRight(mesh.lprev(up)) ||
                    edgeSign(mesh.st(mesh.dst(up)), mesh.st(mesh.org(up)), mesh.st(mesh.org(mesh.lprev(up)))) >= 0)) {
                up = PlanarMesh::sym(mesh.connect(up, mesh.lprev(up)));
                ++added;
            }
            up = mesh.lnext(up);
        }
    }

    // lo->org == up->dst is the leftmost vertex; fan out the rest from it.
    while (mesh.lnext(mesh.lnext(lo)) != up) {
        lo = PlanarMesh::sym(mesh.connect(mesh.lnext(lo), lo));
        ++added;
    }
    return added;
}

std::uint32_t triangulateInterior(PlanarMesh& mesh) {
    std::uint32_t added = 0;
    FaceId next;
    for (FaceId f = mesh.face(PlanarMesh::kFaceHead).next; f != PlanarMesh::kFaceHead; f = next) {
        // New triangles are linked before f and are not revisited.
        next = mesh.face(f).next;
        if (mesh.face(f).inside) {
            added += triangulateMonotoneFace(mesh, f);
        }
    }
    return added;
}

} // namespace polytess
