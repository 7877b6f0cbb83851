#include "polytess/output/output_extractor.h"

#include "polytess/core/geom.h"
#include "polytess/core/logging.h"
#include "polytess/mesh/planar_mesh.h"
#include "polytess/output/tess_result.h"

namespace polytess {

namespace {

void writeVertex(const MeshVertex& v, std::uint32_t coordWidth, float* dst) noexcept {
    dst[0] = static_cast<float>(v.coords.x);
    dst[1] = static_cast<float>(v.coords.y);
    if (coordWidth > 2) dst[2] = static_cast<float>(v.coords.z);
}

std::uint32_t neighbourFace(const PlanarMesh& mesh, EdgeId e) noexcept {
    const FaceId rf = mesh.rface(e);
    if (rf == kNullHandle || !mesh.face(rf).inside) return kUndefIndex;
    return mesh.face(rf).n;
}

void beginResult(const OutputFormat& format, TessResult& out) noexcept {
    out.clear();
    out.elementType = format.elementType;
    out.polySize = format.polySize;
    out.coordWidth = format.coordWidth;
}

} // namespace

std::uint32_t mergeConvexFaces(PlanarMesh& mesh, std::uint32_t maxVertsPerFace) {
    std::uint32_t removed = 0;
    for (FaceId f = mesh.face(PlanarMesh::kFaceHead).next; f != PlanarMesh::kFaceHead; f = mesh.face(f).next) {
        if (!mesh.face(f).inside) continue;

        EdgeId eCur = mesh.face(f).anEdge;
        const VertexId vStart = mesh.org(eCur);
        for (;;) {
            EdgeId eNext = mesh.lnext(eCur);
            const EdgeId eSym = PlanarMesh::sym(eCur);
            bool merged = false;
            const FaceId other = mesh.lface(eSym);
            if (other != kNullHandle && other != f && mesh.face(other).inside) {
                const std::uint32_t curNv = mesh.faceVertexCount(f);
                const std::uint32_t symNv = mesh.faceVertexCount(other);
                if (curNv + symNv - 2 <= maxVertsPerFace) {
                    // Both corners at the shared edge's endpoints must stay convex.
                    if (vertCCW(mesh.st(mesh.org(mesh.lprev(eCur))), mesh.st(mesh.org(eCur)),
                                mesh.st(mesh.org(mesh.lnext(mesh.lnext(eSym))))) &&
                        vertCCW(mesh.st(mesh.org(mesh.lprev(eSym))), mesh.st(mesh.org(eSym)),
                                mesh.st(mesh.org(mesh.lnext(mesh.lnext(eCur)))))) {
                        eNext = mesh.lnext(eSym);
                        mesh.deleteEdge(eSym);
                        ++removed;
                        merged = true;
                    }
                }
            }
            if (!merged && mesh.org(mesh.lnext(eCur)) == vStart) break;
            eCur = eNext;
        }
    }
    return removed;
}

TessError extractPolygons(PlanarMesh& mesh, const OutputFormat& format, TessResult& out) {
    beginResult(format, out);
    const std::uint32_t polySize = format.polySize;

    if (polySize > 3) {
        mergeConvexFaces(mesh, polySize);
    }

    for (VertexId v = mesh.vertex(PlanarMesh::kVertexHead).next; v != PlanarMesh::kVertexHead;
         v = mesh.vertex(v).next) {
        mesh.vertex(v).n = kUndefIndex;
    }

    // Number the interior faces and the vertices they use, in mesh order.
    std::uint32_t vertexCount = 0;
    std::uint32_t faceCount = 0;
    for (FaceId f = mesh.face(PlanarMesh::kFaceHead).next; f != PlanarMesh::kFaceHead; f = mesh.face(f).next) {
        mesh.face(f).n = kUndefIndex;
        if (!mesh.face(f).inside) continue;

        std::uint32_t faceVerts = 0;
        const EdgeId start = mesh.face(f).anEdge;
        EdgeId e = start;
        do {
            MeshVertex& v = mesh.vertex(mesh.org(e));
            if (v.n == kUndefIndex) v.n = vertexCount++;
            ++faceVerts;
            e = mesh.lnext(e);
        } while (e != start);

        if (faceVerts > polySize) {
            POLYTESS_LOG_WARN("output: face with %u vertices exceeds polygon size %u", faceVerts, polySize);
            out.clear();
            return TessError::InvalidInput;
        }
        mesh.face(f).n = faceCount++;
    }

    const bool connected = format.elementType == ElementType::ConnectedPolygons;
    const std::size_t stride = static_cast<std::size_t>(polySize) * (connected ? 2 : 1);
    out.elementCount = faceCount;
    out.elements.assign(static_cast<std::size_t>(faceCount) * stride, kUndefIndex);
    out.vertices.assign(static_cast<std::size_t>(vertexCount) * format.coordWidth, 0.0f);
    out.vertexIndices.assign(vertexCount, kUndefIndex);

    for (VertexId v = mesh.vertex(PlanarMesh::kVertexHead).next; v != PlanarMesh::kVertexHead;
         v = mesh.vertex(v).next) {
        const MeshVertex& mv = mesh.vertex(v);
        if (mv.n == kUndefIndex) continue;
        writeVertex(mv, format.coordWidth, &out.vertices[static_cast<std::size_t>(mv.n) * format.coordWidth]);
        out.vertexIndices[mv.n] = mv.inputIndex;
    }

    for (FaceId f = mesh.face(PlanarMesh::kFaceHead).next; f != PlanarMesh::kFaceHead; f = mesh.face(f).next) {
        if (!mesh.face(f).inside) continue;
        std::uint32_t* dst = &out.elements[static_cast<std::size_t>(mesh.face(f).n) * stride];

        const EdgeId start = mesh.face(f).anEdge;
        EdgeId e = start;
        std::uint32_t i = 0;
        do {
            dst[i] = mesh.vertex(mesh.org(e)).n;
            if (connected) dst[polySize + i] = neighbourFace(mesh, e);
            ++i;
            e = mesh.lnext(e);
        } while (e != start);
    }
    return TessError::Ok;
}

TessError extractContours(PlanarMesh& mesh, const OutputFormat& format, TessResult& out) {
    beginResult(format, out);

    std::uint32_t totalVerts = 0;
    std::uint32_t totalLoops = 0;
    for (FaceId f = mesh.face(PlanarMesh::kFaceHead).next; f != PlanarMesh::kFaceHead; f = mesh.face(f).next) {
        if (!mesh.face(f).inside) continue;
        totalVerts += mesh.faceVertexCount(f);
        ++totalLoops;
    }

    out.elementCount = totalLoops;
    out.elements.reserve(static_cast<std::size_t>(totalLoops) * 2);
    out.vertices.reserve(static_cast<std::size_t>(totalVerts) * format.coordWidth);
    out.vertexIndices.reserve(totalVerts);

    std::uint32_t first = 0;
    for (FaceId f = mesh.face(PlanarMesh::kFaceHead).next; f != PlanarMesh::kFaceHead; f = mesh.face(f).next) {
        if (!mesh.face(f).inside) continue;
        std::uint32_t count = 0;
        const EdgeId start = mesh.face(f).anEdge;
        EdgeId e = start;
        do {
            const MeshVertex& v = mesh.vertex(mesh.org(e));
            float xyz[3] = {0.0f, 0.0f, 0.0f};
            writeVertex(v, format.coordWidth, xyz);
            out.vertices.insert(out.vertices.end(), xyz, xyz + format.coordWidth);
            out.vertexIndices.push_back(v.inputIndex);
            ++count;
            e = mesh.lnext(e);
        } while (e != start);
        out.elements.push_back(first);
        out.elements.push_back(count);
        first += count;
    }
    return TessError::Ok;
}

} // namespace polytess
