#include "polytess/output/tess_result.h"

#include "polytess/core/digest.h"

namespace polytess {

void TessResult::clear() noexcept {
    vertices.clear();
    vertexIndices.clear();
    elements.clear();
    elementCount = 0;
}

std::uint64_t TessResult::digest() const noexcept {
    std::uint64_t h = kDigestOffset;

    h = hashU32(h, 0x53534554u); // "TESS" marker
    h = hashU32(h, static_cast<std::uint32_t>(elementType));
    h = hashU32(h, polySize);
    h = hashU32(h, coordWidth);

    h = hashU32(h, vertexCount());
    for (const float v : vertices) {
        h = hashF32(h, v);
    }
    for (const std::uint32_t idx : vertexIndices) {
        h = hashU32(h, idx);
    }

    h = hashU32(h, elementCount);
    for (const std::uint32_t idx : elements) {
        h = hashU32(h, idx);
    }
    return h;
}

} // namespace polytess
