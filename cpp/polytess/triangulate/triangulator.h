#pragma once

#include "polytess/core/types.h"

#include <cstdint>

namespace polytess {

class PlanarMesh;

/**
 * Triangulates a monotone face in place by walking its upper and lower
 * chains from right to left. Returns the number of edges added.
 */
std::uint32_t triangulateMonotoneFace(PlanarMesh& mesh, FaceId face);

// Triangulates every interior face. Faces created on the way are skipped.
std::uint32_t triangulateInterior(PlanarMesh& mesh);

} // namespace polytess
