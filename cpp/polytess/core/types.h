#pragma once

#include <cstdint>

namespace polytess {

// =============================================================================
// Handles
// =============================================================================

using VertexId = std::uint32_t;
using EdgeId = std::uint32_t;
using FaceId = std::uint32_t;
using RegionId = std::uint32_t;

constexpr std::uint32_t kNullHandle = 0xFFFFFFFFu;

// Output index for padding, missing neighbours and synthesized vertices.
constexpr std::uint32_t kUndefIndex = 0xFFFFFFFFu;

// =============================================================================
// Public enums
// =============================================================================

enum class WindingRule : std::uint32_t {
    Odd = 0,
    NonZero = 1,
    Positive = 2,
    Negative = 3,
    AbsGeqTwo = 4,
};

enum class ElementType : std::uint32_t {
    Polygons = 0,
    ConnectedPolygons = 1,
    BoundaryContours = 2,
};

enum class TessOption : std::uint32_t {
    ConstrainedDelaunay = 0,
    ReverseContours = 1,
    ValidateWinding = 2,
};

enum class TessError : std::uint32_t {
    Ok = 0,
    OutOfMemory = 1,
    InvalidInput = 2,
};

const char* toString(WindingRule rule) noexcept;
const char* toString(ElementType type) noexcept;
const char* toString(TessError error) noexcept;

bool isValid(WindingRule rule) noexcept;
bool isValid(ElementType type) noexcept;

// =============================================================================
// Configuration
// =============================================================================

constexpr double kDefaultCoincidenceTolerance = 1e-12;
// Opposite-angle sum slack for the local Delaunay test.
constexpr double kDelaunayAngleEpsilon = 0.01;

struct TessOptions {
    bool constrainedDelaunay{false};
    bool reverseContours{false};
    bool validateWinding{false};
    // Relative to the largest projected coordinate magnitude. 0 disables snapping.
    double coincidenceTolerance{kDefaultCoincidenceTolerance};
    // 0 selects the quadratic default (interior face count squared).
    std::uint32_t maxDelaunayFlips{0};
};

struct TessStats {
    std::uint32_t inputVertexCount{0};
    std::uint32_t contourCount{0};
    std::uint32_t snappedVertexCount{0};
    std::uint32_t mergedVertexCount{0};
    std::uint32_t intersectionCount{0};
    std::uint32_t degenerateCollapseCount{0};
    std::uint32_t monotoneDiagonalCount{0};
    std::uint32_t delaunayFlipCount{0};
    bool delaunayBudgetExhausted{false};
    std::uint32_t windingMismatchCount{0};
    std::uint32_t outputVertexCount{0};
    std::uint32_t outputElementCount{0};
};

struct Vec3 {
    double x, y, z;
};

struct Point2 {
    double s, t;
};

} // namespace polytess
