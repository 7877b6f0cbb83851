#include "polytess/tessellator.h"

#include "polytess/core/logging.h"
#include "polytess/internal/tess_state.h"
#include "polytess/mesh/planar_mesh.h"
#include "polytess/mono/monotone_decomposer.h"
#include "polytess/output/output_extractor.h"
#include "polytess/projection/plane_projection.h"
#include "polytess/sweep/sweep.h"
#include "polytess/triangulate/delaunay_refiner.h"
#include "polytess/triangulate/triangulator.h"
#include "polytess/winding/winding_rule.h"

#include <cmath>
#include <new>
#include <utility>

namespace polytess {

std::unique_ptr<Tessellator> Tessellator::create() noexcept {
    try {
        return std::make_unique<Tessellator>();
    } catch (const std::bad_alloc&) {
        POLYTESS_LOG_WARN("create: allocation failed");
        return nullptr;
    }
}

Tessellator::Tessellator() : state_(std::make_unique<TessState>()) {}

Tessellator::~Tessellator() {
    dispose();
}

TessError Tessellator::fail(TessError err) noexcept {
    state().lastError = err;
    return err;
}

// ==============================================================================
// Input
// ==============================================================================

TessError Tessellator::addContour(int coordWidth, const float* coords, std::size_t coordCount) {
    TessState& s = state();
    if (s.disposed) return fail(TessError::InvalidInput);
    try {
        s.contours.setReverseContours(s.options.reverseContours);
        s.lastError = s.contours.add(coordWidth, coords, coordCount);
    } catch (const std::bad_alloc&) {
        POLYTESS_LOG_WARN("addContour: allocation failed");
        s.lastError = TessError::OutOfMemory;
    }
    return s.lastError;
}

TessError Tessellator::addContour(int coordWidth, const std::vector<float>& coords) {
    return addContour(coordWidth, coords.data(), coords.size());
}

TessError Tessellator::setOption(TessOption option, bool enabled) {
    TessState& s = state();
    if (s.disposed) return fail(TessError::InvalidInput);
    switch (option) {
        case TessOption::ConstrainedDelaunay:
            s.options.constrainedDelaunay = enabled;
            break;
        case TessOption::ReverseContours:
            s.options.reverseContours = enabled;
            break;
        case TessOption::ValidateWinding:
            s.options.validateWinding = enabled;
            break;
        default:
            POLYTESS_LOG_WARN("setOption: unknown option %u", static_cast<unsigned>(option));
            return fail(TessError::InvalidInput);
    }
    return fail(TessError::Ok);
}

TessError Tessellator::setCoincidenceTolerance(double relTolerance) {
    TessState& s = state();
    if (s.disposed || !std::isfinite(relTolerance) || relTolerance < 0.0) {
        return fail(TessError::InvalidInput);
    }
    s.options.coincidenceTolerance = relTolerance;
    return fail(TessError::Ok);
}

TessError Tessellator::setDelaunayFlipBudget(std::uint32_t maxFlips) {
    TessState& s = state();
    if (s.disposed) return fail(TessError::InvalidInput);
    s.options.maxDelaunayFlips = maxFlips;
    return fail(TessError::Ok);
}

const TessOptions& Tessellator::options() const noexcept {
    return state().options;
}

// ==============================================================================
// Tessellation
// ==============================================================================

TessError Tessellator::tessellate(WindingRule rule, ElementType elementType, int polySize, int outputCoordWidth) {
    return tessellate(rule, elementType, polySize, outputCoordWidth, nullptr, 0);
}

TessError Tessellator::tessellate(WindingRule rule, ElementType elementType, int polySize, int outputCoordWidth,
                                  const std::vector<float>& normal) {
    if (normal.empty()) return fail(TessError::InvalidInput);
    return tessellate(rule, elementType, polySize, outputCoordWidth, normal.data(), normal.size());
}

TessError Tessellator::tessellate(WindingRule rule, ElementType elementType, int polySize, int outputCoordWidth,
                                  const float* normal, std::size_t normalCount) {
    TessState& s = state();
    if (s.disposed) return fail(TessError::InvalidInput);

    if (!isValid(rule) || !isValid(elementType)) {
        POLYTESS_LOG_WARN("tessellate: unknown winding rule or element type");
        return fail(TessError::InvalidInput);
    }
    if (polySize < 3) {
        POLYTESS_LOG_WARN("tessellate: polygon size %d below 3", polySize);
        return fail(TessError::InvalidInput);
    }
    if (outputCoordWidth != 2 && outputCoordWidth != 3) {
        POLYTESS_LOG_WARN("tessellate: output width %d not 2 or 3", outputCoordWidth);
        return fail(TessError::InvalidInput);
    }
    if (normal != nullptr) {
        if (normalCount < 3) {
            POLYTESS_LOG_WARN("tessellate: normal has %zu components", normalCount);
            return fail(TessError::InvalidInput);
        }
        for (std::size_t i = 0; i < 3; ++i) {
            if (!std::isfinite(normal[i])) {
                POLYTESS_LOG_WARN("tessellate: normal component %zu is not finite", i);
                return fail(TessError::InvalidInput);
            }
        }
    }
    if (s.contours.empty()) {
        POLYTESS_LOG_WARN("tessellate: no contours");
        return fail(TessError::InvalidInput);
    }

    try {
        return fail(run(rule, elementType, static_cast<std::uint32_t>(polySize),
                        static_cast<std::uint32_t>(outputCoordWidth), normal));
    } catch (const std::bad_alloc&) {
        POLYTESS_LOG_WARN("tessellate: allocation failed, result cleared");
        s.result.clear();
        s.stats = TessStats{};
        return fail(TessError::OutOfMemory);
    }
}

TessError Tessellator::run(WindingRule rule, ElementType elementType, std::uint32_t polySize,
                           std::uint32_t coordWidth, const float* normal) {
    TessState& s = state();
    TessStats stats{};
    stats.inputVertexCount = s.contours.vertexCount();
    stats.contourCount = static_cast<std::uint32_t>(s.contours.contours().size());

    PlanarMesh mesh;
    s.contours.buildMesh(mesh);

    PlaneProjection projection;
    projection.setup(s.contours, normal);
    projection.apply(mesh);
    if (s.options.coincidenceTolerance > 0.0) {
        stats.snappedVertexCount = projection.snapCoincident(mesh, s.options.coincidenceTolerance);
    }

    {
        SweepScheduler sweep(mesh, rule);
        sweep.computeInterior();
        const SweepStats& sweepStats = sweep.stats();
        stats.mergedVertexCount = sweepStats.mergedVertexCount;
        stats.intersectionCount = sweepStats.intersectionCount;
        stats.degenerateCollapseCount = sweepStats.degenerateCollapseCount;
    }

#if POLYTESS_ENABLE_LOGGING
    if (!mesh.check()) {
        POLYTESS_LOG_WARN("tessellate: mesh check failed after sweep");
    }
#endif

    OutputFormat format;
    format.elementType = elementType;
    format.polySize = polySize;
    format.coordWidth = coordWidth;

    TessResult result;
    TessError err = TessError::Ok;
    if (elementType == ElementType::BoundaryContours) {
        mesh.setWindingNumber(1, true);
        err = extractContours(mesh, format, result);
    } else {
        MonotoneDecomposer decomposer(mesh);
        stats.monotoneDiagonalCount = decomposer.decomposeInterior();
        triangulateInterior(mesh);

        if (s.options.constrainedDelaunay) {
            DelaunayRefiner refiner(mesh);
            const DelaunayResult refined = refiner.refine(s.options.maxDelaunayFlips);
            stats.delaunayFlipCount = refined.flips;
            stats.delaunayBudgetExhausted = refined.budgetExhausted;
        }

        if (s.options.validateWinding) {
            const WindingEvaluator evaluator(s.contours, projection);
            stats.windingMismatchCount = countWindingMismatches(mesh, evaluator, rule);
            if (stats.windingMismatchCount > 0) {
                POLYTESS_LOG_WARN("tessellate: %u triangles disagree with the ray-cast winding",
                                  stats.windingMismatchCount);
            }
        }

        err = extractPolygons(mesh, format, result);
    }

    stats.outputVertexCount = result.vertexCount();
    stats.outputElementCount = result.elementCount;
    s.result = std::move(result);
    s.stats = stats;
    ++s.runCount;

    POLYTESS_LOG_DEBUG("tessellate: %s/%s, %u vertices, %u elements", toString(rule), toString(elementType),
                       stats.outputVertexCount, stats.outputElementCount);
    return err;
}

// ==============================================================================
// Results
// ==============================================================================

const TessResult& Tessellator::result() const noexcept {
    return state().result;
}

const std::vector<float>& Tessellator::getVertices() const noexcept {
    return state().result.vertices;
}

const std::vector<std::uint32_t>& Tessellator::getVertexIndices() const noexcept {
    return state().result.vertexIndices;
}

const std::vector<std::uint32_t>& Tessellator::getElements() const noexcept {
    return state().result.elements;
}

std::uint32_t Tessellator::getVertexCount() const noexcept {
    return state().result.vertexCount();
}

std::uint32_t Tessellator::getElementCount() const noexcept {
    return state().result.elementCount;
}

std::vector<std::array<std::uint32_t, 3>> Tessellator::triangles() const {
    const TessResult& r = state().result;
    std::vector<std::array<std::uint32_t, 3>> out;
    if (r.elementType == ElementType::BoundaryContours) return out;

    const std::size_t stride = static_cast<std::size_t>(r.polySize) *
                               (r.elementType == ElementType::ConnectedPolygons ? 2 : 1);
    for (std::uint32_t i = 0; i < r.elementCount; ++i) {
        const std::uint32_t* poly = &r.elements[i * stride];
        for (std::uint32_t j = 2; j < r.polySize && poly[j] != kUndefIndex; ++j) {
            out.push_back({poly[0], poly[j - 1], poly[j]});
        }
    }
    return out;
}

std::uint64_t Tessellator::getResultDigest() const noexcept {
    return state().result.digest();
}

const TessStats& Tessellator::getStats() const noexcept {
    return state().stats;
}

// ==============================================================================
// Lifecycle
// ==============================================================================

void Tessellator::dispose() noexcept {
    if (!state_ || state_->disposed) return;
    TessState& s = state();
    s.contours.clear();
    std::vector<float>().swap(s.result.vertices);
    std::vector<std::uint32_t>().swap(s.result.vertexIndices);
    std::vector<std::uint32_t>().swap(s.result.elements);
    s.result.elementCount = 0;
    s.stats = TessStats{};
    s.disposed = true;
    s.lastError = TessError::InvalidInput;
}

bool Tessellator::isDisposed() const noexcept {
    return state().disposed;
}

TessError Tessellator::status() const noexcept {
    return state().lastError;
}

} // namespace polytess
