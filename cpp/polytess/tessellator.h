#pragma once

#include "polytess/core/types.h"
#include "polytess/output/tess_result.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace polytess {

struct TessState;

/**
 * Polygon tessellator.
 *
 * Contours are accumulated with addContour() and kept until dispose();
 * every tessellate() call rebuilds the subdivision from them, so a run can
 * be repeated with a different rule or output format. Every operation
 * returns a TessError which is also reported by status().
 *
 * Single owner, not thread-safe.
 */
class Tessellator {
    friend class TessellatorTestAccessor;
public:
    // nullptr when the instance cannot be allocated.
    static std::unique_ptr<Tessellator> create() noexcept;

    Tessellator();
    ~Tessellator();

    Tessellator(const Tessellator&) = delete;
    Tessellator& operator=(const Tessellator&) = delete;

    // ==========================================================================
    // Input
    // ==========================================================================

    // coordCount floats, coordWidth (2 or 3) per vertex.
    TessError addContour(int coordWidth, const float* coords, std::size_t coordCount);
    TessError addContour(int coordWidth, const std::vector<float>& coords);

    TessError setOption(TessOption option, bool enabled);
    TessError setCoincidenceTolerance(double relTolerance);
    // 0 restores the automatic budget.
    TessError setDelaunayFlipBudget(std::uint32_t maxFlips);

    const TessOptions& options() const noexcept;

    // ==========================================================================
    // Tessellation
    // ==========================================================================

    TessError tessellate(WindingRule rule, ElementType elementType, int polySize, int outputCoordWidth);
    // normal must have at least 3 finite components; only the first 3 are used.
    TessError tessellate(WindingRule rule, ElementType elementType, int polySize, int outputCoordWidth,
                         const float* normal, std::size_t normalCount);
    TessError tessellate(WindingRule rule, ElementType elementType, int polySize, int outputCoordWidth,
                         const std::vector<float>& normal);

    // ==========================================================================
    // Results
    // ==========================================================================

    const TessResult& result() const noexcept;
    const std::vector<float>& getVertices() const noexcept;
    const std::vector<std::uint32_t>& getVertexIndices() const noexcept;
    const std::vector<std::uint32_t>& getElements() const noexcept;
    std::uint32_t getVertexCount() const noexcept;
    std::uint32_t getElementCount() const noexcept;

    // Polygon elements fanned into triangles; empty for boundary output.
    std::vector<std::array<std::uint32_t, 3>> triangles() const;

    std::uint64_t getResultDigest() const noexcept;
    const TessStats& getStats() const noexcept;

    // ==========================================================================
    // Lifecycle
    // ==========================================================================

    // Releases contours and results. Later calls fail with InvalidInput.
    void dispose() noexcept;
    bool isDisposed() const noexcept;
    TessError status() const noexcept;

private:
    TessError run(WindingRule rule, ElementType elementType, std::uint32_t polySize,
                  std::uint32_t coordWidth, const float* normal);
    TessError fail(TessError err) noexcept;

    TessState& state() noexcept { return *state_; }
    const TessState& state() const noexcept { return *state_; }

    std::unique_ptr<TessState> state_;
};

} // namespace polytess
