#include <gtest/gtest.h>

#include "polytess/tessellator.h"
#include "polytess/winding/winding_rule.h"
#include "test_accessors.h"

#include <array>
#include <cmath>
#include <limits>
#include <memory>
#include <random>
#include <vector>

using namespace polytess;

namespace {

std::vector<float> square(float x0, float y0, float size, bool ccw = true) {
    if (ccw) return {x0, y0, x0 + size, y0, x0 + size, y0 + size, x0, y0 + size};
    return {x0, y0, x0, y0 + size, x0 + size, y0 + size, x0 + size, y0};
}

std::vector<float> regularPolygon(int n, float radius) {
    std::vector<float> coords;
    for (int i = 0; i < n; ++i) {
        const double a = 2.0 * 3.14159265358979323846 * i / n;
        coords.push_back(static_cast<float>(radius * std::cos(a)));
        coords.push_back(static_cast<float>(radius * std::sin(a)));
    }
    return coords;
}

bool allFinite(const std::vector<float>& v) {
    for (const float x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

using Contours = std::vector<std::vector<float>>;

// Signed crossing count of a ray toward +x, CCW contours counting +1.
int windingAt(const Contours& contours, double x, double y) {
    int winding = 0;
    for (const auto& c : contours) {
        const std::size_t n = c.size() / 2;
        for (std::size_t i = 0; i < n; ++i) {
            const double ax = c[i * 2], ay = c[i * 2 + 1];
            const double bx = c[((i + 1) % n) * 2], by = c[((i + 1) % n) * 2 + 1];
            const double side = (bx - ax) * (y - ay) - (x - ax) * (by - ay);
            if (ay <= y) {
                if (by > y && side > 0) ++winding;
            } else if (by <= y && side < 0) {
                --winding;
            }
        }
    }
    return winding;
}

double segmentDistance(double px, double py, double ax, double ay, double bx, double by) {
    const double dx = bx - ax;
    const double dy = by - ay;
    const double len2 = dx * dx + dy * dy;
    double u = len2 > 0 ? ((px - ax) * dx + (py - ay) * dy) / len2 : 0.0;
    u = u < 0 ? 0 : (u > 1 ? 1 : u);
    const double cx = ax + u * dx - px;
    const double cy = ay + u * dy - py;
    return std::sqrt(cx * cx + cy * cy);
}

double orient(double ax, double ay, double bx, double by, double px, double py) {
    return (bx - ax) * (py - ay) - (px - ax) * (by - ay);
}

// One or two random contours in [0, 20)^2, usually self-intersecting.
Contours randomContours(std::mt19937& rng) {
    std::uniform_int_distribution<int> contourCount(1, 2);
    std::uniform_int_distribution<int> vertexCount(3, 7);
    std::uniform_real_distribution<float> coord(0.0f, 20.0f);

    Contours contours(static_cast<std::size_t>(contourCount(rng)));
    for (auto& c : contours) {
        const int n = vertexCount(rng);
        for (int i = 0; i < n * 2; ++i) c.push_back(coord(rng));
    }
    return contours;
}

} // namespace

class TessellatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        tess = Tessellator::create();
        ASSERT_NE(tess, nullptr);
    }

    // Sum of absolute triangle areas of a 2-wide polygon result.
    double triangleArea() const {
        const std::vector<float>& v = tess->getVertices();
        double area = 0;
        for (const auto& t : tess->triangles()) {
            const double ax = v[t[0] * 2], ay = v[t[0] * 2 + 1];
            const double bx = v[t[1] * 2], by = v[t[1] * 2 + 1];
            const double cx = v[t[2] * 2], cy = v[t[2] * 2 + 1];
            area += std::abs((bx - ax) * (cy - ay) - (cx - ax) * (by - ay)) * 0.5;
        }
        return area;
    }

    TessError triangulate(WindingRule rule = WindingRule::Odd) {
        return tess->tessellate(rule, ElementType::Polygons, 3, 2);
    }

    std::unique_ptr<Tessellator> tess;
};

// =============================================================================
// Lifecycle and status
// =============================================================================

TEST_F(TessellatorTest, InitialState) {
    EXPECT_EQ(tess->status(), TessError::Ok);
    EXPECT_FALSE(tess->isDisposed());
    EXPECT_EQ(tess->getVertexCount(), 0u);
    EXPECT_EQ(tess->getElementCount(), 0u);
    EXPECT_FALSE(tess->options().constrainedDelaunay);
    EXPECT_EQ(tess->options().coincidenceTolerance, kDefaultCoincidenceTolerance);
}

TEST_F(TessellatorTest, TessellateWithoutContoursFails) {
    EXPECT_EQ(triangulate(), TessError::InvalidInput);
    EXPECT_EQ(tess->status(), TessError::InvalidInput);
}

TEST_F(TessellatorTest, MalformedContoursAreRejected) {
    const std::vector<float> five = {0, 0, 1, 0, 1};
    EXPECT_EQ(tess->addContour(4, five), TessError::InvalidInput);
    EXPECT_EQ(tess->addContour(2, five), TessError::InvalidInput);
    EXPECT_EQ(tess->addContour(2, std::vector<float>{}), TessError::InvalidInput);

    std::vector<float> nan = square(0, 0, 1);
    nan[2] = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ(tess->addContour(2, nan), TessError::InvalidInput);
    EXPECT_EQ(tess->status(), TessError::InvalidInput);

    EXPECT_TRUE(TessellatorTestAccessor::contours(*tess).empty());
    EXPECT_EQ(tess->addContour(2, square(0, 0, 1)), TessError::Ok);
    EXPECT_EQ(tess->status(), TessError::Ok);
}

TEST_F(TessellatorTest, MalformedParametersAreRejected) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 1)), TessError::Ok);

    EXPECT_EQ(tess->tessellate(WindingRule::Odd, ElementType::Polygons, 2, 2), TessError::InvalidInput);
    EXPECT_EQ(tess->tessellate(WindingRule::Odd, ElementType::Polygons, 3, 4), TessError::InvalidInput);
    EXPECT_EQ(tess->tessellate(static_cast<WindingRule>(9), ElementType::Polygons, 3, 2), TessError::InvalidInput);
    EXPECT_EQ(tess->tessellate(WindingRule::Odd, static_cast<ElementType>(7), 3, 2), TessError::InvalidInput);
    EXPECT_EQ(tess->tessellate(WindingRule::Odd, ElementType::Polygons, 3, 2, std::vector<float>{0, 0}),
              TessError::InvalidInput);
    EXPECT_EQ(tess->tessellate(WindingRule::Odd, ElementType::Polygons, 3, 2,
                               std::vector<float>{0, 0, std::numeric_limits<float>::infinity()}),
              TessError::InvalidInput);
    EXPECT_EQ(tess->setCoincidenceTolerance(-1.0), TessError::InvalidInput);
    EXPECT_EQ(tess->setOption(static_cast<TessOption>(11), true), TessError::InvalidInput);

    // Nothing ran.
    EXPECT_EQ(TessellatorTestAccessor::runCount(*tess), 0u);
    EXPECT_EQ(tess->getElementCount(), 0u);
}

TEST_F(TessellatorTest, InvalidCallKeepsPreviousResult) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 1)), TessError::Ok);
    ASSERT_EQ(triangulate(), TessError::Ok);
    const std::uint64_t digest = tess->getResultDigest();

    EXPECT_EQ(tess->tessellate(WindingRule::Odd, ElementType::Polygons, 1, 2), TessError::InvalidInput);
    EXPECT_EQ(tess->getResultDigest(), digest);
    EXPECT_EQ(tess->getElementCount(), 2u);
}

TEST_F(TessellatorTest, DisposeIsIdempotentAndTerminal) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 1)), TessError::Ok);
    ASSERT_EQ(triangulate(), TessError::Ok);

    tess->dispose();
    EXPECT_TRUE(tess->isDisposed());
    EXPECT_EQ(tess->status(), TessError::InvalidInput);
    EXPECT_EQ(tess->getVertexCount(), 0u);
    EXPECT_EQ(tess->getElementCount(), 0u);
    EXPECT_TRUE(tess->getVertices().empty());

    tess->dispose();
    EXPECT_EQ(tess->addContour(2, square(0, 0, 1)), TessError::InvalidInput);
    EXPECT_EQ(triangulate(), TessError::InvalidInput);
    EXPECT_EQ(tess->setOption(TessOption::ConstrainedDelaunay, true), TessError::InvalidInput);
    EXPECT_EQ(tess->setDelaunayFlipBudget(10), TessError::InvalidInput);
    EXPECT_EQ(tess->status(), TessError::InvalidInput);
}

TEST_F(TessellatorTest, OptionsAreStored) {
    EXPECT_EQ(tess->setOption(TessOption::ConstrainedDelaunay, true), TessError::Ok);
    EXPECT_EQ(tess->setOption(TessOption::ValidateWinding, true), TessError::Ok);
    EXPECT_EQ(tess->setCoincidenceTolerance(0.0), TessError::Ok);
    EXPECT_EQ(tess->setDelaunayFlipBudget(64), TessError::Ok);

    const TessOptions& opts = tess->options();
    EXPECT_TRUE(opts.constrainedDelaunay);
    EXPECT_TRUE(opts.validateWinding);
    EXPECT_FALSE(opts.reverseContours);
    EXPECT_EQ(opts.coincidenceTolerance, 0.0);
    EXPECT_EQ(opts.maxDelaunayFlips, 64u);
}

TEST(TessNamesTest, EnumsHaveStableNames) {
    EXPECT_STREQ(toString(WindingRule::Odd), "Odd");
    EXPECT_STREQ(toString(WindingRule::NonZero), "NonZero");
    EXPECT_STREQ(toString(WindingRule::AbsGeqTwo), "AbsGeqTwo");
    EXPECT_STREQ(toString(ElementType::ConnectedPolygons), "ConnectedPolygons");
    EXPECT_STREQ(toString(ElementType::BoundaryContours), "BoundaryContours");
    EXPECT_STREQ(toString(TessError::Ok), "OK");
    EXPECT_STREQ(toString(TessError::OutOfMemory), "OutOfMemory");
    EXPECT_STREQ(toString(TessError::InvalidInput), "InvalidInput");
    EXPECT_TRUE(isValid(WindingRule::Negative));
    EXPECT_FALSE(isValid(static_cast<WindingRule>(5)));
}

// =============================================================================
// Triangulation properties
// =============================================================================

TEST_F(TessellatorTest, TriangleYieldsOneTriangle) {
    ASSERT_EQ(tess->addContour(2, std::vector<float>{0, 0, 1, 0, 0, 1}), TessError::Ok);
    ASSERT_EQ(triangulate(), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 1u);
    EXPECT_EQ(tess->getVertexCount(), 3u);
    EXPECT_NEAR(triangleArea(), 0.5, 1e-9);
}

TEST_F(TessellatorTest, SquareYieldsTwoTriangles) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 1)), TessError::Ok);
    ASSERT_EQ(triangulate(), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 2u);
    EXPECT_EQ(tess->getVertexCount(), 4u);
    EXPECT_EQ(tess->getElements().size(), 6u);
    EXPECT_NEAR(triangleArea(), 1.0, 1e-9);

    for (const std::uint32_t idx : tess->getVertexIndices()) {
        EXPECT_LT(idx, 4u);
    }
}

TEST_F(TessellatorTest, ConvexPolygonYieldsNMinusTwoTriangles) {
    for (int n = 3; n <= 24; n += 3) {
        auto t = Tessellator::create();
        ASSERT_EQ(t->addContour(2, regularPolygon(n, 10.0f)), TessError::Ok);
        ASSERT_EQ(t->tessellate(WindingRule::NonZero, ElementType::Polygons, 3, 2), TessError::Ok);
        EXPECT_EQ(t->getElementCount(), static_cast<std::uint32_t>(n - 2)) << n;
        EXPECT_EQ(t->getVertexCount(), static_cast<std::uint32_t>(n)) << n;
    }
}

TEST_F(TessellatorTest, ConcavePolygonYieldsNMinusTwoTriangles) {
    // Comb with four teeth.
    const std::vector<float> comb = {0, 0, 7, 0, 7, 3, 6, 3, 6, 1, 5, 1, 5, 3, 4, 3,
                                     4, 1, 3, 1, 3, 3, 2, 3, 2, 1, 1, 1, 1, 3, 0, 3};
    ASSERT_EQ(tess->addContour(2, comb), TessError::Ok);
    ASSERT_EQ(triangulate(), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 14u);
    EXPECT_NEAR(triangleArea(), 7.0 * 1.0 + 4.0 * 2.0, 1e-6);
}

TEST_F(TessellatorTest, NotchedPolygonStaysInsideBoundary) {
    // The notch at (12,5) must be joined to (10,0), not across the
    // (3,9.5) corner to (0,10).
    ASSERT_EQ(tess->addContour(2, std::vector<float>{0, 10, 3, 9.5f, 10, 0, 15, 0, 12, 5, 20, 10}),
              TessError::Ok);
    ASSERT_EQ(triangulate(), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 4u);
    EXPECT_NEAR(triangleArea(), 85.0, 1e-6);

    const std::vector<float>& v = tess->getVertices();
    for (const auto& t : tess->triangles()) {
        EXPECT_GT(orient(v[t[0] * 2], v[t[0] * 2 + 1], v[t[1] * 2], v[t[1] * 2 + 1], v[t[2] * 2], v[t[2] * 2 + 1]),
                  0.0);
    }
}

TEST_F(TessellatorTest, VertexIndicesMapBackToInput) {
    const Contours contours = {square(0, 0, 4), square(1, 1, 2), {0, 0, 5, 5, 5, 0, 0, 5}};
    std::vector<float> flat;
    for (const auto& c : contours) {
        ASSERT_EQ(tess->addContour(2, c), TessError::Ok);
        flat.insert(flat.end(), c.begin(), c.end());
    }
    ASSERT_EQ(triangulate(WindingRule::NonZero), TessError::Ok);
    ASSERT_GT(tess->getVertexCount(), 0u);

    int mapped = 0;
    for (std::uint32_t i = 0; i < tess->getVertexCount(); ++i) {
        const std::uint32_t idx = tess->getVertexIndices()[i];
        if (idx == kUndefIndex) continue;
        ASSERT_LT(idx * 2 + 1, flat.size());
        EXPECT_FLOAT_EQ(tess->getVertices()[i * 2], flat[idx * 2]) << i;
        EXPECT_FLOAT_EQ(tess->getVertices()[i * 2 + 1], flat[idx * 2 + 1]) << i;
        ++mapped;
    }
    EXPECT_GT(mapped, 0);
}

TEST_F(TessellatorTest, VertexIndicesMapBackToTiltedInput) {
    const std::vector<float> tilted = {0, 0, 0, 1, 0, 1, 1, 1, 1, 0, 1, 0};
    ASSERT_EQ(tess->addContour(3, tilted), TessError::Ok);
    ASSERT_EQ(tess->tessellate(WindingRule::Odd, ElementType::Polygons, 3, 3), TessError::Ok);
    ASSERT_EQ(tess->getVertexCount(), 4u);

    for (std::uint32_t i = 0; i < 4; ++i) {
        const std::uint32_t idx = tess->getVertexIndices()[i];
        ASSERT_LT(idx, 4u);
        for (std::uint32_t k = 0; k < 3; ++k) {
            EXPECT_FLOAT_EQ(tess->getVertices()[i * 3 + k], tilted[idx * 3 + k]);
        }
    }
}

TEST_F(TessellatorTest, SquareWithHoleUnderOdd) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 4)), TessError::Ok);
    ASSERT_EQ(tess->addContour(2, square(1, 1, 2)), TessError::Ok);
    ASSERT_EQ(triangulate(WindingRule::Odd), TessError::Ok);

    // V + 2H - 2 triangles for a polygon with H holes.
    EXPECT_EQ(tess->getElementCount(), 8u);
    EXPECT_NEAR(triangleArea(), 12.0, 1e-9);
}

TEST_F(TessellatorTest, WindingRulesSelectRegions) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 4)), TessError::Ok);
    ASSERT_EQ(tess->addContour(2, square(1, 1, 2)), TessError::Ok);

    ASSERT_EQ(triangulate(WindingRule::NonZero), TessError::Ok);
    EXPECT_NEAR(triangleArea(), 16.0, 1e-9);

    ASSERT_EQ(triangulate(WindingRule::Positive), TessError::Ok);
    EXPECT_NEAR(triangleArea(), 16.0, 1e-9);

    ASSERT_EQ(triangulate(WindingRule::AbsGeqTwo), TessError::Ok);
    EXPECT_NEAR(triangleArea(), 4.0, 1e-9);

    ASSERT_EQ(triangulate(WindingRule::Negative), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 0u);
    EXPECT_EQ(tess->getVertexCount(), 0u);
}

TEST_F(TessellatorTest, ClockwiseHoleUnderNonZero) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 4)), TessError::Ok);
    ASSERT_EQ(tess->addContour(2, square(1, 1, 2, false)), TessError::Ok);
    ASSERT_EQ(triangulate(WindingRule::NonZero), TessError::Ok);
    EXPECT_NEAR(triangleArea(), 12.0, 1e-9);
}

TEST_F(TessellatorTest, ReverseContoursFlipsWinding) {
    ASSERT_EQ(tess->setOption(TessOption::ReverseContours, true), TessError::Ok);
    ASSERT_EQ(tess->addContour(2, square(0, 0, 1)), TessError::Ok);

    const std::vector<float> normal = {0, 0, 1};
    ASSERT_EQ(tess->tessellate(WindingRule::Positive, ElementType::Polygons, 3, 2, normal), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 0u);

    ASSERT_EQ(tess->tessellate(WindingRule::Negative, ElementType::Polygons, 3, 2, normal), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 2u);
}

TEST_F(TessellatorTest, SelfIntersectionAddsVertex) {
    ASSERT_EQ(tess->addContour(2, std::vector<float>{0, 0, 2, 2, 2, 0, 0, 2}), TessError::Ok);
    ASSERT_EQ(triangulate(WindingRule::Odd), TessError::Ok);

    EXPECT_EQ(tess->getElementCount(), 2u);
    EXPECT_EQ(tess->getVertexCount(), 5u);
    EXPECT_EQ(tess->getStats().intersectionCount, 1u);
    EXPECT_NEAR(triangleArea(), 2.0, 1e-9);

    int synthesized = 0;
    for (std::uint32_t i = 0; i < tess->getVertexCount(); ++i) {
        if (tess->getVertexIndices()[i] == kUndefIndex) {
            ++synthesized;
            EXPECT_FLOAT_EQ(tess->getVertices()[i * 2], 1.0f);
            EXPECT_FLOAT_EQ(tess->getVertices()[i * 2 + 1], 1.0f);
        }
    }
    EXPECT_EQ(synthesized, 1);
}

// =============================================================================
// Output modes
// =============================================================================

TEST_F(TessellatorTest, ConvexPolygonsWithLargerPolySize) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 1)), TessError::Ok);
    ASSERT_EQ(tess->tessellate(WindingRule::Odd, ElementType::Polygons, 4, 2), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 1u);
    EXPECT_EQ(tess->getElements().size(), 4u);
    EXPECT_EQ(tess->triangles().size(), 2u);
    EXPECT_NEAR(triangleArea(), 1.0, 1e-9);
}

TEST_F(TessellatorTest, ConnectedPolygonsCarryNeighbours) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 1)), TessError::Ok);
    ASSERT_EQ(tess->tessellate(WindingRule::Odd, ElementType::ConnectedPolygons, 3, 2), TessError::Ok);
    ASSERT_EQ(tess->getElementCount(), 2u);
    ASSERT_EQ(tess->getElements().size(), 12u);

    int shared = 0;
    for (std::uint32_t i = 0; i < 2; ++i) {
        for (std::uint32_t j = 0; j < 3; ++j) {
            const std::uint32_t nbr = tess->getElements()[i * 6 + 3 + j];
            if (nbr != kUndefIndex) {
                EXPECT_EQ(nbr, 1u - i);
                ++shared;
            }
        }
    }
    EXPECT_EQ(shared, 2);
}

TEST_F(TessellatorTest, BoundaryContoursOfSquareWithHole) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 4)), TessError::Ok);
    ASSERT_EQ(tess->addContour(2, square(1, 1, 2)), TessError::Ok);
    ASSERT_EQ(tess->tessellate(WindingRule::Odd, ElementType::BoundaryContours, 3, 2), TessError::Ok);

    ASSERT_EQ(tess->getElementCount(), 2u);
    ASSERT_EQ(tess->getElements().size(), 4u);
    EXPECT_EQ(tess->getVertexCount(), 8u);
    EXPECT_EQ(tess->getElements()[0], 0u);
    EXPECT_EQ(tess->getElements()[1] + tess->getElements()[3], 8u);
    EXPECT_EQ(tess->getElements()[2], tess->getElements()[1]);
    EXPECT_TRUE(tess->triangles().empty());
}

TEST_F(TessellatorTest, BoundaryContoursMergeOverlaps) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 2)), TessError::Ok);
    ASSERT_EQ(tess->addContour(2, square(1, 1, 2)), TessError::Ok);
    ASSERT_EQ(tess->tessellate(WindingRule::NonZero, ElementType::BoundaryContours, 3, 2), TessError::Ok);

    // One outline: 6 original corners and 2 crossings.
    ASSERT_EQ(tess->getElementCount(), 1u);
    EXPECT_EQ(tess->getElements()[1], 8u);
}

TEST_F(TessellatorTest, ThreeWideOutputAndSuppliedNormal) {
    const std::vector<float> tilted = {0, 0, 5, 1, 0, 5, 1, 1, 5, 0, 1, 5};
    ASSERT_EQ(tess->addContour(3, tilted), TessError::Ok);
    ASSERT_EQ(tess->tessellate(WindingRule::Odd, ElementType::Polygons, 3, 3, std::vector<float>{0, 0, 1}),
              TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 2u);
    ASSERT_EQ(tess->getVertices().size(), 12u);
    for (std::uint32_t i = 0; i < 4; ++i) {
        EXPECT_EQ(tess->getVertices()[i * 3 + 2], 5.0f);
    }
}

TEST_F(TessellatorTest, VerticalPlaneUsesComputedNormal) {
    const std::vector<float> wall = {0, 0, 0, 0, 2, 0, 0, 2, 2, 0, 0, 2};
    ASSERT_EQ(tess->addContour(3, wall), TessError::Ok);
    ASSERT_EQ(tess->tessellate(WindingRule::NonZero, ElementType::Polygons, 3, 3), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 2u);
}

TEST_F(TessellatorTest, MixedWidthContours) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 4)), TessError::Ok);
    const std::vector<float> inner = {1, 1, 0, 3, 1, 0, 3, 3, 0, 1, 3, 0};
    ASSERT_EQ(tess->addContour(3, inner), TessError::Ok);
    ASSERT_EQ(triangulate(WindingRule::Odd), TessError::Ok);
    EXPECT_NEAR(triangleArea(), 12.0, 1e-9);
}

// =============================================================================
// Degenerate and extreme input
// =============================================================================

TEST_F(TessellatorTest, CollinearInputYieldsNothing) {
    ASSERT_EQ(tess->addContour(2, std::vector<float>{0, 0, 1, 1, 2, 2}), TessError::Ok);
    EXPECT_EQ(triangulate(), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 0u);
}

TEST_F(TessellatorTest, SinglePointYieldsNothing) {
    ASSERT_EQ(tess->addContour(2, std::vector<float>{3, 3}), TessError::Ok);
    EXPECT_EQ(triangulate(), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 0u);
}

TEST_F(TessellatorTest, DuplicateVerticesCollapse) {
    ASSERT_EQ(tess->addContour(2, std::vector<float>{0, 0, 1, 0, 1, 0, 1, 1, 0, 1, 0, 1}), TessError::Ok);
    ASSERT_EQ(triangulate(), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 2u);
    EXPECT_EQ(tess->getVertexCount(), 4u);
    EXPECT_GT(tess->getStats().degenerateCollapseCount, 0u);
}

TEST_F(TessellatorTest, SharedVertexBetweenContours) {
    ASSERT_EQ(tess->addContour(2, std::vector<float>{0, 0, 1, 0, 1, 1}), TessError::Ok);
    ASSERT_EQ(tess->addContour(2, std::vector<float>{1, 1, 2, 1, 2, 2}), TessError::Ok);
    ASSERT_EQ(triangulate(), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 2u);
    EXPECT_EQ(tess->getVertexCount(), 5u);
    EXPECT_GE(tess->getStats().mergedVertexCount, 1u);
}

TEST_F(TessellatorTest, LargeAndSmallMagnitudesStayFinite) {
    const float scales[] = {1e-6f, 1e-3f, 1.0f, 1e3f, 1e6f};
    for (const float scale : scales) {
        auto t = Tessellator::create();
        ASSERT_EQ(t->addContour(2, square(0, 0, scale)), TessError::Ok);
        ASSERT_EQ(t->addContour(2, square(scale * 0.25f, scale * 0.25f, scale * 0.5f)), TessError::Ok);
        ASSERT_EQ(t->tessellate(WindingRule::Odd, ElementType::Polygons, 3, 2), TessError::Ok) << scale;
        EXPECT_EQ(t->getElementCount(), 8u) << scale;
        EXPECT_TRUE(allFinite(t->getVertices())) << scale;
    }
}

// =============================================================================
// Options and statistics
// =============================================================================

TEST_F(TessellatorTest, ConstrainedDelaunayPicksShortDiagonal) {
    ASSERT_EQ(tess->setOption(TessOption::ConstrainedDelaunay, true), TessError::Ok);
    ASSERT_EQ(tess->addContour(2, std::vector<float>{0, 0, 2, -1, 4, 0, 2, 1}), TessError::Ok);
    ASSERT_EQ(triangulate(), TessError::Ok);
    ASSERT_EQ(tess->getElementCount(), 2u);

    // Both triangles contain the two vertices with x == 2.
    const std::vector<float>& v = tess->getVertices();
    for (const auto& t : tess->triangles()) {
        int onAxis = 0;
        for (const std::uint32_t idx : t) {
            if (v[idx * 2] == 2.0f) ++onAxis;
        }
        EXPECT_EQ(onAxis, 2);
    }
}

TEST_F(TessellatorTest, WindingValidationFindsNoMismatch) {
    ASSERT_EQ(tess->setOption(TessOption::ValidateWinding, true), TessError::Ok);
    ASSERT_EQ(tess->addContour(2, square(0, 0, 4)), TessError::Ok);
    ASSERT_EQ(tess->addContour(2, square(1, 1, 2)), TessError::Ok);
    ASSERT_EQ(tess->addContour(2, std::vector<float>{0, 0, 2, 2, 2, 0, 0, 2}), TessError::Ok);

    ASSERT_EQ(triangulate(WindingRule::Odd), TessError::Ok);
    EXPECT_EQ(tess->getStats().windingMismatchCount, 0u);
    ASSERT_EQ(triangulate(WindingRule::AbsGeqTwo), TessError::Ok);
    EXPECT_EQ(tess->getStats().windingMismatchCount, 0u);
}

TEST_F(TessellatorTest, StatsDescribeRun) {
    ASSERT_EQ(tess->addContour(2, square(0, 0, 4)), TessError::Ok);
    ASSERT_EQ(tess->addContour(2, square(1, 1, 2)), TessError::Ok);
    ASSERT_EQ(triangulate(), TessError::Ok);

    const TessStats& stats = tess->getStats();
    EXPECT_EQ(stats.inputVertexCount, 8u);
    EXPECT_EQ(stats.contourCount, 2u);
    EXPECT_EQ(stats.intersectionCount, 0u);
    EXPECT_EQ(stats.outputVertexCount, tess->getVertexCount());
    EXPECT_EQ(stats.outputElementCount, tess->getElementCount());
}

TEST_F(TessellatorTest, BoundaryLoopsIgnorePolygonSize) {
    ASSERT_EQ(tess->addContour(2, regularPolygon(12, 1.0f)), TessError::Ok);
    ASSERT_EQ(tess->tessellate(WindingRule::Odd, ElementType::BoundaryContours, 3, 2), TessError::Ok);
    EXPECT_EQ(tess->getElementCount(), 1u);
    EXPECT_EQ(tess->getElements()[1], 12u);
}

// =============================================================================
// Coverage
// =============================================================================

// Triangles must tile exactly the points the winding rule selects: every
// sample away from an edge lies in one triangle when inside, none otherwise.
TEST(TessellatorCoverageTest, TrianglesTileWindingRegion) {
    const WindingRule rules[] = {WindingRule::Odd, WindingRule::NonZero, WindingRule::Positive,
                                 WindingRule::Negative, WindingRule::AbsGeqTwo};
    const std::vector<float> normal = {0, 0, 1};
    std::mt19937 rng(20261019u);

    for (int scene = 0; scene < 40; ++scene) {
        const Contours contours = randomContours(rng);
        for (const WindingRule rule : rules) {
            auto tess = Tessellator::create();
            ASSERT_NE(tess, nullptr);
            for (const auto& c : contours) {
                ASSERT_EQ(tess->addContour(2, c), TessError::Ok);
            }
            ASSERT_EQ(tess->tessellate(rule, ElementType::Polygons, 3, 2, normal), TessError::Ok);

            const std::vector<float>& v = tess->getVertices();
            ASSERT_TRUE(allFinite(v));
            const auto tris = tess->triangles();

            std::vector<std::array<double, 4>> segments;
            for (const auto& t : tris) {
                for (std::size_t k = 0; k < 3; ++k) {
                    ASSERT_LT(t[k], tess->getVertexCount());
                    const std::uint32_t a = t[k];
                    const std::uint32_t b = t[(k + 1) % 3];
                    segments.push_back({v[a * 2], v[a * 2 + 1], v[b * 2], v[b * 2 + 1]});
                }
                EXPECT_FALSE(t[0] == t[1] && t[1] == t[2]);
            }
            for (const auto& c : contours) {
                const std::size_t n = c.size() / 2;
                for (std::size_t i = 0; i < n; ++i) {
                    const std::size_t j = (i + 1) % n;
                    segments.push_back({c[i * 2], c[i * 2 + 1], c[j * 2], c[j * 2 + 1]});
                }
            }

            int wrong = 0;
            for (int i = 0; i < 40; ++i) {
                for (int j = 0; j < 40; ++j) {
                    const double x = 0.2371 + i * 0.4937;
                    const double y = 0.3113 + j * 0.4919;
                    bool nearEdge = false;
                    for (const auto& seg : segments) {
                        if (segmentDistance(x, y, seg[0], seg[1], seg[2], seg[3]) < 1e-3) {
                            nearEdge = true;
                            break;
                        }
                    }
                    if (nearEdge) continue;

                    int covered = 0;
                    for (const auto& t : tris) {
                        const double ax = v[t[0] * 2], ay = v[t[0] * 2 + 1];
                        const double bx = v[t[1] * 2], by = v[t[1] * 2 + 1];
                        const double cx = v[t[2] * 2], cy = v[t[2] * 2 + 1];
                        const double d1 = orient(ax, ay, bx, by, x, y);
                        const double d2 = orient(bx, by, cx, cy, x, y);
                        const double d3 = orient(cx, cy, ax, ay, x, y);
                        if ((d1 > 0 && d2 > 0 && d3 > 0) || (d1 < 0 && d2 < 0 && d3 < 0)) ++covered;
                    }
                    const int expected = isWindingInside(rule, windingAt(contours, x, y)) ? 1 : 0;
                    if (covered != expected) ++wrong;
                }
            }
            EXPECT_EQ(wrong, 0) << "scene " << scene << " rule " << toString(rule);
        }
    }
}
