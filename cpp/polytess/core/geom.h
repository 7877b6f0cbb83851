#pragma once

#include "polytess/core/types.h"

namespace polytess {

// Sweep-plane predicates. The sweep advances in +s; ties are broken on t.

inline bool vertEq(const Point2& u, const Point2& v) noexcept {
    return u.s == v.s && u.t == v.t;
}

inline bool vertLeq(const Point2& u, const Point2& v) noexcept {
    return u.s < v.s || (u.s == v.s && u.t <= v.t);
}

// Same order with the axes transposed.
inline bool transLeq(const Point2& u, const Point2& v) noexcept {
    return u.t < v.t || (u.t == v.t && u.s <= v.s);
}

inline double vertL1Dist(const Point2& u, const Point2& v) noexcept {
    const double ds = u.s - v.s;
    const double dt = u.t - v.t;
    return (ds < 0 ? -ds : ds) + (dt < 0 ? -dt : dt);
}

// True when u, v, w make a left turn (or are collinear).
inline bool vertCCW(const Point2& u, const Point2& v, const Point2& w) noexcept {
    return (u.s * (v.t - w.t) + v.s * (w.t - u.t) + w.s * (u.t - v.t)) >= 0;
}

/**
 * Signed t-distance from v to the segment uw, evaluated at v.s.
 * Requires vertLeq(u, v) && vertLeq(v, w). Positive when v lies above uw.
 */
double edgeEval(const Point2& u, const Point2& v, const Point2& w) noexcept;

/**
 * Same sign as edgeEval(u, v, w) but cheaper and without the division.
 */
double edgeSign(const Point2& u, const Point2& v, const Point2& w) noexcept;

double transEval(const Point2& u, const Point2& v, const Point2& w) noexcept;
double transSign(const Point2& u, const Point2& v, const Point2& w) noexcept;

/**
 * Intersection of segments o1d1 and o2d2, computed so that the result stays
 * inside the bounding rectangle of the overlap even for nearly parallel input.
 */
Point2 edgeIntersect(Point2 o1, Point2 d1, Point2 o2, Point2 d2) noexcept;

// Interior angle at b in the triangle (a, b, c), in radians.
double vertexAngle(const Point2& a, const Point2& b, const Point2& c) noexcept;

} // namespace polytess
