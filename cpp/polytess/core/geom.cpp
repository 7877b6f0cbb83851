#include "polytess/core/geom.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace polytess {

namespace {

// Returns x + (y - x) * a / (a + b) with the weights clamped at zero, taking
// care to stay between x and y.
inline double interpolate(double a, double x, double b, double y) noexcept {
    a = a < 0 ? 0 : a;
    b = b < 0 ? 0 : b;
    if (a <= b) {
        if (b == 0) return (x + y) / 2;
        return x + (y - x) * (a / (a + b));
    }
    return y + (x - y) * (b / (a + b));
}

inline Point2 transposed(const Point2& p) noexcept {
    return Point2{p.t, p.s};
}

} // namespace

double edgeEval(const Point2& u, const Point2& v, const Point2& w) noexcept {
    const double gapL = v.s - u.s;
    const double gapR = w.s - v.s;
    if (gapL + gapR > 0) {
        if (gapL < gapR) {
            return (v.t - u.t) + (u.t - w.t) * (gapL / (gapL + gapR));
        }
        return (v.t - w.t) + (w.t - u.t) * (gapR / (gapL + gapR));
    }
    // Vertical line.
    return 0;
}

double edgeSign(const Point2& u, const Point2& v, const Point2& w) noexcept {
    const double gapL = v.s - u.s;
    const double gapR = w.s - v.s;
    if (gapL + gapR > 0) {
        return (v.t - w.t) * gapL + (v.t - u.t) * gapR;
    }
    return 0;
}

double transEval(const Point2& u, const Point2& v, const Point2& w) noexcept {
    return edgeEval(transposed(u), transposed(v), transposed(w));
}

double transSign(const Point2& u, const Point2& v, const Point2& w) noexcept {
    return edgeSign(transposed(u), transposed(v), transposed(w));
}

Point2 edgeIntersect(Point2 o1, Point2 d1, Point2 o2, Point2 d2) noexcept {
    Point2 out{0, 0};

    // s coordinate: sort so that o1 <= o2 <= d1 in the sweep order.
    {
        Point2 a = o1, b = d1, c = o2, d = d2;
        if (!vertLeq(a, b)) std::swap(a, b);
        if (!vertLeq(c, d)) std::swap(c, d);
        if (!vertLeq(a, c)) {
            std::swap(a, c);
            std::swap(b, d);
        }
        if (!vertLeq(c, b)) {
            // No overlap in s.
            out.s = (c.s + b.s) / 2;
        } else if (vertLeq(b, d)) {
            double z1 = edgeEval(a, c, b);
            double z2 = edgeEval(c, b, d);
            if (z1 + z2 < 0) {
                z1 = -z1;
                z2 = -z2;
            }
            out.s = interpolate(z1, c.s, z2, b.s);
        } else {
            double z1 = edgeSign(a, c, b);
            double z2 = -edgeSign(a, d, b);
            if (z1 + z2 < 0) {
                z1 = -z1;
                z2 = -z2;
            }
            out.s = interpolate(z1, c.s, z2, d.s);
        }
    }

    // t coordinate, same procedure in the transposed order.
    {
        Point2 a = o1, b = d1, c = o2, d = d2;
        if (!transLeq(a, b)) std::swap(a, b);
        if (!transLeq(c, d)) std::swap(c, d);
        if (!transLeq(a, c)) {
            std::swap(a, c);
            std::swap(b, d);
        }
        if (!transLeq(c, b)) {
            out.t = (c.t + b.t) / 2;
        } else if (transLeq(b, d)) {
            double z1 = transEval(a, c, b);
            double z2 = transEval(c, b, d);
            if (z1 + z2 < 0) {
                z1 = -z1;
                z2 = -z2;
            }
            out.t = interpolate(z1, c.t, z2, b.t);
        } else {
            double z1 = transSign(a, c, b);
            double z2 = -transSign(a, d, b);
            if (z1 + z2 < 0) {
                z1 = -z1;
                z2 = -z2;
            }
            out.t = interpolate(z1, c.t, z2, d.t);
        }
    }
    return out;
}

double vertexAngle(const Point2& a, const Point2& b, const Point2& c) noexcept {
    const double ux = a.s - b.s;
    const double uy = a.t - b.t;
    const double vx = c.s - b.s;
    const double vy = c.t - b.t;
    const double lu = std::sqrt(ux * ux + uy * uy);
    const double lv = std::sqrt(vx * vx + vy * vy);
    if (lu == 0 || lv == 0) return 0;
    const double cosA = std::clamp((ux * vx + uy * vy) / (lu * lv), -1.0, 1.0);
    return std::acos(cosA);
}

} // namespace polytess
