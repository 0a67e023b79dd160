#pragma once
#include <stratum/geom/rect.h>

namespace stratum::geom {

// 2D affine transform matrix: [a b tx; c d ty; 0 0 1]
struct Matrix {
    float a = 1, b = 0, tx = 0;
    float c = 0, d = 1, ty = 0;

    static Matrix identity() { return {1, 0, 0, 0, 1, 0}; }
    static Matrix translation(float x, float y) { return {1, 0, x, 0, 1, y}; }
    static Matrix scaling(float sx, float sy) { return {sx, 0, 0, 0, sy, 0}; }
    static Matrix rotation(float angle_deg);
    static Matrix skew(float ax_deg, float ay_deg);
    // CSS matrix(a, b, c, d, e, f) argument order.
    static Matrix from_css(float a, float b, float c, float d, float e, float f) {
        return {a, c, e, b, d, f};
    }

    Point apply(const Point& p) const {
        return {a * p.x + b * p.y + tx, c * p.x + d * p.y + ty};
    }

    // Concatenate: this * other (other is applied first)
    Matrix operator*(const Matrix& o) const {
        Matrix r;
        r.a  = a * o.a  + b * o.c;
        r.b  = a * o.b  + b * o.d;
        r.tx = a * o.tx + b * o.ty + tx;
        r.c  = c * o.a  + d * o.c;
        r.d  = c * o.b  + d * o.d;
        r.ty = c * o.tx + d * o.ty + ty;
        return r;
    }

    bool operator==(const Matrix& o) const {
        return a == o.a && b == o.b && tx == o.tx && c == o.c && d == o.d && ty == o.ty;
    }
    bool operator!=(const Matrix& o) const { return !(*this == o); }

    bool is_identity() const {
        return a == 1 && b == 0 && tx == 0 && c == 0 && d == 1 && ty == 0;
    }
};

} // namespace stratum::geom
