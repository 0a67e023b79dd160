#pragma once

namespace stratum::geom {

struct Point {
    float x = 0, y = 0;
};

struct Rect {
    float x = 0, y = 0, width = 0, height = 0;

    bool contains(float px, float py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }
    bool contains(const Point& p) const { return contains(p.x, p.y); }

    float right() const { return x + width; }
    float bottom() const { return y + height; }

    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Rect& o) const { return !(*this == o); }
};

struct EdgeSizes {
    float top = 0, right = 0, bottom = 0, left = 0;
};

} // namespace stratum::geom
