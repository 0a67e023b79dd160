#include <stratum/geom/matrix.h>

#include <cmath>

namespace stratum::geom {

namespace {
constexpr float kPi = 3.14159265358979323846f;

float to_radians(float deg) { return deg * kPi / 180.0f; }
} // namespace

Matrix Matrix::rotation(float angle_deg) {
    float rad = to_radians(angle_deg);
    float cs = std::cos(rad);
    float sn = std::sin(rad);
    return {cs, -sn, 0, sn, cs, 0};
}

Matrix Matrix::skew(float ax_deg, float ay_deg) {
    return {1, std::tan(to_radians(ax_deg)), 0, std::tan(to_radians(ay_deg)), 1, 0};
}

} // namespace stratum::geom
