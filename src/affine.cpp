#include "vellum/affine.hpp"
#include <cmath>

namespace vellum {

Affine Affine::Translate(f64 dx, f64 dy) {
    return Affine({1, 0, 0, 1, dx, dy});
}

Affine Affine::Scale(f64 sx, f64 sy) {
    return Affine({sx, 0, 0, sy, 0, 0});
}

Affine Affine::Rotate(f64 radians) {
    f64 s = std::sin(radians);
    f64 c = std::cos(radians);
    return Affine({c, s, -s, c, 0, 0});
}

Affine Affine::operator*(const Affine& rhs) const {
    const auto& a = c_;
    const auto& b = rhs.c_;
    return Affine({
        a[0] * b[0] + a[2] * b[1],
        a[1] * b[0] + a[3] * b[1],
        a[0] * b[2] + a[2] * b[3],
        a[1] * b[2] + a[3] * b[3],
        a[0] * b[4] + a[2] * b[5] + a[4],
        a[1] * b[4] + a[3] * b[5] + a[5],
    });
}

Point Affine::apply(Point p) const {
    return {c_[0] * p.x + c_[2] * p.y + c_[4],
            c_[1] * p.x + c_[3] * p.y + c_[5]};
}

Affine Affine::preTranslate(f64 dx, f64 dy) const {
    return *this * Translate(dx, dy);
}

Affine Affine::thenTranslate(f64 dx, f64 dy) const {
    return Translate(dx, dy) * *this;
}

Affine Affine::inverse() const {
    f64 invDet = 1.0 / determinant();
    const auto& c = c_;
    return Affine({
        invDet * c[3],
        -invDet * c[1],
        -invDet * c[2],
        invDet * c[0],
        invDet * (c[2] * c[5] - c[3] * c[4]),
        invDet * (c[1] * c[4] - c[0] * c[5]),
    });
}

} // namespace vellum
