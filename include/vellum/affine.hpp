#pragma once

/**
 * @file affine.hpp
 * @brief 2D affine transform value type.
 */

#include "vellum/types.hpp"
#include <array>

namespace vellum {

/// @brief A 2D affine transform stored as six coefficients [a b c d e f].
///
/// A point is mapped as x' = a*x + c*y + e, y' = b*x + d*y + f. The default
/// value is the identity. `A * B` applies B first and then A, so a point in
/// child space is taken to global space by `global * local`.
///
/// Singular matrices are accepted; inverse() of a singular transform yields
/// non-finite coefficients and it is up to the backend to skip such ops.
class Affine {
public:
    constexpr Affine() = default;

    /// @brief Construct from raw coefficients [a b c d e f].
    explicit constexpr Affine(const std::array<f64, 6>& coeffs) : c_(coeffs) {}

    /// @brief The identity transform.
    static constexpr Affine Identity() { return Affine(); }

    /// @brief A translation by (dx, dy).
    static Affine Translate(f64 dx, f64 dy);

    /// @brief A translation by the vector of a point.
    static Affine Translate(Point p) { return Translate(p.x, p.y); }

    /// @brief A uniform scale about the origin.
    static Affine Scale(f64 s) { return Scale(s, s); }

    /// @brief A non-uniform scale about the origin.
    static Affine Scale(f64 sx, f64 sy);

    /// @brief A rotation about the origin by an angle in radians.
    static Affine Rotate(f64 radians);

    /// @brief Compose: the result applies `rhs` first, then `*this`.
    Affine operator*(const Affine& rhs) const;

    /// @brief Map a point through the transform.
    Point operator*(Point p) const { return apply(p); }

    /// @brief Map a point through the transform.
    Point apply(Point p) const;

    /// @brief Translate in local space before this transform: `*this * Translate(dx, dy)`.
    Affine preTranslate(f64 dx, f64 dy) const;

    /// @brief Translate in target space after this transform: `Translate(dx, dy) * *this`.
    Affine thenTranslate(f64 dx, f64 dy) const;

    /// @brief Determinant of the linear part.
    f64 determinant() const { return c_[0] * c_[3] - c_[1] * c_[2]; }

    /// @brief The inverse transform (non-finite when determinant() is 0).
    Affine inverse() const;

    /// @brief The translation part (e, f).
    Point translation() const { return {c_[4], c_[5]}; }

    /// @brief The raw coefficients [a b c d e f].
    const std::array<f64, 6>& coeffs() const { return c_; }

    bool operator==(const Affine& o) const { return c_ == o.c_; }
    bool operator!=(const Affine& o) const { return c_ != o.c_; }

private:
    std::array<f64, 6> c_ = {1, 0, 0, 1, 0, 0};
};

} // namespace vellum
