#pragma once
#include <array>
#include <string>

namespace vt::gfx {

struct Point {
    float x = 0.0f;
    float y = 0.0f;
};

// Column-major 4x4 matrix as consumed by glUniformMatrix4fv.
using GlMatrix = std::array<float, 16>;

GlMatrix gl_identity_matrix();

// 3x3 matrix for 2D affine (and projective) transforms of frame geometry in
// normalized device coordinates. "pre" operations apply before the current
// transform (M = M * T), "post" operations after it (M = T * M).
class Matrix {
public:
    // Identity.
    Matrix();
    // Row-major values: {scale_x, skew_x, trans_x, skew_y, scale_y, trans_y, persp0, persp1, persp2}.
    explicit Matrix(const std::array<float, 9>& values);

    static Matrix scale(float sx, float sy);
    static Matrix translate(float dx, float dy);
    // Counter-clockwise in a y-up coordinate space.
    static Matrix rotate(float degrees);

    bool is_identity() const;

    void pre_concat(const Matrix& other);
    void post_concat(const Matrix& other);
    void pre_scale(float sx, float sy) { pre_concat(scale(sx, sy)); }
    void post_scale(float sx, float sy) { post_concat(scale(sx, sy)); }
    void post_translate(float dx, float dy) { post_concat(translate(dx, dy)); }
    void post_rotate(float degrees) { post_concat(rotate(degrees)); }

    Point map_point(Point p) const;
    template <size_t N>
    void map_points(std::array<Point, N>& points) const {
        for(auto& p : points) p = map_point(p);
    }

    // Embeds the 2D transform in a 4x4 matrix that leaves z untouched.
    GlMatrix to_gl_matrix() const;

    std::string to_string() const;

    bool operator==(const Matrix& other) const { return v_ == other.v_; }
    bool operator!=(const Matrix& other) const { return v_ != other.v_; }

private:
    static Matrix multiply(const Matrix& a, const Matrix& b);

    std::array<float, 9> v_;
};

} // namespace vt::gfx
