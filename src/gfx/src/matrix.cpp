#include "gfx/matrix.hpp"

#include <cmath>
#include <sstream>

namespace vt::gfx {

namespace {
constexpr float kPi = 3.14159265358979323846f;

// Snaps sin/cos of multiples of 90 degrees to exact values so that quarter
// turns keep the matrix integral.
float snap(float v) {
    constexpr float kEpsilon = 1e-6f;
    if(std::fabs(v) < kEpsilon) return 0.0f;
    if(std::fabs(v - 1.0f) < kEpsilon) return 1.0f;
    if(std::fabs(v + 1.0f) < kEpsilon) return -1.0f;
    return v;
}
} // namespace

GlMatrix gl_identity_matrix() {
    return {1, 0, 0, 0,
            0, 1, 0, 0,
            0, 0, 1, 0,
            0, 0, 0, 1};
}

Matrix::Matrix() : v_{1, 0, 0, 0, 1, 0, 0, 0, 1} {}

Matrix::Matrix(const std::array<float, 9>& values) : v_(values) {}

Matrix Matrix::scale(float sx, float sy) {
    return Matrix({sx, 0, 0, 0, sy, 0, 0, 0, 1});
}

Matrix Matrix::translate(float dx, float dy) {
    return Matrix({1, 0, dx, 0, 1, dy, 0, 0, 1});
}

Matrix Matrix::rotate(float degrees) {
    const float radians = degrees * kPi / 180.0f;
    const float s = snap(std::sin(radians));
    const float c = snap(std::cos(radians));
    return Matrix({c, -s, 0, s, c, 0, 0, 0, 1});
}

bool Matrix::is_identity() const {
    return v_ == Matrix().v_;
}

Matrix Matrix::multiply(const Matrix& a, const Matrix& b) {
    std::array<float, 9> r{};
    for(int row = 0; row < 3; ++row) {
        for(int col = 0; col < 3; ++col) {
            float sum = 0.0f;
            for(int k = 0; k < 3; ++k) {
                sum += a.v_[row * 3 + k] * b.v_[k * 3 + col];
            }
            r[row * 3 + col] = sum;
        }
    }
    return Matrix(r);
}

void Matrix::pre_concat(const Matrix& other) { *this = multiply(*this, other); }

void Matrix::post_concat(const Matrix& other) { *this = multiply(other, *this); }

Point Matrix::map_point(Point p) const {
    float x = v_[0] * p.x + v_[1] * p.y + v_[2];
    float y = v_[3] * p.x + v_[4] * p.y + v_[5];
    float w = v_[6] * p.x + v_[7] * p.y + v_[8];
    if(w != 1.0f && w != 0.0f) {
        x /= w;
        y /= w;
    }
    return {x, y};
}

GlMatrix Matrix::to_gl_matrix() const {
    // Row-major 3x3 (x, y, w) spread into a column-major 4x4 (x, y, z, w).
    return {v_[0], v_[3], 0, v_[6],
            v_[1], v_[4], 0, v_[7],
            0,     0,     1, 0,
            v_[2], v_[5], 0, v_[8]};
}

std::string Matrix::to_string() const {
    std::ostringstream oss;
    oss << '[';
    for(size_t i = 0; i < v_.size(); ++i) {
        if(i) oss << (i % 3 == 0 ? "; " : ", ");
        oss << v_[i];
    }
    oss << ']';
    return oss.str();
}

} // namespace vt::gfx
