#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include "gfx/matrix.hpp"

using vt::gfx::Matrix;
using vt::gfx::Point;

static bool approx(float a, float b, float eps = 1e-5f) {
    return std::fabs(a - b) <= eps;
}

TEST_CASE("Matrix default is identity", "[matrix]") {
    Matrix m;
    REQUIRE(m.is_identity());
    Point p = m.map_point({0.25f, -0.75f});
    REQUIRE(p.x == 0.25f);
    REQUIRE(p.y == -0.75f);
}

TEST_CASE("Matrix quarter rotation is exact and counter-clockwise", "[matrix]") {
    Matrix m = Matrix::rotate(90.0f);
    REQUIRE_FALSE(m.is_identity());
    Point p = m.map_point({1.0f, 0.0f});
    REQUIRE(p.x == 0.0f);
    REQUIRE(p.y == 1.0f);

    m.post_rotate(270.0f);
    REQUIRE(m.is_identity());
}

TEST_CASE("Matrix pre and post operations apply in order", "[matrix]") {
    Matrix m;
    m.post_translate(1.0f, 0.0f);
    m.pre_scale(2.0f, 1.0f);
    // Scale first, then translate.
    Point p = m.map_point({1.0f, 1.0f});
    REQUIRE(approx(p.x, 3.0f));
    REQUIRE(approx(p.y, 1.0f));

    Matrix n;
    n.post_scale(2.0f, 1.0f);
    n.pre_concat(Matrix::translate(1.0f, 0.0f));
    // Translate first, then scale.
    Point q = n.map_point({1.0f, 1.0f});
    REQUIRE(approx(q.x, 4.0f));
    REQUIRE(approx(q.y, 1.0f));
}

TEST_CASE("Matrix map_points maps every point", "[matrix]") {
    Matrix m = Matrix::scale(0.5f, 2.0f);
    std::array<Point, 2> pts = {{{1.0f, 1.0f}, {-2.0f, 0.5f}}};
    m.map_points(pts);
    REQUIRE(approx(pts[0].x, 0.5f));
    REQUIRE(approx(pts[0].y, 2.0f));
    REQUIRE(approx(pts[1].x, -1.0f));
    REQUIRE(approx(pts[1].y, 1.0f));
}

TEST_CASE("Matrix converts to a column-major GL matrix", "[matrix]") {
    Matrix m({1, 2, 3,
              4, 5, 6,
              0, 0, 1});
    auto gl = m.to_gl_matrix();
    REQUIRE(gl == vt::gfx::GlMatrix{1, 4, 0, 0,
                                    2, 5, 0, 0,
                                    0, 0, 1, 0,
                                    3, 6, 0, 1});
    REQUIRE(Matrix().to_gl_matrix() == vt::gfx::gl_identity_matrix());
}
