/*
 * Stagecraft Shape Geometry Tests
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "stagecraft/shape.h"
#include "stagecraft/physics.h"
#include "stagecraft/error.h"

using Catch::Approx;

static Stagecraft_ShapeGeometry make_square(float half) {
    Stagecraft_ShapeGeometry g = {};
    g.kind = STAGECRAFT_SHAPE_POLYGON;
    g.polygon.count = 4;
    g.polygon.vertices[0] = stagecraft_vec2(-half, -half);
    g.polygon.vertices[1] = stagecraft_vec2(half, -half);
    g.polygon.vertices[2] = stagecraft_vec2(half, half);
    g.polygon.vertices[3] = stagecraft_vec2(-half, half);
    return g;
}

/* ============================================================================
 * Outlines
 * ============================================================================ */

TEST_CASE("Shape outlines", "[shape][outline]") {
    Stagecraft_ShapeOutline outline;

    SECTION("Polygon outline is its vertices") {
        Stagecraft_ShapeGeometry g = make_square(5.0f);
        REQUIRE(stagecraft_shape_outline(&g, &outline));
        REQUIRE(outline.count == 4);
        REQUIRE_FALSE(outline.is_circle);
        REQUIRE(outline.points[2].x == Approx(5.0f));
    }

    SECTION("Circle outline is its bounding square") {
        Stagecraft_ShapeGeometry g = {};
        g.kind = STAGECRAFT_SHAPE_CIRCLE;
        g.circle.radius = 3.0f;
        REQUIRE(stagecraft_shape_outline(&g, &outline));
        REQUIRE(outline.count == 4);
        REQUIRE(outline.is_circle);
        REQUIRE(outline.radius == Approx(3.0f));
        REQUIRE(outline.points[0].x == Approx(3.0f));
        REQUIRE(outline.points[2].y == Approx(-3.0f));
    }

    SECTION("Segment outline is a unit-wide rectangle") {
        Stagecraft_ShapeGeometry g = {};
        g.kind = STAGECRAFT_SHAPE_SEGMENT;
        g.segment.a = stagecraft_vec2(0.0f, 0.0f);
        g.segment.b = stagecraft_vec2(10.0f, 0.0f);
        REQUIRE(stagecraft_shape_outline(&g, &outline));
        REQUIRE(outline.count == 4);
        REQUIRE(outline.points[0].y == Approx(0.5f));
        REQUIRE(outline.points[1].y == Approx(-0.5f));
        REQUIRE(outline.points[2].x == Approx(10.0f));
    }

    SECTION("Unknown kind is an unsupported shape") {
        stagecraft_clear_error();
        Stagecraft_ShapeGeometry g = {};
        g.kind = STAGECRAFT_SHAPE_UNKNOWN;
        REQUIRE_FALSE(stagecraft_shape_outline(&g, &outline));
        REQUIRE(stagecraft_get_last_error_kind() == STAGECRAFT_ERROR_UNSUPPORTED_SHAPE);
        stagecraft_clear_error();
    }
}

/* ============================================================================
 * Size and Rescale
 * ============================================================================ */

TEST_CASE("Shape size and rescale", "[shape][size]") {
    float w = 0.0f, h = 0.0f;

    SECTION("Polygon") {
        Stagecraft_ShapeGeometry g = make_square(5.0f);
        REQUIRE(stagecraft_shape_size(&g, &w, &h));
        REQUIRE(w == Approx(10.0f));
        REQUIRE(h == Approx(10.0f));

        REQUIRE(stagecraft_shape_rescale(&g, 20.0f, 10.0f));
        REQUIRE(stagecraft_shape_size(&g, &w, &h));
        REQUIRE(w == Approx(20.0f));
        REQUIRE(h == Approx(10.0f));
        REQUIRE(g.polygon.vertices[0].x == Approx(-10.0f));
    }

    SECTION("Circle takes the larger side") {
        Stagecraft_ShapeGeometry g = {};
        g.kind = STAGECRAFT_SHAPE_CIRCLE;
        g.circle.radius = 5.0f;
        REQUIRE(stagecraft_shape_rescale(&g, 20.0f, 10.0f));
        REQUIRE(g.circle.radius == Approx(10.0f));
    }

    SECTION("Segment scales both ends") {
        Stagecraft_ShapeGeometry g = {};
        g.kind = STAGECRAFT_SHAPE_SEGMENT;
        g.segment.a = stagecraft_vec2(-2.0f, -1.0f);
        g.segment.b = stagecraft_vec2(2.0f, 1.0f);
        REQUIRE(stagecraft_shape_rescale(&g, 8.0f, 4.0f));
        REQUIRE(g.segment.b.x == Approx(4.0f));
        REQUIRE(g.segment.b.y == Approx(2.0f));
    }
}

/* ============================================================================
 * Physics Round Trip
 * ============================================================================ */

TEST_CASE("Shape read and write", "[shape][physics]") {
    Stagecraft_PhysicsSpace *space = stagecraft_physics_space_create(nullptr);
    Stagecraft_PhysicsBody *body = stagecraft_physics_body_create_kinematic(space);

    SECTION("Box") {
        Stagecraft_PhysicsShape *box = stagecraft_physics_shape_box(body, 10.0f, 4.0f, 0.0f);
        Stagecraft_ShapeGeometry g;
        REQUIRE(stagecraft_shape_read(box, &g));
        REQUIRE(g.kind == STAGECRAFT_SHAPE_POLYGON);
        REQUIRE(g.polygon.count == 4);

        REQUIRE(stagecraft_shape_rescale(&g, 20.0f, 8.0f));
        REQUIRE(stagecraft_shape_write(box, &g));

        float l, b, r, t;
        stagecraft_physics_shape_get_bb(box, &l, &b, &r, &t);
        REQUIRE(r - l == Approx(20.0f));
        REQUIRE(t - b == Approx(8.0f));
    }

    SECTION("Circle") {
        Stagecraft_PhysicsShape *circle = stagecraft_physics_shape_circle(body, 4.0f, 0.0f, 0.0f);
        Stagecraft_ShapeGeometry g;
        REQUIRE(stagecraft_shape_read(circle, &g));
        REQUIRE(g.kind == STAGECRAFT_SHAPE_CIRCLE);
        g.circle.radius = 9.0f;
        REQUIRE(stagecraft_shape_write(circle, &g));
        REQUIRE(stagecraft_physics_circle_get_radius(circle) == Approx(9.0f));
    }

    stagecraft_physics_space_destroy(space);
}

/* ============================================================================
 * Point Set Helpers
 * ============================================================================ */

TEST_CASE("Shape point helpers", "[shape][points]") {
    SECTION("Regular polygon spans the requested box") {
        Stagecraft_Vec2 pts[STAGECRAFT_SHAPE_MAX_VERTICES];
        int n = stagecraft_shape_regular_polygon(4, 100.0f, 50.0f, pts, STAGECRAFT_SHAPE_MAX_VERTICES);
        REQUIRE(n == 4);
        REQUIRE(pts[0].x == Approx(0.0f).margin(1e-4));
        REQUIRE(pts[0].y == Approx(-25.0f));
        REQUIRE(pts[1].x == Approx(50.0f));

        /* Counter-clockwise */
        REQUIRE(stagecraft_shape_signed_area2(pts, n) == Approx(5000.0f));
    }

    SECTION("Too few sides") {
        Stagecraft_Vec2 pts[4];
        REQUIRE(stagecraft_shape_regular_polygon(2, 10.0f, 10.0f, pts, 4) == 0);
        stagecraft_clear_error();
    }

    SECTION("Clockwise winding has negative area") {
        Stagecraft_Vec2 cw[3] = {{0.0f, 0.0f}, {0.0f, 10.0f}, {10.0f, 0.0f}};
        REQUIRE(stagecraft_shape_signed_area2(cw, 3) < 0.0f);
    }

    SECTION("Bounds") {
        Stagecraft_Vec2 pts[3] = {{50.0f, 50.0f}, {20.0f, 150.0f}, {80.0f, 150.0f}};
        float lx, ly, hx, hy;
        stagecraft_shape_points_bounds(pts, 3, &lx, &ly, &hx, &hy);
        REQUIRE(lx == Approx(20.0f));
        REQUIRE(ly == Approx(50.0f));
        REQUIRE(hx == Approx(80.0f));
        REQUIRE(hy == Approx(150.0f));
    }
}
